#pragma once
/**
 * @file pgt_config.hpp
 * @brief Layer 2: Configuration composition and resource lifecycle.
 *
 * Partial config values and their combine() algebra, completion into a
 * CompletePlan, directory acquisition/release, setup_config()/cleanup_config(),
 * JSON config layers and diagnostic rendering. Include this to provision a
 * throwaway Postgres instance's resources.
 */
#include "pgt_base.hpp"

#include "config/partial.hpp"
#include "config/process_config.hpp"
#include "config/directory.hpp"
#include "config/connection_options.hpp"
#include "config/plan.hpp"
#include "config/config.hpp"
#include "config/errors.hpp"
#include "config/resources.hpp"
#include "config/render.hpp"
#include "config/config_file.hpp"
