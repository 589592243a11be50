#pragma once
/**
 * @file pgt_base.hpp
 * @brief Layer 1: Basic modules built on pgt_platform.
 *
 * Provides format_tools, the logger, Validation<T> for error-accumulating
 * completion, and the two RAII cleanup helpers: ScopeGuard for noexcept
 * actions and RollbackStack for undo actions that may fail.
 */
#include "pgt_platform.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/logger.hpp"
#include "utils/rollback_stack.hpp"
#include "utils/scope_guard.hpp"
#include "utils/validation.hpp"
