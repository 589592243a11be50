#pragma once
/**
 * @file render.hpp
 * @brief JSON snapshots of configuration values for diagnostics.
 *
 * The `to_json` overloads plug into nlohmann::json, so any of these types can
 * be assigned to a json value directly. Stream handles render as
 * "[HANDLE fd=N]" and loggers as "[LOGGER]"; unset fields render as null.
 * Passwords, including PGPASSWORD environment entries, render as "********".
 * Strings that are not valid UTF-8 are rendered with U+FFFD substituted.
 * The output is for people, not for round-tripping through config_from_json().
 */

#include "config/config.hpp"
#include "config/resources.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace pgtemp::config
{

void to_json(nlohmann::json &j, const StreamHandle &handle);
void to_json(nlohmann::json &j, const EnvironmentVariables &vars);
void to_json(nlohmann::json &j, const CommandLineArgs &args);
void to_json(nlohmann::json &j, const ProcessConfig &cfg);
void to_json(nlohmann::json &j, const CompleteProcessConfig &cfg);
void to_json(nlohmann::json &j, const ConnectionOptions &opts);
void to_json(nlohmann::json &j, const DirectoryType &dir);
void to_json(nlohmann::json &j, const CompleteDirectoryType &dir);
void to_json(nlohmann::json &j, const InitDbCache &cache);
void to_json(nlohmann::json &j, const PostgresPlan &plan);
void to_json(nlohmann::json &j, const Plan &plan);
void to_json(nlohmann::json &j, const CompletePostgresPlan &plan);
void to_json(nlohmann::json &j, const CompletePlan &plan);
void to_json(nlohmann::json &j, const Config &cfg);
void to_json(nlohmann::json &j, const Resources &resources);

/// Indented (2 spaces) JSON.
[[nodiscard]] std::string render_plan(const Plan &plan);
[[nodiscard]] std::string render_config(const Config &config);
[[nodiscard]] std::string render_resources(const Resources &resources);

} // namespace pgtemp::config
