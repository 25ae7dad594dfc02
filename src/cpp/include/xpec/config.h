#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace xpec {

using json = nlohmann::json;

// Name looked up in the working directory when no --config path is given
inline const std::string DEFAULT_CONFIG_FILENAME = "xpec.config.json";

// Built-in settings:
//   title        report / card heading ("Gaming PC")
//   html_output  report path ("pc_specs.html")
//   json_output  snapshot export path, "" disables it
//   theme        background, panel, accent, sub, text, dim as "#rrggbb"
json default_config();

// Load the user file and merge it over the defaults (RFC 7386 merge patch,
// so nested objects merge and null removes a key).
// A missing file gives the defaults. An unreadable or malformed file gives
// the defaults and a warning on stderr.
json load_config(const std::string& path = DEFAULT_CONFIG_FILENAME);

// Typed accessors with fallback to the built-in value for wrong types
std::string config_string(const json& config, const std::string& key);
std::string theme_color(const json& config, const std::string& key);

} // namespace xpec
