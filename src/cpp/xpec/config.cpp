#include "xpec/config.h"
#include "xpec/utils/json_utils.h"
#include <filesystem>
#include <iostream>
#include <regex>

namespace fs = std::filesystem;

namespace xpec {

json default_config() {
    return {
        {"title", "Gaming PC"},
        {"html_output", "pc_specs.html"},
        {"json_output", ""},
        {"theme", {
            {"background", "#1a1a1a"},
            {"panel", "#2d2d2d"},
            {"accent", "#00ff9d"},
            {"sub", "#00ccff"},
            {"text", "#f0f0f0"},
            {"dim", "#a0a0a0"},
        }},
    };
}

json load_config(const std::string& path) {
    json config = default_config();

    if (path.empty() || !fs::exists(path)) {
        return config;
    }

    try {
        json user_config = utils::JsonUtils::load_from_file(path);
        if (!user_config.is_object()) {
            std::cerr << "[xpec] Warning: Ignoring " << fs::path(path).filename()
                      << ": top-level value is not an object" << std::endl;
            return config;
        }
        config.merge_patch(user_config);
    } catch (const std::exception& e) {
        std::cerr << "[xpec] Warning: Could not load " << fs::path(path).filename()
                  << ": " << e.what() << std::endl;
        return default_config();
    }

    return config;
}

std::string config_string(const json& config, const std::string& key) {
    if (config.contains(key) && config[key].is_string()) {
        return config[key].get<std::string>();
    }
    json defaults = default_config();
    return defaults.contains(key) && defaults[key].is_string() ? defaults[key].get<std::string>() : "";
}

std::string theme_color(const json& config, const std::string& key) {
    static const std::regex hex_color("#?([0-9a-fA-F]{6})");
    if (config.contains("theme") && config["theme"].is_object()) {
        const json& theme = config["theme"];
        if (theme.contains(key) && theme[key].is_string()) {
            std::smatch match;
            std::string value = theme[key].get<std::string>();
            if (std::regex_match(value, match, hex_color)) {
                return "#" + match[1].str();
            }
        }
    }
    return default_config()["theme"].value(key, "#000000");
}

} // namespace xpec
