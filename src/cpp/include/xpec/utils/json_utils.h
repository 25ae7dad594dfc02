#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace xpec::utils {

using json = nlohmann::json;

class JsonUtils {
public:
    // Parse a JSON file. Throws std::runtime_error if the file cannot be opened
    // and nlohmann::json::parse_error if it is malformed.
    static json load_from_file(const std::string& path);

    // Write pretty-printed JSON (2-space indent)
    static void save_to_file(const json& data, const std::string& path);
};

} // namespace xpec::utils
