#include "xpec/utils/json_utils.h"
#include <fstream>
#include <stdexcept>

namespace xpec::utils {

json JsonUtils::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }
    return json::parse(file);
}

void JsonUtils::save_to_file(const json& data, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not write file: " + path);
    }
    file << data.dump(2) << std::endl;
}

} // namespace xpec::utils
