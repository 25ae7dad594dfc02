#include "xpec/utils/process_utils.h"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#ifdef _WIN32
#define XPEC_POPEN _popen
#define XPEC_PCLOSE _pclose
#else
#include <sys/wait.h>
#define XPEC_POPEN popen
#define XPEC_PCLOSE pclose
#endif

namespace xpec::utils {

std::string run_command(const std::string& command) {
    FILE* pipe = XPEC_POPEN(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to execute: " + command);
    }

    char buffer[512];
    std::string output;
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }

    int status = XPEC_PCLOSE(pipe);
#ifdef _WIN32
    int exit_code = status;
#else
    int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
#endif
    if (exit_code != 0) {
        throw std::runtime_error("Command exited with code " + std::to_string(exit_code) + ": " + command);
    }

    return output;
}

std::string read_text_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // namespace xpec::utils
