#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace xpec {

struct AppConfig {
    std::string config_path;       // "" means ./xpec.config.json
    std::string html_output;       // overrides html_output from the config file
    bool no_html = false;
    std::string json_output;       // "-" writes to stdout
    bool summary = true;
    std::string log_level = "info";

    // Debug trace channels
    bool debug = false;
    bool debug_mobo = false;
    bool debug_gpu = false;
};

class CLIParser {
public:
    CLIParser();

    // Parse command line arguments
    // Returns: 0 if should continue, exit code (may be 0) if should exit
    int parse(int argc, char** argv);

    AppConfig get_config() const { return config_; }

    // Check if we should continue (false means exit cleanly, e.g., after --help)
    bool should_continue() const { return should_continue_; }

    // Get exit code (only valid if should_continue() is false)
    int get_exit_code() const { return exit_code_; }

private:
    CLI::App app_;
    AppConfig config_;
    bool should_continue_ = true;
    int exit_code_ = 0;
};

} // namespace xpec
