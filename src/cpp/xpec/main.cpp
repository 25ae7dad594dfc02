#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <xpec/cli_parser.h>
#include <xpec/config.h>
#include <xpec/inventory.h>
#include <xpec/report.h>
#include <xpec/summary.h>
#include <xpec/version.h>

using namespace xpec;

static bool is_verbose(const std::string& log_level) {
    return log_level == "debug" || log_level == "trace";
}

static bool is_quiet(const std::string& log_level) {
    return log_level == "warning" || log_level == "error" || log_level == "critical";
}

static void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not write " + path);
    }
    file << content;
}

int main(int argc, char** argv) {
    try {
        CLIParser parser;

        parser.parse(argc, argv);

        // Check if we should continue (false for --help, --version, or errors)
        if (!parser.should_continue()) {
            return parser.get_exit_code();
        }

        auto options = parser.get_config();
        json config = load_config(options.config_path.empty() ? DEFAULT_CONFIG_FILENAME : options.config_path);

        std::string json_path = options.json_output.empty() ? config_string(config, "json_output")
                                                            : options.json_output;
        // Keep stdout clean for piping the snapshot
        const bool json_to_stdout = json_path == "-";
        const bool quiet = is_quiet(options.log_level) || json_to_stdout;

        if (!quiet) {
            std::cout << "[xpec] Collecting hardware info (" << XPEC_VERSION_STRING << ")..." << std::endl;
        }

        DetectionTrace trace(options.debug || options.debug_mobo, options.debug || options.debug_gpu);
        HardwareSnapshot snapshot = build_snapshot(trace);

        for (const auto& entry : trace.entries()) {
            if (is_verbose(options.log_level) || trace.is_enabled(entry.channel)) {
                std::cerr << "[" << channel_tag(entry.channel) << "] " << entry.message << std::endl;
            }
        }

        if (!options.no_html) {
            std::string html_path = options.html_output.empty() ? config_string(config, "html_output")
                                                                : options.html_output;
            write_text_file(html_path, generate_html_report(snapshot, trace, config));
            if (!quiet) {
                std::cout << "[xpec] Report saved to " << html_path << std::endl;
            }
        }

        if (!json_path.empty()) {
            std::string document = snapshot_to_json(snapshot).dump(2);
            if (json_to_stdout) {
                std::cout << document << std::endl;
            } else {
                write_text_file(json_path, document + "\n");
                if (!quiet) {
                    std::cout << "[xpec] Snapshot saved to " << json_path << std::endl;
                }
            }
        }

        if (options.summary && !json_to_stdout) {
            std::cout << "\n" << config_string(config, "title") << std::endl;
            for (const auto& line : share_card_lines(snapshot)) {
                std::cout << "  " << line.label << ": " << line.text << std::endl;
            }
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
