#include <xpec/cli_parser.h>
#include <xpec/version.h>

#define APP_NAME "xpec"
#define APP_DESC APP_NAME " - Hardware inventory report"

namespace xpec {

CLIParser::CLIParser()
    : app_(APP_DESC) {

    app_.set_version_flag("-v,--version", (APP_NAME " version " XPEC_VERSION_STRING));

    app_.add_option("--config", config_.config_path, "Settings file (default: ./xpec.config.json)")
        ->envname("XPEC_CONFIG")
        ->type_name("PATH");

    app_.add_option("--html", config_.html_output, "Write the HTML report to PATH instead of the configured file")
        ->type_name("PATH");

    app_.add_flag("--no-html", config_.no_html, "Do not write the HTML report");

    app_.add_option("--json", config_.json_output, "Write the snapshot as JSON to PATH ('-' for stdout)")
        ->type_name("PATH");

    app_.add_flag("--summary,!--no-summary", config_.summary, "Print the share card summary")
        ->default_val(config_.summary);

    app_.add_option("--log-level", config_.log_level, "Console log level")
        ->envname("XPEC_LOG_LEVEL")
        ->type_name("LEVEL")
        ->check(CLI::IsMember({"critical", "error", "warning", "info", "debug", "trace"}))
        ->default_val(config_.log_level);

    app_.add_flag("--debug", config_.debug, "Trace motherboard and GPU detection")
        ->envname("XPEC_DEBUG");

    app_.add_flag("--debug-mobo", config_.debug_mobo, "Trace motherboard detection")
        ->envname("XPEC_DEBUG_MOBO");

    app_.add_flag("--debug-gpu", config_.debug_gpu, "Trace GPU detection")
        ->envname("XPEC_DEBUG_GPU");
}

int CLIParser::parse(int argc, char** argv) {
    try {
        app_.parse(argc, argv);
        should_continue_ = true;
        exit_code_ = 0;
        return 0;  // Success, continue
    } catch (const CLI::ParseError& e) {
        // Help/version requested or parse error occurred
        // Let CLI11 handle printing and get the exit code
        exit_code_ = app_.exit(e);
        should_continue_ = false;  // Don't continue, just exit
        return exit_code_;
    }
}

} // namespace xpec
