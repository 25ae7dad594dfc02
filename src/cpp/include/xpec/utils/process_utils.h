#pragma once

#include <string>

namespace xpec::utils {

// Run a shell command and capture its standard output.
// Throws std::runtime_error if the command cannot be started or exits non-zero.
std::string run_command(const std::string& command);

// Read a whole (small) file, typically from /proc or /sys.
// Throws std::runtime_error if the file cannot be opened.
std::string read_text_file(const std::string& path);

} // namespace xpec::utils
