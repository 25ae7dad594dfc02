#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace xpec {

// Baseboard/system product values that firmware vendors leave unfilled
extern const std::set<std::string> BOARD_PLACEHOLDERS;

// Memory manufacturer values that mean "unknown"
extern const std::set<std::string> MEMORY_VENDOR_PLACEHOLDERS;

// Map a manufacturer string to a short brand name ("Micro-Star International" -> "MSI").
// Unknown vendors are returned trimmed, empty input returns "N/A".
std::string short_vendor(const std::string& raw);

// Format a byte count as gibibytes with one decimal, e.g. "15.9 GB"
std::string bytes_to_gb(int64_t bytes);
std::string bytes_to_gb(const std::optional<uint64_t>& bytes);

// First number directly in front of a "GB" token, 0.0 if there is none
double extract_gb(const std::string& text);

// Strip trademark markers, the word "CPU" and the integrated graphics suffix
std::string clean_cpu_model(const std::string& name);

std::string trim(const std::string& s);
std::string to_upper(std::string s);
std::string to_lower(std::string s);

// True if the (trimmed, upper-cased) value is empty or in the placeholder set
bool is_placeholder(const std::string& value, const std::set<std::string>& placeholders);

// Remove a trailing OEM board code such as " (MS-7E49)"
std::string strip_board_code(const std::string& product);

// Display helpers, "N/A" when absent
std::string or_na(const std::string& value);
std::string or_na(const std::optional<int>& value);
std::string format_ghz(const std::optional<double>& ghz);
std::string format_mhz(const std::optional<int>& mhz);

// Leading integer of a string ("3200 MT/s" -> 3200)
std::optional<int> parse_leading_int(const std::string& text);

} // namespace xpec
