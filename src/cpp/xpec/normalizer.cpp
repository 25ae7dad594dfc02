#include "xpec/normalizer.h"
#include "xpec/hardware.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <regex>
#include <sstream>
#include <vector>

namespace xpec {

const std::set<std::string> BOARD_PLACEHOLDERS = {
    "TO BE FILLED BY O.E.M.",
    "DEFAULT STRING",
    "UNKNOWN",
    "N/A",
    "SYSTEM PRODUCT NAME",
    "NOT SPECIFIED",
};

const std::set<std::string> MEMORY_VENDOR_PLACEHOLDERS = {
    "UNKNOWN",
    "N/A",
    "UNDEFINED",
    "NOT SPECIFIED",
    "INVALID",
};

struct VendorRule {
    std::string needle;
    bool prefix_only;
    std::string short_name;
};

// Checked in order, first hit wins
static const std::vector<VendorRule> VENDOR_RULES = {
    {"MICRO-STAR", false, "MSI"},
    {"MSI", true, "MSI"},
    {"MS-", true, "MSI"},
    {"ASUSTEK", false, "ASUS"},
    {"ASUS", false, "ASUS"},
    {"GIGABYTE", false, "Gigabyte"},
    {"ASROCK", false, "ASRock"},
    {"LENOVO", false, "Lenovo"},
    {"HEWLETT-PACKARD", false, "HP"},
    {"HP", true, "HP"},
    {"DELL", false, "Dell"},
};

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string short_vendor(const std::string& raw) {
    std::string trimmed = trim(raw);
    std::string upper = to_upper(trimmed);

    for (const auto& rule : VENDOR_RULES) {
        bool hit = rule.prefix_only ? upper.rfind(rule.needle, 0) == 0
                                    : upper.find(rule.needle) != std::string::npos;
        if (hit) {
            return rule.short_name;
        }
    }

    return trimmed.empty() ? NOT_AVAILABLE : trimmed;
}

std::string bytes_to_gb(int64_t bytes) {
    if (bytes < 0) {
        bytes = 0;
    }
    double gb = static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
    if (std::fabs(gb) < 0.05) {
        gb = 0.0;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << gb << " GB";
    return oss.str();
}

std::string bytes_to_gb(const std::optional<uint64_t>& bytes) {
    if (!bytes) {
        return NOT_AVAILABLE;
    }
    // Anything above int64 range is a bogus provider value
    if (*bytes > static_cast<uint64_t>(INT64_MAX)) {
        return bytes_to_gb(static_cast<int64_t>(0));
    }
    return bytes_to_gb(static_cast<int64_t>(*bytes));
}

double extract_gb(const std::string& text) {
    static const std::regex gb_regex(R"(([0-9]+(?:\.[0-9]+)?)\s*GB)", std::regex::icase);
    std::smatch match;
    if (std::regex_search(text, match, gb_regex)) {
        try {
            return std::stod(match[1].str());
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

static void erase_all(std::string& s, const std::string& token) {
    size_t pos;
    while ((pos = s.find(token)) != std::string::npos) {
        s.erase(pos, token.size());
    }
}

std::string clean_cpu_model(const std::string& name) {
    if (trim(name).empty()) {
        return NOT_AVAILABLE;
    }

    std::string s = name;
    erase_all(s, "(R)");
    erase_all(s, "(TM)");
    erase_all(s, "CPU");

    static const std::regex igpu_suffix(R"(with Radeon Graphics)", std::regex::icase);
    s = std::regex_replace(s, igpu_suffix, "");

    static const std::regex spaces(R"(\s{2,})");
    s = std::regex_replace(s, spaces, " ");

    return trim(s);
}

bool is_placeholder(const std::string& value, const std::set<std::string>& placeholders) {
    std::string upper = to_upper(trim(value));
    return upper.empty() || placeholders.count(upper) > 0;
}

std::string strip_board_code(const std::string& product) {
    static const std::regex board_code(R"(\s*\(MS-[0-9A-F]+\)$)", std::regex::icase);
    return std::regex_replace(product, board_code, "");
}

std::string or_na(const std::string& value) {
    std::string trimmed = trim(value);
    return trimmed.empty() ? NOT_AVAILABLE : trimmed;
}

std::string or_na(const std::optional<int>& value) {
    return value ? std::to_string(*value) : NOT_AVAILABLE;
}

std::string format_ghz(const std::optional<double>& ghz) {
    if (!ghz) {
        return NOT_AVAILABLE;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << *ghz << " GHz";
    return oss.str();
}

std::string format_mhz(const std::optional<int>& mhz) {
    return mhz ? std::to_string(*mhz) + " MHz" : NOT_AVAILABLE;
}

std::optional<int> parse_leading_int(const std::string& text) {
    std::string s = trim(text);
    size_t digits = 0;
    while (digits < s.size() && std::isdigit(static_cast<unsigned char>(s[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        return std::nullopt;
    }
    try {
        return std::stoi(s.substr(0, digits));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string to_string(DiskKind kind) {
    switch (kind) {
        case DiskKind::HDD:
            return "HDD";
        case DiskKind::SSD:
            return "SSD";
        default:
            return NOT_AVAILABLE;
    }
}

} // namespace xpec
