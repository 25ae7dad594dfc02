#pragma once

#include "xpec/hardware.h"
#include "xpec/provider_chain.h"
#include <nlohmann/json.hpp>
#include <string>

namespace xpec {

using json = nlohmann::json;

// Escape &, <, >, " and ' for HTML text and attribute values
std::string html_escape(const std::string& text);

// Full styled report. Debug sections are added for the trace channels that are
// enabled. generated_on is printed in the footer.
std::string generate_html_report(const HardwareSnapshot& snapshot,
                                 const DetectionTrace& trace,
                                 const json& config,
                                 const std::string& generated_on);

// Same, stamped with the current local time
std::string generate_html_report(const HardwareSnapshot& snapshot,
                                 const DetectionTrace& trace,
                                 const json& config);

// Machine-readable snapshot. Undetermined values are emitted as "N/A".
json snapshot_to_json(const HardwareSnapshot& snapshot);

// Current local time as "YYYY-MM-DD HH:MM:SS"
std::string current_timestamp();

} // namespace xpec
