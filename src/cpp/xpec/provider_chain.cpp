#include "xpec/provider_chain.h"
#include "xpec/normalizer.h"
#include <cstdlib>

namespace xpec {

void DetectionTrace::add(TraceChannel channel, std::string message) {
    entries_.push_back({channel, std::move(message)});
}

bool DetectionTrace::is_enabled(TraceChannel channel) const {
    switch (channel) {
        case TraceChannel::Board:
            return board_enabled_;
        case TraceChannel::GPU:
            return gpu_enabled_;
        default:
            return false;
    }
}

std::vector<std::string> DetectionTrace::lines(TraceChannel channel) const {
    std::vector<std::string> out;
    for (const auto& entry : entries_) {
        if (entry.channel == channel) {
            out.push_back(entry.message);
        }
    }
    return out;
}

std::string channel_tag(TraceChannel channel) {
    switch (channel) {
        case TraceChannel::Board:
            return "MOBO DEBUG";
        case TraceChannel::GPU:
            return "GPU DEBUG";
        default:
            return "xpec DEBUG";
    }
}

bool env_flag(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return false;
    }
    std::string v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::string to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::Unavailable:
            return "unavailable";
        case FailureKind::PermissionDenied:
            return "permission denied";
        case FailureKind::Empty:
            return "no data";
        default:
            return "error";
    }
}

} // namespace xpec
