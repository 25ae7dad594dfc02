#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace xpec {

// Debug output channels, each can be switched on separately
enum class TraceChannel {
    General,
    Board,
    GPU,
};

struct TraceEntry {
    TraceChannel channel;
    std::string message;
};

// Provenance lines collected during one detection run.
// Passed into detection and handed back to the caller with the snapshot.
class DetectionTrace {
public:
    DetectionTrace() = default;
    DetectionTrace(bool board_enabled, bool gpu_enabled)
        : board_enabled_(board_enabled), gpu_enabled_(gpu_enabled) {}

    void add(TraceChannel channel, std::string message);

    bool is_enabled(TraceChannel channel) const;
    bool board_enabled() const { return board_enabled_; }
    bool gpu_enabled() const { return gpu_enabled_; }

    const std::vector<TraceEntry>& entries() const { return entries_; }
    std::vector<std::string> lines(TraceChannel channel) const;

private:
    bool board_enabled_ = false;
    bool gpu_enabled_ = false;
    std::vector<TraceEntry> entries_;
};

// Console tag used when printing a channel ("MOBO DEBUG", "GPU DEBUG", ...)
std::string channel_tag(TraceChannel channel);

// Interpret an environment variable as a boolean switch (1/true/yes/on)
bool env_flag(const char* name);

enum class FailureKind {
    Unavailable,       // API, library or command not present
    PermissionDenied,  // present but refused
    Empty,             // ran fine but produced nothing usable
    Error,             // unexpected failure or exception
};

std::string to_string(FailureKind kind);

template <typename T>
class StrategyResult {
public:
    static StrategyResult success(T value) {
        StrategyResult r;
        r.value_ = std::move(value);
        return r;
    }

    static StrategyResult failure(FailureKind kind, std::string detail = "") {
        StrategyResult r;
        r.kind_ = kind;
        r.detail_ = std::move(detail);
        return r;
    }

    bool ok() const { return value_.has_value(); }
    const T& value() const { return *value_; }
    T&& take() { return std::move(*value_); }

    FailureKind failure_kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    StrategyResult() = default;

    std::optional<T> value_;
    FailureKind kind_ = FailureKind::Error;
    std::string detail_;
};

// One concrete way of querying a hardware fact
template <typename T>
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual std::string name() const = 0;
    virtual StrategyResult<T> detect(DetectionTrace& trace) = 0;
};

template <typename T>
using StrategyList = std::vector<std::unique_ptr<Strategy<T>>>;

// Ordered fallback over strategies. The first strategy that succeeds wins,
// failures (including exceptions) are recorded and never propagate.
template <typename T>
class ProviderChain {
public:
    ProviderChain(std::string label, TraceChannel channel)
        : label_(std::move(label)), channel_(channel) {}

    ProviderChain(std::string label, TraceChannel channel, StrategyList<T> strategies)
        : label_(std::move(label)), channel_(channel), strategies_(std::move(strategies)) {}

    ProviderChain& add(std::unique_ptr<Strategy<T>> strategy) {
        strategies_.push_back(std::move(strategy));
        return *this;
    }

    size_t size() const { return strategies_.size(); }

    std::optional<T> run(DetectionTrace& trace) {
        for (auto& strategy : strategies_) {
            const std::string who = label_ + "/" + strategy->name();
            try {
                StrategyResult<T> result = strategy->detect(trace);
                if (result.ok()) {
                    trace.add(channel_, who + ": ok");
                    return result.take();
                }
                std::string line = who + ": " + to_string(result.failure_kind());
                if (!result.detail().empty()) {
                    line += " (" + result.detail() + ")";
                }
                trace.add(channel_, line);
            } catch (const std::exception& e) {
                trace.add(channel_, who + ": " + to_string(FailureKind::Error) + " (" + e.what() + ")");
            }
        }
        trace.add(channel_, label_ + ": all strategies failed");
        return std::nullopt;
    }

    // Run the chain, substituting the "unknown" value when nothing succeeded
    T resolve(DetectionTrace& trace, T unknown) {
        std::optional<T> found = run(trace);
        return found ? std::move(*found) : std::move(unknown);
    }

private:
    std::string label_;
    TraceChannel channel_;
    StrategyList<T> strategies_;
};

} // namespace xpec
