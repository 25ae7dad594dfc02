#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xpec {

// Placeholder rendered for any value that could not be determined
inline const std::string NOT_AVAILABLE = "N/A";

struct BoardInfo {
    std::string vendor = NOT_AVAILABLE;
    std::string model;
    std::string os_name;
    std::string os_version;
};

struct CPUInfo {
    std::string model;
    std::optional<int> physical_cores;
    std::optional<int> logical_threads;
    std::optional<double> max_clock_ghz;
};

struct MemoryModule {
    int index = 0;  // 1-based slot order
    std::string manufacturer = NOT_AVAILABLE;
    std::optional<uint64_t> capacity_bytes;
    std::optional<int> speed_mhz;
    std::string part_number = NOT_AVAILABLE;
};

struct RAMInfo {
    uint64_t total_bytes = 0;
    std::vector<MemoryModule> modules;
};

struct GPUInfo {
    std::string model = NOT_AVAILABLE;
    std::optional<uint64_t> vram_bytes;
};

enum class DiskKind {
    Unknown,
    HDD,
    SSD,
};

struct DiskInfo {
    std::string model = NOT_AVAILABLE;
    std::optional<uint64_t> size_bytes;
    DiskKind kind = DiskKind::Unknown;
};

// Everything one run found out about the host
struct HardwareSnapshot {
    BoardInfo board;
    CPUInfo cpu;
    RAMInfo ram;
    std::vector<GPUInfo> gpus;
    std::vector<DiskInfo> disks;
};

// "HDD", "SSD" or "N/A"
std::string to_string(DiskKind kind);

} // namespace xpec
