#pragma once

#include "xpec/hardware.h"
#include "xpec/provider_chain.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xpec {

using ModuleList = std::vector<MemoryModule>;
using GPUList = std::vector<GPUInfo>;
using DiskList = std::vector<DiskInfo>;

// An adapter reported by an exact-VRAM source (NVML, DXGI)
struct GPUSourceEntry {
    std::string name;
    uint64_t vram_bytes = 0;
};

// An adapter as listed by the management interface (Win32_VideoController)
struct VideoControllerEntry {
    std::string name;
    std::optional<uint64_t> adapter_ram;
};

// Base class for platform hardware detection.
// Each hardware class is exposed as an ordered list of strategies; the
// inventory builder runs them through a ProviderChain.
class SystemInfo {
public:
    virtual ~SystemInfo() = default;

    virtual std::string get_platform_name() const = 0;

    // Provider chains (to be implemented by OS-specific subclasses)
    virtual StrategyList<BoardInfo> board_strategies() = 0;
    virtual StrategyList<CPUInfo> cpu_strategies() = 0;
    virtual StrategyList<ModuleList> memory_module_strategies() = 0;
    virtual StrategyList<GPUList> gpu_strategies() = 0;
    virtual StrategyList<DiskList> disk_strategies() = 0;

    // Installed memory from the system memory API, 0 if unknown
    virtual uint64_t get_total_memory() = 0;

    // Generic processor identifier used when no model name was found
    virtual std::string get_processor_identifier() = 0;

    // Common methods (can be overridden for detailed platform info)
    virtual std::string get_os_name();
    virtual std::string get_os_version();
};

// Windows implementation
class WindowsSystemInfo : public SystemInfo {
public:
    std::string get_platform_name() const override { return "windows"; }

    StrategyList<BoardInfo> board_strategies() override;
    StrategyList<CPUInfo> cpu_strategies() override;
    StrategyList<ModuleList> memory_module_strategies() override;
    StrategyList<GPUList> gpu_strategies() override;
    StrategyList<DiskList> disk_strategies() override;

    uint64_t get_total_memory() override;
    std::string get_processor_identifier() override;
    std::string get_os_name() override;
    std::string get_os_version() override;
};

// Linux implementation
class LinuxSystemInfo : public SystemInfo {
public:
    std::string get_platform_name() const override { return "linux"; }

    StrategyList<BoardInfo> board_strategies() override;
    StrategyList<CPUInfo> cpu_strategies() override;
    StrategyList<ModuleList> memory_module_strategies() override;
    StrategyList<GPUList> gpu_strategies() override;
    StrategyList<DiskList> disk_strategies() override;

    uint64_t get_total_memory() override;
    std::string get_processor_identifier() override;
    std::string get_os_name() override;
    std::string get_os_version() override;
};

// Factory function, picks the implementation for the host OS
std::unique_ptr<SystemInfo> create_system_info();

// Build the board record from firmware fields.
// The baseboard product is replaced by the system product name when it is
// empty or a known placeholder, and a trailing "(MS-xxxx)" code is removed.
// Returns nullopt when neither manufacturer nor product is set.
std::optional<BoardInfo> compose_board(const std::string& manufacturer,
                                       const std::string& baseboard_product,
                                       const std::string& system_product);

// Bidirectional, case-sensitive substring containment.
// NOTE: short names can over-match ("RTX 3070" vs "RTX 3070 Ti").
bool gpu_names_match(const std::string& a, const std::string& b);

// Generic/virtual adapters that are never reported ("Microsoft Basic Display Adapter")
bool is_virtual_display_adapter(const std::string& name);

// Combine the management-interface adapter list with exact VRAM sources.
// Per adapter: NVML match, else DXGI match, else AdapterRAM, else unknown.
GPUList merge_gpu_sources(const std::vector<VideoControllerEntry>& controllers,
                          const std::vector<GPUSourceEntry>& nvml,
                          const std::vector<GPUSourceEntry>& dxgi,
                          DetectionTrace& trace);

} // namespace xpec
