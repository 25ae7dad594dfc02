#include "xpec/system_info.h"
#include "xpec/normalizer.h"
#include "xpec/parsers.h"
#include "xpec/utils/process_utils.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#include <comdef.h>
#include <Wbemidl.h>
#include <dxgi.h>
#include "utils/wmi_helper.h"
#pragma comment(lib, "dxgi.lib")
#pragma comment(lib, "advapi32.lib")
#endif

#ifdef __linux__
#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace xpec {

namespace fs = std::filesystem;

// ============================================================================
// Shared detection rules
// ============================================================================

std::optional<BoardInfo> compose_board(const std::string& manufacturer,
                                       const std::string& baseboard_product,
                                       const std::string& system_product) {
    std::string manu = trim(manufacturer);
    std::string product = trim(baseboard_product);
    if (manu.empty() && product.empty()) {
        return std::nullopt;
    }

    // Prefer the baseboard product, fall back to the system product name
    std::string pretty = is_placeholder(product, BOARD_PLACEHOLDERS) ? trim(system_product) : product;
    if (is_placeholder(pretty, BOARD_PLACEHOLDERS)) {
        pretty.clear();
    }

    BoardInfo board;
    board.vendor = short_vendor(is_placeholder(manu, BOARD_PLACEHOLDERS) ? "" : manu);
    board.model = trim(strip_board_code(pretty));
    return board;
}

bool gpu_names_match(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) {
        return false;
    }
    return a.find(b) != std::string::npos || b.find(a) != std::string::npos;
}

bool is_virtual_display_adapter(const std::string& name) {
    return name.find("Microsoft") != std::string::npos;
}

static const GPUSourceEntry* find_gpu_match(const std::vector<GPUSourceEntry>& source,
                                            const std::string& name) {
    for (const auto& entry : source) {
        if (gpu_names_match(entry.name, name)) {
            return &entry;
        }
    }
    return nullptr;
}

GPUList merge_gpu_sources(const std::vector<VideoControllerEntry>& controllers,
                          const std::vector<GPUSourceEntry>& nvml,
                          const std::vector<GPUSourceEntry>& dxgi,
                          DetectionTrace& trace) {
    GPUList gpus;

    for (const auto& controller : controllers) {
        const std::string name = trim(controller.name);
        if (name.empty() || is_virtual_display_adapter(name)) {
            trace.add(TraceChannel::GPU, "WMI: skipped adapter '" + name + "'");
            continue;
        }

        GPUInfo gpu;
        gpu.model = name;
        std::string chosen = "none";

        const GPUSourceEntry* nvml_match = find_gpu_match(nvml, name);
        const GPUSourceEntry* dxgi_match = nullptr;
        if (nvml_match) {
            gpu.vram_bytes = nvml_match->vram_bytes;
            chosen = "nvml";
        } else {
            dxgi_match = find_gpu_match(dxgi, name);
            if (dxgi_match) {
                gpu.vram_bytes = dxgi_match->vram_bytes;
                chosen = "dxgi";
            } else if (controller.adapter_ram && *controller.adapter_ram > 0) {
                gpu.vram_bytes = controller.adapter_ram;
                chosen = "wmi";
            }
        }

        trace.add(TraceChannel::GPU,
                  "WMI: name='" + name + "' AdapterRAM=" +
                  (controller.adapter_ram ? std::to_string(*controller.adapter_ram) : "None") +
                  " match_nvml=" + (nvml_match ? "yes" : "no") +
                  " match_dxgi=" + (dxgi_match ? "yes" : "no") +
                  " chosen=" + chosen + " -> " + bytes_to_gb(gpu.vram_bytes));
        gpus.push_back(gpu);
    }

    return gpus;
}

static bool has_any_field(const CPUInfo& cpu) {
    return !trim(cpu.model).empty() || cpu.physical_cores || cpu.logical_threads || cpu.max_clock_ghz;
}

// ============================================================================
// SystemInfo base class implementation
// ============================================================================

std::string SystemInfo::get_os_name() {
    #ifdef _WIN32
    return "Windows";
    #elif __linux__
    return "Linux";
    #elif __APPLE__
    return "macOS";
    #else
    return "Unknown";
    #endif
}

std::string SystemInfo::get_os_version() {
    return NOT_AVAILABLE;
}

// ============================================================================
// Factory function
// ============================================================================

std::unique_ptr<SystemInfo> create_system_info() {
    #ifdef _WIN32
    return std::make_unique<WindowsSystemInfo>();
    #elif __linux__
    return std::make_unique<LinuxSystemInfo>();
    #else
    throw std::runtime_error("Unsupported operating system");
    #endif
}

// ============================================================================
// Windows implementation
// ============================================================================

#ifdef _WIN32

namespace {

const char* BIOS_REGISTRY_KEY = "HARDWARE\\DESCRIPTION\\System\\BIOS";
const char* CPU_REGISTRY_KEY = "HARDWARE\\DESCRIPTION\\System\\CentralProcessor\\0";

FailureKind failure_from_wmi(const wmi::WMIConnection& conn) {
    return conn.access_denied() ? FailureKind::PermissionDenied : FailureKind::Unavailable;
}

std::string hresult_text(HRESULT hr) {
    std::ostringstream oss;
    oss << "HRESULT 0x" << std::hex << static_cast<unsigned long>(hr);
    return oss.str();
}

// Read a REG_SZ value from HKLM, empty string if it is missing
LSTATUS read_registry_string(const char* subkey, const char* value, std::string& out) {
    char buffer[512] = {};
    DWORD size = sizeof(buffer);
    LSTATUS status = RegGetValueA(HKEY_LOCAL_MACHINE, subkey, value, RRF_RT_REG_SZ,
                                  nullptr, buffer, &size);
    out = (status == ERROR_SUCCESS) ? trim(buffer) : "";
    return status;
}

class RegistryBoardStrategy : public Strategy<BoardInfo> {
public:
    std::string name() const override { return "registry"; }

    StrategyResult<BoardInfo> detect(DetectionTrace& trace) override {
        HKEY key = nullptr;
        LSTATUS status = RegOpenKeyExA(HKEY_LOCAL_MACHINE, BIOS_REGISTRY_KEY, 0, KEY_READ, &key);
        if (status != ERROR_SUCCESS) {
            return StrategyResult<BoardInfo>::failure(
                status == ERROR_ACCESS_DENIED ? FailureKind::PermissionDenied : FailureKind::Unavailable,
                "RegOpenKeyEx status " + std::to_string(status));
        }
        RegCloseKey(key);

        std::string manufacturer, product, system_manufacturer, system_product;
        read_registry_string(BIOS_REGISTRY_KEY, "BaseBoardManufacturer", manufacturer);
        read_registry_string(BIOS_REGISTRY_KEY, "BaseBoardProduct", product);
        read_registry_string(BIOS_REGISTRY_KEY, "SystemManufacturer", system_manufacturer);
        read_registry_string(BIOS_REGISTRY_KEY, "SystemProductName", system_product);

        trace.add(TraceChannel::Board, "Reg BaseBoardManufacturer=" + or_na(manufacturer));
        trace.add(TraceChannel::Board, "Reg BaseBoardProduct=" + or_na(product));
        trace.add(TraceChannel::Board, "Reg SystemManufacturer=" + or_na(system_manufacturer));
        trace.add(TraceChannel::Board, "Reg SystemProductName=" + or_na(system_product));

        auto board = compose_board(manufacturer, product, system_product);
        if (!board) {
            return StrategyResult<BoardInfo>::failure(FailureKind::Empty, "baseboard values not set");
        }
        trace.add(TraceChannel::Board, "Reg Product Pretty=" + or_na(board->model) +
                                       " Vendor Short=" + board->vendor);
        return StrategyResult<BoardInfo>::success(*board);
    }
};

class WmiBoardStrategy : public Strategy<BoardInfo> {
public:
    std::string name() const override { return "wmi"; }

    StrategyResult<BoardInfo> detect(DetectionTrace& trace) override {
        wmi::WMIConnection wmi;
        if (!wmi.is_valid()) {
            return StrategyResult<BoardInfo>::failure(failure_from_wmi(wmi), hresult_text(wmi.last_error()));
        }

        std::string manufacturer, product, version;
        bool found = false;
        wmi.query(L"SELECT Manufacturer, Product, Version FROM Win32_BaseBoard", [&](IWbemClassObject* pObj) {
            if (!found) {  // Only get first result
                manufacturer = trim(wmi::get_property_string(pObj, L"Manufacturer"));
                product = trim(wmi::get_property_string(pObj, L"Product"));
                version = trim(wmi::get_property_string(pObj, L"Version"));
                found = true;
            }
        });

        trace.add(TraceChannel::Board, "WMI BaseBoard.Manufacturer=" + or_na(manufacturer) +
                                       " Product=" + or_na(product) + " Version=" + or_na(version));

        auto board = compose_board(manufacturer, product, "");
        if (!board) {
            return StrategyResult<BoardInfo>::failure(FailureKind::Empty, "Win32_BaseBoard returned nothing");
        }
        return StrategyResult<BoardInfo>::success(*board);
    }
};

class WmiProcessorStrategy : public Strategy<CPUInfo> {
public:
    std::string name() const override { return "wmi"; }

    StrategyResult<CPUInfo> detect(DetectionTrace&) override {
        wmi::WMIConnection wmi;
        if (!wmi.is_valid()) {
            return StrategyResult<CPUInfo>::failure(failure_from_wmi(wmi), hresult_text(wmi.last_error()));
        }

        CPUInfo cpu;
        bool found = false;
        wmi.query(L"SELECT * FROM Win32_Processor", [&](IWbemClassObject* pObj) {
            if (found) {
                return;  // Only get first processor
            }
            found = true;
            cpu.model = trim(wmi::get_property_string(pObj, L"Name"));
            int cores = wmi::get_property_int(pObj, L"NumberOfCores");
            int threads = wmi::get_property_int(pObj, L"NumberOfLogicalProcessors");
            int mhz = wmi::get_property_int(pObj, L"MaxClockSpeed");
            if (cores > 0) cpu.physical_cores = cores;
            if (threads > 0) cpu.logical_threads = threads;
            if (mhz > 0) cpu.max_clock_ghz = std::round(mhz / 10.0) / 100.0;
        });

        if (!has_any_field(cpu)) {
            return StrategyResult<CPUInfo>::failure(FailureKind::Empty, "No CPU information found");
        }
        return StrategyResult<CPUInfo>::success(cpu);
    }
};

class RegistryProcessorStrategy : public Strategy<CPUInfo> {
public:
    std::string name() const override { return "registry"; }

    StrategyResult<CPUInfo> detect(DetectionTrace&) override {
        CPUInfo cpu;
        LSTATUS status = read_registry_string(CPU_REGISTRY_KEY, "ProcessorNameString", cpu.model);
        if (status == ERROR_ACCESS_DENIED) {
            return StrategyResult<CPUInfo>::failure(FailureKind::PermissionDenied, CPU_REGISTRY_KEY);
        }

        DWORD mhz = 0;
        DWORD size = sizeof(mhz);
        if (RegGetValueA(HKEY_LOCAL_MACHINE, CPU_REGISTRY_KEY, "~MHz", RRF_RT_REG_DWORD,
                         nullptr, &mhz, &size) == ERROR_SUCCESS && mhz > 0) {
            cpu.max_clock_ghz = std::round(mhz / 10.0) / 100.0;
        }

        DWORD threads = GetActiveProcessorCount(ALL_PROCESSOR_GROUPS);
        if (threads > 0) {
            cpu.logical_threads = static_cast<int>(threads);
        }

        if (!has_any_field(cpu)) {
            return StrategyResult<CPUInfo>::failure(FailureKind::Empty);
        }
        return StrategyResult<CPUInfo>::success(cpu);
    }
};

class WmiPhysicalMemoryStrategy : public Strategy<ModuleList> {
public:
    std::string name() const override { return "wmi"; }

    StrategyResult<ModuleList> detect(DetectionTrace&) override {
        wmi::WMIConnection wmi;
        if (!wmi.is_valid()) {
            return StrategyResult<ModuleList>::failure(failure_from_wmi(wmi), hresult_text(wmi.last_error()));
        }

        ModuleList modules;
        wmi.query(L"SELECT * FROM Win32_PhysicalMemory", [&](IWbemClassObject* pObj) {
            MemoryModule module;
            module.index = static_cast<int>(modules.size()) + 1;

            std::string manufacturer = wmi::get_property_string(pObj, L"Manufacturer");
            module.manufacturer = is_placeholder(manufacturer, MEMORY_VENDOR_PLACEHOLDERS)
                                      ? NOT_AVAILABLE : trim(manufacturer);

            // Prefer ConfiguredClockSpeed, fallback to Speed
            int speed = wmi::get_property_int(pObj, L"ConfiguredClockSpeed");
            if (speed <= 0) {
                speed = wmi::get_property_int(pObj, L"Speed");
            }
            if (speed > 0) {
                module.speed_mhz = speed;
            }

            module.part_number = or_na(wmi::get_property_string(pObj, L"PartNumber"));
            module.capacity_bytes = wmi::get_property_optional_uint64(pObj, L"Capacity");
            modules.push_back(module);
        });

        if (modules.empty()) {
            return StrategyResult<ModuleList>::failure(FailureKind::Empty, "Win32_PhysicalMemory returned nothing");
        }
        return StrategyResult<ModuleList>::success(modules);
    }
};

// NVML types, resolved at runtime from nvml.dll
using nvmlReturn_t = int;
using nvmlDevice_t = struct nvmlDevice_st*;
struct nvmlMemory_t {
    unsigned long long total;
    unsigned long long free;
    unsigned long long used;
};
constexpr nvmlReturn_t NVML_SUCCESS = 0;

// Exact-VRAM adapter lists, enumerated once per run and shared by the GPU strategies
class WindowsGpuSources {
public:
    const std::vector<GPUSourceEntry>& nvml(DetectionTrace& trace) {
        if (!nvml_loaded_) {
            nvml_loaded_ = true;
            enumerate_nvml(trace);
        }
        return nvml_;
    }

    const std::vector<GPUSourceEntry>& dxgi(DetectionTrace& trace) {
        if (!dxgi_loaded_) {
            dxgi_loaded_ = true;
            enumerate_dxgi(trace);
        }
        return dxgi_;
    }

private:
    void enumerate_nvml(DetectionTrace& trace) {
        HMODULE lib = LoadLibraryA("nvml.dll");
        if (!lib) {
            const char* program_files = std::getenv("ProgramFiles");
            if (program_files) {
                std::string path = std::string(program_files) + "\\NVIDIA Corporation\\NVSMI\\nvml.dll";
                lib = LoadLibraryA(path.c_str());
            }
        }
        if (!lib) {
            trace.add(TraceChannel::GPU, "NVML: not available (nvml.dll not found)");
            return;
        }

        using init_t = nvmlReturn_t (*)();
        using shutdown_t = nvmlReturn_t (*)();
        using count_t = nvmlReturn_t (*)(unsigned int*);
        using handle_t = nvmlReturn_t (*)(unsigned int, nvmlDevice_t*);
        using name_t = nvmlReturn_t (*)(nvmlDevice_t, char*, unsigned int);
        using memory_t = nvmlReturn_t (*)(nvmlDevice_t, nvmlMemory_t*);

        auto init = reinterpret_cast<init_t>(GetProcAddress(lib, "nvmlInit_v2"));
        auto shutdown = reinterpret_cast<shutdown_t>(GetProcAddress(lib, "nvmlShutdown"));
        auto get_count = reinterpret_cast<count_t>(GetProcAddress(lib, "nvmlDeviceGetCount_v2"));
        auto get_handle = reinterpret_cast<handle_t>(GetProcAddress(lib, "nvmlDeviceGetHandleByIndex_v2"));
        auto get_name = reinterpret_cast<name_t>(GetProcAddress(lib, "nvmlDeviceGetName"));
        auto get_memory = reinterpret_cast<memory_t>(GetProcAddress(lib, "nvmlDeviceGetMemoryInfo"));

        if (!init || !shutdown || !get_count || !get_handle || !get_name || !get_memory) {
            trace.add(TraceChannel::GPU, "NVML: missing entry points");
            FreeLibrary(lib);
            return;
        }

        if (init() != NVML_SUCCESS) {
            trace.add(TraceChannel::GPU, "NVML: init failed");
            FreeLibrary(lib);
            return;
        }

        unsigned int count = 0;
        if (get_count(&count) == NVML_SUCCESS) {
            trace.add(TraceChannel::GPU, "NVML: init ok, count=" + std::to_string(count));
            for (unsigned int i = 0; i < count; ++i) {
                nvmlDevice_t device = nullptr;
                char name[96] = {};
                nvmlMemory_t memory = {};
                if (get_handle(i, &device) != NVML_SUCCESS ||
                    get_name(device, name, sizeof(name)) != NVML_SUCCESS ||
                    get_memory(device, &memory) != NVML_SUCCESS) {
                    trace.add(TraceChannel::GPU, "NVML[" + std::to_string(i) + "]: query failed");
                    continue;
                }
                nvml_.push_back({trim(name), memory.total});
                trace.add(TraceChannel::GPU, "NVML[" + std::to_string(i) + "]: model='" + trim(name) +
                                             "' mem_bytes=" + std::to_string(memory.total) +
                                             " -> " + bytes_to_gb(static_cast<int64_t>(memory.total)));
            }
        }

        shutdown();
        FreeLibrary(lib);
    }

    void enumerate_dxgi(DetectionTrace& trace) {
        IDXGIFactory1* factory = nullptr;
        if (FAILED(CreateDXGIFactory1(__uuidof(IDXGIFactory1), reinterpret_cast<void**>(&factory))) || !factory) {
            trace.add(TraceChannel::GPU, "DXGI: failed to create factory");
            return;
        }

        for (UINT i = 0;; ++i) {
            IDXGIAdapter1* adapter = nullptr;
            HRESULT hr = factory->EnumAdapters1(i, &adapter);
            if (FAILED(hr) || !adapter) {
                if (hr != DXGI_ERROR_NOT_FOUND) {
                    trace.add(TraceChannel::GPU, "DXGI: EnumAdapters1 failed with " + hresult_text(hr));
                }
                break;
            }

            DXGI_ADAPTER_DESC1 desc{};
            if (SUCCEEDED(adapter->GetDesc1(&desc)) && (desc.Flags & DXGI_ADAPTER_FLAG_SOFTWARE) == 0) {
                std::string model = trim(wmi::wstring_to_string(desc.Description));
                uint64_t bytes = static_cast<uint64_t>(desc.DedicatedVideoMemory);
                dxgi_.push_back({model, bytes});
                trace.add(TraceChannel::GPU, "DXGI[" + std::to_string(i) + "]: model='" + model +
                                             "' mem_bytes=" + std::to_string(bytes) +
                                             " -> " + bytes_to_gb(static_cast<int64_t>(bytes)));
            }
            adapter->Release();
        }
        factory->Release();
    }

    bool nvml_loaded_ = false;
    bool dxgi_loaded_ = false;
    std::vector<GPUSourceEntry> nvml_;
    std::vector<GPUSourceEntry> dxgi_;
};

class WmiVideoControllerStrategy : public Strategy<GPUList> {
public:
    explicit WmiVideoControllerStrategy(std::shared_ptr<WindowsGpuSources> sources)
        : sources_(std::move(sources)) {}

    std::string name() const override { return "wmi+nvml+dxgi"; }

    StrategyResult<GPUList> detect(DetectionTrace& trace) override {
        const auto& nvml = sources_->nvml(trace);
        const auto& dxgi = sources_->dxgi(trace);

        wmi::WMIConnection wmi;
        if (!wmi.is_valid()) {
            trace.add(TraceChannel::GPU, "WMI: failed to connect, " + hresult_text(wmi.last_error()));
            return StrategyResult<GPUList>::failure(failure_from_wmi(wmi), hresult_text(wmi.last_error()));
        }

        std::vector<VideoControllerEntry> controllers;
        bool ok = wmi.query(L"SELECT Name, AdapterRAM FROM Win32_VideoController", [&](IWbemClassObject* pObj) {
            VideoControllerEntry entry;
            entry.name = wmi::get_property_string(pObj, L"Name");
            entry.adapter_ram = wmi::get_property_optional_uint64(pObj, L"AdapterRAM");
            controllers.push_back(entry);
        });
        if (!ok) {
            trace.add(TraceChannel::GPU, "WMI: failed to enumerate, " + hresult_text(wmi.last_error()));
            return StrategyResult<GPUList>::failure(failure_from_wmi(wmi), hresult_text(wmi.last_error()));
        }

        GPUList gpus = merge_gpu_sources(controllers, nvml, dxgi, trace);
        if (gpus.empty()) {
            return StrategyResult<GPUList>::failure(FailureKind::Empty, "no physical adapters listed");
        }
        return StrategyResult<GPUList>::success(gpus);
    }

private:
    std::shared_ptr<WindowsGpuSources> sources_;
};

GPUList to_gpu_list(const std::vector<GPUSourceEntry>& entries) {
    GPUList gpus;
    for (const auto& entry : entries) {
        GPUInfo gpu;
        gpu.model = or_na(entry.name);
        gpu.vram_bytes = entry.vram_bytes;
        gpus.push_back(gpu);
    }
    return gpus;
}

class NvmlGpuStrategy : public Strategy<GPUList> {
public:
    explicit NvmlGpuStrategy(std::shared_ptr<WindowsGpuSources> sources)
        : sources_(std::move(sources)) {}

    std::string name() const override { return "nvml"; }

    StrategyResult<GPUList> detect(DetectionTrace& trace) override {
        GPUList gpus = to_gpu_list(sources_->nvml(trace));
        if (gpus.empty()) {
            return StrategyResult<GPUList>::failure(FailureKind::Unavailable);
        }
        return StrategyResult<GPUList>::success(gpus);
    }

private:
    std::shared_ptr<WindowsGpuSources> sources_;
};

class DxgiGpuStrategy : public Strategy<GPUList> {
public:
    explicit DxgiGpuStrategy(std::shared_ptr<WindowsGpuSources> sources)
        : sources_(std::move(sources)) {}

    std::string name() const override { return "dxgi"; }

    StrategyResult<GPUList> detect(DetectionTrace& trace) override {
        GPUList gpus = to_gpu_list(sources_->dxgi(trace));
        if (gpus.empty()) {
            return StrategyResult<GPUList>::failure(FailureKind::Unavailable);
        }
        return StrategyResult<GPUList>::success(gpus);
    }

private:
    std::shared_ptr<WindowsGpuSources> sources_;
};

class MsftPhysicalDiskStrategy : public Strategy<DiskList> {
public:
    std::string name() const override { return "msft_physicaldisk"; }

    StrategyResult<DiskList> detect(DetectionTrace&) override {
        wmi::WMIConnection wmi(L"ROOT\\Microsoft\\Windows\\Storage");
        if (!wmi.is_valid()) {
            return StrategyResult<DiskList>::failure(failure_from_wmi(wmi), hresult_text(wmi.last_error()));
        }

        DiskList disks;
        bool ok = wmi.query(L"SELECT FriendlyName, Model, Size, MediaType, SpindleSpeed FROM MSFT_PhysicalDisk",
                            [&](IWbemClassObject* pObj) {
            DiskInfo disk;
            std::string name = trim(wmi::get_property_string(pObj, L"FriendlyName"));
            if (name.empty()) {
                name = trim(wmi::get_property_string(pObj, L"Model"));
            }
            disk.model = or_na(name);
            disk.size_bytes = wmi::get_property_optional_uint64(pObj, L"Size");

            auto media_type = wmi::get_property_optional_uint64(pObj, L"MediaType");
            if (media_type) {
                disk.kind = disk_kind_from_media_type(static_cast<int>(*media_type));
            }
            // Fallback hint via SpindleSpeed when the media type is unspecified
            if (disk.kind == DiskKind::Unknown) {
                auto spindle = wmi::get_property_optional_uint64(pObj, L"SpindleSpeed");
                if (spindle) {
                    disk.kind = disk_kind_from_spindle_speed(static_cast<uint32_t>(*spindle));
                }
            }
            disks.push_back(disk);
        });

        if (!ok) {
            return StrategyResult<DiskList>::failure(failure_from_wmi(wmi), hresult_text(wmi.last_error()));
        }
        if (disks.empty()) {
            return StrategyResult<DiskList>::failure(FailureKind::Empty);
        }
        return StrategyResult<DiskList>::success(disks);
    }
};

class PowerShellPhysicalDiskStrategy : public Strategy<DiskList> {
public:
    std::string name() const override { return "powershell"; }

    StrategyResult<DiskList> detect(DetectionTrace&) override {
        std::string output = utils::run_command(
            "powershell -NoProfile -Command \"Get-PhysicalDisk | "
            "Select-Object FriendlyName, MediaType, Size | ConvertTo-Json -Compress\" 2>NUL");

        DiskList disks = parse_physical_disk_json(output);
        if (disks.empty()) {
            return StrategyResult<DiskList>::failure(FailureKind::Empty);
        }
        return StrategyResult<DiskList>::success(disks);
    }
};

class Win32DiskDriveStrategy : public Strategy<DiskList> {
public:
    std::string name() const override { return "win32_diskdrive"; }

    StrategyResult<DiskList> detect(DetectionTrace&) override {
        wmi::WMIConnection wmi;
        if (!wmi.is_valid()) {
            return StrategyResult<DiskList>::failure(failure_from_wmi(wmi), hresult_text(wmi.last_error()));
        }

        DiskList disks;
        wmi.query(L"SELECT Model, Size, PNPDeviceID, SerialNumber FROM Win32_DiskDrive", [&](IWbemClassObject* pObj) {
            auto size = wmi::get_property_optional_uint64(pObj, L"Size");
            if (!size || *size == 0) {
                return;  // removable bays without media
            }
            DiskInfo disk;
            std::string model = trim(wmi::get_property_string(pObj, L"Model"));
            disk.model = or_na(model);
            disk.size_bytes = size;
            disk.kind = disk_kind_from_drive_strings(wmi::get_property_string(pObj, L"PNPDeviceID"),
                                                     model,
                                                     wmi::get_property_string(pObj, L"SerialNumber"));
            disks.push_back(disk);
        });

        if (disks.empty()) {
            return StrategyResult<DiskList>::failure(FailureKind::Empty);
        }
        return StrategyResult<DiskList>::success(disks);
    }
};

} // namespace

StrategyList<BoardInfo> WindowsSystemInfo::board_strategies() {
    StrategyList<BoardInfo> strategies;
    strategies.push_back(std::make_unique<RegistryBoardStrategy>());
    strategies.push_back(std::make_unique<WmiBoardStrategy>());
    return strategies;
}

StrategyList<CPUInfo> WindowsSystemInfo::cpu_strategies() {
    StrategyList<CPUInfo> strategies;
    strategies.push_back(std::make_unique<WmiProcessorStrategy>());
    strategies.push_back(std::make_unique<RegistryProcessorStrategy>());
    return strategies;
}

StrategyList<ModuleList> WindowsSystemInfo::memory_module_strategies() {
    StrategyList<ModuleList> strategies;
    strategies.push_back(std::make_unique<WmiPhysicalMemoryStrategy>());
    return strategies;
}

StrategyList<GPUList> WindowsSystemInfo::gpu_strategies() {
    auto sources = std::make_shared<WindowsGpuSources>();
    StrategyList<GPUList> strategies;
    strategies.push_back(std::make_unique<WmiVideoControllerStrategy>(sources));
    strategies.push_back(std::make_unique<NvmlGpuStrategy>(sources));
    strategies.push_back(std::make_unique<DxgiGpuStrategy>(sources));
    return strategies;
}

StrategyList<DiskList> WindowsSystemInfo::disk_strategies() {
    StrategyList<DiskList> strategies;
    strategies.push_back(std::make_unique<MsftPhysicalDiskStrategy>());
    strategies.push_back(std::make_unique<PowerShellPhysicalDiskStrategy>());
    strategies.push_back(std::make_unique<Win32DiskDriveStrategy>());
    return strategies;
}

uint64_t WindowsSystemInfo::get_total_memory() {
    MEMORYSTATUSEX status{};
    status.dwLength = sizeof(status);
    if (!GlobalMemoryStatusEx(&status)) {
        return 0;
    }
    return status.ullTotalPhys;
}

std::string WindowsSystemInfo::get_processor_identifier() {
    const char* identifier = std::getenv("PROCESSOR_IDENTIFIER");
    return identifier ? trim(identifier) : "";
}

std::string WindowsSystemInfo::get_os_name() {
    wmi::WMIConnection wmi;
    if (!wmi.is_valid()) {
        return "Windows";  // Fallback to basic name
    }

    std::string caption;
    wmi.query(L"SELECT Caption FROM Win32_OperatingSystem", [&](IWbemClassObject* pObj) {
        if (caption.empty()) {  // Only get first result
            caption = trim(wmi::get_property_string(pObj, L"Caption"));
        }
    });
    return caption.empty() ? "Windows" : caption;
}

std::string WindowsSystemInfo::get_os_version() {
    wmi::WMIConnection wmi;
    if (!wmi.is_valid()) {
        return NOT_AVAILABLE;
    }

    std::string version, build_number;
    wmi.query(L"SELECT Version, BuildNumber FROM Win32_OperatingSystem", [&](IWbemClassObject* pObj) {
        if (version.empty()) {
            version = trim(wmi::get_property_string(pObj, L"Version"));
            build_number = trim(wmi::get_property_string(pObj, L"BuildNumber"));
        }
    });

    if (version.empty()) {
        return NOT_AVAILABLE;
    }
    if (!build_number.empty()) {
        version += " (Build " + build_number + ")";
    }
    return version;
}

#endif // _WIN32

// ============================================================================
// Linux implementation
// ============================================================================

#ifdef __linux__

namespace {

const std::string DMI_ID_DIR = "/sys/devices/virtual/dmi/id";

// First line of a sysfs attribute, empty if it cannot be read
std::string read_sysfs_value(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }
    std::string line;
    std::getline(file, line);
    return trim(line);
}

// dmidecode needs root; classify its failure accordingly
FailureKind dmidecode_failure() {
    return geteuid() == 0 ? FailureKind::Unavailable : FailureKind::PermissionDenied;
}

class SysfsDmiBoardStrategy : public Strategy<BoardInfo> {
public:
    std::string name() const override { return "sysfs-dmi"; }

    StrategyResult<BoardInfo> detect(DetectionTrace& trace) override {
        if (!fs::exists(DMI_ID_DIR)) {
            return StrategyResult<BoardInfo>::failure(FailureKind::Unavailable, DMI_ID_DIR + " missing");
        }

        std::string vendor = read_sysfs_value(DMI_ID_DIR + "/board_vendor");
        std::string board = read_sysfs_value(DMI_ID_DIR + "/board_name");
        std::string product = read_sysfs_value(DMI_ID_DIR + "/product_name");

        trace.add(TraceChannel::Board, "linux board_vendor='" + vendor + "' board_name='" + board +
                                       "' product_name='" + product + "'");

        auto result = compose_board(vendor, board, product);
        if (!result) {
            return StrategyResult<BoardInfo>::failure(FailureKind::Empty, "DMI board fields empty");
        }
        return StrategyResult<BoardInfo>::success(*result);
    }
};

class DmidecodeBoardStrategy : public Strategy<BoardInfo> {
public:
    std::string name() const override { return "dmidecode"; }

    StrategyResult<BoardInfo> detect(DetectionTrace& trace) override {
        std::string vendor, board, product;
        try {
            vendor = parse_dmidecode_string(utils::run_command("dmidecode -s baseboard-manufacturer 2>/dev/null"));
            board = parse_dmidecode_string(utils::run_command("dmidecode -s baseboard-product-name 2>/dev/null"));
            product = parse_dmidecode_string(utils::run_command("dmidecode -s system-product-name 2>/dev/null"));
        } catch (const std::runtime_error& e) {
            return StrategyResult<BoardInfo>::failure(dmidecode_failure(), e.what());
        }

        trace.add(TraceChannel::Board, "dmidecode baseboard-manufacturer='" + vendor +
                                       "' baseboard-product-name='" + board + "'");

        auto result = compose_board(vendor, board, product);
        if (!result) {
            return StrategyResult<BoardInfo>::failure(FailureKind::Empty);
        }
        return StrategyResult<BoardInfo>::success(*result);
    }
};

class ProcCpuinfoStrategy : public Strategy<CPUInfo> {
public:
    std::string name() const override { return "proc-cpuinfo"; }

    StrategyResult<CPUInfo> detect(DetectionTrace&) override {
        CPUInfo cpu = parse_proc_cpuinfo(utils::read_text_file("/proc/cpuinfo"));

        long online = sysconf(_SC_NPROCESSORS_ONLN);
        if (online > 0) {
            cpu.logical_threads = static_cast<int>(online);
        }

        // cpufreq reports kHz
        std::string max_khz = read_sysfs_value("/sys/devices/system/cpu/cpu0/cpufreq/cpuinfo_max_freq");
        if (!max_khz.empty()) {
            try {
                double khz = std::stod(max_khz);
                if (khz > 0.0) {
                    cpu.max_clock_ghz = std::round(khz / 10000.0) / 100.0;
                }
            } catch (const std::exception&) {
                // leave the clock undetermined
            }
        }

        if (!has_any_field(cpu)) {
            return StrategyResult<CPUInfo>::failure(FailureKind::Empty);
        }
        return StrategyResult<CPUInfo>::success(cpu);
    }
};

class LscpuStrategy : public Strategy<CPUInfo> {
public:
    std::string name() const override { return "lscpu"; }

    StrategyResult<CPUInfo> detect(DetectionTrace&) override {
        std::string output;
        try {
            output = utils::run_command("lscpu 2>/dev/null");
        } catch (const std::runtime_error& e) {
            return StrategyResult<CPUInfo>::failure(FailureKind::Unavailable, e.what());
        }

        CPUInfo cpu = parse_lscpu(output);
        if (!has_any_field(cpu)) {
            return StrategyResult<CPUInfo>::failure(FailureKind::Empty, "No CPU information found");
        }
        return StrategyResult<CPUInfo>::success(cpu);
    }
};

class DmidecodeMemoryStrategy : public Strategy<ModuleList> {
public:
    std::string name() const override { return "dmidecode"; }

    StrategyResult<ModuleList> detect(DetectionTrace&) override {
        std::string output;
        try {
            output = utils::run_command("dmidecode --type 17 2>/dev/null");
        } catch (const std::runtime_error& e) {
            return StrategyResult<ModuleList>::failure(dmidecode_failure(), e.what());
        }

        ModuleList modules = parse_dmidecode_memory(output);
        if (modules.empty()) {
            return StrategyResult<ModuleList>::failure(FailureKind::Empty, "no populated memory devices");
        }
        return StrategyResult<ModuleList>::success(modules);
    }
};

class LspciGpuStrategy : public Strategy<GPUList> {
public:
    std::string name() const override { return "lspci"; }

    StrategyResult<GPUList> detect(DetectionTrace& trace) override {
        std::string output;
        try {
            output = utils::run_command("lspci 2>/dev/null");
        } catch (const std::runtime_error& e) {
            return StrategyResult<GPUList>::failure(FailureKind::Unavailable, e.what());
        }

        GPUList gpus = parse_lspci_display(output);
        for (size_t i = 0; i < gpus.size(); ++i) {
            trace.add(TraceChannel::GPU, "lspci[" + std::to_string(i) + "]: model='" + gpus[i].model + "'");
        }
        if (gpus.empty()) {
            return StrategyResult<GPUList>::failure(FailureKind::Empty, "no display-class devices");
        }
        return StrategyResult<GPUList>::success(gpus);
    }
};

class LsblkStrategy : public Strategy<DiskList> {
public:
    std::string name() const override { return "lsblk"; }

    StrategyResult<DiskList> detect(DetectionTrace&) override {
        std::string output;
        try {
            output = utils::run_command("lsblk -b -d -o NAME,MODEL,SIZE,ROTA 2>/dev/null");
        } catch (const std::runtime_error& e) {
            return StrategyResult<DiskList>::failure(FailureKind::Unavailable, e.what());
        }

        DiskList disks = parse_lsblk(output);
        if (disks.empty()) {
            return StrategyResult<DiskList>::failure(FailureKind::Empty);
        }
        return StrategyResult<DiskList>::success(disks);
    }
};

class SysfsBlockStrategy : public Strategy<DiskList> {
public:
    std::string name() const override { return "sysfs-block"; }

    StrategyResult<DiskList> detect(DetectionTrace&) override {
        const std::string block_dir = "/sys/block";
        if (!fs::exists(block_dir)) {
            return StrategyResult<DiskList>::failure(FailureKind::Unavailable, block_dir + " missing");
        }

        std::vector<fs::path> devices;
        for (const auto& entry : fs::directory_iterator(block_dir)) {
            devices.push_back(entry.path());
        }
        std::sort(devices.begin(), devices.end());

        DiskList disks;
        for (const auto& device : devices) {
            std::string dev_name = device.filename().string();
            if (is_virtual_block_device(dev_name)) {
                continue;
            }

            DiskInfo disk;
            disk.model = or_na(read_sysfs_value((device / "device" / "model").string()));

            // size is in 512-byte sectors regardless of the logical block size
            std::string sectors = read_sysfs_value((device / "size").string());
            try {
                if (!sectors.empty()) {
                    disk.size_bytes = std::stoull(sectors) * 512ULL;
                }
            } catch (const std::exception&) {
                disk.size_bytes.reset();
            }

            disk.kind = disk_kind_from_rotational(read_sysfs_value((device / "queue" / "rotational").string()));
            disks.push_back(disk);
        }

        if (disks.empty()) {
            return StrategyResult<DiskList>::failure(FailureKind::Empty);
        }
        return StrategyResult<DiskList>::success(disks);
    }
};

} // namespace

StrategyList<BoardInfo> LinuxSystemInfo::board_strategies() {
    StrategyList<BoardInfo> strategies;
    strategies.push_back(std::make_unique<SysfsDmiBoardStrategy>());
    strategies.push_back(std::make_unique<DmidecodeBoardStrategy>());
    return strategies;
}

StrategyList<CPUInfo> LinuxSystemInfo::cpu_strategies() {
    StrategyList<CPUInfo> strategies;
    strategies.push_back(std::make_unique<ProcCpuinfoStrategy>());
    strategies.push_back(std::make_unique<LscpuStrategy>());
    return strategies;
}

StrategyList<ModuleList> LinuxSystemInfo::memory_module_strategies() {
    StrategyList<ModuleList> strategies;
    strategies.push_back(std::make_unique<DmidecodeMemoryStrategy>());
    return strategies;
}

StrategyList<GPUList> LinuxSystemInfo::gpu_strategies() {
    StrategyList<GPUList> strategies;
    strategies.push_back(std::make_unique<LspciGpuStrategy>());
    return strategies;
}

StrategyList<DiskList> LinuxSystemInfo::disk_strategies() {
    StrategyList<DiskList> strategies;
    strategies.push_back(std::make_unique<LsblkStrategy>());
    strategies.push_back(std::make_unique<SysfsBlockStrategy>());
    return strategies;
}

uint64_t LinuxSystemInfo::get_total_memory() {
    struct sysinfo info {};
    if (sysinfo(&info) != 0) {
        return 0;
    }
    return static_cast<uint64_t>(info.totalram) * info.mem_unit;
}

std::string LinuxSystemInfo::get_processor_identifier() {
    struct utsname uts {};
    if (uname(&uts) != 0) {
        return "";
    }
    return trim(uts.machine);
}

std::string LinuxSystemInfo::get_os_name() {
    std::ifstream os_release("/etc/os-release");
    if (os_release.is_open()) {
        std::ostringstream oss;
        oss << os_release.rdbuf();
        std::string distro = parse_os_release(oss.str());
        if (!distro.empty()) {
            return distro;
        }
    }
    return "Linux";
}

std::string LinuxSystemInfo::get_os_version() {
    struct utsname uts {};
    if (uname(&uts) != 0) {
        return NOT_AVAILABLE;
    }
    return trim(uts.release);
}

#endif // __linux__

} // namespace xpec
