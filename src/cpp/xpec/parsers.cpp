#include "xpec/parsers.h"
#include "xpec/normalizer.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <set>
#include <sstream>
#include <utility>

namespace xpec {

using json = nlohmann::json;

// Split "Key: value" at the first colon; false if there is no colon
static bool split_field(const std::string& line, std::string& key, std::string& value) {
    size_t pos = line.find(':');
    if (pos == std::string::npos) {
        return false;
    }
    key = trim(line.substr(0, pos));
    value = trim(line.substr(pos + 1));
    return true;
}

// ============================================================================
// Memory
// ============================================================================

std::optional<uint64_t> parse_dmidecode_size(const std::string& text) {
    static const std::regex size_regex(R"((\d+)\s*(KB|MB|GB|TB))", std::regex::icase);
    std::smatch match;
    if (!std::regex_search(text, match, size_regex)) {
        return std::nullopt;
    }

    uint64_t amount = std::stoull(match[1].str());
    std::string unit = to_upper(match[2].str());
    if (unit == "KB") {
        return amount * 1024ULL;
    } else if (unit == "MB") {
        return amount * 1024ULL * 1024ULL;
    } else if (unit == "GB") {
        return amount * 1024ULL * 1024ULL * 1024ULL;
    }
    return amount * 1024ULL * 1024ULL * 1024ULL * 1024ULL;
}

struct RawMemoryDevice {
    std::string size;
    std::string speed;
    std::string configured_speed;
    std::string manufacturer;
    std::string part_number;
};

std::vector<MemoryModule> parse_dmidecode_memory(const std::string& output) {
    std::vector<RawMemoryDevice> devices;
    std::optional<RawMemoryDevice> current;

    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        std::string trimmed = trim(line);
        if (trimmed == "Memory Device") {
            if (current) {
                devices.push_back(*current);
            }
            current = RawMemoryDevice{};
            continue;
        }
        // A new "Handle ..." line ends the current section's fields
        bool is_handle = trimmed.rfind("Handle ", 0) == 0;
        if (is_handle && current) {
            devices.push_back(*current);
            current.reset();
        }
        if (!current || is_handle) {
            continue;
        }

        std::string key, value;
        if (!split_field(trimmed, key, value)) {
            continue;
        }
        if (key == "Size") {
            current->size = value;
        } else if (key == "Speed") {
            current->speed = value;
        } else if (key == "Configured Memory Speed" || key == "Configured Clock Speed") {
            current->configured_speed = value;
        } else if (key == "Manufacturer") {
            current->manufacturer = value;
        } else if (key == "Part Number") {
            current->part_number = value;
        }
    }
    if (current) {
        devices.push_back(*current);
    }

    std::vector<MemoryModule> modules;
    for (const auto& dev : devices) {
        if (dev.size.find("No Module Installed") != std::string::npos) {
            continue;
        }

        MemoryModule module;
        module.index = static_cast<int>(modules.size()) + 1;
        module.capacity_bytes = parse_dmidecode_size(dev.size);

        std::optional<int> speed = parse_leading_int(dev.configured_speed);
        if (!speed || *speed == 0) {
            speed = parse_leading_int(dev.speed);
        }
        if (speed && *speed > 0) {
            module.speed_mhz = speed;
        }

        module.manufacturer = is_placeholder(dev.manufacturer, MEMORY_VENDOR_PLACEHOLDERS)
                                  ? NOT_AVAILABLE
                                  : trim(dev.manufacturer);
        module.part_number = is_placeholder(dev.part_number, MEMORY_VENDOR_PLACEHOLDERS)
                                 ? NOT_AVAILABLE
                                 : trim(dev.part_number);
        modules.push_back(module);
    }

    return modules;
}

// ============================================================================
// Storage
// ============================================================================

bool is_virtual_block_device(const std::string& name) {
    for (const char* prefix : {"loop", "ram", "zram", "sr", "nbd", "dm-", "md"}) {
        if (name.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

std::vector<DiskInfo> parse_lsblk(const std::string& output) {
    std::vector<DiskInfo> disks;
    std::istringstream iss(output);
    std::string line;
    bool header = true;

    while (std::getline(iss, line)) {
        if (header) {
            header = false;
            continue;
        }
        if (trim(line).empty()) {
            continue;
        }

        std::istringstream columns(line);
        std::vector<std::string> parts;
        std::string part;
        while (columns >> part) {
            parts.push_back(part);
        }
        if (parts.size() < 3 || is_virtual_block_device(parts[0])) {
            continue;
        }

        DiskInfo disk;
        std::string model;
        for (size_t i = 1; i + 2 < parts.size(); ++i) {
            if (!model.empty()) model += " ";
            model += parts[i];
        }
        disk.model = or_na(model);

        const std::string& size = parts[parts.size() - 2];
        if (!size.empty() && std::all_of(size.begin(), size.end(), ::isdigit)) {
            try {
                disk.size_bytes = std::stoull(size);
            } catch (const std::exception&) {
                // out of range, leave undetermined
            }
        }
        disk.kind = disk_kind_from_rotational(parts.back());
        disks.push_back(disk);
    }

    return disks;
}

std::vector<DiskInfo> parse_physical_disk_json(const std::string& output) {
    std::vector<DiskInfo> disks;
    if (trim(output).empty()) {
        return disks;
    }

    json items = json::parse(output);
    if (items.is_object()) {
        items = json::array({items});
    }
    if (!items.is_array()) {
        return disks;
    }

    for (const auto& item : items) {
        if (!item.is_object()) continue;

        DiskInfo disk;
        if (item.contains("FriendlyName") && item["FriendlyName"].is_string()) {
            disk.model = or_na(item["FriendlyName"].get<std::string>());
        }

        if (item.contains("Size")) {
            const auto& size = item["Size"];
            if (size.is_number_unsigned()) {
                disk.size_bytes = size.get<uint64_t>();
            } else if (size.is_number_integer() && size.get<int64_t>() >= 0) {
                disk.size_bytes = static_cast<uint64_t>(size.get<int64_t>());
            } else if (size.is_string()) {
                try {
                    disk.size_bytes = std::stoull(size.get<std::string>());
                } catch (const std::exception&) {
                    // not a number, leave undetermined
                }
            }
        }

        if (item.contains("MediaType")) {
            const auto& media = item["MediaType"];
            if (media.is_string()) {
                disk.kind = disk_kind_from_media_text(media.get<std::string>());
            } else if (media.is_number_integer()) {
                disk.kind = disk_kind_from_media_type(media.get<int>());
            }
        }
        disks.push_back(disk);
    }

    return disks;
}

DiskKind disk_kind_from_media_type(int media_type) {
    switch (media_type) {
        case 3:
            return DiskKind::HDD;
        case 4:
        case 5:
            return DiskKind::SSD;
        default:
            return DiskKind::Unknown;
    }
}

uint32_t cim_uint32_from_i4(int32_t value) {
    return static_cast<uint32_t>(value);
}

DiskKind disk_kind_from_spindle_speed(uint32_t rpm) {
    // 0xFFFFFFFF is reported when the drive does not know its rotation rate
    if (rpm == UINT32_MAX) {
        return DiskKind::Unknown;
    }
    return rpm == 0 ? DiskKind::SSD : DiskKind::HDD;
}

DiskKind disk_kind_from_media_text(const std::string& media) {
    std::string upper = to_upper(trim(media));
    if (upper == "SSD" || upper == "SCM") {
        return DiskKind::SSD;
    }
    if (upper == "HDD") {
        return DiskKind::HDD;
    }
    return DiskKind::Unknown;
}

DiskKind disk_kind_from_rotational(const std::string& flag) {
    std::string value = trim(flag);
    if (value.empty() || !std::all_of(value.begin(), value.end(), ::isdigit)) {
        return DiskKind::Unknown;
    }
    return value == "0" ? DiskKind::SSD : DiskKind::HDD;
}

DiskKind disk_kind_from_drive_strings(const std::string& pnp_device_id,
                                      const std::string& model,
                                      const std::string& serial) {
    std::string pnp_upper = to_upper(pnp_device_id);
    std::string model_upper = to_upper(model);
    std::string serial_upper = to_upper(serial);

    if (pnp_upper.find("NVME") != std::string::npos ||
        model_upper.find("NVME") != std::string::npos ||
        serial_upper.find("NVME") != std::string::npos) {
        return DiskKind::SSD;
    }
    if (model_upper.find("SSD") != std::string::npos) {
        return DiskKind::SSD;
    }
    return DiskKind::HDD;
}

// ============================================================================
// GPU
// ============================================================================

std::vector<GPUInfo> parse_lspci_display(const std::string& output) {
    std::vector<GPUInfo> gpus;
    std::istringstream iss(output);
    std::string line;

    while (std::getline(iss, line)) {
        size_t pos = line.find(": ");
        if (pos == std::string::npos) {
            continue;
        }

        // "01:00.0 VGA compatible controller: NVIDIA Corporation ..."
        std::string device_class = to_lower(line.substr(0, pos));
        size_t slot_end = device_class.find(' ');
        if (slot_end != std::string::npos) {
            device_class = device_class.substr(slot_end + 1);  // drop the bus address
        }
        if (device_class != "vga compatible controller" &&
            device_class != "3d controller" &&
            device_class != "display controller") {
            continue;
        }

        GPUInfo gpu;
        gpu.model = or_na(line.substr(pos + 2));
        gpus.push_back(gpu);
    }

    return gpus;
}

// ============================================================================
// CPU
// ============================================================================

CPUInfo parse_proc_cpuinfo(const std::string& text) {
    CPUInfo cpu;
    std::set<std::pair<std::string, std::string>> cores;
    std::string physical_id = "0";
    std::string core_id;
    int processors = 0;

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        std::string key, value;
        if (!split_field(line, key, value)) {
            // Blank line closes a processor block
            if (!core_id.empty()) {
                cores.insert({physical_id, core_id});
            }
            physical_id = "0";
            core_id.clear();
            continue;
        }

        if (key == "processor") {
            ++processors;
        } else if (key == "model name" && cpu.model.empty()) {
            cpu.model = value;
        } else if (key == "physical id") {
            physical_id = value;
        } else if (key == "core id") {
            core_id = value;
        }
    }
    if (!core_id.empty()) {
        cores.insert({physical_id, core_id});
    }

    if (!cores.empty()) {
        cpu.physical_cores = static_cast<int>(cores.size());
    }
    if (processors > 0) {
        cpu.logical_threads = processors;
    }
    return cpu;
}

CPUInfo parse_lscpu(const std::string& output) {
    CPUInfo cpu;
    int cores_per_socket = 0;
    int sockets = 1;  // Default to 1

    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        std::string key, value;
        if (!split_field(line, key, value)) {
            continue;
        }

        try {
            if (key == "Model name") {
                cpu.model = value;
            } else if (key == "CPU(s)") {
                cpu.logical_threads = std::stoi(value);
            } else if (key == "Core(s) per socket") {
                cores_per_socket = std::stoi(value);
            } else if (key == "Socket(s)") {
                sockets = std::stoi(value);
            } else if (key == "CPU max MHz") {
                double mhz = std::stod(value);
                if (mhz > 0.0) {
                    cpu.max_clock_ghz = std::round(mhz / 10.0) / 100.0;
                }
            }
        } catch (const std::exception&) {
            // Unparseable field, leave it undetermined
        }
    }

    if (cores_per_socket > 0) {
        cpu.physical_cores = cores_per_socket * sockets;
    }
    return cpu;
}

// ============================================================================
// OS
// ============================================================================

std::string parse_os_release(const std::string& text) {
    std::istringstream iss(text);
    std::string line;
    std::string distro_name, distro_version;

    while (std::getline(iss, line)) {
        if (line.find("NAME=") == 0) {
            distro_name = line.substr(5);
            // Remove quotes
            distro_name.erase(std::remove(distro_name.begin(), distro_name.end(), '"'), distro_name.end());
        } else if (line.find("VERSION_ID=") == 0) {
            distro_version = line.substr(11);
            distro_version.erase(std::remove(distro_version.begin(), distro_version.end(), '"'), distro_version.end());
        }
    }

    distro_name = trim(distro_name);
    if (distro_name.empty()) {
        return "";
    }
    distro_version = trim(distro_version);
    return distro_version.empty() ? distro_name : distro_name + " " + distro_version;
}

std::string parse_dmidecode_string(const std::string& output) {
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        std::string value = trim(line);
        if (!value.empty() && value[0] != '#') {
            return value;
        }
    }
    return "";
}

} // namespace xpec
