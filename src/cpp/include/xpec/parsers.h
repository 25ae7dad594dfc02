#pragma once

#include "xpec/hardware.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xpec {

// Parsers for captured command and file output. They never touch the system,
// so every provider's text handling can be exercised with canned output.

// `dmidecode --type 17`: one module per populated "Memory Device" section
std::vector<MemoryModule> parse_dmidecode_memory(const std::string& output);

// dmidecode size field ("16 GB", "8192 MB"), nullopt for "No Module Installed" etc.
std::optional<uint64_t> parse_dmidecode_size(const std::string& text);

// `lsblk -b -d -o NAME,MODEL,SIZE,ROTA` (header line included)
std::vector<DiskInfo> parse_lsblk(const std::string& output);

// loop, ram, zram, optical, network block, device-mapper and md RAID nodes
bool is_virtual_block_device(const std::string& name);

// `lspci` output, keeping VGA / 3D / display controllers only
std::vector<GPUInfo> parse_lspci_display(const std::string& output);

// /proc/cpuinfo: model name, physical cores from distinct (physical id, core id)
// pairs and logical processors from "processor" entries
CPUInfo parse_proc_cpuinfo(const std::string& text);

// `lscpu`: Model name, CPU(s), Core(s) per socket, Socket(s), CPU max MHz
CPUInfo parse_lscpu(const std::string& output);

// `Get-PhysicalDisk | Select-Object FriendlyName, MediaType, Size | ConvertTo-Json`
// Accepts a single object or an array. Throws nlohmann::json::exception on malformed JSON.
std::vector<DiskInfo> parse_physical_disk_json(const std::string& output);

// /etc/os-release: "NAME VERSION_ID", empty if NAME is missing
std::string parse_os_release(const std::string& text);

// `dmidecode -s <keyword>` prints one value, with comment lines on some systems
std::string parse_dmidecode_string(const std::string& output);

// WMI returns CIM uint32 properties as VT_I4; reinterpret the bits unsigned
uint32_t cim_uint32_from_i4(int32_t value);

// Storage media classification
DiskKind disk_kind_from_media_type(int media_type);            // 3 HDD, 4 SSD, 5 SCM
DiskKind disk_kind_from_spindle_speed(uint32_t rpm);           // 0 SSD, >0 HDD
DiskKind disk_kind_from_media_text(const std::string& media);  // "SSD", "SCM", "HDD"
DiskKind disk_kind_from_rotational(const std::string& flag);   // "0" SSD, other numbers HDD
DiskKind disk_kind_from_drive_strings(const std::string& pnp_device_id,
                                      const std::string& model,
                                      const std::string& serial);

} // namespace xpec
