#include "xpec/summary.h"
#include "xpec/normalizer.h"
#include <iomanip>
#include <sstream>

namespace xpec {

static std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

GPUInfo choose_primary_gpu(const std::vector<GPUInfo>& gpus) {
    if (gpus.empty()) {
        return GPUInfo{};
    }

    const GPUInfo* best = &gpus.front();
    double best_gb = extract_gb(bytes_to_gb(best->vram_bytes));
    for (const auto& gpu : gpus) {
        double gb = extract_gb(bytes_to_gb(gpu.vram_bytes));
        if (gb > best_gb) {
            best = &gpu;
            best_gb = gb;
        }
    }
    return *best;
}

std::string summarize_ram(const RAMInfo& ram) {
    std::string summary = "Total: " + bytes_to_gb(static_cast<int64_t>(ram.total_bytes));

    const auto& modules = ram.modules;
    if (modules.empty()) {
        return summary;
    }

    bool complete = true;
    bool same_size = true;
    bool same_speed = true;
    for (const auto& module : modules) {
        if (!module.capacity_bytes || !module.speed_mhz || *module.capacity_bytes == 0) {
            complete = false;
            break;
        }
        same_size = same_size && *module.capacity_bytes == *modules.front().capacity_bytes;
        same_speed = same_speed && *module.speed_mhz == *modules.front().speed_mhz;
    }

    const std::string count = std::to_string(modules.size());
    if (complete && same_size) {
        double per_module_gb = extract_gb(bytes_to_gb(modules.front().capacity_bytes));
        summary += " (" + count + "x" + format_fixed(per_module_gb, 0) + " GB)";
        if (same_speed) {
            summary += " @ " + std::to_string(*modules.front().speed_mhz) + " MHz";
        }
    } else {
        summary += " (" + count + " modules)";
    }
    return summary;
}

std::string summarize_storage(const std::vector<DiskInfo>& disks) {
    int ssd_count = 0, hdd_count = 0;
    double ssd_gb = 0.0, hdd_gb = 0.0;

    for (const auto& disk : disks) {
        double gb = extract_gb(bytes_to_gb(disk.size_bytes));
        if (disk.kind == DiskKind::SSD) {
            ++ssd_count;
            ssd_gb += gb;
        } else if (disk.kind == DiskKind::HDD) {
            ++hdd_count;
            hdd_gb += gb;
        }
    }

    std::string summary;
    if (ssd_count > 0) {
        summary = std::to_string(ssd_count) + "x SSD (" + format_fixed(ssd_gb, 1) + " GB)";
    }
    if (hdd_count > 0) {
        if (!summary.empty()) summary += ", ";
        summary += std::to_string(hdd_count) + "x HDD (" + format_fixed(hdd_gb, 1) + " GB)";
    }
    return summary.empty() ? NOT_AVAILABLE : summary;
}

std::string summarize_cpu(const CPUInfo& cpu) {
    return clean_cpu_model(cpu.model) + "  |  " +
           or_na(cpu.physical_cores) + "C/" + or_na(cpu.logical_threads) + "T  |  " +
           format_ghz(cpu.max_clock_ghz);
}

std::string summarize_gpu(const GPUInfo& gpu) {
    return or_na(gpu.model) + "  |  " + bytes_to_gb(gpu.vram_bytes) + " VRAM";
}

static std::string join_known(const std::string& first, const std::string& second) {
    std::string a = trim(first) == NOT_AVAILABLE ? "" : trim(first);
    std::string b = trim(second) == NOT_AVAILABLE ? "" : trim(second);
    return or_na(a + " " + b);
}

std::string board_display_name(const BoardInfo& board) {
    return join_known(board.vendor, board.model);
}

std::string os_display_name(const BoardInfo& board) {
    return join_known(board.os_name, board.os_version);
}

std::vector<ShareCardLine> share_card_lines(const HardwareSnapshot& snapshot) {
    return {
        {"GPU", summarize_gpu(choose_primary_gpu(snapshot.gpus))},
        {"CPU", summarize_cpu(snapshot.cpu)},
        {"RAM", summarize_ram(snapshot.ram)},
        {"Motherboard", board_display_name(snapshot.board)},
        {"Storage", summarize_storage(snapshot.disks)},
        {"OS", os_display_name(snapshot.board)},
    };
}

} // namespace xpec
