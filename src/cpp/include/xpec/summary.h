#pragma once

#include "xpec/hardware.h"
#include <string>
#include <vector>

namespace xpec {

// Condensed, human-readable renderings of a snapshot (the "share card")

// GPU with the most VRAM, first one wins on a tie. {"N/A", N/A} for an empty list.
GPUInfo choose_primary_gpu(const std::vector<GPUInfo>& gpus);

// "Total: 31.9 GB (2x16 GB) @ 3200 MHz", "Total: 15.9 GB (3 modules)", "Total: 7.8 GB"
std::string summarize_ram(const RAMInfo& ram);

// "1x SSD (476.9 GB), 2x HDD (3726.0 GB)", "N/A" when no disk has a known kind
std::string summarize_storage(const std::vector<DiskInfo>& disks);

// "Ryzen 7 5800X 8-Core Processor  |  8C/16T  |  4.85 GHz"
std::string summarize_cpu(const CPUInfo& cpu);

// "NVIDIA GeForce RTX 3080  |  10.0 GB VRAM"
std::string summarize_gpu(const GPUInfo& gpu);

// "{vendor} {model}", leaving out unknown parts; "N/A" when both are unknown
std::string board_display_name(const BoardInfo& board);

// "{os_name} {os_version}", "N/A" when neither is known
std::string os_display_name(const BoardInfo& board);

struct ShareCardLine {
    std::string label;
    std::string text;
};

// GPU, CPU, RAM, Motherboard, Storage and OS lines in card order
std::vector<ShareCardLine> share_card_lines(const HardwareSnapshot& snapshot);

} // namespace xpec
