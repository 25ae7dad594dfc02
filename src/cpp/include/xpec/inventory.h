#pragma once

#include "xpec/hardware.h"
#include "xpec/provider_chain.h"
#include "xpec/system_info.h"

namespace xpec {

// Runs every hardware class through its provider chain and assembles the snapshot.
// A class whose detection fails entirely is left empty / "N/A".
class InventoryBuilder {
public:
    explicit InventoryBuilder(SystemInfo& system_info) : system_info_(system_info) {}

    HardwareSnapshot build(DetectionTrace& trace);

    BoardInfo detect_board(DetectionTrace& trace);
    CPUInfo detect_cpu(DetectionTrace& trace);
    RAMInfo detect_ram(DetectionTrace& trace);
    GPUList detect_gpus(DetectionTrace& trace);
    DiskList detect_disks(DetectionTrace& trace);

private:
    SystemInfo& system_info_;
};

// Detect the host with the platform's SystemInfo
HardwareSnapshot build_snapshot(DetectionTrace& trace);

// Same, with the debug channels taken from XPEC_DEBUG / XPEC_DEBUG_MOBO / XPEC_DEBUG_GPU
HardwareSnapshot build_snapshot();

} // namespace xpec
