#include "xpec/inventory.h"
#include "xpec/normalizer.h"

namespace xpec {

BoardInfo InventoryBuilder::detect_board(DetectionTrace& trace) {
    BoardInfo board;
    try {
        ProviderChain<BoardInfo> chain("board", TraceChannel::Board, system_info_.board_strategies());
        board = chain.resolve(trace, BoardInfo{});
    } catch (const std::exception& e) {
        trace.add(TraceChannel::Board, std::string("board: detection aborted (") + e.what() + ")");
        board = BoardInfo{};
    }

    try {
        board.os_name = system_info_.get_os_name();
        board.os_version = system_info_.get_os_version();
    } catch (const std::exception& e) {
        trace.add(TraceChannel::General, std::string("os: detection aborted (") + e.what() + ")");
    }
    if (board.os_name.empty()) board.os_name = NOT_AVAILABLE;
    if (board.os_version.empty()) board.os_version = NOT_AVAILABLE;
    return board;
}

CPUInfo InventoryBuilder::detect_cpu(DetectionTrace& trace) {
    CPUInfo cpu;
    try {
        ProviderChain<CPUInfo> chain("cpu", TraceChannel::General, system_info_.cpu_strategies());
        cpu = chain.resolve(trace, CPUInfo{});
    } catch (const std::exception& e) {
        trace.add(TraceChannel::General, std::string("cpu: detection aborted (") + e.what() + ")");
        cpu = CPUInfo{};
    }

    // Generic identifier when no provider reported a model name
    if (trim(cpu.model).empty()) {
        try {
            cpu.model = trim(system_info_.get_processor_identifier());
        } catch (const std::exception& e) {
            trace.add(TraceChannel::General, std::string("cpu: identifier unavailable (") + e.what() + ")");
        }
    }
    cpu.model = or_na(cpu.model);
    return cpu;
}

RAMInfo InventoryBuilder::detect_ram(DetectionTrace& trace) {
    RAMInfo ram;
    try {
        ram.total_bytes = system_info_.get_total_memory();
    } catch (const std::exception& e) {
        trace.add(TraceChannel::General, std::string("ram: total unavailable (") + e.what() + ")");
    }

    try {
        ProviderChain<ModuleList> chain("ram", TraceChannel::General, system_info_.memory_module_strategies());
        ram.modules = chain.resolve(trace, ModuleList{});
    } catch (const std::exception& e) {
        trace.add(TraceChannel::General, std::string("ram: detection aborted (") + e.what() + ")");
        ram.modules.clear();
    }
    return ram;
}

GPUList InventoryBuilder::detect_gpus(DetectionTrace& trace) {
    try {
        ProviderChain<GPUList> chain("gpu", TraceChannel::GPU, system_info_.gpu_strategies());
        return chain.resolve(trace, GPUList{});
    } catch (const std::exception& e) {
        trace.add(TraceChannel::GPU, std::string("gpu: detection aborted (") + e.what() + ")");
        return {};
    }
}

DiskList InventoryBuilder::detect_disks(DetectionTrace& trace) {
    try {
        ProviderChain<DiskList> chain("disk", TraceChannel::General, system_info_.disk_strategies());
        return chain.resolve(trace, DiskList{});
    } catch (const std::exception& e) {
        trace.add(TraceChannel::General, std::string("disk: detection aborted (") + e.what() + ")");
        return {};
    }
}

HardwareSnapshot InventoryBuilder::build(DetectionTrace& trace) {
    trace.add(TraceChannel::General, "platform: " + system_info_.get_platform_name());

    HardwareSnapshot snapshot;
    snapshot.board = detect_board(trace);
    snapshot.cpu = detect_cpu(trace);
    snapshot.ram = detect_ram(trace);
    snapshot.gpus = detect_gpus(trace);
    snapshot.disks = detect_disks(trace);
    return snapshot;
}

HardwareSnapshot build_snapshot(DetectionTrace& trace) {
    auto system_info = create_system_info();
    InventoryBuilder builder(*system_info);
    return builder.build(trace);
}

HardwareSnapshot build_snapshot() {
    bool debug_all = env_flag("XPEC_DEBUG");
    DetectionTrace trace(debug_all || env_flag("XPEC_DEBUG_MOBO"),
                         debug_all || env_flag("XPEC_DEBUG_GPU"));
    return build_snapshot(trace);
}

} // namespace xpec
