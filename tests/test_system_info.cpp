#include <xpec/parsers.h>
#include <xpec/summary.h>
#include <xpec/system_info.h>

#include <catch2/catch.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

using namespace xpec;

static const uint64_t GiB = 1024ULL * 1024ULL * 1024ULL;

TEST_CASE("compose_board falls back to the system product name") {
    auto board = compose_board("ASUSTeK COMPUTER INC.", "TO BE FILLED BY O.E.M.", "ROG STRIX B550");

    REQUIRE(board.has_value());
    REQUIRE(board->vendor == "ASUS");
    REQUIRE(board->model == "ROG STRIX B550");
    REQUIRE(board_display_name(*board) == "ASUS ROG STRIX B550");
}

TEST_CASE("compose_board strips the OEM board code") {
    auto board = compose_board("Micro-Star International Co., Ltd.", "MAG B650 TOMAHAWK WIFI (MS-7D75)", "MS-7D75");

    REQUIRE(board.has_value());
    REQUIRE(board->vendor == "MSI");
    REQUIRE(board->model == "MAG B650 TOMAHAWK WIFI");
}

TEST_CASE("compose_board with only placeholders") {
    REQUIRE_FALSE(compose_board("", "", "Some Laptop").has_value());

    auto board = compose_board("To Be Filled By O.E.M.", "Default string", "System Product Name");
    REQUIRE(board.has_value());
    REQUIRE(board->vendor == "N/A");
    REQUIRE(board->model.empty());
    REQUIRE(board_display_name(*board) == "N/A");
}

TEST_CASE("gpu_names_match is bidirectional containment") {
    REQUIRE(gpu_names_match("NVIDIA GeForce RTX 3080", "NVIDIA GeForce RTX 3080"));
    REQUIRE(gpu_names_match("GeForce RTX 3080", "NVIDIA GeForce RTX 3080"));
    REQUIRE(gpu_names_match("NVIDIA GeForce RTX 3080", "RTX 3080"));
    REQUIRE_FALSE(gpu_names_match("nvidia geforce rtx 3080", "NVIDIA GeForce RTX 3080"));
    REQUIRE_FALSE(gpu_names_match("", "NVIDIA GeForce RTX 3080"));

    // Known over-match on short fragments
    REQUIRE(gpu_names_match("RTX 3070", "NVIDIA GeForce RTX 3070 Ti"));
}

TEST_CASE("merge_gpu_sources prefers NVML, then DXGI, then AdapterRAM") {
    std::vector<VideoControllerEntry> controllers = {
        {"NVIDIA GeForce RTX 3080", 4293918720ULL},
        {"Microsoft Basic Display Adapter", 0ULL},
        {"AMD Radeon(TM) Graphics", 536870912ULL},
        {"Intel(R) UHD Graphics 770", std::nullopt},
        {"Parsec Virtual Display Adapter", 268435456ULL},
        {"", 1024ULL},
    };
    std::vector<GPUSourceEntry> nvml = {{"NVIDIA GeForce RTX 3080", 10 * GiB}};
    std::vector<GPUSourceEntry> dxgi = {
        {"NVIDIA GeForce RTX 3080", 9 * GiB},
        {"AMD Radeon(TM) Graphics", 2 * GiB},
    };

    DetectionTrace trace(false, true);
    GPUList gpus = merge_gpu_sources(controllers, nvml, dxgi, trace);

    REQUIRE(gpus.size() == 4);
    REQUIRE(gpus[0].model == "NVIDIA GeForce RTX 3080");
    REQUIRE(gpus[0].vram_bytes == 10 * GiB);
    REQUIRE(gpus[1].model == "AMD Radeon(TM) Graphics");
    REQUIRE(gpus[1].vram_bytes == 2 * GiB);
    REQUIRE(gpus[2].model == "Intel(R) UHD Graphics 770");
    REQUIRE_FALSE(gpus[2].vram_bytes.has_value());
    REQUIRE(gpus[3].model == "Parsec Virtual Display Adapter");
    REQUIRE(gpus[3].vram_bytes == 268435456ULL);

    auto lines = trace.lines(TraceChannel::GPU);
    REQUIRE(std::any_of(lines.begin(), lines.end(), [](const std::string& line) {
        return line.find("name='NVIDIA GeForce RTX 3080'") != std::string::npos &&
               line.find("chosen=nvml") != std::string::npos;
    }));
    REQUIRE(std::any_of(lines.begin(), lines.end(), [](const std::string& line) {
        return line.find("chosen=dxgi") != std::string::npos;
    }));
}

TEST_CASE("AdapterRAM above 2 GiB is used as the last VRAM fallback") {
    std::vector<VideoControllerEntry> controllers = {
        {"AMD Radeon RX 6800", static_cast<uint64_t>(cim_uint32_from_i4(static_cast<int32_t>(0xFFF00000u)))},
    };

    DetectionTrace trace(false, true);
    GPUList gpus = merge_gpu_sources(controllers, {}, {}, trace);

    REQUIRE(gpus.size() == 1);
    REQUIRE(gpus[0].vram_bytes == 4293918720ULL);
    REQUIRE(summarize_gpu(gpus[0]).find("4.0 GB") != std::string::npos);
}

TEST_CASE("Microsoft adapters are treated as virtual") {
    REQUIRE(is_virtual_display_adapter("Microsoft Basic Display Adapter"));
    REQUIRE(is_virtual_display_adapter("Microsoft Remote Display Adapter"));
    REQUIRE_FALSE(is_virtual_display_adapter("NVIDIA GeForce GTX 1660"));
}

TEST_CASE("create_system_info picks the host platform") {
#if defined(_WIN32) || defined(__linux__)
    auto system_info = create_system_info();
    REQUIRE(system_info != nullptr);
#ifdef _WIN32
    REQUIRE(system_info->get_platform_name() == "windows");
#else
    REQUIRE(system_info->get_platform_name() == "linux");
    REQUIRE(system_info->board_strategies().size() == 2);
    REQUIRE(system_info->disk_strategies().size() == 2);
#endif
#else
    REQUIRE_THROWS(create_system_info());
#endif
}

#ifdef __linux__
TEST_CASE("Linux command strategies report a missing tool as unavailable") {
    namespace fs = std::filesystem;
    fs::path empty_dir = fs::temp_directory_path() / "xpec-tests-empty-path";
    fs::create_directories(empty_dir);

    const char* old_path = std::getenv("PATH");
    std::string saved = old_path ? old_path : "";
    setenv("PATH", empty_dir.string().c_str(), 1);

    LinuxSystemInfo system_info;
    DetectionTrace trace;

    auto cpu = system_info.cpu_strategies();
    REQUIRE(cpu[1]->name() == "lscpu");
    auto cpu_result = cpu[1]->detect(trace);

    auto gpu = system_info.gpu_strategies();
    REQUIRE(gpu[0]->name() == "lspci");
    auto gpu_result = gpu[0]->detect(trace);

    auto disks = system_info.disk_strategies();
    REQUIRE(disks[0]->name() == "lsblk");
    auto disk_result = disks[0]->detect(trace);

    setenv("PATH", saved.c_str(), 1);

    REQUIRE_FALSE(cpu_result.ok());
    REQUIRE(cpu_result.failure_kind() == FailureKind::Unavailable);
    REQUIRE_FALSE(gpu_result.ok());
    REQUIRE(gpu_result.failure_kind() == FailureKind::Unavailable);
    REQUIRE_FALSE(disk_result.ok());
    REQUIRE(disk_result.failure_kind() == FailureKind::Unavailable);
}
#endif
