#include <xpec/config.h>
#include <xpec/report.h>

#include <catch2/catch.hpp>

#include <cstdint>
#include <string>

using namespace xpec;

namespace {

const uint64_t GiB = 1024ULL * 1024ULL * 1024ULL;

HardwareSnapshot sample_snapshot() {
    HardwareSnapshot snapshot;
    snapshot.board.vendor = "MSI";
    snapshot.board.model = "MAG B650 TOMAHAWK WIFI";
    snapshot.board.os_name = "Windows 11 Pro";
    snapshot.board.os_version = "10.0.22631 (Build 22631)";

    snapshot.cpu.model = "AMD Ryzen 7 7800X3D 8-Core Processor";
    snapshot.cpu.physical_cores = 8;
    snapshot.cpu.logical_threads = 16;

    snapshot.ram.total_bytes = 32 * GiB;
    MemoryModule module;
    module.index = 1;
    module.manufacturer = "G.Skill";
    module.capacity_bytes = 16 * GiB;
    module.speed_mhz = 6000;
    snapshot.ram.modules = {module};

    snapshot.gpus = {{"Radeon <RX> 7900 & XTX", std::nullopt}};
    snapshot.disks = {{"WD_BLACK SN850X", 2000 * GiB, DiskKind::SSD}};
    return snapshot;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("html_escape replaces markup characters") {
    REQUIRE(html_escape("<b>\"Tom\" & 'Jerry'</b>") == "&lt;b&gt;&quot;Tom&quot; &amp; &#39;Jerry&#39;&lt;/b&gt;");
    REQUIRE(html_escape("plain") == "plain");
}

TEST_CASE("HTML report lists every hardware class") {
    DetectionTrace trace;
    std::string html = generate_html_report(sample_snapshot(), trace, default_config(), "2024-05-01 12:00:00");

    REQUIRE(contains(html, "<title>Gaming PC Specifications</title>"));
    REQUIRE(contains(html, "<td>MSI MAG B650 TOMAHAWK WIFI</td>"));
    REQUIRE(contains(html, "<td>Windows 11 Pro</td>"));
    REQUIRE(contains(html, "<td>Threads</td><td>16</td>"));
    REQUIRE(contains(html, "<td>Max Clock</td><td>N/A</td>"));
    REQUIRE(contains(html, "Memory (RAM) - Total: 32.0 GB"));
    REQUIRE(contains(html, "<td>G.Skill</td><td>16.0 GB</td><td>6000 MHz</td><td>N/A</td>"));
    REQUIRE(contains(html, "<td>Radeon &lt;RX&gt; 7900 &amp; XTX</td><td>N/A</td>"));
    REQUIRE(contains(html, "<td>WD_BLACK SN850X</td><td>2000.0 GB</td><td>SSD</td>"));
    REQUIRE(contains(html, "Generated on 2024-05-01 12:00:00"));
    REQUIRE_FALSE(contains(html, "Radeon <RX>"));
    REQUIRE_FALSE(contains(html, "Debug:"));
}

TEST_CASE("HTML report uses the configured title and theme") {
    json config = default_config();
    config["title"] = "Battle <Station>";
    config["theme"]["accent"] = "#ff0000";

    std::string html = generate_html_report(HardwareSnapshot{}, DetectionTrace{}, config, "now");

    REQUIRE(contains(html, "Battle &lt;Station&gt; Specifications"));
    REQUIRE(contains(html, "h1 { color: #ff0000;"));
}

TEST_CASE("HTML report adds debug sections for enabled channels") {
    DetectionTrace trace(false, true);
    trace.add(TraceChannel::Board, "Reg BaseBoardProduct=PRIME");
    trace.add(TraceChannel::GPU, "NVML: init ok, count=1");

    std::string html = generate_html_report(sample_snapshot(), trace, default_config(), "now");

    REQUIRE(contains(html, "Debug: GPU Sources"));
    REQUIRE(contains(html, "<td class=\"dim\">01</td><td>NVML: init ok, count=1</td>"));
    REQUIRE_FALSE(contains(html, "Debug: Motherboard Sources"));
}

TEST_CASE("snapshot_to_json emits N/A for undetermined values") {
    json doc = snapshot_to_json(sample_snapshot());

    REQUIRE(doc["board"]["name"] == "MSI MAG B650 TOMAHAWK WIFI");
    REQUIRE(doc["cpu"]["physical_cores"] == 8);
    REQUIRE(doc["cpu"]["max_clock_ghz"] == "N/A");
    REQUIRE(doc["ram"]["total_bytes"] == 32 * GiB);
    REQUIRE(doc["ram"]["modules"][0]["part_number"] == "N/A");
    REQUIRE(doc["gpus"][0]["vram_bytes"] == "N/A");
    REQUIRE(doc["gpus"][0]["vram"] == "N/A");
    REQUIRE(doc["disks"][0]["kind"] == "SSD");
    REQUIRE(doc["summary"]["storage"] == "1x SSD (2000.0 GB)");
}

TEST_CASE("snapshot_to_json of an empty snapshot") {
    json doc = snapshot_to_json(HardwareSnapshot{});

    REQUIRE(doc["board"]["name"] == "N/A");
    REQUIRE(doc["cpu"]["model"] == "N/A");
    REQUIRE(doc["gpus"].is_array());
    REQUIRE(doc["gpus"].empty());
    REQUIRE(doc["summary"]["gpu"] == "N/A  |  N/A VRAM");
}
