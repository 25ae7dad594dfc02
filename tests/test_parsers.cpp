#include <xpec/parsers.h>

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

using namespace xpec;

static const uint64_t GiB = 1024ULL * 1024ULL * 1024ULL;

static const char* DMIDECODE_TYPE17 =
    "# dmidecode 3.3\n"
    "Getting SMBIOS data from sysfs.\n"
    "SMBIOS 3.3.0 present.\n"
    "\n"
    "Handle 0x0040, DMI type 17, 92 bytes\n"
    "Memory Device\n"
    "\tArray Handle: 0x003F\n"
    "\tTotal Width: 64 bits\n"
    "\tSize: 16 GB\n"
    "\tLocator: DIMM_A1\n"
    "\tSpeed: 3200 MT/s\n"
    "\tManufacturer: Corsair\n"
    "\tPart Number: CMK32GX4M2E3200C16\n"
    "\tConfigured Memory Speed: 3000 MT/s\n"
    "\n"
    "Handle 0x0041, DMI type 17, 92 bytes\n"
    "Memory Device\n"
    "\tArray Handle: 0x003F\n"
    "\tSize: No Module Installed\n"
    "\tManufacturer: Unknown\n"
    "\n"
    "Handle 0x0042, DMI type 17, 92 bytes\n"
    "Memory Device\n"
    "\tSize: 8192 MB\n"
    "\tSpeed: 2666 MT/s\n"
    "\tManufacturer: Unknown\n"
    "\tPart Number: Not Specified\n"
    "\tConfigured Memory Speed: Unknown\n";

TEST_CASE("parse_dmidecode_memory keeps populated slots in order") {
    auto modules = parse_dmidecode_memory(DMIDECODE_TYPE17);

    REQUIRE(modules.size() == 2);

    REQUIRE(modules[0].index == 1);
    REQUIRE(modules[0].manufacturer == "Corsair");
    REQUIRE(modules[0].capacity_bytes == 16 * GiB);
    REQUIRE(modules[0].speed_mhz == 3000);  // configured speed wins
    REQUIRE(modules[0].part_number == "CMK32GX4M2E3200C16");

    // Last record has no trailing Handle line and must still be emitted
    REQUIRE(modules[1].index == 2);
    REQUIRE(modules[1].capacity_bytes == 8 * GiB);
    REQUIRE(modules[1].speed_mhz == 2666);
    REQUIRE(modules[1].manufacturer == "N/A");
    REQUIRE(modules[1].part_number == "N/A");
}

TEST_CASE("parse_dmidecode_memory handles empty output") {
    REQUIRE(parse_dmidecode_memory("").empty());
    REQUIRE(parse_dmidecode_memory("# No SMBIOS nor DMI entry point found, sorry.\n").empty());
}

TEST_CASE("parse_dmidecode_size understands binary units") {
    REQUIRE(parse_dmidecode_size("16 GB") == 16 * GiB);
    REQUIRE(parse_dmidecode_size("8192 MB") == 8 * GiB);
    REQUIRE(parse_dmidecode_size("1 TB") == 1024 * GiB);
    REQUIRE_FALSE(parse_dmidecode_size("No Module Installed").has_value());
    REQUIRE_FALSE(parse_dmidecode_size("").has_value());
}

TEST_CASE("parse_lsblk splits name, model, size and rotational flag") {
    const std::string output =
        "NAME    MODEL                      SIZE ROTA\n"
        "loop0                              4096    0\n"
        "nvme0n1 Samsung SSD 980 PRO 1TB 1000204886016 0\n"
        "sda     ST2000DM008-2FR102     2000398934016 1\n"
        "sdb                            2000398934016 1\n"
        "zram0                          8589934592    0\n"
        "nbd0                           0             0\n"
        "dm-0                           536870912000  0\n"
        "md127                          4000797868032 1\n";

    auto disks = parse_lsblk(output);

    REQUIRE(disks.size() == 3);
    REQUIRE(disks[0].model == "Samsung SSD 980 PRO 1TB");
    REQUIRE(disks[0].size_bytes == 1000204886016ULL);
    REQUIRE(disks[0].kind == DiskKind::SSD);

    REQUIRE(disks[1].model == "ST2000DM008-2FR102");
    REQUIRE(disks[1].kind == DiskKind::HDD);

    REQUIRE(disks[2].model == "N/A");
    REQUIRE(disks[2].size_bytes == 2000398934016ULL);
}

TEST_CASE("parse_lspci_display keeps display-class devices only") {
    const std::string output =
        "00:02.0 VGA compatible controller: Intel Corporation UHD Graphics 630 (rev 02)\n"
        "00:1f.3 Audio device: Intel Corporation Cannon Lake PCH cAVS (rev 10)\n"
        "01:00.0 3D controller: NVIDIA Corporation TU117M [GeForce GTX 1650 Mobile / Max-Q] (rev a1)\n"
        "00:07.3 Non-VGA unclassified device: Intel Corporation 82371AB/EB/MB PIIX4 ACPI (rev 08)\n"
        "02:00.0 Display controller: Advanced Micro Devices, Inc. [AMD/ATI] Device 1681\n"
        "3d:00.0 Ethernet controller: Intel Corporation I210 Gigabit Network Connection (rev 03)\n";

    auto gpus = parse_lspci_display(output);

    REQUIRE(gpus.size() == 3);
    REQUIRE(gpus[0].model == "Intel Corporation UHD Graphics 630 (rev 02)");
    REQUIRE(gpus[1].model == "NVIDIA Corporation TU117M [GeForce GTX 1650 Mobile / Max-Q] (rev a1)");
    REQUIRE(gpus[2].model == "Advanced Micro Devices, Inc. [AMD/ATI] Device 1681");
    for (const auto& gpu : gpus) {
        REQUIRE_FALSE(gpu.vram_bytes.has_value());
    }
}

TEST_CASE("parse_proc_cpuinfo counts distinct physical cores") {
    const std::string text =
        "processor\t: 0\n"
        "model name\t: Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz\n"
        "physical id\t: 0\n"
        "core id\t\t: 0\n"
        "\n"
        "processor\t: 1\n"
        "model name\t: Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz\n"
        "physical id\t: 0\n"
        "core id\t\t: 1\n"
        "\n"
        "processor\t: 2\n"
        "model name\t: Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz\n"
        "physical id\t: 0\n"
        "core id\t\t: 0\n"
        "\n"
        "processor\t: 3\n"
        "model name\t: Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz\n"
        "physical id\t: 0\n"
        "core id\t\t: 1\n";

    CPUInfo cpu = parse_proc_cpuinfo(text);

    REQUIRE(cpu.model == "Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz");
    REQUIRE(cpu.physical_cores == 2);
    REQUIRE(cpu.logical_threads == 4);
    REQUIRE_FALSE(cpu.max_clock_ghz.has_value());
}

TEST_CASE("parse_proc_cpuinfo without topology leaves cores unknown") {
    CPUInfo cpu = parse_proc_cpuinfo("processor\t: 0\nmodel name\t: ARMv8 Processor rev 4\n");

    REQUIRE(cpu.model == "ARMv8 Processor rev 4");
    REQUIRE_FALSE(cpu.physical_cores.has_value());
    REQUIRE(cpu.logical_threads == 1);
}

TEST_CASE("parse_lscpu reads model, topology and max clock") {
    const std::string output =
        "Architecture:            x86_64\n"
        "CPU(s):                  16\n"
        "On-line CPU(s) list:     0-15\n"
        "Model name:              AMD Ryzen 7 5800X 8-Core Processor\n"
        "Thread(s) per core:      2\n"
        "Core(s) per socket:      8\n"
        "Socket(s):               1\n"
        "CPU max MHz:             4850.1948\n"
        "CPU min MHz:             2200.0000\n";

    CPUInfo cpu = parse_lscpu(output);

    REQUIRE(cpu.model == "AMD Ryzen 7 5800X 8-Core Processor");
    REQUIRE(cpu.logical_threads == 16);
    REQUIRE(cpu.physical_cores == 8);
    REQUIRE(cpu.max_clock_ghz.has_value());
    REQUIRE(*cpu.max_clock_ghz == Approx(4.85));
}

TEST_CASE("parse_physical_disk_json accepts arrays and single objects") {
    auto disks = parse_physical_disk_json(
        R"([{"FriendlyName":"Samsung SSD 970 EVO Plus 1TB","MediaType":"SSD","Size":1000204886016},)"
        R"({"FriendlyName":"WDC WD20EZAZ-00GGJB0","MediaType":"HDD","Size":"2000398934016"},)"
        R"({"FriendlyName":"Virtual Disk","MediaType":"Unspecified","Size":null}])");

    REQUIRE(disks.size() == 3);
    REQUIRE(disks[0].model == "Samsung SSD 970 EVO Plus 1TB");
    REQUIRE(disks[0].kind == DiskKind::SSD);
    REQUIRE(disks[0].size_bytes == 1000204886016ULL);
    REQUIRE(disks[1].kind == DiskKind::HDD);
    REQUIRE(disks[1].size_bytes == 2000398934016ULL);
    REQUIRE(disks[2].kind == DiskKind::Unknown);
    REQUIRE_FALSE(disks[2].size_bytes.has_value());

    auto single = parse_physical_disk_json(R"({"FriendlyName":"KINGSTON SA400S37240G","MediaType":4,"Size":240057409536})");
    REQUIRE(single.size() == 1);
    REQUIRE(single[0].kind == DiskKind::SSD);

    REQUIRE(parse_physical_disk_json("").empty());
    REQUIRE_THROWS_AS(parse_physical_disk_json("[{\"FriendlyName\":"), nlohmann::json::parse_error);
}

TEST_CASE("parse_os_release joins NAME and VERSION_ID") {
    REQUIRE(parse_os_release("PRETTY_NAME=\"Ubuntu 22.04.4 LTS\"\nNAME=\"Ubuntu\"\nVERSION_ID=\"22.04\"\n") ==
            "Ubuntu 22.04");
    REQUIRE(parse_os_release("NAME=\"Arch Linux\"\nBUILD_ID=rolling\n") == "Arch Linux");
    REQUIRE(parse_os_release("VERSION_ID=\"1\"\n").empty());
}

TEST_CASE("parse_dmidecode_string skips comment lines") {
    REQUIRE(parse_dmidecode_string("# SMBIOS implementations newer than version 3.2.0 are not\n"
                                   "# fully supported by this version of dmidecode.\n"
                                   "ASUSTeK COMPUTER INC.\n") == "ASUSTeK COMPUTER INC.");
    REQUIRE(parse_dmidecode_string("").empty());
}

TEST_CASE("is_virtual_block_device skips non-physical nodes") {
    for (const char* name : {"loop3", "ram0", "zram0", "sr0", "nbd12", "dm-1", "md0", "md127"}) {
        REQUIRE(is_virtual_block_device(name));
    }
    for (const char* name : {"sda", "nvme0n1", "mmcblk0", "vda", "hdb"}) {
        REQUIRE_FALSE(is_virtual_block_device(name));
    }
}

TEST_CASE("CIM uint32 values delivered as VT_I4 keep their full range") {
    // SpindleSpeed 0xFFFFFFFF: rotation rate unknown
    REQUIRE(cim_uint32_from_i4(-1) == UINT32_MAX);
    REQUIRE(disk_kind_from_spindle_speed(cim_uint32_from_i4(-1)) == DiskKind::Unknown);
    REQUIRE(disk_kind_from_spindle_speed(cim_uint32_from_i4(7200)) == DiskKind::HDD);
    REQUIRE(disk_kind_from_spindle_speed(cim_uint32_from_i4(0)) == DiskKind::SSD);

    // AdapterRAM saturates just below 4 GiB on large cards
    REQUIRE(cim_uint32_from_i4(static_cast<int32_t>(0xFFF00000u)) == 4293918720u);
}

TEST_CASE("disk kind classification") {
    REQUIRE(disk_kind_from_media_type(3) == DiskKind::HDD);
    REQUIRE(disk_kind_from_media_type(4) == DiskKind::SSD);
    REQUIRE(disk_kind_from_media_type(5) == DiskKind::SSD);
    REQUIRE(disk_kind_from_media_type(0) == DiskKind::Unknown);

    REQUIRE(disk_kind_from_spindle_speed(0) == DiskKind::SSD);
    REQUIRE(disk_kind_from_spindle_speed(7200) == DiskKind::HDD);
    REQUIRE(disk_kind_from_spindle_speed(UINT32_MAX) == DiskKind::Unknown);

    REQUIRE(disk_kind_from_media_text("SCM") == DiskKind::SSD);
    REQUIRE(disk_kind_from_media_text("hdd") == DiskKind::HDD);
    REQUIRE(disk_kind_from_media_text("Unspecified") == DiskKind::Unknown);

    REQUIRE(disk_kind_from_rotational("0") == DiskKind::SSD);
    REQUIRE(disk_kind_from_rotational("1") == DiskKind::HDD);
    REQUIRE(disk_kind_from_rotational("") == DiskKind::Unknown);

    REQUIRE(disk_kind_from_drive_strings("SCSI\\DISK&VEN_NVME&PROD_SAMSUNG", "Samsung 970", "") == DiskKind::SSD);
    REQUIRE(disk_kind_from_drive_strings("IDE\\DISK", "KINGSTON SSD A400", "") == DiskKind::SSD);
    REQUIRE(disk_kind_from_drive_strings("IDE\\DISK", "WDC WD10EZEX", "WD-123") == DiskKind::HDD);
}
