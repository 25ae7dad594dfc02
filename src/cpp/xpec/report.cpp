#include "xpec/report.h"
#include "xpec/config.h"
#include "xpec/normalizer.h"
#include "xpec/summary.h"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace xpec {

std::string html_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string current_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

static std::string row(const std::vector<std::string>& cells) {
    std::string html = "<tr>";
    for (const auto& cell : cells) {
        html += "<td>" + html_escape(cell) + "</td>";
    }
    return html + "</tr>";
}

static std::string header_row(const std::vector<std::string>& cells) {
    std::string html = "<tr>";
    for (const auto& cell : cells) {
        html += "<th>" + html_escape(cell) + "</th>";
    }
    return html + "</tr>";
}

static std::string section(const std::string& heading, const std::string& table_rows) {
    return "<div class=\"section\">\n<h2>" + html_escape(heading) + "</h2>\n<table>\n" +
           table_rows + "</table>\n</div>\n";
}

static std::string debug_section(const std::string& heading, const std::vector<std::string>& lines) {
    std::string rows;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::ostringstream number;
        number << std::setw(2) << std::setfill('0') << (i + 1);
        rows += "<tr><td class=\"dim\">" + number.str() + "</td><td>" + html_escape(lines[i]) + "</td></tr>\n";
    }
    return section(heading, rows);
}

std::string generate_html_report(const HardwareSnapshot& snapshot,
                                 const DetectionTrace& trace,
                                 const json& config,
                                 const std::string& generated_on) {
    const std::string title = html_escape(config_string(config, "title"));

    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html>\n<head>\n"
         << "<meta charset=\"utf-8\">\n"
         << "<title>" << title << " Specifications</title>\n"
         << "<style>\n"
         << "body { font-family: Arial, sans-serif; margin: 40px; background-color: "
         << theme_color(config, "background") << "; color: " << theme_color(config, "text") << "; }\n"
         << ".container { max-width: 1000px; margin: 0 auto; }\n"
         << ".section { background-color: " << theme_color(config, "panel")
         << "; padding: 20px; margin-bottom: 20px; border-radius: 8px; }\n"
         << "h1 { color: " << theme_color(config, "accent") << "; text-align: center; }\n"
         << "h2 { color: " << theme_color(config, "sub") << "; border-bottom: 2px solid #3d3d3d; }\n"
         << "table { width: 100%; border-collapse: collapse; margin-top: 10px; }\n"
         << "td, th { padding: 12px; text-align: left; border-bottom: 1px solid #3d3d3d; }\n"
         << "th { background-color: #333333; }\n"
         << ".dim, .footer { color: " << theme_color(config, "dim") << "; }\n"
         << ".footer { text-align: center; margin-top: 30px; }\n"
         << "</style>\n</head>\n<body>\n<div class=\"container\">\n"
         << "<h1>" << title << " Specifications</h1>\n";

    const BoardInfo& board = snapshot.board;
    html << section("System Information",
                    row({"Motherboard", board_display_name(board)}) + "\n" +
                    row({"OS", or_na(board.os_name)}) + "\n" +
                    row({"OS Version", or_na(board.os_version)}) + "\n");

    const CPUInfo& cpu = snapshot.cpu;
    html << section("Processor (CPU)",
                    row({"Model", or_na(cpu.model)}) + "\n" +
                    row({"Cores", or_na(cpu.physical_cores)}) + "\n" +
                    row({"Threads", or_na(cpu.logical_threads)}) + "\n" +
                    row({"Max Clock", format_ghz(cpu.max_clock_ghz)}) + "\n");

    std::string module_rows = header_row({"Module", "Manufacturer", "Capacity", "Speed", "Part Number"}) + "\n";
    for (const auto& module : snapshot.ram.modules) {
        module_rows += row({std::to_string(module.index), or_na(module.manufacturer),
                            bytes_to_gb(module.capacity_bytes), format_mhz(module.speed_mhz),
                            or_na(module.part_number)}) + "\n";
    }
    html << section("Memory (RAM) - Total: " + bytes_to_gb(static_cast<int64_t>(snapshot.ram.total_bytes)),
                    module_rows);

    std::string gpu_rows = header_row({"Model", "VRAM"}) + "\n";
    for (const auto& gpu : snapshot.gpus) {
        gpu_rows += row({or_na(gpu.model), bytes_to_gb(gpu.vram_bytes)}) + "\n";
    }
    html << section("Graphics Card (GPU)", gpu_rows);

    std::string disk_rows = header_row({"Model", "Size", "Type"}) + "\n";
    for (const auto& disk : snapshot.disks) {
        disk_rows += row({or_na(disk.model), bytes_to_gb(disk.size_bytes), to_string(disk.kind)}) + "\n";
    }
    html << section("Storage Devices", disk_rows);

    if (trace.board_enabled()) {
        auto lines = trace.lines(TraceChannel::Board);
        if (!lines.empty()) {
            html << debug_section("Debug: Motherboard Sources", lines);
        }
    }
    if (trace.gpu_enabled()) {
        auto lines = trace.lines(TraceChannel::GPU);
        if (!lines.empty()) {
            html << debug_section("Debug: GPU Sources", lines);
        }
    }

    html << "<div class=\"footer\">Generated on " << html_escape(generated_on) << "</div>\n"
         << "</div>\n</body>\n</html>\n";
    return html.str();
}

std::string generate_html_report(const HardwareSnapshot& snapshot,
                                 const DetectionTrace& trace,
                                 const json& config) {
    return generate_html_report(snapshot, trace, config, current_timestamp());
}

template <typename T>
static json value_or_na(const std::optional<T>& value) {
    return value ? json(*value) : json(NOT_AVAILABLE);
}

json snapshot_to_json(const HardwareSnapshot& snapshot) {
    json modules = json::array();
    for (const auto& module : snapshot.ram.modules) {
        modules.push_back({
            {"index", module.index},
            {"manufacturer", or_na(module.manufacturer)},
            {"capacity_bytes", value_or_na(module.capacity_bytes)},
            {"capacity", bytes_to_gb(module.capacity_bytes)},
            {"speed_mhz", value_or_na(module.speed_mhz)},
            {"part_number", or_na(module.part_number)},
        });
    }

    json gpus = json::array();
    for (const auto& gpu : snapshot.gpus) {
        gpus.push_back({
            {"model", or_na(gpu.model)},
            {"vram_bytes", value_or_na(gpu.vram_bytes)},
            {"vram", bytes_to_gb(gpu.vram_bytes)},
        });
    }

    json disks = json::array();
    for (const auto& disk : snapshot.disks) {
        disks.push_back({
            {"model", or_na(disk.model)},
            {"size_bytes", value_or_na(disk.size_bytes)},
            {"size", bytes_to_gb(disk.size_bytes)},
            {"kind", to_string(disk.kind)},
        });
    }

    const BoardInfo& board = snapshot.board;
    const CPUInfo& cpu = snapshot.cpu;
    return {
        {"board", {
            {"vendor", or_na(board.vendor)},
            {"model", or_na(board.model)},
            {"name", board_display_name(board)},
            {"os_name", or_na(board.os_name)},
            {"os_version", or_na(board.os_version)},
        }},
        {"cpu", {
            {"model", or_na(cpu.model)},
            {"physical_cores", value_or_na(cpu.physical_cores)},
            {"logical_threads", value_or_na(cpu.logical_threads)},
            {"max_clock_ghz", value_or_na(cpu.max_clock_ghz)},
        }},
        {"ram", {
            {"total_bytes", snapshot.ram.total_bytes},
            {"total", bytes_to_gb(static_cast<int64_t>(snapshot.ram.total_bytes))},
            {"modules", modules},
        }},
        {"gpus", gpus},
        {"disks", disks},
        {"summary", {
            {"cpu", summarize_cpu(cpu)},
            {"gpu", summarize_gpu(choose_primary_gpu(snapshot.gpus))},
            {"ram", summarize_ram(snapshot.ram)},
            {"storage", summarize_storage(snapshot.disks)},
        }},
    };
}

} // namespace xpec
