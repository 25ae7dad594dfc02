#include <xpec/config.h>

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace xpec;

static fs::path make_temp_dir() {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("xpec-tests-" + std::to_string(static_cast<long long>(now)));
    fs::create_directories(dir);
    return dir;
}

static fs::path write_file(const fs::path& dir, const std::string& name, const std::string& content) {
    fs::path path = dir / name;
    std::ofstream out(path);
    out << content;
    return path;
}

TEST_CASE("default_config values") {
    json config = default_config();

    REQUIRE(config["title"] == "Gaming PC");
    REQUIRE(config["html_output"] == "pc_specs.html");
    REQUIRE(config["json_output"] == "");
    REQUIRE(config["theme"]["accent"] == "#00ff9d");
    REQUIRE(config["theme"]["sub"] == "#00ccff");
}

TEST_CASE("load_config returns defaults when the file is missing") {
    fs::path dir = make_temp_dir();
    REQUIRE(load_config((dir / "absent.json").string()) == default_config());
}

TEST_CASE("load_config merges nested user values over defaults") {
    fs::path dir = make_temp_dir();
    fs::path path = write_file(dir, "xpec.config.json",
                               R"({"title": "Battle Station", "theme": {"accent": "#ff0000"}, "extra": 1})");

    json config = load_config(path.string());

    REQUIRE(config["title"] == "Battle Station");
    REQUIRE(config["theme"]["accent"] == "#ff0000");
    REQUIRE(config["theme"]["sub"] == "#00ccff");
    REQUIRE(config["html_output"] == "pc_specs.html");
    REQUIRE(config["extra"] == 1);
}

TEST_CASE("load_config null removes a key") {
    fs::path dir = make_temp_dir();
    fs::path path = write_file(dir, "xpec.config.json", R"({"html_output": null})");

    json config = load_config(path.string());

    REQUIRE_FALSE(config.contains("html_output"));
    REQUIRE(config_string(config, "html_output") == "pc_specs.html");
}

TEST_CASE("load_config ignores malformed files") {
    fs::path dir = make_temp_dir();
    fs::path broken = write_file(dir, "broken.json", "{\"title\": ");
    REQUIRE(load_config(broken.string()) == default_config());

    fs::path not_object = write_file(dir, "list.json", "[1, 2, 3]");
    REQUIRE(load_config(not_object.string()) == default_config());
}

TEST_CASE("config accessors fall back on wrong types") {
    json config = default_config();
    config["title"] = 42;
    config["theme"]["text"] = "white";
    config["theme"]["dim"] = "AABBCC";

    REQUIRE(config_string(config, "title") == "Gaming PC");
    REQUIRE(theme_color(config, "text") == "#f0f0f0");
    REQUIRE(theme_color(config, "dim") == "#AABBCC");
    REQUIRE(theme_color(config, "panel") == "#2d2d2d");
}
