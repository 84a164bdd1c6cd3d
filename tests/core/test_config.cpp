/**
 * @file test_config.cpp
 * @brief Unit tests for INI tool settings.
 */

#include <catch2/catch_test_macros.hpp>

#include "core/config.hpp"

#include "test_utils.hpp"

#include <raylib.h>

using namespace sfxpack;
using core::Config;

TEST_CASE("Config defaults", "[core][config]") {
    Config cfg;
    REQUIRE(cfg.logging().enabled);
    REQUIRE(cfg.logging().level == LOG_INFO);
    REQUIRE(cfg.logging().file.empty());

    REQUIRE_FALSE(cfg.pack().compress);
    REQUIRE(cfg.pack().compression_level == archive::ZlibTransform::kDefaultLevel);
    REQUIRE(cfg.pack().extraction_path == "rc_extracted");
    REQUIRE(cfg.pack().window_state == archive::WindowState::Normal);
    REQUIRE(cfg.pack().template_path.empty());
}

TEST_CASE("Config parses sections and values", "[core][config]") {
    Config cfg;
    cfg.load_from_string(
        "# tool settings\n"
        "[logging]\n"
        "enabled = yes\n"
        "level = debug\n"
        "file = \"sfx pack.log\"\n"
        "\n"
        "[Pack]\n"
        "compress = on\n"
        "level = 9\n"
        "extract_to = \"%APPDATA%\\MyApp\"   ; per-user\n"
        "window = no-window\n"
        "template = /opt/sfx/sfxstub\r\n"
        "output = setup.bin\n");

    REQUIRE(cfg.logging().level == LOG_DEBUG);
    REQUIRE(cfg.logging().file == "sfx pack.log");

    REQUIRE(cfg.pack().compress);
    REQUIRE(cfg.pack().compression_level == 9);
    REQUIRE(cfg.pack().extraction_path == "%APPDATA%\\MyApp");
    REQUIRE(cfg.pack().window_state == archive::WindowState::Hidden);
    REQUIRE(cfg.pack().template_path == "/opt/sfx/sfxstub");
    REQUIRE(cfg.pack().output == "setup.bin");
}

TEST_CASE("Config keeps defaults for bad values", "[core][config]") {
    Config cfg;
    cfg.load_from_string(
        "[logging]\n"
        "enabled = maybe\n"
        "level = loud\n"
        "[pack]\n"
        "level = 12\n"
        "window = fullscreen\n"
        "extract_to =\n"
        "unknown_key = 1\n"
        "[mystery]\n"
        "x = y\n"
        "not a key value line\n");

    REQUIRE(cfg.logging().enabled);
    REQUIRE(cfg.logging().level == LOG_INFO);
    REQUIRE(cfg.pack().compression_level == archive::ZlibTransform::kDefaultLevel);
    REQUIRE(cfg.pack().window_state == archive::WindowState::Normal);
    REQUIRE(cfg.pack().extraction_path == "rc_extracted");
}

TEST_CASE("Config comments need leading whitespace", "[core][config]") {
    Config cfg;
    cfg.load_from_string(
        "[pack]\n"
        "extract_to = dir;with#chars ; trailing comment\n");
    REQUIRE(cfg.pack().extraction_path == "dir;with#chars");
}

TEST_CASE("Config file loading", "[core][config]") {
    test_helpers::TempDir dir;
    Config cfg;

    REQUIRE_FALSE(cfg.load_from_file((dir.path() / "missing.ini").string()));
    REQUIRE(cfg.loaded_from_path().empty());

    const auto path = dir.create_file("sfxpack.ini", "[pack]\ncompress = true\n");
    REQUIRE(cfg.load_from_file(path.string()));
    REQUIRE(cfg.pack().compress);
    REQUIRE(cfg.loaded_from_path() == path.string());
}

TEST_CASE("Log level names", "[core][config]") {
    REQUIRE(core::log_level_from_string("trace", LOG_INFO) == LOG_TRACE);
    REQUIRE(core::log_level_from_string("WARN", LOG_INFO) == LOG_WARNING);
    REQUIRE(core::log_level_from_string("warning", LOG_INFO) == LOG_WARNING);
    REQUIRE(core::log_level_from_string("error", LOG_INFO) == LOG_ERROR);
    REQUIRE(core::log_level_from_string("none", LOG_INFO) == LOG_NONE);
    REQUIRE(core::log_level_from_string("off", LOG_INFO) == LOG_NONE);
    REQUIRE(core::log_level_from_string("'debug'", LOG_INFO) == LOG_DEBUG);
    REQUIRE(core::log_level_from_string("4", LOG_INFO) == 4);
    REQUIRE(core::log_level_from_string("99", LOG_INFO) == LOG_INFO);
    REQUIRE(core::log_level_from_string("chatty", LOG_ERROR) == LOG_ERROR);
}
