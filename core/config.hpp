#pragma once

#include "archive/table.hpp"
#include "archive/transform.hpp"

#include <string>

namespace sfxpack::core {

struct LoggingConfig {
    bool enabled{true};
    int level{0};  // raylib TraceLogLevel
    std::string file{};
};

// Writer defaults; command-line flags override them.
struct PackDefaults {
    bool compress{false};
    int compression_level{archive::ZlibTransform::kDefaultLevel};
    std::string extraction_path{"rc_extracted"};
    archive::WindowState window_state{archive::WindowState::Normal};
    std::string template_path{};  // empty: sfxstub next to the tool
    std::string output{};         // empty: platform default
};

struct ToolConfig {
    LoggingConfig logging{};
    PackDefaults pack{};
};

// INI settings:
//
//   [logging]
//   enabled = true
//   level = info          ; trace | debug | info | warn | error | none
//   file = sfxpack.log
//
//   [pack]
//   compress = yes
//   level = 9
//   extract_to = "%APPDATA%\MyApp"
//   window = hidden
//   template = /opt/sfxpack/sfxstub
//   output = setup.bin
class Config {
public:
    static Config& instance();

    Config();

    bool load_from_file(const std::string& path);

    // Same format as load_from_file, for settings that do not come from disk.
    void load_from_string(const std::string& text);

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const LoggingConfig& logging() const { return config_.logging; }
    const PackDefaults& pack() const { return config_.pack; }

private:
    ToolConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);

    void parse_line(std::string line, std::string& section);
    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

// "trace", "debug", "info", "warn"/"warning", "error", "fatal", "none"/"off",
// or a raylib level number. Anything else returns default_value.
int log_level_from_string(const std::string& v, int default_value);

} // namespace sfxpack::core
