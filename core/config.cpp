#include "config.hpp"

#include "launch/launcher.hpp"
#include "platform/utf8_path.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <raylib.h>

namespace sfxpack::core {

namespace {

std::string strip_quotes(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

// Comments start a line, or follow whitespace outside quotes, so values
// such as "a;b" or "C:\\x#1" survive.
std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            continue;
        }
        if (c == '#' || c == ';') {
            if (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1]))) {
                return line.substr(0, i);
            }
        }
    }
    return line;
}

} // namespace

Config& Config::instance() {
    static Config inst;
    return inst;
}

Config::Config() {
    config_.logging.enabled = true;
    config_.logging.level = LOG_INFO;
    config_.logging.file = "";
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    const std::string s = trim(v);
    try {
        std::size_t idx = 0;
        int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range
        return default_value;
    }
}

int log_level_from_string(const std::string& v, int default_value) {
    std::string s = strip_quotes(v);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    static const std::unordered_map<std::string, int> map = {
        {"all", LOG_ALL},
        {"trace", LOG_TRACE},
        {"debug", LOG_DEBUG},
        {"info", LOG_INFO},
        {"warning", LOG_WARNING}, {"warn", LOG_WARNING},
        {"error", LOG_ERROR},
        {"fatal", LOG_FATAL},
        {"none", LOG_NONE}, {"off", LOG_NONE},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return default_value;
    }
    const int n = std::atoi(s.c_str());
    return (n >= LOG_ALL && n <= LOG_NONE) ? n : default_value;
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        return;
    }

    if (sec == "pack") {
        if (k == "compress") config_.pack.compress = parse_bool(v, config_.pack.compress);
        else if (k == "level" || k == "compression_level") {
            const int level = parse_int(v, config_.pack.compression_level);
            if (level >= 0 && level <= 9) config_.pack.compression_level = level;
        }
        else if (k == "extract_to" || k == "extraction_path") {
            if (!v.empty()) config_.pack.extraction_path = v;
        }
        else if (k == "window" || k == "execution_style") {
            if (auto state = launch::parse_window_state(v)) config_.pack.window_state = *state;
        }
        else if (k == "template") config_.pack.template_path = v;
        else if (k == "output") config_.pack.output = v;
        return;
    }
}

void Config::parse_line(std::string line, std::string& section) {
    line = trim(strip_comment(line));
    if (line.empty()) return;

    if (line.front() == '[' && line.back() == ']') {
        section = trim(line.substr(1, line.size() - 2));
        return;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) return;

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (key.empty()) return;

    apply_kv(section, key, value);
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    std::string section;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        parse_line(line, section);
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(platform::path_from_utf8(path));
    if (!in.is_open()) {
        return false;
    }

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        parse_line(line, section);
    }

    loaded_from_path_ = path;
    return true;
}

} // namespace sfxpack::core
