#pragma once

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sfxpack::platform {

// Display names, config values and log lines are UTF-8. On Windows the
// narrow path API uses the ANSI code page instead, so every conversion
// between text and paths goes through these.

std::filesystem::path path_from_utf8(std::string_view utf8);

// Never throws, unlike path::string() on Windows.
std::string utf8_from_path(const std::filesystem::path& path);

// fopen that accepts any path the filesystem can hold (_wfopen on Windows).
std::FILE* open_file(const std::filesystem::path& path, const char* mode);

// Environment lookup returning UTF-8 (_wgetenv on Windows).
std::optional<std::string> utf8_getenv(std::string_view name);

// argv[1..] as UTF-8. Windows rebuilds them from the wide command line.
std::vector<std::string> utf8_arguments(int argc, char* argv[]);

} // namespace sfxpack::platform
