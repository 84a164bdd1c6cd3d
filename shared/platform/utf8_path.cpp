#include "utf8_path.hpp"

#include <cstdlib>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <shellapi.h>
#endif

namespace sfxpack::platform {

std::filesystem::path path_from_utf8(std::string_view utf8) {
#if defined(_WIN32)
    const auto* begin = reinterpret_cast<const char8_t*>(utf8.data());
    return std::filesystem::path(std::u8string(begin, begin + utf8.size()));
#else
    return std::filesystem::path(std::string(utf8));
#endif
}

std::string utf8_from_path(const std::filesystem::path& path) {
#if defined(_WIN32)
    const std::u8string u8 = path.u8string();
    return std::string(reinterpret_cast<const char*>(u8.data()), u8.size());
#else
    return path.string();
#endif
}

std::FILE* open_file(const std::filesystem::path& path, const char* mode) {
#if defined(_WIN32)
    const std::wstring wideMode(mode, mode + std::char_traits<char>::length(mode));
    return ::_wfopen(path.c_str(), wideMode.c_str());
#else
    return std::fopen(path.c_str(), mode);
#endif
}

std::optional<std::string> utf8_getenv(std::string_view name) {
#if defined(_WIN32)
    const std::wstring key = path_from_utf8(name).native();
    const wchar_t* value = ::_wgetenv(key.c_str());
    if (!value) {
        return std::nullopt;
    }
    return utf8_from_path(std::filesystem::path(std::wstring(value)));
#else
    const char* value = std::getenv(std::string(name).c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
#endif
}

std::vector<std::string> utf8_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
#if defined(_WIN32)
    (void)argc;
    (void)argv;
    int count = 0;
    LPWSTR* wide = ::CommandLineToArgvW(::GetCommandLineW(), &count);
    if (wide) {
        for (int i = 1; i < count; ++i) {
            args.push_back(utf8_from_path(std::filesystem::path(std::wstring(wide[i]))));
        }
        ::LocalFree(wide);
    }
#else
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
#endif
    return args;
}

} // namespace sfxpack::platform
