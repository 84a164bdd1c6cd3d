#include "self_path.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <system_error>
#include <vector>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#else
#include <unistd.h>
#endif

namespace sfxpack::platform {

bool executable_path(std::filesystem::path* out, std::string* outError) {
#if defined(_WIN32)
    std::vector<wchar_t> buffer(MAX_PATH);
    for (;;) {
        const DWORD len = ::GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (len == 0) {
            if (outError) *outError = std::system_category().message(static_cast<int>(::GetLastError()));
            return false;
        }
        if (len < buffer.size()) {
            *out = std::filesystem::path(std::wstring(buffer.data(), len));
            return true;
        }
        buffer.resize(buffer.size() * 2);
    }
#elif defined(__APPLE__)
    std::uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::vector<char> buffer(size);
    if (_NSGetExecutablePath(buffer.data(), &size) != 0) {
        if (outError) *outError = "_NSGetExecutablePath failed";
        return false;
    }
    std::error_code ec;
    std::filesystem::path resolved = std::filesystem::canonical(buffer.data(), ec);
    if (ec) {
        if (outError) *outError = ec.message();
        return false;
    }
    *out = std::move(resolved);
    return true;
#else
    std::vector<char> buffer(256);
    for (;;) {
        const ssize_t len = ::readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (len < 0) {
            if (outError) *outError = std::string("readlink /proc/self/exe: ") + std::strerror(errno);
            return false;
        }
        if (static_cast<std::size_t>(len) < buffer.size()) {
            *out = std::filesystem::path(std::string(buffer.data(), static_cast<std::size_t>(len)));
            return true;
        }
        buffer.resize(buffer.size() * 2);
    }
#endif
}

} // namespace sfxpack::platform
