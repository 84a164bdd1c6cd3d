#include "win32_launcher.hpp"

#include "platform/utf8_path.hpp"

#include <algorithm>
#include <cwctype>
#include <system_error>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>

namespace sfxpack::launch {

using archive::ArchiveError;
using archive::ErrorKind;
using archive::fail;

namespace {

namespace fs = std::filesystem;

std::wstring widen(const std::string& utf8) {
    if (utf8.empty()) return {};
    const int len = ::MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), nullptr, 0);
    std::wstring out(static_cast<std::size_t>(len), L'\0');
    ::MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), out.data(), len);
    return out;
}

std::string win32_message(DWORD code) {
    return std::system_category().message(static_cast<int>(code));
}

bool is_batch_file(const fs::path& program) {
    std::wstring ext = program.extension().wstring();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](wchar_t c) {
        return static_cast<wchar_t>(std::towlower(c));
    });
    return ext == L".bat" || ext == L".cmd";
}

} // namespace

int to_show_command(WindowState state) {
    switch (state) {
    case WindowState::Normal: return SW_SHOWNORMAL;
    case WindowState::Maximized: return SW_SHOWMAXIMIZED;
    case WindowState::Minimized: return SW_SHOWMINIMIZED;
    case WindowState::Hidden: return SW_HIDE;
    }
    return SW_SHOWNORMAL;
}

std::wstring quote_argument(const std::wstring& arg) {
    if (!arg.empty() && arg.find_first_of(L" \t\"") == std::wstring::npos) {
        return arg;
    }

    // CommandLineToArgvW rules: backslashes are literal unless they precede a quote.
    std::wstring out = L"\"";
    std::size_t backslashes = 0;
    for (wchar_t c : arg) {
        if (c == L'\\') {
            ++backslashes;
            continue;
        }
        if (c == L'"') {
            out.append(backslashes * 2 + 1, L'\\');
        } else {
            out.append(backslashes, L'\\');
        }
        backslashes = 0;
        out += c;
    }
    out.append(backslashes * 2, L'\\');
    out += L'"';
    return out;
}

bool Win32Launcher::launch(const LaunchRequest& request, ArchiveError* outError) {
    std::error_code ec;
    if (!fs::is_regular_file(request.program, ec)) {
        return fail(outError, ErrorKind::Launch,
                    "'" + platform::utf8_from_path(request.program) + "' does not exist or is not a file");
    }

    std::wstring file = request.program.wstring();
    std::wstring params;
    for (const auto& arg : request.arguments) {
        if (!params.empty()) params += L' ';
        params += quote_argument(widen(arg));
    }

    if (is_batch_file(request.program)) {
        std::wstring cmdParams = L"/c \"" + quote_argument(file);
        if (!params.empty()) cmdParams += L" " + params;
        cmdParams += L"\"";
        params = std::move(cmdParams);
        file = L"cmd.exe";
    }

    const std::wstring dir = request.workingDirectory.wstring();

    SHELLEXECUTEINFOW info{};
    info.cbSize = sizeof(info);
    info.fMask = SEE_MASK_NOASYNC | SEE_MASK_FLAG_NO_UI;
    info.lpVerb = request.requestElevation ? L"runas" : L"open";
    info.lpFile = file.c_str();
    info.lpParameters = params.empty() ? nullptr : params.c_str();
    info.lpDirectory = dir.empty() ? nullptr : dir.c_str();
    info.nShow = to_show_command(request.windowState);

    if (!::ShellExecuteExW(&info)) {
        const DWORD code = ::GetLastError();
        if (code == ERROR_CANCELLED) {
            return fail(outError, ErrorKind::LaunchDeclined,
                        "elevation for '" + platform::utf8_from_path(request.program.filename()) + "' was declined");
        }
        return fail(outError, ErrorKind::Launch,
                    "cannot start '" + platform::utf8_from_path(request.program) + "': " + win32_message(code));
    }

    return true;
}

std::unique_ptr<ILauncher> make_platform_launcher() {
    return std::make_unique<Win32Launcher>();
}

} // namespace sfxpack::launch
