#pragma once

#include "launcher.hpp"

#include <string>

namespace sfxpack::launch {

// SW_* value passed to ShellExecuteExW.
int to_show_command(WindowState state);

// Quotes one argument for a Windows command line.
std::wstring quote_argument(const std::wstring& arg);

class Win32Launcher final : public ILauncher {
public:
    bool launch(const LaunchRequest& request, archive::ArchiveError* outError) override;
};

} // namespace sfxpack::launch
