#pragma once

#include "../archive/errors.hpp"
#include "../archive/table.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sfxpack::launch {

using archive::WindowState;

// Accepts "normal", "maximized", "minimized", "hidden" and the legacy
// "no-window" (case-insensitive).
std::optional<WindowState> parse_window_state(std::string_view text);

const char* window_state_name(WindowState state);

struct LaunchRequest {
    std::filesystem::path program;
    std::vector<std::string> arguments;
    WindowState windowState{WindowState::Normal};
    bool requestElevation{false};
    std::filesystem::path workingDirectory;  // empty: inherit
};

// Starts the main entry after extraction. Failure never rolls back what was
// extracted.
class ILauncher {
public:
    virtual ~ILauncher() = default;

    // Fails with Launch, or LaunchDeclined when the user refuses elevation.
    virtual bool launch(const LaunchRequest& request, archive::ArchiveError* outError) = 0;
};

// PosixLauncher or Win32Launcher depending on the build target.
std::unique_ptr<ILauncher> make_platform_launcher();

} // namespace sfxpack::launch
