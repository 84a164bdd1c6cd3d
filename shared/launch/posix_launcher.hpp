#pragma once

#include "launcher.hpp"

#include <string>
#include <vector>

namespace sfxpack::launch {

// How a window state is realised for a POSIX child process.
struct SpawnProfile {
    bool newSession{false};     // setsid() in the child
    bool nullStdio{false};      // stdin/stdout/stderr on /dev/null
    bool stripDisplay{false};   // drop DISPLAY and WAYLAND_DISPLAY
    std::string windowStateHint;  // value for SFXPACK_WINDOW_STATE, empty: unset
};

SpawnProfile to_spawn_profile(WindowState state);

// Profile for the pkexec process itself. It keeps the terminal, session and
// display so a polkit agent can ask the user; a hidden target is detached by
// the wrapper build_argv puts after pkexec.
SpawnProfile to_elevation_profile(WindowState state);

// argv for the child: scripts ending in ".sh" go through /bin/sh, and an
// elevation request prefixes pkexec (plus a hiding wrapper for Hidden).
std::vector<std::string> build_argv(const LaunchRequest& request, bool viaPkexec);

// Environment for the child, derived from `parent` ("KEY=VALUE" strings).
std::vector<std::string> build_envp(const std::vector<std::string>& parent, const SpawnProfile& profile);

class PosixLauncher final : public ILauncher {
public:
    bool launch(const LaunchRequest& request, archive::ArchiveError* outError) override;
};

} // namespace sfxpack::launch
