#include "posix_launcher.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace sfxpack::launch {

using archive::ArchiveError;
using archive::ErrorKind;
using archive::fail;

namespace {

namespace fs = std::filesystem;

constexpr const char* kWindowStateVar = "SFXPACK_WINDOW_STATE";

// pkexec exit statuses for a dismissed dialog and a refused authorization.
constexpr int kPkexecDismissed = 126;
constexpr int kPkexecNotAuthorized = 127;

// Runs "$@" hidden once pkexec has authorized it.
constexpr const char* kHiddenWrapper =
    "unset DISPLAY WAYLAND_DISPLAY; "
    "if command -v setsid >/dev/null 2>&1; then "
    "exec setsid \"$@\" </dev/null >/dev/null 2>&1; fi; "
    "exec \"$@\" </dev/null >/dev/null 2>&1";

bool has_prefix(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

std::string find_in_path(const std::string& name) {
    const char* path = std::getenv("PATH");
    std::string dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";

    std::size_t start = 0;
    while (start <= dirs.size()) {
        std::size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();

        std::string dir = dirs.substr(start, end - start);
        if (dir.empty()) dir = ".";

        const std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return {};
}

std::vector<std::string> current_environment() {
    std::vector<std::string> env;
    for (char** p = environ; p && *p; ++p) {
        env.emplace_back(*p);
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

// fork + execve with a close-on-exec pipe reporting exec failure back.
// On success the child pid is stored in outPid.
bool spawn_child(std::vector<std::string> argv,
                 std::vector<std::string> envp,
                 const SpawnProfile& profile,
                 const fs::path& workingDirectory,
                 pid_t* outPid,
                 int* outErrno) {
    std::vector<char*> argvC = to_c_array(argv);
    std::vector<char*> envpC = to_c_array(envp);
    const std::string cwd = workingDirectory.string();

    int fds[2];
    if (::pipe(fds) != 0) {
        *outErrno = errno;
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);

    const pid_t pid = ::fork();
    if (pid < 0) {
        *outErrno = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return false;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::close(fds[0]);

        if (profile.newSession) {
            ::setsid();
        }
        if (profile.nullStdio) {
            const int devnull = ::open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
                if (devnull > STDERR_FILENO) ::close(devnull);
            }
        }
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            const int err = errno;
            (void)!::write(fds[1], &err, sizeof(err));
            ::_exit(127);
        }

        ::execve(argvC[0], argvC.data(), envpC.data());

        const int err = errno;
        (void)!::write(fds[1], &err, sizeof(err));
        ::_exit(127);
    }

    ::close(fds[1]);

    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(fds[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(fds[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        *outErrno = childErr;
        return false;
    }

    *outPid = pid;
    return true;
}

} // namespace

SpawnProfile to_spawn_profile(WindowState state) {
    SpawnProfile profile;
    switch (state) {
    case WindowState::Hidden:
        profile.newSession = true;
        profile.nullStdio = true;
        profile.stripDisplay = true;
        break;
    case WindowState::Normal:
    case WindowState::Maximized:
    case WindowState::Minimized:
        profile.windowStateHint = window_state_name(state);
        break;
    }
    return profile;
}

SpawnProfile to_elevation_profile(WindowState state) {
    SpawnProfile profile;
    if (state != WindowState::Hidden) {
        profile.windowStateHint = window_state_name(state);
    }
    return profile;
}

std::vector<std::string> build_argv(const LaunchRequest& request, bool viaPkexec) {
    std::vector<std::string> argv;

    if (viaPkexec) {
        std::string pkexec = find_in_path("pkexec");
        argv.push_back(pkexec.empty() ? std::string("/usr/bin/pkexec") : pkexec);
        if (request.windowState == WindowState::Hidden) {
            argv.emplace_back("/bin/sh");
            argv.emplace_back("-c");
            argv.emplace_back(kHiddenWrapper);
            argv.emplace_back("sfxpack-hidden");
        }
    }

    if (request.program.extension() == ".sh") {
        argv.emplace_back("/bin/sh");
    }

    argv.push_back(request.program.string());
    argv.insert(argv.end(), request.arguments.begin(), request.arguments.end());
    return argv;
}

std::vector<std::string> build_envp(const std::vector<std::string>& parent, const SpawnProfile& profile) {
    std::vector<std::string> env;
    env.reserve(parent.size() + 1);

    for (const auto& kv : parent) {
        if (has_prefix(kv, "SFXPACK_WINDOW_STATE=")) continue;
        if (profile.stripDisplay && (has_prefix(kv, "DISPLAY=") || has_prefix(kv, "WAYLAND_DISPLAY="))) {
            continue;
        }
        env.push_back(kv);
    }

    if (!profile.windowStateHint.empty()) {
        env.push_back(std::string(kWindowStateVar) + "=" + profile.windowStateHint);
    }

    return env;
}

bool PosixLauncher::launch(const LaunchRequest& request, ArchiveError* outError) {
    std::error_code ec;
    if (!fs::is_regular_file(request.program, ec)) {
        return fail(outError, ErrorKind::Launch,
                    "'" + request.program.string() + "' does not exist or is not a file");
    }

    const bool isScript = request.program.extension() == ".sh";
    if (!isScript && ::access(request.program.c_str(), X_OK) != 0) {
        return fail(outError, ErrorKind::Launch,
                    "'" + request.program.string() + "' is not executable");
    }

    const bool viaPkexec = request.requestElevation && ::geteuid() != 0;
    const SpawnProfile profile = viaPkexec ? to_elevation_profile(request.windowState)
                                           : to_spawn_profile(request.windowState);

    pid_t pid = -1;
    int err = 0;
    if (!spawn_child(build_argv(request, viaPkexec),
                     build_envp(current_environment(), profile),
                     profile, request.workingDirectory, &pid, &err)) {
        return fail(outError, ErrorKind::Launch,
                    "cannot start '" + request.program.string() + "': " + std::strerror(err));
    }

    if (!viaPkexec) {
        return true;
    }

    // pkexec only reports the authorization outcome through its exit status.
    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        return fail(outError, ErrorKind::Launch,
                    std::string("cannot wait for pkexec: ") + std::strerror(errno));
    }

    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        if (code == kPkexecDismissed || code == kPkexecNotAuthorized) {
            return fail(outError, ErrorKind::LaunchDeclined,
                        "elevation for '" + request.program.filename().string() + "' was declined");
        }
    }

    return true;
}

std::unique_ptr<ILauncher> make_platform_launcher() {
    return std::make_unique<PosixLauncher>();
}

} // namespace sfxpack::launch
