#pragma once

#include "archive/archive_reader.hpp"
#include "archive/errors.hpp"
#include "launch/launcher.hpp"
#include "paths/path_resolver.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sfxpack::stub {

enum class FailurePolicy {
    ContinueRemaining,  // report the entry, extract the rest
    StopOnFirstError,
};

struct ExtractOptions {
    // Image to read; normally the running stub itself.
    std::filesystem::path archivePath;

    // Anchor for relative extraction paths. Empty: archivePath's directory.
    std::filesystem::path executableDir;

    // Empty: the process environment.
    paths::EnvLookup env;

    int workers{1};
    FailurePolicy failurePolicy{FailurePolicy::ContinueRemaining};

    // Passed through to the main entry.
    std::vector<std::string> forwardArgs;
};

enum class ArchiveState {
    NotPackaged,
    Packaged,
    Failed,  // footer, table, path or directory stage; see ExtractionReport::error
};

enum class LaunchOutcome {
    NoMainEntry,
    Skipped,   // main entry not extracted, or no launcher
    Launched,
    Failed,    // see ExtractionReport::launchError
};

struct EntryFailure {
    std::string displayName;
    archive::ArchiveError error;
};

struct ExtractionReport {
    ArchiveState state{ArchiveState::NotPackaged};
    archive::ArchiveError error;

    std::filesystem::path extractionDir;
    std::vector<std::filesystem::path> extracted;  // table order
    std::optional<std::filesystem::path> mainPath;
    std::vector<EntryFailure> failures;

    LaunchOutcome launch{LaunchOutcome::NoMainEntry};
    archive::ArchiveError launchError;
};

// Process exit status for the stub.
constexpr int kExitOk = 0;
constexpr int kExitBadArchive = 3;       // unsupported or corrupt
constexpr int kExitExtractionPath = 4;   // path resolution or directory creation
constexpr int kExitEntriesFailed = 5;
constexpr int kExitLaunchFailed = 6;
constexpr int kExitLaunchDeclined = 7;
constexpr int kExitNoSelfImage = 8;      // own executable could not be located

int exit_code_for(const ExtractionReport& report);

// footer -> table -> extraction path -> directory -> entries -> launch.
class Extractor {
public:
    // `launcher` may be nullptr to extract without launching. Not owned.
    explicit Extractor(launch::ILauncher* launcher);

    ExtractionReport run(const ExtractOptions& options);

private:
    void extract_entries(archive::ArchiveReader& reader,
                         const ExtractOptions& options,
                         ExtractionReport& report);

    void launch_main(const archive::ArchiveReader& reader,
                     const ExtractOptions& options,
                     ExtractionReport& report);

    launch::ILauncher* launcher_;
};

} // namespace sfxpack::stub
