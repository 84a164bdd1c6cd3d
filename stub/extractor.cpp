#include "extractor.hpp"

#include "archive/transform.hpp"
#include "platform/utf8_path.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <mutex>
#include <system_error>
#include <thread>

#include <raylib.h>

namespace sfxpack::stub {

using archive::ArchiveError;
using archive::ArchiveReader;
using archive::ErrorKind;
using archive::ResourceEntry;

namespace {

namespace fs = std::filesystem;

bool write_file(const fs::path& path, const std::vector<std::uint8_t>& data, ArchiveError* outError) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return archive::fail(outError, ErrorKind::Extraction, "cannot create '" + platform::utf8_from_path(path) + "'");
    }
    if (!data.empty()) {
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    out.close();
    if (!out) {
        return archive::fail(outError, ErrorKind::Extraction, "short write to '" + platform::utf8_from_path(path) + "'");
    }
    return true;
}

bool mark_executable(const fs::path& path, ArchiveError* outError) {
#if defined(_WIN32)
    (void)path;
    (void)outError;
    return true;
#else
    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        return archive::fail(outError, ErrorKind::Extraction,
                             "cannot mark '" + platform::utf8_from_path(path) + "' executable: " + ec.message());
    }
    return true;
#endif
}

} // namespace

int exit_code_for(const ExtractionReport& report) {
    switch (report.state) {
    case ArchiveState::NotPackaged:
        return kExitOk;
    case ArchiveState::Failed:
        switch (report.error.kind) {
        case ErrorKind::UnsupportedFormat:
        case ErrorKind::CorruptArchive:
            return kExitBadArchive;
        default:
            return kExitExtractionPath;
        }
    case ArchiveState::Packaged:
        break;
    }

    if (!report.failures.empty()) {
        return kExitEntriesFailed;
    }

    if (report.launch == LaunchOutcome::Failed) {
        return report.launchError.kind == ErrorKind::LaunchDeclined ? kExitLaunchDeclined : kExitLaunchFailed;
    }

    return kExitOk;
}

Extractor::Extractor(launch::ILauncher* launcher)
    : launcher_(launcher) {
}

ExtractionReport Extractor::run(const ExtractOptions& options) {
    ExtractionReport report;

    ArchiveReader reader;
    switch (reader.open(options.archivePath, &report.error)) {
    case ArchiveReader::OpenResult::NotPackaged:
        TraceLog(LOG_INFO, "[stub] No archive attached to %s", platform::utf8_from_path(options.archivePath).c_str());
        report.state = ArchiveState::NotPackaged;
        return report;
    case ArchiveReader::OpenResult::Failed:
        TraceLog(LOG_ERROR, "[stub] %s", archive::describe(report.error).c_str());
        report.state = ArchiveState::Failed;
        return report;
    case ArchiveReader::OpenResult::Packaged:
        break;
    }

    const auto& table = reader.table();
    TraceLog(LOG_INFO, "[stub] Archive: %zu entries, extract to '%s', window %s%s",
             table.entries.size(),
             table.config.extractionPathSpec.c_str(),
             launch::window_state_name(table.config.windowState),
             table.config.requestElevation ? ", elevated" : "");

    const fs::path exeDir = options.executableDir.empty()
        ? options.archivePath.parent_path()
        : options.executableDir;
    const paths::EnvLookup env = options.env ? options.env : paths::process_environment();

    if (!paths::resolve_extraction_path(table.config.extractionPathSpec, exeDir, env,
                                        &report.extractionDir, &report.error)) {
        TraceLog(LOG_ERROR, "[stub] %s", archive::describe(report.error).c_str());
        report.state = ArchiveState::Failed;
        return report;
    }

    std::error_code ec;
    fs::create_directories(report.extractionDir, ec);
    if (ec || !fs::is_directory(report.extractionDir)) {
        archive::fail(&report.error, ErrorKind::ExtractionDir,
                      "cannot create '" + platform::utf8_from_path(report.extractionDir) + "'" +
                      (ec ? ": " + ec.message() : std::string()));
        TraceLog(LOG_ERROR, "[stub] %s", archive::describe(report.error).c_str());
        report.state = ArchiveState::Failed;
        return report;
    }

    report.state = ArchiveState::Packaged;

    extract_entries(reader, options, report);
    launch_main(reader, options, report);

    return report;
}

void Extractor::extract_entries(ArchiveReader& reader,
                                const ExtractOptions& options,
                                ExtractionReport& report) {
    const auto& entries = reader.table().entries;
    if (entries.empty()) {
        return;
    }

    const auto transform = archive::make_default_transform();

    std::vector<std::optional<fs::path>> written(entries.size());
    std::vector<std::optional<ArchiveError>> errors(entries.size());

    std::atomic<std::size_t> next{0};
    std::atomic<bool> stop{false};

    auto extract_one = [&](std::size_t i) {
        const ResourceEntry& entry = entries[i];
        const fs::path target = report.extractionDir / platform::path_from_utf8(entry.displayName);

        ArchiveError err;
        std::vector<std::uint8_t> data;
        if (!reader.read_payload(entry, *transform, data, &err) ||
            !write_file(target, data, &err) ||
            (entry.main && !mark_executable(target, &err))) {
            TraceLog(LOG_ERROR, "[stub] %s", archive::describe(err).c_str());
            errors[i] = std::move(err);
            if (options.failurePolicy == FailurePolicy::StopOnFirstError) {
                stop = true;
            }
            return;
        }

        TraceLog(LOG_DEBUG, "[stub] Extracted %s (%llu bytes)", entry.displayName.c_str(),
                 static_cast<unsigned long long>(entry.originalLength));
        written[i] = target;
    };

    auto worker = [&]() {
        while (!stop) {
            const std::size_t i = next.fetch_add(1);
            if (i >= entries.size()) {
                break;
            }
            extract_one(i);
        }
    };

    const std::size_t workers = std::clamp<std::size_t>(
        static_cast<std::size_t>(std::max(options.workers, 1)), 1, std::max<std::size_t>(entries.size(), 1));

    if (workers == 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            pool.emplace_back(worker);
        }
        for (auto& t : pool) {
            t.join();
        }
    }

    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (written[i]) {
            report.extracted.push_back(*written[i]);
            if (entries[i].main) {
                report.mainPath = *written[i];
            }
        } else if (errors[i]) {
            report.failures.push_back(EntryFailure{entries[i].displayName, std::move(*errors[i])});
        } else {
            // Never attempted because extraction stopped early.
            ArchiveError skipped;
            archive::fail(&skipped, ErrorKind::Extraction,
                          "'" + entries[i].displayName + "': skipped after an earlier failure");
            report.failures.push_back(EntryFailure{entries[i].displayName, std::move(skipped)});
        }
    }

    TraceLog(LOG_INFO, "[stub] Extracted %zu of %zu entries to %s",
             report.extracted.size(), entries.size(), platform::utf8_from_path(report.extractionDir).c_str());
}

void Extractor::launch_main(const ArchiveReader& reader,
                            const ExtractOptions& options,
                            ExtractionReport& report) {
    const ResourceEntry* mainEntry = reader.table().main_entry();
    if (!mainEntry) {
        report.launch = LaunchOutcome::NoMainEntry;
        return;
    }

    // Other entries failing does not block the launch; exit status still reports them.
    if (!report.mainPath) {
        TraceLog(LOG_WARNING, "[stub] Not launching %s: it was not extracted",
                 mainEntry->displayName.c_str());
        report.launch = LaunchOutcome::Skipped;
        return;
    }

    if (!launcher_) {
        report.launch = LaunchOutcome::Skipped;
        return;
    }

    const auto& config = reader.table().config;

    launch::LaunchRequest request;
    request.program = *report.mainPath;
    request.arguments = options.forwardArgs;
    request.windowState = config.windowState;
    request.requestElevation = config.requestElevation;
    request.workingDirectory = report.extractionDir;

    TraceLog(LOG_INFO, "[stub] Launching %s (%s%s)", platform::utf8_from_path(request.program).c_str(),
             launch::window_state_name(request.windowState),
             request.requestElevation ? ", elevated" : "");

    if (!launcher_->launch(request, &report.launchError)) {
        TraceLog(LOG_ERROR, "[stub] %s", archive::describe(report.launchError).c_str());
        report.launch = LaunchOutcome::Failed;
        return;
    }

    report.launch = LaunchOutcome::Launched;
}

} // namespace sfxpack::stub
