// sfxpack - packs files into a self-extracting executable.
//
// Usage:
//   sfxpack [--template <stub>] [--output <file>] [options] <file>[=<name>]...
//   sfxpack --list <archive>
//
// Options:
//   --template, -t <file>  Stub executable to append to (default: sfxstub beside sfxpack).
//   --output, -o <file>    Output executable (default: packed, packed.exe on Windows).
//   --main <name>          Display name of the entry to launch after extraction.
//   --extract-to <spec>    Extraction path spec (default: rc_extracted).
//   --window <state>       normal | maximized | minimized | hidden.
//   --elevate              Request elevated privileges for the main entry.
//   --compress             Store payloads zlib-compressed.
//   --level <0-9>          Compression level.
//   --config <file.ini>    Load tool settings.
//   --list <archive>       Print the archive attached to an executable.
//   --verbose, -v          Print files being added.
//   --help, -h             Show this help message.

#include "archive/archive_reader.hpp"
#include "archive/archive_writer.hpp"
#include "archive/transform.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "launch/launcher.hpp"
#include "platform/self_path.hpp"
#include "platform/utf8_path.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <raylib.h>

namespace fs = std::filesystem;

using namespace sfxpack;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

#if defined(_WIN32)
constexpr const char* kStubName = "sfxstub.exe";
constexpr const char* kDefaultOutput = "packed.exe";
#else
constexpr const char* kStubName = "sfxstub";
constexpr const char* kDefaultOutput = "packed";
#endif

struct Options {
    fs::path templatePath;
    fs::path outputFile;
    std::string mainName;
    std::optional<std::string> extractTo;
    std::optional<archive::WindowState> window;
    bool elevate{false};
    bool compress{false};
    std::optional<int> level;
    std::string configPath;
    fs::path listPath;
    bool verbose{false};
    std::vector<archive::ResourceInput> inputs;
};

enum class ParseResult {
    Ok,
    Help,
    UsageError,
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--template <stub>] [--output <file>] [options] <file>[=<name>]...\n"
              << "       " << program << " --list <archive>\n"
              << "\n"
              << "Options:\n"
              << "  --template, -t <file>  Stub executable to append to (default: " << kStubName << " beside this tool).\n"
              << "  --output, -o <file>    Output executable (default: " << kDefaultOutput << ").\n"
              << "  --main <name>          Display name of the entry to launch after extraction.\n"
              << "  --extract-to <spec>    Extraction path; %VAR%, ${VAR}, $VAR and ~ are expanded\n"
              << "                         at run time, relative paths are beside the executable.\n"
              << "  --window <state>       normal | maximized | minimized | hidden.\n"
              << "  --elevate              Request elevated privileges for the main entry.\n"
              << "  --compress             Store payloads zlib-compressed.\n"
              << "  --level <0-9>          Compression level.\n"
              << "  --config <file.ini>    Load tool settings.\n"
              << "  --list <archive>       Print the archive attached to an executable.\n"
              << "  --verbose, -v          Print files being added.\n"
              << "  --help, -h             Show this help message.\n";
}

// "<file>" or "<file>=<name>"; the last '=' separates the display name.
archive::ResourceInput parse_input(const std::string& arg) {
    archive::ResourceInput input;
    const auto eq = arg.rfind('=');
    if (eq != std::string::npos && eq > 0) {
        input.sourcePath = platform::path_from_utf8(arg.substr(0, eq));
        input.displayName = arg.substr(eq + 1);
    } else {
        input.sourcePath = platform::path_from_utf8(arg);
    }
    return input;
}

ParseResult parse_args(int argc, char* argv[], Options& opts) {
    const std::vector<std::string> args = platform::utf8_arguments(argc, argv);
    const char* program = argc > 0 ? argv[0] : "sfxpack";

    auto require_value = [&](std::size_t& i, const char* what) -> const std::string* {
        if (++i >= args.size()) {
            std::cerr << "Error: " << args[i - 1] << " requires " << what << ".\n";
            return nullptr;
        }
        return &args[i];
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(program);
            return ParseResult::Help;
        } else if (arg == "--template" || arg == "-t") {
            const std::string* v = require_value(i, "a file path");
            if (!v) return ParseResult::UsageError;
            opts.templatePath = platform::path_from_utf8(*v);
        } else if (arg == "--output" || arg == "-o") {
            const std::string* v = require_value(i, "a file path");
            if (!v) return ParseResult::UsageError;
            opts.outputFile = platform::path_from_utf8(*v);
        } else if (arg == "--main") {
            const std::string* v = require_value(i, "a display name");
            if (!v) return ParseResult::UsageError;
            opts.mainName = *v;
        } else if (arg == "--extract-to") {
            const std::string* v = require_value(i, "a path");
            if (!v) return ParseResult::UsageError;
            opts.extractTo = *v;
        } else if (arg == "--window") {
            const std::string* v = require_value(i, "a window state");
            if (!v) return ParseResult::UsageError;
            opts.window = launch::parse_window_state(*v);
            if (!opts.window) {
                std::cerr << "Error: Unknown window state: " << *v << "\n";
                return ParseResult::UsageError;
            }
        } else if (arg == "--elevate") {
            opts.elevate = true;
        } else if (arg == "--compress") {
            opts.compress = true;
        } else if (arg == "--level") {
            const std::string* v = require_value(i, "a number from 0 to 9");
            if (!v) return ParseResult::UsageError;
            if (v->size() != 1 || (*v)[0] < '0' || (*v)[0] > '9') {
                std::cerr << "Error: --level must be a number from 0 to 9.\n";
                return ParseResult::UsageError;
            }
            opts.level = (*v)[0] - '0';
        } else if (arg == "--config") {
            const std::string* v = require_value(i, "a file path");
            if (!v) return ParseResult::UsageError;
            opts.configPath = *v;
        } else if (arg == "--list") {
            const std::string* v = require_value(i, "a file path");
            if (!v) return ParseResult::UsageError;
            opts.listPath = platform::path_from_utf8(*v);
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(program);
            return ParseResult::UsageError;
        } else {
            opts.inputs.push_back(parse_input(arg));
        }
    }

    if (opts.listPath.empty() && opts.inputs.empty()) {
        std::cerr << "Error: No files to pack.\n";
        print_usage(program);
        return ParseResult::UsageError;
    }

    return ParseResult::Ok;
}

int list_archive(const fs::path& path) {
    archive::ArchiveReader reader;
    archive::ArchiveError err;

    switch (reader.open(path, &err)) {
    case archive::ArchiveReader::OpenResult::NotPackaged:
        std::cout << platform::utf8_from_path(path) << ": no archive attached\n";
        return kExitOk;
    case archive::ArchiveReader::OpenResult::Failed:
        std::cerr << "Error: " << archive::describe(err) << "\n";
        return kExitError;
    case archive::ArchiveReader::OpenResult::Packaged:
        break;
    }

    const auto& footer = reader.footer();
    const auto& table = reader.table();

    std::cout << platform::utf8_from_path(path) << "\n"
              << "  Format version: " << footer.version << "\n"
              << "  Template size:  " << reader.resource_region_start() << " bytes\n"
              << "  Table:          " << footer.tableLength << " bytes at " << footer.tableOffset << "\n"
              << "  Extract to:     " << table.config.extractionPathSpec << "\n"
              << "  Window:         " << launch::window_state_name(table.config.windowState) << "\n"
              << "  Elevate:        " << (table.config.requestElevation ? "yes" : "no") << "\n"
              << "  Entries:        " << table.entries.size() << "\n";

    for (const auto& entry : table.entries) {
        std::cout << "    " << (entry.main ? "* " : "  ") << entry.displayName
                  << "  " << entry.originalLength << " bytes";
        if (entry.transformed) {
            std::cout << " (stored " << entry.payloadLength << ")";
        }
        std::cout << "\n";
    }

    return kExitOk;
}

fs::path default_template_path() {
    fs::path self;
    std::string error;
    if (!platform::executable_path(&self, &error)) {
        TraceLog(LOG_WARNING, "[sfxpack] Cannot locate own executable (%s); looking for %s in the current directory",
                 error.c_str(), kStubName);
        return fs::path(kStubName);
    }
    return self.parent_path() / kStubName;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    switch (parse_args(argc, argv, opts)) {
    case ParseResult::Help:
        return kExitOk;
    case ParseResult::UsageError:
        return kExitUsage;
    case ParseResult::Ok:
        break;
    }

    auto& config = core::Config::instance();
    if (!opts.configPath.empty() && !config.load_from_file(opts.configPath)) {
        std::cerr << "Error: Cannot read config file: " << opts.configPath << "\n";
        return kExitError;
    }

    core::LoggingConfig logging = config.logging();
    if (opts.verbose && logging.enabled && logging.level > LOG_DEBUG) {
        logging.level = LOG_DEBUG;
    }
    core::Logger::instance().init(logging);

    if (!opts.listPath.empty()) {
        const int rc = list_archive(opts.listPath);
        core::Logger::instance().shutdown();
        return rc;
    }

    const core::PackDefaults& defaults = config.pack();

    archive::PackRequest request;
    request.templatePath = !opts.templatePath.empty() ? opts.templatePath
                         : !defaults.template_path.empty() ? platform::path_from_utf8(defaults.template_path)
                         : default_template_path();
    request.outputPath = !opts.outputFile.empty() ? opts.outputFile
                       : !defaults.output.empty() ? platform::path_from_utf8(defaults.output)
                       : fs::path(kDefaultOutput);
    request.resources = opts.inputs;
    request.config.extractionPathSpec = opts.extractTo.value_or(defaults.extraction_path);
    request.config.windowState = opts.window.value_or(defaults.window_state);
    request.config.requestElevation = opts.elevate;

    if (!opts.mainName.empty()) {
        bool found = false;
        for (auto& input : request.resources) {
            if (archive::effective_display_name(input) == opts.mainName) {
                input.main = true;
                found = true;
            }
        }
        if (!found) {
            std::cerr << "Error: --main " << opts.mainName << " does not name any packed file.\n";
            core::Logger::instance().shutdown();
            return kExitError;
        }
    } else if (request.config.requestElevation) {
        TraceLog(LOG_WARNING, "[sfxpack] --elevate has no effect without --main");
    }

    std::unique_ptr<archive::IPayloadTransform> transform;
    if (opts.compress || defaults.compress) {
        transform = archive::make_default_transform(opts.level.value_or(defaults.compression_level));
        request.transform = transform.get();
    }

    if (opts.verbose) {
        for (const auto& input : request.resources) {
            std::cout << archive::effective_display_name(input) << " <- " << platform::utf8_from_path(input.sourcePath)
                      << (input.main ? "  [main]" : "") << "\n";
        }
    }

    TraceLog(LOG_DEBUG, "[sfxpack] Template %s, output %s",
             platform::utf8_from_path(request.templatePath).c_str(), platform::utf8_from_path(request.outputPath).c_str());

    archive::PackReport report;
    archive::ArchiveError err;
    if (!archive::pack_archive(request, &report, &err)) {
        std::cerr << "Error: " << archive::describe(err) << "\n";
        core::Logger::instance().shutdown();
        return kExitError;
    }

    std::cout << "Packed " << report.entryCount << " files into " << platform::utf8_from_path(request.outputPath) << "\n";
    std::cout << "  Input size:  " << (report.originalBytes / 1024) << " KB\n";
    std::cout << "  Stored size: " << (report.storedBytes / 1024) << " KB";
    if (request.transform) {
        std::cout << " (" << report.transformedCount << " compressed)";
    }
    std::cout << "\n";
    std::cout << "  Output size: " << (report.outputBytes / 1024) << " KB\n";

    core::Logger::instance().shutdown();
    return kExitOk;
}
