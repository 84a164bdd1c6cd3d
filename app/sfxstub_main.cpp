// sfxstub - self-extracting executable template.
//
// Reads the archive appended to its own image, extracts every entry and
// launches the main entry. Without an archive it only prints a notice.
//
// Environment:
//   SFXPACK_LOG_LEVEL   trace | debug | info | warn | error | none (default: info)
//   SFXPACK_LOG_FILE    also append log lines to this file
//   SFXPACK_WORKERS     extraction threads (default: 1)
//
// Exit status: see stub/extractor.hpp; 8 when the stub cannot find its own image.

#include "core/config.hpp"
#include "core/logger.hpp"
#include "launch/launcher.hpp"
#include "platform/self_path.hpp"
#include "platform/utf8_path.hpp"
#include "stub/extractor.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <raylib.h>

using namespace sfxpack;

namespace {

std::string env_or(const char* name, const char* fallback) {
    const auto v = platform::utf8_getenv(name);
    return (v && !v->empty()) ? *v : std::string(fallback);
}

core::LoggingConfig logging_from_environment() {
    core::LoggingConfig cfg;
    cfg.enabled = true;
    cfg.level = core::log_level_from_string(env_or("SFXPACK_LOG_LEVEL", "info"), LOG_INFO);
    cfg.file = env_or("SFXPACK_LOG_FILE", "");
    return cfg;
}

int workers_from_environment() {
    const std::string v = env_or("SFXPACK_WORKERS", "");
    if (v.empty()) {
        return 1;
    }
    const int n = std::atoi(v.c_str());
    if (n < 1) {
        TraceLog(LOG_WARNING, "[stub] Ignoring SFXPACK_WORKERS=%s", v.c_str());
        return 1;
    }
    return n;
}

} // namespace

int main(int argc, char* argv[]) {
    core::Logger::instance().init(logging_from_environment());

    std::filesystem::path self;
    std::string selfError;
    if (!platform::executable_path(&self, &selfError)) {
        TraceLog(LOG_ERROR, "[stub] Cannot locate own executable: %s", selfError.c_str());
        core::Logger::instance().shutdown();
        return stub::kExitNoSelfImage;
    }

    stub::ExtractOptions options;
    options.archivePath = self;
    options.executableDir = self.parent_path();
    options.workers = workers_from_environment();
    options.forwardArgs = platform::utf8_arguments(argc, argv);

    auto launcher = launch::make_platform_launcher();
    stub::Extractor extractor(launcher.get());
    const stub::ExtractionReport report = extractor.run(options);

    if (report.state == stub::ArchiveState::NotPackaged) {
        std::cout << platform::utf8_from_path(self.filename()) << ": no archive attached. "
                  << "Build one with: sfxpack --template " << platform::utf8_from_path(self.filename())
                  << " --output <file> <resources>...\n";
    }

    for (const auto& failure : report.failures) {
        std::cerr << "[ERROR] " << failure.displayName << ": " << failure.error.message << "\n";
    }

    const int rc = stub::exit_code_for(report);
    core::Logger::instance().shutdown();
    return rc;
}
