#include "logger.hpp"

#include "platform/utf8_path.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

#include <raylib.h>

namespace sfxpack::core {

static Logger* g_logger = nullptr;

namespace {

// "2026-10-19 14:03:07.412"
void format_timestamp(char* buf, std::size_t size) {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &secs);
#else
    localtime_r(&secs, &tm);
#endif

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm);
    std::snprintf(buf, size, "%s.%03d", date, static_cast<int>(ms));
}

} // namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const LoggingConfig& cfg) {
    g_logger = this;

    shutdown();

    if (!cfg.enabled) {
        SetTraceLogLevel(LOG_NONE);
        return;
    }

    SetTraceLogLevel(cfg.level);

    if (!cfg.file.empty()) {
        file_ = platform::open_file(platform::path_from_utf8(cfg.file), "a");
        if (!file_) {
            std::fprintf(stderr, "[WARN] cannot open log file %s, logging to stderr only\n", cfg.file.c_str());
        }
    }

    // Installed even without a file so every line gets the same prefix on
    // stderr instead of raylib's default stdout output.
    SetTraceLogCallback(&Logger::trace_callback);
    callback_installed_ = true;
}

void Logger::shutdown() {
    if (callback_installed_) {
        SetTraceLogCallback(nullptr);
    }

    if (file_) {
        std::fclose(static_cast<FILE*>(file_));
        file_ = nullptr;
    }

    callback_installed_ = false;
}

void Logger::trace_callback(int logLevel, const char* text, va_list args) {

    const char* level_str = "INFO";
    switch (logLevel) {
        case LOG_ALL: level_str = "ALL"; break;
        case LOG_TRACE: level_str = "TRACE"; break;
        case LOG_DEBUG: level_str = "DEBUG"; break;
        case LOG_INFO: level_str = "INFO"; break;
        case LOG_WARNING: level_str = "WARN"; break;
        case LOG_ERROR: level_str = "ERROR"; break;
        case LOG_FATAL: level_str = "FATAL"; break;
        case LOG_NONE: level_str = "NONE"; break;
        default: level_str = "INFO"; break;
    }

    char t[48];
    format_timestamp(t, sizeof(t));

    FILE* sink = g_logger ? static_cast<FILE*>(g_logger->file_) : nullptr;
    if (sink) {
        va_list args_copy;
        va_copy(args_copy, args);

        std::fprintf(sink, "[%s][%s] ", t, level_str);
        std::vfprintf(sink, text, args);
        std::fputc('\n', sink);
        std::fflush(sink);

        std::fprintf(stderr, "[%s][%s] ", t, level_str);
        std::vfprintf(stderr, text, args_copy);
        std::fputc('\n', stderr);

        va_end(args_copy);
    } else {
        std::fprintf(stderr, "[%s][%s] ", t, level_str);
        std::vfprintf(stderr, text, args);
        std::fputc('\n', stderr);
    }
}

} // namespace sfxpack::core
