#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace sfxpack::archive {

// Failure categories shared by the writer, the reader and the launcher.
// Values are stable; the stub maps them to exit codes.
enum class ErrorKind : std::uint8_t {
    None = 0,
    Validation = 1,
    TemplateRead = 2,
    SourceRead = 3,
    Write = 4,
    UnsupportedFormat = 5,
    CorruptArchive = 6,
    ExtractionDir = 7,
    Extraction = 8,
    PathResolution = 9,
    Launch = 10,
    LaunchDeclined = 11,
};

struct ArchiveError {
    ErrorKind kind{ErrorKind::None};
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }
};

const char* error_kind_name(ErrorKind kind);

// Fills outError (if provided) and returns false so call sites can
// `return fail(outError, ...)`.
inline bool fail(ArchiveError* outError, ErrorKind kind, std::string message) {
    if (outError) {
        outError->kind = kind;
        outError->message = std::move(message);
    }
    return false;
}

// "CorruptArchiveError: table length mismatch"
std::string describe(const ArchiveError& error);

} // namespace sfxpack::archive
