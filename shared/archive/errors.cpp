#include "errors.hpp"

namespace sfxpack::archive {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::TemplateRead: return "TemplateReadError";
        case ErrorKind::SourceRead: return "SourceReadError";
        case ErrorKind::Write: return "WriteError";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormatError";
        case ErrorKind::CorruptArchive: return "CorruptArchiveError";
        case ErrorKind::ExtractionDir: return "ExtractionDirError";
        case ErrorKind::Extraction: return "ExtractionError";
        case ErrorKind::PathResolution: return "PathResolutionError";
        case ErrorKind::Launch: return "LaunchError";
        case ErrorKind::LaunchDeclined: return "LaunchDeclinedError";
    }
    return "UnknownError";
}

std::string describe(const ArchiveError& error) {
    std::string out = error_kind_name(error.kind);
    if (!error.message.empty()) {
        out += ": ";
        out += error.message;
    }
    return out;
}

} // namespace sfxpack::archive
