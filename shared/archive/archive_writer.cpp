#include "archive_writer.hpp"

#include "platform/utf8_path.hpp"

#include <fstream>
#include <random>
#include <system_error>

namespace sfxpack::archive {

namespace {

namespace fs = std::filesystem;

bool read_whole_file(const fs::path& path, std::vector<std::uint8_t>& out, std::string* outError) {
    std::ifstream src(path, std::ios::binary | std::ios::ate);
    if (!src) {
        if (outError) *outError = "cannot open '" + platform::utf8_from_path(path) + "'";
        return false;
    }

    const std::streamoff end = src.tellg();
    if (end < 0) {
        if (outError) *outError = "cannot determine size of '" + platform::utf8_from_path(path) + "'";
        return false;
    }

    const auto size = static_cast<std::size_t>(end);
    src.seekg(0, std::ios::beg);

    out.resize(size);
    if (size > 0) {
        if (!src.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size))) {
            if (outError) *outError = "short read from '" + platform::utf8_from_path(path) + "'";
            return false;
        }
    }

    return true;
}

fs::path make_temp_path(const fs::path& outputPath) {
    std::random_device rd;
    std::uniform_int_distribution<std::uint32_t> dist;

    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "%08x", dist(rd));

    fs::path tmp = outputPath;
    tmp += ".tmp-";
    tmp += suffix;
    return tmp;
}

} // namespace

ArchiveWriter::ArchiveWriter(const IPayloadTransform* transform)
    : transform_(transform) {
}

ArchiveWriter::~ArchiveWriter() {
    if (!finalized_) {
        cancel();
    }
}

bool ArchiveWriter::begin(const fs::path& templatePath,
                          const fs::path& outputPath,
                          ArchiveError* outError) {
    if (file_) {
        return fail(outError, ErrorKind::Write, "writer already started");
    }

    std::vector<std::uint8_t> templateBytes;
    std::string readError;
    if (!read_whole_file(templatePath, templateBytes, &readError)) {
        return fail(outError, ErrorKind::TemplateRead, readError);
    }

    if (templateBytes.size() >= FOOTER_SIZE) {
        std::span<const std::uint8_t> tail(templateBytes.data() + templateBytes.size() - FOOTER_SIZE, FOOTER_SIZE);
        if (decode_footer(tail, nullptr) != FooterStatus::NoMagic) {
            return fail(outError, ErrorKind::Validation,
                        "template '" + platform::utf8_from_path(templatePath) + "' already contains an archive");
        }
    }

    outputPath_ = outputPath;
    tempPath_ = make_temp_path(outputPath);

    const std::string pathStr = platform::utf8_from_path(tempPath_);
    file_ = platform::open_file(tempPath_, "wb");
    if (!file_) {
        tempPath_.clear();
        return fail(outError, ErrorKind::Write, "cannot create '" + pathStr + "'");
    }

    entries_.clear();
    currentOffset_ = 0;
    originalBytes_ = 0;
    storedBytes_ = 0;
    finalized_ = false;

    if (!write_raw(templateBytes, outError)) {
        cancel();
        return false;
    }

    templateSize_ = templateBytes.size();
    return true;
}

bool ArchiveWriter::write_raw(std::span<const std::uint8_t> bytes, ArchiveError* outError) {
    if (!bytes.empty()) {
        if (std::fwrite(bytes.data(), 1, bytes.size(), file_) != bytes.size()) {
            return fail(outError, ErrorKind::Write,
                        "short write to '" + platform::utf8_from_path(tempPath_) + "'");
        }
    }
    currentOffset_ += bytes.size();
    return true;
}

bool ArchiveWriter::add_file(const std::string& displayName,
                             const std::vector<std::uint8_t>& data,
                             bool isMain,
                             ArchiveError* outError) {
    if (!file_ || finalized_) {
        return fail(outError, ErrorKind::Write, "writer not started");
    }

    std::string reason;
    if (!is_valid_display_name(displayName, &reason)) {
        return fail(outError, ErrorKind::Validation, "'" + displayName + "': " + reason);
    }

    for (const auto& existing : entries_) {
        if (existing.displayName == displayName) {
            return fail(outError, ErrorKind::Validation, "duplicate display name '" + displayName + "'");
        }
        if (isMain && existing.main) {
            return fail(outError, ErrorKind::Validation,
                        "more than one main entry ('" + existing.displayName + "' and '" + displayName + "')");
        }
    }

    ResourceEntry entry;
    entry.displayName = displayName;
    entry.originalLength = data.size();
    entry.main = isMain;
    entry.payloadOffset = currentOffset_;

    std::vector<std::uint8_t> encoded;
    if (transform_ && !data.empty()) {
        std::string encodeError;
        if (!transform_->encode(data, encoded, &encodeError)) {
            return fail(outError, ErrorKind::Write,
                        "cannot encode '" + displayName + "': " + encodeError);
        }
        // Store raw when the transform does not pay off.
        entry.transformed = encoded.size() < data.size();
    }

    const std::vector<std::uint8_t>& stored = entry.transformed ? encoded : data;
    if (!write_raw(stored, outError)) {
        return false;
    }

    entry.payloadLength = stored.size();
    originalBytes_ += entry.originalLength;
    storedBytes_ += entry.payloadLength;
    entries_.push_back(std::move(entry));
    return true;
}

bool ArchiveWriter::add_file_from_disk(const std::string& displayName,
                                       const fs::path& sourcePath,
                                       bool isMain,
                                       ArchiveError* outError) {
    if (!file_ || finalized_) {
        return fail(outError, ErrorKind::Write, "writer not started");
    }

    std::vector<std::uint8_t> data;
    std::string readError;
    if (!read_whole_file(sourcePath, data, &readError)) {
        return fail(outError, ErrorKind::SourceRead, readError);
    }

    return add_file(displayName, data, isMain, outError);
}

bool ArchiveWriter::finalize(const ArchiveConfig& config, ArchiveError* outError) {
    if (!file_ || finalized_) {
        return fail(outError, ErrorKind::Write, "writer not started");
    }

    if (config.extractionPathSpec.empty()) {
        return fail(outError, ErrorKind::Validation, "extraction path spec is empty");
    }
    if (config.extractionPathSpec.size() > 0xFFFF) {
        return fail(outError, ErrorKind::Validation, "extraction path spec is too long");
    }

    if (!validate_entries(entries_, ErrorKind::Validation, outError)) {
        return false;
    }

    ArchiveTable table;
    table.entries = entries_;
    table.config = config;

    const std::uint64_t tableOffset = currentOffset_;
    const std::vector<std::uint8_t> tableBytes = encode_table(table);
    if (!write_raw(tableBytes, outError)) {
        return false;
    }

    Footer footer;
    footer.tableOffset = tableOffset;
    footer.tableLength = tableBytes.size();
    if (!write_raw(encode_footer(footer), outError)) {
        return false;
    }

    const bool flushed = std::fflush(file_) == 0;
    const bool closed = std::fclose(file_) == 0;
    file_ = nullptr;
    if (!flushed || !closed) {
        return fail(outError, ErrorKind::Write, "cannot flush '" + platform::utf8_from_path(tempPath_) + "'");
    }

    std::error_code ec;
    fs::permissions(tempPath_,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        return fail(outError, ErrorKind::Write,
                    "cannot mark '" + platform::utf8_from_path(tempPath_) + "' executable: " + ec.message());
    }

    fs::rename(tempPath_, outputPath_, ec);
    if (ec) {
        return fail(outError, ErrorKind::Write,
                    "cannot move output into place at '" + platform::utf8_from_path(outputPath_) + "': " + ec.message());
    }

    tempPath_.clear();
    finalized_ = true;
    return true;
}

void ArchiveWriter::cancel() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }

    if (!tempPath_.empty()) {
        std::error_code ec;
        fs::remove(tempPath_, ec);
        tempPath_.clear();
    }

    entries_.clear();
    finalized_ = false;
}

// ============================================================================
// One-shot packaging
// ============================================================================

std::string effective_display_name(const ResourceInput& input) {
    if (!input.displayName.empty()) {
        return input.displayName;
    }
    return platform::utf8_from_path(input.sourcePath.filename());
}

bool validate_pack_request(const PackRequest& request, ArchiveError* outError) {
    if (request.resources.empty()) {
        return fail(outError, ErrorKind::Validation, "no resources to pack");
    }

    if (request.config.extractionPathSpec.empty()) {
        return fail(outError, ErrorKind::Validation, "extraction path spec is empty");
    }

    if (request.outputPath.empty()) {
        return fail(outError, ErrorKind::Validation, "output path is empty");
    }

    std::vector<ResourceEntry> planned;
    planned.reserve(request.resources.size());
    for (const auto& input : request.resources) {
        ResourceEntry entry;
        entry.displayName = effective_display_name(input);
        entry.main = input.main;
        planned.push_back(std::move(entry));
    }

    return validate_entries(planned, ErrorKind::Validation, outError);
}

bool pack_archive(const PackRequest& request, PackReport* outReport, ArchiveError* outError) {
    if (!validate_pack_request(request, outError)) {
        return false;
    }

    ArchiveWriter writer(request.transform);
    if (!writer.begin(request.templatePath, request.outputPath, outError)) {
        return false;
    }

    for (const auto& input : request.resources) {
        if (!writer.add_file_from_disk(effective_display_name(input), input.sourcePath, input.main, outError)) {
            writer.cancel();
            return false;
        }
    }

    if (!writer.finalize(request.config, outError)) {
        writer.cancel();
        return false;
    }

    if (outReport) {
        PackReport report;
        report.entryCount = writer.file_count();
        report.templateBytes = writer.template_size();
        report.originalBytes = writer.original_bytes();
        report.storedBytes = writer.stored_bytes();
        report.outputBytes = writer.output_size();
        for (const auto& entry : writer.entries()) {
            if (entry.transformed) ++report.transformedCount;
        }
        *outReport = report;
    }

    return true;
}

} // namespace sfxpack::archive
