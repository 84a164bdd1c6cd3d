#include "archive_reader.hpp"

#include "platform/utf8_path.hpp"

#include <system_error>

#if !defined(_WIN32)
#include <sys/types.h>
#endif

namespace sfxpack::archive {

namespace {

bool seek_to(FILE* file, std::uint64_t offset) {
#if defined(_WIN32)
    return _fseeki64(file, static_cast<__int64>(offset), SEEK_SET) == 0;
#else
    return fseeko(file, static_cast<off_t>(offset), SEEK_SET) == 0;
#endif
}

} // namespace

ArchiveReader::ArchiveReader() = default;

ArchiveReader::~ArchiveReader() {
    close();
}

ArchiveReader::ArchiveReader(ArchiveReader&& other) noexcept
    : archivePath_(std::move(other.archivePath_))
    , file_(other.file_)
    , fileSize_(other.fileSize_)
    , footer_(other.footer_)
    , table_(std::move(other.table_)) {
    other.file_ = nullptr;
    other.fileSize_ = 0;
}

ArchiveReader& ArchiveReader::operator=(ArchiveReader&& other) noexcept {
    if (this != &other) {
        close();
        archivePath_ = std::move(other.archivePath_);
        file_ = other.file_;
        fileSize_ = other.fileSize_;
        footer_ = other.footer_;
        table_ = std::move(other.table_);
        other.file_ = nullptr;
        other.fileSize_ = 0;
    }
    return *this;
}

ArchiveReader::OpenResult ArchiveReader::open(const std::filesystem::path& archivePath,
                                              ArchiveError* outError) {
    close();

    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(archivePath, ec);
    if (ec) {
        fail(outError, ErrorKind::CorruptArchive,
             "cannot stat '" + platform::utf8_from_path(archivePath) + "': " + ec.message());
        return OpenResult::Failed;
    }

    const std::string pathStr = platform::utf8_from_path(archivePath);
    file_ = platform::open_file(archivePath, "rb");
    if (!file_) {
        fail(outError, ErrorKind::CorruptArchive, "cannot open '" + pathStr + "'");
        return OpenResult::Failed;
    }

    archivePath_ = archivePath;
    fileSize_ = size;

    if (fileSize_ < FOOTER_SIZE) {
        close();
        return OpenResult::NotPackaged;
    }

    std::vector<std::uint8_t> footerBytes(FOOTER_SIZE);
    if (!read_at(fileSize_ - FOOTER_SIZE, footerBytes.data(), FOOTER_SIZE)) {
        close();
        fail(outError, ErrorKind::CorruptArchive, "cannot read footer");
        return OpenResult::Failed;
    }

    Footer footer;
    switch (decode_footer(footerBytes, &footer)) {
    case FooterStatus::NoMagic:
        close();
        return OpenResult::NotPackaged;
    case FooterStatus::UnknownVersion:
        close();
        fail(outError, ErrorKind::UnsupportedFormat,
             "archive format version " + std::to_string(footer.version) +
             " (this build reads version " + std::to_string(FORMAT_VERSION) + ")");
        return OpenResult::Failed;
    case FooterStatus::Valid:
        break;
    }

    // table_offset + table_length must end exactly at the footer.
    const std::uint64_t tableEnd = fileSize_ - FOOTER_SIZE;
    if (footer.tableOffset > tableEnd || footer.tableLength != tableEnd - footer.tableOffset) {
        close();
        fail(outError, ErrorKind::CorruptArchive,
             "table range [" + std::to_string(footer.tableOffset) + ", +" +
             std::to_string(footer.tableLength) + ") does not end at the footer");
        return OpenResult::Failed;
    }

    std::vector<std::uint8_t> tableBytes(static_cast<std::size_t>(footer.tableLength));
    if (!read_at(footer.tableOffset, tableBytes.data(), footer.tableLength)) {
        close();
        fail(outError, ErrorKind::CorruptArchive, "cannot read table");
        return OpenResult::Failed;
    }

    ArchiveTable table;
    if (!decode_table(tableBytes, &table, outError) ||
        !validate_payload_ranges(table, footer.tableOffset, outError)) {
        close();
        return OpenResult::Failed;
    }

    footer_ = footer;
    table_ = std::move(table);
    return OpenResult::Packaged;
}

void ArchiveReader::close() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    archivePath_.clear();
    fileSize_ = 0;
    footer_ = Footer{};
    table_ = ArchiveTable{};
}

std::uint64_t ArchiveReader::resource_region_start() const {
    std::uint64_t start = footer_.tableOffset;
    for (const auto& entry : table_.entries) {
        if (entry.payloadOffset < start) {
            start = entry.payloadOffset;
        }
    }
    return start;
}

bool ArchiveReader::read_at(std::uint64_t offset, std::uint8_t* dst, std::uint64_t size) {
    if (size == 0) {
        return true;
    }
    if (!seek_to(file_, offset)) {
        return false;
    }
    return std::fread(dst, 1, static_cast<std::size_t>(size), file_) == size;
}

bool ArchiveReader::read_payload(const ResourceEntry& entry,
                                 const IPayloadTransform& transform,
                                 std::vector<std::uint8_t>& out,
                                 ArchiveError* outError) {
    std::vector<std::uint8_t> stored(static_cast<std::size_t>(entry.payloadLength));
    {
        std::lock_guard<std::mutex> lock(readMutex_);
        if (!file_) {
            return fail(outError, ErrorKind::Extraction, "'" + entry.displayName + "': archive not open");
        }
        if (!read_at(entry.payloadOffset, stored.data(), entry.payloadLength)) {
            return fail(outError, ErrorKind::Extraction,
                        "'" + entry.displayName + "': short read at offset " +
                        std::to_string(entry.payloadOffset));
        }
    }

    if (!entry.transformed) {
        out = std::move(stored);
        return true;
    }

    std::string decodeError;
    if (!transform.decode(stored, entry.originalLength, out, &decodeError)) {
        return fail(outError, ErrorKind::Extraction,
                    "'" + entry.displayName + "': " + decodeError);
    }

    return true;
}

} // namespace sfxpack::archive
