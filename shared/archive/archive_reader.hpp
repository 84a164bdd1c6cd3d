#pragma once

#include "errors.hpp"
#include "table.hpp"
#include "transform.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <vector>

namespace sfxpack::archive {

// Reads the archive appended to a packaged executable.
//
// Only the footer is located without prior knowledge: it sits in the last
// FOOTER_SIZE bytes. Everything else is reached through its offsets.
class ArchiveReader {
public:
    enum class OpenResult {
        Packaged,     // footer and table valid
        NotPackaged,  // no footer; a plain template
        Failed,       // see outError
    };

    ArchiveReader();
    ~ArchiveReader();

    // Non-copyable, movable.
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;
    ArchiveReader(ArchiveReader&& other) noexcept;
    ArchiveReader& operator=(ArchiveReader&& other) noexcept;

    // Failed carries UnsupportedFormat (unknown version) or CorruptArchive.
    // A file that cannot be opened at all is also CorruptArchive, since the
    // reader only ever opens its own image.
    OpenResult open(const std::filesystem::path& archivePath, ArchiveError* outError);

    void close();

    bool is_open() const { return file_ != nullptr; }

    const ArchiveTable& table() const { return table_; }
    const Footer& footer() const { return footer_; }
    std::uint64_t file_size() const { return fileSize_; }
    const std::filesystem::path& path() const { return archivePath_; }

    // Template bytes occupy [0, resource_region_start()).
    std::uint64_t resource_region_start() const;

    // Read an entry's stored bytes and undo the transform if flagged.
    // Safe to call from several threads; reads are serialized internally.
    // Fails with Extraction naming the entry.
    bool read_payload(const ResourceEntry& entry,
                      const IPayloadTransform& transform,
                      std::vector<std::uint8_t>& out,
                      ArchiveError* outError);

private:
    bool read_at(std::uint64_t offset, std::uint8_t* dst, std::uint64_t size);

    std::filesystem::path archivePath_;
    FILE* file_{nullptr};
    std::uint64_t fileSize_{0};
    Footer footer_;
    ArchiveTable table_;

    std::mutex readMutex_;
};

} // namespace sfxpack::archive
