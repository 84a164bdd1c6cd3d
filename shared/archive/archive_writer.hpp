#pragma once

#include "errors.hpp"
#include "table.hpp"
#include "transform.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

namespace sfxpack::archive {

// Appends resources, a metadata table and a footer to a template executable.
//
// Output goes to a temporary file beside the destination and is renamed into
// place by finalize(), so a failed or cancelled write never leaves a partial
// output file.
class ArchiveWriter {
public:
    // @param transform  Applied to every payload; nullptr stores payloads as-is.
    //                   Must outlive the writer.
    explicit ArchiveWriter(const IPayloadTransform* transform = nullptr);
    ~ArchiveWriter();

    // Non-copyable.
    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // Copy the template into a new temporary output file.
    // Fails with TemplateRead if the template cannot be read, Validation if
    // it already carries an archive, Write if the output cannot be created.
    bool begin(const std::filesystem::path& templatePath,
               const std::filesystem::path& outputPath,
               ArchiveError* outError);

    // Append one payload. Order of calls is the order of the table.
    bool add_file(const std::string& displayName,
                  const std::vector<std::uint8_t>& data,
                  bool isMain,
                  ArchiveError* outError);

    // Read a payload from disk. Fails with SourceRead naming the file.
    bool add_file_from_disk(const std::string& displayName,
                            const std::filesystem::path& sourcePath,
                            bool isMain,
                            ArchiveError* outError);

    // Validate, write table and footer, then move the output into place.
    bool finalize(const ArchiveConfig& config, ArchiveError* outError);

    // Close and remove the temporary output.
    void cancel();

    std::uint32_t file_count() const { return static_cast<std::uint32_t>(entries_.size()); }
    const std::vector<ResourceEntry>& entries() const { return entries_; }

    std::uint64_t template_size() const { return templateSize_; }
    std::uint64_t original_bytes() const { return originalBytes_; }
    std::uint64_t stored_bytes() const { return storedBytes_; }

    // Total size of the finalized output file.
    std::uint64_t output_size() const { return currentOffset_; }

private:
    bool write_raw(std::span<const std::uint8_t> bytes, ArchiveError* outError);

    const IPayloadTransform* transform_{nullptr};

    std::filesystem::path outputPath_;
    std::filesystem::path tempPath_;
    FILE* file_{nullptr};

    std::vector<ResourceEntry> entries_;
    std::uint64_t templateSize_{0};
    std::uint64_t currentOffset_{0};
    std::uint64_t originalBytes_{0};
    std::uint64_t storedBytes_{0};
    bool finalized_{false};
};

// ============================================================================
// One-shot packaging
// ============================================================================

struct ResourceInput {
    std::filesystem::path sourcePath;
    std::string displayName;  // empty: use the source file name
    bool main{false};
};

struct PackRequest {
    std::filesystem::path templatePath;
    std::filesystem::path outputPath;
    std::vector<ResourceInput> resources;  // caller order is preserved
    ArchiveConfig config;
    const IPayloadTransform* transform{nullptr};
};

struct PackReport {
    std::uint32_t entryCount{0};
    std::uint64_t templateBytes{0};
    std::uint64_t originalBytes{0};
    std::uint64_t storedBytes{0};
    std::uint64_t outputBytes{0};
    std::uint32_t transformedCount{0};
};

// Checks every input before any file is touched: display names, a single
// main entry, a non-empty extraction path spec, at least one resource.
bool validate_pack_request(const PackRequest& request, ArchiveError* outError);

// Validate, write and report. On failure nothing exists at outputPath
// (a pre-existing file there is left untouched).
bool pack_archive(const PackRequest& request, PackReport* outReport, ArchiveError* outError);

// Display name used for a resource input.
std::string effective_display_name(const ResourceInput& input);

} // namespace sfxpack::archive
