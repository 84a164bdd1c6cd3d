#pragma once

#include "errors.hpp"
#include "format.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sfxpack::archive {

// How the launched main entry should appear. Values are stored in the table
// and must never change.
enum class WindowState : std::uint8_t {
    Normal = 0,
    Maximized = 1,
    Minimized = 2,
    Hidden = 3,
};

constexpr std::uint8_t WINDOW_STATE_COUNT = 4;

// One packaged file.
struct ResourceEntry {
    std::string displayName;
    std::uint64_t payloadOffset{0};   // absolute position in the archive file
    std::uint64_t payloadLength{0};   // stored bytes
    std::uint64_t originalLength{0};  // bytes before the transform
    bool transformed{false};
    bool main{false};
};

// Packaging-time and run-time policy, stored once per archive.
struct ArchiveConfig {
    std::string extractionPathSpec;
    WindowState windowState{WindowState::Normal};
    bool requestElevation{false};
};

struct ArchiveTable {
    std::vector<ResourceEntry> entries;
    ArchiveConfig config;

    // nullptr when no entry is designated main.
    const ResourceEntry* main_entry() const;
};

// --- Footer ---

enum class FooterStatus {
    Valid,
    NoMagic,         // not a packaged file
    UnknownVersion,  // packaged by a writer this reader does not understand
};

std::vector<std::uint8_t> encode_footer(const Footer& footer);

// `bytes` must be exactly FOOTER_SIZE long. `out` is filled for Valid and
// UnknownVersion (version only).
FooterStatus decode_footer(std::span<const std::uint8_t> bytes, Footer* out);

// --- Table ---

std::vector<std::uint8_t> encode_table(const ArchiveTable& table);

// Decodes a complete table. Fails with CorruptArchive when the bytes are
// truncated, carry trailing data, or break an entry invariant.
bool decode_table(std::span<const std::uint8_t> bytes, ArchiveTable* out, ArchiveError* outError);

// --- Invariants ---

// Non-empty, at most MAX_NAME_LENGTH bytes, no '/' or '\\', no NUL,
// not "." or "..".
bool is_valid_display_name(std::string_view name, std::string* outReason = nullptr);

// Display names valid and unique, at most one main entry. Reports `kind`
// so the writer can raise Validation and the reader CorruptArchive.
bool validate_entries(const std::vector<ResourceEntry>& entries, ErrorKind kind, ArchiveError* outError);

// Every payload lies strictly before the table.
bool validate_payload_ranges(const ArchiveTable& table, std::uint64_t tableOffset, ArchiveError* outError);

} // namespace sfxpack::archive
