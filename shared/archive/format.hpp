#pragma once

// sfxpack appended archive format (RSCSFX)
//
// The archive is appended to a template executable. Nothing in the template
// is interpreted; the reader locates everything from the end of the file.
//
// Layout:
// ┌─────────────────────────────────────┐
// │ Template bytes (the stub itself)    │
// ├─────────────────────────────────────┤
// │ Payload region (variable)           │
// │   Concatenated stored payloads      │
// │   (no alignment padding)            │
// ├─────────────────────────────────────┤
// │ Metadata table (variable)           │
// │   magic[4]      = "RSTB"            │
// │   entry_count   : u32               │
// │   For each entry:                   │
// │     name_len    : u16               │
// │     name        : char[name_len]    │
// │     offset      : u64 (absolute)    │
// │     length      : u64 (stored)      │
// │     original    : u64               │
// │     flags       : u8                │
// │   Config:                           │
// │     spec_len    : u16               │
// │     spec        : char[spec_len]    │
// │     window      : u8                │
// │     elevate     : u8                │
// ├─────────────────────────────────────┤
// │ Footer (32 bytes)                   │
// │   magic[8]      = "RSCSFX\x1A\0"    │
// │   version       : u32 = 1           │
// │   reserved      : u32 = 0           │
// │   table_offset  : u64               │
// │   table_length  : u64               │
// └─────────────────────────────────────┘
//
// All integers are little-endian.

#include <array>
#include <cstddef>
#include <cstdint>

namespace sfxpack::archive {

constexpr std::array<unsigned char, 8> FOOTER_MAGIC{{'R', 'S', 'C', 'S', 'F', 'X', 0x1A, 0x00}};
constexpr std::array<unsigned char, 4> TABLE_MAGIC{{'R', 'S', 'T', 'B'}};

// Current format version. Readers refuse anything else.
constexpr std::uint32_t FORMAT_VERSION = 1;

// Footer size in bytes. Constant for every archive of a format version.
constexpr std::size_t FOOTER_SIZE = 32;

// Maximum display name length (to prevent malicious files).
constexpr std::size_t MAX_NAME_LENGTH = 255;

// Entry flag bits.
constexpr std::uint8_t ENTRY_FLAG_TRANSFORMED = 1u << 0;
constexpr std::uint8_t ENTRY_FLAG_MAIN = 1u << 1;
constexpr std::uint8_t ENTRY_FLAGS_KNOWN = ENTRY_FLAG_TRANSFORMED | ENTRY_FLAG_MAIN;

struct Footer {
    std::uint32_t version{FORMAT_VERSION};
    std::uint32_t reserved{0};
    std::uint64_t tableOffset{0};
    std::uint64_t tableLength{0};
};

} // namespace sfxpack::archive
