#include "table.hpp"

#include "byte_buffer.hpp"

#include <array>
#include <cctype>
#include <stdexcept>
#include <unordered_set>

namespace sfxpack::archive {

const ResourceEntry* ArchiveTable::main_entry() const {
    for (const auto& entry : entries) {
        if (entry.main) {
            return &entry;
        }
    }
    return nullptr;
}

std::vector<std::uint8_t> encode_footer(const Footer& footer) {
    ByteWriter w(FOOTER_SIZE);
    w.write_bytes(FOOTER_MAGIC);
    w.write_u32(footer.version);
    w.write_u32(footer.reserved);
    w.write_u64(footer.tableOffset);
    w.write_u64(footer.tableLength);
    return w.take();
}

FooterStatus decode_footer(std::span<const std::uint8_t> bytes, Footer* out) {
    if (bytes.size() != FOOTER_SIZE) {
        return FooterStatus::NoMagic;
    }

    ByteReader r(bytes);
    if (!r.read_magic(FOOTER_MAGIC)) {
        return FooterStatus::NoMagic;
    }

    Footer footer;
    footer.version = r.read_u32();
    if (footer.version != FORMAT_VERSION) {
        if (out) out->version = footer.version;
        return FooterStatus::UnknownVersion;
    }

    footer.reserved = r.read_u32();
    footer.tableOffset = r.read_u64();
    footer.tableLength = r.read_u64();

    if (out) *out = footer;
    return FooterStatus::Valid;
}

std::vector<std::uint8_t> encode_table(const ArchiveTable& table) {
    ByteWriter w;
    w.write_bytes(TABLE_MAGIC);
    w.write_u32(static_cast<std::uint32_t>(table.entries.size()));

    for (const auto& entry : table.entries) {
        w.write_string(entry.displayName);
        w.write_u64(entry.payloadOffset);
        w.write_u64(entry.payloadLength);
        w.write_u64(entry.originalLength);

        std::uint8_t flags = 0;
        if (entry.transformed) flags |= ENTRY_FLAG_TRANSFORMED;
        if (entry.main) flags |= ENTRY_FLAG_MAIN;
        w.write_u8(flags);
    }

    w.write_string(table.config.extractionPathSpec);
    w.write_u8(static_cast<std::uint8_t>(table.config.windowState));
    w.write_bool(table.config.requestElevation);

    return w.take();
}

namespace {

// Smallest possible encoded entry: empty name, three u64, flags.
constexpr std::size_t kMinEntrySize = 2 + 8 + 8 + 8 + 1;

bool decode_table_body(ByteReader& r, ArchiveTable* out, ArchiveError* outError) {
    if (!r.read_magic(TABLE_MAGIC)) {
        return fail(outError, ErrorKind::CorruptArchive, "table magic mismatch");
    }

    const std::uint32_t count = r.read_u32();
    if (static_cast<std::uint64_t>(count) * kMinEntrySize > r.remaining()) {
        return fail(outError, ErrorKind::CorruptArchive,
                    "entry count " + std::to_string(count) + " exceeds table size");
    }

    ArchiveTable table;
    table.entries.reserve(count);

    for (std::uint32_t i = 0; i < count; ++i) {
        ResourceEntry entry;
        entry.displayName = r.read_string();
        entry.payloadOffset = r.read_u64();
        entry.payloadLength = r.read_u64();
        entry.originalLength = r.read_u64();

        const std::uint8_t flags = r.read_u8();
        if ((flags & ~ENTRY_FLAGS_KNOWN) != 0) {
            return fail(outError, ErrorKind::CorruptArchive,
                        "entry " + std::to_string(i) + " has unknown flag bits");
        }
        entry.transformed = (flags & ENTRY_FLAG_TRANSFORMED) != 0;
        entry.main = (flags & ENTRY_FLAG_MAIN) != 0;

        if (!entry.transformed && entry.payloadLength != entry.originalLength) {
            return fail(outError, ErrorKind::CorruptArchive,
                        "entry '" + entry.displayName + "' stored length differs from original length");
        }

        table.entries.push_back(std::move(entry));
    }

    table.config.extractionPathSpec = r.read_string();

    const std::uint8_t window = r.read_u8();
    if (window >= WINDOW_STATE_COUNT) {
        return fail(outError, ErrorKind::CorruptArchive,
                    "unknown window state " + std::to_string(window));
    }
    table.config.windowState = static_cast<WindowState>(window);
    table.config.requestElevation = r.read_bool_strict();

    if (!r.at_end()) {
        return fail(outError, ErrorKind::CorruptArchive,
                    std::to_string(r.remaining()) + " trailing bytes after table");
    }

    if (!validate_entries(table.entries, ErrorKind::CorruptArchive, outError)) {
        return false;
    }

    *out = std::move(table);
    return true;
}

} // namespace

bool decode_table(std::span<const std::uint8_t> bytes, ArchiveTable* out, ArchiveError* outError) {
    ByteReader r(bytes);
    try {
        return decode_table_body(r, out, outError);
    } catch (const std::runtime_error& e) {
        return fail(outError, ErrorKind::CorruptArchive,
                    std::string("table truncated: ") + e.what());
    }
}

namespace {

// Windows maps these to devices in every directory, with or without an extension.
bool is_reserved_device_name(std::string_view name) {
    static constexpr std::array<std::string_view, 4> kPlain = {"CON", "PRN", "AUX", "NUL"};
    static constexpr std::array<std::string_view, 2> kNumbered = {"COM", "LPT"};

    const std::string_view stem = name.substr(0, name.find('.'));
    auto equals_upper = [](std::string_view s, std::string_view upper) {
        if (s.size() != upper.size()) return false;
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (std::toupper(static_cast<unsigned char>(s[i])) != upper[i]) return false;
        }
        return true;
    };

    for (auto reserved : kPlain) {
        if (equals_upper(stem, reserved)) return true;
    }
    if (stem.size() == 4 && stem[3] >= '1' && stem[3] <= '9') {
        for (auto prefix : kNumbered) {
            if (equals_upper(stem.substr(0, 3), prefix)) return true;
        }
    }
    return false;
}

} // namespace

bool is_valid_display_name(std::string_view name, std::string* outReason) {
    auto reject = [outReason](const char* reason) {
        if (outReason) *outReason = reason;
        return false;
    };

    if (name.empty()) return reject("display name is empty");
    if (name.size() > MAX_NAME_LENGTH) return reject("display name is too long");
    if (name == "." || name == "..") return reject("display name is a relative directory");

    for (char c : name) {
        if (c == '/' || c == '\\') return reject("display name contains a path separator");
        if (c == '\0') return reject("display name contains a NUL byte");
        if (c == ':') return reject("display name contains a drive or stream separator");
    }

    if (is_reserved_device_name(name)) return reject("display name is a reserved device name");

    return true;
}

bool validate_entries(const std::vector<ResourceEntry>& entries, ErrorKind kind, ArchiveError* outError) {
    std::unordered_set<std::string_view> seen;
    seen.reserve(entries.size());

    const ResourceEntry* mainEntry = nullptr;

    for (const auto& entry : entries) {
        std::string reason;
        if (!is_valid_display_name(entry.displayName, &reason)) {
            return fail(outError, kind, "'" + entry.displayName + "': " + reason);
        }

        if (!seen.insert(entry.displayName).second) {
            return fail(outError, kind, "duplicate display name '" + entry.displayName + "'");
        }

        if (entry.main) {
            if (mainEntry) {
                return fail(outError, kind,
                            "more than one main entry ('" + mainEntry->displayName +
                            "' and '" + entry.displayName + "')");
            }
            mainEntry = &entry;
        }
    }

    return true;
}

bool validate_payload_ranges(const ArchiveTable& table, std::uint64_t tableOffset, ArchiveError* outError) {
    for (const auto& entry : table.entries) {
        // Written this way to avoid overflow of offset + length.
        if (entry.payloadOffset > tableOffset ||
            entry.payloadLength > tableOffset - entry.payloadOffset) {
            return fail(outError, ErrorKind::CorruptArchive,
                        "payload of '" + entry.displayName + "' extends past the payload region");
        }
    }
    return true;
}

} // namespace sfxpack::archive
