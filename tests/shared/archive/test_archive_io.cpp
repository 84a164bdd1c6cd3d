/**
 * @file test_archive_io.cpp
 * @brief Writer/reader tests against real files.
 *
 * Covers packaging validation, atomic output, footer location for any
 * template size, and reader rejection of damaged archives.
 */

#include <catch2/catch_test_macros.hpp>

#include "archive/archive_reader.hpp"
#include "archive/archive_writer.hpp"
#include "archive/format.hpp"
#include "archive/transform.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <filesystem>

using namespace sfxpack::archive;
using namespace test_helpers;

namespace fs = std::filesystem;

namespace {

ArchiveConfig default_config() {
    ArchiveConfig config;
    config.extractionPathSpec = "rc_extracted";
    return config;
}

std::string payload_text(ArchiveReader& reader, std::size_t index) {
    std::vector<std::uint8_t> data;
    ArchiveError err;
    ZlibTransform zlib;
    REQUIRE(reader.read_payload(reader.table().entries.at(index), zlib, data, &err));
    return std::string(data.begin(), data.end());
}

} // namespace

// ============================================================================
// Round trip
// ============================================================================

TEST_CASE("Packed resources read back unchanged", "[archive][io]") {
    TempDir dir;
    const fs::path stub = make_template(dir, 1000);
    const fs::path out = dir.path() / "packed.bin";

    const std::string big(20000, 'z');
    const std::vector<std::pair<std::string, std::string>> files = {
        {"readme.txt", "hello world"},
        {"empty.dat", ""},
        {"big.txt", big},
    };

    ArchiveConfig config;
    config.extractionPathSpec = "${HOME}/app";
    config.windowState = WindowState::Maximized;
    config.requestElevation = true;

    ZlibTransform zlib;
    IdentityTransform identity;

    SECTION("without a transform") {
        REQUIRE(pack_files(stub, out, dir, files, config, "readme.txt"));
    }
    SECTION("with the identity transform") {
        REQUIRE(pack_files(stub, out, dir, files, config, "readme.txt", &identity));
    }
    SECTION("with zlib") {
        REQUIRE(pack_files(stub, out, dir, files, config, "readme.txt", &zlib));
    }

    ArchiveReader reader;
    ArchiveError err;
    REQUIRE(reader.open(out, &err) == ArchiveReader::OpenResult::Packaged);

    const auto& table = reader.table();
    REQUIRE(table.entries.size() == 3);
    REQUIRE(table.entries[0].displayName == "readme.txt");
    REQUIRE(table.entries[1].displayName == "empty.dat");
    REQUIRE(table.entries[2].displayName == "big.txt");
    REQUIRE(table.entries[0].main);
    REQUIRE(table.main_entry() == &table.entries[0]);

    REQUIRE(table.config.extractionPathSpec == "${HOME}/app");
    REQUIRE(table.config.windowState == WindowState::Maximized);
    REQUIRE(table.config.requestElevation);

    REQUIRE(payload_text(reader, 0) == "hello world");
    REQUIRE(payload_text(reader, 1).empty());
    REQUIRE(payload_text(reader, 2) == big);

    // Template bytes are untouched and payloads start right after them.
    REQUIRE(reader.resource_region_start() == 1000);
    REQUIRE(table.entries[0].payloadOffset == 1000);
    const auto image = read_bytes(out);
    const auto original = read_bytes(stub);
    REQUIRE(std::equal(original.begin(), original.end(), image.begin()));
}

TEST_CASE("Writer stores raw bytes when the transform does not help", "[archive][io]") {
    TempDir dir;
    const fs::path stub = make_template(dir);
    const fs::path out = dir.path() / "packed.bin";

    ZlibTransform zlib;
    ArchiveWriter compressing(&zlib);
    ArchiveError err;

    REQUIRE(compressing.begin(stub, out, &err));
    REQUIRE(compressing.add_file("noise.bin", noise_bytes(4096), false, &err));
    REQUIRE(compressing.add_file("text.txt", repeated_bytes(4096), false, &err));
    REQUIRE(compressing.add_file("tiny.txt", repeated_bytes(1), false, &err));
    REQUIRE(compressing.finalize(default_config(), &err));

    const auto& entries = compressing.entries();
    REQUIRE_FALSE(entries[0].transformed);
    REQUIRE(entries[0].payloadLength == 4096);
    REQUIRE(entries[1].transformed);
    REQUIRE(entries[1].payloadLength < 4096);
    REQUIRE_FALSE(entries[2].transformed);

    ArchiveReader reader;
    REQUIRE(reader.open(out, &err) == ArchiveReader::OpenResult::Packaged);
    REQUIRE(reader.table().entries[1].originalLength == 4096);
}

TEST_CASE("Pack report", "[archive][io]") {
    TempDir dir;
    const fs::path stub = make_template(dir, 512);

    PackRequest request;
    request.templatePath = stub;
    request.outputPath = dir.path() / "out.bin";
    request.config = default_config();
    request.resources.push_back({dir.create_file("in/a.txt", std::string(100, 'a')), "", false});
    request.resources.push_back({dir.create_file("in/b.txt", std::string(50, 'b')), "renamed.txt", true});

    PackReport report;
    ArchiveError err;
    REQUIRE(pack_archive(request, &report, &err));

    REQUIRE(report.entryCount == 2);
    REQUIRE(report.templateBytes == 512);
    REQUIRE(report.originalBytes == 150);
    REQUIRE(report.storedBytes == 150);
    REQUIRE(report.outputBytes == fs::file_size(request.outputPath));

    ArchiveReader reader;
    REQUIRE(reader.open(request.outputPath, &err) == ArchiveReader::OpenResult::Packaged);
    REQUIRE(reader.table().entries[0].displayName == "a.txt");
    REQUIRE(reader.table().entries[1].displayName == "renamed.txt");
}

// ============================================================================
// Footer location
// ============================================================================

TEST_CASE("Footer is found for any template size", "[archive][io]") {
    TempDir dir;

    for (std::size_t size : {0u, 1u, 31u, 32u, 33u, 70000u}) {
        const fs::path stub = make_template(dir, size, "stub_" + std::to_string(size));
        const fs::path out = dir.path() / ("out_" + std::to_string(size));

        REQUIRE(pack_files(stub, out, dir, {{"f.txt", "data"}}, default_config()));

        const auto image = read_bytes(out);
        Footer footer;
        std::span<const std::uint8_t> tail(image.data() + image.size() - FOOTER_SIZE, FOOTER_SIZE);
        REQUIRE(decode_footer(tail, &footer) == FooterStatus::Valid);
        REQUIRE(footer.tableOffset + footer.tableLength == image.size() - FOOTER_SIZE);

        ArchiveReader reader;
        ArchiveError err;
        REQUIRE(reader.open(out, &err) == ArchiveReader::OpenResult::Packaged);
        REQUIRE(reader.resource_region_start() == size);
        REQUIRE(payload_text(reader, 0) == "data");
    }
}

// ============================================================================
// Writer validation
// ============================================================================

TEST_CASE("Writer rejects invalid requests", "[archive][io]") {
    TempDir dir;
    const fs::path stub = make_template(dir);
    const fs::path out = dir.path() / "out.bin";
    ArchiveError err;

    SECTION("duplicate display names") {
        // Names collide after renaming.
        PackRequest request;
        request.templatePath = stub;
        request.outputPath = out;
        request.config = default_config();
        request.resources.push_back({dir.create_file("x/one.txt", "1"), "same.txt", false});
        request.resources.push_back({dir.create_file("y/two.txt", "2"), "same.txt", false});
        REQUIRE_FALSE(pack_archive(request, nullptr, &err));
        REQUIRE(err.kind == ErrorKind::Validation);
    }

    SECTION("two main entries") {
        PackRequest request;
        request.templatePath = stub;
        request.outputPath = out;
        request.config = default_config();
        request.resources.push_back({dir.create_file("x/one.exe", "1"), "", true});
        request.resources.push_back({dir.create_file("x/two.exe", "2"), "", true});
        REQUIRE_FALSE(pack_archive(request, nullptr, &err));
        REQUIRE(err.kind == ErrorKind::Validation);
    }

    SECTION("display name with a separator") {
        PackRequest request;
        request.templatePath = stub;
        request.outputPath = out;
        request.config = default_config();
        request.resources.push_back({dir.create_file("x/one.txt", "1"), "sub/one.txt", false});
        REQUIRE_FALSE(pack_archive(request, nullptr, &err));
        REQUIRE(err.kind == ErrorKind::Validation);
    }

    SECTION("display name with a drive prefix") {
        PackRequest request;
        request.templatePath = stub;
        request.outputPath = out;
        request.config = default_config();
        request.resources.push_back({dir.create_file("x/one.txt", "1"), "D:one.txt", false});
        REQUIRE_FALSE(pack_archive(request, nullptr, &err));
        REQUIRE(err.kind == ErrorKind::Validation);
    }

    SECTION("empty extraction path spec") {
        ArchiveConfig config;
        REQUIRE_FALSE(pack_files(stub, out, dir, {{"a.txt", "1"}}, config, {}, nullptr, &err));
        REQUIRE(err.kind == ErrorKind::Validation);
    }

    SECTION("no resources") {
        PackRequest request;
        request.templatePath = stub;
        request.outputPath = out;
        request.config = default_config();
        REQUIRE_FALSE(pack_archive(request, nullptr, &err));
        REQUIRE(err.kind == ErrorKind::Validation);
    }

    SECTION("missing template") {
        REQUIRE_FALSE(pack_files(dir.path() / "nope", out, dir, {{"a.txt", "1"}}, default_config(), {}, nullptr, &err));
        REQUIRE(err.kind == ErrorKind::TemplateRead);
    }

    SECTION("missing source names the file") {
        PackRequest request;
        request.templatePath = stub;
        request.outputPath = out;
        request.config = default_config();
        request.resources.push_back({dir.create_file("x/one.txt", "1"), "", false});
        request.resources.push_back({dir.path() / "missing.txt", "", false});
        REQUIRE_FALSE(pack_archive(request, nullptr, &err));
        REQUIRE(err.kind == ErrorKind::SourceRead);
        REQUIRE(err.message.find("missing.txt") != std::string::npos);
    }

    SECTION("template that already carries an archive") {
        REQUIRE(pack_files(stub, out, dir, {{"a.txt", "1"}}, default_config()));
        REQUIRE_FALSE(pack_files(out, dir.path() / "nested.bin", dir, {{"b.txt", "2"}}, default_config(), {}, nullptr, &err));
        REQUIRE(err.kind == ErrorKind::Validation);
        REQUIRE_FALSE(fs::exists(dir.path() / "nested.bin"));
        return;
    }

    REQUIRE_FALSE(fs::exists(out));
}

TEST_CASE("Failed pack leaves no output behind", "[archive][io]") {
    TempDir dir;
    const fs::path stub = make_template(dir);
    const fs::path good = dir.create_file("good.txt", "ok");
    const fs::path out = dir.path() / "out.bin";

    const std::size_t before = dir.entry_count();

    PackRequest request;
    request.templatePath = stub;
    request.outputPath = out;
    request.config = default_config();
    request.resources.push_back({good, "", false});
    request.resources.push_back({dir.path() / "missing.txt", "", false});

    ArchiveError err;
    REQUIRE_FALSE(pack_archive(request, nullptr, &err));
    REQUIRE_FALSE(fs::exists(out));
    // No leftover temporary file either.
    REQUIRE(dir.entry_count() == before);

    SECTION("an existing output is left untouched") {
        write_bytes(out, {1, 2, 3});
        REQUIRE_FALSE(pack_archive(request, nullptr, &err));
        REQUIRE(read_bytes(out) == std::vector<std::uint8_t>{1, 2, 3});
    }
}

TEST_CASE("Successful pack replaces an existing output", "[archive][io]") {
    TempDir dir;
    const fs::path stub = make_template(dir);
    const fs::path out = dir.path() / "out.bin";
    write_bytes(out, {9, 9, 9});

    REQUIRE(pack_files(stub, out, dir, {{"a.txt", "1"}}, default_config()));

    ArchiveReader reader;
    ArchiveError err;
    REQUIRE(reader.open(out, &err) == ArchiveReader::OpenResult::Packaged);

#if !defined(_WIN32)
    const auto perms = fs::status(out).permissions();
    REQUIRE((perms & fs::perms::owner_exec) != fs::perms::none);
#endif
}

TEST_CASE("ArchiveWriter cancel removes the partial output", "[archive][io]") {
    TempDir dir;
    const fs::path stub = make_template(dir);
    const std::size_t before = dir.entry_count();

    ArchiveWriter writer;
    ArchiveError err;
    REQUIRE(writer.begin(stub, dir.path() / "out.bin", &err));
    REQUIRE(writer.add_file("a.txt", repeated_bytes(10), false, &err));
    REQUIRE(dir.entry_count() == before + 1);

    writer.cancel();
    REQUIRE(dir.entry_count() == before);
}

// ============================================================================
// Reader
// ============================================================================

TEST_CASE("Reader treats a plain template as not packaged", "[archive][io]") {
    TempDir dir;
    ArchiveReader reader;
    ArchiveError err;

    SECTION("regular template") {
        REQUIRE(reader.open(make_template(dir), &err) == ArchiveReader::OpenResult::NotPackaged);
    }
    SECTION("file shorter than the footer") {
        REQUIRE(reader.open(make_template(dir, 5), &err) == ArchiveReader::OpenResult::NotPackaged);
    }
    SECTION("empty file") {
        REQUIRE(reader.open(make_template(dir, 0), &err) == ArchiveReader::OpenResult::NotPackaged);
    }

    REQUIRE(err.ok());
    REQUIRE_FALSE(reader.is_open());
}

TEST_CASE("Reader rejects damaged archives", "[archive][io]") {
    TempDir dir;
    const fs::path stub = make_template(dir);
    const fs::path out = dir.path() / "packed.bin";
    REQUIRE(pack_files(stub, out, dir, {{"a.txt", "alpha"}, {"b.txt", "beta"}}, default_config(), "b.txt"));

    auto image = read_bytes(out);
    const std::size_t footerPos = image.size() - FOOTER_SIZE;

    Footer footer;
    REQUIRE(decode_footer(std::span<const std::uint8_t>(image.data() + footerPos, FOOTER_SIZE), &footer) ==
            FooterStatus::Valid);

    ArchiveReader reader;
    ArchiveError err;

    SECTION("one byte removed from the table") {
        image.erase(image.begin() + static_cast<std::ptrdiff_t>(footer.tableOffset + 5));
        write_bytes(out, image);
        REQUIRE(reader.open(out, &err) == ArchiveReader::OpenResult::Failed);
        REQUIRE(err.kind == ErrorKind::CorruptArchive);
    }

    SECTION("unknown format version") {
        image[footerPos + 8] = 2;
        write_bytes(out, image);
        REQUIRE(reader.open(out, &err) == ArchiveReader::OpenResult::Failed);
        REQUIRE(err.kind == ErrorKind::UnsupportedFormat);
    }

    SECTION("table offset past the end") {
        image[footerPos + 16 + 7] = 0x7F;
        write_bytes(out, image);
        REQUIRE(reader.open(out, &err) == ArchiveReader::OpenResult::Failed);
        REQUIRE(err.kind == ErrorKind::CorruptArchive);
    }

    SECTION("payload offset inside the table") {
        // First entry: magic(4) count(4) len(2) "a.txt"(5) then payload_offset.
        const std::size_t offsetPos = footer.tableOffset + 4 + 4 + 2 + 5;
        image[offsetPos + 0] = static_cast<std::uint8_t>(footer.tableOffset & 0xFF);
        image[offsetPos + 1] = static_cast<std::uint8_t>((footer.tableOffset >> 8) & 0xFF);
        image[offsetPos + 2] = static_cast<std::uint8_t>((footer.tableOffset >> 16) & 0xFF);
        image[offsetPos + 3] = static_cast<std::uint8_t>((footer.tableOffset >> 24) & 0xFF);
        write_bytes(out, image);
        REQUIRE(reader.open(out, &err) == ArchiveReader::OpenResult::Failed);
        REQUIRE(err.kind == ErrorKind::CorruptArchive);
    }

    SECTION("missing file") {
        REQUIRE(reader.open(dir.path() / "nope.bin", &err) == ArchiveReader::OpenResult::Failed);
    }

    REQUIRE_FALSE(reader.is_open());
}

TEST_CASE("Reader reports undecodable payloads per entry", "[archive][io]") {
    TempDir dir;
    const fs::path stub = make_template(dir);
    const fs::path out = dir.path() / "packed.bin";
    ZlibTransform zlib;
    REQUIRE(pack_files(stub, out, dir, {{"text.txt", std::string(5000, 'q')}}, default_config(), {}, &zlib));

    ArchiveReader reader;
    ArchiveError err;
    REQUIRE(reader.open(out, &err) == ArchiveReader::OpenResult::Packaged);
    const ResourceEntry entry = reader.table().entries[0];
    REQUIRE(entry.transformed);
    reader.close();

    // Scramble the stored stream; the table stays valid.
    auto image = read_bytes(out);
    for (std::uint64_t i = 2; i < entry.payloadLength; ++i) {
        image[entry.payloadOffset + i] ^= 0x5A;
    }
    write_bytes(out, image);

    REQUIRE(reader.open(out, &err) == ArchiveReader::OpenResult::Packaged);
    std::vector<std::uint8_t> data;
    REQUIRE_FALSE(reader.read_payload(reader.table().entries[0], zlib, data, &err));
    REQUIRE(err.kind == ErrorKind::Extraction);
    REQUIRE(err.message.find("text.txt") != std::string::npos);
}
