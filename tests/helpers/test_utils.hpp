#pragma once

/**
 * @file test_utils.hpp
 * @brief Common test utilities and helpers.
 */

#include "archive/archive_writer.hpp"
#include "platform/utf8_path.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace test_helpers {

namespace fs = std::filesystem;

// =============================================================================
// Filesystem helpers
// =============================================================================

/** @brief Scratch directory removed on destruction. */
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "sfxpack_test") {
        std::random_device rd;
        path_ = fs::temp_directory_path() / (prefix + "_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

    fs::path create_file(const std::string& relativePath, const std::string& content) {
        return create_file(relativePath, std::vector<std::uint8_t>(content.begin(), content.end()));
    }

    fs::path create_file(const std::string& relativePath, const std::vector<std::uint8_t>& content) {
        fs::path fullPath = path_ / sfxpack::platform::path_from_utf8(relativePath);
        fs::create_directories(fullPath.parent_path());
        std::ofstream ofs(fullPath, std::ios::binary | std::ios::trunc);
        ofs.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        return fullPath;
    }

    /** @brief Count directory entries (used to check no temp files are left behind). */
    std::size_t entry_count() const {
        std::size_t n = 0;
        for (const auto& entry : fs::directory_iterator(path_)) {
            (void)entry;
            ++n;
        }
        return n;
    }

private:
    fs::path path_;
};

/** @brief Whole file as bytes; empty if missing. */
inline std::vector<std::uint8_t> read_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::string read_text(const fs::path& path) {
    const auto bytes = read_bytes(path);
    return std::string(bytes.begin(), bytes.end());
}

inline void write_bytes(const fs::path& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

// =============================================================================
// Data helpers
// =============================================================================

/** @brief Deterministic pseudo-random bytes (poorly compressible). */
inline std::vector<std::uint8_t> noise_bytes(std::size_t size, std::uint32_t seed = 1) {
    std::mt19937 rng(seed);
    std::vector<std::uint8_t> out(size);
    for (auto& b : out) {
        b = static_cast<std::uint8_t>(rng() & 0xFF);
    }
    return out;
}

/** @brief Highly compressible bytes. */
inline std::vector<std::uint8_t> repeated_bytes(std::size_t size, std::uint8_t value = 'A') {
    return std::vector<std::uint8_t>(size, value);
}

/** @brief Stand-in for the stub executable: arbitrary bytes with no footer. */
inline fs::path make_template(TempDir& dir, std::size_t size = 4096, const std::string& name = "stub.bin") {
    return dir.create_file(name, noise_bytes(size, 42));
}

/**
 * @brief Pack `files` (display name, content) into `output` using `templatePath`.
 *
 * @return true on success; error details in outError.
 */
inline bool pack_files(const fs::path& templatePath,
                       const fs::path& output,
                       TempDir& sources,
                       const std::vector<std::pair<std::string, std::string>>& files,
                       const sfxpack::archive::ArchiveConfig& config,
                       const std::string& mainName = {},
                       const sfxpack::archive::IPayloadTransform* transform = nullptr,
                       sfxpack::archive::ArchiveError* outError = nullptr) {
    sfxpack::archive::PackRequest request;
    request.templatePath = templatePath;
    request.outputPath = output;
    request.config = config;
    request.transform = transform;

    for (const auto& [name, content] : files) {
        sfxpack::archive::ResourceInput input;
        input.sourcePath = sources.create_file("src/" + name, content);
        input.displayName = name;
        input.main = (name == mainName);
        request.resources.push_back(std::move(input));
    }

    return sfxpack::archive::pack_archive(request, nullptr, outError);
}

} // namespace test_helpers
