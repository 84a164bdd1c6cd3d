#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace sfxpack::archive {

// Reversible byte-stream transform applied to stored payloads.
// The archive only records whether an entry went through the transform, so
// implementations are interchangeable without a format version bump.
class IPayloadTransform {
public:
    virtual ~IPayloadTransform() = default;

    virtual const char* name() const = 0;

    // @return true on success; on failure fills outError (if provided).
    virtual bool encode(std::span<const std::uint8_t> input,
                        std::vector<std::uint8_t>& output,
                        std::string* outError) const = 0;

    // Output must be exactly `originalLength` bytes or decoding fails.
    virtual bool decode(std::span<const std::uint8_t> input,
                        std::uint64_t originalLength,
                        std::vector<std::uint8_t>& output,
                        std::string* outError) const = 0;
};

// Stores bytes unchanged.
class IdentityTransform final : public IPayloadTransform {
public:
    const char* name() const override { return "identity"; }

    bool encode(std::span<const std::uint8_t> input,
                std::vector<std::uint8_t>& output,
                std::string* outError) const override;

    bool decode(std::span<const std::uint8_t> input,
                std::uint64_t originalLength,
                std::vector<std::uint8_t>& output,
                std::string* outError) const override;
};

// zlib deflate stream (compress2 / uncompress).
class ZlibTransform final : public IPayloadTransform {
public:
    static constexpr int kDefaultLevel = 6;

    explicit ZlibTransform(int level = kDefaultLevel);

    const char* name() const override { return "zlib"; }
    int level() const { return level_; }

    bool encode(std::span<const std::uint8_t> input,
                std::vector<std::uint8_t>& output,
                std::string* outError) const override;

    bool decode(std::span<const std::uint8_t> input,
                std::uint64_t originalLength,
                std::vector<std::uint8_t>& output,
                std::string* outError) const override;

private:
    int level_;
};

// The transform used for entries flagged as transformed.
std::unique_ptr<IPayloadTransform> make_default_transform(int level = ZlibTransform::kDefaultLevel);

} // namespace sfxpack::archive
