#include "transform.hpp"

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace sfxpack::archive {

namespace {

// Deflate cannot expand data by more than ~1032:1. Anything claiming more
// is a corrupt table, not a real payload.
constexpr std::uint64_t kMaxDeflateRatio = 1032;

std::string zlib_error(int code) {
    const char* text = zError(code);
    return std::string("zlib error ") + std::to_string(code) + (text ? std::string(" (") + text + ")" : "");
}

} // namespace

bool IdentityTransform::encode(std::span<const std::uint8_t> input,
                               std::vector<std::uint8_t>& output,
                               std::string* outError) const {
    (void)outError;
    output.assign(input.begin(), input.end());
    return true;
}

bool IdentityTransform::decode(std::span<const std::uint8_t> input,
                               std::uint64_t originalLength,
                               std::vector<std::uint8_t>& output,
                               std::string* outError) const {
    if (input.size() != originalLength) {
        if (outError) *outError = "identity payload length does not match original length";
        return false;
    }
    output.assign(input.begin(), input.end());
    return true;
}

ZlibTransform::ZlibTransform(int level)
    : level_(std::clamp(level, Z_NO_COMPRESSION, Z_BEST_COMPRESSION)) {
}

bool ZlibTransform::encode(std::span<const std::uint8_t> input,
                           std::vector<std::uint8_t>& output,
                           std::string* outError) const {
    if (input.size() > std::numeric_limits<uLong>::max()) {
        if (outError) *outError = "payload too large for zlib";
        return false;
    }

    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    output.resize(bound);

    const int result = compress2(output.data(), &bound,
                                 input.data(), static_cast<uLong>(input.size()),
                                 level_);
    if (result != Z_OK) {
        output.clear();
        if (outError) *outError = zlib_error(result);
        return false;
    }

    output.resize(bound);
    return true;
}

bool ZlibTransform::decode(std::span<const std::uint8_t> input,
                           std::uint64_t originalLength,
                           std::vector<std::uint8_t>& output,
                           std::string* outError) const {
    if (input.empty()) {
        if (outError) *outError = "empty compressed payload";
        return false;
    }

    if (originalLength > static_cast<std::uint64_t>(input.size()) * kMaxDeflateRatio ||
        originalLength > std::numeric_limits<uLongf>::max()) {
        if (outError) *outError = "original length " + std::to_string(originalLength) +
                                  " is implausible for " + std::to_string(input.size()) +
                                  " compressed bytes";
        return false;
    }

    output.resize(static_cast<std::size_t>(originalLength));
    uLongf size = static_cast<uLongf>(originalLength);

    // uncompress() rejects a null destination even for zero-length output.
    Bytef empty = 0;
    Bytef* dest = output.empty() ? &empty : output.data();

    const int result = uncompress(dest, &size, input.data(), static_cast<uLong>(input.size()));
    if (result != Z_OK) {
        output.clear();
        if (outError) *outError = zlib_error(result);
        return false;
    }

    if (size != originalLength) {
        output.clear();
        if (outError) *outError = "decoded " + std::to_string(size) + " bytes, expected " +
                                  std::to_string(originalLength);
        return false;
    }

    return true;
}

std::unique_ptr<IPayloadTransform> make_default_transform(int level) {
    return std::make_unique<ZlibTransform>(level);
}

} // namespace sfxpack::archive
