#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <unordered_map>
#include "raster.hpp"
#include "types/result.hpp"

namespace cogstream {

/// Decoder for tile formats that are complete images on their own
/// (JPEG, WebP, LERC, JPEG 2000), as opposed to byte-stream compressors.
///
/// Implementations receive the raw tile bytes (for JPEG, already merged with
/// the IFD's JPEGTables) and must return a buffer of shape
/// (height, width, samples). decode() may be called from several threads at once.
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;

    [[nodiscard]] virtual Result<RasterBuffer> decode(
        std::span<const std::byte> bytes,
        uint32_t width,
        uint32_t height,
        uint16_t samples) const = 0;
};

/// Image decoders registered per Compression tag value
using ImageDecoderRegistry = std::unordered_map<uint16_t, std::shared_ptr<const ImageDecoder>>;

} // namespace cogstream
