#pragma once

/**
 * @file tile_decoder.hpp
 * @brief Decoding of stored tiles and strips into RasterBuffers
 *
 * TileDecoder runs the whole per-chunk pipeline:
 * 1. Image-format tiles (JPEG, LERC, WebP, JPEG 2000) go to a registered
 *    ImageDecoder; JPEG tiles are first merged with the IFD's JPEGTables.
 * 2. Byte-stream compressions (none, PackBits, LZW, Deflate, ZSTD) are
 *    decompressed and the result length is checked against the chunk size.
 * 3. Multi-byte samples are swapped from file to native byte order.
 * 4. The predictor is reversed.
 * 5. 1-bit samples are unpacked to one byte each (0 or 1).
 *
 * The output always has shape (tile_height, tile_width, samples). A last strip
 * shorter than the strip height is padded with zero rows.
 *
 * @note NOT thread-safe (a decompressor may keep a context): use one TileDecoder per task
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "decompressors/decompressor_base.hpp"
#include "decompressors/decompressor_deflate.hpp"
#include "decompressors/decompressor_standard.hpp"
#ifdef COGSTREAM_HAVE_ZSTD
#include "decompressors/decompressor_zstd.hpp"
#endif
#include "image_decoder.hpp"
#include "image_info.hpp"
#include "raster.hpp"
#include "types/byte_order.hpp"
#include "types/result.hpp"
#include "types/tiff_spec.hpp"

namespace cogstream {

/// Byte-stream decompressors compiled into the library
#ifdef COGSTREAM_HAVE_ZSTD
using StandardDecompressors = DecompressorSpec<
    NoneDecompressorDesc,
    PackBitsDecompressorDesc,
    LzwDecompressorDesc,
    DeflateDecompressorDesc,
    ZstdDecompressorDesc>;
#else
using StandardDecompressors = DecompressorSpec<
    NoneDecompressorDesc,
    PackBitsDecompressorDesc,
    LzwDecompressorDesc,
    DeflateDecompressorDesc>;
#endif

/// Compression values whose tiles are self-contained images
[[nodiscard]] constexpr bool is_image_format_compression(uint16_t compression) noexcept {
    switch (static_cast<CompressionScheme>(compression)) {
        case CompressionScheme::JPEG:
        case CompressionScheme::JPEG2000:
        case CompressionScheme::LERC:
        case CompressionScheme::WEBP:
        case CompressionScheme::JXL:
            return true;
        default:
            return false;
    }
}

/// Everything needed to decode one chunk
struct TileDecodeParams {
    uint16_t compression{1};
    Predictor predictor{Predictor::None};
    uint16_t bits_per_sample{8};
    SampleFormat sample_format{SampleFormat::UnsignedInt};
    DataType dtype{DataType::UInt8};
    uint16_t samples_per_pixel{1};       ///< samples stored in this chunk (1 for planar data)
    uint32_t tile_width{0};
    uint32_t tile_height{0};
    uint32_t stored_rows{0};             ///< rows actually stored, 0 meaning tile_height
    ByteOrder byte_order{ByteOrder::LittleEndian};
    std::span<const uint8_t> jpeg_tables;
    std::optional<uint16_t> photometric;

    /// Parameters for chunk row `chunk_row` of an image
    [[nodiscard]] static TileDecodeParams for_chunk(const ImageInfo& info, ByteOrder order, uint64_t chunk_row) noexcept {
        TileDecodeParams params;
        params.compression = info.compression;
        params.predictor = info.predictor;
        params.bits_per_sample = info.bits_per_sample;
        params.sample_format = info.sample_format;
        params.dtype = info.dtype;
        params.samples_per_pixel = info.samples_per_chunk();
        params.tile_width = static_cast<uint32_t>(info.chunk_width);
        params.tile_height = static_cast<uint32_t>(info.chunk_height);
        params.stored_rows = static_cast<uint32_t>(info.stored_rows(chunk_row));
        params.byte_order = order;
        params.jpeg_tables = info.jpeg_tables;
        params.photometric = info.photometric;
        return params;
    }

    [[nodiscard]] uint32_t rows() const noexcept {
        return stored_rows == 0 ? tile_height : stored_rows;
    }

    /// Stored bytes per row (1-bit rows are padded to a whole byte)
    [[nodiscard]] std::size_t stored_row_size() const noexcept {
        const std::size_t row_samples = static_cast<std::size_t>(tile_width) * samples_per_pixel;
        return bits_per_sample == 1 ? (row_samples + 7) / 8 : row_samples * (bits_per_sample / 8);
    }
};

/// Build a complete JPEG stream from an abbreviated tile and the shared JPEGTables:
/// the tables without their EOI marker followed by the tile without its SOI marker.
/// Returns the tile unchanged when there are no usable tables.
[[nodiscard]] inline std::vector<std::byte> merge_jpeg_tables(
    std::span<const uint8_t> tables,
    std::span<const std::byte> tile);

/// Unpack MSB-first 1-bit samples, rows padded to a byte, to one byte (0 or 1) per sample
inline void unpack_bilevel(
    std::span<const std::byte> packed,
    std::span<std::byte> unpacked,
    std::size_t width,
    std::size_t rows);

template <typename DecompSpec = StandardDecompressors>
    requires ValidDecompressorSpec<DecompSpec>
class TileDecoder {
private:
    DecompressorStorage<DecompSpec> decompressors_;
    const ImageDecoderRegistry* image_decoders_{nullptr};

    [[nodiscard]] Result<RasterBuffer> decode_image(
        std::span<const std::byte> raw,
        const TileDecodeParams& params) const;

    [[nodiscard]] Result<RasterBuffer> decode_stream(
        std::span<const std::byte> raw,
        const TileDecodeParams& params) const;

    /// Pad a decoded chunk of params.rows() rows to the full tile height
    [[nodiscard]] static Result<RasterBuffer> finish(
        std::vector<std::byte> bytes,
        const TileDecodeParams& params);

public:
    /// @param image_decoders Registry for image-format compressions; must outlive the decoder.
    ///        JPEG falls back to JpegDecoder when the registry has no entry for it.
    explicit TileDecoder(const ImageDecoderRegistry* image_decoders = nullptr) noexcept
        : image_decoders_(image_decoders) {}

    TileDecoder(const TileDecoder&) = delete;
    TileDecoder& operator=(const TileDecoder&) = delete;
    TileDecoder(TileDecoder&&) noexcept = default;
    TileDecoder& operator=(TileDecoder&&) noexcept = default;

    /// Whether tiles with this compression can be decoded
    [[nodiscard]] bool supports(uint16_t compression) const noexcept;

    /**
     * @brief Decode one stored chunk
     *
     * @retval Error::Code::UnsupportedCompression No decompressor or image decoder for the compression
     * @retval Error::Code::CorruptTile The stream is malformed or does not produce exactly one chunk
     * @retval Error::Code::UnsupportedFeature Unsupported predictor / sample size combination
     */
    [[nodiscard]] Result<RasterBuffer> decode(
        std::span<const std::byte> raw,
        const TileDecodeParams& params) const;
};

} // namespace cogstream

#define COGSTREAM_TILE_DECODER_HEADER
#include "impl/tile_decoder_impl.hpp"
