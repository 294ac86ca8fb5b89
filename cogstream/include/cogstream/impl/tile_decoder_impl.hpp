// This file contains the implementation of TileDecoder.
// Do not include this file directly - it is included by tile_decoder.hpp

#pragma once

#include <cstring>
#include <span>
#include <string>
#include <vector>
#include "../decoders/jpeg_decoder.hpp"
#include "../predictor.hpp"
#include "../types/result.hpp"

#ifndef COGSTREAM_TILE_DECODER_HEADER
#include "../tile_decoder.hpp" // for linters
#endif

namespace cogstream {

// ============================================================================
// Helpers
// ============================================================================

inline std::vector<std::byte> merge_jpeg_tables(
    std::span<const uint8_t> tables,
    std::span<const std::byte> tile) {

    const bool tile_has_soi = tile.size() >= 2 && tile[0] == std::byte{0xFF} && tile[1] == std::byte{0xD8};
    if (tables.size() < 4 || !tile_has_soi) {
        return std::vector<std::byte>(tile.begin(), tile.end());
    }

    std::size_t table_size = tables.size();
    if (tables[table_size - 2] == 0xFF && tables[table_size - 1] == 0xD9) {
        table_size -= 2;
    }

    std::vector<std::byte> merged;
    merged.reserve(table_size + tile.size() - 2);
    for (std::size_t i = 0; i < table_size; ++i) {
        merged.push_back(static_cast<std::byte>(tables[i]));
    }
    merged.insert(merged.end(), tile.begin() + 2, tile.end());
    return merged;
}

inline void unpack_bilevel(
    std::span<const std::byte> packed,
    std::span<std::byte> unpacked,
    std::size_t width,
    std::size_t rows) {

    const std::size_t packed_row = (width + 7) / 8;
    for (std::size_t y = 0; y < rows; ++y) {
        const std::byte* src = packed.data() + y * packed_row;
        std::byte* dst = unpacked.data() + y * width;
        for (std::size_t x = 0; x < width; ++x) {
            const auto bits = static_cast<uint8_t>(src[x / 8]);
            dst[x] = static_cast<std::byte>((bits >> (7 - x % 8)) & 1);
        }
    }
}

// ============================================================================
// TileDecoder
// ============================================================================

template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
bool TileDecoder<DecompSpec>::supports(uint16_t compression) const noexcept {
    if (DecompressorStorage<DecompSpec>::supports(compression)) {
        return true;
    }
    if (image_decoders_ && image_decoders_->contains(compression)) {
        return true;
    }
    return compression == static_cast<uint16_t>(CompressionScheme::JPEG);
}

template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
Result<RasterBuffer> TileDecoder<DecompSpec>::finish(
    std::vector<std::byte> bytes,
    const TileDecodeParams& params) {

    const std::size_t full_size = static_cast<std::size_t>(params.tile_height) * params.tile_width *
                                  params.samples_per_pixel * data_type_size(params.dtype);
    if (bytes.size() < full_size) {
        bytes.resize(full_size, std::byte{0});
    }
    return RasterBuffer::from_bytes(params.dtype, params.tile_height, params.tile_width,
                                    params.samples_per_pixel, std::move(bytes));
}

template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
Result<RasterBuffer> TileDecoder<DecompSpec>::decode_image(
    std::span<const std::byte> raw,
    const TileDecodeParams& params) const {

    const bool is_jpeg = params.compression == static_cast<uint16_t>(CompressionScheme::JPEG);

    const ImageDecoder* decoder = nullptr;
    if (image_decoders_) {
        auto it = image_decoders_->find(params.compression);
        if (it != image_decoders_->end() && it->second) {
            decoder = it->second.get();
        }
    }
    JpegDecoder fallback(params.photometric);
    if (!decoder && is_jpeg) {
        decoder = &fallback;
    }
    if (!decoder) {
        return Err(Error::Code::UnsupportedCompression,
                   "No image decoder registered for compression " +
                   std::string(compression_name(params.compression)) + " (" +
                   std::to_string(params.compression) + ")");
    }

    Result<RasterBuffer> decoded = Err(Error::Code::CorruptTile);
    if (is_jpeg && !params.jpeg_tables.empty()) {
        const auto merged = merge_jpeg_tables(params.jpeg_tables, raw);
        decoded = decoder->decode(merged, params.tile_width, params.rows(), params.samples_per_pixel);
    } else {
        decoded = decoder->decode(raw, params.tile_width, params.rows(), params.samples_per_pixel);
    }
    if (!decoded) {
        return decoded.error();
    }

    RasterBuffer& image = decoded.value();
    if (image.dtype() != params.dtype || image.width() != params.tile_width ||
        image.height() != params.rows() || image.samples() != params.samples_per_pixel) [[unlikely]] {
        return Err(Error::Code::CorruptTile,
                   "Image decoder returned " + std::to_string(image.height()) + "x" +
                   std::to_string(image.width()) + "x" + std::to_string(image.samples()) + " " +
                   std::string(data_type_name(image.dtype())) + ", expected " +
                   std::to_string(params.rows()) + "x" + std::to_string(params.tile_width) + "x" +
                   std::to_string(params.samples_per_pixel) + " " +
                   std::string(data_type_name(params.dtype)));
    }
    if (params.rows() == params.tile_height) {
        return decoded;
    }
    auto bytes = image.bytes();
    return finish(std::vector<std::byte>(bytes.begin(), bytes.end()), params);
}

template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
Result<RasterBuffer> TileDecoder<DecompSpec>::decode_stream(
    std::span<const std::byte> raw,
    const TileDecodeParams& params) const {

    const std::size_t rows = params.rows();
    const std::size_t expected = params.stored_row_size() * rows;

    std::vector<std::byte> stored(expected);
    auto produced = decompressors_.decompress(stored, raw, params.compression);
    if (!produced) {
        return produced.error();
    }
    if (produced.value() != expected) {
        return Err(Error::Code::CorruptTile,
                   "Decompressed " + std::to_string(produced.value()) + " bytes, expected " +
                   std::to_string(expected) + " for a " + std::to_string(params.tile_width) + "x" +
                   std::to_string(rows) + " chunk");
    }

    if (params.bits_per_sample == 1) {
        if (params.predictor != Predictor::None) {
            return Err(Error::Code::UnsupportedFeature, "Predictor on 1-bit samples");
        }
        std::vector<std::byte> unpacked(static_cast<std::size_t>(params.tile_width) * params.samples_per_pixel * rows);
        unpack_bilevel(stored, unpacked, static_cast<std::size_t>(params.tile_width) * params.samples_per_pixel, rows);
        return finish(std::move(unpacked), params);
    }

    // The floating point predictor works on byte planes stored most significant first,
    // so its output is already native; everything else is swapped first.
    const std::size_t sample_size = params.bits_per_sample / 8;
    if (params.predictor != Predictor::FloatingPoint &&
        params.byte_order != native_byte_order() && sample_size > 1) {
        swap_samples_in_place(stored, sample_size);
    }

    auto undone = predictor::undo(params.predictor, stored, params.tile_width, rows,
                                  params.samples_per_pixel, params.bits_per_sample);
    if (!undone) {
        return undone.error();
    }
    return finish(std::move(stored), params);
}

template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
Result<RasterBuffer> TileDecoder<DecompSpec>::decode(
    std::span<const std::byte> raw,
    const TileDecodeParams& params) const {

    if (params.tile_width == 0 || params.tile_height == 0 || params.samples_per_pixel == 0) [[unlikely]] {
        return Err(Error::Code::InvalidState, "Empty tile geometry");
    }
    if (params.rows() > params.tile_height) [[unlikely]] {
        return Err(Error::Code::InvalidState, "Stored rows exceed the tile height");
    }

    if (is_image_format_compression(params.compression) ||
        (image_decoders_ && image_decoders_->contains(params.compression))) {
        return decode_image(raw, params);
    }
    if (!DecompressorStorage<DecompSpec>::supports(params.compression)) {
        return Err(Error::Code::UnsupportedCompression,
                   "Compression " + std::string(compression_name(params.compression)) + " (" +
                   std::to_string(params.compression) + ") is not supported");
    }
    return decode_stream(raw, params);
}

} // namespace cogstream
