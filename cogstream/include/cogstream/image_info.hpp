#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "ifd.hpp"
#include "raster.hpp"
#include "types/result.hpp"
#include "types/tiff_spec.hpp"

namespace cogstream {

/// Validated raster layout of one IFD: everything needed to locate and decode its chunks.
/// A chunk is a tile, or a strip of a non-tiled image (one column of full-width chunks).
struct ImageInfo {
    uint64_t width{0};
    uint64_t height{0};
    uint64_t chunk_width{0};
    uint64_t chunk_height{0};
    uint64_t chunks_across{0};
    uint64_t chunks_down{0};
    bool tiled{true};

    uint16_t samples_per_pixel{1};
    uint16_t bits_per_sample{8};
    SampleFormat sample_format{SampleFormat::UnsignedInt};
    DataType dtype{DataType::UInt8};
    uint16_t compression{1};
    Predictor predictor{Predictor::None};
    PlanarConfiguration planar{PlanarConfiguration::Chunky};
    std::optional<uint16_t> photometric;
    uint32_t subfile_type{0};

    std::vector<uint64_t> chunk_offsets;
    std::vector<uint64_t> chunk_byte_counts;
    std::vector<uint8_t> jpeg_tables;
    std::optional<double> nodata;

    /// Largest decoded chunk accepted, in bytes
    static constexpr uint64_t max_chunk_bytes = uint64_t{1} << 30;

    /// Extract and validate the layout of an IFD.
    /// Inconsistent chunk arrays are InvalidTiff; unsupported sample layouts are UnsupportedFeature.
    [[nodiscard]] static Result<ImageInfo> from_ifd(const Ifd& ifd);

    [[nodiscard]] bool is_planar() const noexcept {
        return planar == PlanarConfiguration::Planar && samples_per_pixel > 1;
    }

    /// Number of separately stored sample planes
    [[nodiscard]] uint16_t planes() const noexcept {
        return is_planar() ? samples_per_pixel : uint16_t{1};
    }

    /// Samples stored in one chunk
    [[nodiscard]] uint16_t samples_per_chunk() const noexcept {
        return is_planar() ? uint16_t{1} : samples_per_pixel;
    }

    [[nodiscard]] uint64_t chunks_per_plane() const noexcept {
        return chunks_across * chunks_down;
    }

    /// Index into the offset/byte-count arrays: plane * per_plane + row * across + col
    [[nodiscard]] uint64_t chunk_index(uint64_t col, uint64_t row, uint16_t plane = 0) const noexcept {
        return static_cast<uint64_t>(plane) * chunks_per_plane() + row * chunks_across + col;
    }

    /// Rows actually stored in chunk row `row`. Tiles are always full height;
    /// the last strip of a stripped image may be shorter.
    [[nodiscard]] uint64_t stored_rows(uint64_t row) const noexcept {
        if (tiled) {
            return chunk_height;
        }
        const uint64_t start = row * chunk_height;
        return start + chunk_height > height ? height - start : chunk_height;
    }

    [[nodiscard]] bool is_mask() const noexcept {
        return (subfile_type & subfile::TransparencyMask) != 0;
    }

    /// Uncompressed byte size of one chunk with `rows` rows (1-bit rows are byte padded)
    [[nodiscard]] uint64_t chunk_byte_size(uint64_t rows) const noexcept {
        const uint64_t row_samples = chunk_width * samples_per_chunk();
        const uint64_t row_bytes = bits_per_sample == 1 ? (row_samples + 7) / 8
                                                        : row_samples * (bits_per_sample / 8);
        return row_bytes * rows;
    }
};

inline Result<ImageInfo> ImageInfo::from_ifd(const Ifd& ifd) {
    ImageInfo info;

    auto width = ifd.image_width();
    if (!width) return width.error();
    auto height = ifd.image_height();
    if (!height) return height.error();
    info.width = width.value();
    info.height = height.value();
    if (info.width == 0 || info.height == 0) {
        return Err(Error::Code::InvalidTiff, "Empty image in IFD at offset " + std::to_string(ifd.offset()));
    }

    info.tiled = ifd.is_tiled();
    if (info.tiled) {
        auto tw = ifd.tile_width();
        if (!tw) return tw.error();
        auto th = ifd.tile_height();
        if (!th) return th.error();
        info.chunk_width = *tw.value();
        info.chunk_height = *th.value();
    } else {
        auto rows = ifd.uint_or(TagCode::RowsPerStrip, info.height);
        if (!rows) return rows.error();
        info.chunk_width = info.width;
        info.chunk_height = std::min(rows.value(), info.height);
    }
    if (info.chunk_width == 0 || info.chunk_height == 0) {
        return Err(Error::Code::InvalidTiff, "Zero tile or strip size in IFD at offset " + std::to_string(ifd.offset()));
    }
    if (info.chunk_width > std::numeric_limits<uint32_t>::max() ||
        info.chunk_height > std::numeric_limits<uint32_t>::max()) {
        return Err(Error::Code::InvalidTiff,
                   "Tile or strip size " + std::to_string(info.chunk_width) + "x" +
                   std::to_string(info.chunk_height) + " in IFD at offset " + std::to_string(ifd.offset()) +
                   " exceeds 32 bits");
    }
    info.chunks_across = info.width / info.chunk_width + (info.width % info.chunk_width != 0 ? 1 : 0);
    info.chunks_down = info.height / info.chunk_height + (info.height % info.chunk_height != 0 ? 1 : 0);

    auto spp = ifd.samples_per_pixel();
    if (!spp) return spp.error();
    info.samples_per_pixel = spp.value();
    if (info.samples_per_pixel == 0) {
        return Err(Error::Code::InvalidTiff, "SamplesPerPixel is 0");
    }

    auto bits = ifd.bits_per_sample();
    if (!bits) return bits.error();
    for (uint16_t b : bits.value()) {
        if (b != bits.value().front()) {
            return Err(Error::Code::UnsupportedFeature, "Samples with different BitsPerSample are not supported");
        }
    }
    info.bits_per_sample = bits.value().front();

    auto format = ifd.sample_format();
    if (!format) return format.error();
    info.sample_format = format.value();

    if (info.bits_per_sample == 1 && info.sample_format == SampleFormat::UnsignedInt) {
        // Bilevel data and internal masks, unpacked to one byte per sample
        info.dtype = DataType::UInt8;
    } else {
        auto dtype = data_type_from_tiff(info.sample_format, info.bits_per_sample);
        if (!dtype) return dtype.error();
        info.dtype = dtype.value();
    }

    auto compression = ifd.compression();
    if (!compression) return compression.error();
    info.compression = compression.value();

    auto predictor = ifd.predictor();
    if (!predictor) return predictor.error();
    info.predictor = predictor.value();

    auto planar = ifd.planar_configuration();
    if (!planar) return planar.error();
    info.planar = planar.value();

    auto photometric = ifd.photometric();
    if (!photometric) return photometric.error();
    info.photometric = photometric.value();

    auto subfile_type = ifd.new_subfile_type();
    if (!subfile_type) return subfile_type.error();
    info.subfile_type = subfile_type.value();

    if (info.bits_per_sample == 1 && info.samples_per_chunk() != 1) {
        return Err(Error::Code::UnsupportedFeature, "1-bit data is only supported with one sample per chunk");
    }

    // chunk_width < 2^32 and samples < 2^16, so one row never overflows
    const uint64_t row_bytes = info.chunk_byte_size(1);
    if (row_bytes > max_chunk_bytes / info.chunk_height) {
        return Err(Error::Code::MemoryError,
                   "Chunks of " + std::to_string(info.chunk_width) + "x" + std::to_string(info.chunk_height) +
                   " pixels in IFD at offset " + std::to_string(ifd.offset()) + " exceed the " +
                   std::to_string(max_chunk_bytes) + " byte limit");
    }
    if (info.chunks_across > std::numeric_limits<uint64_t>::max() / info.chunks_down / info.planes()) {
        return Err(Error::Code::InvalidTiff,
                   "Chunk grid of IFD at offset " + std::to_string(ifd.offset()) + " overflows");
    }

    auto offsets = ifd.uint_array(info.tiled ? TagCode::TileOffsets : TagCode::StripOffsets);
    if (!offsets) return offsets.error();
    auto counts = ifd.uint_array(info.tiled ? TagCode::TileByteCounts : TagCode::StripByteCounts);
    if (!counts) return counts.error();
    info.chunk_offsets = std::move(offsets.value());
    info.chunk_byte_counts = std::move(counts.value());

    const uint64_t expected_chunks = info.chunks_per_plane() * info.planes();
    if (info.chunk_offsets.size() < expected_chunks || info.chunk_byte_counts.size() < expected_chunks) {
        return Err(Error::Code::InvalidTiff,
                   "IFD at offset " + std::to_string(ifd.offset()) + " lists " +
                   std::to_string(info.chunk_offsets.size()) + " offsets and " +
                   std::to_string(info.chunk_byte_counts.size()) + " byte counts for " +
                   std::to_string(expected_chunks) + " chunks");
    }

    if (const Tag* tables = ifd.find(TagCode::JPEGTables)) {
        auto bytes = tables->as_bytes();
        if (!bytes) return bytes.error();
        info.jpeg_tables.assign(bytes.value().begin(), bytes.value().end());
    }

    auto nodata = ifd.nodata();
    if (!nodata) return nodata.error();
    info.nodata = nodata.value();

    return Ok(std::move(info));
}

} // namespace cogstream
