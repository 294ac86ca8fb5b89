// This file contains the implementation of CogReader.
// Do not include this file directly - it is included by cog_reader.hpp

#pragma once

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <new>
#include <string>
#include <vector>
#include "../types/result.hpp"

#ifndef COGSTREAM_COG_READER_HEADER
#include "../cog_reader.hpp" // for linters
#endif

namespace cogstream {

namespace detail {

inline const IfdChain& empty_ifd_chain() noexcept {
    static const IfdChain empty;
    return empty;
}

} // namespace detail

// ============================================================================
// Opening
// ============================================================================

template <ByteSource Source>
Result<std::shared_ptr<const typename CogReader<Source>::Dataset>> CogReader<Source>::load() const {
    logger_.debug("Opening COG, prefetching {} bytes", options_.header_chunk_size);

    auto directory = DirectoryReader<Source>::open(*source_, options_.header_chunk_size);
    if (!directory) {
        return directory.error();
    }
    const TiffLayout& layout = directory.value().layout();
    logger_.debug("{} {} stream of {} bytes, first IFD at offset {}",
                  layout.is_bigtiff() ? "BigTIFF" : "Classic TIFF",
                  layout.byte_order == ByteOrder::LittleEndian ? "little-endian" : "big-endian",
                  directory.value().stream_length(), layout.first_ifd_offset);

    auto chain = IfdChain::load(directory.value(), options_.max_ifds, logger_);
    if (!chain) {
        return chain.error();
    }
    auto pyramid = chain.value().check_pyramid(options_.decimation_tolerance, options_.tile_count_tolerance);
    if (!pyramid) {
        logger_.warn("Irregular overview pyramid: {}", pyramid.error().message);
    }

    auto georef = GeoKeyResolver::resolve(chain.value().level(0));
    if (!georef) {
        return georef.error();
    }
    if (!georef.value().transform) {
        logger_.debug("No geotransform in the full-resolution IFD");
    }

    Profile profile = Profile::from(chain.value().level_info(0), georef.value(), chain.value().decimations());
    logger_.debug("Opened {}x{} image, {} band(s) of {}, {} level(s), crs {}",
                  profile.width, profile.height, profile.count, data_type_name(profile.dtype),
                  chain.value().level_count(), profile.crs.value_or("none"));

    auto dataset = std::make_shared<const Dataset>(Dataset{
        std::move(directory.value()),
        std::move(chain.value()),
        std::move(georef.value()),
        std::move(profile)});
    return Ok(std::move(dataset));
}

template <ByteSource Source>
Result<void> CogReader<Source>::open() {
    ReaderState current = ReaderState::Unopened;
    if (!state_.compare_exchange_strong(current, ReaderState::Opening, std::memory_order_acq_rel)) {
        if (current == ReaderState::Closed) {
            return Err(Error::Code::InvalidState, "Reader is closed");
        }
    }

    const auto& result = dataset_.get_or_init([this]() { return load(); });

    ReaderState opening = ReaderState::Opening;
    state_.compare_exchange_strong(opening, result ? ReaderState::Ready : ReaderState::Failed,
                                   std::memory_order_acq_rel);
    if (!result) {
        logger_.debug("Open failed: {}", result.error().message);
        return result.error();
    }
    return Ok();
}

template <ByteSource Source>
void CogReader<Source>::close() noexcept {
    state_.store(ReaderState::Closed, std::memory_order_release);
    dataset_.reset();
    source_.reset();
}

template <ByteSource Source>
Result<const typename CogReader<Source>::Dataset*> CogReader<Source>::ready() const {
    switch (state_.load(std::memory_order_acquire)) {
        case ReaderState::Ready:
            return Ok(dataset_.get()->value().get());
        case ReaderState::Failed:
            return dataset_.get()->error();
        case ReaderState::Closed:
            return Err(Error::Code::InvalidState, "Reader is closed");
        case ReaderState::Unopened:
        case ReaderState::Opening:
            break;
    }
    return Err(Error::Code::InvalidState, "Reader is not open");
}

// ============================================================================
// Metadata
// ============================================================================

template <ByteSource Source>
Result<Profile> CogReader<Source>::profile() const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    return Ok(dataset.value()->profile);
}

template <ByteSource Source>
Result<Geotransform> CogReader<Source>::geotransform() const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    return dataset.value()->georef.geotransform();
}

template <ByteSource Source>
Result<Bounds> CogReader<Source>::bounds() const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    auto transform = dataset.value()->georef.geotransform();
    if (!transform) {
        return transform.error();
    }
    const ImageInfo& info = dataset.value()->chain.level_info(0);
    return Ok(transform_bounds(transform.value(), info.width, info.height));
}

template <ByteSource Source>
Result<std::optional<std::string>> CogReader<Source>::crs() const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    return Ok(dataset.value()->georef.crs());
}

template <ByteSource Source>
Result<std::optional<uint16_t>> CogReader<Source>::epsg() const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    return Ok(dataset.value()->georef.epsg);
}

template <ByteSource Source>
Result<std::vector<int>> CogReader<Source>::overviews() const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    return Ok(dataset.value()->profile.overviews);
}

template <ByteSource Source>
Result<GeoReference> CogReader<Source>::georeference() const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    return Ok(dataset.value()->georef);
}

template <ByteSource Source>
Result<Geotransform> CogReader<Source>::level_geotransform(std::size_t level) const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    const IfdChain& chain = dataset.value()->chain;
    if (level >= chain.level_count()) {
        return Err(Error::Code::OutOfRange,
                   "Level " + std::to_string(level) + " outside a pyramid of " +
                   std::to_string(chain.level_count()) + " levels");
    }
    auto transform = dataset.value()->georef.geotransform();
    if (!transform) {
        return transform.error();
    }
    const ImageInfo& full = chain.level_info(0);
    const ImageInfo& info = chain.level_info(level);
    return Ok(transform.value().scaled(static_cast<double>(full.width) / static_cast<double>(info.width),
                                       static_cast<double>(full.height) / static_cast<double>(info.height)));
}

template <ByteSource Source>
Result<std::size_t> CogReader<Source>::level_count() const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    return Ok(dataset.value()->chain.level_count());
}

template <ByteSource Source>
Result<std::pair<uint64_t, uint64_t>> CogReader<Source>::tile_count(std::size_t level) const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    const IfdChain& chain = dataset.value()->chain;
    if (level >= chain.level_count()) {
        return Err(Error::Code::OutOfRange,
                   "Level " + std::to_string(level) + " outside a pyramid of " +
                   std::to_string(chain.level_count()) + " levels");
    }
    const ImageInfo& info = chain.level_info(level);
    return Ok(std::pair<uint64_t, uint64_t>{info.chunks_across, info.chunks_down});
}

template <ByteSource Source>
Result<bool> CogReader<Source>::has_mask(std::size_t level) const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    return Ok(dataset.value()->chain.mask_info_for_level(level) != nullptr);
}

template <ByteSource Source>
std::size_t CogReader<Source>::source_reads() const noexcept {
    if (state() != ReaderState::Ready) {
        return 0;
    }
    const auto* cell = dataset_.get();
    if (!cell || !*cell) {
        return 0;
    }
    return cell->value()->directory.source_reads();
}

template <ByteSource Source>
const IfdChain* CogReader<Source>::ifd_chain() const noexcept {
    if (state() != ReaderState::Ready) {
        return nullptr;
    }
    const auto* cell = dataset_.get();
    if (!cell || !*cell) {
        return nullptr;
    }
    return &cell->value()->chain;
}

template <ByteSource Source>
IfdChain::const_iterator CogReader<Source>::begin() const noexcept {
    const IfdChain* chain = ifd_chain();
    return chain ? chain->begin() : detail::empty_ifd_chain().begin();
}

template <ByteSource Source>
IfdChain::const_iterator CogReader<Source>::end() const noexcept {
    const IfdChain* chain = ifd_chain();
    return chain ? chain->end() : detail::empty_ifd_chain().end();
}

// ============================================================================
// Tiles
// ============================================================================

template <ByteSource Source>
Result<RasterBuffer> CogReader<Source>::fetch_chunk(
    const Dataset& dataset,
    const ImageInfo& info,
    uint64_t col,
    uint64_t row,
    uint16_t plane) const {

    const uint64_t index = info.chunk_index(col, row, plane);
    const uint64_t offset = info.chunk_offsets[index];
    const uint64_t byte_count = info.chunk_byte_counts[index];

    if (byte_count == 0) {
        logger_.trace("Chunk {} is sparse", index);
        RasterBuffer sparse(info.dtype, info.chunk_height, info.chunk_width, info.samples_per_chunk());
        sparse.fill(info.nodata.value_or(dataset.profile.nodata.value_or(0.0)));
        return Ok(std::move(sparse));
    }
    if (!dataset.directory.contains(offset, byte_count)) [[unlikely]] {
        return Err(Error::Code::CorruptTile,
                   "Chunk " + std::to_string(index) + " at offset " + std::to_string(offset) + " with " +
                   std::to_string(byte_count) + " bytes extends past the end of the stream (" +
                   std::to_string(dataset.directory.stream_length()) + " bytes)");
    }

    logger_.trace("Fetching chunk {} ({} bytes at offset {})", index, byte_count, offset);
    auto raw = dataset.directory.read(offset, byte_count);
    if (!raw) {
        return raw.error();
    }

    TileDecoder<> decoder(&options_.image_decoders);
    auto params = TileDecodeParams::for_chunk(info, dataset.directory.byte_order(), row);
    Result<RasterBuffer> decoded = Err(Error::Code::MemoryError);
    try {
        decoded = decoder.decode(raw.value(), params);
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError,
                   "Chunk " + std::to_string(index) + ": out of memory decoding " +
                   std::to_string(info.chunk_byte_size(info.chunk_height)) + " bytes");
    }
    if (!decoded) {
        return decoded.error().with_context("Chunk " + std::to_string(index) + " at offset " + std::to_string(offset));
    }
    return decoded;
}

template <ByteSource Source>
Result<std::vector<RasterBuffer>> CogReader<Source>::fetch_chunks(
    const Dataset& dataset,
    const ImageInfo& info,
    const std::vector<std::pair<uint64_t, uint64_t>>& tiles,
    std::stop_token stop) const {

    const uint16_t planes = info.planes();
    std::vector<RasterBuffer> chunks(tiles.size() * planes);

    TaskGroup group(options_.max_concurrency);
    for (std::size_t t = 0; t < tiles.size(); ++t) {
        for (uint16_t p = 0; p < planes; ++p) {
            group.add([this, &dataset, &info, &tiles, &chunks, t, p, planes](std::stop_token) -> Result<void> {
                auto chunk = fetch_chunk(dataset, info, tiles[t].first, tiles[t].second, p);
                if (!chunk) {
                    return chunk.error();
                }
                chunks[t * planes + p] = std::move(chunk.value());
                return Ok();
            });
        }
    }

    logger_.trace("Fetching {} chunk(s) on up to {} thread(s)", group.size(), group.max_concurrency());
    auto run = group.run(stop);
    if (!run) {
        return run.error();
    }
    return Ok(std::move(chunks));
}

template <ByteSource Source>
Result<RasterBuffer> CogReader<Source>::read_tile(
    const Dataset& dataset,
    const ImageInfo& info,
    uint64_t col,
    uint64_t row) const {

    if (!info.is_planar()) {
        return fetch_chunk(dataset, info, col, row, 0);
    }

    std::vector<std::pair<uint64_t, uint64_t>> tiles;
    tiles.emplace_back(col, row);
    auto chunks = fetch_chunks(dataset, info, tiles, {});
    if (!chunks) {
        return chunks.error();
    }

    // Interleave the band planes
    const std::size_t sample_size = data_type_size(info.dtype);
    const std::size_t pixels = info.chunk_width * info.chunk_height;
    const uint16_t samples = info.samples_per_pixel;
    RasterBuffer tile(info.dtype, info.chunk_height, info.chunk_width, samples);
    std::byte* dst = tile.bytes().data();
    for (uint16_t p = 0; p < samples; ++p) {
        const std::byte* src = chunks.value()[p].bytes().data();
        for (std::size_t i = 0; i < pixels; ++i) {
            std::memcpy(dst + (i * samples + p) * sample_size, src + i * sample_size, sample_size);
        }
    }
    return Ok(std::move(tile));
}

template <ByteSource Source>
Result<RasterBuffer> CogReader<Source>::get_tile(std::size_t level, uint64_t col, uint64_t row) const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    const IfdChain& chain = dataset.value()->chain;
    if (level >= chain.level_count()) {
        return Err(Error::Code::OutOfRange,
                   "Level " + std::to_string(level) + " outside a pyramid of " +
                   std::to_string(chain.level_count()) + " levels");
    }
    const ImageInfo& info = chain.level_info(level);
    if (col >= info.chunks_across || row >= info.chunks_down) {
        return Err(Error::Code::OutOfRange,
                   "Tile (" + std::to_string(col) + ", " + std::to_string(row) + ") outside the " +
                   std::to_string(info.chunks_across) + "x" + std::to_string(info.chunks_down) +
                   " grid of level " + std::to_string(level));
    }
    logger_.trace("get_tile level {} col {} row {}", level, col, row);
    return read_tile(*dataset.value(), info, col, row);
}

template <ByteSource Source>
Result<RasterBuffer> CogReader<Source>::get_mask_tile(std::size_t level, uint64_t col, uint64_t row) const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    const ImageInfo* mask = dataset.value()->chain.mask_info_for_level(level);
    if (!mask) {
        return Err(Error::Code::OutOfRange, "Level " + std::to_string(level) + " has no transparency mask");
    }
    if (col >= mask->chunks_across || row >= mask->chunks_down) {
        return Err(Error::Code::OutOfRange,
                   "Mask tile (" + std::to_string(col) + ", " + std::to_string(row) + ") outside the " +
                   std::to_string(mask->chunks_across) + "x" + std::to_string(mask->chunks_down) +
                   " grid of level " + std::to_string(level));
    }
    if (mask->dtype != DataType::UInt8) {
        return Err(Error::Code::UnsupportedFeature,
                   "Mask of level " + std::to_string(level) + " stores " +
                   std::string(data_type_name(mask->dtype)) + " samples");
    }

    auto tile = read_tile(*dataset.value(), *mask, col, row);
    if (!tile) {
        return tile.error();
    }
    auto values = tile.value().template view<uint8_t>();
    if (!values) {
        return values.error();
    }
    for (uint8_t& v : values.value()) {
        v = v != 0 ? uint8_t{255} : uint8_t{0};
    }
    return tile;
}

// ============================================================================
// Window reads
// ============================================================================

template <ByteSource Source>
std::size_t CogReader<Source>::select_level(
    const Dataset& dataset,
    const Bounds& full_bounds,
    const Bounds& request,
    ReadShape shape) const {

    std::vector<LevelSize> sizes;
    sizes.reserve(dataset.chain.level_count());
    for (std::size_t k = 0; k < dataset.chain.level_count(); ++k) {
        const ImageInfo& info = dataset.chain.level_info(k);
        sizes.push_back(LevelSize{info.width, info.height});
    }
    return select_overview(sizes, full_bounds, request, shape.width, shape.height,
                           options_.resolution_tolerance);
}

template <ByteSource Source>
Result<std::size_t> CogReader<Source>::overview_for(const Bounds& bounds, ReadShape shape) const {
    auto dataset = ready();
    if (!dataset) {
        return dataset.error();
    }
    auto transform = dataset.value()->georef.geotransform();
    if (!transform) {
        return transform.error();
    }
    const ImageInfo& full = dataset.value()->chain.level_info(0);
    const Bounds full_bounds = transform_bounds(transform.value(), full.width, full.height);
    return Ok(select_level(*dataset.value(), full_bounds, bounds, shape));
}

template <ByteSource Source>
Result<RasterBuffer> CogReader<Source>::read(const Bounds& bounds, ReadShape shape, std::stop_token stop) const {
    auto ready_dataset = ready();
    if (!ready_dataset) {
        return ready_dataset.error();
    }
    const Dataset& dataset = *ready_dataset.value();

    if (shape.width == 0 || shape.height == 0) {
        return Err(Error::Code::OutOfRange, "Empty output shape");
    }
    if (!(bounds.width() > 0.0) || !(bounds.height() > 0.0)) {
        return Err(Error::Code::OutOfRange, "Empty or inverted window");
    }

    auto transform = dataset.georef.geotransform();
    if (!transform) {
        return transform.error();
    }
    if (transform.value().is_rotated()) {
        return Err(Error::Code::UnsupportedFeature, "Window reads on rotated rasters are not supported");
    }

    const ImageInfo& full = dataset.chain.level_info(0);
    const Bounds full_bounds = transform_bounds(transform.value(), full.width, full.height);
    if (!full_bounds.intersects(bounds)) {
        return Err(Error::Code::OutOfRange, "Window does not intersect the image");
    }

    const std::size_t level = select_level(dataset, full_bounds, bounds, shape);
    const ImageInfo& info = dataset.chain.level_info(level);
    const Geotransform level_transform = transform.value().scaled(
        static_cast<double>(full.width) / static_cast<double>(info.width),
        static_cast<double>(full.height) / static_cast<double>(info.height));
    auto inverse = level_transform.inverse();
    if (!inverse) {
        return inverse.error();
    }
    const Geotransform& to_pixel = inverse.value();
    logger_.trace("Window [{}, {}, {}, {}] at {}x{} reads level {} ({}x{})",
                  bounds.minx, bounds.miny, bounds.maxx, bounds.maxy,
                  shape.width, shape.height, level, info.width, info.height);

    // Source pixel of each output column and row (centres, nearest neighbour).
    // Without rotation the column depends on x only and the row on y only.
    const double step_x = bounds.width() / static_cast<double>(shape.width);
    const double step_y = bounds.height() / static_cast<double>(shape.height);
    constexpr uint64_t outside = std::numeric_limits<uint64_t>::max();

    std::vector<uint64_t> source_cols(shape.width, outside);
    uint64_t min_col = outside;
    uint64_t max_col = 0;
    for (uint64_t j = 0; j < shape.width; ++j) {
        const double x = bounds.minx + (static_cast<double>(j) + 0.5) * step_x;
        const double col = std::floor(to_pixel.a * x + to_pixel.c);
        if (col >= 0.0 && col < static_cast<double>(info.width)) {
            source_cols[j] = static_cast<uint64_t>(col);
            min_col = std::min(min_col, source_cols[j]);
            max_col = std::max(max_col, source_cols[j]);
        }
    }

    std::vector<uint64_t> source_rows(shape.height, outside);
    uint64_t min_row = outside;
    uint64_t max_row = 0;
    for (uint64_t i = 0; i < shape.height; ++i) {
        const double y = bounds.maxy - (static_cast<double>(i) + 0.5) * step_y;
        const double row = std::floor(to_pixel.e * y + to_pixel.f);
        if (row >= 0.0 && row < static_cast<double>(info.height)) {
            source_rows[i] = static_cast<uint64_t>(row);
            min_row = std::min(min_row, source_rows[i]);
            max_row = std::max(max_row, source_rows[i]);
        }
    }

    if (min_col == outside || min_row == outside) {
        return Err(Error::Code::OutOfRange, "No output pixel falls inside the image");
    }

    // Covering tile rectangle
    const uint64_t first_tile_col = min_col / info.chunk_width;
    const uint64_t last_tile_col = max_col / info.chunk_width;
    const uint64_t first_tile_row = min_row / info.chunk_height;
    const uint64_t last_tile_row = max_row / info.chunk_height;
    const uint64_t tiles_across = last_tile_col - first_tile_col + 1;

    std::vector<std::pair<uint64_t, uint64_t>> tiles;
    tiles.reserve(tiles_across * (last_tile_row - first_tile_row + 1));
    for (uint64_t r = first_tile_row; r <= last_tile_row; ++r) {
        for (uint64_t c = first_tile_col; c <= last_tile_col; ++c) {
            tiles.emplace_back(c, r);
        }
    }

    auto chunks = fetch_chunks(dataset, info, tiles, stop);
    if (!chunks) {
        return chunks.error();
    }

    RasterBuffer output(info.dtype, shape.height, shape.width, info.samples_per_pixel);
    const std::optional<double> nodata = info.nodata ? info.nodata : dataset.profile.nodata;
    if (nodata) {
        output.fill(*nodata);
    }

    const uint16_t planes = info.planes();
    const std::size_t chunk_pixel_size = info.samples_per_chunk() * data_type_size(info.dtype);
    for (uint64_t i = 0; i < shape.height; ++i) {
        const uint64_t src_row = source_rows[i];
        if (src_row == outside) {
            continue;
        }
        const uint64_t tile_row = src_row / info.chunk_height - first_tile_row;
        const uint64_t in_row = src_row % info.chunk_height;
        for (uint64_t j = 0; j < shape.width; ++j) {
            const uint64_t src_col = source_cols[j];
            if (src_col == outside) {
                continue;
            }
            const uint64_t tile = tile_row * tiles_across + (src_col / info.chunk_width - first_tile_col);
            const uint64_t in_col = src_col % info.chunk_width;
            std::byte* dst = output.pixel_bytes(i, j).data();
            for (uint16_t p = 0; p < planes; ++p) {
                const RasterBuffer& chunk = chunks.value()[tile * planes + p];
                const std::byte* src = chunk.bytes().data() + (in_row * info.chunk_width + in_col) * chunk_pixel_size;
                std::memcpy(dst + p * chunk_pixel_size, src, chunk_pixel_size);
            }
        }
    }
    return Ok(std::move(output));
}

} // namespace cogstream
