#pragma once

/**
 * @file cog_reader.hpp
 * @brief Range-request reader for Cloud-Optimized GeoTIFF
 *
 * CogReader owns a ByteSource and turns it into georeferenced pixels:
 *
 * @code
 * CogReader reader(FileSource::open("scene.tif").value(), ReaderOptions::from_env());
 * if (auto opened = reader.open(); !opened) { ... }
 * auto profile = reader.profile();
 * auto tile = reader.get_tile(0, 0, 0);
 * auto window = reader.read(Bounds{minx, miny, maxx, maxy}, ReadShape{256, 256});
 * @endcode
 *
 * Opening fetches the header prefix, walks the IFD chain and resolves the
 * GeoTIFF keys, once per reader: concurrent open() calls share one parse and
 * see the same result. Metadata accessors do no I/O. Tile reads and window
 * reads are safe to run concurrently from several threads; close() is not
 * safe against calls still in flight.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "byte_source.hpp"
#include "concurrency/once_cell.hpp"
#include "concurrency/task_group.hpp"
#include "directory_reader.hpp"
#include "geokeys.hpp"
#include "ifd.hpp"
#include "ifd_chain.hpp"
#include "image_info.hpp"
#include "log.hpp"
#include "options.hpp"
#include "overview.hpp"
#include "profile.hpp"
#include "raster.hpp"
#include "tile_decoder.hpp"
#include "types/result.hpp"

namespace cogstream {

enum class ReaderState : uint8_t {
    Unopened,
    Opening,
    Ready,
    Failed,
    Closed
};

[[nodiscard]] constexpr std::string_view reader_state_name(ReaderState state) noexcept {
    switch (state) {
        case ReaderState::Unopened: return "unopened";
        case ReaderState::Opening:  return "opening";
        case ReaderState::Ready:    return "ready";
        case ReaderState::Failed:   return "failed";
        case ReaderState::Closed:   return "closed";
    }
    return "unknown";
}

/// Output size of a window read
struct ReadShape {
    uint64_t height{0};
    uint64_t width{0};
};

template <ByteSource Source>
class CogReader {
private:
    /// Everything parsed at open time. Immutable afterwards.
    struct Dataset {
        DirectoryReader<Source> directory;
        IfdChain chain;
        GeoReference georef;
        Profile profile;
    };

    std::optional<Source> source_;
    ReaderOptions options_;
    Logger logger_;
    std::atomic<ReaderState> state_{ReaderState::Unopened};
    detail::OnceCell<Result<std::shared_ptr<const Dataset>>> dataset_;

    [[nodiscard]] Result<std::shared_ptr<const Dataset>> load() const;

    /// The parsed dataset when Ready; the open error when Failed; InvalidState otherwise
    [[nodiscard]] Result<const Dataset*> ready() const;

    /// Fetch and decode one stored chunk (one plane of a planar tile)
    [[nodiscard]] Result<RasterBuffer> fetch_chunk(
        const Dataset& dataset,
        const ImageInfo& info,
        uint64_t col,
        uint64_t row,
        uint16_t plane) const;

    /// Fetch chunks (col, row, plane) of a level concurrently, in the order given
    [[nodiscard]] Result<std::vector<RasterBuffer>> fetch_chunks(
        const Dataset& dataset,
        const ImageInfo& info,
        const std::vector<std::pair<uint64_t, uint64_t>>& tiles,
        std::stop_token stop) const;

    [[nodiscard]] Result<RasterBuffer> read_tile(
        const Dataset& dataset,
        const ImageInfo& info,
        uint64_t col,
        uint64_t row) const;

    [[nodiscard]] std::size_t select_level(
        const Dataset& dataset,
        const Bounds& full_bounds,
        const Bounds& request,
        ReadShape shape) const;

public:
    explicit CogReader(Source source, ReaderOptions options = ReaderOptions{})
        : source_(std::move(source))
        , options_(std::move(options))
        , logger_(options_.make_logger()) {}

    CogReader(const CogReader&) = delete;
    CogReader& operator=(const CogReader&) = delete;
    CogReader(CogReader&&) = delete;
    CogReader& operator=(CogReader&&) = delete;

    /// Parse the header, the IFD chain and the GeoTIFF keys.
    /// The outcome is kept: after a failure every call returns the same error.
    /// @retval Error::Code::InvalidTiff Not a TIFF, or a broken directory chain
    /// @retval Error::Code::InvalidState The reader was closed
    [[nodiscard]] Result<void> open();

    /// Release the source and the parsed metadata; every later call returns InvalidState
    void close() noexcept;

    [[nodiscard]] ReaderState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ReaderOptions& options() const noexcept { return options_; }

    // ------------------------------------------------------------------------
    // Metadata (no I/O, InvalidState unless Ready)
    // ------------------------------------------------------------------------

    [[nodiscard]] Result<Profile> profile() const;

    /// Extent of the full-resolution image in its CRS, or MissingGeoreferencing
    [[nodiscard]] Result<Bounds> bounds() const;

    /// "EPSG:<code>", std::nullopt when the file has no or a user-defined CRS
    [[nodiscard]] Result<std::optional<std::string>> crs() const;
    [[nodiscard]] Result<std::optional<uint16_t>> epsg() const;

    /// Decimation factor of each overview (2, 4, 8, ...)
    [[nodiscard]] Result<std::vector<int>> overviews() const;

    [[nodiscard]] Result<Geotransform> geotransform() const;

    /// Transform of an overview level: the full-resolution origin with a coarser pixel size
    [[nodiscard]] Result<Geotransform> level_geotransform(std::size_t level) const;

    [[nodiscard]] Result<GeoReference> georeference() const;

    /// Levels including full resolution
    [[nodiscard]] Result<std::size_t> level_count() const;

    /// (tiles across, tiles down) of a level
    [[nodiscard]] Result<std::pair<uint64_t, uint64_t>> tile_count(std::size_t level) const;

    [[nodiscard]] Result<bool> has_mask(std::size_t level) const;

    /// Range requests issued so far, the header prefix included
    [[nodiscard]] std::size_t source_reads() const noexcept;

    // ------------------------------------------------------------------------
    // Pixels
    // ------------------------------------------------------------------------

    /**
     * @brief Fetch and decode one tile
     *
     * Planar images fetch every band concurrently and return them interleaved.
     * Sparse tiles (byte count 0) come back filled with nodata, or zero.
     * The result has shape (tile_height, tile_width, samples); edge tiles are not cropped.
     *
     * @retval Error::Code::OutOfRange Level, column or row outside the pyramid
     */
    [[nodiscard]] Result<RasterBuffer> get_tile(std::size_t level, uint64_t col, uint64_t row) const;

    /// Tile of the transparency mask attached to a level: 255 where valid, 0 elsewhere.
    /// OutOfRange when the level has no mask.
    [[nodiscard]] Result<RasterBuffer> get_mask_tile(std::size_t level, uint64_t col, uint64_t row) const;

    /**
     * @brief Read a georeferenced window resampled to `shape`
     *
     * Picks the overview whose resolution best matches the request, fetches the
     * covering tiles concurrently and samples them with nearest neighbour.
     * Output pixels falling outside the image hold nodata, or zero.
     *
     * @param bounds Window in the dataset's CRS
     * @param shape Output height and width
     * @param stop Cancels the read; queued tile fetches are skipped
     * @retval Error::Code::OutOfRange The window does not intersect the image, or the shape is empty
     * @retval Error::Code::MissingGeoreferencing The file has no geotransform
     * @retval Error::Code::Cancelled `stop` was requested
     */
    [[nodiscard]] Result<RasterBuffer> read(const Bounds& bounds, ReadShape shape, std::stop_token stop = {}) const;

    /// Overview index read() would use for a request
    [[nodiscard]] Result<std::size_t> overview_for(const Bounds& bounds, ReadShape shape) const;

    /// read() on a separate thread. The reader must outlive the future.
    [[nodiscard]] std::future<Result<RasterBuffer>> read_async(
        const Bounds& bounds,
        ReadShape shape,
        std::stop_token stop = {}) const {
        return std::async(std::launch::async, [this, bounds, shape, stop]() {
            return read(bounds, shape, stop);
        });
    }

    /// get_tile() on a separate thread. The reader must outlive the future.
    [[nodiscard]] std::future<Result<RasterBuffer>> get_tile_async(std::size_t level, uint64_t col, uint64_t row) const {
        return std::async(std::launch::async, [this, level, col, row]() {
            return get_tile(level, col, row);
        });
    }

    // ------------------------------------------------------------------------
    // Directory iteration (empty unless Ready)
    // ------------------------------------------------------------------------

    [[nodiscard]] const IfdChain* ifd_chain() const noexcept;

    [[nodiscard]] IfdChain::const_iterator begin() const noexcept;
    [[nodiscard]] IfdChain::const_iterator end() const noexcept;
};

/// Construct and open a reader in one step
template <ByteSource Source>
[[nodiscard]] Result<std::unique_ptr<CogReader<Source>>> open_cog(Source source, ReaderOptions options = ReaderOptions{}) {
    auto reader = std::make_unique<CogReader<Source>>(std::move(source), std::move(options));
    auto opened = reader->open();
    if (!opened) {
        return opened.error();
    }
    return Ok(std::move(reader));
}

} // namespace cogstream

#define COGSTREAM_COG_READER_HEADER
#include "impl/cog_reader_impl.hpp"
