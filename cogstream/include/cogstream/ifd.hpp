#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "byte_source.hpp"
#include "directory_reader.hpp"
#include "log.hpp"
#include "tag.hpp"
#include "types/result.hpp"
#include "types/tiff_spec.hpp"

namespace cogstream {

/**
 * @brief One Image File Directory
 *
 * Tags are kept in the order they appear in the file, with a lookup by code.
 * TIFF requires unique codes inside a directory; when a file repeats one, the
 * first occurrence wins and the repeated code is listed in duplicate_codes().
 *
 * The named accessors apply the TIFF defaults for optional tags and return
 * Error::Code::MalformedTag when a tag exists with an unexpected type.
 * Missing required tags (ImageWidth, ImageLength) are Error::Code::InvalidTiff.
 *
 * Iterating an Ifd yields its Tags in parse order; iteration is restartable.
 */
class Ifd {
private:
    uint64_t offset_{0};
    uint64_t next_offset_{0};
    std::vector<Tag> tags_;
    std::unordered_map<uint16_t, std::size_t> index_;
    std::vector<uint16_t> duplicate_codes_;

public:
    using const_iterator = std::vector<Tag>::const_iterator;

    Ifd() = default;

    explicit Ifd(uint64_t offset) noexcept
        : offset_(offset) {}

    /// File offset of this directory
    [[nodiscard]] uint64_t offset() const noexcept { return offset_; }

    /// Offset of the next directory, 0 when this one is the last
    [[nodiscard]] uint64_t next_offset() const noexcept { return next_offset_; }

    void set_next_offset(uint64_t offset) noexcept { next_offset_ = offset; }

    /// Append a tag; returns false and keeps the existing one if the code is already present
    bool add(Tag tag);

    [[nodiscard]] const Tag* find(uint16_t code) const noexcept;

    [[nodiscard]] const Tag* find(TagCode code) const noexcept {
        return find(static_cast<uint16_t>(code));
    }

    [[nodiscard]] bool has(TagCode code) const noexcept {
        return find(code) != nullptr;
    }

    [[nodiscard]] std::size_t size() const noexcept { return tags_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tags_.empty(); }
    [[nodiscard]] const_iterator begin() const noexcept { return tags_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return tags_.end(); }

    [[nodiscard]] const std::vector<uint16_t>& duplicate_codes() const noexcept { return duplicate_codes_; }

    // ------------------------------------------------------------------------
    // Generic typed lookups
    // ------------------------------------------------------------------------

    /// First value of an unsigned tag, or `fallback` when absent
    [[nodiscard]] Result<uint64_t> uint_or(TagCode code, uint64_t fallback) const;

    /// First value of an unsigned tag, or std::nullopt when absent
    [[nodiscard]] Result<std::optional<uint64_t>> optional_uint(TagCode code) const;

    /// Unsigned array tag; absent tags give an empty vector
    [[nodiscard]] Result<std::vector<uint64_t>> uint_array(TagCode code) const;

    /// Numeric array tag as doubles; absent tags give an empty vector
    [[nodiscard]] Result<std::vector<double>> double_array(TagCode code) const;

    /// ASCII tag, or std::nullopt when absent
    [[nodiscard]] Result<std::optional<std::string>> optional_string(TagCode code) const;

    // ------------------------------------------------------------------------
    // Named accessors
    // ------------------------------------------------------------------------

    [[nodiscard]] Result<uint64_t> image_width() const;
    [[nodiscard]] Result<uint64_t> image_height() const;

    /// TileWidth, or std::nullopt for a stripped image
    [[nodiscard]] Result<std::optional<uint64_t>> tile_width() const;
    [[nodiscard]] Result<std::optional<uint64_t>> tile_height() const;

    [[nodiscard]] Result<uint16_t> compression() const;
    [[nodiscard]] Result<uint16_t> samples_per_pixel() const;
    [[nodiscard]] Result<std::vector<uint16_t>> bits_per_sample() const;
    [[nodiscard]] Result<SampleFormat> sample_format() const;
    [[nodiscard]] Result<Predictor> predictor() const;
    [[nodiscard]] Result<PlanarConfiguration> planar_configuration() const;
    [[nodiscard]] Result<std::optional<uint16_t>> photometric() const;
    [[nodiscard]] Result<uint32_t> new_subfile_type() const;

    /// GDAL_NODATA parsed as a number ("nan", "inf" and "-inf" included)
    [[nodiscard]] Result<std::optional<double>> nodata() const;

    [[nodiscard]] bool is_tiled() const noexcept {
        return has(TagCode::TileWidth) && has(TagCode::TileLength);
    }

    /// NewSubfileType has the transparency mask bit
    [[nodiscard]] bool is_mask() const noexcept;

    /// NewSubfileType has the reduced resolution bit
    [[nodiscard]] bool is_reduced_resolution() const noexcept;

    /// (tiles across, tiles down); a stripped image counts as one column of strips
    [[nodiscard]] Result<std::pair<uint64_t, uint64_t>> tile_count() const;
};

/// Parse the IFD at `offset`: entry count (u16 classic, u64 BigTIFF), entries,
/// then the next-IFD offset. Directory bytes outside the stream are InvalidTiff.
/// Entries with an unknown type are skipped with a warning; other entry errors fail the parse.
template <ByteSource Source>
[[nodiscard]] Result<Ifd> parse_ifd(
    const DirectoryReader<Source>& reader,
    uint64_t offset,
    const Logger& logger = Logger{});

} // namespace cogstream

#define COGSTREAM_IFD_HEADER
#include "impl/ifd_impl.hpp"
