#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "byte_source.hpp"
#include "directory_reader.hpp"
#include "ifd.hpp"
#include "image_info.hpp"
#include "log.hpp"
#include "types/result.hpp"

namespace cogstream {

/**
 * @brief The linked list of IFDs of a COG, split into pyramid levels and masks
 *
 * Level 0 is the full-resolution image and level k its k-th overview.
 * Transparency masks (NewSubfileType bit 2) never count as levels; they are
 * kept apart and matched to the level with the same dimensions.
 * After level 0, an IFD without the reduced-resolution bit is still read as the
 * next overview when both its dimensions are strictly smaller than the previous
 * level's. Other full-resolution pages of a multi-page file are ignored.
 *
 * The chain is built once and not modified afterwards.
 */
class IfdChain {
private:
    std::vector<Ifd> directories_;              // all IFDs in file order
    std::vector<std::size_t> level_index_;      // directories_ index of each level
    std::vector<ImageInfo> level_info_;
    std::vector<std::size_t> mask_index_;       // directories_ index of each mask
    std::vector<std::optional<ImageInfo>> mask_info_;

public:
    using const_iterator = std::vector<Ifd>::const_iterator;

    IfdChain() = default;

    /// Walk the chain from the header's first IFD until a zero next offset.
    /// A repeated offset (cycle), an offset outside the stream or more than
    /// `max_ifds` directories is InvalidTiff.
    template <ByteSource Source>
    [[nodiscard]] static Result<IfdChain> load(
        const DirectoryReader<Source>& reader,
        std::size_t max_ifds,
        const Logger& logger = Logger{});

    /// Number of pyramid levels (full resolution included)
    [[nodiscard]] std::size_t level_count() const noexcept { return level_info_.size(); }

    [[nodiscard]] const Ifd& level(std::size_t index) const noexcept {
        return directories_[level_index_[index]];
    }

    [[nodiscard]] const ImageInfo& level_info(std::size_t index) const noexcept {
        return level_info_[index];
    }

    [[nodiscard]] std::size_t mask_count() const noexcept { return mask_index_.size(); }

    [[nodiscard]] const Ifd& mask(std::size_t index) const noexcept {
        return directories_[mask_index_[index]];
    }

    /// Layout of the mask matching a level's dimensions, or nullptr
    [[nodiscard]] const ImageInfo* mask_info_for_level(std::size_t level) const noexcept;

    /// Every IFD in file order, masks included
    [[nodiscard]] std::size_t size() const noexcept { return directories_.size(); }
    [[nodiscard]] const_iterator begin() const noexcept { return directories_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return directories_.end(); }

    /// Decimation factor of each overview relative to level 0, rounded (2, 4, 8, ...)
    [[nodiscard]] std::vector<int> decimations() const;

    /// Verify that each level halves the width and height of the previous one within
    /// `tolerance`, and holds about a quarter of its chunks within `tile_tolerance`.
    /// Returns InvalidTiff describing the first offending level.
    [[nodiscard]] Result<void> check_pyramid(double tolerance, double tile_tolerance) const;
};

} // namespace cogstream

#define COGSTREAM_IFD_CHAIN_HEADER
#include "impl/ifd_chain_impl.hpp"
