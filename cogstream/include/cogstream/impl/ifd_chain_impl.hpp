// This file contains the implementation of IfdChain.
// Do not include this file directly - it is included by ifd_chain.hpp

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>
#include "../types/result.hpp"

#ifndef COGSTREAM_IFD_CHAIN_HEADER
#include "../ifd_chain.hpp" // for linters
#endif

namespace cogstream {

template <ByteSource Source>
Result<IfdChain> IfdChain::load(const DirectoryReader<Source>& reader, std::size_t max_ifds, const Logger& logger) {
    IfdChain chain;
    std::unordered_set<uint64_t> seen;

    uint64_t offset = reader.layout().first_ifd_offset;
    while (offset != 0) {
        if (!seen.insert(offset).second) {
            return Err(Error::Code::InvalidTiff,
                       "IFD chain loops back to offset " + std::to_string(offset));
        }
        if (chain.directories_.size() >= max_ifds) {
            return Err(Error::Code::InvalidTiff,
                       "IFD chain longer than " + std::to_string(max_ifds) + " directories");
        }

        auto ifd = parse_ifd(reader, offset, logger);
        if (!ifd) {
            return ifd.error();
        }
        offset = ifd.value().next_offset();
        chain.directories_.push_back(std::move(ifd.value()));
    }

    for (std::size_t i = 0; i < chain.directories_.size(); ++i) {
        const Ifd& ifd = chain.directories_[i];

        if (ifd.is_mask()) {
            auto info = ImageInfo::from_ifd(ifd);
            if (!info) {
                logger.warn("Ignoring unreadable mask IFD at offset {}: {}", ifd.offset(), info.error().message);
                chain.mask_info_.emplace_back(std::nullopt);
            } else {
                chain.mask_info_.emplace_back(std::move(info.value()));
            }
            chain.mask_index_.push_back(i);
            continue;
        }

        // Some writers omit the reduced-resolution bit; a strictly smaller image
        // still counts as the next overview
        if (!chain.level_info_.empty() && !ifd.is_reduced_resolution()) {
            const ImageInfo& previous = chain.level_info_.back();
            auto width = ifd.image_width();
            auto height = ifd.image_height();
            if (!width || !height || width.value() >= previous.width || height.value() >= previous.height) {
                logger.warn("Ignoring full-resolution page IFD at offset {}", ifd.offset());
                continue;
            }
            logger.debug("IFD at offset {} lacks the reduced-resolution bit, read as overview {}",
                         ifd.offset(), chain.level_info_.size());
        }

        auto info = ImageInfo::from_ifd(ifd);
        if (!info) {
            return info.error().with_context("IFD at offset " + std::to_string(ifd.offset()));
        }
        chain.level_index_.push_back(i);
        chain.level_info_.push_back(std::move(info.value()));
    }

    if (chain.level_info_.empty()) {
        return Err(Error::Code::InvalidTiff, "No image IFD in the file");
    }

    logger.debug("Parsed {} IFDs: {} levels, {} masks", chain.directories_.size(),
                 chain.level_info_.size(), chain.mask_index_.size());
    return Ok(std::move(chain));
}

inline const ImageInfo* IfdChain::mask_info_for_level(std::size_t level) const noexcept {
    if (level >= level_info_.size()) {
        return nullptr;
    }
    const ImageInfo& target = level_info_[level];
    for (const auto& info : mask_info_) {
        if (info && info->width == target.width && info->height == target.height) {
            return &*info;
        }
    }
    return nullptr;
}

inline std::vector<int> IfdChain::decimations() const {
    std::vector<int> factors;
    if (level_info_.empty()) {
        return factors;
    }
    const double full_width = static_cast<double>(level_info_.front().width);
    for (std::size_t k = 1; k < level_info_.size(); ++k) {
        factors.push_back(static_cast<int>(std::lround(full_width / static_cast<double>(level_info_[k].width))));
    }
    return factors;
}

inline Result<void> IfdChain::check_pyramid(double tolerance, double tile_tolerance) const {
    auto halves = [tolerance](uint64_t finer, uint64_t coarser) {
        // Writers round odd sizes either way
        if (coarser == finer / 2 || coarser == (finer + 1) / 2) {
            return true;
        }
        const double ratio = static_cast<double>(finer) / static_cast<double>(coarser);
        return std::abs(ratio - 2.0) <= 2.0 * tolerance;
    };

    // Partial edge chunks keep the grid from shrinking by exactly 4, so a grid
    // halved along each axis (either rounding) is accepted as well
    auto quarter_chunks = [tile_tolerance](const ImageInfo& finer, const ImageInfo& coarser) {
        auto grid_halves = [](uint64_t finer_count, uint64_t coarser_count) {
            return coarser_count == std::max<uint64_t>(1, finer_count / 2) || coarser_count == (finer_count + 1) / 2;
        };
        if (grid_halves(finer.chunks_across, coarser.chunks_across) &&
            grid_halves(finer.chunks_down, coarser.chunks_down)) {
            return true;
        }
        const double ratio = static_cast<double>(finer.chunks_per_plane()) /
                             static_cast<double>(coarser.chunks_per_plane());
        return std::abs(ratio - 4.0) <= 4.0 * tile_tolerance;
    };

    for (std::size_t k = 1; k < level_info_.size(); ++k) {
        const ImageInfo& finer = level_info_[k - 1];
        const ImageInfo& coarser = level_info_[k];
        if (!halves(finer.width, coarser.width) || !halves(finer.height, coarser.height)) {
            return Err(Error::Code::InvalidTiff,
                       "Overview " + std::to_string(k) + " (" + std::to_string(coarser.width) + "x" +
                       std::to_string(coarser.height) + ") is not half of level " + std::to_string(k - 1) +
                       " (" + std::to_string(finer.width) + "x" + std::to_string(finer.height) + ")");
        }
        if (!quarter_chunks(finer, coarser)) {
            return Err(Error::Code::InvalidTiff,
                       "Overview " + std::to_string(k) + " has " + std::to_string(coarser.chunks_per_plane()) +
                       " chunks against " + std::to_string(finer.chunks_per_plane()) + " in level " +
                       std::to_string(k - 1) + ", not a quarter");
        }
    }
    return Ok();
}

} // namespace cogstream
