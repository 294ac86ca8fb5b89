#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include "geokeys.hpp"

namespace cogstream {

/// Pixel dimensions of one pyramid level
struct LevelSize {
    uint64_t width{0};
    uint64_t height{0};
};

/**
 * @brief Pick the pyramid level to read for a request
 *
 * The requested resolution is the request extent divided by the output shape;
 * level k's resolution is the full extent divided by its pixel size. A level is
 * sufficient when neither axis is coarser than the request, `tolerance` being
 * the relative difference under which two resolutions count as equal.
 *
 * Returns the most reduced sufficient level. 0 when the request is finer than
 * the full resolution, the last level when it is coarser than every overview.
 * Among levels of equal resolution the lowest index wins.
 *
 * @param levels Level sizes, full resolution first (must not be empty)
 * @param full_bounds Extent of the dataset
 * @param request_bounds Extent of the requested window
 * @param width Output width in pixels (> 0)
 * @param height Output height in pixels (> 0)
 * @param tolerance Relative resolution tolerance, e.g. 0.01
 */
[[nodiscard]] inline std::size_t select_overview(
    std::span<const LevelSize> levels,
    const Bounds& full_bounds,
    const Bounds& request_bounds,
    uint64_t width,
    uint64_t height,
    double tolerance) noexcept
{
    if (levels.size() <= 1 || width == 0 || height == 0) {
        return 0;
    }

    const double request_x = request_bounds.width() / static_cast<double>(width);
    const double request_y = request_bounds.height() / static_cast<double>(height);

    auto resolution = [&](std::size_t k) {
        return std::pair<double, double>{
            full_bounds.width() / static_cast<double>(levels[k].width),
            full_bounds.height() / static_cast<double>(levels[k].height)};
    };
    auto sufficient = [&](std::size_t k) {
        const auto [rx, ry] = resolution(k);
        return rx <= request_x * (1.0 + tolerance) && ry <= request_y * (1.0 + tolerance);
    };

    std::size_t selected = 0;
    for (std::size_t k = 1; k < levels.size(); ++k) {
        if (!sufficient(k)) {
            break;
        }
        const auto [rx, ry] = resolution(k);
        const auto [sx, sy] = resolution(selected);
        // Same resolution as the current choice: keep the lower index
        if (rx > sx * (1.0 + tolerance) || ry > sy * (1.0 + tolerance)) {
            selected = k;
        }
    }
    return selected;
}

} // namespace cogstream
