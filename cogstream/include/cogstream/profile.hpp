#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <utility>
#include "geokeys.hpp"
#include "image_info.hpp"
#include "raster.hpp"
#include "types/tiff_spec.hpp"

namespace cogstream {

/// Dataset summary derived from the full-resolution IFD, in the vocabulary
/// raster tools use ("count" bands, "block" sizes, "interleave").
struct Profile {
    uint64_t width{0};
    uint64_t height{0};
    uint16_t count{1};
    DataType dtype{DataType::UInt8};
    uint64_t block_width{0};
    uint64_t block_height{0};
    std::optional<std::string> compress;    ///< empty for uncompressed data
    std::string interleave{"band"};         ///< "pixel" or "band"
    std::optional<std::string> crs;         ///< "EPSG:<code>"
    std::optional<Geotransform> transform;
    std::optional<double> nodata;
    std::optional<std::string> photometric;
    std::vector<int> overviews;             ///< decimation factors, e.g. {2, 4, 8}
    bool tiled{true};

    [[nodiscard]] static Profile from(const ImageInfo& info, const GeoReference& georef, std::vector<int> overviews) {
        Profile profile;
        profile.width = info.width;
        profile.height = info.height;
        profile.count = info.samples_per_pixel;
        profile.dtype = info.dtype;
        profile.block_width = info.chunk_width;
        profile.block_height = info.chunk_height;
        if (info.compression != static_cast<uint16_t>(CompressionScheme::None)) {
            profile.compress = std::string(compression_name(info.compression));
        }
        profile.interleave = info.samples_per_pixel > 1 && !info.is_planar() ? "pixel" : "band";
        profile.crs = georef.crs();
        profile.transform = georef.transform;
        profile.nodata = info.nodata;
        if (info.photometric) {
            profile.photometric = std::string(photometric_name(*info.photometric));
        }
        profile.overviews = std::move(overviews);
        profile.tiled = info.tiled;
        return profile;
    }
};

} // namespace cogstream
