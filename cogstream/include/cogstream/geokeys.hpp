#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "ifd.hpp"
#include "types/result.hpp"
#include "types/tiff_spec.hpp"

namespace cogstream {

/// Affine map from pixel (col, row) to model coordinates:
///   x = a * col + b * row + c
///   y = d * col + e * row + f
/// Pixel (0, 0) is the outer corner of the top-left pixel.
struct Geotransform {
    double a{1.0};
    double b{0.0};
    double c{0.0};
    double d{0.0};
    double e{1.0};
    double f{0.0};

    [[nodiscard]] std::pair<double, double> apply(double col, double row) const noexcept {
        return {a * col + b * row + c, d * col + e * row + f};
    }

    /// Inverse map (model -> pixel); fails with InvalidState when the matrix is singular
    [[nodiscard]] Result<Geotransform> inverse() const;

    /// Same origin, pixel size multiplied by (x_factor, y_factor).
    /// Used to derive an overview's transform from the full-resolution one.
    [[nodiscard]] Geotransform scaled(double x_factor, double y_factor) const noexcept {
        return {a * x_factor, b * y_factor, c, d * x_factor, e * y_factor, f};
    }

    [[nodiscard]] bool is_rotated() const noexcept {
        return b != 0.0 || d != 0.0;
    }

    bool operator==(const Geotransform&) const = default;
};

/// Axis-aligned extent in the raster's native CRS
struct Bounds {
    double minx{0.0};
    double miny{0.0};
    double maxx{0.0};
    double maxy{0.0};

    [[nodiscard]] double width() const noexcept { return maxx - minx; }
    [[nodiscard]] double height() const noexcept { return maxy - miny; }

    [[nodiscard]] bool intersects(const Bounds& other) const noexcept {
        return minx < other.maxx && other.minx < maxx && miny < other.maxy && other.miny < maxy;
    }

    bool operator==(const Bounds&) const = default;
};

/// Envelope of the pixel rectangle [0, width) x [0, height) under a transform
[[nodiscard]] inline Bounds transform_bounds(const Geotransform& transform, uint64_t width, uint64_t height) noexcept;

/// One entry of the GeoKeyDirectory with its value resolved
struct GeoKey {
    using Value = std::variant<std::vector<uint16_t>, std::vector<double>, std::string>;

    uint16_t id{0};
    uint16_t location{0};   ///< 0 (inline), 34735, 34736 or 34737
    uint16_t count{0};
    Value value;

    /// First short value, for keys stored inline or in the directory
    [[nodiscard]] std::optional<uint16_t> as_short() const noexcept {
        const auto* shorts = std::get_if<std::vector<uint16_t>>(&value);
        if (!shorts || shorts->empty()) {
            return std::nullopt;
        }
        return shorts->front();
    }

    [[nodiscard]] const std::string* as_string() const noexcept {
        return std::get_if<std::string>(&value);
    }
};

/// Georeferencing recovered from the GeoTIFF tags of the full-resolution IFD
struct GeoReference {
    std::map<uint16_t, GeoKey> keys;
    uint16_t model_type{0};
    uint16_t raster_type{geokey::RasterPixelIsArea};
    std::optional<uint16_t> epsg;
    std::optional<std::string> citation;
    std::optional<Geotransform> transform;

    /// "EPSG:<code>", or std::nullopt for a user-defined or absent CRS
    [[nodiscard]] std::optional<std::string> crs() const {
        if (!epsg) {
            return std::nullopt;
        }
        return "EPSG:" + std::to_string(*epsg);
    }

    [[nodiscard]] bool is_pixel_is_point() const noexcept {
        return raster_type == geokey::RasterPixelIsPoint;
    }

    [[nodiscard]] const GeoKey* find(uint16_t id) const noexcept {
        auto it = keys.find(id);
        return it == keys.end() ? nullptr : &it->second;
    }

    /// The transform, or MissingGeoreferencing
    [[nodiscard]] Result<Geotransform> geotransform() const;
};

/**
 * @brief Interpretation of the GeoTIFF tags of an IFD
 *
 * Reads GeoKeyDirectory (34735) with GeoDoubleParams (34736) and
 * GeoAsciiParams (34737), and derives the affine transform from
 * ModelTransformation (34264), or ModelPixelScale (33550) with
 * ModelTiepoint (33922).
 *
 * A missing key directory or missing transform tags are not errors here;
 * they leave the corresponding GeoReference fields empty.
 */
class GeoKeyResolver {
public:
    /// Decode the key directory. Absent tag gives an empty list.
    /// Entries pointing outside their parameter tag are MalformedTag.
    [[nodiscard]] static Result<std::vector<GeoKey>> parse_key_directory(const Ifd& ifd);

    /// Affine transform from the model tags, std::nullopt when there are none.
    /// PixelIsPoint rasters are shifted by half a pixel, the convention GDAL applies.
    [[nodiscard]] static Result<std::optional<Geotransform>> resolve_transform(const Ifd& ifd, bool pixel_is_point);

    [[nodiscard]] static Result<GeoReference> resolve(const Ifd& ifd);
};

} // namespace cogstream

#define COGSTREAM_GEOKEYS_HEADER
#include "impl/geokeys_impl.hpp"
