// This file contains the implementation of GeoKeyResolver.
// Do not include this file directly - it is included by geokeys.hpp

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>
#include "../types/result.hpp"

#ifndef COGSTREAM_GEOKEYS_HEADER
#include "../geokeys.hpp" // for linters
#endif

namespace cogstream {

// ============================================================================
// Geotransform
// ============================================================================

inline Result<Geotransform> Geotransform::inverse() const {
    const double det = a * e - b * d;
    if (det == 0.0 || !std::isfinite(det)) [[unlikely]] {
        return Err(Error::Code::InvalidState, "Geotransform is not invertible");
    }
    Geotransform inv;
    inv.a = e / det;
    inv.b = -b / det;
    inv.d = -d / det;
    inv.e = a / det;
    inv.c = -(inv.a * c + inv.b * f);
    inv.f = -(inv.d * c + inv.e * f);
    return Ok(inv);
}

inline Bounds transform_bounds(const Geotransform& transform, uint64_t width, uint64_t height) noexcept {
    const double w = static_cast<double>(width);
    const double h = static_cast<double>(height);
    const std::pair<double, double> corners[4] = {
        transform.apply(0.0, 0.0),
        transform.apply(w, 0.0),
        transform.apply(0.0, h),
        transform.apply(w, h),
    };
    Bounds bounds{corners[0].first, corners[0].second, corners[0].first, corners[0].second};
    for (const auto& [x, y] : corners) {
        bounds.minx = std::min(bounds.minx, x);
        bounds.maxx = std::max(bounds.maxx, x);
        bounds.miny = std::min(bounds.miny, y);
        bounds.maxy = std::max(bounds.maxy, y);
    }
    return bounds;
}

inline Result<Geotransform> GeoReference::geotransform() const {
    if (!transform) {
        return Err(Error::Code::MissingGeoreferencing,
                   "No ModelTransformation or ModelPixelScale tag");
    }
    return Ok(*transform);
}

// ============================================================================
// Key directory
// ============================================================================

namespace detail {

/// GeoTIFF ascii params separate strings with '|'; drop the separator and NULs at the end
inline std::string trim_geo_ascii(std::string text) {
    while (!text.empty() && (text.back() == '|' || text.back() == '\0')) {
        text.pop_back();
    }
    return text;
}

} // namespace detail

inline Result<std::vector<GeoKey>> GeoKeyResolver::parse_key_directory(const Ifd& ifd) {
    std::vector<GeoKey> keys;

    const Tag* directory_tag = ifd.find(TagCode::GeoKeyDirectory);
    if (!directory_tag) {
        return Ok(std::move(keys));
    }
    auto raw = directory_tag->as_uint_array();
    if (!raw) {
        return raw.error().with_context("GeoKeyDirectory");
    }
    const std::vector<uint64_t>& directory = raw.value();
    if (directory.size() < 4) {
        return Err(Error::Code::MalformedTag, "GeoKeyDirectory shorter than its header");
    }

    const std::size_t key_count = static_cast<std::size_t>(directory[3]);
    if (directory.size() < 4 + 4 * key_count) {
        return Err(Error::Code::MalformedTag,
                   "GeoKeyDirectory declares " + std::to_string(key_count) + " keys but holds " +
                   std::to_string((directory.size() - 4) / 4));
    }

    auto doubles = ifd.double_array(TagCode::GeoDoubleParams);
    if (!doubles) {
        return doubles.error().with_context("GeoDoubleParams");
    }
    auto ascii = ifd.optional_string(TagCode::GeoAsciiParams);
    if (!ascii) {
        return ascii.error().with_context("GeoAsciiParams");
    }

    keys.reserve(key_count);
    for (std::size_t k = 0; k < key_count; ++k) {
        const std::size_t base = 4 + 4 * k;
        GeoKey key;
        key.id = static_cast<uint16_t>(directory[base]);
        key.location = static_cast<uint16_t>(directory[base + 1]);
        key.count = static_cast<uint16_t>(directory[base + 2]);
        const std::size_t value_offset = static_cast<std::size_t>(directory[base + 3]);
        const std::size_t count = key.count;

        auto out_of_range = [&](const char* where) {
            return Err(Error::Code::MalformedTag,
                       "GeoKey " + std::to_string(key.id) + " points outside " + where);
        };

        if (key.location == 0) {
            key.value = std::vector<uint16_t>{static_cast<uint16_t>(value_offset)};
        } else if (key.location == static_cast<uint16_t>(TagCode::GeoKeyDirectory)) {
            if (value_offset > directory.size() || count > directory.size() - value_offset) {
                return out_of_range("GeoKeyDirectory");
            }
            std::vector<uint16_t> shorts;
            for (std::size_t i = 0; i < count; ++i) {
                shorts.push_back(static_cast<uint16_t>(directory[value_offset + i]));
            }
            key.value = std::move(shorts);
        } else if (key.location == static_cast<uint16_t>(TagCode::GeoDoubleParams)) {
            const auto& params = doubles.value();
            if (value_offset > params.size() || count > params.size() - value_offset) {
                return out_of_range("GeoDoubleParams");
            }
            key.value = std::vector<double>(params.begin() + static_cast<std::ptrdiff_t>(value_offset),
                                            params.begin() + static_cast<std::ptrdiff_t>(value_offset + count));
        } else if (key.location == static_cast<uint16_t>(TagCode::GeoAsciiParams)) {
            const std::string text = ascii.value().value_or(std::string{});
            if (value_offset > text.size() || count > text.size() - value_offset) {
                return out_of_range("GeoAsciiParams");
            }
            key.value = detail::trim_geo_ascii(text.substr(value_offset, count));
        } else {
            return Err(Error::Code::MalformedTag,
                       "GeoKey " + std::to_string(key.id) + " stored in unsupported tag " +
                       std::to_string(key.location));
        }
        keys.push_back(std::move(key));
    }
    return Ok(std::move(keys));
}

// ============================================================================
// Transform
// ============================================================================

inline Result<std::optional<Geotransform>> GeoKeyResolver::resolve_transform(const Ifd& ifd, bool pixel_is_point) {
    auto matrix = ifd.double_array(TagCode::ModelTransformation);
    if (!matrix) {
        return matrix.error().with_context("ModelTransformation");
    }
    auto scale = ifd.double_array(TagCode::ModelPixelScale);
    if (!scale) {
        return scale.error().with_context("ModelPixelScale");
    }
    auto tiepoints = ifd.double_array(TagCode::ModelTiepoint);
    if (!tiepoints) {
        return tiepoints.error().with_context("ModelTiepoint");
    }

    std::optional<Geotransform> transform;
    if (matrix.value().size() >= 16) {
        // Row-major 4x4; only the 2D affine part is used
        const auto& m = matrix.value();
        transform = Geotransform{m[0], m[1], m[3], m[4], m[5], m[7]};
    } else if (!matrix.value().empty()) {
        return Err(Error::Code::MalformedTag,
                   "ModelTransformation has " + std::to_string(matrix.value().size()) + " values instead of 16");
    } else if (scale.value().size() >= 2) {
        const double sx = scale.value()[0];
        const double sy = scale.value()[1];
        if (tiepoints.value().size() >= 6) {
            // Tiepoint (I, J, K) -> (X, Y, Z)
            const auto& t = tiepoints.value();
            transform = Geotransform{sx, 0.0, t[3] - t[0] * sx, 0.0, -sy, t[4] + t[1] * sy};
        } else {
            transform = Geotransform{sx, 0.0, 0.0, 0.0, -sy, 0.0};
        }
    }

    if (transform && pixel_is_point) {
        transform->c -= 0.5 * (transform->a + transform->b);
        transform->f -= 0.5 * (transform->d + transform->e);
    }
    return Ok(transform);
}

// ============================================================================
// Resolution
// ============================================================================

inline Result<GeoReference> GeoKeyResolver::resolve(const Ifd& ifd) {
    GeoReference reference;

    auto keys = parse_key_directory(ifd);
    if (!keys) {
        return keys.error();
    }
    for (auto& key : keys.value()) {
        const uint16_t id = key.id;
        reference.keys.emplace(id, std::move(key));
    }

    auto short_key = [&reference](uint16_t id) -> std::optional<uint16_t> {
        const GeoKey* key = reference.find(id);
        return key ? key->as_short() : std::nullopt;
    };
    auto usable_code = [](std::optional<uint16_t> code) -> std::optional<uint16_t> {
        if (!code || *code == 0 || *code == geokey::UserDefined) {
            return std::nullopt;
        }
        return code;
    };

    reference.model_type = short_key(geokey::GTModelType).value_or(0);
    reference.raster_type = short_key(geokey::GTRasterType).value_or(geokey::RasterPixelIsArea);

    const auto projected = usable_code(short_key(geokey::ProjectedCSType));
    const auto geographic = usable_code(short_key(geokey::GeographicType));
    switch (reference.model_type) {
        case geokey::ModelTypeProjected:
            reference.epsg = projected;
            break;
        case geokey::ModelTypeGeographic:
            reference.epsg = geographic;
            break;
        default:
            reference.epsg = projected ? projected : geographic;
            break;
    }

    for (uint16_t id : {geokey::PCSCitation, geokey::GTCitation, geokey::GeogCitation}) {
        const GeoKey* key = reference.find(id);
        if (key && key->as_string()) {
            reference.citation = *key->as_string();
            break;
        }
    }

    auto transform = resolve_transform(ifd, reference.is_pixel_is_point());
    if (!transform) {
        return transform.error();
    }
    reference.transform = transform.value();
    return Ok(std::move(reference));
}

} // namespace cogstream
