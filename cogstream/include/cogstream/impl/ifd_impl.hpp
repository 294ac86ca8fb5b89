// This file contains the implementation of Ifd and parse_ifd.
// Do not include this file directly - it is included by ifd.hpp

#pragma once

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "../types/byte_order.hpp"
#include "../types/result.hpp"

#ifndef COGSTREAM_IFD_HEADER
#include "../ifd.hpp" // for linters
#endif

namespace cogstream {

// ============================================================================
// Tag storage
// ============================================================================

inline bool Ifd::add(Tag tag) {
    const uint16_t code = tag.code();
    if (index_.contains(code)) {
        duplicate_codes_.push_back(code);
        return false;
    }
    index_.emplace(code, tags_.size());
    tags_.push_back(std::move(tag));
    return true;
}

inline const Tag* Ifd::find(uint16_t code) const noexcept {
    auto it = index_.find(code);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tags_[it->second];
}

// ============================================================================
// Generic typed lookups
// ============================================================================

inline Result<uint64_t> Ifd::uint_or(TagCode code, uint64_t fallback) const {
    const Tag* tag = find(code);
    if (!tag) {
        return Ok(fallback);
    }
    return tag->as_uint(0);
}

inline Result<std::optional<uint64_t>> Ifd::optional_uint(TagCode code) const {
    const Tag* tag = find(code);
    if (!tag) {
        return Ok(std::optional<uint64_t>{});
    }
    auto value = tag->as_uint(0);
    if (!value) {
        return value.error();
    }
    return Ok(std::optional<uint64_t>{value.value()});
}

inline Result<std::vector<uint64_t>> Ifd::uint_array(TagCode code) const {
    const Tag* tag = find(code);
    if (!tag) {
        return Ok(std::vector<uint64_t>{});
    }
    return tag->as_uint_array();
}

inline Result<std::vector<double>> Ifd::double_array(TagCode code) const {
    const Tag* tag = find(code);
    if (!tag) {
        return Ok(std::vector<double>{});
    }
    return tag->as_double_array();
}

inline Result<std::optional<std::string>> Ifd::optional_string(TagCode code) const {
    const Tag* tag = find(code);
    if (!tag) {
        return Ok(std::optional<std::string>{});
    }
    auto value = tag->as_string();
    if (!value) {
        return value.error();
    }
    return Ok(std::optional<std::string>{std::move(value.value())});
}

// ============================================================================
// Named accessors
// ============================================================================

namespace detail {

inline Result<uint64_t> required_uint(const Ifd& ifd, TagCode code, const char* name) {
    auto value = ifd.optional_uint(code);
    if (!value) {
        return value.error();
    }
    if (!value.value()) {
        return Err(Error::Code::InvalidTiff,
                   std::string("Missing required tag ") + name + " in IFD at offset " +
                   std::to_string(ifd.offset()));
    }
    return Ok(*value.value());
}

/// SHORT-sized field; a wider value stored as LONG is MalformedTag, not truncated
inline Result<uint16_t> short_or(const Ifd& ifd, TagCode code, uint16_t fallback, const char* name) {
    auto value = ifd.uint_or(code, fallback);
    if (!value) {
        return value.error();
    }
    if (value.value() > std::numeric_limits<uint16_t>::max()) {
        return Err(Error::Code::MalformedTag,
                   std::string(name) + " value " + std::to_string(value.value()) + " does not fit 16 bits");
    }
    return Ok(static_cast<uint16_t>(value.value()));
}

template <typename Enum>
Result<Enum> enum_or(const Ifd& ifd, TagCode code, Enum fallback, const char* name) {
    return short_or(ifd, code, static_cast<uint16_t>(fallback), name).transform([](uint16_t v) {
        return static_cast<Enum>(v);
    });
}

} // namespace detail

inline Result<uint64_t> Ifd::image_width() const {
    return detail::required_uint(*this, TagCode::ImageWidth, "ImageWidth");
}

inline Result<uint64_t> Ifd::image_height() const {
    return detail::required_uint(*this, TagCode::ImageLength, "ImageLength");
}

inline Result<std::optional<uint64_t>> Ifd::tile_width() const {
    return optional_uint(TagCode::TileWidth);
}

inline Result<std::optional<uint64_t>> Ifd::tile_height() const {
    return optional_uint(TagCode::TileLength);
}

inline Result<uint16_t> Ifd::compression() const {
    return detail::short_or(*this, TagCode::Compression, 1, "Compression");
}

inline Result<uint16_t> Ifd::samples_per_pixel() const {
    return detail::short_or(*this, TagCode::SamplesPerPixel, 1, "SamplesPerPixel");
}

inline Result<std::vector<uint16_t>> Ifd::bits_per_sample() const {
    auto samples = samples_per_pixel();
    if (!samples) {
        return samples.error();
    }
    auto values = uint_array(TagCode::BitsPerSample);
    if (!values) {
        return values.error();
    }
    if (values.value().empty()) {
        return Ok(std::vector<uint16_t>(samples.value(), 1));
    }
    for (uint64_t bits : values.value()) {
        if (bits > std::numeric_limits<uint16_t>::max()) {
            return Err(Error::Code::MalformedTag, "BitsPerSample value " + std::to_string(bits) + " does not fit 16 bits");
        }
    }
    return Ok(std::vector<uint16_t>(values.value().begin(), values.value().end()));
}

inline Result<SampleFormat> Ifd::sample_format() const {
    return detail::enum_or(*this, TagCode::SampleFormat, SampleFormat::UnsignedInt, "SampleFormat");
}

inline Result<Predictor> Ifd::predictor() const {
    return detail::enum_or(*this, TagCode::Predictor, Predictor::None, "Predictor");
}

inline Result<PlanarConfiguration> Ifd::planar_configuration() const {
    return detail::enum_or(*this, TagCode::PlanarConfiguration, PlanarConfiguration::Chunky, "PlanarConfiguration");
}

inline Result<std::optional<uint16_t>> Ifd::photometric() const {
    return optional_uint(TagCode::PhotometricInterpretation).transform([](std::optional<uint64_t> v) {
        return v ? std::optional<uint16_t>(static_cast<uint16_t>(*v)) : std::nullopt;
    });
}

inline Result<uint32_t> Ifd::new_subfile_type() const {
    return uint_or(TagCode::NewSubfileType, 0).transform([](uint64_t v) {
        return static_cast<uint32_t>(v);
    });
}

inline Result<std::optional<double>> Ifd::nodata() const {
    auto text = optional_string(TagCode::GDAL_NoData);
    if (!text) {
        return text.error();
    }
    if (!text.value()) {
        return Ok(std::optional<double>{});
    }

    std::string value = *text.value();
    while (!value.empty() && (value.back() == ' ' || value.back() == '\n')) {
        value.pop_back();
    }
    // strtod accepts "nan", "inf" and "-inf" in any case
    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (value.empty() || end != value.c_str() + value.size() || errno == ERANGE) {
        return Err(Error::Code::MalformedTag, "GDAL_NODATA value '" + value + "' is not a number");
    }
    return Ok(std::optional<double>{parsed});
}

inline bool Ifd::is_mask() const noexcept {
    auto type = new_subfile_type();
    return type && (type.value() & subfile::TransparencyMask) != 0;
}

inline bool Ifd::is_reduced_resolution() const noexcept {
    auto type = new_subfile_type();
    return type && (type.value() & subfile::ReducedResolution) != 0;
}

inline Result<std::pair<uint64_t, uint64_t>> Ifd::tile_count() const {
    auto width = image_width();
    if (!width) {
        return width.error();
    }
    auto height = image_height();
    if (!height) {
        return height.error();
    }

    uint64_t block_width = width.value();
    uint64_t block_height = height.value();
    if (is_tiled()) {
        auto tw = tile_width();
        auto th = tile_height();
        if (!tw) {
            return tw.error();
        }
        if (!th) {
            return th.error();
        }
        block_width = *tw.value();
        block_height = *th.value();
    } else {
        auto rows = uint_or(TagCode::RowsPerStrip, height.value());
        if (!rows) {
            return rows.error();
        }
        block_height = std::min(rows.value(), height.value());
    }

    if (block_width == 0 || block_height == 0) {
        return Err(Error::Code::InvalidTiff, "Zero tile or strip size");
    }
    return Ok(std::pair<uint64_t, uint64_t>{
        (width.value() + block_width - 1) / block_width,
        (height.value() + block_height - 1) / block_height});
}

// ============================================================================
// Parsing
// ============================================================================

template <ByteSource Source>
Result<Ifd> parse_ifd(const DirectoryReader<Source>& reader, uint64_t offset, const Logger& logger) {
    const TiffLayout& layout = reader.layout();

    if (!reader.contains(offset, layout.entry_count_size())) {
        return Err(Error::Code::InvalidTiff,
                   "IFD offset " + std::to_string(offset) + " beyond end of stream");
    }

    auto count_bytes = reader.read(offset, layout.entry_count_size());
    if (!count_bytes) {
        return count_bytes.error();
    }
    const uint64_t entry_count = layout.is_bigtiff()
        ? load<uint64_t>(count_bytes.value(), layout.byte_order)
        : load<uint16_t>(count_bytes.value(), layout.byte_order);

    if (entry_count > std::numeric_limits<uint64_t>::max() / layout.entry_size()) [[unlikely]] {
        return Err(Error::Code::InvalidTiff, "IFD entry count overflows");
    }
    const uint64_t entries_offset = offset + layout.entry_count_size();
    const uint64_t body_size = entry_count * layout.entry_size() + layout.offset_size();
    if (!reader.contains(entries_offset, body_size)) {
        return Err(Error::Code::InvalidTiff,
                   "IFD at offset " + std::to_string(offset) + " with " + std::to_string(entry_count) +
                   " entries extends beyond end of stream");
    }

    auto body = reader.read(entries_offset, body_size);
    if (!body) {
        return body.error();
    }
    const std::span<const std::byte> bytes(body.value());

    Ifd ifd(offset);
    for (uint64_t i = 0; i < entry_count; ++i) {
        const auto entry = bytes.subspan(static_cast<std::size_t>(i * layout.entry_size()), layout.entry_size());
        const uint16_t raw_type = load<uint16_t>(entry.subspan(2), layout.byte_order);
        if (tiff_type_size(static_cast<TiffDataType>(raw_type)) == 0) {
            logger.warn("IFD at offset {}: skipping tag {} with unknown type {}",
                        offset, load<uint16_t>(entry, layout.byte_order), raw_type);
            continue;
        }

        auto tag = tag_codec::decode_tag(entry, reader);
        if (!tag) {
            return tag.error();
        }
        const uint16_t code = tag.value().code();
        if (!ifd.add(std::move(tag.value()))) {
            logger.warn("IFD at offset {}: duplicate tag {}, keeping the first occurrence", offset, code);
        }
    }

    ifd.set_next_offset(layout.load_offset(
        bytes.subspan(static_cast<std::size_t>(entry_count * layout.entry_size()), layout.offset_size())));
    return Ok(std::move(ifd));
}

} // namespace cogstream
