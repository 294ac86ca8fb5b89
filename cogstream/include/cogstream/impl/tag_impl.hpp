// This file contains the implementation of Tag and the tag codec.
// Do not include this file directly - it is included by tag.hpp

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "../types/byte_order.hpp"
#include "../types/result.hpp"
#include "../types/tiff_spec.hpp"

#ifndef COGSTREAM_TAG_HEADER
#include "../tag.hpp" // for linters
#endif

namespace cogstream {

// ============================================================================
// Tag accessors
// ============================================================================

namespace detail {

inline Error tag_type_mismatch(uint16_t code, TiffDataType type, const char* wanted) {
    return Err(Error::Code::MalformedTag,
               "Tag " + std::to_string(code) + " has type " +
               std::to_string(static_cast<int>(type)) + ", expected " + wanted);
}

} // namespace detail

inline Result<uint64_t> Tag::as_uint(std::size_t index) const {
    return std::visit([&](const auto& values) -> Result<uint64_t> {
        using V = std::decay_t<decltype(values)>;
        if constexpr (std::is_same_v<V, std::vector<uint8_t>> ||
                      std::is_same_v<V, std::vector<uint16_t>> ||
                      std::is_same_v<V, std::vector<uint32_t>> ||
                      std::is_same_v<V, std::vector<uint64_t>>) {
            if (index >= values.size()) [[unlikely]] {
                return Err(Error::Code::MalformedTag,
                           "Tag " + std::to_string(code_) + " has " + std::to_string(values.size()) +
                           " values, index " + std::to_string(index) + " requested");
            }
            return Ok(static_cast<uint64_t>(values[index]));
        } else {
            return detail::tag_type_mismatch(code_, type_, "an unsigned integer");
        }
    }, value_);
}

inline Result<std::vector<uint64_t>> Tag::as_uint_array() const {
    return std::visit([&](const auto& values) -> Result<std::vector<uint64_t>> {
        using V = std::decay_t<decltype(values)>;
        if constexpr (std::is_same_v<V, std::vector<uint8_t>> ||
                      std::is_same_v<V, std::vector<uint16_t>> ||
                      std::is_same_v<V, std::vector<uint32_t>> ||
                      std::is_same_v<V, std::vector<uint64_t>>) {
            return Ok(std::vector<uint64_t>(values.begin(), values.end()));
        } else {
            return detail::tag_type_mismatch(code_, type_, "an unsigned integer");
        }
    }, value_);
}

inline Result<std::vector<double>> Tag::as_double_array() const {
    return std::visit([&](const auto& values) -> Result<std::vector<double>> {
        using V = std::decay_t<decltype(values)>;
        if constexpr (std::is_same_v<V, std::string>) {
            return detail::tag_type_mismatch(code_, type_, "a numeric type");
        } else {
            std::vector<double> out;
            out.reserve(values.size());
            for (const auto& v : values) {
                using E = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<E, Rational> || std::is_same_v<E, SRational>) {
                    out.push_back(v.denominator == 0
                        ? std::numeric_limits<double>::quiet_NaN()
                        : static_cast<double>(v.numerator) / static_cast<double>(v.denominator));
                } else {
                    out.push_back(static_cast<double>(v));
                }
            }
            return Ok(std::move(out));
        }
    }, value_);
}

inline Result<double> Tag::as_double(std::size_t index) const {
    auto values = as_double_array();
    if (!values) {
        return values.error();
    }
    if (index >= values.value().size()) [[unlikely]] {
        return Err(Error::Code::MalformedTag,
                   "Tag " + std::to_string(code_) + " has " + std::to_string(values.value().size()) +
                   " values, index " + std::to_string(index) + " requested");
    }
    return Ok(values.value()[index]);
}

inline Result<std::string> Tag::as_string() const {
    const auto* text = std::get_if<std::string>(&value_);
    if (!text) [[unlikely]] {
        return detail::tag_type_mismatch(code_, type_, "ASCII");
    }
    std::string out = *text;
    while (!out.empty() && out.back() == '\0') {
        out.pop_back();
    }
    return Ok(std::move(out));
}

inline Result<std::span<const uint8_t>> Tag::as_bytes() const {
    const auto* bytes = std::get_if<std::vector<uint8_t>>(&value_);
    if (!bytes) [[unlikely]] {
        return detail::tag_type_mismatch(code_, type_, "Byte or Undefined");
    }
    return Ok(std::span<const uint8_t>(*bytes));
}

// ============================================================================
// Codec
// ============================================================================

namespace tag_codec {

namespace detail {

template <typename T>
std::vector<T> decode_array(std::span<const std::byte> bytes, uint64_t count, ByteOrder order) {
    std::vector<T> out(static_cast<std::size_t>(count));
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = load_at<T>(bytes, i, order);
    }
    return out;
}

template <typename R, typename I>
std::vector<R> decode_rationals(std::span<const std::byte> bytes, uint64_t count, ByteOrder order) {
    std::vector<R> out(static_cast<std::size_t>(count));
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i].numerator = load_at<I>(bytes, 2 * i, order);
        out[i].denominator = load_at<I>(bytes, 2 * i + 1, order);
    }
    return out;
}

} // namespace detail

inline Result<uint64_t> value_byte_size(uint16_t type, uint64_t count) {
    const std::size_t element_size = tiff_type_size(static_cast<TiffDataType>(type));
    if (element_size == 0) {
        return Err(Error::Code::MalformedTag, "Unknown tag type " + std::to_string(type));
    }
    if (count > std::numeric_limits<uint64_t>::max() / element_size) {
        return Err(Error::Code::MalformedTag, "Tag value count " + std::to_string(count) + " overflows");
    }
    return Ok(count * element_size);
}

inline Result<TagValue> decode_values(
    TiffDataType type,
    uint64_t count,
    std::span<const std::byte> bytes,
    ByteOrder order) {

    auto size_result = value_byte_size(static_cast<uint16_t>(type), count);
    if (!size_result) {
        return size_result.error();
    }
    if (bytes.size() < size_result.value()) [[unlikely]] {
        return Err(Error::Code::MalformedTag, "Tag value block shorter than its count");
    }

    switch (type) {
        case TiffDataType::Byte:
        case TiffDataType::Undefined:
            return Ok(TagValue{detail::decode_array<uint8_t>(bytes, count, order)});
        case TiffDataType::Ascii:
            return Ok(TagValue{std::string(reinterpret_cast<const char*>(bytes.data()),
                                           static_cast<std::size_t>(count))});
        case TiffDataType::Short:
            return Ok(TagValue{detail::decode_array<uint16_t>(bytes, count, order)});
        case TiffDataType::Long:
        case TiffDataType::IFD:
            return Ok(TagValue{detail::decode_array<uint32_t>(bytes, count, order)});
        case TiffDataType::Rational:
            return Ok(TagValue{detail::decode_rationals<Rational, uint32_t>(bytes, count, order)});
        case TiffDataType::SByte:
            return Ok(TagValue{detail::decode_array<int8_t>(bytes, count, order)});
        case TiffDataType::SShort:
            return Ok(TagValue{detail::decode_array<int16_t>(bytes, count, order)});
        case TiffDataType::SLong:
            return Ok(TagValue{detail::decode_array<int32_t>(bytes, count, order)});
        case TiffDataType::SRational:
            return Ok(TagValue{detail::decode_rationals<SRational, int32_t>(bytes, count, order)});
        case TiffDataType::Float:
            return Ok(TagValue{detail::decode_array<float>(bytes, count, order)});
        case TiffDataType::Double:
            return Ok(TagValue{detail::decode_array<double>(bytes, count, order)});
        case TiffDataType::Long8:
        case TiffDataType::IFD8:
            return Ok(TagValue{detail::decode_array<uint64_t>(bytes, count, order)});
        case TiffDataType::SLong8:
            return Ok(TagValue{detail::decode_array<int64_t>(bytes, count, order)});
    }
    return Err(Error::Code::MalformedTag, "Unknown tag type " + std::to_string(static_cast<int>(type)));
}

template <ByteSource Source>
Result<Tag> decode_tag(std::span<const std::byte> entry, const DirectoryReader<Source>& reader) {
    const TiffLayout& layout = reader.layout();
    if (entry.size() < layout.entry_size()) [[unlikely]] {
        return Err(Error::Code::MalformedTag, "Truncated directory entry");
    }

    const ByteOrder order = layout.byte_order;
    const uint16_t code = load<uint16_t>(entry, order);
    const uint16_t raw_type = load<uint16_t>(entry.subspan(2), order);
    const uint64_t count = layout.is_bigtiff()
        ? load<uint64_t>(entry.subspan(4), order)
        : load<uint32_t>(entry.subspan(4), order);
    const std::span<const std::byte> slot = entry.subspan(layout.is_bigtiff() ? 12 : 8,
                                                          layout.value_slot_size());

    auto size_result = value_byte_size(raw_type, count);
    if (!size_result) {
        return size_result.error().with_context("Tag " + std::to_string(code));
    }
    const uint64_t byte_size = size_result.value();
    const auto type = static_cast<TiffDataType>(raw_type);

    if (byte_size <= layout.value_slot_size()) {
        auto value = decode_values(type, count, slot, order);
        if (!value) {
            return value.error();
        }
        return Ok(Tag(code, type, count, std::move(value.value())));
    }

    const uint64_t value_offset = layout.load_offset(slot);
    if (!reader.contains(value_offset, byte_size)) {
        return Err(Error::Code::MalformedTag,
                   "Tag " + std::to_string(code) + " values [" + std::to_string(value_offset) + ", +" +
                   std::to_string(byte_size) + ") extend beyond end of stream");
    }

    auto block = reader.read(value_offset, byte_size);
    if (!block) {
        return block.error();
    }
    auto value = decode_values(type, count, block.value(), order);
    if (!value) {
        return value.error();
    }
    return Ok(Tag(code, type, count, std::move(value.value())));
}

} // namespace tag_codec

} // namespace cogstream
