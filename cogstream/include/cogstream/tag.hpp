#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>
#include "byte_source.hpp"
#include "directory_reader.hpp"
#include "types/byte_order.hpp"
#include "types/result.hpp"
#include "types/tiff_spec.hpp"

namespace cogstream {

struct Rational {
    uint32_t numerator;
    uint32_t denominator;
};

struct SRational {
    int32_t numerator;
    int32_t denominator;
};

/// Decoded tag values, one alternative per storage type.
/// Byte and Undefined share std::vector<uint8_t>, IFD and Long share
/// std::vector<uint32_t>, IFD8 and Long8 share std::vector<uint64_t>.
using TagValue = std::variant<
    std::vector<uint8_t>,
    std::string,
    std::vector<uint16_t>,
    std::vector<uint32_t>,
    std::vector<Rational>,
    std::vector<int8_t>,
    std::vector<int16_t>,
    std::vector<int32_t>,
    std::vector<SRational>,
    std::vector<float>,
    std::vector<double>,
    std::vector<uint64_t>,
    std::vector<int64_t>
>;

/// A decoded directory entry. Immutable once parsed.
class Tag {
private:
    uint16_t code_{0};
    TiffDataType type_{TiffDataType::Byte};
    uint64_t count_{0};
    TagValue value_;

public:
    Tag() = default;

    Tag(uint16_t code, TiffDataType type, uint64_t count, TagValue value)
        : code_(code), type_(type), count_(count), value_(std::move(value)) {}

    [[nodiscard]] uint16_t code() const noexcept { return code_; }
    [[nodiscard]] TiffDataType type() const noexcept { return type_; }
    [[nodiscard]] uint64_t count() const noexcept { return count_; }
    [[nodiscard]] const TagValue& value() const noexcept { return value_; }

    [[nodiscard]] bool is(TagCode code) const noexcept {
        return code_ == static_cast<uint16_t>(code);
    }

    /// Element `index` of an unsigned integer tag (Byte, Short, Long, Long8, IFD, IFD8)
    [[nodiscard]] Result<uint64_t> as_uint(std::size_t index = 0) const;

    /// All elements of an unsigned integer tag
    [[nodiscard]] Result<std::vector<uint64_t>> as_uint_array() const;

    /// Element `index` of any numeric tag, rationals divided out
    [[nodiscard]] Result<double> as_double(std::size_t index = 0) const;

    /// All elements of any numeric tag, rationals divided out
    [[nodiscard]] Result<std::vector<double>> as_double_array() const;

    /// ASCII tag content with trailing NULs removed
    [[nodiscard]] Result<std::string> as_string() const;

    /// Raw content of a Byte or Undefined tag (JPEGTables, XMP)
    [[nodiscard]] Result<std::span<const uint8_t>> as_bytes() const;
};

namespace tag_codec {

/// Decode `count` values of `type` packed in `bytes` (already located: inline slot
/// or out-of-line block). Unknown types are Error::Code::MalformedTag.
[[nodiscard]] inline Result<TagValue> decode_values(
    TiffDataType type,
    uint64_t count,
    std::span<const std::byte> bytes,
    ByteOrder order);

/// Total byte size of a tag's values, or MalformedTag on unknown type / overflow
[[nodiscard]] inline Result<uint64_t> value_byte_size(uint16_t type, uint64_t count);

/// Decode a raw 12-byte (classic) or 20-byte (BigTIFF) directory entry.
/// Values that do not fit the entry's slot are fetched from the offset it holds;
/// a value block running past the end of the stream is MalformedTag.
template <ByteSource Source>
[[nodiscard]] Result<Tag> decode_tag(
    std::span<const std::byte> entry,
    const DirectoryReader<Source>& reader);

} // namespace tag_codec

} // namespace cogstream

#define COGSTREAM_TAG_HEADER
#include "impl/tag_impl.hpp"
