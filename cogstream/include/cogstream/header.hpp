#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include "types/byte_order.hpp"
#include "types/result.hpp"

namespace cogstream {

/// Classic TIFF or BigTIFF
enum class TiffFormat : uint8_t {
    Classic, ///< 32-bit offsets, magic 42
    BigTIFF  ///< 64-bit offsets, magic 43
};

/// Container layout decided by the 8 or 16 byte file header
struct TiffLayout {
    ByteOrder byte_order{ByteOrder::LittleEndian};
    TiffFormat format{TiffFormat::Classic};
    uint64_t first_ifd_offset{0};

    [[nodiscard]] constexpr bool is_bigtiff() const noexcept { return format == TiffFormat::BigTIFF; }

    /// Size of one directory entry (12 or 20 bytes)
    [[nodiscard]] constexpr std::size_t entry_size() const noexcept { return is_bigtiff() ? 20 : 12; }

    /// Size of the inline value slot of an entry (4 or 8 bytes)
    [[nodiscard]] constexpr std::size_t value_slot_size() const noexcept { return is_bigtiff() ? 8 : 4; }

    /// Size of the entry count preceding each IFD (2 or 8 bytes)
    [[nodiscard]] constexpr std::size_t entry_count_size() const noexcept { return is_bigtiff() ? 8 : 2; }

    /// Size of the next-IFD offset following each IFD (4 or 8 bytes)
    [[nodiscard]] constexpr std::size_t offset_size() const noexcept { return is_bigtiff() ? 8 : 4; }

    /// Smallest header size for this format
    [[nodiscard]] constexpr std::size_t header_size() const noexcept { return is_bigtiff() ? 16 : 8; }

    /// Read an offset-sized unsigned value (u32 or u64)
    [[nodiscard]] uint64_t load_offset(std::span<const std::byte> bytes) const noexcept {
        return is_bigtiff() ? load<uint64_t>(bytes, byte_order) : load<uint32_t>(bytes, byte_order);
    }
};

/// Bytes needed to run parse_header() on any TIFF flavour
inline constexpr std::size_t max_header_size = 16;

/// Detect "II*\0", "MM\0*", "II+\0" and "MM\0+" and decode the first IFD offset.
/// Anything else is Error::Code::InvalidTiff.
[[nodiscard]] inline Result<TiffLayout> parse_header(std::span<const std::byte> bytes) {
    if (bytes.size() < 8) [[unlikely]] {
        return Err(Error::Code::InvalidTiff, "Stream too short for a TIFF header");
    }

    const auto b0 = static_cast<uint8_t>(bytes[0]);
    const auto b1 = static_cast<uint8_t>(bytes[1]);

    TiffLayout layout;
    if (b0 == 'I' && b1 == 'I') {
        layout.byte_order = ByteOrder::LittleEndian;
    } else if (b0 == 'M' && b1 == 'M') {
        layout.byte_order = ByteOrder::BigEndian;
    } else {
        return Err(Error::Code::InvalidTiff, "Not a TIFF file: bad byte order marker");
    }

    const uint16_t version = load<uint16_t>(bytes.subspan(2), layout.byte_order);
    if (version == 42) {
        layout.format = TiffFormat::Classic;
        layout.first_ifd_offset = load<uint32_t>(bytes.subspan(4), layout.byte_order);
    } else if (version == 43) {
        layout.format = TiffFormat::BigTIFF;
        if (bytes.size() < 16) [[unlikely]] {
            return Err(Error::Code::InvalidTiff, "Stream too short for a BigTIFF header");
        }
        const uint16_t offset_bytesize = load<uint16_t>(bytes.subspan(4), layout.byte_order);
        const uint16_t reserved = load<uint16_t>(bytes.subspan(6), layout.byte_order);
        if (offset_bytesize != 8 || reserved != 0) {
            return Err(Error::Code::InvalidTiff, "Invalid BigTIFF header");
        }
        layout.first_ifd_offset = load<uint64_t>(bytes.subspan(8), layout.byte_order);
    } else {
        return Err(Error::Code::InvalidTiff, "Not a TIFF file: magic " + std::to_string(version));
    }

    if (layout.first_ifd_offset < layout.header_size()) {
        return Err(Error::Code::InvalidTiff,
                   "First IFD offset " + std::to_string(layout.first_ifd_offset) + " points into the header");
    }
    return Ok(layout);
}

} // namespace cogstream
