#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>
#include <utility>

namespace cogstream {

/// Byte order of a TIFF stream, fixed once by its header
enum class ByteOrder : uint8_t {
    LittleEndian, ///< "II"
    BigEndian     ///< "MM"
};

[[nodiscard]] constexpr ByteOrder native_byte_order() noexcept {
    return std::endian::native == std::endian::little ? ByteOrder::LittleEndian : ByteOrder::BigEndian;
}

template <typename T>
constexpr T byteswap(T value) noexcept requires std::is_integral_v<T> {
    using U = std::make_unsigned_t<T>;
    U v = static_cast<U>(value);
    if constexpr (sizeof(T) == 1) {
        return value;
    } else if constexpr (sizeof(T) == 2) {
        return static_cast<T>(static_cast<U>((v >> 8) | (v << 8)));
    } else if constexpr (sizeof(T) == 4) {
        return static_cast<T>(
            ((v & 0xFF000000u) >> 24) |
            ((v & 0x00FF0000u) >> 8)  |
            ((v & 0x0000FF00u) << 8)  |
            ((v & 0x000000FFu) << 24)
        );
    } else if constexpr (sizeof(T) == 8) {
        return static_cast<T>(
            ((v & 0xFF00000000000000ULL) >> 56) |
            ((v & 0x00FF000000000000ULL) >> 40) |
            ((v & 0x0000FF0000000000ULL) >> 24) |
            ((v & 0x000000FF00000000ULL) >> 8)  |
            ((v & 0x00000000FF000000ULL) << 8)  |
            ((v & 0x0000000000FF0000ULL) << 24) |
            ((v & 0x000000000000FF00ULL) << 40) |
            ((v & 0x00000000000000FFULL) << 56)
        );
    }
}

/// Load a value of type T stored in the given byte order from the start of bytes.
/// The caller guarantees bytes.size() >= sizeof(T).
template <typename T>
    requires (std::is_integral_v<T> || std::is_floating_point_v<T>)
[[nodiscard]] inline T load(std::span<const std::byte> bytes, ByteOrder order) noexcept {
    if constexpr (std::is_floating_point_v<T>) {
        using U = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
        return std::bit_cast<T>(load<U>(bytes, order));
    } else {
        T value;
        std::memcpy(&value, bytes.data(), sizeof(T));
        if (order != native_byte_order()) {
            value = byteswap(value);
        }
        return value;
    }
}

/// Load the value at element index i of a packed array of T
template <typename T>
[[nodiscard]] inline T load_at(std::span<const std::byte> bytes, std::size_t i, ByteOrder order) noexcept {
    return load<T>(bytes.subspan(i * sizeof(T), sizeof(T)), order);
}

/// Swap every sample of a packed buffer in place, for 2, 4 and 8 byte samples
inline void swap_samples_in_place(std::span<std::byte> data, std::size_t bytes_per_sample) noexcept {
    if (bytes_per_sample <= 1) {
        return;
    }
    const std::size_t count = data.size() / bytes_per_sample;
    for (std::size_t i = 0; i < count; ++i) {
        std::byte* p = data.data() + i * bytes_per_sample;
        for (std::size_t lo = 0, hi = bytes_per_sample - 1; lo < hi; ++lo, --hi) {
            std::swap(p[lo], p[hi]);
        }
    }
}

} // namespace cogstream
