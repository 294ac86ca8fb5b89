#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>
#include "decompressor_base.hpp"
#include "../types/result.hpp"

namespace cogstream {

/// No compression - simple copy
class NoneDecompressor {
public:
    constexpr NoneDecompressor() noexcept = default;

    ~NoneDecompressor() = default;

    // Non-copyable
    NoneDecompressor(const NoneDecompressor&) = delete;
    NoneDecompressor& operator=(const NoneDecompressor&) = delete;

    // Movable
    constexpr NoneDecompressor(NoneDecompressor&&) noexcept = default;
    constexpr NoneDecompressor& operator=(NoneDecompressor&&) noexcept = default;

    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        if (input.size() > output.size()) {
            return Err(Error::Code::CorruptTile,
                       "Uncompressed tile of " + std::to_string(input.size()) +
                       " bytes larger than expected " + std::to_string(output.size()));
        }

        std::memcpy(output.data(), input.data(), input.size());
        return Ok(input.size());
    }
};

using NoneDecompressorDesc = DecompressorDescriptor<
    NoneDecompressor,
    CompressionScheme::None
>;

/// PackBits decompression (byte-oriented run-length encoding, TIFF 6.0 section 9)
class PackBitsDecompressor {
public:
    constexpr PackBitsDecompressor() noexcept = default;

    ~PackBitsDecompressor() = default;

    PackBitsDecompressor(const PackBitsDecompressor&) = delete;
    PackBitsDecompressor& operator=(const PackBitsDecompressor&) = delete;

    constexpr PackBitsDecompressor(PackBitsDecompressor&&) noexcept = default;
    constexpr PackBitsDecompressor& operator=(PackBitsDecompressor&&) noexcept = default;

    /// Algorithm:
    /// - Read a signed byte n
    /// - If n >= 0: copy next (n+1) bytes literally
    /// - If n < 0 and n != -128: copy next byte (-n+1) times
    /// - If n == -128: no operation (skip)
    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        std::size_t in_pos = 0;
        std::size_t out_pos = 0;

        while (in_pos < input.size()) {
            const int8_t n = static_cast<int8_t>(input[in_pos++]);

            if (n == -128) {
                continue;
            }

            if (n >= 0) {
                const std::size_t count = static_cast<std::size_t>(n) + 1;
                if (in_pos + count > input.size()) {
                    return Err(Error::Code::CorruptTile, "PackBits: unexpected end of input in literal run");
                }
                if (out_pos + count > output.size()) {
                    return Err(Error::Code::CorruptTile, "PackBits: run exceeds the tile size");
                }
                std::memcpy(output.data() + out_pos, input.data() + in_pos, count);
                in_pos += count;
                out_pos += count;
            } else {
                const std::size_t count = static_cast<std::size_t>(-n) + 1;
                if (in_pos >= input.size()) {
                    return Err(Error::Code::CorruptTile, "PackBits: unexpected end of input in replicated run");
                }
                if (out_pos + count > output.size()) {
                    return Err(Error::Code::CorruptTile, "PackBits: run exceeds the tile size");
                }
                std::fill_n(output.data() + out_pos, count, input[in_pos++]);
                out_pos += count;
            }
        }

        return Ok(out_pos);
    }
};

using PackBitsDecompressorDesc = DecompressorDescriptor<
    PackBitsDecompressor,
    CompressionScheme::PackBits
>;

// ============================================================================
// LZW
// ============================================================================

namespace detail {

inline constexpr uint16_t lzw_clear_code = 256;
inline constexpr uint16_t lzw_eoi_code = 257;
inline constexpr uint16_t lzw_first_code = 258;
inline constexpr int lzw_min_bits = 9;
inline constexpr int lzw_max_bits = 12;
inline constexpr std::size_t lzw_table_size = std::size_t{1} << lzw_max_bits;

/// Reads fixed-width codes, most significant bit first (TIFF) or least significant first (old libtiff)
class LzwBitReader {
private:
    std::span<const std::byte> input_;
    std::size_t bit_pos_{0};
    bool msb_first_;

public:
    LzwBitReader(std::span<const std::byte> input, bool msb_first) noexcept
        : input_(input), msb_first_(msb_first) {}

    /// Next code, or -1 once the input is exhausted
    [[nodiscard]] int read(int bits) noexcept {
        if (bit_pos_ + static_cast<std::size_t>(bits) > input_.size() * 8) {
            return -1;
        }
        int code = 0;
        for (int i = 0; i < bits; ++i, ++bit_pos_) {
            const auto byte = static_cast<uint8_t>(input_[bit_pos_ / 8]);
            if (msb_first_) {
                code = (code << 1) | ((byte >> (7 - bit_pos_ % 8)) & 1);
            } else {
                code |= ((byte >> (bit_pos_ % 8)) & 1) << i;
            }
        }
        return code;
    }
};

} // namespace detail

/// LZW decompression as written by libtiff: 9 to 12 bit codes, Clear (256) and
/// EndOfInformation (257) codes, code width growing one code early (at 511, 1023, 2047).
///
/// Streams starting with 0x00 followed by an odd byte are the pre-6.0 "compat"
/// flavour: codes packed least significant bit first, widths growing on time.
class LzwDecompressor {
private:
    struct Entry {
        uint16_t prefix;
        uint16_t length;
        uint8_t suffix;
        uint8_t first;
    };

public:
    LzwDecompressor() noexcept = default;

    ~LzwDecompressor() = default;

    LzwDecompressor(const LzwDecompressor&) = delete;
    LzwDecompressor& operator=(const LzwDecompressor&) = delete;

    LzwDecompressor(LzwDecompressor&&) noexcept = default;
    LzwDecompressor& operator=(LzwDecompressor&&) noexcept = default;

    [[nodiscard]] static bool is_compat_stream(std::span<const std::byte> input) noexcept {
        return input.size() >= 2 && input[0] == std::byte{0} && (static_cast<uint8_t>(input[1]) & 1) != 0;
    }

    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        const bool compat = is_compat_stream(input);
        // Early change: the width grows when the next free code reaches 2^bits - 1
        const int early = compat ? 0 : 1;

        std::vector<Entry> table(detail::lzw_table_size);
        for (uint16_t i = 0; i < 256; ++i) {
            table[i] = Entry{0, 1, static_cast<uint8_t>(i), static_cast<uint8_t>(i)};
        }

        detail::LzwBitReader reader(input, !compat);
        int bits = detail::lzw_min_bits;
        uint16_t next_code = detail::lzw_first_code;
        int previous = -1;
        std::size_t out_pos = 0;

        auto emit = [&](uint16_t code) -> bool {
            const std::size_t length = table[code].length;
            if (out_pos + length > output.size()) {
                return false;
            }
            uint16_t c = code;
            for (std::size_t i = length; i-- > 0;) {
                output[out_pos + i] = static_cast<std::byte>(table[c].suffix);
                c = table[c].prefix;
            }
            out_pos += length;
            return true;
        };

        while (true) {
            const int code = reader.read(bits);
            if (code < 0 || code == detail::lzw_eoi_code) {
                // A missing EndOfInformation code is tolerated, as libtiff does
                break;
            }

            if (code == detail::lzw_clear_code) {
                bits = detail::lzw_min_bits;
                next_code = detail::lzw_first_code;
                previous = -1;
                continue;
            }

            if (previous < 0) {
                if (code > 255) [[unlikely]] {
                    return Err(Error::Code::CorruptTile,
                               "LZW: code " + std::to_string(code) + " right after a clear code");
                }
                if (!emit(static_cast<uint16_t>(code))) {
                    return Err(Error::Code::CorruptTile, "LZW: output exceeds the tile size");
                }
                previous = code;
                continue;
            }

            uint8_t first;
            if (code < next_code) {
                first = table[static_cast<std::size_t>(code)].first;
            } else if (code == next_code && next_code < detail::lzw_table_size) {
                first = table[static_cast<std::size_t>(previous)].first;
            } else [[unlikely]] {
                return Err(Error::Code::CorruptTile,
                           "LZW: code " + std::to_string(code) + " not yet in the table (next is " +
                           std::to_string(next_code) + ")");
            }

            if (next_code < detail::lzw_table_size) {
                const Entry& prev = table[static_cast<std::size_t>(previous)];
                table[next_code] = Entry{static_cast<uint16_t>(previous),
                                         static_cast<uint16_t>(prev.length + 1), first, prev.first};
                ++next_code;
            }

            if (!emit(static_cast<uint16_t>(code))) {
                return Err(Error::Code::CorruptTile, "LZW: output exceeds the tile size");
            }
            previous = code;

            if (next_code + early >= (1 << bits) && bits < detail::lzw_max_bits) {
                ++bits;
            }
        }

        return Ok(out_pos);
    }
};

using LzwDecompressorDesc = DecompressorDescriptor<
    LzwDecompressor,
    CompressionScheme::LZW
>;

} // namespace cogstream
