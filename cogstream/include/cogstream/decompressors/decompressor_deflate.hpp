#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <zlib.h>
#include "decompressor_base.hpp"
#include "../types/result.hpp"

namespace cogstream {

/// Deflate (zlib stream) decompression through zlib.
/// A fresh inflate state is used for each tile, so one instance can serve several threads.
class DeflateDecompressor {
public:
    DeflateDecompressor() noexcept = default;

    ~DeflateDecompressor() = default;

    DeflateDecompressor(const DeflateDecompressor&) = delete;
    DeflateDecompressor& operator=(const DeflateDecompressor&) = delete;

    DeflateDecompressor(DeflateDecompressor&&) noexcept = default;
    DeflateDecompressor& operator=(DeflateDecompressor&&) noexcept = default;

    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        if (input.size() > std::numeric_limits<uInt>::max() ||
            output.size() > std::numeric_limits<uInt>::max()) [[unlikely]] {
            return Err(Error::Code::UnsupportedFeature, "Deflate tile larger than 4 GiB");
        }

        z_stream stream{};
        stream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
        stream.avail_in = static_cast<uInt>(input.size());
        stream.next_out = reinterpret_cast<Bytef*>(output.data());
        stream.avail_out = static_cast<uInt>(output.size());

        if (inflateInit(&stream) != Z_OK) [[unlikely]] {
            return Err(Error::Code::MemoryError, "Failed to initialise zlib inflate state");
        }

        const int status = inflate(&stream, Z_FINISH);
        const std::size_t produced = output.size() - stream.avail_out;
        const std::string message = stream.msg ? stream.msg : "";
        inflateEnd(&stream);

        if (status == Z_STREAM_END) {
            return Ok(produced);
        }
        if (status == Z_BUF_ERROR && stream.avail_out == 0) {
            return Err(Error::Code::CorruptTile, "Deflate stream inflates past the tile size");
        }
        if (status == Z_BUF_ERROR) {
            return Err(Error::Code::CorruptTile,
                       "Deflate stream truncated after " + std::to_string(produced) + " bytes");
        }
        return Err(Error::Code::CorruptTile,
                   "Deflate stream corrupt (zlib status " + std::to_string(status) +
                   (message.empty() ? std::string(")") : "): " + message));
    }
};

/// Handles both the Adobe (8) and the PKZIP (32946) Compression values
using DeflateDecompressorDesc = DecompressorDescriptor<
    DeflateDecompressor,
    CompressionScheme::Deflate_Adobe,
    CompressionScheme::Deflate
>;

} // namespace cogstream
