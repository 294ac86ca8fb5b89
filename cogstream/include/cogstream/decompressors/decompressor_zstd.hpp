#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <zstd.h>
#include "decompressor_base.hpp"
#include "../types/result.hpp"

namespace cogstream {

/// RAII wrapper for a ZSTD decompression context.
/// The context is allocated lazily on first use and reused afterwards;
/// an instance must not be shared between threads.
class ZstdDecompressor {
private:
    struct ZstdContextDeleter {
        void operator()(ZSTD_DCtx* ctx) const noexcept {
            if (ctx) {
                ZSTD_freeDCtx(ctx);
            }
        }
    };

    mutable std::unique_ptr<ZSTD_DCtx, ZstdContextDeleter> context_;

    [[nodiscard]] Result<ZSTD_DCtx*> ensure_context() const noexcept {
        if (!context_) {
            context_.reset(ZSTD_createDCtx());
            if (!context_) {
                return Err(Error::Code::MemoryError,
                           "Failed to create ZSTD decompression context");
            }
        }
        return Ok(context_.get());
    }

public:
    ZstdDecompressor() noexcept = default;

    ~ZstdDecompressor() = default;

    // Non-copyable
    ZstdDecompressor(const ZstdDecompressor&) = delete;
    ZstdDecompressor& operator=(const ZstdDecompressor&) = delete;

    // Movable
    ZstdDecompressor(ZstdDecompressor&&) noexcept = default;
    ZstdDecompressor& operator=(ZstdDecompressor&&) noexcept = default;

    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        // A frame announcing more than one tile of data is corrupt
        const unsigned long long declared = ZSTD_getFrameContentSize(input.data(), input.size());
        if (declared == ZSTD_CONTENTSIZE_ERROR) {
            return Err(Error::Code::CorruptTile, "Invalid ZSTD frame header");
        }
        if (declared != ZSTD_CONTENTSIZE_UNKNOWN && declared > output.size()) {
            return Err(Error::Code::CorruptTile,
                       "ZSTD frame holds " + std::to_string(declared) + " bytes, expected " +
                       std::to_string(output.size()));
        }

        auto ctx_result = ensure_context();
        if (!ctx_result) {
            return ctx_result.error();
        }

        const std::size_t result = ZSTD_decompressDCtx(
            ctx_result.value(),
            output.data(),
            output.size(),
            input.data(),
            input.size());

        if (ZSTD_isError(result)) {
            return Err(Error::Code::CorruptTile,
                       std::string("ZSTD decompression failed: ") + ZSTD_getErrorName(result));
        }

        return Ok(result);
    }
};

/// Handles both the registered (50000) and the older alternative (34926) Compression values
using ZstdDecompressorDesc = DecompressorDescriptor<
    ZstdDecompressor,
    CompressionScheme::ZSTD,
    CompressionScheme::ZSTD_Alt
>;

} // namespace cogstream
