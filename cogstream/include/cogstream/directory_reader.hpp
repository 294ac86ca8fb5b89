#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>
#include "byte_source.hpp"
#include "header.hpp"
#include "types/result.hpp"

namespace cogstream {

/// Metadata reader over a ByteSource.
///
/// Opening fetches the first `prefix_size` bytes in a single range request.
/// COG writers put every IFD and most tag arrays at the start of the file,
/// so directory parsing is usually served from that prefix without another
/// round trip. Reads outside the prefix go to the source.
///
/// Thread-safe after open(): the prefix is immutable.
template <ByteSource Source>
class DirectoryReader {
private:
    const Source* source_{nullptr};
    uint64_t stream_length_{0};
    std::vector<std::byte> prefix_;
    TiffLayout layout_;
    mutable std::atomic<std::size_t> source_reads_{0};

    DirectoryReader() = default;

public:
    DirectoryReader(DirectoryReader&& other) noexcept
        : source_(other.source_)
        , stream_length_(other.stream_length_)
        , prefix_(std::move(other.prefix_))
        , layout_(other.layout_)
        , source_reads_(other.source_reads_.load()) {}

    DirectoryReader& operator=(DirectoryReader&&) = delete;
    DirectoryReader(const DirectoryReader&) = delete;
    DirectoryReader& operator=(const DirectoryReader&) = delete;

    /// Fetch the prefix and parse the TIFF header.
    /// The source must outlive the returned reader.
    [[nodiscard]] static Result<DirectoryReader> open(const Source& source, uint64_t prefix_size) {
        auto length_result = source.length();
        if (!length_result) {
            return length_result.error();
        }

        DirectoryReader reader;
        reader.source_ = &source;
        reader.stream_length_ = length_result.value();

        if (reader.stream_length_ < 8) {
            return Err(Error::Code::InvalidTiff,
                       "Stream of " + std::to_string(reader.stream_length_) + " bytes is too short for TIFF");
        }

        const uint64_t to_fetch = std::min<uint64_t>(std::max<uint64_t>(prefix_size, max_header_size),
                                                     reader.stream_length_);
        auto view_result = source.read_range(0, to_fetch);
        if (!view_result) {
            return view_result.error();
        }
        reader.source_reads_.fetch_add(1, std::memory_order_relaxed);

        const auto& view = view_result.value();
        reader.prefix_.assign(view.data().begin(), view.data().end());

        auto layout_result = parse_header(reader.prefix_);
        if (!layout_result) {
            return layout_result.error();
        }
        reader.layout_ = layout_result.value();

        if (reader.layout_.first_ifd_offset >= reader.stream_length_) {
            return Err(Error::Code::InvalidTiff,
                       "First IFD offset " + std::to_string(reader.layout_.first_ifd_offset) +
                       " beyond end of stream");
        }
        return Ok(std::move(reader));
    }

    [[nodiscard]] const TiffLayout& layout() const noexcept { return layout_; }
    [[nodiscard]] ByteOrder byte_order() const noexcept { return layout_.byte_order; }
    [[nodiscard]] uint64_t stream_length() const noexcept { return stream_length_; }
    [[nodiscard]] std::size_t prefix_size() const noexcept { return prefix_.size(); }

    /// Number of range requests issued to the source, the prefix included
    [[nodiscard]] std::size_t source_reads() const noexcept {
        return source_reads_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool contains(uint64_t offset, uint64_t length) const noexcept {
        return range_within(offset, length, stream_length_);
    }

    /// Copy [offset, offset + length) out of the prefix or the source.
    /// The caller validates the range against stream_length() first, to pick its own error code.
    [[nodiscard]] Result<std::vector<std::byte>> read(uint64_t offset, uint64_t length) const {
        if (range_within(offset, length, prefix_.size())) {
            const auto begin = prefix_.begin() + static_cast<std::ptrdiff_t>(offset);
            return Ok(std::vector<std::byte>(begin, begin + static_cast<std::ptrdiff_t>(length)));
        }

        auto view_result = source_->read_range(offset, length);
        if (!view_result) {
            return view_result.error();
        }
        source_reads_.fetch_add(1, std::memory_order_relaxed);

        const auto& view = view_result.value();
        if (view.size() != length) [[unlikely]] {
            return Err(Error::Code::Transport,
                       "Short read at offset " + std::to_string(offset) + ": got " +
                       std::to_string(view.size()) + " of " + std::to_string(length) + " bytes");
        }
        return Ok(std::vector<std::byte>(view.data().begin(), view.data().end()));
    }
};

} // namespace cogstream
