#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include "../byte_source.hpp"

namespace cogstream {

/// Byte source over a borrowed in-memory buffer (zero-copy).
/// The buffer must outlive the source and every view it returned.
class BufferViewSource {
private:
    std::span<const std::byte> buffer_;

public:
    using ReadViewType = BorrowedReadView;

    BufferViewSource() noexcept = default;

    explicit BufferViewSource(std::span<const std::byte> buffer) noexcept
        : buffer_(buffer) {}

    template <typename T>
    explicit BufferViewSource(std::span<const T> data) noexcept
        : buffer_(std::as_bytes(data)) {}

    [[nodiscard]] Result<ReadViewType> read_range(uint64_t offset, uint64_t length) const noexcept {
        if (!range_within(offset, length, buffer_.size())) [[unlikely]] {
            return Err(Error::Code::Transport,
                       "Range [" + std::to_string(offset) + ", +" + std::to_string(length) +
                       ") beyond buffer of " + std::to_string(buffer_.size()) + " bytes");
        }
        return Ok(BorrowedReadView(buffer_.subspan(static_cast<std::size_t>(offset),
                                                   static_cast<std::size_t>(length))));
    }

    [[nodiscard]] Result<uint64_t> length() const noexcept {
        return Ok(static_cast<uint64_t>(buffer_.size()));
    }
};

static_assert(ByteSource<BufferViewSource>, "BufferViewSource must satisfy ByteSource concept");

/// Byte source owning an in-memory copy of the whole stream.
/// Copies of the source share the same immutable buffer.
class MemorySource {
private:
    std::shared_ptr<const std::vector<std::byte>> buffer_;

public:
    using ReadViewType = BorrowedReadView;

    MemorySource() noexcept
        : buffer_(std::make_shared<const std::vector<std::byte>>()) {}

    explicit MemorySource(std::vector<std::byte> bytes)
        : buffer_(std::make_shared<const std::vector<std::byte>>(std::move(bytes))) {}

    [[nodiscard]] Result<ReadViewType> read_range(uint64_t offset, uint64_t length) const noexcept {
        return BufferViewSource(std::span<const std::byte>(*buffer_)).read_range(offset, length);
    }

    [[nodiscard]] Result<uint64_t> length() const noexcept {
        return Ok(static_cast<uint64_t>(buffer_->size()));
    }

    [[nodiscard]] std::span<const std::byte> bytes() const noexcept {
        return *buffer_;
    }
};

static_assert(ByteSource<MemorySource>, "MemorySource must satisfy ByteSource concept");

} // namespace cogstream
