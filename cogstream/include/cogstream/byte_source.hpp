#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include "types/result.hpp"

namespace cogstream {

/// Concept for a read-only view into fetched bytes with RAII lifetime management
/// Only one thread at a time should access the view
template <typename T>
concept DataReadOnlyView = requires(T view) {
    { view.data() } -> std::same_as<std::span<const std::byte>>;
    { view.size() } -> std::same_as<std::size_t>;
    { view.empty() } -> std::same_as<bool>;

    // Must be movable for Result<T> and transferring ownership
    requires std::move_constructible<T>;
    requires std::is_nothrow_move_constructible_v<T>;
};

/// Concept for the random-access byte source a COG is read from.
///
/// This is the seam to the transport: an HTTP client issuing Range requests,
/// an object store client, a local file. Implementations must:
/// - return exactly `length` bytes for a range inside the stream,
/// - report failures with Error::Code::Transport (they are passed through unchanged),
/// - support concurrent read_range() calls from several threads.
template <typename T>
concept ByteSource = requires(const T source, uint64_t offset, uint64_t length) {
    { source.read_range(offset, length) } -> std::same_as<Result<typename T::ReadViewType>>;
    requires DataReadOnlyView<typename T::ReadViewType>;

    // Total length of the stream in bytes
    { source.length() } -> std::same_as<Result<uint64_t>>;
};

/// Read-only view for borrowed data (zero-copy)
class BorrowedReadView {
private:
    std::span<const std::byte> data_;

public:
    BorrowedReadView() noexcept = default;

    explicit BorrowedReadView(std::span<const std::byte> data) noexcept
        : data_(data) {}

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    BorrowedReadView(BorrowedReadView&&) noexcept = default;
    BorrowedReadView& operator=(BorrowedReadView&&) noexcept = default;
    BorrowedReadView(const BorrowedReadView&) = delete;
    BorrowedReadView& operator=(const BorrowedReadView&) = delete;
};

static_assert(DataReadOnlyView<BorrowedReadView>, "BorrowedReadView must satisfy DataReadOnlyView concept");

/// Read-only view that owns its buffer
class OwnedReadView {
private:
    std::span<const std::byte> data_;
    std::shared_ptr<std::byte[]> buffer_;  // Owns the data

public:
    OwnedReadView() noexcept = default;

    OwnedReadView(std::span<const std::byte> data, std::shared_ptr<std::byte[]> buffer) noexcept
        : data_(data), buffer_(std::move(buffer)) {}

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    OwnedReadView(OwnedReadView&&) noexcept = default;
    OwnedReadView& operator=(OwnedReadView&&) noexcept = default;
    OwnedReadView(const OwnedReadView&) = delete;
    OwnedReadView& operator=(const OwnedReadView&) = delete;
};

static_assert(DataReadOnlyView<OwnedReadView>, "OwnedReadView must satisfy DataReadOnlyView concept");

/// Check that [offset, offset + length) lies inside a stream of the given size
[[nodiscard]] constexpr bool range_within(uint64_t offset, uint64_t length, uint64_t stream_size) noexcept {
    return offset <= stream_size && length <= stream_size - offset;
}

} // namespace cogstream
