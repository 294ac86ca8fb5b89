#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include "types/result.hpp"
#include "types/tiff_spec.hpp"

namespace cogstream {

/// Runtime sample type of a raster
enum class DataType : uint8_t {
    UInt8,
    Int8,
    UInt16,
    Int16,
    UInt32,
    Int32,
    UInt64,
    Int64,
    Float32,
    Float64
};

[[nodiscard]] constexpr std::size_t data_type_size(DataType type) noexcept {
    switch (type) {
        case DataType::UInt8:
        case DataType::Int8:    return 1;
        case DataType::UInt16:
        case DataType::Int16:   return 2;
        case DataType::UInt32:
        case DataType::Int32:
        case DataType::Float32: return 4;
        case DataType::UInt64:
        case DataType::Int64:
        case DataType::Float64: return 8;
    }
    return 0;
}

[[nodiscard]] constexpr std::string_view data_type_name(DataType type) noexcept {
    switch (type) {
        case DataType::UInt8:   return "uint8";
        case DataType::Int8:    return "int8";
        case DataType::UInt16:  return "uint16";
        case DataType::Int16:   return "int16";
        case DataType::UInt32:  return "uint32";
        case DataType::Int32:   return "int32";
        case DataType::UInt64:  return "uint64";
        case DataType::Int64:   return "int64";
        case DataType::Float32: return "float32";
        case DataType::Float64: return "float64";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_floating_point(DataType type) noexcept {
    return type == DataType::Float32 || type == DataType::Float64;
}

/// Map a C++ sample type to its DataType
template <typename T>
inline constexpr DataType data_type_of = [] {
    if constexpr (std::is_same_v<T, uint8_t>) return DataType::UInt8;
    else if constexpr (std::is_same_v<T, int8_t>) return DataType::Int8;
    else if constexpr (std::is_same_v<T, uint16_t>) return DataType::UInt16;
    else if constexpr (std::is_same_v<T, int16_t>) return DataType::Int16;
    else if constexpr (std::is_same_v<T, uint32_t>) return DataType::UInt32;
    else if constexpr (std::is_same_v<T, int32_t>) return DataType::Int32;
    else if constexpr (std::is_same_v<T, uint64_t>) return DataType::UInt64;
    else if constexpr (std::is_same_v<T, int64_t>) return DataType::Int64;
    else if constexpr (std::is_same_v<T, float>) return DataType::Float32;
    else {
        static_assert(std::is_same_v<T, double>, "Unsupported raster sample type");
        return DataType::Float64;
    }
}();

/// Resolve SampleFormat + BitsPerSample into a DataType.
/// Sub-byte, 12/24-bit and half-float samples are not supported.
[[nodiscard]] inline Result<DataType> data_type_from_tiff(SampleFormat format, uint16_t bits) {
    switch (format) {
        case SampleFormat::UnsignedInt:
        case SampleFormat::Undefined:
            switch (bits) {
                case 8:  return Ok(DataType::UInt8);
                case 16: return Ok(DataType::UInt16);
                case 32: return Ok(DataType::UInt32);
                case 64: return Ok(DataType::UInt64);
                default: break;
            }
            break;
        case SampleFormat::SignedInt:
            switch (bits) {
                case 8:  return Ok(DataType::Int8);
                case 16: return Ok(DataType::Int16);
                case 32: return Ok(DataType::Int32);
                case 64: return Ok(DataType::Int64);
                default: break;
            }
            break;
        case SampleFormat::IEEEFloat:
            switch (bits) {
                case 32: return Ok(DataType::Float32);
                case 64: return Ok(DataType::Float64);
                default: break;
            }
            break;
    }
    return Err(Error::Code::UnsupportedFeature,
               "Unsupported sample layout: format " + std::to_string(static_cast<int>(format)) +
               " with " + std::to_string(bits) + " bits per sample");
}

/// Owned, row-major pixel buffer of shape (height, width, samples)
class RasterBuffer {
private:
    DataType dtype_{DataType::UInt8};
    std::size_t height_{0};
    std::size_t width_{0};
    std::size_t samples_{0};
    std::vector<std::byte> data_;

    template <typename T>
    void fill_typed(double value) noexcept {
        auto* p = reinterpret_cast<T*>(data_.data());
        const std::size_t n = data_.size() / sizeof(T);
        if constexpr (std::is_integral_v<T>) {
            if (std::isnan(value)) {
                value = 0.0;
            }
        }
        const T v = static_cast<T>(value);
        for (std::size_t i = 0; i < n; ++i) {
            p[i] = v;
        }
    }

public:
    RasterBuffer() = default;

    /// Zero-initialised buffer
    RasterBuffer(DataType dtype, std::size_t height, std::size_t width, std::size_t samples)
        : dtype_(dtype), height_(height), width_(width), samples_(samples),
          data_(height * width * samples * data_type_size(dtype)) {}

    /// Adopt already decoded bytes; returns CorruptTile when the size does not match the shape
    [[nodiscard]] static Result<RasterBuffer> from_bytes(DataType dtype, std::size_t height, std::size_t width,
                                                        std::size_t samples, std::vector<std::byte> bytes) {
        const std::size_t expected = height * width * samples * data_type_size(dtype);
        if (bytes.size() != expected) {
            return Err(Error::Code::CorruptTile,
                       "Decoded size " + std::to_string(bytes.size()) + " does not match expected " +
                       std::to_string(expected) + " bytes");
        }
        RasterBuffer buffer;
        buffer.dtype_ = dtype;
        buffer.height_ = height;
        buffer.width_ = width;
        buffer.samples_ = samples;
        buffer.data_ = std::move(bytes);
        return Ok(std::move(buffer));
    }

    [[nodiscard]] DataType dtype() const noexcept { return dtype_; }
    [[nodiscard]] std::size_t height() const noexcept { return height_; }
    [[nodiscard]] std::size_t width() const noexcept { return width_; }
    [[nodiscard]] std::size_t samples() const noexcept { return samples_; }
    [[nodiscard]] std::size_t sample_size() const noexcept { return data_type_size(dtype_); }
    [[nodiscard]] std::size_t pixel_size() const noexcept { return samples_ * sample_size(); }
    [[nodiscard]] std::size_t row_size() const noexcept { return width_ * pixel_size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    [[nodiscard]] std::span<std::byte> bytes() noexcept { return data_; }
    [[nodiscard]] std::span<const std::byte> bytes() const noexcept { return data_; }

    [[nodiscard]] std::span<std::byte> pixel_bytes(std::size_t row, std::size_t col) noexcept {
        return std::span<std::byte>(data_).subspan((row * width_ + col) * pixel_size(), pixel_size());
    }

    [[nodiscard]] std::span<const std::byte> pixel_bytes(std::size_t row, std::size_t col) const noexcept {
        return std::span<const std::byte>(data_).subspan((row * width_ + col) * pixel_size(), pixel_size());
    }

    /// Typed access; fails when T does not match the buffer's dtype
    template <typename T>
    [[nodiscard]] Result<std::span<T>> view() noexcept {
        if (data_type_of<T> != dtype_) [[unlikely]] {
            return Err(Error::Code::InvalidState,
                       "Raster is " + std::string(data_type_name(dtype_)) + ", not " +
                       std::string(data_type_name(data_type_of<T>)));
        }
        return Ok(std::span<T>(reinterpret_cast<T*>(data_.data()), data_.size() / sizeof(T)));
    }

    template <typename T>
    [[nodiscard]] Result<std::span<const T>> view() const noexcept {
        if (data_type_of<T> != dtype_) [[unlikely]] {
            return Err(Error::Code::InvalidState,
                       "Raster is " + std::string(data_type_name(dtype_)) + ", not " +
                       std::string(data_type_name(data_type_of<T>)));
        }
        return Ok(std::span<const T>(reinterpret_cast<const T*>(data_.data()), data_.size() / sizeof(T)));
    }

    /// Unchecked element read; T must match dtype()
    template <typename T>
    [[nodiscard]] T at(std::size_t row, std::size_t col, std::size_t sample = 0) const noexcept {
        T value;
        std::memcpy(&value, data_.data() + ((row * width_ + col) * samples_ + sample) * sizeof(T), sizeof(T));
        return value;
    }

    /// Set every sample to value, converted to the buffer's dtype
    void fill(double value) noexcept {
        switch (dtype_) {
            case DataType::UInt8:   fill_typed<uint8_t>(value); break;
            case DataType::Int8:    fill_typed<int8_t>(value); break;
            case DataType::UInt16:  fill_typed<uint16_t>(value); break;
            case DataType::Int16:   fill_typed<int16_t>(value); break;
            case DataType::UInt32:  fill_typed<uint32_t>(value); break;
            case DataType::Int32:   fill_typed<int32_t>(value); break;
            case DataType::UInt64:  fill_typed<uint64_t>(value); break;
            case DataType::Int64:   fill_typed<int64_t>(value); break;
            case DataType::Float32: fill_typed<float>(value); break;
            case DataType::Float64: fill_typed<double>(value); break;
        }
    }
};

} // namespace cogstream
