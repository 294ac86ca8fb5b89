// This file contains the implementation of the TIFF predictors.
// Do not include this file directly - it is included by predictor.hpp

#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>
#include "../types/byte_order.hpp"

#ifndef COGSTREAM_PREDICTOR_HEADER
#include "../predictor.hpp" // for linters
#endif

namespace cogstream {

namespace predictor {

namespace detail {

/// Horizontal differencing decode with a compile-time sample count
template <DeltaDecodableInteger T, std::size_t SamplesPerPixel>
inline void delta_decode_horizontal_impl(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride) noexcept {

    for (std::size_t y = 0; y < height; ++y) {
        std::size_t row_offset = y * stride;

        for (std::size_t x = 1; x < width; ++x) {
            for (std::size_t s = 0; s < SamplesPerPixel; ++s) {
                std::size_t curr_idx = row_offset + x * SamplesPerPixel + s;
                std::size_t prev_idx = row_offset + (x - 1) * SamplesPerPixel + s;
                buffer[curr_idx] = static_cast<T>(buffer[curr_idx] + buffer[prev_idx]);
            }
        }
    }
}

template <DeltaDecodableInteger T, std::size_t SamplesPerPixel>
inline void delta_encode_horizontal_impl(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride) noexcept {

    for (std::size_t y = 0; y < height; ++y) {
        std::size_t row_offset = y * stride;

        // Right to left so the previous value is still unencoded
        for (std::size_t x = width - 1; x > 0; --x) {
            for (std::size_t s = 0; s < SamplesPerPixel; ++s) {
                std::size_t curr_idx = row_offset + x * SamplesPerPixel + s;
                std::size_t prev_idx = row_offset + (x - 1) * SamplesPerPixel + s;
                buffer[curr_idx] = static_cast<T>(buffer[curr_idx] - buffer[prev_idx]);
            }
        }
    }
}

template <DeltaDecodableInteger T>
inline void delta_decode_generic(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride,
    std::size_t samples_per_pixel) noexcept {

    for (std::size_t y = 0; y < height; ++y) {
        std::size_t row_offset = y * stride;
        for (std::size_t x = 1; x < width; ++x) {
            for (std::size_t s = 0; s < samples_per_pixel; ++s) {
                std::size_t curr_idx = row_offset + x * samples_per_pixel + s;
                std::size_t prev_idx = row_offset + (x - 1) * samples_per_pixel + s;
                buffer[curr_idx] = static_cast<T>(buffer[curr_idx] + buffer[prev_idx]);
            }
        }
    }
}

template <DeltaDecodableInteger T>
inline void delta_encode_generic(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride,
    std::size_t samples_per_pixel) noexcept {

    for (std::size_t y = 0; y < height; ++y) {
        std::size_t row_offset = y * stride;
        for (std::size_t x = width - 1; x > 0; --x) {
            for (std::size_t s = 0; s < samples_per_pixel; ++s) {
                std::size_t curr_idx = row_offset + x * samples_per_pixel + s;
                std::size_t prev_idx = row_offset + (x - 1) * samples_per_pixel + s;
                buffer[curr_idx] = static_cast<T>(buffer[curr_idx] - buffer[prev_idx]);
            }
        }
    }
}

template <DeltaDecodableInteger T>
inline std::span<T> as_samples(std::span<std::byte> data) noexcept {
    return std::span<T>(reinterpret_cast<T*>(data.data()), data.size() / sizeof(T));
}

} // namespace detail

template <DeltaDecodableInteger T>
inline void delta_decode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride,
    std::size_t samples_per_pixel) noexcept {

    if (width == 0) {
        return;
    }
    // Dispatch to unrolled implementations for common cases
    switch (samples_per_pixel) {
        case 1:
            detail::delta_decode_horizontal_impl<T, 1>(buffer, width, height, stride);
            break;
        case 2:
            detail::delta_decode_horizontal_impl<T, 2>(buffer, width, height, stride);
            break;
        case 3:
            detail::delta_decode_horizontal_impl<T, 3>(buffer, width, height, stride);
            break;
        case 4:
            detail::delta_decode_horizontal_impl<T, 4>(buffer, width, height, stride);
            break;
        default:
            detail::delta_decode_generic<T>(buffer, width, height, stride, samples_per_pixel);
            break;
    }
}

template <DeltaDecodableInteger T>
inline void delta_encode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride,
    std::size_t samples_per_pixel) noexcept {

    if (width == 0) {
        return;
    }
    switch (samples_per_pixel) {
        case 1:
            detail::delta_encode_horizontal_impl<T, 1>(buffer, width, height, stride);
            break;
        case 2:
            detail::delta_encode_horizontal_impl<T, 2>(buffer, width, height, stride);
            break;
        case 3:
            detail::delta_encode_horizontal_impl<T, 3>(buffer, width, height, stride);
            break;
        case 4:
            detail::delta_encode_horizontal_impl<T, 4>(buffer, width, height, stride);
            break;
        default:
            detail::delta_encode_generic<T>(buffer, width, height, stride, samples_per_pixel);
            break;
    }
}

// ============================================================================
// Floating point predictor
// ============================================================================

inline void floating_point_decode(
    std::span<std::byte> row_bytes,
    std::size_t width,
    std::size_t height,
    std::size_t samples_per_pixel,
    std::size_t bytes_per_sample) {

    const std::size_t wc = width * samples_per_pixel;
    const std::size_t row_size = wc * bytes_per_sample;
    std::vector<std::byte> tmp(row_size);
    const bool little_endian_host = native_byte_order() == ByteOrder::LittleEndian;

    for (std::size_t y = 0; y < height; ++y) {
        std::byte* row = row_bytes.data() + y * row_size;

        for (std::size_t i = samples_per_pixel; i < row_size; ++i) {
            row[i] = static_cast<std::byte>(
                static_cast<uint8_t>(row[i]) + static_cast<uint8_t>(row[i - samples_per_pixel]));
        }

        std::memcpy(tmp.data(), row, row_size);
        for (std::size_t i = 0; i < wc; ++i) {
            for (std::size_t b = 0; b < bytes_per_sample; ++b) {
                // Plane 0 holds the most significant bytes
                const std::size_t plane = little_endian_host ? bytes_per_sample - b - 1 : b;
                row[bytes_per_sample * i + b] = tmp[plane * wc + i];
            }
        }
    }
}

inline void floating_point_encode(
    std::span<std::byte> row_bytes,
    std::size_t width,
    std::size_t height,
    std::size_t samples_per_pixel,
    std::size_t bytes_per_sample) {

    const std::size_t wc = width * samples_per_pixel;
    const std::size_t row_size = wc * bytes_per_sample;
    std::vector<std::byte> tmp(row_size);
    const bool little_endian_host = native_byte_order() == ByteOrder::LittleEndian;

    for (std::size_t y = 0; y < height; ++y) {
        std::byte* row = row_bytes.data() + y * row_size;

        for (std::size_t i = 0; i < wc; ++i) {
            for (std::size_t b = 0; b < bytes_per_sample; ++b) {
                const std::size_t plane = little_endian_host ? bytes_per_sample - b - 1 : b;
                tmp[plane * wc + i] = row[bytes_per_sample * i + b];
            }
        }
        std::memcpy(row, tmp.data(), row_size);

        for (std::size_t i = row_size; i-- > samples_per_pixel;) {
            row[i] = static_cast<std::byte>(
                static_cast<uint8_t>(row[i]) - static_cast<uint8_t>(row[i - samples_per_pixel]));
        }
    }
}

// ============================================================================
// Dispatch
// ============================================================================

inline Result<void> undo(
    Predictor predictor,
    std::span<std::byte> data,
    std::size_t width,
    std::size_t height,
    std::size_t samples_per_pixel,
    uint16_t bits_per_sample) {

    const std::size_t stride = width * samples_per_pixel;

    switch (predictor) {
        case Predictor::None:
            return Ok();

        case Predictor::Horizontal:
            // Differencing on the integer representation whatever the sample format
            switch (bits_per_sample) {
                case 8:
                    delta_decode_horizontal(detail::as_samples<uint8_t>(data), width, height, stride, samples_per_pixel);
                    return Ok();
                case 16:
                    delta_decode_horizontal(detail::as_samples<uint16_t>(data), width, height, stride, samples_per_pixel);
                    return Ok();
                case 32:
                    delta_decode_horizontal(detail::as_samples<uint32_t>(data), width, height, stride, samples_per_pixel);
                    return Ok();
                case 64:
                    delta_decode_horizontal(detail::as_samples<uint64_t>(data), width, height, stride, samples_per_pixel);
                    return Ok();
                default:
                    return Err(Error::Code::UnsupportedFeature,
                               "Horizontal predictor with " + std::to_string(bits_per_sample) + " bits per sample");
            }

        case Predictor::FloatingPoint:
            if (bits_per_sample != 16 && bits_per_sample != 32 && bits_per_sample != 64) {
                return Err(Error::Code::UnsupportedFeature,
                           "Floating point predictor with " + std::to_string(bits_per_sample) + " bits per sample");
            }
            floating_point_decode(data, width, height, samples_per_pixel, bits_per_sample / 8);
            return Ok();
    }
    return Err(Error::Code::UnsupportedFeature,
               "Unknown predictor " + std::to_string(static_cast<int>(predictor)));
}

} // namespace predictor

} // namespace cogstream
