#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include "types/result.hpp"
#include "types/tiff_spec.hpp"

namespace cogstream {

namespace predictor {

/// Concept for types that can be delta decoded
template <typename T>
concept DeltaDecodableInteger = std::is_same_v<T, uint8_t> ||
                                std::is_same_v<T, uint16_t> ||
                                std::is_same_v<T, uint32_t> ||
                                std::is_same_v<T, uint64_t> ||
                                std::is_same_v<T, int8_t> ||
                                std::is_same_v<T, int16_t> ||
                                std::is_same_v<T, int32_t> ||
                                std::is_same_v<T, int64_t>;

/// Apply horizontal differencing (TIFF predictor=2) decoding in place
///
/// This decodes delta-encoded data where each pixel stores the difference
/// from the previous pixel in the same row. For multi-channel images,
/// each channel is predicted separately from its own previous value.
///
/// @tparam T Sample type (uint8_t, uint16_t, etc.)
/// @param buffer Buffer containing the encoded data (modified in place)
/// @param width Number of pixels per row
/// @param height Number of rows
/// @param stride Number of elements (samples) between row starts (>= width * samples_per_pixel)
/// @param samples_per_pixel Number of samples (channels) per pixel (default 1)
template <DeltaDecodableInteger T>
void delta_decode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride,
    std::size_t samples_per_pixel = 1) noexcept;

/// Apply horizontal differencing (TIFF predictor=2) encoding in place.
/// Inverse of delta_decode_horizontal(); the first pixel of each row is unchanged.
template <DeltaDecodableInteger T>
void delta_encode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride,
    std::size_t samples_per_pixel = 1) noexcept;

/// Undo the floating point predictor (TIFF predictor=3, Technical Note 3) in place.
///
/// Each encoded row holds the sample bytes split into planes, most significant
/// byte plane first, then differenced bytewise with a stride of samples_per_pixel.
/// The decoded row holds samples in native byte order, so no byte swap is needed
/// afterwards whatever the file's byte order.
///
/// @param row_bytes Tile data, height rows of width * samples_per_pixel * bytes_per_sample bytes
/// @param bytes_per_sample 2, 4 or 8
inline void floating_point_decode(
    std::span<std::byte> row_bytes,
    std::size_t width,
    std::size_t height,
    std::size_t samples_per_pixel,
    std::size_t bytes_per_sample);

/// Apply the floating point predictor to native-order samples in place
inline void floating_point_encode(
    std::span<std::byte> row_bytes,
    std::size_t width,
    std::size_t height,
    std::size_t samples_per_pixel,
    std::size_t bytes_per_sample);

/// Reverse `predictor` on a decompressed chunk.
/// For Predictor::Horizontal the samples must already be in native byte order;
/// for Predictor::FloatingPoint they must still be in stored order.
/// Unsupported predictor values or sample sizes are Error::Code::UnsupportedFeature.
[[nodiscard]] inline Result<void> undo(
    Predictor predictor,
    std::span<std::byte> data,
    std::size_t width,
    std::size_t height,
    std::size_t samples_per_pixel,
    uint16_t bits_per_sample);

} // namespace predictor

} // namespace cogstream

#define COGSTREAM_PREDICTOR_HEADER
#include "impl/predictor_impl.hpp"
