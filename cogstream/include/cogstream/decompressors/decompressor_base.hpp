#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <tuple>
#include <vector>
#include "../types/result.hpp"
#include "../types/tiff_spec.hpp"

namespace cogstream {

/// Concept for a decompressor implementation.
/// decompress() fills at most output.size() bytes and returns how many were produced;
/// a stream that would produce more, or that is malformed, is Error::Code::CorruptTile.
template <typename T>
concept DecompressorImpl = requires(const T& decompressor,
                                    std::span<std::byte> output,
                                    std::span<const std::byte> input) {
    { decompressor.decompress(output, input) } -> std::same_as<Result<std::size_t>>;
};

/// Decompressor descriptor - binds a decompressor to the Compression tag values it handles
/// (e.g. both Deflate codes, or ZSTD and its alternative code)
template <typename DecompressorType, CompressionScheme... Schemes>
    requires DecompressorImpl<DecompressorType> && (sizeof...(Schemes) > 0)
struct DecompressorDescriptor {
    using decompressor_type = DecompressorType;
    static constexpr std::array<CompressionScheme, sizeof...(Schemes)> schemes = {Schemes...};

    static constexpr bool handles(uint16_t compression) noexcept {
        for (auto s : schemes) {
            if (static_cast<uint16_t>(s) == compression) return true;
        }
        return false;
    }
};

/// Concept to check if a type is a DecompressorDescriptor
template <typename T>
concept DecompressorDescriptorType = requires {
    typename T::decompressor_type;
    { T::schemes } -> std::convertible_to<std::span<const CompressionScheme>>;
    { T::handles(uint16_t{1}) } -> std::same_as<bool>;
    requires DecompressorImpl<typename T::decompressor_type>;
};

/// Helper to check that no compression value is claimed by two decompressors
template <typename... Decompressors>
consteval bool schemes_are_unique() {
    constexpr std::size_t total_schemes = (Decompressors::schemes.size() + ...);
    std::array<CompressionScheme, total_schemes> all_schemes{};

    std::size_t idx = 0;
    auto collect = [&]<typename Desc>() {
        for (auto scheme : Desc::schemes) {
            all_schemes[idx++] = scheme;
        }
    };
    (collect.template operator()<Decompressors>(), ...);

    for (std::size_t i = 0; i < all_schemes.size(); ++i) {
        for (std::size_t j = i + 1; j < all_schemes.size(); ++j) {
            if (all_schemes[i] == all_schemes[j]) {
                return false;
            }
        }
    }
    return true;
}

/// Compile-time set of decompressors
template <DecompressorDescriptorType... Decompressors>
struct DecompressorSpec {
    static constexpr std::size_t num_decompressors = sizeof...(Decompressors);

    static_assert(schemes_are_unique<Decompressors...>(),
                  "Each compression scheme can only be handled by one decompressor");

    static constexpr bool supports(uint16_t compression) noexcept {
        return (Decompressors::handles(compression) || ...);
    }
};

/// Concept to validate DecompressorSpec structure at compile time
template <typename T>
concept ValidDecompressorSpec = requires {
    { T::num_decompressors } -> std::convertible_to<std::size_t>;

    requires []<DecompressorDescriptorType... Decompressors>(DecompressorSpec<Decompressors...>*) {
        return std::is_same_v<std::remove_cvref_t<T>, DecompressorSpec<Decompressors...>>;
    }(static_cast<std::remove_cvref_t<T>*>(nullptr));

    requires T::num_decompressors > 0;
};

/// Storage helper for a single decompressor
template <typename DecompressorDesc>
    requires DecompressorDescriptorType<DecompressorDesc>
class DecompressorHolder {
private:
    [[no_unique_address]] typename DecompressorDesc::decompressor_type decompressor_;

public:
    DecompressorHolder() noexcept = default;

    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {
        return decompressor_.decompress(output, input);
    }

    static constexpr bool handles(uint16_t compression) noexcept {
        return DecompressorDesc::handles(compression);
    }
};

/// One instance of every decompressor of a spec, dispatched on the Compression value at runtime.
/// Not thread-safe when a decompressor keeps a context: use one storage per thread.
template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
class DecompressorStorage {
private:
    [[no_unique_address]] decltype([]<DecompressorDescriptorType... Descs>(DecompressorSpec<Descs...>*) {
        return std::tuple<DecompressorHolder<Descs>...>{};
    }(static_cast<DecompSpec*>(nullptr))) holders_;

    template <std::size_t I = 0>
    [[nodiscard]] Result<std::size_t> decompress_impl(
        std::span<std::byte> output,
        std::span<const std::byte> input,
        uint16_t compression) const noexcept {

        if constexpr (I < std::tuple_size_v<decltype(holders_)>) {
            const auto& holder = std::get<I>(holders_);
            if (holder.handles(compression)) {
                return holder.decompress(output, input);
            }
            return decompress_impl<I + 1>(output, input, compression);
        } else {
            return Err(Error::Code::UnsupportedCompression,
                       "Compression " + std::string(compression_name(compression)) + " (" +
                       std::to_string(compression) + ") not supported in this build");
        }
    }

public:
    DecompressorStorage() noexcept = default;
    ~DecompressorStorage() = default;

    DecompressorStorage(const DecompressorStorage&) = delete;
    DecompressorStorage& operator=(const DecompressorStorage&) = delete;

    DecompressorStorage(DecompressorStorage&&) noexcept = default;
    DecompressorStorage& operator=(DecompressorStorage&&) noexcept = default;

    /// Decompress `input` into `output` with the decompressor registered for `compression`
    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input,
        uint16_t compression) const noexcept {
        return decompress_impl(output, input, compression);
    }

    static constexpr bool supports(uint16_t compression) noexcept {
        return DecompSpec::supports(compression);
    }
};

} // namespace cogstream
