#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "../cogstream/include/cogstream/options.hpp"
#include "../cogstream/include/cogstream/predictor.hpp"
#include "../cogstream/include/cogstream/raster.hpp"
#include "../cogstream/include/cogstream/types/byte_order.hpp"
#include "test_helpers.hpp"

namespace cog_bench {

using cogstream::ByteOrder;
using cogstream::DataType;
using cogstream::Predictor;

/// Compression type enumeration
enum class CompressionType { None, PackBits, LZW, Deflate, ZSTD };

/// Test image configuration
struct ImageConfig {
    uint64_t width;
    uint64_t height;
    uint16_t samples;
    uint64_t tile;
    DataType dtype = DataType::UInt8;

    std::string name() const;
    std::size_t num_bytes() const {
        return static_cast<std::size_t>(width * height * samples) * cogstream::data_type_size(dtype);
    }
};

/// How the image is stored in the COG
struct StorageConfig {
    CompressionType compression = CompressionType::Deflate;
    Predictor predictor = Predictor::None;
    ByteOrder order = ByteOrder::LittleEndian;
    bool bigtiff = false;
    std::size_t overviews = 3;

    std::string name() const;
};

/// Predefined configurations for benchmarking
namespace configs {
    // Small images (quick tests)
    constexpr ImageConfig small_gray{256, 256, 1, 256};
    constexpr ImageConfig small_rgb{256, 256, 3, 256};

    // Medium images (typical web-map tiles)
    constexpr ImageConfig medium_gray{2048, 2048, 1, 256};
    constexpr ImageConfig medium_rgb{2048, 2048, 3, 256};
    constexpr ImageConfig medium_dem{2048, 2048, 1, 256, DataType::Float32};

    // Large image, many tiles
    constexpr ImageConfig large_gray{8192, 8192, 1, 512};

    constexpr StorageConfig uncompressed{CompressionType::None};
    constexpr StorageConfig lzw{CompressionType::LZW, Predictor::Horizontal};
    constexpr StorageConfig deflate{CompressionType::Deflate, Predictor::Horizontal};
    constexpr StorageConfig deflate_float{CompressionType::Deflate, Predictor::FloatingPoint};
    constexpr StorageConfig zstd{CompressionType::ZSTD, Predictor::Horizontal};
    constexpr StorageConfig bigtiff_bigendian{CompressionType::Deflate, Predictor::None, ByteOrder::BigEndian, true};
}

[[nodiscard]] uint16_t compression_id(CompressionType compression);
[[nodiscard]] std::string compression_label(CompressionType compression);

/// Pattern image described by the two configurations, georeferenced with 1 unit pixels
[[nodiscard]] cogtest::ImageSpec make_image(const ImageConfig& image, const StorageConfig& storage);

/// Full COG: the image followed by `storage.overviews` overviews
[[nodiscard]] std::vector<std::byte> make_cog(const ImageConfig& image, const StorageConfig& storage);

/// Reader options with logging off
[[nodiscard]] cogstream::ReaderOptions bench_options(std::size_t max_concurrency = 0);

/// Temporary file manager for benchmarks
class TempFileManager {
public:
    TempFileManager();
    ~TempFileManager();

    TempFileManager(const TempFileManager&) = delete;
    TempFileManager& operator=(const TempFileManager&) = delete;

    /// Write `bytes` to a new temporary file and return its path
    std::filesystem::path write(const std::string& name, const std::vector<std::byte>& bytes);

    /// Clean up all temporary files
    void cleanup_all();

private:
    std::filesystem::path temp_dir_;
    std::vector<std::filesystem::path> temp_files_;
};

/// Helper to compute throughput in MB/s
inline double compute_throughput(std::size_t bytes, double time_ns) {
    if (time_ns <= 0.0) return 0.0;
    double seconds = time_ns / 1e9;
    double mb = static_cast<double>(bytes) / (1024.0 * 1024.0);
    return mb / seconds;
}

} // namespace cog_bench
