#include "benchmark_helpers.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cog_bench {

// ============================================================================
// Configurations
// ============================================================================

std::string ImageConfig::name() const {
    std::ostringstream oss;
    oss << width << "x" << height << "_c" << samples << "_" << cogstream::data_type_name(dtype)
        << "_tiles" << tile;
    return oss.str();
}

std::string StorageConfig::name() const {
    std::ostringstream oss;
    oss << compression_label(compression);

    switch (predictor) {
        case Predictor::Horizontal: oss << "_PredHoriz"; break;
        case Predictor::FloatingPoint: oss << "_PredFloat"; break;
        default: break;
    }

    oss << (bigtiff ? "_BigTIFF" : "_Classic");
    if (order == ByteOrder::BigEndian) {
        oss << "_BigEndian";
    }
    if (overviews > 0) {
        oss << "_ovr" << overviews;
    }
    return oss.str();
}

uint16_t compression_id(CompressionType compression) {
    switch (compression) {
        case CompressionType::None:     return static_cast<uint16_t>(cogstream::CompressionScheme::None);
        case CompressionType::PackBits: return static_cast<uint16_t>(cogstream::CompressionScheme::PackBits);
        case CompressionType::LZW:      return static_cast<uint16_t>(cogstream::CompressionScheme::LZW);
        case CompressionType::Deflate:  return static_cast<uint16_t>(cogstream::CompressionScheme::Deflate);
        case CompressionType::ZSTD:     return static_cast<uint16_t>(cogstream::CompressionScheme::ZSTD);
    }
    return static_cast<uint16_t>(cogstream::CompressionScheme::None);
}

std::string compression_label(CompressionType compression) {
    switch (compression) {
        case CompressionType::None:     return "NoComp";
        case CompressionType::PackBits: return "PackBits";
        case CompressionType::LZW:      return "LZW";
        case CompressionType::Deflate:  return "Deflate";
        case CompressionType::ZSTD:     return "ZSTD";
    }
    return "Unknown";
}

// ============================================================================
// COG generation
// ============================================================================

cogtest::ImageSpec make_image(const ImageConfig& image, const StorageConfig& storage) {
    cogtest::ImageSpec spec = cogtest::pattern_image(image.width, image.height, image.dtype, image.samples, image.tile);
    spec.compression = compression_id(storage.compression);
    spec.predictor = storage.predictor;

    cogtest::GeoSpec geo;
    geo.origin_y = static_cast<double>(image.height);
    spec.extra_tags = cogtest::geo_tags(geo);
    return spec;
}

std::vector<std::byte> make_cog(const ImageConfig& image, const StorageConfig& storage) {
    return cogtest::CogBuilder(storage.order, storage.bigtiff)
        .add_pyramid(make_image(image, storage), storage.overviews)
        .build();
}

cogstream::ReaderOptions bench_options(std::size_t max_concurrency) {
    cogstream::ReaderOptions options;
    options.log_level = cogstream::LogLevel::Off;
    options.max_concurrency = max_concurrency;
    return options;
}

// ============================================================================
// TempFileManager
// ============================================================================

TempFileManager::TempFileManager() {
    temp_dir_ = std::filesystem::temp_directory_path() / "cogstream_benchmarks";
    std::filesystem::create_directories(temp_dir_);
}

TempFileManager::~TempFileManager() {
    cleanup_all();
}

std::filesystem::path TempFileManager::write(const std::string& name, const std::vector<std::byte>& bytes) {
    auto path = temp_dir_ / (name + ".tif");
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("Failed to write " + path.string());
    }
    temp_files_.push_back(path);
    return path;
}

void TempFileManager::cleanup_all() {
    for (const auto& path : temp_files_) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        // Ignore errors during cleanup
    }
    temp_files_.clear();

    std::error_code ec;
    std::filesystem::remove(temp_dir_, ec);
}

} // namespace cog_bench
