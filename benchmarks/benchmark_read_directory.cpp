// Standalone benchmark for reading Cloud Optimized GeoTIFFs from a directory
// Times opening, full-resolution tile reads or window reads per file

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

#include "../cogstream/include/cogstream/cog_reader.hpp"
#include "../cogstream/include/cogstream/options.hpp"
#include "../cogstream/include/cogstream/sources/file_source.hpp"

namespace fs = std::filesystem;
using namespace cogstream;

enum class Mode { Open, Tiles, Window };

// ============================================================================
// Statistics Helper
// ============================================================================

struct Statistics {
    std::vector<double> times_ms;
    std::vector<size_t> bytes_read;
    std::vector<size_t> source_reads;

    void add_measurement(double time_ms, size_t bytes, size_t reads) {
        times_ms.push_back(time_ms);
        bytes_read.push_back(bytes);
        source_reads.push_back(reads);
    }

    double mean_time() const {
        if (times_ms.empty()) return 0.0;
        return std::accumulate(times_ms.begin(), times_ms.end(), 0.0) / times_ms.size();
    }

    double stddev_time() const {
        if (times_ms.size() < 2) return 0.0;
        double mean = mean_time();
        double sum_sq = 0.0;
        for (double t : times_ms) {
            sum_sq += (t - mean) * (t - mean);
        }
        return std::sqrt(sum_sq / (times_ms.size() - 1));
    }

    double median_time() const {
        if (times_ms.empty()) return 0.0;
        auto sorted = times_ms;
        std::sort(sorted.begin(), sorted.end());
        size_t mid = sorted.size() / 2;
        if (sorted.size() % 2 == 0) {
            return (sorted[mid - 1] + sorted[mid]) / 2.0;
        }
        return sorted[mid];
    }

    double min_time() const {
        if (times_ms.empty()) return 0.0;
        return *std::min_element(times_ms.begin(), times_ms.end());
    }

    double max_time() const {
        if (times_ms.empty()) return 0.0;
        return *std::max_element(times_ms.begin(), times_ms.end());
    }

    size_t total_bytes() const {
        return std::accumulate(bytes_read.begin(), bytes_read.end(), size_t{0});
    }

    size_t total_reads() const {
        return std::accumulate(source_reads.begin(), source_reads.end(), size_t{0});
    }

    double total_time() const {
        return std::accumulate(times_ms.begin(), times_ms.end(), 0.0);
    }

    double throughput_mbps() const {
        double total_mb = total_bytes() / (1024.0 * 1024.0);
        double total_sec = total_time() / 1000.0;
        return total_sec > 0 ? total_mb / total_sec : 0.0;
    }

    void print(const std::string& mode_name) const {
        std::cout << "\n=== " << mode_name << " Statistics ===\n";
        std::cout << "Files processed: " << times_ms.size() << "\n";
        std::cout << "Total data decoded: " << (total_bytes() / (1024.0 * 1024.0)) << " MB\n";
        std::cout << "Total source reads: " << total_reads() << "\n";
        std::cout << "Total time: " << total_time() << " ms\n";
        std::cout << "Throughput: " << throughput_mbps() << " MB/s\n";
        std::cout << "\nPer-file timing:\n";
        std::cout << "  Mean:   " << mean_time() << " ms\n";
        std::cout << "  Median: " << median_time() << " ms\n";
        std::cout << "  Stddev: " << stddev_time() << " ms\n";
        std::cout << "  Min:    " << min_time() << " ms\n";
        std::cout << "  Max:    " << max_time() << " ms\n";
    }
};

// ============================================================================
// Reading
// ============================================================================

struct FileOutcome {
    size_t bytes = 0;
    size_t reads = 0;
};

/// Decode every full-resolution tile of an open reader
Result<size_t> read_all_tiles(const CogReader<FileSource>& reader) {
    auto count = reader.tile_count(0);
    if (!count) {
        return count.error();
    }
    const auto [across, down] = count.value();

    size_t bytes = 0;
    for (uint64_t row = 0; row < down; ++row) {
        for (uint64_t col = 0; col < across; ++col) {
            auto tile = reader.get_tile(0, col, row);
            if (!tile) {
                return tile.error();
            }
            bytes += tile.value().bytes().size();
        }
    }
    return Ok(bytes);
}

/// Resample the whole extent to a size x size window
Result<size_t> read_whole_window(const CogReader<FileSource>& reader, uint64_t size) {
    auto bounds = reader.bounds();
    if (!bounds) {
        return bounds.error();
    }
    auto window = reader.read(bounds.value(), ReadShape{size, size});
    if (!window) {
        return window.error();
    }
    return Ok(window.value().bytes().size());
}

std::optional<FileOutcome> read_with_cogstream(
    const std::string& path,
    Mode mode,
    uint64_t window_size,
    const ReaderOptions& options) {

    auto source = FileSource::open(path);
    if (!source) {
        std::cerr << "Failed to open file: " << path << " (" << source.error().message << ")\n";
        return std::nullopt;
    }

    CogReader reader(std::move(source.value()), options);
    if (auto opened = reader.open(); !opened) {
        std::cerr << "Failed to open COG: " << path << " (" << opened.error().message << ")\n";
        return std::nullopt;
    }

    Result<size_t> decoded = Ok(size_t{0});
    switch (mode) {
        case Mode::Open: break;
        case Mode::Tiles: decoded = read_all_tiles(reader); break;
        case Mode::Window: decoded = read_whole_window(reader, window_size); break;
    }
    if (!decoded) {
        std::cerr << "Failed to read: " << path << " (" << decoded.error().message << ")\n";
        return std::nullopt;
    }
    return FileOutcome{decoded.value(), reader.source_reads()};
}

// ============================================================================
// Main
// ============================================================================

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " <directory> <mode> [size]\n";
    std::cout << "\nArguments:\n";
    std::cout << "  directory  : Path to directory containing COG files\n";
    std::cout << "  mode       : One of: open, tiles, window\n";
    std::cout << "  size       : Optional. Output size of the square window read (default 512).\n";
    std::cout << "\nReader options are taken from the COGSTREAM_* environment variables.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << prog_name << " /data/cogs open          # Parse headers only\n";
    std::cout << "  " << prog_name << " /data/cogs tiles         # Decode every full-resolution tile\n";
    std::cout << "  " << prog_name << " /data/cogs window 1024   # Read each extent into 1024x1024\n";
}

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        print_usage(argv[0]);
        return 1;
    }

    std::string directory = argv[1];
    std::string mode_str = argv[2];
    uint64_t window_size = 512;

    if (argc == 4) {
        try {
            window_size = std::stoull(argv[3]);
        } catch (const std::exception&) {
            std::cerr << "Invalid size: " << argv[3] << "\n";
            return 1;
        }
        if (window_size == 0) {
            std::cerr << "Invalid size: " << argv[3] << "\n";
            return 1;
        }
    }

    Mode mode;
    std::string mode_name;

    if (mode_str == "open") {
        mode = Mode::Open;
        mode_name = "Open";
    } else if (mode_str == "tiles") {
        mode = Mode::Tiles;
        mode_name = "Full-resolution tiles";
    } else if (mode_str == "window") {
        mode = Mode::Window;
        mode_name = "Window " + std::to_string(window_size) + "x" + std::to_string(window_size);
    } else {
        std::cerr << "Unknown mode: " << mode_str << "\n";
        std::cerr << "Valid options: open, tiles, window\n";
        return 1;
    }

    // Verify directory exists
    if (!fs::exists(directory) || !fs::is_directory(directory)) {
        std::cerr << "Directory does not exist: " << directory << "\n";
        return 1;
    }

    // Collect TIFF files
    std::vector<std::string> tiff_files;
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (entry.is_regular_file()) {
            auto ext = entry.path().extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
            if (ext == ".tif" || ext == ".tiff") {
                tiff_files.push_back(entry.path().string());
            }
        }
    }

    if (tiff_files.empty()) {
        std::cerr << "No TIFF files found in: " << directory << "\n";
        return 1;
    }

    // Sort for consistent ordering
    std::sort(tiff_files.begin(), tiff_files.end());

    const ReaderOptions options = ReaderOptions::from_env();

    std::cout << "Found " << tiff_files.size() << " TIFF files\n";
    std::cout << "Mode: " << mode_name << "\n";
    std::cout << "Header chunk size: " << options.header_chunk_size << " bytes\n";
    std::cout << "\nProcessing...\n";

    Statistics stats;
    size_t success_count = 0;
    size_t fail_count = 0;

    for (const auto& path : tiff_files) {
        std::cout << "Reading: " << fs::path(path).filename().string() << " ... " << std::flush;

        auto start = std::chrono::high_resolution_clock::now();
        auto outcome = read_with_cogstream(path, mode, window_size, options);
        auto end = std::chrono::high_resolution_clock::now();

        if (outcome) {
            double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
            stats.add_measurement(elapsed_ms, outcome->bytes, outcome->reads);
            std::cout << "OK (" << elapsed_ms << " ms, " << outcome->reads << " reads)\n";
            success_count++;
        } else {
            std::cout << "FAILED\n";
            fail_count++;
        }
    }

    std::cout << "\n=== Summary ===\n";
    std::cout << "Successful: " << success_count << "/" << tiff_files.size() << "\n";
    std::cout << "Failed: " << fail_count << "/" << tiff_files.size() << "\n";

    if (success_count > 0) {
        stats.print(mode_name);
    }

    return fail_count > 0 ? 1 : 0;
}
