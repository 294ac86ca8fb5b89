#include <benchmark/benchmark.h>
#include <cstdint>
#include <vector>

#include "benchmark_helpers.hpp"

#include "../cogstream/include/cogstream/cog_reader.hpp"
#include "../cogstream/include/cogstream/decompressors/decompressor_base.hpp"
#include "../cogstream/include/cogstream/sources/file_source.hpp"
#include "../cogstream/include/cogstream/sources/memory_source.hpp"
#include "../cogstream/include/cogstream/tile_decoder.hpp"

using namespace cogstream;
using namespace cog_bench;

namespace {

/// Compression selected by a benchmark argument
CompressionType compression_arg(int64_t index) {
    switch (index) {
        case 1: return CompressionType::PackBits;
        case 2: return CompressionType::LZW;
        case 3: return CompressionType::Deflate;
        case 4: return CompressionType::ZSTD;
        default: return CompressionType::None;
    }
}

StorageConfig storage_for(CompressionType compression, std::size_t overviews = 3) {
    StorageConfig storage;
    storage.compression = compression;
    storage.predictor = compression == CompressionType::None || compression == CompressionType::PackBits
        ? Predictor::None : Predictor::Horizontal;
    storage.overviews = overviews;
    return storage;
}

} // namespace

// ============================================================================
// Opening (header prefix, IFD chain, GeoKeys)
// ============================================================================

static void BM_Open_Memory(benchmark::State& state) {
    StorageConfig storage = storage_for(CompressionType::Deflate, static_cast<std::size_t>(state.range(0)));
    storage.bigtiff = state.range(1) != 0;
    const MemorySource source(make_cog(configs::large_gray, storage));

    for (auto _ : state) {
        CogReader reader(source, bench_options());
        auto opened = reader.open();
        if (!opened) {
            state.SkipWithError(("Open failed: " + opened.error().message).c_str());
            return;
        }
        auto profile = reader.profile();
        benchmark::DoNotOptimize(profile);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Open_Memory)
    ->Args({0, 0})   // single level, Classic
    ->Args({4, 0})   // 4 overviews, Classic
    ->Args({4, 1})   // 4 overviews, BigTIFF
    ->Unit(benchmark::kMicrosecond);

static void BM_Open_File(benchmark::State& state) {
    TempFileManager temp;
    const auto path = temp.write("open_" + configs::medium_gray.name(),
                                 make_cog(configs::medium_gray, storage_for(CompressionType::Deflate)));

    for (auto _ : state) {
        auto source = FileSource::open(path.string());
        if (!source) {
            state.SkipWithError(source.error().message.c_str());
            return;
        }
        CogReader reader(std::move(source.value()), bench_options());
        auto opened = reader.open();
        if (!opened) {
            state.SkipWithError(("Open failed: " + opened.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(reader.level_count());
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Open_File)->Unit(benchmark::kMicrosecond);

// ============================================================================
// Single tiles
// ============================================================================

static void BM_GetTile(benchmark::State& state) {
    const CompressionType compression = compression_arg(state.range(0));
#ifndef COGSTREAM_HAVE_ZSTD
    if (compression == CompressionType::ZSTD) {
        state.SkipWithError("ZSTD support not compiled in");
        return;
    }
#endif
    const ImageConfig image = configs::medium_gray;
    CogReader reader(MemorySource(make_cog(image, storage_for(compression, 0))), bench_options());
    if (auto opened = reader.open(); !opened) {
        state.SkipWithError(("Open failed: " + opened.error().message).c_str());
        return;
    }
    const auto [across, down] = reader.tile_count(0).value();

    std::size_t bytes_processed = 0;
    uint64_t index = 0;
    for (auto _ : state) {
        const uint64_t col = index % across;
        const uint64_t row = (index / across) % down;
        ++index;

        auto tile = reader.get_tile(0, col, row);
        if (!tile) {
            state.SkipWithError(("Tile read failed: " + tile.error().message).c_str());
            return;
        }
        bytes_processed += tile.value().bytes().size();
        benchmark::DoNotOptimize(tile);
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes_processed));
    state.SetItemsProcessed(state.iterations());
    state.SetLabel(compression_label(compression));
}

BENCHMARK(BM_GetTile)
    ->Arg(0)   // None
    ->Arg(1)   // PackBits
    ->Arg(2)   // LZW + horizontal predictor
    ->Arg(3)   // Deflate + horizontal predictor
    ->Arg(4)   // ZSTD + horizontal predictor
    ->Unit(benchmark::kMicrosecond);

static void BM_GetTile_FloatPredictor(benchmark::State& state) {
    CogReader reader(MemorySource(make_cog(configs::medium_dem, configs::deflate_float)), bench_options());
    if (auto opened = reader.open(); !opened) {
        state.SkipWithError(("Open failed: " + opened.error().message).c_str());
        return;
    }

    std::size_t bytes_processed = 0;
    for (auto _ : state) {
        auto tile = reader.get_tile(0, 3, 5);
        if (!tile) {
            state.SkipWithError(("Tile read failed: " + tile.error().message).c_str());
            return;
        }
        bytes_processed += tile.value().bytes().size();
        benchmark::DoNotOptimize(tile);
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes_processed));
}

BENCHMARK(BM_GetTile_FloatPredictor)->Unit(benchmark::kMicrosecond);

// ============================================================================
// Decompression alone
// ============================================================================

static void BM_Decompress(benchmark::State& state) {
    const CompressionType compression = compression_arg(state.range(0));
    const uint16_t id = compression_id(compression);
    if (!DecompressorStorage<StandardDecompressors>::supports(id)) {
        state.SkipWithError("Compression not compiled in");
        return;
    }

    const auto raw = cogtest::pattern_pixels(DataType::UInt8, 256, 256, 1, 0);
    const auto encoded = cogtest::compress(id, raw);
    std::vector<std::byte> output(raw.size());
    DecompressorStorage<StandardDecompressors> decompressors;

    for (auto _ : state) {
        auto produced = decompressors.decompress(output, encoded, id);
        if (!produced) {
            state.SkipWithError(produced.error().message.c_str());
            return;
        }
        benchmark::DoNotOptimize(output.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * raw.size()));
    state.SetLabel(compression_label(compression));
}

BENCHMARK(BM_Decompress)
    ->Arg(1)   // PackBits
    ->Arg(2)   // LZW
    ->Arg(3)   // Deflate
    ->Arg(4)   // ZSTD
    ->Unit(benchmark::kMicrosecond);

// ============================================================================
// Window reads (overview selection, concurrent tile fetches, resampling)
// ============================================================================

static void BM_ReadWindow(benchmark::State& state) {
    const auto size = static_cast<uint64_t>(state.range(0));
    const auto concurrency = static_cast<std::size_t>(state.range(1));
    const ImageConfig image = configs::medium_rgb;

    CogReader reader(MemorySource(make_cog(image, storage_for(CompressionType::Deflate))), bench_options(concurrency));
    if (auto opened = reader.open(); !opened) {
        state.SkipWithError(("Open failed: " + opened.error().message).c_str());
        return;
    }
    const Bounds extent = reader.bounds().value();

    std::size_t bytes_processed = 0;
    for (auto _ : state) {
        auto out = reader.read(extent, ReadShape{size, size});
        if (!out) {
            state.SkipWithError(("Read failed: " + out.error().message).c_str());
            return;
        }
        bytes_processed += out.value().bytes().size();
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes_processed));
    state.counters["level"] = static_cast<double>(reader.overview_for(extent, ReadShape{size, size}).value());
}

BENCHMARK(BM_ReadWindow)
    ->Args({256, 1})    // coarsest overview, serial
    ->Args({256, 0})    // coarsest overview, hardware concurrency
    ->Args({1024, 1})   // overview 1, serial
    ->Args({1024, 0})   // overview 1, hardware concurrency
    ->Args({2048, 0})   // full resolution
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

static void BM_ReadWindow_Small(benchmark::State& state) {
    // Web-map style 256x256 request inside a large image
    CogReader reader(MemorySource(make_cog(configs::large_gray, storage_for(CompressionType::Deflate))), bench_options());
    if (auto opened = reader.open(); !opened) {
        state.SkipWithError(("Open failed: " + opened.error().message).c_str());
        return;
    }
    const Bounds window{1000.0, 4000.0, 1512.0, 4512.0};

    for (auto _ : state) {
        auto out = reader.read(window, ReadShape{256, 256});
        if (!out) {
            state.SkipWithError(("Read failed: " + out.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ReadWindow_Small)->Unit(benchmark::kMicrosecond)->UseRealTime();
