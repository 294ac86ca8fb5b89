#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "../cogstream/include/cogstream/cog_reader.hpp"
#include "../cogstream/include/cogstream/concurrency/once_cell.hpp"
#include "../cogstream/include/cogstream/concurrency/task_group.hpp"
#include "test_helpers.hpp"

using namespace cogstream;
using namespace cogtest;

namespace {

ReaderOptions quiet(std::size_t max_concurrency = 0) {
    ReaderOptions options;
    options.log_level = LogLevel::Off;
    options.max_concurrency = max_concurrency;
    return options;
}

ImageSpec georeferenced_image() {
    ImageSpec image = pattern_image(128, 128, DataType::UInt16);
    image.compression = static_cast<uint16_t>(CompressionScheme::LZW);
    image.predictor = Predictor::Horizontal;
    GeoSpec geo;
    geo.origin_y = 128.0;
    image.extra_tags = geo_tags(geo);
    return image;
}

} // namespace

// ============================================================================
// TaskGroup
// ============================================================================

TEST(TaskGroup, EmptyGroup) {
    TaskGroup group(4);
    EXPECT_EQ(group.size(), 0u);
    EXPECT_TRUE(group.run().is_ok());

    std::stop_source stop;
    stop.request_stop();
    TaskGroup cancelled(4);
    auto result = cancelled.run(stop.get_token());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::Cancelled);
}

TEST(TaskGroup, ZeroConcurrencyUsesHardware) {
    TaskGroup group(0);
    EXPECT_GE(group.max_concurrency(), 1u);
    EXPECT_EQ(TaskGroup(3).max_concurrency(), 3u);
}

TEST(TaskGroup, RunsEveryTask) {
    TaskGroup group(4);
    std::atomic<int> done{0};
    std::vector<int> slots(100, 0);
    for (int i = 0; i < 100; ++i) {
        group.add([&done, &slots, i](std::stop_token) -> Result<void> {
            slots[i] = i + 1;
            done.fetch_add(1);
            return Ok();
        });
    }
    EXPECT_EQ(group.size(), 100u);
    ASSERT_TRUE(group.run().is_ok());
    EXPECT_EQ(done.load(), 100);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(slots[i], i + 1);
    }
}

TEST(TaskGroup, BoundedConcurrency) {
    TaskGroup group(3);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    for (int i = 0; i < 24; ++i) {
        group.add([&active, &peak](std::stop_token) -> Result<void> {
            const int now = active.fetch_add(1) + 1;
            int previous = peak.load();
            while (now > previous && !peak.compare_exchange_weak(previous, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            active.fetch_sub(1);
            return Ok();
        });
    }
    ASSERT_TRUE(group.run().is_ok());
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(TaskGroup, FirstErrorSkipsRemainingTasks) {
    TaskGroup group(1);
    std::atomic<int> started{0};
    for (int i = 0; i < 10; ++i) {
        group.add([&started, i](std::stop_token) -> Result<void> {
            started.fetch_add(1);
            if (i == 3) {
                return Err(Error::Code::CorruptTile, "tile 3");
            }
            return Ok();
        });
    }
    auto result = group.run();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::CorruptTile);
    EXPECT_EQ(result.error().message, "tile 3");
    EXPECT_EQ(started.load(), 4);
}

TEST(TaskGroup, ErrorSignalsRunningTasks) {
    TaskGroup group(2);
    std::atomic<bool> saw_stop{false};
    group.add([&saw_stop](std::stop_token token) -> Result<void> {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!token.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        saw_stop = token.stop_requested();
        return Ok();
    });
    group.add([](std::stop_token) -> Result<void> {
        return Err(Error::Code::Transport, "connection reset");
    });

    auto result = group.run();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::Transport);
    EXPECT_TRUE(saw_stop.load());
}

TEST(TaskGroup, CallerCancellationWinsOverTaskErrors) {
    std::stop_source caller;
    TaskGroup group(1);
    group.add([&caller](std::stop_token) -> Result<void> {
        caller.request_stop();
        return Err(Error::Code::Transport, "aborted");
    });
    auto result = group.run(caller.get_token());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::Cancelled);
}

TEST(TaskGroup, CancelledBeforeRunStartsNothing) {
    std::stop_source caller;
    caller.request_stop();
    TaskGroup group(2);
    std::atomic<int> started{0};
    for (int i = 0; i < 5; ++i) {
        group.add([&started](std::stop_token) -> Result<void> {
            started.fetch_add(1);
            return Ok();
        });
    }
    auto result = group.run(caller.get_token());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::Cancelled);
    EXPECT_EQ(started.load(), 0);
}

// ============================================================================
// OnceCell
// ============================================================================

TEST(OnceCell, InitialisesOnceAcrossThreads) {
    detail::OnceCell<int> cell;
    EXPECT_EQ(cell.get(), nullptr);

    std::atomic<int> calls{0};
    std::vector<std::thread> threads;
    std::vector<int> seen(8, 0);
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cell, &calls, &seen, t]() {
            seen[t] = cell.get_or_init([&calls]() {
                calls.fetch_add(1);
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                return 42;
            });
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(calls.load(), 1);
    for (int value : seen) {
        EXPECT_EQ(value, 42);
    }
    ASSERT_NE(cell.get(), nullptr);
    EXPECT_EQ(*cell.get(), 42);

    cell.reset();
    EXPECT_EQ(cell.get(), nullptr);
    EXPECT_EQ(cell.get_or_init([]() { return 7; }), 7);
}

// ============================================================================
// Reader
// ============================================================================

TEST(ConcurrentReader, OpenFromManyThreadsParsesOnce) {
    CountingSource source(CogBuilder().add_pyramid(georeferenced_image(), 2).build());
    CogReader reader(source, quiet());

    std::vector<std::future<Result<void>>> opens;
    for (int t = 0; t < 8; ++t) {
        opens.push_back(std::async(std::launch::async, [&reader]() { return reader.open(); }));
    }
    for (auto& open : opens) {
        EXPECT_TRUE(open.get().is_ok());
    }
    EXPECT_EQ(reader.state(), ReaderState::Ready);
    EXPECT_EQ(source.reads(), 1u);
}

TEST(ConcurrentReader, FailedOpenSharedByAllThreads) {
    CogReader reader(MemorySource(std::vector<std::byte>(64, std::byte{0x42})), quiet());
    std::vector<std::future<Result<void>>> opens;
    for (int t = 0; t < 4; ++t) {
        opens.push_back(std::async(std::launch::async, [&reader]() { return reader.open(); }));
    }
    for (auto& open : opens) {
        auto result = open.get();
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error().code, Error::Code::InvalidTiff);
    }
    EXPECT_EQ(reader.state(), ReaderState::Failed);
}

TEST(ConcurrentReader, TilesFromManyThreads) {
    const ImageSpec image = georeferenced_image();
    CogReader reader(CogBuilder().add(image).source(), quiet());
    ASSERT_TRUE(reader.open().is_ok());

    std::vector<std::thread> threads;
    std::vector<std::string> mismatches(64);
    for (uint64_t t = 0; t < 8; ++t) {
        threads.emplace_back([&reader, &image, &mismatches, t]() {
            for (uint64_t col = 0; col < 8; ++col) {
                auto tile = reader.get_tile(0, col, t);
                mismatches[t * 8 + col] = tile ? tile_mismatch(tile.value(), image, col, t)
                                               : tile.error().message;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (std::size_t i = 0; i < mismatches.size(); ++i) {
        EXPECT_EQ(mismatches[i], "") << "tile " << i;
    }
}

TEST(ConcurrentReader, GetTileAsync) {
    const ImageSpec image = georeferenced_image();
    CogReader reader(CogBuilder().add(image).source(), quiet());
    ASSERT_TRUE(reader.open().is_ok());

    auto first = reader.get_tile_async(0, 1, 2);
    auto second = reader.get_tile_async(0, 7, 7);
    auto missing = reader.get_tile_async(0, 8, 0);

    auto a = first.get();
    auto b = second.get();
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(tile_mismatch(a.value(), image, 1, 2), "");
    EXPECT_EQ(tile_mismatch(b.value(), image, 7, 7), "");
    EXPECT_EQ(missing.get().error().code, Error::Code::OutOfRange);
}

TEST(ConcurrentReader, ReadAsyncMatchesRead) {
    CogReader reader(CogBuilder().add_pyramid(georeferenced_image(), 2).source(), quiet());
    ASSERT_TRUE(reader.open().is_ok());

    const Bounds window{20.0, 30.0, 100.0, 110.0};
    auto future = reader.read_async(window, {40, 40});
    auto direct = reader.read(window, {40, 40});
    auto async = future.get();
    ASSERT_TRUE(direct.is_ok()) << direct.error().message;
    ASSERT_TRUE(async.is_ok()) << async.error().message;
    ASSERT_EQ(async.value().bytes().size(), direct.value().bytes().size());
    EXPECT_TRUE(std::equal(async.value().bytes().begin(), async.value().bytes().end(),
                           direct.value().bytes().begin()));
}

TEST(ConcurrentReader, SingleThreadedReadMatchesParallel) {
    const auto bytes = CogBuilder().add(georeferenced_image()).build();
    CogReader serial(MemorySource(bytes), quiet(1));
    CogReader parallel(MemorySource(bytes), quiet(8));
    ASSERT_TRUE(serial.open().is_ok());
    ASSERT_TRUE(parallel.open().is_ok());

    const Bounds everything{0.0, 0.0, 128.0, 128.0};
    auto a = serial.read(everything, {128, 128});
    auto b = parallel.read(everything, {128, 128});
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_TRUE(std::equal(a.value().bytes().begin(), a.value().bytes().end(), b.value().bytes().begin()));
}

TEST(ConcurrentReader, StoppedReadIsCancelled) {
    CogReader reader(CogBuilder().add(georeferenced_image()).source(), quiet());
    ASSERT_TRUE(reader.open().is_ok());

    std::stop_source stop;
    stop.request_stop();
    auto result = reader.read(Bounds{0.0, 0.0, 128.0, 128.0}, {64, 64}, stop.get_token());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::Cancelled);

    auto async = reader.read_async(Bounds{0.0, 0.0, 128.0, 128.0}, {64, 64}, stop.get_token()).get();
    ASSERT_TRUE(async.is_error());
    EXPECT_EQ(async.error().code, Error::Code::Cancelled);

    // The reader stays usable
    EXPECT_TRUE(reader.read(Bounds{0.0, 0.0, 128.0, 128.0}, {64, 64}).is_ok());
}
