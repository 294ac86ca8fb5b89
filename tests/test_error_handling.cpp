#include <gtest/gtest.h>
#include <cstdint>
#include <string>
#include <vector>

#include "../cogstream/include/cogstream/cog_reader.hpp"
#include "../cogstream/include/cogstream/types/result.hpp"
#include "test_helpers.hpp"

using namespace cogstream;
using namespace cogtest;

namespace {

ReaderOptions quiet() {
    ReaderOptions options;
    options.log_level = LogLevel::Off;
    return options;
}

/// 128x128 uncompressed uint16 image: 32 KiB of tiles, most of them beyond the header prefix
ImageSpec large_image() {
    return pattern_image(128, 128, DataType::UInt16);
}

ImageSpec with_raw_chunk(ImageSpec image, std::size_t index, std::vector<std::byte> chunk) {
    image.raw_chunks = image.encode_chunks(ByteOrder::LittleEndian);
    image.raw_chunks[index] = std::move(chunk);
    return image;
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

} // namespace

// ============================================================================
// Result and Error
// ============================================================================

TEST(ResultApi, ValueAndError) {
    Result<int> ok = Ok(5);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_EQ(ok.value(), 5);
    EXPECT_EQ(ok.value_or(9), 5);

    Result<int> failed = Err(Error::Code::OutOfRange, "level 7");
    EXPECT_TRUE(failed.is_error());
    EXPECT_FALSE(static_cast<bool>(failed));
    EXPECT_EQ(failed.error().code, Error::Code::OutOfRange);
    EXPECT_EQ(failed.error().message, "level 7");
    EXPECT_EQ(failed.value_or(9), 9);
}

TEST(ResultApi, Chaining) {
    auto halve = [](int v) -> Result<int> {
        if (v % 2 != 0) {
            return Err(Error::Code::CorruptTile, "odd");
        }
        return Ok(v / 2);
    };

    EXPECT_EQ(Result<int>(8).and_then(halve).value(), 4);
    EXPECT_EQ(Result<int>(7).and_then(halve).error().code, Error::Code::CorruptTile);

    auto text = Result<int>(3).transform([](int v) { return std::to_string(v * 2); });
    EXPECT_EQ(text.value(), "6");

    Result<int> failed = Err(Error::Code::Transport, "timeout");
    auto propagated = failed.transform([](int v) { return v + 1; });
    ASSERT_TRUE(propagated.is_error());
    EXPECT_EQ(propagated.error().message, "timeout");
}

TEST(ResultApi, VoidResult) {
    Result<void> ok = Ok();
    EXPECT_TRUE(ok.is_ok());
    Result<void> failed = Err(Error::Code::Cancelled);
    EXPECT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, Error::Code::Cancelled);
}

TEST(ErrorApi, ContextKeepsCode) {
    const Error base{Error::Code::CorruptTile, "Decompressed 10 bytes"};
    const Error wrapped = base.with_context("Chunk 3 at offset 4096");
    EXPECT_EQ(wrapped.code, Error::Code::CorruptTile);
    EXPECT_EQ(wrapped.message, "Chunk 3 at offset 4096: Decompressed 10 bytes");
    EXPECT_TRUE(wrapped.is_error());
    EXPECT_FALSE(base.is_success());
    EXPECT_TRUE(Error{Error::Code::Success}.is_success());
}

TEST(ErrorApi, CodeNames) {
    EXPECT_EQ(error_code_name(Error::Code::InvalidTiff), "InvalidTiff");
    EXPECT_EQ(error_code_name(Error::Code::MalformedTag), "MalformedTag");
    EXPECT_EQ(error_code_name(Error::Code::UnsupportedCompression), "UnsupportedCompression");
    EXPECT_EQ(error_code_name(Error::Code::CorruptTile), "CorruptTile");
    EXPECT_EQ(error_code_name(Error::Code::MissingGeoreferencing), "MissingGeoreferencing");
    EXPECT_EQ(error_code_name(Error::Code::OutOfRange), "OutOfRange");
    EXPECT_EQ(error_code_name(Error::Code::Transport), "Transport");
    EXPECT_EQ(error_code_name(Error::Code::InvalidState), "InvalidState");
    EXPECT_EQ(error_code_name(Error::Code::Cancelled), "Cancelled");
}

// ============================================================================
// Transport failures
// ============================================================================

TEST(ReaderErrors, LengthFailureFailsOpen) {
    CountingSource source(CogBuilder().add(large_image()).build());
    source.fail_length();
    CogReader reader(source, quiet());
    auto opened = reader.open();
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, Error::Code::Transport);
    EXPECT_EQ(reader.state(), ReaderState::Failed);
}

TEST(ReaderErrors, PrefixFailureFailsOpen) {
    CountingSource source(CogBuilder().add(large_image()).build());
    source.fail_from(0);
    CogReader reader(source, quiet());
    auto opened = reader.open();
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, Error::Code::Transport);
    EXPECT_TRUE(contains(opened.error().message, "HTTP 503"));

    // The failure is kept: no retry on the next call
    const std::size_t reads = source.reads();
    EXPECT_EQ(reader.profile().error().code, Error::Code::Transport);
    EXPECT_EQ(reader.open().error().code, Error::Code::Transport);
    EXPECT_EQ(source.reads(), reads);
}

TEST(ReaderErrors, TileFetchFailure) {
    CountingSource source(CogBuilder().add(large_image()).build());
    source.fail_from(20000);
    CogReader reader(source, quiet());
    ASSERT_TRUE(reader.open().is_ok());

    // Served from the prefix
    EXPECT_TRUE(reader.get_tile(0, 0, 0).is_ok());

    auto tile = reader.get_tile(0, 7, 7);
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::Transport);

    // Other tiles and the reader state are unaffected
    EXPECT_EQ(reader.state(), ReaderState::Ready);
    EXPECT_TRUE(reader.get_tile(0, 1, 0).is_ok());
}

TEST(ReaderErrors, WindowReadReportsTransportError) {
    ImageSpec image = large_image();
    GeoSpec geo;
    geo.origin_y = 128.0;
    image.extra_tags = geo_tags(geo);
    CountingSource source(CogBuilder().add(image).build());
    source.fail_from(20000);
    CogReader reader(source, quiet());
    ASSERT_TRUE(reader.open().is_ok());

    auto out = reader.read(Bounds{0.0, 0.0, 128.0, 128.0}, {128, 128});
    ASSERT_TRUE(out.is_error());
    EXPECT_EQ(out.error().code, Error::Code::Transport);
}

// ============================================================================
// Corrupt data
// ============================================================================

TEST(ReaderErrors, TruncatedStreamIsCorruptTile) {
    auto bytes = CogBuilder().add(large_image()).build();
    bytes.resize(bytes.size() - 100);
    CogReader reader(MemorySource(bytes), quiet());
    ASSERT_TRUE(reader.open().is_ok());

    auto last = reader.get_tile(0, 7, 7);
    ASSERT_TRUE(last.is_error());
    EXPECT_EQ(last.error().code, Error::Code::CorruptTile);
    EXPECT_TRUE(contains(last.error().message, "past the end of the stream"));
    EXPECT_TRUE(reader.get_tile(0, 0, 0).is_ok());
}

TEST(ReaderErrors, GarbageDeflateTile) {
    ImageSpec image = pattern_image(32, 32);
    image.compression = static_cast<uint16_t>(CompressionScheme::Deflate);
    image = with_raw_chunk(image, 2, std::vector<std::byte>(50, std::byte{0xEE}));
    CogReader reader(CogBuilder().add(image).source(), quiet());
    ASSERT_TRUE(reader.open().is_ok());

    auto tile = reader.get_tile(0, 0, 1);
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::CorruptTile);
    EXPECT_TRUE(contains(tile.error().message, "Chunk 2 at offset"));
    EXPECT_TRUE(reader.get_tile(0, 1, 1).is_ok());
}

TEST(ReaderErrors, GarbageLzwTile) {
    ImageSpec image = pattern_image(32, 32, DataType::UInt16);
    image.compression = static_cast<uint16_t>(CompressionScheme::LZW);
    // Clear code followed by a code the table does not hold yet
    image = with_raw_chunk(image, 0, {std::byte{0x80}, std::byte{0x10}, std::byte{0x72}, std::byte{0x00}});
    CogReader reader(CogBuilder().add(image).source(), quiet());
    ASSERT_TRUE(reader.open().is_ok());

    auto tile = reader.get_tile(0, 0, 0);
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::CorruptTile);
}

TEST(ReaderErrors, ShortUncompressedTile) {
    ImageSpec image = pattern_image(32, 32);
    image = with_raw_chunk(image, 1, std::vector<std::byte>(10, std::byte{1}));
    CogReader reader(CogBuilder().add(image).source(), quiet());
    ASSERT_TRUE(reader.open().is_ok());

    auto tile = reader.get_tile(0, 1, 0);
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::CorruptTile);
    EXPECT_TRUE(contains(tile.error().message, "expected 256"));
}

TEST(ReaderErrors, UnsupportedCompressionOnlyFailsPixels) {
    ImageSpec image = pattern_image(32, 32);
    image.compression = static_cast<uint16_t>(CompressionScheme::CCITT_Fax4);
    image.raw_chunks.assign(image.chunk_count(), std::vector<std::byte>(16, std::byte{0}));
    CogReader reader(CogBuilder().add(image).source(), quiet());
    ASSERT_TRUE(reader.open().is_ok());
    EXPECT_TRUE(reader.profile().is_ok());

    auto tile = reader.get_tile(0, 0, 0);
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::UnsupportedCompression);
}

// ============================================================================
// Broken structure
// ============================================================================

TEST(ReaderErrors, OversizedTileFailsOpen) {
    ImageSpec image = pattern_image(100, 100);
    image.tile_width = 4000000000;
    image.tile_height = 4000000000;
    image.raw_chunks = {std::vector<std::byte>(16, std::byte{0})};

    CogReader reader(CogBuilder().add(image).source(), quiet());
    auto opened = reader.open();
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, Error::Code::MemoryError);
    EXPECT_TRUE(contains(opened.error().message, "byte limit")) << opened.error().message;
    EXPECT_TRUE(reader.get_tile(0, 0, 0).is_error());
}

TEST(ReaderErrors, LoopingChainFailsOpen) {
    CogReader reader(CogBuilder().add_pyramid(pattern_image(64, 64), 1).loop_chain().source(), quiet());
    auto opened = reader.open();
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, Error::Code::InvalidTiff);
}

TEST(ReaderErrors, TooManyIfdsFailsOpen) {
    ReaderOptions options = quiet();
    options.max_ifds = 2;
    CogReader reader(CogBuilder().add_pyramid(pattern_image(64, 64), 3).source(), options);
    auto opened = reader.open();
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, Error::Code::InvalidTiff);
}

TEST(ReaderErrors, EmptyStream) {
    CogReader reader(MemorySource(std::vector<std::byte>{}), quiet());
    auto opened = reader.open();
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, Error::Code::InvalidTiff);
    EXPECT_EQ(reader.state(), ReaderState::Failed);
}
