#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "../cogstream/include/cogstream/directory_reader.hpp"
#include "../cogstream/include/cogstream/ifd.hpp"
#include "../cogstream/include/cogstream/image_info.hpp"
#include "../cogstream/include/cogstream/log.hpp"
#include "../cogstream/include/cogstream/sources/memory_source.hpp"
#include "test_helpers.hpp"

using namespace cogstream;
using namespace cogtest;

namespace {

/// Collects log messages for inspection
struct CapturedLog {
    std::mutex mutex;
    std::vector<std::pair<LogLevel, std::string>> messages;

    Logger logger(LogLevel level = LogLevel::Trace) {
        return Logger(level, [this](LogLevel l, std::string_view message) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.emplace_back(l, std::string(message));
        });
    }

    bool contains(std::string_view needle) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [level, message] : messages) {
            if (message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
};

Result<Ifd> first_ifd(const std::vector<std::byte>& data, const Logger& logger = Logger{}) {
    MemorySource source(data);
    auto reader = DirectoryReader<MemorySource>::open(source, 1 << 20);
    if (!reader) {
        return reader.error();
    }
    return parse_ifd(reader.value(), reader.value().layout().first_ifd_offset, logger);
}

Ifd make_ifd(std::initializer_list<Tag> tags) {
    Ifd ifd(8);
    for (const auto& tag : tags) {
        ifd.add(tag);
    }
    return ifd;
}

Tag short_value(TagCode code, std::vector<uint16_t> values) {
    const auto count = values.size();
    return Tag(static_cast<uint16_t>(code), TiffDataType::Short, count, TagValue{std::move(values)});
}

Tag long_value(TagCode code, std::vector<uint32_t> values) {
    const auto count = values.size();
    return Tag(static_cast<uint16_t>(code), TiffDataType::Long, count, TagValue{std::move(values)});
}

Tag long8_value(TagCode code, std::vector<uint64_t> values) {
    const auto count = values.size();
    return Tag(static_cast<uint16_t>(code), TiffDataType::Long8, count, TagValue{std::move(values)});
}

Tag ascii_value(TagCode code, std::string text) {
    const auto count = text.size() + 1;
    return Tag(static_cast<uint16_t>(code), TiffDataType::Ascii, count, TagValue{text + '\0'});
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(IfdParsing, ClassicTiledImage) {
    ImageSpec image = pattern_image(40, 24, DataType::UInt16, 3);
    image.compression = static_cast<uint16_t>(CompressionScheme::Deflate);
    image.predictor = Predictor::Horizontal;

    auto ifd = first_ifd(CogBuilder().add(image).build());
    ASSERT_TRUE(ifd.is_ok()) << ifd.error().message;
    EXPECT_EQ(ifd.value().next_offset(), 0u);
    EXPECT_EQ(ifd.value().image_width().value(), 40u);
    EXPECT_EQ(ifd.value().image_height().value(), 24u);
    EXPECT_EQ(*ifd.value().tile_width().value(), 16u);
    EXPECT_EQ(ifd.value().samples_per_pixel().value(), 3);
    EXPECT_EQ(ifd.value().bits_per_sample().value(), (std::vector<uint16_t>{16, 16, 16}));
    EXPECT_EQ(ifd.value().compression().value(), static_cast<uint16_t>(CompressionScheme::Deflate));
    EXPECT_EQ(ifd.value().predictor().value(), Predictor::Horizontal);
    EXPECT_EQ(ifd.value().photometric().value(), static_cast<uint16_t>(PhotometricInterpretation::RGB));
    EXPECT_TRUE(ifd.value().is_tiled());
    EXPECT_EQ(ifd.value().tile_count().value(), (std::pair<uint64_t, uint64_t>{3, 2}));
}

TEST(IfdParsing, BigTiffBigEndian) {
    ImageSpec image = pattern_image(64, 64, DataType::Float32);
    auto ifd = first_ifd(CogBuilder(ByteOrder::BigEndian, true).add(image).build());
    ASSERT_TRUE(ifd.is_ok()) << ifd.error().message;
    EXPECT_EQ(ifd.value().sample_format().value(), SampleFormat::IEEEFloat);
    EXPECT_EQ(ifd.value().uint_array(TagCode::TileOffsets).value().size(), 16u);
    EXPECT_EQ(ifd.value().find(TagCode::TileOffsets)->type(), TiffDataType::Long8);
}

TEST(IfdParsing, TagsIterateInFileOrder) {
    auto ifd = first_ifd(CogBuilder().add(pattern_image(16, 16)).build());
    ASSERT_TRUE(ifd.is_ok());
    uint16_t previous = 0;
    std::size_t count = 0;
    for (const Tag& tag : ifd.value()) {
        EXPECT_GT(tag.code(), previous);
        previous = tag.code();
        ++count;
    }
    EXPECT_EQ(count, ifd.value().size());
    EXPECT_GE(count, 9u);
}

TEST(IfdParsing, UnknownTypeSkippedWithWarning) {
    ImageSpec image = pattern_image(16, 16);
    image.extra_tags.push_back(bytes_tag(65000, {1, 2, 3, 4, 5, 6}, static_cast<TiffDataType>(99)));

    CapturedLog log;
    auto ifd = first_ifd(CogBuilder().add(image).build(), log.logger());
    ASSERT_TRUE(ifd.is_ok()) << ifd.error().message;
    EXPECT_EQ(ifd.value().find(65000), nullptr);
    EXPECT_TRUE(log.contains("unknown type 99"));
}

TEST(IfdParsing, DuplicateTagKeepsFirst) {
    ImageSpec image = pattern_image(16, 16);
    image.extra_tags.push_back(code_tag(TagCode::Compression, {static_cast<uint64_t>(CompressionScheme::LZW)}));

    CapturedLog log;
    auto ifd = first_ifd(CogBuilder().add(image).build(), log.logger());
    ASSERT_TRUE(ifd.is_ok());
    EXPECT_EQ(ifd.value().compression().value(), static_cast<uint16_t>(CompressionScheme::None));
    ASSERT_EQ(ifd.value().duplicate_codes().size(), 1u);
    EXPECT_EQ(ifd.value().duplicate_codes()[0], static_cast<uint16_t>(TagCode::Compression));
    EXPECT_TRUE(log.contains("duplicate tag 259"));
}

TEST(IfdParsing, DirectoryBeyondStream) {
    auto data = CogBuilder().add(pattern_image(16, 16)).build();
    MemorySource source(data);
    auto reader = DirectoryReader<MemorySource>::open(source, 1024);
    ASSERT_TRUE(reader.is_ok());

    auto ifd = parse_ifd(reader.value(), data.size() - 1, Logger{});
    ASSERT_TRUE(ifd.is_error());
    EXPECT_EQ(ifd.error().code, Error::Code::InvalidTiff);
}

TEST(IfdParsing, TruncatedEntriesAreInvalid) {
    auto data = CogBuilder().add(pattern_image(16, 16)).build();
    // Claim far more entries than the stream holds
    data[8] = std::byte{0xFF};
    data[9] = std::byte{0x7F};
    auto ifd = first_ifd(data);
    ASSERT_TRUE(ifd.is_error());
    EXPECT_EQ(ifd.error().code, Error::Code::InvalidTiff);
}

// ============================================================================
// Accessors
// ============================================================================

TEST(IfdAccessors, Defaults) {
    Ifd ifd = make_ifd({
        long_value(TagCode::ImageWidth, {10}),
        long_value(TagCode::ImageLength, {20}),
    });
    EXPECT_EQ(ifd.compression().value(), 1);
    EXPECT_EQ(ifd.samples_per_pixel().value(), 1);
    EXPECT_EQ(ifd.bits_per_sample().value(), (std::vector<uint16_t>{1}));
    EXPECT_EQ(ifd.sample_format().value(), SampleFormat::UnsignedInt);
    EXPECT_EQ(ifd.predictor().value(), Predictor::None);
    EXPECT_EQ(ifd.planar_configuration().value(), PlanarConfiguration::Chunky);
    EXPECT_FALSE(ifd.photometric().value().has_value());
    EXPECT_EQ(ifd.new_subfile_type().value(), 0u);
    EXPECT_FALSE(ifd.nodata().value().has_value());
    EXPECT_FALSE(ifd.is_tiled());
    EXPECT_FALSE(ifd.is_mask());
    EXPECT_EQ(ifd.tile_count().value(), (std::pair<uint64_t, uint64_t>{1, 1}));
}

TEST(IfdAccessors, MissingWidthIsInvalidTiff) {
    Ifd ifd = make_ifd({long_value(TagCode::ImageLength, {20})});
    auto width = ifd.image_width();
    ASSERT_TRUE(width.is_error());
    EXPECT_EQ(width.error().code, Error::Code::InvalidTiff);
}

TEST(IfdAccessors, WrongTypeIsMalformed) {
    Ifd ifd = make_ifd({ascii_value(TagCode::ImageWidth, "ten")});
    auto width = ifd.image_width();
    ASSERT_TRUE(width.is_error());
    EXPECT_EQ(width.error().code, Error::Code::MalformedTag);
}

TEST(IfdAccessors, NodataValues) {
    EXPECT_DOUBLE_EQ(*make_ifd({ascii_value(TagCode::GDAL_NoData, "-9999")}).nodata().value(), -9999.0);
    EXPECT_DOUBLE_EQ(*make_ifd({ascii_value(TagCode::GDAL_NoData, "0 ")}).nodata().value(), 0.0);
    EXPECT_TRUE(std::isnan(*make_ifd({ascii_value(TagCode::GDAL_NoData, "nan")}).nodata().value()));
    EXPECT_TRUE(std::isinf(*make_ifd({ascii_value(TagCode::GDAL_NoData, "-inf")}).nodata().value()));

    auto bad = make_ifd({ascii_value(TagCode::GDAL_NoData, "none")}).nodata();
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, Error::Code::MalformedTag);
}

TEST(IfdAccessors, SubfileFlags) {
    Ifd overview = make_ifd({long_value(TagCode::NewSubfileType, {subfile::ReducedResolution})});
    EXPECT_TRUE(overview.is_reduced_resolution());
    EXPECT_FALSE(overview.is_mask());

    Ifd mask = make_ifd({long_value(TagCode::NewSubfileType, {subfile::ReducedResolution | subfile::TransparencyMask})});
    EXPECT_TRUE(mask.is_mask());
    EXPECT_TRUE(mask.is_reduced_resolution());
}

TEST(IfdAccessors, ShortFieldsBeyond16BitsMalformed) {
    auto compression = make_ifd({long_value(TagCode::Compression, {65537})}).compression();
    ASSERT_TRUE(compression.is_error());
    EXPECT_EQ(compression.error().code, Error::Code::MalformedTag);
    EXPECT_NE(compression.error().message.find("Compression value 65537"), std::string::npos);

    auto samples = make_ifd({long_value(TagCode::SamplesPerPixel, {70000})}).samples_per_pixel();
    ASSERT_TRUE(samples.is_error());
    EXPECT_EQ(samples.error().code, Error::Code::MalformedTag);

    auto bits = make_ifd({long_value(TagCode::BitsPerSample, {8, 65536})}).bits_per_sample();
    ASSERT_TRUE(bits.is_error());
    EXPECT_EQ(bits.error().code, Error::Code::MalformedTag);

    EXPECT_EQ(make_ifd({long_value(TagCode::Compression, {50000})}).compression().value(), 50000);
}

// ============================================================================
// ImageInfo
// ============================================================================

TEST(ImageInfo, TiledLayout) {
    ImageSpec image = pattern_image(40, 24, DataType::Int16, 2);
    image.planar = true;
    image.nodata = "-1";
    auto ifd = first_ifd(CogBuilder().add(image).build());
    ASSERT_TRUE(ifd.is_ok());

    auto info = ImageInfo::from_ifd(ifd.value());
    ASSERT_TRUE(info.is_ok()) << info.error().message;
    EXPECT_EQ(info.value().chunks_across, 3u);
    EXPECT_EQ(info.value().chunks_down, 2u);
    EXPECT_EQ(info.value().dtype, DataType::Int16);
    EXPECT_TRUE(info.value().is_planar());
    EXPECT_EQ(info.value().planes(), 2);
    EXPECT_EQ(info.value().samples_per_chunk(), 1);
    EXPECT_EQ(info.value().chunk_index(1, 1, 1), 6u + 3u + 1u);
    EXPECT_EQ(info.value().chunk_offsets.size(), 12u);
    EXPECT_DOUBLE_EQ(*info.value().nodata, -1.0);
}

TEST(ImageInfo, StripLayout) {
    ImageSpec image = pattern_image(30, 25);
    image.tiled = false;
    image.rows_per_strip = 8;
    auto ifd = first_ifd(CogBuilder().add(image).build());
    ASSERT_TRUE(ifd.is_ok());

    auto info = ImageInfo::from_ifd(ifd.value());
    ASSERT_TRUE(info.is_ok()) << info.error().message;
    EXPECT_FALSE(info.value().tiled);
    EXPECT_EQ(info.value().chunk_width, 30u);
    EXPECT_EQ(info.value().chunk_height, 8u);
    EXPECT_EQ(info.value().chunks_across, 1u);
    EXPECT_EQ(info.value().chunks_down, 4u);
    EXPECT_EQ(info.value().stored_rows(0), 8u);
    EXPECT_EQ(info.value().stored_rows(3), 1u);
}

TEST(ImageInfo, BilevelIsUInt8) {
    ImageSpec base = pattern_image(16, 16);
    ImageSpec mask = mask_image(base, [](uint64_t x, uint64_t) { return x < 8; });
    auto ifd = first_ifd(CogBuilder().add(mask).build());
    ASSERT_TRUE(ifd.is_ok());
    auto info = ImageInfo::from_ifd(ifd.value());
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().bits_per_sample, 1);
    EXPECT_EQ(info.value().dtype, DataType::UInt8);
    EXPECT_TRUE(info.value().is_mask());
    EXPECT_EQ(info.value().chunk_byte_size(16), 2u * 16u);
}

TEST(ImageInfo, TooFewOffsetsIsInvalid) {
    Ifd ifd = make_ifd({
        long_value(TagCode::ImageWidth, {32}),
        long_value(TagCode::ImageLength, {32}),
        short_value(TagCode::BitsPerSample, {8}),
        short_value(TagCode::TileWidth, {16}),
        short_value(TagCode::TileLength, {16}),
        long_value(TagCode::TileOffsets, {100, 200, 300}),
        long_value(TagCode::TileByteCounts, {10, 10, 10}),
    });
    auto info = ImageInfo::from_ifd(ifd);
    ASSERT_TRUE(info.is_error());
    EXPECT_EQ(info.error().code, Error::Code::InvalidTiff);
}

TEST(ImageInfo, MixedBitsPerSampleUnsupported) {
    Ifd ifd = make_ifd({
        long_value(TagCode::ImageWidth, {16}),
        long_value(TagCode::ImageLength, {16}),
        short_value(TagCode::SamplesPerPixel, {2}),
        short_value(TagCode::BitsPerSample, {8, 16}),
    });
    auto info = ImageInfo::from_ifd(ifd);
    ASSERT_TRUE(info.is_error());
    EXPECT_EQ(info.error().code, Error::Code::UnsupportedFeature);
}

TEST(ImageInfo, ZeroWidthIsInvalid) {
    Ifd ifd = make_ifd({
        long_value(TagCode::ImageWidth, {0}),
        long_value(TagCode::ImageLength, {16}),
    });
    auto info = ImageInfo::from_ifd(ifd);
    ASSERT_TRUE(info.is_error());
    EXPECT_EQ(info.error().code, Error::Code::InvalidTiff);
}

TEST(ImageInfo, OversizedTileIsMemoryError) {
    Ifd ifd = make_ifd({
        long_value(TagCode::ImageWidth, {100}),
        long_value(TagCode::ImageLength, {100}),
        short_value(TagCode::BitsPerSample, {8}),
        long_value(TagCode::TileWidth, {4000000000u}),
        long_value(TagCode::TileLength, {4000000000u}),
        long_value(TagCode::TileOffsets, {8}),
        long_value(TagCode::TileByteCounts, {16}),
    });
    auto info = ImageInfo::from_ifd(ifd);
    ASSERT_TRUE(info.is_error());
    EXPECT_EQ(info.error().code, Error::Code::MemoryError);
}

TEST(ImageInfo, TileAtByteLimitAccepted) {
    // 32768 x 32768 bytes is exactly the limit
    Ifd ifd = make_ifd({
        long_value(TagCode::ImageWidth, {100}),
        long_value(TagCode::ImageLength, {100}),
        short_value(TagCode::BitsPerSample, {8}),
        long_value(TagCode::TileWidth, {32768}),
        long_value(TagCode::TileLength, {32768}),
        long_value(TagCode::TileOffsets, {8}),
        long_value(TagCode::TileByteCounts, {16}),
    });
    auto info = ImageInfo::from_ifd(ifd);
    ASSERT_TRUE(info.is_ok()) << info.error().message;
    EXPECT_EQ(info.value().chunk_byte_size(info.value().chunk_height), ImageInfo::max_chunk_bytes);

    Ifd wider = make_ifd({
        long_value(TagCode::ImageWidth, {100}),
        long_value(TagCode::ImageLength, {100}),
        short_value(TagCode::BitsPerSample, {16}),
        long_value(TagCode::TileWidth, {32768}),
        long_value(TagCode::TileLength, {32768}),
        long_value(TagCode::TileOffsets, {8}),
        long_value(TagCode::TileByteCounts, {16}),
    });
    auto over = ImageInfo::from_ifd(wider);
    ASSERT_TRUE(over.is_error());
    EXPECT_EQ(over.error().code, Error::Code::MemoryError);
}

TEST(ImageInfo, TileSizeBeyond32BitsIsInvalid) {
    Ifd ifd = make_ifd({
        long_value(TagCode::ImageWidth, {100}),
        long_value(TagCode::ImageLength, {100}),
        short_value(TagCode::BitsPerSample, {8}),
        long8_value(TagCode::TileWidth, {(uint64_t{1} << 32) + 16}),
        long_value(TagCode::TileLength, {16}),
        long_value(TagCode::TileOffsets, {8}),
        long_value(TagCode::TileByteCounts, {16}),
    });
    auto info = ImageInfo::from_ifd(ifd);
    ASSERT_TRUE(info.is_error());
    EXPECT_EQ(info.error().code, Error::Code::InvalidTiff);
    EXPECT_NE(info.error().message.find("exceeds 32 bits"), std::string::npos);
}
