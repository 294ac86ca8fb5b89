#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "../cogstream/include/cogstream/directory_reader.hpp"
#include "../cogstream/include/cogstream/sources/memory_source.hpp"
#include "../cogstream/include/cogstream/tag.hpp"
#include "test_helpers.hpp"

using namespace cogstream;
using cogtest::ByteWriter;

// ============================================================================
// Value decoding
// ============================================================================

TEST(TagCodec, ShortsInBothByteOrders) {
    for (ByteOrder order : {ByteOrder::LittleEndian, ByteOrder::BigEndian}) {
        ByteWriter w(order);
        w.put(uint16_t{256});
        w.put(uint16_t{65535});
        const auto bytes = std::move(w).take();

        auto value = tag_codec::decode_values(TiffDataType::Short, 2, bytes, order);
        ASSERT_TRUE(value.is_ok());
        Tag tag(256, TiffDataType::Short, 2, value.value());
        auto values = tag.as_uint_array();
        ASSERT_TRUE(values.is_ok());
        EXPECT_EQ(values.value(), (std::vector<uint64_t>{256, 65535}));
    }
}

TEST(TagCodec, Long8BigEndian) {
    ByteWriter w(ByteOrder::BigEndian);
    w.put(uint64_t{0x0102030405060708ULL});
    const auto bytes = std::move(w).take();

    auto value = tag_codec::decode_values(TiffDataType::Long8, 1, bytes, ByteOrder::BigEndian);
    ASSERT_TRUE(value.is_ok());
    Tag tag(324, TiffDataType::Long8, 1, value.value());
    EXPECT_EQ(tag.as_uint().value(), 0x0102030405060708ULL);
}

TEST(TagCodec, RationalsDivideOut) {
    ByteWriter w(ByteOrder::LittleEndian);
    w.put(uint32_t{3});
    w.put(uint32_t{4});
    w.put(uint32_t{1});
    w.put(uint32_t{0});
    const auto bytes = std::move(w).take();

    auto value = tag_codec::decode_values(TiffDataType::Rational, 2, bytes, ByteOrder::LittleEndian);
    ASSERT_TRUE(value.is_ok());
    Tag tag(282, TiffDataType::Rational, 2, value.value());
    auto doubles = tag.as_double_array();
    ASSERT_TRUE(doubles.is_ok());
    EXPECT_DOUBLE_EQ(doubles.value()[0], 0.75);
    EXPECT_TRUE(std::isnan(doubles.value()[1]));

    // Rationals are not unsigned integers
    EXPECT_EQ(tag.as_uint().error().code, Error::Code::MalformedTag);
}

TEST(TagCodec, SignedRational) {
    ByteWriter w(ByteOrder::BigEndian);
    w.put(static_cast<uint32_t>(-6));
    w.put(uint32_t{4});
    const auto bytes = std::move(w).take();

    auto value = tag_codec::decode_values(TiffDataType::SRational, 1, bytes, ByteOrder::BigEndian);
    ASSERT_TRUE(value.is_ok());
    Tag tag(0, TiffDataType::SRational, 1, value.value());
    EXPECT_DOUBLE_EQ(tag.as_double().value(), -1.5);
}

TEST(TagCodec, FloatsAndDoubles) {
    ByteWriter w(ByteOrder::BigEndian);
    w.put(1.5f);
    w.put(-2.25);
    const auto bytes = std::move(w).take();

    auto f = tag_codec::decode_values(TiffDataType::Float, 1, std::span(bytes).first(4), ByteOrder::BigEndian);
    ASSERT_TRUE(f.is_ok());
    EXPECT_FLOAT_EQ(Tag(0, TiffDataType::Float, 1, f.value()).as_double().value(), 1.5);

    auto d = tag_codec::decode_values(TiffDataType::Double, 1, std::span(bytes).subspan(4), ByteOrder::BigEndian);
    ASSERT_TRUE(d.is_ok());
    EXPECT_DOUBLE_EQ(Tag(0, TiffDataType::Double, 1, d.value()).as_double().value(), -2.25);
}

TEST(TagCodec, AsciiStripsTrailingNul) {
    const std::string text = "WGS 84|";
    std::vector<std::byte> bytes;
    for (char c : text) bytes.push_back(static_cast<std::byte>(c));
    bytes.push_back(std::byte{0});

    auto value = tag_codec::decode_values(TiffDataType::Ascii, bytes.size(), bytes, ByteOrder::LittleEndian);
    ASSERT_TRUE(value.is_ok());
    Tag tag(34737, TiffDataType::Ascii, bytes.size(), value.value());
    EXPECT_EQ(tag.as_string().value(), "WGS 84|");
    EXPECT_EQ(tag.as_uint().error().code, Error::Code::MalformedTag);
}

TEST(TagCodec, UndefinedBytes) {
    const std::vector<std::byte> bytes = {std::byte{0xFF}, std::byte{0xD8}, std::byte{0xFF}, std::byte{0xD9}};
    auto value = tag_codec::decode_values(TiffDataType::Undefined, 4, bytes, ByteOrder::LittleEndian);
    ASSERT_TRUE(value.is_ok());
    Tag tag(347, TiffDataType::Undefined, 4, value.value());
    auto raw = tag.as_bytes();
    ASSERT_TRUE(raw.is_ok());
    ASSERT_EQ(raw.value().size(), 4u);
    EXPECT_EQ(raw.value()[1], 0xD8);
}

TEST(TagCodec, ShortBlockIsMalformed) {
    const std::vector<std::byte> bytes(3);
    auto value = tag_codec::decode_values(TiffDataType::Long, 1, bytes, ByteOrder::LittleEndian);
    ASSERT_TRUE(value.is_error());
    EXPECT_EQ(value.error().code, Error::Code::MalformedTag);
}

TEST(TagCodec, ValueByteSize) {
    EXPECT_EQ(tag_codec::value_byte_size(3, 5).value(), 10u);
    EXPECT_EQ(tag_codec::value_byte_size(5, 2).value(), 16u);
    EXPECT_EQ(tag_codec::value_byte_size(16, 3).value(), 24u);

    auto unknown = tag_codec::value_byte_size(99, 1);
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, Error::Code::MalformedTag);

    auto overflow = tag_codec::value_byte_size(16, UINT64_MAX / 4);
    ASSERT_TRUE(overflow.is_error());
    EXPECT_EQ(overflow.error().code, Error::Code::MalformedTag);
}

// ============================================================================
// Directory entries
// ============================================================================

namespace {

/// Classic little-endian stream: header, then `tail` from offset 8
std::vector<std::byte> classic_stream(const std::vector<std::byte>& tail, ByteOrder order = ByteOrder::LittleEndian) {
    ByteWriter w(order);
    w.put(static_cast<uint8_t>(order == ByteOrder::LittleEndian ? 'I' : 'M'));
    w.put(static_cast<uint8_t>(order == ByteOrder::LittleEndian ? 'I' : 'M'));
    w.put(uint16_t{42});
    w.put(uint32_t{8});
    w.put_bytes(tail);
    return std::move(w).take();
}

std::vector<std::byte> entry(ByteOrder order, uint16_t code, uint16_t type, uint32_t count, uint32_t slot) {
    ByteWriter w(order);
    w.put(code);
    w.put(type);
    w.put(count);
    w.put(slot);
    return std::move(w).take();
}

} // namespace

TEST(TagCodec, InlineShortInBigEndianSlot) {
    // A single SHORT sits in the first two bytes of the slot
    ByteWriter w(ByteOrder::BigEndian);
    w.put(uint16_t{259});
    w.put(uint16_t{3});
    w.put(uint32_t{1});
    w.put(uint16_t{8});
    w.put(uint16_t{0});
    const auto raw = std::move(w).take();

    MemorySource source(classic_stream(raw, ByteOrder::BigEndian));
    auto reader = DirectoryReader<MemorySource>::open(source, 1024);
    ASSERT_TRUE(reader.is_ok());

    auto tag = tag_codec::decode_tag(raw, reader.value());
    ASSERT_TRUE(tag.is_ok());
    EXPECT_EQ(tag.value().code(), 259);
    EXPECT_EQ(tag.value().as_uint().value(), 8u);
}

TEST(TagCodec, OutOfLineValues) {
    // Entry at 8 points to three LONGs at 20
    auto raw = entry(ByteOrder::LittleEndian, 324, 4, 3, 20);
    ByteWriter tail(ByteOrder::LittleEndian);
    tail.put_bytes(raw);
    tail.put(uint32_t{100});
    tail.put(uint32_t{200});
    tail.put(uint32_t{300});
    MemorySource source(classic_stream(std::move(tail).take()));
    auto reader = DirectoryReader<MemorySource>::open(source, 1024);
    ASSERT_TRUE(reader.is_ok());

    auto tag = tag_codec::decode_tag(raw, reader.value());
    ASSERT_TRUE(tag.is_ok()) << tag.error().message;
    EXPECT_EQ(tag.value().count(), 3u);
    EXPECT_EQ(tag.value().as_uint_array().value(), (std::vector<uint64_t>{100, 200, 300}));
}

TEST(TagCodec, OutOfLineBeyondStreamIsMalformed) {
    auto raw = entry(ByteOrder::LittleEndian, 324, 4, 100, 20);
    MemorySource source(classic_stream(raw));
    auto reader = DirectoryReader<MemorySource>::open(source, 1024);
    ASSERT_TRUE(reader.is_ok());

    auto tag = tag_codec::decode_tag(raw, reader.value());
    ASSERT_TRUE(tag.is_error());
    EXPECT_EQ(tag.error().code, Error::Code::MalformedTag);
}

TEST(TagCodec, OutOfLineReadOutsidePrefix) {
    auto raw = entry(ByteOrder::LittleEndian, 33550, 12, 3, 64);
    ByteWriter tail(ByteOrder::LittleEndian);
    tail.put_bytes(raw);
    tail.seek(64 - 8);
    tail.put(10.0);
    tail.put(20.0);
    tail.put(0.0);
    cogtest::CountingSource source(classic_stream(std::move(tail).take()));
    auto reader = DirectoryReader<cogtest::CountingSource>::open(source, 16);
    ASSERT_TRUE(reader.is_ok());

    auto tag = tag_codec::decode_tag(raw, reader.value());
    ASSERT_TRUE(tag.is_ok());
    EXPECT_EQ(source.reads(), 2u);
    EXPECT_DOUBLE_EQ(tag.value().as_double(1).value(), 20.0);
}
