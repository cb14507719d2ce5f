#include "../src/encoding/wire.hpp"
#include "../src/storage/reader.hpp"
#include "../src/storage/writer.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <vector>

using namespace semilog_cpp::encoding;
using namespace semilog_cpp::storage;

namespace {

auto uleb(std::uint64_t value) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    encode_uleb128(value, out);
    return out;
}

}  // namespace

// -- Unsigned LEB128 ----------------------------------------------------------

TEST(Uleb128, small_values_take_one_byte) {
    EXPECT_EQ(uleb(0), (std::vector<std::byte>{std::byte{0x00}}));
    EXPECT_EQ(uleb(127), (std::vector<std::byte>{std::byte{0x7F}}));
}

TEST(Uleb128, multi_byte_values) {
    // 300 = 0x12C -> [0xAC, 0x02]
    EXPECT_EQ(uleb(300), (std::vector<std::byte>{std::byte{0xAC}, std::byte{0x02}}));
    // 624485 -> [0xE5, 0x8E, 0x26]
    EXPECT_EQ(uleb(624485),
              (std::vector<std::byte>{std::byte{0xE5}, std::byte{0x8E}, std::byte{0x26}}));
    EXPECT_EQ(uleb(std::numeric_limits<std::uint64_t>::max()).size(), 10u);
}

TEST(Uleb128, decode_reports_bytes_read) {
    const auto bytes = uleb(624485);
    const auto result = decode_uleb128(bytes);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, 624485u);
    EXPECT_EQ(result->bytes_read, 3u);
}

TEST(Uleb128, decode_max_uint64) {
    const auto bytes = uleb(std::numeric_limits<std::uint64_t>::max());
    const auto result = decode_uleb128(bytes);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, std::numeric_limits<std::uint64_t>::max());
}

TEST(Uleb128, truncated_input_is_rejected) {
    const auto bytes = std::vector<std::byte>{std::byte{0x80}, std::byte{0x80}};
    EXPECT_FALSE(decode_uleb128(bytes).has_value());
    EXPECT_FALSE(decode_uleb128({}).has_value());
}

TEST(Uleb128, overflow_is_rejected) {
    auto bytes = std::vector<std::byte>(9, std::byte{0xFF});
    bytes.push_back(std::byte{0x02});
    EXPECT_FALSE(decode_uleb128(bytes).has_value());
}

// -- Field keys ---------------------------------------------------------------

TEST(FieldKey, packs_tag_and_wire_type) {
    EXPECT_EQ(make_key(0, WireType::varint), 0u);
    EXPECT_EQ(make_key(1, WireType::bytes), 10u);

    const auto key = split_key(make_key(7, WireType::bytes));
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->tag, 7u);
    EXPECT_EQ(key->wire, WireType::bytes);
}

TEST(FieldKey, unknown_wire_types_are_rejected) {
    EXPECT_FALSE(split_key(1).has_value());
    EXPECT_FALSE(split_key((3u << 3) | 5).has_value());
}

// -- Reader / Writer ----------------------------------------------------------

TEST(Reader, reads_back_what_writer_wrote) {
    auto writer = Writer{};
    writer.write_key(2, WireType::varint);
    writer.write_uleb128(1000);
    writer.write_key(3, WireType::bytes);
    writer.write_string("hello");

    const auto& data = writer.data();
    auto reader = Reader{data};
    auto key = reader.read_key();
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->tag, 2u);
    EXPECT_EQ(reader.read_uleb128(), 1000u);

    key = reader.read_key();
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->wire, WireType::bytes);
    EXPECT_EQ(reader.read_string(), "hello");
    EXPECT_TRUE(reader.at_end());
}

TEST(Reader, skip_consumes_unknown_fields) {
    auto writer = Writer{};
    writer.write_uleb128(123456);
    writer.write_string("skipped");
    writer.write_uleb128(9);

    auto reader = Reader{writer.data()};
    EXPECT_TRUE(reader.skip(WireType::varint));
    EXPECT_TRUE(reader.skip(WireType::bytes));
    EXPECT_EQ(reader.read_uleb128(), 9u);
}

TEST(Reader, length_past_the_end_is_rejected) {
    auto writer = Writer{};
    writer.write_uleb128(50);
    writer.write_uleb128(1);

    auto reader = Reader{writer.data()};
    EXPECT_FALSE(reader.read_delimited().has_value());
}

TEST(Reader, never_reads_past_the_end) {
    auto reader = Reader{std::span<const std::byte>{}};
    EXPECT_TRUE(reader.at_end());
    EXPECT_FALSE(reader.read_uleb128().has_value());
    EXPECT_FALSE(reader.read_bytes(1).has_value());
    EXPECT_FALSE(reader.read_key().has_value());
}
