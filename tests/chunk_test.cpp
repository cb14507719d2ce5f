#include "../src/storage/chunk.hpp"
#include "../src/storage/compression.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace semilog_cpp::storage;

namespace {

auto bytes_of(const std::string& s) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    for (auto c : s) out.push_back(static_cast<std::byte>(c));
    return out;
}

}  // namespace

// -- Envelope -----------------------------------------------------------------

TEST(Chunk, magic_bytes_are_correct) {
    EXPECT_EQ(chunk_magic[0], std::byte{0xA7});
    EXPECT_EQ(chunk_magic[1], std::byte{'S'});
    EXPECT_EQ(chunk_magic[2], std::byte{'L'});
    EXPECT_EQ(chunk_magic[3], std::byte{'G'});
}

TEST(Chunk, header_records_kind_flag_and_length) {
    const auto body = bytes_of("abc");
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkKind::root, true, body, output);

    const auto header = parse_chunk_header(output);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->kind, ChunkKind::root);
    EXPECT_TRUE(header->deflated);
    EXPECT_EQ(header->body_length, 3u);
    EXPECT_EQ(header->body_offset + 3, output.size());
}

TEST(Chunk, checksum_is_crc32_of_body) {
    // CRC-32 check value from the zlib documentation.
    EXPECT_EQ(compute_checksum(bytes_of("123456789")), 0xCBF43926u);
}

TEST(Chunk, valid_chunk_yields_its_body) {
    const auto body = bytes_of("payload");
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkKind::slice, false, body, output);

    const auto header = parse_chunk_header(output);
    ASSERT_TRUE(header.has_value());
    const auto extracted = chunk_body(*header, output);
    ASSERT_TRUE(extracted.has_value());
    EXPECT_EQ(std::vector<std::byte>(extracted->begin(), extracted->end()), body);
}

TEST(Chunk, tampered_body_fails_checksum) {
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkKind::slice, false, bytes_of("payload"), output);
    output.back() ^= std::byte{0x01};

    const auto header = parse_chunk_header(output);
    ASSERT_TRUE(header.has_value());
    EXPECT_FALSE(chunk_body(*header, output).has_value());
}

TEST(Chunk, trailing_bytes_are_rejected) {
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkKind::slice, false, bytes_of("payload"), output);
    output.push_back(std::byte{0});

    const auto header = parse_chunk_header(output);
    ASSERT_TRUE(header.has_value());
    EXPECT_FALSE(chunk_body(*header, output).has_value());
}

TEST(Chunk, truncated_body_is_rejected) {
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkKind::slice, false, bytes_of("payload"), output);
    output.pop_back();

    const auto header = parse_chunk_header(output);
    ASSERT_TRUE(header.has_value());
    EXPECT_FALSE(chunk_body(*header, output).has_value());
}

TEST(Chunk, bad_magic_or_kind_is_rejected) {
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkKind::slice, false, bytes_of("x"), output);

    auto bad_magic = output;
    bad_magic[0] = std::byte{0x00};
    EXPECT_FALSE(parse_chunk_header(bad_magic).has_value());

    auto bad_kind = output;
    bad_kind[8] = std::byte{0x09};
    EXPECT_FALSE(parse_chunk_header(bad_kind).has_value());

    EXPECT_FALSE(parse_chunk_header(std::span<const std::byte>{output}.first(5)).has_value());
}

// -- Compression --------------------------------------------------------------

TEST(Compression, deflate_then_inflate_restores_input) {
    auto input = std::vector<std::byte>{};
    for (int i = 0; i < 100000; ++i) input.push_back(static_cast<std::byte>(i % 7));

    const auto packed = deflate_body(input);
    ASSERT_TRUE(packed.has_value());
    EXPECT_LT(packed->size(), input.size());

    const auto unpacked = inflate_body(*packed);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_EQ(*unpacked, input);
}

TEST(Compression, corrupt_or_truncated_streams_are_rejected) {
    const auto packed = deflate_body(bytes_of(std::string(5000, 'q')));
    ASSERT_TRUE(packed.has_value());

    auto truncated = *packed;
    truncated.resize(truncated.size() / 2);
    EXPECT_FALSE(inflate_body(truncated).has_value());

    auto trailing = *packed;
    trailing.push_back(std::byte{0x42});
    EXPECT_FALSE(inflate_body(trailing).has_value());

    EXPECT_FALSE(inflate_body(bytes_of("not deflate at all")).has_value());
}
