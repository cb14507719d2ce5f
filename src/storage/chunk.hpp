#pragma once

// Chunk envelope around every encoded slice, root and detailed view.
//
//   magic     (4 bytes: 0xA7 'S' 'L' 'G')
//   checksum  (4 bytes: big-endian CRC-32 of the stored body)
//   kind      (1 byte: ChunkKind, high bit set when the body is deflated)
//   length    (ULEB128)
//   body      (length bytes, nothing may follow)
//
// Internal header, not installed.

#include "../encoding/wire.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace semilog_cpp::storage {

inline constexpr std::array<std::byte, 4> chunk_magic = {
    std::byte{0xA7}, std::byte{'S'}, std::byte{'L'}, std::byte{'G'}
};

enum class ChunkKind : std::uint8_t {
    slice    = 0x01,
    root     = 0x02,
    detailed = 0x03,
};

inline constexpr std::uint8_t deflated_flag = 0x80;

struct ChunkHeader {
    ChunkKind kind;
    bool deflated;
    std::uint32_t checksum;
    std::size_t body_offset;
    std::size_t body_length;
};

inline auto compute_checksum(std::span<const std::byte> body) -> std::uint32_t {
    auto crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(body.data()),
                  static_cast<uInt>(body.size()));
    return static_cast<std::uint32_t>(crc);
}

// Append a complete chunk around body.
inline void write_chunk(ChunkKind kind, bool deflated, std::span<const std::byte> body,
                        std::vector<std::byte>& output) {
    output.insert(output.end(), chunk_magic.begin(), chunk_magic.end());
    const auto crc = compute_checksum(body);
    for (int shift = 24; shift >= 0; shift -= 8) {
        output.push_back(static_cast<std::byte>((crc >> shift) & 0xFF));
    }
    auto kind_byte = static_cast<std::uint8_t>(kind);
    if (deflated) kind_byte |= deflated_flag;
    output.push_back(static_cast<std::byte>(kind_byte));
    encoding::encode_uleb128(body.size(), output);
    output.insert(output.end(), body.begin(), body.end());
}

// Parse the header at the front of data.
// Returns nullopt on bad magic, an unknown kind, or a truncated header.
inline auto parse_chunk_header(std::span<const std::byte> data)
    -> std::optional<ChunkHeader> {
    if (data.size() < 9) return std::nullopt;
    if (std::memcmp(data.data(), chunk_magic.data(), chunk_magic.size()) != 0) {
        return std::nullopt;
    }

    auto crc = std::uint32_t{0};
    for (std::size_t i = 4; i < 8; ++i) {
        crc = (crc << 8) | static_cast<std::uint32_t>(data[i]);
    }

    const auto kind_byte = static_cast<std::uint8_t>(data[8]);
    const auto kind = static_cast<std::uint8_t>(kind_byte & ~deflated_flag);
    if (kind < static_cast<std::uint8_t>(ChunkKind::slice) ||
        kind > static_cast<std::uint8_t>(ChunkKind::detailed)) {
        return std::nullopt;
    }

    auto len = encoding::decode_uleb128(data.subspan(9));
    if (!len) return std::nullopt;

    return ChunkHeader{
        .kind = static_cast<ChunkKind>(kind),
        .deflated = (kind_byte & deflated_flag) != 0,
        .checksum = crc,
        .body_offset = 9 + len->bytes_read,
        .body_length = static_cast<std::size_t>(len->value),
    };
}

// Return the body of a chunk that spans exactly data and whose checksum
// matches, or nullopt.
inline auto chunk_body(const ChunkHeader& header, std::span<const std::byte> data)
    -> std::optional<std::span<const std::byte>> {
    if (header.body_offset > data.size() ||
        header.body_length != data.size() - header.body_offset) {
        return std::nullopt;
    }
    auto body = data.subspan(header.body_offset, header.body_length);
    if (compute_checksum(body) != header.checksum) return std::nullopt;
    return body;
}

}  // namespace semilog_cpp::storage
