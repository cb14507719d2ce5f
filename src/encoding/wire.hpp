#pragma once

// Wire primitives for the tag-indexed binary format.
//
// Every field is written as key + payload, where
//   key     = ULEB128((tag << 3) | wire_type)
//   payload = ULEB128 value            (wire_type varint)
//           | ULEB128 length + bytes   (wire_type bytes)
// Tags are the field's position in its product, so decoders can skip
// fields they do not know.
//
// Internal header, not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace semilog_cpp::encoding {

// -- Unsigned LEB128 ----------------------------------------------------------

// Append value as unsigned LEB128.
inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    while (value >= 0x80) {
        output.push_back(static_cast<std::byte>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    output.push_back(static_cast<std::byte>(value));
}

// Decoded value + number of bytes consumed.
struct DecodeResult {
    std::uint64_t value;
    std::size_t bytes_read;
};

// Decode an unsigned LEB128 value from the front of input.
// Returns nullopt if the input is truncated, longer than ten bytes, or
// overflows 64 bits.
inline auto decode_uleb128(std::span<const std::byte> input) -> std::optional<DecodeResult> {
    auto value = std::uint64_t{0};
    for (std::size_t i = 0; i < input.size() && i < 10; ++i) {
        const auto bits = static_cast<std::uint64_t>(input[i] & std::byte{0x7F});
        const auto shift = static_cast<unsigned>(7 * i);
        if (i == 9 && bits > 1) return std::nullopt;  // overflow
        value |= bits << shift;
        if ((input[i] & std::byte{0x80}) == std::byte{0}) {
            return DecodeResult{.value = value, .bytes_read = i + 1};
        }
    }
    return std::nullopt;
}

// -- Field keys ---------------------------------------------------------------

enum class WireType : std::uint8_t {
    varint = 0,
    bytes = 2,
};

struct FieldKey {
    std::uint64_t tag;
    WireType wire;
};

inline auto make_key(std::uint64_t tag, WireType wire) -> std::uint64_t {
    return (tag << 3) | static_cast<std::uint64_t>(wire);
}

// Split a raw key. Returns nullopt for wire types this format never writes.
inline auto split_key(std::uint64_t key) -> std::optional<FieldKey> {
    const auto wire = key & 0x07;
    if (wire != static_cast<std::uint64_t>(WireType::varint) &&
        wire != static_cast<std::uint64_t>(WireType::bytes)) {
        return std::nullopt;
    }
    return FieldKey{.tag = key >> 3, .wire = static_cast<WireType>(wire)};
}

}  // namespace semilog_cpp::encoding
