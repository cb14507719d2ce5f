// Fuzz target for the wire primitives: LEB128 edge cases (overflow,
// truncation, ten-byte encodings), field keys and skipping.

#include "encoding/wire.hpp"
#include "storage/reader.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto u = semilog_cpp::encoding::decode_uleb128(span);
    (void)u;

    // Walk the input as a message body until it stops parsing.
    auto reader = semilog_cpp::storage::Reader{span};
    while (!reader.at_end()) {
        auto key = reader.read_key();
        if (!key || !reader.skip(key->wire)) break;
    }
    return 0;
}
