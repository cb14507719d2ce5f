// Fuzz target for decode_slice(): exercises the chunk envelope, inflate
// and the tag-indexed decoder. Anything that decodes must re-encode and
// decode to the same value.

#include <semilog-cpp/codec.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto slice = semilog_cpp::decode_slice(span);
    if (slice) {
        auto again = semilog_cpp::decode_slice(semilog_cpp::encode_slice(*slice));
        if (!again || !(*again == *slice)) std::abort();
    }
    return 0;
}
