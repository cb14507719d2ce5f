// Fuzz target for decode_detailed(): the materialized-view cache format.

#include <semilog-cpp/codec.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto view = semilog_cpp::decode_detailed(span);
    if (view) {
        auto saved = semilog_cpp::encode_detailed(*view);
        (void)saved;
    }
    return 0;
}
