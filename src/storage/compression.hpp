#pragma once

// Raw DEFLATE (no zlib/gzip header) for chunk bodies above the
// compression threshold.
//
// Internal header, not installed.

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace semilog_cpp::storage {

// Upper bound on an inflated body. Larger bodies are treated as malformed.
inline constexpr std::size_t max_inflated_size = std::size_t{256} * 1024 * 1024;

inline auto deflate_body(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {
    auto stream = z_stream{};
    if (::deflateInit2(&stream, Z_BEST_SPEED, Z_DEFLATED, -15, 8,
                       Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    auto output = std::vector<std::byte>(
        ::deflateBound(&stream, static_cast<uLong>(input.size())));
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    const auto ret = ::deflate(&stream, Z_FINISH);
    const auto written = stream.total_out;
    ::deflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(written);
    return output;
}

// Inflate a raw DEFLATE stream in fixed-size steps.
// Returns nullopt on a corrupt or truncated stream, trailing input, or
// output past max_inflated_size.
inline auto inflate_body(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {
    auto stream = z_stream{};
    if (::inflateInit2(&stream, -15) != Z_OK) return std::nullopt;

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    auto output = std::vector<std::byte>{};
    auto step = std::array<std::byte, 16 * 1024>{};
    auto ret = Z_OK;
    while (ret == Z_OK) {
        stream.next_out = reinterpret_cast<Bytef*>(step.data());
        stream.avail_out = static_cast<uInt>(step.size());
        ret = ::inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) break;
        const auto produced = step.size() - stream.avail_out;
        if (output.size() + produced > max_inflated_size) {
            ret = Z_DATA_ERROR;
            break;
        }
        output.insert(output.end(), step.begin(), step.begin() + static_cast<std::ptrdiff_t>(produced));
        if (ret == Z_OK && produced == 0 && stream.avail_in == 0) {
            ret = Z_BUF_ERROR;  // truncated stream
        }
    }
    const auto leftover = stream.avail_in;
    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END || leftover != 0) return std::nullopt;
    return output;
}

}  // namespace semilog_cpp::storage
