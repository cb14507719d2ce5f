/// @file codec.hpp
/// @brief Binary encoding of Slice, Root and Detailed.
///
/// Every blob is a checksummed chunk holding a tag-indexed body. Fields are
/// keyed by their position in the product, so readers skip fields they do
/// not know and decode missing fields as bottom. Decoding never returns a
/// partial value.

#pragma once

#include <semilog-cpp/detailed.hpp>
#include <semilog-cpp/schema.hpp>

#include <cstddef>
#include <limits>
#include <optional>
#include <span>
#include <vector>

namespace semilog_cpp {

/// Bodies larger than this many bytes are stored DEFLATE-compressed.
inline constexpr std::size_t default_compression_threshold = 1024;

/// Pass as the threshold to never compress.
inline constexpr std::size_t never_compress = std::numeric_limits<std::size_t>::max();

/// Encode one actor's Slice.
/// @throws Exception with ErrorKind::encoding_error if compression fails.
auto encode_slice(const Slice& slice,
                  std::size_t compression_threshold = default_compression_threshold)
    -> std::vector<std::byte>;

/// Decode a Slice. Returns nullopt on any malformed input.
auto decode_slice(std::span<const std::byte> data) -> std::optional<Slice>;

/// Encode a whole Root.
auto encode_root(const Root& root,
                 std::size_t compression_threshold = default_compression_threshold)
    -> std::vector<std::byte>;

/// Decode a Root. Returns nullopt on any malformed input.
auto decode_root(std::span<const std::byte> data) -> std::optional<Root>;

/// Encode a materialized view (the cache format).
auto encode_detailed(const Detailed& view,
                     std::size_t compression_threshold = default_compression_threshold)
    -> std::vector<std::byte>;

/// Decode a materialized view. Returns nullopt on any malformed input.
auto decode_detailed(std::span<const std::byte> data) -> std::optional<Detailed>;

}  // namespace semilog_cpp
