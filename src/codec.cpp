#include <semilog-cpp/codec.hpp>
#include <semilog-cpp/error.hpp>

#include "storage/chunk.hpp"
#include "storage/codec.hpp"
#include "storage/compression.hpp"
#include "storage/reader.hpp"
#include "storage/writer.hpp"

#include <string>
#include <utility>

namespace semilog_cpp {

namespace {

template <typename T>
auto encode_chunk(storage::ChunkKind kind, const T& value, std::size_t threshold)
    -> std::vector<std::byte> {
    auto body = storage::Writer{};
    storage::Codec<T>::write_body(body, value);

    auto output = std::vector<std::byte>{};
    if (body.size() > threshold) {
        auto packed = storage::deflate_body(body.data());
        if (!packed) {
            throw Exception{ErrorKind::encoding_error,
                            "deflate failed on a " + std::to_string(body.size()) + " byte body"};
        }
        storage::write_chunk(kind, true, *packed, output);
    } else {
        storage::write_chunk(kind, false, body.data(), output);
    }
    return output;
}

template <typename T>
auto decode_chunk(storage::ChunkKind kind, std::span<const std::byte> data)
    -> std::optional<T> {
    auto header = storage::parse_chunk_header(data);
    if (!header || header->kind != kind) return std::nullopt;

    auto body = storage::chunk_body(*header, data);
    if (!body) return std::nullopt;

    auto inflated = std::vector<std::byte>{};
    if (header->deflated) {
        auto unpacked = storage::inflate_body(*body);
        if (!unpacked) return std::nullopt;
        inflated = std::move(*unpacked);
        body = std::span<const std::byte>{inflated};
    }

    auto reader = storage::Reader{*body};
    auto result = T{};
    if (!storage::Codec<T>::read_body(reader, result) || !reader.at_end()) {
        return std::nullopt;
    }
    return result;
}

}  // namespace

auto encode_slice(const Slice& slice, std::size_t compression_threshold)
    -> std::vector<std::byte> {
    return encode_chunk(storage::ChunkKind::slice, slice, compression_threshold);
}

auto decode_slice(std::span<const std::byte> data) -> std::optional<Slice> {
    return decode_chunk<Slice>(storage::ChunkKind::slice, data);
}

auto encode_root(const Root& root, std::size_t compression_threshold)
    -> std::vector<std::byte> {
    return encode_chunk(storage::ChunkKind::root, root, compression_threshold);
}

auto decode_root(std::span<const std::byte> data) -> std::optional<Root> {
    return decode_chunk<Root>(storage::ChunkKind::root, data);
}

auto encode_detailed(const Detailed& view, std::size_t compression_threshold)
    -> std::vector<std::byte> {
    return encode_chunk(storage::ChunkKind::detailed, view, compression_threshold);
}

auto decode_detailed(std::span<const std::byte> data) -> std::optional<Detailed> {
    return decode_chunk<Detailed>(storage::ChunkKind::detailed, data);
}

}  // namespace semilog_cpp
