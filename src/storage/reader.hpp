#pragma once

// Byte stream reader for the tag-indexed binary format.
// Every read returns nullopt (or false) instead of reading past the end.
// Internal header, not installed.

#include "../encoding/wire.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace semilog_cpp::storage {

class Reader {
public:
    explicit Reader(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto pos() const -> std::size_t { return pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_uleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    // Length-prefixed raw bytes.
    auto read_delimited() -> std::optional<std::span<const std::byte>> {
        auto len = read_uleb128();
        if (!len || *len > remaining()) return std::nullopt;
        return read_bytes(static_cast<std::size_t>(*len));
    }

    auto read_string() -> std::optional<std::string> {
        auto bytes = read_delimited();
        if (!bytes) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    auto read_key() -> std::optional<encoding::FieldKey> {
        auto raw = read_uleb128();
        if (!raw) return std::nullopt;
        return encoding::split_key(*raw);
    }

    // Skip the payload of a field this reader does not know.
    auto skip(encoding::WireType wire) -> bool {
        switch (wire) {
            case encoding::WireType::varint: return read_uleb128().has_value();
            case encoding::WireType::bytes:  return read_delimited().has_value();
        }
        return false;
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;
};

}  // namespace semilog_cpp::storage
