#pragma once

// Byte stream writer for the tag-indexed binary format.
// Internal header, not installed.

#include "../encoding/wire.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace semilog_cpp::storage {

class Writer {
public:
    void write_uleb128(std::uint64_t value) {
        encoding::encode_uleb128(value, data_);
    }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    // Length-prefixed raw bytes.
    void write_delimited(std::span<const std::byte> bytes) {
        write_uleb128(bytes.size());
        write_bytes(bytes);
    }

    void write_string(std::string_view s) {
        write_uleb128(s.size());
        for (auto c : s) {
            data_.push_back(static_cast<std::byte>(c));
        }
    }

    void write_key(std::uint64_t tag, encoding::WireType wire) {
        write_uleb128(encoding::make_key(tag, wire));
    }

    auto size() const -> std::size_t { return data_.size(); }
    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

}  // namespace semilog_cpp::storage
