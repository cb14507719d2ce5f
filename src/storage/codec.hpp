#pragma once

// Codec<T>: the tag-indexed binary encoding of every persisted type.
//
// Scalars are varints, strings and nested values are length-delimited
// messages. Inside a message each field is keyed by its position. Product
// types (anything declared with SEMILOG_PRODUCT) are encoded generically
// from lattice_fields(), skipping bottom fields; a missing field decodes as
// bottom and a field with an unknown tag is skipped. Decoding joins every
// occurrence of a field into the target, so repeated entries merge.
//
// Internal header, not installed.

#include "../encoding/wire.hpp"
#include "reader.hpp"
#include "writer.hpp"

#include <semilog-cpp/detailed.hpp>
#include <semilog-cpp/lattice.hpp>
#include <semilog-cpp/primitives.hpp>
#include <semilog-cpp/schema.hpp>
#include <semilog-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace semilog_cpp::storage {

using encoding::FieldKey;
using encoding::WireType;

template <typename T>
struct Codec;

template <typename T>
concept Product = requires(const T& t) { t.lattice_fields(); };

// -- Helpers ------------------------------------------------------------------

// Write a length-delimited message whose body is produced by body(Writer&).
template <typename Body>
void write_message(Writer& out, Body&& body) {
    auto inner = Writer{};
    body(inner);
    out.write_delimited(inner.data());
}

// Read a length-delimited message and hand its body to body(Reader&).
// The body must consume the message exactly.
template <typename Body>
auto read_message(Reader& in, Body&& body) -> bool {
    auto bytes = in.read_delimited();
    if (!bytes) return false;
    auto inner = Reader{*bytes};
    return body(inner) && inner.at_end();
}

// Walk every field of a message body. on_field(Reader&, FieldKey) must
// consume the payload (skip it if the tag is unknown) and return false to
// reject the message.
template <typename OnField>
auto read_fields(Reader& in, OnField&& on_field) -> bool {
    while (!in.at_end()) {
        auto key = in.read_key();
        if (!key) return false;
        if (!on_field(in, *key)) return false;
    }
    return true;
}

template <typename F>
void write_field(Writer& out, std::uint64_t tag, const F& value) {
    out.write_key(tag, Codec<F>::wire);
    Codec<F>::write(out, value);
}

// Write a lattice-valued field unless it is bottom.
template <Semilattice F>
void write_lattice_field(Writer& out, std::uint64_t tag, const F& value) {
    if (is_bottom(value)) return;
    write_field(out, tag, value);
}

template <typename F>
auto read_value(Reader& in, WireType wire) -> std::optional<F> {
    if (wire != Codec<F>::wire) return std::nullopt;
    return Codec<F>::read(in);
}

template <Semilattice F>
auto join_field(Reader& in, WireType wire, F& target) -> bool {
    auto value = read_value<F>(in, wire);
    if (!value) return false;
    ::semilog_cpp::join_assign(target, *value);
    return true;
}

template <typename Fields, std::size_t... I>
auto join_field_at(Reader& in, FieldKey key, Fields& fields, std::index_sequence<I...>) -> bool {
    auto ok = false;
    (void)((key.tag == I && ((ok = join_field(in, key.wire, std::get<I>(fields))), true)) || ...);
    return ok;
}

// -- Scalars ------------------------------------------------------------------

template <>
struct Codec<std::uint64_t> {
    static constexpr auto wire = WireType::varint;

    static void write(Writer& out, std::uint64_t value) { out.write_uleb128(value); }
    static auto read(Reader& in) -> std::optional<std::uint64_t> { return in.read_uleb128(); }
};

template <>
struct Codec<std::string> {
    static constexpr auto wire = WireType::bytes;

    static void write(Writer& out, const std::string& value) { out.write_string(value); }
    static auto read(Reader& in) -> std::optional<std::string> { return in.read_string(); }
};

template <>
struct Codec<ActorId> {
    static constexpr auto wire = WireType::bytes;

    static void write(Writer& out, const ActorId& value) { out.write_string(value.name); }

    static auto read(Reader& in) -> std::optional<ActorId> {
        auto name = in.read_string();
        if (!name) return std::nullopt;
        return ActorId{std::move(*name)};
    }
};

template <>
struct Codec<MessageId> {
    static constexpr auto wire = WireType::bytes;

    static void write(Writer& out, const MessageId& value) {
        write_message(out, [&](Writer& body) {
            write_field(body, 0, value.actor);
            write_field(body, 1, value.local);
        });
    }

    static auto read(Reader& in) -> std::optional<MessageId> {
        auto result = MessageId{};
        auto seen_actor = false;
        auto seen_local = false;
        const auto ok = read_message(in, [&](Reader& body) {
            return read_fields(body, [&](Reader& r, FieldKey key) {
                switch (key.tag) {
                    case 0: {
                        auto actor = read_value<ActorId>(r, key.wire);
                        if (!actor) return false;
                        result.actor = std::move(*actor);
                        seen_actor = true;
                        return true;
                    }
                    case 1: {
                        auto local = read_value<LocalId>(r, key.wire);
                        if (!local) return false;
                        result.local = *local;
                        seen_local = true;
                        return true;
                    }
                    default:
                        return r.skip(key.wire);
                }
            });
        });
        // Both fields are always written.
        if (!ok || !seen_actor || !seen_local) return std::nullopt;
        return result;
    }
};

// -- Primitives ---------------------------------------------------------------

template <typename T>
struct Codec<Max<T>> {
    static constexpr auto wire = Codec<T>::wire;

    static void write(Writer& out, const Max<T>& value) { Codec<T>::write(out, value.value); }

    static auto read(Reader& in) -> std::optional<Max<T>> {
        auto value = Codec<T>::read(in);
        if (!value) return std::nullopt;
        return Max<T>{std::move(*value)};
    }
};

// Elements are repeated field 0.
template <typename T>
struct Codec<GSet<T>> {
    static constexpr auto wire = WireType::bytes;

    static void write(Writer& out, const GSet<T>& value) {
        write_message(out, [&](Writer& body) {
            for (const auto& item : value) write_field(body, 0, item);
        });
    }

    static auto read(Reader& in) -> std::optional<GSet<T>> {
        auto result = GSet<T>{};
        const auto ok = read_message(in, [&](Reader& body) {
            return read_fields(body, [&](Reader& r, FieldKey key) {
                if (key.tag != 0) return r.skip(key.wire);
                auto item = read_value<T>(r, key.wire);
                if (!item) return false;
                result.insert(std::move(*item));
                return true;
            });
        });
        if (!ok) return std::nullopt;
        return result;
    }
};

// Entries are repeated field 0, each a message {0: key, 1: value}.
// The key is always written so that bottom-valued keys survive.
template <typename K, typename V>
struct Codec<GMap<K, V>> {
    static constexpr auto wire = WireType::bytes;

    static void write(Writer& out, const GMap<K, V>& value) {
        write_message(out, [&](Writer& body) {
            for (const auto& [key, mapped] : value) {
                body.write_key(0, WireType::bytes);
                write_message(body, [&](Writer& entry) {
                    write_field(entry, 0, key);
                    write_lattice_field(entry, 1, mapped);
                });
            }
        });
    }

    static auto read(Reader& in) -> std::optional<GMap<K, V>> {
        auto result = GMap<K, V>{};
        const auto ok = read_message(in, [&](Reader& body) {
            return read_fields(body, [&](Reader& r, FieldKey key) {
                if (key.tag != 0) return r.skip(key.wire);
                if (key.wire != WireType::bytes) return false;
                return read_entry(r, result);
            });
        });
        if (!ok) return std::nullopt;
        return result;
    }

private:
    static auto read_entry(Reader& in, GMap<K, V>& result) -> bool {
        auto key = std::optional<K>{};
        auto mapped = V{};
        const auto ok = read_message(in, [&](Reader& entry) {
            return read_fields(entry, [&](Reader& r, FieldKey field) {
                switch (field.tag) {
                    case 0: {
                        auto decoded = read_value<K>(r, field.wire);
                        if (!decoded) return false;
                        key = std::move(decoded);
                        return true;
                    }
                    case 1:
                        return join_field(r, field.wire, mapped);
                    default:
                        return r.skip(field.wire);
                }
            });
        });
        // Every entry carries its key, even when the value is bottom.
        if (!ok || !key) return false;
        result.join_entry(*key, mapped);
        return true;
    }
};

template <typename G, typename V>
struct Codec<GuardedPair<G, V>> {
    static constexpr auto wire = WireType::bytes;

    static void write(Writer& out, const GuardedPair<G, V>& value) {
        write_message(out, [&](Writer& body) {
            write_lattice_field(body, 0, value.guard);
            write_lattice_field(body, 1, value.value);
        });
    }

    static auto read(Reader& in) -> std::optional<GuardedPair<G, V>> {
        auto guard = G{};
        auto value = V{};
        const auto ok = read_message(in, [&](Reader& body) {
            return read_fields(body, [&](Reader& r, FieldKey key) {
                switch (key.tag) {
                    case 0:  return join_field(r, key.wire, guard);
                    case 1:  return join_field(r, key.wire, value);
                    default: return r.skip(key.wire);
                }
            });
        });
        if (!ok) return std::nullopt;
        return GuardedPair<G, V>{std::move(guard), std::move(value)};
    }
};

// {0: state, 1: content}. Content is only legal on a live cell.
template <typename T>
struct Codec<Redactable<T>> {
    static constexpr auto wire = WireType::bytes;
    using State = typename Redactable<T>::State;

    static void write(Writer& out, const Redactable<T>& value) {
        write_message(out, [&](Writer& body) {
            if (!value.is_empty()) {
                write_field(body, 0, static_cast<std::uint64_t>(value.state()));
            }
            if (const auto* content = value.value()) {
                write_field(body, 1, *content);
            }
        });
    }

    static auto read(Reader& in) -> std::optional<Redactable<T>> {
        auto state = std::uint64_t{0};
        auto content = std::optional<T>{};
        const auto ok = read_message(in, [&](Reader& body) {
            return read_fields(body, [&](Reader& r, FieldKey key) {
                switch (key.tag) {
                    case 0: {
                        auto decoded = read_value<std::uint64_t>(r, key.wire);
                        if (!decoded) return false;
                        state = *decoded;
                        return true;
                    }
                    case 1:
                        content = read_value<T>(r, key.wire);
                        return content.has_value();
                    default:
                        return r.skip(key.wire);
                }
            });
        });
        if (!ok) return std::nullopt;

        switch (state) {
            case static_cast<std::uint64_t>(State::empty):
                if (content) return std::nullopt;
                return Redactable<T>{};
            case static_cast<std::uint64_t>(State::live):
                if (!content) return std::nullopt;
                return Redactable<T>::live(std::move(*content));
            case static_cast<std::uint64_t>(State::tombstoned):
                if (content) return std::nullopt;
                return Redactable<T>::tombstone();
            default:
                return std::nullopt;
        }
    }
};

// -- Products -----------------------------------------------------------------

template <Product T>
struct Codec<T> {
    static constexpr auto wire = WireType::bytes;

    // The unframed field list. Top-level chunks store this directly.
    static void write_body(Writer& out, const T& value) {
        const auto fields = value.lattice_fields();
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            (write_lattice_field(out, I, std::get<I>(fields)), ...);
        }(std::make_index_sequence<std::tuple_size_v<decltype(fields)>>{});
    }

    static auto read_body(Reader& in, T& value) -> bool {
        auto fields = value.lattice_fields();
        constexpr auto n = std::tuple_size_v<decltype(fields)>;
        return read_fields(in, [&](Reader& r, FieldKey key) {
            if (key.tag >= n) return r.skip(key.wire);
            return join_field_at(r, key, fields, std::make_index_sequence<n>{});
        });
    }

    static void write(Writer& out, const T& value) {
        write_message(out, [&](Writer& body) { write_body(body, value); });
    }

    static auto read(Reader& in) -> std::optional<T> {
        auto result = T{};
        if (!read_message(in, [&](Reader& body) { return read_body(body, result); })) {
            return std::nullopt;
        }
        return result;
    }
};

}  // namespace semilog_cpp::storage
