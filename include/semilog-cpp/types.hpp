/// @file types.hpp
/// @brief Core identity types: ActorId, LocalId, MessageId, Version.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace semilog_cpp {

/// An opaque, stable identity for an author (a name or a public key).
///
/// Every actor owns exactly one Slice. Actor ordering is lexicographic on
/// the raw bytes and is used for deterministic iteration during the fold.
struct ActorId {
    std::string name;  ///< Raw identity bytes.

    ActorId() = default;

    /// Construct from the raw identity.
    explicit ActorId(std::string n) : name{std::move(n)} {}

    auto operator<=>(const ActorId&) const = default;
    auto operator==(const ActorId&) const -> bool = default;

    /// Check if the identity is empty.
    auto empty() const -> bool { return name.empty(); }
};

/// A number chosen by the owning actor for one of its messages.
using LocalId = std::uint64_t;

/// Identifies one device of an actor. Only the low 16 bits are usable.
using DeviceId = std::uint64_t;

/// Key of one content version inside a message.
using Version = std::uint64_t;

/// A free-form thread label.
using Tag = std::string;

/// A free-form reaction name ("like", "+1", ...).
using Reaction = std::string;

/// Number of low bits of a LocalId or Version reserved for the device id.
inline constexpr unsigned device_bits = 16;

/// Largest device id an ActorSession accepts.
inline constexpr DeviceId max_device_id = (DeviceId{1} << device_bits) - 1;

/// Identifies a message: (author, local id).
///
/// MessageIds are globally unique once issued because only the author
/// allocates local ids inside its own Slice. Ordered by actor, then id.
struct MessageId {
    ActorId actor{};   ///< The authoring actor.
    LocalId local{0};  ///< The author's local id.

    MessageId() = default;

    /// Construct from an actor and a local id.
    MessageId(ActorId a, LocalId l) : actor{std::move(a)}, local{l} {}

    auto operator<=>(const MessageId&) const = default;
    auto operator==(const MessageId&) const -> bool = default;
};

}  // namespace semilog_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<semilog_cpp::ActorId> {
    auto operator()(const semilog_cpp::ActorId& id) const noexcept -> std::size_t {
        // FNV-1a over the identity bytes
        auto h = std::size_t{14695981039346656037ULL};
        for (auto c : id.name) {
            h ^= static_cast<std::size_t>(static_cast<unsigned char>(c));
            h *= std::size_t{1099511628211ULL};
        }
        return h;
    }
};

template <>
struct std::hash<semilog_cpp::MessageId> {
    auto operator()(const semilog_cpp::MessageId& id) const noexcept -> std::size_t {
        auto h1 = std::hash<semilog_cpp::ActorId>{}(id.actor);
        auto h2 = std::hash<std::uint64_t>{}(id.local);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
