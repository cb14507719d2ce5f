/// @file json.hpp
/// @brief nlohmann/json interoperability for semilog-cpp.
///
/// ADL `to_json` for every identity, primitive, schema and view type, so
/// any of them can be assigned to a nlohmann::json directly. Maps keyed by
/// strings or actors become JSON objects; other maps become arrays of
/// `[key, value]` pairs. Votes carry their aggregate alongside the raw
/// counters. `from_json` is provided for the identity types and for
/// ReplicaConfig.

#pragma once

#include <semilog-cpp/detailed.hpp>
#include <semilog-cpp/log.hpp>
#include <semilog-cpp/primitives.hpp>
#include <semilog-cpp/replica.hpp>
#include <semilog-cpp/schema.hpp>
#include <semilog-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <concepts>
#include <cstddef>
#include <string>

namespace semilog_cpp {

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const ActorId& id);
void from_json(const nlohmann::json& j, ActorId& id);

/// `{"actor": "...", "id": n}`
void to_json(nlohmann::json& j, const MessageId& id);
void from_json(const nlohmann::json& j, MessageId& id);

// -- Primitives ---------------------------------------------------------------

template <typename T>
void to_json(nlohmann::json& j, const Max<T>& m) {
    j = m.value;
}

template <typename T>
void to_json(nlohmann::json& j, const GSet<T>& s) {
    j = nlohmann::json::array();
    for (const auto& item : s) j.push_back(item);
}

namespace detail {

template <typename K>
concept ObjectKey = std::same_as<K, std::string> || std::same_as<K, ActorId>;

inline auto object_key(const std::string& key) -> const std::string& { return key; }
inline auto object_key(const ActorId& key) -> const std::string& { return key.name; }

}  // namespace detail

template <typename K, typename V>
void to_json(nlohmann::json& j, const GMap<K, V>& m) {
    if constexpr (detail::ObjectKey<K>) {
        j = nlohmann::json::object();
        for (const auto& [key, value] : m) j[detail::object_key(key)] = value;
    } else {
        j = nlohmann::json::array();
        for (const auto& [key, value] : m) {
            j.push_back(nlohmann::json::array({nlohmann::json(key), nlohmann::json(value)}));
        }
    }
}

template <typename G, typename V>
void to_json(nlohmann::json& j, const GuardedPair<G, V>& p) {
    j = nlohmann::json{{"guard", p.guard}, {"value", p.value}};
}

/// `{"state": "empty" | "live" | "tombstoned", "value": ...}`; the value is
/// present only on a live cell.
template <typename T>
void to_json(nlohmann::json& j, const Redactable<T>& r) {
    if (const auto* value = r.value()) {
        j = nlohmann::json{{"state", "live"}, {"value", *value}};
    } else {
        j = nlohmann::json{{"state", r.is_tombstoned() ? "tombstoned" : "empty"}};
    }
}

template <std::size_t N>
void to_json(nlohmann::json& j, const Vote<N>& v) {
    j = nlohmann::json{{"votes", v.votes}, {"aggregate", v.aggregate()}};
}

// -- Schema -------------------------------------------------------------------

void to_json(nlohmann::json& j, const Owned& o);
void to_json(nlohmann::json& j, const Shared& s);
void to_json(nlohmann::json& j, const Slice& s);
void to_json(nlohmann::json& j, const Root& r);

// -- View ---------------------------------------------------------------------

/// Includes the derived `scores` object.
void to_json(nlohmann::json& j, const Thread& t);
void to_json(nlohmann::json& j, const Comment& c);
void to_json(nlohmann::json& j, const Detailed& d);

// -- Configuration ------------------------------------------------------------

void to_json(nlohmann::json& j, LogLevel level);
void from_json(const nlohmann::json& j, LogLevel& level);

void to_json(nlohmann::json& j, const ReplicaConfig& c);

/// Read known keys, ignoring the rest.
/// @throws Exception with ErrorKind::invalid_config on a non-object or a
/// value of the wrong type.
void from_json(const nlohmann::json& j, ReplicaConfig& c);

}  // namespace semilog_cpp
