/// @file primitives.hpp
/// @brief Leaf semilattices: Max, GSet, GMap, GuardedPair, Redactable, Vote.

#pragma once

#include <semilog-cpp/lattice.hpp>
#include <semilog-cpp/types.hpp>

#include <algorithm>
#include <array>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <set>
#include <utility>

namespace semilog_cpp {

// -- Max ----------------------------------------------------------------------

/// Monotonic maximum. Join keeps the larger value; bottom is `T{}`.
template <std::totally_ordered T>
struct Max {
    T value{};  ///< The current maximum.

    constexpr Max() = default;

    /// Construct holding v.
    explicit constexpr Max(T v) : value{std::move(v)} {}

    void join_assign(const Max& other) {
        if (value < other.value) value = other.value;
    }

    auto partial_cmp(const Max& other) const -> std::partial_ordering {
        if (value < other.value) return std::partial_ordering::less;
        if (other.value < value) return std::partial_ordering::greater;
        return std::partial_ordering::equivalent;
    }

    auto operator<=>(const Max&) const = default;
    auto operator==(const Max&) const -> bool = default;
};

// -- GSet ---------------------------------------------------------------------

/// Grow-only set. Join is union; the order is set inclusion.
template <std::totally_ordered T>
class GSet {
public:
    using value_type = T;
    using const_iterator = typename std::set<T>::const_iterator;

    GSet() = default;

    /// Construct from a list of elements.
    GSet(std::initializer_list<T> items) : items_{items} {}

    /// A set holding exactly one element.
    static auto singleton(T item) -> GSet {
        auto result = GSet{};
        result.items_.insert(std::move(item));
        return result;
    }

    void insert(T item) { items_.insert(std::move(item)); }

    auto contains(const T& item) const -> bool { return items_.contains(item); }
    auto size() const -> std::size_t { return items_.size(); }
    auto empty() const -> bool { return items_.empty(); }

    auto begin() const -> const_iterator { return items_.begin(); }
    auto end() const -> const_iterator { return items_.end(); }

    void join_assign(const GSet& other) {
        items_.insert(other.items_.begin(), other.items_.end());
    }

    auto partial_cmp(const GSet& other) const -> std::partial_ordering {
        const bool sub = std::includes(other.items_.begin(), other.items_.end(),
                                       items_.begin(), items_.end());
        const bool super = std::includes(items_.begin(), items_.end(),
                                         other.items_.begin(), other.items_.end());
        if (sub && super) return std::partial_ordering::equivalent;
        if (sub) return std::partial_ordering::less;
        if (super) return std::partial_ordering::greater;
        return std::partial_ordering::unordered;
    }

    auto operator==(const GSet&) const -> bool = default;

private:
    std::set<T> items_;
};

// -- GMap ---------------------------------------------------------------------

/// Grow-only map. Join takes the union of keys and joins values on shared
/// keys. An absent key is equivalent to a key bound to bottom, both for
/// equality and for the order.
template <std::totally_ordered K, Semilattice V>
class GMap {
public:
    using key_type = K;
    using mapped_type = V;
    using const_iterator = typename std::map<K, V>::const_iterator;

    GMap() = default;

    /// Construct from key/value pairs.
    GMap(std::initializer_list<std::pair<const K, V>> entries) : entries_{entries} {}

    /// A map holding exactly one entry.
    static auto singleton(K key, V value) -> GMap {
        auto result = GMap{};
        result.entries_.emplace(std::move(key), std::move(value));
        return result;
    }

    /// Get the value at key, inserting bottom if absent.
    auto entry(const K& key) -> V& {
        return entries_.try_emplace(key).first->second;
    }

    /// Look up a value without inserting.
    /// @return The value, or nullptr if the key is absent.
    auto get(const K& key) const -> const V* {
        auto it = entries_.find(key);
        return it != entries_.end() ? &it->second : nullptr;
    }

    /// Join value into the entry at key.
    void join_entry(const K& key, const V& value) {
        auto [it, inserted] = entries_.try_emplace(key, value);
        if (!inserted) ::semilog_cpp::join_assign(it->second, value);
    }

    auto contains(const K& key) const -> bool { return entries_.contains(key); }
    auto size() const -> std::size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }

    auto begin() const -> const_iterator { return entries_.begin(); }
    auto end() const -> const_iterator { return entries_.end(); }

    void join_assign(const GMap& other) {
        for (const auto& [key, value] : other.entries_) {
            join_entry(key, value);
        }
    }

    auto partial_cmp(const GMap& other) const -> std::partial_ordering {
        const auto bottom = V{};
        auto order = std::partial_ordering::equivalent;
        for (const auto& [key, value] : entries_) {
            const auto* theirs = other.get(key);
            order = detail::combine_order(
                order, ::semilog_cpp::partial_compare(value, theirs ? *theirs : bottom));
            if (order == std::partial_ordering::unordered) return order;
        }
        for (const auto& [key, value] : other.entries_) {
            if (entries_.contains(key)) continue;
            order = detail::combine_order(order, ::semilog_cpp::partial_compare(bottom, value));
            if (order == std::partial_ordering::unordered) return order;
        }
        return order;
    }

    auto operator==(const GMap& other) const -> bool {
        const auto bottom = V{};
        for (const auto& [key, value] : entries_) {
            const auto* theirs = other.get(key);
            if (!(value == (theirs ? *theirs : bottom))) return false;
        }
        for (const auto& [key, value] : other.entries_) {
            if (!entries_.contains(key) && !(value == bottom)) return false;
        }
        return true;
    }

private:
    std::map<K, V> entries_;
};

// -- GuardedPair --------------------------------------------------------------

/// A value guarded by a totally ordered lattice.
///
/// Join keeps the side with the strictly greater guard in full, discarding
/// the other side's value. Equal guards join the values.
template <typename G, Semilattice V>
    requires Semilattice<G> && std::totally_ordered<G>
struct GuardedPair {
    G guard{};  ///< Supersession guard.
    V value{};  ///< Guarded value.

    GuardedPair() = default;

    /// Construct from a guard and a value.
    GuardedPair(G g, V v) : guard{std::move(g)}, value{std::move(v)} {}

    void join_assign(const GuardedPair& other) {
        if (guard < other.guard) {
            *this = other;
        } else if (guard == other.guard) {
            ::semilog_cpp::join_assign(value, other.value);
        }
    }

    auto partial_cmp(const GuardedPair& other) const -> std::partial_ordering {
        if (guard < other.guard) return std::partial_ordering::less;
        if (other.guard < guard) return std::partial_ordering::greater;
        return ::semilog_cpp::partial_compare(value, other.value);
    }

    auto operator==(const GuardedPair&) const -> bool = default;
};

// -- Redactable ---------------------------------------------------------------

/// A cell that can be tombstoned.
///
/// States form a chain: empty (bottom) < live(v) < tombstoned. Two live
/// values order by T, so concurrent writes of different content resolve
/// to the greater value (byte order for strings). A tombstone absorbs
/// every later join.
template <std::totally_ordered T>
class Redactable {
public:
    enum class State : std::uint8_t {
        empty = 0,       ///< Never written (bottom).
        live = 1,        ///< Holds content.
        tombstoned = 2,  ///< Redacted.
    };

    Redactable() = default;

    /// A live cell holding value.
    static auto live(T value) -> Redactable {
        auto result = Redactable{};
        result.state_ = State::live;
        result.value_ = std::move(value);
        return result;
    }

    /// A tombstoned cell.
    static auto tombstone() -> Redactable {
        auto result = Redactable{};
        result.state_ = State::tombstoned;
        return result;
    }

    auto state() const -> State { return state_; }
    auto is_empty() const -> bool { return state_ == State::empty; }
    auto is_live() const -> bool { return state_ == State::live; }
    auto is_tombstoned() const -> bool { return state_ == State::tombstoned; }

    /// The content, or nullptr unless live.
    auto value() const -> const T* {
        return state_ == State::live ? &value_ : nullptr;
    }

    void join_assign(const Redactable& other) {
        if (*this < other) *this = other;
    }

    auto partial_cmp(const Redactable& other) const -> std::partial_ordering {
        return *this <=> other;
    }

    // value_ stays T{} outside the live state, so member-wise comparison
    // orders by state first and by content only between live cells.
    auto operator<=>(const Redactable&) const = default;
    auto operator==(const Redactable&) const -> bool = default;

private:
    State state_{State::empty};
    T value_{};
};

// -- Vote ---------------------------------------------------------------------

/// Per-actor categorical opinion.
///
/// Each actor holds a monotonic counter; its residue modulo N is the
/// actor's current category. Join is the map join, so an actor changes
/// its opinion only by incrementing.
template <std::size_t N>
struct Vote {
    static_assert(N > 0, "a vote needs at least one category");

    GMap<ActorId, Max<std::uint64_t>> votes;  ///< Actor -> raw counter.

    SEMILOG_PRODUCT(Vote, votes);

    /// A vote holding exactly one actor's counter.
    static auto attributed(ActorId actor, Max<std::uint64_t> counter) -> Vote {
        auto result = Vote{};
        result.votes = GMap<ActorId, Max<std::uint64_t>>::singleton(std::move(actor), counter);
        return result;
    }

    /// The current category of one actor (0 if the actor never voted).
    auto opinion(const ActorId& actor) const -> std::size_t {
        const auto* counter = votes.get(actor);
        return counter ? static_cast<std::size_t>(counter->value % N) : 0;
    }

    /// Histogram of current categories over all actors, for display only.
    /// Counters still at bottom are not counted.
    auto aggregate() const -> std::array<std::uint64_t, N> {
        auto histogram = std::array<std::uint64_t, N>{};
        for (const auto& [actor, counter] : votes) {
            if (counter.value == 0) continue;
            ++histogram[counter.value % N];
        }
        return histogram;
    }
};

}  // namespace semilog_cpp
