/// @file lattice.hpp
/// @brief The Semilattice concept, join helpers, and structural product
/// derivation.
///
/// A semilattice is a value type with a join that is idempotent,
/// commutative and associative, whose default-constructed value (bottom)
/// is the join identity. The join induces a partial order:
/// `a <= b` exactly when `join(a, b) == b`.
///
/// Product types get their join and order derived field by field:
///
/// @code
/// struct Shared {
///     GMap<Tag, Max<std::uint64_t>> tags;
///     GMap<Reaction, Max<std::uint64_t>> reactions;
///
///     SEMILOG_PRODUCT(Shared, tags, reactions);
/// };
/// @endcode

#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace semilog_cpp {

/// Customization point describing how a type joins and compares.
///
/// The primary template is empty: a type is not a semilattice unless a
/// specialization applies. Class types qualify by providing member
/// `join_assign(const T&)` and `partial_cmp(const T&) const`.
template <typename T>
struct lattice_traits {};

/// A join-semilattice value type.
template <typename T>
concept Semilattice =
    std::default_initializable<T> &&
    std::equality_comparable<T> &&
    requires(T& a, const T& b) {
        lattice_traits<T>::join_assign(a, b);
        { lattice_traits<T>::compare(b, b) } -> std::same_as<std::partial_ordering>;
    };

/// True for std::variant. Tagged variants have no canonical join across
/// differently-tagged alternatives and never satisfy Semilattice.
template <typename T>
inline constexpr bool is_tagged_variant_v = false;

template <typename... Ts>
inline constexpr bool is_tagged_variant_v<std::variant<Ts...>> = true;

// -- Free functions -----------------------------------------------------------

/// Join b into a in place.
template <Semilattice T>
void join_assign(T& a, const T& b) {
    lattice_traits<T>::join_assign(a, b);
}

/// Return the join of a and b.
template <Semilattice T>
auto join(T a, const T& b) -> T {
    lattice_traits<T>::join_assign(a, b);
    return a;
}

/// Compare two values in the order induced by join.
/// Returns std::partial_ordering::unordered for incomparable values.
template <Semilattice T>
auto partial_compare(const T& a, const T& b) -> std::partial_ordering {
    return lattice_traits<T>::compare(a, b);
}

/// Check a <= b in the order induced by join.
template <Semilattice T>
auto leq(const T& a, const T& b) -> bool {
    return std::is_lteq(partial_compare(a, b));
}

/// Check whether a value is the join identity.
template <Semilattice T>
auto is_bottom(const T& value) -> bool {
    return value == T{};
}

// -- Member-function semilattices ---------------------------------------------

template <typename T>
    requires requires(T& a, const T& b) {
        a.join_assign(b);
        { b.partial_cmp(b) } -> std::same_as<std::partial_ordering>;
    }
struct lattice_traits<T> {
    static void join_assign(T& a, const T& b) { a.join_assign(b); }

    static auto compare(const T& a, const T& b) -> std::partial_ordering {
        return a.partial_cmp(b);
    }
};

// -- Structural derivation ----------------------------------------------------

namespace detail {

/// Fold one more field ordering into the running product ordering.
///
/// Equal fields are neutral; Less and Greater must agree in direction;
/// any disagreement or incomparable field makes the product unordered.
constexpr auto combine_order(std::partial_ordering acc,
                             std::partial_ordering next) noexcept -> std::partial_ordering {
    if (acc == std::partial_ordering::unordered ||
        next == std::partial_ordering::unordered) {
        return std::partial_ordering::unordered;
    }
    if (acc == std::partial_ordering::equivalent) return next;
    if (next == std::partial_ordering::equivalent) return acc;
    return acc == next ? acc : std::partial_ordering::unordered;
}

template <typename Tuple>
struct product_fields;

template <typename... Fields>
struct product_fields<std::tuple<Fields...>> {
    static constexpr bool any_variant =
        (is_tagged_variant_v<std::remove_cvref_t<Fields>> || ...);
    static constexpr bool all_joinable =
        (Semilattice<std::remove_cvref_t<Fields>> && ...);
};

/// Join each field of rhs into the matching field of lhs, by position.
template <typename Lhs, typename Rhs>
void join_fields(Lhs&& lhs, const Rhs& rhs) {
    using fields = product_fields<std::remove_cvref_t<Lhs>>;
    static_assert(!fields::any_variant,
                  "a tagged variant has no canonical join and cannot be a product field");
    static_assert(fields::all_joinable,
                  "every field of a product must satisfy Semilattice");
    constexpr auto n = std::tuple_size_v<std::remove_cvref_t<Lhs>>;
    static_assert(n == std::tuple_size_v<Rhs>);

    if constexpr (!fields::any_variant && fields::all_joinable) {
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            (::semilog_cpp::join_assign(std::get<I>(lhs), std::get<I>(rhs)), ...);
        }(std::make_index_sequence<n>{});
    }
}

/// Compare two field tuples position by position with combine_order.
/// An empty tuple compares equivalent.
template <typename Lhs, typename Rhs>
auto compare_fields(const Lhs& lhs, const Rhs& rhs) -> std::partial_ordering {
    using fields = product_fields<Lhs>;
    static_assert(!fields::any_variant,
                  "a tagged variant has no canonical order and cannot be a product field");
    constexpr auto n = std::tuple_size_v<Lhs>;
    auto order = std::partial_ordering::equivalent;

    if constexpr (!fields::any_variant && fields::all_joinable) {
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            ((order = combine_order(
                  order, ::semilog_cpp::partial_compare(std::get<I>(lhs), std::get<I>(rhs)))),
             ...);
        }(std::make_index_sequence<n>{});
    }
    return order;
}

}  // namespace detail

// -- Positional products ------------------------------------------------------

template <typename... Ts>
    requires (Semilattice<Ts> && ...)
struct lattice_traits<std::tuple<Ts...>> {
    static void join_assign(std::tuple<Ts...>& a, const std::tuple<Ts...>& b) {
        detail::join_fields(std::apply([](auto&... f) { return std::tie(f...); }, a),
                            std::apply([](const auto&... f) { return std::tie(f...); }, b));
    }

    static auto compare(const std::tuple<Ts...>& a,
                        const std::tuple<Ts...>& b) -> std::partial_ordering {
        return detail::compare_fields(
            std::apply([](const auto&... f) { return std::tie(f...); }, a),
            std::apply([](const auto&... f) { return std::tie(f...); }, b));
    }
};

template <Semilattice A, Semilattice B>
struct lattice_traits<std::pair<A, B>> {
    static void join_assign(std::pair<A, B>& a, const std::pair<A, B>& b) {
        detail::join_fields(std::tie(a.first, a.second), std::tie(b.first, b.second));
    }

    static auto compare(const std::pair<A, B>& a,
                        const std::pair<A, B>& b) -> std::partial_ordering {
        return detail::compare_fields(std::tie(a.first, a.second),
                                      std::tie(b.first, b.second));
    }
};

}  // namespace semilog_cpp

/// Derive join_assign, partial_cmp and operator== for a product type.
///
/// Place inside the struct body, listing every field in declaration order.
/// Field positions double as stable wire tags in the binary codec, so new
/// fields must be appended. Listing a std::variant field fails to compile.
#define SEMILOG_PRODUCT(Type, ...)                                                       \
    auto lattice_fields() { return std::tie(__VA_ARGS__); }                              \
    auto lattice_fields() const { return std::tie(__VA_ARGS__); }                        \
    void join_assign(const Type& other) {                                                \
        ::semilog_cpp::detail::join_fields(lattice_fields(), other.lattice_fields());    \
    }                                                                                    \
    auto partial_cmp(const Type& other) const -> std::partial_ordering {                 \
        return ::semilog_cpp::detail::compare_fields(lattice_fields(),                   \
                                                     other.lattice_fields());            \
    }                                                                                    \
    auto operator==(const Type&) const -> bool = default
