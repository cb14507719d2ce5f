// Algebraic laws of the schema types, checked over seeded random values.

#include <semilog-cpp/detailed.hpp>
#include <semilog-cpp/schema.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using namespace semilog_cpp;
using semilog_test::Gen;

namespace {

constexpr int iterations = 300;

template <typename T, typename Make>
void check_laws(std::uint64_t seed, Make make) {
    auto gen = Gen{seed};
    for (int i = 0; i < iterations; ++i) {
        const T x = make(gen);
        const T y = make(gen);
        const T z = make(gen);

        EXPECT_EQ(join(x, x), x) << "idempotence, iteration " << i;
        EXPECT_EQ(join(x, y), join(y, x)) << "commutativity, iteration " << i;
        EXPECT_EQ(join(join(x, y), z), join(x, join(y, z))) << "associativity, iteration " << i;
        EXPECT_EQ(join(T{}, x), x) << "bottom identity, iteration " << i;

        EXPECT_EQ(leq(x, y), join(x, y) == y) << "order agreement, iteration " << i;
        EXPECT_TRUE(leq(x, join(x, y))) << "upper bound, iteration " << i;
        EXPECT_TRUE(leq(y, join(x, y))) << "upper bound, iteration " << i;
    }
}

auto random_view(Gen& g) -> Detailed {
    return materialize(semilog_test::random_activity(g, 1 + g.below(15)));
}

// One entry of a nested actor -> local -> value map, or bottom when empty.
template <typename V>
auto pick(Gen& g, const GMap<ActorId, GMap<LocalId, V>>& nested) -> V {
    auto all = std::vector<const V*>{};
    for (const auto& [actor, by_local] : nested) {
        for (const auto& [local, value] : by_local) all.push_back(&value);
    }
    if (all.empty()) return V{};
    return *all[g.below(all.size())];
}

}  // namespace

TEST(Laws, redactable) {
    check_laws<Redactable<std::string>>(1, [](Gen& g) { return g.redactable(); });
}

TEST(Laws, titles) {
    check_laws<Titles>(2, [](Gen& g) { return g.titles(); });
}

TEST(Laws, counters) {
    check_laws<GMap<std::string, Max<std::uint64_t>>>(3, [](Gen& g) { return g.counters(); });
}

TEST(Laws, owned) {
    check_laws<Owned>(4, [](Gen& g) { return g.owned(); });
}

TEST(Laws, shared) {
    check_laws<Shared>(5, [](Gen& g) { return g.shared(); });
}

TEST(Laws, slice) {
    check_laws<Slice>(6, [](Gen& g) { return g.slice(); });
}

TEST(Laws, root) {
    check_laws<Root>(7, [](Gen& g) { return g.root(); });
}

TEST(Laws, vote) {
    check_laws<Vote<4>>(8, [](Gen& g) {
        auto vote = Vote<4>{};
        for (auto n = g.below(3); n > 0; --n) {
            join_assign(vote, Vote<4>::attributed(g.actor(), g.max()));
        }
        return vote;
    });
}

TEST(Laws, thread) {
    check_laws<Thread>(10, [](Gen& g) { return pick(g, random_view(g).threads); });
}

TEST(Laws, comment) {
    check_laws<Comment>(11, [](Gen& g) { return pick(g, random_view(g).messages); });
}

TEST(Laws, detailed) {
    check_laws<Detailed>(12, [](Gen& g) { return random_view(g); });
}

TEST(Laws, session_grown_slices_only_move_up) {
    auto gen = Gen{9};
    for (int i = 0; i < 50; ++i) {
        auto root = semilog_test::random_activity(gen, 20);
        const auto before = root;
        const auto actor = root.inner.begin()->first;
        auto session = ActorSession{root.inner.entry(actor), actor, 0};
        session.new_thread("t", "b", {});

        EXPECT_TRUE(leq(before, root));
        EXPECT_FALSE(leq(root, before));
    }
}
