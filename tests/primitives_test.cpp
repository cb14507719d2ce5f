#include <semilog-cpp/primitives.hpp>

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <string>

using namespace semilog_cpp;

using U64 = Max<std::uint64_t>;

// -- Max ----------------------------------------------------------------------

TEST(Max, join_keeps_the_larger_value) {
    EXPECT_EQ(join(U64{3}, U64{5}).value, 5u);
    EXPECT_EQ(join(U64{5}, U64{3}).value, 5u);
    EXPECT_TRUE(is_bottom(U64{}));
}

TEST(Max, order_is_total) {
    EXPECT_EQ(partial_compare(U64{1}, U64{2}), std::partial_ordering::less);
    EXPECT_EQ(partial_compare(U64{2}, U64{2}), std::partial_ordering::equivalent);
    EXPECT_TRUE(leq(U64{0}, U64{9}));
}

// -- GSet ---------------------------------------------------------------------

TEST(GSet, join_is_union) {
    const auto s = join(GSet<std::string>{"a", "b"}, GSet<std::string>{"b", "c"});
    EXPECT_EQ(s.size(), 3u);
    EXPECT_TRUE(s.contains("a"));
    EXPECT_TRUE(s.contains("c"));
}

TEST(GSet, order_is_inclusion) {
    EXPECT_EQ(partial_compare(GSet<int>{1}, GSet<int>{1, 2}), std::partial_ordering::less);
    EXPECT_EQ(partial_compare(GSet<int>{1, 2}, GSet<int>{1}), std::partial_ordering::greater);
    EXPECT_EQ(partial_compare(GSet<int>{1}, GSet<int>{2}), std::partial_ordering::unordered);
    EXPECT_TRUE(leq(GSet<int>{}, GSet<int>{7}));
}

TEST(GSet, singleton_and_insert) {
    auto s = GSet<int>::singleton(4);
    s.insert(4);
    s.insert(2);
    EXPECT_EQ(s.size(), 2u);
    EXPECT_EQ(*s.begin(), 2);
}

// -- GMap ---------------------------------------------------------------------

TEST(GMap, join_unions_keys_and_joins_values) {
    auto a = GMap<std::string, U64>{{"x", U64{1}}, {"y", U64{5}}};
    const auto b = GMap<std::string, U64>{{"x", U64{3}}, {"z", U64{2}}};
    join_assign(a, b);

    EXPECT_EQ(a.size(), 3u);
    EXPECT_EQ(a.get("x")->value, 3u);
    EXPECT_EQ(a.get("y")->value, 5u);
    EXPECT_EQ(a.get("z")->value, 2u);
}

TEST(GMap, absent_key_equals_bottom_entry) {
    auto with_bottom = GMap<std::string, U64>{};
    with_bottom.entry("x");
    EXPECT_TRUE(with_bottom.contains("x"));
    EXPECT_EQ(with_bottom, (GMap<std::string, U64>{}));
    EXPECT_TRUE(is_bottom(with_bottom));
    EXPECT_EQ(partial_compare(with_bottom, GMap<std::string, U64>{}),
              std::partial_ordering::equivalent);
}

TEST(GMap, order_treats_missing_keys_as_bottom) {
    const auto small = GMap<std::string, U64>{{"x", U64{1}}};
    const auto big = GMap<std::string, U64>{{"x", U64{2}}, {"y", U64{1}}};
    const auto other = GMap<std::string, U64>{{"z", U64{1}}};

    EXPECT_EQ(partial_compare(small, big), std::partial_ordering::less);
    EXPECT_EQ(partial_compare(big, small), std::partial_ordering::greater);
    EXPECT_EQ(partial_compare(small, other), std::partial_ordering::unordered);
}

TEST(GMap, get_does_not_insert) {
    const auto m = GMap<int, U64>{};
    EXPECT_EQ(m.get(1), nullptr);
    EXPECT_FALSE(m.contains(1));
}

TEST(GMap, join_entry_merges_into_existing) {
    auto m = GMap<int, U64>::singleton(1, U64{4});
    m.join_entry(1, U64{2});
    m.join_entry(2, U64{9});
    EXPECT_EQ(m.get(1)->value, 4u);
    EXPECT_EQ(m.get(2)->value, 9u);
}

// -- GuardedPair --------------------------------------------------------------

using Guarded = GuardedPair<U64, GSet<std::string>>;

TEST(GuardedPair, greater_guard_supersedes_in_full) {
    const auto stale = Guarded{U64{0}, GSet<std::string>{"old"}};
    const auto fresh = Guarded{U64{1}, GSet<std::string>{"new"}};

    EXPECT_EQ(join(stale, fresh), fresh);
    EXPECT_EQ(join(fresh, stale), fresh);
    EXPECT_EQ(partial_compare(stale, fresh), std::partial_ordering::less);
}

TEST(GuardedPair, equal_guards_join_values) {
    const auto a = Guarded{U64{2}, GSet<std::string>{"a"}};
    const auto b = Guarded{U64{2}, GSet<std::string>{"b"}};
    const auto c = join(a, b);

    EXPECT_EQ(c.guard.value, 2u);
    EXPECT_EQ(c.value, (GSet<std::string>{"a", "b"}));
    EXPECT_EQ(partial_compare(a, b), std::partial_ordering::unordered);
}

// -- Redactable ---------------------------------------------------------------

using Cell = Redactable<std::string>;

TEST(Redactable, states_form_a_chain) {
    const auto empty = Cell{};
    const auto live = Cell::live("text");
    const auto dead = Cell::tombstone();

    EXPECT_TRUE(empty.is_empty());
    EXPECT_TRUE(is_bottom(empty));
    EXPECT_EQ(partial_compare(empty, live), std::partial_ordering::less);
    EXPECT_EQ(partial_compare(live, dead), std::partial_ordering::less);
    EXPECT_EQ(partial_compare(empty, dead), std::partial_ordering::less);
}

TEST(Redactable, tombstone_absorbs_every_join) {
    auto cell = Cell::tombstone();
    join_assign(cell, Cell::live("late write"));
    EXPECT_TRUE(cell.is_tombstoned());
    EXPECT_EQ(cell.value(), nullptr);

    EXPECT_TRUE(join(Cell::live("x"), Cell::tombstone()).is_tombstoned());
}

TEST(Redactable, concurrent_live_values_resolve_to_byte_order_greater) {
    const auto a = Cell::live("apple");
    const auto b = Cell::live("banana");

    ASSERT_NE(join(a, b).value(), nullptr);
    EXPECT_EQ(*join(a, b).value(), "banana");
    EXPECT_EQ(join(a, b), join(b, a));
    EXPECT_EQ(partial_compare(a, b), std::partial_ordering::less);
}

TEST(Redactable, value_is_only_visible_when_live) {
    EXPECT_EQ(Cell{}.value(), nullptr);
    ASSERT_NE(Cell::live("").value(), nullptr);
    EXPECT_EQ(*Cell::live("").value(), "");
    EXPECT_TRUE(Cell::live("").is_live());
}

// -- Vote ---------------------------------------------------------------------

TEST(Vote, opinion_is_counter_modulo_n) {
    auto vote = Vote<4>::attributed(ActorId{"alice"}, U64{6});
    EXPECT_EQ(vote.opinion(ActorId{"alice"}), 2u);
    EXPECT_EQ(vote.opinion(ActorId{"bob"}), 0u);
}

TEST(Vote, aggregate_counts_current_categories) {
    auto vote = Vote<2>::attributed(ActorId{"alice"}, U64{1});
    join_assign(vote, Vote<2>::attributed(ActorId{"bob"}, U64{2}));
    join_assign(vote, Vote<2>::attributed(ActorId{"carol"}, U64{3}));

    EXPECT_EQ(vote.aggregate(), (std::array<std::uint64_t, 2>{1, 2}));
}

TEST(Vote, aggregate_skips_bottom_counters) {
    const auto vote = Vote<2>::attributed(ActorId{"alice"}, U64{0});
    EXPECT_EQ(vote.aggregate(), (std::array<std::uint64_t, 2>{0, 0}));
    EXPECT_EQ(vote, Vote<2>{});
}

TEST(Vote, join_keeps_each_actors_latest_counter) {
    const auto old_vote = Vote<2>::attributed(ActorId{"alice"}, U64{1});
    const auto new_vote = Vote<2>::attributed(ActorId{"alice"}, U64{2});

    const auto merged = join(old_vote, new_vote);
    EXPECT_EQ(merged.opinion(ActorId{"alice"}), 0u);
    EXPECT_EQ(merged.aggregate(), (std::array<std::uint64_t, 2>{1, 0}));
    EXPECT_TRUE(leq(old_vote, new_vote));
}
