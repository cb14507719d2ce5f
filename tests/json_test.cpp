#include <semilog-cpp/error.hpp>
#include <semilog-cpp/json.hpp>
#include <semilog-cpp/session.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace semilog_cpp;
using json = nlohmann::json;

// -- Identity types -----------------------------------------------------------

TEST(JsonAdl, actor_id_round_trip) {
    const auto j = json(ActorId{"alice"});
    EXPECT_EQ(j, "alice");
    EXPECT_EQ(j.get<ActorId>(), ActorId{"alice"});
}

TEST(JsonAdl, message_id_round_trip) {
    const auto id = MessageId{ActorId{"bob"}, 65537};
    const auto j = json(id);
    EXPECT_EQ(j.at("actor"), "bob");
    EXPECT_EQ(j.at("id"), 65537u);
    EXPECT_EQ(j.get<MessageId>(), id);
}

// -- Primitives ---------------------------------------------------------------

TEST(JsonAdl, string_keyed_maps_are_objects) {
    const auto m = GMap<std::string, Max<std::uint64_t>>{{"like", Max<std::uint64_t>{3}}};
    EXPECT_EQ(json(m), json::parse(R"({"like": 3})"));
}

TEST(JsonAdl, other_maps_are_pair_arrays) {
    const auto m = GMap<LocalId, Max<std::uint64_t>>{{7, Max<std::uint64_t>{1}}};
    EXPECT_EQ(json(m), json::parse("[[7, 1]]"));
}

TEST(JsonAdl, redactable_states) {
    EXPECT_EQ(json(Redactable<std::string>{}), json::parse(R"({"state": "empty"})"));
    EXPECT_EQ(json(Redactable<std::string>::live("x")),
              json::parse(R"({"state": "live", "value": "x"})"));
    EXPECT_EQ(json(Redactable<std::string>::tombstone()),
              json::parse(R"({"state": "tombstoned"})"));
}

TEST(JsonAdl, votes_carry_their_aggregate) {
    auto vote = Vote<2>::attributed(ActorId{"alice"}, Max<std::uint64_t>{1});
    join_assign(vote, Vote<2>::attributed(ActorId{"bob"}, Max<std::uint64_t>{2}));
    EXPECT_EQ(json(vote), json::parse(R"({"votes": {"alice": 1, "bob": 2}, "aggregate": [1, 1]})"));
}

TEST(JsonAdl, guarded_pair_and_set) {
    const auto titles = Titles{Max<std::uint64_t>{2}, GSet<std::string>{"b", "a"}};
    EXPECT_EQ(json(titles), json::parse(R"({"guard": 2, "value": ["a", "b"]})"));
}

// -- Schema and view ----------------------------------------------------------

TEST(JsonAdl, slice_export) {
    auto slice = Slice{};
    const auto id = ActorSession{slice, ActorId{"alice"}, 0}.new_thread("Hello", "Hi", {"intro"});
    const auto j = json(slice);

    ASSERT_TRUE(j.at("owned").is_array());
    EXPECT_EQ(j.at("owned")[0][0], id.local);
    EXPECT_EQ(j.at("owned")[0][1].at("titles").at("value"), json::parse(R"(["Hello"])"));
    EXPECT_EQ(j.at("shared")[0][0], json(id));
    EXPECT_EQ(j.at("shared")[0][1].at("tags").at("intro"), 1);
}

TEST(JsonAdl, thread_includes_scores) {
    auto thread = Thread{};
    thread.tags.join_entry("t", Vote<4>::attributed(ActorId{"alice"}, Max<std::uint64_t>{1}));
    const auto j = json(thread);
    EXPECT_EQ(j.at("scores").at("t"), 1);
    EXPECT_EQ(j.at("tags").at("t").at("aggregate"), json::parse("[0, 1, 0, 0]"));
}

TEST(JsonAdl, detailed_export_is_keyed_by_actor) {
    auto root = Root{};
    ActorSession{root.inner.entry(ActorId{"alice"}), ActorId{"alice"}, 0}
        .new_thread("Hello", "Hi", {});
    const auto j = json(materialize(root));

    ASSERT_TRUE(j.at("threads").contains("alice"));
    ASSERT_TRUE(j.at("messages").contains("alice"));
    EXPECT_EQ(j.at("messages").at("alice")[0][1].at("content")[0][1].at("value"), "Hi");
}

// -- Configuration ------------------------------------------------------------

TEST(JsonAdl, replica_config_round_trip) {
    auto c = ReplicaConfig{};
    c.directory = "/tmp/x";
    c.threads = 2;
    c.use_cache = false;
    c.compression_threshold = 10;
    c.log_level = LogLevel::debug;

    const auto j = json(c);
    EXPECT_EQ(j.at("log_level"), "debug");
    EXPECT_EQ(j.get<ReplicaConfig>(), c);
}

TEST(JsonAdl, replica_config_rejects_wrong_types) {
    EXPECT_THROW((void)json::parse(R"({"directory": 5})").get<ReplicaConfig>(), Exception);
    EXPECT_THROW((void)json::parse(R"({"compression_threshold": 1.5})").get<ReplicaConfig>(), Exception);
}

TEST(JsonAdl, replica_config_rejects_thread_counts_that_do_not_fit) {
    try {
        (void)json::parse(R"({"threads": 4294967296})").get<ReplicaConfig>();
        FAIL() << "expected invalid_config";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_config);
    }
    EXPECT_EQ(json::parse(R"({"threads": 4294967295})").get<ReplicaConfig>().threads,
              4294967295u);
}
