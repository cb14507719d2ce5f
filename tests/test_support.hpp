#pragma once

// Seeded random values and activity for the law and fold tests.

#include <semilog-cpp/schema.hpp>
#include <semilog-cpp/session.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace semilog_test {

using namespace semilog_cpp;

// Small domains so that random values collide often.
class Gen {
public:
    explicit Gen(std::uint64_t seed) : rng_{seed} {}

    auto below(std::uint64_t n) -> std::uint64_t {
        return std::uniform_int_distribution<std::uint64_t>{0, n - 1}(rng_);
    }

    auto coin() -> bool { return below(2) == 0; }

    auto word() -> std::string {
        static const std::array<const char*, 4> words = {"a", "b", "hello", "zeta"};
        return words[below(words.size())];
    }

    auto actor() -> ActorId {
        static const std::array<const char*, 3> names = {"alice", "bob", "carol"};
        return ActorId{names[below(names.size())]};
    }

    auto message_id() -> MessageId { return MessageId{actor(), below(3)}; }

    auto max() -> Max<std::uint64_t> { return Max<std::uint64_t>{below(5)}; }

    auto redactable() -> Redactable<std::string> {
        switch (below(3)) {
            case 0:  return Redactable<std::string>{};
            case 1:  return Redactable<std::string>::live(word());
            default: return Redactable<std::string>::tombstone();
        }
    }

    auto words() -> GSet<std::string> {
        auto result = GSet<std::string>{};
        for (auto n = below(3); n > 0; --n) result.insert(word());
        return result;
    }

    auto titles() -> Titles { return Titles{Max<std::uint64_t>{below(3)}, words()}; }

    auto counters() -> GMap<std::string, Max<std::uint64_t>> {
        auto result = GMap<std::string, Max<std::uint64_t>>{};
        for (auto n = below(3); n > 0; --n) result.join_entry(word(), max());
        return result;
    }

    auto owned() -> Owned {
        auto result = Owned{};
        if (coin()) result.titles = titles();
        for (auto n = below(2); n > 0; --n) result.reply_to.insert(message_id());
        for (auto n = below(3); n > 0; --n) result.content.join_entry(below(3), redactable());
        return result;
    }

    auto shared() -> Shared {
        auto result = Shared{};
        result.tags = counters();
        result.reactions = counters();
        return result;
    }

    auto slice() -> Slice {
        auto result = Slice{};
        for (auto n = below(3); n > 0; --n) result.owned.join_entry(below(3), owned());
        for (auto n = below(3); n > 0; --n) result.shared.join_entry(message_id(), shared());
        return result;
    }

    auto root() -> Root {
        auto result = Root{};
        for (auto n = below(3); n > 0; --n) result.inner.join_entry(actor(), slice());
        return result;
    }

    template <typename T>
    void shuffle(std::vector<T>& items) { std::shuffle(items.begin(), items.end(), rng_); }

private:
    std::mt19937_64 rng_;
};

// Drive random, legal session activity for a few actors and return the
// resulting Root. Replies, reactions and tags may target any message seen
// so far, including ones from other actors.
inline auto random_activity(Gen& gen, std::size_t steps) -> Root {
    auto slices = std::map<ActorId, Slice>{};
    auto seen = std::vector<MessageId>{};

    for (std::size_t i = 0; i < steps; ++i) {
        const auto actor = gen.actor();
        auto session = ActorSession{slices[actor], actor, gen.below(3)};

        switch (seen.empty() ? 0 : gen.below(6)) {
            case 0:
                seen.push_back(session.new_thread(gen.word(), gen.word(), {gen.word()}));
                break;
            case 1:
                seen.push_back(session.reply(seen[gen.below(seen.size())], gen.word()));
                break;
            case 2: {
                const auto& target = seen[gen.below(seen.size())];
                if (target.actor == actor) session.edit(target.local, gen.word());
                break;
            }
            case 3: {
                const auto& target = seen[gen.below(seen.size())];
                if (target.actor == actor) session.redact(target.local, gen.below(2) << device_bits);
                break;
            }
            case 4:
                session.react(seen[gen.below(seen.size())], gen.word(), gen.coin());
                break;
            default:
                session.adjust_tags(seen[gen.below(seen.size())], {gen.word()}, {gen.word()});
                break;
        }
    }

    auto root = Root{};
    for (const auto& [actor, slice] : slices) root.inner.join_entry(actor, slice);
    return root;
}

}  // namespace semilog_test
