#include <semilog-cpp/session.hpp>
#include <semilog-cpp/error.hpp>

#include <utility>

namespace semilog_cpp {

namespace {

// Tag counter categories, stored modulo 4.
constexpr std::uint64_t tag_neutral = 0;
constexpr std::uint64_t tag_positive = 1;
constexpr std::uint64_t tag_negative = 2;

}  // namespace

ActorSession::ActorSession(Slice& slice, ActorId actor, DeviceId device)
    : slice_{slice}, actor_{std::move(actor)}, device_{device} {
    if (device_ > max_device_id) {
        throw Exception{ErrorKind::invalid_device,
                        "device id " + std::to_string(device_) + " for actor '" +
                            actor_.name + "' exceeds " + std::to_string(max_device_id)};
    }
}

auto ActorSession::next_local_id() const -> LocalId {
    // edit() and redact() may create entries for ids never handed out here,
    // so step past any key that is already taken.
    auto count = static_cast<LocalId>(slice_.owned.size());
    auto id = (count << device_bits) | device_;
    while (slice_.owned.contains(id)) {
        id = (++count << device_bits) | device_;
    }
    return id;
}

auto ActorSession::new_thread(std::string title, std::string body,
                              const std::vector<Tag>& tags) -> MessageId {
    const auto id = next_local_id();

    auto owned = Owned{};
    owned.titles = Titles{Max<std::uint64_t>{0}, GSet<std::string>::singleton(std::move(title))};
    owned.content = Content::singleton(0, Redactable<std::string>::live(std::move(body)));
    join_assign(slice_.owned.entry(id), owned);

    auto message = MessageId{actor_, id};
    auto& votes = slice_.shared.entry(message).tags;
    for (const auto& tag : tags) {
        votes.join_entry(tag, Max<std::uint64_t>{tag_positive});
    }
    return message;
}

auto ActorSession::reply(const MessageId& parent, std::string body) -> MessageId {
    const auto id = next_local_id();

    auto owned = Owned{};
    owned.reply_to = GSet<MessageId>::singleton(parent);
    owned.content = Content::singleton(0, Redactable<std::string>::live(std::move(body)));
    join_assign(slice_.owned.entry(id), owned);

    return MessageId{actor_, id};
}

auto ActorSession::edit(LocalId id, std::string body) -> Version {
    auto& content = slice_.owned.entry(id).content;

    // One past the highest version observed from any device.
    auto next = std::uint64_t{0};
    for (const auto& [version, cell] : content) {
        next = (version >> device_bits) + 1;
    }
    const auto version = (next << device_bits) | device_;

    content.join_entry(version, Redactable<std::string>::live(std::move(body)));
    return version;
}

void ActorSession::redact(LocalId id, Version version) {
    slice_.owned.entry(id).content.join_entry(version, Redactable<std::string>::tombstone());
}

void ActorSession::react(const MessageId& target, const Reaction& reaction, bool want) {
    auto& counter = slice_.shared.entry(target).reactions.entry(reaction);
    if (counter.value % 2 != static_cast<std::uint64_t>(want)) {
        ++counter.value;
    }
}

void ActorSession::adjust_tags(const MessageId& target, const std::vector<Tag>& add,
                               const std::vector<Tag>& remove) {
    auto& tags = slice_.shared.entry(target).tags;

    // Transitions only ever increment so the counter stays Max-joinable.
    // State 3 is reserved and is left again on the next adjustment.
    for (const auto& tag : add) {
        auto& counter = tags.entry(tag);
        switch (counter.value % 4) {
            case tag_neutral:  counter.value += 1; break;
            case tag_positive: break;
            case tag_negative: counter.value += 3; break;
            default:           counter.value += 2; break;
        }
    }

    for (const auto& tag : remove) {
        auto& counter = tags.entry(tag);
        switch (counter.value % 4) {
            case tag_neutral:  counter.value += 2; break;
            case tag_positive: counter.value += 1; break;
            case tag_negative: break;
            default:           counter.value += 3; break;
        }
    }
}

}  // namespace semilog_cpp
