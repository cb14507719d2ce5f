/// @file session.hpp
/// @brief ActorSession: the mutation interface over one actor's Slice.

#pragma once

#include <semilog-cpp/schema.hpp>
#include <semilog-cpp/types.hpp>

#include <string>
#include <vector>

namespace semilog_cpp {

/// Produces legal deltas against one actor's own Slice.
///
/// A session holds the only mutable reference to the Slice it was handed,
/// so an actor can never write another actor's state. Identifiers are
/// partitioned by device: the low 16 bits of every LocalId and Version
/// are the device id, the high bits a per-Slice count.
///
/// Precondition: at most one live session per (actor, device). Two
/// sessions on the same device racing on allocation is undefined.
///
/// @code
/// auto slice = Slice{};
/// auto alice = ActorSession{slice, ActorId{"alice"}, 0};
/// auto thread = alice.new_thread("Hello", "Hi all", {"intro"});
/// alice.edit(thread.local, "Hi everyone");
/// @endcode
class ActorSession {
public:
    /// Open a session on slice.
    /// @throws Exception (invalid_device) if device exceeds max_device_id.
    ActorSession(Slice& slice, ActorId actor, DeviceId device);

    ActorSession(const ActorSession&) = delete;
    auto operator=(const ActorSession&) -> ActorSession& = delete;

    /// The actor this session writes for.
    auto actor_id() const -> const ActorId& { return actor_; }

    /// The device this session allocates identifiers for.
    auto device_id() const -> DeviceId { return device_; }

    /// Read-only view of the Slice being edited.
    auto slice() const -> const Slice& { return slice_; }

    /// Start a thread with one title and an initial body.
    /// The author's tags are recorded as positive votes on the new thread.
    auto new_thread(std::string title, std::string body,
                    const std::vector<Tag>& tags) -> MessageId;

    /// Reply to any message.
    auto reply(const MessageId& parent, std::string body) -> MessageId;

    /// Add a new version of one of the actor's messages.
    /// Earlier versions are kept; picking one is a reader policy.
    /// @return The new version key.
    auto edit(LocalId id, std::string body) -> Version;

    /// Tombstone a version of one of the actor's messages. A version that
    /// was never written is tombstoned too.
    void redact(LocalId id, Version version);

    /// Set whether the actor currently reacts with reaction on target.
    /// Repeating the current state is a no-op.
    void react(const MessageId& target, const Reaction& reaction, bool want);

    /// Vote tags up (add) or down (remove) on target.
    void adjust_tags(const MessageId& target, const std::vector<Tag>& add,
                     const std::vector<Tag>& remove);

private:
    auto next_local_id() const -> LocalId;

    Slice& slice_;
    ActorId actor_;
    DeviceId device_;
};

}  // namespace semilog_cpp
