/// @file schema.hpp
/// @brief Per-actor append-only state: Owned, Shared, Slice, Root.
///
/// Each actor writes only its own Slice. A Slice is a semilattice on its
/// own, so any two copies of it (from two devices, or a stale and a fresh
/// replica) merge with join. Root is the join of every known Slice and is
/// the unit of replication.

#pragma once

#include <semilog-cpp/lattice.hpp>
#include <semilog-cpp/primitives.hpp>
#include <semilog-cpp/types.hpp>

#include <cstdint>
#include <string>

namespace semilog_cpp {

/// Title set of a thread, superseded as a whole by a greater guard.
using Titles = GuardedPair<Max<std::uint64_t>, GSet<std::string>>;

/// Version -> content cell of one message.
using Content = GMap<Version, Redactable<std::string>>;

/// Fields only the authoring actor may write for one of its own messages.
struct Owned {
    Titles titles;                 ///< Non-empty only for thread starters.
    GSet<MessageId> reply_to;      ///< Forward reply edges.
    Content content;               ///< Every authored version.

    SEMILOG_PRODUCT(Owned, titles, reply_to, content);
};

/// One actor's private opinion counters about a message, possibly
/// someone else's.
struct Shared {
    GMap<Tag, Max<std::uint64_t>> tags;            ///< Mod-4 tag counters.
    GMap<Reaction, Max<std::uint64_t>> reactions;  ///< Mod-2 reaction counters.

    SEMILOG_PRODUCT(Shared, tags, reactions);
};

/// One actor's whole private, append-only state.
struct Slice {
    GMap<LocalId, Owned> owned;     ///< The actor's own messages.
    GMap<MessageId, Shared> shared; ///< The actor's annotations on any message.

    SEMILOG_PRODUCT(Slice, owned, shared);
};

/// The join of all known actors' Slices.
struct Root {
    GMap<ActorId, Slice> inner;  ///< Actor -> that actor's Slice.

    SEMILOG_PRODUCT(Root, inner);
};

}  // namespace semilog_cpp
