/// @file detailed.hpp
/// @brief The materialized view (Thread, Comment, Detailed) and the fold
/// that derives it from a Root.

#pragma once

#include <semilog-cpp/lattice.hpp>
#include <semilog-cpp/primitives.hpp>
#include <semilog-cpp/schema.hpp>
#include <semilog-cpp/types.hpp>

#include <thread_pool.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace semilog_cpp {

/// Shared worker pool (BS::thread_pool) used for the parallel fold.
using thread_pool = ::thread_pool;

/// Thread metadata: titles and attributed tag votes.
struct Thread {
    Titles titles;                  ///< Titles written by the author.
    GMap<Tag, Vote<4>> tags;        ///< 0 neutral, 1 positive, 2 negative, 3 reserved.

    SEMILOG_PRODUCT(Thread, titles, tags);

    /// Net score per tag: positive votes minus negative votes.
    auto tag_scores() const -> std::map<Tag, std::int64_t>;
};

/// One message with everything the fold attached to it.
struct Comment {
    GSet<MessageId> reply_to;             ///< Forward reply edges.
    Content content;                      ///< Every version, live or redacted.
    GMap<Reaction, Vote<2>> reactions;    ///< 1 = reacted, 0 = not.
    GSet<MessageId> backrefs;             ///< Messages replying to this one.

    SEMILOG_PRODUCT(Comment, reply_to, content, reactions, backrefs);

    /// Every live version in version order.
    auto live_versions() const -> std::vector<std::pair<Version, std::string>>;

    /// Content of the highest live version, or nullptr if none is live.
    /// A reader policy; the view itself keeps every version.
    auto latest_live() const -> const std::string*;
};

/// The whole materialized view.
///
/// Always re-derivable from a Root and never a primary source of truth.
/// Its join exists only to reduce per-actor partial folds.
struct Detailed {
    GMap<ActorId, GMap<LocalId, Thread>> threads;    ///< Author -> id -> thread.
    GMap<ActorId, GMap<LocalId, Comment>> messages;  ///< Author -> id -> message.

    SEMILOG_PRODUCT(Detailed, threads, messages);

    /// Look up a thread by message id.
    auto thread(const MessageId& id) const -> const Thread*;

    /// Look up a message by id.
    auto message(const MessageId& id) const -> const Comment*;
};

/// Promote one actor's private counters to one-entry attributed votes.
///
/// Each counter becomes `Vote{actor -> counter}`, which joins safely with
/// the same actor's contribution folded by any other replica.
template <std::size_t N>
auto attribute_votes(const ActorId& actor,
                     const GMap<std::string, Max<std::uint64_t>>& counters)
    -> GMap<std::string, Vote<N>> {
    auto result = GMap<std::string, Vote<N>>{};
    for (const auto& [key, counter] : counters) {
        result.join_entry(key, Vote<N>::attributed(actor, counter));
    }
    return result;
}

/// Fold one actor's Slice into a running view.
void fold_slice(Detailed& view, const ActorId& actor, const Slice& slice);

/// Fold every Slice of a Root into a running view.
void fold_root(Detailed& view, const Root& root);

/// Materialize a Root into a fresh view.
auto materialize(const Root& root) -> Detailed;

/// Materialize a Root, folding each actor on the pool and reducing the
/// partial views with join. A null pool folds sequentially.
auto materialize(const Root& root, const std::shared_ptr<thread_pool>& pool) -> Detailed;

}  // namespace semilog_cpp
