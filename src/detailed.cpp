#include <semilog-cpp/detailed.hpp>

#include <utility>

namespace semilog_cpp {

// -- View helpers -------------------------------------------------------------

auto Thread::tag_scores() const -> std::map<Tag, std::int64_t> {
    auto scores = std::map<Tag, std::int64_t>{};
    for (const auto& [tag, vote] : tags) {
        const auto histogram = vote.aggregate();
        scores[tag] += static_cast<std::int64_t>(histogram[1]) -
                       static_cast<std::int64_t>(histogram[2]);
    }
    return scores;
}

auto Comment::live_versions() const -> std::vector<std::pair<Version, std::string>> {
    auto result = std::vector<std::pair<Version, std::string>>{};
    for (const auto& [version, cell] : content) {
        if (const auto* text = cell.value()) {
            result.emplace_back(version, *text);
        }
    }
    return result;
}

auto Comment::latest_live() const -> const std::string* {
    const std::string* latest = nullptr;
    for (const auto& [version, cell] : content) {
        if (const auto* text = cell.value()) latest = text;
    }
    return latest;
}

auto Detailed::thread(const MessageId& id) const -> const Thread* {
    const auto* by_actor = threads.get(id.actor);
    return by_actor ? by_actor->get(id.local) : nullptr;
}

auto Detailed::message(const MessageId& id) const -> const Comment* {
    const auto* by_actor = messages.get(id.actor);
    return by_actor ? by_actor->get(id.local) : nullptr;
}

// -- Fold ---------------------------------------------------------------------

void fold_slice(Detailed& view, const ActorId& actor, const Slice& slice) {
    for (const auto& [id, owned] : slice.owned) {
        if (!owned.titles.value.empty()) {
            join_assign(view.threads.entry(actor).entry(id).titles, owned.titles);
        }

        // The only writer of backrefs: the inverse of each forward edge.
        for (const auto& parent : owned.reply_to) {
            view.messages.entry(parent.actor).entry(parent.local)
                .backrefs.insert(MessageId{actor, id});
        }

        auto comment = Comment{};
        comment.reply_to = owned.reply_to;
        comment.content = owned.content;
        join_assign(view.messages.entry(actor).entry(id), comment);
    }

    for (const auto& [target, shared] : slice.shared) {
        join_assign(view.messages.entry(target.actor).entry(target.local).reactions,
                    attribute_votes<2>(actor, shared.reactions));

        if (!shared.tags.empty()) {
            join_assign(view.threads.entry(target.actor).entry(target.local).tags,
                        attribute_votes<4>(actor, shared.tags));
        }
    }
}

void fold_root(Detailed& view, const Root& root) {
    for (const auto& [actor, slice] : root.inner) {
        fold_slice(view, actor, slice);
    }
}

auto materialize(const Root& root) -> Detailed {
    auto view = Detailed{};
    fold_root(view, root);
    return view;
}

auto materialize(const Root& root, const std::shared_ptr<thread_pool>& pool) -> Detailed {
    if (!pool || root.inner.size() < 2) return materialize(root);

    auto actors = std::vector<std::pair<const ActorId*, const Slice*>>{};
    actors.reserve(root.inner.size());
    for (const auto& [actor, slice] : root.inner) {
        actors.emplace_back(&actor, &slice);
    }

    auto partials = std::vector<Detailed>(actors.size());
    pool->parallelize_loop(std::size_t{0}, actors.size(),
        [&](std::size_t start, std::size_t end) {
            for (auto i = start; i < end; ++i) {
                fold_slice(partials[i], *actors[i].first, *actors[i].second);
            }
        });

    // Tree reduce: each round joins partials[left + stride] into partials[left].
    for (std::size_t stride = 1; stride < partials.size(); stride *= 2) {
        const auto pairs = (partials.size() + 2 * stride - 1) / (2 * stride);
        pool->parallelize_loop(std::size_t{0}, pairs,
            [&](std::size_t start, std::size_t end) {
                for (auto p = start; p < end; ++p) {
                    const auto left = p * 2 * stride;
                    const auto right = left + stride;
                    if (right < partials.size()) {
                        join_assign(partials[left], partials[right]);
                    }
                }
            });
    }

    return std::move(partials.front());
}

}  // namespace semilog_cpp
