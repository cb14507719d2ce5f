#include <semilog-cpp/report.hpp>

#include <set>
#include <sstream>
#include <utility>
#include <vector>

namespace semilog_cpp {

namespace {

auto quoted(const std::string& s) -> std::string {
    auto result = std::string{"\""};
    for (auto c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            default:   result.push_back(c); break;
        }
    }
    result.push_back('"');
    return result;
}

void render_replies(std::ostringstream& out, const Detailed& view, const MessageId& start) {
    auto visited = std::set<MessageId>{};
    auto stack = std::vector<std::pair<std::size_t, MessageId>>{{0, start}};

    while (!stack.empty()) {
        auto [depth, id] = std::move(stack.back());
        stack.pop_back();
        if (!visited.insert(id).second) continue;

        const auto* message = view.message(id);
        if (!message) continue;

        out << "Depth: " << depth << '\n';
        out << "Author: " << quoted(id.actor.name) << " [" << id.local << "]\n";
        for (const auto& [version, text] : message->live_versions()) {
            out << "Body: " << quoted(text) << '\n';
        }
        out << '\n';

        // Reversed so that replies print in id order.
        for (auto it = message->backrefs.end(); it != message->backrefs.begin();) {
            --it;
            if (!visited.contains(*it)) stack.emplace_back(depth + 1, *it);
        }
    }
}

}  // namespace

auto render_report(const Detailed& view) -> std::string {
    auto out = std::ostringstream{};

    for (const auto& [author, threads] : view.threads) {
        for (const auto& [id, thread] : threads) {
            out << "Author: " << quoted(author.name) << " [" << id << "]\n";
            for (const auto& title : thread.titles.value) {
                out << "Title: " << title << '\n';
            }

            out << "Tags: ";
            for (const auto& [tag, score] : thread.tag_scores()) {
                if (score > 0) out << tag << " (" << score << "), ";
            }
            out << "\n\n";

            render_replies(out, view, MessageId{author, id});
        }
    }
    return out.str();
}

}  // namespace semilog_cpp
