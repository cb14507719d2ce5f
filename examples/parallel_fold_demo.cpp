// parallel_fold_demo: the fold is a join, so it parallelizes
//
// Builds many actors' slices, then materializes the Root sequentially and
// on a BS::thread_pool (one partial view per actor, reduced with join).
// Both views are identical.
//
// Run:   ./build/parallel_fold_demo [actors] [messages-per-actor]

#include <semilog-cpp/semilog.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

namespace sl = semilog_cpp;

struct Timer {
    std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    auto ms() const -> double {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
    }
};

int main(int argc, char** argv) {
    const auto actors = (argc > 1) ? std::strtoul(argv[1], nullptr, 10) : 64UL;
    const auto per_actor = (argc > 2) ? std::strtoul(argv[2], nullptr, 10) : 200UL;

    auto pool = std::make_shared<sl::thread_pool>(std::thread::hardware_concurrency());
    pool->sleep_duration = 0;
    std::printf("Thread pool: %lu threads\n",
                static_cast<unsigned long>(pool->get_thread_count()));

    // Everyone replies to the first thread and reacts to it.
    auto root = sl::Root{};
    const auto first = sl::MessageId{sl::ActorId{"actor-0"}, 0};
    for (unsigned long a = 0; a < actors; ++a) {
        const auto actor = sl::ActorId{"actor-" + std::to_string(a)};
        auto session = sl::ActorSession{root.inner.entry(actor), actor, 0};
        for (unsigned long m = 0; m < per_actor; ++m) {
            if (m % 10 == 0) {
                session.new_thread("thread " + std::to_string(m), "body", {"tag" + std::to_string(m % 7)});
            } else {
                session.reply(first, "reply " + std::to_string(m));
            }
        }
        session.react(first, "like", true);
    }

    auto t = Timer{};
    const auto sequential = sl::materialize(root);
    std::printf("sequential fold: %.1f ms\n", t.ms());

    t = Timer{};
    const auto parallel = sl::materialize(root, pool);
    std::printf("parallel fold:   %.1f ms\n", t.ms());

    std::printf("views identical: %s\n", sequential == parallel ? "yes" : "NO");
    std::printf("replies to first thread: %zu\n", parallel.message(first)->backrefs.size());
    return sequential == parallel ? 0 : 1;
}
