// threads_demo: three actors, offline edits, one converged view
//
// Each actor writes only its own Slice. The slices are published to a
// replica, read back as one Root, and folded into the threaded view.
//
// Run:   ./build/threads_demo [config.json]

#include <semilog-cpp/semilog.hpp>

#include <cstdio>
#include <exception>
#include <string>

namespace sl = semilog_cpp;

int main(int argc, char** argv) {
    try {
        auto config = (argc > 1) ? sl::load_config(argv[1]) : sl::ReplicaConfig{};
        auto replica = sl::Replica::open(config);

        const auto alice = sl::ActorId{"alice"};
        const auto bob = sl::ActorId{"bob"};
        const auto carol = sl::ActorId{"carol"};

        // Alice starts a thread from her laptop (device 0).
        auto alice_slice = replica.load_slice(alice);
        auto laptop = sl::ActorSession{alice_slice, alice, 0};
        const auto thread = laptop.new_thread("Hello", "Hi all", {"intro"});
        replica.publish(alice, alice_slice);

        // Bob replies, Carol reacts and votes the tag up.
        auto bob_slice = replica.load_slice(bob);
        const auto reply = sl::ActorSession{bob_slice, bob, 0}.reply(thread, "Welcome!");
        replica.publish(bob, bob_slice);

        auto carol_slice = replica.load_slice(carol);
        auto carol_session = sl::ActorSession{carol_slice, carol, 0};
        carol_session.react(thread, "like", true);
        carol_session.adjust_tags(thread, {"intro", "meta"}, {});
        carol_session.reply(reply, "Seconded.");
        replica.publish(carol, carol_slice);

        // Alice edits the same message from two devices without syncing.
        auto phone_copy = alice_slice;
        laptop.edit(thread.local, "Hi all (edited on laptop)");
        sl::ActorSession{phone_copy, alice, 1}.edit(thread.local, "Hi all (edited on phone)");
        replica.publish(alice, alice_slice);
        replica.publish(alice, phone_copy);

        const auto view = replica.materialize();
        std::printf("%s", sl::render_report(view).c_str());

        const auto* message = view.message(thread);
        const auto likes = message->reactions.get("like");
        std::printf("likes on thread: %llu\n",
                    static_cast<unsigned long long>(likes ? likes->aggregate()[1] : 0));
        std::printf("versions kept: %zu\n", message->content.size());
    } catch (const std::exception& e) {
        std::fprintf(stderr, "threads_demo: %s\n", e.what());
        return 1;
    }
    return 0;
}
