// semilog-cpp benchmarks: fold, join and codec throughput.

#include <semilog-cpp/semilog.hpp>

#include <benchmark/benchmark.h>

#include <memory>
#include <string>
#include <thread>

using namespace semilog_cpp;

// One pool for the whole suite.
static auto g_pool = std::make_shared<thread_pool>(std::thread::hardware_concurrency());

static auto make_root(std::size_t actors, std::size_t per_actor) -> Root {
    auto root = Root{};
    const auto first = MessageId{ActorId{"actor-0"}, 0};
    for (std::size_t a = 0; a < actors; ++a) {
        const auto actor = ActorId{"actor-" + std::to_string(a)};
        auto session = ActorSession{root.inner.entry(actor), actor, 0};
        for (std::size_t m = 0; m < per_actor; ++m) {
            if (m % 10 == 0) {
                session.new_thread("thread", "body", {"tag"});
            } else {
                session.reply(first, "reply " + std::to_string(m));
            }
        }
        session.react(first, "like", true);
    }
    return root;
}

// =============================================================================
// Fold
// =============================================================================

static void bm_materialize_sequential(benchmark::State& state) {
    const auto root = make_root(static_cast<std::size_t>(state.range(0)), 100);
    for (auto _ : state) {
        benchmark::DoNotOptimize(materialize(root));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * 100);
}
BENCHMARK(bm_materialize_sequential)->Arg(8)->Arg(64)->Arg(256);

static void bm_materialize_parallel(benchmark::State& state) {
    const auto root = make_root(static_cast<std::size_t>(state.range(0)), 100);
    for (auto _ : state) {
        benchmark::DoNotOptimize(materialize(root, g_pool));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * 100);
}
BENCHMARK(bm_materialize_parallel)->Arg(8)->Arg(64)->Arg(256);

// =============================================================================
// Join
// =============================================================================

static void bm_join_roots(benchmark::State& state) {
    const auto a = make_root(static_cast<std::size_t>(state.range(0)), 50);
    const auto b = make_root(static_cast<std::size_t>(state.range(0)) / 2, 80);
    for (auto _ : state) {
        benchmark::DoNotOptimize(join(a, b));
    }
}
BENCHMARK(bm_join_roots)->Arg(16)->Arg(128);

// =============================================================================
// Codec
// =============================================================================

static void bm_encode_slice(benchmark::State& state) {
    const auto root = make_root(1, static_cast<std::size_t>(state.range(0)));
    const auto& slice = root.inner.begin()->second;
    for (auto _ : state) {
        benchmark::DoNotOptimize(encode_slice(slice));
    }
}
BENCHMARK(bm_encode_slice)->Arg(100)->Arg(1000);

static void bm_decode_slice(benchmark::State& state) {
    const auto root = make_root(1, static_cast<std::size_t>(state.range(0)));
    const auto bytes = encode_slice(root.inner.begin()->second);
    for (auto _ : state) {
        benchmark::DoNotOptimize(decode_slice(bytes));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(bytes.size()));
}
BENCHMARK(bm_decode_slice)->Arg(100)->Arg(1000);
