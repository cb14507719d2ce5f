#include <semilog-cpp/replica.hpp>

#include <semilog-cpp/error.hpp>
#include <semilog-cpp/json.hpp>

#include "executor.hpp"

#include <fstream>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace semilog_cpp {

namespace {

auto make_pool(unsigned int num_threads) -> std::shared_ptr<thread_pool> {
    if (num_threads == 1) return nullptr;
    auto n = (num_threads == 0) ? std::thread::hardware_concurrency() : num_threads;
    if (n <= 1) return nullptr;
    return std::make_shared<thread_pool>(n);
}

auto malformed(const ActorId& actor) -> Exception {
    return Exception{ErrorKind::decoding_error,
                     "published slice of actor '" + actor.name + "' is malformed"};
}

}  // namespace

// -- Configuration ------------------------------------------------------------

auto load_config(const std::filesystem::path& path) -> ReplicaConfig {
    auto in = std::ifstream{path};
    if (!in) {
        throw Exception{ErrorKind::invalid_config, "cannot open config " + path.string()};
    }

    auto config = ReplicaConfig{};
    try {
        const auto j = nlohmann::json::parse(in);
        j.get_to(config);
    } catch (const nlohmann::json::exception& e) {
        throw Exception{ErrorKind::invalid_config, path.string() + ": " + e.what()};
    }
    return config;
}

// -- Replica ------------------------------------------------------------------

Replica::Replica(std::shared_ptr<Substrate> substrate, ReplicaConfig config)
    : substrate_{std::move(substrate)},
      config_{std::move(config)},
      pool_{make_pool(config_.threads)} {
    if (!substrate_) {
        throw Exception{ErrorKind::invalid_operation, "replica needs a substrate"};
    }
}

auto Replica::open(const ReplicaConfig& config) -> Replica {
    set_log_level(config.log_level);
    if (config.directory.empty()) {
        log_debug("opening in-memory replica");
        return Replica{std::make_shared<MemorySubstrate>(), config};
    }
    log_debug("opening replica at " + config.directory);
    return Replica{std::make_shared<DirectorySubstrate>(config.directory), config};
}

void Replica::publish(const ActorId& actor, const Slice& slice) {
    auto merged = load_slice(actor);
    join_assign(merged, slice);

    const auto bytes = encode_slice(merged, config_.compression_threshold);
    substrate_->write(actor, bytes);
    if (config_.use_cache) substrate_->clear_cache();
    log_info("published slice of '" + actor.name + "' (" + std::to_string(bytes.size()) + " bytes)");
}

auto Replica::load_slice(const ActorId& actor) const -> Slice {
    auto bytes = substrate_->read(actor);
    if (!bytes) return Slice{};

    auto slice = decode_slice(*bytes);
    if (!slice) {
        log_error("cannot decode slice of '" + actor.name + "'");
        throw malformed(actor);
    }
    return std::move(*slice);
}

auto Replica::load_root() const -> Root {
    const auto blobs = substrate_->read_all();
    auto decoded = std::vector<std::optional<Slice>>(blobs.size());

    if (blobs.size() > 1) {
        auto taskflow = tf::Taskflow{};
        taskflow.for_each_index(std::size_t{0}, blobs.size(), std::size_t{1},
            [&](std::size_t i) { decoded[i] = decode_slice(blobs[i].second); });
        detail::global_executor().run(taskflow).wait();
    } else {
        for (std::size_t i = 0; i < blobs.size(); ++i) {
            decoded[i] = decode_slice(blobs[i].second);
        }
    }

    auto root = Root{};
    for (std::size_t i = 0; i < blobs.size(); ++i) {
        const auto& actor = blobs[i].first;
        if (!decoded[i]) {
            log_error("cannot decode slice of '" + actor.name + "'");
            throw malformed(actor);
        }
        root.inner.join_entry(actor, *decoded[i]);
    }
    log_debug("loaded " + std::to_string(blobs.size()) + " slices");
    return root;
}

auto Replica::materialize() -> Detailed {
    auto view = semilog_cpp::materialize(load_root(), pool_);
    if (config_.use_cache) {
        substrate_->write_cache(encode_detailed(view, config_.compression_threshold));
        log_debug("refreshed materialized cache");
    }
    return view;
}

auto Replica::cached_view() -> Detailed {
    if (!config_.use_cache) return materialize();

    auto bytes = substrate_->read_cache();
    if (!bytes) {
        log_info("no materialized cache, rebuilding");
        return materialize();
    }

    auto view = decode_detailed(*bytes);
    if (!view) {
        log_warn("materialized cache is unreadable, rebuilding");
        return materialize();
    }
    return std::move(*view);
}

}  // namespace semilog_cpp
