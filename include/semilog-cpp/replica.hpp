/// @file replica.hpp
/// @brief Publish, load and materialize over a Substrate.

#pragma once

#include <semilog-cpp/codec.hpp>
#include <semilog-cpp/detailed.hpp>
#include <semilog-cpp/log.hpp>
#include <semilog-cpp/schema.hpp>
#include <semilog-cpp/substrate.hpp>
#include <semilog-cpp/types.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace semilog_cpp {

/// Replica settings, loadable from a JSON file with load_config().
struct ReplicaConfig {
    /// Root of a DirectorySubstrate. Empty selects an in-memory substrate.
    std::string directory{};

    /// Worker threads for the fold: 0 = hardware concurrency, 1 = sequential.
    unsigned int threads{0};

    /// Write the materialized view back after every full rebuild, and let
    /// cached_view() read it.
    bool use_cache{true};

    /// Encoded bodies above this size are DEFLATE-compressed.
    std::size_t compression_threshold{default_compression_threshold};

    /// Minimum level passed to the log sink by Replica::open().
    LogLevel log_level{LogLevel::info};

    auto operator==(const ReplicaConfig&) const -> bool = default;
};

/// Read a ReplicaConfig from a JSON file. Unknown keys are ignored and
/// missing keys keep their defaults.
/// @throws Exception with ErrorKind::invalid_config if the file is missing,
/// is not valid JSON, or holds a key of the wrong type.
auto load_config(const std::filesystem::path& path) -> ReplicaConfig;

/// Orchestrates one process's view of the replicated state.
///
/// A Replica holds no Root or Detailed of its own: every load reads the
/// substrate afresh and every materialization is rebuilt from a Root.
///
/// @code
/// auto replica = semilog_cpp::Replica::open(config);
/// auto slice = replica.load_slice(me);
/// auto session = semilog_cpp::ActorSession{slice, me, device};
/// session.new_thread("title", "body", {"news"});
/// replica.publish(me, slice);
/// auto view = replica.materialize();
/// @endcode
class Replica {
public:
    /// Construct over an existing substrate.
    /// @throws Exception with ErrorKind::invalid_operation if substrate is null.
    Replica(std::shared_ptr<Substrate> substrate, ReplicaConfig config = {});

    /// Open the substrate named by config (a directory, or memory when the
    /// directory is empty) and apply config.log_level.
    static auto open(const ReplicaConfig& config) -> Replica;

    /// Publish actor's slice. The stored slice becomes the join of what was
    /// stored and slice, so republishing or publishing a stale copy never
    /// loses data. Drops the materialized cache when caching is enabled.
    /// @throws Exception with ErrorKind::decoding_error if the stored slice
    /// is malformed, or ErrorKind::storage_error on I/O failure.
    void publish(const ActorId& actor, const Slice& slice);

    /// The published slice of actor. An actor that never published has the
    /// bottom slice.
    /// @throws Exception with ErrorKind::decoding_error if it is malformed.
    auto load_slice(const ActorId& actor) const -> Slice;

    /// Join every published slice. Decoding runs in parallel.
    /// @throws Exception with ErrorKind::decoding_error naming the first
    /// actor (in actor order) whose slice is malformed.
    auto load_root() const -> Root;

    /// Rebuild the view from load_root(), folding on the thread pool, and
    /// refresh the cache when enabled.
    auto materialize() -> Detailed;

    /// The cached view, rebuilding when the cache is disabled, absent or
    /// unreadable. Slices written to the substrate other than through
    /// publish() are not seen until the next materialize().
    auto cached_view() -> Detailed;

    auto config() const -> const ReplicaConfig& { return config_; }
    auto substrate() const -> const std::shared_ptr<Substrate>& { return substrate_; }

    /// The pool used by materialize(); null when folding sequentially.
    auto get_thread_pool() const -> std::shared_ptr<thread_pool> { return pool_; }

private:
    std::shared_ptr<Substrate> substrate_;
    ReplicaConfig config_;
    std::shared_ptr<thread_pool> pool_;
};

}  // namespace semilog_cpp
