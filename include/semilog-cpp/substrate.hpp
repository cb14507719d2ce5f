/// @file substrate.hpp
/// @brief The replication boundary: where encoded slices and the
/// materialized cache are stored.
///
/// A Substrate keeps at most one blob per actor (last write wins) plus one
/// cache blob. It never interprets the bytes. Readers may observe any
/// consistent, possibly stale, snapshot.

#pragma once

#include <semilog-cpp/types.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace semilog_cpp {

/// Raw bytes as stored by a Substrate.
using Blob = std::vector<std::byte>;

/// Abstract storage and replication boundary.
///
/// Implementations report I/O failures by throwing Exception with
/// ErrorKind::storage_error.
class Substrate {
public:
    virtual ~Substrate() = default;

    /// Store the encoded slice of actor, replacing any previous blob.
    virtual void write(const ActorId& actor, const Blob& encoded_slice) = 0;

    /// The blob last written for actor, or nullopt if none.
    virtual auto read(const ActorId& actor) const -> std::optional<Blob> = 0;

    /// Every stored (actor, blob) pair, ordered by actor.
    virtual auto read_all() const -> std::vector<std::pair<ActorId, Blob>> = 0;

    /// Replace the materialized-view cache.
    virtual void write_cache(const Blob& encoded_view) = 0;

    /// The cache blob, or nullopt if none was written.
    virtual auto read_cache() const -> std::optional<Blob> = 0;

    /// Drop the cache. A no-op when there is none.
    virtual void clear_cache() = 0;
};

/// In-process substrate guarded by a reader/writer lock.
class MemorySubstrate : public Substrate {
public:
    void write(const ActorId& actor, const Blob& encoded_slice) override;
    auto read(const ActorId& actor) const -> std::optional<Blob> override;
    auto read_all() const -> std::vector<std::pair<ActorId, Blob>> override;
    void write_cache(const Blob& encoded_view) override;
    auto read_cache() const -> std::optional<Blob> override;
    void clear_cache() override;

private:
    mutable std::shared_mutex mutex_;
    std::map<ActorId, Blob> slices_;
    std::optional<Blob> cache_;
};

/// Substrate backed by a directory:
///
///     <root>/threads/<hex(actor)>     one file per actor
///     <root>/threads-materialized     the cache
///
/// Files are replaced atomically by writing a temporary file and renaming
/// it over the old one.
class DirectorySubstrate : public Substrate {
public:
    /// Open (and create if missing) a substrate rooted at root.
    /// @throws Exception with ErrorKind::storage_error if the directory
    /// cannot be created.
    explicit DirectorySubstrate(std::filesystem::path root);

    void write(const ActorId& actor, const Blob& encoded_slice) override;
    auto read(const ActorId& actor) const -> std::optional<Blob> override;
    auto read_all() const -> std::vector<std::pair<ActorId, Blob>> override;
    void write_cache(const Blob& encoded_view) override;
    auto read_cache() const -> std::optional<Blob> override;
    void clear_cache() override;

    /// The directory holding one file per actor.
    auto threads_dir() const -> const std::filesystem::path& { return threads_dir_; }

    /// The cache file.
    auto cache_path() const -> const std::filesystem::path& { return cache_path_; }

private:
    auto actor_path(const ActorId& actor) const -> std::filesystem::path;

    std::filesystem::path root_;
    std::filesystem::path threads_dir_;
    std::filesystem::path cache_path_;
    std::mutex write_mutex_;
};

/// Hex-encode an actor name for use as a file name.
auto actor_to_filename(const ActorId& actor) -> std::string;

/// Invert actor_to_filename. Returns nullopt for anything that is not
/// lower-case hex of even length.
auto actor_from_filename(std::string_view filename) -> std::optional<ActorId>;

}  // namespace semilog_cpp
