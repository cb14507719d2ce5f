#include <semilog-cpp/substrate.hpp>

#include <semilog-cpp/error.hpp>
#include <semilog-cpp/log.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace semilog_cpp {

namespace fs = std::filesystem;

// -- Filenames ----------------------------------------------------------------

auto actor_to_filename(const ActorId& actor) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(actor.name.size() * 2);
    for (auto c : actor.name) {
        const auto byte = static_cast<unsigned char>(c);
        result.push_back(digits[byte >> 4]);
        result.push_back(digits[byte & 0x0F]);
    }
    return result;
}

auto actor_from_filename(std::string_view filename) -> std::optional<ActorId> {
    if (filename.empty() || filename.size() % 2 != 0) return std::nullopt;

    const auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };

    auto name = std::string{};
    name.reserve(filename.size() / 2);
    for (std::size_t i = 0; i < filename.size(); i += 2) {
        const auto hi = nibble(filename[i]);
        const auto lo = nibble(filename[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        name.push_back(static_cast<char>((hi << 4) | lo));
    }
    return ActorId{std::move(name)};
}

// -- MemorySubstrate ----------------------------------------------------------

void MemorySubstrate::write(const ActorId& actor, const Blob& encoded_slice) {
    auto lock = std::unique_lock{mutex_};
    slices_.insert_or_assign(actor, encoded_slice);
}

auto MemorySubstrate::read(const ActorId& actor) const -> std::optional<Blob> {
    auto lock = std::shared_lock{mutex_};
    auto it = slices_.find(actor);
    if (it == slices_.end()) return std::nullopt;
    return it->second;
}

auto MemorySubstrate::read_all() const -> std::vector<std::pair<ActorId, Blob>> {
    auto lock = std::shared_lock{mutex_};
    return std::vector<std::pair<ActorId, Blob>>(slices_.begin(), slices_.end());
}

void MemorySubstrate::write_cache(const Blob& encoded_view) {
    auto lock = std::unique_lock{mutex_};
    cache_ = encoded_view;
}

auto MemorySubstrate::read_cache() const -> std::optional<Blob> {
    auto lock = std::shared_lock{mutex_};
    return cache_;
}

void MemorySubstrate::clear_cache() {
    auto lock = std::unique_lock{mutex_};
    cache_.reset();
}

// -- DirectorySubstrate -------------------------------------------------------

namespace {

auto read_file(const fs::path& path) -> std::optional<Blob> {
    auto ec = std::error_code{};
    if (!fs::exists(path, ec)) {
        if (ec) throw Exception{ErrorKind::storage_error, "cannot stat " + path.string() + ": " + ec.message()};
        return std::nullopt;
    }

    auto in = std::ifstream{path, std::ios::binary};
    if (!in) throw Exception{ErrorKind::storage_error, "cannot open " + path.string()};

    auto chars = std::vector<char>{std::istreambuf_iterator<char>{in},
                                   std::istreambuf_iterator<char>{}};
    if (in.bad()) throw Exception{ErrorKind::storage_error, "cannot read " + path.string()};

    auto bytes = Blob(chars.size());
    for (std::size_t i = 0; i < chars.size(); ++i) {
        bytes[i] = static_cast<std::byte>(chars[i]);
    }
    return bytes;
}

void replace_file(const fs::path& path, const Blob& bytes) {
    auto tmp = path;
    tmp += ".tmp";
    {
        auto out = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
        if (!out) throw Exception{ErrorKind::storage_error, "cannot create " + tmp.string()};
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) throw Exception{ErrorKind::storage_error, "cannot write " + tmp.string()};
    }

    auto ec = std::error_code{};
    fs::rename(tmp, path, ec);
    if (ec) {
        throw Exception{ErrorKind::storage_error,
                        "cannot replace " + path.string() + ": " + ec.message()};
    }
}

}  // namespace

DirectorySubstrate::DirectorySubstrate(fs::path root)
    : root_{std::move(root)},
      threads_dir_{root_ / "threads"},
      cache_path_{root_ / "threads-materialized"} {
    auto ec = std::error_code{};
    fs::create_directories(threads_dir_, ec);
    if (ec) {
        throw Exception{ErrorKind::storage_error,
                        "cannot create " + threads_dir_.string() + ": " + ec.message()};
    }
}

auto DirectorySubstrate::actor_path(const ActorId& actor) const -> fs::path {
    if (actor.empty()) {
        throw Exception{ErrorKind::invalid_operation, "empty actor id has no slice file"};
    }
    return threads_dir_ / actor_to_filename(actor);
}

void DirectorySubstrate::write(const ActorId& actor, const Blob& encoded_slice) {
    const auto path = actor_path(actor);
    auto lock = std::lock_guard{write_mutex_};
    try {
        replace_file(path, encoded_slice);
    } catch (const Exception& e) {
        throw Exception{ErrorKind::storage_error,
                        "publishing actor '" + actor.name + "': " + e.error().message};
    }
}

auto DirectorySubstrate::read(const ActorId& actor) const -> std::optional<Blob> {
    return read_file(actor_path(actor));
}

auto DirectorySubstrate::read_all() const -> std::vector<std::pair<ActorId, Blob>> {
    auto result = std::vector<std::pair<ActorId, Blob>>{};
    auto ec = std::error_code{};
    auto it = fs::directory_iterator{threads_dir_, ec};
    if (ec) {
        throw Exception{ErrorKind::storage_error,
                        "cannot list " + threads_dir_.string() + ": " + ec.message()};
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file()) continue;
        const auto filename = entry.path().filename().string();
        auto actor = actor_from_filename(filename);
        if (!actor) {
            if (entry.path().extension() != ".tmp") {
                log_warn("ignoring stray file " + entry.path().string());
            }
            continue;
        }
        // A file can vanish between listing and reading; treat it as unpublished.
        if (auto bytes = read_file(entry.path())) {
            result.emplace_back(std::move(*actor), std::move(*bytes));
        }
    }

    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return result;
}

void DirectorySubstrate::write_cache(const Blob& encoded_view) {
    auto lock = std::lock_guard{write_mutex_};
    replace_file(cache_path_, encoded_view);
}

auto DirectorySubstrate::read_cache() const -> std::optional<Blob> {
    return read_file(cache_path_);
}

void DirectorySubstrate::clear_cache() {
    auto lock = std::lock_guard{write_mutex_};
    auto ec = std::error_code{};
    fs::remove(cache_path_, ec);
    if (ec) {
        throw Exception{ErrorKind::storage_error,
                        "cannot remove " + cache_path_.string() + ": " + ec.message()};
    }
}

}  // namespace semilog_cpp
