#include <semilog-cpp/json.hpp>

#include <semilog-cpp/error.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace semilog_cpp {

namespace {

[[noreturn]] void config_error(const std::string& key, const char* expected) {
    throw Exception{ErrorKind::invalid_config,
                    "config key '" + key + "' must be " + expected};
}

}  // namespace

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const ActorId& id) {
    j = id.name;
}

void from_json(const nlohmann::json& j, ActorId& id) {
    id = ActorId{j.get<std::string>()};
}

void to_json(nlohmann::json& j, const MessageId& id) {
    j = nlohmann::json{{"actor", id.actor}, {"id", id.local}};
}

void from_json(const nlohmann::json& j, MessageId& id) {
    id = MessageId{j.at("actor").get<ActorId>(), j.at("id").get<LocalId>()};
}

// -- Schema -------------------------------------------------------------------

void to_json(nlohmann::json& j, const Owned& o) {
    j = nlohmann::json{{"titles", o.titles}, {"reply_to", o.reply_to}, {"content", o.content}};
}

void to_json(nlohmann::json& j, const Shared& s) {
    j = nlohmann::json{{"tags", s.tags}, {"reactions", s.reactions}};
}

void to_json(nlohmann::json& j, const Slice& s) {
    j = nlohmann::json{{"owned", s.owned}, {"shared", s.shared}};
}

void to_json(nlohmann::json& j, const Root& r) {
    j = r.inner;
}

// -- View ---------------------------------------------------------------------

void to_json(nlohmann::json& j, const Thread& t) {
    j = nlohmann::json{{"titles", t.titles}, {"tags", t.tags}, {"scores", t.tag_scores()}};
}

void to_json(nlohmann::json& j, const Comment& c) {
    j = nlohmann::json{
        {"reply_to", c.reply_to},
        {"content", c.content},
        {"reactions", c.reactions},
        {"backrefs", c.backrefs},
    };
}

void to_json(nlohmann::json& j, const Detailed& d) {
    j = nlohmann::json{{"threads", d.threads}, {"messages", d.messages}};
}

// -- Configuration ------------------------------------------------------------

void to_json(nlohmann::json& j, LogLevel level) {
    auto name = std::string{to_string_view(level)};
    for (auto& c : name) c = static_cast<char>(c - 'A' + 'a');
    j = name;
}

void from_json(const nlohmann::json& j, LogLevel& level) {
    if (!j.is_string()) config_error("log_level", "a string");
    auto parsed = parse_log_level(j.get<std::string>());
    if (!parsed) config_error("log_level", "one of debug, info, warn, error, off");
    level = *parsed;
}

void to_json(nlohmann::json& j, const ReplicaConfig& c) {
    j = nlohmann::json{
        {"directory", c.directory},
        {"threads", c.threads},
        {"use_cache", c.use_cache},
        {"compression_threshold", c.compression_threshold},
        {"log_level", c.log_level},
    };
}

void from_json(const nlohmann::json& j, ReplicaConfig& c) {
    if (!j.is_object()) {
        throw Exception{ErrorKind::invalid_config, "config must be a JSON object"};
    }

    if (auto it = j.find("directory"); it != j.end()) {
        if (!it->is_string()) config_error("directory", "a string");
        c.directory = it->get<std::string>();
    }
    if (auto it = j.find("threads"); it != j.end()) {
        if (!it->is_number_unsigned() ||
            it->get<std::uint64_t>() > std::numeric_limits<unsigned int>::max()) {
            config_error("threads", "a non-negative integer that fits in unsigned int");
        }
        c.threads = static_cast<unsigned int>(it->get<std::uint64_t>());
    }
    if (auto it = j.find("use_cache"); it != j.end()) {
        if (!it->is_boolean()) config_error("use_cache", "a boolean");
        c.use_cache = it->get<bool>();
    }
    if (auto it = j.find("compression_threshold"); it != j.end()) {
        if (!it->is_number_unsigned()) config_error("compression_threshold", "a non-negative integer");
        c.compression_threshold = it->get<std::size_t>();
    }
    if (auto it = j.find("log_level"); it != j.end()) {
        c.log_level = it->get<LogLevel>();
    }
}

}  // namespace semilog_cpp
