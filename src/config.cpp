#include "config.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace voice_relay {

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

template<typename T>
std::vector<T> get_array_or_default(const json& j, const std::string& key,
                                    const std::vector<T>& default_val) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<T>>();
    }
    return default_val;
}

void parse_upstream(const json& j, UpstreamConfig& config) {
    if (!j.contains("upstream")) return;
    const auto& up = j["upstream"];
    config.endpoint = get_or_default(up, "endpoint", config.endpoint);
    config.model = get_or_default(up, "model", config.model);
    config.api_key = get_or_default(up, "api_key", config.api_key);
    config.client_id = get_or_default(up, "client_id", config.client_id);
    config.api_version = get_or_default(up, "api_version", config.api_version);
    config.token_scope = get_or_default(up, "token_scope", config.token_scope);
    config.imds_endpoint = get_or_default(up, "imds_endpoint", config.imds_endpoint);
}

void parse_session(const json& j, SessionConfig& config) {
    if (!j.contains("session")) return;
    const auto& s = j["session"];
    config.instructions = get_or_default(s, "instructions", config.instructions);
    config.noise_reduction = get_or_default(s, "noise_reduction", config.noise_reduction);
    config.echo_cancellation = get_or_default(s, "echo_cancellation", config.echo_cancellation);

    if (s.contains("turn_detection")) {
        const auto& td = s["turn_detection"];
        auto& out = config.turn_detection;
        out.type = get_or_default(td, "type", out.type);
        out.threshold = get_or_default(td, "threshold", out.threshold);
        out.prefix_padding_ms = get_or_default(td, "prefix_padding_ms", out.prefix_padding_ms);
        out.silence_duration_ms = get_or_default(td, "silence_duration_ms", out.silence_duration_ms);
        out.remove_filler_words = get_or_default(td, "remove_filler_words", out.remove_filler_words);
        if (td.contains("end_of_utterance_detection")) {
            const auto& eou = td["end_of_utterance_detection"];
            out.end_of_utterance.model = get_or_default(eou, "model", out.end_of_utterance.model);
            out.end_of_utterance.threshold = get_or_default(eou, "threshold", out.end_of_utterance.threshold);
            out.end_of_utterance.timeout = get_or_default(eou, "timeout", out.end_of_utterance.timeout);
        }
    }

    if (s.contains("voice")) {
        const auto& v = s["voice"];
        config.voice.name = get_or_default(v, "name", config.voice.name);
        config.voice.type = get_or_default(v, "type", config.voice.type);
        config.voice.temperature = get_or_default(v, "temperature", config.voice.temperature);
    }
}

void parse_server(const json& j, ServerConfig& config) {
    if (!j.contains("server")) return;
    const auto& s = j["server"];
    config.bind_address = get_or_default(s, "bind_address", config.bind_address);
    config.port = get_or_default(s, "port", config.port);
    config.web_path = get_or_default(s, "web_path", config.web_path);
    config.telephony_path = get_or_default(s, "telephony_path", config.telephony_path);
    config.max_connections = get_or_default(s, "max_connections", config.max_connections);
}

void parse_tools(const json& j, ToolsConfig& config) {
    if (!j.contains("tools")) return;
    const auto& t = j["tools"];
    config.enabled = get_array_or_default<std::string>(t, "enabled", config.enabled);
    config.reply_on_failure = get_or_default(t, "reply_on_failure", config.reply_on_failure);
}

void parse_logging(const json& j, LoggingConfig& config) {
    if (!j.contains("logging")) return;
    const auto& l = j["logging"];
    config.level = get_or_default(l, "level", config.level);
    config.file = get_or_default(l, "file", config.file);
}

bool env_string(const char* name, std::string& out) {
    const char* value = std::getenv(name);
    if (!value || !*value) return false;
    out = value;
    return true;
}

bool env_int(const char* name, int& out) {
    const char* value = std::getenv(name);
    if (!value || !*value) return false;
    try {
        out = std::stoi(value);
        return true;
    } catch (const std::exception& e) {
        Logger::warn(std::string("Ignoring ") + name + "=\"" + value + "\": " + e.what());
        return false;
    }
}

} // namespace

Config Config::load_from_string(const std::string& json_text) {
    Config cfg;
    json j = json::parse(json_text);
    parse_upstream(j, cfg.upstream);
    parse_session(j, cfg.session);
    parse_server(j, cfg.server);
    parse_tools(j, cfg.tools);
    parse_logging(j, cfg.logging);
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ", using defaults");
    } else {
        std::stringstream buffer;
        buffer << file.rdbuf();
        try {
            cfg = load_from_string(buffer.str());
            Logger::info("Loaded configuration from " + path);
        } catch (const json::exception& e) {
            Logger::warn("Failed to parse config file " + path + ": " + e.what() + ", using defaults");
            cfg = Config();
        }
    }

    cfg.apply_env_overrides();
    return cfg;
}

void Config::apply_env_overrides() {
    env_string("AZURE_VOICE_LIVE_ENDPOINT", upstream.endpoint);
    env_string("VOICE_LIVE_MODEL", upstream.model);
    env_string("AZURE_VOICE_LIVE_API_KEY", upstream.api_key);
    env_string("AZURE_USER_ASSIGNED_IDENTITY_CLIENT_ID", upstream.client_id);
    env_int("VOICE_RELAY_PORT", server.port);
    env_int("VOICE_RELAY_MAX_CONNECTIONS", server.max_connections);
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;
    if (upstream.endpoint.empty()) {
        problems.push_back("upstream.endpoint is not set (AZURE_VOICE_LIVE_ENDPOINT)");
    }
    if (upstream.model.empty()) {
        problems.push_back("upstream.model is not set (VOICE_LIVE_MODEL)");
    }
    if (upstream.api_key.empty() && upstream.client_id.empty()) {
        problems.push_back("either upstream.api_key or upstream.client_id must be set");
    }
    if (server.port <= 0 || server.port > 65535) {
        problems.push_back("server.port must be in 1..65535, got " + std::to_string(server.port));
    }
    if (server.max_connections <= 0) {
        problems.push_back("server.max_connections must be positive");
    }
    if (server.web_path == server.telephony_path) {
        problems.push_back("server.web_path and server.telephony_path must differ");
    }
    return problems;
}

std::string Config::to_json_string() const {
    // Never includes api_key
    json j;
    j["upstream"] = {
        {"endpoint", upstream.endpoint},
        {"model", upstream.model},
        {"client_id", upstream.client_id},
        {"api_version", upstream.api_version},
        {"token_scope", upstream.token_scope},
        {"imds_endpoint", upstream.imds_endpoint}
    };
    j["session"] = {
        {"instructions", session.instructions},
        {"noise_reduction", session.noise_reduction},
        {"echo_cancellation", session.echo_cancellation},
        {"turn_detection", {
            {"type", session.turn_detection.type},
            {"threshold", session.turn_detection.threshold},
            {"prefix_padding_ms", session.turn_detection.prefix_padding_ms},
            {"silence_duration_ms", session.turn_detection.silence_duration_ms},
            {"remove_filler_words", session.turn_detection.remove_filler_words},
            {"end_of_utterance_detection", {
                {"model", session.turn_detection.end_of_utterance.model},
                {"threshold", session.turn_detection.end_of_utterance.threshold},
                {"timeout", session.turn_detection.end_of_utterance.timeout}
            }}
        }},
        {"voice", {
            {"name", session.voice.name},
            {"type", session.voice.type},
            {"temperature", session.voice.temperature}
        }}
    };
    j["server"] = {
        {"bind_address", server.bind_address},
        {"port", server.port},
        {"web_path", server.web_path},
        {"telephony_path", server.telephony_path},
        {"max_connections", server.max_connections}
    };
    j["tools"] = {
        {"enabled", tools.enabled},
        {"reply_on_failure", tools.reply_on_failure}
    };
    j["logging"] = {
        {"level", logging.level},
        {"file", logging.file}
    };
    return j.dump(2);
}

} // namespace voice_relay
