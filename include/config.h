#pragma once

#include <string>
#include <vector>

namespace voice_relay {

/// Voice Live service endpoint and credentials
struct UpstreamConfig {
    std::string endpoint;                ///< e.g. https://my-resource.cognitiveservices.azure.com
    std::string model = "gpt-4o-mini";
    std::string api_key;                 ///< Used when client_id is empty
    std::string client_id;               ///< User-assigned managed identity; takes precedence over api_key
    std::string api_version = "2025-05-01-preview";
    std::string token_scope = "https://cognitiveservices.azure.com/.default";
    std::string imds_endpoint = "http://169.254.169.254/metadata/identity/oauth2/token";
};

struct EndOfUtteranceConfig {
    std::string model = "semantic_detection_v1";
    double threshold = 0.01;
    int timeout = 2;
};

struct TurnDetectionConfig {
    std::string type = "azure_semantic_vad";
    double threshold = 0.3;
    int prefix_padding_ms = 200;
    int silence_duration_ms = 200;
    bool remove_filler_words = false;
    EndOfUtteranceConfig end_of_utterance;
};

struct VoiceConfig {
    std::string name = "en-US-Aria:DragonHDLatestNeural";
    std::string type = "azure-standard";
    double temperature = 0.8;
};

/// Values sent in the initial session.update
struct SessionConfig {
    /// Opening of the instructions; the tool list and usage hints are appended
    std::string instructions = "You are a helpful AI assistant for a customer service call center.";
    TurnDetectionConfig turn_detection;
    std::string noise_reduction = "azure_deep_noise_suppression";
    std::string echo_cancellation = "server_echo_cancellation";
    VoiceConfig voice;
};

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    int port = 8000;
    std::string web_path = "/web/ws";         ///< Browser clients, raw PCM frames
    std::string telephony_path = "/acs/ws";   ///< Telephony media stream, JSON frames
    int max_connections = 100;
};

struct ToolsConfig {
    std::vector<std::string> enabled;  ///< Tool names to register; empty = all reference tools
    /// When true, a tool that throws still gets a failure function output and a response.create
    bool reply_on_failure = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;  ///< Empty = console only
};

struct Config {
    UpstreamConfig upstream;
    SessionConfig session;
    ServerConfig server;
    ToolsConfig tools;
    LoggingConfig logging;

    /**
     * @brief Load configuration from a JSON file, then apply environment overrides
     *
     * Missing keys keep their defaults. An unreadable or invalid file logs a
     * warning and yields the defaults (plus environment overrides).
     */
    static Config load_from_file(const std::string& path);

    /// Parse configuration from JSON text (no environment overrides)
    static Config load_from_string(const std::string& json_text);

    /// Override upstream/server values from AZURE_VOICE_LIVE_* and VOICE_RELAY_* variables
    void apply_env_overrides();

    /// @return Human-readable problems; empty when the config is usable
    std::vector<std::string> validate() const;

    std::string to_json_string() const;
};

} // namespace voice_relay
