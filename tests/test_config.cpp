/**
 * Configuration: defaults, JSON overrides, environment overrides,
 * validation and redacted dumps.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include "credentials.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace voice_relay;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

bool has_problem(const std::vector<std::string>& problems, const std::string& needle) {
    for (const auto& p : problems) {
        if (p.find(needle) != std::string::npos) return true;
    }
    return false;
}

void clear_env() {
    unsetenv("AZURE_VOICE_LIVE_ENDPOINT");
    unsetenv("VOICE_LIVE_MODEL");
    unsetenv("AZURE_VOICE_LIVE_API_KEY");
    unsetenv("AZURE_USER_ASSIGNED_IDENTITY_CLIENT_ID");
    unsetenv("VOICE_RELAY_PORT");
    unsetenv("VOICE_RELAY_MAX_CONNECTIONS");
}

} // namespace

int main() {
    Logger::initialize(LogLevel::ERROR);
    clear_env();

    // --- Defaults ---
    {
        Config config = Config::load_from_string("{}");
        ASSERT(config.upstream.model == "gpt-4o-mini");
        ASSERT(config.upstream.api_version == "2025-05-01-preview");
        ASSERT(config.server.port == 8000);
        ASSERT(config.server.max_connections == 100);
        ASSERT(config.server.web_path == "/web/ws");
        ASSERT(config.server.telephony_path == "/acs/ws");
        ASSERT(config.tools.enabled.empty());
        ASSERT(!config.tools.reply_on_failure);
        ASSERT(config.session.turn_detection.silence_duration_ms == 200);

        auto problems = config.validate();
        ASSERT(has_problem(problems, "upstream.endpoint"));
        ASSERT(has_problem(problems, "api_key or upstream.client_id"));
    }

    // --- JSON overrides, missing keys keep defaults ---
    {
        Config config = Config::load_from_string(R"({
            "upstream": {"endpoint": "https://x.cognitiveservices.azure.com", "api_key": "k"},
            "server": {"port": 9100, "max_connections": 3},
            "session": {"voice": {"name": "en-US-Ava"}, "turn_detection": {"threshold": 0.5}},
            "tools": {"enabled": ["lookup_information"], "reply_on_failure": true},
            "logging": {"level": "debug"}
        })");
        ASSERT(config.upstream.endpoint == "https://x.cognitiveservices.azure.com");
        ASSERT(config.upstream.model == "gpt-4o-mini");
        ASSERT(config.server.port == 9100);
        ASSERT(config.server.max_connections == 3);
        ASSERT(config.session.voice.name == "en-US-Ava");
        ASSERT(config.session.voice.type == "azure-standard");
        ASSERT(config.session.turn_detection.threshold == 0.5);
        ASSERT(config.session.turn_detection.prefix_padding_ms == 200);
        ASSERT(config.tools.enabled.size() == 1);
        ASSERT(config.tools.reply_on_failure);
        ASSERT(parse_log_level(config.logging.level) == LogLevel::DEBUG);
        ASSERT(config.validate().empty());
    }

    // --- Validation ---
    {
        Config config;
        config.upstream.endpoint = "https://x";
        config.upstream.client_id = "identity";
        config.server.port = 70000;
        config.server.max_connections = 0;
        config.server.telephony_path = config.server.web_path;
        auto problems = config.validate();
        ASSERT(problems.size() == 3);
        ASSERT(has_problem(problems, "server.port"));
        ASSERT(has_problem(problems, "max_connections"));
        ASSERT(has_problem(problems, "must differ"));
    }

    // --- Environment overrides ---
    {
        const std::string path = "test_config_env.json";
        {
            std::ofstream out(path);
            out << R"({"upstream": {"endpoint": "https://from-file", "model": "file-model"}, "server": {"port": 8100}})";
        }
        setenv("AZURE_VOICE_LIVE_ENDPOINT", "https://from-env", 1);
        setenv("AZURE_VOICE_LIVE_API_KEY", "env-key", 1);
        setenv("VOICE_RELAY_PORT", "8200", 1);
        setenv("VOICE_RELAY_MAX_CONNECTIONS", "many", 1);

        Config config = Config::load_from_file(path);
        ASSERT(config.upstream.endpoint == "https://from-env");
        ASSERT(config.upstream.model == "file-model");
        ASSERT(config.upstream.api_key == "env-key");
        ASSERT(config.server.port == 8200);
        ASSERT(config.server.max_connections == 100);

        clear_env();
        std::remove(path.c_str());
    }

    // --- Unreadable and invalid files fall back to defaults ---
    {
        Config missing = Config::load_from_file("does/not/exist.json");
        ASSERT(missing.server.port == 8000);

        const std::string path = "test_config_bad.json";
        {
            std::ofstream out(path);
            out << "{ \"server\": { \"port\": ";
        }
        Config invalid = Config::load_from_file(path);
        ASSERT(invalid.server.port == 8000);
        std::remove(path.c_str());
    }

    // --- Dump never carries the API key ---
    {
        Config config;
        config.upstream.api_key = "super-secret-key";
        std::string dumped = config.to_json_string();
        ASSERT(dumped.find("super-secret-key") == std::string::npos);
        json parsed = json::parse(dumped);
        ASSERT(!parsed["upstream"].contains("api_key"));
        ASSERT(parsed["server"]["port"] == 8000);
    }

    // --- Log levels ---
    {
        ASSERT(parse_log_level("DEBUG") == LogLevel::DEBUG);
        ASSERT(parse_log_level(" warning ") == LogLevel::WARN);
        ASSERT(parse_log_level("error") == LogLevel::ERROR);
        ASSERT(parse_log_level("verbose") == LogLevel::INFO);
    }

    // --- Credential selection ---
    {
        UpstreamConfig upstream;
        upstream.api_key = "k";
        auto key = make_credential_provider(upstream);
        ASSERT(key->kind() == "api-key");
        auto headers = key->auth_headers();
        ASSERT(headers.is_ok());
        ASSERT(headers.value().size() == 1);
        ASSERT(headers.value()[0].first == "api-key");
        ASSERT(headers.value()[0].second == "k");

        UpstreamConfig none;
        auto empty = make_credential_provider(none);
        ASSERT(empty->auth_headers().is_error());
        ASSERT(empty->auth_headers().error().type == ErrorType::AuthError);

        ASSERT(ManagedIdentityCredential::scope_to_resource("https://cognitiveservices.azure.com/.default") ==
               "https://cognitiveservices.azure.com");
        ASSERT(ManagedIdentityCredential::scope_to_resource("https://example.com") == "https://example.com");
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
