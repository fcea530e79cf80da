#include "config.h"
#include "connection_registry.h"
#include "credentials.h"
#include "logger.h"
#include "relay_server.h"
#include <fstream>
#include <string>
#include <unistd.h>

int main(int argc, char* argv[]) {
    // Console logging until the configured level/file is known
    voice_relay::Logger::initialize(voice_relay::LogLevel::INFO);

    std::string config_path = "config/config.json";
    if (argc > 1) {
        config_path = argv[1];
    } else {
        // Try config directory relative to executable (e.g. build/../config)
        char buf[1024];
        ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
        if (len != -1) {
            buf[len] = '\0';
            std::string exe_dir(buf);
            size_t pos = exe_dir.find_last_of('/');
            if (pos != std::string::npos) {
                std::string candidate = exe_dir.substr(0, pos) + "/../config/config.json";
                std::ifstream test(candidate);
                if (test.good()) {
                    config_path = candidate;
                }
            }
        }
    }

    voice_relay::Config config = voice_relay::Config::load_from_file(config_path);

    voice_relay::Logger::shutdown();
    voice_relay::Logger::initialize(voice_relay::parse_log_level(config.logging.level), config.logging.file);

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            voice_relay::Logger::error("Config: " + problem);
        }
        voice_relay::Logger::shutdown();
        return 1;
    }
    voice_relay::Logger::debug("Effective config: " + config.to_json_string());

    voice_relay::ConnectionRegistry registry(config.server.max_connections);
    voice_relay::RelayServer server(config, registry,
                                    voice_relay::make_credential_provider(config.upstream));

    auto started = server.start();
    if (!started) {
        voice_relay::Logger::error(started.error().describe());
        voice_relay::Logger::shutdown();
        return 1;
    }

    // Returns on SIGINT/SIGTERM once every session has been torn down
    server.run();

    voice_relay::Logger::shutdown();
    return 0;
}
