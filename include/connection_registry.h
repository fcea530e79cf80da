#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace voice_relay {

/**
 * @brief Client flavour of a session; selects the downstream audio encoding
 */
enum class ConnectionType {
    Web,        ///< Browser client, raw PCM binary frames
    Telephony   ///< Telephony media stream, base64 audio in JSON envelopes
};

const char* connection_type_name(ConnectionType type);

/**
 * @brief Registry view of one active session
 */
struct RegistryEntry {
    std::optional<std::string> caller_id;
    ConnectionType connection_type = ConnectionType::Web;
    std::chrono::system_clock::time_point connected_at;
    std::string status = "connected";
};

/**
 * @brief Bounded admission control and bookkeeping for active sessions
 *
 * One instance is owned by the process entry point and shared by reference
 * with every session. Every operation runs under a single mutex, so a
 * registration either sees the full effect of a concurrent removal or none
 * of it. No I/O besides logging is performed while the lock is held.
 */
class ConnectionRegistry {
public:
    static constexpr int DEFAULT_MAX_CONNECTIONS = 100;

    explicit ConnectionRegistry(int max_connections = DEFAULT_MAX_CONNECTIONS);

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * @brief Admit a session if capacity remains
     * @param connection_id Unique session key
     * @param caller_id Optional caller identifier (informational)
     * @param connection_type Web or telephony
     * @return true if registered, false if the limit is reached (registry unchanged)
     */
    bool register_connection(const std::string& connection_id,
                             const std::optional<std::string>& caller_id,
                             ConnectionType connection_type);

    /**
     * @brief Remove a session; unknown ids are logged and ignored
     */
    void unregister_connection(const std::string& connection_id);

    int active_count() const;

    /// Copy of the entry for connection_id, if registered
    std::optional<RegistryEntry> get(const std::string& connection_id) const;

    /// Point-in-time copy of all entries
    std::map<std::string, RegistryEntry> all() const;

    int max_connections() const;

    /**
     * @brief Change the limit for subsequent registrations
     *
     * Non-positive values are ignored. Lowering the limit below the current
     * count does not evict anyone; new registrations are refused until the
     * count drops under the limit.
     */
    void set_max_connections(int max_connections);

private:
    mutable std::mutex mutex_;
    std::map<std::string, RegistryEntry> connections_;
    int max_connections_;
};

} // namespace voice_relay
