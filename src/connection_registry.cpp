#include "connection_registry.h"
#include "logger.h"
#include <iomanip>
#include <sstream>

namespace voice_relay {

const char* connection_type_name(ConnectionType type) {
    switch (type) {
        case ConnectionType::Web:       return "web";
        case ConnectionType::Telephony: return "telephony";
        default:                        return "unknown";
    }
}

ConnectionRegistry::ConnectionRegistry(int max_connections)
    : max_connections_(max_connections > 0 ? max_connections : DEFAULT_MAX_CONNECTIONS) {
}

bool ConnectionRegistry::register_connection(const std::string& connection_id,
                                             const std::optional<std::string>& caller_id,
                                             ConnectionType connection_type) {
    std::lock_guard<std::mutex> lock(mutex_);

    int active = static_cast<int>(connections_.size());
    if (active >= max_connections_) {
        Logger::warn("[Registry] Connection limit reached (" + std::to_string(active) + "/" +
                     std::to_string(max_connections_) + "). Rejecting connection " + connection_id);
        return false;
    }

    RegistryEntry entry;
    entry.caller_id = caller_id;
    entry.connection_type = connection_type;
    entry.connected_at = std::chrono::system_clock::now();
    entry.status = "connected";
    connections_[connection_id] = entry;

    LOG_REGISTRY("Connection registered: " + connection_id +
                 " (type=" + connection_type_name(connection_type) +
                 ", caller=" + caller_id.value_or("unknown") + "). Active connections: " +
                 std::to_string(connections_.size()) + "/" + std::to_string(max_connections_));
    return true;
}

void ConnectionRegistry::unregister_connection(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        Logger::warn("[Registry] Attempted to unregister unknown connection: " + connection_id);
        return;
    }

    auto duration = std::chrono::duration<double>(
        std::chrono::system_clock::now() - it->second.connected_at).count();
    connections_.erase(it);

    std::ostringstream oss;
    oss << "Connection unregistered: " << connection_id
        << " (duration=" << std::fixed << std::setprecision(2) << duration << "s)."
        << " Active connections: " << connections_.size() << "/" << max_connections_;
    LOG_REGISTRY(oss.str());
}

int ConnectionRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(connections_.size());
}

std::optional<RegistryEntry> ConnectionRegistry::get(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, RegistryEntry> ConnectionRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_;
}

int ConnectionRegistry::max_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_connections_;
}

void ConnectionRegistry::set_max_connections(int max_connections) {
    if (max_connections <= 0) {
        Logger::warn("[Registry] Ignoring non-positive max_connections: " + std::to_string(max_connections));
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    max_connections_ = max_connections;
    LOG_REGISTRY("Max connections set to " + std::to_string(max_connections));
}

} // namespace voice_relay
