#pragma once

#include "config.h"
#include "connection_registry.h"
#include "credentials.h"
#include "downstream_transport.h"
#include "errors.h"
#include "upstream_transport.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace voice_relay {

/**
 * @brief WebSocket front end: accepts clients and runs one SessionRelay each
 *
 * Paths are mapped to connection types from ServerConfig (web_path,
 * telephony_path); anything else is answered with 404. The optional callerId
 * query parameter becomes the session's caller id. Each accepted client runs
 * on its own thread until either side closes.
 */
class RelayServer {
public:
    using UpstreamFactory = std::function<std::unique_ptr<UpstreamTransport>()>;

    /**
     * @param config Process configuration
     * @param registry Shared admission controller
     * @param credentials Upstream auth source shared by all sessions
     * @param upstream_factory Creates one upstream transport per session
     *        (nullptr = WebSocketUpstream)
     */
    RelayServer(const Config& config,
                ConnectionRegistry& registry,
                std::shared_ptr<CredentialProvider> credentials,
                UpstreamFactory upstream_factory = nullptr);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /// Bind and listen on server.bind_address:server.port
    VoidResult start();

    /**
     * @brief Accept clients until stop() or SIGINT/SIGTERM
     *
     * Joins every connection thread before returning.
     */
    void run();

    /// Stop accepting and shut down open client connections; callable from any thread
    void stop();

    /// Port actually bound (useful when configured as 0)
    unsigned short port() const { return bound_port_; }

    /// Connection type served at a request path, if any
    static std::optional<ConnectionType> route(const ServerConfig& config, const std::string& path);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    /// Socket of one client, on the io_context its connection thread runs
    struct AcceptedClient {
        boost::asio::io_context ioc{1};
        boost::asio::ip::tcp::socket socket{ioc};
    };

    void do_accept();
    void do_stop();
    void reap_workers(bool wait_all);
    void handle_connection(AcceptedClient& client);

    void track(const std::shared_ptr<WebSocketDownstream>& downstream);
    void untrack(const std::shared_ptr<WebSocketDownstream>& downstream);

    Config config_;
    ConnectionRegistry& registry_;
    std::shared_ptr<CredentialProvider> credentials_;
    UpstreamFactory upstream_factory_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
    unsigned short bound_port_ = 0;
    std::atomic<bool> stopping_{false};

    std::list<Worker> workers_;  // Touched only by the accept handler and run()

    std::mutex clients_mutex_;
    std::set<std::shared_ptr<WebSocketDownstream>> clients_;
};

} // namespace voice_relay
