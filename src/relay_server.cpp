#include "relay_server.h"
#include "logger.h"
#include "session_relay.h"
#include "url_utils.h"
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <csignal>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace voice_relay {

RelayServer::RelayServer(const Config& config,
                         ConnectionRegistry& registry,
                         std::shared_ptr<CredentialProvider> credentials,
                         UpstreamFactory upstream_factory)
    : config_(config),
      registry_(registry),
      credentials_(std::move(credentials)),
      upstream_factory_(std::move(upstream_factory)),
      acceptor_(ioc_),
      signals_(ioc_, SIGINT, SIGTERM) {
    if (!upstream_factory_) {
        upstream_factory_ = [] { return std::make_unique<WebSocketUpstream>(); };
    }
}

RelayServer::~RelayServer() {
    reap_workers(true);
}

std::optional<ConnectionType> RelayServer::route(const ServerConfig& config, const std::string& path) {
    if (path == config.web_path) {
        return ConnectionType::Web;
    }
    if (path == config.telephony_path) {
        return ConnectionType::Telephony;
    }
    return std::nullopt;
}

VoidResult RelayServer::start() {
    beast::error_code ec;
    auto address = net::ip::make_address(config_.server.bind_address, ec);
    if (ec) {
        return make_network_error("Invalid bind address " + config_.server.bind_address + ": " + ec.message());
    }
    tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        return make_network_error("Cannot listen on " + config_.server.bind_address + ":" +
                                  std::to_string(config_.server.port) + ": " + ec.message());
    }

    bound_port_ = acceptor_.local_endpoint().port();
    LOG_SERVER("Listening on " + config_.server.bind_address + ":" + std::to_string(bound_port_) +
               " (web: " + config_.server.web_path + ", telephony: " + config_.server.telephony_path + ")");
    return VoidResult();
}

void RelayServer::run() {
    signals_.async_wait([this](const beast::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_SERVER("Received signal " + std::to_string(signal_number) + ", shutting down...");
            do_stop();
        }
    });
    do_accept();
    ioc_.run();
    reap_workers(true);
    LOG_SERVER("Stopped");
}

void RelayServer::stop() {
    net::post(ioc_, [this] { do_stop(); });
}

void RelayServer::do_stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    beast::error_code ec;
    acceptor_.close(ec);
    signals_.cancel(ec);

    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (const auto& client : clients_) {
        client->close(websocket::close_code::going_away);
    }
}

void RelayServer::do_accept() {
    auto client = std::make_shared<AcceptedClient>();
    acceptor_.async_accept(client->socket, [this, client](const beast::error_code& ec) {
        if (ec) {
            if (!stopping_) {
                Logger::error("[Server] Accept failed: " + ec.message());
                do_accept();
            }
            return;
        }
        reap_workers(false);

        auto done = std::make_shared<std::atomic<bool>>(false);
        Worker worker;
        worker.done = done;
        worker.thread = std::thread([this, done, client] {
            try {
                handle_connection(*client);
            } catch (const std::exception& e) {
                Logger::error("[Server] Connection handler error: " + std::string(e.what()));
            }
            *done = true;
        });
        workers_.push_back(std::move(worker));

        if (!stopping_) {
            do_accept();
        }
    });
}

void RelayServer::reap_workers(bool wait_all) {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (wait_all || *it->done) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void RelayServer::track(const std::shared_ptr<WebSocketDownstream>& downstream) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.insert(downstream);
    if (stopping_) {
        downstream->close(websocket::close_code::going_away);
    }
}

void RelayServer::untrack(const std::shared_ptr<WebSocketDownstream>& downstream) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.erase(downstream);
}

void RelayServer::handle_connection(AcceptedClient& client) {
    beast::error_code ec;
    std::string peer = client.socket.remote_endpoint(ec).address().to_string();

    beast::tcp_stream stream(std::move(client.socket));
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::read(stream, buffer, req, ec);
    if (ec) {
        Logger::debug("[Server] Failed to read request from " + peer + ": " + ec.message());
        return;
    }

    std::string target(req.target());
    auto connection_type = route(config_.server, target_path(target));
    if (!connection_type || !websocket::is_upgrade(req)) {
        http::status status = connection_type ? http::status::bad_request : http::status::not_found;
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::content_type, "text/plain");
        res.keep_alive(false);
        res.body() = connection_type ? "WebSocket upgrade required" : "Not found";
        res.prepare_payload();
        http::write(stream, res, ec);
        LOG_SERVER("Rejected request for " + target + " from " + peer + " (" +
                   std::to_string(static_cast<int>(status)) + ")");
        return;
    }

    std::optional<std::string> caller_id = query_param(target, "callerId");

    WebSocketDownstream::Stream ws(std::move(stream));
    ws.accept(req, ec);
    if (ec) {
        Logger::warn("[Server] WebSocket handshake with " + peer + " failed: " + ec.message());
        return;
    }
    LOG_SERVER(std::string(connection_type_name(*connection_type)) + " client connected from " + peer);

    auto downstream = std::make_shared<WebSocketDownstream>(ws, client.ioc);

    {
        SessionRelay session(config_, registry_, upstream_factory_(), credentials_);

        // Until run() starts this thread is the only one touching ws
        auto attached = session.attach_downstream(downstream, *connection_type, caller_id);
        if (!attached) {
            ws.close(websocket::close_reason(websocket::close_code::try_again_later,
                                             attached.error().message), ec);
            return;
        }

        track(downstream);
        session.set_on_upstream_closed([downstream] { downstream->close(); });

        auto connected = session.connect();
        if (!connected) {
            untrack(downstream);
            ws.close(websocket::close_reason(websocket::close_code::internal_error,
                                             "Upstream connection failed"), ec);
            return;
        }

        const ConnectionType type = *connection_type;
        ec = downstream->run([&session, type](std::string payload, bool binary) {
            if (type == ConnectionType::Web) {
                if (binary) {
                    session.push_web_audio(std::vector<uint8_t>(payload.begin(), payload.end()));
                } else {
                    Logger::debug("[connection_id=" + session.connection_id() + "] Ignoring text frame from web client");
                }
            } else {
                session.push_telephony_message(payload);
            }
        });

        if (ec == websocket::error::closed) {
            LOG_RELAY(session.connection_id(), "Client connection closed");
        } else {
            LOG_RELAY(session.connection_id(), "Client connection ended: " + ec.message());
        }

        session.cleanup();
    }

    untrack(downstream);
}

} // namespace voice_relay
