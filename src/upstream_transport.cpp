#include "upstream_transport.h"
#include "logger.h"
#include "url_utils.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace voice_relay {

class WebSocketUpstream::Impl {
public:
    using Stream = websocket::stream<beast::ssl_stream<tcp::socket>>;

    explicit Impl(const std::string& extra_ca_pem) : ssl_ctx_(ssl::context::tlsv12_client) {
        ssl_ctx_.set_default_verify_paths();
        if (!extra_ca_pem.empty()) {
            beast::error_code ec;
            ssl_ctx_.add_certificate_authority(net::buffer(extra_ca_pem), ec);
            if (ec) {
                Logger::error("Ignoring extra CA certificates: " + ec.message());
            }
        }
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }

    ~Impl() {
        close();
    }

    VoidResult connect(const std::string& url, const HttpHeaders& headers) {
        auto parsed = parse_ws_url(url);
        if (!parsed) {
            return parsed.error();
        }
        const WsUrl& target = parsed.value();
        if (!target.secure) {
            return make_network_error("Upstream requires wss://, got " + url);
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (closed_ || io_thread_.joinable()) {
                return make_error(ErrorType::InvalidState, "Upstream already connected or closed");
            }
        }

        // The handshake runs synchronously on the caller's thread; the I/O
        // thread does not exist yet, so the stream still has a single user.
        try {
            tcp::resolver resolver{ioc_};
            auto const results = resolver.resolve(target.host, target.port);

            ws_ = std::make_unique<Stream>(ioc_, ssl_ctx_);
            net::connect(beast::get_lowest_layer(*ws_), results);

            if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), target.host.c_str())) {
                throw beast::system_error(
                    beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "SSL_set_tlsext_host_name");
            }
            ws_->next_layer().set_verify_callback(ssl::host_name_verification(target.host));
            ws_->next_layer().handshake(ssl::stream_base::client);

            ws_->set_option(websocket::stream_base::decorator(
                [headers](websocket::request_type& req) {
                    req.set(http::field::user_agent, "voice-relay/1.0");
                    for (const auto& header : headers) {
                        req.set(header.first, header.second);
                    }
                }));

            std::string host = target.port == "443" ? target.host : target.host + ":" + target.port;
            ws_->handshake(host, target.target);
            ws_->text(true);
        } catch (const beast::system_error& e) {
            return make_network_error("Upstream connect to " + target.host + " failed: " + e.code().message());
        } catch (const std::exception& e) {
            return make_network_error("Upstream connect to " + target.host + " failed: " + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (closed_) {
                return make_closed_error("Upstream closed while connecting");
            }
            open_ = true;
            work_.emplace(net::make_work_guard(ioc_));
            net::post(ioc_, [this] { do_read(); });
            io_thread_ = std::thread([this] { run_io(); });
        }

        LOG_UPSTREAM("Connected to " + target.host);
        return VoidResult();
    }

    VoidResult send_text(const std::string& message) {
        auto pending = std::make_shared<PendingWrite>();
        pending->message = message;
        std::future<beast::error_code> written = pending->done.get_future();
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (closed_ || !io_thread_.joinable()) {
                return make_closed_error("Upstream not open");
            }
            net::post(ioc_, [this, pending] {
                writes_.push_back(pending);
                if (writes_.size() == 1) {
                    do_write();
                }
            });
        }

        beast::error_code ec;
        try {
            ec = written.get();
        } catch (const std::future_error&) {
            return make_closed_error("Upstream closed before the write ran");
        }
        if (ec == net::error::operation_aborted || ec == websocket::error::closed) {
            return make_closed_error("Upstream closed");
        }
        if (ec) {
            return make_network_error("Upstream write failed: " + ec.message());
        }
        return VoidResult();
    }

    Result<std::string> receive() {
        std::unique_lock<std::mutex> lock(inbound_mutex_);
        inbound_cv_.wait(lock, [this] { return read_done_ || !inbound_.empty(); });
        if (!inbound_.empty()) {
            std::string message = std::move(inbound_.front());
            inbound_.pop_front();
            return message;
        }
        return read_error_;
    }

    void close() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        open_ = false;

        if (io_thread_.joinable()) {
            // Queued after every write posted so far; the socket close aborts
            // the pending read and any write still in flight.
            net::post(ioc_, [this] {
                beast::error_code ec;
                beast::get_lowest_layer(*ws_).close(ec);
                if (ec) {
                    Logger::debug("Upstream socket close: " + ec.message());
                }
            });
            work_.reset();
            io_thread_.join();
        }
        finish_reading(make_closed_error("Upstream closed"));
        std::lock_guard<std::mutex> inbound_lock(inbound_mutex_);
        inbound_.clear();
    }

    bool is_open() const {
        return open_;
    }

private:
    struct PendingWrite {
        std::string message;
        std::promise<beast::error_code> done;
    };

    void run_io() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            Logger::error(std::string("Upstream I/O thread error: ") + e.what());
            open_ = false;
            finish_reading(make_network_error(std::string("Upstream I/O failed: ") + e.what()));
        }
    }

    // Everything below runs on the I/O thread only

    void do_read() {
        ws_->async_read(read_buffer_, [this](beast::error_code ec, std::size_t) {
            if (ec) {
                open_ = false;
                // A close frame from the peer ends the session cleanly even if
                // the TLS teardown after it fails
                if (ec == websocket::error::closed || ws_->reason().code != websocket::close_code::none) {
                    finish_reading(make_closed_error("Upstream closed the connection"));
                } else if (closed_) {
                    finish_reading(make_closed_error("Upstream closed"));
                } else {
                    finish_reading(make_network_error("Upstream read failed: " + ec.message()));
                }
                return;
            }
            {
                std::lock_guard<std::mutex> lock(inbound_mutex_);
                inbound_.push_back(beast::buffers_to_string(read_buffer_.data()));
            }
            inbound_cv_.notify_one();
            read_buffer_.consume(read_buffer_.size());
            do_read();
        });
    }

    void do_write() {
        ws_->async_write(net::buffer(writes_.front()->message), [this](beast::error_code ec, std::size_t) {
            writes_.front()->done.set_value(ec);
            writes_.pop_front();
            if (ec) {
                // The stream is unusable after a failed write
                for (auto& pending : writes_) {
                    pending->done.set_value(ec);
                }
                writes_.clear();
                return;
            }
            if (!writes_.empty()) {
                do_write();
            }
        });
    }

    void finish_reading(Error error) {
        {
            std::lock_guard<std::mutex> lock(inbound_mutex_);
            if (read_done_) {
                return;
            }
            read_done_ = true;
            read_error_ = std::move(error);
        }
        inbound_cv_.notify_all();
    }

    net::io_context ioc_{1};
    ssl::context ssl_ctx_;
    std::unique_ptr<Stream> ws_;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work_;
    std::thread io_thread_;

    std::mutex state_mutex_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> open_{false};

    beast::flat_buffer read_buffer_;
    std::deque<std::shared_ptr<PendingWrite>> writes_;

    std::mutex inbound_mutex_;
    std::condition_variable inbound_cv_;
    std::deque<std::string> inbound_;
    bool read_done_ = false;
    Error read_error_;
};

WebSocketUpstream::WebSocketUpstream(const std::string& extra_ca_pem)
    : pimpl_(std::make_unique<Impl>(extra_ca_pem)) {}
WebSocketUpstream::~WebSocketUpstream() = default;

VoidResult WebSocketUpstream::connect(const std::string& url, const HttpHeaders& headers) {
    return pimpl_->connect(url, headers);
}

VoidResult WebSocketUpstream::send_text(const std::string& message) {
    return pimpl_->send_text(message);
}

Result<std::string> WebSocketUpstream::receive() {
    return pimpl_->receive();
}

void WebSocketUpstream::close() {
    pimpl_->close();
}

bool WebSocketUpstream::is_open() const {
    return pimpl_->is_open();
}

} // namespace voice_relay
