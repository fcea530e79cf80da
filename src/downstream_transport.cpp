#include "downstream_transport.h"
#include "logger.h"
#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;

namespace voice_relay {

WebSocketDownstream::WebSocketDownstream(Stream& ws, net::io_context& ioc) : ws_(ws), ioc_(ioc) {}

beast::error_code WebSocketDownstream::run(FrameHandler on_frame) {
    on_frame_ = std::move(on_frame);

    // The websocket timeouts replace the tcp_stream ones; the handshake value
    // bounds the close handshake as well.
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout{
        std::chrono::seconds(30), websocket::stream_base::none(), false});

    work_.emplace(net::make_work_guard(ioc_));
    net::post(ioc_, [this] { do_read(); });
    try {
        ioc_.run();
    } catch (const std::exception& e) {
        Logger::error(std::string("[Server] Client I/O error: ") + e.what());
        if (!read_error_) {
            read_error_ = net::error::operation_aborted;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    return read_error_;
}

VoidResult WebSocketDownstream::send_text(const std::string& message) {
    return enqueue(Frame{message, false});
}

VoidResult WebSocketDownstream::send_binary(const std::vector<uint8_t>& data) {
    return enqueue(Frame{std::string(data.begin(), data.end()), true});
}

VoidResult WebSocketDownstream::enqueue(Frame frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || close_requested_) {
        return make_closed_error("Downstream closed");
    }
    net::post(ioc_, [this, frame = std::move(frame)]() mutable {
        if (closing_ || failed_) {
            return;
        }
        outgoing_.push_back(std::move(frame));
        start_write();
    });
    return VoidResult();
}

void WebSocketDownstream::close() {
    close(websocket::close_code::normal);
}

void WebSocketDownstream::close(websocket::close_code code, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || close_requested_) {
        return;
    }
    close_requested_ = true;
    websocket::close_reason cr(code, reason);
    net::post(ioc_, [this, cr] {
        pending_close_ = cr;
        start_write();
    });
}

void WebSocketDownstream::do_read() {
    ws_.async_read(read_buffer_, [this](beast::error_code ec, std::size_t) {
        if (ec) {
            read_error_ = ec;
            work_.reset();
            return;
        }
        std::string payload = beast::buffers_to_string(read_buffer_.data());
        read_buffer_.consume(read_buffer_.size());
        on_frame_(std::move(payload), ws_.got_binary());
        do_read();
    });
}

// One write or close in flight at a time; a queued close goes out after the
// frames ahead of it.
void WebSocketDownstream::start_write() {
    if (writing_ || closing_ || failed_) {
        return;
    }
    if (!outgoing_.empty()) {
        writing_ = true;
        ws_.binary(outgoing_.front().binary);
        ws_.async_write(net::buffer(outgoing_.front().data), [this](beast::error_code ec, std::size_t) {
            writing_ = false;
            outgoing_.pop_front();
            if (ec) {
                Logger::debug("[Server] Downstream write failed: " + ec.message());
                drop_connection();
                return;
            }
            start_write();
        });
        return;
    }
    if (pending_close_) {
        closing_ = true;
        ws_.async_close(*pending_close_, [this](beast::error_code ec) {
            if (ec) {
                Logger::debug("[Server] Downstream close failed: " + ec.message());
                drop_connection();
            }
        });
        pending_close_.reset();
    }
}

void WebSocketDownstream::drop_connection() {
    failed_ = true;
    outgoing_.clear();
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().close(ec);
}

} // namespace voice_relay
