#pragma once

#include "errors.h"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voice_relay {

/**
 * @brief Message channel back to the client (browser or telephony media stream)
 *
 * Sends may come from any thread; they are serialized by the implementation.
 */
class DownstreamTransport {
public:
    virtual ~DownstreamTransport() = default;

    virtual VoidResult send_text(const std::string& message) = 0;
    virtual VoidResult send_binary(const std::vector<uint8_t>& data) = 0;

    /**
     * @brief Shut the connection down
     *
     * Callable from any thread; the connection's reader sees the stream end.
     */
    virtual void close() = 0;
};

/**
 * @brief DownstreamTransport over an accepted Boost.Beast WebSocket
 *
 * run() makes the calling thread the only user of the stream: it drives
 * async_read and async_write on the connection's io_context until the client
 * goes away. send_text(), send_binary() and close() post to that context and
 * return at once, so frames leave in the order they were sent. A write
 * failure is logged and drops the connection.
 */
class WebSocketDownstream : public DownstreamTransport {
public:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using FrameHandler = std::function<void(std::string payload, bool binary)>;

    /**
     * @param ws Accepted stream; must outlive run()
     * @param ioc Context the stream's socket belongs to
     */
    WebSocketDownstream(Stream& ws, boost::asio::io_context& ioc);

    /**
     * @brief Read frames until the connection ends
     *
     * Calls on_frame for every data frame, on this thread. Returns the error
     * that ended the read (websocket::error::closed after a clean close).
     * Sends fail with a Closed error once this returns.
     */
    boost::beast::error_code run(FrameHandler on_frame);

    VoidResult send_text(const std::string& message) override;
    VoidResult send_binary(const std::vector<uint8_t>& data) override;

    /// Close handshake with the normal close code
    void close() override;

    /// Close handshake after the frames already queued; later sends are refused
    void close(boost::beast::websocket::close_code code, const std::string& reason = "");

private:
    struct Frame {
        std::string data;
        bool binary = false;
    };

    VoidResult enqueue(Frame frame);
    void do_read();
    void start_write();
    void drop_connection();

    Stream& ws_;
    boost::asio::io_context& ioc_;

    std::mutex mutex_;
    bool closed_ = false;
    bool close_requested_ = false;

    // Touched on the run() thread only
    FrameHandler on_frame_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    boost::beast::flat_buffer read_buffer_;
    boost::beast::error_code read_error_;
    std::deque<Frame> outgoing_;
    std::optional<boost::beast::websocket::close_reason> pending_close_;
    bool writing_ = false;
    bool closing_ = false;
    bool failed_ = false;
};

} // namespace voice_relay
