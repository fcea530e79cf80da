#pragma once

#include "credentials.h"
#include "errors.h"
#include <memory>
#include <string>

namespace voice_relay {

/**
 * @brief Message channel to the realtime voice service
 *
 * One reader thread and one writer thread may use a connected transport at
 * the same time. close() may be called from any thread and makes a pending
 * receive() fail.
 */
class UpstreamTransport {
public:
    virtual ~UpstreamTransport() = default;

    /**
     * @brief Open the connection
     * @param url wss:// URL including path and query
     * @param headers Extra handshake headers (auth, request id)
     */
    virtual VoidResult connect(const std::string& url, const HttpHeaders& headers) = 0;

    /// Send one text message
    virtual VoidResult send_text(const std::string& message) = 0;

    /**
     * @brief Block until the next message arrives
     * @return Message text, or Closed/NetworkError once the link is gone
     */
    virtual Result<std::string> receive() = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

/**
 * @brief UpstreamTransport over a TLS WebSocket (Boost.Beast + OpenSSL)
 *
 * Verifies the peer against the system trust store and sends SNI.
 *
 * After the handshake the stream belongs to a private I/O thread running
 * async_read and async_write; no other thread touches it. send_text() hands
 * the message to that thread and waits for the write to finish. receive()
 * takes the next message the read loop has buffered. Messages that arrived
 * before the peer went away are still delivered, then the error; close()
 * discards them.
 */
class WebSocketUpstream : public UpstreamTransport {
public:
    /**
     * @param extra_ca_pem PEM certificates trusted in addition to the system
     *        roots (empty = system roots only)
     */
    explicit WebSocketUpstream(const std::string& extra_ca_pem = "");
    ~WebSocketUpstream() override;

    WebSocketUpstream(const WebSocketUpstream&) = delete;
    WebSocketUpstream& operator=(const WebSocketUpstream&) = delete;

    VoidResult connect(const std::string& url, const HttpHeaders& headers) override;
    VoidResult send_text(const std::string& message) override;
    Result<std::string> receive() override;
    void close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_relay
