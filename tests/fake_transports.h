#pragma once

/**
 * In-memory transports and credentials for driving SessionRelay without a
 * network.
 */

#include "credentials.h"
#include "downstream_transport.h"
#include "message_queue.h"
#include "upstream_transport.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voice_relay {
namespace testing {

/**
 * Upstream whose inbound messages are injected by the test. receive() blocks
 * until a message is injected or the transport is closed.
 */
class FakeUpstream : public UpstreamTransport {
public:
    VoidResult connect(const std::string& url, const HttpHeaders& headers) override {
        std::lock_guard<std::mutex> lock(mutex_);
        url_ = url;
        headers_ = headers;
        if (fail_connect) {
            return make_network_error("connection refused");
        }
        open_ = true;
        return VoidResult();
    }

    VoidResult send_text(const std::string& message) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) {
                return make_closed_error();
            }
            sent_.push_back(message);
        }
        cv_.notify_all();
        return VoidResult();
    }

    Result<std::string> receive() override {
        auto message = inbound_.pop();
        if (!message) {
            return make_closed_error("fake upstream closed");
        }
        return *message;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
            ++close_calls_;
        }
        inbound_.close();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    /// Deliver a message to the session's receiver loop
    void inject(const std::string& message) { inbound_.push(message); }

    /// Simulate the service dropping the connection
    void remote_close() { inbound_.close(); }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    /// Wait until at least count messages were sent
    bool wait_for_sent(size_t count, int timeout_ms = 2000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [&] { return sent_.size() >= count; });
    }

    std::string url() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return url_;
    }

    HttpHeaders headers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return headers_;
    }

    int close_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_calls_;
    }

    bool fail_connect = false;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    MessageQueue inbound_;
    std::vector<std::string> sent_;
    std::string url_;
    HttpHeaders headers_;
    bool open_ = false;
    int close_calls_ = 0;
};

/// Downstream that records what the session sends to the client
class FakeDownstream : public DownstreamTransport {
public:
    VoidResult send_text(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        texts_.push_back(message);
        return VoidResult();
    }

    VoidResult send_binary(const std::vector<uint8_t>& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        binaries_.push_back(data);
        return VoidResult();
    }

    void close() override { closed_ = true; }

    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_;
    }

    std::vector<std::vector<uint8_t>> binaries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return binaries_;
    }

    bool closed() const { return closed_; }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> texts_;
    std::vector<std::vector<uint8_t>> binaries_;
    std::atomic<bool> closed_{false};
};

class FakeCredential : public CredentialProvider {
public:
    explicit FakeCredential(bool fail = false) : fail_(fail) {}

    Result<HttpHeaders> auth_headers() override {
        if (fail_) {
            return make_auth_error("token endpoint unreachable");
        }
        return HttpHeaders{{"api-key", "test-key"}};
    }

    std::string kind() const override { return "fake"; }

private:
    bool fail_;
};

/// Poll a condition until it holds or the timeout passes
template<typename Predicate>
bool eventually(Predicate predicate, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // namespace testing
} // namespace voice_relay
