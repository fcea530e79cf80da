#pragma once

#include "config.h"
#include "connection_registry.h"
#include "credentials.h"
#include "downstream_transport.h"
#include "errors.h"
#include "message_queue.h"
#include "session_state.h"
#include "tool_dispatcher.h"
#include "tool_registry.h"
#include "transcript.h"
#include "upstream_transport.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace voice_relay {

/**
 * @brief Bridges one client connection and one realtime-service connection
 *
 * Lifecycle (see SessionStateMachine):
 * attach_downstream() registers with the ConnectionRegistry, connect() opens
 * the upstream link, sends session.update and response.create, then starts
 * two threads:
 * - sender: drains the outbound queue into the upstream transport (FIFO)
 * - receiver: decodes upstream events, forwards audio and transcriptions
 *   downstream, runs function calls through the ToolDispatcher
 *
 * cleanup() is idempotent and runs from the destructor as well. Each session
 * owns its queue, transcript and tool registry; only the connection registry
 * is shared.
 */
class SessionRelay {
public:
    using ClosedCallback = std::function<void()>;

    /**
     * @param config Process configuration (copied)
     * @param registry Shared admission controller; must outlive the session
     * @param upstream Transport to the realtime service
     * @param credentials Source of the upstream auth headers
     */
    SessionRelay(const Config& config,
                 ConnectionRegistry& registry,
                 std::unique_ptr<UpstreamTransport> upstream,
                 std::shared_ptr<CredentialProvider> credentials);
    ~SessionRelay();

    SessionRelay(const SessionRelay&) = delete;
    SessionRelay& operator=(const SessionRelay&) = delete;

    /**
     * @brief Bind the client connection and claim a registry slot
     * @return AdmissionRefused when the registry is full (session becomes Rejected),
     *         InvalidState when called twice
     */
    VoidResult attach_downstream(std::shared_ptr<DownstreamTransport> downstream,
                                 ConnectionType connection_type,
                                 const std::optional<std::string>& caller_id);

    /**
     * @brief Open the upstream link and start streaming
     *
     * On failure all resources are released, the registry slot is returned
     * and the session ends in Failed.
     */
    VoidResult connect();

    /// Queue a serialized upstream message; false once the session is closing
    bool enqueue(std::string message);

    /// Raw PCM from a web client; base64-encoded into input_audio_buffer.append
    bool push_web_audio(const std::vector<uint8_t>& audio);

    /**
     * @brief JSON frame from a telephony client
     *
     * Non-silent AudioData is forwarded; silent frames, other kinds and
     * malformed frames are dropped.
     * @return true if audio was queued
     */
    bool push_telephony_message(const std::string& text);

    /// Already-encoded audio
    bool push_audio_base64(const std::string& audio_b64);

    /// Handle one upstream event (called by the receiver loop)
    void process_upstream_message(const std::string& text);

    /**
     * @brief Release everything: close the queue and the upstream link, join
     *        the loops, return the registry slot
     *
     * Safe to call any number of times from any thread other than the
     * receiver loop's own.
     */
    void cleanup();

    /**
     * @brief Called once when the receiver loop exits (upstream closed or failed)
     *
     * Runs on the receiver thread; must not call cleanup().
     */
    void set_on_upstream_closed(ClosedCallback callback);

    SessionState state() const { return state_.get_state(); }
    const std::string& connection_id() const { return connection_id_; }
    std::optional<std::string> caller_id() const;
    ConnectionType connection_type() const { return connection_type_; }
    std::optional<std::string> upstream_session_id() const;
    std::chrono::system_clock::time_point started_at() const { return started_at_; }
    bool is_registered() const { return registered_; }

    std::vector<TranscriptEntry> transcript() const { return transcript_.snapshot(); }
    const ToolRegistry& tools() const { return tool_registry_; }
    size_t pending_messages() const { return outbound_.size(); }

private:
    VoidResult fail_connect(const Error& error);
    void release_resources();
    void sender_loop();
    void receiver_loop();

    void send_downstream_text(const std::string& message);
    void send_downstream_binary(const std::vector<uint8_t>& data);
    void forward_audio_delta(const nlohmann::json& event);

    Config config_;
    ConnectionRegistry& registry_;
    std::unique_ptr<UpstreamTransport> upstream_;
    std::shared_ptr<CredentialProvider> credentials_;
    std::shared_ptr<DownstreamTransport> downstream_;

    const std::string connection_id_;
    ConnectionType connection_type_ = ConnectionType::Web;
    std::chrono::system_clock::time_point started_at_;

    SessionStateMachine state_;
    std::atomic<bool> registered_{false};

    MessageQueue outbound_;
    Transcript transcript_;
    ToolRegistry tool_registry_;
    ToolDispatcher dispatcher_;

    mutable std::mutex info_mutex_;
    std::optional<std::string> caller_id_;
    std::optional<std::string> upstream_session_id_;
    ClosedCallback on_upstream_closed_;

    std::mutex thread_mutex_;
    std::thread sender_;
    std::thread receiver_;
};

} // namespace voice_relay
