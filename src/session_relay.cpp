#include "session_relay.h"
#include "logger.h"
#include "protocol.h"
#include "tools/tool_factory.h"
#include "url_utils.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voice_relay {

SessionRelay::SessionRelay(const Config& config,
                           ConnectionRegistry& registry,
                           std::unique_ptr<UpstreamTransport> upstream,
                           std::shared_ptr<CredentialProvider> credentials)
    : config_(config),
      registry_(registry),
      upstream_(std::move(upstream)),
      credentials_(std::move(credentials)),
      connection_id_(utils::generate_uuid()),
      started_at_(std::chrono::system_clock::now()),
      tool_registry_(create_tool_registry(config.tools, connection_id_)),
      dispatcher_(tool_registry_, outbound_, config.tools.reply_on_failure, connection_id_) {
    LOG_RELAY(connection_id_, "Session created with " + std::to_string(tool_registry_.size()) + " tools");
}

SessionRelay::~SessionRelay() {
    cleanup();
    // A cleanup requested from the receiver thread could not join it
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (sender_.joinable()) sender_.join();
    if (receiver_.joinable()) receiver_.join();
}

VoidResult SessionRelay::attach_downstream(std::shared_ptr<DownstreamTransport> downstream,
                                           ConnectionType connection_type,
                                           const std::optional<std::string>& caller_id) {
    if (!state_.begin_registration()) {
        return make_error(ErrorType::InvalidState,
                          std::string("Cannot attach in state ") + session_state_name(state_.get_state()));
    }

    downstream_ = std::move(downstream);
    connection_type_ = connection_type;
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        caller_id_ = caller_id;
    }

    bool admitted = registry_.register_connection(connection_id_, caller_id, connection_type);
    registered_ = admitted;
    state_.on_admission(admitted);
    if (!admitted) {
        Logger::warn("[connection_id=" + connection_id_ + "] Connection rejected: limit of " +
                     std::to_string(registry_.max_connections()) + " reached");
        return make_error(ErrorType::AdmissionRefused, "Maximum concurrent connections reached");
    }

    LOG_RELAY(connection_id_, std::string("Attached ") + connection_type_name(connection_type) +
              " client, caller_id=" + caller_id.value_or("unknown"));
    return VoidResult();
}

VoidResult SessionRelay::connect() {
    if (state_.get_state() != SessionState::Connecting) {
        return make_error(ErrorType::InvalidState,
                          std::string("Cannot connect in state ") + session_state_name(state_.get_state()));
    }

    auto auth = credentials_->auth_headers();
    if (!auth) {
        return fail_connect(auth.error());
    }

    HttpHeaders headers = auth.value();
    headers.emplace_back("x-ms-client-request-id", utils::generate_uuid());

    std::string url = build_realtime_url(config_.upstream);
    LOG_RELAY(connection_id_, "Connecting upstream to " + url + " using " + credentials_->kind());

    auto connected = upstream_->connect(url, headers);
    if (!connected) {
        return fail_connect(connected.error());
    }

    auto update = upstream_->send_text(protocol::make_session_update(config_.session, tool_registry_).dump());
    if (!update) {
        return fail_connect(update.error());
    }
    auto trigger = upstream_->send_text(protocol::make_response_create().dump());
    if (!trigger) {
        return fail_connect(trigger.error());
    }

    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        if (!state_.on_upstream_connected()) {
            return make_closed_error("Session closed while connecting");
        }
        sender_ = std::thread(&SessionRelay::sender_loop, this);
        receiver_ = std::thread(&SessionRelay::receiver_loop, this);
    }

    LOG_RELAY(connection_id_, "Streaming");
    return VoidResult();
}

VoidResult SessionRelay::fail_connect(const Error& error) {
    Logger::error("[connection_id=" + connection_id_ + "] Upstream connect failed: " + error.describe());
    release_resources();
    state_.on_connect_failed();
    return error;
}

bool SessionRelay::enqueue(std::string message) {
    return outbound_.push(std::move(message));
}

bool SessionRelay::push_web_audio(const std::vector<uint8_t>& audio) {
    return push_audio_base64(utils::base64_encode(audio));
}

bool SessionRelay::push_telephony_message(const std::string& text) {
    protocol::TelephonyFrame frame = protocol::parse_telephony_frame(text);
    switch (frame.kind) {
        case protocol::TelephonyFrame::Kind::Audio:
            return push_audio_base64(frame.audio_b64);
        case protocol::TelephonyFrame::Kind::Silent:
            return false;
        case protocol::TelephonyFrame::Kind::Other:
            Logger::debug("[connection_id=" + connection_id_ + "] Ignoring telephony frame: " + frame.detail);
            return false;
        case protocol::TelephonyFrame::Kind::Malformed:
            Logger::warn("[connection_id=" + connection_id_ + "] Malformed telephony frame: " + frame.detail);
            return false;
    }
    return false;
}

bool SessionRelay::push_audio_base64(const std::string& audio_b64) {
    if (audio_b64.empty()) {
        return false;
    }
    return enqueue(protocol::make_audio_append(audio_b64).dump());
}

void SessionRelay::process_upstream_message(const std::string& text) {
    json event;
    try {
        event = json::parse(text);
    } catch (const json::exception& e) {
        Logger::warn("[connection_id=" + connection_id_ + "] Dropping non-JSON upstream message: " + e.what());
        return;
    }
    if (!event.is_object()) {
        Logger::warn("[connection_id=" + connection_id_ + "] Dropping upstream message that is not an object");
        return;
    }

    auto type_it = event.find("type");
    std::string type = type_it != event.end() && type_it->is_string() ? type_it->get<std::string>() : "";
    try {
        switch (protocol::parse_event_type(type)) {
            case protocol::UpstreamEventType::SessionCreated: {
                auto session = event.find("session");
                if (session == event.end() || !session->is_object()) {
                    Logger::warn("[connection_id=" + connection_id_ + "] session.created without a session object");
                    break;
                }
                auto id = session->find("id");
                if (id == session->end() || !id->is_string() || id->get_ref<const std::string&>().empty()) {
                    Logger::warn("[connection_id=" + connection_id_ + "] session.created without a session id");
                    break;
                }
                {
                    std::lock_guard<std::mutex> lock(info_mutex_);
                    upstream_session_id_ = id->get<std::string>();
                }
                LOG_RELAY(connection_id_, "Upstream session id: " + id->get<std::string>());
                break;
            }

            case protocol::UpstreamEventType::InputBufferCleared:
                LOG_RELAY(connection_id_, "Input audio buffer cleared");
                break;

            case protocol::UpstreamEventType::SpeechStarted:
                LOG_RELAY(connection_id_, "Voice activity detection started at " +
                          event.value("audio_start_ms", json()).dump() + " ms");
                send_downstream_text(protocol::make_stop_audio_message());
                break;

            case protocol::UpstreamEventType::SpeechStopped:
                LOG_RELAY(connection_id_, "Speech stopped");
                break;

            case protocol::UpstreamEventType::InputTranscriptionCompleted: {
                std::string transcript = event.value("transcript", "");
                LOG_RELAY(connection_id_, "User: " + transcript);
                transcript_.append_user(transcript);
                break;
            }

            case protocol::UpstreamEventType::InputTranscriptionFailed:
                Logger::warn("[connection_id=" + connection_id_ + "] Transcription error: " +
                             event.value("error", json()).dump());
                break;

            case protocol::UpstreamEventType::FunctionCallArgumentsDone:
                dispatcher_.dispatch(event);
                break;

            case protocol::UpstreamEventType::ResponseDone: {
                json response = event.value("response", json::object());
                LOG_RELAY(connection_id_, "Response done: id=" + response.value("id", std::string("unknown")));
                if (response.contains("status_details") && !response["status_details"].is_null()) {
                    LOG_RELAY(connection_id_, "Status details: " + response["status_details"].dump());
                }
                break;
            }

            case protocol::UpstreamEventType::AudioTranscriptDone: {
                std::string transcript = event.value("transcript", "");
                LOG_RELAY(connection_id_, "AI: " + transcript);
                transcript_.append_assistant(transcript);
                send_downstream_text(protocol::make_transcription_message(transcript));
                break;
            }

            case protocol::UpstreamEventType::AudioDelta:
                forward_audio_delta(event);
                break;

            case protocol::UpstreamEventType::Error:
                Logger::error("[connection_id=" + connection_id_ + "] Voice Live error: " + event.dump());
                break;

            case protocol::UpstreamEventType::Unknown:
                Logger::debug("[connection_id=" + connection_id_ + "] Other event: " + type);
                break;
        }
    } catch (const json::exception& e) {
        Logger::warn("[connection_id=" + connection_id_ + "] Bad " + type + " event: " + e.what());
    }
}

void SessionRelay::forward_audio_delta(const json& event) {
    auto delta = event.find("delta");
    if (delta == event.end() || !delta->is_string()) {
        Logger::warn("[connection_id=" + connection_id_ + "] Audio delta without payload");
        return;
    }
    const std::string& audio_b64 = delta->get_ref<const std::string&>();

    if (connection_type_ == ConnectionType::Web) {
        std::vector<uint8_t> audio;
        if (!utils::base64_decode(audio_b64, audio)) {
            Logger::warn("[connection_id=" + connection_id_ + "] Audio delta is not valid base64");
            return;
        }
        send_downstream_binary(audio);
    } else {
        send_downstream_text(protocol::make_audio_data_message(audio_b64));
    }
}

void SessionRelay::send_downstream_text(const std::string& message) {
    if (!downstream_) return;
    auto sent = downstream_->send_text(message);
    if (!sent) {
        Logger::warn("[connection_id=" + connection_id_ + "] Failed to send to client: " + sent.error().describe());
    }
}

void SessionRelay::send_downstream_binary(const std::vector<uint8_t>& data) {
    if (!downstream_) return;
    auto sent = downstream_->send_binary(data);
    if (!sent) {
        Logger::warn("[connection_id=" + connection_id_ + "] Failed to send to client: " + sent.error().describe());
    }
}

void SessionRelay::sender_loop() {
    while (auto message = outbound_.pop()) {
        auto sent = upstream_->send_text(*message);
        if (!sent) {
            Logger::error("[connection_id=" + connection_id_ + "] Sender loop error: " + sent.error().describe());
            upstream_->close();
            break;
        }
    }
    Logger::debug("[connection_id=" + connection_id_ + "] Sender loop exited");
}

void SessionRelay::receiver_loop() {
    try {
        while (true) {
            auto message = upstream_->receive();
            if (!message) {
                SessionState current = state_.get_state();
                if (current == SessionState::Closing || current == SessionState::Closed) {
                    Logger::debug("[connection_id=" + connection_id_ + "] Receiver stopped by cleanup");
                } else if (message.error().type == ErrorType::Closed) {
                    LOG_RELAY(connection_id_, "Upstream closed the connection");
                } else {
                    Logger::error("[connection_id=" + connection_id_ + "] Receiver loop error: " +
                                  message.error().describe());
                }
                break;
            }
            process_upstream_message(message.value());
        }
    } catch (const std::exception& e) {
        Logger::error("[connection_id=" + connection_id_ + "] Receiver loop error: " + e.what());
    }

    outbound_.close();

    ClosedCallback callback;
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        callback = std::move(on_upstream_closed_);
        on_upstream_closed_ = nullptr;
    }
    if (callback) {
        callback();
    }
}

void SessionRelay::cleanup() {
    if (!state_.begin_close()) {
        return;
    }
    release_resources();
    state_.finish_close();

    auto duration = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - started_at_).count();
    LOG_RELAY(connection_id_, "Cleanup complete. Transcript entries: " + std::to_string(transcript_.size()) +
              ", call duration: " + std::to_string(duration) + "s");
}

void SessionRelay::release_resources() {
    outbound_.close();
    upstream_->close();

    std::thread sender;
    std::thread receiver;
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        sender = std::move(sender_);
        if (receiver_.joinable() && receiver_.get_id() == std::this_thread::get_id()) {
            Logger::warn("[connection_id=" + connection_id_ + "] cleanup() called from the receiver thread");
        } else {
            receiver = std::move(receiver_);
        }
    }
    if (sender.joinable()) sender.join();
    if (receiver.joinable()) receiver.join();

    if (registered_.exchange(false)) {
        registry_.unregister_connection(connection_id_);
    }
}

void SessionRelay::set_on_upstream_closed(ClosedCallback callback) {
    std::lock_guard<std::mutex> lock(info_mutex_);
    on_upstream_closed_ = std::move(callback);
}

std::optional<std::string> SessionRelay::caller_id() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return caller_id_;
}

std::optional<std::string> SessionRelay::upstream_session_id() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return upstream_session_id_;
}

} // namespace voice_relay
