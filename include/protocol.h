#pragma once

/**
 * @file protocol.h
 * @brief Wire formats of the upstream realtime API and the downstream client
 *
 * Upstream messages are JSON events tagged by "type". Downstream telephony
 * messages are JSON envelopes tagged by "Kind"; downstream web audio is raw
 * binary PCM and needs no envelope.
 */

#include "config.h"
#include "tool_registry.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace voice_relay {
namespace protocol {

// =============================================================================
// Upstream (realtime API)
// =============================================================================

/// Inbound upstream event kinds the relay acts on
enum class UpstreamEventType {
    SessionCreated,
    InputBufferCleared,
    SpeechStarted,
    SpeechStopped,
    InputTranscriptionCompleted,
    InputTranscriptionFailed,
    FunctionCallArgumentsDone,
    ResponseDone,
    AudioTranscriptDone,
    AudioDelta,
    Error,
    Unknown     ///< Any other tag; logged and ignored
};

UpstreamEventType parse_event_type(const std::string& tag);

/// Wire tag for a known event type ("" for Unknown)
const char* event_type_tag(UpstreamEventType type);

/// Instructions text: the configured preamble, the tool list and usage hints
std::string build_instructions(const std::string& preamble,
                               const std::vector<std::string>& tool_names);

/// session.update carrying instructions, audio options, voice and tool definitions
nlohmann::json make_session_update(const SessionConfig& config, const ToolRegistry& tools);

/// input_audio_buffer.append
nlohmann::json make_audio_append(const std::string& audio_b64);

/// response.create
nlohmann::json make_response_create();

/**
 * @brief conversation.item.create with a function_call_output item
 * @param output Serialized result (sent as a JSON string)
 */
nlohmann::json make_function_call_output(const std::string& call_id, const std::string& output);

// =============================================================================
// Downstream (client)
// =============================================================================

/// {"Kind":"AudioData","AudioData":{"Data":b64},"StopAudio":null}
std::string make_audio_data_message(const std::string& audio_b64);

/// {"Kind":"StopAudio","AudioData":null,"StopAudio":{}}
std::string make_stop_audio_message();

/// {"Kind":"Transcription","Text":text}
std::string make_transcription_message(const std::string& text);

/**
 * @brief Classified inbound telephony frame
 */
struct TelephonyFrame {
    enum class Kind {
        Audio,      ///< Non-silent audio; audio_b64 holds the payload
        Silent,     ///< Audio flagged silent (or without the flag)
        Other,      ///< Valid JSON of another kind
        Malformed   ///< Not JSON, or audio without a usable payload
    };

    Kind kind = Kind::Malformed;
    std::string audio_b64;
    std::string detail;  ///< Kind name or parse error, for logging
};

/**
 * @brief Parse {"kind":"AudioData","audioData":{"data":b64,"silent":bool}}
 */
TelephonyFrame parse_telephony_frame(const std::string& text);

} // namespace protocol
} // namespace voice_relay
