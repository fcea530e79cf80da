#include "protocol.h"
#include "utils.h"
#include <map>

using json = nlohmann::json;

namespace voice_relay {
namespace protocol {

namespace {

struct EventTag {
    const char* tag;
    UpstreamEventType type;
};

const EventTag kEventTags[] = {
    {"session.created", UpstreamEventType::SessionCreated},
    {"input_audio_buffer.cleared", UpstreamEventType::InputBufferCleared},
    {"input_audio_buffer.speech_started", UpstreamEventType::SpeechStarted},
    {"input_audio_buffer.speech_stopped", UpstreamEventType::SpeechStopped},
    {"conversation.item.input_audio_transcription.completed", UpstreamEventType::InputTranscriptionCompleted},
    {"conversation.item.input_audio_transcription.failed", UpstreamEventType::InputTranscriptionFailed},
    {"response.function_call_arguments.done", UpstreamEventType::FunctionCallArgumentsDone},
    {"response.done", UpstreamEventType::ResponseDone},
    {"response.audio_transcript.done", UpstreamEventType::AudioTranscriptDone},
    {"response.audio.delta", UpstreamEventType::AudioDelta},
    {"error", UpstreamEventType::Error},
};

const std::map<std::string, std::string>& tool_hints() {
    static const std::map<std::string, std::string> hints = {
        {"send_email_summary", "when the customer wants to receive a summary or when the call is ending"},
        {"book_appointment", "when the customer wants to schedule a meeting"},
        {"lookup_information", "when asked about policies, hours, or company info"},
        {"check_order_status", "when the customer asks about their order"},
    };
    return hints;
}

} // namespace

UpstreamEventType parse_event_type(const std::string& tag) {
    for (const auto& entry : kEventTags) {
        if (tag == entry.tag) {
            return entry.type;
        }
    }
    return UpstreamEventType::Unknown;
}

const char* event_type_tag(UpstreamEventType type) {
    for (const auto& entry : kEventTags) {
        if (entry.type == type) {
            return entry.tag;
        }
    }
    return "";
}

std::string build_instructions(const std::string& preamble,
                               const std::vector<std::string>& tool_names) {
    std::string text = preamble;
    if (tool_names.empty()) {
        return text + " Always be polite, professional, and helpful.";
    }

    text += " You have access to the following tools to help customers: " +
            utils::join(tool_names, ", ") + ". "
            "Use these tools proactively when appropriate based on the customer's needs.";

    std::string examples;
    for (const auto& name : tool_names) {
        auto it = tool_hints().find(name);
        if (it != tool_hints().end()) {
            examples += "\n- Use '" + name + "' " + it->second;
        }
    }
    if (!examples.empty()) {
        text += " For example:" + examples + "\n";
    } else {
        text += " ";
    }
    text += "Always be polite, professional, and helpful.";
    return text;
}

json make_session_update(const SessionConfig& config, const ToolRegistry& tools) {
    const auto& td = config.turn_detection;
    json session = {
        {"instructions", build_instructions(config.instructions, tools.get_tool_names())},
        {"turn_detection", {
            {"type", td.type},
            {"threshold", td.threshold},
            {"prefix_padding_ms", td.prefix_padding_ms},
            {"silence_duration_ms", td.silence_duration_ms},
            {"remove_filler_words", td.remove_filler_words},
            {"end_of_utterance_detection", {
                {"model", td.end_of_utterance.model},
                {"threshold", td.end_of_utterance.threshold},
                {"timeout", td.end_of_utterance.timeout}
            }}
        }},
        {"input_audio_noise_reduction", {{"type", config.noise_reduction}}},
        {"input_audio_echo_cancellation", {{"type", config.echo_cancellation}}},
        {"voice", {
            {"name", config.voice.name},
            {"type", config.voice.type},
            {"temperature", config.voice.temperature}
        }},
        {"tools", tools.get_function_definitions()},
        {"tool_choice", "auto"}
    };
    return {{"type", "session.update"}, {"session", session}};
}

json make_audio_append(const std::string& audio_b64) {
    return {{"type", "input_audio_buffer.append"}, {"audio", audio_b64}};
}

json make_response_create() {
    return {{"type", "response.create"}};
}

json make_function_call_output(const std::string& call_id, const std::string& output) {
    return {
        {"type", "conversation.item.create"},
        {"item", {
            {"type", "function_call_output"},
            {"call_id", call_id},
            {"output", output}
        }}
    };
}

std::string make_audio_data_message(const std::string& audio_b64) {
    json message = {
        {"Kind", "AudioData"},
        {"AudioData", {{"Data", audio_b64}}},
        {"StopAudio", nullptr}
    };
    return message.dump();
}

std::string make_stop_audio_message() {
    json message = {
        {"Kind", "StopAudio"},
        {"AudioData", nullptr},
        {"StopAudio", json::object()}
    };
    return message.dump();
}

std::string make_transcription_message(const std::string& text) {
    json message = {{"Kind", "Transcription"}, {"Text", text}};
    return message.dump();
}

TelephonyFrame parse_telephony_frame(const std::string& text) {
    TelephonyFrame frame;

    json data;
    try {
        data = json::parse(text);
    } catch (const json::exception& e) {
        frame.kind = TelephonyFrame::Kind::Malformed;
        frame.detail = e.what();
        return frame;
    }

    if (!data.is_object()) {
        frame.kind = TelephonyFrame::Kind::Malformed;
        frame.detail = "frame is not a JSON object";
        return frame;
    }

    std::string kind = data.value("kind", "");
    if (kind != "AudioData") {
        frame.kind = TelephonyFrame::Kind::Other;
        frame.detail = kind.empty() ? "(no kind)" : kind;
        return frame;
    }

    auto audio_it = data.find("audioData");
    if (audio_it == data.end() || !audio_it->is_object()) {
        frame.kind = TelephonyFrame::Kind::Malformed;
        frame.detail = "AudioData frame without audioData object";
        return frame;
    }

    const json& audio = *audio_it;
    auto silent_it = audio.find("silent");
    bool silent = silent_it == audio.end() || !silent_it->is_boolean() || silent_it->get<bool>();
    if (silent) {
        frame.kind = TelephonyFrame::Kind::Silent;
        frame.detail = "AudioData";
        return frame;
    }

    auto data_it = audio.find("data");
    if (data_it == audio.end() || !data_it->is_string()) {
        frame.kind = TelephonyFrame::Kind::Malformed;
        frame.detail = "AudioData frame without data payload";
        return frame;
    }

    frame.kind = TelephonyFrame::Kind::Audio;
    frame.audio_b64 = data_it->get<std::string>();
    frame.detail = "AudioData";
    return frame;
}

} // namespace protocol
} // namespace voice_relay
