/**
 * Wire formats: base64, upstream events, downstream envelopes, telephony
 * frames, URLs and request routing.
 *
 * Run from build dir: ./test_protocol
 */

#include "config.h"
#include "logger.h"
#include "protocol.h"
#include "relay_server.h"
#include "tools/tool_factory.h"
#include "url_utils.h"
#include "utils.h"
#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace voice_relay;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- base64 ---
    {
        std::vector<uint8_t> pcm;
        for (int i = 0; i < 256; ++i) pcm.push_back(static_cast<uint8_t>(i));
        std::vector<uint8_t> decoded;
        ASSERT(utils::base64_decode(utils::base64_encode(pcm), decoded));
        ASSERT(decoded == pcm);

        ASSERT(utils::base64_encode(std::string("hello")) == "aGVsbG8=");
        ASSERT(utils::base64_encode(std::string("")) == "");
        ASSERT(utils::base64_decode("aGVs\nbG8=", decoded));
        ASSERT(std::string(decoded.begin(), decoded.end()) == "hello");

        ASSERT(!utils::base64_decode("aGVsbG8*", decoded));
        ASSERT(!utils::base64_decode("aGVsb", decoded));
    }

    // --- UUIDs ---
    {
        std::set<std::string> ids;
        for (int i = 0; i < 100; ++i) ids.insert(utils::generate_uuid());
        ASSERT(ids.size() == 100);
        ASSERT(ids.begin()->size() == 36);
    }

    // --- Event tags ---
    {
        using protocol::UpstreamEventType;
        ASSERT(protocol::parse_event_type("session.created") == UpstreamEventType::SessionCreated);
        ASSERT(protocol::parse_event_type("response.audio.delta") == UpstreamEventType::AudioDelta);
        ASSERT(protocol::parse_event_type("response.function_call_arguments.done") ==
               UpstreamEventType::FunctionCallArgumentsDone);
        ASSERT(protocol::parse_event_type("error") == UpstreamEventType::Error);
        ASSERT(protocol::parse_event_type("rate_limits.updated") == UpstreamEventType::Unknown);
        ASSERT(protocol::parse_event_type("") == UpstreamEventType::Unknown);
        ASSERT(std::string(protocol::event_type_tag(UpstreamEventType::SpeechStarted)) ==
               "input_audio_buffer.speech_started");
    }

    // --- session.update ---
    {
        Config config;
        ToolRegistry tools = create_tool_registry(config.tools, std::string("s"));
        json update = protocol::make_session_update(config.session, tools);
        ASSERT(update["type"] == "session.update");
        const json& session = update["session"];
        ASSERT(session["tool_choice"] == "auto");
        ASSERT(session["tools"].size() == 4);
        ASSERT(session["tools"][0]["name"] == "send_email_summary");
        ASSERT(session["tools"][1]["name"] == "book_appointment");
        ASSERT(session["tools"][2]["name"] == "lookup_information");
        ASSERT(session["tools"][3]["name"] == "check_order_status");
        ASSERT(session["turn_detection"]["type"] == "azure_semantic_vad");
        ASSERT(session["turn_detection"]["threshold"] == 0.3);
        ASSERT(session["turn_detection"]["prefix_padding_ms"] == 200);
        ASSERT(session["turn_detection"]["silence_duration_ms"] == 200);
        ASSERT(session["turn_detection"]["remove_filler_words"] == false);
        ASSERT(session["turn_detection"]["end_of_utterance_detection"]["model"] == "semantic_detection_v1");
        ASSERT(session["turn_detection"]["end_of_utterance_detection"]["timeout"] == 2);
        ASSERT(session["input_audio_noise_reduction"]["type"] == "azure_deep_noise_suppression");
        ASSERT(session["input_audio_echo_cancellation"]["type"] == "server_echo_cancellation");
        ASSERT(session["voice"]["name"] == "en-US-Aria:DragonHDLatestNeural");
        ASSERT(session["voice"]["type"] == "azure-standard");
        ASSERT(session["voice"]["temperature"] == 0.8);

        std::string instructions = session["instructions"];
        ASSERT(utils::starts_with(instructions, config.session.instructions));
        ASSERT(instructions.find("send_email_summary, book_appointment, lookup_information, check_order_status")
               != std::string::npos);
        ASSERT(instructions.find("- Use 'send_email_summary'") < instructions.find("- Use 'check_order_status'"));
        ASSERT(instructions.find("- Use 'check_order_status' when the customer asks about their order")
               != std::string::npos);

        std::string bare = protocol::build_instructions("Be brief.", {});
        ASSERT(bare == "Be brief. Always be polite, professional, and helpful.");
    }

    // --- Outbound upstream envelopes ---
    {
        json append = protocol::make_audio_append("AAAA");
        ASSERT(append["type"] == "input_audio_buffer.append");
        ASSERT(append["audio"] == "AAAA");
        ASSERT(protocol::make_response_create() == json({{"type", "response.create"}}));

        json output = protocol::make_function_call_output("call_1", "{\"success\":true}");
        ASSERT(output["type"] == "conversation.item.create");
        ASSERT(output["item"]["type"] == "function_call_output");
        ASSERT(output["item"]["call_id"] == "call_1");
        ASSERT(output["item"]["output"].is_string());
    }

    // --- Downstream envelopes ---
    {
        json audio = json::parse(protocol::make_audio_data_message("UklGRg=="));
        ASSERT(audio["Kind"] == "AudioData");
        ASSERT(audio["AudioData"]["Data"] == "UklGRg==");
        ASSERT(audio["StopAudio"].is_null());

        json stop = json::parse(protocol::make_stop_audio_message());
        ASSERT(stop["Kind"] == "StopAudio");
        ASSERT(stop["AudioData"].is_null());
        ASSERT(stop["StopAudio"].is_object() && stop["StopAudio"].empty());

        json text = json::parse(protocol::make_transcription_message("Hello there"));
        ASSERT(text["Kind"] == "Transcription");
        ASSERT(text["Text"] == "Hello there");
    }

    // --- Telephony frames ---
    {
        using Kind = protocol::TelephonyFrame::Kind;
        auto audio = protocol::parse_telephony_frame(
            R"({"kind":"AudioData","audioData":{"data":"AAEC","silent":false}})");
        ASSERT(audio.kind == Kind::Audio);
        ASSERT(audio.audio_b64 == "AAEC");

        ASSERT(protocol::parse_telephony_frame(
            R"({"kind":"AudioData","audioData":{"data":"AAEC","silent":true}})").kind == Kind::Silent);
        ASSERT(protocol::parse_telephony_frame(
            R"({"kind":"AudioData","audioData":{"data":"AAEC"}})").kind == Kind::Silent);
        ASSERT(protocol::parse_telephony_frame(
            R"({"kind":"AudioMetadata","audioMetadata":{}})").kind == Kind::Other);
        ASSERT(protocol::parse_telephony_frame("not json").kind == Kind::Malformed);
        ASSERT(protocol::parse_telephony_frame("[1,2]").kind == Kind::Malformed);
        ASSERT(protocol::parse_telephony_frame(
            R"({"kind":"AudioData","audioData":{"silent":false}})").kind == Kind::Malformed);
    }

    // --- URLs ---
    {
        UpstreamConfig up;
        up.endpoint = "https://my-resource.cognitiveservices.azure.com/";
        up.model = "gpt-4o";
        ASSERT(build_realtime_url(up) ==
               "wss://my-resource.cognitiveservices.azure.com/voice-live/realtime"
               "?api-version=2025-05-01-preview&model=gpt-4o");

        auto parsed = parse_ws_url(build_realtime_url(up));
        ASSERT(parsed.is_ok());
        ASSERT(parsed.value().secure);
        ASSERT(parsed.value().host == "my-resource.cognitiveservices.azure.com");
        ASSERT(parsed.value().port == "443");
        ASSERT(parsed.value().target == "/voice-live/realtime?api-version=2025-05-01-preview&model=gpt-4o");

        auto local = parse_ws_url("ws://localhost:9000");
        ASSERT(local.is_ok());
        ASSERT(!local.value().secure);
        ASSERT(local.value().port == "9000");
        ASSERT(local.value().target == "/");

        auto bad = parse_ws_url("ftp://example.com");
        ASSERT(bad.is_error());
        ASSERT(bad.error().type == ErrorType::ParseError);

        ASSERT(target_path("/acs/ws?callerId=123") == "/acs/ws");
        ASSERT(query_param("/acs/ws?callerId=%2B15551234&x=1", "callerId") == std::string("+15551234"));
        ASSERT(query_param("/acs/ws?x=1", "callerId") == std::nullopt);
        ASSERT(query_param("/acs/ws", "callerId") == std::nullopt);
        ASSERT(percent_decode("a+b%20c%zz") == "a b c%zz");
    }

    // --- Routing ---
    {
        ServerConfig server;
        ASSERT(RelayServer::route(server, "/web/ws") == ConnectionType::Web);
        ASSERT(RelayServer::route(server, "/acs/ws") == ConnectionType::Telephony);
        ASSERT(!RelayServer::route(server, "/other").has_value());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All protocol tests passed.\n";
    return 0;
}
