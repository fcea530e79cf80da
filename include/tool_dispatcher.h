#pragma once

#include "message_queue.h"
#include "tool.h"
#include "tool_registry.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace voice_relay {

/**
 * @brief A function call requested by the remote model
 */
struct ToolCallRequest {
    std::string call_id;
    std::string tool_name;  ///< "unknown" when the event carries no name
    nlohmann::json arguments = nlohmann::json::object();
};

/**
 * @brief Outcome of one dispatch
 */
enum class DispatchOutcome {
    Executed,       ///< Tool ran; its result was submitted
    NotFound,       ///< Unknown tool; a failure output was submitted
    Failed,         ///< Tool threw or arguments were undecodable; reply depends on policy
    Dropped         ///< Event unusable (no call_id) or queue closed
};

/**
 * @brief Turns function-call events into function_call_output replies
 *
 * Runs tools in place on the caller's thread (the session's receiver loop),
 * so calls within one session are serialized. Each reply is pushed as one
 * contiguous batch: the conversation.item.create output followed by
 * response.create.
 */
class ToolDispatcher {
public:
    /**
     * @param registry Session-owned tool registry
     * @param queue Session outbound queue
     * @param reply_on_failure Submit a failure output when a tool throws
     * @param connection_id Used in log lines
     */
    ToolDispatcher(ToolRegistry& registry, MessageQueue& queue,
                   bool reply_on_failure, std::string connection_id);

    ToolDispatcher(const ToolDispatcher&) = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;

    /**
     * @brief Handle a response.function_call_arguments.done event
     */
    DispatchOutcome dispatch(const nlohmann::json& event);

    /**
     * @brief Extract call_id, name and arguments from the event
     * @return nullopt if call_id is missing; error text in *error when the
     *         argument string is not a JSON object
     */
    static std::optional<ToolCallRequest> parse_request(const nlohmann::json& event,
                                                        std::string* error);

private:
    bool submit(const std::string& call_id, const ToolResult& result);

    ToolRegistry& registry_;
    MessageQueue& queue_;
    bool reply_on_failure_;
    std::string connection_id_;
};

} // namespace voice_relay
