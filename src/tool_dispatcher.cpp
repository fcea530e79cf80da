#include "tool_dispatcher.h"
#include "logger.h"
#include "protocol.h"

using json = nlohmann::json;

namespace voice_relay {

ToolDispatcher::ToolDispatcher(ToolRegistry& registry, MessageQueue& queue,
                               bool reply_on_failure, std::string connection_id)
    : registry_(registry), queue_(queue), reply_on_failure_(reply_on_failure),
      connection_id_(std::move(connection_id)) {}

std::optional<ToolCallRequest> ToolDispatcher::parse_request(const json& event, std::string* error) {
    auto call_it = event.find("call_id");
    if (call_it == event.end() || !call_it->is_string() || call_it->get<std::string>().empty()) {
        return std::nullopt;
    }

    ToolCallRequest request;
    request.call_id = call_it->get<std::string>();
    auto name_it = event.find("name");
    request.tool_name = name_it != event.end() && name_it->is_string() && !name_it->get_ref<const std::string&>().empty()
                            ? name_it->get<std::string>()
                            : "unknown";

    auto args_it = event.find("arguments");
    if (args_it == event.end() || args_it->is_null()) {
        return request;
    }

    if (args_it->is_object()) {
        request.arguments = *args_it;
    } else if (args_it->is_string()) {
        const std::string& text = args_it->get_ref<const std::string&>();
        if (!text.empty()) {
            try {
                json parsed = json::parse(text);
                if (parsed.is_object()) {
                    request.arguments = std::move(parsed);
                } else if (error) {
                    *error = "arguments are not a JSON object";
                }
            } catch (const json::exception& e) {
                if (error) {
                    *error = std::string("invalid arguments: ") + e.what();
                }
            }
        }
    } else if (error) {
        *error = "arguments are not a JSON object";
    }

    return request;
}

DispatchOutcome ToolDispatcher::dispatch(const json& event) {
    std::string arg_error;
    auto request = parse_request(event, &arg_error);
    if (!request) {
        Logger::warn("[connection_id=" + connection_id_ + "] Function call without call_id, ignoring");
        return DispatchOutcome::Dropped;
    }

    LOG_RELAY(connection_id_, "Function call: " + request->tool_name + " (call_id=" + request->call_id + ")");

    auto tool = registry_.get_tool(request->tool_name);
    if (!tool) {
        Logger::warn("[connection_id=" + connection_id_ + "] Tool not found: " + request->tool_name);
        ToolResult result = ToolResult::error_result("Tool not found: " + request->tool_name);
        return submit(request->call_id, result) ? DispatchOutcome::NotFound : DispatchOutcome::Dropped;
    }

    std::string failure = arg_error;
    ToolResult result;
    if (failure.empty()) {
        try {
            result = tool->execute(request->arguments);
        } catch (const std::exception& e) {
            failure = e.what();
        }
    }

    if (!failure.empty()) {
        Logger::error("[connection_id=" + connection_id_ + "] Tool execution failed for " +
                      request->tool_name + ": " + failure);
        if (!reply_on_failure_) {
            return DispatchOutcome::Failed;
        }
        submit(request->call_id, ToolResult::error_result("Tool execution failed: " + failure));
        return DispatchOutcome::Failed;
    }

    LOG_TOOL(request->tool_name + " -> " + (result.success ? "success" : "failure") + ": " + result.message);
    return submit(request->call_id, result) ? DispatchOutcome::Executed : DispatchOutcome::Dropped;
}

bool ToolDispatcher::submit(const std::string& call_id, const ToolResult& result) {
    std::vector<std::string> batch;
    batch.push_back(protocol::make_function_call_output(call_id, result.to_json().dump()).dump());
    batch.push_back(protocol::make_response_create().dump());
    if (!queue_.push_batch(std::move(batch))) {
        Logger::warn("[connection_id=" + connection_id_ + "] Outbound queue closed, dropping tool output for " + call_id);
        return false;
    }
    return true;
}

} // namespace voice_relay
