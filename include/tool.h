#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace voice_relay {

/**
 * @brief Structured outcome of a tool call
 *
 * Serialized as a flat JSON object: {"success": ..., "message": ..., <fields>}.
 */
struct ToolResult {
    bool success = false;
    std::string message;
    nlohmann::json fields = nlohmann::json::object();  // Extra result fields (topic, status, ...)

    static ToolResult success_result(const std::string& message,
                                     nlohmann::json fields = nlohmann::json::object()) {
        ToolResult result;
        result.success = true;
        result.message = message;
        result.fields = std::move(fields);
        return result;
    }

    static ToolResult error_result(const std::string& message,
                                   nlohmann::json fields = nlohmann::json::object()) {
        ToolResult result;
        result.success = false;
        result.message = message;
        result.fields = std::move(fields);
        return result;
    }

    nlohmann::json to_json() const {
        nlohmann::json out = fields.is_object() ? fields : nlohmann::json::object();
        out["success"] = success;
        out["message"] = message;
        return out;
    }
};

/**
 * @brief Read a string argument; missing, null or non-string values yield default_val
 */
inline std::string string_arg(const nlohmann::json& args, const std::string& key,
                              const std::string& default_val = "") {
    if (!args.is_object()) return default_val;
    auto it = args.find(key);
    if (it == args.end() || !it->is_string()) return default_val;
    return it->get<std::string>();
}

/**
 * @brief Abstract base class for all tools
 *
 * Tools are functions the remote voice model can call during a conversation.
 * Each tool must provide:
 * - A unique name
 * - A clear description (for the model)
 * - A JSON schema for parameters
 * - An execute method that performs the tool's action
 *
 * execute() may throw; the dispatcher treats a throw as an execution failure.
 */
class Tool {
public:
    virtual ~Tool() = default;

    /**
     * @brief Get the tool's unique name
     * @return Tool name (e.g., "lookup_information")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Get the tool's description for the model
     */
    virtual std::string description() const = 0;

    /**
     * @brief Get the JSON schema for tool parameters
     * @return JSON schema object describing the tool's parameters
     */
    virtual nlohmann::json parameter_schema() const = 0;

    /**
     * @brief Execute the tool with decoded arguments
     * @param args JSON object of arguments
     * @return ToolResult with success flag, message and extra fields
     */
    virtual ToolResult execute(const nlohmann::json& args) = 0;

    /**
     * @brief Function definition in the realtime session format
     * @return {"type": "function", "name", "description", "parameters"}
     */
    nlohmann::json to_function_definition() const {
        return {
            {"type", "function"},
            {"name", name()},
            {"description", description()},
            {"parameters", parameter_schema()}
        };
    }
};

} // namespace voice_relay
