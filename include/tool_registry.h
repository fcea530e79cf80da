#pragma once

#include "tool.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace voice_relay {

/**
 * @brief Per-session registry of available tools
 *
 * Each session builds its own registry so tool state (captured session id,
 * bookings made during the call) stays with that session. Tools keep their
 * registration order, which is the order advertised upstream. Not thread-safe:
 * tools are registered before streaming starts and looked up from the
 * session's receiver thread only.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with the registry
     * @param tool Shared pointer to tool instance
     * @return true if registered; a tool with the same name is replaced in
     *         place (last wins, position kept)
     */
    bool register_tool(std::shared_ptr<Tool> tool);

    /**
     * @brief Remove a tool by name
     * @return true if a tool was removed
     */
    bool unregister_tool(const std::string& name);

    /**
     * @brief Get a tool by name
     * @return Shared pointer to tool, or nullptr if not found
     */
    std::shared_ptr<Tool> get_tool(const std::string& name) const;

    /// Tool names in registration order
    std::vector<std::string> get_tool_names() const;

    /**
     * @brief Function definitions for the session.update "tools" array
     * @return JSON array of {"type": "function", "name", "description", "parameters"}
     */
    nlohmann::json get_function_definitions() const;

    bool has_tool(const std::string& name) const;

    size_t size() const { return tools_.size(); }

private:
    std::vector<std::shared_ptr<Tool>>::const_iterator find(const std::string& name) const;

    std::vector<std::shared_ptr<Tool>> tools_;
};

} // namespace voice_relay
