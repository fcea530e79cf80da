#include "tool_registry.h"
#include "logger.h"
#include <algorithm>

using json = nlohmann::json;

namespace voice_relay {

std::vector<std::shared_ptr<Tool>>::const_iterator ToolRegistry::find(const std::string& name) const {
    return std::find_if(tools_.begin(), tools_.end(),
                        [&name](const std::shared_ptr<Tool>& tool) { return tool->name() == name; });
}

bool ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        Logger::error("Attempted to register null tool");
        return false;
    }

    std::string name = tool->name();
    auto it = find(name);
    if (it != tools_.end()) {
        Logger::warn("Tool '" + name + "' is already registered. Replacing.");
        tools_[static_cast<size_t>(it - tools_.begin())] = tool;
    } else {
        tools_.push_back(tool);
    }

    Logger::debug("Registered tool: " + name);
    return true;
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    auto it = find(name);
    if (it == tools_.end()) {
        return false;
    }
    tools_.erase(it);
    Logger::debug("Unregistered tool: " + name);
    return true;
}

std::shared_ptr<Tool> ToolRegistry::get_tool(const std::string& name) const {
    auto it = find(name);
    if (it != tools_.end()) {
        return *it;
    }
    return nullptr;
}

std::vector<std::string> ToolRegistry::get_tool_names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& tool : tools_) {
        names.push_back(tool->name());
    }
    return names;
}

json ToolRegistry::get_function_definitions() const {
    json tools_array = json::array();
    for (const auto& tool : tools_) {
        try {
            tools_array.push_back(tool->to_function_definition());
        } catch (const json::exception& e) {
            Logger::error("Failed to build function definition for tool '" + tool->name() + "': " + e.what());
        }
    }
    return tools_array;
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return find(name) != tools_.end();
}

} // namespace voice_relay
