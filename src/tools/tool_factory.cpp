#include "tools/tool_factory.h"
#include "tools/appointment_booking_tool.h"
#include "tools/email_summary_tool.h"
#include "tools/knowledge_base_tool.h"
#include "tools/order_status_tool.h"
#include "logger.h"
#include <algorithm>
#include <vector>

namespace voice_relay {

ToolRegistry create_tool_registry(const ToolsConfig& config,
                                  const std::optional<std::string>& session_id,
                                  std::shared_ptr<EmailService> email_service) {
    if (!email_service) {
        email_service = std::make_shared<EmailService>();
    }

    std::vector<std::shared_ptr<Tool>> available = {
        std::make_shared<EmailSummaryTool>(email_service, session_id),
        std::make_shared<AppointmentBookingTool>(),
        std::make_shared<KnowledgeBaseTool>(),
        std::make_shared<OrderStatusTool>(),
    };

    ToolRegistry registry;
    for (const auto& tool : available) {
        if (!config.enabled.empty() &&
            std::find(config.enabled.begin(), config.enabled.end(), tool->name()) == config.enabled.end()) {
            continue;
        }
        registry.register_tool(tool);
    }

    for (const auto& name : config.enabled) {
        if (!registry.has_tool(name)) {
            Logger::warn("Unknown tool name in config: " + name);
        }
    }

    Logger::debug("Initialized tool registry with " + std::to_string(registry.size()) + " tools");
    return registry;
}

} // namespace voice_relay
