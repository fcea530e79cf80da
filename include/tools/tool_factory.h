#pragma once

#include "config.h"
#include "email_service.h"
#include "tool_registry.h"
#include <memory>
#include <optional>
#include <string>

namespace voice_relay {

/**
 * @brief Build a fresh registry holding the reference tools
 *
 * To add a tool: implement Tool, then add it to the list in tool_factory.cpp.
 *
 * @param config tools.enabled filters by name (empty = all)
 * @param session_id Captured by tools that tag their output with the session
 * @param email_service Backend for send_email_summary (nullptr = simulated service)
 */
ToolRegistry create_tool_registry(const ToolsConfig& config,
                                  const std::optional<std::string>& session_id,
                                  std::shared_ptr<EmailService> email_service = nullptr);

} // namespace voice_relay
