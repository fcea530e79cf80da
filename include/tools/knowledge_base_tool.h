#pragma once

#include "tool.h"
#include <string>
#include <utility>
#include <vector>

namespace voice_relay {

/**
 * @brief Tool for company information lookup (policies, hours, pricing)
 */
class KnowledgeBaseTool : public Tool {
public:
    KnowledgeBaseTool();

    std::string name() const override { return "lookup_information"; }

    std::string description() const override {
        return "Looks up information from the company knowledge base. "
               "Use this when the user asks about business hours, policies, pricing, shipping, "
               "support, or other company information.";
    }

    nlohmann::json parameter_schema() const override;

    ToolResult execute(const nlohmann::json& args) override;

    std::vector<std::string> topics() const;

private:
    // Ordered: fuzzy matching returns the first entry that matches
    std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace voice_relay
