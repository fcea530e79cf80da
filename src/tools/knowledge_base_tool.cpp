#include "tools/knowledge_base_tool.h"
#include "logger.h"
#include "utils.h"

using json = nlohmann::json;

namespace voice_relay {

KnowledgeBaseTool::KnowledgeBaseTool()
    : entries_{
          {"business_hours", "Our business hours are Monday-Friday 9am-5pm EST"},
          {"return_policy", "We offer a 30-day money-back guarantee on all products. "
                            "Items must be in original condition."},
          {"shipping", "Standard shipping takes 5-7 business days. "
                       "Express shipping is available for 2-3 day delivery."},
          {"support", "For technical support, email support@example.com or call 1-800-SUPPORT"},
          {"pricing", "Our pricing varies by plan. Basic plan starts at $9.99/month, "
                      "Professional at $29.99/month, and Enterprise is custom priced."},
          {"contact", "You can reach us at contact@example.com or call 1-800-CONTACT"},
          {"cancellation", "You can cancel your subscription anytime from your account settings. "
                           "No cancellation fees apply."},
          {"warranty", "All products come with a 1-year manufacturer warranty covering defects "
                       "in materials and workmanship."},
      } {
}

json KnowledgeBaseTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["topic"] = json::object({
        {"type", "string"},
        {"description", "The topic to look up. Examples: business_hours, return_policy, "
                        "shipping, support, pricing, contact, cancellation, warranty"}
    });
    schema["properties"]["query"] = json::object({
        {"type", "string"},
        {"description", "Additional context or specific question about the topic"}
    });
    schema["required"] = json::array({"topic"});
    return schema;
}

std::vector<std::string> KnowledgeBaseTool::topics() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.first);
    }
    return names;
}

ToolResult KnowledgeBaseTool::execute(const json& args) {
    std::string topic = utils::to_lower_copy(utils::trim_copy(string_arg(args, "topic")));
    std::string query = string_arg(args, "query");

    if (topic.empty()) {
        return ToolResult::error_result("Missing or invalid 'topic' parameter",
                                        {{"available_topics", topics()}});
    }

    LOG_TOOL("lookup_information topic=\"" + topic + "\"" +
             (query.empty() ? "" : " query=\"" + query + "\""));

    for (const auto& [key, value] : entries_) {
        if (key == topic) {
            return ToolResult::success_result("Found information about " + key,
                                              {{"topic", key}, {"information", value}});
        }
    }

    for (const auto& [key, value] : entries_) {
        if (key.find(topic) != std::string::npos || topic.find(key) != std::string::npos) {
            return ToolResult::success_result("Found information about " + key,
                                              {{"topic", key}, {"information", value}});
        }
    }

    return ToolResult::error_result("No information found for topic: " + topic,
                                    {{"available_topics", topics()}});
}

} // namespace voice_relay
