#include "tools/email_summary_tool.h"
#include "logger.h"

using json = nlohmann::json;

namespace voice_relay {

EmailSummaryTool::EmailSummaryTool(std::shared_ptr<EmailService> email_service,
                                   std::optional<std::string> session_id)
    : email_service_(std::move(email_service)), session_id_(std::move(session_id)) {
}

json EmailSummaryTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["email"] = json::object({
        {"type", "string"},
        {"description", "The recipient's email address"}
    });
    schema["properties"]["summary"] = json::object({
        {"type", "string"},
        {"description", "A concise summary of the call conversation including key points discussed"}
    });
    schema["required"] = json::array({"email", "summary"});
    return schema;
}

ToolResult EmailSummaryTool::execute(const json& args) {
    std::string email = string_arg(args, "email");
    std::string summary = string_arg(args, "summary");

    if (email.empty() || summary.empty()) {
        return ToolResult::error_result("Email and summary are required");
    }

    bool sent = email_service_ &&
                email_service_->send_email_summary(email, "Call Summary", summary, session_id_);

    LOG_TOOL("send_email_summary to " + email + (sent ? " succeeded" : " failed"));
    if (sent) {
        return ToolResult::success_result("Email sent successfully");
    }
    return ToolResult::error_result("Failed to send email");
}

} // namespace voice_relay
