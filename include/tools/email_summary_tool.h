#pragma once

#include "tool.h"
#include "email_service.h"
#include <memory>
#include <optional>
#include <string>

namespace voice_relay {

/**
 * @brief Tool for emailing a summary of the call
 *
 * The session id captured at construction is attached to every email, which
 * is why each session gets its own instance.
 */
class EmailSummaryTool : public Tool {
public:
    /**
     * @param email_service Delivery backend
     * @param session_id Session the summaries belong to
     */
    EmailSummaryTool(std::shared_ptr<EmailService> email_service,
                     std::optional<std::string> session_id);

    std::string name() const override { return "send_email_summary"; }

    std::string description() const override {
        return "Sends an email with a summary of the call conversation. "
               "Use this when the user requests a summary or when the call is ending.";
    }

    nlohmann::json parameter_schema() const override;

    ToolResult execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<EmailService> email_service_;
    std::optional<std::string> session_id_;
};

} // namespace voice_relay
