#include "email_service.h"
#include "logger.h"

namespace voice_relay {

EmailService::EmailService() {
    Logger::debug("Email service initialized in MOCK mode - emails will be simulated");
}

bool EmailService::send_email_summary(const std::string& to_email,
                                      const std::string& subject,
                                      const std::string& summary,
                                      const std::optional<std::string>& call_id) {
    const std::string rule(70, '=');
    Logger::info(rule);
    Logger::info("SIMULATED EMAIL SENT");
    Logger::info(rule);
    Logger::info("To: " + to_email);
    Logger::info("Subject: " + subject);
    Logger::info("Call ID: " + call_id.value_or("N/A"));
    Logger::info(std::string(70, '-'));
    Logger::info("Summary Content:");
    Logger::info(summary);
    Logger::info(rule);
    return true;
}

} // namespace voice_relay
