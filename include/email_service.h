#pragma once

#include <optional>
#include <string>

namespace voice_relay {

/**
 * @brief Delivers call summaries by email
 *
 * Simulated: the message is written to the log and reported as sent.
 */
class EmailService {
public:
    EmailService();
    virtual ~EmailService() = default;

    /**
     * @brief Send a call summary
     * @param to_email Recipient address
     * @param subject Subject line
     * @param summary Body text
     * @param call_id Session the summary belongs to, if known
     * @return true if the message was accepted for delivery
     */
    virtual bool send_email_summary(const std::string& to_email,
                                    const std::string& subject,
                                    const std::string& summary,
                                    const std::optional<std::string>& call_id);
};

} // namespace voice_relay
