#pragma once

#include "tool.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace voice_relay {

/**
 * @brief Tool for booking appointments (in-memory, per session)
 */
class AppointmentBookingTool : public Tool {
public:
    std::string name() const override { return "book_appointment"; }

    std::string description() const override {
        return "Books an appointment for the customer. "
               "Use this when the user wants to schedule a meeting, consultation, or service.";
    }

    nlohmann::json parameter_schema() const override;

    ToolResult execute(const nlohmann::json& args) override;

    /// Appointments confirmed during this session, oldest first
    const std::vector<nlohmann::json>& booked_appointments() const { return booked_; }

    /// Strict YYYY-MM-DD check that also rejects impossible days (2025-02-30)
    static bool is_valid_date(const std::string& date);

    /// HH:MM in 24-hour form; a single-digit hour is accepted
    static bool is_valid_time(const std::string& time);

private:
    std::vector<nlohmann::json> booked_;
};

} // namespace voice_relay
