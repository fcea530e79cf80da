#include "tools/appointment_booking_tool.h"
#include "logger.h"
#include "utils.h"
#include <cctype>

using json = nlohmann::json;

namespace voice_relay {

namespace {

// Reads min_digits..max_digits decimal digits starting at pos.
bool read_number(const std::string& s, size_t& pos, size_t min_digits, size_t max_digits, int& out) {
    size_t start = pos;
    out = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])) &&
           pos - start < max_digits) {
        out = out * 10 + (s[pos] - '0');
        ++pos;
    }
    return pos - start >= min_digits;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

} // namespace

json AppointmentBookingTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["customer_name"] = json::object({
        {"type", "string"},
        {"description", "The customer's full name"}
    });
    schema["properties"]["date"] = json::object({
        {"type", "string"},
        {"description", "Appointment date in YYYY-MM-DD format"}
    });
    schema["properties"]["time"] = json::object({
        {"type", "string"},
        {"description", "Appointment time in HH:MM format (24-hour)"}
    });
    schema["properties"]["service_type"] = json::object({
        {"type", "string"},
        {"description", "Type of service or meeting (e.g., consultation, support, demo)"}
    });
    schema["properties"]["phone"] = json::object({
        {"type", "string"},
        {"description", "Customer's phone number"}
    });
    schema["required"] = json::array({"customer_name", "date", "time", "service_type"});
    return schema;
}

bool AppointmentBookingTool::is_valid_date(const std::string& date) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    if (!read_number(date, pos, 4, 4, year)) return false;
    if (pos >= date.size() || date[pos++] != '-') return false;
    if (!read_number(date, pos, 1, 2, month)) return false;
    if (pos >= date.size() || date[pos++] != '-') return false;
    if (!read_number(date, pos, 1, 2, day)) return false;
    if (pos != date.size()) return false;

    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1) return false;
    int max_day = days_in_month[month - 1];
    if (month == 2 && is_leap_year(year)) max_day = 29;
    return day <= max_day;
}

bool AppointmentBookingTool::is_valid_time(const std::string& time) {
    size_t pos = 0;
    int hour = 0, minute = 0;
    if (!read_number(time, pos, 1, 2, hour)) return false;
    if (pos >= time.size() || time[pos++] != ':') return false;
    if (!read_number(time, pos, 1, 2, minute)) return false;
    if (pos != time.size()) return false;
    return hour <= 23 && minute <= 59;
}

ToolResult AppointmentBookingTool::execute(const json& args) {
    std::string customer_name = string_arg(args, "customer_name");
    std::string date = string_arg(args, "date");
    std::string time = string_arg(args, "time");
    std::string service_type = string_arg(args, "service_type");
    std::string phone = string_arg(args, "phone", "Not provided");

    if (customer_name.empty() || date.empty() || time.empty() || service_type.empty()) {
        return ToolResult::error_result("Missing required fields for appointment booking");
    }

    if (!is_valid_date(date) || !is_valid_time(time)) {
        return ToolResult::error_result(
            "Invalid date or time format. Use YYYY-MM-DD for date and HH:MM for time.");
    }

    std::string appointment_id = "APT-" + utils::format_local_time("%Y%m%d%H%M%S");

    json appointment = {
        {"appointment_id", appointment_id},
        {"customer_name", customer_name},
        {"date", date},
        {"time", time},
        {"service_type", service_type},
        {"phone", phone},
        {"status", "confirmed"}
    };
    booked_.push_back(appointment);

    LOG_TOOL("Appointment booked: " + appointment.dump());

    return ToolResult::success_result(
        "Appointment successfully booked for " + customer_name + " on " + date + " at " + time,
        {{"appointment_id", appointment_id}, {"details", appointment}});
}

} // namespace voice_relay
