/**
 * Reference tools and the per-session tool registry.
 *
 * Run from build dir: ./test_tools
 */

#include "config.h"
#include "email_service.h"
#include "logger.h"
#include "tool_registry.h"
#include "tools/appointment_booking_tool.h"
#include "tools/email_summary_tool.h"
#include "tools/knowledge_base_tool.h"
#include "tools/order_status_tool.h"
#include "tools/tool_factory.h"
#include "utils.h"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace voice_relay;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

struct SentEmail {
    std::string to;
    std::string summary;
    std::optional<std::string> call_id;
};

class RecordingEmailService : public EmailService {
public:
    bool send_email_summary(const std::string& to_email, const std::string&,
                            const std::string& summary,
                            const std::optional<std::string>& call_id) override {
        sent.push_back({to_email, summary, call_id});
        return accept;
    }

    std::vector<SentEmail> sent;
    bool accept = true;
};

} // namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- lookup_information ---
    {
        KnowledgeBaseTool kb;
        ToolResult shipping = kb.execute({{"topic", "shipping"}});
        ASSERT(shipping.success);
        ASSERT(shipping.fields["topic"] == "shipping");
        ASSERT(shipping.fields["information"].get<std::string>().find("5-7 business days") != std::string::npos);

        ToolResult upper = kb.execute({{"topic", "  Business_Hours "}});
        ASSERT(upper.success);
        ASSERT(upper.fields["topic"] == "business_hours");

        // Substring match either way
        ToolResult partial = kb.execute({{"topic", "return"}});
        ASSERT(partial.success);
        ASSERT(partial.fields["topic"] == "return_policy");
        ToolResult longer = kb.execute({{"topic", "warranty coverage"}});
        ASSERT(longer.success);
        ASSERT(longer.fields["topic"] == "warranty");

        ToolResult missing = kb.execute({{"topic", "nonexistent_topic"}});
        ASSERT(!missing.success);
        ASSERT(missing.message == "No information found for topic: nonexistent_topic");
        ASSERT(missing.fields["available_topics"].is_array());
        ASSERT(missing.fields["available_topics"].size() == 8);
        ASSERT(missing.fields["available_topics"][0] == "business_hours");

        ToolResult empty = kb.execute(json::object());
        ASSERT(!empty.success);

        json serialized = shipping.to_json();
        ASSERT(serialized["success"] == true);
        ASSERT(serialized["message"] == "Found information about shipping");
    }

    // --- check_order_status ---
    {
        OrderStatusTool orders;
        ToolResult shipped = orders.execute({{"order_id", "ORD-12345"}});
        ASSERT(shipped.success);
        ASSERT(shipped.fields["status"] == "shipped");
        ASSERT(shipped.fields["tracking_number"] == "1Z999AA10123456784");
        ASSERT(shipped.fields["estimated_delivery"] == utils::format_local_time("%Y-%m-%d", 2));
        ASSERT(shipped.fields["items"].size() == 2);

        ToolResult lower = orders.execute({{"order_id", "ord-67890"}});
        ASSERT(lower.success);
        ASSERT(lower.fields["status"] == "processing");
        ASSERT(!lower.fields.contains("tracking_number"));

        ToolResult unknown = orders.execute({{"order_id", "ORD-00000"}});
        ASSERT(!unknown.success);
        ASSERT(unknown.message.find("ORD-00000 not found") != std::string::npos);
        ASSERT(unknown.fields.contains("suggestion"));
    }

    // --- book_appointment ---
    {
        AppointmentBookingTool booking;
        ToolResult ok = booking.execute({
            {"customer_name", "Ana"}, {"date", "2025-03-14"}, {"time", "14:30"},
            {"service_type", "consultation"}});
        ASSERT(ok.success);
        ASSERT(ok.message == "Appointment successfully booked for Ana on 2025-03-14 at 14:30");
        ASSERT(utils::starts_with(ok.fields["appointment_id"].get<std::string>(), "APT-"));
        ASSERT(ok.fields["appointment_id"].get<std::string>().size() == 18);
        ASSERT(ok.fields["details"]["status"] == "confirmed");
        ASSERT(ok.fields["details"]["phone"] == "Not provided");
        ASSERT(booking.booked_appointments().size() == 1);

        ToolResult missing = booking.execute({{"customer_name", "Ana"}, {"date", "2025-03-14"}});
        ASSERT(!missing.success);
        ASSERT(missing.message == "Missing required fields for appointment booking");

        ToolResult bad_date = booking.execute({
            {"customer_name", "Ana"}, {"date", "2025-02-30"}, {"time", "10:00"},
            {"service_type", "repair"}});
        ASSERT(!bad_date.success);
        ASSERT(bad_date.message == "Invalid date or time format. Use YYYY-MM-DD for date and HH:MM for time.");
        ASSERT(booking.booked_appointments().size() == 1);

        ASSERT(AppointmentBookingTool::is_valid_date("2024-02-29"));
        ASSERT(!AppointmentBookingTool::is_valid_date("2023-02-29"));
        ASSERT(!AppointmentBookingTool::is_valid_date("14/03/2025"));
        ASSERT(AppointmentBookingTool::is_valid_time("9:05"));
        ASSERT(!AppointmentBookingTool::is_valid_time("24:00"));
        ASSERT(!AppointmentBookingTool::is_valid_time("12:60"));
    }

    // --- send_email_summary carries the session id ---
    {
        auto service = std::make_shared<RecordingEmailService>();
        EmailSummaryTool tool(service, std::string("session-1"));
        ToolResult sent = tool.execute({{"email", "a@example.com"}, {"summary", "Call went well"}});
        ASSERT(sent.success);
        ASSERT(sent.message == "Email sent successfully");
        ASSERT(service->sent.size() == 1);
        ASSERT(service->sent[0].call_id == std::string("session-1"));

        ToolResult missing = tool.execute({{"email", "a@example.com"}});
        ASSERT(!missing.success);
        ASSERT(missing.message == "Email and summary are required");

        service->accept = false;
        ToolResult rejected = tool.execute({{"email", "a@example.com"}, {"summary", "x"}});
        ASSERT(!rejected.success);
        ASSERT(rejected.message == "Failed to send email");
    }

    // --- Registry: last registration wins, definitions, factory ---
    {
        ToolRegistry registry;
        ASSERT(registry.register_tool(std::make_shared<KnowledgeBaseTool>()));
        ASSERT(registry.register_tool(std::make_shared<KnowledgeBaseTool>()));
        ASSERT(registry.size() == 1);
        ASSERT(registry.has_tool("lookup_information"));
        ASSERT(registry.get_tool("missing") == nullptr);

        json defs = registry.get_function_definitions();
        ASSERT(defs.is_array());
        ASSERT(defs.size() == 1);
        ASSERT(defs[0]["type"] == "function");
        ASSERT(defs[0]["name"] == "lookup_information");
        ASSERT(defs[0]["parameters"]["required"][0] == "topic");

        ASSERT(registry.unregister_tool("lookup_information"));
        ASSERT(!registry.unregister_tool("lookup_information"));
        ASSERT(registry.size() == 0);

        // Registration order is kept; replacing a tool keeps its position
        ToolRegistry ordered;
        ordered.register_tool(std::make_shared<OrderStatusTool>());
        ordered.register_tool(std::make_shared<KnowledgeBaseTool>());
        ordered.register_tool(std::make_shared<AppointmentBookingTool>());
        ordered.register_tool(std::make_shared<OrderStatusTool>());
        ASSERT(ordered.get_tool_names() ==
               std::vector<std::string>({"check_order_status", "lookup_information", "book_appointment"}));
        ASSERT(ordered.get_function_definitions()[2]["name"] == "book_appointment");
        ASSERT(ordered.unregister_tool("lookup_information"));
        ASSERT(ordered.get_tool_names() ==
               std::vector<std::string>({"check_order_status", "book_appointment"}));

        ToolsConfig all;
        ToolRegistry full = create_tool_registry(all, std::string("s1"));
        ASSERT(full.size() == 4);
        ASSERT(full.get_tool_names() == std::vector<std::string>({
            "send_email_summary", "book_appointment", "lookup_information", "check_order_status"}));
        ASSERT(full.has_tool("send_email_summary"));
        ASSERT(full.has_tool("book_appointment"));
        ASSERT(full.has_tool("lookup_information"));
        ASSERT(full.has_tool("check_order_status"));

        ToolsConfig some;
        some.enabled = {"check_order_status", "no_such_tool"};
        ToolRegistry partial = create_tool_registry(some, std::nullopt);
        ASSERT(partial.size() == 1);
        ASSERT(partial.has_tool("check_order_status"));

        // Registries built for two sessions do not share tool instances
        ToolRegistry other = create_tool_registry(all, std::string("s2"));
        ASSERT(other.get_tool("book_appointment") != full.get_tool("book_appointment"));
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All tool tests passed.\n";
    return 0;
}
