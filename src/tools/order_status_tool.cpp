#include "tools/order_status_tool.h"
#include "logger.h"
#include "utils.h"

using json = nlohmann::json;

namespace voice_relay {

OrderStatusTool::OrderStatusTool() {
    orders_["ORD-12345"] = Order{
        "ORD-12345", "shipped", {"Product A", "Product B"}, "$149.99",
        std::string("1Z999AA10123456784"), utils::format_local_time("%Y-%m-%d", 2)};
    orders_["ORD-67890"] = Order{
        "ORD-67890", "processing", {"Product C"}, "$79.99",
        std::nullopt, utils::format_local_time("%Y-%m-%d", 5)};
}

json OrderStatusTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["order_id"] = json::object({
        {"type", "string"},
        {"description", "The order ID or order number (e.g., ORD-12345)"}
    });
    schema["properties"]["email"] = json::object({
        {"type", "string"},
        {"description", "Customer's email address associated with the order (for verification)"}
    });
    schema["required"] = json::array({"order_id"});
    return schema;
}

ToolResult OrderStatusTool::execute(const json& args) {
    std::string order_id = utils::to_upper_copy(utils::trim_copy(string_arg(args, "order_id")));

    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return ToolResult::error_result(
            "Order " + order_id + " not found. Please verify the order number is correct.",
            {{"suggestion", "Try checking your order confirmation email for the correct order number."}});
    }

    const Order& order = it->second;
    json fields = {
        {"order_id", order.order_id},
        {"status", order.status},
        {"items", order.items},
        {"total", order.total},
        {"estimated_delivery", order.estimated_delivery}
    };

    std::string message;
    if (order.tracking_number) {
        fields["tracking_number"] = *order.tracking_number;
        message = "Order " + order_id + " is " + order.status + ". Tracking number: " + *order.tracking_number;
    } else {
        message = "Order " + order_id + " is " + order.status + ". No tracking number yet.";
    }

    LOG_TOOL("Order status retrieved: " + order_id);
    return ToolResult::success_result(message, fields);
}

} // namespace voice_relay
