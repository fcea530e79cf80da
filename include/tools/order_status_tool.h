#pragma once

#include "tool.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace voice_relay {

/**
 * @brief Tool for order status and tracking lookup (demo order book)
 */
class OrderStatusTool : public Tool {
public:
    OrderStatusTool();

    std::string name() const override { return "check_order_status"; }

    std::string description() const override {
        return "Checks the status of a customer's order. "
               "Use this when the user wants to know about their order status, tracking, "
               "or delivery information.";
    }

    nlohmann::json parameter_schema() const override;

    ToolResult execute(const nlohmann::json& args) override;

private:
    struct Order {
        std::string order_id;
        std::string status;
        std::vector<std::string> items;
        std::string total;
        std::optional<std::string> tracking_number;
        std::string estimated_delivery;  // YYYY-MM-DD
    };

    std::map<std::string, Order> orders_;
};

} // namespace voice_relay
