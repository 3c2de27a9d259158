#include "valr_response_adapter.hpp"
#include "api/general/api_errors.hpp"
#include "logging/logs/api_logs.hpp"
#include <algorithm>
#include <cctype>

using ValrTrader::Logging::ApiLogs;

namespace ValrTrader {
namespace API {

namespace {
    const json& empty_array() {
        static const json empty_array_value = json::array();
        return empty_array_value;
    }

    std::string normalize_status_text(const std::string& raw_status) {
        std::string normalized_status;
        for (char current_char : raw_status) {
            if (current_char == '_' || current_char == '-') {
                normalized_status.push_back(' ');
            } else {
                normalized_status.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(current_char))));
            }
        }
        std::string::size_type begin_position = normalized_status.find_first_not_of(' ');
        std::string::size_type end_position = normalized_status.find_last_not_of(' ');
        if (begin_position == std::string::npos) return "";
        return normalized_status.substr(begin_position, end_position - begin_position + 1);
    }
}

std::optional<Core::Decimal> ValrResponseAdapter::decimal_from_json(const json& value) {
    try {
        if (value.is_string()) {
            return DecimalUtils::parse_decimal(value.get<std::string>());
        }
        if (value.is_number()) {
            return DecimalUtils::parse_decimal(value.dump());
        }
    } catch (const std::runtime_error& parse_exception_error) {
        ApiLogs::log_response_warning("Decimal field", parse_exception_error.what());
    }
    return std::nullopt;
}

std::optional<Core::Decimal> ValrResponseAdapter::decimal_field(const json& object, std::initializer_list<const char*> field_names) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    for (const char* field_name : field_names) {
        json::const_iterator field_iterator = object.find(field_name);
        if (field_iterator != object.end() && !field_iterator->is_null()) {
            std::optional<Core::Decimal> parsed_value = decimal_from_json(*field_iterator);
            if (parsed_value) {
                return parsed_value;
            }
        }
    }
    return std::nullopt;
}

std::string ValrResponseAdapter::string_field(const json& object, std::initializer_list<const char*> field_names) {
    if (!object.is_object()) {
        return "";
    }
    for (const char* field_name : field_names) {
        json::const_iterator field_iterator = object.find(field_name);
        if (field_iterator == object.end() || field_iterator->is_null()) {
            continue;
        }
        if (field_iterator->is_string()) {
            return field_iterator->get<std::string>();
        }
        if (field_iterator->is_number()) {
            return field_iterator->dump();
        }
    }
    return "";
}

const json& ValrResponseAdapter::unwrap_array(const json& response, const char* wrapper_field) {
    if (response.is_array()) {
        return response;
    }
    if (response.is_object()) {
        json::const_iterator wrapper_iterator = response.find(wrapper_field);
        if (wrapper_iterator != response.end() && wrapper_iterator->is_array()) {
            return *wrapper_iterator;
        }
    }
    return empty_array();
}

Core::OrderStatus ValrResponseAdapter::normalize_status(const std::string& raw_status) {
    std::string normalized_status = normalize_status_text(raw_status);

    if (normalized_status == "filled" || normalized_status == "completed" || normalized_status == "complete") {
        return Core::OrderStatus::FILLED;
    }
    if (normalized_status == "partially filled" || normalized_status == "partial" || normalized_status == "partial fill") {
        return Core::OrderStatus::PARTIALLY_FILLED;
    }
    if (normalized_status == "cancelled" || normalized_status == "canceled" || normalized_status == "failed" ||
        normalized_status == "rejected" || normalized_status == "expired") {
        return Core::OrderStatus::CANCELLED;
    }
    if (!normalized_status.empty() && normalized_status != "placed" && normalized_status != "active" &&
        normalized_status != "open" && normalized_status != "new" && normalized_status != "pending") {
        ApiLogs::log_response_warning("Order status", "unrecognised status '" + raw_status + "' treated as pending");
    }
    return Core::OrderStatus::PENDING;
}

Core::OrderStatusReport ValrResponseAdapter::parse_order_status(const json& response, const std::string& order_id) {
    if (!response.is_object()) {
        throw ApiError("Order status response for " + order_id + " is not an object", "INVALID_RESPONSE", 200);
    }

    Core::OrderStatusReport status_report;
    status_report.order_id = order_id;
    status_report.raw_status = string_field(response, {"orderStatusType", "status", "orderStatus", "state"});
    status_report.status = normalize_status(status_report.raw_status);
    status_report.original_quantity = decimal_field(response, {"originalQuantity", "quantity", "baseAmount"});
    status_report.average_price = decimal_field(response, {"averagePrice", "avgPrice", "averageFilledPrice", "executedPrice"});

    std::optional<Core::Decimal> reported_filled = decimal_field(response, {"filledQuantity", "executedQuantity",
                                                                           "cumulativeQuantity", "totalExecutedQuantity"});
    if (reported_filled) {
        status_report.filled_quantity = reported_filled;
    } else {
        std::optional<Core::Decimal> remaining_quantity = decimal_field(response, {"remainingQuantity"});
        if (status_report.original_quantity && remaining_quantity) {
            status_report.filled_quantity = *status_report.original_quantity - *remaining_quantity;
        }
    }

    if (status_report.filled_quantity && *status_report.filled_quantity < 0) {
        status_report.filled_quantity = Core::Decimal(0);
    }
    if (status_report.status == Core::OrderStatus::PENDING && status_report.filled_quantity &&
        *status_report.filled_quantity > 0) {
        status_report.status = Core::OrderStatus::PARTIALLY_FILLED;
    }
    return status_report;
}

Core::OrderBook ValrResponseAdapter::parse_order_book(const json& response, const std::string& pair) {
    Core::OrderBook order_book;
    order_book.pair = pair;
    if (!response.is_object()) {
        throw ApiError("Order book response for " + pair + " is not an object", "INVALID_RESPONSE", 200);
    }

    auto parse_side = [&](std::initializer_list<const char*> side_names, std::vector<Core::OrderBookLevel>& levels) {
        for (const char* side_name : side_names) {
            json::const_iterator side_iterator = response.find(side_name);
            if (side_iterator == response.end() || !side_iterator->is_array()) {
                continue;
            }
            for (const json& level_json : *side_iterator) {
                std::optional<Core::Decimal> level_price = decimal_field(level_json, {"price"});
                std::optional<Core::Decimal> level_quantity = decimal_field(level_json, {"quantity", "size"});
                if (!level_price || !level_quantity) {
                    ApiLogs::log_response_warning("Order book " + pair, "skipping malformed level " + level_json.dump());
                    continue;
                }
                levels.push_back(Core::OrderBookLevel{*level_price, *level_quantity});
            }
            return;
        }
    };

    parse_side({"Bids", "bids"}, order_book.bids);
    parse_side({"Asks", "asks"}, order_book.asks);

    std::sort(order_book.bids.begin(), order_book.bids.end(),
              [](const Core::OrderBookLevel& left, const Core::OrderBookLevel& right) { return left.price > right.price; });
    std::sort(order_book.asks.begin(), order_book.asks.end(),
              [](const Core::OrderBookLevel& left, const Core::OrderBookLevel& right) { return left.price < right.price; });
    return order_book;
}

std::map<std::string, Core::Decimal> ValrResponseAdapter::parse_balances(const json& response) {
    std::map<std::string, Core::Decimal> balances;
    for (const json& balance_json : unwrap_array(response, "balances")) {
        std::string currency = string_field(balance_json, {"currency", "asset"});
        std::optional<Core::Decimal> available_amount = decimal_field(balance_json, {"available", "free"});
        if (currency.empty() || !available_amount) {
            ApiLogs::log_response_warning("Balances", "skipping malformed entry " + balance_json.dump());
            continue;
        }
        balances[currency] = *available_amount;
    }
    return balances;
}

std::string ValrResponseAdapter::extract_order_id(const json& response) {
    std::string order_id = string_field(response, {"id", "orderId"});
    if (order_id.empty()) {
        throw ApiError("Order response missing id: " + response.dump(), "INVALID_RESPONSE", 200);
    }
    return order_id;
}

std::vector<Core::OpenOrder> ValrResponseAdapter::parse_open_orders(const json& response) {
    std::vector<Core::OpenOrder> open_orders;
    for (const json& order_json : unwrap_array(response, "orders")) {
        Core::OpenOrder open_order;
        open_order.order_id = string_field(order_json, {"orderId", "id"});
        open_order.pair = string_field(order_json, {"currencyPair", "pair"});
        std::string side_string = string_field(order_json, {"side"});
        std::optional<Core::Decimal> order_quantity = decimal_field(order_json, {"remainingQuantity", "originalQuantity", "quantity", "baseAmount"});
        std::optional<Core::Decimal> order_price = decimal_field(order_json, {"price", "limitPrice", "originalPrice", "orderPrice"});
        if (open_order.order_id.empty() || open_order.pair.empty() || side_string.empty() || !order_quantity || !order_price) {
            ApiLogs::log_response_warning("Open orders", "skipping malformed entry " + order_json.dump());
            continue;
        }
        try {
            open_order.side = Core::parse_order_side(side_string);
        } catch (const std::runtime_error& side_exception_error) {
            ApiLogs::log_response_warning("Open orders", side_exception_error.what());
            continue;
        }
        open_order.quantity = *order_quantity;
        open_order.price = *order_price;
        open_order.created_at = string_field(order_json, {"createdAt", "orderCreatedAt"});
        open_orders.push_back(open_order);
    }
    return open_orders;
}

std::vector<Core::OrderFill> ValrResponseAdapter::parse_fills(const json& response, const std::string& order_id,
                                                              bool require_order_id) {
    std::vector<Core::OrderFill> fills;
    for (const json& fill_json : unwrap_array(response, "fills")) {
        std::string fill_order_id = string_field(fill_json, {"orderId"});
        if (fill_order_id.empty() && require_order_id) {
            continue;
        }
        if (!fill_order_id.empty() && fill_order_id != order_id) {
            continue;
        }
        std::optional<Core::Decimal> fill_price = decimal_field(fill_json, {"price"});
        std::optional<Core::Decimal> fill_quantity = decimal_field(fill_json, {"quantity", "baseAmount"});
        if (!fill_price || !fill_quantity) {
            ApiLogs::log_response_warning("Fills for " + order_id, "skipping malformed entry " + fill_json.dump());
            continue;
        }
        fills.push_back(Core::OrderFill{order_id, *fill_price, *fill_quantity});
    }
    return fills;
}

Core::Decimal ValrResponseAdapter::parse_last_traded_price(const json& response, const std::string& pair) {
    std::optional<Core::Decimal> last_price = decimal_field(response, {"lastTradedPrice", "markPrice", "price"});
    if (!last_price || *last_price <= 0) {
        throw ApiError("Market summary for " + pair + " has no usable price", "INVALID_RESPONSE", 200);
    }
    return *last_price;
}

long long ValrResponseAdapter::parse_server_time(const json& response) {
    if (response.is_object()) {
        json::const_iterator epoch_iterator = response.find("epochTime");
        if (epoch_iterator != response.end() && epoch_iterator->is_number_integer()) {
            return epoch_iterator->get<long long>() * 1000;
        }
    }
    throw ApiError("Server time response missing epochTime: " + response.dump(), "INVALID_RESPONSE", 200);
}

} // namespace API
} // namespace ValrTrader
