#ifndef VALR_RESPONSE_ADAPTER_HPP
#define VALR_RESPONSE_ADAPTER_HPP

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "trader/data_structures/data_structures.hpp"

namespace ValrTrader {
namespace API {

using json = nlohmann::json;

/**
 * Converts exchange response documents into canonical types.
 * This is the only place that knows the exchange's field names and casings.
 */
class ValrResponseAdapter {
public:
    static Core::OrderStatus normalize_status(const std::string& raw_status);
    static Core::OrderStatusReport parse_order_status(const json& response, const std::string& order_id);
    static Core::OrderBook parse_order_book(const json& response, const std::string& pair);
    static std::map<std::string, Core::Decimal> parse_balances(const json& response);
    static std::string extract_order_id(const json& response);
    static std::vector<Core::OpenOrder> parse_open_orders(const json& response);
    // Untagged entries are kept unless require_order_id is set (pair-wide trade history).
    static std::vector<Core::OrderFill> parse_fills(const json& response, const std::string& order_id,
                                                    bool require_order_id = false);
    static Core::Decimal parse_last_traded_price(const json& response, const std::string& pair);
    static long long parse_server_time(const json& response);

    // Field helpers: first present, non-null candidate wins
    static std::optional<Core::Decimal> decimal_field(const json& object, std::initializer_list<const char*> field_names);
    static std::string string_field(const json& object, std::initializer_list<const char*> field_names);
    static std::optional<Core::Decimal> decimal_from_json(const json& value);

private:
    static const json& unwrap_array(const json& response, const char* wrapper_field);
};

} // namespace API
} // namespace ValrTrader

#endif // VALR_RESPONSE_ADAPTER_HPP
