#include "entry_pricing_strategy.hpp"
#include <stdexcept>

namespace ValrTrader {
namespace Core {

EntryOrderPlan CrossAskPricingStrategy::plan_entry(const OrderBook& order_book, const Config::PairSettings& pair_settings) const {
    EntryOrderPlan entry_plan;
    entry_plan.order_type = EntryOrderType::LIMIT;
    entry_plan.price = DecimalUtils::round_to_tick(order_book.best_ask(), pair_settings.tick_size);
    return entry_plan;
}

EntryOrderPlan JoinBidPricingStrategy::plan_entry(const OrderBook& order_book, const Config::PairSettings& pair_settings) const {
    EntryOrderPlan entry_plan;
    entry_plan.order_type = EntryOrderType::POST_ONLY_LIMIT;
    entry_plan.price = DecimalUtils::round_to_tick(order_book.best_bid(), pair_settings.tick_size);
    return entry_plan;
}

EntryOrderPlan MarketEntryPricingStrategy::plan_entry(const OrderBook& order_book, const Config::PairSettings&) const {
    EntryOrderPlan entry_plan;
    entry_plan.order_type = EntryOrderType::MARKET;
    entry_plan.price = order_book.best_ask();
    return entry_plan;
}

std::unique_ptr<EntryPricingStrategy> create_entry_pricing_strategy(Config::EntryPricingMode pricing_mode) {
    switch (pricing_mode) {
        case Config::EntryPricingMode::CROSS_ASK:
            return std::make_unique<CrossAskPricingStrategy>();
        case Config::EntryPricingMode::JOIN_BID:
            return std::make_unique<JoinBidPricingStrategy>();
        case Config::EntryPricingMode::MARKET:
            return std::make_unique<MarketEntryPricingStrategy>();
    }
    throw std::runtime_error("Unknown entry pricing mode");
}

std::string to_string(EntryOrderType order_type) {
    switch (order_type) {
        case EntryOrderType::LIMIT: return "LIMIT";
        case EntryOrderType::POST_ONLY_LIMIT: return "POST_ONLY_LIMIT";
        case EntryOrderType::MARKET: return "MARKET";
    }
    throw std::runtime_error("Unknown entry order type");
}

} // namespace Core
} // namespace ValrTrader
