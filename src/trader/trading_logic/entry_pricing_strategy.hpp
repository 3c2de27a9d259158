#ifndef ENTRY_PRICING_STRATEGY_HPP
#define ENTRY_PRICING_STRATEGY_HPP

#include <memory>
#include <string>
#include "configs/pair_config.hpp"
#include "configs/strategy_config.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace ValrTrader {
namespace Core {

enum class EntryOrderType { LIMIT, POST_ONLY_LIMIT, MARKET };

// Price is the limit price, or the estimated execution price for market entries.
struct EntryOrderPlan {
    EntryOrderType order_type = EntryOrderType::LIMIT;
    Decimal price;
};

/**
 * @brief Chooses entry order type and price from the current order book.
 * Callers must check has_best_bid()/has_best_ask() first.
 */
class EntryPricingStrategy {
public:
    virtual ~EntryPricingStrategy() = default;

    virtual EntryOrderPlan plan_entry(const OrderBook& order_book, const Config::PairSettings& pair_settings) const = 0;
    virtual std::string get_name() const = 0;
};

// Limit buy at the best ask; fills immediately when the ask is still there.
class CrossAskPricingStrategy : public EntryPricingStrategy {
public:
    EntryOrderPlan plan_entry(const OrderBook& order_book, const Config::PairSettings& pair_settings) const override;
    std::string get_name() const override { return "ask"; }
};

// Post-only limit buy at the best bid; rests as a maker order.
class JoinBidPricingStrategy : public EntryPricingStrategy {
public:
    EntryOrderPlan plan_entry(const OrderBook& order_book, const Config::PairSettings& pair_settings) const override;
    std::string get_name() const override { return "bid"; }
};

// Market buy for the quote amount, priced at the best ask for sizing.
class MarketEntryPricingStrategy : public EntryPricingStrategy {
public:
    EntryOrderPlan plan_entry(const OrderBook& order_book, const Config::PairSettings& pair_settings) const override;
    std::string get_name() const override { return "market"; }
};

std::unique_ptr<EntryPricingStrategy> create_entry_pricing_strategy(Config::EntryPricingMode pricing_mode);

std::string to_string(EntryOrderType order_type);

} // namespace Core
} // namespace ValrTrader

#endif // ENTRY_PRICING_STRATEGY_HPP
