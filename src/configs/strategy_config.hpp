#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "utils/decimal_utils.hpp"

namespace ValrTrader {
namespace Config {

enum class EntryPricingMode {
    CROSS_ASK,
    JOIN_BID,
    MARKET
};

enum class ProtectionMode {
    DUAL,
    STOP_LOSS_ONLY
};

struct StrategyConfig {
    // ========================================================================
    // PAIRS AND SIGNAL
    // ========================================================================

    std::vector<std::string> pairs{"BTCZAR", "ETHZAR"};
    DecimalUtils::Decimal rsi_threshold{"45"};
    int rsi_period = 14;
    int scan_cooldown_seconds = 300;                  // Quiet period after a buy signal on a pair

    // ========================================================================
    // EXITS AND SIZING
    // ========================================================================

    DecimalUtils::Decimal take_profit_percentage{"1.5"};
    DecimalUtils::Decimal stop_loss_percentage{"2.0"};
    DecimalUtils::Decimal base_trade_amount{"100"};   // Quote currency per trade
    int max_daily_trades = 20;
    DecimalUtils::Decimal maker_fee_percentage{"0.18"};
    DecimalUtils::Decimal balance_safety_margin_percentage{"1.0"};

    // ========================================================================
    // ORDER POLICY
    // ========================================================================

    EntryPricingMode entry_pricing_mode = EntryPricingMode::CROSS_ASK;
    ProtectionMode protection_mode = ProtectionMode::DUAL;
    bool allow_multiple_positions_per_pair = false;

    static EntryPricingMode parse_entry_pricing_mode(const std::string& mode_str) {
        if (mode_str == "ask" || mode_str == "ASK") {
            return EntryPricingMode::CROSS_ASK;
        } else if (mode_str == "bid" || mode_str == "BID") {
            return EntryPricingMode::JOIN_BID;
        } else if (mode_str == "market" || mode_str == "MARKET") {
            return EntryPricingMode::MARKET;
        } else {
            throw std::runtime_error("Invalid entry pricing mode: " + mode_str + ". Must be 'ask', 'bid' or 'market'");
        }
    }

    static ProtectionMode parse_protection_mode(const std::string& mode_str) {
        if (mode_str == "dual" || mode_str == "DUAL") {
            return ProtectionMode::DUAL;
        } else if (mode_str == "stop_loss_only" || mode_str == "STOP_LOSS_ONLY") {
            return ProtectionMode::STOP_LOSS_ONLY;
        } else {
            throw std::runtime_error("Invalid protection mode: " + mode_str + ". Must be 'dual' or 'stop_loss_only'");
        }
    }

    static std::string protection_mode_to_string(ProtectionMode mode) {
        switch (mode) {
            case ProtectionMode::DUAL:
                return "dual";
            case ProtectionMode::STOP_LOSS_ONLY:
                return "stop_loss_only";
            default:
                throw std::runtime_error("Unknown protection mode");
        }
    }
};

} // namespace Config
} // namespace ValrTrader

#endif // STRATEGY_CONFIG_HPP
