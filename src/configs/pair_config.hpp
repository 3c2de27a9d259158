#ifndef PAIR_CONFIG_HPP
#define PAIR_CONFIG_HPP

#include <map>
#include <string>
#include <vector>
#include "utils/decimal_utils.hpp"

namespace ValrTrader {
namespace Config {

struct PairSettings {
    int price_decimals = 2;
    int quantity_decimals = 6;
    DecimalUtils::Decimal tick_size{"0.01"};
    DecimalUtils::Decimal minimum_quantity{"0"};
    std::string quote_currency;                       // Empty means derive from the pair suffix
};

/**
 * Per-pair precision table.
 * Pairs without an explicit entry use default_settings.
 */
struct PairConfig {
    PairSettings default_settings;
    std::map<std::string, PairSettings> pair_settings;

    PairSettings resolve(const std::string& pair) const {
        PairSettings resolved_settings = default_settings;
        std::map<std::string, PairSettings>::const_iterator pair_iterator = pair_settings.find(pair);
        if (pair_iterator != pair_settings.end()) {
            resolved_settings = pair_iterator->second;
        }
        if (resolved_settings.quote_currency.empty()) {
            resolved_settings.quote_currency = derive_quote_currency(pair);
        }
        return resolved_settings;
    }

    static std::string derive_quote_currency(const std::string& pair) {
        static const std::vector<std::string> known_quote_currencies = {"USDT", "USDC", "ZAR", "USD"};
        for (const std::string& quote_currency : known_quote_currencies) {
            if (pair.size() > quote_currency.size() &&
                pair.compare(pair.size() - quote_currency.size(), quote_currency.size(), quote_currency) == 0) {
                return quote_currency;
            }
        }
        return "USDT";
    }
};

} // namespace Config
} // namespace ValrTrader

#endif // PAIR_CONFIG_HPP
