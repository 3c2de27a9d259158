#ifndef RSI_SIGNAL_SCANNER_HPP
#define RSI_SIGNAL_SCANNER_HPP

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include "signal_source.hpp"
#include "api/general/exchange_gateway_interface.hpp"
#include "configs/strategy_config.hpp"
#include "utils/clock.hpp"

namespace ValrTrader {
namespace Core {

/**
 * @brief Samples the last traded price per scan and signals a buy when RSI drops below the threshold.
 * After a buy signal the pair is skipped for the configured cooldown.
 */
class RsiSignalScanner : public SignalSourceInterface {
public:
    RsiSignalScanner(API::ExchangeGatewayInterface& gateway, const Config::StrategyConfig& strategy_config,
                     const ClockInterface& clock);

    SignalDecision evaluate(const std::string& pair) override;

    // Appends a sample without querying the exchange.
    void record_price(const std::string& pair, const Decimal& price);
    SignalDecision evaluate_recorded(const std::string& pair);

    size_t get_price_history_size(const std::string& pair) const;
    bool is_in_cooldown(const std::string& pair) const;
    void reset_cooldowns();

private:
    bool is_in_cooldown_unlocked(const std::string& pair, TimePoint current_time) const;

    API::ExchangeGatewayInterface& gateway;
    const Config::StrategyConfig& strategy_config;
    const ClockInterface& clock;
    size_t max_history_length;

    mutable std::mutex scanner_mutex;
    std::map<std::string, std::deque<Decimal>> price_history;
    std::map<std::string, TimePoint> last_signal_times;
};

} // namespace Core
} // namespace ValrTrader

#endif // RSI_SIGNAL_SCANNER_HPP
