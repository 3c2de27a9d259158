#include "rsi_signal_scanner.hpp"
#include "indicators.hpp"
#include "logging/logs/trading_logs.hpp"
#include <algorithm>

using ValrTrader::Logging::TradingLogs;

namespace ValrTrader {
namespace Core {

namespace {
    constexpr size_t MINIMUM_HISTORY_LENGTH = 250;
}

RsiSignalScanner::RsiSignalScanner(API::ExchangeGatewayInterface& gateway_ref, const Config::StrategyConfig& strategy_config_ref,
                                   const ClockInterface& clock_ref)
    : gateway(gateway_ref), strategy_config(strategy_config_ref), clock(clock_ref),
      max_history_length(std::max(MINIMUM_HISTORY_LENGTH, static_cast<size_t>(strategy_config_ref.rsi_period) * 10)) {
    if (strategy_config.rsi_threshold <= 0) {
        throw std::runtime_error("RSI threshold must be positive");
    }
}

SignalDecision RsiSignalScanner::evaluate(const std::string& pair) {
    if (is_in_cooldown(pair)) {
        TradingLogs::log_signal_scan(pair, SignalDecision{}, false);
        return SignalDecision{};
    }

    Decimal last_price = gateway.get_last_traded_price(pair);
    record_price(pair, last_price);
    return evaluate_recorded(pair);
}

void RsiSignalScanner::record_price(const std::string& pair, const Decimal& price) {
    std::lock_guard<std::mutex> scanner_lock(scanner_mutex);
    std::deque<Decimal>& pair_history = price_history[pair];
    pair_history.push_back(price);
    while (pair_history.size() > max_history_length) {
        pair_history.pop_front();
    }
}

SignalDecision RsiSignalScanner::evaluate_recorded(const std::string& pair) {
    std::lock_guard<std::mutex> scanner_lock(scanner_mutex);
    SignalDecision decision;
    TimePoint current_time = clock.now();

    if (is_in_cooldown_unlocked(pair, current_time)) {
        TradingLogs::log_signal_scan(pair, decision, false);
        return decision;
    }

    std::optional<Decimal> rsi_value = calculate_rsi(price_history[pair], strategy_config.rsi_period);
    if (!rsi_value) {
        TradingLogs::log_signal_scan(pair, decision, false);
        return decision;
    }

    decision.indicator_value = *rsi_value;
    decision.should_buy = *rsi_value < strategy_config.rsi_threshold;
    if (decision.should_buy) {
        decision.confidence = (strategy_config.rsi_threshold - *rsi_value) / strategy_config.rsi_threshold;
        last_signal_times[pair] = current_time;
    }
    TradingLogs::log_signal_scan(pair, decision, true);
    return decision;
}

size_t RsiSignalScanner::get_price_history_size(const std::string& pair) const {
    std::lock_guard<std::mutex> scanner_lock(scanner_mutex);
    std::map<std::string, std::deque<Decimal>>::const_iterator history_iterator = price_history.find(pair);
    return history_iterator == price_history.end() ? 0 : history_iterator->second.size();
}

bool RsiSignalScanner::is_in_cooldown(const std::string& pair) const {
    std::lock_guard<std::mutex> scanner_lock(scanner_mutex);
    return is_in_cooldown_unlocked(pair, clock.now());
}

bool RsiSignalScanner::is_in_cooldown_unlocked(const std::string& pair, TimePoint current_time) const {
    std::map<std::string, TimePoint>::const_iterator signal_iterator = last_signal_times.find(pair);
    if (signal_iterator == last_signal_times.end()) {
        return false;
    }
    return current_time - signal_iterator->second < std::chrono::seconds(strategy_config.scan_cooldown_seconds);
}

void RsiSignalScanner::reset_cooldowns() {
    std::lock_guard<std::mutex> scanner_lock(scanner_mutex);
    last_signal_times.clear();
}

} // namespace Core
} // namespace ValrTrader
