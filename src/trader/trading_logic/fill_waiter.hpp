#ifndef FILL_WAITER_HPP
#define FILL_WAITER_HPP

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "api/general/exchange_gateway_interface.hpp"
#include "configs/timing_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "utils/clock.hpp"

namespace ValrTrader {
namespace Core {

// Poll interval grows with the time already spent waiting.
struct FillPollSchedule {
    std::chrono::milliseconds fast_interval{500};
    std::chrono::milliseconds fast_window{10000};
    std::chrono::milliseconds medium_interval{1000};
    std::chrono::milliseconds medium_window{30000};
    std::chrono::milliseconds slow_interval{2000};

    static FillPollSchedule from_timing_config(const Config::TimingConfig& timing_config);
};

/**
 * @brief Polls one order until it is filled, cancelled, timed out or the process shuts down.
 * The shutdown flag is checked before every poll. A FILLED report never yields a
 * zero quantity: the waiter falls back to the order's fills, then to the submitted quantity.
 * A partial fill at timeout cancels the remainder and returns PARTIALLY_FILLED.
 */
class FillWaiter {
public:
    FillWaiter(API::ExchangeGatewayInterface& gateway, const ClockInterface& clock,
               const std::atomic<bool>& shutdown_flag, FillPollSchedule poll_schedule);

    FillOutcome wait_for_fill(const std::string& pair, const std::string& order_id, const Decimal& submitted_quantity,
                              const Decimal& fallback_price, std::chrono::milliseconds timeout);

    std::chrono::milliseconds poll_interval_for(std::chrono::milliseconds elapsed) const;

    // Quantity and price for an order the exchange reports as executed.
    FillOutcome resolve_filled_outcome(const std::string& pair, const OrderStatusReport& status_report,
                                       FillState fill_state, const Decimal& submitted_quantity,
                                       const Decimal& fallback_price);

private:
    std::vector<OrderFill> fetch_fills(const std::string& pair, const std::string& order_id);
    void cancel_remainder(const std::string& pair, const std::string& order_id);
    OrderStatusReport refresh_after_cancel(const std::string& pair, const std::string& order_id,
                                           const OrderStatusReport& last_partial_report, FillState& final_state);

    API::ExchangeGatewayInterface& gateway;
    const ClockInterface& clock;
    const std::atomic<bool>& shutdown_requested;
    FillPollSchedule schedule;
};

} // namespace Core
} // namespace ValrTrader

#endif // FILL_WAITER_HPP
