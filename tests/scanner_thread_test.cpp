#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include "api/general/api_errors.hpp"
#include "threads/system_threads/scanner_thread.hpp"
#include "utils/time_utils.hpp"
#include "test_support/engine_test_fixture.hpp"

using ValrTrader::Core::Decimal;
using ValrTrader::Core::SignalDecision;
using ValrTrader::Threads::ScannerThread;

namespace {
    // Fixed answer per pair; pairs listed in failing_pairs throw instead.
    class ScriptedSignalSource : public ValrTrader::Core::SignalSourceInterface {
    public:
        SignalDecision evaluate(const std::string& pair) override {
            std::lock_guard<std::mutex> source_lock(source_mutex);
            evaluated_pairs.push_back(pair);
            if (failing_pairs.count(pair) > 0) {
                throw ValrTrader::API::ConnectionError("market summary unavailable for " + pair);
            }
            SignalDecision decision;
            decision.should_buy = buy_pairs.count(pair) > 0;
            decision.indicator_value = decision.should_buy ? Decimal("30") : Decimal("60");
            return decision;
        }

        std::map<std::string, bool> buy_pairs;
        std::map<std::string, bool> failing_pairs;
        std::vector<std::string> evaluated_pairs;
        std::mutex source_mutex;
    };
}

class ScannerThreadTest : public ValrTrader::Testing::EngineTestBase {
protected:
    void SetUp() override {
        EngineTestBase::SetUp();
        config.strategy.pairs = {"BTCZAR", "ETHZAR"};
        config.timing.pair_scan_delay_milliseconds = 0;
        create_engine();
    }

    ScannerThread make_scanner() {
        return ScannerThread(config, signal_source, *trading_engine, clock, logging_context, state_mutex, state_cv,
                             running, shutdown_requested, scanner_iterations);
    }

    ScriptedSignalSource signal_source;
    ValrTrader::Logging::LoggingContext logging_context;
    std::mutex state_mutex;
    std::condition_variable state_cv;
    std::atomic<bool> running{true};
    std::atomic<unsigned long> scanner_iterations{0};
};

TEST_F(ScannerThreadTest, buy_signal_starts_trade_setup_for_that_pair_only) {
    signal_source.buy_pairs["BTCZAR"] = true;
    script_entry_fill();
    ScannerThread scanner = make_scanner();

    scanner.execute_scan_cycle();

    ASSERT_EQ(signal_source.evaluated_pairs.size(), 2u);
    std::vector<ValrTrader::Core::Position> open_positions = trading_engine->get_open_positions();
    ASSERT_EQ(open_positions.size(), 1u);
    EXPECT_EQ(open_positions[0].pair, "BTCZAR");
}

TEST_F(ScannerThreadTest, failing_pair_does_not_stop_the_cycle) {
    signal_source.failing_pairs["BTCZAR"] = true;
    ScannerThread scanner = make_scanner();

    EXPECT_NO_THROW(scanner.execute_scan_cycle());
    ASSERT_EQ(signal_source.evaluated_pairs.size(), 2u);
    EXPECT_EQ(signal_source.evaluated_pairs[1], "ETHZAR");
}

TEST_F(ScannerThreadTest, shutdown_skips_evaluation) {
    shutdown_requested.store(true);
    ScannerThread scanner = make_scanner();

    scanner.execute_scan_cycle();
    EXPECT_TRUE(signal_source.evaluated_pairs.empty());
}

TEST_F(ScannerThreadTest, stale_order_cleanup_runs_once_per_utc_day) {
    open_dual_protected_position();
    ScannerThread scanner = make_scanner();

    scanner.execute_scan_cycle();
    EXPECT_EQ(scanner.last_cleanup_date, TimeUtils::format_utc_date(clock.now()));
    EXPECT_EQ(order_store->get_active_orders().size(), 2u);

    clock.advance(std::chrono::hours(25));
    scanner.execute_scan_cycle();
    EXPECT_EQ(scanner.last_cleanup_date, TimeUtils::format_utc_date(clock.now()));
    EXPECT_TRUE(order_store->get_active_orders().empty());
}

TEST_F(ScannerThreadTest, thread_loop_exits_on_shutdown_notification) {
    config.timing.scan_interval_seconds = 3600;
    ScannerThread scanner = make_scanner();

    std::thread scanner_thread(std::ref(scanner));
    while (scanner_iterations.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    {
        std::lock_guard<std::mutex> state_lock(state_mutex);
        shutdown_requested.store(true);
    }
    state_cv.notify_all();
    scanner_thread.join();

    EXPECT_EQ(scanner_iterations.load(), 1u);
}
