#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <chrono>
#include <thread>

namespace ValrTrader {
namespace Core {

/**
 * @brief Time source for timeout and rollover decisions.
 * The engine never reads the system clock directly so tests can drive time.
 */
class ClockInterface {
public:
    virtual ~ClockInterface() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds sleep_duration) const = 0;
};

class SystemClock : public ClockInterface {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    void sleep_for(std::chrono::milliseconds sleep_duration) const override {
        std::this_thread::sleep_for(sleep_duration);
    }
};

} // namespace Core
} // namespace ValrTrader

#endif // CLOCK_HPP
