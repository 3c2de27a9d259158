#ifndef SIGNAL_SOURCE_HPP
#define SIGNAL_SOURCE_HPP

#include <memory>
#include <string>
#include "trader/data_structures/data_structures.hpp"

namespace ValrTrader {
namespace Core {

// Buy/no-buy decision for one pair. Implementations own their per-pair state.
class SignalSourceInterface {
public:
    virtual ~SignalSourceInterface() = default;

    virtual SignalDecision evaluate(const std::string& pair) = 0;
};

using SignalSourcePtr = std::unique_ptr<SignalSourceInterface>;

} // namespace Core
} // namespace ValrTrader

#endif // SIGNAL_SOURCE_HPP
