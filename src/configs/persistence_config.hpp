#ifndef PERSISTENCE_CONFIG_HPP
#define PERSISTENCE_CONFIG_HPP

#include <string>

namespace ValrTrader {
namespace Config {

struct PersistenceConfig {
    std::string orders_file = "data/orders.json";
    std::string positions_file = "data/positions.json";
    bool enable_order_persistence = true;
};

} // namespace Config
} // namespace ValrTrader

#endif // PERSISTENCE_CONFIG_HPP
