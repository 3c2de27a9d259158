#ifndef ORDER_STORE_HPP
#define ORDER_STORE_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "trader/data_structures/data_structures.hpp"
#include "utils/clock.hpp"

namespace ValrTrader {
namespace Core {

/**
 * @brief Registry of orders the bot placed that are still live on the exchange.
 * Filled and cancelled orders are pruned on update. Every mutation is persisted
 * when persistence is enabled; write failures are logged and never propagate.
 */
class OrderStore {
public:
    OrderStore(const std::string& file_path, bool persistence_enabled, const ClockInterface& clock);

    // Throws PersistenceError if the file exists but cannot be read as a document.
    void load();
    // Throws PersistenceError on write failure.
    void save();

    void add_order(const OrderRecord& order_record);
    bool update_order_status(const std::string& order_id, OrderRecordStatus new_status);
    bool remove_order(const std::string& order_id);

    std::optional<OrderRecord> get_order(const std::string& order_id) const;
    std::vector<OrderRecord> get_active_orders() const;
    std::vector<OrderRecord> get_orders_by_pair(const std::string& pair) const;

    size_t cleanup_stale_orders(int max_age_hours);
    OrderStoreStatistics get_statistics() const;
    void clear_all_orders();

    static nlohmann::json order_to_json(const OrderRecord& order_record);
    static OrderRecord order_from_json(const nlohmann::json& order_json);

private:
    void save_unlocked();
    void persist_after_mutation_unlocked();

    std::string store_file_path;
    bool persistence_enabled;
    const ClockInterface& clock;

    mutable std::mutex store_mutex;
    std::map<std::string, OrderRecord> orders;
};

} // namespace Core
} // namespace ValrTrader

#endif // ORDER_STORE_HPP
