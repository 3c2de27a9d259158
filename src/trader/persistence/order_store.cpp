#include "order_store.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include "logging/logs/persistence_logs.hpp"
#include "utils/file_utils.hpp"
#include "utils/time_utils.hpp"

using json = nlohmann::json;
using ValrTrader::Logging::PersistenceLogs;

namespace ValrTrader {
namespace Core {

namespace {
    constexpr const char* ORDER_STORE_NAME = "OrderStore";
    constexpr const char* ORDER_STORE_FORMAT_VERSION = "1.0";
}

OrderStore::OrderStore(const std::string& file_path, bool persistence_enabled_value, const ClockInterface& clock_ref)
    : store_file_path(file_path), persistence_enabled(persistence_enabled_value), clock(clock_ref) {
    if (!persistence_enabled) {
        PersistenceLogs::log_persistence_disabled(ORDER_STORE_NAME);
    }
}

// ========================================================================
// SERIALIZATION
// ========================================================================

json OrderStore::order_to_json(const OrderRecord& order_record) {
    return json{
        {"orderId", order_record.order_id},
        {"pair", order_record.pair},
        {"side", to_string(order_record.side)},
        {"quantity", DecimalUtils::format_decimal(order_record.quantity)},
        {"price", DecimalUtils::format_decimal(order_record.price)},
        {"role", to_string(order_record.role)},
        {"status", to_string(order_record.status)},
        {"createdAt", TimeUtils::format_iso8601(order_record.created_at)},
        {"lastUpdated", TimeUtils::format_iso8601(order_record.last_updated)}
    };
}

OrderRecord OrderStore::order_from_json(const json& order_json) {
    try {
        OrderRecord order_record;
        order_record.order_id = order_json.at("orderId").get<std::string>();
        order_record.pair = order_json.at("pair").get<std::string>();
        order_record.side = parse_order_side(order_json.at("side").get<std::string>());
        order_record.quantity = DecimalUtils::parse_decimal(order_json.at("quantity").get<std::string>());
        order_record.price = DecimalUtils::parse_decimal(order_json.at("price").get<std::string>());
        order_record.role = parse_order_role(order_json.at("role").get<std::string>());
        order_record.status = parse_order_record_status(order_json.at("status").get<std::string>());
        order_record.created_at = TimeUtils::parse_iso8601(order_json.at("createdAt").get<std::string>());
        order_record.last_updated = TimeUtils::parse_iso8601(order_json.at("lastUpdated").get<std::string>());
        if (order_record.order_id.empty()) {
            throw std::runtime_error("empty order id");
        }
        return order_record;
    } catch (const json::exception& json_exception_error) {
        throw std::runtime_error(std::string("malformed order record: ") + json_exception_error.what());
    }
}

// ========================================================================
// LOAD / SAVE
// ========================================================================

void OrderStore::load() {
    std::lock_guard<std::mutex> store_lock(store_mutex);
    if (!persistence_enabled) {
        return;
    }

    std::optional<std::string> file_contents;
    try {
        file_contents = FileUtils::read_file_if_exists(store_file_path);
    } catch (const std::runtime_error& read_exception_error) {
        throw PersistenceError(read_exception_error.what());
    }
    if (!file_contents) {
        PersistenceLogs::log_store_loaded(ORDER_STORE_NAME, store_file_path, 0);
        return;
    }

    json store_document;
    try {
        store_document = json::parse(*file_contents);
    } catch (const json::parse_error& parse_exception_error) {
        throw PersistenceError("Order store " + store_file_path + " is not valid JSON: " + parse_exception_error.what());
    }

    json::const_iterator orders_iterator = store_document.find("orders");
    if (orders_iterator == store_document.end() || !orders_iterator->is_array()) {
        throw PersistenceError("Order store " + store_file_path + " has no orders array");
    }

    orders.clear();
    for (const json& order_json : *orders_iterator) {
        try {
            OrderRecord order_record = order_from_json(order_json);
            orders[order_record.order_id] = order_record;
        } catch (const std::runtime_error& record_exception_error) {
            PersistenceLogs::log_record_skipped(ORDER_STORE_NAME, record_exception_error.what());
        }
    }
    PersistenceLogs::log_store_loaded(ORDER_STORE_NAME, store_file_path, orders.size());
}

void OrderStore::save() {
    std::lock_guard<std::mutex> store_lock(store_mutex);
    save_unlocked();
}

void OrderStore::save_unlocked() {
    if (!persistence_enabled) {
        return;
    }

    json orders_array = json::array();
    for (const std::pair<const std::string, OrderRecord>& order_entry : orders) {
        orders_array.push_back(order_to_json(order_entry.second));
    }
    json store_document = {
        {"version", ORDER_STORE_FORMAT_VERSION},
        {"savedAt", TimeUtils::format_iso8601(clock.now())},
        {"orders", orders_array}
    };

    try {
        FileUtils::write_file_atomically(store_file_path, store_document.dump(2));
    } catch (const std::runtime_error& write_exception_error) {
        throw PersistenceError("Failed to save order store: " + std::string(write_exception_error.what()));
    }
    PersistenceLogs::log_store_saved(ORDER_STORE_NAME, orders.size());
}

void OrderStore::persist_after_mutation_unlocked() {
    try {
        save_unlocked();
    } catch (const PersistenceError& persistence_exception_error) {
        PersistenceLogs::log_store_failure(ORDER_STORE_NAME, persistence_exception_error.what());
    }
}

// ========================================================================
// MUTATIONS
// ========================================================================

void OrderStore::add_order(const OrderRecord& order_record) {
    std::lock_guard<std::mutex> store_lock(store_mutex);
    OrderRecord stored_record = order_record;
    stored_record.status = OrderRecordStatus::ACTIVE;
    TimePoint current_time = clock.now();
    if (stored_record.created_at == TimePoint{}) {
        stored_record.created_at = current_time;
    }
    stored_record.last_updated = current_time;
    orders[stored_record.order_id] = stored_record;
    persist_after_mutation_unlocked();
}

bool OrderStore::update_order_status(const std::string& order_id, OrderRecordStatus new_status) {
    std::lock_guard<std::mutex> store_lock(store_mutex);
    std::map<std::string, OrderRecord>::iterator order_iterator = orders.find(order_id);
    if (order_iterator == orders.end()) {
        return false;
    }

    if (new_status == OrderRecordStatus::ACTIVE) {
        order_iterator->second.status = new_status;
        order_iterator->second.last_updated = clock.now();
    } else {
        orders.erase(order_iterator);
    }
    persist_after_mutation_unlocked();
    return true;
}

bool OrderStore::remove_order(const std::string& order_id) {
    std::lock_guard<std::mutex> store_lock(store_mutex);
    if (orders.erase(order_id) == 0) {
        return false;
    }
    persist_after_mutation_unlocked();
    return true;
}

size_t OrderStore::cleanup_stale_orders(int max_age_hours) {
    std::lock_guard<std::mutex> store_lock(store_mutex);
    TimePoint cutoff_time = clock.now() - std::chrono::hours(max_age_hours);

    size_t removed_count = 0;
    for (std::map<std::string, OrderRecord>::iterator order_iterator = orders.begin(); order_iterator != orders.end();) {
        if (order_iterator->second.created_at < cutoff_time) {
            order_iterator = orders.erase(order_iterator);
            ++removed_count;
        } else {
            ++order_iterator;
        }
    }

    if (removed_count > 0) {
        PersistenceLogs::log_stale_orders_removed(removed_count, max_age_hours);
        persist_after_mutation_unlocked();
    }
    return removed_count;
}

void OrderStore::clear_all_orders() {
    std::lock_guard<std::mutex> store_lock(store_mutex);
    orders.clear();
    persist_after_mutation_unlocked();
}

// ========================================================================
// QUERIES
// ========================================================================

std::optional<OrderRecord> OrderStore::get_order(const std::string& order_id) const {
    std::lock_guard<std::mutex> store_lock(store_mutex);
    std::map<std::string, OrderRecord>::const_iterator order_iterator = orders.find(order_id);
    if (order_iterator == orders.end()) {
        return std::nullopt;
    }
    return order_iterator->second;
}

std::vector<OrderRecord> OrderStore::get_active_orders() const {
    std::lock_guard<std::mutex> store_lock(store_mutex);
    std::vector<OrderRecord> active_orders;
    for (const std::pair<const std::string, OrderRecord>& order_entry : orders) {
        if (order_entry.second.status == OrderRecordStatus::ACTIVE) {
            active_orders.push_back(order_entry.second);
        }
    }
    return active_orders;
}

std::vector<OrderRecord> OrderStore::get_orders_by_pair(const std::string& pair) const {
    std::lock_guard<std::mutex> store_lock(store_mutex);
    std::vector<OrderRecord> pair_orders;
    for (const std::pair<const std::string, OrderRecord>& order_entry : orders) {
        if (order_entry.second.pair == pair) {
            pair_orders.push_back(order_entry.second);
        }
    }
    return pair_orders;
}

OrderStoreStatistics OrderStore::get_statistics() const {
    std::lock_guard<std::mutex> store_lock(store_mutex);
    OrderStoreStatistics statistics;
    statistics.total_orders = orders.size();
    for (const std::pair<const std::string, OrderRecord>& order_entry : orders) {
        statistics.orders_by_role[to_string(order_entry.second.role)]++;
        statistics.orders_by_pair[order_entry.second.pair]++;
    }
    return statistics;
}

} // namespace Core
} // namespace ValrTrader
