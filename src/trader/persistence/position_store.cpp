#include "position_store.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include "logging/logs/persistence_logs.hpp"
#include "utils/file_utils.hpp"
#include "utils/time_utils.hpp"

using json = nlohmann::json;
using ValrTrader::Logging::PersistenceLogs;

namespace ValrTrader {
namespace Core {

namespace {
    constexpr const char* POSITION_STORE_NAME = "PositionStore";

    json optional_id_to_json(const std::optional<std::string>& order_id) {
        if (order_id) {
            return json(*order_id);
        }
        return json(nullptr);
    }

    std::optional<std::string> optional_id_from_json(const json& position_json, const char* field_name) {
        json::const_iterator field_iterator = position_json.find(field_name);
        if (field_iterator == position_json.end() || field_iterator->is_null()) {
            return std::nullopt;
        }
        return field_iterator->get<std::string>();
    }
}

PositionStore::PositionStore(const std::string& file_path) : store_file_path(file_path) {
    if (store_file_path.empty()) {
        throw std::runtime_error("Position store file path is required but not provided");
    }
}

json PositionStore::position_to_json(const Position& position) {
    return json{
        {"pair", position.pair},
        {"quantity", DecimalUtils::format_decimal(position.quantity)},
        {"entryPrice", DecimalUtils::format_decimal(position.entry_price)},
        {"stopLossPrice", DecimalUtils::format_decimal(position.stop_loss_price)},
        {"takeProfitPrice", DecimalUtils::format_decimal(position.take_profit_price)},
        {"createdAt", TimeUtils::format_iso8601(position.created_at)},
        {"entryFilledAt", TimeUtils::format_iso8601(position.entry_filled_at)},
        {"status", to_string(position.status)},
        {"entryOrderId", position.entry_order_id},
        {"takeProfitOrderId", optional_id_to_json(position.take_profit_order_id)},
        {"stopLossOrderId", optional_id_to_json(position.stop_loss_order_id)}
    };
}

Position PositionStore::position_from_json(const std::string& position_id, const json& position_json) {
    try {
        Position position;
        position.position_id = position_id;
        position.pair = position_json.at("pair").get<std::string>();
        position.quantity = DecimalUtils::parse_decimal(position_json.at("quantity").get<std::string>());
        position.entry_price = DecimalUtils::parse_decimal(position_json.at("entryPrice").get<std::string>());
        position.stop_loss_price = DecimalUtils::parse_decimal(position_json.at("stopLossPrice").get<std::string>());
        position.take_profit_price = DecimalUtils::parse_decimal(position_json.at("takeProfitPrice").get<std::string>());
        position.created_at = TimeUtils::parse_iso8601(position_json.at("createdAt").get<std::string>());
        position.entry_filled_at = TimeUtils::parse_iso8601(position_json.at("entryFilledAt").get<std::string>());
        position.status = parse_position_status(position_json.at("status").get<std::string>());
        position.entry_order_id = position_json.at("entryOrderId").get<std::string>();
        position.take_profit_order_id = optional_id_from_json(position_json, "takeProfitOrderId");
        position.stop_loss_order_id = optional_id_from_json(position_json, "stopLossOrderId");
        return position;
    } catch (const json::exception& json_exception_error) {
        throw PersistenceError("Malformed position " + position_id + ": " + json_exception_error.what());
    } catch (const std::runtime_error& field_exception_error) {
        throw PersistenceError("Malformed position " + position_id + ": " + field_exception_error.what());
    }
}

PositionMap PositionStore::load_positions() const {
    std::lock_guard<std::mutex> file_lock(file_mutex);
    return load_positions_unlocked();
}

PositionMap PositionStore::load_positions_unlocked() const {
    std::optional<std::string> file_contents;
    try {
        file_contents = FileUtils::read_file_if_exists(store_file_path);
    } catch (const std::runtime_error& read_exception_error) {
        throw PersistenceError(read_exception_error.what());
    }

    PositionMap positions;
    if (!file_contents) {
        return positions;
    }

    json store_document;
    try {
        store_document = json::parse(*file_contents);
    } catch (const json::parse_error& parse_exception_error) {
        throw PersistenceError("Position store " + store_file_path + " is not valid JSON: " + parse_exception_error.what());
    }
    if (!store_document.is_object()) {
        throw PersistenceError("Position store " + store_file_path + " must hold a JSON object");
    }

    for (json::const_iterator position_iterator = store_document.begin(); position_iterator != store_document.end(); ++position_iterator) {
        try {
            positions[position_iterator.key()] = position_from_json(position_iterator.key(), position_iterator.value());
        } catch (const PersistenceError& record_exception_error) {
            PersistenceLogs::log_record_skipped(POSITION_STORE_NAME, record_exception_error.what());
        }
    }
    PersistenceLogs::log_store_loaded(POSITION_STORE_NAME, store_file_path, positions.size());
    return positions;
}

void PositionStore::save_positions(const PositionMap& positions) const {
    std::lock_guard<std::mutex> file_lock(file_mutex);
    save_positions_unlocked(positions);
}

void PositionStore::save_positions_unlocked(const PositionMap& positions) const {
    json store_document = json::object();
    for (const std::pair<const std::string, Position>& position_entry : positions) {
        store_document[position_entry.first] = position_to_json(position_entry.second);
    }

    try {
        FileUtils::write_file_atomically(store_file_path, store_document.dump(2));
    } catch (const std::runtime_error& write_exception_error) {
        throw PersistenceError("Failed to save positions: " + std::string(write_exception_error.what()));
    }
    PersistenceLogs::log_store_saved(POSITION_STORE_NAME, positions.size());
}

void PositionStore::save_position(const Position& position) const {
    std::lock_guard<std::mutex> file_lock(file_mutex);
    PositionMap positions = load_positions_unlocked();
    positions[position.position_id] = position;
    save_positions_unlocked(positions);
}

void PositionStore::delete_position(const std::string& position_id) const {
    std::lock_guard<std::mutex> file_lock(file_mutex);
    PositionMap positions = load_positions_unlocked();
    if (positions.erase(position_id) == 0) {
        return;
    }
    save_positions_unlocked(positions);
}

} // namespace Core
} // namespace ValrTrader
