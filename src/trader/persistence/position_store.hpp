#ifndef POSITION_STORE_HPP
#define POSITION_STORE_HPP

#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "trader/data_structures/data_structures.hpp"

namespace ValrTrader {
namespace Core {

using PositionMap = std::map<std::string, Position>;

/**
 * @brief Durable map of open positions keyed by position id.
 * Decimals are stored as strings and timestamps as ISO-8601 so a
 * save/load cycle reproduces every field exactly.
 * All operations throw PersistenceError on I/O or format failure.
 */
class PositionStore {
public:
    explicit PositionStore(const std::string& file_path);

    PositionMap load_positions() const;
    void save_positions(const PositionMap& positions) const;
    void save_position(const Position& position) const;
    void delete_position(const std::string& position_id) const;

    const std::string& get_file_path() const { return store_file_path; }

    static nlohmann::json position_to_json(const Position& position);
    static Position position_from_json(const std::string& position_id, const nlohmann::json& position_json);

private:
    PositionMap load_positions_unlocked() const;
    void save_positions_unlocked(const PositionMap& positions) const;

    std::string store_file_path;
    mutable std::mutex file_mutex;
};

} // namespace Core
} // namespace ValrTrader

#endif // POSITION_STORE_HPP
