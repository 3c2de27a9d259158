#include "persistence_logs.hpp"
#include "logging/logger/async_logger.hpp"

namespace ValrTrader {
namespace Logging {

void PersistenceLogs::log_store_loaded(const std::string& store_name, const std::string& file_path, size_t record_count) {
    log_message("PERSISTENCE: Loaded " + std::to_string(record_count) + " records into " + store_name + " from " + file_path, "");
}

void PersistenceLogs::log_store_saved(const std::string& store_name, size_t record_count) {
    log_message("PERSISTENCE: Saved " + std::to_string(record_count) + " records from " + store_name, "");
}

void PersistenceLogs::log_store_failure(const std::string& store_name, const std::string& error_message) {
    log_message("ERROR: " + store_name + " persistence failed, continuing in memory: " + error_message, "");
}

void PersistenceLogs::log_record_skipped(const std::string& store_name, const std::string& detail) {
    log_message("WARNING: " + store_name + " skipped malformed record: " + detail, "");
}

void PersistenceLogs::log_stale_orders_removed(size_t removed_count, int max_age_hours) {
    log_message("PERSISTENCE: Removed " + std::to_string(removed_count) + " order records older than " +
                std::to_string(max_age_hours) + "h", "");
}

void PersistenceLogs::log_persistence_disabled(const std::string& store_name) {
    log_message("PERSISTENCE: " + store_name + " persistence disabled, keeping records in memory only", "");
}

} // namespace Logging
} // namespace ValrTrader
