#ifndef PERSISTENCE_LOGS_HPP
#define PERSISTENCE_LOGS_HPP

#include <string>

namespace ValrTrader {
namespace Logging {

class PersistenceLogs {
public:
    static void log_store_loaded(const std::string& store_name, const std::string& file_path, size_t record_count);
    static void log_store_saved(const std::string& store_name, size_t record_count);
    static void log_store_failure(const std::string& store_name, const std::string& error_message);
    static void log_record_skipped(const std::string& store_name, const std::string& detail);
    static void log_stale_orders_removed(size_t removed_count, int max_age_hours);
    static void log_persistence_disabled(const std::string& store_name);
};

} // namespace Logging
} // namespace ValrTrader

#endif // PERSISTENCE_LOGS_HPP
