#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <string>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>
#include <thread>
#include <memory>
#include <unordered_map>
#include <vector>
#include <fstream>
#include <cstdint>
#include "configs/system_config.hpp"

namespace ValrTrader {
namespace Logging {


// Named constants
constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");
constexpr std::uintmax_t BYTES_PER_MEGABYTE = 1024 * 1024;

class AsyncLogger {
private:
    std::string file_path;
    std::uintmax_t max_file_size_bytes;
    int backup_count;
    bool console_output_enabled;

    void collect_all_available_messages_internal(std::vector<std::string>& message_buffer);
    void output_log_line_internal(const std::string& log_line, std::ofstream& log_file);
    void rotate_files_internal();

public:
    std::mutex mtx;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::atomic<bool> running{false};

    AsyncLogger(const std::string& log_file_path, std::uintmax_t max_size_bytes, int backups, bool console_output)
        : file_path(log_file_path), max_file_size_bytes(max_size_bytes), backup_count(backups),
          console_output_enabled(console_output) {}

    const std::string& get_file_path() const { return file_path; }
    void enqueue(const std::string& formatted_line);
    void stop();

    // Message processing methods (called by logging thread)
    void collect_all_available_messages(std::vector<std::string>& message_buffer);

    // Write messages to console and log file, then clear buffer
    void flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file);

    // Rotates <file> to <file>.1 .. <file>.N when the size limit is reached; reopens log_file
    bool rotate_if_needed(std::ofstream& log_file);
};


struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;

    std::string get_thread_tag() const {
        std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
        std::unordered_map<std::thread::id, std::string>::const_iterator thread_tag_map_iterator = thread_tags.find(std::this_thread::get_id());
        if (thread_tag_map_iterator != thread_tags.end()) {
            return thread_tag_map_iterator->second;
        }
        return "MAIN  ";
    }

    void set_thread_tag(const std::string& tag_value) {
        std::lock_guard<std::mutex> lock(thread_tag_mutex);
        std::string tag_string = tag_value;
        if (tag_string.size() < LOG_TAG_WIDTH) {
            tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
        }
        if (tag_string.size() > LOG_TAG_WIDTH) {
            tag_string = tag_string.substr(0, LOG_TAG_WIDTH);
        }
        thread_tags[std::this_thread::get_id()] = tag_string;
    }
};

// Thread-local log tag (6 characters, padded/truncated) to appear in timestamp
void set_log_thread_tag(const std::string& thread_tag_value);

// Main logging function
void log_message(const std::string& message, const std::string& log_file_path);

// Global lifecycle helpers (use context internally)
void initialize_global_logger(std::shared_ptr<AsyncLogger> logger);
void shutdown_global_logger(AsyncLogger& logger);

// Application foundation initialization
std::shared_ptr<AsyncLogger> initialize_application_foundation(const ValrTrader::Config::SystemConfig& config);

// Context access (validates context exists before returning)
LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);

} // namespace Logging
} // namespace ValrTrader

#endif // ASYNC_LOGGER_HPP
