#include "async_logger.hpp"
#include "configs/system_config.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <chrono>
#include <thread>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <filesystem>

namespace ValrTrader {
namespace Logging {

thread_local LoggingContext* thread_local_logging_context_pointer = nullptr;

void log_message_to_stderr(const std::string& error_message);

LoggingContext* get_logging_context() {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        throw std::runtime_error("Logging context not initialized for current thread - system must fail without context");
    }
    return thread_logging_context_ptr;
}

void set_logging_context(LoggingContext& context) {
    thread_local_logging_context_pointer = &context;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();
    thread_logging_context_ptr->set_thread_tag(thread_tag_value);
}


void log_message(const std::string& message, const std::string& log_file_path) {
    try {
        LoggingContext* thread_logging_context_ptr = get_logging_context();

        std::string timestamp_string;
        try {
            timestamp_string = TimeUtils::get_current_human_readable_time();
        } catch (const std::exception& time_exception_error) {
            log_message_to_stderr("ERROR: TimeUtils failed: " + std::string(time_exception_error.what()));
            timestamp_string = "ERROR-TIME";
        }

        std::string thread_tag_string = thread_logging_context_ptr->get_thread_tag();
        std::stringstream log_stream;
        log_stream << timestamp_string << " [" << thread_tag_string << "]   " << message << std::endl;
        std::string log_formatted_string = log_stream.str();

        if (thread_logging_context_ptr->async_logger) {
            try {
                thread_logging_context_ptr->async_logger->enqueue(log_formatted_string);
                return;
            } catch (const std::exception& logger_exception_error) {
                log_message_to_stderr("ERROR: Async logger enqueue failed: " + std::string(logger_exception_error.what()));
            }
        }

        try {
            std::lock_guard<std::mutex> console_guard(thread_logging_context_ptr->console_mutex);
            std::cout << log_formatted_string << std::flush;
        } catch (const std::exception& console_exception_error) {
            log_message_to_stderr("ERROR: Console logging failed: " + std::string(console_exception_error.what()));
        }

        if (!log_file_path.empty()) {
            try {
                std::ofstream log_file_stream(log_file_path, std::ios::app);
                if (log_file_stream.is_open()) {
                    log_file_stream << log_formatted_string;
                    log_file_stream.close();
                } else {
                    log_message_to_stderr("ERROR: Failed to open log file: " + log_file_path);
                }
            } catch (const std::exception& file_exception_error) {
                log_message_to_stderr("ERROR: File logging failed: " + std::string(file_exception_error.what()));
            }
        }
    } catch (const std::exception& critical_exception_error) {
        log_message_to_stderr("CRITICAL ERROR: Logging system failure: " + std::string(critical_exception_error.what()));
        std::cerr << message << std::endl;
    }
}

void log_message_to_stderr(const std::string& error_message) {
    std::cerr << error_message << std::endl;
}

void initialize_global_logger(std::shared_ptr<AsyncLogger> logger_instance) {
    if (!logger_instance) {
        throw std::runtime_error("Async logger is required but not provided");
    }
    LoggingContext* thread_logging_context_ptr = get_logging_context();
    thread_logging_context_ptr->async_logger = logger_instance;
    logger_instance->running.store(true);
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

// AsyncLogger implementation
void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        queue.push(formatted_line);
    }
    cv.notify_one();
}

// Message processing implementations
void AsyncLogger::collect_all_available_messages_internal(std::vector<std::string>& message_buffer) {
    // Collect all available messages immediately (no waiting)
    while (!queue.empty()) {
        message_buffer.push_back(std::move(queue.front()));
        queue.pop();
    }
}

void AsyncLogger::collect_all_available_messages(std::vector<std::string>& message_buffer) {
    std::unique_lock<std::mutex> lock(mtx);
    collect_all_available_messages_internal(message_buffer);
}

void AsyncLogger::output_log_line_internal(const std::string& log_line, std::ofstream& log_file) {
    if (console_output_enabled) {
        LoggingContext* thread_logging_context_ptr = get_logging_context();
        std::lock_guard<std::mutex> cguard(thread_logging_context_ptr->console_mutex);
        std::cout << log_line << std::flush;
    }

    if (log_file.is_open()) {
        log_file << log_line;
    }
}

void AsyncLogger::flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file) {
    for (const auto& log_line : message_buffer) {
        output_log_line_internal(log_line, log_file);
    }
    if (log_file.is_open()) {
        log_file.flush();
    }
    message_buffer.clear();
    rotate_if_needed(log_file);
}

bool AsyncLogger::rotate_if_needed(std::ofstream& log_file) {
    if (max_file_size_bytes == 0) {
        return false;
    }
    std::error_code size_error;
    std::uintmax_t current_size = std::filesystem::file_size(file_path, size_error);
    if (size_error || current_size < max_file_size_bytes) {
        return false;
    }

    log_file.close();
    rotate_files_internal();
    log_file.open(file_path, std::ios::out | std::ios::trunc);
    return true;
}

void AsyncLogger::rotate_files_internal() {
    std::error_code rotation_error;
    if (backup_count <= 0) {
        std::filesystem::remove(file_path, rotation_error);
        return;
    }

    std::filesystem::remove(file_path + "." + std::to_string(backup_count), rotation_error);
    for (int backup_index = backup_count - 1; backup_index >= 1; --backup_index) {
        std::string source_path = file_path + "." + std::to_string(backup_index);
        if (std::filesystem::exists(source_path, rotation_error)) {
            std::filesystem::rename(source_path, file_path + "." + std::to_string(backup_index + 1), rotation_error);
        }
    }
    std::filesystem::rename(file_path, file_path + ".1", rotation_error);
    if (rotation_error) {
        log_message_to_stderr("ERROR: Log rotation failed for " + file_path + ": " + rotation_error.message());
    }
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const ValrTrader::Config::SystemConfig& config) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();

    std::filesystem::path log_file_path(config.logging.log_file);
    try {
        if (log_file_path.has_parent_path()) {
            std::filesystem::create_directories(log_file_path.parent_path());
        }
    } catch (const std::exception& filesystem_exception_error) {
        log_message_to_stderr(std::string("CRITICAL ERROR: Failed to create log folder: ") + filesystem_exception_error.what());
        throw std::runtime_error("Failed to create log folder for: " + config.logging.log_file);
    }

    auto logger_instance = std::make_shared<AsyncLogger>(
        config.logging.log_file,
        static_cast<std::uintmax_t>(config.logging.max_log_file_size_mb) * BYTES_PER_MEGABYTE,
        config.logging.log_backup_count,
        config.logging.console_output_enabled);

    initialize_global_logger(logger_instance);
    thread_logging_context_ptr->set_thread_tag("MAIN");

    return logger_instance;
}

} // namespace Logging
} // namespace ValrTrader
