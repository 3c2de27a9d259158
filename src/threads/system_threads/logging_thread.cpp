/**
 * Logging thread.
 * Drains the async logger queue to the console and the rotating log file.
 */
#include "logging_thread.hpp"
#include "logging/logs/thread_logs.hpp"
#include <chrono>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace ValrTrader::Threads;
using namespace ValrTrader::Logging;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void LoggingThread::operator()() {
    try {
        setup_logging_thread();
        execute_logging_processing_loop();
        ThreadLogs::log_thread_exited("LoggingThread");
    } catch (const std::exception& exception_error) {
        ThreadLogs::log_thread_exception("LoggingThread", exception_error.what());
    }
}

void LoggingThread::setup_logging_thread() {
    set_logging_context(logging_context);
    set_log_thread_tag("LOGGER");
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        ThreadLogs::log_thread_exception("LoggingThread", "cannot open log file " + logger_ptr->get_file_path());
    }

    std::vector<std::string> message_buffer;
    std::chrono::seconds poll_interval(config.timing.thread_logging_poll_interval_sec);

    while (logger_ptr->running.load()) {
        try {
            logger_ptr->collect_all_available_messages(message_buffer);
            if (!message_buffer.empty()) {
                logger_ptr->flush_message_buffer(message_buffer, log_file);
                logger_iterations->fetch_add(1);
            }

            std::unique_lock<std::mutex> wait_lock(logger_ptr->mtx);
            logger_ptr->cv.wait_for(wait_lock, poll_interval, [this]() {
                return !logger_ptr->running.load();
            });
        } catch (const std::exception& exception_error) {
            ThreadLogs::log_loop_iteration_exception("LoggingThread", exception_error.what());
            std::this_thread::sleep_for(poll_interval);
        }
    }

    // Final drain after stop()
    logger_ptr->collect_all_available_messages(message_buffer);
    if (!message_buffer.empty()) {
        logger_ptr->flush_message_buffer(message_buffer, log_file);
    }
}
