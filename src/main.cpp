// main.cpp
#include "system/system_manager.hpp"
#include "logging/logs/system_logs.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>
#include <string>

using namespace ValrTrader::System;

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
private:
    std::atomic<bool> shutdown_requested_flag{false};
    std::atomic<SystemState*> system_state_pointer{nullptr};

public:
    static ShutdownHandler& get_instance() {
        static ShutdownHandler instance;
        return instance;
    }

    void set_system_state(SystemState* state) {
        system_state_pointer.store(state);
    }

    bool is_shutdown_requested() const {
        return shutdown_requested_flag.load();
    }

    // Only lock-free atomic stores here; run() notices the flags within a second.
    void signal_handler(int signal_number) {
        if (signal_number == SIGINT || signal_number == SIGTERM) {
            shutdown_requested_flag.store(true);
            SystemState* state = system_state_pointer.load();
            if (state) {
                state->shutdown_requested.store(true);
                state->running.store(false);
            }
        }
    }

private:
    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// =============================================================================
// STATIC SIGNAL HANDLER FUNCTION
// =============================================================================
static void signal_handler(int signal_number) {
    ShutdownHandler::get_instance().signal_handler(signal_number);
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    std::string config_directory = argc > 1 ? argv[1] : "config";

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    SystemInitializationResult initialization_result;
    try {
        initialization_result = initialize(config_directory);
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error during initialization: " << exception_error.what() << std::endl;
        return 1;
    }

    SystemState& system_state = *initialization_result.system_state;
    ShutdownHandler::get_instance().set_system_state(&system_state);

    int exit_code = 0;
    try {
        startup(system_state, initialization_result.logger);
        run(system_state);
    } catch (const std::exception& exception_error) {
        ValrTrader::Logging::SystemLogs::log_fatal_error(exception_error.what());
        exit_code = 1;
    }

    // Always runs so worker threads are joined and stores are flushed
    shutdown(system_state, initialization_result.logger);
    ShutdownHandler::get_instance().set_system_state(nullptr);

    if (exit_code != 0) {
        std::cerr << "Fatal error: valr_trader stopped after a startup or runtime failure" << std::endl;
    }
    return exit_code;
}
