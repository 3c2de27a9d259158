#include <gtest/gtest.h>
#include "logging/logger/async_logger.hpp"

namespace {

// Engine code logs through the thread-local context; tests log to the console.
class TestLoggingEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        ValrTrader::Logging::set_logging_context(logging_context);
    }

private:
    ValrTrader::Logging::LoggingContext logging_context;
};

::testing::Environment* const test_logging_environment =
    ::testing::AddGlobalTestEnvironment(new TestLoggingEnvironment());

} // namespace
