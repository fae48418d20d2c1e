#define BOOST_TEST_MODULE celestia_da_tests
#include <boost/test/unit_test.hpp>

#include "celestiada/sdk/Logger.hpp"

// Keep test output readable; failures under test are expected to log warnings
struct QuietLogger {
    QuietLogger() {
        celestiada::sdk::Logger::instance().set_log_level(celestiada::sdk::Logger::LogLevel::CRITICAL);
    }
};

BOOST_GLOBAL_FIXTURE(QuietLogger);
