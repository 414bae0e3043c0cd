// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the piianon unit tests in test/unit/.
// Logging is limited to ERROR and above.

#include <gtest/gtest.h>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    piianon::util::logger::setLogLevel(piianon::util::logger::LogLevel::ERROR);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
