// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point shared by the xpeconomy test executables.
// Logging is raised to ERROR so expected rejections do not flood the output.

#include <gtest/gtest.h>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    xpeconomy::util::logger::setLogLevel(xpeconomy::util::logger::LogLevel::ERROR);
    return RUN_ALL_TESTS();
}
