/**
 * @file test_all.cpp
 * @brief Test entry point for the authorization core
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Test cases register themselves from the other translation units of the
 * authcore_tests executable. Pass a test name substring as the first
 * argument to run a subset.
 */

#include "test_framework.hpp"
#include "auth_logger.hpp"

using namespace authcore;
using namespace authcore::testing;

int main(int argc, char* argv[]) {
    AuthLogger::instance().setConsoleOutput(false);
    AuthLogger::instance().setLevel(LogLevel::LOG_DEBUG);

    std::string filter;
    if (argc > 1) filter = argv[1];
    return TestRunner::instance().run(filter);
}
