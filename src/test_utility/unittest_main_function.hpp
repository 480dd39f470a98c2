/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef imageviz_test_utility_unittest_main_function_hpp
#define imageviz_test_utility_unittest_main_function_hpp

#include "libimageviz/Error.hpp"
#include "libimageviz/Logger.hpp"

// WATCH OUT!
// boost libraries must be included before CppUTest, so include this file
// as the last header file in the test code
#include <CppUTest/CommandLineTestRunner.h>
#include <CppUTest/MemoryLeakWarningPlugin.h>


#define IMAGEVIZ_UNITTEST_MAIN_FUNCTION() \
int main(int argc, char **argv) { \
    /* lazily initialized statics of Boost and of the logger are not leaks */ \
    MemoryLeakWarningPlugin::turnOffNewDeleteOverloads(); \
    try { \
        return CommandLineTestRunner::RunAllTests(argc, argv); \
    } \
    catch(const libimageviz::Error& e) { \
        libimageviz::Logger::getInstance().reportError(e); \
        return 1; \
    } \
}

#endif
