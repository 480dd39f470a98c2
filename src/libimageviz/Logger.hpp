/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libimageviz_Logger_hpp
#define libimageviz_Logger_hpp

#include <chrono>
#include <string>
#include <iostream>

#include <boost/format.hpp>

#include "libimageviz/LogLevel.hpp"
#include "libimageviz/Error.hpp"

namespace libimageviz {

enum class Subsystem { MAIN, CLI, CONFIG, INPUT, IMAGE_GRAPH };

std::string getSubsystemName(Subsystem subsystem);

/**
 * Process-wide logger. Messages below the current level are dropped.
 *
 * GENERAL messages are printed verbatim, all other messages get a prefix
 * with the time elapsed since startup, the subsystem and the level.
 * WARN and ERROR messages go to the error stream, the rest to the output stream.
 */
class Logger {
public:
    static Logger& getInstance();

    void log(Subsystem subsystem, const std::string& message, LogLevel logLevel,
             std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr) const;
    void log(Subsystem subsystem, const boost::format& message, LogLevel logLevel,
             std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr) const;

    void reportError(const Error& error, std::ostream& errStream = std::cerr) const;

    void setLevel(LogLevel logLevel) { level = logLevel; }
    LogLevel getLevel() const { return level; }
    bool isEnabled(LogLevel logLevel) const { return logLevel >= level; }

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string makePrefix(Subsystem subsystem, LogLevel logLevel) const;

private:
    LogLevel level = LogLevel::WARN;
    std::chrono::steady_clock::time_point startTime;
};

}

#endif
