/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libimageviz/Logger.hpp"

#include <string>
#include <vector>
#include <iostream>

#include <boost/algorithm/string/join.hpp>
#include <boost/format.hpp>

namespace libimageviz {

std::string getSubsystemName(Subsystem subsystem) {
    switch(subsystem) {
        case Subsystem::MAIN:        return "main";
        case Subsystem::CLI:         return "CLI";
        case Subsystem::CONFIG:      return "Config";
        case Subsystem::INPUT:       return "Input";
        case Subsystem::IMAGE_GRAPH: return "ImageGraph";
    }
    return "unknown";
}

static const char* getLogLevelName(LogLevel logLevel) {
    switch(logLevel) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARN:    return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::GENERAL: return "";
    }
    return "";
}

Logger& Logger::getInstance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : startTime{std::chrono::steady_clock::now()}
{}

void Logger::log(Subsystem subsystem, const std::string& message, LogLevel logLevel,
                 std::ostream& outStream, std::ostream& errStream) const {
    if(!isEnabled(logLevel)) {
        return;
    }

    auto& stream = (logLevel == LogLevel::WARN || logLevel == LogLevel::ERROR) ? errStream : outStream;
    stream << makePrefix(subsystem, logLevel) << message << std::endl;
}

void Logger::log(Subsystem subsystem, const boost::format& message, LogLevel logLevel,
                 std::ostream& outStream, std::ostream& errStream) const {
    log(subsystem, message.str(), logLevel, outStream, errStream);
}

/**
 * Prints the messages of the error for the user, outermost first, and, if
 * the level of the error is enabled, its trace. The trace of a user error
 * only shows up in verbose mode.
 */
void Logger::reportError(const Error& error, std::ostream& errStream) const {
    auto messages = std::vector<std::string>{};
    const auto& trace = error.getTrace();
    for(auto entry = trace.crbegin(); entry != trace.crend(); ++entry) {
        messages.push_back(entry->message);
    }

    errStream << "imageviz: ";
    if(!error.isUserError()) {
        errStream << getErrorKindString(error.getKind()) << ": ";
    }
    errStream << boost::algorithm::join(messages, ": ") << "\n";
    if(error.getKind() == ErrorKind::USAGE) {
        errStream << "See 'imageviz --help'\n";
    }

    if(!isEnabled(error.getLogLevel())) {
        return;
    }

    errStream << "Error trace (most nested error first):\n";
    for(size_t i=0; i<trace.size(); ++i) {
        const auto& entry = trace[i];
        if(entry.fileLine < 0) {
            errStream << boost::format("  #%d %s: %s\n") % i % entry.functionName % entry.message;
        }
        else {
            errStream << boost::format("  #%d %s (%s:%d): %s\n")
                % i % entry.functionName % entry.fileName % entry.fileLine % entry.message;
        }
    }
    errStream.flush();
}

std::string Logger::makePrefix(Subsystem subsystem, LogLevel logLevel) const {
    if(logLevel == LogLevel::GENERAL) {
        return "";
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime);
    auto prefix = boost::format("[+%.6f] [%s] [%s] ")
        % elapsed.count() % getSubsystemName(subsystem) % getLogLevelName(logLevel);
    return prefix.str();
}

}
