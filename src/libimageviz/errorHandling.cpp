/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Error.hpp"

#include <ios>
#include <stdexcept>
#include <system_error>

#include <boost/filesystem/path.hpp>

namespace libimageviz {

std::string getErrorKindString(ErrorKind kind) {
    switch(kind) {
        case ErrorKind::USAGE:             return "usage error";
        case ErrorKind::INPUT_ACQUISITION: return "input acquisition error";
        case ErrorKind::MALFORMED_INPUT:   return "malformed input";
        case ErrorKind::ROOT_NOT_FOUND:    return "root image not found";
        case ErrorKind::CONFIGURATION:     return "configuration error";
        case ErrorKind::INTERNAL:          return "internal error";
    }
    return "unknown error";
}

Error::Error(ErrorKind kind, const TraceEntry& entry)
    : kind{kind}
    , trace{entry}
{}

const char* Error::what() const noexcept {
    return trace.front().message.c_str();
}

void Error::appendTraceEntry(const TraceEntry& entry) {
    trace.push_back(entry);
}

bool operator==(const Error::TraceEntry& lhs, const Error::TraceEntry& rhs) {
    return lhs.message == rhs.message
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

std::string getExceptionTypeString(const std::exception& e) {
    // most derived types first: ios_base::failure and system_error are runtime_errors
    if(dynamic_cast<const std::ios_base::failure*>(&e)) {
        return "ios_base failure";
    }
    if(dynamic_cast<const std::system_error*>(&e)) {
        return "system error";
    }
    if(dynamic_cast<const std::runtime_error*>(&e)) {
        return "runtime error";
    }
    if(dynamic_cast<const std::logic_error*>(&e)) {
        return "logic error";
    }
    return "generic exception";
}

namespace error {

static Error::TraceEntry makeTraceEntry(const std::string& message, const char* file, int line, const char* function) {
    return Error::TraceEntry{message, boost::filesystem::path{file}.filename().string(), line, function};
}

void throwError(ErrorKind kind, const std::string& message, const char* file, int line, const char* function) {
    throw Error{kind, makeTraceEntry(message, file, line, function)};
}

static Error makePropagatedError(const std::exception& e, const std::string& message,
                                 const char* file, int line, const char* function) {
    const auto* cause = dynamic_cast<const Error*>(&e);
    auto error = cause ? *cause
                       : Error{ErrorKind::INTERNAL, Error::TraceEntry{e.what(), "", -1, getExceptionTypeString(e)}};
    error.appendTraceEntry(makeTraceEntry(message, file, line, function));
    return error;
}

void rethrowError(const std::exception& e, const std::string& message, const char* file, int line, const char* function) {
    throw makePropagatedError(e, message, file, line, function);
}

void rethrowError(const std::exception& e, ErrorKind kind, const std::string& message,
                  const char* file, int line, const char* function) {
    auto error = makePropagatedError(e, message, file, line, function);
    error.setKind(kind);
    throw error;
}

}

}
