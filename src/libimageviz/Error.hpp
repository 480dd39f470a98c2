/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libimageviz_Error_hpp
#define libimageviz_Error_hpp

#include <exception>
#include <string>
#include <vector>

#include "libimageviz/LogLevel.hpp"

namespace libimageviz {

/**
 * What went wrong, from the point of view of the person running imageviz.
 * Everything but INTERNAL is caused by the command line, the input or the
 * configuration, and is fixed by the user.
 */
enum class ErrorKind {
    USAGE,              // invalid command line
    INPUT_ACQUISITION,  // the image list could not be read
    MALFORMED_INPUT,    // the image list is not a valid JSON array of images
    ROOT_NOT_FOUND,     // the root selector of the tree view matches no image
    CONFIGURATION,      // invalid settings file
    INTERNAL
};

std::string getErrorKindString(ErrorKind kind);

/**
 * Exception carrying the kind of failure and a trace of where it was raised
 * and through which functions it was propagated (most nested entry first).
 *
 * Raise with IMAGEVIZ_THROW_ERROR, propagate with IMAGEVIZ_RETHROW_ERROR
 * or IMAGEVIZ_RETHROW_ERROR_AS.
 */
class Error : public std::exception {
public:
    struct TraceEntry {
        std::string message;
        std::string fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(ErrorKind kind, const TraceEntry& entry);

    const char* what() const noexcept override;

    ErrorKind getKind() const { return kind; }
    void setKind(ErrorKind value) { kind = value; }
    bool isUserError() const { return kind != ErrorKind::INTERNAL; }

    // user errors are expected: their trace is only interesting in verbose mode
    LogLevel getLogLevel() const { return isUserError() ? LogLevel::INFO : LogLevel::ERROR; }

    const std::vector<TraceEntry>& getTrace() const { return trace; }
    void appendTraceEntry(const TraceEntry& entry);

private:
    ErrorKind kind;
    std::vector<TraceEntry> trace;
};

bool operator==(const Error::TraceEntry&, const Error::TraceEntry&);

std::string getExceptionTypeString(const std::exception& e);

namespace error {

[[noreturn]] void throwError(ErrorKind kind, const std::string& message,
                             const char* file, int line, const char* function);

// appends an entry to the trace of a libimageviz::Error, or starts a new
// INTERNAL error from any other exception
[[noreturn]] void rethrowError(const std::exception& e, const std::string& message,
                               const char* file, int line, const char* function);

// as above, but also sets the kind of the propagated error
[[noreturn]] void rethrowError(const std::exception& e, ErrorKind kind, const std::string& message,
                               const char* file, int line, const char* function);

}

}

#define IMAGEVIZ_THROW_ERROR(kind, message) \
    ::libimageviz::error::throwError(kind, message, __FILE__, __LINE__, __func__)

#define IMAGEVIZ_RETHROW_ERROR(exception, message) \
    ::libimageviz::error::rethrowError(exception, message, __FILE__, __LINE__, __func__)

#define IMAGEVIZ_RETHROW_ERROR_AS(exception, kind, message) \
    ::libimageviz::error::rethrowError(exception, kind, message, __FILE__, __LINE__, __func__)

#endif
