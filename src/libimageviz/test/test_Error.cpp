/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <ios>
#include <new>
#include <stdexcept>
#include <string>
#include <system_error>

#include "libimageviz/Error.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace libimageviz {
namespace test {

TEST_GROUP(ErrorTestGroup) {
};

static int lineOfRootNotFound = 0;
static int lineOfRenderFailure = 0;

static void resolveUnknownRoot() {
    lineOfRootNotFound = __LINE__ + 1;
    IMAGEVIZ_THROW_ERROR(ErrorKind::ROOT_NOT_FOUND, "Unable to find image ubuntu.");
}

static void renderTreeOfUnknownRoot() {
    try {
        resolveUnknownRoot();
    }
    catch(const Error& e) {
        lineOfRenderFailure = __LINE__ + 1;
        IMAGEVIZ_RETHROW_ERROR(e, "Failed to render tree");
    }
}

static void readTruncatedImageList() {
    try {
        IMAGEVIZ_THROW_ERROR(ErrorKind::INPUT_ACQUISITION, "unexpected end of stream");
    }
    catch(const Error& e) {
        IMAGEVIZ_RETHROW_ERROR_AS(e, ErrorKind::MALFORMED_INPUT, "Invalid input: the list of images is truncated");
    }
}

static void convertSize() {
    try {
        throw std::out_of_range("size does not fit in 64 bits");
    }
    catch(const std::exception& e) {
        IMAGEVIZ_RETHROW_ERROR(e, "Failed to convert image size");
    }
}

TEST(ErrorTestGroup, thrownErrorHasOneTraceEntry) {
    try {
        resolveUnknownRoot();
        FAIL("expected libimageviz::Error to be thrown");
    }
    catch(const Error& error) {
        auto expectedEntry = Error::TraceEntry{"Unable to find image ubuntu.", "test_Error.cpp",
                                               lineOfRootNotFound, "resolveUnknownRoot"};
        CHECK_EQUAL(1u, error.getTrace().size());
        CHECK(error.getTrace()[0] == expectedEntry);
        CHECK(error.getKind() == ErrorKind::ROOT_NOT_FOUND);
        STRCMP_EQUAL("Unable to find image ubuntu.", error.what());
    }
}

TEST(ErrorTestGroup, rethrownErrorKeepsKindAndGrowsTrace) {
    try {
        renderTreeOfUnknownRoot();
        FAIL("expected libimageviz::Error to be thrown");
    }
    catch(const Error& error) {
        auto expectedOuterEntry = Error::TraceEntry{"Failed to render tree", "test_Error.cpp",
                                                    lineOfRenderFailure, "renderTreeOfUnknownRoot"};
        CHECK_EQUAL(2u, error.getTrace().size());
        CHECK_EQUAL(std::string{"resolveUnknownRoot"}, error.getTrace()[0].functionName);
        CHECK(error.getTrace()[1] == expectedOuterEntry);
        CHECK(error.getKind() == ErrorKind::ROOT_NOT_FOUND);
        // what() stays the message of the innermost entry
        STRCMP_EQUAL("Unable to find image ubuntu.", error.what());
    }
}

TEST(ErrorTestGroup, rethrowAsOtherKind) {
    try {
        readTruncatedImageList();
        FAIL("expected libimageviz::Error to be thrown");
    }
    catch(const Error& error) {
        CHECK(error.getKind() == ErrorKind::MALFORMED_INPUT);
        CHECK_EQUAL(2u, error.getTrace().size());
        CHECK_EQUAL(std::string{"Invalid input: the list of images is truncated"}, error.getTrace()[1].message);
    }
}

TEST(ErrorTestGroup, standardExceptionBecomesInternalError) {
    try {
        convertSize();
        FAIL("expected libimageviz::Error to be thrown");
    }
    catch(const Error& error) {
        auto expectedCause = Error::TraceEntry{"size does not fit in 64 bits", "", -1, "logic error"};
        CHECK_EQUAL(2u, error.getTrace().size());
        CHECK(error.getTrace()[0] == expectedCause);
        CHECK_EQUAL(std::string{"convertSize"}, error.getTrace()[1].functionName);
        CHECK(error.getKind() == ErrorKind::INTERNAL);
    }
}

TEST(ErrorTestGroup, userErrorsAreLoggedAsInfo) {
    auto entry = Error::TraceEntry{"message", "file.cpp", 1, "function"};

    for(auto kind : {ErrorKind::USAGE, ErrorKind::INPUT_ACQUISITION, ErrorKind::MALFORMED_INPUT,
                     ErrorKind::ROOT_NOT_FOUND, ErrorKind::CONFIGURATION}) {
        auto error = Error{kind, entry};
        CHECK(error.isUserError());
        CHECK(error.getLogLevel() == LogLevel::INFO);
    }

    auto internalError = Error{ErrorKind::INTERNAL, entry};
    CHECK(!internalError.isUserError());
    CHECK(internalError.getLogLevel() == LogLevel::ERROR);
}

TEST(ErrorTestGroup, errorKindString) {
    CHECK_EQUAL(std::string{"usage error"}, getErrorKindString(ErrorKind::USAGE));
    CHECK_EQUAL(std::string{"root image not found"}, getErrorKindString(ErrorKind::ROOT_NOT_FOUND));
    CHECK_EQUAL(std::string{"internal error"}, getErrorKindString(ErrorKind::INTERNAL));
}

TEST(ErrorTestGroup, exceptionTypeString) {
    CHECK_EQUAL(std::string{"logic error"}, getExceptionTypeString(std::invalid_argument("")));
    CHECK_EQUAL(std::string{"runtime error"}, getExceptionTypeString(std::runtime_error("")));
    CHECK_EQUAL(std::string{"ios_base failure"}, getExceptionTypeString(std::ios_base::failure("")));
    CHECK_EQUAL(std::string{"system error"},
                getExceptionTypeString(std::system_error(std::make_error_code(std::errc::io_error))));
    CHECK_EQUAL(std::string{"generic exception"}, getExceptionTypeString(std::bad_alloc()));
}

}}

IMAGEVIZ_UNITTEST_MAIN_FUNCTION();
