/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <cerrno>
#include <cstring>

#include <unistd.h>

#include <boost/format.hpp>

#include "libimageviz/Error.hpp"

namespace libimageviz {
namespace process {

/**
 * Returns true if the file descriptor refers to a terminal. Any reason
 * for isatty() to fail other than "not a terminal" is reported as an error.
 */
bool isTerminal(int fileDescriptor) {
    if(isatty(fileDescriptor) == 1) {
        return true;
    }
    if(errno != ENOTTY && errno != EINVAL) {
        auto message = boost::format("failed to check whether file descriptor %d is a terminal (%s)")
            % fileDescriptor % strerror(errno);
        IMAGEVIZ_THROW_ERROR(ErrorKind::INPUT_ACQUISITION, message.str());
    }
    return false;
}

}}
