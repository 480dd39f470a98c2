/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "logging.hpp"

namespace libimageviz {

void logMessage(Subsystem subsystem, const std::string& message, LogLevel level, std::ostream& out, std::ostream& err) {
    Logger::getInstance().log(subsystem, message, level, out, err);
}

void logMessage(Subsystem subsystem, const boost::format& message, LogLevel level, std::ostream& out, std::ostream& err) {
    Logger::getInstance().log(subsystem, message, level, out, err);
}

}
