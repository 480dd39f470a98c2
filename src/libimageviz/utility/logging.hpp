/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libimageviz_utility_logging_hpp
#define libimageviz_utility_logging_hpp

#include <string>
#include <iostream>

#include <boost/format.hpp>

#include "libimageviz/Logger.hpp"

namespace libimageviz {

void logMessage(Subsystem, const std::string&, LogLevel,
                std::ostream& out = std::cout, std::ostream& err = std::cerr);
void logMessage(Subsystem, const boost::format&, LogLevel,
                std::ostream& out = std::cout, std::ostream& err = std::cerr);

}

#endif
