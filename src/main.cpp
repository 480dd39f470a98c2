/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <exception>
#include <iostream>
#include <clocale>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"
#include "libimageviz/Error.hpp"
#include "libimageviz/Logger.hpp"
#include "libimageviz/CLIArguments.hpp"
#include "cli/CLI.hpp"

using namespace imageviz;

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // tree connectors and tags may be non-ascii

    auto& logger = libimageviz::Logger::getInstance();

    try {
        auto installationPrefixDir = boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();
        auto config = common::Config{installationPrefixDir};

        auto commandLine = cli::CLI{};
        auto action = commandLine.parseCommandLine(libimageviz::CLIArguments(argc, argv), config);
        commandLine.execute(action, config);
    }
    catch(const libimageviz::Error& e) {
        logger.reportError(e);
        return 1;
    }
    catch(const std::exception& e) {
        std::cerr << "imageviz: unexpected exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
