/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef imageviz_cli_CLI_hpp
#define imageviz_cli_CLI_hpp

#include <iostream>
#include <vector>

#include <boost/program_options.hpp>

#include "libimageviz/CLIArguments.hpp"
#include "common/Config.hpp"
#include "common/ImageRecord.hpp"


namespace imageviz {
namespace cli {

/**
 * Command line of imageviz:
 *
 *   imageviz [--debug|--verbose] (--dot|--tree|--short) [--no-trunc] [--input FILE] [ROOT]
 *   imageviz --help
 *   imageviz --version
 */
class CLI {
public:
    enum class Action { RENDER, PRINT_HELP, PRINT_VERSION };

public:
    CLI();

    // sets the level of the logger and config.commandImages
    Action parseCommandLine(const libimageviz::CLIArguments& args, common::Config& config) const;

    void execute(Action action, const common::Config& config, std::ostream& out = std::cout) const;

    void printHelpMessage(std::ostream& out) const;

private:
    void parseViewOptions(const boost::program_options::variables_map& values,
                          common::Config::CommandImages& options) const;
    std::vector<common::ImageRecord> readImages(const common::Config::CommandImages& options) const;

private:
    boost::program_options::options_description generalOptions{"General options"};
    boost::program_options::options_description viewOptions{"View options"};
    boost::program_options::options_description hiddenOptions;
    boost::program_options::positional_options_description positionalOptions;
};

}
}

#endif
