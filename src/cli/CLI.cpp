/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLI.hpp"

#include <string>

#include <unistd.h>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libimageviz/Error.hpp"
#include "libimageviz/Utility.hpp"
#include "image_graph/Renderer.hpp"


namespace po = boost::program_options;

namespace imageviz {
namespace cli {

CLI::CLI() {
    generalOptions.add_options()
        ("help,h", "Print this help message and quit")
        ("version", "Print version information and quit")
        ("debug", "Print all log messages with DEBUG level or higher")
        ("verbose", "Print all log messages with INFO level or higher");

    viewOptions.add_options()
        ("dot,d", "Show image information as Graphviz dot")
        ("tree,t", "Show image information as tree")
        ("short,s", "Show short summary of images (repository name and list of tags)")
        ("no-trunc,n", "Don't truncate the image IDs")
        ("input,i", po::value<std::string>()->value_name("FILE"),
            "Read the list of images from FILE instead of standard input");

    hiddenOptions.add_options()
        ("root", po::value<std::string>(), "Image from which the tree is rendered");
    positionalOptions.add("root", 1);
}

CLI::Action CLI::parseCommandLine(const libimageviz::CLIArguments& args, common::Config& config) const {
    libimageviz::logMessage(libimageviz::Subsystem::CLI,
                            boost::format("parsing command line %s") % args,
                            libimageviz::LogLevel::DEBUG);

    auto allOptions = po::options_description{};
    allOptions.add(generalOptions).add(viewOptions).add(hiddenOptions);

    auto values = po::variables_map{};
    try {
        po::store(po::command_line_parser(args.argc(), args.argv())
                    .options(allOptions)
                    .positional(positionalOptions)
                    .style(po::command_line_style::unix_style)
                    .run(), values);
        po::notify(values);
    }
    catch(const po::error& e) {
        IMAGEVIZ_RETHROW_ERROR_AS(e, libimageviz::ErrorKind::USAGE, "failed to parse command line");
    }

    auto& logger = libimageviz::Logger::getInstance();
    if(values.count("debug")) {
        logger.setLevel(libimageviz::LogLevel::DEBUG);
    }
    else if(values.count("verbose")) {
        logger.setLevel(libimageviz::LogLevel::INFO);
    }
    else {
        logger.setLevel(libimageviz::LogLevel::WARN);
    }

    if(values.count("help")) {
        return Action::PRINT_HELP;
    }
    if(values.count("version")) {
        return Action::PRINT_VERSION;
    }

    parseViewOptions(values, config.commandImages);
    return Action::RENDER;
}

void CLI::parseViewOptions(const po::variables_map& values, common::Config::CommandImages& options) const {
    auto numberOfModes = values.count("dot") + values.count("tree") + values.count("short");
    if(numberOfModes == 0) {
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::USAGE, "Please specify either --dot, --tree, or --short");
    }
    if(numberOfModes > 1) {
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::USAGE, "The options --dot, --tree and --short are mutually exclusive");
    }

    if(values.count("dot")) {
        options.mode = common::Config::RenderMode::DOT;
    }
    else if(values.count("tree")) {
        options.mode = common::Config::RenderMode::TREE;
    }
    else if(values.count("short")) {
        options.mode = common::Config::RenderMode::SHORT;
    }

    options.truncateIDs = values.count("no-trunc") == 0;

    if(values.count("input")) {
        options.inputFile = boost::filesystem::absolute(values["input"].as<std::string>());
    }

    if(values.count("root")) {
        if(options.mode != common::Config::RenderMode::TREE) {
            IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::USAGE, "A root image can only be specified together with --tree");
        }
        options.rootSelector = values["root"].as<std::string>();
    }
}

void CLI::execute(Action action, const common::Config& config, std::ostream& out) const {
    switch(action) {
        case Action::PRINT_HELP:
            printHelpMessage(out);
            return;
        case Action::PRINT_VERSION:
            out << config.buildTime.version << std::endl;
            return;
        case Action::RENDER:
            break;
    }

    auto images = readImages(config.commandImages);
    out << image_graph::render(images, config);
    out.flush();
}

std::vector<common::ImageRecord> CLI::readImages(const common::Config::CommandImages& options) const {
    if(options.inputFile) {
        libimageviz::logMessage(libimageviz::Subsystem::CLI,
                                boost::format("reading images from %s") % *options.inputFile,
                                libimageviz::LogLevel::INFO);
        return common::readImageRecords(*options.inputFile);
    }

    if(libimageviz::process::isTerminal(STDIN_FILENO)) {
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::INPUT_ACQUISITION,
                             "No list of images was piped to standard input."
                             " Pipe in the JSON image list of a container engine or use --input FILE");
    }

    libimageviz::logMessage(libimageviz::Subsystem::CLI, "reading images from standard input", libimageviz::LogLevel::INFO);
    return common::readImageRecords(std::cin);
}

void CLI::printHelpMessage(std::ostream& out) const {
    out << "Usage: imageviz (--dot | --tree | --short) [OPTIONS] [ROOT]\n"
        << "\n"
        << "Visualize the hierarchy of container images.\n"
        << "\n"
        << "Reads the JSON image list of a container engine (e.g. the output of\n"
        << "'curl --unix-socket /var/run/docker.sock http://localhost/images/json?all=1')\n"
        << "from standard input or from the file given with --input.\n"
        << "ROOT (tree view only) is an image ID, an ID prefix or a repository[:tag]\n"
        << "from which the tree is rendered.\n"
        << "\n"
        << viewOptions
        << "\n"
        << generalOptions;
}

}
}
