/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLIArguments.hpp"

namespace libimageviz {

CLIArguments::CLIArguments(int argc, char* argv[])
    : args(argv, argv + argc)
{}

CLIArguments::CLIArguments(std::initializer_list<std::string> args)
    : args(args)
{}

int CLIArguments::argc() const {
    return static_cast<int>(args.size());
}

char** CLIArguments::argv() const {
    argvPointers.clear();
    for(const auto& arg : args) {
        argvPointers.push_back(const_cast<char*>(arg.c_str()));
    }
    argvPointers.push_back(nullptr);
    return argvPointers.data();
}

CLIArguments::const_iterator CLIArguments::begin() const {
    return args.cbegin();
}

CLIArguments::const_iterator CLIArguments::end() const {
    return args.cend();
}

std::ostream& operator<<(std::ostream& os, const CLIArguments& args) {
    os << "[";
    for(auto it = args.begin(); it != args.end(); ++it) {
        os << (it == args.begin() ? "" : ", ") << "\"" << *it << "\"";
    }
    os << "]";
    return os;
}

}
