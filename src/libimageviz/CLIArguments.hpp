/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libimageviz_CLIArguments_hpp
#define libimageviz_CLIArguments_hpp

#include <initializer_list>
#include <vector>
#include <string>
#include <ostream>

namespace libimageviz {

/**
 * Owns a list of command line tokens and exposes them as the null-terminated
 * char* array expected by boost::program_options.
 */
class CLIArguments {
public:
    using const_iterator = std::vector<std::string>::const_iterator;

public:
    CLIArguments(int argc, char* argv[]);
    CLIArguments(std::initializer_list<std::string> args);

    int argc() const;
    char** argv() const;

    const_iterator begin() const;
    const_iterator end() const;

private:
    std::vector<std::string> args;
    mutable std::vector<char*> argvPointers; // rebuilt on every call to argv()
};

std::ostream& operator<<(std::ostream&, const CLIArguments&);

}

#endif
