/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Utility functions to be used in the tests.
 */

#ifndef imageviz_test_utility_config_hpp
#define imageviz_test_utility_config_hpp

#include <memory>
#include <string>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"
#include "test_utility/filesystem.hpp"

namespace test_utility {
namespace config {

struct ConfigRAII {
    std::shared_ptr<imageviz::common::Config> config;
    std::shared_ptr<filesystem::PathRAII> prefixDir; // removed with the last copy
};

/**
 * Creates a temporary installation prefix with the default configuration
 * file and its schema, and loads the Config from there
 */
ConfigRAII makeConfig();

/**
 * As above, but with the given content as configuration file
 */
ConfigRAII makeConfig(const std::string& configFileContent);

}
}

#endif
