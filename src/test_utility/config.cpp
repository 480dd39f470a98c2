/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "config.hpp"

#include "test_utility/filesystem.hpp"

using namespace imageviz;

namespace test_utility {
namespace config {

static boost::filesystem::path getRepoRootDir() {
    return boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();
}

static std::shared_ptr<filesystem::PathRAII> makePrefixDir() {
    auto prefixDir = std::make_shared<filesystem::PathRAII>(filesystem::makeTemporaryPath("imageviz-test-prefix-dir"));
    boost::filesystem::create_directories(prefixDir->getPath() / "etc");
    boost::filesystem::copy_file(getRepoRootDir() / "etc/imageviz.schema.json",
                                 prefixDir->getPath() / "etc/imageviz.schema.json");
    return prefixDir;
}

ConfigRAII makeConfig() {
    auto raii = ConfigRAII{};
    raii.prefixDir = makePrefixDir();
    boost::filesystem::copy_file(getRepoRootDir() / "etc/imageviz.json", raii.prefixDir->getPath() / "etc/imageviz.json");
    raii.config = std::make_shared<common::Config>(raii.prefixDir->getPath());
    return raii;
}

ConfigRAII makeConfig(const std::string& configFileContent) {
    auto raii = ConfigRAII{};
    raii.prefixDir = makePrefixDir();
    filesystem::writeTextFile(raii.prefixDir->getPath() / "etc/imageviz.json", configFileContent);
    raii.config = std::make_shared<common::Config>(raii.prefixDir->getPath());
    return raii;
}

}
}
