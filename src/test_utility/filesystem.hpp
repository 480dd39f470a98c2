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
 * @brief Temporary files and directories for the tests.
 */

#ifndef imageviz_test_utility_filesystem_hpp
#define imageviz_test_utility_filesystem_hpp

#include <string>

#include <boost/filesystem.hpp>


namespace test_utility {
namespace filesystem {

/**
 * Removes the wrapped path (if it exists) when going out of scope
 */
class PathRAII {
public:
    explicit PathRAII(const boost::filesystem::path& path);
    PathRAII(const PathRAII&) = delete;
    PathRAII& operator=(const PathRAII&) = delete;
    ~PathRAII();
    const boost::filesystem::path& getPath() const;

private:
    boost::filesystem::path path;
};

boost::filesystem::path makeTemporaryPath(const std::string& prefix);
void writeTextFile(const boost::filesystem::path& file, const std::string& content);

}
}

#endif
