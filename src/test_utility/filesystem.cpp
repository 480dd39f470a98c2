/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "filesystem.hpp"

#include <fstream>

#include <boost/format.hpp>

#include "libimageviz/Error.hpp"


namespace test_utility {
namespace filesystem {

PathRAII::PathRAII(const boost::filesystem::path& path)
    : path{path}
{}

PathRAII::~PathRAII() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(path, ec);
}

const boost::filesystem::path& PathRAII::getPath() const {
    return path;
}

/**
 * Returns a non-existing path in the temporary directory, e.g.
 * "/tmp/imageviz-test-json-1a2b-3c4d-5e6f" for the prefix "imageviz-test-json"
 */
boost::filesystem::path makeTemporaryPath(const std::string& prefix) {
    return boost::filesystem::unique_path(boost::filesystem::temp_directory_path() / (prefix + "-%%%%-%%%%-%%%%"));
}

void writeTextFile(const boost::filesystem::path& file, const std::string& content) {
    if(file.has_parent_path()) {
        boost::filesystem::create_directories(file.parent_path());
    }
    std::ofstream ofs(file.string());
    ofs << content;
    ofs.close();
    if(!ofs) {
        auto message = boost::format("Failed to write test file %s") % file;
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::INTERNAL, message.str());
    }
}

}
}
