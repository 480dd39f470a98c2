/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image_graph/Utility.hpp"

#include <vector>

#include <boost/format.hpp>


namespace imageviz {
namespace image_graph {
namespace utility {

/**
 * Formats a byte count with decimal (1000-based) magnitude steps and one
 * fractional digit, e.g. 1500000 -> "1.5 MB". Values beyond the TB range
 * are still expressed in TB.
 */
std::string humanSize(std::int64_t bytes) {
    const std::vector<std::string> suffix = {"B", "KB", "MB", "GB", "TB"};
    const double unit(1000);

    double size_d(bytes);
    size_t i = 0;

    while ( (size_d >= unit) && (i < (suffix.size() - 1) ) )
    {
        size_d = size_d / unit;
        ++i;
    }
    return ( boost::format("%.1f %s") % size_d % suffix[i] ).str();
}

std::string shortenID(const std::string& id) {
    return id.substr(0, SHORT_ID_LENGTH);
}

/**
 * Splits "repository:tag" at the last colon, so that the port number in a
 * registry host (e.g. "registry:5000/repo:1.0") stays in the repository.
 * A reference without any colon yields an empty tag.
 */
std::pair<std::string, std::string> splitRepositoryAndTag(const std::string& repoTag) {
    auto lastColon = repoTag.rfind(':');
    if(lastColon == std::string::npos) {
        return std::pair<std::string, std::string>{repoTag, std::string{}};
    }
    return std::pair<std::string, std::string>{repoTag.substr(0, lastColon), repoTag.substr(lastColon + 1)};
}

}
}
}
