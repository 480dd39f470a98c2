/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef imageviz_image_graph_Utility_hpp
#define imageviz_image_graph_Utility_hpp

#include <cstdint>
#include <string>
#include <utility>

namespace imageviz {
namespace image_graph {
namespace utility {

const std::size_t SHORT_ID_LENGTH = 12;

std::string humanSize(std::int64_t bytes);
std::string shortenID(const std::string& id);
std::pair<std::string, std::string> splitRepositoryAndTag(const std::string& repoTag);

}
}
}

#endif
