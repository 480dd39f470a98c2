/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef imageviz_image_graph_SummaryRenderer_hpp
#define imageviz_image_graph_SummaryRenderer_hpp

#include <map>
#include <string>
#include <vector>

#include "common/ImageRecord.hpp"


namespace imageviz {
namespace image_graph {

/**
 * Renders one line per repository with all the tags found for it, e.g.
 * "ubuntu: 14.04, latest". Untagged images do not contribute.
 */
class SummaryRenderer {
public:
    std::string render(const std::vector<common::ImageRecord>& images) const;

// public for test purpose
public:
    std::map<std::string, std::vector<std::string>> groupTagsByRepository(
        const std::vector<common::ImageRecord>& images) const;
};

}
}

#endif
