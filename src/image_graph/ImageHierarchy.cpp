/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image_graph/ImageHierarchy.hpp"

#include "libimageviz/utility/logging.hpp"
#include "image_graph/Utility.hpp"


namespace imageviz {
namespace image_graph {

ImageHierarchy::ImageHierarchy(const std::vector<common::ImageRecord>& images) {
    for(const auto& image : images) {
        if(image.isRoot()) {
            roots.push_back(image);
        }
        else {
            childrenByParent[image.parentId].push_back(image);
        }
    }

    auto message = boost::format("built image hierarchy: %d images, %d roots, %d parents")
        % images.size() % roots.size() % childrenByParent.size();
    libimageviz::logMessage(libimageviz::Subsystem::IMAGE_GRAPH, message, libimageviz::LogLevel::DEBUG);
}

const std::vector<common::ImageRecord>& ImageHierarchy::getRoots() const {
    return roots;
}

const std::vector<common::ImageRecord>& ImageHierarchy::getChildren(const std::string& parentID) const {
    auto it = childrenByParent.find(parentID);
    if(it == childrenByParent.cend()) {
        return noChildren;
    }
    return it->second;
}

}
}
