/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef imageviz_image_graph_ImageHierarchy_hpp
#define imageviz_image_graph_ImageHierarchy_hpp

#include <string>
#include <unordered_map>
#include <vector>

#include "common/ImageRecord.hpp"


namespace imageviz {
namespace image_graph {

/**
 * Index of the parent/child relationships implied by the parent id of each image.
 *
 * Roots are the images without a parent id. Images whose parent id does not
 * match any image of the collection are indexed under that id but, having no
 * root ancestor, are not reachable from the roots.
 *
 * Roots and children keep the relative order they have in the input collection.
 * No cycle detection is performed.
 */
class ImageHierarchy {
public:
    explicit ImageHierarchy(const std::vector<common::ImageRecord>& images);

    const std::vector<common::ImageRecord>& getRoots() const;
    const std::vector<common::ImageRecord>& getChildren(const std::string& parentID) const;

private:
    std::vector<common::ImageRecord> roots;
    std::unordered_map<std::string, std::vector<common::ImageRecord>> childrenByParent;
    const std::vector<common::ImageRecord> noChildren;
};

}
}

#endif
