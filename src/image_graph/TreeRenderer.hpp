/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef imageviz_image_graph_TreeRenderer_hpp
#define imageviz_image_graph_TreeRenderer_hpp

#include <ostream>
#include <string>
#include <vector>

#include "common/ImageRecord.hpp"
#include "image_graph/ImageHierarchy.hpp"


namespace imageviz {
namespace image_graph {

/**
 * Renders the image hierarchy as an ASCII tree, e.g.:
 *
 *   └─511136ea3c5a Virtual Size: 0.0 B Tags: scratch:latest
 *     ├─6c8a4b2f0e1d Virtual Size: 85.0 MB
 *     │ └─9ee13ca3b908 Virtual Size: 85.1 MB Tags: ubuntu:latest
 *     └─2c57ae96e4a0 Virtual Size: 90.2 MB Tags: debian:latest
 *
 * The recursion depth is bounded by maxDepth: parent references forming a
 * cycle make rendering fail instead of overflowing the stack.
 */
class TreeRenderer {
public:
    TreeRenderer(const ImageHierarchy& hierarchy, bool truncateIDs, std::size_t maxDepth);

    std::string render() const;
    std::string render(const common::ImageRecord& root) const;

private:
    void walk(std::ostream& os, const std::vector<common::ImageRecord>& images,
              const std::string& prefix, std::size_t depth) const;
    void printNode(std::ostream& os, const common::ImageRecord& image, const std::string& prefix) const;

private:
    const ImageHierarchy& hierarchy;
    bool truncateIDs;
    std::size_t maxDepth;
};

}
}

#endif
