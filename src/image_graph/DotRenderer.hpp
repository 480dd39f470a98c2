/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef imageviz_image_graph_DotRenderer_hpp
#define imageviz_image_graph_DotRenderer_hpp

#include <string>
#include <vector>

#include "common/Config.hpp"
#include "common/ImageRecord.hpp"


namespace imageviz {
namespace image_graph {

/**
 * Renders the images as a Graphviz digraph. Nodes are the short image ids.
 * Root images hang from an invisible "base" node, so that all of them are
 * laid out as a single graph; tagged images get a styled, labelled node.
 */
class DotRenderer {
public:
    explicit DotRenderer(const common::Config::DotNodeStyle& taggedNodeStyle);

    std::string render(const std::vector<common::ImageRecord>& images) const;

private:
    std::string makeTaggedNodeDeclaration(const common::ImageRecord& image) const;

private:
    common::Config::DotNodeStyle taggedNodeStyle;
};

}
}

#endif
