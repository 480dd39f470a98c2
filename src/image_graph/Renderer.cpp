/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image_graph/Renderer.hpp"

#include "libimageviz/Error.hpp"
#include "image_graph/DotRenderer.hpp"
#include "image_graph/ImageHierarchy.hpp"
#include "image_graph/RootResolver.hpp"
#include "image_graph/SummaryRenderer.hpp"
#include "image_graph/TreeRenderer.hpp"


namespace imageviz {
namespace image_graph {

static std::string renderTree(const std::vector<common::ImageRecord>& images, const common::Config& config) {
    const auto& options = config.commandImages;

    // resolve the root first: an unknown selector must not produce any output
    auto root = RootResolver{images}.resolve(options.rootSelector);

    auto hierarchy = ImageHierarchy{images};
    auto renderer = TreeRenderer{hierarchy, options.truncateIDs, config.getTreeMaxDepth()};
    if(root) {
        return renderer.render(*root);
    }
    return renderer.render();
}

/**
 * Renders the images in the view selected by config.commandImages.mode
 */
std::string render(const std::vector<common::ImageRecord>& images, const common::Config& config) {
    switch(config.commandImages.mode) {
        case common::Config::RenderMode::DOT:
            return DotRenderer{config.getDotTaggedNodeStyle()}.render(images);
        case common::Config::RenderMode::TREE:
            return renderTree(images, config);
        case common::Config::RenderMode::SHORT:
            return SummaryRenderer{}.render(images);
        case common::Config::RenderMode::NONE:
            break;
    }

    IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::USAGE, "Please specify either --dot, --tree, or --short");
}

}
}
