/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image_graph/DotRenderer.hpp"

#include <sstream>

#include <boost/algorithm/string/join.hpp>
#include <boost/format.hpp>

#include "libimageviz/utility/logging.hpp"
#include "image_graph/Utility.hpp"


namespace imageviz {
namespace image_graph {

DotRenderer::DotRenderer(const common::Config::DotNodeStyle& taggedNodeStyle)
    : taggedNodeStyle(taggedNodeStyle)
{}

std::string DotRenderer::render(const std::vector<common::ImageRecord>& images) const {
    libimageviz::logMessage(libimageviz::Subsystem::IMAGE_GRAPH,
                            boost::format("rendering dot graph of %d images") % images.size(),
                            libimageviz::LogLevel::DEBUG);

    std::ostringstream os;
    os << "digraph docker {\n";

    for(const auto& image : images) {
        auto id = utility::shortenID(image.id);
        if(image.isRoot()) {
            os << boost::format(" base -> \"%s\" [style=invis]\n") % id;
        }
        else {
            os << boost::format(" \"%s\" -> \"%s\"\n") % utility::shortenID(image.parentId) % id;
        }
        if(image.isTagged()) {
            os << makeTaggedNodeDeclaration(image);
        }
    }

    os << " base [style=invisible]\n}\n";
    return os.str();
}

std::string DotRenderer::makeTaggedNodeDeclaration(const common::ImageRecord& image) const {
    auto id = utility::shortenID(image.id);
    // "\\n" is the two-character newline escape of dot labels
    auto label = id + "\\n" + boost::algorithm::join(image.repoTags, "\\n");
    auto declaration = boost::format(" \"%s\" [label=\"%s\",shape=%s,fillcolor=\"%s\",style=\"%s\"];\n")
        % id % label % taggedNodeStyle.shape % taggedNodeStyle.fillColor % taggedNodeStyle.style;
    return declaration.str();
}

}
}
