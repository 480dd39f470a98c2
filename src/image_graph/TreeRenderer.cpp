/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image_graph/TreeRenderer.hpp"

#include <sstream>

#include <boost/algorithm/string/join.hpp>
#include <boost/format.hpp>

#include "libimageviz/Error.hpp"
#include "libimageviz/utility/logging.hpp"
#include "image_graph/Utility.hpp"


namespace imageviz {
namespace image_graph {

TreeRenderer::TreeRenderer(const ImageHierarchy& hierarchy, bool truncateIDs, std::size_t maxDepth)
    : hierarchy{hierarchy}
    , truncateIDs{truncateIDs}
    , maxDepth{maxDepth}
{}

std::string TreeRenderer::render() const {
    libimageviz::logMessage(libimageviz::Subsystem::IMAGE_GRAPH,
                            "rendering tree of all root images",
                            libimageviz::LogLevel::DEBUG);
    std::ostringstream os;
    walk(os, hierarchy.getRoots(), "", 1);
    return os.str();
}

std::string TreeRenderer::render(const common::ImageRecord& root) const {
    libimageviz::logMessage(libimageviz::Subsystem::IMAGE_GRAPH,
                            boost::format("rendering tree rooted at image %s") % root.id,
                            libimageviz::LogLevel::DEBUG);
    std::ostringstream os;
    walk(os, std::vector<common::ImageRecord>{root}, "", 1);
    return os.str();
}

void TreeRenderer::walk(std::ostream& os, const std::vector<common::ImageRecord>& images,
                        const std::string& prefix, std::size_t depth) const {
    for(size_t i=0; i<images.size(); ++i) {
        const auto& image = images[i];

        if(depth > maxDepth) {
            auto message = boost::format("Failed to render tree: image %s is nested more than %d levels deep."
                                         " The parent references of the images probably form a cycle.")
                % image.id % maxDepth;
            IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, message.str());
        }

        bool isLast = i+1 == images.size();
        printNode(os, image, prefix + (isLast ? "└─" : "├─"));

        const auto& children = hierarchy.getChildren(image.id);
        if(!children.empty()) {
            walk(os, children, prefix + (isLast ? "  " : "│ "), depth + 1);
        }
    }
}

void TreeRenderer::printNode(std::ostream& os, const common::ImageRecord& image, const std::string& prefix) const {
    auto id = truncateIDs ? utility::shortenID(image.id) : image.id;
    os << prefix << id << " Virtual Size: " << utility::humanSize(image.virtualSize);
    if(image.isTagged()) {
        os << " Tags: " << boost::algorithm::join(image.repoTags, ", ");
    }
    os << "\n";
}

}
}
