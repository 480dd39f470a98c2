/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image_graph/SummaryRenderer.hpp"

#include <sstream>
#include <tuple>

#include <boost/algorithm/string/join.hpp>

#include "libimageviz/utility/logging.hpp"
#include "image_graph/Utility.hpp"


namespace imageviz {
namespace image_graph {

std::string SummaryRenderer::render(const std::vector<common::ImageRecord>& images) const {
    auto tagsByRepository = groupTagsByRepository(images);

    std::ostringstream os;
    for(const auto& entry : tagsByRepository) {
        os << entry.first << ": " << boost::algorithm::join(entry.second, ", ") << "\n";
    }
    return os.str();
}

std::map<std::string, std::vector<std::string>> SummaryRenderer::groupTagsByRepository(
        const std::vector<common::ImageRecord>& images) const {
    auto tagsByRepository = std::map<std::string, std::vector<std::string>>{};

    for(const auto& image : images) {
        for(const auto& repoTag : image.repoTags) {
            if(repoTag == common::ImageRecord::UNTAGGED) {
                continue;
            }
            std::string repository, tag;
            std::tie(repository, tag) = utility::splitRepositoryAndTag(repoTag);
            tagsByRepository[repository].push_back(tag);
        }
    }

    auto message = boost::format("grouped tags of %d images into %d repositories")
        % images.size() % tagsByRepository.size();
    libimageviz::logMessage(libimageviz::Subsystem::IMAGE_GRAPH, message, libimageviz::LogLevel::DEBUG);
    return tagsByRepository;
}

}
}
