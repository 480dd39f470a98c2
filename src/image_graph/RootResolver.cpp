/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image_graph/RootResolver.hpp"

#include <algorithm>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/format.hpp>

#include "libimageviz/Error.hpp"
#include "libimageviz/utility/logging.hpp"
#include "image_graph/Utility.hpp"


namespace imageviz {
namespace image_graph {

const std::string RootResolver::DEFAULT_TAG = "latest";

RootResolver::RootResolver(const std::vector<common::ImageRecord>& images)
    : images{images}
{}

/**
 * Returns the first image of the collection matched by the selector, or none
 * if the selector is empty (i.e. the whole forest is to be rendered).
 * Throws if no image matches.
 */
boost::optional<common::ImageRecord> RootResolver::resolve(const std::string& selector) const {
    if(selector.empty()) {
        return boost::none;
    }

    libimageviz::logMessage(libimageviz::Subsystem::IMAGE_GRAPH,
                            boost::format("resolving root image from selector '%s'") % selector,
                            libimageviz::LogLevel::DEBUG);

    auto selectorWithTag = appendDefaultTagIfMissing(selector);
    auto it = std::find_if(images.cbegin(), images.cend(), [&](const common::ImageRecord& image) {
        return isMatch(image, selector, selectorWithTag);
    });

    if(it == images.cend()) {
        auto message = boost::format("Unable to find image %s.") % selector;
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::ROOT_NOT_FOUND, message.str());
    }

    libimageviz::logMessage(libimageviz::Subsystem::IMAGE_GRAPH,
                            boost::format("selector '%s' resolved to image %s") % selector % it->id,
                            libimageviz::LogLevel::INFO);
    return *it;
}

/**
 * A reference carries a tag if it contains a colon after its last slash:
 * the colon in "registry:5000/repo" separates a port number, not a tag.
 */
bool RootResolver::hasTag(const std::string& reference) {
    auto lastColon = reference.rfind(':');
    if(lastColon == std::string::npos) {
        return false;
    }
    auto lastSlash = reference.rfind('/');
    return lastSlash == std::string::npos || lastColon > lastSlash;
}

std::string RootResolver::appendDefaultTagIfMissing(const std::string& reference) {
    if(hasTag(reference)) {
        return reference;
    }
    return reference + ":" + DEFAULT_TAG;
}

bool RootResolver::isMatch(const common::ImageRecord& image,
                           const std::string& selector,
                           const std::string& selectorWithTag) const {
    // id or id prefix (this includes the full id and its short form)
    if(boost::algorithm::starts_with(image.id, selector)) {
        return true;
    }

    // repository reference
    if(image.isTagged()) {
        for(const auto& repoTag : image.repoTags) {
            if(repoTag == selector || repoTag == selectorWithTag) {
                return true;
            }
        }
    }

    return utility::shortenID(image.id) == selector;
}

}
}
