/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef imageviz_image_graph_RootResolver_hpp
#define imageviz_image_graph_RootResolver_hpp

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "common/ImageRecord.hpp"


namespace imageviz {
namespace image_graph {

/**
 * Maps the root selector of the tree view (an image id, a prefix of it, or a
 * repository reference) to an image of the collection.
 */
class RootResolver {
public:
    static const std::string DEFAULT_TAG;

public:
    explicit RootResolver(const std::vector<common::ImageRecord>& images);

    boost::optional<common::ImageRecord> resolve(const std::string& selector) const;

// these methods are public for test purpose
public:
    static bool hasTag(const std::string& reference);
    static std::string appendDefaultTagIfMissing(const std::string& reference);

private:
    bool isMatch(const common::ImageRecord& image,
                 const std::string& selector,
                 const std::string& selectorWithTag) const;

private:
    const std::vector<common::ImageRecord>& images;
};

}
}

#endif
