/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef imageviz_common_ImageRecord_hpp
#define imageviz_common_ImageRecord_hpp

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>


namespace imageviz {
namespace common {

struct ImageRecord {
    static const std::string UNTAGGED; // "<none>:<none>", the only entry of repoTags when the image has no tags

    std::string id;
    std::string parentId;               // empty for root images
    std::vector<std::string> repoTags;  // never empty, see UNTAGGED
    std::int64_t virtualSize = 0;       // including the layers inherited from the parent images
    std::int64_t size = 0;              // this layer alone
    std::int64_t created = 0;

    bool isRoot() const;
    bool isTagged() const;
};

bool operator==(const ImageRecord&, const ImageRecord&);
std::ostream& operator<<(std::ostream&, const ImageRecord&);

std::vector<ImageRecord> parseImageRecords(const rapidjson::Value& json);
std::vector<ImageRecord> readImageRecords(std::istream& is);
std::vector<ImageRecord> readImageRecords(const boost::filesystem::path& file);

}
}

#endif
