/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "images.hpp"

namespace test_utility {
namespace images {

const std::string SCRATCH_ID = "511136ea3c5a64f264b78b5433614aec563103b4d4702f3ba7d4d2698e22c158";
const std::string BASE_LAYER_ID = "6c8a4b2f0e1d7a21c2e39c0c8c1c0f3f5a0f3d0e6a3c1f42b1e9a7a8c3d2e1f0";
const std::string UBUNTU_ID = "9ee13ca3b908a2c5f1e8d0a6e29ee3c4b4c8f1bfa3f7b3c3c1e1d4c5b6a7f8e9";
const std::string DEBIAN_ID = "2c57ae96e4a0c0e4b7b1b9f1e3a5d8c7b6a5f4e3d2c1b0a9f8e7d6c5b4a3f2e1";
const std::string BUSYBOX_ID = "f1b10cd842498c23d206ee0cbeaa9de8d2ae09ff3c7af2723a9e337a6965d639";
const std::string ORPHAN_ID = "aaaaaaaaaaaabbbbbbbbbbbbccccccccccccddddddddddddeeeeeeeeeeeeffff";
const std::string MISSING_PARENT_ID = "deadbeef00000000000000000000000000000000000000000000000000000000";

imageviz::common::ImageRecord makeImage(const std::string& id,
                                        const std::string& parentId,
                                        const std::vector<std::string>& repoTags,
                                        std::int64_t virtualSize) {
    auto image = imageviz::common::ImageRecord{};
    image.id = id;
    image.parentId = parentId;
    image.repoTags = repoTags.empty() ? std::vector<std::string>{imageviz::common::ImageRecord::UNTAGGED} : repoTags;
    image.virtualSize = virtualSize;
    image.size = virtualSize;
    return image;
}

std::vector<imageviz::common::ImageRecord> makeSampleImages() {
    return std::vector<imageviz::common::ImageRecord>{
        makeImage(SCRATCH_ID, "", {"scratch:latest"}, 0),
        makeImage(BASE_LAYER_ID, SCRATCH_ID, {}, 85000000),
        makeImage(UBUNTU_ID, BASE_LAYER_ID, {"ubuntu:14.04", "ubuntu:latest"}, 85100000),
        makeImage(DEBIAN_ID, SCRATCH_ID, {"debian:latest"}, 90200000),
        makeImage(BUSYBOX_ID, "", {"busybox:latest"}, 2430000),
        makeImage(ORPHAN_ID, MISSING_PARENT_ID, {}, 1000)
    };
}

std::string makeSampleImagesJSON() {
    return R"([
        {"Id": ")" + SCRATCH_ID + R"(", "ParentId": "", "RepoTags": ["scratch:latest"],
         "Size": 0, "VirtualSize": 0, "Created": 1371157430},
        {"Id": ")" + BASE_LAYER_ID + R"(", "ParentId": ")" + SCRATCH_ID + R"(", "RepoTags": ["<none>:<none>"],
         "Size": 85000000, "VirtualSize": 85000000, "Created": 1400000000},
        {"Id": ")" + UBUNTU_ID + R"(", "ParentId": ")" + BASE_LAYER_ID + R"(", "RepoTags": ["ubuntu:14.04", "ubuntu:latest"],
         "Size": 85100000, "VirtualSize": 85100000, "Created": 1400000100},
        {"Id": ")" + DEBIAN_ID + R"(", "ParentId": ")" + SCRATCH_ID + R"(", "RepoTags": ["debian:latest"],
         "Size": 90200000, "VirtualSize": 90200000, "Created": 1400000200},
        {"Id": ")" + BUSYBOX_ID + R"(", "ParentId": "", "RepoTags": ["busybox:latest"],
         "Size": 2430000, "VirtualSize": 2430000, "Created": 1400000300},
        {"Id": ")" + ORPHAN_ID + R"(", "ParentId": ")" + MISSING_PARENT_ID + R"(", "RepoTags": null,
         "Size": 1000, "VirtualSize": 1000, "Created": 1400000400}
    ])";
}

}
}
