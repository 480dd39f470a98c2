/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Sample image collections to be used in the tests.
 */

#ifndef imageviz_test_utility_images_hpp
#define imageviz_test_utility_images_hpp

#include <cstdint>
#include <string>
#include <vector>

#include "common/ImageRecord.hpp"

namespace test_utility {
namespace images {

extern const std::string SCRATCH_ID;
extern const std::string BASE_LAYER_ID;
extern const std::string UBUNTU_ID;
extern const std::string DEBIAN_ID;
extern const std::string BUSYBOX_ID;
extern const std::string ORPHAN_ID;
extern const std::string MISSING_PARENT_ID;

imageviz::common::ImageRecord makeImage(const std::string& id,
                                        const std::string& parentId,
                                        const std::vector<std::string>& repoTags,
                                        std::int64_t virtualSize);

/**
 * Two trees and an orphan, in this input order:
 *
 *   scratch:latest (root)
 *     <untagged layer>
 *       ubuntu:14.04, ubuntu:latest
 *     debian:latest
 *   busybox:latest (root)
 *   <untagged image whose parent is not in the collection>
 */
std::vector<imageviz::common::ImageRecord> makeSampleImages();

/**
 * The same collection as an engine would report it in JSON
 */
std::string makeSampleImagesJSON();

}
}

#endif
