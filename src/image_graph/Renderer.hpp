/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef imageviz_image_graph_Renderer_hpp
#define imageviz_image_graph_Renderer_hpp

#include <string>
#include <vector>

#include "common/Config.hpp"
#include "common/ImageRecord.hpp"


namespace imageviz {
namespace image_graph {

std::string render(const std::vector<common::ImageRecord>& images, const common::Config& config);

}
}

#endif
