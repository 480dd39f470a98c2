/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <map>
#include <string>
#include <vector>

#include "common/ImageRecord.hpp"
#include "image_graph/SummaryRenderer.hpp"
#include "test_utility/images.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace imageviz;
namespace images = test_utility::images;

TEST_GROUP(SummaryRendererTestGroup) {
};

TEST(SummaryRendererTestGroup, sampleCollection) {
    auto expected = std::string{
        "busybox: latest\n"
        "debian: latest\n"
        "scratch: latest\n"
        "ubuntu: 14.04, latest\n"
    };
    CHECK_EQUAL(image_graph::SummaryRenderer{}.render(images::makeSampleImages()), expected);
}

TEST(SummaryRendererTestGroup, groupTagsByRepository) {
    auto records = std::vector<common::ImageRecord>{
        images::makeImage("a", "", {"registry:5000/myrepo:1.0", "ubuntu:latest"}, 1),
        images::makeImage("b", "", {}, 1),
        images::makeImage("c", "", {"registry:5000/myrepo:2.0"}, 1),
        images::makeImage("d", "", {"ubuntu:14.04"}, 1)
    };

    auto groups = image_graph::SummaryRenderer{}.groupTagsByRepository(records);

    CHECK_EQUAL(groups.size(), 2);
    CHECK(groups["registry:5000/myrepo"] == (std::vector<std::string>{"1.0", "2.0"}));
    // tags keep the input order
    CHECK(groups["ubuntu"] == (std::vector<std::string>{"latest", "14.04"}));
}

TEST(SummaryRendererTestGroup, untaggedOnly) {
    auto records = std::vector<common::ImageRecord>{ images::makeImage("a", "", {}, 1) };
    CHECK(image_graph::SummaryRenderer{}.render(records).empty());
    CHECK(image_graph::SummaryRenderer{}.render({}).empty());
}

IMAGEVIZ_UNITTEST_MAIN_FUNCTION();
