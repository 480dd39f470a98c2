/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>
#include <utility>

#include "image_graph/Utility.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace imageviz;

TEST_GROUP(ImageGraphUtilityTestGroup) {
};

TEST(ImageGraphUtilityTestGroup, humanSize) {
    CHECK_EQUAL(image_graph::utility::humanSize(0), std::string{"0.0 B"});
    CHECK_EQUAL(image_graph::utility::humanSize(999), std::string{"999.0 B"});
    CHECK_EQUAL(image_graph::utility::humanSize(1000), std::string{"1.0 KB"});
    CHECK_EQUAL(image_graph::utility::humanSize(1500000), std::string{"1.5 MB"});
    CHECK_EQUAL(image_graph::utility::humanSize(85100000), std::string{"85.1 MB"});
    CHECK_EQUAL(image_graph::utility::humanSize(2000000000), std::string{"2.0 GB"});
    CHECK_EQUAL(image_graph::utility::humanSize(3000000000000), std::string{"3.0 TB"});
    // no unit beyond TB
    CHECK_EQUAL(image_graph::utility::humanSize(5000000000000000), std::string{"5000.0 TB"});
}

TEST(ImageGraphUtilityTestGroup, shortenID) {
    auto id = std::string{"511136ea3c5a64f264b78b5433614aec563103b4d4702f3ba7d4d2698e22c158"};
    CHECK_EQUAL(image_graph::utility::shortenID(id), std::string{"511136ea3c5a"});
    CHECK_EQUAL(image_graph::utility::shortenID("511136ea3c5a"), std::string{"511136ea3c5a"});
    CHECK_EQUAL(image_graph::utility::shortenID("5111"), std::string{"5111"});
}

TEST(ImageGraphUtilityTestGroup, splitRepositoryAndTag) {
    using Split = std::pair<std::string, std::string>;
    CHECK(image_graph::utility::splitRepositoryAndTag("ubuntu:14.04") == (Split{"ubuntu", "14.04"}));
    CHECK(image_graph::utility::splitRepositoryAndTag("library/ubuntu:latest") == (Split{"library/ubuntu", "latest"}));
    CHECK(image_graph::utility::splitRepositoryAndTag("registry:5000/myrepo:1.0") == (Split{"registry:5000/myrepo", "1.0"}));
    CHECK(image_graph::utility::splitRepositoryAndTag("ubuntu") == (Split{"ubuntu", ""}));
}

IMAGEVIZ_UNITTEST_MAIN_FUNCTION();
