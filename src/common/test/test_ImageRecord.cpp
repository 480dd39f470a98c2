/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <sstream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "libimageviz/Error.hpp"
#include "libimageviz/Utility.hpp"
#include "common/ImageRecord.hpp"
#include "test_utility/filesystem.hpp"
#include "test_utility/images.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace imageviz;

TEST_GROUP(ImageRecordTestGroup) {
};

static std::vector<common::ImageRecord> parse(const std::string& json) {
    std::istringstream is{json};
    return common::readImageRecords(is);
}

TEST(ImageRecordTestGroup, readSampleCollection) {
    auto images = parse(test_utility::images::makeSampleImagesJSON());
    auto expected = test_utility::images::makeSampleImages();

    CHECK_EQUAL(images.size(), expected.size());
    for(size_t i=0; i<images.size(); ++i) {
        CHECK_EQUAL(images[i].id, expected[i].id);
        CHECK_EQUAL(images[i].parentId, expected[i].parentId);
        CHECK(images[i].repoTags == expected[i].repoTags);
        CHECK_EQUAL(images[i].virtualSize, expected[i].virtualSize);
        CHECK_EQUAL(images[i].size, expected[i].size);
    }
    CHECK_EQUAL(images[0].created, 1371157430);
}

TEST(ImageRecordTestGroup, rootAndTagged) {
    auto images = test_utility::images::makeSampleImages();

    // scratch:latest
    CHECK(images[0].isRoot());
    CHECK(images[0].isTagged());

    // untagged intermediate layer
    CHECK(!images[1].isRoot());
    CHECK(!images[1].isTagged());
}

TEST(ImageRecordTestGroup, missingOrEmptyRepoTags) {
    auto images = parse(R"([
        {"Id": "a", "Size": 1},
        {"Id": "b", "Size": 1, "RepoTags": null},
        {"Id": "c", "Size": 1, "RepoTags": []}
    ])");

    CHECK_EQUAL(images.size(), 3);
    for(const auto& image : images) {
        CHECK(image.repoTags == std::vector<std::string>{common::ImageRecord::UNTAGGED});
        CHECK(!image.isTagged());
    }
}

TEST(ImageRecordTestGroup, optionalProperties) {
    auto images = parse(R"([{"Id": "a", "ParentId": null, "Size": 1234}])");

    CHECK_EQUAL(images.size(), 1);
    CHECK(images[0].isRoot());
    CHECK_EQUAL(images[0].size, 1234);
    CHECK_EQUAL(images[0].virtualSize, 1234); // defaults to Size
    CHECK_EQUAL(images[0].created, 0);
}

TEST(ImageRecordTestGroup, unknownPropertiesAreIgnored) {
    auto images = parse(R"([{"Id": "a", "Size": 1, "Labels": {"maintainer": "me"}, "Containers": -1}])");
    CHECK_EQUAL(images.size(), 1);
    CHECK_EQUAL(images[0].id, std::string{"a"});
}

TEST(ImageRecordTestGroup, emptyCollection) {
    CHECK(parse("[]").empty());
}

TEST(ImageRecordTestGroup, invalidInput) {
    // not JSON
    CHECK_THROWS(libimageviz::Error, parse("this is not JSON"));
    CHECK_THROWS(libimageviz::Error, parse(""));
    // not an array
    CHECK_THROWS(libimageviz::Error, parse(R"({"Id": "a", "Size": 1})"));
    // entry is not an object
    CHECK_THROWS(libimageviz::Error, parse(R"(["a"])"));
    // missing or empty id
    CHECK_THROWS(libimageviz::Error, parse(R"([{"Size": 1}])"));
    CHECK_THROWS(libimageviz::Error, parse(R"([{"Id": "", "Size": 1}])"));
    // missing size
    CHECK_THROWS(libimageviz::Error, parse(R"([{"Id": "a"}])"));
    // wrong types
    CHECK_THROWS(libimageviz::Error, parse(R"([{"Id": 1, "Size": 1}])"));
    CHECK_THROWS(libimageviz::Error, parse(R"([{"Id": "a", "Size": "1"}])"));
    CHECK_THROWS(libimageviz::Error, parse(R"([{"Id": "a", "Size": -1}])"));
    CHECK_THROWS(libimageviz::Error, parse(R"([{"Id": "a", "Size": 1, "VirtualSize": 1.5}])"));
    CHECK_THROWS(libimageviz::Error, parse(R"([{"Id": "a", "Size": 1, "RepoTags": "ubuntu:latest"}])"));
    CHECK_THROWS(libimageviz::Error, parse(R"([{"Id": "a", "Size": 1, "RepoTags": [1]}])"));
}

TEST(ImageRecordTestGroup, errorMessageNamesTheEntry) {
    try {
        parse(R"([{"Id": "a", "Size": 1}, {"Id": "b"}])");
        FAIL("expected libimageviz::Error to be thrown");
    }
    catch(const libimageviz::Error& error) {
        const auto& trace = error.getTrace();
        CHECK(error.getKind() == libimageviz::ErrorKind::MALFORMED_INPUT);
        CHECK_EQUAL(trace.size(), 2);
        CHECK_EQUAL(trace[0].message, std::string{"missing required property \"Size\""});
        CHECK(trace[1].message.find("Invalid input: failed to parse image entry #1") == 0);
        CHECK(trace[1].message.find(R"({"Id":"b"})") != std::string::npos);
    }
}

TEST(ImageRecordTestGroup, readFromFile) {
    auto testDir = test_utility::filesystem::PathRAII{
        test_utility::filesystem::makeTemporaryPath("imageviz-test-images")};
    auto file = testDir.getPath() / "images.json";
    test_utility::filesystem::writeTextFile(file, test_utility::images::makeSampleImagesJSON());

    auto images = common::readImageRecords(file);

    CHECK_EQUAL(images.size(), 6);
    CHECK_EQUAL(images[2].id, test_utility::images::UBUNTU_ID);
}

TEST(ImageRecordTestGroup, readFromMissingFile) {
    auto file = test_utility::filesystem::makeTemporaryPath("imageviz-test-images") / "images.json";
    try {
        common::readImageRecords(file);
        FAIL("expected libimageviz::Error to be thrown");
    }
    catch(const libimageviz::Error& error) {
        CHECK(error.getKind() == libimageviz::ErrorKind::INPUT_ACQUISITION);
    }
}

TEST(ImageRecordTestGroup, readFromFileWithInvalidJSON) {
    auto testDir = test_utility::filesystem::PathRAII{
        test_utility::filesystem::makeTemporaryPath("imageviz-test-images")};
    auto file = testDir.getPath() / "images.json";
    test_utility::filesystem::writeTextFile(file, R"([{"Id": "a",)");

    try {
        common::readImageRecords(file);
        FAIL("expected libimageviz::Error to be thrown");
    }
    catch(const libimageviz::Error& error) {
        // same wording as for the list of images read from standard input
        CHECK(error.getKind() == libimageviz::ErrorKind::MALFORMED_INPUT);
        CHECK(std::string{error.what()}.find("Invalid input: the list of images is not valid JSON") == 0);
        CHECK(error.getTrace().back().message.find("Failed to read images from") == 0);
    }
}

TEST(ImageRecordTestGroup, streamOperator) {
    auto image = test_utility::images::makeSampleImages()[0];
    std::ostringstream os;
    os << image;
    CHECK_EQUAL(os.str(), test_utility::images::SCRATCH_ID);
}

IMAGEVIZ_UNITTEST_MAIN_FUNCTION();
