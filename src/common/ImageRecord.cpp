/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/ImageRecord.hpp"

#include <fstream>

#include <boost/format.hpp>

#include "libimageviz/Error.hpp"
#include "libimageviz/Utility.hpp"


namespace rj = rapidjson;

namespace imageviz {
namespace common {

const std::string ImageRecord::UNTAGGED = "<none>:<none>";

bool ImageRecord::isRoot() const {
    return parentId.empty();
}

bool ImageRecord::isTagged() const {
    return !repoTags.empty() && repoTags.front() != UNTAGGED;
}

bool operator==(const ImageRecord& lhs, const ImageRecord& rhs) {
    return lhs.id == rhs.id
        && lhs.parentId == rhs.parentId
        && lhs.repoTags == rhs.repoTags
        && lhs.virtualSize == rhs.virtualSize
        && lhs.size == rhs.size
        && lhs.created == rhs.created;
}

std::ostream& operator<<(std::ostream& os, const ImageRecord& image) {
    os << image.id;
    return os;
}

static std::string getStringMember(const rj::Value& entry, const char* name, bool isRequired) {
    auto itr = entry.FindMember(name);
    if(itr == entry.MemberEnd() || itr->value.IsNull()) {
        if(isRequired) {
            auto message = boost::format("missing required property \"%s\"") % name;
            IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, message.str());
        }
        return std::string{};
    }
    if(!itr->value.IsString()) {
        auto message = boost::format("property \"%s\" is expected to be a string") % name;
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, message.str());
    }
    return std::string(itr->value.GetString(), itr->value.GetStringLength());
}

static bool hasMember(const rj::Value& entry, const char* name) {
    auto itr = entry.FindMember(name);
    return itr != entry.MemberEnd() && !itr->value.IsNull();
}

static std::int64_t getSizeMember(const rj::Value& entry, const char* name) {
    const auto& value = entry[name];
    if(!value.IsInt64() || value.GetInt64() < 0) {
        auto message = boost::format("property \"%s\" is expected to be a non-negative integer") % name;
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, message.str());
    }
    return value.GetInt64();
}

static std::vector<std::string> getRepoTags(const rj::Value& entry) {
    auto tags = std::vector<std::string>{};

    if(hasMember(entry, "RepoTags")) {
        const auto& value = entry["RepoTags"];
        if(!value.IsArray()) {
            IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, "property \"RepoTags\" is expected to be an array of strings");
        }
        for(const auto& tag : value.GetArray()) {
            if(!tag.IsString()) {
                IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, "property \"RepoTags\" is expected to be an array of strings");
            }
            tags.emplace_back(tag.GetString(), tag.GetStringLength());
        }
    }

    // untagged images carry the sentinel, never an empty list
    if(tags.empty()) {
        tags.push_back(ImageRecord::UNTAGGED);
    }

    return tags;
}

static ImageRecord parseImageRecord(const rj::Value& entry) {
    if(!entry.IsObject()) {
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, "image entry is expected to be a JSON object");
    }

    auto image = ImageRecord{};
    image.id = getStringMember(entry, "Id", true);
    if(image.id.empty()) {
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, "property \"Id\" must not be empty");
    }
    image.parentId = getStringMember(entry, "ParentId", false);
    image.repoTags = getRepoTags(entry);

    if(!hasMember(entry, "Size")) {
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, "missing required property \"Size\"");
    }
    image.size = getSizeMember(entry, "Size");

    // engine API v1.44 dropped "VirtualSize", which then equals "Size"
    image.virtualSize = hasMember(entry, "VirtualSize") ? getSizeMember(entry, "VirtualSize") : image.size;

    if(hasMember(entry, "Created")) {
        if(!entry["Created"].IsInt64()) {
            IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, "property \"Created\" is expected to be an integer");
        }
        image.created = entry["Created"].GetInt64();
    }

    return image;
}

std::vector<ImageRecord> parseImageRecords(const rj::Value& json) {
    if(!json.IsArray()) {
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, "Invalid input: the list of images is expected to be a JSON array");
    }

    auto images = std::vector<ImageRecord>{};
    images.reserve(json.Size());

    for(rj::SizeType i=0; i<json.Size(); ++i) {
        try {
            images.push_back(parseImageRecord(json[i]));
        }
        catch(libimageviz::Error& e) {
            auto message = boost::format("Invalid input: failed to parse image entry #%d %s")
                % i % libimageviz::json::serialize(json[i]);
            IMAGEVIZ_RETHROW_ERROR(e, message.str());
        }
    }

    libimageviz::logMessage(libimageviz::Subsystem::INPUT,
                            boost::format("parsed %d image records") % images.size(),
                            libimageviz::LogLevel::DEBUG);

    return images;
}

std::vector<ImageRecord> readImageRecords(std::istream& is) {
    auto json = libimageviz::json::parseStream(is);
    if(json.HasParseError()) {
        auto message = boost::format("Invalid input: the list of images is not valid JSON (%s)")
            % libimageviz::json::describeParseError(json);
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::MALFORMED_INPUT, message.str());
    }
    return parseImageRecords(json);
}

std::vector<ImageRecord> readImageRecords(const boost::filesystem::path& file) {
    std::ifstream ifs(file.string());
    if(!ifs) {
        auto message = boost::format("Failed to open the list of images %s") % file;
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::INPUT_ACQUISITION, message.str());
    }

    try {
        return readImageRecords(ifs);
    }
    catch(const libimageviz::Error& e) {
        auto message = boost::format("Failed to read images from %s") % file;
        IMAGEVIZ_RETHROW_ERROR(e, message.str());
    }
}

}
}
