/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include <boost/format.hpp>
#include <rapidjson/pointer.h>

#include "libimageviz/Error.hpp"
#include "libimageviz/Utility.hpp"


namespace rj = rapidjson;

namespace imageviz {
namespace common {

Config::BuildTime::BuildTime()
    : version{IMAGEVIZ_VERSION}
{}

Config::Config() {
    setDefaults();
}

Config::Config(const boost::filesystem::path& installationPrefixDir) {
    auto configFilename = installationPrefixDir / "etc/imageviz.json";
    auto configSchemaFilename = installationPrefixDir / "etc/imageviz.schema.json";

    if(boost::filesystem::exists(configFilename)) {
        load(configFilename, configSchemaFilename);
    }
    else {
        libimageviz::logMessage(libimageviz::Subsystem::CONFIG,
                                boost::format("configuration file %s not found, using defaults") % configFilename,
                                libimageviz::LogLevel::DEBUG);
    }
    setDefaults();
}

void Config::load(const boost::filesystem::path& configFilename,
                  const boost::filesystem::path& configSchemaFilename) {
    try {
        json = libimageviz::json::readAndValidate(configFilename, configSchemaFilename);
    }
    catch(const libimageviz::Error& e) {
        auto message = boost::format("Failed to load configuration file %s") % configFilename;
        IMAGEVIZ_RETHROW_ERROR_AS(e, libimageviz::ErrorKind::CONFIGURATION, message.str());
    }
}

/**
 * Fills in the settings that the configuration file is allowed to omit
 */
void Config::setDefaults() {
    auto& allocator = json.GetAllocator();
    rj::Pointer("/treeMaxDepth").GetWithDefault(json, 1000, allocator);
    rj::Pointer("/dot/taggedNodeShape").GetWithDefault(json, "box", allocator);
    rj::Pointer("/dot/taggedNodeFillColor").GetWithDefault(json, "paleturquoise", allocator);
    rj::Pointer("/dot/taggedNodeStyle").GetWithDefault(json, "filled,rounded", allocator);
}

std::size_t Config::getTreeMaxDepth() const {
    const auto& value = json["treeMaxDepth"];
    if(!value.IsUint() || value.GetUint() == 0) {
        auto message = boost::format("invalid configuration: \"treeMaxDepth\" must be a positive integer, got %s")
            % libimageviz::json::serialize(value);
        IMAGEVIZ_THROW_ERROR(libimageviz::ErrorKind::CONFIGURATION, message.str());
    }
    return value.GetUint();
}

Config::DotNodeStyle Config::getDotTaggedNodeStyle() const {
    const auto& dot = json["dot"];
    return DotNodeStyle{
        dot["taggedNodeShape"].GetString(),
        dot["taggedNodeFillColor"].GetString(),
        dot["taggedNodeStyle"].GetString()
    };
}

}
}
