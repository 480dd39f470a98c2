/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef imageviz_common_Config_hpp
#define imageviz_common_Config_hpp

#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>


namespace imageviz {
namespace common {

class Config {
    public:
        Config();
        Config(const boost::filesystem::path& installationPrefixDir);

        struct BuildTime {
            BuildTime();
            std::string version;
        };

        enum class RenderMode { NONE, DOT, TREE, SHORT };

        struct CommandImages {
            RenderMode mode = RenderMode::NONE;
            bool truncateIDs = true;
            std::string rootSelector;
            boost::optional<boost::filesystem::path> inputFile;
        };

        struct DotNodeStyle {
            std::string shape;
            std::string fillColor;
            std::string style;
        };

        std::size_t getTreeMaxDepth() const;
        DotNodeStyle getDotTaggedNodeStyle() const;

        BuildTime buildTime;
        rapidjson::Document json{ rapidjson::kObjectType };
        CommandImages commandImages;

    private:
        void load(const boost::filesystem::path& configFilename,
                  const boost::filesystem::path& configSchemaFilename);
        void setDefaults();
};

}
}

#endif
