/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libimageviz_utility_json_hpp
#define libimageviz_utility_json_hpp

#include <istream>
#include <string>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/schema.h>

namespace libimageviz {
namespace json {

/**
 * Parses the whole stream. Syntax errors are left in the returned document
 * (see rapidjson::Document::HasParseError) for the caller to report,
 * I/O failures of the stream are thrown.
 */
rapidjson::Document parseStream(std::istream& is);

std::string describeParseError(const rapidjson::Document& json);

rapidjson::Document read(const boost::filesystem::path& file);
rapidjson::Document readAndValidate(const boost::filesystem::path& file,
                                    const boost::filesystem::path& schemaFile);

std::string serialize(const rapidjson::Value& json);

}}

#endif
