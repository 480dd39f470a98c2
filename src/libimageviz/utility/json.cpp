/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "json.hpp"

#include <fstream>

#include <boost/format.hpp>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/error/en.h>
#include <rapidjson/writer.h>

#include "libimageviz/Error.hpp"

namespace rj = rapidjson;

namespace libimageviz {
namespace json {

rj::Document parseStream(std::istream& is) {
    auto json = rj::Document{};
    rj::IStreamWrapper wrapper(is);
    json.ParseStream(wrapper);

    if(is.bad()) {
        IMAGEVIZ_THROW_ERROR(ErrorKind::INPUT_ACQUISITION, "I/O failure while reading JSON stream");
    }
    return json;
}

std::string describeParseError(const rj::Document& json) {
    auto description = boost::format("offset %u: %s")
        % static_cast<unsigned>(json.GetErrorOffset())
        % rj::GetParseError_En(json.GetParseError());
    return description.str();
}

rj::Document read(const boost::filesystem::path& file) {
    std::ifstream ifs(file.string());
    if(!ifs) {
        auto message = boost::format("Failed to open JSON file %s") % file;
        IMAGEVIZ_THROW_ERROR(ErrorKind::INPUT_ACQUISITION, message.str());
    }

    auto json = parseStream(ifs);
    if(json.HasParseError()) {
        auto message = boost::format("File %s is not valid JSON (%s)") % file % describeParseError(json);
        IMAGEVIZ_THROW_ERROR(ErrorKind::MALFORMED_INPUT, message.str());
    }
    return json;
}

template<class Pointer>
static std::string stringify(const Pointer& pointer) {
    rj::StringBuffer buffer;
    pointer.StringifyUriFragment(buffer);
    return buffer.GetString();
}

rj::Document readAndValidate(const boost::filesystem::path& file, const boost::filesystem::path& schemaFile) {
    auto schemaJSON = read(schemaFile);
    rj::SchemaDocument schema(schemaJSON);
    auto json = read(file);

    rj::SchemaValidator validator(schema);
    if(!json.Accept(validator)) {
        auto message = boost::format("File %s does not conform to schema %s:"
                                     " keyword '%s' violated by %s (schema location %s)")
            % file % schemaFile
            % validator.GetInvalidSchemaKeyword()
            % stringify(validator.GetInvalidDocumentPointer())
            % stringify(validator.GetInvalidSchemaPointer());
        IMAGEVIZ_THROW_ERROR(ErrorKind::MALFORMED_INPUT, message.str());
    }
    return json;
}

std::string serialize(const rj::Value& json) {
    rj::StringBuffer buffer;
    rj::Writer<rj::StringBuffer> writer(buffer);
    json.Accept(writer);
    return buffer.GetString();
}

}}
