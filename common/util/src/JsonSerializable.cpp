/**
 * @file JsonSerializable.cpp
 *
 * @copyright Copyright © 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include "JsonSerializable.h"
#include "Logger.h"
#include <sstream>
#include <boost/regex.hpp>
#include <boost/filesystem/fstream.hpp>
//boost 1.73 through 1.75 json_parser pulls in the deprecated global bind placeholders
#if (BOOST_VERSION < 107600) && (BOOST_VERSION >= 107300) && !defined(BOOST_BIND_GLOBAL_PLACEHOLDERS)
#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#endif
#include <boost/property_tree/json_parser.hpp>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::none;

//property_tree writes every leaf as a string; strip the quotes from values (not keys)
//that are numbers, true, false, {} or []
static const boost::regex regexQuotedNonStringValue("\\\"(-?\\d*\\.{0,1}\\d+|true|false|\\{\\}|\\[\\])\\\"(?!:)");

static bool ParseJsonStream(std::istream& jsonStream, const std::string & sourceName, boost::property_tree::ptree& pt) {
    try {
        boost::property_tree::read_json(jsonStream, pt);
    }
    catch (const boost::property_tree::json_parser::json_parser_error & e) {
        LOG_ERROR(subprocess) << "invalid JSON in " << sourceName << ": " << e.message() << " (line " << e.line() << ")";
        return false;
    }
    return true;
}

//depth first; array elements (empty keys) are not checked
static bool FindUnknownKeyRecursive(const boost::property_tree::ptree & userPt, const boost::property_tree::ptree & knownPt,
    const std::string & parentPath, std::string & unknownKeyPath)
{
    for (boost::property_tree::ptree::const_iterator it = userPt.begin(); it != userPt.end(); ++it) {
        const std::string & key = it->first;
        if (key.empty()) {
            continue;
        }
        const std::string keyPath = parentPath + "." + key;
        boost::property_tree::ptree::const_assoc_iterator knownIt = knownPt.find(key);
        if (knownIt == knownPt.not_found()) {
            unknownKeyPath = keyPath;
            return true;
        }
        if ((!it->second.empty()) && (!knownIt->second.empty())
            && FindUnknownKeyRecursive(it->second, knownIt->second, keyPath, unknownKeyPath))
        {
            return true;
        }
    }
    return false;
}

JsonSerializable::JsonSerializable() {}

JsonSerializable::~JsonSerializable() {}

std::string JsonSerializable::PtToJsonString(const boost::property_tree::ptree& pt, bool pretty) {
    std::ostringstream oss;
    boost::property_tree::write_json(oss, pt, pretty);
    return boost::regex_replace(oss.str(), regexQuotedNonStringValue, "$1");
}

bool JsonSerializable::GetPropertyTreeFromJsonString(const std::string & jsonStr, boost::property_tree::ptree& pt) {
    std::istringstream iss(jsonStr);
    return ParseJsonStream(iss, "string", pt);
}

bool JsonSerializable::GetPropertyTreeFromJsonFilePath(const boost::filesystem::path& jsonFilePath, boost::property_tree::ptree& pt) {
    boost::filesystem::ifstream ifs(jsonFilePath);
    if (!ifs.good()) {
        LOG_ERROR(subprocess) << "cannot open JSON file " << jsonFilePath;
        return false;
    }
    return ParseJsonStream(ifs, jsonFilePath.string(), pt);
}

bool JsonSerializable::FindUnknownKey(const boost::property_tree::ptree & userPt, const std::string & sectionName, std::string & unknownKeyPath) const {
    unknownKeyPath.clear();
    return FindUnknownKeyRecursive(userPt, GetNewPropertyTree(), sectionName, unknownKeyPath);
}

std::string JsonSerializable::ToJson(bool pretty) const {
    return PtToJsonString(GetNewPropertyTree(), pretty);
}

bool JsonSerializable::ToJsonFile(const boost::filesystem::path& filePath, bool pretty) const {
    boost::filesystem::ofstream out(filePath);
    if (!out.good()) {
        LOG_ERROR(subprocess) << "cannot open " << filePath << " for writing";
        return false;
    }
    out << ToJson(pretty);
    return out.good();
}

bool JsonSerializable::SetValuesFromJson(const std::string & jsonString) {
    boost::property_tree::ptree pt;
    if (!GetPropertyTreeFromJsonString(jsonString, pt)) {
        return false;
    }
    return SetValuesFromPropertyTree(pt);
}
