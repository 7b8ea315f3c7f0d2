/**
 * @file JsonSerializable.h
 *
 * @copyright Copyright © 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 *
 * @section DESCRIPTION
 *
 * JsonSerializable is the base class of every CFTP type that travels as JSON:
 * the server configuration file, the control interface request and response bodies.
 * A derived class maps itself to and from a boost::property_tree::ptree;
 * this class handles the text side (parsing, writing numbers and booleans
 * unquoted, and rejecting keys the derived class does not know).
 */

#ifndef JSON_SERIALIZABLE_H
#define JSON_SERIALIZABLE_H 1

#include <string>
#include <boost/property_tree/ptree.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/version.hpp>
#include "cftp_util_export.h"

//boost below 1.59 parses json with spirit classic, which needs BOOST_SPIRIT_THREADSAFE
//since configs and control bodies are parsed from several threads
#if BOOST_VERSION < 105900 && !defined(BOOST_SPIRIT_THREADSAFE)
#error "Boost version is below 1.59.0 and BOOST_SPIRIT_THREADSAFE is not defined"
#endif


class CFTP_UTIL_EXPORT JsonSerializable {
public:
    /// Writes pt as JSON with numbers, booleans, {} and [] left unquoted
    static std::string PtToJsonString(const boost::property_tree::ptree& pt, bool pretty = true);
    static bool GetPropertyTreeFromJsonString(const std::string & jsonStr, boost::property_tree::ptree& pt);
    static bool GetPropertyTreeFromJsonFilePath(const boost::filesystem::path& jsonFilePath, boost::property_tree::ptree& pt);

    /** Compare a user supplied tree against the keys this object serializes to.
     *
     * @param userPt The tree parsed from the user's JSON.
     * @param sectionName Name of the document, used as the root of the reported key path.
     * @param unknownKeyPath On return, the dotted path of the first unknown key (e.g. "transferServerConfig.prot").
     * @return True if userPt holds a key this object does not serialize.
     */
    bool FindUnknownKey(const boost::property_tree::ptree & userPt, const std::string & sectionName, std::string & unknownKeyPath) const;

    std::string ToJson(bool pretty = true) const;
    bool ToJsonFile(const boost::filesystem::path& filePath, bool pretty = true) const;

    virtual boost::property_tree::ptree GetNewPropertyTree() const = 0;
    virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) = 0;
    bool SetValuesFromJson(const std::string & jsonString);

protected:
    JsonSerializable();
    virtual ~JsonSerializable();
};

#endif // JSON_SERIALIZABLE_H
