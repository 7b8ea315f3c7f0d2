/**
 * @file TestJsonSerializable.cpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <boost/test/unit_test.hpp>
#include <boost/filesystem.hpp>
#include "JsonSerializable.h"
#include <string>

//download request body with an optional nested retry section
class DownloadRequestJson : public JsonSerializable {
public:
    DownloadRequestJson() : m_remoteFilename(), m_localFilename(), m_maxRetries(3) {}
    virtual ~DownloadRequestJson() {}
    virtual boost::property_tree::ptree GetNewPropertyTree() const override {
        boost::property_tree::ptree pt;
        pt.put("remoteFilename", m_remoteFilename);
        pt.put("localFilename", m_localFilename);
        pt.put("retry.maxRetries", m_maxRetries);
        return pt;
    }
    virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) override {
        try {
            m_remoteFilename = pt.get<std::string>("remoteFilename");
            m_localFilename = pt.get<std::string>("localFilename", m_remoteFilename);
            m_maxRetries = pt.get<unsigned int>("retry.maxRetries", m_maxRetries);
        }
        catch (const boost::property_tree::ptree_error &) {
            return false;
        }
        return true;
    }
    std::string m_remoteFilename;
    std::string m_localFilename;
    unsigned int m_maxRetries;
};

BOOST_AUTO_TEST_CASE(JsonSerializableParseAndWriteTestCase)
{
    //UTF-8 (Hebrew characters): shalom is \xd7\xa9\xd7\x9c\xd7\x95\xd7\x9d
    #define UTF_8_SAMPLE_STR "\xd7\xa9\xd7\x9c\xd7\x95\xd7\x9d.txt"
    const std::string jsonText =
    "{"
        "\"name\":\"" UTF_8_SAMPLE_STR "\","
        "\"isDirectory\":false,"
        "\"size\"  :  1048576,"
        "\"offset\":-3"
    "}\n";

    boost::property_tree::ptree pt;
    BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonString(jsonText, pt));
    BOOST_REQUIRE_EQUAL(pt.get<std::string>("name", ""), UTF_8_SAMPLE_STR);
    BOOST_REQUIRE_EQUAL(pt.get<bool>("isDirectory", true), false);
    BOOST_REQUIRE_EQUAL(pt.get<uint64_t>("size", 0), 1048576);
    BOOST_REQUIRE_EQUAL(pt.get<int>("offset", 100), -3);

    //numbers and booleans are written unquoted, strings stay quoted
    const std::string written = JsonSerializable::PtToJsonString(pt, false);
    BOOST_REQUIRE_NE(written.find("\"size\":1048576"), std::string::npos);
    BOOST_REQUIRE_NE(written.find("\"isDirectory\":false"), std::string::npos);
    BOOST_REQUIRE_NE(written.find("\"offset\":-3"), std::string::npos);
    BOOST_REQUIRE_NE(written.find("\"name\":\""), std::string::npos);

    BOOST_REQUIRE(!JsonSerializable::GetPropertyTreeFromJsonString("{\"name\": ", pt));
    BOOST_REQUIRE(!JsonSerializable::GetPropertyTreeFromJsonFilePath("does_not_exist.json", pt));
}

BOOST_AUTO_TEST_CASE(JsonSerializableUnknownKeysTestCase)
{
    DownloadRequestJson request;
    BOOST_REQUIRE(request.SetValuesFromJson("{\"remoteFilename\":\"example.txt\"}"));
    BOOST_REQUIRE_EQUAL(request.m_remoteFilename, "example.txt");
    BOOST_REQUIRE_EQUAL(request.m_localFilename, "example.txt");

    boost::property_tree::ptree pt;
    std::string unknownKeyPath;
    BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonString(
        "{\"remoteFilename\":\"example.txt\",\"localFilename\":\"example.txt\",\"retry\":{\"maxRetries\":5}}", pt));
    BOOST_REQUIRE(!request.FindUnknownKey(pt, "downloadRequest", unknownKeyPath));
    BOOST_REQUIRE(unknownKeyPath.empty());

    //keys are case sensitive
    BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonString(
        "{\"remoteFilename\":\"example.txt\",\"localFileName\":\"copy.txt\"}", pt));
    BOOST_REQUIRE(request.FindUnknownKey(pt, "downloadRequest", unknownKeyPath));
    BOOST_REQUIRE_EQUAL(unknownKeyPath, "downloadRequest.localFileName");

    //unknown keys inside a known section are reported with their section
    BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonString(
        "{\"remoteFilename\":\"example.txt\",\"retry\":{\"maxRetries\":5,\"backoffMs\":100}}", pt));
    BOOST_REQUIRE(request.FindUnknownKey(pt, "downloadRequest", unknownKeyPath));
    BOOST_REQUIRE_EQUAL(unknownKeyPath, "downloadRequest.retry.backoffMs");
}

BOOST_AUTO_TEST_CASE(JsonSerializableFileTestCase)
{
    const boost::filesystem::path jsonPath = boost::filesystem::temp_directory_path()
        / boost::filesystem::unique_path("cftp_json_%%%%-%%%%.json");
    DownloadRequestJson request;
    request.m_remoteFilename = "a.bin";
    request.m_localFilename = "b.bin";
    request.m_maxRetries = 7;
    BOOST_REQUIRE(request.ToJsonFile(jsonPath));

    boost::property_tree::ptree pt;
    BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonFilePath(jsonPath, pt));
    DownloadRequestJson copy;
    BOOST_REQUIRE(copy.SetValuesFromPropertyTree(pt));
    BOOST_REQUIRE_EQUAL(copy.m_localFilename, "b.bin");
    BOOST_REQUIRE_EQUAL(copy.m_maxRetries, 7);
    BOOST_REQUIRE_EQUAL(copy.ToJson(), request.ToJson());
    boost::filesystem::remove(jsonPath);
}
