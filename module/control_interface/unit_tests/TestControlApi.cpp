/**
 * @file TestControlApi.cpp
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
#include "ControlApi.h"
#include "JsonSerializable.h"
#include "Logger.h"
#include "TestFileHelpers.h"
#include <string>
#include <vector>

static TransferServerConfig MakeControlTestConfig(const ScopedTestDirectory & dir) {
    TransferServerConfig config;
    config.m_host = "127.0.0.1";
    config.m_port = 0;
    config.m_rootDir = dir.SubDirectory("root").string();
    config.m_tempDir = dir.SubDirectory("temp").string();
    config.m_serverType = "threaded";
    config.m_ioMode = "threaded";
    return config;
}

static boost::property_tree::ptree ParseBody(const control_api_response_t & response) {
    boost::property_tree::ptree pt;
    BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonString(response.jsonBody, pt));
    return pt;
}

BOOST_AUTO_TEST_CASE(ControlApiRoutingTestCase)
{
    ScopedTestDirectory dir("cftp_control_routing");
    TransferServerController controller;
    DownloadManager downloadManager(dir.SubDirectory("save"), dir.SubDirectory("clienttemp"));
    ControlApi api(controller, downloadManager);

    BOOST_REQUIRE_EQUAL(api.HandleRequest("GET", "/nowhere", "").statusCode, 404);
    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/server/status", "").statusCode, 405);
    BOOST_REQUIRE_EQUAL(api.HandleRequest("GET", "/server/start", "").statusCode, 405);
    BOOST_REQUIRE_EQUAL(api.HandleRequest("GET", "/download", "").statusCode, 405);

    const control_api_response_t status = api.HandleRequest("GET", "/server/status?verbose=1", "");
    BOOST_REQUIRE_EQUAL(status.statusCode, 200);
    BOOST_REQUIRE(!ParseBody(status).get<bool>("running"));

    //stopping a stopped server is a client error
    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/server/stop", "").statusCode, 400);
    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/server/start", "{ not json").statusCode, 400);
    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/server/start", "{\"serverType\": \"forking\"}").statusCode, 400);
    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/server/start", "{\"unknownKey\": 5}").statusCode, 400);

    BOOST_REQUIRE_EQUAL(api.HandleRequest("GET", "/download/progress/never-requested.txt", "").statusCode, 404);
    BOOST_REQUIRE_EQUAL(api.HandleRequest("GET", "/download/progress/bad%2", "").statusCode, 400);
    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/download", "{\"localFilename\": \"x.txt\"}").statusCode, 400);
    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/download",
        "{\"remoteFilename\": \"a.txt\", \"localFilename\": \"../escape.txt\"}").statusCode, 400);
    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/download", "[1, 2").statusCode, 400);
}

BOOST_AUTO_TEST_CASE(ControlApiPercentDecodeTestCase)
{
    std::string decoded;
    BOOST_REQUIRE(ControlApi::PercentDecode("my%20file+name.txt", decoded));
    BOOST_REQUIRE_EQUAL(decoded, "my file name.txt");
    BOOST_REQUIRE(ControlApi::PercentDecode("sub%2Fdir%2fa.bin", decoded));
    BOOST_REQUIRE_EQUAL(decoded, "sub/dir/a.bin");
    BOOST_REQUIRE(!ControlApi::PercentDecode("%zz", decoded));
    BOOST_REQUIRE(!ControlApi::PercentDecode("abc%4", decoded));
}

BOOST_AUTO_TEST_CASE(ControlApiServerLifecycleAndDownloadTestCase)
{
    ScopedTestDirectory dir("cftp_control_lifecycle");
    const TransferServerConfig config = MakeControlTestConfig(dir);
    const std::vector<uint8_t> contents = MakeTestFileContents(300000, 11);
    BOOST_REQUIRE(WriteTestFile(boost::filesystem::path(config.m_rootDir) / "a.txt", contents));
    BOOST_REQUIRE(WriteTestFile(boost::filesystem::path(config.m_rootDir) / "b.txt", MakeTestFileContents(10, 12)));

    TransferServerController controller;
    const boost::filesystem::path saveDir = dir.SubDirectory("save");
    DownloadManager downloadManager(saveDir, dir.SubDirectory("clienttemp"));
    downloadManager.Start();
    ControlApi api(controller, downloadManager);

    const control_api_response_t started = api.HandleRequest("POST", "/server/start", config.ToJson());
    BOOST_REQUIRE_EQUAL(started.statusCode, 200);
    const boost::property_tree::ptree startedPt = ParseBody(started);
    BOOST_REQUIRE(startedPt.get<bool>("running"));
    BOOST_REQUIRE_EQUAL(startedPt.get<std::string>("serverType"), "threaded");
    const uint16_t port = startedPt.get<uint16_t>("port");
    BOOST_REQUIRE_NE(port, 0);
    BOOST_REQUIRE_EQUAL(downloadManager.GetRemotePort(), port);
    BOOST_REQUIRE_EQUAL(downloadManager.GetRemoteHost(), "127.0.0.1");

    //already running
    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/server/start", config.ToJson()).statusCode, 400);

    const control_api_response_t files = api.HandleRequest("GET", "/files", "");
    BOOST_REQUIRE_EQUAL(files.statusCode, 200);
    const boost::property_tree::ptree filesPt = ParseBody(files);
    std::vector<std::string> names;
    const boost::property_tree::ptree & filesArrayPt = filesPt.get_child("files");
    for (boost::property_tree::ptree::const_iterator it = filesArrayPt.begin(); it != filesArrayPt.end(); ++it) {
        names.push_back(it->second.get<std::string>("name"));
        if (names.back() == "a.txt") {
            BOOST_REQUIRE_EQUAL(it->second.get<uint64_t>("size"), contents.size());
            BOOST_REQUIRE(!it->second.get<bool>("isDirectory"));
        }
    }
    BOOST_REQUIRE_EQUAL(names.size(), 2);

    const control_api_response_t queued = api.HandleRequest("POST", "/download",
        "{\"remoteFilename\": \"a.txt\", \"localFilename\": \"copy of a.txt\"}");
    BOOST_REQUIRE_EQUAL(queued.statusCode, 202);
    BOOST_REQUIRE_EQUAL(ParseBody(queued).get<std::string>("filename"), "copy of a.txt");
    BOOST_REQUIRE(downloadManager.WaitUntilIdle(10000));

    const control_api_response_t progress = api.HandleRequest("GET", "/download/progress/copy%20of%20a.txt", "");
    BOOST_REQUIRE_EQUAL(progress.statusCode, 200);
    const boost::property_tree::ptree progressPt = ParseBody(progress);
    BOOST_REQUIRE_EQUAL(progressPt.get<std::string>("status"), "completed");
    BOOST_REQUIRE_EQUAL(progressPt.get<double>("progress"), 1.0);
    BOOST_REQUIRE(!progressPt.get_child_optional("error"));
    std::vector<uint8_t> received;
    BOOST_REQUIRE(ReadWholeTestFile(saveDir / "copy of a.txt", received));
    BOOST_REQUIRE(received == contents);

    //a missing remote file is reported through the progress record
    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/download", "{\"remoteFilename\": \"missing.txt\"}").statusCode, 202);
    BOOST_REQUIRE(downloadManager.WaitUntilIdle(10000));
    const boost::property_tree::ptree failedPt = ParseBody(api.HandleRequest("GET", "/download/progress/missing.txt", ""));
    BOOST_REQUIRE_EQUAL(failedPt.get<std::string>("status"), "failed");
    BOOST_REQUIRE_EQUAL(failedPt.get<std::string>("error"), CftpProtocol::ErrorTypeToString(CFTP_ERROR_TYPE::NOT_FOUND));

    const control_api_response_t logs = api.HandleRequest("GET", "/server/logs", "");
    BOOST_REQUIRE_EQUAL(logs.statusCode, 200);
    BOOST_REQUIRE(ParseBody(logs).get_child_optional("logs"));

    const control_api_response_t stopped = api.HandleRequest("POST", "/server/stop", "");
    BOOST_REQUIRE_EQUAL(stopped.statusCode, 200);
    BOOST_REQUIRE(!ParseBody(stopped).get<bool>("running"));
    BOOST_REQUIRE(!controller.IsRunning());

    //nothing listening any more
    BOOST_REQUIRE_EQUAL(api.HandleRequest("GET", "/files", "").statusCode, 502);
    downloadManager.Stop();
}

BOOST_AUTO_TEST_CASE(ControlApiEmptyListingTestCase)
{
    ScopedTestDirectory dir("cftp_control_empty");
    const TransferServerConfig config = MakeControlTestConfig(dir);
    TransferServerController controller;
    DownloadManager downloadManager(dir.SubDirectory("save"), dir.SubDirectory("clienttemp"));
    ControlApi api(controller, downloadManager);

    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/server/start", config.ToJson()).statusCode, 200);
    const control_api_response_t files = api.HandleRequest("GET", "/files", "");
    BOOST_REQUIRE_EQUAL(files.statusCode, 200);
    const boost::property_tree::ptree filesPt = ParseBody(files);
    BOOST_REQUIRE(filesPt.get_child("files").empty());
    BOOST_REQUIRE_NE(files.jsonBody.find("[]"), std::string::npos);
    BOOST_REQUIRE_EQUAL(api.HandleRequest("POST", "/server/stop", "").statusCode, 200);
}
