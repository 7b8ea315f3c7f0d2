/**
 * @file TestTransferServerConfig.cpp
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
#include "TransferServerConfig.h"
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <memory>

BOOST_AUTO_TEST_CASE(TransferServerConfigTestCase)
{
    TransferServerConfig_ptr c1 = std::make_shared<TransferServerConfig>();
    c1->m_port = 9001;
    c1->m_serverType = "threaded";
    c1->m_ioMode = "threaded";
    c1->m_listRecursive = true;

    TransferServerConfig_ptr c1_copy = std::make_shared<TransferServerConfig>();
    c1_copy->m_port = 9001;
    c1_copy->m_serverType = "threaded";
    c1_copy->m_ioMode = "threaded";
    c1_copy->m_listRecursive = true;

    TransferServerConfig_ptr c2 = std::make_shared<TransferServerConfig>();
    c2->m_chunkSize = 4096;

    TransferServerConfig c2StackCopy = *c2; //copy assignment

    BOOST_REQUIRE(*c1 == *c1_copy);
    BOOST_REQUIRE(!(*c1 == *c2));
    BOOST_REQUIRE(*c2 == c2StackCopy);
    TransferServerConfig c2Moved = std::move(c2StackCopy); //move assignment
    BOOST_REQUIRE(*c2 == c2Moved);

    const std::string c1Json = c1->ToJson();
    TransferServerConfig_ptr c1_fromJson = TransferServerConfig::CreateFromJson(c1Json);
    BOOST_REQUIRE(c1_fromJson); //not null
    BOOST_REQUIRE(*c1 == *c1_fromJson);
    BOOST_REQUIRE(c1Json == c1_fromJson->ToJson());
    BOOST_REQUIRE_EQUAL(c1_fromJson->m_port, 9001);
    BOOST_REQUIRE_EQUAL(c1_fromJson->m_listRecursive, true);

    //file round trip
    const boost::filesystem::path jsonPath = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("cftp_config_%%%%%%.json");
    BOOST_REQUIRE(c1->ToJsonFile(jsonPath));
    TransferServerConfig_ptr c1_fromFile = TransferServerConfig::CreateFromJsonFilePath(jsonPath);
    boost::filesystem::remove(jsonPath);
    BOOST_REQUIRE(c1_fromFile);
    BOOST_REQUIRE(*c1 == *c1_fromFile);
}

BOOST_AUTO_TEST_CASE(TransferServerConfigDefaultsTestCase)
{
    //absent keys keep their defaults
    TransferServerConfig_ptr c = TransferServerConfig::CreateFromJson("{\"port\": 8123, \"rootDir\": \"/srv/files\"}");
    BOOST_REQUIRE(c);
    BOOST_REQUIRE_EQUAL(c->m_port, 8123);
    BOOST_REQUIRE_EQUAL(c->m_rootDir, "/srv/files");
    BOOST_REQUIRE_EQUAL(c->m_host, "localhost");
    BOOST_REQUIRE_EQUAL(c->m_tempDir, "./server_files/temp");
    BOOST_REQUIRE_EQUAL(c->m_serverType, "sequential");
    BOOST_REQUIRE_EQUAL(c->m_ioMode, "single");
    BOOST_REQUIRE_EQUAL(c->m_chunkSize, 8192);
    BOOST_REQUIRE_EQUAL(c->m_maxRetries, 3);
    BOOST_REQUIRE_EQUAL(c->m_sessionTimeoutSeconds, 3600);
    BOOST_REQUIRE_EQUAL(c->m_sessionSweepIntervalSeconds, 60);
    BOOST_REQUIRE_EQUAL(c->m_maxPayloadBytes, 16777216);
    BOOST_REQUIRE_EQUAL(c->m_listRecursive, false);
    BOOST_REQUIRE_EQUAL(c->m_preserveTempOnError, true);
    BOOST_REQUIRE_EQUAL(c->m_digestAlgorithm, "md5");
}

BOOST_AUTO_TEST_CASE(TransferServerConfigRejectTestCase)
{
    //unknown key
    BOOST_REQUIRE(!TransferServerConfig::CreateFromJson("{\"port\": 8123, \"chunksize\": 100}"));
    //unknown key allowed when not verifying
    BOOST_REQUIRE(TransferServerConfig::CreateFromJson("{\"port\": 8123, \"chunksize\": 100}", false));
    {
        TransferServerConfig_ptr lenient = TransferServerConfig::CreateFromJson("{\"port\": 8123, \"chunksize\": 100}", false);
        boost::property_tree::ptree pt;
        BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonString("{\"port\": 8123, \"chunksize\": 100}", pt));
        std::string unknownKeyPath;
        BOOST_REQUIRE(lenient->FindUnknownKey(pt, "transferServerConfig", unknownKeyPath));
        BOOST_REQUIRE_EQUAL(unknownKeyPath, "transferServerConfig.chunksize");
    }
    //unknown key in a config file
    {
        const boost::filesystem::path jsonPath = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("cftp_config_%%%%%%.json");
        {
            boost::filesystem::ofstream ofs(jsonPath);
            ofs << "{\n  \"port\": 8123,\n  \"rootdir\": \"files\"\n}\n";
        }
        BOOST_REQUIRE(!TransferServerConfig::CreateFromJsonFilePath(jsonPath));
        BOOST_REQUIRE(TransferServerConfig::CreateFromJsonFilePath(jsonPath, false));
        boost::filesystem::remove(jsonPath);
    }
    //invalid names
    BOOST_REQUIRE(!TransferServerConfig::CreateFromJson("{\"serverType\": \"forking\"}"));
    BOOST_REQUIRE(!TransferServerConfig::CreateFromJson("{\"ioMode\": \"epoll\"}"));
    BOOST_REQUIRE(!TransferServerConfig::CreateFromJson("{\"digestAlgorithm\": \"crc32\"}"));
    //ranges
    BOOST_REQUIRE(!TransferServerConfig::CreateFromJson("{\"port\": 70000}"));
    BOOST_REQUIRE(!TransferServerConfig::CreateFromJson("{\"chunkSize\": 0}"));
    BOOST_REQUIRE(!TransferServerConfig::CreateFromJson("{\"chunkSize\": 2048, \"maxPayloadBytes\": 1024}"));
    //type errors
    BOOST_REQUIRE(!TransferServerConfig::CreateFromJson("{\"port\": \"eighty\"}"));
    BOOST_REQUIRE(!TransferServerConfig::CreateFromJson("{\"listRecursive\": \"sometimes\"}"));
    //malformed
    BOOST_REQUIRE(!TransferServerConfig::CreateFromJson("{\"port\": "));
}

BOOST_AUTO_TEST_CASE(TransferServerConfigServerTypeAliasTestCase)
{
    BOOST_REQUIRE_EQUAL(TransferServerConfig::NormalizeServerType("protocol"), "sequential");
    BOOST_REQUIRE_EQUAL(TransferServerConfig::NormalizeServerType("select"), "multiplexed");
    BOOST_REQUIRE_EQUAL(TransferServerConfig::NormalizeServerType("async"), "async");
    BOOST_REQUIRE_EQUAL(TransferServerConfig::GetDefaultIoModeForServerType("select"), "nonblocking");
    BOOST_REQUIRE_EQUAL(TransferServerConfig::GetDefaultIoModeForServerType("threaded"), "threaded");

    TransferServerConfig_ptr c = TransferServerConfig::CreateFromJson("{\"serverType\": \"select\", \"ioMode\": \"nonblocking\"}");
    BOOST_REQUIRE(c);
    BOOST_REQUIRE_EQUAL(c->m_serverType, "select"); //kept as given, normalized by the server factory

    //mismatched pair is only a warning
    BOOST_REQUIRE(TransferServerConfig::CreateFromJson("{\"serverType\": \"async\", \"ioMode\": \"single\"}"));
}
