/**
 * @file TestTransferServerBackends.cpp
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
#include <boost/thread.hpp>
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TransferServerBase.h"
#include "TcpFileTransferClient.h"
#include "TestFileHelpers.h"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

static const std::vector<std::string> ALL_SERVER_TYPES = { "sequential", "threaded", "multiplexed", "async" };

static TransferServerConfig MakeLoopbackConfig(const ScopedTestDirectory & dir, const std::string & serverType) {
    TransferServerConfig config;
    config.m_host = "127.0.0.1";
    config.m_port = 0;
    config.m_rootDir = dir.SubDirectory("root").string();
    config.m_tempDir = dir.SubDirectory("temp").string();
    config.m_serverType = serverType;
    config.m_ioMode = TransferServerConfig::GetDefaultIoModeForServerType(serverType);
    return config;
}

static bool WaitForNoActiveConnections(const TransferServerBase & server) {
    for (unsigned int i = 0; i < 100; ++i) {
        if (server.GetNumActiveConnections() == 0) {
            return true;
        }
        boost::this_thread::sleep(boost::posix_time::milliseconds(20));
    }
    return false;
}

BOOST_AUTO_TEST_CASE(TransferServerFactoryTestCase)
{
    for (std::size_t i = 0; i < ALL_SERVER_TYPES.size(); ++i) {
        std::unique_ptr<TransferServerBase> server = TransferServerBase::Create(ALL_SERVER_TYPES[i]);
        BOOST_REQUIRE(server);
        BOOST_REQUIRE_EQUAL(server->GetServerType(), ALL_SERVER_TYPES[i]);
        BOOST_REQUIRE(!server->IsRunning());
    }
    BOOST_REQUIRE_EQUAL(TransferServerBase::Create("protocol")->GetServerType(), "sequential");
    BOOST_REQUIRE_EQUAL(TransferServerBase::Create("select")->GetServerType(), "multiplexed");
    BOOST_REQUIRE(!TransferServerBase::Create("forking"));
}

//Scenario A over loopback TCP on every backend; the client must receive identical bytes from each
BOOST_AUTO_TEST_CASE(TransferServerAllBackendsFullTransferTestCase)
{
    const std::vector<uint8_t> contents = MakeTestFileContents(1048576, 7);
    std::vector<std::vector<uint8_t> > receivedByBackend;

    for (std::size_t i = 0; i < ALL_SERVER_TYPES.size(); ++i) {
        BOOST_TEST_MESSAGE("backend " << ALL_SERVER_TYPES[i]);
        ScopedTestDirectory dir("cftp_backend_" + ALL_SERVER_TYPES[i]);
        const TransferServerConfig config = MakeLoopbackConfig(dir, ALL_SERVER_TYPES[i]);
        BOOST_REQUIRE(WriteTestFile(boost::filesystem::path(config.m_rootDir) / "example.txt", contents));

        std::unique_ptr<TransferServerBase> server = TransferServerBase::Create(config.m_serverType);
        BOOST_REQUIRE(server->Start(config));
        BOOST_REQUIRE(server->IsRunning());
        BOOST_REQUIRE_NE(server->GetBoundPort(), 0);

        TcpFileTransferClient client(dir.SubDirectory("downloads"), dir.SubDirectory("client_temp"));
        BOOST_REQUIRE(client.Init());
        client.SetRecordReceivedBytes(true);
        BOOST_REQUIRE(client.Connect("127.0.0.1", server->GetBoundPort(), "loopback-client"));
        BOOST_REQUIRE(client.DownloadFile("example.txt", "example.txt") == CFTP_ERROR_TYPE::NONE);
        BOOST_REQUIRE(client.Close());

        std::vector<uint8_t> downloaded;
        BOOST_REQUIRE(ReadWholeTestFile(dir.Path() / "downloads" / "example.txt", downloaded));
        BOOST_REQUIRE(downloaded == contents);
        BOOST_REQUIRE(client.GetLastSession());
        BOOST_REQUIRE_EQUAL(client.GetLastSession()->GetTotalChunks(), 128);
        BOOST_REQUIRE_EQUAL(client.GetSessionRegistry().GetNumActiveSessions(), 0);
        BOOST_REQUIRE(boost::filesystem::is_empty(dir.Path() / "client_temp"));

        BOOST_REQUIRE(WaitForNoActiveConnections(*server));
        BOOST_REQUIRE_EQUAL(server->GetTotalConnectionsAccepted(), 1);
        server->Stop();
        BOOST_REQUIRE(!server->IsRunning());
        receivedByBackend.push_back(client.GetReceivedBytes());
    }

    BOOST_REQUIRE_EQUAL(receivedByBackend.size(), ALL_SERVER_TYPES.size());
    BOOST_REQUIRE(!receivedByBackend[0].empty());
    for (std::size_t i = 1; i < receivedByBackend.size(); ++i) {
        BOOST_REQUIRE(receivedByBackend[i] == receivedByBackend[0]);
    }
}

static void DownloadInThread(uint16_t port, const boost::filesystem::path & baseDir, unsigned int clientIndex,
    std::atomic<unsigned int> * numSucceeded)
{
    const std::string indexStr = std::to_string(clientIndex);
    TcpFileTransferClient client(baseDir / ("downloads" + indexStr), baseDir / ("client_temp" + indexStr));
    if (!client.Init()) {
        return;
    }
    if (!client.Connect("127.0.0.1", port, "client" + indexStr)) {
        return;
    }
    const std::string filename = "file" + indexStr + ".bin";
    if (client.DownloadFile(filename, filename) != CFTP_ERROR_TYPE::NONE) {
        return;
    }
    client.Close();
    std::vector<uint8_t> downloaded;
    if (ReadWholeTestFile(baseDir / ("downloads" + indexStr) / filename, downloaded)
        && (downloaded == MakeTestFileContents(200000 + clientIndex * 1000, clientIndex)))
    {
        ++(*numSucceeded);
    }
}

BOOST_AUTO_TEST_CASE(TransferServerAllBackendsConcurrentClientsTestCase)
{
    static constexpr unsigned int NUM_CLIENTS = 4;
    for (std::size_t i = 0; i < ALL_SERVER_TYPES.size(); ++i) {
        BOOST_TEST_MESSAGE("backend " << ALL_SERVER_TYPES[i]);
        ScopedTestDirectory dir("cftp_concurrent_" + ALL_SERVER_TYPES[i]);
        TransferServerConfig config = MakeLoopbackConfig(dir, ALL_SERVER_TYPES[i]);
        config.m_chunkSize = 4096;
        for (unsigned int c = 0; c < NUM_CLIENTS; ++c) {
            BOOST_REQUIRE(WriteTestFile(boost::filesystem::path(config.m_rootDir) / ("file" + std::to_string(c) + ".bin"),
                MakeTestFileContents(200000 + c * 1000, c)));
        }
        std::unique_ptr<TransferServerBase> server = TransferServerBase::Create(config.m_serverType);
        BOOST_REQUIRE(server->Start(config));

        std::atomic<unsigned int> numSucceeded(0);
        std::vector<std::unique_ptr<boost::thread> > threads;
        for (unsigned int c = 0; c < NUM_CLIENTS; ++c) {
            threads.push_back(boost::make_unique<boost::thread>(boost::bind(&DownloadInThread,
                server->GetBoundPort(), dir.Path(), c, &numSucceeded)));
        }
        for (std::size_t t = 0; t < threads.size(); ++t) {
            threads[t]->join();
        }
        BOOST_REQUIRE_EQUAL(numSucceeded.load(), NUM_CLIENTS);
        BOOST_REQUIRE(WaitForNoActiveConnections(*server));
        BOOST_REQUIRE_EQUAL(server->GetTotalConnectionsAccepted(), NUM_CLIENTS);
        server->Stop();
    }
}

BOOST_AUTO_TEST_CASE(TransferServerRecoverableErrorsAndListTestCase)
{
    for (std::size_t i = 0; i < ALL_SERVER_TYPES.size(); ++i) {
        BOOST_TEST_MESSAGE("backend " << ALL_SERVER_TYPES[i]);
        ScopedTestDirectory dir("cftp_list_" + ALL_SERVER_TYPES[i]);
        const TransferServerConfig config = MakeLoopbackConfig(dir, ALL_SERVER_TYPES[i]);
        BOOST_REQUIRE(WriteTestFile(boost::filesystem::path(config.m_rootDir) / "a.txt", MakeTestFileContents(100, 1)));
        BOOST_REQUIRE(WriteTestFile(boost::filesystem::path(config.m_rootDir) / "b.txt", MakeTestFileContents(20000, 2)));
        boost::filesystem::create_directories(boost::filesystem::path(config.m_rootDir) / "subdir");

        std::unique_ptr<TransferServerBase> server = TransferServerBase::Create(config.m_serverType);
        BOOST_REQUIRE(server->Start(config));
        TcpFileTransferClient client(dir.SubDirectory("downloads"), dir.SubDirectory("client_temp"));
        BOOST_REQUIRE(client.Init());
        BOOST_REQUIRE(client.Connect("127.0.0.1", server->GetBoundPort(), "list-client"));

        //a missing file keeps the connection open
        BOOST_REQUIRE(client.DownloadFile("missing.txt", "missing.txt") == CFTP_ERROR_TYPE::NOT_FOUND);
        BOOST_REQUIRE(client.IsConnected());

        list_entry_vector_t entries;
        BOOST_REQUIRE(client.ListFiles(CFTP_LIST_FILTER::ALL, "", entries) == CFTP_ERROR_TYPE::NONE);
        BOOST_REQUIRE_EQUAL(entries.size(), 3);
        BOOST_REQUIRE_EQUAL(entries[0].name, "a.txt");
        BOOST_REQUIRE_EQUAL(entries[1].name, "b.txt");
        BOOST_REQUIRE_EQUAL(entries[1].size, 20000);
        BOOST_REQUIRE_EQUAL(entries[2].name, "subdir");
        BOOST_REQUIRE(entries[2].isDirectory);
        BOOST_REQUIRE(client.ListFiles(CFTP_LIST_FILTER::DIRECTORIES_ONLY, "", entries) == CFTP_ERROR_TYPE::NONE);
        BOOST_REQUIRE_EQUAL(entries.size(), 1);

        //the same connection still serves downloads
        BOOST_REQUIRE(client.DownloadFile("b.txt", "b.txt") == CFTP_ERROR_TYPE::NONE);
        BOOST_REQUIRE(client.Close());
        BOOST_REQUIRE(!client.IsConnected());
        server->Stop();
    }
}

BOOST_AUTO_TEST_CASE(TransferServerResumeFromPartialFileTestCase)
{
    ScopedTestDirectory dir("cftp_tcp_resume");
    const TransferServerConfig config = MakeLoopbackConfig(dir, "threaded");
    const std::vector<uint8_t> contents = MakeTestFileContents(1048576, 11);
    BOOST_REQUIRE(WriteTestFile(boost::filesystem::path(config.m_rootDir) / "example.txt", contents));
    const std::vector<uint8_t> firstHalf(contents.begin(), contents.begin() + (64 * 8192));
    const boost::filesystem::path partialPath = dir.Path() / "example.txt.part";
    BOOST_REQUIRE(WriteTestFile(partialPath, firstHalf));

    std::unique_ptr<TransferServerBase> server = TransferServerBase::Create(config.m_serverType);
    BOOST_REQUIRE(server->Start(config));
    TcpFileTransferClient client(dir.SubDirectory("downloads"), dir.SubDirectory("client_temp"));
    BOOST_REQUIRE(client.Init());
    BOOST_REQUIRE(client.Connect("127.0.0.1", server->GetBoundPort(), "resume-client"));
    BOOST_REQUIRE(client.DownloadFile("example.txt", "example.txt", partialPath, 64) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(client.GetDownloadEngine()->GetLastMetadata().remainingChunks, 64);
    BOOST_REQUIRE_EQUAL(client.GetDownloadEngine()->GetChunksWritten().front(), 64);
    BOOST_REQUIRE_EQUAL(client.GetDownloadEngine()->GetChunksWritten().back(), 127);
    std::vector<uint8_t> downloaded;
    BOOST_REQUIRE(ReadWholeTestFile(dir.Path() / "downloads" / "example.txt", downloaded));
    BOOST_REQUIRE(downloaded == contents);
    BOOST_REQUIRE(client.Close());
    server->Stop();
}

BOOST_AUTO_TEST_CASE(TransferServerStopWithOpenConnectionsTestCase)
{
    for (std::size_t i = 0; i < ALL_SERVER_TYPES.size(); ++i) {
        BOOST_TEST_MESSAGE("backend " << ALL_SERVER_TYPES[i]);
        ScopedTestDirectory dir("cftp_stop_" + ALL_SERVER_TYPES[i]);
        const TransferServerConfig config = MakeLoopbackConfig(dir, ALL_SERVER_TYPES[i]);
        std::unique_ptr<TransferServerBase> server = TransferServerBase::Create(config.m_serverType);
        BOOST_REQUIRE(server->Start(config));
        BOOST_REQUIRE(!server->Start(config)); //already running

        TcpFileTransferClient client(dir.SubDirectory("downloads"), dir.SubDirectory("client_temp"));
        BOOST_REQUIRE(client.Init());
        client.SetIdleTimeoutMilliseconds(2000);
        BOOST_REQUIRE(client.Connect("127.0.0.1", server->GetBoundPort(), "idle-client"));
        BOOST_REQUIRE_EQUAL(server->GetNumActiveConnections(), 1);

        const boost::posix_time::ptime startTime = boost::posix_time::microsec_clock::universal_time();
        server->Stop();
        BOOST_REQUIRE_LT((boost::posix_time::microsec_clock::universal_time() - startTime).total_milliseconds(), 2000);
        BOOST_REQUIRE(!server->IsRunning());
        BOOST_REQUIRE_EQUAL(server->GetNumActiveConnections(), 0);

        //the server can be started again after a stop
        BOOST_REQUIRE(server->Start(config));
        server->Stop();
    }
}
