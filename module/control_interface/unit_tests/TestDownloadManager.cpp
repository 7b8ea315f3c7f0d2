/**
 * @file TestDownloadManager.cpp
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
#include "DownloadManager.h"
#include "TransferServerController.h"
#include "TestFileHelpers.h"
#include <string>
#include <vector>

BOOST_AUTO_TEST_CASE(DownloadManagerSafeFilenameTestCase)
{
    BOOST_REQUIRE(DownloadManager::IsSafeLocalFilename("a.txt"));
    BOOST_REQUIRE(DownloadManager::IsSafeLocalFilename("sub/dir/a.txt"));
    BOOST_REQUIRE(DownloadManager::IsSafeLocalFilename("a..b.txt"));
    BOOST_REQUIRE(!DownloadManager::IsSafeLocalFilename(""));
    BOOST_REQUIRE(!DownloadManager::IsSafeLocalFilename("/etc/passwd"));
    BOOST_REQUIRE(!DownloadManager::IsSafeLocalFilename("../a.txt"));
    BOOST_REQUIRE(!DownloadManager::IsSafeLocalFilename("sub/../../a.txt"));
}

BOOST_AUTO_TEST_CASE(DownloadManagerProgressJsonTestCase)
{
    download_progress_t p;
    p.filename = "report.pdf";
    p.status = DOWNLOAD_STATUS::DOWNLOADING;
    p.progress = 0.5;
    const std::string json = p.ToJson();
    BOOST_REQUIRE_EQUAL(json.find("error"), std::string::npos);

    download_progress_t p2;
    BOOST_REQUIRE(p2.SetValuesFromJson(json));
    BOOST_REQUIRE_EQUAL(p2.filename, "report.pdf");
    BOOST_REQUIRE(p2.status == DOWNLOAD_STATUS::DOWNLOADING);
    BOOST_REQUIRE_EQUAL(p2.progress, 0.5);

    p.status = DOWNLOAD_STATUS::FAILED;
    p.error = CFTP_ERROR_TYPE::INTEGRITY_ERROR;
    BOOST_REQUIRE_NE(p.ToJson().find(CftpProtocol::ErrorTypeToString(CFTP_ERROR_TYPE::INTEGRITY_ERROR)), std::string::npos);
    BOOST_REQUIRE(!p2.SetValuesFromJson("{\"filename\": \"x\", \"status\": \"paused\", \"progress\": 0}"));
}

BOOST_AUTO_TEST_CASE(DownloadManagerQueueTestCase)
{
    ScopedTestDirectory dir("cftp_download_manager");
    TransferServerConfig config;
    config.m_host = "127.0.0.1";
    config.m_port = 0;
    config.m_rootDir = dir.SubDirectory("root").string();
    config.m_tempDir = dir.SubDirectory("temp").string();
    config.m_serverType = "async";
    config.m_ioMode = "async";
    config.m_chunkSize = 1024;
    const std::vector<uint8_t> contents = MakeTestFileContents(50000, 3);
    BOOST_REQUIRE(WriteTestFile(boost::filesystem::path(config.m_rootDir) / "data.bin", contents));

    TransferServerController controller;
    BOOST_REQUIRE(controller.Start(config) == SERVER_START_RESULT::STARTED);
    BOOST_REQUIRE(controller.Start(config) == SERVER_START_RESULT::ALREADY_RUNNING);

    const boost::filesystem::path saveDir = dir.SubDirectory("save");
    DownloadManager downloadManager(saveDir, dir.SubDirectory("clienttemp"));
    BOOST_REQUIRE_EQUAL(downloadManager.GetRemoteHost(), "localhost");
    BOOST_REQUIRE_EQUAL(downloadManager.GetRemotePort(), 8001);
    downloadManager.SetRemoteServer("127.0.0.1", controller.GetStatus().port);

    //queued before the worker starts, so both are still pending
    BOOST_REQUIRE(downloadManager.QueueDownload("data.bin", ""));
    BOOST_REQUIRE(!downloadManager.QueueDownload("data.bin", "data.bin"));
    BOOST_REQUIRE(downloadManager.QueueDownload("data.bin", "nested/copy.bin"));
    BOOST_REQUIRE(!downloadManager.QueueDownload("data.bin", "../copy.bin"));
    download_progress_t progress;
    BOOST_REQUIRE(downloadManager.GetProgress("data.bin", progress));
    BOOST_REQUIRE(progress.status == DOWNLOAD_STATUS::PENDING);
    BOOST_REQUIRE(!downloadManager.GetProgress("other.bin", progress));

    downloadManager.Start();
    BOOST_REQUIRE(downloadManager.WaitUntilIdle(10000));
    BOOST_REQUIRE(downloadManager.GetProgress("data.bin", progress));
    BOOST_REQUIRE(progress.status == DOWNLOAD_STATUS::COMPLETED);
    BOOST_REQUIRE(downloadManager.GetProgress("nested/copy.bin", progress));
    BOOST_REQUIRE(progress.status == DOWNLOAD_STATUS::COMPLETED);
    BOOST_REQUIRE_EQUAL(progress.progress, 1.0);

    std::vector<uint8_t> received;
    BOOST_REQUIRE(ReadWholeTestFile(saveDir / "data.bin", received));
    BOOST_REQUIRE(received == contents);
    BOOST_REQUIRE(ReadWholeTestFile(saveDir / "nested" / "copy.bin", received));
    BOOST_REQUIRE(received == contents);

    //a finished download can be requested again
    BOOST_REQUIRE(downloadManager.QueueDownload("data.bin", "data.bin"));
    BOOST_REQUIRE(downloadManager.WaitUntilIdle(10000));

    list_entry_vector_t entries;
    BOOST_REQUIRE(downloadManager.ListRemoteFiles(entries) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(entries.size(), 1);
    BOOST_REQUIRE_EQUAL(entries[0].name, "data.bin");
    BOOST_REQUIRE_EQUAL(entries[0].size, contents.size());

    BOOST_REQUIRE(controller.Stop());
    BOOST_REQUIRE(!controller.Stop());
    BOOST_REQUIRE(downloadManager.ListRemoteFiles(entries) != CFTP_ERROR_TYPE::NONE);

    //with the server gone a download fails instead of hanging
    BOOST_REQUIRE(downloadManager.QueueDownload("data.bin", "again.bin"));
    BOOST_REQUIRE(downloadManager.WaitUntilIdle(10000));
    BOOST_REQUIRE(downloadManager.GetProgress("again.bin", progress));
    BOOST_REQUIRE(progress.status == DOWNLOAD_STATUS::FAILED);
    BOOST_REQUIRE(progress.error == CFTP_ERROR_TYPE::RESOURCE_ERROR);
    downloadManager.Stop();
}

BOOST_AUTO_TEST_CASE(DownloadManagerStopFailsQueuedTestCase)
{
    ScopedTestDirectory dir("cftp_download_manager_stop");
    DownloadManager downloadManager(dir.SubDirectory("save"), dir.SubDirectory("clienttemp"));
    downloadManager.Start();
    downloadManager.Stop();
    //whether the worker reaches it or Stop() drops it, the request ends as failed
    BOOST_REQUIRE(downloadManager.QueueDownload("x.bin", "x.bin"));
    downloadManager.Start();
    downloadManager.Stop();
    download_progress_t progress;
    BOOST_REQUIRE(downloadManager.GetProgress("x.bin", progress));
    BOOST_REQUIRE(progress.status != DOWNLOAD_STATUS::PENDING);
    BOOST_REQUIRE(progress.status != DOWNLOAD_STATUS::DOWNLOADING);
}
