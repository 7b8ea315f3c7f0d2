/**
 * @file TestFileManager.cpp
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
#include <boost/bind/bind.hpp>
#include <boost/thread.hpp>
#include <boost/filesystem.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "FileManager.h"
#include "TestFileHelpers.h"
#include <string>
#include <vector>

static checksum_field_t DigestOf(const std::vector<uint8_t> & contents) {
    ContentDigest digest;
    checksum_field_t checksum;
    BOOST_REQUIRE(digest.Compute(contents.data(), contents.size(), checksum));
    return checksum;
}

BOOST_AUTO_TEST_CASE(FileManagerServeChunksTestCase)
{
    ScopedTestDirectory dir("cftp_fm_serve");
    SessionRegistry registry;
    FileManager fileManager(registry, dir.SubDirectory("root"), dir.SubDirectory("temp"), DIGEST_ALGORITHM::MD5, false, true);
    BOOST_REQUIRE(fileManager.Init());

    const std::vector<uint8_t> contents = MakeTestFileContents(10000, 1);
    BOOST_REQUIRE(WriteTestFile(fileManager.GetRootDir() / "served.bin", contents));

    TransferSession_ptr session = registry.CreateSession("served.bin", 4096);
    BOOST_REQUIRE(fileManager.OpenSourceFile(session) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(session->GetFileSize(), 10000);
    BOOST_REQUIRE_EQUAL(session->GetTotalChunks(), 3);
    BOOST_REQUIRE(session->GetFileChecksum() == DigestOf(contents));
    BOOST_REQUIRE_GE(session->GetFileDescriptor(), 0);

    std::vector<uint8_t> chunk;
    BOOST_REQUIRE(fileManager.ReadChunk(session, 1, chunk) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE(chunk == std::vector<uint8_t>(contents.begin() + 4096, contents.begin() + 8192));
    BOOST_REQUIRE(fileManager.ReadChunk(session, 2, chunk) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(chunk.size(), 10000 - 8192);
    BOOST_REQUIRE(chunk == std::vector<uint8_t>(contents.begin() + 8192, contents.end()));
    BOOST_REQUIRE(fileManager.ReadChunk(session, 3, chunk) == CFTP_ERROR_TYPE::INVALID_RANGE);

    //the whole-file digest is computed once per (path, size, mtime)
    TransferSession_ptr session2 = registry.CreateSession("served.bin", 4096);
    BOOST_REQUIRE(fileManager.OpenSourceFile(session2) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(fileManager.GetNumCachedChecksums(), 1);

    TransferSession_ptr missing = registry.CreateSession("missing.bin", 4096);
    BOOST_REQUIRE(fileManager.OpenSourceFile(missing) == CFTP_ERROR_TYPE::NOT_FOUND);
    TransferSession_ptr escaping = registry.CreateSession("../outside.bin", 4096);
    BOOST_REQUIRE(fileManager.OpenSourceFile(escaping) == CFTP_ERROR_TYPE::NOT_FOUND);
    TransferSession_ptr absolute = registry.CreateSession("/etc/hostname", 4096);
    BOOST_REQUIRE(fileManager.OpenSourceFile(absolute) == CFTP_ERROR_TYPE::NOT_FOUND);
    boost::filesystem::create_directories(fileManager.GetRootDir() / "subdir");
    TransferSession_ptr directory = registry.CreateSession("subdir", 4096);
    BOOST_REQUIRE(fileManager.OpenSourceFile(directory) == CFTP_ERROR_TYPE::NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(FileManagerWriteFinalizeTestCase)
{
    ScopedTestDirectory dir("cftp_fm_write");
    SessionRegistry registry;
    FileManager fileManager(registry, dir.SubDirectory("root"), dir.SubDirectory("temp"), DIGEST_ALGORITHM::MD5, false, true);
    BOOST_REQUIRE(fileManager.Init());

    const std::vector<uint8_t> contents = MakeTestFileContents(2500, 2);
    TransferSession_ptr session = registry.CreateSession("out.bin", 1000);
    const boost::filesystem::path finalPath = dir.Path() / "downloads" / "out.bin";
    BOOST_REQUIRE(fileManager.PrepareDownload(session, contents.size(), DigestOf(contents), finalPath) == CFTP_ERROR_TYPE::NONE);
    const boost::filesystem::path tempPath = session->GetTempFilePath();
    BOOST_REQUIRE(boost::filesystem::exists(tempPath));
    BOOST_REQUIRE_EQUAL(tempPath.parent_path(), fileManager.GetTempDir());
    BOOST_REQUIRE_EQUAL(tempPath.filename().string(), session->GetSessionId() + "_out.bin");
    BOOST_REQUIRE(session->GetStatus() == TRANSFER_SESSION_STATUS::TRANSFERRING);

    //bounds and length checks
    BOOST_REQUIRE(fileManager.WriteChunk(session, 3, contents.data(), 500) == CFTP_ERROR_TYPE::INVALID_RANGE);
    BOOST_REQUIRE(fileManager.WriteChunk(session, 0, contents.data(), 999) == CFTP_ERROR_TYPE::INVALID_RANGE);
    BOOST_REQUIRE(fileManager.WriteChunk(session, 2, contents.data() + 2000, 1000) == CFTP_ERROR_TYPE::INVALID_RANGE);
    BOOST_REQUIRE(fileManager.WriteChunk("no-such-session", 0, contents.data(), 1000) == CFTP_ERROR_TYPE::SESSION_EXPIRED);

    BOOST_REQUIRE(fileManager.WriteChunk(session, 2, contents.data() + 2000, 500) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE(fileManager.WriteChunk(session->GetSessionId(), 0, contents.data(), 1000) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE(fileManager.Finalize(session) == CFTP_ERROR_TYPE::PROTOCOL_ERROR); //chunk 1 missing
    BOOST_REQUIRE(fileManager.WriteChunk(session, 1, contents.data() + 1000, 1000) == CFTP_ERROR_TYPE::NONE);

    BOOST_REQUIRE(fileManager.Finalize(session->GetSessionId()) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE(session->GetStatus() == TRANSFER_SESSION_STATUS::COMPLETED);
    BOOST_REQUIRE(!boost::filesystem::exists(tempPath));
    std::vector<uint8_t> written;
    BOOST_REQUIRE(ReadWholeTestFile(finalPath, written));
    BOOST_REQUIRE(written == contents);
}

BOOST_AUTO_TEST_CASE(FileManagerFinalizeMismatchStaysResumableTestCase)
{
    ScopedTestDirectory dir("cftp_fm_mismatch");
    SessionRegistry registry;
    FileManager fileManager(registry, dir.SubDirectory("root"), dir.SubDirectory("temp"), DIGEST_ALGORITHM::SHA256, false, true);
    BOOST_REQUIRE(fileManager.Init());

    const std::vector<uint8_t> contents = MakeTestFileContents(3000, 3);
    checksum_field_t expected;
    ContentDigest sha256(DIGEST_ALGORITHM::SHA256);
    BOOST_REQUIRE(sha256.Compute(contents.data(), contents.size(), expected));

    TransferSession_ptr session = registry.CreateSession("f.bin", 1000);
    const boost::filesystem::path finalPath = dir.Path() / "f.bin";
    BOOST_REQUIRE(fileManager.PrepareDownload(session, contents.size(), expected, finalPath) == CFTP_ERROR_TYPE::NONE);
    std::vector<uint8_t> corrupted(contents);
    corrupted[1500] ^= 0x01;
    for (uint32_t i = 0; i < 3; ++i) {
        BOOST_REQUIRE(fileManager.WriteChunk(session, i, corrupted.data() + (i * 1000), 1000) == CFTP_ERROR_TYPE::NONE);
    }
    BOOST_REQUIRE(fileManager.Finalize(session) == CFTP_ERROR_TYPE::INTEGRITY_ERROR);
    BOOST_REQUIRE(boost::filesystem::exists(session->GetTempFilePath()));
    BOOST_REQUIRE(!boost::filesystem::exists(finalPath));
    BOOST_REQUIRE(registry.GetSession(session->GetSessionId()) == session);

    //rewrite the bad chunk and finalize again
    BOOST_REQUIRE(fileManager.WriteChunk(session, 1, contents.data() + 1000, 1000) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE(fileManager.Finalize(session) == CFTP_ERROR_TYPE::NONE);
    std::vector<uint8_t> written;
    BOOST_REQUIRE(ReadWholeTestFile(finalPath, written));
    BOOST_REQUIRE(written == contents);
}

static void WriteChunksThreadFunc(FileManager & fileManager, TransferSession_ptr session, const std::vector<uint8_t> & contents,
    uint32_t chunkSize, unsigned int threadIndex, unsigned int numThreads, unsigned int & numFailures)
{
    const uint32_t totalChunks = session->GetTotalChunks();
    //each thread writes its own chunks, last to first, interleaved with its neighbors
    for (uint32_t i = totalChunks; i > 0; --i) {
        const uint32_t chunk = i - 1;
        if ((chunk % numThreads) != threadIndex) {
            continue;
        }
        const uint32_t length = CftpProtocol::GetChunkLength(contents.size(), chunkSize, chunk);
        if (fileManager.WriteChunk(session, chunk, contents.data() + (static_cast<std::size_t>(chunk) * chunkSize), length) != CFTP_ERROR_TYPE::NONE) {
            ++numFailures;
        }
    }
}

BOOST_AUTO_TEST_CASE(FileManagerConcurrentWriteIsolationTestCase)
{
    static constexpr unsigned int NUM_THREADS = 8;
    static constexpr uint32_t CHUNK_SIZE = 4096;
    ScopedTestDirectory dir("cftp_fm_isolation");
    SessionRegistry registry;
    FileManager fileManager(registry, dir.SubDirectory("root"), dir.SubDirectory("temp"), DIGEST_ALGORITHM::MD5, false, true);
    BOOST_REQUIRE(fileManager.Init());

    const std::vector<uint8_t> contents = MakeTestFileContents((CHUNK_SIZE * 257) + 123, 4);
    TransferSession_ptr session = registry.CreateSession("parallel.bin", CHUNK_SIZE);
    const boost::filesystem::path finalPath = dir.Path() / "parallel.bin";
    BOOST_REQUIRE(fileManager.PrepareDownload(session, contents.size(), DigestOf(contents), finalPath) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(session->GetTotalChunks(), 258);

    std::vector<unsigned int> failures(NUM_THREADS, 0);
    boost::thread_group threads;
    for (unsigned int t = 0; t < NUM_THREADS; ++t) {
        threads.create_thread(boost::bind(&WriteChunksThreadFunc, boost::ref(fileManager), session, boost::cref(contents),
            CHUNK_SIZE, t, NUM_THREADS, boost::ref(failures[t])));
    }
    threads.join_all();
    for (unsigned int t = 0; t < NUM_THREADS; ++t) {
        BOOST_REQUIRE_EQUAL(failures[t], 0);
    }
    BOOST_REQUIRE(session->AllChunksReceived());
    BOOST_REQUIRE(fileManager.Finalize(session) == CFTP_ERROR_TYPE::NONE);
    std::vector<uint8_t> written;
    BOOST_REQUIRE(ReadWholeTestFile(finalPath, written));
    BOOST_REQUIRE(written == contents);
}

BOOST_AUTO_TEST_CASE(FileManagerResumeFromPartialFileTestCase)
{
    ScopedTestDirectory dir("cftp_fm_partial");
    SessionRegistry registry;
    FileManager fileManager(registry, dir.SubDirectory("root"), dir.SubDirectory("temp"), DIGEST_ALGORITHM::MD5, false, true);
    BOOST_REQUIRE(fileManager.Init());

    const std::vector<uint8_t> contents = MakeTestFileContents(5000, 5);
    const boost::filesystem::path partialPath = dir.Path() / "partial.bin";
    BOOST_REQUIRE(WriteTestFile(partialPath, std::vector<uint8_t>(contents.begin(), contents.begin() + 3000)));

    TransferSession_ptr session = registry.CreateSession("whole.bin", 1000);
    BOOST_REQUIRE(fileManager.PrepareDownload(session, contents.size(), DigestOf(contents), dir.Path() / "whole.bin",
        partialPath, 3) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(session->GetNumChunksReceived(), 3);
    BOOST_REQUIRE_EQUAL(session->GetFirstMissingChunk(), 3);
    BOOST_REQUIRE(boost::filesystem::exists(partialPath)); //copied, not moved
    BOOST_REQUIRE(fileManager.WriteChunk(session, 3, contents.data() + 3000, 1000) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE(fileManager.WriteChunk(session, 4, contents.data() + 4000, 1000) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE(fileManager.Finalize(session) == CFTP_ERROR_TYPE::NONE);
    std::vector<uint8_t> written;
    BOOST_REQUIRE(ReadWholeTestFile(dir.Path() / "whole.bin", written));
    BOOST_REQUIRE(written == contents);

    //a start chunk beyond the file is rejected
    TransferSession_ptr session2 = registry.CreateSession("whole.bin", 1000);
    BOOST_REQUIRE(fileManager.PrepareDownload(session2, contents.size(), DigestOf(contents), dir.Path() / "again.bin",
        partialPath, 6) == CFTP_ERROR_TYPE::INVALID_RANGE);
}

static void RunTempPolicy(bool preserveTempOnError) {
    ScopedTestDirectory dir("cftp_fm_policy");
    SessionRegistry registry;
    FileManager fileManager(registry, dir.SubDirectory("root"), dir.SubDirectory("temp"), DIGEST_ALGORITHM::MD5, false, preserveTempOnError);
    registry.SetSessionExpiredCallback(boost::bind(&FileManager::OnSessionExpired, &fileManager, boost::placeholders::_1));
    BOOST_REQUIRE(fileManager.Init());
    BOOST_REQUIRE_EQUAL(fileManager.IsPreserveTempOnError(), preserveTempOnError);

    const std::vector<uint8_t> contents = MakeTestFileContents(2000, 6);

    //unrecoverable error
    TransferSession_ptr failed = registry.CreateSession("failed.bin", 1000);
    BOOST_REQUIRE(fileManager.PrepareDownload(failed, contents.size(), DigestOf(contents), dir.Path() / "failed.bin") == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE(fileManager.WriteChunk(failed, 0, contents.data(), 1000) == CFTP_ERROR_TYPE::NONE);
    const boost::filesystem::path failedTemp = failed->GetTempFilePath();
    fileManager.ReleaseSession(failed, true);
    BOOST_REQUIRE(failed->GetStatus() == TRANSFER_SESSION_STATUS::FAILED);
    BOOST_REQUIRE_LT(failed->GetFileDescriptor(), 0);
    BOOST_REQUIRE_EQUAL(boost::filesystem::exists(failedTemp), preserveTempOnError);

    //idle timeout
    TransferSession_ptr idle = registry.CreateSession("idle.bin", 1000);
    BOOST_REQUIRE(fileManager.PrepareDownload(idle, contents.size(), DigestOf(contents), dir.Path() / "idle.bin") == CFTP_ERROR_TYPE::NONE);
    const boost::filesystem::path idleTemp = idle->GetTempFilePath();
    idle->SetLastActivity(boost::posix_time::microsec_clock::universal_time() - boost::posix_time::hours(2));
    BOOST_REQUIRE_EQUAL(registry.SweepIdleSessions(boost::posix_time::hours(1)), 1);
    BOOST_REQUIRE(idle->GetStatus() == TRANSFER_SESSION_STATUS::EXPIRED);
    BOOST_REQUIRE_EQUAL(boost::filesystem::exists(idleTemp), preserveTempOnError);

    //a clean release never deletes anything
    TransferSession_ptr released = registry.CreateSession("released.bin", 1000);
    BOOST_REQUIRE(fileManager.PrepareDownload(released, contents.size(), DigestOf(contents), dir.Path() / "released.bin") == CFTP_ERROR_TYPE::NONE);
    fileManager.ReleaseSession(released, false);
    BOOST_REQUIRE(boost::filesystem::exists(released->GetTempFilePath()));
}

BOOST_AUTO_TEST_CASE(FileManagerPreserveTempOnErrorTestCase)
{
    RunTempPolicy(true);
}

BOOST_AUTO_TEST_CASE(FileManagerDiscardTempOnErrorTestCase)
{
    RunTempPolicy(false);
}

static void MakeListingTree(const boost::filesystem::path & root) {
    BOOST_REQUIRE(WriteTestFile(root / "b.txt", MakeTestFileContents(10, 7)));
    BOOST_REQUIRE(WriteTestFile(root / "a.txt", MakeTestFileContents(20, 8)));
    boost::filesystem::create_directories(root / "docs" / "deep");
    BOOST_REQUIRE(WriteTestFile(root / "docs" / "c.txt", MakeTestFileContents(30, 9)));
    BOOST_REQUIRE(WriteTestFile(root / "docs" / "deep" / "d.txt", MakeTestFileContents(40, 10)));
}

BOOST_AUTO_TEST_CASE(FileManagerListFlatTestCase)
{
    ScopedTestDirectory dir("cftp_fm_list_flat");
    SessionRegistry registry;
    FileManager fileManager(registry, dir.SubDirectory("root"), dir.SubDirectory("temp"), DIGEST_ALGORITHM::MD5, false, true);
    BOOST_REQUIRE(fileManager.Init());
    MakeListingTree(fileManager.GetRootDir());

    list_entry_vector_t entries;
    BOOST_REQUIRE(fileManager.List("", CFTP_LIST_FILTER::ALL, entries) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(entries.size(), 3);
    BOOST_REQUIRE_EQUAL(entries[0].name, "a.txt");
    BOOST_REQUIRE_EQUAL(entries[0].size, 20);
    BOOST_REQUIRE(!entries[0].isDirectory);
    BOOST_REQUIRE_GT(entries[0].mtimeUnixSeconds, 0);
    BOOST_REQUIRE_EQUAL(entries[1].name, "b.txt");
    BOOST_REQUIRE_EQUAL(entries[2].name, "docs");
    BOOST_REQUIRE(entries[2].isDirectory);
    BOOST_REQUIRE_EQUAL(entries[2].size, 0);

    BOOST_REQUIRE(fileManager.List("docs", CFTP_LIST_FILTER::ALL, entries) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(entries.size(), 2);
    BOOST_REQUIRE_EQUAL(entries[0].name, "c.txt");
    BOOST_REQUIRE_EQUAL(entries[1].name, "deep");

    BOOST_REQUIRE(fileManager.List("", CFTP_LIST_FILTER::DIRECTORIES_ONLY, entries) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(entries.size(), 1);
    BOOST_REQUIRE(fileManager.List("", CFTP_LIST_FILTER::FILES_ONLY, entries) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(entries.size(), 2);

    BOOST_REQUIRE(fileManager.List("nope", CFTP_LIST_FILTER::ALL, entries) == CFTP_ERROR_TYPE::NOT_FOUND);
    BOOST_REQUIRE(entries.empty());
    BOOST_REQUIRE(fileManager.List("..", CFTP_LIST_FILTER::ALL, entries) == CFTP_ERROR_TYPE::NOT_FOUND);
    BOOST_REQUIRE(fileManager.List("a.txt", CFTP_LIST_FILTER::ALL, entries) == CFTP_ERROR_TYPE::NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(FileManagerListRecursiveTestCase)
{
    ScopedTestDirectory dir("cftp_fm_list_recursive");
    SessionRegistry registry;
    FileManager fileManager(registry, dir.SubDirectory("root"), dir.SubDirectory("temp"), DIGEST_ALGORITHM::MD5, true, true);
    BOOST_REQUIRE(fileManager.Init());
    MakeListingTree(fileManager.GetRootDir());

    list_entry_vector_t entries;
    BOOST_REQUIRE(fileManager.List("", CFTP_LIST_FILTER::ALL, entries) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(entries.size(), 6);
    BOOST_REQUIRE_EQUAL(entries[0].name, "a.txt");
    BOOST_REQUIRE_EQUAL(entries[1].name, "b.txt");
    BOOST_REQUIRE_EQUAL(entries[2].name, "docs");
    BOOST_REQUIRE_EQUAL(entries[3].name, "docs/c.txt");
    BOOST_REQUIRE_EQUAL(entries[4].name, "docs/deep");
    BOOST_REQUIRE_EQUAL(entries[5].name, "docs/deep/d.txt");
    BOOST_REQUIRE_EQUAL(entries[5].size, 40);

    BOOST_REQUIRE(fileManager.List("", CFTP_LIST_FILTER::FILES_ONLY, entries) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(entries.size(), 4);
    BOOST_REQUIRE(fileManager.List("docs", CFTP_LIST_FILTER::FILES_ONLY, entries) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(entries.size(), 2);
    BOOST_REQUIRE_EQUAL(entries[0].name, "c.txt");
    BOOST_REQUIRE_EQUAL(entries[1].name, "deep/d.txt");
}

static void RunListWithDanglingSymlink(bool listRecursive) {
    ScopedTestDirectory dir("cftp_fm_list_dangling");
    SessionRegistry registry;
    FileManager fileManager(registry, dir.SubDirectory("root"), dir.SubDirectory("temp"), DIGEST_ALGORITHM::MD5, listRecursive, true);
    BOOST_REQUIRE(fileManager.Init());
    BOOST_REQUIRE(WriteTestFile(fileManager.GetRootDir() / "good.bin", MakeTestFileContents(64, 7)));
    boost::filesystem::create_symlink(dir.Path() / "nonexistent" / "target", fileManager.GetRootDir() / "dangling");

    //the unreadable entry is skipped, the rest is still listed
    list_entry_vector_t entries;
    BOOST_REQUIRE(fileManager.List("", CFTP_LIST_FILTER::ALL, entries) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(entries.size(), 1);
    BOOST_REQUIRE_EQUAL(entries[0].name, "good.bin");
    BOOST_REQUIRE_EQUAL(entries[0].size, 64);
    BOOST_REQUIRE(fileManager.List("", CFTP_LIST_FILTER::FILES_ONLY, entries) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(entries.size(), 1);
}

BOOST_AUTO_TEST_CASE(FileManagerListSkipsDanglingSymlinkTestCase)
{
    RunListWithDanglingSymlink(false);
    RunListWithDanglingSymlink(true);
}

BOOST_AUTO_TEST_CASE(FileManagerChecksumCacheBoundedTestCase)
{
    ScopedTestDirectory dir("cftp_fm_cache");
    SessionRegistry registry;
    FileManager fileManager(registry, dir.SubDirectory("root"), dir.SubDirectory("temp"), DIGEST_ALGORITHM::MD5, false, true);
    BOOST_REQUIRE(fileManager.Init());

    //a served file that is later deleted leaves no cache entry behind
    BOOST_REQUIRE(WriteTestFile(fileManager.GetRootDir() / "gone.bin", MakeTestFileContents(100, 8)));
    TransferSession_ptr session = registry.CreateSession("gone.bin", 64);
    BOOST_REQUIRE(fileManager.OpenSourceFile(session) == CFTP_ERROR_TYPE::NONE);
    fileManager.ReleaseSession(session, false);
    BOOST_REQUIRE_EQUAL(fileManager.GetNumCachedChecksums(), 1);
    BOOST_REQUIRE(boost::filesystem::remove(fileManager.GetRootDir() / "gone.bin"));
    TransferSession_ptr again = registry.CreateSession("gone.bin", 64);
    BOOST_REQUIRE(fileManager.OpenSourceFile(again) == CFTP_ERROR_TYPE::NOT_FOUND);
    BOOST_REQUIRE_EQUAL(fileManager.GetNumCachedChecksums(), 0);

    //serving more distinct files than the cap keeps the cache at the cap
    const std::size_t numFiles = FileManager::MAX_CACHED_CHECKSUMS + 10;
    for (std::size_t i = 0; i < numFiles; ++i) {
        const std::string name = "f" + std::to_string(i) + ".bin";
        BOOST_REQUIRE(WriteTestFile(fileManager.GetRootDir() / name, MakeTestFileContents(16, static_cast<uint32_t>(i))));
        TransferSession_ptr s = registry.CreateSession(name, 64);
        BOOST_REQUIRE(fileManager.OpenSourceFile(s) == CFTP_ERROR_TYPE::NONE);
        fileManager.ReleaseSession(s, false);
    }
    BOOST_REQUIRE_EQUAL(fileManager.GetNumCachedChecksums(), FileManager::MAX_CACHED_CHECKSUMS);
}
