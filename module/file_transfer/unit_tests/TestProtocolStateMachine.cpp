/**
 * @file TestProtocolStateMachine.cpp
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
#include <boost/filesystem.hpp>
#include <boost/make_unique.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "ServerConnectionHandler.h"
#include "DownloadEngine.h"
#include "TestFileHelpers.h"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/// Moves bytes between a server handler and a client handler in memory,
/// optionally corrupting chosen FILE_DATA payloads on the way to the client.
class InMemoryPump {
public:
    InMemoryPump(ConnectionHandler & server, ConnectionHandler & client) :
        m_server(server), m_client(client) {}

    void CorruptChunk(uint32_t chunkNumber, unsigned int numTimes) {
        m_corruptionsRemaining[chunkNumber] = numTimes;
    }

    /// One exchange in each direction; returns false if nothing moved
    bool Step() {
        bool moved = false;
        if (m_client.TakeBytesToSend(m_buffer)) {
            m_server.HandleReceivedBytes(m_buffer.data(), m_buffer.size());
            moved = true;
        }
        if (m_server.TakeBytesToSend(m_buffer)) {
            InspectServerFrames(m_buffer);
            m_client.HandleReceivedBytes(m_buffer.data(), m_buffer.size());
            moved = true;
        }
        return moved;
    }

    void Run() {
        while (Step()) {}
    }

    void RunSteps(unsigned int numSteps) {
        for (unsigned int i = 0; i < numSteps; ++i) {
            Step();
        }
    }

    std::vector<uint32_t> m_fileDataChunksSent;
    std::vector<uint8_t> m_fileDataBytesSent;
    std::vector<CFTP_MESSAGE_TYPE> m_messageTypesSent;

private:
    void InspectServerFrames(std::vector<uint8_t> & frames) {
        //the server only ever queues whole frames
        std::size_t offset = 0;
        while ((offset + CFTP_HEADER_SIZE) <= frames.size()) {
            cftp_header_t header;
            CftpProtocol::DeserializeHeader(&frames[offset], header);
            uint8_t * payload = &frames[offset + CFTP_HEADER_SIZE];
            m_messageTypesSent.push_back(header.GetMessageType());
            if (header.GetMessageType() == CFTP_MESSAGE_TYPE::FILE_DATA) {
                m_fileDataChunksSent.push_back(header.chunkNumber);
                std::map<uint32_t, unsigned int>::iterator it = m_corruptionsRemaining.find(header.chunkNumber);
                if ((it != m_corruptionsRemaining.end()) && (it->second > 0) && (header.payloadLength > 0)) {
                    --it->second;
                    payload[header.payloadLength / 2] ^= 0x80;
                }
                else {
                    m_fileDataBytesSent.insert(m_fileDataBytesSent.end(), payload, payload + header.payloadLength);
                }
            }
            offset += CFTP_HEADER_SIZE + header.payloadLength;
        }
        BOOST_REQUIRE_EQUAL(offset, frames.size());
    }

    ConnectionHandler & m_server;
    ConnectionHandler & m_client;
    std::vector<uint8_t> m_buffer;
    std::map<uint32_t, unsigned int> m_corruptionsRemaining;
};

struct DownloadResultCollector {
    std::vector<std::pair<std::string, CFTP_ERROR_TYPE> > downloads;
    std::vector<std::pair<CFTP_ERROR_TYPE, list_entry_vector_t> > lists;
    void OnDownloadComplete(const std::string & remoteFilename, CFTP_ERROR_TYPE result) {
        downloads.push_back(std::make_pair(remoteFilename, result));
    }
    void OnListComplete(CFTP_ERROR_TYPE result, const list_entry_vector_t & entries) {
        lists.push_back(std::make_pair(result, entries));
    }
};

/// A served root with one file, and a client side download directory
class TransferTestBed {
public:
    explicit TransferTestBed(const std::string & name, std::size_t fileSize = 1048576, uint32_t maxRetries = 3) :
        m_dir(name)
    {
        m_config.m_rootDir = m_dir.SubDirectory("root").string();
        m_config.m_tempDir = m_dir.SubDirectory("server_temp").string();
        m_config.m_chunkSize = 8192;
        m_config.m_maxRetries = maxRetries;
        m_serverContextPtr = boost::make_unique<ServerContext>(m_config);
        BOOST_REQUIRE(m_serverContextPtr->Init());

        m_contents = MakeTestFileContents(fileSize, 42);
        BOOST_REQUIRE(WriteTestFile(m_dir.Path() / "root" / "example.txt", m_contents));
        m_downloadDir = m_dir.SubDirectory("downloads");
        m_clientFileManagerPtr = boost::make_unique<FileManager>(m_clientRegistry, m_downloadDir, m_dir.SubDirectory("client_temp"),
            DIGEST_ALGORITHM::MD5, false, true);
        BOOST_REQUIRE(m_clientFileManagerPtr->Init());
    }

    std::unique_ptr<ServerConnectionHandler> NewServerHandler() {
        return boost::make_unique<ServerConnectionHandler>(*m_serverContextPtr, "test-connection");
    }

    std::unique_ptr<DownloadEngine> NewClient() {
        std::unique_ptr<DownloadEngine> client = boost::make_unique<DownloadEngine>(m_clientRegistry, *m_clientFileManagerPtr, "test-client");
        client->SetDownloadCompleteCallback(boost::bind(&DownloadResultCollector::OnDownloadComplete, &m_results,
            boost::placeholders::_1, boost::placeholders::_2));
        client->SetListCompleteCallback(boost::bind(&DownloadResultCollector::OnListComplete, &m_results,
            boost::placeholders::_1, boost::placeholders::_2));
        return client;
    }

    bool DownloadedFileMatches(const std::string & localName) {
        std::vector<uint8_t> downloaded;
        return ReadWholeTestFile(m_downloadDir / localName, downloaded) && (downloaded == m_contents);
    }

    ScopedTestDirectory m_dir;
    TransferServerConfig m_config;
    std::unique_ptr<ServerContext> m_serverContextPtr;
    SessionRegistry m_clientRegistry;
    std::unique_ptr<FileManager> m_clientFileManagerPtr;
    boost::filesystem::path m_downloadDir;
    std::vector<uint8_t> m_contents;
    DownloadResultCollector m_results;
};

BOOST_AUTO_TEST_CASE(ProtocolFullTransferTestCase)
{
    TransferTestBed bed("cftp_sm_full");
    std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
    std::unique_ptr<DownloadEngine> client = bed.NewClient();
    InMemoryPump pump(*server, *client);

    client->QueueDownload("example.txt", bed.m_downloadDir / "example.txt");
    pump.Run();

    BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::COMPLETE);
    BOOST_REQUIRE_EQUAL(server->GetClientId(), "test-client");
    BOOST_REQUIRE(client->IsIdle());
    BOOST_REQUIRE_EQUAL(bed.m_results.downloads.size(), 1);
    BOOST_REQUIRE(bed.m_results.downloads[0].second == CFTP_ERROR_TYPE::NONE);

    const file_metadata_payload_t & metadata = client->GetLastMetadata();
    BOOST_REQUIRE_EQUAL(metadata.fileSize, 1048576);
    BOOST_REQUIRE_EQUAL(metadata.totalChunks, 128);
    BOOST_REQUIRE_EQUAL(metadata.chunkSize, 8192);
    BOOST_REQUIRE_EQUAL(metadata.startChunk, 0);
    BOOST_REQUIRE_EQUAL(metadata.remainingChunks, 128);
    BOOST_REQUIRE_EQUAL(metadata.remainingSize, 1048576);

    //handshake ack, metadata, 128 data frames, checksum verify
    BOOST_REQUIRE_EQUAL(pump.m_messageTypesSent.size(), 131);
    BOOST_REQUIRE(pump.m_messageTypesSent.front() == CFTP_MESSAGE_TYPE::ACK);
    BOOST_REQUIRE(pump.m_messageTypesSent[1] == CFTP_MESSAGE_TYPE::FILE_METADATA);
    BOOST_REQUIRE(pump.m_messageTypesSent.back() == CFTP_MESSAGE_TYPE::CHECKSUM_VERIFY);
    BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent.size(), 128);
    for (uint32_t i = 0; i < 128; ++i) {
        BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent[i], i);
        BOOST_REQUIRE_EQUAL(client->GetChunksWritten()[i], i);
    }
    BOOST_REQUIRE(pump.m_fileDataBytesSent == bed.m_contents);
    BOOST_REQUIRE(bed.DownloadedFileMatches("example.txt"));
    ContentDigest digest;
    checksum_field_t downloadedChecksum;
    BOOST_REQUIRE(digest.ComputeFile(bed.m_downloadDir / "example.txt", downloadedChecksum));
    BOOST_REQUIRE(downloadedChecksum == metadata.fileChecksum);

    //sessions are gone on both sides, the temp file was moved
    BOOST_REQUIRE_EQUAL(bed.m_serverContextPtr->GetSessionRegistry().GetNumActiveSessions(), 0);
    BOOST_REQUIRE_EQUAL(bed.m_clientRegistry.GetNumActiveSessions(), 0);
    BOOST_REQUIRE(boost::filesystem::is_empty(bed.m_dir.Path() / "client_temp"));

    //a completed connection accepts more requests, then closes
    client->QueueList(CFTP_LIST_FILTER::ALL, "");
    client->QueueClose();
    pump.Run();
    BOOST_REQUIRE_EQUAL(bed.m_results.lists.size(), 1);
    BOOST_REQUIRE(bed.m_results.lists[0].first == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(bed.m_results.lists[0].second.size(), 1);
    BOOST_REQUIRE_EQUAL(bed.m_results.lists[0].second[0].name, "example.txt");
    BOOST_REQUIRE_EQUAL(bed.m_results.lists[0].second[0].size, 1048576);
    BOOST_REQUIRE(server->IsFinished());
    BOOST_REQUIRE(client->GetState() == DOWNLOAD_ENGINE_STATE::CLOSED);
    BOOST_REQUIRE(server->GetState() != SERVER_CONNECTION_STATE::ERROR);
}

BOOST_AUTO_TEST_CASE(ProtocolResumeTransferTestCase)
{
    TransferTestBed bed("cftp_sm_resume");
    //full transfer first, for the reference suffix
    std::vector<uint8_t> fullTransferBytes;
    {
        std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
        std::unique_ptr<DownloadEngine> client = bed.NewClient();
        InMemoryPump pump(*server, *client);
        client->QueueDownload("example.txt", bed.m_downloadDir / "full.txt");
        pump.Run();
        fullTransferBytes = pump.m_fileDataBytesSent;
    }

    const boost::filesystem::path partialPath = bed.m_downloadDir / "partial.txt";
    BOOST_REQUIRE(WriteTestFile(partialPath, std::vector<uint8_t>(bed.m_contents.begin(), bed.m_contents.begin() + (64 * 8192))));

    std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
    std::unique_ptr<DownloadEngine> client = bed.NewClient();
    InMemoryPump pump(*server, *client);
    client->QueueDownload("example.txt", bed.m_downloadDir / "resumed.txt", partialPath, 64);
    pump.Run();

    BOOST_REQUIRE_EQUAL(bed.m_results.downloads.size(), 2);
    BOOST_REQUIRE(bed.m_results.downloads[1].second == CFTP_ERROR_TYPE::NONE);
    const file_metadata_payload_t & metadata = client->GetLastMetadata();
    BOOST_REQUIRE_EQUAL(metadata.totalChunks, 128);
    BOOST_REQUIRE_EQUAL(metadata.startChunk, 64);
    BOOST_REQUIRE_EQUAL(metadata.remainingChunks, 64);
    BOOST_REQUIRE_EQUAL(metadata.remainingSize, 64 * 8192);

    BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent.size(), 64);
    for (uint32_t i = 0; i < 64; ++i) {
        BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent[i], 64 + i);
    }
    BOOST_REQUIRE(client->GetChunksWritten() == pump.m_fileDataChunksSent);
    //the resumed bytes are exactly the suffix of a full transfer
    BOOST_REQUIRE(pump.m_fileDataBytesSent == std::vector<uint8_t>(fullTransferBytes.begin() + (64 * 8192), fullTransferBytes.end()));
    BOOST_REQUIRE(bed.DownloadedFileMatches("resumed.txt"));
}

BOOST_AUTO_TEST_CASE(ProtocolResumeAtEndTestCase)
{
    TransferTestBed bed("cftp_sm_resume_end", 20000);
    const boost::filesystem::path partialPath = bed.m_downloadDir / "partial.txt";
    BOOST_REQUIRE(WriteTestFile(partialPath, bed.m_contents));

    std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
    std::unique_ptr<DownloadEngine> client = bed.NewClient();
    InMemoryPump pump(*server, *client);
    client->QueueDownload("example.txt", bed.m_downloadDir / "whole.txt", partialPath, 3);
    pump.Run();

    BOOST_REQUIRE_EQUAL(client->GetLastMetadata().remainingChunks, 0);
    BOOST_REQUIRE(pump.m_fileDataChunksSent.empty());
    BOOST_REQUIRE(pump.m_messageTypesSent.back() == CFTP_MESSAGE_TYPE::CHECKSUM_VERIFY);
    BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::COMPLETE);
    BOOST_REQUIRE(bed.DownloadedFileMatches("whole.txt"));
}

BOOST_AUTO_TEST_CASE(ProtocolEmptyFileTestCase)
{
    TransferTestBed bed("cftp_sm_empty", 0);
    std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
    std::unique_ptr<DownloadEngine> client = bed.NewClient();
    InMemoryPump pump(*server, *client);
    client->QueueDownload("example.txt", bed.m_downloadDir / "empty.txt");
    pump.Run();

    BOOST_REQUIRE_EQUAL(client->GetLastMetadata().totalChunks, 0);
    BOOST_REQUIRE(pump.m_fileDataChunksSent.empty());
    BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::COMPLETE);
    BOOST_REQUIRE_EQUAL(bed.m_results.downloads.size(), 1);
    BOOST_REQUIRE(bed.m_results.downloads[0].second == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE(boost::filesystem::exists(bed.m_downloadDir / "empty.txt"));
    BOOST_REQUIRE_EQUAL(boost::filesystem::file_size(bed.m_downloadDir / "empty.txt"), 0);
}

BOOST_AUTO_TEST_CASE(ProtocolSingleRetransmissionTestCase)
{
    TransferTestBed bed("cftp_sm_retry");
    std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
    std::unique_ptr<DownloadEngine> client = bed.NewClient();
    InMemoryPump pump(*server, *client);
    pump.CorruptChunk(5, 1);
    client->QueueDownload("example.txt", bed.m_downloadDir / "example.txt");
    pump.Run();

    BOOST_REQUIRE(bed.m_results.downloads.at(0).second == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(client->GetNumChecksumErrors(), 1);
    BOOST_REQUIRE_EQUAL(server->GetNumRetransmissions(), 1);
    BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent.size(), 129);
    //chunk 5 goes out twice, back to back, before chunk 6
    BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent[5], 5);
    BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent[6], 5);
    BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent[7], 6);
    BOOST_REQUIRE(bed.DownloadedFileMatches("example.txt"));
}

BOOST_AUTO_TEST_CASE(ProtocolRetryExhaustedTestCase)
{
    static constexpr uint32_t MAX_RETRIES = 3;
    TransferTestBed bed("cftp_sm_exhausted", 1048576, MAX_RETRIES);
    std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
    std::unique_ptr<DownloadEngine> client = bed.NewClient();
    InMemoryPump pump(*server, *client);
    pump.CorruptChunk(5, 100);
    client->QueueDownload("example.txt", bed.m_downloadDir / "example.txt");
    pump.Run();

    BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::ERROR);
    BOOST_REQUIRE(server->IsFinished());
    BOOST_REQUIRE(client->GetState() == DOWNLOAD_ENGINE_STATE::FAILED);
    BOOST_REQUIRE(client->GetLastError() == CFTP_ERROR_TYPE::RETRY_EXHAUSTED);
    BOOST_REQUIRE(bed.m_results.downloads.at(0).second == CFTP_ERROR_TYPE::RETRY_EXHAUSTED);

    //chunks 0..4 once, chunk 5 exactly 1 + MAX_RETRIES times, nothing after it
    BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent.size(), 5 + 1 + MAX_RETRIES);
    for (std::size_t i = 5; i < pump.m_fileDataChunksSent.size(); ++i) {
        BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent[i], 5);
    }
    BOOST_REQUIRE(pump.m_messageTypesSent.back() == CFTP_MESSAGE_TYPE::ERROR);
    BOOST_REQUIRE_EQUAL(client->GetNumChecksumErrors(), 1 + MAX_RETRIES);
    BOOST_REQUIRE_EQUAL(bed.m_serverContextPtr->GetSessionRegistry().GetNumActiveSessions(), 0);

    //the client kept its partial download (temp files are preserved on error)
    BOOST_REQUIRE_EQUAL(bed.m_clientRegistry.GetNumActiveSessions(), 1);
    BOOST_REQUIRE_EQUAL(client->GetCurrentSession()->GetFirstMissingChunk(), 5);
    BOOST_REQUIRE(boost::filesystem::exists(client->GetCurrentSession()->GetTempFilePath()));
}

BOOST_AUTO_TEST_CASE(ProtocolDisconnectAndResumeTestCase)
{
    TransferTestBed bed("cftp_sm_disconnect");
    TransferSession_ptr interruptedSession;
    {
        std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
        std::unique_ptr<DownloadEngine> client = bed.NewClient();
        InMemoryPump pump(*server, *client);
        client->QueueDownload("example.txt", bed.m_downloadDir / "example.txt");
        //handshake, request (metadata + chunk 0), ack 0 (chunk 1), ack 1 (chunk 2)
        pump.RunSteps(4);
        BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::TRANSFERRING);
        BOOST_REQUIRE_EQUAL(bed.m_serverContextPtr->GetSessionRegistry().GetNumActiveSessions(), 1);

        server->OnDisconnect();
        client->OnDisconnect();
        BOOST_REQUIRE_EQUAL(bed.m_serverContextPtr->GetSessionRegistry().GetNumActiveSessions(), 0);
        BOOST_REQUIRE(client->GetState() == DOWNLOAD_ENGINE_STATE::FAILED);
        BOOST_REQUIRE(bed.m_results.downloads.at(0).second == CFTP_ERROR_TYPE::RESOURCE_ERROR);
        interruptedSession = client->GetCurrentSession();
    }
    BOOST_REQUIRE(interruptedSession);
    BOOST_REQUIRE_EQUAL(interruptedSession->GetFirstMissingChunk(), 3);
    BOOST_REQUIRE(bed.m_clientRegistry.GetSession(interruptedSession->GetSessionId()) == interruptedSession);

    //a new connection continues from the first missing chunk
    std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
    std::unique_ptr<DownloadEngine> client = bed.NewClient();
    InMemoryPump pump(*server, *client);
    client->QueueResume(interruptedSession);
    pump.Run();
    BOOST_REQUIRE(bed.m_results.downloads.at(1).second == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(client->GetLastMetadata().startChunk, 3);
    BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent.front(), 3);
    BOOST_REQUIRE_EQUAL(pump.m_fileDataChunksSent.size(), 125);
    BOOST_REQUIRE(bed.DownloadedFileMatches("example.txt"));
    BOOST_REQUIRE_EQUAL(bed.m_clientRegistry.GetNumActiveSessions(), 0);
}

BOOST_AUTO_TEST_CASE(ProtocolRecoverableErrorsTestCase)
{
    TransferTestBed bed("cftp_sm_recoverable", 20000);
    std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
    std::unique_ptr<DownloadEngine> client = bed.NewClient();
    InMemoryPump pump(*server, *client);

    const boost::filesystem::path partialPath = bed.m_downloadDir / "partial.txt";
    BOOST_REQUIRE(WriteTestFile(partialPath, bed.m_contents));
    client->QueueDownload("missing.txt", bed.m_downloadDir / "missing.txt");
    client->QueueDownload("example.txt", bed.m_downloadDir / "bad_range.txt", partialPath, 4); //file has 3 chunks
    client->QueueList(CFTP_LIST_FILTER::ALL, "no_such_dir");
    client->QueueList(CFTP_LIST_FILTER::ALL, "../..");
    client->QueueDownload("example.txt", bed.m_downloadDir / "example.txt");
    pump.Run();

    BOOST_REQUIRE_EQUAL(bed.m_results.downloads.size(), 3);
    BOOST_REQUIRE(bed.m_results.downloads[0].second == CFTP_ERROR_TYPE::NOT_FOUND);
    BOOST_REQUIRE(bed.m_results.downloads[1].second == CFTP_ERROR_TYPE::INVALID_RANGE);
    BOOST_REQUIRE(bed.m_results.downloads[2].second == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE_EQUAL(bed.m_results.lists.size(), 2);
    BOOST_REQUIRE(bed.m_results.lists[0].first == CFTP_ERROR_TYPE::NOT_FOUND);
    BOOST_REQUIRE(bed.m_results.lists[1].first == CFTP_ERROR_TYPE::NOT_FOUND);
    BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::COMPLETE);
    BOOST_REQUIRE(bed.DownloadedFileMatches("example.txt"));
    BOOST_REQUIRE(!boost::filesystem::exists(bed.m_downloadDir / "missing.txt"));
    BOOST_REQUIRE_EQUAL(bed.m_serverContextPtr->GetSessionRegistry().GetNumActiveSessions(), 0);
}

/// Feed raw client frames to a server handler and decode everything it answers
static std::vector<cftp_message_t> ExchangeWithServer(ServerConnectionHandler & server, const std::vector<uint8_t> & clientFrames) {
    std::vector<cftp_message_t> replies;
    server.HandleReceivedBytes(clientFrames.data(), clientFrames.size());
    std::vector<uint8_t> serverBytes;
    server.TakeBytesToSend(serverBytes);
    std::size_t offset = 0;
    ContentDigest digest;
    while (offset < serverBytes.size()) {
        cftp_header_t header;
        CftpProtocol::DeserializeHeader(&serverBytes[offset], header);
        const std::size_t frameSize = CFTP_HEADER_SIZE + header.payloadLength;
        cftp_message_t message;
        BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, &serverBytes[offset], frameSize, message) == CFTP_ERROR_TYPE::NONE);
        replies.push_back(message);
        offset += frameSize;
    }
    return replies;
}

static CFTP_ERROR_TYPE GetErrorType(const cftp_message_t & message) {
    BOOST_REQUIRE(message.header.GetMessageType() == CFTP_MESSAGE_TYPE::ERROR);
    error_payload_t error;
    BOOST_REQUIRE(error.Deserialize(message.payload.data(), message.payload.size()));
    return error.errorType;
}

BOOST_AUTO_TEST_CASE(ProtocolFatalErrorsTestCase)
{
    TransferTestBed bed("cftp_sm_fatal", 20000);

    {
        //wrong protocol version in the handshake
        std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
        CftpFrameBuilder builder;
        std::vector<uint8_t> frames;
        builder.GenerateHandshake(frames, "old-client", 2);
        std::vector<cftp_message_t> replies = ExchangeWithServer(*server, frames);
        BOOST_REQUIRE_EQUAL(replies.size(), 1);
        BOOST_REQUIRE(GetErrorType(replies[0]) == CFTP_ERROR_TYPE::UNSUPPORTED_VERSION);
        BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::ERROR);
        BOOST_REQUIRE(server->IsFinished());
    }
    {
        //a request before the handshake
        std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
        CftpFrameBuilder builder;
        std::vector<uint8_t> frames;
        builder.GenerateFileRequest(frames, "example.txt");
        std::vector<cftp_message_t> replies = ExchangeWithServer(*server, frames);
        BOOST_REQUIRE_EQUAL(replies.size(), 1);
        BOOST_REQUIRE(GetErrorType(replies[0]) == CFTP_ERROR_TYPE::PROTOCOL_ERROR);
        BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::ERROR);
    }
    {
        //FILE_DATA from a client, pipelined frames after it are ignored
        std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
        CftpFrameBuilder builder;
        std::vector<uint8_t> frames;
        builder.GenerateHandshake(frames, "client");
        const uint8_t data[3] = { 1, 2, 3 };
        builder.GenerateFileData(frames, 0, data, sizeof(data));
        builder.GenerateFileRequest(frames, "example.txt");
        std::vector<cftp_message_t> replies = ExchangeWithServer(*server, frames);
        BOOST_REQUIRE_EQUAL(replies.size(), 2);
        BOOST_REQUIRE(replies[0].header.GetMessageType() == CFTP_MESSAGE_TYPE::ACK);
        BOOST_REQUIRE(GetErrorType(replies[1]) == CFTP_ERROR_TYPE::PROTOCOL_ERROR);
        BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::ERROR);
    }
    {
        //bad magic
        std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
        CftpFrameBuilder builder;
        std::vector<uint8_t> frames;
        builder.GenerateHandshake(frames, "client");
        frames[0] = 0x00;
        std::vector<cftp_message_t> replies = ExchangeWithServer(*server, frames);
        BOOST_REQUIRE_EQUAL(replies.size(), 1);
        BOOST_REQUIRE(GetErrorType(replies[0]) == CFTP_ERROR_TYPE::FRAME_ERROR);
        BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::ERROR);
    }
    {
        //an ack for a chunk that is not outstanding
        std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
        CftpFrameBuilder builder;
        std::vector<uint8_t> frames;
        builder.GenerateHandshake(frames, "client");
        builder.GenerateFileRequest(frames, "example.txt");
        std::vector<cftp_message_t> replies = ExchangeWithServer(*server, frames);
        BOOST_REQUIRE_EQUAL(replies.size(), 3); //ack, metadata, chunk 0
        BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::TRANSFERRING);
        frames.clear();
        builder.GenerateAck(frames, replies[2].header.sequenceNumber, 1);
        replies = ExchangeWithServer(*server, frames);
        BOOST_REQUIRE_EQUAL(replies.size(), 1);
        BOOST_REQUIRE(GetErrorType(replies[0]) == CFTP_ERROR_TYPE::PROTOCOL_ERROR);
        BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::ERROR);
        BOOST_REQUIRE_EQUAL(bed.m_serverContextPtr->GetSessionRegistry().GetNumActiveSessions(), 0);
    }
}

BOOST_AUTO_TEST_CASE(ProtocolExpiredSessionTestCase)
{
    TransferTestBed bed("cftp_sm_expired", 20000);
    std::unique_ptr<ServerConnectionHandler> server = bed.NewServerHandler();
    CftpFrameBuilder builder;
    std::vector<uint8_t> frames;
    builder.GenerateHandshake(frames, "client");
    builder.GenerateFileRequest(frames, "example.txt");
    std::vector<cftp_message_t> replies = ExchangeWithServer(*server, frames);
    BOOST_REQUIRE_EQUAL(replies.size(), 3);

    //the sweep takes the session away while chunk 0 is outstanding
    SessionRegistry & registry = bed.m_serverContextPtr->GetSessionRegistry();
    BOOST_REQUIRE_EQUAL(registry.SweepIdleSessions(boost::posix_time::seconds(0),
        boost::posix_time::microsec_clock::universal_time() + boost::posix_time::hours(1)), 1);
    frames.clear();
    builder.GenerateAck(frames, replies[2].header.sequenceNumber, 0);
    replies = ExchangeWithServer(*server, frames);
    BOOST_REQUIRE_EQUAL(replies.size(), 1);
    BOOST_REQUIRE(GetErrorType(replies[0]) == CFTP_ERROR_TYPE::SESSION_EXPIRED);
    BOOST_REQUIRE(server->GetState() == SERVER_CONNECTION_STATE::ERROR);
}
