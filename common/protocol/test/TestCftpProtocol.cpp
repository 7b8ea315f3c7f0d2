/**
 * @file TestCftpProtocol.cpp
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
#include "CftpProtocol.h"
#include <string>
#include <vector>
#include <algorithm>
#include <cstdint>

BOOST_AUTO_TEST_CASE(CftpHeaderLayoutTestCase)
{
    ContentDigest digest;
    std::vector<uint8_t> frame;
    const std::string payload("abc");
    BOOST_REQUIRE(CftpProtocol::EncodeFrame(digest, CFTP_MESSAGE_TYPE::FILE_DATA, 0x01020304, 0x0a0b0c0d,
        reinterpret_cast<const uint8_t*>(payload.data()), payload.size(), frame));
    BOOST_REQUIRE_EQUAL(frame.size(), CFTP_HEADER_SIZE + 3);
    static const uint8_t expectedPrefix[18] = {
        0x44, 0x42, //magic
        0x00, 0x01, //version
        0x00, 0x04, //FILE_DATA
        0x01, 0x02, 0x03, 0x04, //sequence
        0x0a, 0x0b, 0x0c, 0x0d, //chunk
        0x00, 0x00, 0x00, 0x03 //payload length
    };
    BOOST_REQUIRE(std::vector<uint8_t>(frame.begin(), frame.begin() + 18) == std::vector<uint8_t>(expectedPrefix, expectedPrefix + 18));
    //md5("abc") then 16 zero bytes
    static const uint8_t md5Abc[16] = { 0x90, 0x01, 0x50, 0x98, 0x3c, 0xd2, 0x4f, 0xb0, 0xd6, 0x96, 0x3f, 0x7d, 0x28, 0xe1, 0x7f, 0x72 };
    BOOST_REQUIRE(std::vector<uint8_t>(frame.begin() + 18, frame.begin() + 34) == std::vector<uint8_t>(md5Abc, md5Abc + 16));
    for (std::size_t i = 34; i < CFTP_HEADER_SIZE; ++i) {
        BOOST_REQUIRE_EQUAL(frame[i], 0);
    }
    BOOST_REQUIRE_EQUAL(frame[50], 'a');
    BOOST_REQUIRE_EQUAL(frame[52], 'c');

    cftp_message_t msg;
    BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, frame.data(), frame.size(), msg) == CFTP_ERROR_TYPE::NONE);
    BOOST_REQUIRE(msg.header.GetMessageType() == CFTP_MESSAGE_TYPE::FILE_DATA);
    BOOST_REQUIRE_EQUAL(msg.header.sequenceNumber, 0x01020304);
    BOOST_REQUIRE_EQUAL(msg.header.chunkNumber, 0x0a0b0c0d);
    BOOST_REQUIRE_EQUAL(msg.header.payloadLength, 3);
    BOOST_REQUIRE_EQUAL(std::string(msg.payload.begin(), msg.payload.end()), payload);

    //re-encode gives identical bytes
    std::vector<uint8_t> reencoded;
    BOOST_REQUIRE(CftpProtocol::EncodeFrame(digest, msg.header.GetMessageType(), msg.header.sequenceNumber, msg.header.chunkNumber,
        msg.payload.data(), msg.payload.size(), reencoded));
    BOOST_REQUIRE(reencoded == frame);
}

BOOST_AUTO_TEST_CASE(CftpEmptyPayloadTestCase)
{
    ContentDigest digest;
    std::vector<uint8_t> frame;
    BOOST_REQUIRE(CftpProtocol::EncodeFrame(digest, CFTP_MESSAGE_TYPE::CLOSE, 7, 0, NULL, 0, frame));
    BOOST_REQUIRE_EQUAL(frame.size(), CFTP_HEADER_SIZE);
    cftp_message_t msg;
    BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, frame.data(), frame.size(), msg) == CFTP_ERROR_TYPE::NONE);
    checksum_field_t emptyDigest;
    BOOST_REQUIRE(digest.Compute(NULL, 0, emptyDigest));
    BOOST_REQUIRE(msg.header.checksum == emptyDigest);
    BOOST_REQUIRE(msg.payload.empty());
}

BOOST_AUTO_TEST_CASE(CftpDecodeFailuresTestCase)
{
    ContentDigest digest;
    std::vector<uint8_t> frame;
    const std::string payload("example.txt");
    BOOST_REQUIRE(CftpProtocol::EncodeFrame(digest, CFTP_MESSAGE_TYPE::FILE_REQUEST, 1, 0,
        reinterpret_cast<const uint8_t*>(payload.data()), payload.size(), frame));
    cftp_message_t msg;

    //truncated header
    BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, frame.data(), CFTP_HEADER_SIZE - 1, msg) == CFTP_ERROR_TYPE::FRAME_ERROR);
    //payload length mismatch (short and long)
    BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, frame.data(), frame.size() - 1, msg) == CFTP_ERROR_TYPE::FRAME_ERROR);
    {
        std::vector<uint8_t> longer(frame);
        longer.push_back(0);
        BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, longer.data(), longer.size(), msg) == CFTP_ERROR_TYPE::FRAME_ERROR);
    }
    //bad magic
    {
        std::vector<uint8_t> bad(frame);
        bad[0] = 0x45;
        BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, bad.data(), bad.size(), msg) == CFTP_ERROR_TYPE::FRAME_ERROR);
    }
    //unknown version
    {
        std::vector<uint8_t> bad(frame);
        bad[3] = 2;
        BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, bad.data(), bad.size(), msg) == CFTP_ERROR_TYPE::UNSUPPORTED_VERSION);
        BOOST_REQUIRE(CftpProtocol::GetErrorClass(CFTP_ERROR_TYPE::UNSUPPORTED_VERSION) == CFTP_ERROR_CLASS::FRAME);
    }
    //unknown message type
    {
        std::vector<uint8_t> bad(frame);
        bad[5] = 12;
        BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, bad.data(), bad.size(), msg) == CFTP_ERROR_TYPE::FRAME_ERROR);
    }
    //corrupted payload
    {
        std::vector<uint8_t> bad(frame);
        bad.back() ^= 0x01;
        BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, bad.data(), bad.size(), msg) == CFTP_ERROR_TYPE::FRAME_ERROR);
    }
    //corrupted checksum field
    {
        std::vector<uint8_t> bad(frame);
        bad[20] ^= 0x80;
        BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, bad.data(), bad.size(), msg) == CFTP_ERROR_TYPE::FRAME_ERROR);
    }
    //payload over the configured maximum
    BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, frame.data(), frame.size(), msg, 4) == CFTP_ERROR_TYPE::FRAME_ERROR);
    //intact
    BOOST_REQUIRE(CftpProtocol::DecodeFrame(digest, frame.data(), frame.size(), msg) == CFTP_ERROR_TYPE::NONE);
}

BOOST_AUTO_TEST_CASE(CftpPayloadsTestCase)
{
    {
        handshake_payload_t p;
        p.clientId = "client-42";
        std::vector<uint8_t> v;
        p.Serialize(v);
        BOOST_REQUIRE_EQUAL(v.size(), 4 + 9);
        handshake_payload_t p2;
        BOOST_REQUIRE(p2.Deserialize(v.data(), v.size()));
        BOOST_REQUIRE(p == p2);
        BOOST_REQUIRE(!p2.Deserialize(v.data(), v.size() - 1)); //client id shorter than its length
    }
    {
        resume_request_payload_t p;
        p.startChunk = 64;
        p.filename = "dir/example.txt";
        std::vector<uint8_t> v;
        p.Serialize(v);
        resume_request_payload_t p2;
        BOOST_REQUIRE(p2.Deserialize(v.data(), v.size()));
        BOOST_REQUIRE(p == p2);
        BOOST_REQUIRE(!p2.Deserialize(v.data(), 4)); //no filename
    }
    {
        file_metadata_payload_t p;
        p.fileSize = 1048576;
        p.totalChunks = 128;
        p.chunkSize = 8192;
        p.startChunk = 64;
        p.remainingSize = 524288;
        p.remainingChunks = 64;
        p.fileChecksum[0] = 0xab;
        p.fileChecksum[15] = 0xcd;
        p.filename = "example.txt";
        std::vector<uint8_t> v;
        p.Serialize(v);
        BOOST_REQUIRE_EQUAL(v.size(), 8 + 4 + 4 + 4 + 8 + 4 + 32 + 11);
        file_metadata_payload_t p2;
        BOOST_REQUIRE(p2.Deserialize(v.data(), v.size()));
        BOOST_REQUIRE(p == p2);
        BOOST_REQUIRE(!p2.Deserialize(v.data(), 40));
    }
    {
        error_payload_t p(CFTP_ERROR_TYPE::CHECKSUM_ERROR, "chunk 5 corrupt", 5);
        p.expectedChecksum[0] = 1;
        p.receivedChecksum[0] = 2;
        std::vector<uint8_t> v;
        p.Serialize(v);
        error_payload_t p2;
        BOOST_REQUIRE(p2.Deserialize(v.data(), v.size()));
        BOOST_REQUIRE(p == p2);
        v[1] = 200; //unknown error type
        BOOST_REQUIRE(!p2.Deserialize(v.data(), v.size()));
    }
    {
        list_response_payload_t p;
        p.entries.push_back(list_entry_t("a.txt", false, 100, 1700000000));
        p.entries.push_back(list_entry_t("sub", true, 0, 1700000001));
        p.entries.push_back(list_entry_t("", false, 0, 0));
        std::vector<uint8_t> v;
        p.Serialize(v);
        list_response_payload_t p2;
        BOOST_REQUIRE(p2.Deserialize(v.data(), v.size()));
        BOOST_REQUIRE(p.entries == p2.entries);
        BOOST_REQUIRE(!p2.Deserialize(v.data(), v.size() - 1));
        //count larger than the entries present
        v[3] = 4;
        BOOST_REQUIRE(!p2.Deserialize(v.data(), v.size()));
    }
    {
        list_request_payload_t p;
        p.filter = CFTP_LIST_FILTER::DIRECTORIES_ONLY;
        p.path = "sub";
        std::vector<uint8_t> v;
        p.Serialize(v);
        list_request_payload_t p2;
        BOOST_REQUIRE(p2.Deserialize(v.data(), v.size()));
        BOOST_REQUIRE(p2.filter == CFTP_LIST_FILTER::DIRECTORIES_ONLY);
        BOOST_REQUIRE_EQUAL(p2.path, "sub");
    }
    {
        ack_payload_t p;
        p.acknowledgedSequenceNumber = 0xfffffffe;
        std::vector<uint8_t> v;
        p.Serialize(v);
        ack_payload_t p2;
        BOOST_REQUIRE(p2.Deserialize(v.data(), v.size()));
        BOOST_REQUIRE_EQUAL(p2.acknowledgedSequenceNumber, 0xfffffffe);
        v.push_back(0);
        BOOST_REQUIRE(!p2.Deserialize(v.data(), v.size()));
    }
}

BOOST_AUTO_TEST_CASE(CftpOversizedLengthFieldsTestCase)
{
    const std::string longString(static_cast<std::size_t>(UINT16_MAX) + 1, 'x');
    {
        handshake_payload_t p;
        p.clientId = longString;
        std::vector<uint8_t> v;
        BOOST_REQUIRE(!p.Serialize(v));
        BOOST_REQUIRE(v.empty());
        p.clientId.resize(UINT16_MAX);
        BOOST_REQUIRE(p.Serialize(v));
        BOOST_REQUIRE_EQUAL(v.size(), 4 + static_cast<std::size_t>(UINT16_MAX));
    }
    {
        list_response_payload_t p;
        p.entries.emplace_back("short.txt", false, 10, 20);
        p.entries.emplace_back(longString, false, 30, 40);
        std::vector<uint8_t> v;
        BOOST_REQUIRE(!p.Serialize(v));
        BOOST_REQUIRE(v.empty());
    }
    {
        //a frame that cannot be encoded does not consume a sequence number
        CftpFrameBuilder builder;
        std::vector<uint8_t> frame;
        BOOST_REQUIRE(!builder.GenerateHandshake(frame, longString));
        BOOST_REQUIRE_EQUAL(builder.GetNextSequenceNumber(), 0);
        list_entry_vector_t entries;
        entries.emplace_back(longString, true, 0, 0);
        BOOST_REQUIRE(!builder.GenerateListResponse(frame, entries));
        BOOST_REQUIRE_EQUAL(builder.GetNextSequenceNumber(), 0);
        BOOST_REQUIRE(builder.GenerateHandshake(frame, "client"));
        BOOST_REQUIRE_EQUAL(builder.GetNextSequenceNumber(), 1);
    }
}

BOOST_AUTO_TEST_CASE(CftpChunkArithmeticTestCase)
{
    BOOST_REQUIRE_EQUAL(CftpProtocol::GetTotalChunks(1048576, 8192), 128);
    BOOST_REQUIRE_EQUAL(CftpProtocol::GetTotalChunks(1048577, 8192), 129);
    BOOST_REQUIRE_EQUAL(CftpProtocol::GetTotalChunks(0, 8192), 0);
    BOOST_REQUIRE_EQUAL(CftpProtocol::GetTotalChunks(1, 8192), 1);
    BOOST_REQUIRE_EQUAL(CftpProtocol::GetChunkLength(1048577, 8192, 128), 1);
    BOOST_REQUIRE_EQUAL(CftpProtocol::GetChunkLength(1048577, 8192, 127), 8192);
    BOOST_REQUIRE_EQUAL(CftpProtocol::GetChunkLength(1048576, 8192, 127), 8192);
    BOOST_REQUIRE_EQUAL(CftpProtocol::GetChunkLength(1048576, 8192, 128), 0);
    for (uint64_t fileSize = 1; fileSize < 100; fileSize += 7) {
        for (uint32_t chunkSize = 1; chunkSize < 20; chunkSize += 3) {
            const uint32_t total = CftpProtocol::GetTotalChunks(fileSize, chunkSize);
            BOOST_REQUIRE_EQUAL(total, (fileSize + chunkSize - 1) / chunkSize);
            BOOST_REQUIRE_EQUAL(CftpProtocol::GetChunkLength(fileSize, chunkSize, total - 1), fileSize - (total - 1) * static_cast<uint64_t>(chunkSize));
        }
    }
}

BOOST_AUTO_TEST_CASE(CftpErrorClassTestCase)
{
    BOOST_REQUIRE(CftpProtocol::IsFatal(CFTP_ERROR_TYPE::FRAME_ERROR));
    BOOST_REQUIRE(CftpProtocol::IsFatal(CFTP_ERROR_TYPE::PROTOCOL_ERROR));
    BOOST_REQUIRE(CftpProtocol::IsFatal(CFTP_ERROR_TYPE::RETRY_EXHAUSTED));
    BOOST_REQUIRE(CftpProtocol::IsFatal(CFTP_ERROR_TYPE::RESOURCE_ERROR));
    BOOST_REQUIRE(CftpProtocol::IsFatal(CFTP_ERROR_TYPE::SESSION_EXPIRED));
    BOOST_REQUIRE(!CftpProtocol::IsFatal(CFTP_ERROR_TYPE::NOT_FOUND));
    BOOST_REQUIRE(!CftpProtocol::IsFatal(CFTP_ERROR_TYPE::INVALID_RANGE));
    BOOST_REQUIRE(!CftpProtocol::IsFatal(CFTP_ERROR_TYPE::CHECKSUM_ERROR));
    BOOST_REQUIRE(CftpProtocol::GetErrorClass(CFTP_ERROR_TYPE::NOT_FOUND) == CFTP_ERROR_CLASS::NOT_FOUND);
    BOOST_REQUIRE(CftpProtocol::GetErrorClass(CFTP_ERROR_TYPE::INVALID_RANGE) == CFTP_ERROR_CLASS::RANGE);
    BOOST_REQUIRE(CftpProtocol::GetErrorClass(CFTP_ERROR_TYPE::CHECKSUM_ERROR) == CFTP_ERROR_CLASS::INTEGRITY);
    BOOST_REQUIRE(CftpProtocol::GetErrorClass(CFTP_ERROR_TYPE::RESOURCE_ERROR) == CFTP_ERROR_CLASS::RESOURCE);
    BOOST_REQUIRE_EQUAL(std::string(CftpProtocol::ErrorTypeToString(CFTP_ERROR_TYPE::RETRY_EXHAUSTED)), "RETRY_EXHAUSTED");
    BOOST_REQUIRE_EQUAL(std::string(CftpProtocol::MessageTypeToString(CFTP_MESSAGE_TYPE::RESUME_REQUEST)), "RESUME_REQUEST");
}

BOOST_AUTO_TEST_CASE(CftpFrameReaderTestCase)
{
    struct Test {
        Test() :
            m_numFramesRead(0),
            m_numChecksumMismatches(0),
            m_numFrameErrors(0),
            m_lastErrorType(CFTP_ERROR_TYPE::NONE),
            m_reader(DIGEST_ALGORITHM::MD5, 1000)
        {
            m_reader.SetFrameReadCallback(boost::bind(&Test::FrameRead, this, boost::placeholders::_1));
            m_reader.SetChecksumMismatchCallback(boost::bind(&Test::ChecksumMismatch, this, boost::placeholders::_1, boost::placeholders::_2));
            m_reader.SetFrameErrorCallback(boost::bind(&Test::FrameError, this, boost::placeholders::_1, boost::placeholders::_2));
        }
        void FrameRead(cftp_message_t & message) {
            ++m_numFramesRead;
            m_messages.push_back(message);
        }
        void ChecksumMismatch(cftp_message_t & message, const checksum_field_t & computedChecksum) {
            ++m_numChecksumMismatches;
            BOOST_REQUIRE(computedChecksum != message.header.checksum);
            m_mismatchedChunks.push_back(message.header.chunkNumber);
        }
        void FrameError(CFTP_ERROR_TYPE errorType, const std::string &) {
            ++m_numFrameErrors;
            m_lastErrorType = errorType;
        }
        unsigned int m_numFramesRead;
        unsigned int m_numChecksumMismatches;
        unsigned int m_numFrameErrors;
        CFTP_ERROR_TYPE m_lastErrorType;
        std::vector<cftp_message_t> m_messages;
        std::vector<uint32_t> m_mismatchedChunks;
        CftpFrameReader m_reader;
    };

    CftpFrameBuilder builder;
    std::vector<uint8_t> stream;
    BOOST_REQUIRE(builder.GenerateHandshake(stream, "reader-test"));
    BOOST_REQUIRE(builder.GenerateClose(stream)); //empty payload in the middle
    std::vector<uint8_t> chunkData(300);
    for (std::size_t i = 0; i < chunkData.size(); ++i) {
        chunkData[i] = static_cast<uint8_t>(i);
    }
    BOOST_REQUIRE(builder.GenerateFileData(stream, 3, chunkData.data(), chunkData.size()));
    const std::size_t corruptFrameStart = stream.size();
    BOOST_REQUIRE(builder.GenerateFileData(stream, 4, chunkData.data(), chunkData.size()));
    stream[corruptFrameStart + CFTP_HEADER_SIZE + 10] ^= 0xff;
    BOOST_REQUIRE(builder.GenerateAck(stream, 9, 4));
    BOOST_REQUIRE_EQUAL(builder.GetNextSequenceNumber(), 5);

    //all at once, byte by byte, and in odd sized pieces all yield the same frames
    for (unsigned int mode = 0; mode < 3; ++mode) {
        Test t;
        if (mode == 0) {
            t.m_reader.HandleReceivedChars(stream.data(), stream.size());
        }
        else if (mode == 1) {
            for (std::size_t i = 0; i < stream.size(); ++i) {
                t.m_reader.HandleReceivedChar(stream[i]);
            }
        }
        else {
            std::size_t i = 0;
            while (i < stream.size()) {
                const std::size_t n = std::min<std::size_t>(37, stream.size() - i);
                t.m_reader.HandleReceivedChars(&stream[i], n);
                i += n;
            }
        }
        BOOST_REQUIRE_EQUAL(t.m_numFramesRead, 4);
        BOOST_REQUIRE_EQUAL(t.m_numChecksumMismatches, 1);
        BOOST_REQUIRE_EQUAL(t.m_numFrameErrors, 0);
        BOOST_REQUIRE_EQUAL(t.m_mismatchedChunks[0], 4);
        BOOST_REQUIRE(t.m_messages[0].header.GetMessageType() == CFTP_MESSAGE_TYPE::HANDSHAKE);
        handshake_payload_t hs;
        BOOST_REQUIRE(hs.Deserialize(t.m_messages[0].payload.data(), t.m_messages[0].payload.size()));
        BOOST_REQUIRE_EQUAL(hs.clientId, "reader-test");
        BOOST_REQUIRE(t.m_messages[1].header.GetMessageType() == CFTP_MESSAGE_TYPE::CLOSE);
        BOOST_REQUIRE(t.m_messages[2].payload == chunkData);
        BOOST_REQUIRE_EQUAL(t.m_messages[2].header.chunkNumber, 3);
        BOOST_REQUIRE_EQUAL(t.m_messages[2].header.sequenceNumber, 2);
        BOOST_REQUIRE(t.m_messages[3].header.GetMessageType() == CFTP_MESSAGE_TYPE::ACK);
        BOOST_REQUIRE_EQUAL(t.m_messages[3].header.sequenceNumber, 4);
        BOOST_REQUIRE(t.m_reader.GetRxState() == CFTP_FRAME_RX_STATE::READ_HEADER);
    }

    //bad version is reported as soon as the header completes, and further bytes are ignored
    {
        Test t;
        std::vector<uint8_t> bad;
        BOOST_REQUIRE(builder.GenerateHandshake(bad, "x"));
        bad[3] = 9;
        t.m_reader.HandleReceivedChars(bad.data(), CFTP_HEADER_SIZE);
        BOOST_REQUIRE_EQUAL(t.m_numFrameErrors, 1);
        BOOST_REQUIRE(t.m_lastErrorType == CFTP_ERROR_TYPE::UNSUPPORTED_VERSION);
        BOOST_REQUIRE(t.m_reader.GetRxState() == CFTP_FRAME_RX_STATE::FAILED);
        t.m_reader.HandleReceivedChars(stream.data(), stream.size());
        BOOST_REQUIRE_EQUAL(t.m_numFramesRead, 0);
        t.m_reader.InitRx();
        t.m_reader.HandleReceivedChars(stream.data(), stream.size());
        BOOST_REQUIRE_EQUAL(t.m_numFramesRead, 4);
    }

    //declared payload over the limit (1000) is rejected before any payload byte is buffered
    {
        Test t;
        std::vector<uint8_t> big;
        std::vector<uint8_t> bigData(1001);
        BOOST_REQUIRE(builder.GenerateFileData(big, 0, bigData.data(), bigData.size()));
        t.m_reader.HandleReceivedChars(big.data(), CFTP_HEADER_SIZE);
        BOOST_REQUIRE_EQUAL(t.m_numFrameErrors, 1);
        BOOST_REQUIRE(t.m_lastErrorType == CFTP_ERROR_TYPE::FRAME_ERROR);
    }
}
