/**
 * @file CftpProtocol.h
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
 * This file implements the CFTP (chunked file transfer protocol) wire format.
 * A frame is a fixed 50-byte big-endian header followed by a variable length payload:
 *
 *   magic 0x4442 (2) | version (2) | msg_type (2) | sequence_number (4) |
 *   chunk_number (4) | payload_length (4) | checksum (32)
 *
 * The checksum is the ContentDigest of the payload bytes (zero padded to 32 bytes).
 * It defines the payload structures, one-shot frame encoding and decoding,
 * a finite-state machine (FSM) frame reader that accepts arbitrary partial reads
 * and calls custom callback functions whenever a complete frame is received,
 * and a frame builder which owns a connection's outgoing sequence numbers.
 */

#ifndef CFTP_PROTOCOL_H
#define CFTP_PROTOCOL_H 1

#include <string>
#include <vector>
#include <cstdint>
#include <boost/function.hpp>
#include "ContentDigest.h"
#include "cftp_protocol_export.h"

#define CFTP_PROTOCOL_MAGIC 0x4442
#define CFTP_PROTOCOL_VERSION 1
#define CFTP_HEADER_SIZE 50
#define CFTP_DEFAULT_MAX_PAYLOAD_BYTES 16777216

enum class CFTP_MESSAGE_TYPE : uint16_t
{
    HANDSHAKE = 1,
    FILE_REQUEST = 2,
    FILE_METADATA = 3,
    FILE_DATA = 4,
    CHECKSUM_VERIFY = 5,
    ERROR = 6,
    ACK = 7,
    RESUME_REQUEST = 8,
    CLOSE = 9,
    LIST_REQUEST = 10,
    LIST_RESPONSE = 11
};

enum class CFTP_ERROR_TYPE : uint16_t
{
    NONE = 0,
    FRAME_ERROR = 1,
    UNSUPPORTED_VERSION = 2,
    PROTOCOL_ERROR = 3,
    NOT_FOUND = 4,
    INVALID_RANGE = 5,
    CHECKSUM_ERROR = 6,
    INTEGRITY_ERROR = 7,
    RETRY_EXHAUSTED = 8,
    RESOURCE_ERROR = 9,
    SESSION_EXPIRED = 10
};

/// Error taxonomy that decides how a fault is handled
enum class CFTP_ERROR_CLASS
{
    NONE = 0,
    FRAME,
    PROTOCOL,
    NOT_FOUND,
    RANGE,
    INTEGRITY,
    RESOURCE
};

enum class CFTP_LIST_FILTER : uint32_t
{
    ALL = 0,
    FILES_ONLY = 1,
    DIRECTORIES_ONLY = 2
};

struct cftp_header_t {
    uint16_t magic;
    uint16_t version;
    uint16_t msgType; //raw value, see CFTP_MESSAGE_TYPE
    uint32_t sequenceNumber;
    uint32_t chunkNumber;
    uint32_t payloadLength;
    checksum_field_t checksum;

    CFTP_PROTOCOL_EXPORT cftp_header_t();
    CFTP_PROTOCOL_EXPORT bool operator==(const cftp_header_t & o) const;
    CFTP_PROTOCOL_EXPORT CFTP_MESSAGE_TYPE GetMessageType() const;
};

struct cftp_message_t {
    cftp_header_t header;
    std::vector<uint8_t> payload;
};

//payloads (each Serialize appends to the given vector, each Deserialize consumes the entire buffer)
//a bool Serialize returns false, appending nothing, when a length does not fit its wire field

struct handshake_payload_t {
    uint16_t version;
    std::string clientId;

    CFTP_PROTOCOL_EXPORT handshake_payload_t();
    CFTP_PROTOCOL_EXPORT bool operator==(const handshake_payload_t & o) const;
    CFTP_PROTOCOL_EXPORT bool Serialize(std::vector<uint8_t> & out) const;
    CFTP_PROTOCOL_EXPORT bool Deserialize(const uint8_t * data, std::size_t size);
};

struct ack_payload_t {
    uint32_t acknowledgedSequenceNumber;

    CFTP_PROTOCOL_EXPORT ack_payload_t();
    CFTP_PROTOCOL_EXPORT void Serialize(std::vector<uint8_t> & out) const;
    CFTP_PROTOCOL_EXPORT bool Deserialize(const uint8_t * data, std::size_t size);
};

struct file_request_payload_t {
    std::string filename;

    CFTP_PROTOCOL_EXPORT void Serialize(std::vector<uint8_t> & out) const;
    CFTP_PROTOCOL_EXPORT bool Deserialize(const uint8_t * data, std::size_t size);
};

struct resume_request_payload_t {
    uint32_t startChunk;
    std::string filename;

    CFTP_PROTOCOL_EXPORT resume_request_payload_t();
    CFTP_PROTOCOL_EXPORT bool operator==(const resume_request_payload_t & o) const;
    CFTP_PROTOCOL_EXPORT void Serialize(std::vector<uint8_t> & out) const;
    CFTP_PROTOCOL_EXPORT bool Deserialize(const uint8_t * data, std::size_t size);
};

struct file_metadata_payload_t {
    uint64_t fileSize;
    uint32_t totalChunks;
    uint32_t chunkSize;
    uint32_t startChunk;
    uint64_t remainingSize;
    uint32_t remainingChunks;
    checksum_field_t fileChecksum;
    std::string filename;

    CFTP_PROTOCOL_EXPORT file_metadata_payload_t();
    CFTP_PROTOCOL_EXPORT bool operator==(const file_metadata_payload_t & o) const;
    CFTP_PROTOCOL_EXPORT void Serialize(std::vector<uint8_t> & out) const;
    CFTP_PROTOCOL_EXPORT bool Deserialize(const uint8_t * data, std::size_t size);
};

struct checksum_verify_payload_t {
    checksum_field_t fileChecksum;

    CFTP_PROTOCOL_EXPORT checksum_verify_payload_t();
    CFTP_PROTOCOL_EXPORT void Serialize(std::vector<uint8_t> & out) const;
    CFTP_PROTOCOL_EXPORT bool Deserialize(const uint8_t * data, std::size_t size);
};

struct error_payload_t {
    CFTP_ERROR_TYPE errorType;
    uint32_t chunkNumber;
    checksum_field_t expectedChecksum;
    checksum_field_t receivedChecksum;
    std::string message;

    CFTP_PROTOCOL_EXPORT error_payload_t();
    CFTP_PROTOCOL_EXPORT error_payload_t(CFTP_ERROR_TYPE paramErrorType, const std::string & paramMessage, uint32_t paramChunkNumber = 0);
    CFTP_PROTOCOL_EXPORT bool operator==(const error_payload_t & o) const;
    CFTP_PROTOCOL_EXPORT void Serialize(std::vector<uint8_t> & out) const;
    CFTP_PROTOCOL_EXPORT bool Deserialize(const uint8_t * data, std::size_t size);
};

struct list_request_payload_t {
    CFTP_LIST_FILTER filter;
    std::string path;

    CFTP_PROTOCOL_EXPORT list_request_payload_t();
    CFTP_PROTOCOL_EXPORT void Serialize(std::vector<uint8_t> & out) const;
    CFTP_PROTOCOL_EXPORT bool Deserialize(const uint8_t * data, std::size_t size);
};

struct list_entry_t {
    std::string name;
    bool isDirectory;
    uint64_t size;
    uint64_t mtimeUnixSeconds;

    CFTP_PROTOCOL_EXPORT list_entry_t();
    CFTP_PROTOCOL_EXPORT list_entry_t(const std::string & paramName, bool paramIsDirectory, uint64_t paramSize, uint64_t paramMtime);
    CFTP_PROTOCOL_EXPORT bool operator==(const list_entry_t & o) const;
    CFTP_PROTOCOL_EXPORT bool operator<(const list_entry_t & o) const; //by name
};
typedef std::vector<list_entry_t> list_entry_vector_t;

struct list_response_payload_t {
    list_entry_vector_t entries;

    CFTP_PROTOCOL_EXPORT bool Serialize(std::vector<uint8_t> & out) const;
    CFTP_PROTOCOL_EXPORT bool Deserialize(const uint8_t * data, std::size_t size);
};

class CftpProtocol {
public:
    CftpProtocol() = delete;

    CFTP_PROTOCOL_EXPORT static const char * MessageTypeToString(CFTP_MESSAGE_TYPE msgType);
    CFTP_PROTOCOL_EXPORT static const char * ErrorTypeToString(CFTP_ERROR_TYPE errorType);
    CFTP_PROTOCOL_EXPORT static bool IsValidMessageType(uint16_t msgTypeValue);
    CFTP_PROTOCOL_EXPORT static CFTP_ERROR_CLASS GetErrorClass(CFTP_ERROR_TYPE errorType);

    /** Decide whether an error closes the connection.
     * CHECKSUM_ERROR and INTEGRITY_ERROR are recoverable (retransmission / resume),
     * as are NOT_FOUND and INVALID_RANGE. Everything else is fatal.
     */
    CFTP_PROTOCOL_EXPORT static bool IsFatal(CFTP_ERROR_TYPE errorType);

    /// Number of chunks needed for fileSize bytes (0 for an empty file)
    CFTP_PROTOCOL_EXPORT static uint32_t GetTotalChunks(uint64_t fileSize, uint32_t chunkSize);

    /// Length of chunk chunkNumber (the final chunk may be short, 0 if out of range)
    CFTP_PROTOCOL_EXPORT static uint32_t GetChunkLength(uint64_t fileSize, uint32_t chunkSize, uint32_t chunkNumber);

    CFTP_PROTOCOL_EXPORT static void SerializeHeader(const cftp_header_t & header, uint8_t * headerOut50Bytes);
    CFTP_PROTOCOL_EXPORT static void DeserializeHeader(const uint8_t * header50Bytes, cftp_header_t & headerOut);

    /** Check magic, version, message type and payload length of a deserialized header.
     *
     * @param header The header to check.
     * @param maxPayloadBytes The largest payload_length accepted.
     * @param reason A description of the failure.
     * @return NONE, FRAME_ERROR or UNSUPPORTED_VERSION.
     */
    CFTP_PROTOCOL_EXPORT static CFTP_ERROR_TYPE ValidateHeader(const cftp_header_t & header, uint64_t maxPayloadBytes, std::string & reason);

    /** Encode a complete frame, appending it to frameOut.
     *
     * @return True on success, or False if the payload digest could not be computed.
     */
    CFTP_PROTOCOL_EXPORT static bool EncodeFrame(ContentDigest & digest, CFTP_MESSAGE_TYPE msgType, uint32_t sequenceNumber, uint32_t chunkNumber,
        const uint8_t * payload, std::size_t payloadSize, std::vector<uint8_t> & frameOut);

    /** Decode exactly one complete frame.
     * Fails on truncated headers, bad magic or version, a payload_length that
     * does not match the bytes given, or a checksum mismatch.
     *
     * @return NONE on success, or the error type describing the failure.
     */
    CFTP_PROTOCOL_EXPORT static CFTP_ERROR_TYPE DecodeFrame(ContentDigest & digest, const uint8_t * data, std::size_t size,
        cftp_message_t & messageOut, uint64_t maxPayloadBytes = CFTP_DEFAULT_MAX_PAYLOAD_BYTES);
};

enum class CFTP_FRAME_RX_STATE
{
    READ_HEADER = 0,
    READ_PAYLOAD,
    FAILED
};

class CftpFrameReader {
public:
    typedef boost::function<void(cftp_message_t & message)> FrameReadCallback_t;
    typedef boost::function<void(cftp_message_t & message, const checksum_field_t & computedChecksum)> ChecksumMismatchCallback_t;
    typedef boost::function<void(CFTP_ERROR_TYPE errorType, const std::string & reason)> FrameErrorCallback_t;

    CFTP_PROTOCOL_EXPORT explicit CftpFrameReader(DIGEST_ALGORITHM digestAlgorithm = DIGEST_ALGORITHM::MD5,
        uint64_t maxPayloadBytes = CFTP_DEFAULT_MAX_PAYLOAD_BYTES);
    CFTP_PROTOCOL_EXPORT ~CftpFrameReader();

    CFTP_PROTOCOL_EXPORT void SetFrameReadCallback(const FrameReadCallback_t & callback);
    CFTP_PROTOCOL_EXPORT void SetChecksumMismatchCallback(const ChecksumMismatchCallback_t & callback);
    CFTP_PROTOCOL_EXPORT void SetFrameErrorCallback(const FrameErrorCallback_t & callback);

    CFTP_PROTOCOL_EXPORT void InitRx();

    /** Feed received bytes (any amount, including partial headers and payloads).
     * Once a frame error has been reported all further bytes are ignored until InitRx().
     */
    CFTP_PROTOCOL_EXPORT void HandleReceivedChars(const uint8_t * rxVals, std::size_t numChars);
    CFTP_PROTOCOL_EXPORT void HandleReceivedChar(const uint8_t rxVal);

    CFTP_PROTOCOL_EXPORT CFTP_FRAME_RX_STATE GetRxState() const noexcept;
    CFTP_PROTOCOL_EXPORT uint64_t GetNumFramesRead() const noexcept;

private:
    CFTP_PROTOCOL_EXPORT void OnHeaderComplete();
    CFTP_PROTOCOL_EXPORT void OnPayloadComplete();

private:
    const uint64_t M_MAX_PAYLOAD_BYTES;
    ContentDigest m_digest;
    CFTP_FRAME_RX_STATE m_rxState;
    uint8_t m_headerBytes[CFTP_HEADER_SIZE];
    std::size_t m_headerBytesRead;
    cftp_message_t m_message;
    uint64_t m_numFramesRead;

    FrameReadCallback_t m_frameReadCallback;
    ChecksumMismatchCallback_t m_checksumMismatchCallback;
    FrameErrorCallback_t m_frameErrorCallback;
};

class CftpFrameBuilder {
public:
    CFTP_PROTOCOL_EXPORT explicit CftpFrameBuilder(DIGEST_ALGORITHM digestAlgorithm = DIGEST_ALGORITHM::MD5);
    CFTP_PROTOCOL_EXPORT ~CftpFrameBuilder();

    /// The sequence number the next generated frame will carry
    CFTP_PROTOCOL_EXPORT uint32_t GetNextSequenceNumber() const noexcept;

    //each Generate function appends one frame to frameOut and consumes one sequence number
    CFTP_PROTOCOL_EXPORT bool GenerateFrame(std::vector<uint8_t> & frameOut, CFTP_MESSAGE_TYPE msgType, uint32_t chunkNumber,
        const uint8_t * payload, std::size_t payloadSize);
    CFTP_PROTOCOL_EXPORT bool GenerateHandshake(std::vector<uint8_t> & frameOut, const std::string & clientId, uint16_t version = CFTP_PROTOCOL_VERSION);
    CFTP_PROTOCOL_EXPORT bool GenerateAck(std::vector<uint8_t> & frameOut, uint32_t acknowledgedSequenceNumber, uint32_t acknowledgedChunkNumber);
    CFTP_PROTOCOL_EXPORT bool GenerateFileRequest(std::vector<uint8_t> & frameOut, const std::string & filename);
    CFTP_PROTOCOL_EXPORT bool GenerateResumeRequest(std::vector<uint8_t> & frameOut, const std::string & filename, uint32_t startChunk);
    CFTP_PROTOCOL_EXPORT bool GenerateFileMetadata(std::vector<uint8_t> & frameOut, const file_metadata_payload_t & metadata);
    CFTP_PROTOCOL_EXPORT bool GenerateFileData(std::vector<uint8_t> & frameOut, uint32_t chunkNumber, const uint8_t * data, std::size_t size);
    CFTP_PROTOCOL_EXPORT bool GenerateChecksumVerify(std::vector<uint8_t> & frameOut, const checksum_field_t & fileChecksum);
    CFTP_PROTOCOL_EXPORT bool GenerateError(std::vector<uint8_t> & frameOut, const error_payload_t & error);
    CFTP_PROTOCOL_EXPORT bool GenerateListRequest(std::vector<uint8_t> & frameOut, CFTP_LIST_FILTER filter, const std::string & path);
    CFTP_PROTOCOL_EXPORT bool GenerateListResponse(std::vector<uint8_t> & frameOut, const list_entry_vector_t & entries);
    CFTP_PROTOCOL_EXPORT bool GenerateClose(std::vector<uint8_t> & frameOut);

private:
    ContentDigest m_digest;
    uint32_t m_nextSequenceNumber;
    std::vector<uint8_t> m_payloadScratch;
};

#endif // CFTP_PROTOCOL_H
