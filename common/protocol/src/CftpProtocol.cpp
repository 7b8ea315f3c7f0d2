/**
 * @file CftpProtocol.cpp
 *
 * @copyright Copyright © 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include "CftpProtocol.h"
#include "Logger.h"
#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <cstdint>
#include <cstring>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::codec;

static void AppendU8(std::vector<uint8_t> & out, uint8_t v) {
    out.push_back(v);
}
static void AppendU16(std::vector<uint8_t> & out, uint16_t v) {
    uint8_t buf[sizeof(v)];
    boost::endian::store_big_u16(buf, v);
    out.insert(out.end(), buf, buf + sizeof(v));
}
static void AppendU32(std::vector<uint8_t> & out, uint32_t v) {
    uint8_t buf[sizeof(v)];
    boost::endian::store_big_u32(buf, v);
    out.insert(out.end(), buf, buf + sizeof(v));
}
static void AppendU64(std::vector<uint8_t> & out, uint64_t v) {
    uint8_t buf[sizeof(v)];
    boost::endian::store_big_u64(buf, v);
    out.insert(out.end(), buf, buf + sizeof(v));
}
static void AppendChecksum(std::vector<uint8_t> & out, const checksum_field_t & checksum) {
    out.insert(out.end(), checksum.cbegin(), checksum.cend());
}
static void AppendString(std::vector<uint8_t> & out, const std::string & str) {
    out.insert(out.end(), str.cbegin(), str.cend());
}

//bounds checked big endian cursor over a payload
class PayloadCursor {
public:
    PayloadCursor(const uint8_t * data, std::size_t size) : m_ptr(data), m_remaining(size) {}
    bool ReadU8(uint8_t & v) {
        if (m_remaining < 1) return false;
        v = *m_ptr;
        Advance(1);
        return true;
    }
    bool ReadU16(uint16_t & v) {
        if (m_remaining < sizeof(v)) return false;
        v = boost::endian::load_big_u16(m_ptr);
        Advance(sizeof(v));
        return true;
    }
    bool ReadU32(uint32_t & v) {
        if (m_remaining < sizeof(v)) return false;
        v = boost::endian::load_big_u32(m_ptr);
        Advance(sizeof(v));
        return true;
    }
    bool ReadU64(uint64_t & v) {
        if (m_remaining < sizeof(v)) return false;
        v = boost::endian::load_big_u64(m_ptr);
        Advance(sizeof(v));
        return true;
    }
    bool ReadChecksum(checksum_field_t & checksum) {
        if (m_remaining < checksum.size()) return false;
        memcpy(checksum.data(), m_ptr, checksum.size());
        Advance(checksum.size());
        return true;
    }
    bool ReadString(std::size_t length, std::string & str) {
        if (m_remaining < length) return false;
        str.assign(reinterpret_cast<const char*>(m_ptr), length);
        Advance(length);
        return true;
    }
    void ReadRest(std::string & str) {
        ReadString(m_remaining, str);
    }
    bool AtEnd() const {
        return m_remaining == 0;
    }
private:
    void Advance(std::size_t n) {
        m_ptr += n;
        m_remaining -= n;
    }
    const uint8_t * m_ptr;
    std::size_t m_remaining;
};

static checksum_field_t ZeroChecksum() {
    checksum_field_t c;
    c.fill(0);
    return c;
}

//////////////////////////
// header
//////////////////////////
cftp_header_t::cftp_header_t() :
    magic(CFTP_PROTOCOL_MAGIC),
    version(CFTP_PROTOCOL_VERSION),
    msgType(0),
    sequenceNumber(0),
    chunkNumber(0),
    payloadLength(0),
    checksum(ZeroChecksum()) {}

bool cftp_header_t::operator==(const cftp_header_t & o) const {
    return (magic == o.magic) &&
        (version == o.version) &&
        (msgType == o.msgType) &&
        (sequenceNumber == o.sequenceNumber) &&
        (chunkNumber == o.chunkNumber) &&
        (payloadLength == o.payloadLength) &&
        (checksum == o.checksum);
}

CFTP_MESSAGE_TYPE cftp_header_t::GetMessageType() const {
    return static_cast<CFTP_MESSAGE_TYPE>(msgType);
}

//////////////////////////
// payloads
//////////////////////////
handshake_payload_t::handshake_payload_t() : version(CFTP_PROTOCOL_VERSION), clientId() {}
bool handshake_payload_t::operator==(const handshake_payload_t & o) const {
    return (version == o.version) && (clientId == o.clientId);
}
bool handshake_payload_t::Serialize(std::vector<uint8_t> & out) const {
    if (clientId.size() > UINT16_MAX) {
        LOG_ERROR(subprocess) << "client id of " << clientId.size() << " bytes exceeds the 16-bit length field";
        return false;
    }
    AppendU16(out, version);
    AppendU16(out, static_cast<uint16_t>(clientId.size()));
    AppendString(out, clientId);
    return true;
}
bool handshake_payload_t::Deserialize(const uint8_t * data, std::size_t size) {
    PayloadCursor cursor(data, size);
    uint16_t clientIdLength;
    return cursor.ReadU16(version) &&
        cursor.ReadU16(clientIdLength) &&
        cursor.ReadString(clientIdLength, clientId) &&
        cursor.AtEnd();
}

ack_payload_t::ack_payload_t() : acknowledgedSequenceNumber(0) {}
void ack_payload_t::Serialize(std::vector<uint8_t> & out) const {
    AppendU32(out, acknowledgedSequenceNumber);
}
bool ack_payload_t::Deserialize(const uint8_t * data, std::size_t size) {
    PayloadCursor cursor(data, size);
    return cursor.ReadU32(acknowledgedSequenceNumber) && cursor.AtEnd();
}

void file_request_payload_t::Serialize(std::vector<uint8_t> & out) const {
    AppendString(out, filename);
}
bool file_request_payload_t::Deserialize(const uint8_t * data, std::size_t size) {
    PayloadCursor cursor(data, size);
    cursor.ReadRest(filename);
    return !filename.empty();
}

resume_request_payload_t::resume_request_payload_t() : startChunk(0), filename() {}
bool resume_request_payload_t::operator==(const resume_request_payload_t & o) const {
    return (startChunk == o.startChunk) && (filename == o.filename);
}
void resume_request_payload_t::Serialize(std::vector<uint8_t> & out) const {
    AppendU32(out, startChunk);
    AppendString(out, filename);
}
bool resume_request_payload_t::Deserialize(const uint8_t * data, std::size_t size) {
    PayloadCursor cursor(data, size);
    if (!cursor.ReadU32(startChunk)) {
        return false;
    }
    cursor.ReadRest(filename);
    return !filename.empty();
}

file_metadata_payload_t::file_metadata_payload_t() :
    fileSize(0),
    totalChunks(0),
    chunkSize(0),
    startChunk(0),
    remainingSize(0),
    remainingChunks(0),
    fileChecksum(ZeroChecksum()),
    filename() {}
bool file_metadata_payload_t::operator==(const file_metadata_payload_t & o) const {
    return (fileSize == o.fileSize) &&
        (totalChunks == o.totalChunks) &&
        (chunkSize == o.chunkSize) &&
        (startChunk == o.startChunk) &&
        (remainingSize == o.remainingSize) &&
        (remainingChunks == o.remainingChunks) &&
        (fileChecksum == o.fileChecksum) &&
        (filename == o.filename);
}
void file_metadata_payload_t::Serialize(std::vector<uint8_t> & out) const {
    AppendU64(out, fileSize);
    AppendU32(out, totalChunks);
    AppendU32(out, chunkSize);
    AppendU32(out, startChunk);
    AppendU64(out, remainingSize);
    AppendU32(out, remainingChunks);
    AppendChecksum(out, fileChecksum);
    AppendString(out, filename);
}
bool file_metadata_payload_t::Deserialize(const uint8_t * data, std::size_t size) {
    PayloadCursor cursor(data, size);
    if (!(cursor.ReadU64(fileSize) &&
        cursor.ReadU32(totalChunks) &&
        cursor.ReadU32(chunkSize) &&
        cursor.ReadU32(startChunk) &&
        cursor.ReadU64(remainingSize) &&
        cursor.ReadU32(remainingChunks) &&
        cursor.ReadChecksum(fileChecksum)))
    {
        return false;
    }
    cursor.ReadRest(filename);
    return true;
}

checksum_verify_payload_t::checksum_verify_payload_t() : fileChecksum(ZeroChecksum()) {}
void checksum_verify_payload_t::Serialize(std::vector<uint8_t> & out) const {
    AppendChecksum(out, fileChecksum);
}
bool checksum_verify_payload_t::Deserialize(const uint8_t * data, std::size_t size) {
    PayloadCursor cursor(data, size);
    return cursor.ReadChecksum(fileChecksum) && cursor.AtEnd();
}

error_payload_t::error_payload_t() :
    errorType(CFTP_ERROR_TYPE::NONE),
    chunkNumber(0),
    expectedChecksum(ZeroChecksum()),
    receivedChecksum(ZeroChecksum()),
    message() {}
error_payload_t::error_payload_t(CFTP_ERROR_TYPE paramErrorType, const std::string & paramMessage, uint32_t paramChunkNumber) :
    errorType(paramErrorType),
    chunkNumber(paramChunkNumber),
    expectedChecksum(ZeroChecksum()),
    receivedChecksum(ZeroChecksum()),
    message(paramMessage) {}
bool error_payload_t::operator==(const error_payload_t & o) const {
    return (errorType == o.errorType) &&
        (chunkNumber == o.chunkNumber) &&
        (expectedChecksum == o.expectedChecksum) &&
        (receivedChecksum == o.receivedChecksum) &&
        (message == o.message);
}
void error_payload_t::Serialize(std::vector<uint8_t> & out) const {
    AppendU16(out, static_cast<uint16_t>(errorType));
    AppendU32(out, chunkNumber);
    AppendChecksum(out, expectedChecksum);
    AppendChecksum(out, receivedChecksum);
    AppendString(out, message);
}
bool error_payload_t::Deserialize(const uint8_t * data, std::size_t size) {
    PayloadCursor cursor(data, size);
    uint16_t errorTypeValue;
    if (!(cursor.ReadU16(errorTypeValue) &&
        cursor.ReadU32(chunkNumber) &&
        cursor.ReadChecksum(expectedChecksum) &&
        cursor.ReadChecksum(receivedChecksum)))
    {
        return false;
    }
    if (errorTypeValue > static_cast<uint16_t>(CFTP_ERROR_TYPE::SESSION_EXPIRED)) {
        return false;
    }
    errorType = static_cast<CFTP_ERROR_TYPE>(errorTypeValue);
    cursor.ReadRest(message);
    return true;
}

list_request_payload_t::list_request_payload_t() : filter(CFTP_LIST_FILTER::ALL), path() {}
void list_request_payload_t::Serialize(std::vector<uint8_t> & out) const {
    AppendU32(out, static_cast<uint32_t>(filter));
    AppendString(out, path);
}
bool list_request_payload_t::Deserialize(const uint8_t * data, std::size_t size) {
    PayloadCursor cursor(data, size);
    uint32_t filterValue;
    if (!cursor.ReadU32(filterValue)) {
        return false;
    }
    if (filterValue > static_cast<uint32_t>(CFTP_LIST_FILTER::DIRECTORIES_ONLY)) {
        return false;
    }
    filter = static_cast<CFTP_LIST_FILTER>(filterValue);
    cursor.ReadRest(path);
    return true;
}

list_entry_t::list_entry_t() : name(), isDirectory(false), size(0), mtimeUnixSeconds(0) {}
list_entry_t::list_entry_t(const std::string & paramName, bool paramIsDirectory, uint64_t paramSize, uint64_t paramMtime) :
    name(paramName), isDirectory(paramIsDirectory), size(paramSize), mtimeUnixSeconds(paramMtime) {}
bool list_entry_t::operator==(const list_entry_t & o) const {
    return (name == o.name) && (isDirectory == o.isDirectory) && (size == o.size) && (mtimeUnixSeconds == o.mtimeUnixSeconds);
}
bool list_entry_t::operator<(const list_entry_t & o) const {
    return name < o.name;
}

bool list_response_payload_t::Serialize(std::vector<uint8_t> & out) const {
    if (entries.size() > UINT32_MAX) {
        LOG_ERROR(subprocess) << "list of " << entries.size() << " entries exceeds the 32-bit count field";
        return false;
    }
    for (list_entry_vector_t::const_iterator it = entries.cbegin(); it != entries.cend(); ++it) {
        if (it->name.size() > UINT16_MAX) {
            LOG_ERROR(subprocess) << "list entry name of " << it->name.size() << " bytes exceeds the 16-bit length field";
            return false;
        }
    }
    AppendU32(out, static_cast<uint32_t>(entries.size()));
    for (list_entry_vector_t::const_iterator it = entries.cbegin(); it != entries.cend(); ++it) {
        AppendU8(out, it->isDirectory ? 1 : 0);
        AppendU64(out, it->size);
        AppendU64(out, it->mtimeUnixSeconds);
        AppendU16(out, static_cast<uint16_t>(it->name.size()));
        AppendString(out, it->name);
    }
    return true;
}
bool list_response_payload_t::Deserialize(const uint8_t * data, std::size_t size) {
    PayloadCursor cursor(data, size);
    uint32_t count;
    if (!cursor.ReadU32(count)) {
        return false;
    }
    entries.clear();
    //each entry is at least 19 bytes, so a corrupt count cannot trigger a huge reserve
    entries.reserve(std::min<std::size_t>(count, size / 19));
    for (uint32_t i = 0; i < count; ++i) {
        list_entry_t entry;
        uint8_t isDir;
        uint16_t nameLength;
        if (!(cursor.ReadU8(isDir) &&
            cursor.ReadU64(entry.size) &&
            cursor.ReadU64(entry.mtimeUnixSeconds) &&
            cursor.ReadU16(nameLength) &&
            cursor.ReadString(nameLength, entry.name)))
        {
            return false;
        }
        entry.isDirectory = (isDir != 0);
        entries.push_back(std::move(entry));
    }
    return cursor.AtEnd();
}

//////////////////////////
// CftpProtocol
//////////////////////////
const char * CftpProtocol::MessageTypeToString(CFTP_MESSAGE_TYPE msgType) {
    switch (msgType) {
        case CFTP_MESSAGE_TYPE::HANDSHAKE: return "HANDSHAKE";
        case CFTP_MESSAGE_TYPE::FILE_REQUEST: return "FILE_REQUEST";
        case CFTP_MESSAGE_TYPE::FILE_METADATA: return "FILE_METADATA";
        case CFTP_MESSAGE_TYPE::FILE_DATA: return "FILE_DATA";
        case CFTP_MESSAGE_TYPE::CHECKSUM_VERIFY: return "CHECKSUM_VERIFY";
        case CFTP_MESSAGE_TYPE::ERROR: return "ERROR";
        case CFTP_MESSAGE_TYPE::ACK: return "ACK";
        case CFTP_MESSAGE_TYPE::RESUME_REQUEST: return "RESUME_REQUEST";
        case CFTP_MESSAGE_TYPE::CLOSE: return "CLOSE";
        case CFTP_MESSAGE_TYPE::LIST_REQUEST: return "LIST_REQUEST";
        case CFTP_MESSAGE_TYPE::LIST_RESPONSE: return "LIST_RESPONSE";
    }
    return "UNKNOWN";
}

const char * CftpProtocol::ErrorTypeToString(CFTP_ERROR_TYPE errorType) {
    switch (errorType) {
        case CFTP_ERROR_TYPE::NONE: return "NONE";
        case CFTP_ERROR_TYPE::FRAME_ERROR: return "FRAME_ERROR";
        case CFTP_ERROR_TYPE::UNSUPPORTED_VERSION: return "UNSUPPORTED_VERSION";
        case CFTP_ERROR_TYPE::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
        case CFTP_ERROR_TYPE::NOT_FOUND: return "NOT_FOUND";
        case CFTP_ERROR_TYPE::INVALID_RANGE: return "INVALID_RANGE";
        case CFTP_ERROR_TYPE::CHECKSUM_ERROR: return "CHECKSUM_ERROR";
        case CFTP_ERROR_TYPE::INTEGRITY_ERROR: return "INTEGRITY_ERROR";
        case CFTP_ERROR_TYPE::RETRY_EXHAUSTED: return "RETRY_EXHAUSTED";
        case CFTP_ERROR_TYPE::RESOURCE_ERROR: return "RESOURCE_ERROR";
        case CFTP_ERROR_TYPE::SESSION_EXPIRED: return "SESSION_EXPIRED";
    }
    return "UNKNOWN";
}

bool CftpProtocol::IsValidMessageType(uint16_t msgTypeValue) {
    return (msgTypeValue >= static_cast<uint16_t>(CFTP_MESSAGE_TYPE::HANDSHAKE)) &&
        (msgTypeValue <= static_cast<uint16_t>(CFTP_MESSAGE_TYPE::LIST_RESPONSE));
}

CFTP_ERROR_CLASS CftpProtocol::GetErrorClass(CFTP_ERROR_TYPE errorType) {
    switch (errorType) {
        case CFTP_ERROR_TYPE::NONE:
            return CFTP_ERROR_CLASS::NONE;
        case CFTP_ERROR_TYPE::FRAME_ERROR:
        case CFTP_ERROR_TYPE::UNSUPPORTED_VERSION:
            return CFTP_ERROR_CLASS::FRAME;
        case CFTP_ERROR_TYPE::PROTOCOL_ERROR:
        case CFTP_ERROR_TYPE::SESSION_EXPIRED:
            return CFTP_ERROR_CLASS::PROTOCOL;
        case CFTP_ERROR_TYPE::NOT_FOUND:
            return CFTP_ERROR_CLASS::NOT_FOUND;
        case CFTP_ERROR_TYPE::INVALID_RANGE:
            return CFTP_ERROR_CLASS::RANGE;
        case CFTP_ERROR_TYPE::CHECKSUM_ERROR:
        case CFTP_ERROR_TYPE::INTEGRITY_ERROR:
        case CFTP_ERROR_TYPE::RETRY_EXHAUSTED:
            return CFTP_ERROR_CLASS::INTEGRITY;
        case CFTP_ERROR_TYPE::RESOURCE_ERROR:
            return CFTP_ERROR_CLASS::RESOURCE;
    }
    return CFTP_ERROR_CLASS::PROTOCOL;
}

bool CftpProtocol::IsFatal(CFTP_ERROR_TYPE errorType) {
    switch (errorType) {
        case CFTP_ERROR_TYPE::NONE:
        case CFTP_ERROR_TYPE::NOT_FOUND:
        case CFTP_ERROR_TYPE::INVALID_RANGE:
        case CFTP_ERROR_TYPE::CHECKSUM_ERROR:
        case CFTP_ERROR_TYPE::INTEGRITY_ERROR:
            return false;
        default:
            return true;
    }
}

uint32_t CftpProtocol::GetTotalChunks(uint64_t fileSize, uint32_t chunkSize) {
    if (chunkSize == 0) {
        return 0;
    }
    return static_cast<uint32_t>((fileSize + chunkSize - 1) / chunkSize);
}

uint32_t CftpProtocol::GetChunkLength(uint64_t fileSize, uint32_t chunkSize, uint32_t chunkNumber) {
    const uint32_t totalChunks = GetTotalChunks(fileSize, chunkSize);
    if (chunkNumber >= totalChunks) {
        return 0;
    }
    if (chunkNumber == (totalChunks - 1)) {
        return static_cast<uint32_t>(fileSize - (static_cast<uint64_t>(totalChunks - 1) * chunkSize));
    }
    return chunkSize;
}

void CftpProtocol::SerializeHeader(const cftp_header_t & header, uint8_t * headerOut50Bytes) {
    uint8_t * p = headerOut50Bytes;
    boost::endian::store_big_u16(p, header.magic); p += 2;
    boost::endian::store_big_u16(p, header.version); p += 2;
    boost::endian::store_big_u16(p, header.msgType); p += 2;
    boost::endian::store_big_u32(p, header.sequenceNumber); p += 4;
    boost::endian::store_big_u32(p, header.chunkNumber); p += 4;
    boost::endian::store_big_u32(p, header.payloadLength); p += 4;
    memcpy(p, header.checksum.data(), header.checksum.size());
}

void CftpProtocol::DeserializeHeader(const uint8_t * header50Bytes, cftp_header_t & headerOut) {
    const uint8_t * p = header50Bytes;
    headerOut.magic = boost::endian::load_big_u16(p); p += 2;
    headerOut.version = boost::endian::load_big_u16(p); p += 2;
    headerOut.msgType = boost::endian::load_big_u16(p); p += 2;
    headerOut.sequenceNumber = boost::endian::load_big_u32(p); p += 4;
    headerOut.chunkNumber = boost::endian::load_big_u32(p); p += 4;
    headerOut.payloadLength = boost::endian::load_big_u32(p); p += 4;
    memcpy(headerOut.checksum.data(), p, headerOut.checksum.size());
}

CFTP_ERROR_TYPE CftpProtocol::ValidateHeader(const cftp_header_t & header, uint64_t maxPayloadBytes, std::string & reason) {
    if (header.magic != CFTP_PROTOCOL_MAGIC) {
        reason = "bad magic " + std::to_string(header.magic);
        return CFTP_ERROR_TYPE::FRAME_ERROR;
    }
    if (header.version != CFTP_PROTOCOL_VERSION) {
        reason = "unsupported protocol version " + std::to_string(header.version);
        return CFTP_ERROR_TYPE::UNSUPPORTED_VERSION;
    }
    if (!IsValidMessageType(header.msgType)) {
        reason = "unknown message type " + std::to_string(header.msgType);
        return CFTP_ERROR_TYPE::FRAME_ERROR;
    }
    if (header.payloadLength > maxPayloadBytes) {
        reason = "payload length " + std::to_string(header.payloadLength) + " exceeds maximum " + std::to_string(maxPayloadBytes);
        return CFTP_ERROR_TYPE::FRAME_ERROR;
    }
    return CFTP_ERROR_TYPE::NONE;
}

bool CftpProtocol::EncodeFrame(ContentDigest & digest, CFTP_MESSAGE_TYPE msgType, uint32_t sequenceNumber, uint32_t chunkNumber,
    const uint8_t * payload, std::size_t payloadSize, std::vector<uint8_t> & frameOut)
{
    cftp_header_t header;
    header.msgType = static_cast<uint16_t>(msgType);
    header.sequenceNumber = sequenceNumber;
    header.chunkNumber = chunkNumber;
    header.payloadLength = static_cast<uint32_t>(payloadSize);
    if (!digest.Compute(payload, payloadSize, header.checksum)) {
        LOG_ERROR(subprocess) << "cannot compute checksum for " << MessageTypeToString(msgType) << " frame";
        return false;
    }
    const std::size_t startIndex = frameOut.size();
    frameOut.resize(startIndex + CFTP_HEADER_SIZE + payloadSize);
    SerializeHeader(header, &frameOut[startIndex]);
    if (payloadSize) {
        memcpy(&frameOut[startIndex + CFTP_HEADER_SIZE], payload, payloadSize);
    }
    return true;
}

CFTP_ERROR_TYPE CftpProtocol::DecodeFrame(ContentDigest & digest, const uint8_t * data, std::size_t size,
    cftp_message_t & messageOut, uint64_t maxPayloadBytes)
{
    if (size < CFTP_HEADER_SIZE) {
        LOG_DEBUG(subprocess) << "truncated header: " << size << " bytes";
        return CFTP_ERROR_TYPE::FRAME_ERROR;
    }
    DeserializeHeader(data, messageOut.header);
    std::string reason;
    const CFTP_ERROR_TYPE headerError = ValidateHeader(messageOut.header, maxPayloadBytes, reason);
    if (headerError != CFTP_ERROR_TYPE::NONE) {
        LOG_DEBUG(subprocess) << reason;
        return headerError;
    }
    if (messageOut.header.payloadLength != (size - CFTP_HEADER_SIZE)) {
        LOG_DEBUG(subprocess) << "payload length mismatch: header says " << messageOut.header.payloadLength
            << ", got " << (size - CFTP_HEADER_SIZE);
        return CFTP_ERROR_TYPE::FRAME_ERROR;
    }
    checksum_field_t computed;
    if (!digest.Compute(data + CFTP_HEADER_SIZE, messageOut.header.payloadLength, computed)) {
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    if (computed != messageOut.header.checksum) {
        LOG_DEBUG(subprocess) << "checksum mismatch";
        return CFTP_ERROR_TYPE::FRAME_ERROR;
    }
    messageOut.payload.assign(data + CFTP_HEADER_SIZE, data + size);
    return CFTP_ERROR_TYPE::NONE;
}

//////////////////////////
// CftpFrameReader
//////////////////////////
CftpFrameReader::CftpFrameReader(DIGEST_ALGORITHM digestAlgorithm, uint64_t maxPayloadBytes) :
    M_MAX_PAYLOAD_BYTES(maxPayloadBytes),
    m_digest(digestAlgorithm),
    m_numFramesRead(0)
{
    InitRx();
}
CftpFrameReader::~CftpFrameReader() {}

void CftpFrameReader::SetFrameReadCallback(const FrameReadCallback_t & callback) {
    m_frameReadCallback = callback;
}
void CftpFrameReader::SetChecksumMismatchCallback(const ChecksumMismatchCallback_t & callback) {
    m_checksumMismatchCallback = callback;
}
void CftpFrameReader::SetFrameErrorCallback(const FrameErrorCallback_t & callback) {
    m_frameErrorCallback = callback;
}

void CftpFrameReader::InitRx() {
    m_rxState = CFTP_FRAME_RX_STATE::READ_HEADER;
    m_headerBytesRead = 0;
    m_message.payload.resize(0);
}

CFTP_FRAME_RX_STATE CftpFrameReader::GetRxState() const noexcept {
    return m_rxState;
}
uint64_t CftpFrameReader::GetNumFramesRead() const noexcept {
    return m_numFramesRead;
}

void CftpFrameReader::HandleReceivedChar(const uint8_t rxVal) {
    HandleReceivedChars(&rxVal, 1);
}

void CftpFrameReader::HandleReceivedChars(const uint8_t * rxVals, std::size_t numChars) {
    while (numChars) {
        const CFTP_FRAME_RX_STATE rxState = m_rxState; //const for optimization
        if (rxState == CFTP_FRAME_RX_STATE::READ_HEADER) {
            const std::size_t bytesToCopy = std::min(numChars, static_cast<std::size_t>(CFTP_HEADER_SIZE - m_headerBytesRead));
            memcpy(&m_headerBytes[m_headerBytesRead], rxVals, bytesToCopy);
            m_headerBytesRead += bytesToCopy;
            rxVals += bytesToCopy;
            numChars -= bytesToCopy;
            if (m_headerBytesRead == CFTP_HEADER_SIZE) {
                OnHeaderComplete();
            }
        }
        else if (rxState == CFTP_FRAME_RX_STATE::READ_PAYLOAD) {
            const std::size_t payloadBytesRemaining = m_message.header.payloadLength - m_message.payload.size();
            const std::size_t bytesToCopy = std::min(numChars, payloadBytesRemaining);
            m_message.payload.insert(m_message.payload.end(), rxVals, rxVals + bytesToCopy);
            rxVals += bytesToCopy;
            numChars -= bytesToCopy;
            if (m_message.payload.size() == m_message.header.payloadLength) {
                OnPayloadComplete();
            }
        }
        else { //FAILED
            return;
        }
    }
}

void CftpFrameReader::OnHeaderComplete() {
    CftpProtocol::DeserializeHeader(m_headerBytes, m_message.header);
    m_headerBytesRead = 0;
    std::string reason;
    const CFTP_ERROR_TYPE headerError = CftpProtocol::ValidateHeader(m_message.header, M_MAX_PAYLOAD_BYTES, reason);
    if (headerError != CFTP_ERROR_TYPE::NONE) {
        m_rxState = CFTP_FRAME_RX_STATE::FAILED;
        LOG_ERROR(subprocess) << "frame error: " << reason;
        if (m_frameErrorCallback) {
            m_frameErrorCallback(headerError, reason);
        }
        return;
    }
    m_message.payload.resize(0);
    if (m_message.header.payloadLength == 0) {
        OnPayloadComplete();
    }
    else {
        m_message.payload.reserve(m_message.header.payloadLength);
        m_rxState = CFTP_FRAME_RX_STATE::READ_PAYLOAD;
    }
}

void CftpFrameReader::OnPayloadComplete() {
    m_rxState = CFTP_FRAME_RX_STATE::READ_HEADER;
    checksum_field_t computed;
    if (!m_digest.Compute(m_message.payload.data(), m_message.payload.size(), computed)) {
        m_rxState = CFTP_FRAME_RX_STATE::FAILED;
        if (m_frameErrorCallback) {
            m_frameErrorCallback(CFTP_ERROR_TYPE::RESOURCE_ERROR, "digest failure");
        }
        return;
    }
    ++m_numFramesRead;
    if (computed != m_message.header.checksum) {
        LOG_WARNING(subprocess) << "checksum mismatch on " << CftpProtocol::MessageTypeToString(m_message.header.GetMessageType())
            << " frame seq=" << m_message.header.sequenceNumber << " chunk=" << m_message.header.chunkNumber;
        if (m_checksumMismatchCallback) {
            m_checksumMismatchCallback(m_message, computed);
        }
        else if (m_frameErrorCallback) {
            m_rxState = CFTP_FRAME_RX_STATE::FAILED;
            m_frameErrorCallback(CFTP_ERROR_TYPE::FRAME_ERROR, "checksum mismatch");
        }
        return;
    }
    if (m_frameReadCallback) {
        m_frameReadCallback(m_message);
    }
}

//////////////////////////
// CftpFrameBuilder
//////////////////////////
CftpFrameBuilder::CftpFrameBuilder(DIGEST_ALGORITHM digestAlgorithm) :
    m_digest(digestAlgorithm),
    m_nextSequenceNumber(0)
{
    m_payloadScratch.reserve(256);
}
CftpFrameBuilder::~CftpFrameBuilder() {}

uint32_t CftpFrameBuilder::GetNextSequenceNumber() const noexcept {
    return m_nextSequenceNumber;
}

bool CftpFrameBuilder::GenerateFrame(std::vector<uint8_t> & frameOut, CFTP_MESSAGE_TYPE msgType, uint32_t chunkNumber,
    const uint8_t * payload, std::size_t payloadSize)
{
    if (!CftpProtocol::EncodeFrame(m_digest, msgType, m_nextSequenceNumber, chunkNumber, payload, payloadSize, frameOut)) {
        return false;
    }
    ++m_nextSequenceNumber;
    return true;
}

bool CftpFrameBuilder::GenerateHandshake(std::vector<uint8_t> & frameOut, const std::string & clientId, uint16_t version) {
    handshake_payload_t p;
    p.version = version;
    p.clientId = clientId;
    m_payloadScratch.resize(0);
    if (!p.Serialize(m_payloadScratch)) {
        return false;
    }
    return GenerateFrame(frameOut, CFTP_MESSAGE_TYPE::HANDSHAKE, 0, m_payloadScratch.data(), m_payloadScratch.size());
}

bool CftpFrameBuilder::GenerateAck(std::vector<uint8_t> & frameOut, uint32_t acknowledgedSequenceNumber, uint32_t acknowledgedChunkNumber) {
    ack_payload_t p;
    p.acknowledgedSequenceNumber = acknowledgedSequenceNumber;
    m_payloadScratch.resize(0);
    p.Serialize(m_payloadScratch);
    return GenerateFrame(frameOut, CFTP_MESSAGE_TYPE::ACK, acknowledgedChunkNumber, m_payloadScratch.data(), m_payloadScratch.size());
}

bool CftpFrameBuilder::GenerateFileRequest(std::vector<uint8_t> & frameOut, const std::string & filename) {
    file_request_payload_t p;
    p.filename = filename;
    m_payloadScratch.resize(0);
    p.Serialize(m_payloadScratch);
    return GenerateFrame(frameOut, CFTP_MESSAGE_TYPE::FILE_REQUEST, 0, m_payloadScratch.data(), m_payloadScratch.size());
}

bool CftpFrameBuilder::GenerateResumeRequest(std::vector<uint8_t> & frameOut, const std::string & filename, uint32_t startChunk) {
    resume_request_payload_t p;
    p.startChunk = startChunk;
    p.filename = filename;
    m_payloadScratch.resize(0);
    p.Serialize(m_payloadScratch);
    return GenerateFrame(frameOut, CFTP_MESSAGE_TYPE::RESUME_REQUEST, startChunk, m_payloadScratch.data(), m_payloadScratch.size());
}

bool CftpFrameBuilder::GenerateFileMetadata(std::vector<uint8_t> & frameOut, const file_metadata_payload_t & metadata) {
    m_payloadScratch.resize(0);
    metadata.Serialize(m_payloadScratch);
    return GenerateFrame(frameOut, CFTP_MESSAGE_TYPE::FILE_METADATA, metadata.startChunk, m_payloadScratch.data(), m_payloadScratch.size());
}

bool CftpFrameBuilder::GenerateFileData(std::vector<uint8_t> & frameOut, uint32_t chunkNumber, const uint8_t * data, std::size_t size) {
    return GenerateFrame(frameOut, CFTP_MESSAGE_TYPE::FILE_DATA, chunkNumber, data, size);
}

bool CftpFrameBuilder::GenerateChecksumVerify(std::vector<uint8_t> & frameOut, const checksum_field_t & fileChecksum) {
    checksum_verify_payload_t p;
    p.fileChecksum = fileChecksum;
    m_payloadScratch.resize(0);
    p.Serialize(m_payloadScratch);
    return GenerateFrame(frameOut, CFTP_MESSAGE_TYPE::CHECKSUM_VERIFY, 0, m_payloadScratch.data(), m_payloadScratch.size());
}

bool CftpFrameBuilder::GenerateError(std::vector<uint8_t> & frameOut, const error_payload_t & error) {
    m_payloadScratch.resize(0);
    error.Serialize(m_payloadScratch);
    return GenerateFrame(frameOut, CFTP_MESSAGE_TYPE::ERROR, error.chunkNumber, m_payloadScratch.data(), m_payloadScratch.size());
}

bool CftpFrameBuilder::GenerateListRequest(std::vector<uint8_t> & frameOut, CFTP_LIST_FILTER filter, const std::string & path) {
    list_request_payload_t p;
    p.filter = filter;
    p.path = path;
    m_payloadScratch.resize(0);
    p.Serialize(m_payloadScratch);
    return GenerateFrame(frameOut, CFTP_MESSAGE_TYPE::LIST_REQUEST, 0, m_payloadScratch.data(), m_payloadScratch.size());
}

bool CftpFrameBuilder::GenerateListResponse(std::vector<uint8_t> & frameOut, const list_entry_vector_t & entries) {
    list_response_payload_t p;
    p.entries = entries;
    m_payloadScratch.resize(0);
    if (!p.Serialize(m_payloadScratch)) {
        return false;
    }
    return GenerateFrame(frameOut, CFTP_MESSAGE_TYPE::LIST_RESPONSE, 0, m_payloadScratch.data(), m_payloadScratch.size());
}

bool CftpFrameBuilder::GenerateClose(std::vector<uint8_t> & frameOut) {
    return GenerateFrame(frameOut, CFTP_MESSAGE_TYPE::CLOSE, 0, NULL, 0);
}
