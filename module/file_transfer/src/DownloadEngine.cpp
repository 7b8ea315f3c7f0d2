/**
 * @file DownloadEngine.cpp
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

#include "DownloadEngine.h"
#include "Logger.h"
#include <boost/bind/bind.hpp>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::client;

DownloadEngine::DownloadEngine(SessionRegistry & sessionRegistry, FileManager & fileManager,
    const std::string & clientId, uint64_t maxPayloadBytes) :
    m_sessionRegistryRef(sessionRegistry),
    m_fileManagerRef(fileManager),
    M_CLIENT_ID(clientId),
    m_frameReader(fileManager.GetDigestAlgorithm(), maxPayloadBytes),
    m_frameBuilder(fileManager.GetDigestAlgorithm()),
    m_state(DOWNLOAD_ENGINE_STATE::HANDSHAKE_SENT),
    m_expectedChunk(0),
    m_lastError(CFTP_ERROR_TYPE::NONE),
    m_numChecksumErrors(0)
{
    m_frameReader.SetFrameReadCallback(boost::bind(&DownloadEngine::OnFrameRead, this, boost::placeholders::_1));
    m_frameReader.SetChecksumMismatchCallback(boost::bind(&DownloadEngine::OnChecksumMismatch, this,
        boost::placeholders::_1, boost::placeholders::_2));
    m_frameReader.SetFrameErrorCallback(boost::bind(&DownloadEngine::OnFrameError, this,
        boost::placeholders::_1, boost::placeholders::_2));
    m_currentOperation.type = OPERATION_TYPE::CLOSE;
    m_currentOperation.startChunk = 0;
    m_currentOperation.filter = CFTP_LIST_FILTER::ALL;
    if (!m_frameBuilder.GenerateHandshake(m_bytesToSend, M_CLIENT_ID)) {
        LOG_ERROR(subprocess) << "cannot encode HANDSHAKE for client id of " << M_CLIENT_ID.size() << " bytes";
        m_lastError = CFTP_ERROR_TYPE::PROTOCOL_ERROR;
        m_state = DOWNLOAD_ENGINE_STATE::FAILED;
    }
}

DownloadEngine::~DownloadEngine() {}

void DownloadEngine::SetDownloadCompleteCallback(const DownloadCompleteCallback_t & callback) {
    m_downloadCompleteCallback = callback;
}
void DownloadEngine::SetDownloadProgressCallback(const DownloadProgressCallback_t & callback) {
    m_downloadProgressCallback = callback;
}
void DownloadEngine::SetListCompleteCallback(const ListCompleteCallback_t & callback) {
    m_listCompleteCallback = callback;
}

const char * DownloadEngine::StateToString(DOWNLOAD_ENGINE_STATE state) {
    switch (state) {
        case DOWNLOAD_ENGINE_STATE::HANDSHAKE_SENT: return "HANDSHAKE_SENT";
        case DOWNLOAD_ENGINE_STATE::IDLE: return "IDLE";
        case DOWNLOAD_ENGINE_STATE::AWAITING_METADATA: return "AWAITING_METADATA";
        case DOWNLOAD_ENGINE_STATE::RECEIVING: return "RECEIVING";
        case DOWNLOAD_ENGINE_STATE::AWAITING_LIST: return "AWAITING_LIST";
        case DOWNLOAD_ENGINE_STATE::CLOSING: return "CLOSING";
        case DOWNLOAD_ENGINE_STATE::CLOSED: return "CLOSED";
        case DOWNLOAD_ENGINE_STATE::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

void DownloadEngine::QueueDownload(const std::string & remoteFilename, const boost::filesystem::path & localPath,
    const boost::filesystem::path & resumeSourcePath, uint32_t startChunk)
{
    pending_operation_t op;
    op.type = resumeSourcePath.empty() ? OPERATION_TYPE::DOWNLOAD : OPERATION_TYPE::RESUME;
    op.remoteFilename = remoteFilename;
    op.localPath = localPath;
    op.resumeSourcePath = resumeSourcePath;
    op.startChunk = resumeSourcePath.empty() ? 0 : startChunk;
    op.filter = CFTP_LIST_FILTER::ALL;
    m_pendingOperations.push_back(std::move(op));
    StartNextOperation();
}

void DownloadEngine::QueueResume(const TransferSession_ptr & session) {
    pending_operation_t op;
    op.type = OPERATION_TYPE::RESUME;
    op.remoteFilename = session->GetFilename();
    op.localPath = session->GetFinalFilePath();
    op.startChunk = 0; //taken from the session when the request is sent
    op.session = session;
    op.filter = CFTP_LIST_FILTER::ALL;
    m_pendingOperations.push_back(std::move(op));
    StartNextOperation();
}

void DownloadEngine::QueueList(CFTP_LIST_FILTER filter, const std::string & path) {
    pending_operation_t op;
    op.type = OPERATION_TYPE::LIST;
    op.startChunk = 0;
    op.filter = filter;
    op.listPath = path;
    m_pendingOperations.push_back(std::move(op));
    StartNextOperation();
}

void DownloadEngine::QueueClose() {
    pending_operation_t op;
    op.type = OPERATION_TYPE::CLOSE;
    op.startChunk = 0;
    op.filter = CFTP_LIST_FILTER::ALL;
    m_pendingOperations.push_back(std::move(op));
    StartNextOperation();
}

bool DownloadEngine::IsIdle() const {
    return (m_state == DOWNLOAD_ENGINE_STATE::IDLE) && m_pendingOperations.empty();
}

void DownloadEngine::StartNextOperation() {
    if ((m_state != DOWNLOAD_ENGINE_STATE::IDLE) || m_pendingOperations.empty()) {
        return;
    }
    m_currentOperation = std::move(m_pendingOperations.front());
    m_pendingOperations.pop_front();
    switch (m_currentOperation.type) {
        case OPERATION_TYPE::DOWNLOAD:
            m_sessionPtr.reset();
            m_chunksWritten.clear();
            m_frameBuilder.GenerateFileRequest(m_bytesToSend, m_currentOperation.remoteFilename);
            m_state = DOWNLOAD_ENGINE_STATE::AWAITING_METADATA;
            break;
        case OPERATION_TYPE::RESUME:
            m_sessionPtr = m_currentOperation.session;
            m_chunksWritten.clear();
            if (m_sessionPtr) {
                m_currentOperation.startChunk = m_sessionPtr->GetFirstMissingChunk();
            }
            m_frameBuilder.GenerateResumeRequest(m_bytesToSend, m_currentOperation.remoteFilename, m_currentOperation.startChunk);
            m_state = DOWNLOAD_ENGINE_STATE::AWAITING_METADATA;
            LOG_INFO(subprocess) << "resuming " << m_currentOperation.remoteFilename << " from chunk " << m_currentOperation.startChunk;
            break;
        case OPERATION_TYPE::LIST:
            m_frameBuilder.GenerateListRequest(m_bytesToSend, m_currentOperation.filter, m_currentOperation.listPath);
            m_state = DOWNLOAD_ENGINE_STATE::AWAITING_LIST;
            break;
        case OPERATION_TYPE::CLOSE:
            m_frameBuilder.GenerateClose(m_bytesToSend);
            m_state = DOWNLOAD_ENGINE_STATE::CLOSING;
            break;
    }
}

void DownloadEngine::HandleReceivedBytes(const uint8_t * data, std::size_t size) {
    if (!IsFinished()) {
        m_frameReader.HandleReceivedChars(data, size);
    }
}

bool DownloadEngine::TakeBytesToSend(std::vector<uint8_t> & bytesToSend) {
    bytesToSend.clear();
    bytesToSend.swap(m_bytesToSend);
    return !bytesToSend.empty();
}

bool DownloadEngine::IsFinished() const {
    return (m_state == DOWNLOAD_ENGINE_STATE::CLOSED) || (m_state == DOWNLOAD_ENGINE_STATE::FAILED);
}

void DownloadEngine::OnDisconnect() {
    if (m_state == DOWNLOAD_ENGINE_STATE::CLOSING) {
        m_state = DOWNLOAD_ENGINE_STATE::CLOSED;
        return;
    }
    if (IsFinished()) {
        return;
    }
    LOG_ERROR(subprocess) << "connection lost in state " << StateToString(m_state);
    m_lastError = CFTP_ERROR_TYPE::RESOURCE_ERROR;
    const DOWNLOAD_ENGINE_STATE previousState = m_state;
    m_state = DOWNLOAD_ENGINE_STATE::FAILED;
    m_pendingOperations.clear();
    if ((previousState == DOWNLOAD_ENGINE_STATE::AWAITING_METADATA) || (previousState == DOWNLOAD_ENGINE_STATE::RECEIVING)) {
        FinishDownload(CFTP_ERROR_TYPE::RESOURCE_ERROR);
    }
    else if ((previousState == DOWNLOAD_ENGINE_STATE::AWAITING_LIST) && m_listCompleteCallback) {
        m_listCompleteCallback(CFTP_ERROR_TYPE::RESOURCE_ERROR, list_entry_vector_t());
    }
}

void DownloadEngine::OnFrameRead(cftp_message_t & message) {
    if (IsFinished()) {
        return;
    }
    const CFTP_MESSAGE_TYPE msgType = message.header.GetMessageType();
    if (msgType == CFTP_MESSAGE_TYPE::ERROR) {
        HandleServerError(message);
        return;
    }
    switch (m_state) {
        case DOWNLOAD_ENGINE_STATE::HANDSHAKE_SENT:
            if (msgType == CFTP_MESSAGE_TYPE::ACK) {
                LOG_DEBUG(subprocess) << "handshake acknowledged";
                m_state = DOWNLOAD_ENGINE_STATE::IDLE;
                StartNextOperation();
                return;
            }
            break;
        case DOWNLOAD_ENGINE_STATE::AWAITING_METADATA:
            if (msgType == CFTP_MESSAGE_TYPE::FILE_METADATA) {
                HandleMetadata(message);
                return;
            }
            break;
        case DOWNLOAD_ENGINE_STATE::RECEIVING:
            if (msgType == CFTP_MESSAGE_TYPE::FILE_DATA) {
                HandleFileData(message);
                return;
            }
            else if (msgType == CFTP_MESSAGE_TYPE::CHECKSUM_VERIFY) {
                HandleChecksumVerify(message);
                return;
            }
            break;
        case DOWNLOAD_ENGINE_STATE::AWAITING_LIST:
            if (msgType == CFTP_MESSAGE_TYPE::LIST_RESPONSE) {
                HandleListResponse(message);
                return;
            }
            break;
        case DOWNLOAD_ENGINE_STATE::CLOSING:
            if (msgType == CFTP_MESSAGE_TYPE::ACK) {
                m_state = DOWNLOAD_ENGINE_STATE::CLOSED;
                return;
            }
            break;
        default:
            break;
    }
    Fail(CFTP_ERROR_TYPE::PROTOCOL_ERROR, std::string("unexpected ") + CftpProtocol::MessageTypeToString(msgType)
        + " in state " + StateToString(m_state));
}

void DownloadEngine::OnChecksumMismatch(cftp_message_t & message, const checksum_field_t & computedChecksum) {
    if (IsFinished()) {
        return;
    }
    const uint32_t chunkNumber = message.header.chunkNumber;
    if ((m_state == DOWNLOAD_ENGINE_STATE::RECEIVING)
        && (message.header.GetMessageType() == CFTP_MESSAGE_TYPE::FILE_DATA)
        && (chunkNumber == m_expectedChunk))
    {
        ++m_numChecksumErrors;
        LOG_WARNING(subprocess) << "checksum mismatch on chunk " << chunkNumber << " of " << m_metadata.filename << ", requesting retransmission";
        error_payload_t error(CFTP_ERROR_TYPE::CHECKSUM_ERROR, "chunk checksum mismatch", chunkNumber);
        error.expectedChecksum = message.header.checksum;
        error.receivedChecksum = computedChecksum;
        m_frameBuilder.GenerateError(m_bytesToSend, error);
        return;
    }
    Fail(CFTP_ERROR_TYPE::FRAME_ERROR, std::string("payload checksum mismatch on ")
        + CftpProtocol::MessageTypeToString(message.header.GetMessageType()), chunkNumber);
}

void DownloadEngine::OnFrameError(CFTP_ERROR_TYPE errorType, const std::string & reason) {
    if (!IsFinished()) {
        Fail(errorType, reason);
    }
}

void DownloadEngine::HandleMetadata(const cftp_message_t & message) {
    file_metadata_payload_t metadata;
    if (!metadata.Deserialize(message.payload.data(), message.payload.size())) {
        Fail(CFTP_ERROR_TYPE::FRAME_ERROR, "malformed FILE_METADATA payload");
        return;
    }
    if ((metadata.chunkSize == 0)
        || (metadata.startChunk != m_currentOperation.startChunk)
        || (metadata.totalChunks != CftpProtocol::GetTotalChunks(metadata.fileSize, metadata.chunkSize))
        || (metadata.startChunk > metadata.totalChunks))
    {
        Fail(CFTP_ERROR_TYPE::PROTOCOL_ERROR, "inconsistent FILE_METADATA for " + metadata.filename);
        return;
    }
    m_metadata = metadata;

    CFTP_ERROR_TYPE prepareResult;
    if (m_sessionPtr) {
        if ((m_sessionPtr->GetChunkSize() != metadata.chunkSize)
            || (m_sessionPtr->GetFileSize() != metadata.fileSize)
            || (m_sessionPtr->GetFileChecksum() != metadata.fileChecksum))
        {
            Fail(CFTP_ERROR_TYPE::PROTOCOL_ERROR, metadata.filename + " changed since the interrupted transfer");
            return;
        }
        prepareResult = m_fileManagerRef.PrepareDownload(m_sessionPtr, metadata.fileSize, metadata.fileChecksum,
            m_sessionPtr->GetFinalFilePath());
    }
    else {
        m_sessionPtr = m_sessionRegistryRef.CreateSession(m_currentOperation.remoteFilename, metadata.chunkSize);
        m_sessionPtr->SetClientId(M_CLIENT_ID);
        prepareResult = m_fileManagerRef.PrepareDownload(m_sessionPtr, metadata.fileSize, metadata.fileChecksum,
            m_currentOperation.localPath, m_currentOperation.resumeSourcePath, metadata.startChunk);
    }
    if (prepareResult != CFTP_ERROR_TYPE::NONE) {
        Fail(prepareResult, "cannot prepare local storage for " + metadata.filename);
        return;
    }
    m_expectedChunk = metadata.startChunk;
    m_state = DOWNLOAD_ENGINE_STATE::RECEIVING;
    LOG_INFO(subprocess) << "receiving " << metadata.filename << ": " << metadata.fileSize << " bytes, "
        << metadata.remainingChunks << " of " << metadata.totalChunks << " chunks of " << metadata.chunkSize << " bytes";
    if (m_downloadProgressCallback) {
        m_downloadProgressCallback(m_currentOperation.remoteFilename, m_sessionPtr->GetProgress());
    }
}

void DownloadEngine::HandleFileData(const cftp_message_t & message) {
    const uint32_t chunkNumber = message.header.chunkNumber;
    if (chunkNumber != m_expectedChunk) {
        Fail(CFTP_ERROR_TYPE::PROTOCOL_ERROR, "received chunk " + std::to_string(chunkNumber)
            + " while expecting chunk " + std::to_string(m_expectedChunk), chunkNumber);
        return;
    }
    const CFTP_ERROR_TYPE writeResult = m_fileManagerRef.WriteChunk(m_sessionPtr, chunkNumber, message.payload.data(), message.payload.size());
    if (writeResult != CFTP_ERROR_TYPE::NONE) {
        Fail(writeResult, "cannot store chunk " + std::to_string(chunkNumber), chunkNumber);
        return;
    }
    m_chunksWritten.push_back(chunkNumber);
    m_frameBuilder.GenerateAck(m_bytesToSend, message.header.sequenceNumber, chunkNumber);
    ++m_expectedChunk;
    if (m_downloadProgressCallback) {
        m_downloadProgressCallback(m_currentOperation.remoteFilename, m_sessionPtr->GetProgress());
    }
}

void DownloadEngine::HandleChecksumVerify(const cftp_message_t & message) {
    checksum_verify_payload_t verify;
    if (!verify.Deserialize(message.payload.data(), message.payload.size())) {
        Fail(CFTP_ERROR_TYPE::FRAME_ERROR, "malformed CHECKSUM_VERIFY payload");
        return;
    }
    if (m_expectedChunk != m_metadata.totalChunks) {
        Fail(CFTP_ERROR_TYPE::PROTOCOL_ERROR, "CHECKSUM_VERIFY before chunk " + std::to_string(m_expectedChunk) + " was sent");
        return;
    }
    if (verify.fileChecksum != m_metadata.fileChecksum) {
        Fail(CFTP_ERROR_TYPE::PROTOCOL_ERROR, "CHECKSUM_VERIFY does not match FILE_METADATA of " + m_metadata.filename);
        return;
    }
    const CFTP_ERROR_TYPE finalizeResult = m_fileManagerRef.Finalize(m_sessionPtr);
    if (finalizeResult == CFTP_ERROR_TYPE::NONE) {
        m_sessionRegistryRef.RemoveSession(m_sessionPtr->GetSessionId());
        FinishDownload(CFTP_ERROR_TYPE::NONE);
    }
    else if (finalizeResult == CFTP_ERROR_TYPE::INTEGRITY_ERROR) {
        //the temp file and the session stay behind, the transfer can be resumed
        m_fileManagerRef.ReleaseSession(m_sessionPtr, false);
        m_sessionPtr->SetStatus(TRANSFER_SESSION_STATUS::FAILED);
        m_frameBuilder.GenerateError(m_bytesToSend, error_payload_t(CFTP_ERROR_TYPE::INTEGRITY_ERROR,
            "whole file digest mismatch for " + m_metadata.filename));
        FinishDownload(CFTP_ERROR_TYPE::INTEGRITY_ERROR);
    }
    else {
        Fail(finalizeResult, "cannot finalize " + m_metadata.filename);
    }
}

void DownloadEngine::HandleListResponse(const cftp_message_t & message) {
    list_response_payload_t response;
    if (!response.Deserialize(message.payload.data(), message.payload.size())) {
        Fail(CFTP_ERROR_TYPE::FRAME_ERROR, "malformed LIST_RESPONSE payload");
        return;
    }
    m_state = DOWNLOAD_ENGINE_STATE::IDLE;
    if (m_listCompleteCallback) {
        m_listCompleteCallback(CFTP_ERROR_TYPE::NONE, response.entries);
    }
    StartNextOperation();
}

void DownloadEngine::HandleServerError(const cftp_message_t & message) {
    error_payload_t error;
    if (!error.Deserialize(message.payload.data(), message.payload.size())) {
        Fail(CFTP_ERROR_TYPE::FRAME_ERROR, "malformed ERROR payload");
        return;
    }
    m_lastError = error.errorType;
    if (CftpProtocol::IsFatal(error.errorType)) {
        LOG_ERROR(subprocess) << "server error " << CftpProtocol::ErrorTypeToString(error.errorType) << ": " << error.message;
        const DOWNLOAD_ENGINE_STATE previousState = m_state;
        m_state = DOWNLOAD_ENGINE_STATE::FAILED;
        m_pendingOperations.clear();
        if ((previousState == DOWNLOAD_ENGINE_STATE::AWAITING_METADATA) || (previousState == DOWNLOAD_ENGINE_STATE::RECEIVING)) {
            FinishDownload(error.errorType);
        }
        else if ((previousState == DOWNLOAD_ENGINE_STATE::AWAITING_LIST) && m_listCompleteCallback) {
            m_listCompleteCallback(error.errorType, list_entry_vector_t());
        }
        return;
    }
    LOG_WARNING(subprocess) << "server reports " << CftpProtocol::ErrorTypeToString(error.errorType) << ": " << error.message;
    if (m_state == DOWNLOAD_ENGINE_STATE::AWAITING_METADATA) {
        FinishDownload(error.errorType);
    }
    else if (m_state == DOWNLOAD_ENGINE_STATE::AWAITING_LIST) {
        m_state = DOWNLOAD_ENGINE_STATE::IDLE;
        if (m_listCompleteCallback) {
            m_listCompleteCallback(error.errorType, list_entry_vector_t());
        }
        StartNextOperation();
    }
}

void DownloadEngine::FinishDownload(CFTP_ERROR_TYPE result) {
    if (result == CFTP_ERROR_TYPE::NONE) {
        LOG_INFO(subprocess) << "downloaded " << m_currentOperation.remoteFilename << " to " << m_sessionPtr->GetFinalFilePath();
    }
    else if ((result != CFTP_ERROR_TYPE::INTEGRITY_ERROR) && m_sessionPtr) {
        m_fileManagerRef.ReleaseSession(m_sessionPtr, true);
        if (m_sessionPtr->GetTempFilePath().empty()) {
            //nothing left to resume from
            m_sessionRegistryRef.RemoveSession(m_sessionPtr->GetSessionId());
        }
    }
    if (m_state != DOWNLOAD_ENGINE_STATE::FAILED) {
        m_state = DOWNLOAD_ENGINE_STATE::IDLE;
    }
    if (m_downloadCompleteCallback) {
        m_downloadCompleteCallback(m_currentOperation.remoteFilename, result);
    }
    StartNextOperation();
}

void DownloadEngine::Fail(CFTP_ERROR_TYPE errorType, const std::string & message, uint32_t chunkNumber) {
    LOG_ERROR(subprocess) << CftpProtocol::ErrorTypeToString(errorType) << ": " << message;
    m_frameBuilder.GenerateError(m_bytesToSend, error_payload_t(errorType, message, chunkNumber));
    m_lastError = errorType;
    const DOWNLOAD_ENGINE_STATE previousState = m_state;
    m_state = DOWNLOAD_ENGINE_STATE::FAILED;
    m_pendingOperations.clear();
    if ((previousState == DOWNLOAD_ENGINE_STATE::AWAITING_METADATA) || (previousState == DOWNLOAD_ENGINE_STATE::RECEIVING)) {
        FinishDownload(errorType);
    }
    else if ((previousState == DOWNLOAD_ENGINE_STATE::AWAITING_LIST) && m_listCompleteCallback) {
        m_listCompleteCallback(errorType, list_entry_vector_t());
    }
}
