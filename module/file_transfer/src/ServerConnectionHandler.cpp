/**
 * @file ServerConnectionHandler.cpp
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

#include "ServerConnectionHandler.h"
#include "Logger.h"
#include <algorithm>
#include <boost/bind/bind.hpp>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::protocol;

ConnectionHandler::~ConnectionHandler() {}

static DIGEST_ALGORITHM GetDigestAlgorithm(ServerContext & serverContext) {
    return serverContext.GetFileManager().GetDigestAlgorithm();
}

ServerConnectionHandler::ServerConnectionHandler(ServerContext & serverContext, const std::string & connectionName) :
    m_serverContextRef(serverContext),
    M_CONNECTION_NAME(connectionName),
    M_MAX_SENDS_PER_CHUNK(1 + serverContext.GetConfig().m_maxRetries),
    m_frameReader(GetDigestAlgorithm(serverContext), serverContext.GetConfig().m_maxPayloadBytes),
    m_frameBuilder(GetDigestAlgorithm(serverContext)),
    m_state(SERVER_CONNECTION_STATE::INIT),
    m_closeRequested(false),
    m_currentChunk(0),
    m_numSendsOfCurrentChunk(0),
    m_currentChunkSequenceNumber(0),
    m_numChunksSent(0),
    m_numRetransmissions(0),
    m_numTransfersCompleted(0)
{
    m_frameReader.SetFrameReadCallback(boost::bind(&ServerConnectionHandler::OnFrameRead, this, boost::placeholders::_1));
    m_frameReader.SetChecksumMismatchCallback(boost::bind(&ServerConnectionHandler::OnChecksumMismatch, this,
        boost::placeholders::_1, boost::placeholders::_2));
    m_frameReader.SetFrameErrorCallback(boost::bind(&ServerConnectionHandler::OnFrameError, this,
        boost::placeholders::_1, boost::placeholders::_2));
}

ServerConnectionHandler::~ServerConnectionHandler() {
    DropSession(m_state == SERVER_CONNECTION_STATE::TRANSFERRING);
}

const char * ServerConnectionHandler::StateToString(SERVER_CONNECTION_STATE state) {
    switch (state) {
        case SERVER_CONNECTION_STATE::INIT: return "INIT";
        case SERVER_CONNECTION_STATE::HANDSHAKEN: return "HANDSHAKEN";
        case SERVER_CONNECTION_STATE::TRANSFERRING: return "TRANSFERRING";
        case SERVER_CONNECTION_STATE::COMPLETE: return "COMPLETE";
        case SERVER_CONNECTION_STATE::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

void ServerConnectionHandler::HandleReceivedBytes(const uint8_t * data, std::size_t size) {
    if (!IsFinished()) {
        m_frameReader.HandleReceivedChars(data, size);
    }
}

bool ServerConnectionHandler::TakeBytesToSend(std::vector<uint8_t> & bytesToSend) {
    bytesToSend.clear();
    bytesToSend.swap(m_bytesToSend);
    return !bytesToSend.empty();
}

bool ServerConnectionHandler::IsFinished() const {
    return (m_state == SERVER_CONNECTION_STATE::ERROR) || m_closeRequested;
}

void ServerConnectionHandler::OnDisconnect() {
    if (m_sessionPtr) {
        LOG_INFO(subprocess) << M_CONNECTION_NAME << ": disconnected in state " << StateToString(m_state)
            << ", dropping session " << m_sessionPtr->GetSessionId();
    }
    DropSession(m_state == SERVER_CONNECTION_STATE::TRANSFERRING);
}

void ServerConnectionHandler::OnFrameRead(cftp_message_t & message) {
    if (IsFinished()) { //frames pipelined behind a CLOSE or a fatal error
        return;
    }
    const CFTP_MESSAGE_TYPE msgType = message.header.GetMessageType();
    LOG_TRACE(subprocess) << M_CONNECTION_NAME << ": rx " << CftpProtocol::MessageTypeToString(msgType)
        << " seq=" << message.header.sequenceNumber << " chunk=" << message.header.chunkNumber
        << " in " << StateToString(m_state);

    if ((m_state == SERVER_CONNECTION_STATE::TRANSFERRING) && (m_sessionPtr->GetStatus() == TRANSFER_SESSION_STATUS::EXPIRED)) {
        ReportError(CFTP_ERROR_TYPE::SESSION_EXPIRED, "session " + m_sessionPtr->GetSessionId() + " expired", m_currentChunk);
        return;
    }
    if ((msgType == CFTP_MESSAGE_TYPE::CLOSE) && (m_state != SERVER_CONNECTION_STATE::ERROR)) {
        HandleClose(message);
        return;
    }

    switch (m_state) {
        case SERVER_CONNECTION_STATE::INIT:
            if (msgType == CFTP_MESSAGE_TYPE::HANDSHAKE) {
                HandleHandshake(message);
                return;
            }
            break;
        case SERVER_CONNECTION_STATE::HANDSHAKEN:
        case SERVER_CONNECTION_STATE::COMPLETE:
            if (msgType == CFTP_MESSAGE_TYPE::FILE_REQUEST) {
                file_request_payload_t request;
                if (!request.Deserialize(message.payload.data(), message.payload.size())) {
                    ReportError(CFTP_ERROR_TYPE::FRAME_ERROR, "malformed FILE_REQUEST payload");
                    return;
                }
                HandleTransferRequest(request.filename, 0, false);
                return;
            }
            else if (msgType == CFTP_MESSAGE_TYPE::RESUME_REQUEST) {
                resume_request_payload_t request;
                if (!request.Deserialize(message.payload.data(), message.payload.size())) {
                    ReportError(CFTP_ERROR_TYPE::FRAME_ERROR, "malformed RESUME_REQUEST payload");
                    return;
                }
                HandleTransferRequest(request.filename, request.startChunk, true);
                return;
            }
            else if (msgType == CFTP_MESSAGE_TYPE::LIST_REQUEST) {
                HandleListRequest(message);
                return;
            }
            else if (msgType == CFTP_MESSAGE_TYPE::ERROR) {
                HandlePeerError(message);
                return;
            }
            break;
        case SERVER_CONNECTION_STATE::TRANSFERRING:
            if (msgType == CFTP_MESSAGE_TYPE::ACK) {
                HandleAck(message);
                return;
            }
            else if (msgType == CFTP_MESSAGE_TYPE::ERROR) {
                HandlePeerError(message);
                return;
            }
            break;
        case SERVER_CONNECTION_STATE::ERROR:
            break;
    }
    ReportError(CFTP_ERROR_TYPE::PROTOCOL_ERROR, std::string("unexpected ") + CftpProtocol::MessageTypeToString(msgType)
        + " in state " + StateToString(m_state));
}

void ServerConnectionHandler::OnChecksumMismatch(cftp_message_t & message, const checksum_field_t & computedChecksum) {
    if (IsFinished()) {
        return;
    }
    //nothing a client sends is retransmittable, so a corrupted client frame is a frame error
    error_payload_t error(CFTP_ERROR_TYPE::FRAME_ERROR, "payload checksum mismatch", message.header.chunkNumber);
    error.expectedChecksum = message.header.checksum;
    error.receivedChecksum = computedChecksum;
    LOG_ERROR(subprocess) << M_CONNECTION_NAME << ": checksum mismatch on received "
        << CftpProtocol::MessageTypeToString(message.header.GetMessageType());
    SendError(error);
    EnterErrorState();
}

void ServerConnectionHandler::OnFrameError(CFTP_ERROR_TYPE errorType, const std::string & reason) {
    if (IsFinished()) {
        return;
    }
    ReportError(errorType, reason);
}

void ServerConnectionHandler::HandleHandshake(const cftp_message_t & message) {
    handshake_payload_t handshake;
    if (!handshake.Deserialize(message.payload.data(), message.payload.size())) {
        ReportError(CFTP_ERROR_TYPE::FRAME_ERROR, "malformed HANDSHAKE payload");
        return;
    }
    if (handshake.version != CFTP_PROTOCOL_VERSION) {
        ReportError(CFTP_ERROR_TYPE::UNSUPPORTED_VERSION, "unsupported protocol version " + std::to_string(handshake.version));
        return;
    }
    m_clientId = handshake.clientId;
    m_frameBuilder.GenerateAck(m_bytesToSend, message.header.sequenceNumber, 0);
    m_state = SERVER_CONNECTION_STATE::HANDSHAKEN;
    LOG_INFO(subprocess) << M_CONNECTION_NAME << ": handshake from client " << m_clientId;
}

void ServerConnectionHandler::HandleTransferRequest(const std::string & filename, uint32_t startChunk, bool isResume) {
    FileManager & fileManager = m_serverContextRef.GetFileManager();
    SessionRegistry & sessionRegistry = m_serverContextRef.GetSessionRegistry();

    TransferSession_ptr session = sessionRegistry.CreateSession(filename, m_serverContextRef.GetConfig().m_chunkSize);
    session->SetClientId(m_clientId);
    const CFTP_ERROR_TYPE openResult = fileManager.OpenSourceFile(session);
    if (openResult != CFTP_ERROR_TYPE::NONE) {
        sessionRegistry.RemoveSession(session->GetSessionId());
        ReportError(openResult, (openResult == CFTP_ERROR_TYPE::NOT_FOUND) ? ("file not found: " + filename) : ("cannot open " + filename));
        return;
    }
    const uint32_t totalChunks = session->GetTotalChunks();
    if (startChunk > totalChunks) {
        sessionRegistry.RemoveSession(session->GetSessionId());
        ReportError(CFTP_ERROR_TYPE::INVALID_RANGE, "start chunk " + std::to_string(startChunk)
            + " beyond " + std::to_string(totalChunks) + " chunks of " + filename, startChunk);
        return;
    }

    file_metadata_payload_t metadata;
    metadata.fileSize = session->GetFileSize();
    metadata.totalChunks = totalChunks;
    metadata.chunkSize = session->GetChunkSize();
    metadata.startChunk = startChunk;
    metadata.remainingSize = metadata.fileSize - std::min<uint64_t>(metadata.fileSize, static_cast<uint64_t>(startChunk) * metadata.chunkSize);
    metadata.remainingChunks = totalChunks - startChunk;
    metadata.fileChecksum = session->GetFileChecksum();
    metadata.filename = filename;
    if (!m_frameBuilder.GenerateFileMetadata(m_bytesToSend, metadata)) {
        sessionRegistry.RemoveSession(session->GetSessionId());
        ReportError(CFTP_ERROR_TYPE::RESOURCE_ERROR, "cannot encode FILE_METADATA");
        return;
    }

    m_sessionPtr = session;
    session->SetStatus(TRANSFER_SESSION_STATUS::TRANSFERRING);
    m_state = SERVER_CONNECTION_STATE::TRANSFERRING;
    m_currentChunk = startChunk;
    m_numSendsOfCurrentChunk = 0;
    LOG_INFO(subprocess) << M_CONNECTION_NAME << ": " << (isResume ? "resuming " : "sending ") << filename
        << " (" << metadata.fileSize << " bytes, chunks " << startChunk << ".." << totalChunks << " of " << totalChunks << ")";

    if (metadata.remainingChunks == 0) {
        CompleteTransfer();
    }
    else {
        SendCurrentChunk();
    }
}

void ServerConnectionHandler::HandleListRequest(const cftp_message_t & message) {
    list_request_payload_t request;
    if (!request.Deserialize(message.payload.data(), message.payload.size())) {
        ReportError(CFTP_ERROR_TYPE::FRAME_ERROR, "malformed LIST_REQUEST payload");
        return;
    }
    list_entry_vector_t entries;
    const CFTP_ERROR_TYPE listResult = m_serverContextRef.GetFileManager().List(request.path, request.filter, entries);
    if (listResult != CFTP_ERROR_TYPE::NONE) {
        ReportError(listResult, "cannot list \"" + request.path + "\"");
        return;
    }
    if (!m_frameBuilder.GenerateListResponse(m_bytesToSend, entries)) {
        ReportError(CFTP_ERROR_TYPE::RESOURCE_ERROR, "cannot encode LIST_RESPONSE");
        return;
    }
    LOG_DEBUG(subprocess) << M_CONNECTION_NAME << ": listed " << entries.size() << " entries of \"" << request.path << "\"";
}

void ServerConnectionHandler::HandleAck(const cftp_message_t & message) {
    ack_payload_t ack;
    if (!ack.Deserialize(message.payload.data(), message.payload.size())) {
        ReportError(CFTP_ERROR_TYPE::FRAME_ERROR, "malformed ACK payload", m_currentChunk);
        return;
    }
    if ((message.header.chunkNumber != m_currentChunk) || (ack.acknowledgedSequenceNumber != m_currentChunkSequenceNumber)) {
        ReportError(CFTP_ERROR_TYPE::PROTOCOL_ERROR, "ACK for chunk " + std::to_string(message.header.chunkNumber)
            + " while chunk " + std::to_string(m_currentChunk) + " is outstanding", m_currentChunk);
        return;
    }
    m_sessionPtr->MarkChunkReceived(m_currentChunk);
    m_sessionPtr->Touch();
    ++m_currentChunk;
    m_numSendsOfCurrentChunk = 0;
    if (m_currentChunk == m_sessionPtr->GetTotalChunks()) {
        CompleteTransfer();
    }
    else {
        SendCurrentChunk();
    }
}

void ServerConnectionHandler::HandlePeerError(const cftp_message_t & message) {
    error_payload_t error;
    if (!error.Deserialize(message.payload.data(), message.payload.size())) {
        ReportError(CFTP_ERROR_TYPE::FRAME_ERROR, "malformed ERROR payload");
        return;
    }
    if ((m_state == SERVER_CONNECTION_STATE::TRANSFERRING) && (error.errorType == CFTP_ERROR_TYPE::CHECKSUM_ERROR)) {
        if (error.chunkNumber != m_currentChunk) {
            ReportError(CFTP_ERROR_TYPE::PROTOCOL_ERROR, "CHECKSUM_ERROR for chunk " + std::to_string(error.chunkNumber)
                + " while chunk " + std::to_string(m_currentChunk) + " is outstanding", m_currentChunk);
            return;
        }
        if (m_numSendsOfCurrentChunk >= M_MAX_SENDS_PER_CHUNK) {
            ReportError(CFTP_ERROR_TYPE::RETRY_EXHAUSTED, "chunk " + std::to_string(m_currentChunk) + " failed after "
                + std::to_string(m_numSendsOfCurrentChunk) + " sends", m_currentChunk);
            return;
        }
        LOG_WARNING(subprocess) << M_CONNECTION_NAME << ": client reports checksum error on chunk " << m_currentChunk
            << ", retransmitting (send " << (m_numSendsOfCurrentChunk + 1) << " of " << M_MAX_SENDS_PER_CHUNK << ")";
        ++m_numRetransmissions;
        SendCurrentChunk();
        return;
    }
    if (CftpProtocol::IsFatal(error.errorType)) {
        LOG_ERROR(subprocess) << M_CONNECTION_NAME << ": client reports fatal " << CftpProtocol::ErrorTypeToString(error.errorType)
            << ": " << error.message;
        EnterErrorState();
        return;
    }
    LOG_WARNING(subprocess) << M_CONNECTION_NAME << ": client reports " << CftpProtocol::ErrorTypeToString(error.errorType)
        << " (chunk " << error.chunkNumber << "): " << error.message;
}

void ServerConnectionHandler::HandleClose(const cftp_message_t & message) {
    m_frameBuilder.GenerateAck(m_bytesToSend, message.header.sequenceNumber, 0);
    DropSession(m_state == SERVER_CONNECTION_STATE::TRANSFERRING);
    m_closeRequested = true;
    LOG_INFO(subprocess) << M_CONNECTION_NAME << ": client " << m_clientId << " closed the connection";
}

void ServerConnectionHandler::SendCurrentChunk() {
    const CFTP_ERROR_TYPE readResult = m_serverContextRef.GetFileManager().ReadChunk(m_sessionPtr, m_currentChunk, m_chunkBuffer);
    if (readResult != CFTP_ERROR_TYPE::NONE) {
        //the file was opened and validated by this handler, so a failed read is a storage fault
        ReportError(CFTP_ERROR_TYPE::RESOURCE_ERROR, "cannot read chunk " + std::to_string(m_currentChunk), m_currentChunk);
        return;
    }
    m_currentChunkSequenceNumber = m_frameBuilder.GetNextSequenceNumber();
    if (!m_frameBuilder.GenerateFileData(m_bytesToSend, m_currentChunk, m_chunkBuffer.data(), m_chunkBuffer.size())) {
        ReportError(CFTP_ERROR_TYPE::RESOURCE_ERROR, "cannot encode FILE_DATA", m_currentChunk);
        return;
    }
    ++m_numSendsOfCurrentChunk;
    ++m_numChunksSent;
}

void ServerConnectionHandler::CompleteTransfer() {
    m_frameBuilder.GenerateChecksumVerify(m_bytesToSend, m_sessionPtr->GetFileChecksum());
    m_sessionPtr->SetStatus(TRANSFER_SESSION_STATUS::COMPLETED);
    LOG_INFO(subprocess) << M_CONNECTION_NAME << ": sent " << m_sessionPtr->GetFilename() << " to client " << m_clientId;
    DropSession(false);
    ++m_numTransfersCompleted;
    m_state = SERVER_CONNECTION_STATE::COMPLETE;
}

void ServerConnectionHandler::SendError(const error_payload_t & error) {
    if (!m_frameBuilder.GenerateError(m_bytesToSend, error)) {
        LOG_ERROR(subprocess) << M_CONNECTION_NAME << ": cannot encode ERROR " << CftpProtocol::ErrorTypeToString(error.errorType);
    }
}

void ServerConnectionHandler::ReportError(CFTP_ERROR_TYPE errorType, const std::string & message, uint32_t chunkNumber) {
    const bool isFatal = CftpProtocol::IsFatal(errorType);
    if (isFatal) {
        LOG_ERROR(subprocess) << M_CONNECTION_NAME << ": " << CftpProtocol::ErrorTypeToString(errorType) << ": " << message;
    }
    else {
        LOG_INFO(subprocess) << M_CONNECTION_NAME << ": " << CftpProtocol::ErrorTypeToString(errorType) << ": " << message;
    }
    SendError(error_payload_t(errorType, message, chunkNumber));
    if (isFatal) {
        EnterErrorState();
    }
}

void ServerConnectionHandler::EnterErrorState() {
    DropSession(true);
    m_state = SERVER_CONNECTION_STATE::ERROR;
}

void ServerConnectionHandler::DropSession(bool transferFailed) {
    if (m_sessionPtr) {
        m_serverContextRef.GetFileManager().ReleaseSession(m_sessionPtr, transferFailed);
        m_serverContextRef.GetSessionRegistry().RemoveSession(m_sessionPtr->GetSessionId());
        m_sessionPtr.reset();
    }
}
