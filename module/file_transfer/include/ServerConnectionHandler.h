/**
 * @file ServerConnectionHandler.h
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
 * The ServerConnectionHandler class is the per-connection protocol state machine
 * of the serving side:  INIT -> HANDSHAKEN -> TRANSFERRING -> COMPLETE, with ERROR
 * reachable from any state and terminal.  File data is sent stop-and-wait, one
 * chunk outstanding until its ACK (or a CHECKSUM_ERROR, which retransmits the
 * same chunk up to the configured retry budget).  A finished transfer is closed
 * with CHECKSUM_VERIFY, after which the connection accepts new requests.
 */

#ifndef SERVER_CONNECTION_HANDLER_H
#define SERVER_CONNECTION_HANDLER_H 1

#include <string>
#include <vector>
#include <cstdint>
#include "ConnectionHandler.h"
#include "CftpProtocol.h"
#include "ServerContext.h"
#include "TransferSession.h"
#include "file_transfer_lib_export.h"

enum class SERVER_CONNECTION_STATE
{
    INIT = 0,
    HANDSHAKEN,
    TRANSFERRING,
    COMPLETE,
    ERROR
};

class ServerConnectionHandler : public ConnectionHandler {
public:
    FILE_TRANSFER_LIB_EXPORT ServerConnectionHandler(ServerContext & serverContext, const std::string & connectionName);
    FILE_TRANSFER_LIB_EXPORT virtual ~ServerConnectionHandler();
    ServerConnectionHandler(const ServerConnectionHandler&) = delete;
    ServerConnectionHandler& operator=(const ServerConnectionHandler&) = delete;

    FILE_TRANSFER_LIB_EXPORT virtual void HandleReceivedBytes(const uint8_t * data, std::size_t size) override;
    FILE_TRANSFER_LIB_EXPORT virtual bool TakeBytesToSend(std::vector<uint8_t> & bytesToSend) override;
    FILE_TRANSFER_LIB_EXPORT virtual bool IsFinished() const override;
    FILE_TRANSFER_LIB_EXPORT virtual void OnDisconnect() override;

    FILE_TRANSFER_LIB_EXPORT static const char * StateToString(SERVER_CONNECTION_STATE state);
    SERVER_CONNECTION_STATE GetState() const { return m_state; }
    const std::string & GetClientId() const { return m_clientId; }
    uint64_t GetNumChunksSent() const { return m_numChunksSent; }
    uint64_t GetNumRetransmissions() const { return m_numRetransmissions; }
    uint64_t GetNumTransfersCompleted() const { return m_numTransfersCompleted; }

private:
    void OnFrameRead(cftp_message_t & message);
    void OnChecksumMismatch(cftp_message_t & message, const checksum_field_t & computedChecksum);
    void OnFrameError(CFTP_ERROR_TYPE errorType, const std::string & reason);

    void HandleHandshake(const cftp_message_t & message);
    void HandleTransferRequest(const std::string & filename, uint32_t startChunk, bool isResume);
    void HandleListRequest(const cftp_message_t & message);
    void HandleAck(const cftp_message_t & message);
    void HandlePeerError(const cftp_message_t & message);
    void HandleClose(const cftp_message_t & message);

    void SendCurrentChunk();
    void CompleteTransfer();
    void SendError(const error_payload_t & error);
    /// Sends the error, then closes the connection when the error is fatal
    void ReportError(CFTP_ERROR_TYPE errorType, const std::string & message, uint32_t chunkNumber = 0);
    void EnterErrorState();
    void DropSession(bool transferFailed);

private:
    ServerContext & m_serverContextRef;
    const std::string M_CONNECTION_NAME;
    const uint32_t M_MAX_SENDS_PER_CHUNK;

    CftpFrameReader m_frameReader;
    CftpFrameBuilder m_frameBuilder;
    std::vector<uint8_t> m_bytesToSend;
    std::vector<uint8_t> m_chunkBuffer;

    SERVER_CONNECTION_STATE m_state;
    bool m_closeRequested;
    std::string m_clientId;
    TransferSession_ptr m_sessionPtr;
    uint32_t m_currentChunk;
    uint32_t m_numSendsOfCurrentChunk;
    uint32_t m_currentChunkSequenceNumber;

    uint64_t m_numChunksSent;
    uint64_t m_numRetransmissions;
    uint64_t m_numTransfersCompleted;
};

#endif //SERVER_CONNECTION_HANDLER_H
