/**
 * @file DownloadEngine.h
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
 * The DownloadEngine class is the client half of the protocol, byte driven like
 * the ServerConnectionHandler.  It handshakes on construction, then runs queued
 * operations (download, resume, list, close) one at a time.  Received chunks are
 * verified and written through a FileManager into a temp file; CHECKSUM_VERIFY
 * finalizes the file.  A corrupted chunk is answered with CHECKSUM_ERROR so the
 * server retransmits it.  Download sessions live in a SessionRegistry owned by
 * the caller, so an interrupted download can later be resumed on a new connection
 * from its first missing chunk.
 */

#ifndef DOWNLOAD_ENGINE_H
#define DOWNLOAD_ENGINE_H 1

#include <cstdint>
#include <deque>
#include <string>
#include <vector>
#include <boost/function.hpp>
#include <boost/filesystem/path.hpp>
#include "ConnectionHandler.h"
#include "CftpProtocol.h"
#include "FileManager.h"
#include "SessionRegistry.h"
#include "TransferSession.h"
#include "file_transfer_lib_export.h"

enum class DOWNLOAD_ENGINE_STATE
{
    HANDSHAKE_SENT = 0,
    IDLE,
    AWAITING_METADATA,
    RECEIVING,
    AWAITING_LIST,
    CLOSING,
    CLOSED,
    FAILED
};

class DownloadEngine : public ConnectionHandler {
public:
    /// success is NONE or the error that ended the download
    typedef boost::function<void(const std::string & remoteFilename, CFTP_ERROR_TYPE result)> DownloadCompleteCallback_t;
    typedef boost::function<void(const std::string & remoteFilename, double progress)> DownloadProgressCallback_t;
    typedef boost::function<void(CFTP_ERROR_TYPE result, const list_entry_vector_t & entries)> ListCompleteCallback_t;

    FILE_TRANSFER_LIB_EXPORT DownloadEngine(SessionRegistry & sessionRegistry, FileManager & fileManager,
        const std::string & clientId, uint64_t maxPayloadBytes = CFTP_DEFAULT_MAX_PAYLOAD_BYTES);
    FILE_TRANSFER_LIB_EXPORT virtual ~DownloadEngine();
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    FILE_TRANSFER_LIB_EXPORT void SetDownloadCompleteCallback(const DownloadCompleteCallback_t & callback);
    FILE_TRANSFER_LIB_EXPORT void SetDownloadProgressCallback(const DownloadProgressCallback_t & callback);
    FILE_TRANSFER_LIB_EXPORT void SetListCompleteCallback(const ListCompleteCallback_t & callback);

    /** Queue a download of remoteFilename into localPath.
     * With a non-empty resumeSourcePath (a partial copy of the file holding at
     * least startChunk whole chunks) a RESUME_REQUEST for startChunk is sent
     * instead of a FILE_REQUEST.
     */
    FILE_TRANSFER_LIB_EXPORT void QueueDownload(const std::string & remoteFilename, const boost::filesystem::path & localPath,
        const boost::filesystem::path & resumeSourcePath = boost::filesystem::path(), uint32_t startChunk = 0);

    /// Queue a RESUME_REQUEST that continues an interrupted session from its first missing chunk.
    FILE_TRANSFER_LIB_EXPORT void QueueResume(const TransferSession_ptr & session);

    FILE_TRANSFER_LIB_EXPORT void QueueList(CFTP_LIST_FILTER filter, const std::string & path);
    FILE_TRANSFER_LIB_EXPORT void QueueClose();

    FILE_TRANSFER_LIB_EXPORT virtual void HandleReceivedBytes(const uint8_t * data, std::size_t size) override;
    FILE_TRANSFER_LIB_EXPORT virtual bool TakeBytesToSend(std::vector<uint8_t> & bytesToSend) override;
    FILE_TRANSFER_LIB_EXPORT virtual bool IsFinished() const override;
    FILE_TRANSFER_LIB_EXPORT virtual void OnDisconnect() override;

    FILE_TRANSFER_LIB_EXPORT static const char * StateToString(DOWNLOAD_ENGINE_STATE state);
    DOWNLOAD_ENGINE_STATE GetState() const { return m_state; }
    /// True once handshaken with nothing in progress or queued
    FILE_TRANSFER_LIB_EXPORT bool IsIdle() const;
    CFTP_ERROR_TYPE GetLastError() const { return m_lastError; }
    /// The session of the current (or most recent) download
    const TransferSession_ptr & GetCurrentSession() const { return m_sessionPtr; }
    const file_metadata_payload_t & GetLastMetadata() const { return m_metadata; }
    /// Chunk numbers of every FILE_DATA written, in arrival order
    const std::vector<uint32_t> & GetChunksWritten() const { return m_chunksWritten; }
    uint64_t GetNumChecksumErrors() const { return m_numChecksumErrors; }

private:
    enum class OPERATION_TYPE { DOWNLOAD, RESUME, LIST, CLOSE };
    struct pending_operation_t {
        OPERATION_TYPE type;
        std::string remoteFilename;
        boost::filesystem::path localPath;
        boost::filesystem::path resumeSourcePath;
        uint32_t startChunk;
        TransferSession_ptr session;
        CFTP_LIST_FILTER filter;
        std::string listPath;
    };

    void StartNextOperation();
    void OnFrameRead(cftp_message_t & message);
    void OnChecksumMismatch(cftp_message_t & message, const checksum_field_t & computedChecksum);
    void OnFrameError(CFTP_ERROR_TYPE errorType, const std::string & reason);

    void HandleMetadata(const cftp_message_t & message);
    void HandleFileData(const cftp_message_t & message);
    void HandleChecksumVerify(const cftp_message_t & message);
    void HandleListResponse(const cftp_message_t & message);
    void HandleServerError(const cftp_message_t & message);

    void FinishDownload(CFTP_ERROR_TYPE result);
    /// Reports a local fault to the server and fails the connection
    void Fail(CFTP_ERROR_TYPE errorType, const std::string & message, uint32_t chunkNumber = 0);

private:
    SessionRegistry & m_sessionRegistryRef;
    FileManager & m_fileManagerRef;
    const std::string M_CLIENT_ID;

    CftpFrameReader m_frameReader;
    CftpFrameBuilder m_frameBuilder;
    std::vector<uint8_t> m_bytesToSend;

    DOWNLOAD_ENGINE_STATE m_state;
    std::deque<pending_operation_t> m_pendingOperations;
    pending_operation_t m_currentOperation;
    TransferSession_ptr m_sessionPtr;
    file_metadata_payload_t m_metadata;
    uint32_t m_expectedChunk;
    CFTP_ERROR_TYPE m_lastError;
    std::vector<uint32_t> m_chunksWritten;
    uint64_t m_numChecksumErrors;

    DownloadCompleteCallback_t m_downloadCompleteCallback;
    DownloadProgressCallback_t m_downloadProgressCallback;
    ListCompleteCallback_t m_listCompleteCallback;
};

#endif //DOWNLOAD_ENGINE_H
