/**
 * @file TcpFileTransferClient.h
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
 * The TcpFileTransferClient class is a blocking CFTP client.  Each call runs a
 * DownloadEngine over a TCP socket until the requested operation completes.
 * Download sessions are kept in a SessionRegistry owned by this object,
 * so a download interrupted by a lost connection can be resumed after Connect()
 * is called again.
 */

#ifndef TCP_FILE_TRANSFER_CLIENT_H
#define TCP_FILE_TRANSFER_CLIENT_H 1

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/function.hpp>
#include "CftpProtocol.h"
#include "ContentDigest.h"
#include "DownloadEngine.h"
#include "FileManager.h"
#include "SessionRegistry.h"
#include "transfer_client_lib_export.h"

class TcpFileTransferClient {
public:
    /**
     * @param saveDir Relative local paths are resolved against this directory.
     * @param tempDir Partially downloaded files live here until finalized.
     */
    TRANSFER_CLIENT_LIB_EXPORT TcpFileTransferClient(const boost::filesystem::path & saveDir,
        const boost::filesystem::path & tempDir,
        DIGEST_ALGORITHM digestAlgorithm = DIGEST_ALGORITHM::MD5,
        bool preserveTempOnError = true,
        uint64_t maxPayloadBytes = CFTP_DEFAULT_MAX_PAYLOAD_BYTES);
    TRANSFER_CLIENT_LIB_EXPORT ~TcpFileTransferClient();
    TcpFileTransferClient(const TcpFileTransferClient&) = delete;
    TcpFileTransferClient& operator=(const TcpFileTransferClient&) = delete;

    /// Creates the save and temp directories
    TRANSFER_CLIENT_LIB_EXPORT bool Init();

    /** Connect and complete the HANDSHAKE.
     *
     * @return True once the server has acknowledged the handshake.
     */
    TRANSFER_CLIENT_LIB_EXPORT bool Connect(const std::string & host, uint16_t port, const std::string & clientId);
    /// Send CLOSE, wait for its ACK, then close the socket.
    TRANSFER_CLIENT_LIB_EXPORT bool Close();
    /// Drop the connection without a CLOSE
    TRANSFER_CLIENT_LIB_EXPORT void Disconnect();
    TRANSFER_CLIENT_LIB_EXPORT bool IsConnected() const;

    /** Download remoteFilename to localPath (relative paths go under the save directory).
     * With a non-empty resumeSourcePath, the first startChunk chunks are taken from
     * that partial file and only the rest is requested.
     *
     * @return NONE on success, otherwise the error that ended the download.
     */
    TRANSFER_CLIENT_LIB_EXPORT CFTP_ERROR_TYPE DownloadFile(const std::string & remoteFilename, const boost::filesystem::path & localPath,
        const boost::filesystem::path & resumeSourcePath = boost::filesystem::path(), uint32_t startChunk = 0);

    /// Continue an interrupted download session from its first missing chunk.
    TRANSFER_CLIENT_LIB_EXPORT CFTP_ERROR_TYPE ResumeDownload(const TransferSession_ptr & session);

    TRANSFER_CLIENT_LIB_EXPORT CFTP_ERROR_TYPE ListFiles(CFTP_LIST_FILTER filter, const std::string & path, list_entry_vector_t & entries);

    TRANSFER_CLIENT_LIB_EXPORT void SetDownloadProgressCallback(const DownloadEngine::DownloadProgressCallback_t & callback);
    /// Give up on an operation when the server sends nothing for this long (default 30 s)
    TRANSFER_CLIENT_LIB_EXPORT void SetIdleTimeoutMilliseconds(int timeoutMilliseconds);
    /// Keep a copy of every byte received from the server (see GetReceivedBytes())
    TRANSFER_CLIENT_LIB_EXPORT void SetRecordReceivedBytes(bool record);
    const std::vector<uint8_t> & GetReceivedBytes() const { return m_receivedBytes; }

    SessionRegistry & GetSessionRegistry() { return m_sessionRegistry; }
    FileManager & GetFileManager() { return m_fileManager; }
    /// The session of the most recent download (NULL if none)
    const TransferSession_ptr & GetLastSession() const { return m_lastSessionPtr; }
    /// The engine of the current connection (NULL if never connected)
    const DownloadEngine * GetDownloadEngine() const { return m_downloadEnginePtr.get(); }
    TRANSFER_CLIENT_LIB_EXPORT boost::filesystem::path ResolveLocalPath(const boost::filesystem::path & localPath) const;

private:
    /// Exchange bytes until isDone() holds (true), or the engine fails or the connection is lost (false).
    bool RunUntil(const boost::function<bool()> & isDone);
    bool IsHandshakeDone() const;
    bool IsOperationDone() const;
    bool IsEngineFinished() const;
    void OnDownloadComplete(const std::string & remoteFilename, CFTP_ERROR_TYPE result);
    void OnListComplete(CFTP_ERROR_TYPE result, const list_entry_vector_t & entries);
    void DisconnectEngine();

private:
    const boost::filesystem::path M_SAVE_DIR;
    SessionRegistry m_sessionRegistry;
    FileManager m_fileManager;
    const uint64_t M_MAX_PAYLOAD_BYTES;

    boost::asio::io_service m_ioService;
    boost::asio::ip::tcp::socket m_tcpSocket;
    std::unique_ptr<DownloadEngine> m_downloadEnginePtr;
    DownloadEngine::DownloadProgressCallback_t m_downloadProgressCallback;
    int m_idleTimeoutMilliseconds;

    bool m_operationDone;
    CFTP_ERROR_TYPE m_operationResult;
    list_entry_vector_t m_listEntries;
    TransferSession_ptr m_lastSessionPtr;

    bool m_recordReceivedBytes;
    std::vector<uint8_t> m_receivedBytes;
    std::vector<uint8_t> m_readBuffer;
    std::vector<uint8_t> m_bytesToSend;
};

#endif //TCP_FILE_TRANSFER_CLIENT_H
