/**
 * @file TcpFileTransferClient.cpp
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

#include "TcpFileTransferClient.h"
#include "Logger.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>
#include <boost/lexical_cast.hpp>
#include <poll.h>
#include <cerrno>
#include <cstring>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::client;

TcpFileTransferClient::TcpFileTransferClient(const boost::filesystem::path & saveDir,
    const boost::filesystem::path & tempDir,
    DIGEST_ALGORITHM digestAlgorithm,
    bool preserveTempOnError,
    uint64_t maxPayloadBytes) :
    M_SAVE_DIR(saveDir),
    m_sessionRegistry(),
    m_fileManager(m_sessionRegistry, saveDir, tempDir, digestAlgorithm, false, preserveTempOnError),
    M_MAX_PAYLOAD_BYTES(maxPayloadBytes),
    m_ioService(),
    m_tcpSocket(m_ioService),
    m_idleTimeoutMilliseconds(30000),
    m_operationDone(false),
    m_operationResult(CFTP_ERROR_TYPE::NONE),
    m_recordReceivedBytes(false),
    m_readBuffer(65536)
{
}

TcpFileTransferClient::~TcpFileTransferClient() {
    DisconnectEngine();
}

bool TcpFileTransferClient::Init() {
    return m_fileManager.Init();
}

void TcpFileTransferClient::SetDownloadProgressCallback(const DownloadEngine::DownloadProgressCallback_t & callback) {
    m_downloadProgressCallback = callback;
    if (m_downloadEnginePtr) {
        m_downloadEnginePtr->SetDownloadProgressCallback(callback);
    }
}

void TcpFileTransferClient::SetIdleTimeoutMilliseconds(int timeoutMilliseconds) {
    m_idleTimeoutMilliseconds = timeoutMilliseconds;
}

void TcpFileTransferClient::SetRecordReceivedBytes(bool record) {
    m_recordReceivedBytes = record;
}

boost::filesystem::path TcpFileTransferClient::ResolveLocalPath(const boost::filesystem::path & localPath) const {
    if (localPath.is_absolute()) {
        return localPath;
    }
    return M_SAVE_DIR / localPath;
}

bool TcpFileTransferClient::Connect(const std::string & host, uint16_t port, const std::string & clientId) {
    if (m_tcpSocket.is_open()) {
        LOG_INFO(subprocess) << "dropping the previous connection before connecting to " << host << ":" << port;
        DisconnectEngine();
    }
    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(m_ioService);
    const boost::asio::ip::tcp::resolver::results_type results =
        resolver.resolve(boost::asio::ip::tcp::v4(), host, boost::lexical_cast<std::string>(port), ec);
    if (ec) {
        LOG_ERROR(subprocess) << "unable to resolve " << host << ": " << ec.message();
        return false;
    }
    boost::asio::connect(m_tcpSocket, results, ec);
    if (ec) {
        LOG_ERROR(subprocess) << "unable to connect to " << host << ":" << port << ": " << ec.message();
        boost::system::error_code ecClose;
        m_tcpSocket.close(ecClose);
        return false;
    }
    m_receivedBytes.clear();
    m_downloadEnginePtr = boost::make_unique<DownloadEngine>(m_sessionRegistry, m_fileManager, clientId, M_MAX_PAYLOAD_BYTES);
    m_downloadEnginePtr->SetDownloadCompleteCallback(boost::bind(&TcpFileTransferClient::OnDownloadComplete, this,
        boost::placeholders::_1, boost::placeholders::_2));
    m_downloadEnginePtr->SetListCompleteCallback(boost::bind(&TcpFileTransferClient::OnListComplete, this,
        boost::placeholders::_1, boost::placeholders::_2));
    if (m_downloadProgressCallback) {
        m_downloadEnginePtr->SetDownloadProgressCallback(m_downloadProgressCallback);
    }
    if (!RunUntil(boost::bind(&TcpFileTransferClient::IsHandshakeDone, this))) {
        LOG_ERROR(subprocess) << "handshake with " << host << ":" << port << " failed: "
            << CftpProtocol::ErrorTypeToString(m_downloadEnginePtr->GetLastError());
        DisconnectEngine();
        return false;
    }
    LOG_INFO(subprocess) << "connected to " << host << ":" << port << " as " << clientId;
    return true;
}

bool TcpFileTransferClient::IsConnected() const {
    return m_tcpSocket.is_open() && m_downloadEnginePtr && (!m_downloadEnginePtr->IsFinished());
}

bool TcpFileTransferClient::Close() {
    if (!IsConnected()) {
        return false;
    }
    m_downloadEnginePtr->QueueClose();
    RunUntil(boost::bind(&TcpFileTransferClient::IsEngineFinished, this));
    const bool closedCleanly = (m_downloadEnginePtr->GetState() == DOWNLOAD_ENGINE_STATE::CLOSED);
    DisconnectEngine();
    if (!closedCleanly) {
        LOG_WARNING(subprocess) << "connection ended without a CLOSE acknowledgement";
    }
    return closedCleanly;
}

void TcpFileTransferClient::Disconnect() {
    DisconnectEngine();
}

void TcpFileTransferClient::DisconnectEngine() {
    if (m_tcpSocket.is_open()) {
        boost::system::error_code ec;
        m_tcpSocket.shutdown(boost::asio::socket_base::shutdown_both, ec);
        m_tcpSocket.close(ec);
        if (ec) {
            LOG_ERROR(subprocess) << "error closing tcp socket: " << ec.message();
        }
    }
    if (m_downloadEnginePtr) {
        m_downloadEnginePtr->OnDisconnect();
    }
}

CFTP_ERROR_TYPE TcpFileTransferClient::DownloadFile(const std::string & remoteFilename, const boost::filesystem::path & localPath,
    const boost::filesystem::path & resumeSourcePath, uint32_t startChunk)
{
    if (!IsConnected()) {
        LOG_ERROR(subprocess) << "cannot download " << remoteFilename << ": not connected";
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    m_operationDone = false;
    m_operationResult = CFTP_ERROR_TYPE::NONE;
    m_downloadEnginePtr->QueueDownload(remoteFilename, ResolveLocalPath(localPath), resumeSourcePath, startChunk);
    RunUntil(boost::bind(&TcpFileTransferClient::IsOperationDone, this));
    m_lastSessionPtr = m_downloadEnginePtr->GetCurrentSession();
    if (!m_operationDone) {
        m_operationResult = CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    if (m_downloadEnginePtr->IsFinished()) {
        DisconnectEngine();
    }
    return m_operationResult;
}

CFTP_ERROR_TYPE TcpFileTransferClient::ResumeDownload(const TransferSession_ptr & session) {
    if (!session) {
        return CFTP_ERROR_TYPE::SESSION_EXPIRED;
    }
    if (!IsConnected()) {
        LOG_ERROR(subprocess) << "cannot resume " << session->GetFilename() << ": not connected";
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    m_operationDone = false;
    m_operationResult = CFTP_ERROR_TYPE::NONE;
    m_downloadEnginePtr->QueueResume(session);
    RunUntil(boost::bind(&TcpFileTransferClient::IsOperationDone, this));
    m_lastSessionPtr = m_downloadEnginePtr->GetCurrentSession();
    if (!m_operationDone) {
        m_operationResult = CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    if (m_downloadEnginePtr->IsFinished()) {
        DisconnectEngine();
    }
    return m_operationResult;
}

CFTP_ERROR_TYPE TcpFileTransferClient::ListFiles(CFTP_LIST_FILTER filter, const std::string & path, list_entry_vector_t & entries) {
    entries.clear();
    if (!IsConnected()) {
        LOG_ERROR(subprocess) << "cannot list " << path << ": not connected";
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    m_operationDone = false;
    m_operationResult = CFTP_ERROR_TYPE::NONE;
    m_listEntries.clear();
    m_downloadEnginePtr->QueueList(filter, path);
    RunUntil(boost::bind(&TcpFileTransferClient::IsOperationDone, this));
    if (!m_operationDone) {
        m_operationResult = CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    if (m_downloadEnginePtr->IsFinished()) {
        DisconnectEngine();
    }
    entries.swap(m_listEntries);
    return m_operationResult;
}

void TcpFileTransferClient::OnDownloadComplete(const std::string & remoteFilename, CFTP_ERROR_TYPE result) {
    LOG_DEBUG(subprocess) << "download of " << remoteFilename << " ended with " << CftpProtocol::ErrorTypeToString(result);
    m_operationResult = result;
    m_operationDone = true;
}

void TcpFileTransferClient::OnListComplete(CFTP_ERROR_TYPE result, const list_entry_vector_t & entries) {
    m_operationResult = result;
    m_listEntries = entries;
    m_operationDone = true;
}

bool TcpFileTransferClient::IsHandshakeDone() const {
    return m_downloadEnginePtr->GetState() != DOWNLOAD_ENGINE_STATE::HANDSHAKE_SENT;
}

bool TcpFileTransferClient::IsOperationDone() const {
    return m_operationDone;
}

bool TcpFileTransferClient::IsEngineFinished() const {
    return m_downloadEnginePtr->IsFinished();
}

bool TcpFileTransferClient::RunUntil(const boost::function<bool()> & isDone) {
    boost::system::error_code ec;
    while (true) {
        if (m_downloadEnginePtr->TakeBytesToSend(m_bytesToSend)) {
            boost::asio::write(m_tcpSocket, boost::asio::buffer(m_bytesToSend), ec);
            if (ec) {
                LOG_ERROR(subprocess) << "write error: " << ec.message();
                DisconnectEngine();
                return isDone();
            }
        }
        if (isDone()) {
            return true;
        }
        if (m_downloadEnginePtr->IsFinished()) {
            return false;
        }
        struct pollfd pfd;
        pfd.fd = m_tcpSocket.native_handle();
        pfd.events = POLLIN;
        pfd.revents = 0;
        const int rc = poll(&pfd, 1, m_idleTimeoutMilliseconds);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(subprocess) << "poll failed: " << std::strerror(errno);
            DisconnectEngine();
            return isDone();
        }
        if (rc == 0) {
            LOG_ERROR(subprocess) << "no data from the server for " << m_idleTimeoutMilliseconds << " ms in state "
                << DownloadEngine::StateToString(m_downloadEnginePtr->GetState());
            DisconnectEngine();
            return isDone();
        }
        const std::size_t bytesRead = m_tcpSocket.read_some(boost::asio::buffer(m_readBuffer), ec);
        if (ec) {
            if (ec == boost::asio::error::eof) {
                LOG_INFO(subprocess) << "server closed the connection";
            }
            else {
                LOG_ERROR(subprocess) << "read error: " << ec.message();
            }
            DisconnectEngine();
            return isDone();
        }
        if (m_recordReceivedBytes) {
            m_receivedBytes.insert(m_receivedBytes.end(), m_readBuffer.begin(), m_readBuffer.begin() + bytesRead);
        }
        m_downloadEnginePtr->HandleReceivedBytes(m_readBuffer.data(), bytesRead);
    }
}
