/**
 * @file AsyncTransferServer.cpp
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

#include "AsyncTransferServer.h"
#include "Logger.h"
#include "ThreadNamer.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>
#include <boost/asio/post.hpp>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::server;

class AsyncTransferConnection : public std::enable_shared_from_this<AsyncTransferConnection> {
public:
    AsyncTransferConnection(AsyncTransferServer & server, std::shared_ptr<boost::asio::ip::tcp::socket> & socketPtr,
        const ConnectionHandler_ptr & handlerPtr, const std::string & connectionName);

    void Start();
    /// Closes now, or as soon as the running step returns.
    void RequestClose();

private:
    void StartRead();
    void HandleRead(const boost::system::error_code & error, std::size_t bytesTransferred);
    void RunStepOnWorker(std::size_t bytesTransferred);
    void HandleStepComplete(std::shared_ptr<std::vector<uint8_t> > & bytesToSendPtr, bool finished);
    void HandleWrite(const boost::system::error_code & error, std::size_t bytesTransferred, bool finished);
    void Close();

private:
    AsyncTransferServer & m_serverRef;
    std::shared_ptr<boost::asio::ip::tcp::socket> m_socketPtr;
    ConnectionHandler_ptr m_handlerPtr;
    const std::string M_CONNECTION_NAME;
    std::vector<uint8_t> m_readBuffer;
    std::shared_ptr<std::vector<uint8_t> > m_writeBufferPtr;
    bool m_stepInProgress;
    bool m_closeRequested;
    bool m_closed;
};

AsyncTransferConnection::AsyncTransferConnection(AsyncTransferServer & server, std::shared_ptr<boost::asio::ip::tcp::socket> & socketPtr,
    const ConnectionHandler_ptr & handlerPtr, const std::string & connectionName) :
    m_serverRef(server),
    m_socketPtr(socketPtr),
    m_handlerPtr(handlerPtr),
    M_CONNECTION_NAME(connectionName),
    m_readBuffer(65536),
    m_stepInProgress(false),
    m_closeRequested(false),
    m_closed(false)
{
}

void AsyncTransferConnection::Start() {
    StartRead();
}

void AsyncTransferConnection::RequestClose() {
    if (m_stepInProgress) {
        m_closeRequested = true;
    }
    else {
        Close();
    }
}

void AsyncTransferConnection::StartRead() {
    m_socketPtr->async_read_some(boost::asio::buffer(m_readBuffer),
        boost::bind(&AsyncTransferConnection::HandleRead, shared_from_this(),
            boost::asio::placeholders::error,
            boost::asio::placeholders::bytes_transferred));
}

void AsyncTransferConnection::HandleRead(const boost::system::error_code & error, std::size_t bytesTransferred) {
    if (m_closed) {
        return;
    }
    if (error) {
        if (error == boost::asio::error::eof) {
            LOG_INFO(subprocess) << M_CONNECTION_NAME << ": peer closed the connection";
        }
        else if (error != boost::asio::error::operation_aborted) {
            LOG_ERROR(subprocess) << M_CONNECTION_NAME << ": read error: " << error.message();
        }
        Close();
        return;
    }
    m_stepInProgress = true;
    boost::asio::post(*m_serverRef.m_workerPoolPtr,
        boost::bind(&AsyncTransferConnection::RunStepOnWorker, shared_from_this(), bytesTransferred));
}

void AsyncTransferConnection::RunStepOnWorker(std::size_t bytesTransferred) {
    m_handlerPtr->HandleReceivedBytes(m_readBuffer.data(), bytesTransferred);
    std::shared_ptr<std::vector<uint8_t> > bytesToSendPtr = std::make_shared<std::vector<uint8_t> >();
    m_handlerPtr->TakeBytesToSend(*bytesToSendPtr);
    const bool finished = m_handlerPtr->IsFinished();
    boost::asio::post(m_serverRef.m_ioService,
        boost::bind(&AsyncTransferConnection::HandleStepComplete, shared_from_this(), bytesToSendPtr, finished));
}

void AsyncTransferConnection::HandleStepComplete(std::shared_ptr<std::vector<uint8_t> > & bytesToSendPtr, bool finished) {
    m_stepInProgress = false;
    if (m_closeRequested) {
        Close();
        return;
    }
    if (bytesToSendPtr->empty()) {
        if (finished) {
            Close();
        }
        else {
            StartRead();
        }
        return;
    }
    m_writeBufferPtr = bytesToSendPtr;
    boost::asio::async_write(*m_socketPtr, boost::asio::buffer(*m_writeBufferPtr),
        boost::bind(&AsyncTransferConnection::HandleWrite, shared_from_this(),
            boost::asio::placeholders::error,
            boost::asio::placeholders::bytes_transferred, finished));
}

void AsyncTransferConnection::HandleWrite(const boost::system::error_code & error, std::size_t bytesTransferred, bool finished) {
    (void)bytesTransferred;
    m_writeBufferPtr.reset();
    if (m_closed) {
        return;
    }
    if (error) {
        if (error != boost::asio::error::operation_aborted) {
            LOG_ERROR(subprocess) << M_CONNECTION_NAME << ": write error: " << error.message();
        }
        Close();
    }
    else if (finished) {
        Close();
    }
    else {
        StartRead();
    }
}

void AsyncTransferConnection::Close() {
    if (m_closed) {
        return;
    }
    m_closed = true;
    m_handlerPtr->OnDisconnect();
    AsyncTransferServer::CloseSocket(*m_socketPtr);
    LOG_INFO(subprocess) << "connection from " << M_CONNECTION_NAME << " closed";
    m_serverRef.OnConnectionFinished(shared_from_this());
}


AsyncTransferServer::AsyncTransferServer(unsigned int numWorkerThreads) :
    TransferServerBase(),
    M_NUM_WORKER_THREADS((numWorkerThreads) ? numWorkerThreads : 1)
{
}

AsyncTransferServer::~AsyncTransferServer() {
    Stop();
}

std::string AsyncTransferServer::GetServerType() const {
    return "async";
}

bool AsyncTransferServer::StartBackend() {
    m_workerPoolPtr = boost::make_unique<boost::asio::thread_pool>(M_NUM_WORKER_THREADS);
    m_workPtr = boost::make_unique<boost::asio::io_service::work>(m_ioService);
    StartTcpAccept();
    m_ioServiceThreadPtr = boost::make_unique<boost::thread>(boost::bind(&boost::asio::io_service::run, &m_ioService));
    ThreadNamer::SetIoServiceThreadName(m_ioService, "ioServiceAsync");
    return true;
}

void AsyncTransferServer::StopBackend() {
    if (!m_ioServiceThreadPtr) {
        return;
    }
    boost::asio::post(m_ioService, boost::bind(&AsyncTransferServer::CloseAllConnections, this));
    //steps still running post their results back to the io_service, which stays alive until the pool is joined
    m_workerPoolPtr->join();
    m_workPtr.reset();
    try {
        m_ioServiceThreadPtr->join();
    }
    catch (const boost::thread_resource_error &) {
        LOG_ERROR(subprocess) << "error stopping AsyncTransferServer io_service thread";
    }
    m_ioServiceThreadPtr.reset();
    m_workerPoolPtr.reset();
    m_liveConnections.clear();
}

void AsyncTransferServer::StartTcpAccept() {
    std::shared_ptr<boost::asio::ip::tcp::socket> newSocketPtr = std::make_shared<boost::asio::ip::tcp::socket>(m_ioService);
    m_tcpAcceptor.async_accept(*newSocketPtr,
        boost::bind(&AsyncTransferServer::HandleTcpAccept, this, newSocketPtr, boost::asio::placeholders::error));
}

void AsyncTransferServer::HandleTcpAccept(std::shared_ptr<boost::asio::ip::tcp::socket> & newSocketPtr, const boost::system::error_code & error) {
    if (error) {
        if (error != boost::asio::error::operation_aborted) {
            LOG_ERROR(subprocess) << "tcp accept error: " << error.message();
        }
    }
    else if (m_running) {
        const std::string connectionName = GetConnectionName(*newSocketPtr);
        LOG_INFO(subprocess) << "accepted connection from " << connectionName
            << " (" << (m_liveConnections.size() + 1) << " open)";
        m_serverContextPtr->OnConnectionOpened();
        AsyncTransferConnection_ptr connectionPtr = std::make_shared<AsyncTransferConnection>(*this, newSocketPtr,
            NewConnectionHandler(connectionName), connectionName);
        m_liveConnections.insert(connectionPtr);
        connectionPtr->Start();
    }
    if (m_running && (error != boost::asio::error::operation_aborted)) {
        StartTcpAccept();
    }
}

void AsyncTransferServer::CloseAllConnections() {
    boost::system::error_code ec;
    m_tcpAcceptor.cancel(ec);
    if (ec) {
        LOG_ERROR(subprocess) << "error cancelling tcp accept: " << ec.message();
    }
    if (!m_liveConnections.empty()) {
        LOG_INFO(subprocess) << "closing " << m_liveConnections.size() << " connections, server is stopping";
    }
    //RequestClose may erase from the set
    std::set<AsyncTransferConnection_ptr> connections(m_liveConnections);
    for (std::set<AsyncTransferConnection_ptr>::iterator it = connections.begin(); it != connections.end(); ++it) {
        (*it)->RequestClose();
    }
}

void AsyncTransferServer::OnConnectionFinished(const AsyncTransferConnection_ptr & connectionPtr) {
    if (m_liveConnections.erase(connectionPtr)) {
        m_serverContextPtr->OnConnectionClosed();
    }
}
