/**
 * @file TransferServerBase.cpp
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

#include "TransferServerBase.h"
#include "SequentialTransferServer.h"
#include "ThreadedTransferServer.h"
#include "MultiplexedTransferServer.h"
#include "AsyncTransferServer.h"
#include "ServerConnectionHandler.h"
#include "Logger.h"
#include <boost/make_unique.hpp>
#include <boost/lexical_cast.hpp>
#include <poll.h>
#include <cerrno>
#include <cstring>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::server;

static constexpr std::size_t BLOCKING_READ_BUFFER_SIZE = 65536;
static constexpr int BLOCKING_POLL_TIMEOUT_MILLISECONDS = 100;

TransferServerBase::TransferServerBase() :
    m_running(false),
    m_config(),
    m_ioService(),
    m_tcpAcceptor(m_ioService),
    m_boundPort(0)
{
}

TransferServerBase::~TransferServerBase() {
    //derived classes call Stop() in their own destructors so that StopBackend() is still bound
}

std::unique_ptr<TransferServerBase> TransferServerBase::Create(const std::string & serverType) {
    const std::string canonical = TransferServerConfig::NormalizeServerType(serverType);
    if (canonical == "sequential") {
        return boost::make_unique<SequentialTransferServer>();
    }
    else if (canonical == "threaded") {
        return boost::make_unique<ThreadedTransferServer>();
    }
    else if (canonical == "multiplexed") {
        return boost::make_unique<MultiplexedTransferServer>();
    }
    else if (canonical == "async") {
        return boost::make_unique<AsyncTransferServer>();
    }
    LOG_ERROR(subprocess) << "unknown server type " << serverType;
    return std::unique_ptr<TransferServerBase>();
}

bool TransferServerBase::Start(const TransferServerConfig & config) {
    if (m_running) {
        LOG_ERROR(subprocess) << GetServerType() << " server already running on port " << m_boundPort;
        return false;
    }
    if (!config.Validate()) {
        return false;
    }
    m_config = config;
    m_serverContextPtr = boost::make_unique<ServerContext>(m_config);
    if (!m_serverContextPtr->Init()) {
        LOG_ERROR(subprocess) << "unable to initialize server storage (root " << m_config.m_rootDir << ", temp " << m_config.m_tempDir << ")";
        m_serverContextPtr.reset();
        return false;
    }

    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(m_ioService);
    const boost::asio::ip::tcp::resolver::results_type results =
        resolver.resolve(boost::asio::ip::tcp::v4(), m_config.m_host, boost::lexical_cast<std::string>(m_config.m_port), ec);
    if (ec || results.empty()) {
        LOG_ERROR(subprocess) << "unable to resolve " << m_config.m_host << ": " << ec.message();
        m_serverContextPtr.reset();
        return false;
    }
    const boost::asio::ip::tcp::endpoint endpoint = results.begin()->endpoint();

    try {
        m_ioService.restart();
        m_tcpAcceptor.open(endpoint.protocol());
        m_tcpAcceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        m_tcpAcceptor.bind(endpoint);
        m_tcpAcceptor.listen();
        m_boundPort = m_tcpAcceptor.local_endpoint().port();
    }
    catch (const boost::system::system_error & e) {
        LOG_ERROR(subprocess) << "unable to listen on " << endpoint << ": " << e.what();
        CloseAcceptor();
        m_serverContextPtr.reset();
        return false;
    }

    m_running = true;
    if (!StartBackend()) {
        LOG_ERROR(subprocess) << "unable to start " << GetServerType() << " backend";
        m_running = false;
        StopBackend();
        CloseAcceptor();
        m_serverContextPtr.reset();
        return false;
    }
    LOG_INFO(subprocess) << GetServerType() << " server listening on " << m_config.m_host << ":" << m_boundPort
        << " serving " << m_config.m_rootDir;
    return true;
}

void TransferServerBase::Stop() {
    if (!m_serverContextPtr) {
        return;
    }
    m_running = false;
    StopBackend();
    CloseAcceptor();
    LOG_INFO(subprocess) << GetServerType() << " server on port " << m_boundPort << " stopped after accepting "
        << m_serverContextPtr->GetTotalConnectionsAccepted() << " connections";
    m_serverContextPtr.reset();
    m_boundPort = 0;
}

void TransferServerBase::CloseAcceptor() {
    if (m_tcpAcceptor.is_open()) {
        try {
            m_tcpAcceptor.close();
        }
        catch (const boost::system::system_error & e) {
            LOG_ERROR(subprocess) << "error closing tcp acceptor: " << e.what();
        }
    }
}

bool TransferServerBase::IsRunning() const noexcept {
    return m_running;
}

uint16_t TransferServerBase::GetBoundPort() const noexcept {
    return m_boundPort;
}

unsigned int TransferServerBase::GetNumActiveConnections() const {
    return (m_serverContextPtr) ? m_serverContextPtr->GetNumActiveConnections() : 0;
}

uint64_t TransferServerBase::GetTotalConnectionsAccepted() const {
    return (m_serverContextPtr) ? m_serverContextPtr->GetTotalConnectionsAccepted() : 0;
}

const TransferServerConfig & TransferServerBase::GetConfig() const noexcept {
    return m_config;
}

bool TransferServerBase::AcceptWithTimeout(boost::asio::ip::tcp::socket & socketOut, int timeoutMilliseconds) {
    struct pollfd pfd;
    pfd.fd = m_tcpAcceptor.native_handle();
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int rc = poll(&pfd, 1, timeoutMilliseconds);
    if (rc < 0) {
        if (errno != EINTR) {
            LOG_ERROR(subprocess) << "poll on listening socket failed: " << std::strerror(errno);
        }
        return false;
    }
    if (rc == 0) {
        return false;
    }
    boost::system::error_code ec;
    m_tcpAcceptor.accept(socketOut, ec);
    if (ec) {
        LOG_ERROR(subprocess) << "tcp accept error: " << ec.message();
        return false;
    }
    return true;
}

void TransferServerBase::ServeBlockingConnection(boost::asio::ip::tcp::socket & socket, ConnectionHandler & handler, const std::string & connectionName) {
    std::vector<uint8_t> bytesToSend;
    std::vector<uint8_t> readBuffer(BLOCKING_READ_BUFFER_SIZE);
    boost::system::error_code ec;
    while (true) {
        if (handler.TakeBytesToSend(bytesToSend)) {
            boost::asio::write(socket, boost::asio::buffer(bytesToSend), ec);
            if (ec) {
                LOG_ERROR(subprocess) << connectionName << ": write error: " << ec.message();
                break;
            }
        }
        if (handler.IsFinished()) {
            break;
        }
        if (!m_running) {
            LOG_INFO(subprocess) << connectionName << ": closing, server is stopping";
            break;
        }
        struct pollfd pfd;
        pfd.fd = socket.native_handle();
        pfd.events = POLLIN;
        pfd.revents = 0;
        const int rc = poll(&pfd, 1, BLOCKING_POLL_TIMEOUT_MILLISECONDS);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(subprocess) << connectionName << ": poll failed: " << std::strerror(errno);
            break;
        }
        if (rc == 0) {
            continue;
        }
        const std::size_t bytesRead = socket.read_some(boost::asio::buffer(readBuffer), ec);
        if (ec) {
            if (ec == boost::asio::error::eof) {
                LOG_INFO(subprocess) << connectionName << ": peer closed the connection";
            }
            else {
                LOG_ERROR(subprocess) << connectionName << ": read error: " << ec.message();
            }
            break;
        }
        handler.HandleReceivedBytes(readBuffer.data(), bytesRead);
    }
    handler.OnDisconnect();
    CloseSocket(socket);
}

ConnectionHandler_ptr TransferServerBase::NewConnectionHandler(const std::string & connectionName) {
    return std::make_shared<ServerConnectionHandler>(*m_serverContextPtr, connectionName);
}

std::string TransferServerBase::GetConnectionName(const boost::asio::ip::tcp::socket & socket) {
    boost::system::error_code ec;
    const boost::asio::ip::tcp::endpoint remoteEndpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown-peer";
    }
    return remoteEndpoint.address().to_string() + ":" + boost::lexical_cast<std::string>(remoteEndpoint.port());
}

void TransferServerBase::CloseSocket(boost::asio::ip::tcp::socket & socket) {
    if (!socket.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket.shutdown(boost::asio::socket_base::shutdown_both, ec);
    if (ec && (ec != boost::asio::error::not_connected)) {
        LOG_DEBUG(subprocess) << "error shutting down tcp socket: " << ec.message();
    }
    socket.close(ec);
    if (ec) {
        LOG_ERROR(subprocess) << "error closing tcp socket: " << ec.message();
    }
}
