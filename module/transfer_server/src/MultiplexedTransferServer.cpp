/**
 * @file MultiplexedTransferServer.cpp
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

#include "MultiplexedTransferServer.h"
#include "Logger.h"
#include "ThreadNamer.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>
#include <poll.h>
#include <cerrno>
#include <cstring>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::server;

static constexpr int EVENT_LOOP_POLL_TIMEOUT_MILLISECONDS = 100;

MultiplexedTransferServer::MultiplexedTransferServer() :
    TransferServerBase(),
    m_readBuffer(65536)
{
}

MultiplexedTransferServer::~MultiplexedTransferServer() {
    Stop();
}

std::string MultiplexedTransferServer::GetServerType() const {
    return "multiplexed";
}

bool MultiplexedTransferServer::StartBackend() {
    boost::system::error_code ec;
    m_tcpAcceptor.non_blocking(true, ec);
    if (ec) {
        LOG_ERROR(subprocess) << "unable to make the listening socket non-blocking: " << ec.message();
        return false;
    }
    m_eventLoopThreadPtr = boost::make_unique<boost::thread>(boost::bind(&MultiplexedTransferServer::EventLoopThreadFunc, this));
    ThreadNamer::SetThreadName(*m_eventLoopThreadPtr, "muxEventLoop");
    return true;
}

void MultiplexedTransferServer::StopBackend() {
    if (m_eventLoopThreadPtr) {
        try {
            m_eventLoopThreadPtr->join();
        }
        catch (const boost::thread_resource_error &) {
            LOG_ERROR(subprocess) << "error stopping MultiplexedTransferServer event loop thread";
        }
        m_eventLoopThreadPtr.reset();
    }
}

void MultiplexedTransferServer::EventLoopThreadFunc() {
    std::vector<struct pollfd> pollFds;
    std::vector<connection_list_t::iterator> pollConnections;

    while (m_running) {
        pollFds.clear();
        pollConnections.clear();
        struct pollfd listenFd;
        listenFd.fd = m_tcpAcceptor.native_handle();
        listenFd.events = POLLIN;
        listenFd.revents = 0;
        pollFds.push_back(listenFd);
        for (connection_list_t::iterator it = m_connections.begin(); it != m_connections.end(); ++it) {
            struct pollfd connFd;
            connFd.fd = it->socketPtr->native_handle();
            connFd.events = (it->handlerPtr->IsFinished()) ? 0 : POLLIN;
            if (it->pendingOutputOffset < it->pendingOutput.size()) {
                connFd.events |= POLLOUT;
            }
            connFd.revents = 0;
            pollFds.push_back(connFd);
            pollConnections.push_back(it);
        }

        const int rc = poll(pollFds.data(), static_cast<nfds_t>(pollFds.size()), EVENT_LOOP_POLL_TIMEOUT_MILLISECONDS);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(subprocess) << "poll failed: " << std::strerror(errno);
            break;
        }
        if (rc == 0) {
            continue;
        }

        for (std::size_t i = 0; i < pollConnections.size(); ++i) {
            multiplexed_connection_t & connection = *pollConnections[i];
            const short revents = pollFds[i + 1].revents;
            if (revents & (POLLIN | POLLHUP | POLLERR)) {
                ReadFromConnection(connection);
            }
            if ((!connection.closeNow) && (revents & POLLOUT)) {
                FlushConnection(connection);
            }
            if ((!connection.closeNow) && (revents & POLLNVAL)) {
                connection.closeNow = true;
            }
        }
        for (connection_list_t::iterator it = m_connections.begin(); it != m_connections.end(); ) {
            const bool drained = (it->pendingOutputOffset >= it->pendingOutput.size());
            if (it->closeNow || (drained && it->handlerPtr->IsFinished())) {
                CloseConnection(*it);
                m_connections.erase(it++);
            }
            else {
                ++it;
            }
        }
        if (pollFds[0].revents & POLLIN) {
            AcceptPendingConnections();
        }
    }

    if (!m_connections.empty()) {
        LOG_INFO(subprocess) << "closing " << m_connections.size() << " connections, server is stopping";
    }
    for (connection_list_t::iterator it = m_connections.begin(); it != m_connections.end(); ++it) {
        CloseConnection(*it);
    }
    m_connections.clear();
}

void MultiplexedTransferServer::AcceptPendingConnections() {
    while (true) {
        std::unique_ptr<boost::asio::ip::tcp::socket> socketPtr = boost::make_unique<boost::asio::ip::tcp::socket>(m_ioService);
        boost::system::error_code ec;
        m_tcpAcceptor.accept(*socketPtr, ec);
        if (ec) {
            if ((ec != boost::asio::error::would_block) && (ec != boost::asio::error::try_again)) {
                LOG_ERROR(subprocess) << "tcp accept error: " << ec.message();
            }
            return;
        }
        socketPtr->non_blocking(true, ec);
        if (ec) {
            LOG_ERROR(subprocess) << "unable to make an accepted socket non-blocking: " << ec.message();
            CloseSocket(*socketPtr);
            continue;
        }
        multiplexed_connection_t connection;
        connection.connectionName = GetConnectionName(*socketPtr);
        connection.socketPtr = std::move(socketPtr);
        connection.handlerPtr = NewConnectionHandler(connection.connectionName);
        connection.pendingOutputOffset = 0;
        connection.closeNow = false;
        LOG_INFO(subprocess) << "accepted connection from " << connection.connectionName
            << " (" << (m_connections.size() + 1) << " open)";
        m_serverContextPtr->OnConnectionOpened();
        m_connections.push_back(std::move(connection));
    }
}

void MultiplexedTransferServer::ReadFromConnection(multiplexed_connection_t & connection) {
    while (!connection.handlerPtr->IsFinished()) {
        boost::system::error_code ec;
        const std::size_t bytesRead = connection.socketPtr->read_some(boost::asio::buffer(m_readBuffer), ec);
        if (ec) {
            if ((ec == boost::asio::error::would_block) || (ec == boost::asio::error::try_again)) {
                break;
            }
            if (ec == boost::asio::error::eof) {
                LOG_INFO(subprocess) << connection.connectionName << ": peer closed the connection";
            }
            else {
                LOG_ERROR(subprocess) << connection.connectionName << ": read error: " << ec.message();
            }
            connection.closeNow = true;
            return;
        }
        connection.handlerPtr->HandleReceivedBytes(m_readBuffer.data(), bytesRead);
    }
    FlushConnection(connection);
}

void MultiplexedTransferServer::FlushConnection(multiplexed_connection_t & connection) {
    std::vector<uint8_t> newBytes;
    if (connection.handlerPtr->TakeBytesToSend(newBytes)) {
        if (connection.pendingOutputOffset >= connection.pendingOutput.size()) {
            connection.pendingOutput.swap(newBytes);
            connection.pendingOutputOffset = 0;
        }
        else {
            connection.pendingOutput.insert(connection.pendingOutput.end(), newBytes.begin(), newBytes.end());
        }
    }
    while (connection.pendingOutputOffset < connection.pendingOutput.size()) {
        boost::system::error_code ec;
        const std::size_t bytesWritten = connection.socketPtr->write_some(boost::asio::buffer(
            &connection.pendingOutput[connection.pendingOutputOffset],
            connection.pendingOutput.size() - connection.pendingOutputOffset), ec);
        if (ec) {
            if ((ec == boost::asio::error::would_block) || (ec == boost::asio::error::try_again)) {
                return;
            }
            LOG_ERROR(subprocess) << connection.connectionName << ": write error: " << ec.message();
            connection.closeNow = true;
            return;
        }
        connection.pendingOutputOffset += bytesWritten;
    }
    connection.pendingOutput.clear();
    connection.pendingOutputOffset = 0;
}

void MultiplexedTransferServer::CloseConnection(multiplexed_connection_t & connection) {
    connection.handlerPtr->OnDisconnect();
    CloseSocket(*connection.socketPtr);
    m_serverContextPtr->OnConnectionClosed();
    LOG_INFO(subprocess) << "connection from " << connection.connectionName << " closed";
}
