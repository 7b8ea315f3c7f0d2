/**
 * @file SequentialTransferServer.cpp
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

#include "SequentialTransferServer.h"
#include "Logger.h"
#include "ThreadNamer.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::server;

SequentialTransferServer::SequentialTransferServer() : TransferServerBase() {}

SequentialTransferServer::~SequentialTransferServer() {
    Stop();
}

std::string SequentialTransferServer::GetServerType() const {
    return "sequential";
}

bool SequentialTransferServer::StartBackend() {
    m_acceptLoopThreadPtr = boost::make_unique<boost::thread>(boost::bind(&SequentialTransferServer::AcceptLoopThreadFunc, this));
    ThreadNamer::SetThreadName(*m_acceptLoopThreadPtr, "seqAcceptLoop");
    return true;
}

void SequentialTransferServer::StopBackend() {
    if (m_acceptLoopThreadPtr) {
        try {
            m_acceptLoopThreadPtr->join();
        }
        catch (const boost::thread_resource_error &) {
            LOG_ERROR(subprocess) << "error stopping SequentialTransferServer accept thread";
        }
        m_acceptLoopThreadPtr.reset();
    }
}

void SequentialTransferServer::AcceptLoopThreadFunc() {
    while (m_running) {
        boost::asio::ip::tcp::socket socket(m_ioService);
        if (!AcceptWithTimeout(socket, 100)) {
            continue;
        }
        const std::string connectionName = GetConnectionName(socket);
        LOG_INFO(subprocess) << "accepted connection from " << connectionName;
        m_serverContextPtr->OnConnectionOpened();
        ConnectionHandler_ptr handlerPtr = NewConnectionHandler(connectionName);
        ServeBlockingConnection(socket, *handlerPtr, connectionName);
        m_serverContextPtr->OnConnectionClosed();
        LOG_INFO(subprocess) << "connection from " << connectionName << " closed";
    }
}
