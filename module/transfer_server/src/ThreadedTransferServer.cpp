/**
 * @file ThreadedTransferServer.cpp
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

#include "ThreadedTransferServer.h"
#include "Logger.h"
#include "ThreadNamer.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::server;

ThreadedTransferServer::ThreadedTransferServer() : TransferServerBase() {}

ThreadedTransferServer::~ThreadedTransferServer() {
    Stop();
}

std::string ThreadedTransferServer::GetServerType() const {
    return "threaded";
}

std::size_t ThreadedTransferServer::GetNumWorkerThreads() {
    boost::mutex::scoped_lock lock(m_workersMutex);
    return m_workers.size();
}

bool ThreadedTransferServer::StartBackend() {
    m_acceptLoopThreadPtr = boost::make_unique<boost::thread>(boost::bind(&ThreadedTransferServer::AcceptLoopThreadFunc, this));
    ThreadNamer::SetThreadName(*m_acceptLoopThreadPtr, "thrAcceptLoop");
    return true;
}

void ThreadedTransferServer::StopBackend() {
    if (m_acceptLoopThreadPtr) {
        try {
            m_acceptLoopThreadPtr->join();
        }
        catch (const boost::thread_resource_error &) {
            LOG_ERROR(subprocess) << "error stopping ThreadedTransferServer accept thread";
        }
        m_acceptLoopThreadPtr.reset();
    }
    //workers notice m_running == false within one poll interval
    ReapWorkers(true);
}

void ThreadedTransferServer::AcceptLoopThreadFunc() {
    while (m_running) {
        ReapWorkers(false);
        socket_ptr_t socketPtr = std::make_shared<boost::asio::ip::tcp::socket>(m_ioService);
        if (!AcceptWithTimeout(*socketPtr, 100)) {
            continue;
        }
        const std::string connectionName = GetConnectionName(*socketPtr);
        LOG_INFO(subprocess) << "accepted connection from " << connectionName << ", starting worker thread";
        m_serverContextPtr->OnConnectionOpened();

        connection_worker_t worker;
        worker.doneFlagPtr = std::make_shared<std::atomic<bool> >(false);
        worker.threadPtr = boost::make_unique<boost::thread>(boost::bind(&ThreadedTransferServer::ConnectionWorkerThreadFunc,
            this, socketPtr, connectionName, worker.doneFlagPtr));
        ThreadNamer::SetThreadName(*worker.threadPtr, "thrConnWorker");
        boost::mutex::scoped_lock lock(m_workersMutex);
        m_workers.push_back(std::move(worker));
    }
}

void ThreadedTransferServer::ConnectionWorkerThreadFunc(socket_ptr_t socketPtr, std::string connectionName, std::shared_ptr<std::atomic<bool> > doneFlagPtr) {
    ConnectionHandler_ptr handlerPtr = NewConnectionHandler(connectionName);
    ServeBlockingConnection(*socketPtr, *handlerPtr, connectionName);
    m_serverContextPtr->OnConnectionClosed();
    LOG_INFO(subprocess) << "connection from " << connectionName << " closed";
    *doneFlagPtr = true;
}

void ThreadedTransferServer::ReapWorkers(bool joinAll) {
    std::list<connection_worker_t> toJoin;
    {
        boost::mutex::scoped_lock lock(m_workersMutex);
        for (std::list<connection_worker_t>::iterator it = m_workers.begin(); it != m_workers.end(); ) {
            if (joinAll || (*it->doneFlagPtr)) {
                toJoin.splice(toJoin.end(), m_workers, it++);
            }
            else {
                ++it;
            }
        }
    }
    for (std::list<connection_worker_t>::iterator it = toJoin.begin(); it != toJoin.end(); ++it) {
        try {
            it->threadPtr->join();
        }
        catch (const boost::thread_resource_error &) {
            LOG_ERROR(subprocess) << "error joining connection worker thread";
        }
    }
}
