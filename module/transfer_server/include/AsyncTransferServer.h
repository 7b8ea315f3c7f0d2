/**
 * @file AsyncTransferServer.h
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
 * The AsyncTransferServer class runs all socket I/O as asio completion handlers
 * on a single io_service thread.  Each protocol step (and its disk I/O) is
 * posted to a worker thread pool, and its output is posted back to the
 * io_service thread to be written.  A connection has at most one read, one step
 * or one write outstanding at any time, so its handler is never entered concurrently.
 */

#ifndef ASYNC_TRANSFER_SERVER_H
#define ASYNC_TRANSFER_SERVER_H 1

#include <memory>
#include <set>
#include <boost/thread.hpp>
#include <boost/asio/thread_pool.hpp>
#include "TransferServerBase.h"

class AsyncTransferConnection;
typedef std::shared_ptr<AsyncTransferConnection> AsyncTransferConnection_ptr;

class AsyncTransferServer : public TransferServerBase {
    friend class AsyncTransferConnection;
public:
    TRANSFER_SERVER_LIB_EXPORT explicit AsyncTransferServer(unsigned int numWorkerThreads = 4);
    TRANSFER_SERVER_LIB_EXPORT virtual ~AsyncTransferServer() override;
    TRANSFER_SERVER_LIB_EXPORT virtual std::string GetServerType() const override;

protected:
    virtual bool StartBackend() override;
    virtual void StopBackend() override;

private:
    void StartTcpAccept();
    void HandleTcpAccept(std::shared_ptr<boost::asio::ip::tcp::socket> & newSocketPtr, const boost::system::error_code & error);
    void CloseAllConnections();
    void OnConnectionFinished(const AsyncTransferConnection_ptr & connectionPtr);

private:
    const unsigned int M_NUM_WORKER_THREADS;
    std::unique_ptr<boost::asio::thread_pool> m_workerPoolPtr;
    std::unique_ptr<boost::asio::io_service::work> m_workPtr;
    std::unique_ptr<boost::thread> m_ioServiceThreadPtr;
    std::set<AsyncTransferConnection_ptr> m_liveConnections; //io_service thread only
};

#endif //ASYNC_TRANSFER_SERVER_H
