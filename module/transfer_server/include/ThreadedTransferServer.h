/**
 * @file ThreadedTransferServer.h
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
 * The ThreadedTransferServer class gives every accepted connection its own
 * worker thread running the blocking connection loop.  Finished workers are
 * joined by the accept thread; the rest are joined when the server stops.
 */

#ifndef THREADED_TRANSFER_SERVER_H
#define THREADED_TRANSFER_SERVER_H 1

#include <atomic>
#include <list>
#include <memory>
#include <boost/thread.hpp>
#include "TransferServerBase.h"

class ThreadedTransferServer : public TransferServerBase {
public:
    TRANSFER_SERVER_LIB_EXPORT ThreadedTransferServer();
    TRANSFER_SERVER_LIB_EXPORT virtual ~ThreadedTransferServer() override;
    TRANSFER_SERVER_LIB_EXPORT virtual std::string GetServerType() const override;
    /// Workers not yet joined (includes finished ones awaiting reaping)
    TRANSFER_SERVER_LIB_EXPORT std::size_t GetNumWorkerThreads();

protected:
    virtual bool StartBackend() override;
    virtual void StopBackend() override;

private:
    struct connection_worker_t {
        std::unique_ptr<boost::thread> threadPtr;
        std::shared_ptr<std::atomic<bool> > doneFlagPtr;
    };
    typedef std::shared_ptr<boost::asio::ip::tcp::socket> socket_ptr_t;

    void AcceptLoopThreadFunc();
    void ConnectionWorkerThreadFunc(socket_ptr_t socketPtr, std::string connectionName, std::shared_ptr<std::atomic<bool> > doneFlagPtr);
    /// Join finished workers (all of them when joinAll is set).
    void ReapWorkers(bool joinAll);

private:
    std::unique_ptr<boost::thread> m_acceptLoopThreadPtr;
    boost::mutex m_workersMutex;
    std::list<connection_worker_t> m_workers;
};

#endif //THREADED_TRANSFER_SERVER_H
