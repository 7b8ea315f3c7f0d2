/**
 * @file MultiplexedTransferServer.h
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
 * The MultiplexedTransferServer class serves every connection from one thread
 * with poll(2) readiness over non-blocking sockets.  Each connection keeps its
 * own pending output buffer so that a slow reader never blocks the others.
 */

#ifndef MULTIPLEXED_TRANSFER_SERVER_H
#define MULTIPLEXED_TRANSFER_SERVER_H 1

#include <list>
#include <memory>
#include <vector>
#include <boost/thread.hpp>
#include "TransferServerBase.h"

class MultiplexedTransferServer : public TransferServerBase {
public:
    TRANSFER_SERVER_LIB_EXPORT MultiplexedTransferServer();
    TRANSFER_SERVER_LIB_EXPORT virtual ~MultiplexedTransferServer() override;
    TRANSFER_SERVER_LIB_EXPORT virtual std::string GetServerType() const override;

protected:
    virtual bool StartBackend() override;
    virtual void StopBackend() override;

private:
    struct multiplexed_connection_t {
        std::unique_ptr<boost::asio::ip::tcp::socket> socketPtr;
        ConnectionHandler_ptr handlerPtr;
        std::string connectionName;
        std::vector<uint8_t> pendingOutput;
        std::size_t pendingOutputOffset;
        bool closeNow;
    };
    typedef std::list<multiplexed_connection_t> connection_list_t;

    void EventLoopThreadFunc();
    void AcceptPendingConnections();
    void ReadFromConnection(multiplexed_connection_t & connection);
    void FlushConnection(multiplexed_connection_t & connection);
    void CloseConnection(multiplexed_connection_t & connection);

private:
    std::unique_ptr<boost::thread> m_eventLoopThreadPtr;
    connection_list_t m_connections;
    std::vector<uint8_t> m_readBuffer;
};

#endif //MULTIPLEXED_TRANSFER_SERVER_H
