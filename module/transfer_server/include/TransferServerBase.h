/**
 * @file TransferServerBase.h
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
 * The TransferServerBase class is the common part of the four concurrency backends.
 * It owns the ServerContext and the listening socket of a running server instance,
 * and it implements the blocking connection loop shared by the sequential and
 * thread-per-connection backends.  Each backend only decides how accepted
 * connections are scheduled onto ServerConnectionHandler instances.
 */

#ifndef TRANSFER_SERVER_BASE_H
#define TRANSFER_SERVER_BASE_H 1

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "TransferServerConfig.h"
#include "ServerContext.h"
#include "ConnectionHandler.h"
#include "transfer_server_lib_export.h"

class TransferServerBase {
public:
    TRANSFER_SERVER_LIB_EXPORT TransferServerBase();
    TRANSFER_SERVER_LIB_EXPORT virtual ~TransferServerBase();
    TransferServerBase(const TransferServerBase&) = delete;
    TransferServerBase& operator=(const TransferServerBase&) = delete;

    /** Make a backend for a serverType name (aliases accepted).
     *
     * @return The backend, or NULL if the name is unknown.
     */
    TRANSFER_SERVER_LIB_EXPORT static std::unique_ptr<TransferServerBase> Create(const std::string & serverType);

    /** Create the ServerContext, bind the listening socket and start accepting.
     * A port of 0 binds an ephemeral port (see GetBoundPort()).
     *
     * @return True if the server is running.
     */
    TRANSFER_SERVER_LIB_EXPORT bool Start(const TransferServerConfig & config);

    /// Stop accepting, close every connection and destroy the ServerContext.
    TRANSFER_SERVER_LIB_EXPORT void Stop();

    TRANSFER_SERVER_LIB_EXPORT bool IsRunning() const noexcept;
    TRANSFER_SERVER_LIB_EXPORT uint16_t GetBoundPort() const noexcept;
    TRANSFER_SERVER_LIB_EXPORT unsigned int GetNumActiveConnections() const;
    TRANSFER_SERVER_LIB_EXPORT uint64_t GetTotalConnectionsAccepted() const;
    /// The running configuration (defaults if never started)
    TRANSFER_SERVER_LIB_EXPORT const TransferServerConfig & GetConfig() const noexcept;
    virtual std::string GetServerType() const = 0;

protected:
    virtual bool StartBackend() = 0;
    /// Called after m_running is cleared; must join every backend thread.
    virtual void StopBackend() = 0;

    /** Wait up to timeoutMilliseconds for a pending connection on the (blocking) acceptor.
     *
     * @return True if socketOut holds a newly accepted connection.
     */
    bool AcceptWithTimeout(boost::asio::ip::tcp::socket & socketOut, int timeoutMilliseconds);

    /** Drive a handler over a blocking socket until the handler finishes,
     * the peer disconnects, or the server stops.  Always ends with OnDisconnect().
     */
    void ServeBlockingConnection(boost::asio::ip::tcp::socket & socket, ConnectionHandler & handler, const std::string & connectionName);

    /// New server side handler bound to this instance's ServerContext
    ConnectionHandler_ptr NewConnectionHandler(const std::string & connectionName);
    static std::string GetConnectionName(const boost::asio::ip::tcp::socket & socket);
    static void CloseSocket(boost::asio::ip::tcp::socket & socket);
    void CloseAcceptor();

protected:
    std::atomic<bool> m_running;
    TransferServerConfig m_config;
    std::unique_ptr<ServerContext> m_serverContextPtr;
    boost::asio::io_service m_ioService;
    boost::asio::ip::tcp::acceptor m_tcpAcceptor;
    uint16_t m_boundPort;
};

#endif //TRANSFER_SERVER_BASE_H
