/**
 * @file ServerContext.h
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
 * The ServerContext class holds the state shared by every connection of one
 * running server instance: its configuration, the SessionRegistry and the
 * FileManager.  It is created when a server starts, destroyed when it stops,
 * and passed by reference into each ServerConnectionHandler.
 * It also runs the periodic idle-session sweep on its own io_service thread.
 */

#ifndef SERVER_CONTEXT_H
#define SERVER_CONTEXT_H 1

#include <atomic>
#include <memory>
#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include "TransferServerConfig.h"
#include "SessionRegistry.h"
#include "FileManager.h"
#include "file_transfer_lib_export.h"

class ServerContext {
public:
    FILE_TRANSFER_LIB_EXPORT explicit ServerContext(const TransferServerConfig & config);
    FILE_TRANSFER_LIB_EXPORT ~ServerContext();
    ServerContext(const ServerContext&) = delete;
    ServerContext& operator=(const ServerContext&) = delete;

    /** Create the storage directories and start the idle-session sweep.
     *
     * @return True on success.
     */
    FILE_TRANSFER_LIB_EXPORT bool Init();

    /// Stop the sweep (also done by the destructor).
    FILE_TRANSFER_LIB_EXPORT void Stop();

    const TransferServerConfig & GetConfig() const { return m_config; }
    SessionRegistry & GetSessionRegistry() { return m_sessionRegistry; }
    FileManager & GetFileManager() { return m_fileManager; }

    FILE_TRANSFER_LIB_EXPORT void OnConnectionOpened();
    FILE_TRANSFER_LIB_EXPORT void OnConnectionClosed();
    FILE_TRANSFER_LIB_EXPORT unsigned int GetNumActiveConnections() const noexcept;
    FILE_TRANSFER_LIB_EXPORT uint64_t GetTotalConnectionsAccepted() const noexcept;

private:
    void StartSweepTimer();
    void OnSweepTimerExpired(const boost::system::error_code & e);

private:
    const TransferServerConfig m_config;
    SessionRegistry m_sessionRegistry;
    FileManager m_fileManager;

    std::atomic<unsigned int> m_numActiveConnections;
    std::atomic<uint64_t> m_totalConnectionsAccepted;

    boost::asio::io_service m_ioServiceSweep;
    boost::asio::deadline_timer m_sweepTimer;
    std::unique_ptr<boost::thread> m_ioServiceSweepThreadPtr;
};

#endif //SERVER_CONTEXT_H
