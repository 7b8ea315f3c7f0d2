/**
 * @file SessionRegistry.h
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
 * The SessionRegistry class maps session identifiers (random RFC 4122 UUID strings)
 * to TransferSession objects.  Its mutex guards only the map itself and is never
 * held while a session is read, written or sent; per-session state is guarded by
 * each session's own mutex.  Idle sessions can be swept after a timeout, in which
 * case they are marked EXPIRED and handed to an optional release callback
 * (used by the FileManager to release temp storage).
 */

#ifndef SESSION_REGISTRY_H
#define SESSION_REGISTRY_H 1

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <boost/function.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include "TransferSession.h"
#include "file_transfer_lib_export.h"

class SessionRegistry {
public:
    typedef boost::function<void(const TransferSession_ptr & session)> SessionExpiredCallback_t;

    FILE_TRANSFER_LIB_EXPORT SessionRegistry();
    FILE_TRANSFER_LIB_EXPORT ~SessionRegistry();
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /** Create and insert a new session under a fresh identifier.
     *
     * @param filename The requested file name.
     * @param chunkSize The chunk size of the transfer.
     * @return The new session (never NULL).
     */
    FILE_TRANSFER_LIB_EXPORT TransferSession_ptr CreateSession(const std::string & filename, uint32_t chunkSize);

    /// @return The session, or NULL if not found
    FILE_TRANSFER_LIB_EXPORT TransferSession_ptr GetSession(const std::string & sessionId) const;

    /// @return True if the session was present and removed
    FILE_TRANSFER_LIB_EXPORT bool RemoveSession(const std::string & sessionId);

    FILE_TRANSFER_LIB_EXPORT std::size_t GetNumActiveSessions() const;

    /** Remove every session whose last activity is older than idleTimeout.
     * Swept sessions are marked EXPIRED and passed to the expired callback
     * after the map lock has been released.
     *
     * @return The number of sessions swept.
     */
    FILE_TRANSFER_LIB_EXPORT std::size_t SweepIdleSessions(const boost::posix_time::time_duration & idleTimeout,
        const boost::posix_time::ptime & now);
    FILE_TRANSFER_LIB_EXPORT std::size_t SweepIdleSessions(const boost::posix_time::time_duration & idleTimeout);

    FILE_TRANSFER_LIB_EXPORT void SetSessionExpiredCallback(const SessionExpiredCallback_t & callback);

    /// A random UUID string; each calling thread owns its own generator
    FILE_TRANSFER_LIB_EXPORT static std::string GenerateSessionId();

private:
    typedef std::map<std::string, TransferSession_ptr> session_map_t;
    mutable boost::mutex m_mapMutex;
    session_map_t m_sessions;
    SessionExpiredCallback_t m_sessionExpiredCallback;
};

#endif //SESSION_REGISTRY_H
