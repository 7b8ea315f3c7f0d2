/**
 * @file SessionRegistry.cpp
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

#include "SessionRegistry.h"
#include "Logger.h"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread/tss.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::registry;

SessionRegistry::SessionRegistry() {}

SessionRegistry::~SessionRegistry() {
    boost::mutex::scoped_lock lock(m_mapMutex);
    if (!m_sessions.empty()) {
        LOG_DEBUG(subprocess) << "destroying registry with " << m_sessions.size() << " active session(s)";
    }
}

std::string SessionRegistry::GenerateSessionId() {
    //random_generator is not thread safe, keep one per thread
    static boost::thread_specific_ptr<boost::uuids::random_generator> s_generatorPtr;
    if (s_generatorPtr.get() == NULL) {
        s_generatorPtr.reset(new boost::uuids::random_generator());
    }
    return boost::uuids::to_string((*s_generatorPtr)());
}

TransferSession_ptr SessionRegistry::CreateSession(const std::string & filename, uint32_t chunkSize) {
    while (true) {
        TransferSession_ptr session = std::make_shared<TransferSession>(GenerateSessionId(), filename, chunkSize);
        {
            boost::mutex::scoped_lock lock(m_mapMutex);
            if (m_sessions.emplace(session->GetSessionId(), session).second) {
                LOG_DEBUG(subprocess) << "created session " << session->GetSessionId() << " for " << filename;
                return session;
            }
        }
        //122 random bits make this practically unreachable
        LOG_WARNING(subprocess) << "session id collision on " << session->GetSessionId() << ", regenerating";
    }
}

TransferSession_ptr SessionRegistry::GetSession(const std::string & sessionId) const {
    boost::mutex::scoped_lock lock(m_mapMutex);
    session_map_t::const_iterator it = m_sessions.find(sessionId);
    if (it == m_sessions.cend()) {
        return TransferSession_ptr();
    }
    return it->second;
}

bool SessionRegistry::RemoveSession(const std::string & sessionId) {
    TransferSession_ptr removed; //destroyed (and its descriptor closed) outside the lock
    {
        boost::mutex::scoped_lock lock(m_mapMutex);
        session_map_t::iterator it = m_sessions.find(sessionId);
        if (it == m_sessions.end()) {
            return false;
        }
        removed = std::move(it->second);
        m_sessions.erase(it);
    }
    LOG_DEBUG(subprocess) << "removed session " << sessionId;
    return true;
}

std::size_t SessionRegistry::GetNumActiveSessions() const {
    boost::mutex::scoped_lock lock(m_mapMutex);
    return m_sessions.size();
}

void SessionRegistry::SetSessionExpiredCallback(const SessionExpiredCallback_t & callback) {
    m_sessionExpiredCallback = callback;
}

std::size_t SessionRegistry::SweepIdleSessions(const boost::posix_time::time_duration & idleTimeout) {
    return SweepIdleSessions(idleTimeout, boost::posix_time::microsec_clock::universal_time());
}

std::size_t SessionRegistry::SweepIdleSessions(const boost::posix_time::time_duration & idleTimeout,
    const boost::posix_time::ptime & now)
{
    std::vector<TransferSession_ptr> candidates;
    {
        boost::mutex::scoped_lock lock(m_mapMutex);
        candidates.reserve(m_sessions.size());
        for (session_map_t::const_iterator it = m_sessions.cbegin(); it != m_sessions.cend(); ++it) {
            candidates.push_back(it->second);
        }
    }
    //session locks are taken without the map lock held
    std::vector<TransferSession_ptr> expired;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if ((now - candidates[i]->GetLastActivity()) > idleTimeout) {
            expired.push_back(candidates[i]);
        }
    }
    std::size_t numSwept = 0;
    for (std::size_t i = 0; i < expired.size(); ++i) {
        const TransferSession_ptr & session = expired[i];
        if (!RemoveSession(session->GetSessionId())) {
            continue; //removed concurrently by its handler
        }
        ++numSwept;
        session->SetStatus(TRANSFER_SESSION_STATUS::EXPIRED);
        LOG_INFO(subprocess) << "session " << session->GetSessionId() << " (" << session->GetFilename()
            << ") expired after " << (now - session->GetLastActivity()).total_seconds() << "s idle";
        if (m_sessionExpiredCallback) {
            m_sessionExpiredCallback(session);
        }
    }
    return numSwept;
}
