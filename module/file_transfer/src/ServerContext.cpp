/**
 * @file ServerContext.cpp
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

#include "ServerContext.h"
#include "Logger.h"
#include "ThreadNamer.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::server;

static DIGEST_ALGORITHM DigestAlgorithmFromConfig(const std::string & name) {
    DIGEST_ALGORITHM algorithm = DIGEST_ALGORITHM::MD5;
    if (!ContentDigest::GetAlgorithmFromString(name, algorithm)) {
        LOG_WARNING(subprocess) << "unknown digest algorithm " << name << ", using md5";
    }
    return algorithm;
}

ServerContext::ServerContext(const TransferServerConfig & config) :
    m_config(config),
    m_sessionRegistry(),
    m_fileManager(m_sessionRegistry, config.m_rootDir, config.m_tempDir,
        DigestAlgorithmFromConfig(config.m_digestAlgorithm), config.m_listRecursive, config.m_preserveTempOnError),
    m_numActiveConnections(0),
    m_totalConnectionsAccepted(0),
    m_ioServiceSweep(),
    m_sweepTimer(m_ioServiceSweep)
{
    m_sessionRegistry.SetSessionExpiredCallback(boost::bind(&FileManager::OnSessionExpired, &m_fileManager, boost::placeholders::_1));
}

ServerContext::~ServerContext() {
    Stop();
}

bool ServerContext::Init() {
    if (!m_fileManager.Init()) {
        return false;
    }
    if (!m_ioServiceSweepThreadPtr) {
        StartSweepTimer();
        m_ioServiceSweepThreadPtr = boost::make_unique<boost::thread>(boost::bind(&boost::asio::io_service::run, &m_ioServiceSweep));
        ThreadNamer::SetIoServiceThreadName(m_ioServiceSweep, "ioServiceSweep");
    }
    return true;
}

void ServerContext::Stop() {
    if (m_ioServiceSweepThreadPtr) {
        m_ioServiceSweep.stop();
        try {
            m_ioServiceSweepThreadPtr->join();
        }
        catch (const boost::thread_resource_error&) {
            LOG_ERROR(subprocess) << "error stopping ServerContext sweep thread";
        }
        m_ioServiceSweepThreadPtr.reset();
    }
}

void ServerContext::StartSweepTimer() {
    m_sweepTimer.expires_from_now(boost::posix_time::seconds(static_cast<long>(m_config.m_sessionSweepIntervalSeconds)));
    m_sweepTimer.async_wait(boost::bind(&ServerContext::OnSweepTimerExpired, this, boost::asio::placeholders::error));
}

void ServerContext::OnSweepTimerExpired(const boost::system::error_code & e) {
    if (e == boost::asio::error::operation_aborted) {
        return;
    }
    const std::size_t numSwept = m_sessionRegistry.SweepIdleSessions(
        boost::posix_time::seconds(static_cast<long>(m_config.m_sessionTimeoutSeconds)));
    if (numSwept) {
        LOG_INFO(subprocess) << "swept " << numSwept << " idle session(s), " << m_sessionRegistry.GetNumActiveSessions() << " remain";
    }
    StartSweepTimer();
}

void ServerContext::OnConnectionOpened() {
    ++m_numActiveConnections;
    ++m_totalConnectionsAccepted;
}

void ServerContext::OnConnectionClosed() {
    --m_numActiveConnections;
}

unsigned int ServerContext::GetNumActiveConnections() const noexcept {
    return m_numActiveConnections.load(std::memory_order_acquire);
}

uint64_t ServerContext::GetTotalConnectionsAccepted() const noexcept {
    return m_totalConnectionsAccepted.load(std::memory_order_acquire);
}
