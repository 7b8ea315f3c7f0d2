/**
 * @file TransferServerController.cpp
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

#include "TransferServerController.h"
#include "Logger.h"

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::control;

server_status_t::server_status_t() :
    running(false),
    port(0),
    activeConnections(0) {}

bool server_status_t::operator==(const server_status_t & o) const {
    return (running == o.running)
        && (serverType == o.serverType)
        && (ioMode == o.ioMode)
        && (host == o.host)
        && (port == o.port)
        && (activeConnections == o.activeConnections);
}

boost::property_tree::ptree server_status_t::GetNewPropertyTree() const {
    boost::property_tree::ptree pt;
    pt.put("running", running);
    pt.put("serverType", serverType);
    pt.put("ioMode", ioMode);
    pt.put("host", host);
    pt.put("port", port);
    pt.put("activeConnections", activeConnections);
    return pt;
}

bool server_status_t::SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) {
    try {
        running = pt.get<bool>("running");
        serverType = pt.get<std::string>("serverType");
        ioMode = pt.get<std::string>("ioMode");
        host = pt.get<std::string>("host");
        port = pt.get<uint16_t>("port");
        activeConnections = pt.get<unsigned int>("activeConnections");
    }
    catch (const boost::property_tree::ptree_error & e) {
        LOG_ERROR(subprocess) << "parsing JSON server status: " << e.what();
        return false;
    }
    return true;
}

TransferServerController::TransferServerController() {}

TransferServerController::~TransferServerController() {
    Stop();
}

const char * TransferServerController::StartResultToString(SERVER_START_RESULT result) {
    switch (result) {
        case SERVER_START_RESULT::STARTED: return "started";
        case SERVER_START_RESULT::ALREADY_RUNNING: return "server already running";
        case SERVER_START_RESULT::INVALID_CONFIG: return "invalid server configuration";
        case SERVER_START_RESULT::START_FAILED: return "server failed to start";
    }
    return "unknown";
}

SERVER_START_RESULT TransferServerController::Start(const TransferServerConfig & config) {
    boost::mutex::scoped_lock lock(m_mutex);
    if (m_serverPtr && m_serverPtr->IsRunning()) {
        LOG_WARNING(subprocess) << "start requested while a " << m_serverPtr->GetServerType() << " server is running";
        return SERVER_START_RESULT::ALREADY_RUNNING;
    }
    if (!config.Validate()) {
        return SERVER_START_RESULT::INVALID_CONFIG;
    }
    m_lastConfig = config;
    m_serverPtr = TransferServerBase::Create(config.m_serverType);
    if (!m_serverPtr) {
        return SERVER_START_RESULT::INVALID_CONFIG;
    }
    if (!m_serverPtr->Start(config)) {
        m_serverPtr.reset();
        return SERVER_START_RESULT::START_FAILED;
    }
    return SERVER_START_RESULT::STARTED;
}

bool TransferServerController::Stop() {
    boost::mutex::scoped_lock lock(m_mutex);
    if (!(m_serverPtr && m_serverPtr->IsRunning())) {
        return false;
    }
    m_serverPtr->Stop();
    m_serverPtr.reset();
    return true;
}

bool TransferServerController::IsRunning() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_serverPtr && m_serverPtr->IsRunning();
}

server_status_t TransferServerController::GetStatus() const {
    boost::mutex::scoped_lock lock(m_mutex);
    server_status_t status;
    status.running = m_serverPtr && m_serverPtr->IsRunning();
    status.serverType = TransferServerConfig::NormalizeServerType(m_lastConfig.m_serverType);
    status.ioMode = m_lastConfig.m_ioMode;
    status.host = m_lastConfig.m_host;
    if (status.running) {
        status.port = m_serverPtr->GetBoundPort();
        status.activeConnections = m_serverPtr->GetNumActiveConnections();
    }
    else {
        status.port = static_cast<uint16_t>(m_lastConfig.m_port);
    }
    return status;
}
