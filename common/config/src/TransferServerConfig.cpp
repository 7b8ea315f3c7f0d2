/**
 * @file TransferServerConfig.cpp
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

#include "TransferServerConfig.h"
#include "Logger.h"
#include <algorithm>
#include <memory>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::none;

static const std::vector<std::string> VALID_SERVER_TYPES = { "sequential", "threaded", "multiplexed", "async" };
static const std::vector<std::string> VALID_IO_MODES = { "single", "threaded", "nonblocking", "async" };
static const std::vector<std::string> VALID_DIGEST_ALGORITHMS = { "md5", "sha256" };

static bool IsValidName(const std::vector<std::string> & validNames, const std::string & name) {
    return std::find(validNames.cbegin(), validNames.cend(), name) != validNames.cend();
}

TransferServerConfig::TransferServerConfig() :
    m_host("localhost"),
    m_port(8001),
    m_rootDir("./server_files/root"),
    m_tempDir("./server_files/temp"),
    m_serverType("sequential"),
    m_ioMode("single"),
    m_chunkSize(8192),
    m_maxRetries(3),
    m_sessionTimeoutSeconds(3600),
    m_sessionSweepIntervalSeconds(60),
    m_maxPayloadBytes(16777216),
    m_listRecursive(false),
    m_preserveTempOnError(true),
    m_digestAlgorithm("md5") { }

TransferServerConfig::~TransferServerConfig() {
}

//a copy constructor: X(const X&)
TransferServerConfig::TransferServerConfig(const TransferServerConfig& o) :
    m_host(o.m_host),
    m_port(o.m_port),
    m_rootDir(o.m_rootDir),
    m_tempDir(o.m_tempDir),
    m_serverType(o.m_serverType),
    m_ioMode(o.m_ioMode),
    m_chunkSize(o.m_chunkSize),
    m_maxRetries(o.m_maxRetries),
    m_sessionTimeoutSeconds(o.m_sessionTimeoutSeconds),
    m_sessionSweepIntervalSeconds(o.m_sessionSweepIntervalSeconds),
    m_maxPayloadBytes(o.m_maxPayloadBytes),
    m_listRecursive(o.m_listRecursive),
    m_preserveTempOnError(o.m_preserveTempOnError),
    m_digestAlgorithm(o.m_digestAlgorithm) { }

//a move constructor: X(X&&)
TransferServerConfig::TransferServerConfig(TransferServerConfig&& o) noexcept :
    m_host(std::move(o.m_host)),
    m_port(o.m_port),
    m_rootDir(std::move(o.m_rootDir)),
    m_tempDir(std::move(o.m_tempDir)),
    m_serverType(std::move(o.m_serverType)),
    m_ioMode(std::move(o.m_ioMode)),
    m_chunkSize(o.m_chunkSize),
    m_maxRetries(o.m_maxRetries),
    m_sessionTimeoutSeconds(o.m_sessionTimeoutSeconds),
    m_sessionSweepIntervalSeconds(o.m_sessionSweepIntervalSeconds),
    m_maxPayloadBytes(o.m_maxPayloadBytes),
    m_listRecursive(o.m_listRecursive),
    m_preserveTempOnError(o.m_preserveTempOnError),
    m_digestAlgorithm(std::move(o.m_digestAlgorithm)) { }

//a copy assignment: operator=(const X&)
TransferServerConfig& TransferServerConfig::operator=(const TransferServerConfig& o) {
    m_host = o.m_host;
    m_port = o.m_port;
    m_rootDir = o.m_rootDir;
    m_tempDir = o.m_tempDir;
    m_serverType = o.m_serverType;
    m_ioMode = o.m_ioMode;
    m_chunkSize = o.m_chunkSize;
    m_maxRetries = o.m_maxRetries;
    m_sessionTimeoutSeconds = o.m_sessionTimeoutSeconds;
    m_sessionSweepIntervalSeconds = o.m_sessionSweepIntervalSeconds;
    m_maxPayloadBytes = o.m_maxPayloadBytes;
    m_listRecursive = o.m_listRecursive;
    m_preserveTempOnError = o.m_preserveTempOnError;
    m_digestAlgorithm = o.m_digestAlgorithm;
    return *this;
}

//a move assignment: operator=(X&&)
TransferServerConfig& TransferServerConfig::operator=(TransferServerConfig&& o) noexcept {
    m_host = std::move(o.m_host);
    m_port = o.m_port;
    m_rootDir = std::move(o.m_rootDir);
    m_tempDir = std::move(o.m_tempDir);
    m_serverType = std::move(o.m_serverType);
    m_ioMode = std::move(o.m_ioMode);
    m_chunkSize = o.m_chunkSize;
    m_maxRetries = o.m_maxRetries;
    m_sessionTimeoutSeconds = o.m_sessionTimeoutSeconds;
    m_sessionSweepIntervalSeconds = o.m_sessionSweepIntervalSeconds;
    m_maxPayloadBytes = o.m_maxPayloadBytes;
    m_listRecursive = o.m_listRecursive;
    m_preserveTempOnError = o.m_preserveTempOnError;
    m_digestAlgorithm = std::move(o.m_digestAlgorithm);
    return *this;
}

bool TransferServerConfig::operator==(const TransferServerConfig & other) const {
    return
        (m_host == other.m_host) &&
        (m_port == other.m_port) &&
        (m_rootDir == other.m_rootDir) &&
        (m_tempDir == other.m_tempDir) &&
        (m_serverType == other.m_serverType) &&
        (m_ioMode == other.m_ioMode) &&
        (m_chunkSize == other.m_chunkSize) &&
        (m_maxRetries == other.m_maxRetries) &&
        (m_sessionTimeoutSeconds == other.m_sessionTimeoutSeconds) &&
        (m_sessionSweepIntervalSeconds == other.m_sessionSweepIntervalSeconds) &&
        (m_maxPayloadBytes == other.m_maxPayloadBytes) &&
        (m_listRecursive == other.m_listRecursive) &&
        (m_preserveTempOnError == other.m_preserveTempOnError) &&
        (m_digestAlgorithm == other.m_digestAlgorithm);
}

const std::vector<std::string> & TransferServerConfig::GetValidServerTypes() {
    return VALID_SERVER_TYPES;
}
const std::vector<std::string> & TransferServerConfig::GetValidIoModes() {
    return VALID_IO_MODES;
}
const std::vector<std::string> & TransferServerConfig::GetValidDigestAlgorithms() {
    return VALID_DIGEST_ALGORITHMS;
}

std::string TransferServerConfig::NormalizeServerType(const std::string & serverType) {
    if (serverType == "protocol") {
        return "sequential";
    }
    else if (serverType == "select") {
        return "multiplexed";
    }
    return serverType;
}

std::string TransferServerConfig::GetDefaultIoModeForServerType(const std::string & serverType) {
    const std::string canonical = NormalizeServerType(serverType);
    if (canonical == "threaded") {
        return "threaded";
    }
    else if (canonical == "multiplexed") {
        return "nonblocking";
    }
    else if (canonical == "async") {
        return "async";
    }
    return "single";
}

bool TransferServerConfig::Validate() const {
    if (!IsValidName(VALID_SERVER_TYPES, NormalizeServerType(m_serverType))) {
        LOG_ERROR(subprocess) << "error parsing JSON TransferServer config: invalid serverType " << m_serverType;
        return false;
    }
    if (!IsValidName(VALID_IO_MODES, m_ioMode)) {
        LOG_ERROR(subprocess) << "error parsing JSON TransferServer config: invalid ioMode " << m_ioMode;
        return false;
    }
    if (!IsValidName(VALID_DIGEST_ALGORITHMS, m_digestAlgorithm)) {
        LOG_ERROR(subprocess) << "error parsing JSON TransferServer config: invalid digestAlgorithm " << m_digestAlgorithm;
        return false;
    }
    if (m_port > UINT16_MAX) {
        LOG_ERROR(subprocess) << "error parsing JSON TransferServer config: port " << m_port << " does not fit in 16 bits";
        return false;
    }
    if ((m_chunkSize == 0) || (m_chunkSize > m_maxPayloadBytes)) {
        LOG_ERROR(subprocess) << "error parsing JSON TransferServer config: chunkSize " << m_chunkSize
            << " must be non-zero and at most maxPayloadBytes (" << m_maxPayloadBytes << ")";
        return false;
    }
    if (m_rootDir.empty() || m_tempDir.empty()) {
        LOG_ERROR(subprocess) << "error parsing JSON TransferServer config: rootDir and tempDir must be defined";
        return false;
    }
    if (m_sessionSweepIntervalSeconds == 0) {
        LOG_ERROR(subprocess) << "error parsing JSON TransferServer config: sessionSweepIntervalSeconds must be non-zero";
        return false;
    }
    if (NormalizeServerType(m_serverType) != m_serverType) {
        LOG_INFO(subprocess) << "serverType " << m_serverType << " is an alias of " << NormalizeServerType(m_serverType);
    }
    if (GetDefaultIoModeForServerType(m_serverType) != m_ioMode) {
        LOG_WARNING(subprocess) << "ioMode " << m_ioMode << " does not match serverType " << m_serverType
            << " (expected " << GetDefaultIoModeForServerType(m_serverType) << ")";
    }
    return true;
}

bool TransferServerConfig::SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) {
    try {
        m_host = pt.get<std::string>("host", m_host);
        m_port = pt.get<uint32_t>("port", m_port);
        m_rootDir = pt.get<std::string>("rootDir", m_rootDir);
        m_tempDir = pt.get<std::string>("tempDir", m_tempDir);
        m_serverType = pt.get<std::string>("serverType", m_serverType);
        m_ioMode = pt.get<std::string>("ioMode", m_ioMode);
        m_chunkSize = pt.get<uint32_t>("chunkSize", m_chunkSize);
        m_maxRetries = pt.get<uint32_t>("maxRetries", m_maxRetries);
        m_sessionTimeoutSeconds = pt.get<uint64_t>("sessionTimeoutSeconds", m_sessionTimeoutSeconds);
        m_sessionSweepIntervalSeconds = pt.get<uint64_t>("sessionSweepIntervalSeconds", m_sessionSweepIntervalSeconds);
        m_maxPayloadBytes = pt.get<uint32_t>("maxPayloadBytes", m_maxPayloadBytes);
        m_listRecursive = pt.get<bool>("listRecursive", m_listRecursive);
        m_preserveTempOnError = pt.get<bool>("preserveTempOnError", m_preserveTempOnError);
        m_digestAlgorithm = pt.get<std::string>("digestAlgorithm", m_digestAlgorithm);
    }
    catch (const boost::property_tree::ptree_error & e) {
        LOG_ERROR(subprocess) << "error parsing JSON TransferServer config: " << e.what();
        return false;
    }

    return Validate();
}

TransferServerConfig_ptr TransferServerConfig::CreateFromJson(const std::string& jsonString, bool verifyNoUnusedJsonKeys) {
    boost::property_tree::ptree pt;
    TransferServerConfig_ptr config; //NULL
    if (GetPropertyTreeFromJsonString(jsonString, pt)) { //prints message if failed
        config = CreateFromPtree(pt);
        if (config && verifyNoUnusedJsonKeys) {
            std::string unknownKeyPath;
            if (config->FindUnknownKey(pt, "transferServerConfig", unknownKeyPath)) {
                LOG_ERROR(subprocess) << "unknown key " << unknownKeyPath << " in TransferServer config JSON";
                config.reset(); //NULL
            }
        }
    }
    return config;
}

TransferServerConfig_ptr TransferServerConfig::CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath, bool verifyNoUnusedJsonKeys) {
    boost::property_tree::ptree pt;
    TransferServerConfig_ptr config; //NULL
    if (GetPropertyTreeFromJsonFilePath(jsonFilePath, pt)) { //prints message if failed
        config = CreateFromPtree(pt);
        if (config && verifyNoUnusedJsonKeys) {
            std::string unknownKeyPath;
            if (config->FindUnknownKey(pt, "transferServerConfig", unknownKeyPath)) {
                LOG_ERROR(subprocess) << "unknown key " << unknownKeyPath << " in " << jsonFilePath;
                config.reset(); //NULL
            }
        }
    }
    return config;
}

TransferServerConfig_ptr TransferServerConfig::CreateFromPtree(const boost::property_tree::ptree & pt) {

    TransferServerConfig_ptr ptrConfig = std::make_shared<TransferServerConfig>();
    if (!ptrConfig->SetValuesFromPropertyTree(pt)) {
        ptrConfig = TransferServerConfig_ptr(); //failed, so delete and set it NULL
    }
    return ptrConfig;
}

boost::property_tree::ptree TransferServerConfig::GetNewPropertyTree() const {
    boost::property_tree::ptree pt;
    pt.put("host", m_host);
    pt.put("port", m_port);
    pt.put("rootDir", m_rootDir);
    pt.put("tempDir", m_tempDir);
    pt.put("serverType", m_serverType);
    pt.put("ioMode", m_ioMode);
    pt.put("chunkSize", m_chunkSize);
    pt.put("maxRetries", m_maxRetries);
    pt.put("sessionTimeoutSeconds", m_sessionTimeoutSeconds);
    pt.put("sessionSweepIntervalSeconds", m_sessionSweepIntervalSeconds);
    pt.put("maxPayloadBytes", m_maxPayloadBytes);
    pt.put("listRecursive", m_listRecursive);
    pt.put("preserveTempOnError", m_preserveTempOnError);
    pt.put("digestAlgorithm", m_digestAlgorithm);
    return pt;
}
