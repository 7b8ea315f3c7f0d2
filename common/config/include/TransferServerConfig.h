/**
 * @file TransferServerConfig.h
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
 * The TransferServerConfig class contains all the config parameters for
 * instantiating a single CFTP transfer server (listening address, storage
 * directories, concurrency backend, chunking and session policies), and it
 * provides JSON serialization and deserialization capability.
 */

#ifndef TRANSFER_SERVER_CONFIG_H
#define TRANSFER_SERVER_CONFIG_H 1

#include <string>
#include <memory>
#include <vector>
#include <cstdint>
#include "JsonSerializable.h"
#include "config_lib_export.h"

class TransferServerConfig;
typedef std::shared_ptr<TransferServerConfig> TransferServerConfig_ptr;

class TransferServerConfig : public JsonSerializable {


public:
    CONFIG_LIB_EXPORT TransferServerConfig();
    CONFIG_LIB_EXPORT ~TransferServerConfig();

    //a copy constructor: X(const X&)
    CONFIG_LIB_EXPORT TransferServerConfig(const TransferServerConfig& o);

    //a move constructor: X(X&&)
    CONFIG_LIB_EXPORT TransferServerConfig(TransferServerConfig&& o) noexcept;

    //a copy assignment: operator=(const X&)
    CONFIG_LIB_EXPORT TransferServerConfig& operator=(const TransferServerConfig& o);

    //a move assignment: operator=(X&&)
    CONFIG_LIB_EXPORT TransferServerConfig& operator=(TransferServerConfig&& o) noexcept;

    CONFIG_LIB_EXPORT bool operator==(const TransferServerConfig & other) const;

    CONFIG_LIB_EXPORT static TransferServerConfig_ptr CreateFromPtree(const boost::property_tree::ptree & pt);
    CONFIG_LIB_EXPORT static TransferServerConfig_ptr CreateFromJson(const std::string & jsonString, bool verifyNoUnusedJsonKeys = true);
    CONFIG_LIB_EXPORT static TransferServerConfig_ptr CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath, bool verifyNoUnusedJsonKeys = true);
    CONFIG_LIB_EXPORT virtual boost::property_tree::ptree GetNewPropertyTree() const override;

    /** Load every key from the tree, falling back to the current value for absent keys,
     * then validate the result.
     *
     * @param pt The property tree to load.
     * @return True if all present values parsed and the resulting config is valid, or False otherwise.
     */
    CONFIG_LIB_EXPORT virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) override;

    /// Checks the names against their valid lists and the numeric ranges (logs the first failure)
    CONFIG_LIB_EXPORT bool Validate() const;

    /// Maps the original backend names ("protocol", "select") onto the canonical ones, returns the input otherwise
    CONFIG_LIB_EXPORT static std::string NormalizeServerType(const std::string & serverType);

    /// The ioMode that normally accompanies a (canonical) serverType
    CONFIG_LIB_EXPORT static std::string GetDefaultIoModeForServerType(const std::string & serverType);

    CONFIG_LIB_EXPORT static const std::vector<std::string> & GetValidServerTypes();
    CONFIG_LIB_EXPORT static const std::vector<std::string> & GetValidIoModes();
    CONFIG_LIB_EXPORT static const std::vector<std::string> & GetValidDigestAlgorithms();
public:

    std::string m_host;
    uint32_t m_port; //wider than 16 bits so that an out of range json value can be rejected
    std::string m_rootDir;
    std::string m_tempDir;
    std::string m_serverType;
    std::string m_ioMode;
    uint32_t m_chunkSize;
    uint32_t m_maxRetries;
    uint64_t m_sessionTimeoutSeconds;
    uint64_t m_sessionSweepIntervalSeconds;
    uint32_t m_maxPayloadBytes;
    bool m_listRecursive;
    bool m_preserveTempOnError;
    std::string m_digestAlgorithm;
};

#endif // TRANSFER_SERVER_CONFIG_H
