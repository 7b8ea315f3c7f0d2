/**
 * @file TransferServerController.h
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
 * The TransferServerController class starts, stops and reports on at most one
 * running transfer server at a time.  It is thread safe so that the control
 * interface and the signal handler can both drive it.
 */

#ifndef TRANSFER_SERVER_CONTROLLER_H
#define TRANSFER_SERVER_CONTROLLER_H 1

#include <cstdint>
#include <memory>
#include <string>
#include <boost/thread/mutex.hpp>
#include "JsonSerializable.h"
#include "TransferServerBase.h"
#include "TransferServerConfig.h"
#include "control_interface_lib_export.h"

enum class SERVER_START_RESULT
{
    STARTED = 0,
    ALREADY_RUNNING,
    INVALID_CONFIG,
    START_FAILED
};

struct server_status_t : public JsonSerializable {
    bool running;
    std::string serverType;
    std::string ioMode;
    std::string host;
    uint16_t port;
    unsigned int activeConnections;

    CONTROL_INTERFACE_LIB_EXPORT server_status_t();
    CONTROL_INTERFACE_LIB_EXPORT bool operator==(const server_status_t & o) const;
    CONTROL_INTERFACE_LIB_EXPORT virtual boost::property_tree::ptree GetNewPropertyTree() const override;
    CONTROL_INTERFACE_LIB_EXPORT virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) override;
};

class TransferServerController {
public:
    CONTROL_INTERFACE_LIB_EXPORT TransferServerController();
    CONTROL_INTERFACE_LIB_EXPORT ~TransferServerController();
    TransferServerController(const TransferServerController&) = delete;
    TransferServerController& operator=(const TransferServerController&) = delete;

    CONTROL_INTERFACE_LIB_EXPORT SERVER_START_RESULT Start(const TransferServerConfig & config);
    /// @return False if no server was running.
    CONTROL_INTERFACE_LIB_EXPORT bool Stop();
    CONTROL_INTERFACE_LIB_EXPORT bool IsRunning() const;
    /// When stopped, reports the most recent configuration
    CONTROL_INTERFACE_LIB_EXPORT server_status_t GetStatus() const;
    CONTROL_INTERFACE_LIB_EXPORT static const char * StartResultToString(SERVER_START_RESULT result);

private:
    mutable boost::mutex m_mutex;
    std::unique_ptr<TransferServerBase> m_serverPtr;
    TransferServerConfig m_lastConfig;
};

#endif //TRANSFER_SERVER_CONTROLLER_H
