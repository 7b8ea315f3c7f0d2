/**
 * @file ControlHttpServer.h
 *
 * @copyright Copyright © 2022 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 *
 * @section DESCRIPTION
 * This ControlHttpServer class serves the ControlApi over plain HTTP/1.1 using
 * Boost.Beast on a single io_service thread.  Every response body is JSON.
 */

#ifndef CONTROL_HTTP_SERVER_H
#define CONTROL_HTTP_SERVER_H 1

#include <cstdint>
#include <memory>
#include <string>
#include <boost/core/noncopyable.hpp>
#include "ControlApi.h"
#include "control_interface_lib_export.h"

class ControlHttpServer : private boost::noncopyable {
public:
    CONTROL_INTERFACE_LIB_EXPORT ControlHttpServer();
    CONTROL_INTERFACE_LIB_EXPORT ~ControlHttpServer();

    /// Port 0 binds an ephemeral port (see GetBoundPort).
    CONTROL_INTERFACE_LIB_EXPORT bool Init(const std::string & bindAddress, uint16_t port, ControlApi & controlApi);
    CONTROL_INTERFACE_LIB_EXPORT void Stop();
    CONTROL_INTERFACE_LIB_EXPORT uint16_t GetBoundPort() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_pimpl;
};

#endif //CONTROL_HTTP_SERVER_H
