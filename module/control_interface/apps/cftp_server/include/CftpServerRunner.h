/**
 * @file CftpServerRunner.h
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
 * This CftpServerRunner class is used for launching a CFTP transfer server and
 * its HTTP control interface into their own process.
 * The CftpServerRunner provides a blocking Run function which builds the
 * TransferServerConfig from the command line arguments (and an optional JSON
 * config file), starts the server unless told not to, and serves the control
 * interface until SIGINT, SIGTERM or SIGQUIT.
 */

#ifndef _CFTP_SERVER_RUNNER_H
#define _CFTP_SERVER_RUNNER_H 1

#include <stdint.h>
#include <atomic>
#include <boost/program_options.hpp>
#include "TransferServerConfig.h"

class CftpServerRunner {
public:
    CftpServerRunner();
    ~CftpServerRunner();
    bool Run(int argc, const char* const argv[], std::atomic<bool>& running, bool useSignalHandler);

    /// Applies the command line overrides to config; false if the result does not validate.
    static bool ApplyCommandLineOverrides(const boost::program_options::variables_map& vm, TransferServerConfig& config);

private:
    void MonitorExitKeypressThreadFunction();

    std::atomic<bool> m_runningFromSigHandler;
};


#endif //_CFTP_SERVER_RUNNER_H
