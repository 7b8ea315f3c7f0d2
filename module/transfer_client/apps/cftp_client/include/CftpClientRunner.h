/**
 * @file CftpClientRunner.h
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
 * This CftpClientRunner class is used for launching a one-shot CFTP client
 * into its own process: it connects to a transfer server, then lists a
 * directory and/or downloads (or resumes) one file as directed by the
 * command line arguments, and closes the connection.
 */

#ifndef _CFTP_CLIENT_RUNNER_H
#define _CFTP_CLIENT_RUNNER_H 1

#include <stdint.h>
#include <string>
#include "CftpProtocol.h"

class CftpClientRunner {
public:
    CftpClientRunner();
    ~CftpClientRunner();
    bool Run(int argc, const char* const argv[]);

    CFTP_ERROR_TYPE m_lastResult;

private:
    void OnDownloadProgress(const std::string & remoteFilename, double progress);

    int m_lastReportedPercent;
};


#endif //_CFTP_CLIENT_RUNNER_H
