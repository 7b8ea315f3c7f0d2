/**
 * @file CftpClientMain.cpp
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

#include "CftpClientRunner.h"
#include "Logger.h"
#include "ThreadNamer.h"

int main(int argc, const char* argv[]) {

    cftp::Logger::initializeWithProcess(cftp::Logger::Process::transferclient);
    ThreadNamer::SetThisThreadName("CftpClientMain");
    CftpClientRunner runner;
    return runner.Run(argc, argv) ? 0 : 1;

}
