/**
 * @file CftpVersion.hpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
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
 * Defines the current CFTP software version (logged at process start).
 * It is based off of boost/version.hpp
 */

#ifndef CFTP_VERSION_HPP
#define CFTP_VERSION_HPP

 //  CFTP_VERSION % 100 is the patch level
 //  CFTP_VERSION / 100 % 1000 is the minor version
 //  CFTP_VERSION / 100000 is the major version
 //  00.000.00 where MAJOR_MINOR_PATCH

#define CFTP_VERSION 100000

#define CFTP_VERSION_PATCH (CFTP_VERSION % 100)
#define CFTP_VERSION_MINOR ((CFTP_VERSION / 100) % 1000)
#define CFTP_VERSION_MAJOR (CFTP_VERSION / 100000)

#endif
