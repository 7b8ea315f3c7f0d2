/**
 * @file ThreadNamer.h
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
 * This ThreadNamer static class sets the names of the CFTP worker threads
 * (accept loops, per-connection workers, io_service threads) so they can be
 * told apart in a debugger or in top -H.
 * Linux truncates names to 15 characters.
 */

#ifndef _THREAD_NAMER_H
#define _THREAD_NAMER_H 1

#include <boost/thread.hpp>
#include <boost/asio/io_service.hpp>
#include <string>
#include "cftp_util_export.h"

class ThreadNamer {
public:

    ThreadNamer() = delete;

    /** Set the thread name for boost::thread.
     *
     * @param thread The already created boost::thread to set the name of.
     * @param threadName The name to assign to the thread.
     */
    CFTP_UTIL_EXPORT static void SetThreadName(boost::thread& thread, const std::string& threadName);

    /** Set the thread name for the current/calling thread.
     *
     * @param threadName The name to assign to the current/calling thread.
     */
    CFTP_UTIL_EXPORT static void SetThisThreadName(const std::string& threadName);

    /** Post a naming request to the thread(s) running ioService.
     *
     * @param ioService The io_service whose next run() caller gets named.
     * @param threadName The name to assign.
     */
    CFTP_UTIL_EXPORT static void SetIoServiceThreadName(boost::asio::io_service& ioService, const std::string& threadName);
};



#endif //_THREAD_NAMER_H
