/**
 * @file ThreadNamer.cpp
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

#include "ThreadNamer.h"
#include <boost/asio/post.hpp>
#include <boost/bind/bind.hpp>
#include <pthread.h>
#include <sys/prctl.h>
#include "Logger.h"

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::none;

//pthread names are limited to 16 bytes including the terminating null
static std::string TruncateThreadName(const std::string& threadName) {
    if (threadName.size() > 15) {
        return threadName.substr(0, 15);
    }
    return threadName;
}

void ThreadNamer::SetIoServiceThreadName(boost::asio::io_service& ioService, const std::string& threadName) {
    boost::asio::post(ioService, boost::bind(&ThreadNamer::SetThisThreadName, threadName));
}
void ThreadNamer::SetThreadName(boost::thread& thread, const std::string& threadName) {
    const int ret = pthread_setname_np(thread.native_handle(), TruncateThreadName(threadName).c_str());
    if (ret != 0) {
        LOG_WARNING(subprocess) << "cannot set thread name " << threadName << " (error " << ret << ")";
    }
}
void ThreadNamer::SetThisThreadName(const std::string& threadName) {
    prctl(PR_SET_NAME, TruncateThreadName(threadName).c_str(), 0, 0, 0);
}
