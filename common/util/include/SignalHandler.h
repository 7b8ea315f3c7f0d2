/**
 * @file SignalHandler.h
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
 * This SignalHandler class waits for SIGINT, SIGTERM or SIGQUIT and calls a
 * custom function when one arrives.  The cftp-server runner uses it to stop
 * the transfer server and control interface cleanly.
 */

#ifndef SIGNAL_HANDLER_H
#define SIGNAL_HANDLER_H 1
#include <atomic>
#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include <boost/function.hpp>
#include <memory>
#include "cftp_util_export.h"

class SignalHandler {
private:
    SignalHandler();
public:
    /**
     * Register the stop signals (SIGINT, SIGTERM and SIGQUIT where defined).
     * @param handleSignalFunction Called once per received signal.
     */
    CFTP_UTIL_EXPORT SignalHandler(boost::function<void() > handleSignalFunction);

    /// Calls Stop()
    CFTP_UTIL_EXPORT ~SignalHandler();

    /** Start waiting for a signal.
     *
     * @param useDedicatedThread Whether to spawn a separate thread for the I/O.
     */
    CFTP_UTIL_EXPORT void Start(bool useDedicatedThread = true);

    /// Stop waiting and join the dedicated thread, if any.
    CFTP_UTIL_EXPORT void Stop();

    /** Poll for a signal.
     *
     * Only call when NOT using a dedicated I/O thread.
     * @return True if a signal arrived since last checked, or False otherwise.
     */
    CFTP_UTIL_EXPORT bool PollOnce();

    /// The last signal received, or 0 if none
    CFTP_UTIL_EXPORT int GetLastSignalNumber() const noexcept;

private:
    void HandleSignal(const boost::system::error_code & error, int signalNumber);

private:
    boost::asio::io_service m_ioService;
    boost::asio::signal_set m_signals;
    std::unique_ptr<boost::thread> m_ioServiceThreadPtr;
    boost::function<void() > m_handleSignalFunction;
    std::atomic<int> m_lastSignalNumber;
};
#endif
