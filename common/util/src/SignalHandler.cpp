/**
 * @file SignalHandler.cpp
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

#include "SignalHandler.h"
#include "Logger.h"
#include "ThreadNamer.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>
#include <signal.h>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::none;

SignalHandler::SignalHandler(boost::function<void () > handleSignalFunction) :
    m_ioService(),
    m_signals(m_ioService),
    m_handleSignalFunction(handleSignalFunction),
    m_lastSignalNumber(0)
{
    m_signals.add(SIGINT);
    m_signals.add(SIGTERM);
#if defined(SIGQUIT)
    m_signals.add(SIGQUIT);
#endif // defined(SIGQUIT)
}

SignalHandler::~SignalHandler() {
    Stop();
}

void SignalHandler::Start(bool useDedicatedThread) {
    m_signals.async_wait(boost::bind(&SignalHandler::HandleSignal, this,
        boost::asio::placeholders::error, boost::asio::placeholders::signal_number));
    if (useDedicatedThread && (!m_ioServiceThreadPtr)) {
        m_ioServiceThreadPtr = boost::make_unique<boost::thread>(boost::bind(&boost::asio::io_service::run, &m_ioService));
        ThreadNamer::SetIoServiceThreadName(m_ioService, "ioServiceSignal");
    }
}

void SignalHandler::Stop() {
    m_ioService.stop();
    if (m_ioServiceThreadPtr) {
        try {
            m_ioServiceThreadPtr->join();
        }
        catch (const boost::thread_resource_error &) {
            LOG_ERROR(subprocess) << "error stopping SignalHandler io_service thread";
        }
        m_ioServiceThreadPtr.reset();
    }
}

bool SignalHandler::PollOnce() {
    return (m_ioService.poll_one() > 0);
}

int SignalHandler::GetLastSignalNumber() const noexcept {
    return m_lastSignalNumber;
}

void SignalHandler::HandleSignal(const boost::system::error_code & error, int signalNumber) {
    if (error) {
        if (error != boost::asio::error::operation_aborted) {
            LOG_ERROR(subprocess) << "error waiting for signals: " << error.message();
        }
        return;
    }
    m_lastSignalNumber = signalNumber;
    LOG_INFO(subprocess) << "received signal " << signalNumber << ", stopping";
    m_handleSignalFunction();
    //keep listening so that a second signal is also reported
    m_signals.async_wait(boost::bind(&SignalHandler::HandleSignal, this,
        boost::asio::placeholders::error, boost::asio::placeholders::signal_number));
}
