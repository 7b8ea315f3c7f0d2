/**
 * @file TestSignalHandler.cpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <boost/test/unit_test.hpp>
#include <boost/bind/bind.hpp>
#include <boost/thread.hpp>
#include "SignalHandler.h"
#include <atomic>
#include <csignal>

static void CountSignal(std::atomic<unsigned int> * count) {
    ++(*count);
}

BOOST_AUTO_TEST_CASE(SignalHandlerPollTestCase)
{
    std::atomic<unsigned int> count(0);
    SignalHandler sigHandler(boost::bind(&CountSignal, &count));
    sigHandler.Start(false);
    BOOST_REQUIRE(!sigHandler.PollOnce());
    BOOST_REQUIRE_EQUAL(sigHandler.GetLastSignalNumber(), 0);

    BOOST_REQUIRE_EQUAL(std::raise(SIGTERM), 0);
    bool received = false;
    for (unsigned int i = 0; (i < 100) && (!received); ++i) {
        received = sigHandler.PollOnce();
        if (!received) {
            boost::this_thread::sleep(boost::posix_time::milliseconds(10));
        }
    }
    BOOST_REQUIRE(received);
    BOOST_REQUIRE_EQUAL(count.load(), 1);
    BOOST_REQUIRE_EQUAL(sigHandler.GetLastSignalNumber(), SIGTERM);
    sigHandler.Stop();
}

BOOST_AUTO_TEST_CASE(SignalHandlerDedicatedThreadTestCase)
{
    std::atomic<unsigned int> count(0);
    SignalHandler sigHandler(boost::bind(&CountSignal, &count));
    sigHandler.Start(true);
    //the handler re-arms, so both signals are seen
    BOOST_REQUIRE_EQUAL(std::raise(SIGINT), 0);
    for (unsigned int i = 0; (i < 200) && (count.load() < 1); ++i) {
        boost::this_thread::sleep(boost::posix_time::milliseconds(10));
    }
    BOOST_REQUIRE_EQUAL(std::raise(SIGINT), 0);
    for (unsigned int i = 0; (i < 200) && (count.load() < 2); ++i) {
        boost::this_thread::sleep(boost::posix_time::milliseconds(10));
    }
    BOOST_REQUIRE_EQUAL(count.load(), 2);
    BOOST_REQUIRE_EQUAL(sigHandler.GetLastSignalNumber(), SIGINT);
    sigHandler.Stop();
}
