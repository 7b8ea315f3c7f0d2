/**
 * @file TestSessionRegistry.cpp
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
#include <boost/date_time/posix_time/posix_time.hpp>
#include "SessionRegistry.h"
#include <set>
#include <string>
#include <vector>

BOOST_AUTO_TEST_CASE(TransferSessionChunkTrackingTestCase)
{
    TransferSession session("id", "example.txt", 1000);
    BOOST_REQUIRE(session.GetStatus() == TRANSFER_SESSION_STATUS::PENDING);
    BOOST_REQUIRE_EQUAL(session.GetChunkSize(), 1000);
    checksum_field_t checksum;
    checksum.fill(0x5a);
    session.SetFileInfo(4500, 5, checksum);
    BOOST_REQUIRE(session.GetFileChecksum() == checksum);
    BOOST_REQUIRE_EQUAL(session.GetFirstMissingChunk(), 0);

    BOOST_REQUIRE(session.MarkChunkReceived(0));
    BOOST_REQUIRE(session.MarkChunkReceived(1));
    BOOST_REQUIRE(session.MarkChunkReceived(3));
    BOOST_REQUIRE(!session.MarkChunkReceived(3)); //duplicate
    BOOST_REQUIRE(!session.MarkChunkReceived(5)); //outside [0, total_chunks)
    BOOST_REQUIRE_EQUAL(session.GetNumChunksReceived(), 3);
    BOOST_REQUIRE_EQUAL(session.GetFirstMissingChunk(), 2);
    BOOST_REQUIRE(!session.AllChunksReceived());
    BOOST_REQUIRE_CLOSE(session.GetProgress(), 0.6, 0.0001);

    BOOST_REQUIRE(session.MarkChunkReceived(2));
    BOOST_REQUIRE(session.MarkChunkReceived(4));
    BOOST_REQUIRE(session.AllChunksReceived());
    BOOST_REQUIRE_EQUAL(session.GetFirstMissingChunk(), 5);

    //shrinking the file drops chunks that no longer exist
    session.SetFileInfo(2000, 2, checksum);
    BOOST_REQUIRE_EQUAL(session.GetNumChunksReceived(), 2);
    BOOST_REQUIRE(session.AllChunksReceived());
    BOOST_REQUIRE(!session.IsChunkReceived(4));

    //an empty transfer is complete once its session is
    TransferSession emptySession("id2", "empty.bin", 1000);
    BOOST_REQUIRE_EQUAL(emptySession.GetProgress(), 0.0);
    emptySession.SetStatus(TRANSFER_SESSION_STATUS::COMPLETED);
    BOOST_REQUIRE_EQUAL(emptySession.GetProgress(), 1.0);
    BOOST_REQUIRE_EQUAL(std::string(TransferSession::StatusToString(TRANSFER_SESSION_STATUS::EXPIRED)), "expired");
}

BOOST_AUTO_TEST_CASE(SessionRegistryCreateGetRemoveTestCase)
{
    SessionRegistry registry;
    TransferSession_ptr a = registry.CreateSession("a.txt", 8192);
    TransferSession_ptr b = registry.CreateSession("b.txt", 4096);
    BOOST_REQUIRE(a);
    BOOST_REQUIRE(b);
    BOOST_REQUIRE_NE(a->GetSessionId(), b->GetSessionId());
    BOOST_REQUIRE_EQUAL(a->GetSessionId().size(), 36); //canonical uuid text
    BOOST_REQUIRE_EQUAL(registry.GetNumActiveSessions(), 2);

    BOOST_REQUIRE(registry.GetSession(a->GetSessionId()) == a);
    BOOST_REQUIRE_EQUAL(registry.GetSession(b->GetSessionId())->GetFilename(), "b.txt");
    BOOST_REQUIRE(!registry.GetSession("no-such-session"));

    BOOST_REQUIRE(registry.RemoveSession(a->GetSessionId()));
    BOOST_REQUIRE(!registry.RemoveSession(a->GetSessionId()));
    BOOST_REQUIRE(!registry.GetSession(a->GetSessionId()));
    BOOST_REQUIRE_EQUAL(registry.GetNumActiveSessions(), 1);
    //a removed session stays usable by whoever still holds it
    BOOST_REQUIRE_EQUAL(a->GetFilename(), "a.txt");
}

static void CreateSessionsThreadFunc(SessionRegistry & registry, unsigned int numToCreate, std::vector<std::string> & idsOut) {
    idsOut.reserve(numToCreate);
    for (unsigned int i = 0; i < numToCreate; ++i) {
        idsOut.push_back(registry.CreateSession("file" + std::to_string(i), 1024)->GetSessionId());
    }
}

BOOST_AUTO_TEST_CASE(SessionRegistryConcurrentUniqueIdsTestCase)
{
    static constexpr unsigned int NUM_THREADS = 8;
    static constexpr unsigned int NUM_PER_THREAD = 1250;
    SessionRegistry registry;
    std::vector<std::vector<std::string> > idsPerThread(NUM_THREADS);
    boost::thread_group threads;
    for (unsigned int t = 0; t < NUM_THREADS; ++t) {
        threads.create_thread(boost::bind(&CreateSessionsThreadFunc, boost::ref(registry), NUM_PER_THREAD, boost::ref(idsPerThread[t])));
    }
    threads.join_all();

    std::set<std::string> uniqueIds;
    for (unsigned int t = 0; t < NUM_THREADS; ++t) {
        BOOST_REQUIRE_EQUAL(idsPerThread[t].size(), NUM_PER_THREAD);
        uniqueIds.insert(idsPerThread[t].begin(), idsPerThread[t].end());
    }
    BOOST_REQUIRE_EQUAL(uniqueIds.size(), 10000);
    BOOST_REQUIRE_EQUAL(registry.GetNumActiveSessions(), 10000);
}

struct ExpiredSessionCollector {
    std::vector<TransferSession_ptr> expired;
    void OnExpired(const TransferSession_ptr & session) {
        expired.push_back(session);
    }
};

BOOST_AUTO_TEST_CASE(SessionRegistrySweepIdleOnlyTestCase)
{
    SessionRegistry registry;
    ExpiredSessionCollector collector;
    registry.SetSessionExpiredCallback(boost::bind(&ExpiredSessionCollector::OnExpired, &collector, boost::placeholders::_1));

    const boost::posix_time::ptime now = boost::posix_time::microsec_clock::universal_time();
    TransferSession_ptr idle1 = registry.CreateSession("idle1", 100);
    TransferSession_ptr active = registry.CreateSession("active", 100);
    TransferSession_ptr idle2 = registry.CreateSession("idle2", 100);
    idle1->SetLastActivity(now - boost::posix_time::hours(2));
    idle2->SetLastActivity(now - boost::posix_time::minutes(61));
    active->SetLastActivity(now - boost::posix_time::minutes(59));
    active->SetStatus(TRANSFER_SESSION_STATUS::TRANSFERRING);

    BOOST_REQUIRE_EQUAL(registry.SweepIdleSessions(boost::posix_time::hours(1), now), 2);
    BOOST_REQUIRE_EQUAL(registry.GetNumActiveSessions(), 1);
    BOOST_REQUIRE(registry.GetSession(active->GetSessionId()) == active);
    BOOST_REQUIRE(active->GetStatus() == TRANSFER_SESSION_STATUS::TRANSFERRING);
    BOOST_REQUIRE(!registry.GetSession(idle1->GetSessionId()));
    BOOST_REQUIRE(!registry.GetSession(idle2->GetSessionId()));
    BOOST_REQUIRE(idle1->GetStatus() == TRANSFER_SESSION_STATUS::EXPIRED);
    BOOST_REQUIRE(idle2->GetStatus() == TRANSFER_SESSION_STATUS::EXPIRED);
    BOOST_REQUIRE_EQUAL(collector.expired.size(), 2);

    //nothing more to sweep
    BOOST_REQUIRE_EQUAL(registry.SweepIdleSessions(boost::posix_time::hours(1), now), 0);
    BOOST_REQUIRE_EQUAL(collector.expired.size(), 2);
}
