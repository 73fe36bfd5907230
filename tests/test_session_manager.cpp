//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_session_manager.cpp
// Purpose: GoogleTests for session creation, lookup, expiry and removal
//==========================================================================================================

#include <gtest/gtest.h>

#include <set>
#include <thread>

#include "toolgate/SessionManager.h"

using namespace toolgate;

namespace {

Session createSession(SessionManager& sm, const std::string& version = "2025-06-18") {
    return sm.Create(version, Implementation{"client", "1.0"}, JSONValue{JSONValue::Object{}}, JSONValue{JSONValue::Object{}});
}

} // namespace

TEST(SessionManager, CreateAssignsUniqueIds) {
    SessionManager sm;
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        ids.insert(createSession(sm).id);
    }
    EXPECT_EQ(ids.size(), 50u);
    EXPECT_EQ(sm.Count(), 50u);
    EXPECT_EQ(sm.IdleTimeout(), std::chrono::minutes(30));
}

TEST(SessionManager, FindReturnsStoredVersionVerbatim) {
    SessionManager sm;
    auto s = createSession(sm, "1.0");
    auto found = sm.Find(s.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->protocolVersion, "1.0");
    EXPECT_EQ(found->clientInfo.name, "client");
    EXPECT_FALSE(found->initializedNotified);
}

TEST(SessionManager, UnknownIdIsNotFound) {
    SessionManager sm;
    EXPECT_FALSE(sm.Find("no-such-session").has_value());
    EXPECT_FALSE(sm.MarkInitialized("no-such-session"));
    EXPECT_FALSE(sm.Remove("no-such-session"));
}

TEST(SessionManager, MarkInitializedIsVisibleOnLookup) {
    SessionManager sm;
    auto s = createSession(sm);
    EXPECT_TRUE(sm.MarkInitialized(s.id));
    EXPECT_TRUE(sm.Find(s.id)->initializedNotified);
}

TEST(SessionManager, RemoveDiscardsSession) {
    SessionManager sm;
    auto s = createSession(sm);
    EXPECT_TRUE(sm.Remove(s.id));
    EXPECT_FALSE(sm.Find(s.id).has_value());
    EXPECT_EQ(sm.Count(), 0u);
}

TEST(SessionManager, IdleSessionsExpire) {
    SessionManager sm(std::chrono::milliseconds(30));
    auto s = createSession(sm);
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    EXPECT_FALSE(sm.Find(s.id).has_value());
    EXPECT_EQ(sm.Count(), 0u);
}

TEST(SessionManager, LookupRefreshesIdleTimer) {
    SessionManager sm(std::chrono::milliseconds(200));
    auto s = createSession(sm);
    for (int i = 0; i < 5; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        ASSERT_TRUE(sm.Find(s.id).has_value());
    }
}

TEST(SessionManager, NonExpiringSessionOutlivesIdleTimeout) {
    SessionManager sm(std::chrono::milliseconds(30));
    auto pinned = sm.Create("2025-06-18", Implementation{"stdio", "1"}, JSONValue{JSONValue::Object{}},
                            JSONValue{JSONValue::Object{}}, false);
    auto idle = createSession(sm);
    EXPECT_FALSE(pinned.expires);
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    EXPECT_EQ(sm.PurgeExpired(), 1u);
    EXPECT_TRUE(sm.Find(pinned.id).has_value());
    EXPECT_FALSE(sm.Find(idle.id).has_value());
}

TEST(SessionManager, ZeroTimeoutNeverExpires) {
    SessionManager sm(std::chrono::milliseconds(0));
    createSession(sm);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(sm.PurgeExpired(), 0u);
    EXPECT_EQ(sm.Count(), 1u);
}

TEST(SessionManager, ConcurrentCreateAndFind) {
    SessionManager sm;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&sm]() {
            for (int i = 0; i < 100; ++i) {
                auto s = createSession(sm);
                auto f = sm.Find(s.id);
                EXPECT_TRUE(f.has_value());
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(sm.Count(), 800u);
}
