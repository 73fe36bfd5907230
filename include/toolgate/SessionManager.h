//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.h
// Purpose: Issues and tracks sessions created by a successful initialize
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "toolgate/Protocol.h"

namespace toolgate {

//==========================================================================================================
// Session
// Purpose: Negotiated state for one logical connection.
// Fields:
//   id: Opaque UUID string returned to the client.
//   protocolVersion: Version string exactly as the client requested it.
//   clientCapabilities / serverCapabilities: Objects exchanged during initialize.
//   initializedNotified: Set once notifications/initialized arrives.
//   expires: False for sessions that live until their connection closes (stdio).
//==========================================================================================================
struct Session {
    std::string id;
    std::string protocolVersion;
    JSONValue clientCapabilities;
    JSONValue serverCapabilities;
    Implementation clientInfo;
    std::chrono::steady_clock::time_point createdAt;
    std::chrono::steady_clock::time_point lastSeen;
    bool initializedNotified{false};
    bool expires{true};
};

//==========================================================================================================
// SessionManager
// Purpose: Thread-safe table of live sessions with idle expiry.
// Notes:
//   One coarse mutex guards the table. Lookups return copies so callers never hold references into it.
//   An idle timeout of zero disables expiry.
//==========================================================================================================
class SessionManager {
public:
    explicit SessionManager(std::chrono::milliseconds idleTimeout = std::chrono::minutes(30));
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Creates a session with a fresh id and returns a copy of it. With expires false the idle timeout
    // does not apply; the session stays until Remove().
    Session Create(const std::string& protocolVersion,
                   const Implementation& clientInfo,
                   const JSONValue& clientCapabilities,
                   const JSONValue& serverCapabilities,
                   bool expires = true);

    //======================================================================================================
    // Find
    // Purpose: Looks up a live session and refreshes its lastSeen time. Expired sessions are purged first.
    // Returns:
    //   A copy of the session, or std::nullopt when the id is unknown or expired.
    //======================================================================================================
    std::optional<Session> Find(const std::string& id);

    // Returns false when the session does not exist.
    bool MarkInitialized(const std::string& id);
    bool Remove(const std::string& id);

    std::size_t Count() const;

    // Returns the number of sessions removed.
    std::size_t PurgeExpired();

    std::chrono::milliseconds IdleTimeout() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolgate
