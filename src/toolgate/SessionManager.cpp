//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.cpp
// Purpose: Session table with UUID identifiers and idle expiry
//==========================================================================================================

#include "toolgate/SessionManager.h"

#include <mutex>
#include <unordered_map>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"

namespace toolgate {

class SessionManager::Impl {
public:
    explicit Impl(std::chrono::milliseconds idle) : idleTimeout(idle) {}

    std::chrono::milliseconds idleTimeout;
    mutable std::mutex mutex;
    std::unordered_map<std::string, Session> sessions;
    boost::uuids::random_generator uuidGen;

    bool expired(const Session& s, std::chrono::steady_clock::time_point now) const {
        if (!s.expires || idleTimeout.count() <= 0) return false;
        return (now - s.lastSeen) >= idleTimeout;
    }

    // Caller holds mutex.
    std::size_t purgeLocked(std::chrono::steady_clock::time_point now) {
        std::size_t removed = 0;
        for (auto it = sessions.begin(); it != sessions.end();) {
            if (expired(it->second, now)) {
                LOG_DEBUG("Session expired: {}", it->first);
                it = sessions.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }
};

SessionManager::SessionManager(std::chrono::milliseconds idleTimeout)
    : pImpl(std::make_unique<Impl>(idleTimeout)) {}

SessionManager::~SessionManager() = default;

Session SessionManager::Create(const std::string& protocolVersion,
                               const Implementation& clientInfo,
                               const JSONValue& clientCapabilities,
                               const JSONValue& serverCapabilities,
                               bool expires) {
    const auto now = std::chrono::steady_clock::now();
    Session s;
    s.protocolVersion = protocolVersion;
    s.clientInfo = clientInfo;
    s.clientCapabilities = clientCapabilities;
    s.serverCapabilities = serverCapabilities;
    s.createdAt = now;
    s.lastSeen = now;
    s.expires = expires;

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->purgeLocked(now);
    do {
        s.id = boost::uuids::to_string(pImpl->uuidGen());
    } while (pImpl->sessions.find(s.id) != pImpl->sessions.end());
    pImpl->sessions.emplace(s.id, s);
    LOG_INFO("Session created: {} (protocol {}, client {} {})", s.id, protocolVersion, clientInfo.name, clientInfo.version);
    return s;
}

std::optional<Session> SessionManager::Find(const std::string& id) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->purgeLocked(now);
    auto it = pImpl->sessions.find(id);
    if (it == pImpl->sessions.end()) {
        return std::nullopt;
    }
    it->second.lastSeen = now;
    return it->second;
}

bool SessionManager::MarkInitialized(const std::string& id) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->sessions.find(id);
    if (it == pImpl->sessions.end()) {
        return false;
    }
    it->second.initializedNotified = true;
    it->second.lastSeen = std::chrono::steady_clock::now();
    return true;
}

bool SessionManager::Remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const bool removed = pImpl->sessions.erase(id) > 0;
    if (removed) {
        LOG_DEBUG("Session removed: {}", id);
    }
    return removed;
}

std::size_t SessionManager::Count() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->sessions.size();
}

std::size_t SessionManager::PurgeExpired() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->purgeLocked(std::chrono::steady_clock::now());
}

std::chrono::milliseconds SessionManager::IdleTimeout() const {
    return pImpl->idleTimeout;
}

} // namespace toolgate
