/**
 * @file auth_api.cpp
 * @brief AuthApi lookups and per-thread snapshot sessions
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "auth_api.hpp"
#include "auth_error.hpp"
#include "auth_logger.hpp"
#include <map>

namespace authcore {

namespace {

struct SessionPin {
    SnapshotPtr snapshot;
    int depth = 0;
};

// Keyed by AuthApi so that sessions on different instances do not interfere
thread_local std::map<const AuthApi*, SessionPin> t_session_pins;

} // namespace

// ============================================================================
// Session
// ============================================================================

AuthApi::Session::Session(const AuthApi& api) : api_(api) {
    auto it = t_session_pins.find(&api_);
    if (it == t_session_pins.end()) {
        // the pin exists only once a snapshot was obtained
        SnapshotPtr latest = api_.latestSnapshot();
        it = t_session_pins.emplace(&api_, SessionPin{std::move(latest), 0}).first;
    }
    ++it->second.depth;
    snapshot_ = it->second.snapshot;
}

AuthApi::Session::~Session() {
    auto it = t_session_pins.find(&api_);
    if (it != t_session_pins.end() && --it->second.depth == 0) {
        t_session_pins.erase(it);
    }
}

// ============================================================================
// AuthApi
// ============================================================================

AuthApi::AuthApi(std::shared_ptr<SnapshotPrefetcher> prefetcher, std::set<std::string> fqdnOnlyCategories)
    : prefetcher_(std::move(prefetcher)), mode_(prefetcher_->compilerMode()),
      fqdn_only_categories_(std::move(fqdnOnlyCategories)) {}

AuthApi::AuthApi(SnapshotPtr snapshot, CompilerMode mode, std::set<std::string> fqdnOnlyCategories)
    : fixed_(std::move(snapshot)), mode_(mode), fqdn_only_categories_(std::move(fqdnOnlyCategories)) {
    if (!fixed_) throw AuthCoreError(ErrorCode::INVALID_ARGUMENT, "AuthApi needs a snapshot");
}

AuthApi::~AuthApi() = default;

SnapshotPtr AuthApi::latestSnapshot() const {
    if (fixed_) return fixed_;
    SnapshotPtr snapshot = prefetcher_->current();
    if (snapshot) return snapshot;
    LOG_DEBUG("AuthApi", "Waiting for the first snapshot");
    return prefetcher_->waitForFirstSnapshot();
}

SnapshotPtr AuthApi::currentSnapshot() const {
    auto it = t_session_pins.find(this);
    if (it != t_session_pins.end()) return it->second.snapshot;
    return latestSnapshot();
}

Result<AuthData> AuthApi::checkCredentials(const std::string& orgId, const std::string& userId) const {
    auto users = views().userIdsToOrgIds();
    auto it = users->find(userId);
    if (it == users->end()) {
        return Err<AuthData>(ErrorCode::UNKNOWN_USER, "unknown user");
    }
    if (it->second != orgId) {
        return Err<AuthData>(ErrorCode::ORG_MISMATCH, "user does not belong to the organization");
    }
    return AuthData{orgId, userId};
}

AuthData AuthApi::authenticate(const std::string& orgId, const std::string& userId) const {
    auto result = checkCredentials(orgId, userId);
    if (!result) {
        LOG_INFO("AuthApi", "Authentication failed: " + errorCodeToString(result.error().code));
        throw AuthenticationError("authentication failed: " + result.error().message, result.error().code);
    }
    return result.value();
}

std::optional<AccessInfo> AuthApi::accessInfo(const std::string& orgId) const {
    auto infos = views().accessInfos();
    auto it = infos->find(orgId);
    if (it == infos->end()) return std::nullopt;
    return it->second;
}

std::shared_ptr<const OrgAccessInfos> AuthApi::orgIdsToAccessInfos() const {
    return views().accessInfos();
}

std::shared_ptr<const NotificationConfigs> AuthApi::orgIdsToNotificationConfigs() const {
    return views().notificationConfigs();
}

std::shared_ptr<const CombinedConfigs> AuthApi::orgIdsToCombinedConfigs() const {
    return views().combinedConfigs();
}

std::shared_ptr<const StringMap> AuthApi::orgIdsToActualNames() const {
    return views().actualNames();
}

std::shared_ptr<const StringMap> AuthApi::userIdsToOrgIds() const {
    return views().userIdsToOrgIds();
}

std::shared_ptr<const StringSet> AuthApi::orgIds() const {
    return views().orgIds();
}

std::shared_ptr<const StringSet> AuthApi::streamApiEnabledOrgIds() const {
    return views().streamApiEnabledOrgIds();
}

std::shared_ptr<const StringSet> AuthApi::streamApiDisabledOrgIds() const {
    return views().streamApiDisabledOrgIds();
}

std::shared_ptr<const StreamAccessInfos> AuthApi::sourceIdsToSubsToStreamApiAccessInfos() const {
    return views().streamAccessInfos();
}

std::shared_ptr<const NotificationAccessInfoMappings> AuthApi::sourceIdsToNotificationAccessInfoMappings() const {
    return views().notificationAccessInfoMappings();
}

std::shared_ptr<const InsideCriteriaResolver> AuthApi::insideCriteriaResolver() const {
    return views().insideCriteriaResolver();
}

std::shared_ptr<const AnonymizedSourceMapping> AuthApi::anonymizedSourceMapping() const {
    return views().anonymizedSourceMapping();
}

std::shared_ptr<const StringSet> AuthApi::dipAnonymizationDisabledSourceIds() const {
    return views().dipAnonymizationDisabledSourceIds();
}

InsideMatchResult AuthApi::matchInside(const InsideMatchInput& event) const {
    return insideCriteriaResolver()->match(event, fqdn_only_categories_);
}

} // namespace authcore
