/**
 * @file auth_api.hpp
 * @brief Consumer facade over the published directory snapshot
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_AUTH_API_HPP
#define AUTHCORE_AUTH_API_HPP

#include "auth_views.hpp"
#include "prefetcher.hpp"
#include "result.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace authcore {

/** @brief Identity of an authenticated caller */
struct AuthData {
    std::string org_id;
    std::string user_id;

    bool operator==(const AuthData&) const = default;
};

/**
 * @class AuthApi
 * @brief Thread-safe lookups against the current snapshot
 *
 * The snapshot comes from a SnapshotPrefetcher, or is fixed at
 * construction. A lookup outside a Session uses whatever snapshot is
 * published at that moment; the first lookup blocks until the prefetcher
 * publishes its first snapshot.
 *
 * @code
 * AuthApi api(prefetcher);
 * {
 *     AuthApi::Session session(api);
 *     auto auth = api.authenticate("org.example", "user@example.com");
 *     auto info = api.accessInfo(auth.org_id);   // same snapshot as above
 * }
 * @endcode
 */
class AuthApi {
public:
    /**
     * @class Session
     * @brief Pins one snapshot for the calling thread
     *
     * Sessions nest: only the outermost one pins, and the pin is released
     * when it is destroyed. Lookups on the same AuthApi from the same thread
     * see the pinned snapshot even if a newer one is published meanwhile.
     */
    class Session {
    public:
        explicit Session(const AuthApi& api);
        ~Session();

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        const SnapshotPtr& snapshot() const { return snapshot_; }

    private:
        const AuthApi& api_;
        SnapshotPtr snapshot_;
    };

    explicit AuthApi(std::shared_ptr<SnapshotPrefetcher> prefetcher,
                     std::set<std::string> fqdnOnlyCategories = {});

    /** @brief Serve one fixed snapshot (tools and tests) */
    AuthApi(SnapshotPtr snapshot, CompilerMode mode,
            std::set<std::string> fqdnOnlyCategories = {});

    ~AuthApi();

    AuthApi(const AuthApi&) = delete;
    AuthApi& operator=(const AuthApi&) = delete;

    /** @brief Snapshot pinned by the thread's session, or the latest one */
    SnapshotPtr currentSnapshot() const;

    CompilerMode compilerMode() const { return mode_; }

    // ------------------------------------------------------------------------
    // Authentication
    // ------------------------------------------------------------------------

    /**
     * @brief Check that @p userId belongs to @p orgId
     * @return UNKNOWN_USER or ORG_MISMATCH on failure
     */
    Result<AuthData> checkCredentials(const std::string& orgId, const std::string& userId) const;

    /** @throws AuthenticationError if checkCredentials() fails */
    AuthData authenticate(const std::string& orgId, const std::string& userId) const;

    // ------------------------------------------------------------------------
    // Views
    // ------------------------------------------------------------------------

    /** @return std::nullopt for an organization with no access at all */
    std::optional<AccessInfo> accessInfo(const std::string& orgId) const;

    std::shared_ptr<const OrgAccessInfos> orgIdsToAccessInfos() const;
    std::shared_ptr<const NotificationConfigs> orgIdsToNotificationConfigs() const;
    std::shared_ptr<const CombinedConfigs> orgIdsToCombinedConfigs() const;
    std::shared_ptr<const StringMap> orgIdsToActualNames() const;

    std::shared_ptr<const StringMap> userIdsToOrgIds() const;
    std::shared_ptr<const StringSet> orgIds() const;
    std::shared_ptr<const StringSet> streamApiEnabledOrgIds() const;
    std::shared_ptr<const StringSet> streamApiDisabledOrgIds() const;

    std::shared_ptr<const StreamAccessInfos> sourceIdsToSubsToStreamApiAccessInfos() const;
    std::shared_ptr<const NotificationAccessInfoMappings> sourceIdsToNotificationAccessInfoMappings() const;

    std::shared_ptr<const InsideCriteriaResolver> insideCriteriaResolver() const;
    std::shared_ptr<const AnonymizedSourceMapping> anonymizedSourceMapping() const;
    std::shared_ptr<const StringSet> dipAnonymizationDisabledSourceIds() const;

    /** @brief Match an event against the inside criteria, honoring the FQDN-only categories */
    InsideMatchResult matchInside(const InsideMatchInput& event) const;

private:
    SnapshotPtr latestSnapshot() const;
    AuthViews views() const { return AuthViews(currentSnapshot(), mode_); }

    std::shared_ptr<SnapshotPrefetcher> prefetcher_;
    SnapshotPtr fixed_;
    CompilerMode mode_;
    std::set<std::string> fqdn_only_categories_;
};

} // namespace authcore

#endif // AUTHCORE_AUTH_API_HPP
