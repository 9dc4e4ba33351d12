/**
 * @file auth_views.hpp
 * @brief Derived read views of a directory snapshot, memoized per snapshot
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_AUTH_VIEWS_HPP
#define AUTHCORE_AUTH_VIEWS_HPP

#include "condition_compiler.hpp"
#include "graph_resolver.hpp"
#include "inside_criteria.hpp"
#include "snapshot.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace authcore {

//=============================================================================
// View value types
//=============================================================================

/** @brief Time of day of an e-mail notification */
struct NotificationTime {
    int hour = 0;
    int minute = 0;

    /**
     * @brief Parse "HH:MM" or "HH"; spaces are ignored and '.' separates like ':'
     * @return nullopt for anything else
     */
    static std::optional<NotificationTime> parse(const std::string& text);

    /** @brief "HH:MM" */
    std::string toString() const;

    bool operator<(const NotificationTime& o) const {
        return hour != o.hour ? hour < o.hour : minute < o.minute;
    }
    bool operator==(const NotificationTime&) const = default;
};

struct NotificationConfig {
    std::vector<NotificationTime> times;       ///< sorted
    std::vector<std::string> addresses;        ///< sorted
    std::optional<std::string> name;
    bool stream_api_enabled = false;
    bool business_days_only = false;
    std::string language = "pl";

    bool operator==(const NotificationConfig&) const = default;
};

struct CombinedConfig {
    InsideCriteria inside_criteria;
    std::optional<NotificationConfig> notification_config;

    bool operator==(const CombinedConfig&) const = default;
};

struct AnonymizedSourceMapping {
    std::map<std::string, std::string> forward;   ///< source id -> anonymized id
    std::map<std::string, std::string> reverse;   ///< anonymized id -> source id

    bool operator==(const AnonymizedSourceMapping&) const = default;
};

using StringMap = std::map<std::string, std::string>;
using StringSet = std::set<std::string>;
using NotificationConfigs = std::map<std::string, NotificationConfig>;
using CombinedConfigs = std::map<std::string, CombinedConfig>;

//=============================================================================
// View names
//=============================================================================

namespace views {
constexpr const char* USER_IDS_TO_ORG_IDS = "user_ids_to_org_ids";
constexpr const char* ORG_IDS = "org_ids";
constexpr const char* STREAM_API_ENABLED_ORG_IDS = "stream_api_enabled_org_ids";
constexpr const char* STREAM_API_DISABLED_ORG_IDS = "stream_api_disabled_org_ids";
constexpr const char* ACCESS_FACTS = "access_facts";
constexpr const char* NOTIFICATION_CONFIGS = "notification_configs";
constexpr const char* INSIDE_CRITERIA = "inside_criteria";
constexpr const char* INSIDE_CRITERIA_RESOLVER = "inside_criteria_resolver";
constexpr const char* COMBINED_CONFIGS = "combined_configs";
constexpr const char* ACTUAL_NAMES = "actual_names";
constexpr const char* ANONYMIZED_SOURCE_MAPPING = "anonymized_source_mapping";
constexpr const char* DIP_ANONYMIZATION_DISABLED_SOURCE_IDS = "dip_anonymization_disabled_source_ids";

/** @brief Views built by the condition pipeline are memoized per compiler mode */
std::string accessInfos(CompilerMode mode);
std::string streamAccessInfos(CompilerMode mode);
std::string notificationAccessInfos(CompilerMode mode);
} // namespace views

//=============================================================================
// AuthViews
//=============================================================================

/**
 * @class AuthViews
 * @brief Lazily computed views of one snapshot
 *
 * Each accessor computes its view on first use and memoizes it on the
 * snapshot, so every AuthViews over the same snapshot shares the results.
 * Returned views are immutable and stay valid after the snapshot is
 * replaced.
 */
class AuthViews {
public:
    explicit AuthViews(SnapshotPtr snapshot, CompilerMode mode = CompilerMode::DEFAULT)
        : snapshot_(std::move(snapshot)), mode_(mode) {}

    const SnapshotPtr& snapshot() const { return snapshot_; }
    CompilerMode compilerMode() const { return mode_; }

    /** @brief user id -> org id; a user listed twice keeps the first organization */
    std::shared_ptr<const StringMap> userIdsToOrgIds() const;
    std::shared_ptr<const StringSet> orgIds() const;
    std::shared_ptr<const StringSet> streamApiEnabledOrgIds() const;
    std::shared_ptr<const StringSet> streamApiDisabledOrgIds() const;

    std::shared_ptr<const AccessFactSet> accessFacts() const;
    std::shared_ptr<const OrgAccessInfos> accessInfos() const;
    std::shared_ptr<const StreamAccessInfos> streamAccessInfos() const;
    std::shared_ptr<const NotificationAccessInfoMappings> notificationAccessInfoMappings() const;

    /** @brief Configs of organizations with e-mail notifications enabled */
    std::shared_ptr<const NotificationConfigs> notificationConfigs() const;

    std::shared_ptr<const std::vector<InsideCriteria>> insideCriteria() const;
    std::shared_ptr<const InsideCriteriaResolver> insideCriteriaResolver() const;
    std::shared_ptr<const CombinedConfigs> combinedConfigs() const;
    std::shared_ptr<const StringMap> actualNames() const;

    std::shared_ptr<const AnonymizedSourceMapping> anonymizedSourceMapping() const;
    std::shared_ptr<const StringSet> dipAnonymizationDisabledSourceIds() const;

private:
    SnapshotPtr snapshot_;
    CompilerMode mode_;
};

/** @brief Build the config of one organization (used for e-mail enabled ones) */
NotificationConfig makeNotificationConfig(const Organization& org);

} // namespace authcore

#endif // AUTHCORE_AUTH_VIEWS_HPP
