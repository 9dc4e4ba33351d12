/**
 * @file condition_compiler.hpp
 * @brief Per-organization access conditions built from access facts
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_CONDITION_COMPILER_HPP
#define AUTHCORE_CONDITION_COMPILER_HPP

#include "cond.hpp"
#include "cond_compile.hpp"
#include "graph_resolver.hpp"
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace authcore {

/**
 * @struct AccessInfo
 * @brief What one organization may query, per zone, and its resource limits
 *
 * Only zones in which the organization reaches at least one subsource
 * appear in access_zone_conditions; each holds exactly one condition.
 */
struct AccessInfo {
    std::map<AccessZone, std::vector<CompiledCondition>> access_zone_conditions;
    std::map<std::string, ResourceLimits> resource_limits;   ///< keyed by resource id
    bool full_access = false;

    bool operator==(const AccessInfo&) const = default;
};

using OrgAccessInfos = std::map<std::string, AccessInfo>;

/** @brief Stream gateway view of one subsource */
struct StreamAccessInfo {
    CompiledCondition condition;
    std::map<AccessZone, std::set<std::string>> zone_org_ids;   ///< all three zones present
};

/** source id -> subsource ref -> info */
using StreamAccessInfos = std::map<std::string, std::map<std::string, StreamAccessInfo>>;

/** @brief Notification view of one subsource for one full-access setting */
struct NotificationAccessInfo {
    CompiledCondition condition;
    std::set<std::string> org_ids;
};

/** source id -> (subsource ref, full access) -> info */
using NotificationAccessInfoMappings =
    std::map<std::string, std::map<std::pair<std::string, bool>, NotificationAccessInfo>>;

/**
 * @class ConditionCompiler
 * @brief Builds condition trees from subsources and criteria containers
 *        and runs them through the configured pipeline
 */
class ConditionCompiler {
public:
    static constexpr const char* RESTRICTION_KEY = "restriction";
    static constexpr const char* RESTRICTION_INTERNAL = "internal";
    static constexpr const char* IGNORED_KEY = "ignored";

    ConditionCompiler(const GraphResolver& resolver, CompilerMode mode = CompilerMode::DEFAULT)
        : resolver_(resolver), pipeline_(mode) {}

    CompilerMode mode() const { return pipeline_.mode(); }

    /**
     * @brief OR of the container's non-empty criteria
     *
     * Criteria are taken in name order (asn, category, cc, ip-network,
     * name); every IP network gives its own BETWEEN. A malformed network
     * is logged and skipped.
     *
     * @return nullptr if no criterion remains
     */
    CondPtr containerCondition(const CriteriaContainer& container) const;

    /**
     * @brief source == id AND all inclusion containers AND NOT each exclusion container
     */
    CondPtr subsourceCondition(const std::string& subsourceRef) const;

    /** @brief NOT (restriction == 'internal') AND NOT (ignored IS TRUE) */
    static CondPtr restrictionClause();

    /** @brief Append the restriction clause unless @p fullAccess */
    static CondPtr withAccessRestriction(const CondPtr& c, bool fullAccess);

    /**
     * @brief AccessInfo of every organization having at least one access fact
     *
     * Facts are visited in their set order. Resource limits are filled in
     * for every enabled resource of the organization.
     */
    OrgAccessInfos compileAccessInfos(const AccessFactSet& facts) const;

    /**
     * @brief Stream gateway view: stream-enabled organizations, zones with
     *        an enabled resource only
     *
     * Every predicate carries the restriction clause.
     */
    StreamAccessInfos compileStreamAccessInfos(const AccessFactSet& facts) const;

    /** @brief Notification view: inside zone, email-enabled organizations with the inside resource */
    NotificationAccessInfoMappings compileNotificationAccessInfos(const AccessFactSet& facts) const;

private:
    const GraphResolver& resolver_;
    ConditionPipeline pipeline_;
};

} // namespace authcore

#endif // AUTHCORE_CONDITION_COMPILER_HPP
