/**
 * @file graph_resolver.hpp
 * @brief Resolution of the directory graph into access facts and
 *        per-resource limits
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_GRAPH_RESOLVER_HPP
#define AUTHCORE_GRAPH_RESOLVER_HPP

#include "auth_types.hpp"
#include "directory.hpp"
#include "result.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>

namespace authcore {

//=============================================================================
// Flags
//=============================================================================

namespace flags {
constexpr const char* FULL_ACCESS = "n6rest-api-full-access";
constexpr const char* STREAM_API_ENABLED = "n6stream-api-enabled";
constexpr const char* EMAIL_NOTIFICATIONS_ENABLED = "n6email-notifications-enabled";
constexpr const char* EMAIL_NOTIFICATIONS_BUSINESS_DAYS_ONLY = "n6email-notifications-business-days-only";
constexpr const char* DIP_ANONYMIZATION_ENABLED = "n6dip-anonymization-enabled";
} // namespace flags

/**
 * @brief Read a TRUE/FALSE flag attribute
 *
 * A value other than TRUE/FALSE (case-insensitive), or more than one
 * value, is logged as a data error and yields @p onIllegal.
 *
 * @param caption entry description used in the log message
 */
bool isFlagEnabled(const AttributeMap& attrs, const std::string& caption, const std::string& flag,
                   bool onMissing = false, bool onIllegal = false);

//=============================================================================
// Access facts
//=============================================================================

/**
 * @struct AccessFact
 * @brief Organization may see a subsource in a zone
 *
 * Ordering is by org id, then subsource ref, then zone.
 */
struct AccessFact {
    std::string org_id;
    std::string subsource_ref;
    AccessZone zone = AccessZone::INSIDE;

    bool operator<(const AccessFact& o) const {
        return std::tie(org_id, subsource_ref, zone) < std::tie(o.org_id, o.subsource_ref, o.zone);
    }
    bool operator==(const AccessFact& o) const {
        return org_id == o.org_id && subsource_ref == o.subsource_ref && zone == o.zone;
    }
};

using AccessFactSet = std::set<AccessFact>;

//=============================================================================
// Resource limits
//=============================================================================

struct ResourceLimits {
    int64_t window = DEFAULT_RESOURCE_LIMIT_WINDOW;
    std::optional<int64_t> queries_limit;
    std::optional<int64_t> results_limit;
    int64_t max_days_old = DEFAULT_MAX_DAYS_OLD;
    /** parameter name -> required?; nullopt means no restriction */
    std::optional<std::map<std::string, bool>> request_parameters;

    bool operator==(const ResourceLimits&) const = default;
};

/**
 * @brief Parse the attributes of a "res-<zone>" entry
 * @return DIRECTORY_DATA_INVALID for malformed numbers or an inconsistent
 *         parameter whitelist
 */
Result<ResourceLimits> makeResourceLimits(const AttributeMap& resourceAttrs);

//=============================================================================
// Resolver
//=============================================================================

/**
 * @class GraphResolver
 * @brief Pure functions of one directory graph
 */
class GraphResolver {
public:
    explicit GraphResolver(const DirectoryGraph& graph) : graph_(graph) {}

    /**
     * @brief All (org, subsource, zone) triples reachable by inclusion and
     *        not removed by any exclusion
     *
     * Organization channels contribute inclusion and exclusion edges,
     * organization group channels inclusion edges only. Subsource groups
     * are expanded one level.
     */
    AccessFactSet resolveAccessFacts() const;

    /** @brief Subsources reachable through one channel */
    std::set<std::string> channelSubsourceRefs(const Channel& channel) const;

    bool isResourceEnabled(const Organization& org, AccessZone zone) const {
        return org.resources.count(zone) != 0;
    }

    /**
     * @brief Limits of the zone's resource for an organization
     * @return nullopt if the resource is disabled or its data is malformed
     *         (the latter is logged)
     */
    std::optional<ResourceLimits> resourceLimits(const Organization& org, AccessZone zone) const;

    bool isFullAccess(const Organization& org) const;

    /** @brief Log a warning for every organization id that is too long */
    void checkOrgIdLengths() const;

    const DirectoryGraph& graph() const { return graph_; }

private:
    void collect(const std::string& orgId, const ChannelMap& channels,
                 AccessFactSet& into) const;

    const DirectoryGraph& graph_;
};

} // namespace authcore

#endif // AUTHCORE_GRAPH_RESOLVER_HPP
