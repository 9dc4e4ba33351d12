/**
 * @file graph_resolver.cpp
 * @brief Access fact resolution, flag reading and resource limits
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "graph_resolver.hpp"
#include "auth_error.hpp"
#include "auth_logger.hpp"
#include "auth_string_utils.hpp"
#include <algorithm>
#include <iterator>

namespace authcore {

// ============================================================================
// Flags
// ============================================================================

bool isFlagEnabled(const AttributeMap& attrs, const std::string& caption, const std::string& flag,
                   bool onMissing, bool onIllegal) {
    try {
        auto value = singleAttributeValue(attrs, flag);
        if (!value) return onMissing;
        std::string upper = string_utils::toUpper(string_utils::trim(*value));
        if (upper == "TRUE") return true;
        if (upper == "FALSE") return false;
        throw DirectoryDataError(flag + " should be TRUE or FALSE (found: '" + *value + "')");
    } catch (const DirectoryDataError& e) {
        LOG_ERROR("GraphResolver", "Problem with directory data for " + caption + ": " + e.what());
        return onIllegal;
    }
}

// ============================================================================
// Resource limits
// ============================================================================

namespace {

Result<std::optional<int64_t>> intAttribute(const AttributeMap& attrs, const std::string& name) {
    std::optional<std::string> raw;
    try {
        raw = singleAttributeValue(attrs, name);
    } catch (const DirectoryDataError& e) {
        return Err<std::optional<int64_t>>(e.toError());
    }
    if (!raw) return std::optional<int64_t>{};
    auto parsed = string_utils::toInt64(string_utils::trim(*raw));
    if (!parsed) {
        return Err<std::optional<int64_t>>(ErrorCode::DIRECTORY_DATA_INVALID,
                                           name + " is not an integer: '" + *raw + "'");
    }
    return std::optional<int64_t>{*parsed};
}

Result<std::optional<std::map<std::string, bool>>> requestParameters(const AttributeMap& attrs) {
    using Params = std::optional<std::map<std::string, bool>>;
    const auto& allowed = attributeValues(attrs, "n6request-parameters");
    const auto& requiredList = attributeValues(attrs, "n6request-required-parameters");
    std::set<std::string> allowedSet(allowed.begin(), allowed.end());
    std::set<std::string> required(requiredList.begin(), requiredList.end());

    if (allowedSet.empty()) {
        if (!required.empty()) {
            return Err<Params>(ErrorCode::DIRECTORY_DATA_INVALID,
                               "n6request-required-parameters are illegal when the "
                               "n6request-parameters limitation is not specified");
        }
        return Params{};
    }
    if (!std::includes(allowedSet.begin(), allowedSet.end(), required.begin(), required.end())) {
        return Err<Params>(ErrorCode::DIRECTORY_DATA_INVALID,
                           "n6request-required-parameters (" + string_utils::join(required, ", ")
                           + ") is not a subset of n6request-parameters ("
                           + string_utils::join(allowedSet, ", ") + ")");
    }
    std::map<std::string, bool> params;
    for (const auto& p : allowedSet) params[p] = required.count(p) != 0;
    return Params{std::move(params)};
}

} // namespace

Result<ResourceLimits> makeResourceLimits(const AttributeMap& resourceAttrs) {
    ResourceLimits limits;

    auto window = intAttribute(resourceAttrs, "n6time-window");
    if (!window) return Err<ResourceLimits>(window.error());
    if (window.value()) limits.window = *window.value();

    auto queries = intAttribute(resourceAttrs, "n6queries-limit");
    if (!queries) return Err<ResourceLimits>(queries.error());
    limits.queries_limit = queries.value();

    auto results = intAttribute(resourceAttrs, "n6results-limit");
    if (!results) return Err<ResourceLimits>(results.error());
    limits.results_limit = results.value();

    auto maxDays = intAttribute(resourceAttrs, "n6max-days-old");
    if (!maxDays) return Err<ResourceLimits>(maxDays.error());
    if (maxDays.value()) limits.max_days_old = *maxDays.value();

    auto params = requestParameters(resourceAttrs);
    if (!params) return Err<ResourceLimits>(params.error());
    limits.request_parameters = params.value();

    return limits;
}

// ============================================================================
// GraphResolver
// ============================================================================

std::set<std::string> GraphResolver::channelSubsourceRefs(const Channel& channel) const {
    std::set<std::string> refs(channel.subsource_refs.begin(), channel.subsource_refs.end());
    for (const auto& groupRef : channel.subsource_group_refs) {
        const SubsourceGroup& group = graph_.subsourceGroup(groupRef);
        refs.insert(group.subsource_refs.begin(), group.subsource_refs.end());
    }
    return refs;
}

void GraphResolver::collect(const std::string& orgId, const ChannelMap& channels,
                            AccessFactSet& into) const {
    for (const auto& [zone, channel] : channels) {
        for (const auto& ref : channelSubsourceRefs(channel)) {
            into.insert(AccessFact{orgId, ref, zone});
        }
    }
}

AccessFactSet GraphResolver::resolveAccessFacts() const {
    AccessFactSet included;
    AccessFactSet excluded;
    for (const auto& [orgId, org] : graph_.organizations()) {
        collect(orgId, org.channels, included);
        collect(orgId, org.excluding_channels, excluded);
        for (const auto& groupRef : org.org_group_refs) {
            collect(orgId, graph_.organizationGroup(groupRef).channels, included);
        }
    }

    AccessFactSet facts;
    std::set_difference(included.begin(), included.end(), excluded.begin(), excluded.end(),
                        std::inserter(facts, facts.end()));
    LOG_DEBUG("GraphResolver", "Resolved " + std::to_string(facts.size()) + " access facts ("
              + std::to_string(included.size() - facts.size()) + " removed by exclusion)");
    return facts;
}

std::optional<ResourceLimits> GraphResolver::resourceLimits(const Organization& org, AccessZone zone) const {
    auto it = org.resources.find(zone);
    if (it == org.resources.end()) return std::nullopt;
    auto limits = makeResourceLimits(it->second);
    if (!limits) {
        LOG_ERROR("GraphResolver", "Problem with directory data for the organization '" + org.id
                  + "' (resource " + resourceIdForZone(zone) + "): " + limits.error().message);
        return std::nullopt;
    }
    return limits.value();
}

bool GraphResolver::isFullAccess(const Organization& org) const {
    return isFlagEnabled(org.attributes, "the organization '" + org.id + "'", flags::FULL_ACCESS);
}

void GraphResolver::checkOrgIdLengths() const {
    for (const auto& [orgId, org] : graph_.organizations()) {
        if (orgId.size() > CLIENT_ORGANIZATION_MAX_LENGTH) {
            LOG_WARNING("GraphResolver", "The length of the organization id '" + orgId + "' is "
                        + std::to_string(orgId.size()) + ", exceeding the limit of "
                        + std::to_string(CLIENT_ORGANIZATION_MAX_LENGTH));
        }
    }
}

} // namespace authcore
