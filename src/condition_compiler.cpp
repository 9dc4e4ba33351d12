/**
 * @file condition_compiler.cpp
 * @brief Access condition construction and per-organization compilation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "condition_compiler.hpp"
#include "auth_logger.hpp"

namespace authcore {

namespace {

std::vector<CondValue> stringValues(const std::vector<std::string>& values) {
    return std::vector<CondValue>(values.begin(), values.end());
}

} // namespace

// ============================================================================
// Building blocks
// ============================================================================

CondPtr ConditionCompiler::containerCondition(const CriteriaContainer& container) const {
    std::vector<CondPtr> criteria;
    if (!container.asn.empty()) {
        criteria.push_back(cond::in("asn", std::vector<CondValue>(container.asn.begin(), container.asn.end())));
    }
    if (!container.category.empty()) {
        criteria.push_back(cond::in("category", stringValues(container.category)));
    }
    if (!container.cc.empty()) {
        criteria.push_back(cond::in("cc", stringValues(container.cc)));
    }
    for (const auto& network : container.ip_network) {
        auto bounds = ipNetworkBounds(network);
        if (!bounds) {
            LOG_ERROR("ConditionCompiler", "Problem with directory data for the criteria container '"
                      + container.ref + "': malformed IP network '" + network + "' skipped");
            continue;
        }
        criteria.push_back(cond::between("ip", bounds->first, bounds->second));
    }
    if (!container.name.empty()) {
        criteria.push_back(cond::in("name", stringValues(container.name)));
    }
    if (criteria.empty()) return nullptr;
    return cond::orOf(std::move(criteria));
}

CondPtr ConditionCompiler::subsourceCondition(const std::string& subsourceRef) const {
    const DirectoryGraph& graph = resolver_.graph();
    const Subsource& subsource = graph.subsource(subsourceRef);

    std::vector<CondPtr> inclusion;
    for (const auto& ref : subsource.inclusion_criteria_refs) {
        if (CondPtr c = containerCondition(graph.criteriaContainer(ref))) inclusion.push_back(c);
    }
    std::vector<CondPtr> exclusion;
    for (const auto& ref : subsource.exclusion_criteria_refs) {
        if (CondPtr c = containerCondition(graph.criteriaContainer(ref))) {
            exclusion.push_back(cond::notOf(c));
        }
    }
    return cond::andOf({
        cond::equal("source", subsource.source_id),
        cond::andOf(std::move(inclusion)),
        cond::andOf(std::move(exclusion)),
    });
}

CondPtr ConditionCompiler::restrictionClause() {
    return cond::andOf({
        cond::notOf(cond::equal(RESTRICTION_KEY, std::string(RESTRICTION_INTERNAL))),
        cond::notOf(cond::isTrue(IGNORED_KEY)),
    });
}

CondPtr ConditionCompiler::withAccessRestriction(const CondPtr& c, bool fullAccess) {
    if (fullAccess) return c;
    return cond::andOf({c, restrictionClause()});
}

// ============================================================================
// Access infos
// ============================================================================

OrgAccessInfos ConditionCompiler::compileAccessInfos(const AccessFactSet& facts) const {
    const DirectoryGraph& graph = resolver_.graph();

    // org id -> zone -> subsource conditions, in fact order
    std::map<std::string, std::map<AccessZone, std::vector<CondPtr>>> collected;
    std::map<std::string, CondPtr> subsourceConds;
    for (const auto& fact : facts) {
        auto it = subsourceConds.find(fact.subsource_ref);
        if (it == subsourceConds.end()) {
            it = subsourceConds.emplace(fact.subsource_ref, subsourceCondition(fact.subsource_ref)).first;
        }
        collected[fact.org_id][fact.zone].push_back(it->second);
    }

    OrgAccessInfos result;
    for (auto& [orgId, zones] : collected) {
        const Organization* org = graph.findOrganization(orgId);
        if (!org) continue;
        AccessInfo info;
        info.full_access = resolver_.isFullAccess(*org);
        for (auto& [zone, conds] : zones) {
            CondPtr aggregate = withAccessRestriction(cond::orOf(std::move(conds)), info.full_access);
            info.access_zone_conditions[zone].push_back(pipeline_.compile(aggregate));
        }
        for (AccessZone zone : ALL_ACCESS_ZONES) {
            if (auto limits = resolver_.resourceLimits(*org, zone)) {
                info.resource_limits.emplace(resourceIdForZone(zone), std::move(*limits));
            }
        }
        result.emplace(orgId, std::move(info));
    }
    LOG_DEBUG("ConditionCompiler", "Compiled access infos of " + std::to_string(result.size())
              + " organizations (mode: " + compilerModeToString(mode()) + ")");
    return result;
}

StreamAccessInfos ConditionCompiler::compileStreamAccessInfos(const AccessFactSet& facts) const {
    const DirectoryGraph& graph = resolver_.graph();
    std::map<std::string, bool> streamEnabled;

    StreamAccessInfos result;
    for (const auto& fact : facts) {
        const Organization* org = graph.findOrganization(fact.org_id);
        if (!org) continue;
        auto flag = streamEnabled.find(fact.org_id);
        if (flag == streamEnabled.end()) {
            flag = streamEnabled.emplace(fact.org_id, isFlagEnabled(
                org->attributes, "the organization '" + fact.org_id + "'",
                flags::STREAM_API_ENABLED)).first;
        }
        if (!flag->second) continue;
        if (!resolver_.isResourceEnabled(*org, fact.zone)) continue;

        const Subsource& subsource = graph.subsource(fact.subsource_ref);
        auto& perSubsource = result[subsource.source_id];
        auto it = perSubsource.find(fact.subsource_ref);
        if (it == perSubsource.end()) {
            StreamAccessInfo info;
            info.condition = pipeline_.compile(
                withAccessRestriction(subsourceCondition(fact.subsource_ref), false));
            for (AccessZone zone : ALL_ACCESS_ZONES) info.zone_org_ids[zone];
            it = perSubsource.emplace(fact.subsource_ref, std::move(info)).first;
        }
        it->second.zone_org_ids[fact.zone].insert(fact.org_id);
    }
    return result;
}

NotificationAccessInfoMappings ConditionCompiler::compileNotificationAccessInfos(
        const AccessFactSet& facts) const {
    const DirectoryGraph& graph = resolver_.graph();

    NotificationAccessInfoMappings result;
    for (const auto& fact : facts) {
        if (fact.zone != AccessZone::INSIDE) continue;
        const Organization* org = graph.findOrganization(fact.org_id);
        if (!org) continue;
        if (!isFlagEnabled(org->attributes, "the organization '" + fact.org_id + "'",
                           flags::EMAIL_NOTIFICATIONS_ENABLED)) {
            continue;
        }
        if (!resolver_.isResourceEnabled(*org, fact.zone)) continue;

        const Subsource& subsource = graph.subsource(fact.subsource_ref);
        bool fullAccess = resolver_.isFullAccess(*org);
        auto& mapping = result[subsource.source_id];
        auto key = std::make_pair(fact.subsource_ref, fullAccess);
        auto it = mapping.find(key);
        if (it == mapping.end()) {
            NotificationAccessInfo info;
            info.condition = pipeline_.compile(
                withAccessRestriction(subsourceCondition(fact.subsource_ref), fullAccess));
            it = mapping.emplace(key, std::move(info)).first;
        }
        it->second.org_ids.insert(fact.org_id);
    }
    return result;
}

} // namespace authcore
