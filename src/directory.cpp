/**
 * @file directory.cpp
 * @brief Directory graph construction and reference checks
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "directory.hpp"
#include "auth_error.hpp"

namespace authcore {

namespace {

const std::vector<std::string> kNoValues;

template<typename Map, typename Node>
void insertUnique(Map& map, const std::string& key, Node&& node, const char* kind) {
    if (key.empty()) {
        throw DirectoryStructureError(std::string(kind) + " with an empty id");
    }
    auto [it, inserted] = map.emplace(key, std::forward<Node>(node));
    if (!inserted) {
        throw DirectoryStructureError(std::string("duplicate ") + kind + " id '" + key + "'");
    }
}

template<typename Map>
const typename Map::mapped_type& lookup(const Map& map, const std::string& key, const char* kind) {
    auto it = map.find(key);
    if (it == map.end()) {
        throw DirectoryStructureError(std::string("unknown ") + kind + " '" + key + "'");
    }
    return it->second;
}

} // namespace

std::optional<std::string> singleAttributeValue(const AttributeMap& attrs, const std::string& name) {
    auto it = attrs.find(name);
    if (it == attrs.end() || it->second.empty()) return std::nullopt;
    if (it->second.size() > 1) {
        throw DirectoryDataError("attribute '" + name + "' has " +
                                 std::to_string(it->second.size()) + " values, expected one");
    }
    return it->second.front();
}

const std::vector<std::string>& attributeValues(const AttributeMap& attrs, const std::string& name) {
    auto it = attrs.find(name);
    return it == attrs.end() ? kNoValues : it->second;
}

void DirectoryGraph::addOrganization(Organization org) {
    std::string key = org.id;
    insertUnique(organizations_, key, std::move(org), "organization");
}

void DirectoryGraph::addOrganizationGroup(OrganizationGroup group) {
    std::string key = group.id;
    insertUnique(org_groups_, key, std::move(group), "organization group");
}

void DirectoryGraph::addSource(Source source) {
    std::string key = source.id;
    insertUnique(sources_, key, std::move(source), "source");
}

void DirectoryGraph::addSubsource(Subsource subsource) {
    std::string key = subsource.ref;
    insertUnique(subsources_, key, std::move(subsource), "subsource");
}

void DirectoryGraph::addSubsourceGroup(SubsourceGroup group) {
    std::string key = group.ref;
    insertUnique(subsource_groups_, key, std::move(group), "subsource group");
}

void DirectoryGraph::addCriteriaContainer(CriteriaContainer container) {
    std::string key = container.ref;
    insertUnique(criteria_, key, std::move(container), "criteria container");
}

void DirectoryGraph::validate() const {
    auto checkChannels = [this](const ChannelMap& channels, const std::string& owner) {
        for (const auto& [zone, channel] : channels) {
            for (const auto& ref : channel.subsource_refs) {
                if (!subsources_.count(ref)) {
                    throw DirectoryStructureError(owner + " channel '" + accessZoneToString(zone) +
                                                  "' references unknown subsource '" + ref + "'");
                }
            }
            for (const auto& ref : channel.subsource_group_refs) {
                if (!subsource_groups_.count(ref)) {
                    throw DirectoryStructureError(owner + " channel '" + accessZoneToString(zone) +
                                                  "' references unknown subsource group '" + ref + "'");
                }
            }
        }
    };

    for (const auto& [id, org] : organizations_) {
        checkChannels(org.channels, "organization '" + id + "'");
        checkChannels(org.excluding_channels, "organization '" + id + "'");
        for (const auto& ref : org.org_group_refs) {
            if (!org_groups_.count(ref)) {
                throw DirectoryStructureError("organization '" + id +
                                              "' references unknown organization group '" + ref + "'");
            }
        }
    }
    for (const auto& [id, group] : org_groups_) {
        checkChannels(group.channels, "organization group '" + id + "'");
    }
    for (const auto& [ref, group] : subsource_groups_) {
        for (const auto& sub : group.subsource_refs) {
            if (!subsources_.count(sub)) {
                throw DirectoryStructureError("subsource group '" + ref +
                                              "' references unknown subsource '" + sub + "'");
            }
        }
    }
    for (const auto& [ref, sub] : subsources_) {
        if (!sources_.count(sub.source_id)) {
            throw DirectoryStructureError("subsource '" + ref +
                                          "' belongs to unknown source '" + sub.source_id + "'");
        }
        for (const auto* refs : {&sub.inclusion_criteria_refs, &sub.exclusion_criteria_refs}) {
            for (const auto& crit : *refs) {
                if (!criteria_.count(crit)) {
                    throw DirectoryStructureError("subsource '" + ref +
                                                  "' references unknown criteria container '" + crit + "'");
                }
            }
        }
    }
}

const Organization* DirectoryGraph::findOrganization(const std::string& id) const {
    auto it = organizations_.find(id);
    return it == organizations_.end() ? nullptr : &it->second;
}

const OrganizationGroup& DirectoryGraph::organizationGroup(const std::string& id) const {
    return lookup(org_groups_, id, "organization group");
}

const Subsource& DirectoryGraph::subsource(const std::string& ref) const {
    return lookup(subsources_, ref, "subsource");
}

const SubsourceGroup& DirectoryGraph::subsourceGroup(const std::string& ref) const {
    return lookup(subsource_groups_, ref, "subsource group");
}

const CriteriaContainer& DirectoryGraph::criteriaContainer(const std::string& ref) const {
    return lookup(criteria_, ref, "criteria container");
}

} // namespace authcore
