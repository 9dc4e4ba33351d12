/**
 * @file directory.hpp
 * @brief In-memory directory graph: organizations, groups, sources,
 *        subsources, subsource groups and criteria containers
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_DIRECTORY_HPP
#define AUTHCORE_DIRECTORY_HPP

#include "auth_types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace authcore {

/** @brief Multi-valued named attributes of a directory entry */
using AttributeMap = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Return the only value of an attribute
 * @return nullopt when the attribute is absent
 * @throws DirectoryDataError when the attribute has more than one value
 */
std::optional<std::string> singleAttributeValue(const AttributeMap& attrs, const std::string& name);

/** @brief All values of an attribute (empty when absent) */
const std::vector<std::string>& attributeValues(const AttributeMap& attrs, const std::string& name);

//=============================================================================
// Nodes
//=============================================================================

/**
 * @struct Channel
 * @brief Edge set of one zone: direct subsources and subsource groups
 */
struct Channel {
    std::vector<std::string> subsource_refs;
    std::vector<std::string> subsource_group_refs;

    bool empty() const { return subsource_refs.empty() && subsource_group_refs.empty(); }
    bool operator==(const Channel&) const = default;
};

using ChannelMap = std::map<AccessZone, Channel>;

struct Organization {
    std::string id;
    AttributeMap attributes;
    ChannelMap channels;                             ///< inclusion edges
    ChannelMap excluding_channels;                   ///< "-ex" edges
    std::map<AccessZone, AttributeMap> resources;    ///< "res-<zone>" entries
    std::vector<std::string> org_group_refs;
    std::vector<std::string> user_ids;

    bool operator==(const Organization&) const = default;
};

/** @brief Group whose channels are inherited (inclusion only) by member organizations */
struct OrganizationGroup {
    std::string id;
    ChannelMap channels;

    bool operator==(const OrganizationGroup&) const = default;
};

struct Source {
    std::string id;
    AttributeMap attributes;

    bool operator==(const Source&) const = default;
};

struct Subsource {
    std::string ref;
    std::string source_id;
    std::vector<std::string> inclusion_criteria_refs;
    std::vector<std::string> exclusion_criteria_refs;

    bool operator==(const Subsource&) const = default;
};

struct SubsourceGroup {
    std::string ref;
    std::vector<std::string> subsource_refs;

    bool operator==(const SubsourceGroup&) const = default;
};

/**
 * @struct CriteriaContainer
 * @brief Reusable bundle of event field criteria
 */
struct CriteriaContainer {
    std::string ref;
    std::vector<int64_t> asn;
    std::vector<std::string> cc;
    std::vector<std::string> ip_network;   ///< CIDR notation
    std::vector<std::string> category;
    std::vector<std::string> name;

    bool empty() const {
        return asn.empty() && cc.empty() && ip_network.empty() && category.empty() && name.empty();
    }
    bool operator==(const CriteriaContainer&) const = default;
};

//=============================================================================
// Graph
//=============================================================================

/**
 * @class DirectoryGraph
 * @brief Id-keyed node tables with eagerly checked references
 *
 * Nodes are added through the add*() methods; validate() then checks that
 * every reference points at an existing node. A graph that fails the check
 * must not be published.
 */
class DirectoryGraph {
public:
    void addOrganization(Organization org);
    void addOrganizationGroup(OrganizationGroup group);
    void addSource(Source source);
    void addSubsource(Subsource subsource);
    void addSubsourceGroup(SubsourceGroup group);
    void addCriteriaContainer(CriteriaContainer container);

    /**
     * @brief Verify every reference in the graph
     * @throws DirectoryStructureError naming the first dangling reference
     */
    void validate() const;

    const std::map<std::string, Organization>& organizations() const { return organizations_; }
    const std::map<std::string, OrganizationGroup>& organizationGroups() const { return org_groups_; }
    const std::map<std::string, Source>& sources() const { return sources_; }
    const std::map<std::string, Subsource>& subsources() const { return subsources_; }
    const std::map<std::string, SubsourceGroup>& subsourceGroups() const { return subsource_groups_; }
    const std::map<std::string, CriteriaContainer>& criteriaContainers() const { return criteria_; }

    const Organization* findOrganization(const std::string& id) const;

    /** @throws DirectoryStructureError if the id is unknown */
    const OrganizationGroup& organizationGroup(const std::string& id) const;
    const Subsource& subsource(const std::string& ref) const;
    const SubsourceGroup& subsourceGroup(const std::string& ref) const;
    const CriteriaContainer& criteriaContainer(const std::string& ref) const;

    bool operator==(const DirectoryGraph&) const = default;

private:
    std::map<std::string, Organization> organizations_;
    std::map<std::string, OrganizationGroup> org_groups_;
    std::map<std::string, Source> sources_;
    std::map<std::string, Subsource> subsources_;
    std::map<std::string, SubsourceGroup> subsource_groups_;
    std::map<std::string, CriteriaContainer> criteria_;
};

} // namespace authcore

#endif // AUTHCORE_DIRECTORY_HPP
