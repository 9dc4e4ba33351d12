/**
 * @file directory_json.cpp
 * @brief Directory graph JSON encoder and decoder
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "directory_json.hpp"
#include "auth_error.hpp"
#include <cmath>

namespace authcore {

using json::JsonArray;
using json::JsonObject;
using json::JsonValue;

namespace {

JsonValue stringArray(const std::vector<std::string>& values) {
    JsonArray arr;
    for (const auto& v : values) arr.emplace_back(v);
    return JsonValue(std::move(arr));
}

JsonValue attributesToJson(const AttributeMap& attrs) {
    JsonObject obj;
    for (const auto& [name, values] : attrs) obj[name] = stringArray(values);
    return JsonValue(std::move(obj));
}

JsonValue channelToJson(const Channel& channel) {
    JsonObject obj;
    obj["subsources"] = stringArray(channel.subsource_refs);
    obj["subsource_groups"] = stringArray(channel.subsource_group_refs);
    return JsonValue(std::move(obj));
}

JsonValue channelsToJson(const ChannelMap& channels, const ChannelMap* excluding = nullptr) {
    JsonObject obj;
    for (const auto& [zone, channel] : channels) {
        obj[accessZoneToString(zone)] = channelToJson(channel);
    }
    if (excluding) {
        for (const auto& [zone, channel] : *excluding) {
            obj[accessZoneToString(zone) + "-ex"] = channelToJson(channel);
        }
    }
    return JsonValue(std::move(obj));
}

// Decoding helpers: any shape problem is a structural error

const JsonObject& expectObject(const JsonValue& v, const std::string& what) {
    if (!v.isObject()) throw DirectoryStructureError(what + " must be an object");
    return v.asObject();
}

const JsonArray& expectArray(const JsonValue& v, const std::string& what) {
    if (!v.isArray()) throw DirectoryStructureError(what + " must be an array");
    return v.asArray();
}

std::string expectString(const JsonValue& v, const std::string& what) {
    if (!v.isString()) throw DirectoryStructureError(what + " must be a string");
    return v.asString();
}

const JsonArray& optionalArray(const JsonObject& obj, const std::string& key, const std::string& what) {
    static const JsonArray empty;
    auto it = obj.find(key);
    if (it == obj.end() || it->second.isNull()) return empty;
    return expectArray(it->second, what + "." + key);
}

std::string requiredString(const JsonObject& obj, const std::string& key, const std::string& what) {
    auto it = obj.find(key);
    if (it == obj.end()) throw DirectoryStructureError(what + " lacks '" + key + "'");
    return expectString(it->second, what + "." + key);
}

std::vector<std::string> stringList(const JsonObject& obj, const std::string& key, const std::string& what) {
    std::vector<std::string> result;
    for (const auto& item : optionalArray(obj, key, what)) {
        result.push_back(expectString(item, what + "." + key + "[]"));
    }
    return result;
}

// Attribute values are strings; integral numbers are accepted and kept in decimal form
AttributeMap attributesFromJson(const JsonObject& obj, const std::string& what) {
    AttributeMap attrs;
    auto it = obj.find("attributes");
    if (it == obj.end()) return attrs;
    for (const auto& [name, values] : expectObject(it->second, what + ".attributes")) {
        auto& target = attrs[name];
        for (const auto& v : expectArray(values, what + ".attributes." + name)) {
            if (v.isString()) {
                target.push_back(v.asString());
            } else if (v.isNumber() && v.asNumber() == std::floor(v.asNumber())) {
                target.push_back(std::to_string(v.asInt64()));
            } else {
                throw DirectoryStructureError(what + ".attributes." + name +
                                              " values must be strings");
            }
        }
    }
    return attrs;
}

Channel channelFromJson(const JsonValue& v, const std::string& what) {
    const auto& obj = expectObject(v, what);
    Channel channel;
    channel.subsource_refs = stringList(obj, "subsources", what);
    channel.subsource_group_refs = stringList(obj, "subsource_groups", what);
    return channel;
}

void channelsFromJson(const JsonObject& owner, const std::string& what,
                      ChannelMap& including, ChannelMap* excluding) {
    auto it = owner.find("channels");
    if (it == owner.end()) return;
    for (const auto& [key, value] : expectObject(it->second, what + ".channels")) {
        bool isExcluding = key.size() > 3 && key.compare(key.size() - 3, 3, "-ex") == 0;
        std::string zoneName = isExcluding ? key.substr(0, key.size() - 3) : key;
        auto zone = accessZoneFromString(zoneName);
        if (!zone) throw DirectoryStructureError(what + ".channels has unknown zone '" + key + "'");
        if (isExcluding && !excluding) {
            throw DirectoryStructureError(what + " cannot have excluding channel '" + key + "'");
        }
        Channel channel = channelFromJson(value, what + ".channels." + key);
        (isExcluding ? *excluding : including)[*zone] = std::move(channel);
    }
}

} // namespace

JsonValue directoryToJson(const DirectoryGraph& graph,
                          const std::vector<std::string>& ignoredIpNetworks) {
    JsonObject doc;

    JsonArray orgs;
    for (const auto& [id, org] : graph.organizations()) {
        JsonObject o;
        o["id"] = org.id;
        o["attributes"] = attributesToJson(org.attributes);
        o["channels"] = channelsToJson(org.channels, &org.excluding_channels);
        JsonObject res;
        for (const auto& [zone, attrs] : org.resources) res[accessZoneToString(zone)] = attributesToJson(attrs);
        o["resources"] = JsonValue(std::move(res));
        o["org_groups"] = stringArray(org.org_group_refs);
        o["users"] = stringArray(org.user_ids);
        orgs.emplace_back(std::move(o));
    }
    doc["organizations"] = JsonValue(std::move(orgs));

    JsonArray groups;
    for (const auto& [id, group] : graph.organizationGroups()) {
        JsonObject g;
        g["id"] = group.id;
        g["channels"] = channelsToJson(group.channels);
        groups.emplace_back(std::move(g));
    }
    doc["org_groups"] = JsonValue(std::move(groups));

    JsonArray sources;
    for (const auto& [id, source] : graph.sources()) {
        JsonObject s;
        s["id"] = source.id;
        s["attributes"] = attributesToJson(source.attributes);
        sources.emplace_back(std::move(s));
    }
    doc["sources"] = JsonValue(std::move(sources));

    JsonArray subsources;
    for (const auto& [ref, sub] : graph.subsources()) {
        JsonObject s;
        s["ref"] = sub.ref;
        s["source"] = sub.source_id;
        s["inclusion_criteria"] = stringArray(sub.inclusion_criteria_refs);
        s["exclusion_criteria"] = stringArray(sub.exclusion_criteria_refs);
        subsources.emplace_back(std::move(s));
    }
    doc["subsources"] = JsonValue(std::move(subsources));

    JsonArray subGroups;
    for (const auto& [ref, group] : graph.subsourceGroups()) {
        JsonObject g;
        g["ref"] = group.ref;
        g["subsources"] = stringArray(group.subsource_refs);
        subGroups.emplace_back(std::move(g));
    }
    doc["subsource_groups"] = JsonValue(std::move(subGroups));

    JsonArray containers;
    for (const auto& [ref, crit] : graph.criteriaContainers()) {
        JsonObject c;
        c["ref"] = crit.ref;
        JsonArray asn;
        for (int64_t a : crit.asn) asn.emplace_back(static_cast<long long>(a));
        c["asn"] = JsonValue(std::move(asn));
        c["cc"] = stringArray(crit.cc);
        c["ip_network"] = stringArray(crit.ip_network);
        c["category"] = stringArray(crit.category);
        c["name"] = stringArray(crit.name);
        containers.emplace_back(std::move(c));
    }
    doc["criteria_containers"] = JsonValue(std::move(containers));

    doc["ignored_ip_networks"] = stringArray(ignoredIpNetworks);
    return JsonValue(std::move(doc));
}

DirectoryDocument directoryFromJson(const JsonValue& value) {
    const auto& doc = expectObject(value, "directory");
    DirectoryDocument result;
    DirectoryGraph& graph = result.graph;

    for (const auto& item : optionalArray(doc, "organizations", "directory")) {
        const auto& o = expectObject(item, "organization");
        Organization org;
        org.id = requiredString(o, "id", "organization");
        std::string what = "organization '" + org.id + "'";
        org.attributes = attributesFromJson(o, what);
        channelsFromJson(o, what, org.channels, &org.excluding_channels);
        if (auto res = o.find("resources"); res != o.end()) {
            for (const auto& [zoneName, attrs] : expectObject(res->second, what + ".resources")) {
                auto zone = accessZoneFromString(zoneName);
                if (!zone) throw DirectoryStructureError(what + " has unknown resource zone '" + zoneName + "'");
                JsonObject wrapper;
                wrapper["attributes"] = attrs;
                org.resources[*zone] = attributesFromJson(wrapper, what + ".resources." + zoneName);
            }
        }
        org.org_group_refs = stringList(o, "org_groups", what);
        org.user_ids = stringList(o, "users", what);
        graph.addOrganization(std::move(org));
    }

    for (const auto& item : optionalArray(doc, "org_groups", "directory")) {
        const auto& g = expectObject(item, "organization group");
        OrganizationGroup group;
        group.id = requiredString(g, "id", "organization group");
        channelsFromJson(g, "organization group '" + group.id + "'", group.channels, nullptr);
        graph.addOrganizationGroup(std::move(group));
    }

    for (const auto& item : optionalArray(doc, "sources", "directory")) {
        const auto& s = expectObject(item, "source");
        Source source;
        source.id = requiredString(s, "id", "source");
        source.attributes = attributesFromJson(s, "source '" + source.id + "'");
        graph.addSource(std::move(source));
    }

    for (const auto& item : optionalArray(doc, "subsources", "directory")) {
        const auto& s = expectObject(item, "subsource");
        Subsource sub;
        sub.ref = requiredString(s, "ref", "subsource");
        std::string what = "subsource '" + sub.ref + "'";
        sub.source_id = requiredString(s, "source", what);
        sub.inclusion_criteria_refs = stringList(s, "inclusion_criteria", what);
        sub.exclusion_criteria_refs = stringList(s, "exclusion_criteria", what);
        graph.addSubsource(std::move(sub));
    }

    for (const auto& item : optionalArray(doc, "subsource_groups", "directory")) {
        const auto& g = expectObject(item, "subsource group");
        SubsourceGroup group;
        group.ref = requiredString(g, "ref", "subsource group");
        group.subsource_refs = stringList(g, "subsources", "subsource group '" + group.ref + "'");
        graph.addSubsourceGroup(std::move(group));
    }

    for (const auto& item : optionalArray(doc, "criteria_containers", "directory")) {
        const auto& c = expectObject(item, "criteria container");
        CriteriaContainer crit;
        crit.ref = requiredString(c, "ref", "criteria container");
        std::string what = "criteria container '" + crit.ref + "'";
        for (const auto& a : optionalArray(c, "asn", what)) {
            if (a.isNumber() && a.asNumber() == std::floor(a.asNumber())) {
                crit.asn.push_back(a.asInt64());
            } else {
                throw DirectoryStructureError(what + ".asn values must be integers");
            }
        }
        crit.cc = stringList(c, "cc", what);
        crit.ip_network = stringList(c, "ip_network", what);
        crit.category = stringList(c, "category", what);
        crit.name = stringList(c, "name", what);
        graph.addCriteriaContainer(std::move(crit));
    }

    result.ignored_ip_networks = stringList(doc, "ignored_ip_networks", "directory");
    graph.validate();
    return result;
}

} // namespace authcore
