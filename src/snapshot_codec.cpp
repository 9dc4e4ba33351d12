/**
 * @file snapshot_codec.cpp
 * @brief JSON codecs of snapshot views and the cache body
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "snapshot_codec.hpp"
#include "auth_error.hpp"
#include "auth_logger.hpp"
#include "directory_json.hpp"

namespace authcore {

using json::JsonArray;
using json::JsonObject;
using json::JsonValue;

namespace {

JsonValue optionalInt(const std::optional<int64_t>& value) {
    return value ? JsonValue(*value) : JsonValue(nullptr);
}

std::optional<int64_t> optionalIntFrom(const JsonValue& value) {
    if (value.isNull()) return std::nullopt;
    return value.asInt64();
}

template<typename Container>
JsonValue stringArray(const Container& values) {
    JsonArray arr;
    for (const auto& v : values) arr.emplace_back(v);
    return JsonValue(std::move(arr));
}

std::vector<std::string> stringsFrom(const JsonValue& value) {
    std::vector<std::string> out;
    for (const auto& item : value.asArray()) out.push_back(item.asString());
    return out;
}

AccessZone zoneFrom(const std::string& name) {
    auto zone = accessZoneFromString(name);
    if (!zone) throw std::runtime_error("unknown access zone '" + name + "'");
    return *zone;
}

} // namespace

// ============================================================================
// Resource limits and access infos
// ============================================================================

JsonValue resourceLimitsToJson(const ResourceLimits& limits) {
    JsonObject obj;
    obj["window"] = JsonValue(limits.window);
    obj["queries_limit"] = optionalInt(limits.queries_limit);
    obj["results_limit"] = optionalInt(limits.results_limit);
    obj["max_days_old"] = JsonValue(limits.max_days_old);
    if (limits.request_parameters) {
        JsonObject params;
        for (const auto& [name, required] : *limits.request_parameters) params[name] = JsonValue(required);
        obj["request_parameters"] = JsonValue(std::move(params));
    } else {
        obj["request_parameters"] = JsonValue(nullptr);
    }
    return JsonValue(std::move(obj));
}

ResourceLimits resourceLimitsFromJson(const JsonValue& doc) {
    ResourceLimits limits;
    limits.window = doc["window"].asInt64();
    limits.queries_limit = optionalIntFrom(doc["queries_limit"]);
    limits.results_limit = optionalIntFrom(doc["results_limit"]);
    limits.max_days_old = doc["max_days_old"].asInt64();
    const JsonValue& params = doc["request_parameters"];
    if (!params.isNull()) {
        std::map<std::string, bool> parsed;
        for (const auto& [name, required] : params.asObject()) parsed[name] = required.asBool();
        limits.request_parameters = std::move(parsed);
    }
    return limits;
}

JsonValue accessInfoToJson(const AccessInfo& info) {
    JsonObject zones;
    for (const auto& [zone, conditions] : info.access_zone_conditions) {
        JsonArray arr;
        for (const auto& compiled : conditions) arr.push_back(condToJson(compiled.cond));
        zones[accessZoneToString(zone)] = JsonValue(std::move(arr));
    }
    JsonObject limits;
    for (const auto& [resourceId, resourceLimits] : info.resource_limits) {
        limits[resourceId] = resourceLimitsToJson(resourceLimits);
    }
    JsonObject obj;
    obj["full_access"] = JsonValue(info.full_access);
    obj["access_zone_conditions"] = JsonValue(std::move(zones));
    obj["resource_limits"] = JsonValue(std::move(limits));
    return JsonValue(std::move(obj));
}

AccessInfo accessInfoFromJson(const JsonValue& doc) {
    AccessInfo info;
    info.full_access = doc["full_access"].asBool();
    for (const auto& [zoneName, conditions] : doc["access_zone_conditions"].asObject()) {
        auto& list = info.access_zone_conditions[zoneFrom(zoneName)];
        for (const auto& item : conditions.asArray()) {
            list.push_back(compileCondition(condFromJson(item)));
        }
    }
    for (const auto& [resourceId, limits] : doc["resource_limits"].asObject()) {
        info.resource_limits.emplace(resourceId, resourceLimitsFromJson(limits));
    }
    return info;
}

// ============================================================================
// Inside criteria and notification configs
// ============================================================================

JsonValue insideCriteriaToJson(const InsideCriteria& cri) {
    JsonObject obj;
    obj["org_id"] = JsonValue(cri.org_id);
    obj["fqdn_seq"] = stringArray(cri.fqdn_seq);
    JsonArray asns;
    for (int64_t asn : cri.asn_seq) asns.emplace_back(asn);
    obj["asn_seq"] = JsonValue(std::move(asns));
    obj["cc_seq"] = stringArray(cri.cc_seq);
    JsonArray ranges;
    for (const auto& [lo, hi] : cri.ip_min_max_seq) {
        ranges.emplace_back(JsonArray{JsonValue(lo), JsonValue(hi)});
    }
    obj["ip_min_max_seq"] = JsonValue(std::move(ranges));
    obj["url_seq"] = stringArray(cri.url_seq);
    return JsonValue(std::move(obj));
}

InsideCriteria insideCriteriaFromJson(const JsonValue& doc) {
    InsideCriteria cri;
    cri.org_id = doc["org_id"].asString();
    cri.fqdn_seq = stringsFrom(doc["fqdn_seq"]);
    for (const auto& item : doc["asn_seq"].asArray()) cri.asn_seq.push_back(item.asInt64());
    cri.cc_seq = stringsFrom(doc["cc_seq"]);
    for (const auto& item : doc["ip_min_max_seq"].asArray()) {
        cri.ip_min_max_seq.emplace_back(item[0].asInt64(), item[1].asInt64());
    }
    cri.url_seq = stringsFrom(doc["url_seq"]);
    return cri;
}

JsonValue notificationConfigToJson(const NotificationConfig& config) {
    JsonArray times;
    for (const auto& t : config.times) times.emplace_back(t.toString());
    JsonObject obj;
    obj["times"] = JsonValue(std::move(times));
    obj["addresses"] = stringArray(config.addresses);
    obj["name"] = config.name ? JsonValue(*config.name) : JsonValue(nullptr);
    obj["stream_api_enabled"] = JsonValue(config.stream_api_enabled);
    obj["business_days_only"] = JsonValue(config.business_days_only);
    obj["language"] = JsonValue(config.language);
    return JsonValue(std::move(obj));
}

NotificationConfig notificationConfigFromJson(const JsonValue& doc) {
    NotificationConfig config;
    for (const auto& item : doc["times"].asArray()) {
        auto t = NotificationTime::parse(item.asString());
        if (!t) throw std::runtime_error("bad notification time '" + item.asString() + "'");
        config.times.push_back(*t);
    }
    config.addresses = stringsFrom(doc["addresses"]);
    if (!doc["name"].isNull()) config.name = doc["name"].asString();
    config.stream_api_enabled = doc["stream_api_enabled"].asBool();
    config.business_days_only = doc["business_days_only"].asBool();
    config.language = doc["language"].asString();
    return config;
}

JsonValue combinedConfigToJson(const CombinedConfig& config) {
    JsonObject obj;
    obj["inside_criteria"] = insideCriteriaToJson(config.inside_criteria);
    obj["notification_config"] = config.notification_config
        ? notificationConfigToJson(*config.notification_config) : JsonValue(nullptr);
    return JsonValue(std::move(obj));
}

CombinedConfig combinedConfigFromJson(const JsonValue& doc) {
    CombinedConfig config;
    config.inside_criteria = insideCriteriaFromJson(doc["inside_criteria"]);
    if (!doc["notification_config"].isNull()) {
        config.notification_config = notificationConfigFromJson(doc["notification_config"]);
    }
    return config;
}

// ============================================================================
// Cache body
// ============================================================================

std::string serializeSnapshot(const SnapshotPtr& snapshot, CompilerMode mode) {
    AuthViews views(snapshot, mode);
    auto accessInfos = views.accessInfos();
    auto combinedConfigs = views.combinedConfigs();

    JsonObject infos;
    for (const auto& [orgId, info] : *accessInfos) infos[orgId] = accessInfoToJson(info);
    JsonObject combined;
    for (const auto& [orgId, config] : *combinedConfigs) combined[orgId] = combinedConfigToJson(config);

    JsonObject doc;
    doc["format"] = JsonValue(SNAPSHOT_FORMAT);
    doc["version"] = JsonValue(snapshot->version());
    doc["timestamp"] = JsonValue(snapshot->timestamp());
    doc["compiler_mode"] = JsonValue(compilerModeToString(mode));
    doc["directory"] = directoryToJson(snapshot->graph(), snapshot->ignoredIpNetworks());
    doc["access_infos"] = JsonValue(std::move(infos));
    doc["combined_configs"] = JsonValue(std::move(combined));
    return JsonValue(std::move(doc)).dump();
}

SnapshotPtr deserializeSnapshot(const std::string& body, CompilerMode mode) {
    try {
        const JsonValue doc = json::parse(body);
        if (doc["format"].asInt() != SNAPSHOT_FORMAT) {
            throw std::runtime_error("unsupported format " + doc["format"].dump());
        }
        DirectoryDocument directory = directoryFromJson(doc["directory"]);
        auto snapshot = std::make_shared<const Snapshot>(
            std::move(directory.graph), doc["version"].asInt64(), doc["timestamp"].asNumber(),
            std::move(directory.ignored_ip_networks));

        if (compilerModeFromString(doc["compiler_mode"].asString()) == mode) {
            OrgAccessInfos infos;
            for (const auto& [orgId, info] : doc["access_infos"].asObject()) {
                infos.emplace(orgId, accessInfoFromJson(info));
            }
            snapshot->seed<OrgAccessInfos>(views::accessInfos(mode),
                                           std::make_shared<const OrgAccessInfos>(std::move(infos)));
        } else {
            LOG_INFO("SignedCache", "Cached access infos were built in a different compiler mode; "
                     "they will be recomputed");
        }

        CombinedConfigs combined;
        for (const auto& [orgId, config] : doc["combined_configs"].asObject()) {
            combined.emplace(orgId, combinedConfigFromJson(config));
        }
        snapshot->seed<CombinedConfigs>(views::COMBINED_CONFIGS,
                                        std::make_shared<const CombinedConfigs>(std::move(combined)));
        return snapshot;
    } catch (const std::runtime_error& e) {
        throw CacheIntegrityError(ErrorCode::CACHE_IO_ERROR, std::string("malformed cache body: ") + e.what());
    }
}

} // namespace authcore
