/**
 * @file auth_views.cpp
 * @brief Derived snapshot views
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "auth_views.hpp"
#include "auth_error.hpp"
#include "auth_logger.hpp"
#include "auth_string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace authcore {

// ============================================================================
// NotificationTime
// ============================================================================

namespace {

std::optional<int> parseTimeField(const std::string& field, int maxValue) {
    if (field.empty() || field.size() > 2) return std::nullopt;
    for (char c : field) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    int value = std::stoi(field);
    if (value > maxValue) return std::nullopt;
    return value;
}

std::string orgCaption(const std::string& orgId) {
    return "the organization '" + orgId + "'";
}

} // namespace

std::optional<NotificationTime> NotificationTime::parse(const std::string& text) {
    std::string s = string_utils::removeAll(string_utils::trim(text), ' ');
    std::replace(s.begin(), s.end(), '.', ':');

    NotificationTime t;
    auto colon = s.find(':');
    if (colon == std::string::npos) {
        auto hour = parseTimeField(s, 23);
        if (!hour) return std::nullopt;
        t.hour = *hour;
        return t;
    }
    auto hour = parseTimeField(s.substr(0, colon), 23);
    auto minute = parseTimeField(s.substr(colon + 1), 59);
    if (!hour || !minute) return std::nullopt;
    t.hour = *hour;
    t.minute = *minute;
    return t;
}

std::string NotificationTime::toString() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
    return buf;
}

NotificationConfig makeNotificationConfig(const Organization& org) {
    NotificationConfig config;
    for (const auto& value : attributeValues(org.attributes, "n6email-notifications-times")) {
        auto t = NotificationTime::parse(value);
        if (!t) {
            LOG_ERROR("AuthApi", "Incorrect format of notification time '" + value
                      + "' for org id '" + org.id + "'");
            continue;
        }
        config.times.push_back(*t);
    }
    std::sort(config.times.begin(), config.times.end());
    if (config.times.empty()) {
        LOG_WARNING("AuthApi", "No notification times for org id '" + org.id + "'");
    }

    config.addresses = attributeValues(org.attributes, "n6email-notifications-address");
    std::sort(config.addresses.begin(), config.addresses.end());
    if (config.addresses.empty()) {
        LOG_WARNING("AuthApi", "No notification email addresses for org id '" + org.id + "'");
    }

    try {
        config.name = singleAttributeValue(org.attributes, "name");
    } catch (const DirectoryDataError& e) {
        LOG_ERROR("AuthApi", "Problem with directory data for " + orgCaption(org.id) + ": " + e.what());
    }
    try {
        auto language = singleAttributeValue(org.attributes, "n6email-notifications-language");
        if (language) config.language = *language;
    } catch (const DirectoryDataError& e) {
        LOG_ERROR("AuthApi", "Problem with directory data for " + orgCaption(org.id) + ": " + e.what());
    }
    if (!config.name || config.name->empty()) {
        config.name.reset();
        LOG_INFO("AuthApi", "No name for org id '" + org.id + "'");
    }

    config.stream_api_enabled = isFlagEnabled(org.attributes, orgCaption(org.id), flags::STREAM_API_ENABLED);
    config.business_days_only = isFlagEnabled(org.attributes, orgCaption(org.id),
                                               flags::EMAIL_NOTIFICATIONS_BUSINESS_DAYS_ONLY);
    return config;
}

// ============================================================================
// View names
// ============================================================================

namespace views {

std::string accessInfos(CompilerMode mode) {
    return "access_infos:" + compilerModeToString(mode);
}

std::string streamAccessInfos(CompilerMode mode) {
    return "stream_access_infos:" + compilerModeToString(mode);
}

std::string notificationAccessInfos(CompilerMode mode) {
    return "notification_access_infos:" + compilerModeToString(mode);
}

} // namespace views

// ============================================================================
// Organization and user views
// ============================================================================

std::shared_ptr<const StringMap> AuthViews::userIdsToOrgIds() const {
    return snapshot_->memoized<StringMap>(views::USER_IDS_TO_ORG_IDS, [this] {
        const DirectoryGraph& graph = snapshot_->graph();
        GraphResolver(graph).checkOrgIdLengths();
        StringMap result;
        for (const auto& [orgId, org] : graph.organizations()) {
            for (const auto& userId : org.user_ids) {
                auto [it, inserted] = result.emplace(userId, orgId);
                if (!inserted && it->second != orgId) {
                    LOG_ERROR("AuthApi", "Problem with directory data: a user belongs to more than one "
                              "organization ('" + it->second + "' and '" + orgId
                              + "'); only the former is kept");
                }
            }
        }
        return result;
    });
}

std::shared_ptr<const StringSet> AuthViews::orgIds() const {
    return snapshot_->memoized<StringSet>(views::ORG_IDS, [this] {
        StringSet result;
        for (const auto& entry : snapshot_->graph().organizations()) result.insert(entry.first);
        return result;
    });
}

std::shared_ptr<const StringSet> AuthViews::streamApiEnabledOrgIds() const {
    return snapshot_->memoized<StringSet>(views::STREAM_API_ENABLED_ORG_IDS, [this] {
        StringSet result;
        for (const auto& [orgId, org] : snapshot_->graph().organizations()) {
            if (isFlagEnabled(org.attributes, orgCaption(orgId), flags::STREAM_API_ENABLED)) {
                result.insert(orgId);
            }
        }
        return result;
    });
}

std::shared_ptr<const StringSet> AuthViews::streamApiDisabledOrgIds() const {
    return snapshot_->memoized<StringSet>(views::STREAM_API_DISABLED_ORG_IDS, [this] {
        auto enabled = streamApiEnabledOrgIds();
        StringSet result;
        for (const auto& entry : snapshot_->graph().organizations()) {
            if (!enabled->count(entry.first)) result.insert(entry.first);
        }
        return result;
    });
}

// ============================================================================
// Access views
// ============================================================================

std::shared_ptr<const AccessFactSet> AuthViews::accessFacts() const {
    return snapshot_->memoized<AccessFactSet>(views::ACCESS_FACTS, [this] {
        GraphResolver resolver(snapshot_->graph());
        resolver.checkOrgIdLengths();
        return resolver.resolveAccessFacts();
    });
}

std::shared_ptr<const OrgAccessInfos> AuthViews::accessInfos() const {
    return snapshot_->memoized<OrgAccessInfos>(views::accessInfos(mode_), [this] {
        auto facts = accessFacts();
        GraphResolver resolver(snapshot_->graph());
        return ConditionCompiler(resolver, mode_).compileAccessInfos(*facts);
    });
}

std::shared_ptr<const StreamAccessInfos> AuthViews::streamAccessInfos() const {
    return snapshot_->memoized<StreamAccessInfos>(views::streamAccessInfos(mode_), [this] {
        auto facts = accessFacts();
        GraphResolver resolver(snapshot_->graph());
        return ConditionCompiler(resolver, mode_).compileStreamAccessInfos(*facts);
    });
}

std::shared_ptr<const NotificationAccessInfoMappings> AuthViews::notificationAccessInfoMappings() const {
    return snapshot_->memoized<NotificationAccessInfoMappings>(views::notificationAccessInfos(mode_), [this] {
        auto facts = accessFacts();
        GraphResolver resolver(snapshot_->graph());
        return ConditionCompiler(resolver, mode_).compileNotificationAccessInfos(*facts);
    });
}

// ============================================================================
// Notification, inside criteria and combined views
// ============================================================================

std::shared_ptr<const NotificationConfigs> AuthViews::notificationConfigs() const {
    return snapshot_->memoized<NotificationConfigs>(views::NOTIFICATION_CONFIGS, [this] {
        NotificationConfigs result;
        for (const auto& [orgId, org] : snapshot_->graph().organizations()) {
            if (isFlagEnabled(org.attributes, orgCaption(orgId), flags::EMAIL_NOTIFICATIONS_ENABLED)) {
                result.emplace(orgId, makeNotificationConfig(org));
            }
        }
        return result;
    });
}

std::shared_ptr<const std::vector<InsideCriteria>> AuthViews::insideCriteria() const {
    return snapshot_->memoized<std::vector<InsideCriteria>>(views::INSIDE_CRITERIA, [this] {
        return insideCriteriaFromDirectory(snapshot_->graph());
    });
}

std::shared_ptr<const InsideCriteriaResolver> AuthViews::insideCriteriaResolver() const {
    return snapshot_->memoized<InsideCriteriaResolver>(views::INSIDE_CRITERIA_RESOLVER, [this] {
        return InsideCriteriaResolver(*insideCriteria());
    });
}

std::shared_ptr<const CombinedConfigs> AuthViews::combinedConfigs() const {
    return snapshot_->memoized<CombinedConfigs>(views::COMBINED_CONFIGS, [this] {
        auto criteria = insideCriteria();
        auto notifications = notificationConfigs();
        CombinedConfigs result;
        for (const auto& cri : *criteria) {
            CombinedConfig combined;
            combined.inside_criteria = cri;
            auto it = notifications->find(cri.org_id);
            if (it != notifications->end()) combined.notification_config = it->second;
            result.emplace(cri.org_id, std::move(combined));
        }
        return result;
    });
}

std::shared_ptr<const StringMap> AuthViews::actualNames() const {
    return snapshot_->memoized<StringMap>(views::ACTUAL_NAMES, [this] {
        StringMap result;
        for (const auto& [orgId, org] : snapshot_->graph().organizations()) {
            try {
                auto name = singleAttributeValue(org.attributes, "name");
                if (name && !name->empty()) result.emplace(orgId, *name);
            } catch (const DirectoryDataError& e) {
                LOG_ERROR("AuthApi", "Problem with directory data for " + orgCaption(orgId) + ": " + e.what());
            }
        }
        return result;
    });
}

// ============================================================================
// Source views
// ============================================================================

std::shared_ptr<const AnonymizedSourceMapping> AuthViews::anonymizedSourceMapping() const {
    return snapshot_->memoized<AnonymizedSourceMapping>(views::ANONYMIZED_SOURCE_MAPPING, [this] {
        AnonymizedSourceMapping mapping;
        for (const auto& [sourceId, source] : snapshot_->graph().sources()) {
            try {
                auto anonymized = singleAttributeValue(source.attributes, "n6anonymized");
                if (!anonymized) throw DirectoryDataError("n6anonymized is missing");
                mapping.forward.emplace(sourceId, *anonymized);
            } catch (const DirectoryDataError& e) {
                LOG_ERROR("AuthApi", "Problem with directory data for the source '" + sourceId + "': " + e.what());
            }
        }
        for (const auto& [sourceId, anonymized] : mapping.forward) {
            mapping.reverse.emplace(anonymized, sourceId);
        }
        return mapping;
    });
}

std::shared_ptr<const StringSet> AuthViews::dipAnonymizationDisabledSourceIds() const {
    return snapshot_->memoized<StringSet>(views::DIP_ANONYMIZATION_DISABLED_SOURCE_IDS, [this] {
        StringSet result;
        for (const auto& [sourceId, source] : snapshot_->graph().sources()) {
            if (!isFlagEnabled(source.attributes, "the source '" + sourceId + "'",
                               flags::DIP_ANONYMIZATION_ENABLED, false, true)) {
                result.insert(sourceId);
            }
        }
        return result;
    });
}

} // namespace authcore
