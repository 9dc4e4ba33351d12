/**
 * @file inside_criteria.cpp
 * @brief Inside criteria extraction, interval index and event matching
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "inside_criteria.hpp"
#include "auth_error.hpp"
#include "auth_logger.hpp"
#include "auth_string_utils.hpp"
#include "auth_types.hpp"
#include <algorithm>
#include <regex>

namespace authcore {

// ============================================================================
// Extraction from the directory
// ============================================================================

std::vector<InsideCriteria> insideCriteriaFromDirectory(const DirectoryGraph& graph) {
    std::vector<InsideCriteria> result;
    result.reserve(graph.organizations().size());
    for (const auto& [orgId, org] : graph.organizations()) {
        InsideCriteria cri;
        cri.org_id = orgId;
        for (const auto& value : attributeValues(org.attributes, "n6asn")) {
            auto asn = string_utils::toInt64(string_utils::trim(value));
            if (!asn) {
                LOG_ERROR("InsideCriteria", "Problem with directory data for the organization '"
                          + orgId + "': n6asn is not an integer: '" + value + "'");
                continue;
            }
            cri.asn_seq.push_back(*asn);
        }
        cri.cc_seq = attributeValues(org.attributes, "n6cc");
        cri.fqdn_seq = attributeValues(org.attributes, "n6fqdn");
        for (const auto& value : attributeValues(org.attributes, "n6ip-network")) {
            auto bounds = ipNetworkBounds(value);
            if (!bounds) {
                LOG_ERROR("InsideCriteria", "Problem with directory data for the organization '"
                          + orgId + "': malformed n6ip-network '" + value + "'");
                continue;
            }
            cri.ip_min_max_seq.push_back(*bounds);
        }
        cri.url_seq = attributeValues(org.attributes, "n6url");
        result.push_back(std::move(cri));
    }
    return result;
}

// ============================================================================
// Glob translation
// ============================================================================

namespace {

bool isRegexSpecial(char c) {
    static const std::string specials = "\\^$.|?*+()[]{}";
    return specials.find(c) != std::string::npos;
}

void appendLiteral(std::string& out, char c) {
    if (isRegexSpecial(c)) out += '\\';
    out += c;
}

} // namespace

std::string globToRegex(const std::string& glob) {
    std::string out;
    size_t i = 0;
    const size_t n = glob.size();
    while (i < n) {
        char c = glob[i++];
        if (c == '*') {
            out += "[\\s\\S]*";
        } else if (c == '?') {
            out += "[\\s\\S]";
        } else if (c == '[') {
            size_t j = i;
            if (j < n && glob[j] == '!') ++j;
            if (j < n && glob[j] == ']') ++j;
            while (j < n && glob[j] != ']') ++j;
            if (j >= n) {
                out += "\\[";
                continue;
            }
            std::string stuff = string_utils::replaceAll(glob.substr(i, j - i), "\\", "\\\\");
            i = j + 1;
            if (!stuff.empty() && stuff[0] == '!') {
                stuff[0] = '^';
            } else if (!stuff.empty() && stuff[0] == '^') {
                stuff = "\\" + stuff;
            }
            out += "[" + stuff + "]";
        } else {
            appendLiteral(out, c);
        }
    }
    return out;
}

// ============================================================================
// InsideCriteriaResolver
// ============================================================================

InsideCriteriaResolver::InsideCriteriaResolver(const std::vector<InsideCriteria>& criteria) {
    if (criteria.empty()) {
        LOG_WARNING("InsideCriteria", "Something wrong: the inside criteria list is empty");
    }

    std::map<int64_t, std::vector<std::pair<std::string, bool>>> endpoints;
    endpoints[IP_LO_GUARD];
    endpoints[IP_HI_GUARD];

    std::set<std::string> seen;
    for (const auto& cri : criteria) {
        if (!seen.insert(cri.org_id).second) {
            throw AuthCoreError(ErrorCode::INVALID_ARGUMENT,
                                "duplicate inside criteria for the organization '" + cri.org_id + "'");
        }
        for (const auto& [minIp, maxIp] : cri.ip_min_max_seq) {
            if (minIp > maxIp || minIp < 0 || maxIp >= IP_HI_GUARD) {
                throw AuthCoreError(ErrorCode::INVALID_ARGUMENT,
                                    "invalid IP range " + std::to_string(minIp) + "-"
                                    + std::to_string(maxIp) + " of the organization '" + cri.org_id + "'");
            }
            endpoints[minIp].emplace_back(cri.org_id, true);
            endpoints[maxIp + 1].emplace_back(cri.org_id, false);
        }
        for (const auto& fqdn : cri.fqdn_seq) fqdn_suffix_to_ids_[fqdn].push_back(cri.org_id);
        for (int64_t asn : cri.asn_seq) asn_to_ids_[asn].push_back(cri.org_id);
        for (const auto& cc : cri.cc_seq) cc_to_ids_[cc].push_back(cri.org_id);
        if (!cri.url_seq.empty()) ids_and_urls_.emplace_back(cri.org_id, cri.url_seq);
    }

    buildIntervals(endpoints);
    LOG_DEBUG("InsideCriteria", "Built index of " + std::to_string(criteria.size())
              + " organizations with " + std::to_string(border_ips_.size()) + " IP borders");
}

void InsideCriteriaResolver::buildIntervals(
        const std::map<int64_t, std::vector<std::pair<std::string, bool>>>& endpoints) {
    std::map<std::string, int> unclosed;
    auto currentSet = [&unclosed] {
        std::set<std::string> ids;
        for (const auto& [orgId, count] : unclosed) {
            if (count > 0) ids.insert(orgId);
        }
        return ids;
    };

    for (const auto& [ip, orgEndpoints] : endpoints) {
        for (const auto& [orgId, isLower] : orgEndpoints) {
            unclosed[orgId] += isLower ? 1 : -1;
        }
        border_ips_.push_back(ip);
        org_sets_.push_back(currentSet());
    }

    if (border_ips_.front() != IP_LO_GUARD || border_ips_.back() != IP_HI_GUARD ||
        !org_sets_.front().empty() || !org_sets_.back().empty()) {
        throw AuthCoreError(ErrorCode::INTERNAL_ERROR, "unbalanced IP interval decomposition");
    }
}

const std::set<std::string>& InsideCriteriaResolver::orgIdsForIp(uint32_t ip) const {
    auto it = std::upper_bound(border_ips_.begin(), border_ips_.end(), static_cast<int64_t>(ip));
    return org_sets_[static_cast<size_t>(it - border_ips_.begin()) - 1];
}

InsideMatchResult InsideCriteriaResolver::match(const InsideMatchInput& event,
                                                const std::set<std::string>& fqdnOnlyCategories) const {
    InsideMatchResult result;

    if (event.fqdn) {
        const std::string& fqdn = *event.fqdn;
        size_t start = 0;
        while (true) {
            auto it = fqdn_suffix_to_ids_.find(fqdn.substr(start));
            if (it != fqdn_suffix_to_ids_.end()) {
                result.org_ids.insert(it->second.begin(), it->second.end());
            }
            size_t dot = fqdn.find('.', start);
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
    }

    if (fqdnOnlyCategories.count(event.category)) return result;

    for (const auto& adr : event.address) {
        if (adr.asn) {
            auto it = asn_to_ids_.find(*adr.asn);
            if (it != asn_to_ids_.end()) result.org_ids.insert(it->second.begin(), it->second.end());
        }
        if (adr.cc) {
            auto it = cc_to_ids_.find(*adr.cc);
            if (it != cc_to_ids_.end()) result.org_ids.insert(it->second.begin(), it->second.end());
        }
        const auto& ids = orgIdsForIp(adr.ip);
        result.org_ids.insert(ids.begin(), ids.end());
    }

    if (event.url_pattern) matchUrls(*event.url_pattern, result);
    return result;
}

void InsideCriteriaResolver::matchUrls(const std::string& urlPattern, InsideMatchResult& result) const {
    std::optional<std::regex> searchRe;
    std::optional<std::regex> globRe;
    std::string regexProblem;
    try {
        searchRe.emplace(urlPattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        regexProblem = e.what();
    }
    try {
        globRe.emplace(globToRegex(urlPattern), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        if (!searchRe) {
            LOG_WARNING("InsideCriteria", "Cannot process url_pattern '" + urlPattern
                        + "' (as regex: " + regexProblem + "; as glob: " + e.what() + ")");
            return;
        }
    }

    for (const auto& [orgId, urls] : ids_and_urls_) {
        std::set<std::string> matched;
        for (const auto& url : urls) {
            if ((searchRe && std::regex_search(url, *searchRe)) ||
                (globRe && std::regex_match(url, *globRe))) {
                matched.insert(url);
            }
        }
        if (!matched.empty()) {
            result.org_ids.insert(orgId);
            result.urls_matched[orgId].assign(matched.begin(), matched.end());
        }
    }
}

} // namespace authcore
