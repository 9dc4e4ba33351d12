/**
 * @file inside_criteria.hpp
 * @brief Inside criteria of organizations and the matcher that tags
 *        events with the organizations they concern
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_INSIDE_CRITERIA_HPP
#define AUTHCORE_INSIDE_CRITERIA_HPP

#include "directory.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace authcore {

/**
 * @struct InsideCriteria
 * @brief Matching rules of one organization
 */
struct InsideCriteria {
    std::string org_id;
    std::vector<std::string> fqdn_seq;     ///< FQDN suffixes
    std::vector<int64_t> asn_seq;
    std::vector<std::string> cc_seq;
    std::vector<std::pair<int64_t, int64_t>> ip_min_max_seq;   ///< inclusive ranges
    std::vector<std::string> url_seq;

    bool operator==(const InsideCriteria&) const = default;
};

/**
 * @brief Inside criteria of every organization, in org id order
 *
 * Malformed n6asn and n6ip-network values are logged and skipped.
 */
std::vector<InsideCriteria> insideCriteriaFromDirectory(const DirectoryGraph& graph);

struct EventAddress {
    uint32_t ip = 0;
    std::optional<int64_t> asn;
    std::optional<std::string> cc;
};

/** @brief The event fields the matcher looks at */
struct InsideMatchInput {
    std::string category;
    std::optional<std::string> fqdn;
    std::vector<EventAddress> address;
    std::optional<std::string> url_pattern;
};

struct InsideMatchResult {
    std::set<std::string> org_ids;
    std::map<std::string, std::vector<std::string>> urls_matched;   ///< sorted, unique
};

/**
 * @brief Translate a shell glob into an anchored ECMAScript regex body
 *
 * '*' and '?' match any characters including newlines; "[!...]" is a
 * negated set; an unterminated '[' is literal.
 */
std::string globToRegex(const std::string& glob);

/**
 * @class InsideCriteriaResolver
 * @brief Read-only index over all inside criteria
 *
 * IP ranges are decomposed into half-open intervals: border_ips[i] starts
 * the interval whose organizations are org_sets[i]. Guard borders -1 and
 * 2^32 keep every IPv4 address inside the table, and the sets at both
 * guards are empty. Queries are safe from any number of threads.
 */
class InsideCriteriaResolver {
public:
    static constexpr int64_t IP_LO_GUARD = -1;
    static constexpr int64_t IP_HI_GUARD = int64_t{1} << 32;

    /**
     * @throws AuthCoreError (INVALID_ARGUMENT) on a duplicate org id or an
     *         inverted IP range
     */
    explicit InsideCriteriaResolver(const std::vector<InsideCriteria>& criteria);

    /**
     * @brief Organizations the event concerns and the URLs that matched
     *
     * FQDN suffixes are always checked. Addresses (ASN, CC, IP) and the
     * URL pattern are checked only when the category is not in
     * @p fqdnOnlyCategories.
     */
    InsideMatchResult match(const InsideMatchInput& event,
                            const std::set<std::string>& fqdnOnlyCategories = {}) const;

    /** @brief Organizations whose IP ranges contain @p ip */
    const std::set<std::string>& orgIdsForIp(uint32_t ip) const;

    const std::vector<int64_t>& borderIps() const { return border_ips_; }
    const std::vector<std::set<std::string>>& orgSets() const { return org_sets_; }

private:
    void buildIntervals(const std::map<int64_t, std::vector<std::pair<std::string, bool>>>& endpoints);
    void matchUrls(const std::string& urlPattern, InsideMatchResult& result) const;

    std::vector<int64_t> border_ips_;
    std::vector<std::set<std::string>> org_sets_;
    std::unordered_map<std::string, std::vector<std::string>> fqdn_suffix_to_ids_;
    std::unordered_map<int64_t, std::vector<std::string>> asn_to_ids_;
    std::unordered_map<std::string, std::vector<std::string>> cc_to_ids_;
    std::vector<std::pair<std::string, std::vector<std::string>>> ids_and_urls_;
};

} // namespace authcore

#endif // AUTHCORE_INSIDE_CRITERIA_HPP
