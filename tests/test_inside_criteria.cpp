/**
 * @file test_inside_criteria.cpp
 * @brief Tests for inside criteria extraction and the event matcher
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "test_fixtures.hpp"
#include "inside_criteria.hpp"
#include <algorithm>
#include <regex>

using namespace authcore;
using namespace authcore::testing;

namespace {

InsideCriteria criteria(const std::string& orgId) {
    InsideCriteria cri;
    cri.org_id = orgId;
    return cri;
}

InsideMatchInput eventAt(uint32_t ip, const std::string& category = "bots") {
    InsideMatchInput event;
    event.category = category;
    event.address.push_back({ip, std::nullopt, std::nullopt});
    return event;
}

bool globMatches(const std::string& glob, const std::string& text) {
    return std::regex_match(text, std::regex(globToRegex(glob), std::regex::ECMAScript));
}

} // namespace

// ============================================================================
// Extraction
// ============================================================================

TEST_CASE_SUITE(ExtractedFromSampleDirectory, InsideCriteria) {
    auto all = insideCriteriaFromDirectory(fixtures::sampleGraph());
    REQUIRE_SIZE(all, 3u);
    const InsideCriteria& oA = all.back();
    REQUIRE_EQ(oA.org_id, std::string("oA"));
    REQUIRE(oA.fqdn_seq == std::vector<std::string>{"example.org"});
    REQUIRE_SIZE(oA.ip_min_max_seq, 2u);
    // 0.0.0.0 is not a valid event address, so the range starts at 1
    REQUIRE(oA.ip_min_max_seq[0] == std::make_pair(int64_t{1}, int64_t{3}));
    REQUIRE(oA.ip_min_max_seq[1] == std::make_pair(int64_t{167772160}, int64_t{184549375}));
    REQUIRE_EMPTY(all.front().ip_min_max_seq);
}

TEST_CASE_SUITE(MalformedValuesAreSkipped, InsideCriteria) {
    DirectoryGraph graph;
    graph.addOrganization(fixtures::makeOrg("o-odd", {
        {"n6asn", {"12", "twelve"}},
        {"n6ip-network", {"300.1.1.1/8", "192.168.0.0/24"}},
    }));
    auto all = insideCriteriaFromDirectory(graph);
    REQUIRE(all.front().asn_seq == std::vector<int64_t>{12});
    REQUIRE_SIZE(all.front().ip_min_max_seq, 1u);
    REQUIRE_LOGGED("n6asn is not an integer: 'twelve'");
    REQUIRE_LOGGED("malformed n6ip-network '300.1.1.1/8'");
}

// ============================================================================
// Interval index
// ============================================================================

TEST_CASE_SUITE(SampleIpLookup, InsideResolver) {
    InsideCriteriaResolver resolver(insideCriteriaFromDirectory(fixtures::sampleGraph()));
    REQUIRE(resolver.match(eventAt(2)).org_ids == std::set<std::string>{"oA"});
    REQUIRE_EMPTY(resolver.match(eventAt(0)).org_ids);
    REQUIRE_EMPTY(resolver.match(eventAt(4)).org_ids);
    REQUIRE(resolver.orgIdsForIp(184549375u) == std::set<std::string>{"oA"});
    REQUIRE_EMPTY(resolver.orgIdsForIp(184549376u));
}

TEST_CASE_SUITE(IntervalsAreBalanced, InsideResolver) {
    InsideCriteria a = criteria("a");
    a.ip_min_max_seq = {{10, 20}, {15, 30}};
    InsideCriteria b = criteria("b");
    b.ip_min_max_seq = {{20, 20}, {0xFFFFFF00, 0xFFFFFFFF}};
    InsideCriteriaResolver resolver({a, b});

    const auto& borders = resolver.borderIps();
    REQUIRE_EQ(borders.front(), InsideCriteriaResolver::IP_LO_GUARD);
    REQUIRE_EQ(borders.back(), InsideCriteriaResolver::IP_HI_GUARD);
    REQUIRE(std::is_sorted(borders.begin(), borders.end()));
    REQUIRE_EMPTY(resolver.orgSets().front());
    REQUIRE_EMPTY(resolver.orgSets().back());

    REQUIRE_EMPTY(resolver.orgIdsForIp(9));
    REQUIRE(resolver.orgIdsForIp(10) == std::set<std::string>{"a"});
    REQUIRE(resolver.orgIdsForIp(20) == (std::set<std::string>{"a", "b"}));
    REQUIRE(resolver.orgIdsForIp(25) == std::set<std::string>{"a"});
    REQUIRE_EMPTY(resolver.orgIdsForIp(31));
    REQUIRE(resolver.orgIdsForIp(0xFFFFFFFFu) == std::set<std::string>{"b"});
}

TEST_CASE_SUITE(DuplicateOrgAndBadRangeThrow, InsideResolver) {
    REQUIRE_THROWS_CODE(InsideCriteriaResolver({criteria("a"), criteria("a")}), ErrorCode::INVALID_ARGUMENT);

    InsideCriteria inverted = criteria("x");
    inverted.ip_min_max_seq = {{5, 4}};
    REQUIRE_THROWS_CODE(InsideCriteriaResolver({inverted}), ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE_SUITE(EmptyCriteriaListWarns, InsideResolver) {
    InsideCriteriaResolver resolver(std::vector<InsideCriteria>{});
    REQUIRE_LOGGED("the inside criteria list is empty");
    REQUIRE_EMPTY(resolver.match(eventAt(1)).org_ids);
}

// ============================================================================
// Matching
// ============================================================================

TEST_CASE_SUITE(FqdnSuffixMatch, InsideResolver) {
    InsideCriteriaResolver resolver(insideCriteriaFromDirectory(fixtures::sampleGraph()));
    InsideMatchInput event;
    event.category = "phish";
    event.fqdn = "www.example.org";
    REQUIRE(resolver.match(event).org_ids == std::set<std::string>{"oA"});
    event.fqdn = "example.org";
    REQUIRE(resolver.match(event).org_ids == std::set<std::string>{"oA"});
    event.fqdn = "badexample.org";
    REQUIRE_EMPTY(resolver.match(event).org_ids);
    event.fqdn = "example.org.pl";
    REQUIRE_EMPTY(resolver.match(event).org_ids);
}

TEST_CASE_SUITE(AsnAndCcMatch, InsideResolver) {
    InsideCriteria a = criteria("a");
    a.asn_seq = {64512};
    InsideCriteria b = criteria("b");
    b.cc_seq = {"PL"};
    InsideCriteriaResolver resolver({a, b});

    InsideMatchInput event;
    event.category = "bots";
    event.address.push_back({7, int64_t{64512}, std::string("DE")});
    event.address.push_back({8, std::nullopt, std::string("PL")});
    REQUIRE(resolver.match(event).org_ids == (std::set<std::string>{"a", "b"}));
}

TEST_CASE_SUITE(FqdnOnlyCategorySkipsAddresses, InsideResolver) {
    InsideCriteriaResolver resolver(insideCriteriaFromDirectory(fixtures::sampleGraph()));
    InsideMatchInput event = eventAt(2, "leak");
    REQUIRE_EMPTY(resolver.match(event, {"leak"}).org_ids);
    event.fqdn = "mail.example.org";
    REQUIRE(resolver.match(event, {"leak"}).org_ids == std::set<std::string>{"oA"});
}

TEST_CASE_SUITE(UrlPatternAsRegexOrGlob, InsideResolver) {
    InsideCriteria a = criteria("a");
    a.url_seq = {"http://a.example/login", "http://a.example/admin"};
    InsideCriteria b = criteria("b");
    b.url_seq = {"ftp://b.example/file1.txt"};
    InsideCriteriaResolver resolver({a, b});

    InsideMatchInput event;
    event.category = "phish";
    event.url_pattern = "a\\.example/(login|admin)";
    InsideMatchResult byRegex = resolver.match(event);
    REQUIRE(byRegex.org_ids == std::set<std::string>{"a"});
    REQUIRE(byRegex.urls_matched.at("a") ==
            (std::vector<std::string>{"http://a.example/admin", "http://a.example/login"}));

    // not a valid regex, still a valid glob
    event.url_pattern = "*.example/file?.txt";
    InsideMatchResult byGlob = resolver.match(event);
    REQUIRE(byGlob.org_ids == std::set<std::string>{"b"});
    REQUIRE_SIZE(byGlob.urls_matched.at("b"), 1u);

    event.url_pattern = "nothing-like-this";
    REQUIRE_EMPTY(resolver.match(event).urls_matched);
}

TEST_CASE_SUITE(GlobTranslation, InsideResolver) {
    REQUIRE(globMatches("*.example/*", "www.example/path\nmore"));
    REQUIRE(globMatches("file?.txt", "file1.txt"));
    REQUIRE_FALSE(globMatches("file?.txt", "file12.txt"));
    REQUIRE(globMatches("[!a]bc", "xbc"));
    REQUIRE_FALSE(globMatches("[!a]bc", "abc"));
    REQUIRE(globMatches("a[b", "a[b"));
    REQUIRE(globMatches("a+b(c)", "a+b(c)"));
}
