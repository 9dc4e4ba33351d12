/**
 * @file test_graph_resolver.cpp
 * @brief Tests for access fact resolution, flags and resource limits
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "test_fixtures.hpp"
#include "graph_resolver.hpp"

using namespace authcore;
using namespace authcore::testing;

// ============================================================================
// Flags
// ============================================================================

TEST_CASE_SUITE(FlagValues, Flags) {
    AttributeMap attrs{{"a", {"TRUE"}}, {"b", {"false"}}, {"c", {" True "}}};
    REQUIRE(isFlagEnabled(attrs, "test", "a"));
    REQUIRE_FALSE(isFlagEnabled(attrs, "test", "b"));
    REQUIRE(isFlagEnabled(attrs, "test", "c"));
}

TEST_CASE_SUITE(MissingFlagUsesOnMissing, Flags) {
    AttributeMap attrs;
    REQUIRE_FALSE(isFlagEnabled(attrs, "test", "a"));
    REQUIRE(isFlagEnabled(attrs, "test", "a", true));
}

TEST_CASE_SUITE(IllegalFlagIsLoggedAndUsesOnIllegal, Flags) {
    AttributeMap attrs{{"odd", {"maybe"}}, {"multi", {"TRUE", "FALSE"}}};
    REQUIRE_FALSE(isFlagEnabled(attrs, "the organization 'x'", "odd"));
    REQUIRE_LOGGED("Problem with directory data for the organization 'x'");
    REQUIRE(isFlagEnabled(attrs, "test", "multi", false, true));
}

// ============================================================================
// Resource limits
// ============================================================================

TEST_CASE_SUITE(DefaultLimits, ResourceLimits) {
    auto limits = makeResourceLimits({});
    REQUIRE_OK(limits);
    REQUIRE_EQ(limits.value().window, int64_t{DEFAULT_RESOURCE_LIMIT_WINDOW});
    REQUIRE_EQ(limits.value().max_days_old, int64_t{DEFAULT_MAX_DAYS_OLD});
    REQUIRE_FALSE(limits.value().queries_limit.has_value());
    REQUIRE_FALSE(limits.value().results_limit.has_value());
    REQUIRE_FALSE(limits.value().request_parameters.has_value());
}

TEST_CASE_SUITE(ExplicitLimits, ResourceLimits) {
    auto limits = makeResourceLimits({
        {"n6time-window", {"60"}},
        {"n6queries-limit", {"10"}},
        {"n6results-limit", {"500"}},
        {"n6max-days-old", {"7"}},
        {"n6request-parameters", {"category", "asn", "time.min"}},
        {"n6request-required-parameters", {"time.min"}},
    });
    REQUIRE_OK(limits);
    const ResourceLimits& l = limits.value();
    REQUIRE_EQ(l.window, int64_t{60});
    REQUIRE(l.queries_limit == std::optional<int64_t>(10));
    REQUIRE(l.results_limit == std::optional<int64_t>(500));
    REQUIRE_EQ(l.max_days_old, int64_t{7});
    REQUIRE(l.request_parameters.has_value());
    REQUIRE_SIZE(*l.request_parameters, 3u);
    REQUIRE(l.request_parameters->at("time.min"));
    REQUIRE_FALSE(l.request_parameters->at("asn"));
}

TEST_CASE_SUITE(MalformedLimits, ResourceLimits) {
    REQUIRE_ERR_CODE(makeResourceLimits({{"n6time-window", {"soon"}}}), ErrorCode::DIRECTORY_DATA_INVALID);
    REQUIRE_ERR_CODE(makeResourceLimits({{"n6queries-limit", {"1", "2"}}}), ErrorCode::DIRECTORY_DATA_INVALID);
    REQUIRE_ERR_CODE(makeResourceLimits({{"n6request-required-parameters", {"asn"}}}),
                     ErrorCode::DIRECTORY_DATA_INVALID);
    REQUIRE_ERR_CODE(makeResourceLimits({{"n6request-parameters", {"cc"}},
                                         {"n6request-required-parameters", {"asn"}}}),
                     ErrorCode::DIRECTORY_DATA_INVALID);
}

TEST_CASE_SUITE(MalformedLimitsSkipTheResource, ResourceLimits) {
    DirectoryGraph graph = fixtures::sampleGraph();
    GraphResolver resolver(graph);
    Organization org = *graph.findOrganization("o5");
    org.resources[AccessZone::SEARCH] = {{"n6max-days-old", {"many"}}};

    REQUIRE_FALSE(resolver.resourceLimits(org, AccessZone::SEARCH).has_value());
    REQUIRE_LOGGED("resource /search/events");
    REQUIRE(resolver.resourceLimits(org, AccessZone::THREATS).has_value());
    REQUIRE_FALSE(resolver.resourceLimits(org, AccessZone::INSIDE).has_value());
}

// ============================================================================
// Access facts
// ============================================================================

TEST_CASE_SUITE(SampleFacts, GraphResolver) {
    DirectoryGraph graph = fixtures::sampleGraph();
    AccessFactSet facts = GraphResolver(graph).resolveAccessFacts();
    AccessFactSet expected{
        {"o1", "p1", AccessZone::THREATS},
        {"o5", "p5", AccessZone::THREATS},
        {"oA", "p1", AccessZone::INSIDE},
    };
    REQUIRE(facts == expected);
}

TEST_CASE_SUITE(ResolutionIsIdempotent, GraphResolver) {
    DirectoryGraph graph = fixtures::sampleGraph();
    GraphResolver resolver(graph);
    REQUIRE(resolver.resolveAccessFacts() == resolver.resolveAccessFacts());
}

TEST_CASE_SUITE(ExclusionDominatesAnyInclusionPath, GraphResolver) {
    DirectoryGraph graph = fixtures::sampleGraph();
    graph.addSubsourceGroup({"group-all", {"p1", "p5"}});

    OrganizationGroup og;
    og.id = "og";
    Channel viaGroup;
    viaGroup.subsource_group_refs = {"group-all"};
    og.channels[AccessZone::SEARCH] = viaGroup;
    graph.addOrganizationGroup(og);

    Organization org = fixtures::makeOrg("o-mixed");
    org.channels[AccessZone::SEARCH] = fixtures::subsourceChannel({"p5"});
    org.org_group_refs = {"og"};
    Channel excluded;
    excluded.subsource_group_refs = {"group-all"};
    org.excluding_channels[AccessZone::SEARCH] = excluded;
    org.channels[AccessZone::THREATS] = fixtures::subsourceChannel({"p5"});
    graph.addOrganization(org);
    graph.validate();

    AccessFactSet facts = GraphResolver(graph).resolveAccessFacts();
    REQUIRE_FALSE(facts.count({"o-mixed", "p1", AccessZone::SEARCH}));
    REQUIRE_FALSE(facts.count({"o-mixed", "p5", AccessZone::SEARCH}));
    REQUIRE(facts.count({"o-mixed", "p5", AccessZone::THREATS}));
}

TEST_CASE_SUITE(OrgGroupChannelsInclude, GraphResolver) {
    DirectoryGraph graph = fixtures::sampleGraph();
    OrganizationGroup og;
    og.id = "og";
    og.channels[AccessZone::INSIDE] = fixtures::subsourceChannel({"p5"});
    graph.addOrganizationGroup(og);
    Organization org = fixtures::makeOrg("o-member");
    org.org_group_refs = {"og"};
    graph.addOrganization(org);

    AccessFactSet facts = GraphResolver(graph).resolveAccessFacts();
    REQUIRE(facts.count({"o-member", "p5", AccessZone::INSIDE}));
}

TEST_CASE_SUITE(FullAccessFlag, GraphResolver) {
    DirectoryGraph graph = fixtures::sampleGraph();
    GraphResolver resolver(graph);
    REQUIRE(resolver.isFullAccess(*graph.findOrganization("o1")));
    REQUIRE_FALSE(resolver.isFullAccess(*graph.findOrganization("o5")));
}

TEST_CASE_SUITE(LongOrgIdIsWarned, GraphResolver) {
    DirectoryGraph graph = fixtures::sampleGraph();
    std::string longId(40, 'x');
    graph.addOrganization(fixtures::makeOrg(longId));
    GraphResolver(graph).checkOrgIdLengths();
    REQUIRE_LOGGED("The length of the organization id '" + longId + "' is 40");
}
