/**
 * @file test_cond.cpp
 * @brief Tests for condition trees, their rewrites and compilation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "cond.hpp"
#include "cond_compile.hpp"
#include "cond_transform.hpp"

using namespace authcore;
using namespace authcore::testing;

namespace {

std::vector<CondValue> ints(std::initializer_list<int64_t> values) {
    return std::vector<CondValue>(values.begin(), values.end());
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE_SUITE(InWithOneValueIsEquality, Cond) {
    CondPtr c = cond::in("asn", ints({7, 7}));
    REQUIRE(c->kind() == CondKind::EQUAL);
    REQUIRE(std::get<int64_t>(c->value()) == 7);
}

TEST_CASE_SUITE(InWithNoValuesIsFalse, Cond) {
    CondPtr c = cond::in("asn", {});
    REQUIRE(c->kind() == CondKind::FIXED);
    REQUIRE_FALSE(c->truth());
}

TEST_CASE_SUITE(InEqualityIgnoresValueOrder, Cond) {
    REQUIRE(*cond::in("asn", ints({1, 2, 3})) == *cond::in("asn", ints({3, 1, 2})));
}

TEST_CASE_SUITE(AndFlattensAndDropsNeutral, Cond) {
    CondPtr a = cond::equal("source", std::string("s"));
    CondPtr b = cond::isNull("url");
    CondPtr c = cond::andOf({a, cond::andOf({b, cond::trueCond()}), a});
    REQUIRE(c->kind() == CondKind::AND);
    REQUIRE_SIZE(c->subconditions(), 2u);
}

TEST_CASE_SUITE(OrWithTrueIsTrue, Cond) {
    CondPtr c = cond::orOf({cond::isNull("asn"), cond::trueCond()});
    REQUIRE(c->kind() == CondKind::FIXED);
    REQUIRE(c->truth());
}

TEST_CASE_SUITE(EmptyAndIsTrueEmptyOrIsFalse, Cond) {
    REQUIRE(cond::andOf({})->truth());
    REQUIRE_FALSE(cond::orOf({})->truth());
}

TEST_CASE_SUITE(ContradictionCollapses, Cond) {
    CondPtr x = cond::equal("cc", std::string("PL"));
    REQUIRE_FALSE(cond::andOf({x, cond::notOf(x)})->truth());
    REQUIRE(cond::orOf({x, cond::notOf(x)})->truth());
}

TEST_CASE_SUITE(DoubleNegationCancels, Cond) {
    CondPtr x = cond::isTrue("ignored");
    REQUIRE(*cond::notOf(cond::notOf(x)) == *x);
}

TEST_CASE_SUITE(BetweenRejectsMixedTypes, Cond) {
    REQUIRE_THROWS_CODE(cond::between("ip", int64_t{1}, std::string("x")), ErrorCode::INVALID_CONDITION);
}

TEST_CASE_SUITE(ToStringIsReadable, Cond) {
    CondPtr c = cond::andOf({cond::equal("source", std::string("a.b")), cond::in("asn", ints({1, 2}))});
    REQUIRE_EQ(c->toString(), std::string("(source == 'a.b' AND asn IN {1, 2})"));
}

// ============================================================================
// Rewrites
// ============================================================================

TEST_CASE_SUITE(FactorPullsOutSharedOperand, CondTransform) {
    CondPtr s = cond::equal("source", std::string("s"));
    CondPtr a = cond::equal("asn", int64_t{1});
    CondPtr b = cond::equal("cc", std::string("PL"));
    CondPtr c = cond::orOf({cond::andOf({s, a}), cond::andOf({s, b})});

    CondPtr expected = cond::andOf({s, cond::orOf({a, b})});
    REQUIRE(*factorCond(c) == *expected);
}

TEST_CASE_SUITE(MergeEqualitiesIntoIn, CondTransform) {
    CondPtr c = cond::orOf({cond::equal("asn", int64_t{1}), cond::in("asn", ints({2, 3})),
                            cond::isNull("cc")});
    CondPtr merged = mergeEqualities(c);
    REQUIRE(*merged == *cond::orOf({cond::in("asn", ints({1, 2, 3})), cond::isNull("cc")}));
}

TEST_CASE_SUITE(MergeNegatedEqualitiesUnderAnd, CondTransform) {
    CondPtr c = cond::andOf({cond::notOf(cond::equal("cc", std::string("PL"))),
                             cond::notOf(cond::equal("cc", std::string("DE")))});
    CondPtr merged = mergeEqualities(c);
    REQUIRE(*merged == *cond::notOf(cond::in("cc", {std::string("PL"), std::string("DE")})));
}

TEST_CASE_SUITE(DeMorganPushesNegationDown, CondTransform) {
    CondPtr a = cond::equal("asn", int64_t{1});
    CondPtr b = cond::equal("cc", std::string("PL"));
    CondPtr result = applyDeMorgan(cond::notOf(cond::andOf({a, b})));
    REQUIRE(*result == *cond::orOf({cond::notOf(a), cond::notOf(b)}));
}

TEST_CASE_SUITE(HardenAddsNullGuardForNullableKey, CondTransform) {
    CondPtr hardened = hardenCond(cond::notOf(cond::in("asn", ints({1, 2, 3}))));
    REQUIRE(*hardened == *cond::orOf({cond::isNull("asn"), cond::notOf(cond::in("asn", ints({1, 2, 3})))}));
}

TEST_CASE_SUITE(HardenLeavesNeverNullKeys, CondTransform) {
    CondPtr c = cond::notOf(cond::equal("restriction", std::string("internal")));
    REQUIRE(*hardenCond(c) == *c);
}

TEST_CASE_SUITE(HardenLeavesIsTrueNegation, CondTransform) {
    CondPtr c = cond::notOf(cond::isTrue("ignored"));
    REQUIRE(*hardenCond(c) == *c);
}

// ============================================================================
// Compilation
// ============================================================================

TEST_CASE_SUITE(SqlRendering, CondCompile) {
    CondPtr c = cond::andOf({
        cond::equal("source", std::string("o'neil")),
        cond::orOf({cond::isNull("asn"), cond::notOf(cond::in("asn", ints({1, 2})))}),
        cond::between("ip", int64_t{10}, int64_t{20}),
    });
    REQUIRE_EQ(condToSql(c), std::string(
        "event.source = 'o''neil' AND (event.asn IS NULL OR event.asn NOT IN (1, 2)) "
        "AND event.ip BETWEEN 10 AND 20"));
    REQUIRE_EQ(condToSql(cond::isTrue("ignored"), ""), std::string("ignored IS TRUE"));
}

TEST_CASE_SUITE(PredicateMissingKeySemantics, CondCompile) {
    EventRecord empty;
    REQUIRE_FALSE(compilePredicate(cond::equal("asn", int64_t{1}))(empty));
    REQUIRE(compilePredicate(cond::isNull("asn"))(empty));
    REQUIRE(compilePredicate(cond::notOf(cond::equal("asn", int64_t{1})))(empty));

    EventRecord rec{{"asn", {int64_t{1}}}};
    REQUIRE_FALSE(compilePredicate(cond::isNull("asn"))(rec));
}

TEST_CASE_SUITE(PredicateMultiValuedKeys, CondCompile) {
    EventRecord rec{{"asn", {int64_t{9}, int64_t{2}}}, {"cc", {std::string("PL")}}};
    REQUIRE(compilePredicate(cond::in("asn", ints({1, 2})))(rec));
    REQUIRE(compilePredicate(cond::between("asn", int64_t{5}, int64_t{10}))(rec));
    REQUIRE_FALSE(compilePredicate(cond::equal("asn", int64_t{3}))(rec));
    REQUIRE_FALSE(compilePredicate(cond::equal("cc", int64_t{1}))(rec));
}

TEST_CASE_SUITE(PredicateIsTrue, CondCompile) {
    CondPredicate p = compilePredicate(cond::isTrue("ignored"));
    REQUIRE(p(EventRecord{{"ignored", {int64_t{1}}}}));
    REQUIRE_FALSE(p(EventRecord{{"ignored", {int64_t{0}}}}));
    REQUIRE_FALSE(p(EventRecord{}));
}

TEST_CASE_SUITE(JsonRoundTripKeepsTree, CondCompile) {
    CondPtr c = cond::orOf({
        cond::andOf({cond::equal("source", std::string("s")), cond::greater("confidence", int64_t{2})}),
        cond::notOf(cond::between("ip", int64_t{1}, int64_t{3})),
        cond::isNull("url"),
    });
    CondPtr back = condFromJson(json::parse(condToJson(c).dump()));
    REQUIRE(*back == *c);
}

TEST_CASE_SUITE(JsonRejectsUnknownOperator, CondCompile) {
    REQUIRE_THROWS(condFromJson(json::parse(R"({"op":"xor","key":"asn"})")));
}

TEST_CASE_SUITE(PipelineModes, CondCompile) {
    CondPtr c = cond::orOf({
        cond::andOf({cond::equal("source", std::string("s")), cond::notOf(cond::equal("cc", std::string("PL")))}),
        cond::andOf({cond::equal("source", std::string("s")), cond::equal("asn", int64_t{5})}),
    });

    CompiledCondition def = ConditionPipeline(CompilerMode::DEFAULT).compile(c);
    REQUIRE_CONTAINS(def.sql, "event.cc IS NULL OR event.cc != 'PL'");
    REQUIRE(def.sql.find("event.source = 's'") == def.sql.rfind("event.source = 's'"));

    CompiledCondition legacy = ConditionPipeline(CompilerMode::LEGACY_UNSAFE_NEGATION).compile(c);
    REQUIRE(legacy.sql.find("IS NULL") == std::string::npos);

    CompiledCondition skip = ConditionPipeline(CompilerMode::SKIP_OPTIMIZATION).compile(c);
    REQUIRE(skip.sql.find("event.source = 's'") != skip.sql.rfind("event.source = 's'"));

    // In-process evaluation of a missing key is the same in every mode
    EventRecord rec{{"source", {std::string("s")}}};
    REQUIRE(def.matches(rec));
    REQUIRE(skip.matches(rec));
    REQUIRE(legacy.matches(rec));
    REQUIRE_FALSE(def.matches(EventRecord{{"source", {std::string("s")}}, {"cc", {std::string("PL")}}}));
}
