/**
 * @file cond_compile.hpp
 * @brief Condition pipeline and its output forms: SQL text, in-process
 *        predicate and JSON
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_COND_COMPILE_HPP
#define AUTHCORE_COND_COMPILE_HPP

#include "auth_json.hpp"
#include "auth_types.hpp"
#include "cond.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace authcore {

/**
 * @brief Event record as seen by predicates
 *
 * Address-derived keys (ip, asn, cc) may carry several values; a key
 * with no values is treated as absent.
 */
using EventRecord = std::map<std::string, std::vector<CondValue>>;

using CondPredicate = std::function<bool(const EventRecord&)>;

/**
 * @brief Render a condition as an SQL boolean expression
 * @param table column qualifier; empty for bare column names
 */
std::string condToSql(const CondPtr& c, const std::string& table = "event");

/**
 * @brief Build a predicate closure equivalent to the condition
 *
 * A record item test on an absent key is false, except IS NULL which is
 * true. A test on a multi-valued key holds if any value satisfies it.
 * Values of different types never compare equal or ordered.
 */
CondPredicate compilePredicate(const CondPtr& c);

json::JsonValue condToJson(const CondPtr& c);

/** @throws AuthCoreError (INVALID_CONDITION) on a malformed document */
CondPtr condFromJson(const json::JsonValue& doc);

//=============================================================================
// Pipeline
//=============================================================================

/**
 * @struct CompiledCondition
 * @brief A processed condition with both executable forms
 */
struct CompiledCondition {
    CondPtr cond;
    std::string sql;
    CondPredicate predicate;

    bool matches(const EventRecord& record) const { return predicate(record); }

    bool operator==(const CompiledCondition& other) const {
        return *cond == *other.cond && sql == other.sql;
    }
    bool operator!=(const CompiledCondition& other) const { return !(*this == other); }
};

/** @brief Compile an already processed tree into both forms */
CompiledCondition compileCondition(CondPtr c);

/**
 * @class ConditionPipeline
 * @brief Optimize, harden and compile, as selected by the compiler mode
 *
 * | Mode                   | Optimize | Harden |
 * |------------------------|----------|--------|
 * | DEFAULT                | yes      | yes    |
 * | SKIP_OPTIMIZATION      | no       | yes    |
 * | LEGACY_UNSAFE_NEGATION | yes      | no     |
 */
class ConditionPipeline {
public:
    explicit ConditionPipeline(CompilerMode mode = CompilerMode::DEFAULT) : mode_(mode) {}

    CompilerMode mode() const { return mode_; }

    CondPtr process(const CondPtr& c) const;
    CompiledCondition compile(const CondPtr& c) const { return compileCondition(process(c)); }

private:
    CompilerMode mode_;
};

} // namespace authcore

#endif // AUTHCORE_COND_COMPILE_HPP
