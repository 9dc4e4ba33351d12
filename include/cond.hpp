/**
 * @file cond.hpp
 * @brief Immutable boolean filter condition trees over event record keys
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Conditions are built only through the factory functions in namespace
 * cond, which apply the logic reductions below so that equal conditions
 * always have the same shape:
 * - AND/OR flatten nested nodes of the same kind, drop neutral FIXED
 *   operands and duplicates, collapse to FIXED on an absorbing operand or
 *   on a pair (x, NOT x), and reduce to the sole operand or the neutral
 *   element when one or zero operands remain.
 * - NOT of FIXED is FIXED; NOT of NOT x is x.
 * - IN with no values is FIXED false; IN with one value is EQUAL.
 *
 * Operand order of AND/OR and value order of IN are kept for rendering but
 * are irrelevant to equality.
 */
#ifndef AUTHCORE_COND_HPP
#define AUTHCORE_COND_HPP

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace authcore {

/** @brief Operand of a record item comparison */
using CondValue = std::variant<int64_t, std::string>;

std::string condValueToString(const CondValue& value);

enum class CondKind {
    EQUAL,
    GREATER,
    GREATER_OR_EQUAL,
    LESS,
    LESS_OR_EQUAL,
    IN,
    BETWEEN,
    IS_TRUE,
    IS_NULL,
    NOT,
    AND,
    OR,
    FIXED
};

std::string condKindToString(CondKind kind);

class Cond;
using CondPtr = std::shared_ptr<const Cond>;

/**
 * @class Cond
 * @brief One node of a condition tree
 *
 * Record item nodes (EQUAL .. IS_NULL) carry a record key and their
 * operation parameter; NOT/AND/OR carry subconditions; FIXED carries a
 * truth value.
 */
class Cond {
public:
    CondKind kind() const { return kind_; }

    bool isRecItem() const { return kind_ <= CondKind::IS_NULL; }
    bool isCompound() const { return kind_ == CondKind::NOT || isMulti(); }
    bool isMulti() const { return kind_ == CondKind::AND || kind_ == CondKind::OR; }

    const std::string& key() const { return key_; }

    /** @brief Operand of EQUAL/GREATER/../LESS_OR_EQUAL; BETWEEN minimum */
    const CondValue& value() const { return values_.front(); }
    /** @brief BETWEEN maximum */
    const CondValue& maxValue() const { return values_.back(); }
    /** @brief IN values, in first-given order */
    const std::vector<CondValue>& values() const { return values_; }

    const std::vector<CondPtr>& subconditions() const { return subconds_; }
    const CondPtr& subcond() const { return subconds_.front(); }

    bool truth() const { return truth_; }

    size_t hash() const { return hash_; }
    bool operator==(const Cond& other) const;
    bool operator!=(const Cond& other) const { return !(*this == other); }

    /** @brief Compact human readable form, e.g. "(asn IN {1, 2} OR cc == 'PL')" */
    std::string toString() const;

private:
    friend struct CondFactory;

    Cond() = default;

    CondKind kind_ = CondKind::FIXED;
    std::string key_;
    std::vector<CondValue> values_;
    std::set<CondValue> value_set_;
    std::vector<CondPtr> subconds_;
    bool truth_ = false;
    size_t hash_ = 0;
};

/** @brief Hash/equality functors comparing conditions structurally */
struct CondPtrHash {
    size_t operator()(const CondPtr& c) const { return c->hash(); }
};
struct CondPtrEqual {
    bool operator()(const CondPtr& a, const CondPtr& b) const { return *a == *b; }
};

bool condListsEqual(const std::vector<CondPtr>& a, const std::vector<CondPtr>& b);

//=============================================================================
// Factories
//=============================================================================

namespace cond {

CondPtr equal(const std::string& key, CondValue value);
CondPtr greater(const std::string& key, CondValue value);
CondPtr greaterOrEqual(const std::string& key, CondValue value);
CondPtr less(const std::string& key, CondValue value);
CondPtr lessOrEqual(const std::string& key, CondValue value);
CondPtr in(const std::string& key, std::vector<CondValue> values);
CondPtr between(const std::string& key, CondValue minValue, CondValue maxValue);
CondPtr isTrue(const std::string& key);
CondPtr isNull(const std::string& key);

CondPtr notOf(CondPtr subcond);
CondPtr andOf(std::vector<CondPtr> subconds);
CondPtr orOf(std::vector<CondPtr> subconds);
CondPtr fixed(bool truth);

inline CondPtr trueCond() { return fixed(true); }
inline CondPtr falseCond() { return fixed(false); }

/** @brief Build a node of the same kind as @p like from new subconditions */
CondPtr remake(const Cond& like, std::vector<CondPtr> subconds);

} // namespace cond

} // namespace authcore

#endif // AUTHCORE_COND_HPP
