/**
 * @file cond_transform.hpp
 * @brief Logic-preserving rewrites of condition trees
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Every transformation returns a new tree logically equivalent to its
 * input (null-safe hardening excepted, which is equivalent under two-valued
 * logic and fixes the three-valued SQL case). Input trees are never
 * modified.
 */
#ifndef AUTHCORE_COND_TRANSFORM_HPP
#define AUTHCORE_COND_TRANSFORM_HPP

#include "cond.hpp"
#include <set>
#include <string>

namespace authcore {

/**
 * @brief Record keys that are never NULL in stored events
 *
 * Negations over these keys need no IS NULL guard.
 */
const std::set<std::string>& neverNullRecordKeys();

/**
 * @brief Factor out subconditions shared by several operands
 *
 * (x AND a) OR (x AND b) OR e becomes (x AND (a OR b)) OR e, and dually
 * for AND over OR. Operands implied by other operands disappear, e.g.
 * (x AND a) OR x becomes x. The most widely shared subconditions are
 * factored first.
 */
CondPtr factorCond(const CondPtr& c);

/**
 * @brief Merge equality tests on the same record key
 *
 * Within OR: (k == a) OR (k IN (b, c)) becomes k IN (a, b, c).
 * Within AND: NOT (k == a) AND NOT (k IN (b, c)) becomes NOT (k IN (a, b, c)).
 */
CondPtr mergeEqualities(const CondPtr& c);

/** @brief factorCond() followed by mergeEqualities() */
CondPtr optimizeCond(const CondPtr& c);

/**
 * @brief Push every NOT down until it wraps a record item condition
 */
CondPtr applyDeMorgan(const CondPtr& c);

/**
 * @brief Guard negated leaves against NULL record items
 *
 * NOT leaf over a key outside @p neverNullKeys becomes
 * (key IS NULL OR NOT leaf). Negated IS NULL and IS TRUE tests are
 * already two-valued and stay as they are. Expects De Morgan-normalized
 * input; NOT over a compound subtree is left untouched.
 */
CondPtr hardenNullSafe(const CondPtr& c,
                       const std::set<std::string>& neverNullKeys = neverNullRecordKeys());

/** @brief applyDeMorgan() followed by hardenNullSafe() */
CondPtr hardenCond(const CondPtr& c);

} // namespace authcore

#endif // AUTHCORE_COND_TRANSFORM_HPP
