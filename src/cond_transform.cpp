/**
 * @file cond_transform.cpp
 * @brief Factoring, equality merging, De Morgan and null-safe rewrites
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "cond_transform.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace authcore {

namespace {

template<typename Visit>
CondPtr subvisit(const CondPtr& c, Visit&& visit) {
    if (!c->isCompound()) return c;
    std::vector<CondPtr> subs;
    subs.reserve(c->subconditions().size());
    bool changed = false;
    for (const auto& sub : c->subconditions()) {
        CondPtr n = visit(sub);
        changed = changed || n != sub;
        subs.push_back(std::move(n));
    }
    return changed ? cond::remake(*c, std::move(subs)) : c;
}

CondPtr makeMulti(CondKind kind, std::vector<CondPtr> subs) {
    return kind == CondKind::AND ? cond::andOf(std::move(subs)) : cond::orOf(std::move(subs));
}

// ============================================================================
// Factoring
// ============================================================================

struct SharedSubcond {
    CondPtr subcond;
    std::vector<CondPtr> parents;
};

/**
 * Find the second-level subconditions shared by the largest number of
 * top-level operands and rewrite cond with them factored out.
 * @return nullptr when nothing is shared
 */
CondPtr factorOutMostShared(const CondPtr& c) {
    const CondKind topKind = c->kind() == CondKind::AND ? CondKind::OR : CondKind::AND;

    std::vector<SharedSubcond> entries;
    std::unordered_map<CondPtr, size_t, CondPtrHash, CondPtrEqual> index;
    auto store = [&](const CondPtr& subc, const CondPtr& parent) {
        auto [it, inserted] = index.emplace(subc, entries.size());
        if (inserted) entries.push_back({subc, {}});
        entries[it->second].parents.push_back(parent);
    };

    for (const auto& parent : c->subconditions()) {
        if (parent->kind() == topKind) {
            for (const auto& subc : parent->subconditions()) store(subc, parent);
        } else {
            // A lone operand acts as its own one-element parent
            store(parent, parent);
        }
    }

    std::vector<const SharedSubcond*> shared;
    for (const auto& e : entries) {
        if (e.parents.size() > 1) shared.push_back(&e);
    }
    if (shared.empty()) return nullptr;
    std::stable_sort(shared.begin(), shared.end(), [](const SharedSubcond* a, const SharedSubcond* b) {
        return a->parents.size() > b->parents.size();
    });

    // Leading run of subconditions having exactly the same parents
    const std::vector<CondPtr>& parents = shared.front()->parents;
    std::vector<CondPtr> extracted;
    for (const auto* s : shared) {
        if (s->parents != parents) break;
        extracted.push_back(s->subcond);
    }

    std::unordered_set<CondPtr, CondPtrHash, CondPtrEqual> extractedSet(extracted.begin(), extracted.end());
    std::vector<CondPtr> inBracket;
    for (const auto& parent : parents) {
        std::vector<CondPtr> rest;
        if (parent->kind() == topKind) {
            for (const auto& subc : parent->subconditions()) {
                if (!extractedSet.count(subc)) rest.push_back(subc);
            }
        } else if (!extractedSet.count(parent)) {
            rest.push_back(parent);
        }
        inBracket.push_back(makeMulti(topKind, std::move(rest)));
    }

    CondPtr replacing = makeMulti(topKind, {
        makeMulti(topKind, std::move(extracted)),
        cond::remake(*c, std::move(inBracket))
    });

    std::unordered_set<const Cond*> replaced;
    for (const auto& p : parents) replaced.insert(p.get());
    std::vector<CondPtr> newSubs;
    for (const auto& sub : c->subconditions()) {
        if (!replaced.count(sub.get())) newSubs.push_back(sub);
    }
    newSubs.push_back(std::move(replacing));
    return cond::remake(*c, std::move(newSubs));
}

// ============================================================================
// Equality merging
// ============================================================================

struct KeyAndValues {
    std::string key;
    std::vector<CondValue> values;
};

std::optional<KeyAndValues> equalityOf(const Cond& c) {
    if (c.kind() == CondKind::EQUAL) return KeyAndValues{c.key(), {c.value()}};
    if (c.kind() == CondKind::IN) return KeyAndValues{c.key(), c.values()};
    return std::nullopt;
}

CondPtr mergeSiblingEqualities(const CondPtr& c) {
    const bool negated = c->kind() == CondKind::AND;
    auto mergeable = [negated](const Cond& sub) -> std::optional<KeyAndValues> {
        if (!negated) return equalityOf(sub);
        if (sub.kind() == CondKind::NOT) return equalityOf(*sub.subcond());
        return std::nullopt;
    };

    std::map<std::string, std::vector<CondValue>> collected;
    std::map<std::string, size_t> counts;
    bool anything = false;
    for (const auto& sub : c->subconditions()) {
        if (auto kv = mergeable(*sub)) {
            auto& values = collected[kv->key];
            values.insert(values.end(), kv->values.begin(), kv->values.end());
            anything = anything || ++counts[kv->key] > 1;
        }
    }
    if (!anything) return c;

    std::vector<CondPtr> out;
    for (const auto& sub : c->subconditions()) {
        auto kv = mergeable(*sub);
        if (!kv) {
            out.push_back(sub);
            continue;
        }
        auto it = collected.find(kv->key);
        if (it == collected.end()) continue;   // already emitted
        CondPtr merged = cond::in(kv->key, std::move(it->second));
        collected.erase(it);
        out.push_back(negated ? cond::notOf(std::move(merged)) : std::move(merged));
    }
    return cond::remake(*c, std::move(out));
}

} // namespace

const std::set<std::string>& neverNullRecordKeys() {
    static const std::set<std::string> keys = {
        "id", "source", "restriction", "confidence", "category",
        "time", "ip", "dip", "modified"
    };
    return keys;
}

CondPtr factorCond(const CondPtr& c) {
    if (c->isMulti()) {
        if (CondPtr factored = factorOutMostShared(c)) return factorCond(factored);
    }
    return subvisit(c, factorCond);
}

CondPtr mergeEqualities(const CondPtr& c) {
    CondPtr visited = subvisit(c, mergeEqualities);
    if (!visited->isMulti()) return visited;
    return mergeSiblingEqualities(visited);
}

CondPtr optimizeCond(const CondPtr& c) {
    return mergeEqualities(factorCond(c));
}

CondPtr applyDeMorgan(const CondPtr& c) {
    if (c->kind() == CondKind::NOT && c->subcond()->isMulti()) {
        const Cond& inner = *c->subcond();
        std::vector<CondPtr> negated;
        negated.reserve(inner.subconditions().size());
        for (const auto& sub : inner.subconditions()) negated.push_back(cond::notOf(sub));
        CondKind opposite = inner.kind() == CondKind::AND ? CondKind::OR : CondKind::AND;
        return applyDeMorgan(makeMulti(opposite, std::move(negated)));
    }
    return subvisit(c, applyDeMorgan);
}

CondPtr hardenNullSafe(const CondPtr& c, const std::set<std::string>& neverNullKeys) {
    if (c->kind() == CondKind::NOT) {
        const Cond& leaf = *c->subcond();
        if (!leaf.isRecItem()) return c;
        if (leaf.kind() == CondKind::IS_NULL || leaf.kind() == CondKind::IS_TRUE) return c;
        if (neverNullKeys.count(leaf.key())) return c;
        return cond::orOf({cond::isNull(leaf.key()), c});
    }
    return subvisit(c, [&neverNullKeys](const CondPtr& sub) { return hardenNullSafe(sub, neverNullKeys); });
}

CondPtr hardenCond(const CondPtr& c) {
    return hardenNullSafe(applyDeMorgan(c));
}

} // namespace authcore
