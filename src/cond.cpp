/**
 * @file cond.cpp
 * @brief Condition node construction, equality and logic reductions
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "cond.hpp"
#include "auth_error.hpp"
#include <functional>
#include <sstream>
#include <unordered_set>

namespace authcore {

namespace {

void hashCombine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

size_t hashValue(const CondValue& value) {
    size_t h = value.index();
    hashCombine(h, std::visit([](const auto& v) {
        return std::hash<std::decay_t<decltype(v)>>{}(v);
    }, value));
    return h;
}

const char* comparisonOperator(CondKind kind) {
    switch (kind) {
        case CondKind::EQUAL: return "==";
        case CondKind::GREATER: return ">";
        case CondKind::GREATER_OR_EQUAL: return ">=";
        case CondKind::LESS: return "<";
        case CondKind::LESS_OR_EQUAL: return "<=";
        default: return "?";
    }
}

using CondSet = std::unordered_set<CondPtr, CondPtrHash, CondPtrEqual>;

} // namespace

std::string condValueToString(const CondValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    return "'" + std::get<std::string>(value) + "'";
}

std::string condKindToString(CondKind kind) {
    switch (kind) {
        case CondKind::EQUAL: return "EQUAL";
        case CondKind::GREATER: return "GREATER";
        case CondKind::GREATER_OR_EQUAL: return "GREATER_OR_EQUAL";
        case CondKind::LESS: return "LESS";
        case CondKind::LESS_OR_EQUAL: return "LESS_OR_EQUAL";
        case CondKind::IN: return "IN";
        case CondKind::BETWEEN: return "BETWEEN";
        case CondKind::IS_TRUE: return "IS_TRUE";
        case CondKind::IS_NULL: return "IS_NULL";
        case CondKind::NOT: return "NOT";
        case CondKind::AND: return "AND";
        case CondKind::OR: return "OR";
        case CondKind::FIXED: return "FIXED";
    }
    return "UNKNOWN";
}

//=============================================================================
// Cond
//=============================================================================

bool Cond::operator==(const Cond& other) const {
    if (this == &other) return true;
    if (kind_ != other.kind_ || hash_ != other.hash_) return false;
    switch (kind_) {
        case CondKind::FIXED:
            return truth_ == other.truth_;
        case CondKind::IN:
            return key_ == other.key_ && value_set_ == other.value_set_;
        case CondKind::NOT:
            return *subcond() == *other.subcond();
        case CondKind::AND:
        case CondKind::OR:
            return condListsEqual(subconds_, other.subconds_);
        default:
            return key_ == other.key_ && values_ == other.values_;
    }
}

std::string Cond::toString() const {
    std::ostringstream oss;
    switch (kind_) {
        case CondKind::EQUAL:
        case CondKind::GREATER:
        case CondKind::GREATER_OR_EQUAL:
        case CondKind::LESS:
        case CondKind::LESS_OR_EQUAL:
            oss << key_ << " " << comparisonOperator(kind_) << " " << condValueToString(value());
            break;
        case CondKind::IN: {
            oss << key_ << " IN {";
            for (size_t i = 0; i < values_.size(); ++i) {
                if (i) oss << ", ";
                oss << condValueToString(values_[i]);
            }
            oss << "}";
            break;
        }
        case CondKind::BETWEEN:
            oss << key_ << " BETWEEN " << condValueToString(value())
                << " AND " << condValueToString(maxValue());
            break;
        case CondKind::IS_TRUE:
            oss << key_ << " IS TRUE";
            break;
        case CondKind::IS_NULL:
            oss << key_ << " IS NULL";
            break;
        case CondKind::NOT:
            oss << "NOT (" << subcond()->toString() << ")";
            break;
        case CondKind::AND:
        case CondKind::OR: {
            const char* op = kind_ == CondKind::AND ? " AND " : " OR ";
            oss << "(";
            for (size_t i = 0; i < subconds_.size(); ++i) {
                if (i) oss << op;
                oss << subconds_[i]->toString();
            }
            oss << ")";
            break;
        }
        case CondKind::FIXED:
            oss << (truth_ ? "TRUE" : "FALSE");
            break;
    }
    return oss.str();
}

bool condListsEqual(const std::vector<CondPtr>& a, const std::vector<CondPtr>& b) {
    if (a.size() != b.size()) return false;
    CondSet other(b.begin(), b.end());
    for (const auto& c : a) {
        if (!other.count(c)) return false;
    }
    return true;
}

//=============================================================================
// Node factory
//=============================================================================

struct CondFactory {
    static CondPtr recItem(CondKind kind, const std::string& key, std::vector<CondValue> values) {
        if (key.empty()) {
            throw AuthCoreError(ErrorCode::INVALID_CONDITION, "record key must not be empty");
        }
        std::shared_ptr<Cond> c(new Cond());
        c->kind_ = kind;
        c->key_ = key;
        c->values_ = std::move(values);
        size_t h = static_cast<size_t>(kind);
        hashCombine(h, std::hash<std::string>{}(key));
        if (kind == CondKind::IN) {
            c->value_set_.insert(c->values_.begin(), c->values_.end());
            size_t sum = 0;
            for (const auto& v : c->value_set_) sum += hashValue(v);
            hashCombine(h, sum);
        } else {
            for (const auto& v : c->values_) hashCombine(h, hashValue(v));
        }
        c->hash_ = h;
        return c;
    }

    static CondPtr compound(CondKind kind, std::vector<CondPtr> subconds) {
        std::shared_ptr<Cond> c(new Cond());
        c->kind_ = kind;
        size_t h = static_cast<size_t>(kind);
        if (kind == CondKind::NOT) {
            hashCombine(h, subconds.front()->hash());
        } else {
            size_t sum = 0;
            for (const auto& s : subconds) sum += s->hash();
            hashCombine(h, sum);
        }
        c->subconds_ = std::move(subconds);
        c->hash_ = h;
        return c;
    }

    static CondPtr fixed(bool truth) {
        std::shared_ptr<Cond> c(new Cond());
        c->kind_ = CondKind::FIXED;
        c->truth_ = truth;
        c->hash_ = truth ? 0x5f3759dfULL : 0x2545f491ULL;
        return c;
    }
};

namespace {

CondPtr makeMulti(CondKind kind, std::vector<CondPtr> given) {
    const bool neutral = (kind == CondKind::AND);
    const bool absorbing = !neutral;

    std::vector<CondPtr> flat;
    CondSet seen;
    bool absorbed = false;

    std::function<void(const CondPtr&)> add = [&](const CondPtr& c) {
        if (!c) {
            throw AuthCoreError(ErrorCode::INVALID_CONDITION, "null subcondition");
        }
        if (c->kind() == kind) {
            for (const auto& sub : c->subconditions()) add(sub);
            return;
        }
        if (c->kind() == CondKind::FIXED) {
            if (c->truth() != neutral) absorbed = true;
            return;
        }
        if (seen.insert(c).second) flat.push_back(c);
    };
    for (const auto& c : given) add(c);

    if (absorbed) return CondFactory::fixed(absorbing);

    // x together with NOT x
    for (const auto& c : flat) {
        if (c->kind() == CondKind::NOT && seen.count(c->subcond())) {
            return CondFactory::fixed(absorbing);
        }
    }

    if (flat.empty()) return CondFactory::fixed(neutral);
    if (flat.size() == 1) return flat.front();
    return CondFactory::compound(kind, std::move(flat));
}

} // namespace

namespace cond {

CondPtr equal(const std::string& key, CondValue value) {
    return CondFactory::recItem(CondKind::EQUAL, key, {std::move(value)});
}

CondPtr greater(const std::string& key, CondValue value) {
    return CondFactory::recItem(CondKind::GREATER, key, {std::move(value)});
}

CondPtr greaterOrEqual(const std::string& key, CondValue value) {
    return CondFactory::recItem(CondKind::GREATER_OR_EQUAL, key, {std::move(value)});
}

CondPtr less(const std::string& key, CondValue value) {
    return CondFactory::recItem(CondKind::LESS, key, {std::move(value)});
}

CondPtr lessOrEqual(const std::string& key, CondValue value) {
    return CondFactory::recItem(CondKind::LESS_OR_EQUAL, key, {std::move(value)});
}

CondPtr in(const std::string& key, std::vector<CondValue> values) {
    std::vector<CondValue> unique;
    std::set<CondValue> seen;
    for (auto& v : values) {
        if (seen.insert(v).second) unique.push_back(std::move(v));
    }
    if (unique.empty()) return fixed(false);
    if (unique.size() == 1) return equal(key, std::move(unique.front()));
    return CondFactory::recItem(CondKind::IN, key, std::move(unique));
}

CondPtr between(const std::string& key, CondValue minValue, CondValue maxValue) {
    if (minValue.index() != maxValue.index()) {
        throw AuthCoreError(ErrorCode::INVALID_CONDITION,
                            "BETWEEN endpoints of '" + key + "' differ in type");
    }
    return CondFactory::recItem(CondKind::BETWEEN, key, {std::move(minValue), std::move(maxValue)});
}

CondPtr isTrue(const std::string& key) {
    return CondFactory::recItem(CondKind::IS_TRUE, key, {});
}

CondPtr isNull(const std::string& key) {
    return CondFactory::recItem(CondKind::IS_NULL, key, {});
}

CondPtr notOf(CondPtr subcond) {
    if (!subcond) {
        throw AuthCoreError(ErrorCode::INVALID_CONDITION, "null subcondition");
    }
    if (subcond->kind() == CondKind::FIXED) return fixed(!subcond->truth());
    if (subcond->kind() == CondKind::NOT) return subcond->subcond();
    return CondFactory::compound(CondKind::NOT, {std::move(subcond)});
}

CondPtr andOf(std::vector<CondPtr> subconds) {
    return makeMulti(CondKind::AND, std::move(subconds));
}

CondPtr orOf(std::vector<CondPtr> subconds) {
    return makeMulti(CondKind::OR, std::move(subconds));
}

CondPtr fixed(bool truth) {
    return CondFactory::fixed(truth);
}

CondPtr remake(const Cond& like, std::vector<CondPtr> subconds) {
    switch (like.kind()) {
        case CondKind::NOT:
            if (subconds.size() != 1) {
                throw AuthCoreError(ErrorCode::INVALID_CONDITION,
                                    "NOT takes exactly one subcondition (" +
                                    std::to_string(subconds.size()) + " given)");
            }
            return notOf(std::move(subconds.front()));
        case CondKind::AND:
            return andOf(std::move(subconds));
        case CondKind::OR:
            return orOf(std::move(subconds));
        default:
            throw AuthCoreError(ErrorCode::INVALID_CONDITION,
                                condKindToString(like.kind()) + " has no subconditions");
    }
}

} // namespace cond

} // namespace authcore
