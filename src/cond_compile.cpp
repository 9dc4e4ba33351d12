/**
 * @file cond_compile.cpp
 * @brief SQL rendering, predicate building and JSON codec for conditions
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "cond_compile.hpp"
#include "auth_error.hpp"
#include "cond_transform.hpp"
#include <cmath>
#include <sstream>

namespace authcore {

using json::JsonArray;
using json::JsonObject;
using json::JsonValue;

// ============================================================================
// SQL
// ============================================================================

namespace {

std::string sqlLiteral(const CondValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    std::string out = "'";
    for (char ch : std::get<std::string>(value)) {
        if (ch == '\'') out += '\'';
        out += ch;
    }
    return out + "'";
}

std::string sqlList(const std::vector<CondValue>& values) {
    std::string out = "(";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ", ";
        out += sqlLiteral(values[i]);
    }
    return out + ")";
}

const char* sqlOperator(CondKind kind) {
    switch (kind) {
        case CondKind::EQUAL: return " = ";
        case CondKind::GREATER: return " > ";
        case CondKind::GREATER_OR_EQUAL: return " >= ";
        case CondKind::LESS: return " < ";
        case CondKind::LESS_OR_EQUAL: return " <= ";
        default: return " ? ";
    }
}

std::string renderSql(const Cond& c, const std::string& table);

std::string column(const Cond& c, const std::string& table) {
    return table.empty() ? c.key() : table + "." + c.key();
}

std::string renderLeaf(const Cond& c, const std::string& table) {
    std::string col = column(c, table);
    switch (c.kind()) {
        case CondKind::IN: return col + " IN " + sqlList(c.values());
        case CondKind::BETWEEN:
            return col + " BETWEEN " + sqlLiteral(c.value()) + " AND " + sqlLiteral(c.maxValue());
        case CondKind::IS_TRUE: return col + " IS TRUE";
        case CondKind::IS_NULL: return col + " IS NULL";
        default: return col + sqlOperator(c.kind()) + sqlLiteral(c.value());
    }
}

std::string renderNot(const Cond& c, const std::string& table) {
    const Cond& sub = *c.subcond();
    if (sub.isRecItem()) {
        std::string col = column(sub, table);
        switch (sub.kind()) {
            case CondKind::EQUAL: return col + " != " + sqlLiteral(sub.value());
            case CondKind::IN: return col + " NOT IN " + sqlList(sub.values());
            case CondKind::BETWEEN:
                return col + " NOT BETWEEN " + sqlLiteral(sub.value()) + " AND " + sqlLiteral(sub.maxValue());
            case CondKind::IS_TRUE: return col + " IS NOT TRUE";
            case CondKind::IS_NULL: return col + " IS NOT NULL";
            default: break;
        }
    }
    return "NOT (" + renderSql(sub, table) + ")";
}

std::string renderSql(const Cond& c, const std::string& table) {
    switch (c.kind()) {
        case CondKind::FIXED:
            return c.truth() ? "TRUE" : "FALSE";
        case CondKind::NOT:
            return renderNot(c, table);
        case CondKind::AND:
        case CondKind::OR: {
            const bool isAnd = c.kind() == CondKind::AND;
            std::string out;
            for (const auto& sub : c.subconditions()) {
                if (!out.empty()) out += isAnd ? " AND " : " OR ";
                std::string part = renderSql(*sub, table);
                // AND binds tighter than OR
                if (isAnd && sub->kind() == CondKind::OR) part = "(" + part + ")";
                out += part;
            }
            return out;
        }
        default:
            return renderLeaf(c, table);
    }
}

// ============================================================================
// Predicates
// ============================================================================

template<typename Test>
CondPredicate anyValue(const std::string& key, Test test) {
    return [key, test](const EventRecord& rec) {
        auto it = rec.find(key);
        if (it == rec.end()) return false;
        for (const auto& v : it->second) {
            if (test(v)) return true;
        }
        return false;
    };
}

template<typename Compare>
CondPredicate comparison(const Cond& c, Compare compare) {
    CondValue operand = c.value();
    return anyValue(c.key(), [operand, compare](const CondValue& v) {
        return v.index() == operand.index() && compare(v, operand);
    });
}

} // namespace

std::string condToSql(const CondPtr& c, const std::string& table) {
    return renderSql(*c, table);
}

CondPredicate compilePredicate(const CondPtr& c) {
    switch (c->kind()) {
        case CondKind::EQUAL:
            return comparison(*c, [](const CondValue& a, const CondValue& b) { return a == b; });
        case CondKind::GREATER:
            return comparison(*c, [](const CondValue& a, const CondValue& b) { return a > b; });
        case CondKind::GREATER_OR_EQUAL:
            return comparison(*c, [](const CondValue& a, const CondValue& b) { return a >= b; });
        case CondKind::LESS:
            return comparison(*c, [](const CondValue& a, const CondValue& b) { return a < b; });
        case CondKind::LESS_OR_EQUAL:
            return comparison(*c, [](const CondValue& a, const CondValue& b) { return a <= b; });
        case CondKind::IN: {
            std::set<CondValue> values(c->values().begin(), c->values().end());
            return anyValue(c->key(), [values](const CondValue& v) { return values.count(v) > 0; });
        }
        case CondKind::BETWEEN: {
            CondValue lo = c->value();
            CondValue hi = c->maxValue();
            return anyValue(c->key(), [lo, hi](const CondValue& v) {
                return v.index() == lo.index() && lo <= v && v <= hi;
            });
        }
        case CondKind::IS_TRUE:
            return anyValue(c->key(), [](const CondValue& v) {
                const auto* i = std::get_if<int64_t>(&v);
                return i && *i != 0;
            });
        case CondKind::IS_NULL: {
            std::string key = c->key();
            return [key](const EventRecord& rec) {
                auto it = rec.find(key);
                return it == rec.end() || it->second.empty();
            };
        }
        case CondKind::NOT: {
            CondPredicate sub = compilePredicate(c->subcond());
            return [sub](const EventRecord& rec) { return !sub(rec); };
        }
        case CondKind::AND:
        case CondKind::OR: {
            std::vector<CondPredicate> subs;
            for (const auto& s : c->subconditions()) subs.push_back(compilePredicate(s));
            if (c->kind() == CondKind::AND) {
                return [subs](const EventRecord& rec) {
                    for (const auto& p : subs) if (!p(rec)) return false;
                    return true;
                };
            }
            return [subs](const EventRecord& rec) {
                for (const auto& p : subs) if (p(rec)) return true;
                return false;
            };
        }
        case CondKind::FIXED: {
            bool truth = c->truth();
            return [truth](const EventRecord&) { return truth; };
        }
    }
    throw AuthCoreError(ErrorCode::INVALID_CONDITION, "unsupported condition kind");
}

// ============================================================================
// JSON
// ============================================================================

namespace {

const char* jsonOpName(CondKind kind) {
    switch (kind) {
        case CondKind::EQUAL: return "eq";
        case CondKind::GREATER: return "gt";
        case CondKind::GREATER_OR_EQUAL: return "ge";
        case CondKind::LESS: return "lt";
        case CondKind::LESS_OR_EQUAL: return "le";
        case CondKind::IN: return "in";
        case CondKind::BETWEEN: return "between";
        case CondKind::IS_TRUE: return "is_true";
        case CondKind::IS_NULL: return "is_null";
        case CondKind::NOT: return "not";
        case CondKind::AND: return "and";
        case CondKind::OR: return "or";
        case CondKind::FIXED: return "fixed";
    }
    return "";
}

JsonValue valueToJson(const CondValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return JsonValue(static_cast<long long>(*i));
    return JsonValue(std::get<std::string>(value));
}

[[noreturn]] void malformed(const std::string& what) {
    throw AuthCoreError(ErrorCode::INVALID_CONDITION, "malformed condition document: " + what);
}

CondValue valueFromJson(const JsonValue& v) {
    if (v.isString()) return v.asString();
    if (v.isNumber() && v.asNumber() == std::floor(v.asNumber())) return v.asInt64();
    malformed("operand must be a string or an integer");
}

const JsonValue& member(const JsonValue& doc, const std::string& name) {
    auto found = doc.get(name);
    if (!found) malformed("missing '" + name + "'");
    return found->get();
}

std::string keyOf(const JsonValue& doc) {
    const JsonValue& key = member(doc, "key");
    if (!key.isString()) malformed("'key' must be a string");
    return key.asString();
}

std::vector<CondPtr> subcondsOf(const JsonValue& doc) {
    const JsonValue& list = member(doc, "conds");
    if (!list.isArray()) malformed("'conds' must be an array");
    std::vector<CondPtr> subs;
    for (const auto& item : list.asArray()) subs.push_back(condFromJson(item));
    return subs;
}

} // namespace

JsonValue condToJson(const CondPtr& c) {
    JsonObject obj;
    obj["op"] = jsonOpName(c->kind());
    switch (c->kind()) {
        case CondKind::FIXED:
            obj["value"] = c->truth();
            break;
        case CondKind::NOT:
            obj["cond"] = condToJson(c->subcond());
            break;
        case CondKind::AND:
        case CondKind::OR: {
            JsonArray subs;
            for (const auto& s : c->subconditions()) subs.push_back(condToJson(s));
            obj["conds"] = JsonValue(std::move(subs));
            break;
        }
        case CondKind::IN: {
            obj["key"] = c->key();
            JsonArray values;
            for (const auto& v : c->values()) values.push_back(valueToJson(v));
            obj["values"] = JsonValue(std::move(values));
            break;
        }
        case CondKind::BETWEEN:
            obj["key"] = c->key();
            obj["min"] = valueToJson(c->value());
            obj["max"] = valueToJson(c->maxValue());
            break;
        case CondKind::IS_TRUE:
        case CondKind::IS_NULL:
            obj["key"] = c->key();
            break;
        default:
            obj["key"] = c->key();
            obj["value"] = valueToJson(c->value());
            break;
    }
    return JsonValue(std::move(obj));
}

CondPtr condFromJson(const JsonValue& doc) {
    if (!doc.isObject()) malformed("condition must be an object");
    const JsonValue& opValue = member(doc, "op");
    if (!opValue.isString()) malformed("'op' must be a string");
    const std::string& op = opValue.asString();

    if (op == "fixed") {
        const JsonValue& v = member(doc, "value");
        if (!v.isBool()) malformed("'value' of fixed must be a boolean");
        return cond::fixed(v.asBool());
    }
    if (op == "not") return cond::notOf(condFromJson(member(doc, "cond")));
    if (op == "and") return cond::andOf(subcondsOf(doc));
    if (op == "or") return cond::orOf(subcondsOf(doc));
    if (op == "in") {
        const JsonValue& list = member(doc, "values");
        if (!list.isArray()) malformed("'values' must be an array");
        std::vector<CondValue> values;
        for (const auto& v : list.asArray()) values.push_back(valueFromJson(v));
        return cond::in(keyOf(doc), std::move(values));
    }
    if (op == "between") {
        return cond::between(keyOf(doc), valueFromJson(member(doc, "min")),
                             valueFromJson(member(doc, "max")));
    }
    if (op == "is_true") return cond::isTrue(keyOf(doc));
    if (op == "is_null") return cond::isNull(keyOf(doc));
    if (op == "eq") return cond::equal(keyOf(doc), valueFromJson(member(doc, "value")));
    if (op == "gt") return cond::greater(keyOf(doc), valueFromJson(member(doc, "value")));
    if (op == "ge") return cond::greaterOrEqual(keyOf(doc), valueFromJson(member(doc, "value")));
    if (op == "lt") return cond::less(keyOf(doc), valueFromJson(member(doc, "value")));
    if (op == "le") return cond::lessOrEqual(keyOf(doc), valueFromJson(member(doc, "value")));
    malformed("unknown op '" + op + "'");
}

// ============================================================================
// Pipeline
// ============================================================================

CompiledCondition compileCondition(CondPtr c) {
    CompiledCondition compiled;
    compiled.sql = condToSql(c);
    compiled.predicate = compilePredicate(c);
    compiled.cond = std::move(c);
    return compiled;
}

CondPtr ConditionPipeline::process(const CondPtr& c) const {
    switch (mode_) {
        case CompilerMode::DEFAULT:
            return hardenCond(optimizeCond(c));
        case CompilerMode::SKIP_OPTIMIZATION:
            return hardenCond(c);
        case CompilerMode::LEGACY_UNSAFE_NEGATION:
            return optimizeCond(c);
    }
    return hardenCond(optimizeCond(c));
}

} // namespace authcore
