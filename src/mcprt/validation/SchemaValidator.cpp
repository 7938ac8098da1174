//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: Recursive JSON-Schema subset validator
//==========================================================================================================

#include "mcprt/validation/SchemaValidator.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include <fmt/format.h>

#include "logging/Logger.h"

namespace mcprt {
namespace validation {

namespace {
const char* typeName(const JSONValue& v) {
    switch (v.value.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        case 6: return "object";
        default: return "unknown";
    }
}

bool matchesType(const JSONValue& inst, const std::string& type) {
    if (type == "object") return inst.isObject();
    if (type == "array") return inst.isArray();
    if (type == "string") return inst.isString();
    if (type == "number") return inst.isNumber();
    if (type == "integer") {
        if (inst.isInteger()) return true;
        if (std::holds_alternative<double>(inst.value)) {
            double d = std::get<double>(inst.value);
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    if (type == "boolean") return std::holds_alternative<bool>(inst.value);
    if (type == "null") return inst.isNull();
    LOG_DEBUG("SchemaValidator: unknown type keyword '{}' accepted", type);
    return true;
}

double asDouble(const JSONValue& v) {
    return v.isInteger() ? static_cast<double>(std::get<int64_t>(v.value)) : std::get<double>(v.value);
}

std::string formatNumber(const JSONValue& v) {
    if (v.isInteger()) return std::to_string(std::get<int64_t>(v.value));
    return fmt::format("{}", std::get<double>(v.value));
}

// Length in code points, so multi-byte characters count once
std::size_t utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::optional<std::size_t> sizeKeyword(const JSONValue& schema, const char* key) {
    const JSONValue* v = schema.find(key);
    if (!v || !v->isNumber()) return std::nullopt;
    double d = asDouble(*v);
    if (d < 0) return std::size_t{0};
    return static_cast<std::size_t>(d);
}

std::string childPath(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

std::string indexPath(const std::string& parent, std::size_t i) {
    return (parent.empty() ? std::string("(root)") : parent) + "[" + std::to_string(i) + "]";
}

std::optional<ValidationError> fail(const std::string& path, std::string reason) {
    return ValidationError{path.empty() ? std::string("(root)") : path, std::move(reason)};
}

std::optional<ValidationError> validateAt(const JSONValue& schema, const JSONValue& inst, const std::string& path);

std::optional<ValidationError> checkType(const JSONValue& schema, const JSONValue& inst, const std::string& path) {
    const JSONValue* type = schema.find("type");
    if (!type) return std::nullopt;
    if (type->isString()) {
        const std::string& t = std::get<std::string>(type->value);
        if (!matchesType(inst, t)) {
            return fail(path, fmt::format("expected {}, got {}", t, typeName(inst)));
        }
        return std::nullopt;
    }
    if (type->isArray()) {
        std::string allowed;
        for (const auto& t : std::get<JSONValue::Array>(type->value)) {
            if (!t || !t->isString()) continue;
            const std::string& name = std::get<std::string>(t->value);
            if (matchesType(inst, name)) return std::nullopt;
            if (!allowed.empty()) allowed += " or ";
            allowed += name;
        }
        return fail(path, fmt::format("expected {}, got {}", allowed, typeName(inst)));
    }
    return std::nullopt;
}

std::optional<ValidationError> checkEnum(const JSONValue& schema, const JSONValue& inst, const std::string& path) {
    if (const JSONValue* c = schema.find("const")) {
        if (inst != *c) {
            return fail(path, "value must equal " + SerializeJSON(*c));
        }
    }
    const JSONValue* e = schema.find("enum");
    if (!e || !e->isArray()) return std::nullopt;
    const auto& options = std::get<JSONValue::Array>(e->value);
    for (const auto& opt : options) {
        if (opt && *opt == inst) return std::nullopt;
    }
    return fail(path, "value is not one of " + SerializeJSON(*e));
}

std::optional<ValidationError> checkNumber(const JSONValue& schema, const JSONValue& inst, const std::string& path) {
    if (!inst.isNumber()) return std::nullopt;
    const double v = asDouble(inst);
    if (const JSONValue* m = schema.find("minimum"); m && m->isNumber() && v < asDouble(*m)) {
        return fail(path, "must be >= " + formatNumber(*m));
    }
    if (const JSONValue* m = schema.find("maximum"); m && m->isNumber() && v > asDouble(*m)) {
        return fail(path, "must be <= " + formatNumber(*m));
    }
    if (const JSONValue* m = schema.find("exclusiveMinimum"); m && m->isNumber() && v <= asDouble(*m)) {
        return fail(path, "must be > " + formatNumber(*m));
    }
    if (const JSONValue* m = schema.find("exclusiveMaximum"); m && m->isNumber() && v >= asDouble(*m)) {
        return fail(path, "must be < " + formatNumber(*m));
    }
    return std::nullopt;
}

std::optional<ValidationError> checkString(const JSONValue& schema, const JSONValue& inst, const std::string& path) {
    if (!inst.isString()) return std::nullopt;
    const std::size_t len = utf8Length(std::get<std::string>(inst.value));
    if (auto mn = sizeKeyword(schema, "minLength"); mn && len < *mn) {
        return fail(path, fmt::format("length must be >= {}", *mn));
    }
    if (auto mx = sizeKeyword(schema, "maxLength"); mx && len > *mx) {
        return fail(path, fmt::format("length must be <= {}", *mx));
    }
    return std::nullopt;
}

std::optional<ValidationError> checkArray(const JSONValue& schema, const JSONValue& inst, const std::string& path) {
    if (!inst.isArray()) return std::nullopt;
    const auto& arr = std::get<JSONValue::Array>(inst.value);
    if (auto mn = sizeKeyword(schema, "minItems"); mn && arr.size() < *mn) {
        return fail(path, fmt::format("must contain at least {} items", *mn));
    }
    if (auto mx = sizeKeyword(schema, "maxItems"); mx && arr.size() > *mx) {
        return fail(path, fmt::format("must contain at most {} items", *mx));
    }
    const JSONValue* items = schema.find("items");
    if (!items || !items->isObject()) return std::nullopt;
    for (std::size_t i = 0; i < arr.size(); ++i) {
        const JSONValue nullValue;
        const JSONValue& item = arr[i] ? *arr[i] : nullValue;
        if (auto err = validateAt(*items, item, indexPath(path, i))) return err;
    }
    return std::nullopt;
}

std::optional<ValidationError> checkObject(const JSONValue& schema, const JSONValue& inst, const std::string& path) {
    if (!inst.isObject()) return std::nullopt;
    const auto& obj = std::get<JSONValue::Object>(inst.value);

    if (const JSONValue* req = schema.find("required"); req && req->isArray()) {
        for (const auto& r : std::get<JSONValue::Array>(req->value)) {
            if (!r || !r->isString()) continue;
            const std::string& key = std::get<std::string>(r->value);
            if (obj.find(key) == obj.end()) {
                return fail(childPath(path, key), "required property is missing");
            }
        }
    }

    const JSONValue* props = schema.find("properties");
    const JSONValue* additional = schema.find("additionalProperties");

    std::vector<std::string> keys;
    keys.reserve(obj.size());
    for (const auto& kv : obj) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());

    for (const auto& key : keys) {
        const auto& member = obj.at(key);
        const JSONValue nullValue;
        const JSONValue& value = member ? *member : nullValue;
        const JSONValue* propSchema = props ? props->find(key) : nullptr;
        if (propSchema) {
            if (auto err = validateAt(*propSchema, value, childPath(path, key))) return err;
            continue;
        }
        // Undeclared property
        if (additional && std::holds_alternative<bool>(additional->value)) {
            if (std::get<bool>(additional->value)) continue;
            return fail(childPath(path, key), "unknown property");
        }
        if (additional && additional->isObject()) {
            if (auto err = validateAt(*additional, value, childPath(path, key))) return err;
            continue;
        }
        return fail(childPath(path, key), "unknown property");
    }
    return std::nullopt;
}

std::optional<ValidationError> validateAt(const JSONValue& schema, const JSONValue& inst, const std::string& path) {
    if (std::holds_alternative<bool>(schema.value)) {
        // Boolean schemas: true accepts everything, false nothing
        if (std::get<bool>(schema.value)) return std::nullopt;
        return fail(path, "no value is allowed here");
    }
    if (!schema.isObject() || std::get<JSONValue::Object>(schema.value).empty()) return std::nullopt;
    if (auto err = checkType(schema, inst, path)) return err;
    if (auto err = checkEnum(schema, inst, path)) return err;
    if (auto err = checkNumber(schema, inst, path)) return err;
    if (auto err = checkString(schema, inst, path)) return err;
    if (auto err = checkArray(schema, inst, path)) return err;
    return checkObject(schema, inst, path);
}
} // namespace

std::optional<ValidationError> SchemaValidator::Validate(const JSONValue& schema, const JSONValue& instance) {
    FUNC_SCOPE();
    if (schema.isNull()) return std::nullopt;
    if (schema.isObject() && std::get<JSONValue::Object>(schema.value).empty()) return std::nullopt;
    return validateAt(schema, instance, "");
}

} // namespace validation
} // namespace mcprt
