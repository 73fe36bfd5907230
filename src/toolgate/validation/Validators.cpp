//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.cpp
// Purpose: JSON Schema subset validator for tool arguments
//==========================================================================================================

#include "toolgate/validation/Validators.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace toolgate {
namespace validation {

namespace {

std::string joinPath(const std::string& base, const std::string& key) {
    if (base.empty()) return key;
    return base + "." + key;
}

std::string indexPath(const std::string& base, std::size_t i) {
    return base + "[" + std::to_string(i) + "]";
}

bool matchesType(const JSONValue& v, const std::string& type) {
    if (type == "object") return v.IsObject();
    if (type == "array") return v.IsArray();
    if (type == "string") return v.IsString();
    if (type == "boolean") return std::holds_alternative<bool>(v.value);
    if (type == "null") return v.IsNull();
    if (type == "integer") {
        if (std::holds_alternative<int64_t>(v.value)) return true;
        if (std::holds_alternative<double>(v.value)) {
            // Integral doubles count only when they fit int64, which is what handlers read them as
            const double d = std::get<double>(v.value);
            return std::isfinite(d) && std::trunc(d) == d && d >= -9223372036854775808.0 && d < 9223372036854775808.0;
        }
        return false;
    }
    if (type == "number") {
        return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
    }
    // Unknown type names never match.
    return false;
}

// Numbers compare by value regardless of int/double representation.
bool enumEquals(const JSONValue& a, const JSONValue& b) {
    const bool aNum = std::holds_alternative<int64_t>(a.value) || std::holds_alternative<double>(a.value);
    const bool bNum = std::holds_alternative<int64_t>(b.value) || std::holds_alternative<double>(b.value);
    if (aNum && bNum) {
        auto asDouble = [](const JSONValue& x) {
            if (std::holds_alternative<int64_t>(x.value)) return static_cast<double>(std::get<int64_t>(x.value));
            return std::get<double>(x.value);
        };
        return asDouble(a) == asDouble(b);
    }
    return a == b;
}

void validateNode(const JSONValue& schema, const JSONValue& value, const std::string& path,
                  std::vector<FieldError>& out) {
    if (!schema.IsObject()) {
        return;
    }

    if (const JSONValue* typeVal = schema.Find("type")) {
        std::vector<std::string> allowed;
        if (typeVal->IsString()) {
            allowed.push_back(std::get<std::string>(typeVal->value));
        } else if (typeVal->IsArray()) {
            for (const auto& t : std::get<JSONValue::Array>(typeVal->value)) {
                if (t && t->IsString()) allowed.push_back(std::get<std::string>(t->value));
            }
        }
        if (!allowed.empty()) {
            const bool ok = std::any_of(allowed.begin(), allowed.end(),
                                        [&](const std::string& t) { return matchesType(value, t); });
            if (!ok) {
                std::string expected;
                for (std::size_t i = 0; i < allowed.size(); ++i) {
                    if (i) expected += " or ";
                    expected += allowed[i];
                }
                out.push_back({path, "expected " + expected + ", got " + jsonTypeName(value)});
                // Structural checks below are meaningless on the wrong type
                return;
            }
        }
    }

    if (const JSONValue* enumVal = schema.Find("enum")) {
        if (enumVal->IsArray()) {
            const auto& options = std::get<JSONValue::Array>(enumVal->value);
            const bool found = std::any_of(options.begin(), options.end(),
                                           [&](const std::shared_ptr<JSONValue>& o) { return o && enumEquals(*o, value); });
            if (!found) {
                out.push_back({path, "value is not one of the allowed values"});
            }
        }
    }

    if (value.IsObject()) {
        const auto& obj = std::get<JSONValue::Object>(value.value);
        const JSONValue* props = schema.Find("properties");

        if (const JSONValue* req = schema.Find("required")) {
            if (req->IsArray()) {
                for (const auto& r : std::get<JSONValue::Array>(req->value)) {
                    if (!r || !r->IsString()) continue;
                    const std::string& key = std::get<std::string>(r->value);
                    if (obj.find(key) == obj.end()) {
                        out.push_back({joinPath(path, key), "required field missing"});
                    }
                }
            }
        }

        // Sorted so that errors come out in a stable order
        std::set<std::string> keys;
        for (const auto& kv : obj) keys.insert(kv.first);

        const JSONValue* additional = schema.Find("additionalProperties");
        const bool closed = additional != nullptr && std::holds_alternative<bool>(additional->value) &&
                            !std::get<bool>(additional->value);

        for (const auto& key : keys) {
            const JSONValue* propSchema = props ? props->Find(key) : nullptr;
            const auto& member = obj.at(key);
            if (propSchema != nullptr) {
                validateNode(*propSchema, member ? *member : JSONValue(nullptr), joinPath(path, key), out);
            } else if (closed) {
                out.push_back({joinPath(path, key), "unexpected field"});
            }
        }
    }

    if (value.IsArray()) {
        if (const JSONValue* items = schema.Find("items")) {
            const auto& arr = std::get<JSONValue::Array>(value.value);
            for (std::size_t i = 0; i < arr.size(); ++i) {
                validateNode(*items, arr[i] ? *arr[i] : JSONValue(nullptr), indexPath(path, i), out);
            }
        }
    }
}

} // namespace

std::string jsonTypeName(const JSONValue& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return "null";
        else if constexpr (std::is_same_v<T, bool>) return "boolean";
        else if constexpr (std::is_same_v<T, int64_t>) return "integer";
        else if constexpr (std::is_same_v<T, double>) return "number";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, JSONValue::Array>) return "array";
        else return "object";
    }, v.value);
}

std::vector<FieldError> validateArguments(const JSONValue& schema, const JSONValue& arguments) {
    std::vector<FieldError> errors;
    validateNode(schema, arguments, std::string(), errors);
    return errors;
}

JSONValue fieldErrorsToJSON(const std::vector<FieldError>& errors) {
    JSONValue::Array fields;
    JSONValue::Array items;
    for (const auto& e : errors) {
        fields.push_back(std::make_shared<JSONValue>(e.field));
        JSONValue::Object item;
        item["field"] = std::make_shared<JSONValue>(e.field);
        item["reason"] = std::make_shared<JSONValue>(e.reason);
        items.push_back(std::make_shared<JSONValue>(std::move(item)));
    }
    JSONValue::Object o;
    o["fields"] = std::make_shared<JSONValue>(std::move(fields));
    o["errors"] = std::make_shared<JSONValue>(std::move(items));
    return JSONValue{std::move(o)};
}

} // namespace validation
} // namespace toolgate
