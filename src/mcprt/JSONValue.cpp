//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.cpp
// Purpose: Strict recursive-descent JSON parser, compact serializer, and JSON-RPC envelope rendering
//==========================================================================================================

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <iomanip>

#include "mcprt/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace mcprt {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::find(const std::string& key) const {
    if (!std::holds_alternative<Object>(value)) {
        return nullptr;
    }
    const auto& o = std::get<Object>(value);
    auto it = o.find(key);
    if (it == o.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.isNumber() && b.isNumber()) {
        if (a.isInteger() && b.isInteger()) {
            return std::get<int64_t>(a.value) == std::get<int64_t>(b.value);
        }
        auto asDouble = [](const JSONValue& v) {
            return v.isInteger() ? static_cast<double>(std::get<int64_t>(v.value)) : std::get<double>(v.value);
        };
        return asDouble(a) == asDouble(b);
    }
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (a.isArray()) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (std::size_t i = 0; i < x.size(); ++i) {
            if (!x[i] || !y[i]) {
                if (x[i] != y[i]) return false;
                continue;
            }
            if (*x[i] != *y[i]) return false;
        }
        return true;
    }
    if (a.isObject()) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) return false;
        for (const auto& [k, v] : x) {
            auto it = y.find(k);
            if (it == y.end()) return false;
            if (!v || !it->second) {
                if (v != it->second) return false;
                continue;
            }
            if (*v != *it->second) return false;
        }
        return true;
    }
    return a.value == b.value;
}

// -------------------------------
// Strict recursive JSON parser
// -------------------------------
namespace {
constexpr unsigned int MaxNestingDepth = 512u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0u};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(what + " at offset " + std::to_string(i), i);
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int cp) {
        if (cp <= 0x7F) {
            out.push_back(static_cast<char>(cp));
        } else if (cp <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"'");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int cp = parseHex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int lo = parseHex4();
                            if (lo < 0xDC00 || lo > 0xDFFF) fail("Invalid low surrogate");
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        } else {
                            fail("Unpaired high surrogate");
                        }
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("Unpaired low surrogate");
                    }
                    appendUtf8(out, cp);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        std::size_t start = i;
        auto isDigit = [&](std::size_t k) { return k < s.size() && std::isdigit(static_cast<unsigned char>(s[k])); };
        if (i < s.size() && s[i] == '-') ++i;
        if (!isDigit(i)) fail("Invalid number");
        if (s[i] == '0') {
            ++i;
            if (isDigit(i)) fail("Leading zero in number");
        } else {
            while (isDigit(i)) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (!isDigit(i)) fail("Expected digit after decimal point");
            while (isDigit(i)) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (!isDigit(i)) fail("Expected digit in exponent");
            while (isDigit(i)) ++i;
        }
        const std::string num = s.substr(start, i - start);
        if (!isFloat) {
            errno = 0;
            long long v = std::strtoll(num.c_str(), nullptr, 10);
            if (errno != ERANGE) {
                return JSONValue(static_cast<int64_t>(v));
            }
            // Out of int64 range: fall through to double
        }
        errno = 0;
        double d = std::strtod(num.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(d)) fail("Number out of range");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' or ']' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' or '}' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || (c >= '0' && c <= '9')) return parseNumber();
        fail("Unexpected character");
    }
};

void writeString(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                oss << "null";
            } else {
                char buf[32];
                std::snprintf(buf, sizeof(buf), "%.17g", v);
                oss << buf;
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) writeValue(oss, *v[k]); else oss << "null";
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeString(oss, key);
                oss << ':';
                if (val) writeValue(oss, *val); else oss << "null";
            }
            oss << '}';
        }
    }, value.get());
}

JSONValue idToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return JSONValue(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return JSONValue(v);
        } else {
            return JSONValue(nullptr);
        }
    }, id);
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

std::string IdToString(const JSONRPCId& id) {
    std::string idStr;
    std::visit([&](const auto& v){
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { idStr = v; }
        else if constexpr (std::is_same_v<T, int64_t>) { idStr = std::to_string(v); }
        else { idStr = "null"; }
    }, id);
    return idStr;
}

std::string IdKey(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) {
        return "s:" + std::get<std::string>(id);
    }
    if (std::holds_alternative<int64_t>(id)) {
        return "i:" + std::to_string(std::get<int64_t>(id));
    }
    return "null";
}

// JSONRPCRequest implementation
JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue::Object o;
    o["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    o["id"] = std::make_shared<JSONValue>(idToJSON(id));
    o["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        o["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue{std::move(o)};
}

// JSONRPCResponse implementation
JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object o;
    o["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    o["id"] = std::make_shared<JSONValue>(idToJSON(id));
    if (error.has_value()) {
        o["error"] = std::make_shared<JSONValue>(error.value());
    } else {
        o["result"] = std::make_shared<JSONValue>(result.has_value() ? result.value() : JSONValue{JSONValue::Object{}});
    }
    return JSONValue{std::move(o)};
}

std::optional<JSONRPCResponse> JSONRPCResponse::FromJSON(const std::string& text) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(text);
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to parse JSONRPCResponse: {}", e.what());
        return std::nullopt;
    }
    const JSONValue* idVal = doc.find("id");
    if (!idVal) {
        return std::nullopt;
    }
    JSONRPCResponse resp;
    if (idVal->isString()) {
        resp.id = std::get<std::string>(idVal->value);
    } else if (idVal->isInteger()) {
        resp.id = std::get<int64_t>(idVal->value);
    } else {
        resp.id = nullptr;
    }
    if (const JSONValue* r = doc.find("result")) {
        resp.result = *r;
    }
    if (const JSONValue* e = doc.find("error")) {
        resp.error = *e;
    }
    if (!resp.result.has_value() && !resp.error.has_value()) {
        return std::nullopt;
    }
    return resp;
}

// JSONRPCNotification implementation
JSONValue JSONRPCNotification::ToJSON() const {
    JSONValue::Object o;
    o["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    o["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        o["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue{std::move(o)};
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcprt
