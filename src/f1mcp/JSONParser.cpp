//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Strict recursive-descent JSON parser, serializers and JSON-RPC message serialization
//==========================================================================================================

#include <cctype>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <fmt/core.h>
#include "f1mcp/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace f1mcp {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(int v) : value(static_cast<int64_t>(v)) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::find(const std::string& key) const {
    const auto* obj = std::get_if<Object>(&value);
    if (!obj) return nullptr;
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) return nullptr;
    return it->second.get();
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        // 3 and 3.0 compare equal
        auto na = getNumber(&a);
        auto nb = getNumber(&b);
        return na.has_value() && nb.has_value() && *na == *nb;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.value);
        if constexpr (std::is_same_v<T, JSONValue::Array>) {
            if (lhs.size() != rhs.size()) return false;
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                if (!lhs[i] || !rhs[i]) { if (lhs[i] != rhs[i]) return false; continue; }
                if (*lhs[i] != *rhs[i]) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            if (lhs.size() != rhs.size()) return false;
            for (const auto& [k, v] : lhs) {
                auto it = rhs.find(k);
                if (it == rhs.end()) return false;
                if (!v || !it->second) { if (v != it->second) return false; continue; }
                if (*v != *it->second) return false;
            }
            return true;
        } else {
            return lhs == rhs;
        }
    }, a.value);
}

//----------------------------------------------------------------------------------------------------------
// Accessors
//----------------------------------------------------------------------------------------------------------
std::optional<std::string> getString(const JSONValue* v) {
    if (!v) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&v->value)) return *s;
    return std::nullopt;
}

std::optional<int64_t> getInt(const JSONValue* v) {
    if (!v) return std::nullopt;
    if (const auto* i = std::get_if<int64_t>(&v->value)) return *i;
    if (const auto* d = std::get_if<double>(&v->value)) {
        // 2^63 is exact as a double; anything at or beyond it does not fit int64_t
        if (std::isfinite(*d) && std::floor(*d) == *d &&
            *d >= -9223372036854775808.0 && *d < 9223372036854775808.0) {
            return static_cast<int64_t>(*d);
        }
    }
    return std::nullopt;
}

std::optional<double> getNumber(const JSONValue* v) {
    if (!v) return std::nullopt;
    if (const auto* i = std::get_if<int64_t>(&v->value)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&v->value)) return *d;
    return std::nullopt;
}

std::optional<bool> getBool(const JSONValue* v) {
    if (!v) return std::nullopt;
    if (const auto* b = std::get_if<bool>(&v->value)) return *b;
    return std::nullopt;
}

const JSONValue::Array* getArray(const JSONValue* v) {
    if (!v) return nullptr;
    return std::get_if<JSONValue::Array>(&v->value);
}

const JSONValue* findPath(const JSONValue& root, std::initializer_list<const char*> path) {
    const JSONValue* cur = &root;
    for (const char* key : path) {
        cur = cur->find(key);
        if (!cur) return nullptr;
    }
    return cur;
}

// -------------------------------
// Strict recursive JSON parser
// -------------------------------
namespace {
constexpr int kMaxDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const { throw JsonParseError(what, i); }

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

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (c != '\\') { out.push_back(c); continue; }
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
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        const std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid number");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid fraction");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) return JSONValue(v);
            // Integers beyond int64 range degrade to double
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc() || ptr != last) fail("Number out of range");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
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
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail("Unexpected character");
    }
};

void escapeString(std::ostringstream& oss, const std::string& v) {
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

void writeValue(std::ostringstream& oss, const JSONValue& value, int indent, int level) {
    const bool pretty = indent > 0;
    auto newline = [&](int lvl) {
        if (!pretty) return;
        oss << '\n' << std::string(static_cast<std::size_t>(indent * lvl), ' ');
    };
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) oss << fmt::format("{}", v); else oss << "null";
        } else if constexpr (std::is_same_v<T, std::string>) {
            escapeString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            if (v.empty()) { oss << ']'; return; }
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                newline(level + 1);
                if (v[k]) writeValue(oss, *v[k], indent, level + 1); else oss << "null";
            }
            newline(level);
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            if (v.empty()) { oss << '}'; return; }
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                newline(level + 1);
                escapeString(oss, key);
                oss << (pretty ? ": " : ":");
                if (val) writeValue(oss, *val, indent, level + 1); else oss << "null";
            }
            newline(level);
            oss << '}';
        }
    }, value.value);
}

void writeId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            escapeString(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else {
            oss << "null";
        }
    }, id);
}
} // namespace

JSONValue parseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) p.fail("Trailing characters after JSON value");
    return v;
}

std::string serializeJSONValue(const JSONValue& value) {
    std::ostringstream oss;
    writeValue(oss, value, 0, 0);
    return oss.str();
}

std::string serializeJSONValuePretty(const JSONValue& value, int indent) {
    std::ostringstream oss;
    writeValue(oss, value, indent, 0);
    return oss.str();
}

std::string idToString(const JSONRPCId& id) {
    std::ostringstream oss;
    writeId(oss, id);
    return oss.str();
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    if (!IsNotification()) {
        oss << ",\"id\":";
        writeId(oss, id);
    }
    oss << ",\"method\":";
    escapeString(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":" << serializeJSONValue(params.value());
    }
    oss << "}";
    return oss.str();
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    oss << ",\"id\":";
    writeId(oss, id);
    if (error.has_value()) {
        oss << ",\"error\":" << serializeJSONValue(error.value());
    } else if (result.has_value()) {
        oss << ",\"result\":" << serializeJSONValue(result.value());
    } else {
        LOG_WARN("Serializing response id={} with neither result nor error", idToString(id));
        oss << ",\"result\":null";
    }
    oss << "}";
    return oss.str();
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = makeJSON(static_cast<int64_t>(code));
    errorObj["message"] = makeJSON(message);
    if (data.has_value()) {
        errorObj["data"] = makeJSON(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace f1mcp
