//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Strict JSON parser/serializer and JSON-RPC envelope (de)serialization using only std library
//==========================================================================================================

#include <cmath>
#include <cstdlib>
#include <cerrno>
#include <format>
#include <sstream>
#include <iomanip>
#include "payload/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace payload {

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
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

bool operator==(const JSONValue& a, const JSONValue& b) {
    const auto* ai = std::get_if<int64_t>(&a.value);
    const auto* ad = std::get_if<double>(&a.value);
    const auto* bi = std::get_if<int64_t>(&b.value);
    const auto* bd = std::get_if<double>(&b.value);
    if ((ai || ad) && (bi || bd)) {
        if (ai && bi) return *ai == *bi;
        const double x = ai ? static_cast<double>(*ai) : *ad;
        const double y = bi ? static_cast<double>(*bi) : *bd;
        return x == y;
    }
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (const auto* arr = std::get_if<JSONValue::Array>(&a.value)) {
        const auto& other = std::get<JSONValue::Array>(b.value);
        if (arr->size() != other.size()) return false;
        for (std::size_t i = 0; i < arr->size(); ++i) {
            if (!(*arr)[i] || !other[i]) {
                if ((*arr)[i] != other[i]) return false;
                continue;
            }
            if (!(*(*arr)[i] == *other[i])) return false;
        }
        return true;
    }
    if (const auto* obj = std::get_if<JSONValue::Object>(&a.value)) {
        const auto& other = std::get<JSONValue::Object>(b.value);
        if (obj->size() != other.size()) return false;
        for (const auto& [key, val] : *obj) {
            auto it = other.find(key);
            if (it == other.end()) return false;
            if (!val || !it->second) {
                if (val != it->second) return false;
                continue;
            }
            if (!(*val == *it->second)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

// -------------------------------
// Strict recursive JSON parser
// -------------------------------
namespace {
constexpr unsigned int MaxNestingDepth = 512;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(what, i);
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
        for (std::size_t k = 0; k < 4; ++k) {
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

    // Copies one well-formed multi-byte UTF-8 sequence starting at s[i] (RFC 3629: no overlong forms,
    // no surrogates, nothing above U+10FFFF).
    void copyUtf8Sequence(std::string& out) {
        const auto byteAt = [this](std::size_t k) { return static_cast<unsigned char>(s[k]); };
        const unsigned char lead = byteAt(i);
        std::size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            len = 3;
            if (lead == 0xE0) lo = 0xA0;
            if (lead == 0xED) hi = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            len = 4;
            if (lead == 0xF0) lo = 0x90;
            if (lead == 0xF4) hi = 0x8F;
        } else {
            fail("Invalid UTF-8 lead byte in string");
        }
        if (i + len > s.size()) fail("Truncated UTF-8 sequence in string");
        const unsigned char second = byteAt(i + 1);
        if (second < lo || second > hi) fail("Invalid UTF-8 sequence in string");
        for (std::size_t k = 2; k < len; ++k) {
            const unsigned char b = byteAt(i + k);
            if (b < 0x80 || b > 0xBF) fail("Invalid UTF-8 sequence in string");
        }
        out.append(s, i, len);
        i += len;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (static_cast<unsigned char>(c) >= 0x80) {
                --i;
                copyUtf8Sequence(out);
                continue;
            }
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
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired high surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired low surrogate");
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
        std::size_t start = i;
        auto isDigit = [this](std::size_t k) {
            return k < s.size() && s[k] >= '0' && s[k] <= '9';
        };
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
            char* end = nullptr;
            long long v = std::strtoll(num.c_str(), &end, 10);
            if (errno != ERANGE) {
                return JSONValue(static_cast<int64_t>(v));
            }
            // Out of int64 range: keep magnitude as double
        }
        errno = 0;
        double d = std::strtod(num.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(d)) fail("Number out of range");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{' || c == '[') {
            if (++depth > MaxNestingDepth) fail("Nesting too deep");
            JSONValue v = (c == '{') ? parseObject() : parseArray();
            --depth;
            return v;
        }
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || (c >= '0' && c <= '9')) return parseNumber();
        fail("Unexpected character");
    }
};

void appendEscaped(std::ostringstream& oss, const std::string& v) {
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
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void serializeInto(std::ostringstream& oss, const JSONValue& value) {
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
                throw JSONSerializeError("Non-finite number has no JSON representation");
            }
            oss << std::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                if (!v[i]) throw JSONSerializeError("Dangling array element");
                serializeInto(oss, *v[i]);
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!val) throw JSONSerializeError("Dangling value for key '" + key + "'");
                if (!first) oss << ',';
                first = false;
                appendEscaped(oss, key);
                oss << ':';
                serializeInto(oss, *val);
            }
            oss << '}';
        }
    }, value.get());
}

void appendId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            // Parsed ids are always finite; a non-finite one cannot be echoed
            if (std::isfinite(v)) {
                oss << std::format("{}", v);
            } else {
                oss << "null";
            }
        } else {
            oss << "null";
        }
    }, id);
}

// Returns false when the JSON id has a shape JSON-RPC does not allow (bool, object, array).
bool idFromJSON(const JSONValue& v, JSONRPCId& out) {
    if (const auto* str = std::get_if<std::string>(&v.value)) { out = *str; return true; }
    if (const auto* num = std::get_if<int64_t>(&v.value)) { out = *num; return true; }
    if (const auto* dbl = std::get_if<double>(&v.value)) { out = *dbl; return true; }
    if (v.IsNull()) { out = nullptr; return true; }
    return false;
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON document");
    }
    return v;
}

std::string SerializeJSONValue(const JSONValue& value) {
    std::ostringstream oss;
    serializeInto(oss, value);
    return oss.str();
}

bool RequestFromJSON(const JSONValue& doc, JSONRPCRequest& out, std::string& reason) {
    if (!doc.IsObject()) {
        reason = "Request must be a JSON object";
        return false;
    }
    const auto& obj = std::get<JSONValue::Object>(doc.value);

    auto itId = obj.find("id");
    if (itId != obj.end() && itId->second) {
        if (!idFromJSON(*itId->second, out.id)) {
            out.id = nullptr;
            reason = "Request id must be a string or a number";
            return false;
        }
    } else {
        out.id = nullptr;
    }

    auto itVer = obj.find("jsonrpc");
    if (itVer == obj.end() || !itVer->second || !itVer->second->IsString() ||
        std::get<std::string>(itVer->second->value) != "2.0") {
        reason = "Request jsonrpc member must be \"2.0\"";
        return false;
    }
    out.jsonrpc = "2.0";

    auto itMethod = obj.find("method");
    if (itMethod == obj.end() || !itMethod->second || !itMethod->second->IsString() ||
        std::get<std::string>(itMethod->second->value).empty()) {
        reason = "Request method must be a non-empty string";
        return false;
    }
    out.method = std::get<std::string>(itMethod->second->value);

    auto itParams = obj.find("params");
    if (itParams != obj.end() && itParams->second && !itParams->second->IsNull()) {
        out.params = *itParams->second;
    } else {
        out.params = JSONValue(JSONValue::Object{});
    }
    return true;
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    appendEscaped(oss, jsonrpc);
    oss << ",\"id\":";
    appendId(oss, id);
    oss << ",\"method\":";
    appendEscaped(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        serializeInto(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        std::string reason;
        if (!RequestFromJSON(ParseJSON(json), *this, reason)) {
            LOG_DEBUG("Rejected JSONRPCRequest: {}", reason);
            return false;
        }
        return true;
    } catch (const JSONParseError& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    appendEscaped(oss, jsonrpc);
    oss << ",\"id\":";
    appendId(oss, id);

    if (result.has_value()) {
        oss << ",\"result\":";
        serializeInto(oss, result.value());
    }

    if (error.has_value()) {
        oss << ",\"error\":";
        serializeInto(oss, error.value());
    }

    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue doc = ParseJSON(json);
        if (!doc.IsObject()) {
            return false;
        }
        const auto& obj = std::get<JSONValue::Object>(doc.value);
        auto itId = obj.find("id");
        if (itId == obj.end() || !itId->second || !idFromJSON(*itId->second, id)) {
            return false;
        }
        auto itVer = obj.find("jsonrpc");
        if (itVer != obj.end() && itVer->second && itVer->second->IsString()) {
            jsonrpc = std::get<std::string>(itVer->second->value);
        }
        auto itResult = obj.find("result");
        if (itResult != obj.end() && itResult->second) {
            result = *itResult->second;
        }
        auto itError = obj.find("error");
        if (itError != obj.end() && itError->second) {
            error = *itError->second;
        }
        // Exactly one of result/error
        return result.has_value() != error.has_value();
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
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

} // namespace payload
