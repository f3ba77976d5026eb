//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 envelopes for the payload plugin protocol
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <utility>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace payload {

struct JSONValue;

//==========================================================================================================
// JSONObject
// Purpose: JSON object members in the order they were first inserted (document order for parsed input).
// Notes:
//   - Map-style lookup (find/at/count/operator[]) through a key index.
//   - Assigning an existing key replaces its value in place; the member keeps its position.
//==========================================================================================================
class JSONObject {
public:
    using value_type = std::pair<std::string, std::shared_ptr<JSONValue>>;
    using iterator = std::vector<value_type>::iterator;
    using const_iterator = std::vector<value_type>::const_iterator;

    JSONObject() = default;
    JSONObject(std::initializer_list<value_type> init) {
        for (const auto& kv : init) {
            (*this)[kv.first] = kv.second;
        }
    }

    iterator begin() { return members_.begin(); }
    iterator end() { return members_.end(); }
    const_iterator begin() const { return members_.begin(); }
    const_iterator end() const { return members_.end(); }

    std::size_t size() const { return members_.size(); }
    bool empty() const { return members_.empty(); }

    iterator find(const std::string& key) {
        auto it = index_.find(key);
        return it == index_.end() ? members_.end() : members_.begin() + static_cast<std::ptrdiff_t>(it->second);
    }
    const_iterator find(const std::string& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? members_.end() : members_.begin() + static_cast<std::ptrdiff_t>(it->second);
    }
    std::size_t count(const std::string& key) const { return index_.count(key); }

    std::shared_ptr<JSONValue>& at(const std::string& key) {
        return members_.at(index_.at(key)).second;
    }
    const std::shared_ptr<JSONValue>& at(const std::string& key) const {
        return members_.at(index_.at(key)).second;
    }

    std::shared_ptr<JSONValue>& operator[](const std::string& key) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            return members_[it->second].second;
        }
        index_.emplace(key, members_.size());
        members_.emplace_back(key, nullptr);
        return members_.back().second;
    }

    std::size_t erase(const std::string& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return 0;
        }
        members_.erase(members_.begin() + static_cast<std::ptrdiff_t>(it->second));
        index_.clear();
        for (std::size_t k = 0; k < members_.size(); ++k) {
            index_.emplace(members_[k].first, k);
        }
        return 1;
    }

    // Identity comparison (order and pointer equality); structural equality is operator==(JSONValue).
    bool operator==(const JSONObject& other) const { return members_ == other.members_; }

private:
    std::vector<value_type> members_;
    std::unordered_map<std::string, std::size_t> index_;
};

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: JSONObject, members in insertion order.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = JSONObject;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
};

//==========================================================================================================
// Structural equality (object key order is irrelevant; int64 and double compare by numeric value).
//==========================================================================================================
bool operator==(const JSONValue& a, const JSONValue& b);

//==========================================================================================================
// JSONParseError
// Purpose: Raised when text is not exactly one complete, valid JSON document.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}
    std::size_t offset() const { return offset_; }
private:
    std::size_t offset_;
};

//==========================================================================================================
// JSONSerializeError
// Purpose: Raised when a value has no JSON representation (non-finite number, dangling node).
//==========================================================================================================
class JSONSerializeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document. Leading/trailing whitespace is allowed; anything else after
//          the document is an error.
// Args:
//   text: UTF-8 input.
// Returns:
//   Parsed JSONValue; throws JSONParseError on malformed input.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSONValue
// Purpose: Compact single-line serialization. Throws JSONSerializeError for values JSON cannot carry.
//==========================================================================================================
std::string SerializeJSONValue(const JSONValue& value);

//==========================================================================================================
// JSONRPCId
// Purpose: Request id echoed back unchanged: string, integer, other number (fraction, exponent or
//          beyond int64), or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, double, std::nullptr_t>;

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns compact JSON text for the message (no trailing newline).
//   Deserialize(json): Parses JSON text into this object; returns true on success.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual bool Deserialize(const std::string& json) = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and params.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// RequestFromJSON
// Purpose: Extracts a request envelope from a parsed document.
// Args:
//   doc: Parsed JSON document.
//   out: Receives id/method/params. The id is filled in as soon as it is recognized so callers can
//        correlate an InvalidRequest answer even when a later field is bad.
//   reason: Receives a human-readable description on failure.
// Returns:
//   true when doc is an object with jsonrpc "2.0", a non-empty string method and a string/number/absent id.
//==========================================================================================================
bool RequestFromJSON(const JSONValue& doc, JSONRPCRequest& out, std::string& reason);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: JSON-RPC 2.0 error codes used on the plugin wire.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
    constexpr int ServerError = -32000;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace payload
