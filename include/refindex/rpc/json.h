// REFINDEX - JSON Value and JSON-RPC Envelopes
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Minimal JSON document model plus JSON-RPC 2.0 request/response envelopes
// used to talk to chain nodes. Also used for the daemon's record dump.

#ifndef REFINDEX_RPC_JSON_H
#define REFINDEX_RPC_JSON_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace refindex {
namespace rpc {

// ============================================================================
// JSON Value
// ============================================================================

/**
 * Represents a JSON value.
 * Supports: null, bool, int64, double, string, array, object
 */
class JSONValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        Double,
        String,
        Array,
        Object
    };

    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;

    JSONValue() : type_(Type::Null) {}
    JSONValue(std::nullptr_t) : type_(Type::Null) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint32_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint64_t value) : type_(Type::Int), intValue_(static_cast<int64_t>(value)) {}
    JSONValue(double value) : type_(Type::Double), doubleValue_(value) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(const std::string& value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string&& value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(const Array& value) : type_(Type::Array), arrayValue_(value) {}
    JSONValue(Array&& value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(const Object& value) : type_(Type::Object), objectValue_(value) {}
    JSONValue(Object&& value) : type_(Type::Object), objectValue_(std::move(value)) {}

    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsDouble() const { return type_ == Type::Double; }
    bool IsNumber() const { return type_ == Type::Int || type_ == Type::Double; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }

    // Value getters (with defaults)
    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString(const std::string& defaultValue = emptyString_) const;
    const Array& GetArray() const;
    const Object& GetObject() const;

    // Object access; a missing key reads as null
    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);

    // Array access
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    void Push(JSONValue value);

    /// Serialize; pretty output indents by two spaces per level
    std::string ToJSON(bool pretty = false, int indent = 0) const;

    /// Parse a document; throws std::runtime_error on malformed input
    static JSONValue Parse(const std::string& json);

    static std::optional<JSONValue> TryParse(const std::string& json);

    static const JSONValue& Null() { return nullValue_; }

private:
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    double doubleValue_{0.0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;

    static const JSONValue nullValue_;
    static const Array emptyArray_;
    static const Object emptyObject_;
    static const std::string emptyString_;
};

/// Quote and escape a string as a JSON literal
std::string QuoteJSONString(const std::string& str);

// ============================================================================
// RPC Error Codes (JSON-RPC 2.0 standard)
// ============================================================================

namespace ErrorCode {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;

    // Server errors (-32000 to -32099)
    constexpr int SERVER_ERROR = -32000;
}

// ============================================================================
// RPC Request
// ============================================================================

/**
 * A JSON-RPC 2.0 request.
 */
class RPCRequest {
public:
    RPCRequest() = default;
    RPCRequest(const std::string& method, const JSONValue& params = JSONValue(),
               const JSONValue& id = JSONValue());

    const std::string& GetMethod() const { return method_; }

    const JSONValue& GetParams() const { return params_; }

    const JSONValue& GetId() const { return id_; }

    /// Positional parameter, null when absent
    const JSONValue& GetParam(size_t index) const;

    std::string ToJSON() const;

    static std::optional<RPCRequest> Parse(const std::string& json);

private:
    std::string method_;
    JSONValue params_;
    JSONValue id_;
};

// ============================================================================
// RPC Response
// ============================================================================

/**
 * A JSON-RPC 2.0 response.
 */
class RPCResponse {
public:
    static RPCResponse Success(const JSONValue& result, const JSONValue& id);

    static RPCResponse Error(int code, const std::string& message,
                             const JSONValue& id, const JSONValue& data = JSONValue());

    bool IsError() const { return isError_; }

    const JSONValue& GetResult() const { return result_; }

    int GetErrorCode() const { return errorCode_; }

    const std::string& GetErrorMessage() const { return errorMessage_; }

    const JSONValue& GetErrorData() const { return errorData_; }

    const JSONValue& GetId() const { return id_; }

    std::string ToJSON() const;

    /**
     * Parse a response body.
     * Returns nullopt if the body is not a JSON-RPC response object
     * (no "result" and no well-formed "error").
     */
    static std::optional<RPCResponse> Parse(const std::string& json);

private:
    bool isError_{false};
    JSONValue result_;
    int errorCode_{0};
    std::string errorMessage_;
    JSONValue errorData_;
    JSONValue id_;
};

} // namespace rpc
} // namespace refindex

#endif // REFINDEX_RPC_JSON_H
