// REFINDEX - JSON Value and JSON-RPC Envelopes Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/rpc/json.h"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace refindex {
namespace rpc {

const JSONValue JSONValue::nullValue_;
const JSONValue::Array JSONValue::emptyArray_;
const JSONValue::Object JSONValue::emptyObject_;
const std::string JSONValue::emptyString_;

// ============================================================================
// JSONValue Accessors
// ============================================================================

bool JSONValue::GetBool(bool defaultValue) const {
    if (type_ == Type::Bool) return boolValue_;
    return defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    if (type_ == Type::Double) return static_cast<int64_t>(doubleValue_);
    return defaultValue;
}

double JSONValue::GetDouble(double defaultValue) const {
    if (type_ == Type::Double) return doubleValue_;
    if (type_ == Type::Int) return static_cast<double>(intValue_);
    return defaultValue;
}

const std::string& JSONValue::GetString(const std::string& defaultValue) const {
    if (type_ == Type::String) return stringValue_;
    return defaultValue;
}

const JSONValue::Array& JSONValue::GetArray() const {
    if (type_ == Type::Array) return arrayValue_;
    return emptyArray_;
}

const JSONValue::Object& JSONValue::GetObject() const {
    if (type_ == Type::Object) return objectValue_;
    return emptyObject_;
}

bool JSONValue::HasKey(const std::string& key) const {
    return type_ == Type::Object && objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return nullValue_;
    auto it = objectValue_.find(key);
    if (it == objectValue_.end()) return nullValue_;
    return it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return nullValue_;
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

// ============================================================================
// Serialization
// ============================================================================

std::string QuoteJSONString(const std::string& str) {
    std::ostringstream ss;
    ss << '"';
    for (char c : str) {
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
    return ss.str();
}

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    std::string indentStr(indent * 2, ' ');
    std::string childIndent((indent + 1) * 2, ' ');

    switch (type_) {
        case Type::Null:
            ss << "null";
            break;

        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;

        case Type::Int:
            ss << intValue_;
            break;

        case Type::Double:
            ss << std::setprecision(15) << doubleValue_;
            break;

        case Type::String:
            ss << QuoteJSONString(stringValue_);
            break;

        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
                break;
            }
            ss << (pretty ? "[\n" : "[");
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (pretty) ss << childIndent;
                ss << arrayValue_[i].ToJSON(pretty, indent + 1);
                if (i + 1 < arrayValue_.size()) ss << ",";
                if (pretty) ss << "\n";
            }
            if (pretty) ss << indentStr;
            ss << "]";
            break;
        }

        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
                break;
            }
            ss << (pretty ? "{\n" : "{");
            size_t i = 0;
            for (const auto& [key, value] : objectValue_) {
                if (pretty) ss << childIndent;
                ss << QuoteJSONString(key) << (pretty ? ": " : ":")
                   << value.ToJSON(pretty, indent + 1);
                if (++i < objectValue_.size()) ss << ",";
                if (pretty) ss << "\n";
            }
            if (pretty) ss << indentStr;
            ss << "}";
            break;
        }
    }

    return ss.str();
}

// ============================================================================
// Parsing
// ============================================================================

namespace {

/// Maximum nesting accepted from a remote peer
constexpr int MAX_JSON_DEPTH = 64;

class JSONParser {
public:
    explicit JSONParser(const std::string& text) : text_(text) {}

    std::optional<JSONValue> ParseDocument() {
        auto value = ParseValue(0);
        if (!value) return std::nullopt;
        SkipWhitespace();
        if (pos_ != text_.size()) return std::nullopt;  // trailing garbage
        return value;
    }

private:
    void SkipWhitespace() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool Consume(const char* literal) {
        size_t len = std::char_traits<char>::length(literal);
        if (text_.compare(pos_, len, literal) != 0) return false;
        pos_ += len;
        return true;
    }

    std::optional<uint32_t> ParseHex4() {
        if (pos_ + 4 > text_.size()) return std::nullopt;
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            cp <<= 4;
            if (c >= '0' && c <= '9') cp |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') cp |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') cp |= static_cast<uint32_t>(c - 'A' + 10);
            else return std::nullopt;
        }
        return cp;
    }

    static void AppendUTF8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::optional<std::string> ParseString() {
        if (pos_ >= text_.size() || text_[pos_] != '"') return std::nullopt;
        ++pos_;

        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) return std::nullopt;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) return std::nullopt;
            switch (text_[pos_++]) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    auto cp = ParseHex4();
                    if (!cp) return std::nullopt;
                    if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                        // High surrogate must pair with a low one
                        if (!Consume("\\u")) return std::nullopt;
                        auto low = ParseHex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) return std::nullopt;
                        *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
                        return std::nullopt;
                    }
                    AppendUTF8(out, *cp);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;  // unterminated
    }

    std::optional<JSONValue> ParseNumber() {
        size_t start = pos_;
        bool isFloat = false;

        if (text_[pos_] == '-') ++pos_;
        size_t digits = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        if (pos_ == digits) return std::nullopt;

        if (pos_ < text_.size() && text_[pos_] == '.') {
            isFloat = true;
            ++pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            isFloat = true;
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        }

        std::string numStr = text_.substr(start, pos_ - start);
        try {
            if (isFloat) {
                return JSONValue(std::stod(numStr));
            }
            return JSONValue(static_cast<int64_t>(std::stoll(numStr)));
        } catch (const std::out_of_range&) {
            // Integers beyond int64 degrade to double
            return JSONValue(std::strtod(numStr.c_str(), nullptr));
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }

    std::optional<JSONValue> ParseArray(int depth) {
        ++pos_;  // '['
        JSONValue::Array arr;

        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return JSONValue(std::move(arr));
        }

        while (true) {
            auto val = ParseValue(depth + 1);
            if (!val) return std::nullopt;
            arr.push_back(std::move(*val));

            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            char c = text_[pos_++];
            if (c == ']') return JSONValue(std::move(arr));
            if (c != ',') return std::nullopt;
        }
    }

    std::optional<JSONValue> ParseObject(int depth) {
        ++pos_;  // '{'
        JSONValue::Object obj;

        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return JSONValue(std::move(obj));
        }

        while (true) {
            SkipWhitespace();
            auto key = ParseString();
            if (!key) return std::nullopt;

            SkipWhitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') return std::nullopt;
            ++pos_;

            auto val = ParseValue(depth + 1);
            if (!val) return std::nullopt;
            obj[*key] = std::move(*val);

            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            char c = text_[pos_++];
            if (c == '}') return JSONValue(std::move(obj));
            if (c != ',') return std::nullopt;
        }
    }

    std::optional<JSONValue> ParseValue(int depth) {
        if (depth > MAX_JSON_DEPTH) return std::nullopt;

        SkipWhitespace();
        if (pos_ >= text_.size()) return std::nullopt;

        char c = text_[pos_];
        if (c == 'n') return Consume("null") ? std::optional<JSONValue>(JSONValue()) : std::nullopt;
        if (c == 't') return Consume("true") ? std::optional<JSONValue>(JSONValue(true)) : std::nullopt;
        if (c == 'f') return Consume("false") ? std::optional<JSONValue>(JSONValue(false)) : std::nullopt;
        if (c == '"') {
            auto str = ParseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '[') return ParseArray(depth);
        if (c == '{') return ParseObject(depth);
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return ParseNumber();

        return std::nullopt;
    }

    const std::string& text_;
    size_t pos_{0};
};

} // namespace

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw std::runtime_error("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    return JSONParser(json).ParseDocument();
}

// ============================================================================
// RPCRequest Implementation
// ============================================================================

RPCRequest::RPCRequest(const std::string& method, const JSONValue& params,
                       const JSONValue& id)
    : method_(method), params_(params), id_(id) {}

const JSONValue& RPCRequest::GetParam(size_t index) const {
    if (params_.IsArray()) {
        return params_[index];
    }
    return JSONValue::Null();
}

std::string RPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = "2.0";
    obj["method"] = method_;
    obj["params"] = params_.IsNull() ? JSONValue(JSONValue::Array{}) : params_;
    obj["id"] = id_;
    return JSONValue(std::move(obj)).ToJSON();
}

std::optional<RPCRequest> RPCRequest::Parse(const std::string& json) {
    auto parsed = JSONValue::TryParse(json);
    if (!parsed || !parsed->IsObject()) return std::nullopt;

    const auto& obj = *parsed;
    if (obj["jsonrpc"].GetString() != "2.0") return std::nullopt;
    if (!obj["method"].IsString()) return std::nullopt;

    return RPCRequest(obj["method"].GetString(), obj["params"], obj["id"]);
}

// ============================================================================
// RPCResponse Implementation
// ============================================================================

RPCResponse RPCResponse::Success(const JSONValue& result, const JSONValue& id) {
    RPCResponse resp;
    resp.isError_ = false;
    resp.result_ = result;
    resp.id_ = id;
    return resp;
}

RPCResponse RPCResponse::Error(int code, const std::string& message,
                               const JSONValue& id, const JSONValue& data) {
    RPCResponse resp;
    resp.isError_ = true;
    resp.errorCode_ = code;
    resp.errorMessage_ = message;
    resp.errorData_ = data;
    resp.id_ = id;
    return resp;
}

std::string RPCResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = "2.0";

    if (isError_) {
        JSONValue::Object error;
        error["code"] = errorCode_;
        error["message"] = errorMessage_;
        if (!errorData_.IsNull()) {
            error["data"] = errorData_;
        }
        obj["error"] = std::move(error);
    } else {
        obj["result"] = result_;
    }
    obj["id"] = id_;

    return JSONValue(std::move(obj)).ToJSON();
}

std::optional<RPCResponse> RPCResponse::Parse(const std::string& json) {
    auto parsed = JSONValue::TryParse(json);
    if (!parsed || !parsed->IsObject()) return std::nullopt;

    const auto& obj = *parsed;
    const JSONValue& error = obj["error"];
    if (!error.IsNull()) {
        if (!error.IsObject() || !error["code"].IsInt()) return std::nullopt;
        return Error(static_cast<int>(error["code"].GetInt()),
                     error["message"].GetString(), obj["id"], error["data"]);
    }

    // "result": null is a legitimate answer (absent storage item)
    if (!obj.HasKey("result")) return std::nullopt;
    return Success(obj["result"], obj["id"]);
}

} // namespace rpc
} // namespace refindex
