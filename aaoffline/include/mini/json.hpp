#pragma once
// Small JSON helper for configs and case data.
// Objects are unordered; dump() emits keys sorted so output is stable.
// Numbers keep their source text in `str` so they round-trip exactly.

#include <algorithm>
#include <string>
#include <unordered_map>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace mini {

struct Value;
using Object = std::unordered_map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
    enum class Type { String, Number, Bool, Null, Object, Array } type{Type::Null};
    std::string str; // string value, or the literal text of a number
    int64_t number{0};
    bool boolean{false};
    Object object;
    Array array;

    bool isString() const { return type == Type::String; }
    bool isObject() const { return type == Type::Object; }
    bool isArray() const { return type == Type::Array; }
    bool isNumber() const { return type == Type::Number; }
    bool isBool() const { return type == Type::Bool; }
    bool isNull() const { return type == Type::Null; }

    static Value makeString(std::string s) {
        Value v;
        v.type = Type::String;
        v.str = std::move(s);
        return v;
    }
    static Value makeNumber(int64_t n) {
        Value v;
        v.type = Type::Number;
        v.number = n;
        v.str = std::to_string(n);
        return v;
    }
    static Value makeBool(bool b) {
        Value v;
        v.type = Type::Bool;
        v.boolean = b;
        return v;
    }
};

inline void skip_ws(const std::string& s, size_t& i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
}

inline void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline bool parse_hex4(const std::string& s, size_t& i, uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
        char c = s[i++];
        out <<= 4;
        if (c >= '0' && c <= '9') out |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
        else return false;
    }
    return true;
}

inline bool parse_string(const std::string& s, size_t& i, std::string& out) {
    if (i >= s.size() || s[i] != '"') return false;
    i++; out.clear();
    while (i < s.size()) {
        char c = s[i++];
        if (c == '\\' && i < s.size()) {
            char esc = s[i++];
            switch (esc) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!parse_hex4(s, i, cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                        size_t save = i;
                        i += 2;
                        uint32_t low = 0;
                        if (parse_hex4(s, i, low) && low >= 0xDC00 && low <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            i = save;
                        }
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: out.push_back(esc); break;
            }
        } else if (c == '"') {
            return true;
        } else {
            out.push_back(c);
        }
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out); // fwd
inline bool parse_array(const std::string& s, size_t& i, Array& out);

inline bool parse_value(const std::string& s, size_t& i, Value& out) {
    skip_ws(s, i);
    if (i >= s.size()) return false;
    if (s[i] == '"') {
        out.type = Value::Type::String;
        return parse_string(s, i, out.str);
    }
    if (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '-') {
        size_t start = i;
        while (i < s.size()) {
            char c = s[i];
            if (std::isdigit(static_cast<unsigned char>(c)) || c=='-' || c=='+' || c=='.' || c=='e' || c=='E') {
                i++;
            } else break;
        }
        out.type = Value::Type::Number;
        out.str = s.substr(start, i - start);
        out.number = std::strtoll(out.str.c_str(), nullptr, 10);
        return true;
    }
    if (s.compare(i, 4, "true") == 0) {
        out.type = Value::Type::Bool; out.boolean = true; i += 4; return true;
    }
    if (s.compare(i, 5, "false") == 0) {
        out.type = Value::Type::Bool; out.boolean = false; i += 5; return true;
    }
    if (s.compare(i, 4, "null") == 0) {
        out.type = Value::Type::Null; i += 4; return true;
    }
    if (s[i] == '{') {
        out.type = Value::Type::Object;
        return parse_object(s, i, out.object);
    }
    if (s[i] == '[') {
        out.type = Value::Type::Array;
        return parse_array(s, i, out.array);
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out) {
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '{') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != '}') {
        std::string key;
        if (!parse_string(s, i, key)) return false;
        skip_ws(s, i);
        if (i >= s.size() || s[i] != ':') return false;
        i++;
        Value v;
        if (!parse_value(s, i, v)) return false;
        out[key] = std::move(v);
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') { i++; skip_ws(s, i); }
    }
    if (i < s.size() && s[i] == '}') { i++; return true; }
    return false;
}

inline bool parse_array(const std::string& s, size_t& i, Array& out) {
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '[') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != ']') {
        Value v;
        if (!parse_value(s, i, v)) return false;
        out.push_back(std::move(v));
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') { i++; skip_ws(s, i); }
    }
    if (i < s.size() && s[i] == ']') { i++; return true; }
    return false;
}

inline bool parse(const std::string& s, Object& out) {
    size_t i = 0;
    return parse_object(s, i, out);
}

inline bool parse(const std::string& s, Array& out) {
    size_t i = 0;
    return parse_array(s, i, out);
}

inline bool parse(const std::string& s, Value& out) {
    size_t i = 0;
    if (!parse_value(s, i, out)) return false;
    skip_ws(s, i);
    return i == s.size();
}

inline void dump_string(const std::string& in, std::string& out) {
    static const char* hex = "0123456789abcdef";
    out.push_back('"');
    unsigned char prev = 0;
    for (unsigned char c : in) {
        // "</" would close an enclosing <script> element.
        if (c == '/' && prev == '<') {
            out += "\\/";
            prev = c;
            continue;
        }
        prev = c;
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0xF]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back('"');
}

inline void dump_value(const Value& v, std::string& out) {
    switch (v.type) {
        case Value::Type::String: dump_string(v.str, out); break;
        case Value::Type::Number: out += v.str.empty() ? std::to_string(v.number) : v.str; break;
        case Value::Type::Bool: out += v.boolean ? "true" : "false"; break;
        case Value::Type::Null: out += "null"; break;
        case Value::Type::Array: {
            out.push_back('[');
            for (size_t k = 0; k < v.array.size(); ++k) {
                if (k) out.push_back(',');
                dump_value(v.array[k], out);
            }
            out.push_back(']');
            break;
        }
        case Value::Type::Object: {
            std::vector<const std::string*> keys;
            keys.reserve(v.object.size());
            for (const auto& kv : v.object) keys.push_back(&kv.first);
            std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });
            out.push_back('{');
            bool first = true;
            for (const auto* k : keys) {
                if (!first) out.push_back(',');
                first = false;
                dump_string(*k, out);
                out.push_back(':');
                dump_value(v.object.at(*k), out);
            }
            out.push_back('}');
            break;
        }
    }
}

inline std::string dump(const Value& v) {
    std::string out;
    dump_value(v, out);
    return out;
}

// Member lookup; nullptr when v is not an object or lacks the key.
inline const Value* get(const Value& v, const std::string& key) {
    if (v.type != Value::Type::Object) return nullptr;
    auto it = v.object.find(key);
    return it == v.object.end() ? nullptr : &it->second;
}

inline std::string getString(const Value& v, const std::string& key, const std::string& fallback = "") {
    const Value* m = get(v, key);
    return (m && m->type == Value::Type::String) ? m->str : fallback;
}

inline bool getBool(const Value& v, const std::string& key, bool fallback = false) {
    const Value* m = get(v, key);
    if (!m) return fallback;
    if (m->type == Value::Type::Bool) return m->boolean;
    if (m->type == Value::Type::Number) return m->number != 0;
    return fallback;
}

// RFC 6901 pointer segments ("~1" is "/", "~0" is "~").
inline std::string escape_pointer_token(const std::string& token) {
    std::string out;
    for (char c : token) {
        if (c == '~') out += "~0";
        else if (c == '/') out += "~1";
        else out.push_back(c);
    }
    return out;
}

inline Value* pointer(Value& root, const std::string& ptr) {
    if (ptr.empty()) return &root;
    if (ptr[0] != '/') return nullptr;
    Value* cur = &root;
    size_t pos = 1;
    while (cur) {
        size_t next = ptr.find('/', pos);
        std::string raw = ptr.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        std::string token;
        for (size_t k = 0; k < raw.size(); ++k) {
            if (raw[k] == '~' && k + 1 < raw.size()) {
                token.push_back(raw[k + 1] == '1' ? '/' : '~');
                ++k;
            } else {
                token.push_back(raw[k]);
            }
        }
        if (cur->type == Value::Type::Object) {
            auto it = cur->object.find(token);
            cur = it == cur->object.end() ? nullptr : &it->second;
        } else if (cur->type == Value::Type::Array) {
            if (token.empty() || !std::all_of(token.begin(), token.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); })) return nullptr;
            size_t idx = static_cast<size_t>(std::strtoull(token.c_str(), nullptr, 10));
            cur = idx < cur->array.size() ? &cur->array[idx] : nullptr;
        } else {
            return nullptr;
        }
        if (next == std::string::npos) break;
        pos = next + 1;
    }
    return cur;
}

} // namespace mini
