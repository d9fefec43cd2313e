#pragma once

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

// Reader for flat JSON objects such as params.json:
//   {"input": "downloads", "rename": true, "threads": 8}
// Nested objects and arrays are rejected.
namespace utils::json_min {

struct Object {
    // Strings are stored decoded (without quotes).
    // Numbers / true / false / null are stored as the raw token ("8", "true").
    std::unordered_map<std::string, std::string> kv;
};

inline void skip_ws(std::string_view s, size_t& i) {
    while (i < s.size() && std::isspace((unsigned char)s[i])) ++i;
}

inline bool consume(std::string_view s, size_t& i, char ch) {
    skip_ws(s, i);
    if (i < s.size() && s[i] == ch) { ++i; return true; }
    return false;
}

inline void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

// Four hex digits of a \u escape.
inline bool parse_hex4(std::string_view s, size_t& i, unsigned& cp) {
    if (i + 4 > s.size()) return false;
    cp = 0;
    for (int k = 0; k < 4; ++k) {
        char h = s[i++];
        cp <<= 4;
        if (h >= '0' && h <= '9') cp |= (unsigned)(h - '0');
        else if (h >= 'a' && h <= 'f') cp |= (unsigned)(h - 'a' + 10);
        else if (h >= 'A' && h <= 'F') cp |= (unsigned)(h - 'A' + 10);
        else return false;
    }
    return true;
}

inline std::optional<std::string> parse_string(std::string_view s, size_t& i) {
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '"') return std::nullopt;
    ++i;
    std::string out;
    while (i < s.size()) {
        char c = s[i++];
        if (c == '"') return out;
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (i >= s.size()) return std::nullopt;
        char e = s[i++];
        switch (e) {
            case '"':  out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/'); break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'u': {
                unsigned cp = 0;
                if (!parse_hex4(s, i, cp)) return std::nullopt;
                if (cp >= 0xDC00 && cp <= 0xDFFF) return std::nullopt;   // lone low surrogate
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    // high surrogate: must be followed by \uDC00..\uDFFF
                    unsigned lo = 0;
                    if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') return std::nullopt;
                    i += 2;
                    if (!parse_hex4(s, i, lo) || lo < 0xDC00 || lo > 0xDFFF) return std::nullopt;
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                }
                append_utf8(out, cp);
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return std::nullopt;
}

// number / true / false / null
inline std::optional<std::string> parse_token(std::string_view s, size_t& i) {
    skip_ws(s, i);
    if (i >= s.size()) return std::nullopt;
    if (s[i] == '{' || s[i] == '[') return std::nullopt;

    size_t start = i;
    while (i < s.size()) {
        char c = s[i];
        if (std::isspace((unsigned char)c) || c == ',' || c == '}') break;
        ++i;
    }
    if (i == start) return std::nullopt;
    return std::string(s.substr(start, i - start));
}

inline bool parse_object(std::string_view s, Object& out, std::string* err = nullptr) {
    size_t i = 0;
    // UTF-8 BOM
    if (s.size() >= 3 && (unsigned char)s[0] == 0xEF && (unsigned char)s[1] == 0xBB &&
        (unsigned char)s[2] == 0xBF) {
        i = 3;
    }
    if (!consume(s, i, '{')) {
        if (err) *err = "expected {";
        return false;
    }

    if (consume(s, i, '}')) {
        return true;
    }

    while (i < s.size()) {
        auto k = parse_string(s, i);
        if (!k.has_value()) {
            if (err) *err = "expected string key";
            return false;
        }

        if (!consume(s, i, ':')) {
            if (err) *err = "expected :";
            return false;
        }

        skip_ws(s, i);
        std::optional<std::string> val;
        if (i < s.size() && s[i] == '"') {
            val = parse_string(s, i);
            if (!val.has_value()) {
                if (err) *err = "bad string value for key '" + *k + "'";
                return false;
            }
        } else {
            val = parse_token(s, i);
            if (!val.has_value()) {
                if (err) *err = "unsupported value for key '" + *k + "'";
                return false;
            }
        }

        out.kv[*k] = std::move(*val);

        if (consume(s, i, '}')) {
            skip_ws(s, i);
            if (i != s.size()) {
                if (err) *err = "trailing data after object";
                return false;
            }
            return true;
        }
        if (!consume(s, i, ',')) {
            if (err) *err = "expected , or }";
            return false;
        }
    }

    if (err) *err = "unexpected end";
    return false;
}

} // namespace utils::json_min
