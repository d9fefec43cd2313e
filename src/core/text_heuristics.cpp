#include "text_heuristics.h"

#include <cctype>
#include <string>

namespace core::text {

namespace {

// Length of the UTF-8 sequence introduced by lead byte c, 0 if invalid.
std::size_t sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if (c >= 0xC2 && c <= 0xDF) return 2;
    if (c >= 0xE0 && c <= 0xEF) return 3;
    if (c >= 0xF0 && c <= 0xF4) return 4;
    return 0;
}

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool is_json_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // namespace

bool is_valid_utf8(std::string_view bytes, bool allow_truncated_tail) {
    const std::size_t n = bytes.size();
    std::size_t i = 0;
    while (i < n) {
        unsigned char c = (unsigned char)bytes[i];
        std::size_t len = sequence_length(c);
        if (len == 0) return false;
        if (len == 1) { ++i; continue; }

        if (i + len > n) {
            // Only continuation bytes may follow, up to the end of the buffer.
            if (!allow_truncated_tail) return false;
            for (std::size_t k = i + 1; k < n; ++k) {
                if (!is_continuation((unsigned char)bytes[k])) return false;
            }
            return true;
        }

        unsigned char c1 = (unsigned char)bytes[i + 1];
        if (!is_continuation(c1)) return false;
        // overlongs and surrogates are excluded by the second-byte range
        if (c == 0xE0 && c1 < 0xA0) return false;
        if (c == 0xED && c1 > 0x9F) return false;
        if (c == 0xF0 && c1 < 0x90) return false;
        if (c == 0xF4 && c1 > 0x8F) return false;

        for (std::size_t k = 2; k < len; ++k) {
            if (!is_continuation((unsigned char)bytes[i + k])) return false;
        }
        i += len;
    }
    return true;
}

double printable_ratio(std::string_view bytes) {
    std::size_t total = 0;
    std::size_t good = 0;

    std::size_t i = 0;
    while (i < bytes.size()) {
        unsigned char c = (unsigned char)bytes[i];
        std::size_t len = sequence_length(c);
        if (len == 0) len = 1;

        ++total;
        if (c >= 0x80) {
            ++good;
        } else if (std::isprint(c) || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            ++good;
        }
        i += len;
    }

    if (total == 0) return 0.0;
    return (double)good / (double)total;
}

std::string_view strip_bom(std::string_view bytes) {
    if (bytes.size() >= 3 && (unsigned char)bytes[0] == 0xEF &&
        (unsigned char)bytes[1] == 0xBB && (unsigned char)bytes[2] == 0xBF) {
        bytes.remove_prefix(3);
    }
    return bytes;
}

bool looks_like_json(std::string_view bytes) {
    std::string_view s = strip_bom(bytes);
    std::size_t i = 0;
    while (i < s.size() && is_json_ws(s[i])) ++i;
    if (i >= s.size()) return false;
    if (s[i] != '{' && s[i] != '[') return false;
    return is_valid_utf8(s);
}

bool looks_like_html(std::string_view bytes) {
    std::string_view head = strip_bom(bytes).substr(0, kHtmlScanBytes);
    if (head.find('\0') != std::string_view::npos) return false;

    std::string lower(head);
    for (char& c : lower) c = (char)std::tolower((unsigned char)c);

    static const char* const kMarkers[] = {"<!doctype html", "<html", "<head", "<body"};
    for (const char* m : kMarkers) {
        if (lower.find(m) != std::string::npos) return true;
    }
    return false;
}

bool looks_like_text(std::string_view bytes) {
    std::string_view s = strip_bom(bytes);
    if (s.empty()) return false;
    if (s.find('\0') != std::string_view::npos) return false;
    if (!is_valid_utf8(s)) return false;
    return printable_ratio(s) > kMinPrintableRatio;
}

} // namespace core::text
