#pragma once

#include <cstddef>
#include <string_view>

namespace core::text {

// Strict UTF-8 check (no overlongs, no surrogates, <= U+10FFFF).
// With allow_truncated_tail, a multi-byte sequence cut off by the end of the
// buffer is accepted: the buffer is usually a prefix of a longer file.
bool is_valid_utf8(std::string_view bytes, bool allow_truncated_tail = true);

// Share of code points that are printable or whitespace, in [0, 1].
// Assumes valid UTF-8; every non-ASCII code point counts as printable.
// Empty input -> 0.
double printable_ratio(std::string_view bytes);

// Drops a leading UTF-8 byte order mark.
std::string_view strip_bom(std::string_view bytes);

// After BOM and whitespace, starts with '{' or '[' and is valid UTF-8.
bool looks_like_json(std::string_view bytes);

// "<html", "<!doctype html", "<head" or "<body" (any case) in the first
// kHtmlScanBytes bytes, with no NUL byte in that range.
inline constexpr std::size_t kHtmlScanBytes = 1024;
bool looks_like_html(std::string_view bytes);

// Valid UTF-8, no NUL, printable_ratio > 0.95.
inline constexpr double kMinPrintableRatio = 0.95;
bool looks_like_text(std::string_view bytes);

} // namespace core::text
