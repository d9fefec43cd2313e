#include "zip_probe.h"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace core {

namespace {

constexpr std::string_view kLocalHeader("PK\x03\x04", 4);
constexpr std::string_view kEndOfCentralDir("PK\x05\x06", 4);
constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kMaxMimetypeBytes = 200;

struct Known {
    const char* mimetype;   // content of the "mimetype" entry, or nullptr
    const char* ext;
    const char* mime;
};

const Known kOdf[] = {
    {"application/vnd.oasis.opendocument.text",         "odt",  "application/vnd.oasis.opendocument.text"},
    {"application/vnd.oasis.opendocument.spreadsheet",  "ods",  "application/vnd.oasis.opendocument.spreadsheet"},
    {"application/vnd.oasis.opendocument.presentation", "odp",  "application/vnd.oasis.opendocument.presentation"},
    {"application/epub+zip",                            "epub", "application/epub+zip"},
};

const Known kOoxmlDocx = {nullptr, "docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"};
const Known kOoxmlXlsx = {nullptr, "xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"};
const Known kOoxmlPptx = {nullptr, "pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"};
const Known kJar       = {nullptr, "jar",  "application/java-archive"};

std::uint16_t le16(std::string_view b, std::size_t at) {
    return (std::uint16_t)((unsigned char)b[at] | ((unsigned char)b[at + 1] << 8));
}

std::uint32_t le32(std::string_view b, std::size_t at) {
    return (std::uint32_t)(unsigned char)b[at] |
           ((std::uint32_t)(unsigned char)b[at + 1] << 8) |
           ((std::uint32_t)(unsigned char)b[at + 2] << 16) |
           ((std::uint32_t)(unsigned char)b[at + 3] << 24);
}

bool starts_with(std::string_view s, std::string_view p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\n' || s.front() == '\r' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\n' || s.back() == '\r' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

ZipSubtype to_subtype(const Known& k) {
    return ZipSubtype{k.ext, k.mime};
}

} // namespace

std::optional<ZipSubtype> probe_zip_subtype(std::string_view window) {
    bool word = false, xl = false, ppt = false, jar = false;

    std::size_t pos = window.find(kLocalHeader);
    while (pos != std::string_view::npos && pos + kLocalHeaderSize <= window.size()) {
        std::uint16_t method   = le16(window, pos + 8);
        std::uint32_t csize    = le32(window, pos + 18);
        std::uint16_t name_len = le16(window, pos + 26);
        std::uint16_t extra    = le16(window, pos + 28);

        std::size_t name_at = pos + kLocalHeaderSize;
        if (name_at + name_len > window.size()) break;
        std::string_view name = window.substr(name_at, name_len);

        if (name == "mimetype" && method == 0) {
            std::size_t data_at = name_at + name_len + extra;
            if (data_at < window.size()) {
                std::size_t n = std::min<std::size_t>({(std::size_t)csize, kMaxMimetypeBytes, window.size() - data_at});
                std::string_view value = trim(window.substr(data_at, n));
                for (const auto& k : kOdf) {
                    if (value == k.mimetype) return to_subtype(k);
                }
            }
        } else if (starts_with(name, "word/")) {
            word = true;
        } else if (starts_with(name, "xl/")) {
            xl = true;
        } else if (starts_with(name, "ppt/")) {
            ppt = true;
        } else if (name == "META-INF/MANIFEST.MF") {
            jar = true;
        }

        pos = window.find(kLocalHeader, name_at);
    }

    if (word) return to_subtype(kOoxmlDocx);
    if (xl)   return to_subtype(kOoxmlXlsx);
    if (ppt)  return to_subtype(kOoxmlPptx);
    if (jar)  return to_subtype(kJar);
    return std::nullopt;
}

bool zip_window_is_complete(std::string_view window) {
    return window.find(kEndOfCentralDir) != std::string_view::npos;
}

std::optional<ZipSubtype> zip_subtype_for_extension(std::string_view ext) {
    if (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);
    std::string lower(ext);
    for (char& c : lower) c = (char)std::tolower((unsigned char)c);

    for (const auto& k : kOdf) {
        if (lower == k.ext) return to_subtype(k);
    }
    for (const Known* k : {&kOoxmlDocx, &kOoxmlXlsx, &kOoxmlPptx, &kJar}) {
        if (lower == k->ext) return to_subtype(*k);
    }
    return std::nullopt;
}

std::vector<std::string> zip_subtype_extensions() {
    std::vector<std::string> out;
    for (const auto& k : kOdf) out.push_back(k.ext);
    out.push_back(kOoxmlDocx.ext);
    out.push_back(kOoxmlXlsx.ext);
    out.push_back(kOoxmlPptx.ext);
    out.push_back(kJar.ext);
    return out;
}

} // namespace core
