#include "extension_normalizer.h"

#include <cctype>
#include <stdexcept>

namespace core {

ExtensionNormalizer::ExtensionNormalizer(const std::vector<ExtensionFamily>& families) {
    for (const auto& f : families) {
        FamilyId id = normalize(f.canonical);
        if (id.empty()) {
            throw std::invalid_argument("extension family without canonical extension");
        }
        canonical_[id] = id;

        auto claim = [&](const std::string& raw) {
            std::string ext = normalize(raw);
            auto [it, inserted] = by_ext_.emplace(ext, id);
            if (!inserted && it->second != id) {
                throw std::invalid_argument("extension '" + ext + "' belongs to both '" +
                                            it->second + "' and '" + id + "'");
            }
        };
        claim(f.canonical);
        for (const auto& a : f.aliases) claim(a);
    }
}

ExtensionNormalizer ExtensionNormalizer::builtin() {
    return ExtensionNormalizer({
        {"jpg",  {"jpeg", "jpe", "jfif"}},
        {"png",  {}},
        {"gif",  {}},
        {"tiff", {"tif"}},
        {"webp", {}},
        {"pdf",  {}},
        {"wav",  {"wave"}},
        {"avi",  {}},
        {"mp4",  {"m4v"}},
        {"m4a",  {}},
        {"mov",  {"qt"}},
        {"3gp",  {"3gpp"}},
        {"heic", {"heif"}},
        {"avif", {}},
        {"mp3",  {}},
        {"7z",   {}},
        {"rar",  {}},
        {"gz",   {"gzip", "tgz"}},
        {"bz2",  {"bz", "tbz", "tbz2"}},
        {"xz",   {"txz"}},
        {"zip",  {}},
        {"docx", {}},
        {"xlsx", {}},
        {"pptx", {}},
        {"odt",  {}},
        {"ods",  {}},
        {"odp",  {}},
        {"epub", {}},
        {"jar",  {}},
        {"json", {}},
        {"html", {"htm", "xhtml"}},
        {"txt",  {"text"}},
        {"bin",  {}},
    });
}

std::string ExtensionNormalizer::normalize(std::string_view ext) {
    if (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);
    std::string out(ext);
    for (char& c : out) c = (char)std::tolower((unsigned char)c);
    return out;
}

FamilyId ExtensionNormalizer::family_of(std::string_view ext) const {
    std::string e = normalize(ext);
    auto it = by_ext_.find(e);
    if (it != by_ext_.end()) return it->second;
    return kUnknownFamilyPrefix + e;
}

bool ExtensionNormalizer::is_known(const FamilyId& family) const {
    return canonical_.find(family) != canonical_.end();
}

std::optional<std::string> ExtensionNormalizer::canonical_ext(const FamilyId& family) const {
    auto it = canonical_.find(family);
    if (it == canonical_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> ExtensionNormalizer::uncovered(const std::vector<std::string>& exts) const {
    std::vector<std::string> out;
    for (const auto& e : exts) {
        if (by_ext_.find(normalize(e)) == by_ext_.end()) out.push_back(e);
    }
    return out;
}

} // namespace core
