#include "signature_table.h"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace core {

namespace {

// String literal -> byte pattern, keeping embedded NULs.
template <std::size_t N>
Signature sig(const char (&bytes)[N], std::size_t offset, const char* ext, const char* mime) {
    return Signature{std::string(bytes, N - 1), offset, ext, mime};
}

} // namespace

SignatureTable::SignatureTable(std::vector<Signature> signatures, std::size_t window)
    : signatures_(std::move(signatures)), window_(window) {
    for (const auto& s : signatures_) {
        if (s.pattern.empty()) {
            throw std::invalid_argument("signature for '" + s.ext + "' has an empty pattern");
        }
        if (s.ext.empty()) {
            throw std::invalid_argument("signature without extension");
        }
        std::size_t end = s.offset + s.pattern.size();
        if (end > window_) {
            throw std::invalid_argument("signature for '" + s.ext + "' ends at byte " +
                                        std::to_string(end) + ", past the " +
                                        std::to_string(window_) + "-byte sniff window");
        }
        required_window_ = std::max(required_window_, end);
    }
}

SignatureTable SignatureTable::builtin() {
    std::vector<Signature> t;
    t.reserve(48);

    // documents
    t.push_back(sig("%PDF-", 0, "pdf", "application/pdf"));

    // images
    t.push_back(sig("\xFF\xD8\xFF", 0, "jpg", "image/jpeg"));
    t.push_back(sig("\x89PNG\r\n\x1a\n", 0, "png", "image/png"));
    t.push_back(sig("GIF87a", 0, "gif", "image/gif"));
    t.push_back(sig("GIF89a", 0, "gif", "image/gif"));
    t.push_back(sig("II*\x00", 0, "tiff", "image/tiff"));
    t.push_back(sig("MM\x00*", 0, "tiff", "image/tiff"));

    // RIFF containers: the form type sits after "RIFF" + 4-byte length
    t.push_back(sig("WEBP", 8, "webp", "image/webp"));
    t.push_back(sig("WAVE", 8, "wav", "audio/wav"));
    t.push_back(sig("AVI ", 8, "avi", "video/x-msvideo"));

    // ISO base media: box size, "ftyp", then the major brand at offset 8.
    // Brands not listed here fall through to the heuristics.
    for (const auto& b : {"isom", "iso2", "mp41", "mp42", "avc1", "M4V ", "dash"}) {
        t.push_back(Signature{std::string("ftyp") + b, 4, "mp4", "video/mp4"});
    }
    t.push_back(sig("ftypM4A ", 4, "m4a", "audio/mp4"));
    t.push_back(sig("ftypqt  ", 4, "mov", "video/quicktime"));
    t.push_back(sig("ftyp3gp4", 4, "3gp", "video/3gpp"));
    t.push_back(sig("ftyp3gp5", 4, "3gp", "video/3gpp"));
    t.push_back(sig("ftypheic", 4, "heic", "image/heic"));
    t.push_back(sig("ftypheix", 4, "heic", "image/heic"));
    t.push_back(sig("ftypavif", 4, "avif", "image/avif"));

    // mp3: ID3v2 tag or a bare MPEG audio frame header
    t.push_back(sig("ID3", 0, "mp3", "audio/mpeg"));
    t.push_back(sig("\xFF\xFB", 0, "mp3", "audio/mpeg"));
    t.push_back(sig("\xFF\xFA", 0, "mp3", "audio/mpeg"));
    t.push_back(sig("\xFF\xF3", 0, "mp3", "audio/mpeg"));
    t.push_back(sig("\xFF\xF2", 0, "mp3", "audio/mpeg"));

    // archives / compressors
    t.push_back(sig("7z\xBC\xAF\x27\x1C", 0, "7z", "application/x-7z-compressed"));
    t.push_back(sig("Rar!\x1A\x07\x01\x00", 0, "rar", "application/vnd.rar"));
    t.push_back(sig("Rar!\x1A\x07\x00", 0, "rar", "application/vnd.rar"));
    t.push_back(sig("\x1F\x8B\x08", 0, "gz", "application/gzip"));
    t.push_back(sig("BZh", 0, "bz2", "application/x-bzip2"));
    t.push_back(sig("\xFD" "7zXZ\x00", 0, "xz", "application/x-xz"));

    // zip and everything built on it (docx, odt, epub, jar, ...)
    t.push_back(sig("PK\x03\x04", 0, "zip", "application/zip"));
    t.push_back(sig("PK\x05\x06", 0, "zip", "application/zip"));
    t.push_back(sig("PK\x07\x08", 0, "zip", "application/zip"));

    return SignatureTable(std::move(t));
}

std::vector<SignatureMatch> SignatureTable::match(std::string_view prefix) const {
    std::vector<SignatureMatch> out;

    for (const auto& s : signatures_) {
        if (s.offset + s.pattern.size() > prefix.size()) continue;
        if (prefix.compare(s.offset, s.pattern.size(), s.pattern) != 0) continue;
        out.push_back(SignatureMatch{&s, s.pattern.size()});
    }

    std::stable_sort(out.begin(), out.end(), [](const SignatureMatch& a, const SignatureMatch& b) {
        return a.specificity > b.specificity;
    });
    return out;
}

std::optional<std::string> SignatureTable::mime_for(const std::string& ext) const {
    for (const auto& s : signatures_) {
        if (s.ext == ext) return s.mime;
    }
    return std::nullopt;
}

std::vector<std::string> SignatureTable::extensions() const {
    std::vector<std::string> out;
    for (const auto& s : signatures_) {
        if (std::find(out.begin(), out.end(), s.ext) == out.end()) {
            out.push_back(s.ext);
        }
    }
    return out;
}

} // namespace core
