#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Largest prefix the sniffer reads by default; every signature fits inside it.
inline constexpr std::size_t kDefaultSniffWindow = 16 * 1024;

struct Signature {
    std::string pattern;       // raw bytes
    std::size_t offset = 0;    // where the pattern must start
    std::string ext;
    std::string mime;
};

struct SignatureMatch {
    const Signature* signature = nullptr;
    std::size_t specificity = 0;   // pattern length
};

// Immutable magic-number registry. Build it once and share it by const
// reference; concurrent reads need no locking.
class SignatureTable {
public:
    // Throws std::invalid_argument if a signature has an empty pattern or
    // does not fit inside `window` bytes.
    explicit SignatureTable(std::vector<Signature> signatures,
                            std::size_t window = kDefaultSniffWindow);

    // The fixed set of formats extcheck knows about.
    static SignatureTable builtin();

    // Signatures whose pattern appears at their offset in `prefix`, most
    // specific first; equal lengths keep declaration order. Signatures that
    // reach past the end of `prefix` are skipped.
    std::vector<SignatureMatch> match(std::string_view prefix) const;

    std::optional<std::string> mime_for(const std::string& ext) const;

    // Distinct extensions in declaration order.
    std::vector<std::string> extensions() const;

    // Bytes needed to evaluate every signature.
    std::size_t required_window() const { return required_window_; }
    std::size_t window() const { return window_; }

    const std::vector<Signature>& signatures() const { return signatures_; }

private:
    std::vector<Signature> signatures_;
    std::size_t window_ = 0;
    std::size_t required_window_ = 0;
};

} // namespace core
