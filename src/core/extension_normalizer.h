#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// Family id == the family's canonical extension ("jpg"), or
// "unknown-<ext>" for extensions no family claims.
using FamilyId = std::string;

inline constexpr const char* kUnknownFamilyPrefix = "unknown-";

struct ExtensionFamily {
    std::string canonical;              // extension used when renaming into the family
    std::vector<std::string> aliases;   // other spellings of the same format
};

// Maps extensions onto families of interchangeable spellings (jpg/jpeg).
// Immutable after construction.
class ExtensionNormalizer {
public:
    // Throws std::invalid_argument if two families claim the same extension.
    explicit ExtensionNormalizer(const std::vector<ExtensionFamily>& families);

    static ExtensionNormalizer builtin();

    // Case-insensitive, leading dot ignored. Never fails: unknown extensions
    // get their own "unknown-<ext>" family.
    FamilyId family_of(std::string_view ext) const;

    bool is_known(const FamilyId& family) const;

    // Canonical extension of a known family.
    std::optional<std::string> canonical_ext(const FamilyId& family) const;

    // Entries of `exts` that no family claims.
    std::vector<std::string> uncovered(const std::vector<std::string>& exts) const;

    // "JPG" -> "jpg", ".Tar" -> "tar"
    static std::string normalize(std::string_view ext);

private:
    std::unordered_map<std::string, FamilyId> by_ext_;
    std::unordered_map<FamilyId, std::string> canonical_;
};

} // namespace core
