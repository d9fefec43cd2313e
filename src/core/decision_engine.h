#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "detection_types.h"
#include "extension_normalizer.h"

namespace core {

// Answers "is there already a file at this path?". Injected so the engine
// stays a pure function of its inputs.
using PathExistsProbe = std::function<bool(const std::string&)>;

// Probe backed by std::filesystem (errors count as "exists").
bool path_exists_on_disk(const std::string& path);

namespace reason {
inline constexpr const char* kUnreadable   = "unreadable";
inline constexpr const char* kInconclusive = "inconclusive";
inline constexpr const char* kMatch        = "match";
inline constexpr const char* kReportOnly   = "mismatch-report-only";
inline constexpr const char* kMismatch     = "mismatch";
inline constexpr const char* kNoFreeName   = "no-free-name";
} // namespace reason

// Turns (current extension, detection) into a FileVerdict.
//
// Rules, first hit wins:
//   1. read error                      -> error,  is_match=false, "unreadable"
//   2. "bin" at confidence 0           -> none,   is_match=true,  "inconclusive"
//   3. same family                     -> none,   is_match=true,  "match"
//   4. different family, no rename     -> none,   is_match=false, "mismatch-report-only"
//   5. different family, rename        -> rename, is_match=false, "mismatch",
//      new_path = <dir>/<stem>.<canonical>, or <stem>_1, <stem>_2, ... when taken
class DecisionEngine {
public:
    static constexpr std::size_t kMaxCollisionSuffix = 100000;

    // Throws std::invalid_argument if any of `producible_exts` (what the
    // sniffer can emit) has no family in `normalizer`.
    DecisionEngine(const ExtensionNormalizer& normalizer,
                   const std::vector<std::string>& producible_exts);

    // Throws InvariantError when the detected extension has no family;
    // every other input maps to a verdict.
    FileVerdict decide(const std::string& path,
                       const std::string& current_ext,
                       const DetectionOutcome& outcome,
                       bool rename_enabled,
                       const PathExistsProbe& exists) const;

    // First free "<dir>/<stem>[_k].<ext>" for `path`, probing `exists`.
    // Empty when kMaxCollisionSuffix candidates are all taken.
    static std::string resolve_target(const std::string& path,
                                      const std::string& new_ext,
                                      const PathExistsProbe& exists);

private:
    const ExtensionNormalizer& normalizer_;
};

} // namespace core
