#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace core {

inline constexpr const char* kBinaryExt  = "bin";
inline constexpr const char* kBinaryMime = "application/octet-stream";

// File could not be opened or read. Recorded per file, never fatal to a scan.
class ReadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Internal inconsistency (e.g. a detected extension with no family).
// Fatal for the file being processed only.
class InvariantError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

struct DetectionResult {
    std::string detected_ext;
    std::string detected_mime;
    double confidence = 0.0;     // [0, 1]
    std::string basis;           // "signature:png", "heuristic:json", "fallback", ...
};

// What the sniffer produced for one file: a result, or the read error.
struct DetectionOutcome {
    std::optional<DetectionResult> detection;
    std::optional<std::string> read_error;

    static DetectionOutcome ok(DetectionResult r) {
        DetectionOutcome o;
        o.detection = std::move(r);
        return o;
    }
    static DetectionOutcome failed(std::string message) {
        DetectionOutcome o;
        o.read_error = std::move(message);
        return o;
    }
};

enum class Action {
    None,
    Rename,
    Error,
};

const char* action_name(Action a);

struct FileVerdict {
    bool is_match = false;
    Action action = Action::None;
    std::string reason;                  // "match", "inconclusive", "mismatch", ...
    std::optional<std::string> new_path; // set only when action == Rename
    std::string error;                   // why, when action == Error without a read error
};

} // namespace core
