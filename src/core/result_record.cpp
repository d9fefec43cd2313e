#include "result_record.h"

#include "extension_normalizer.h"

namespace core {

ResultRecord build_record(const std::string& path,
                          std::uintmax_t size_bytes,
                          const std::string& current_ext,
                          const DetectionOutcome& outcome,
                          const FileVerdict& verdict) {
    ResultRecord r;
    r.path = path;
    r.size_bytes = size_bytes;
    r.current_ext = ExtensionNormalizer::normalize(current_ext);

    if (outcome.detection.has_value()) {
        r.detected_ext = outcome.detection->detected_ext;
        r.detected_mime = outcome.detection->detected_mime;
        r.confidence = outcome.detection->confidence;
    }
    if (outcome.read_error.has_value()) {
        r.error = *outcome.read_error;
    } else if (verdict.action == Action::Error) {
        r.error = verdict.error.empty() ? std::string(verdict.reason) : verdict.error;
    }

    r.is_match = verdict.is_match;
    r.action = action_name(verdict.action);
    r.new_path = verdict.new_path.value_or("");
    r.reason = verdict.reason;
    return r;
}

ResultRecord build_error_record(const std::string& path,
                                std::uintmax_t size_bytes,
                                const std::string& current_ext,
                                const std::string& error,
                                const std::string& reason) {
    ResultRecord r;
    r.path = path;
    r.size_bytes = size_bytes;
    r.current_ext = ExtensionNormalizer::normalize(current_ext);
    r.is_match = false;
    r.action = action_name(Action::Error);
    r.error = error;
    r.reason = reason;
    return r;
}

} // namespace core
