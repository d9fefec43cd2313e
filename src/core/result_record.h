#pragma once

#include <cstdint>
#include <string>

#include "detection_types.h"

namespace core {

// One report row. Column order of the CSV follows the field order.
struct ResultRecord {
    std::string path;
    std::uintmax_t size_bytes = 0;
    std::string current_ext;
    std::string detected_ext;
    std::string detected_mime;
    double confidence = 0.0;
    bool is_match = false;
    std::string action = "none";
    std::string new_path;
    std::string error;
    std::string reason;
};

ResultRecord build_record(const std::string& path,
                          std::uintmax_t size_bytes,
                          const std::string& current_ext,
                          const DetectionOutcome& outcome,
                          const FileVerdict& verdict);

// Row for a file whose processing failed outside the detection step
// (internal invariant, failed rename, ...).
ResultRecord build_error_record(const std::string& path,
                                std::uintmax_t size_bytes,
                                const std::string& current_ext,
                                const std::string& error,
                                const std::string& reason);

} // namespace core
