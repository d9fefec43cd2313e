#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "detection_types.h"
#include "raw_file_source.h"
#include "signature_table.h"

namespace core {

inline constexpr double kSignatureConfidence = 1.0;
inline constexpr double kJsonConfidence      = 0.7;
inline constexpr double kHtmlConfidence      = 0.6;
inline constexpr double kTextConfidence      = 0.4;
// zip container whose format comes from the file's own extension
inline constexpr double kDeclaredZipConfidence = 0.8;

// Content sniffer: bytes -> DetectionResult.
// Classifier steps run in order (signature, json, html, text); the first one
// that returns a value wins, otherwise the result is "bin" at confidence 0.
class Sniffer {
public:
    using Classifier = std::function<std::optional<DetectionResult>(std::string_view)>;

    struct Step {
        std::string name;
        Classifier classify;
    };

    // `table` must outlive the sniffer. Throws std::invalid_argument when
    // `window` is too small for the table's signatures.
    explicit Sniffer(const SignatureTable& table, std::size_t window = kDefaultSniffWindow);
    Sniffer(const Sniffer&) = delete;
    Sniffer& operator=(const Sniffer&) = delete;

    // One bounded read from `src`, then classify() with src.extension().
    // Throws ReadError.
    DetectionResult detect(RawFileSource& src) const;

    // A generic zip result takes `declared_ext` when that names a zip-based
    // format (docx, odt, epub, ...) and the archive continues past the window,
    // so the window could not confirm or refute it.
    DetectionResult classify(std::string_view bytes, std::string_view declared_ext = {}) const;

    // Every extension classify() can produce.
    std::vector<std::string> known_extensions() const;

    const std::vector<Step>& steps() const { return steps_; }
    std::size_t window() const { return window_; }

private:
    std::optional<DetectionResult> by_signature_(std::string_view bytes) const;

    const SignatureTable& table_;
    std::size_t window_;
    std::vector<Step> steps_;
};

} // namespace core
