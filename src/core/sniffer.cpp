#include "sniffer.h"

#include <algorithm>
#include <stdexcept>

#include "text_heuristics.h"
#include "zip_probe.h"

namespace core {

namespace {

DetectionResult make_result(std::string ext, std::string mime, double confidence, std::string basis) {
    DetectionResult r;
    r.detected_ext = std::move(ext);
    r.detected_mime = std::move(mime);
    r.confidence = std::clamp(confidence, 0.0, 1.0);
    r.basis = std::move(basis);
    return r;
}

std::optional<DetectionResult> by_json(std::string_view bytes) {
    if (!text::looks_like_json(bytes)) return std::nullopt;
    return make_result("json", "application/json", kJsonConfidence, "heuristic:json");
}

std::optional<DetectionResult> by_html(std::string_view bytes) {
    if (!text::looks_like_html(bytes)) return std::nullopt;
    return make_result("html", "text/html", kHtmlConfidence, "heuristic:html");
}

std::optional<DetectionResult> by_text(std::string_view bytes) {
    if (!text::looks_like_text(bytes)) return std::nullopt;
    return make_result("txt", "text/plain", kTextConfidence, "heuristic:text");
}

} // namespace

Sniffer::Sniffer(const SignatureTable& table, std::size_t window)
    : table_(table), window_(window) {
    if (window_ < table_.required_window()) {
        throw std::invalid_argument("sniff window of " + std::to_string(window_) +
                                    " bytes is smaller than the " +
                                    std::to_string(table_.required_window()) +
                                    " bytes the signature table needs");
    }

    steps_.push_back({"signature", [this](std::string_view b) { return by_signature_(b); }});
    steps_.push_back({"json", by_json});
    steps_.push_back({"html", by_html});
    steps_.push_back({"text", by_text});
}

std::optional<DetectionResult> Sniffer::by_signature_(std::string_view bytes) const {
    auto matches = table_.match(bytes);
    if (matches.empty()) return std::nullopt;

    const Signature& best = *matches.front().signature;
    if (best.ext == "zip") {
        if (auto sub = probe_zip_subtype(bytes); sub.has_value()) {
            return make_result(sub->ext, sub->mime, kSignatureConfidence, "zip:" + sub->ext);
        }
    }
    return make_result(best.ext, best.mime, kSignatureConfidence, "signature:" + best.ext);
}

DetectionResult Sniffer::classify(std::string_view bytes, std::string_view declared_ext) const {
    if (bytes.size() > window_) bytes = bytes.substr(0, window_);

    for (const auto& step : steps_) {
        auto r = step.classify(bytes);
        if (!r.has_value()) continue;

        if (r->detected_ext == "zip" && !zip_window_is_complete(bytes)) {
            if (auto sub = zip_subtype_for_extension(declared_ext); sub.has_value()) {
                return make_result(sub->ext, sub->mime, kDeclaredZipConfidence,
                                   "zip+extension:" + sub->ext);
            }
        }
        return *r;
    }
    return make_result(kBinaryExt, kBinaryMime, 0.0, "fallback");
}

DetectionResult Sniffer::detect(RawFileSource& src) const {
    std::string prefix = src.read_prefix(window_);
    return classify(prefix, src.extension());
}

std::vector<std::string> Sniffer::known_extensions() const {
    std::vector<std::string> out = table_.extensions();
    for (auto& e : zip_subtype_extensions()) out.push_back(std::move(e));
    for (const char* e : {"json", "html", "txt", kBinaryExt}) out.emplace_back(e);
    return out;
}

} // namespace core
