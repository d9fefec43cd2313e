#include "decision_engine.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace core {

const char* action_name(Action a) {
    switch (a) {
        case Action::None:   return "none";
        case Action::Rename: return "rename";
        case Action::Error:  return "error";
    }
    return "none";
}

bool path_exists_on_disk(const std::string& path) {
    std::error_code ec;
    auto st = std::filesystem::symlink_status(path, ec);
    if (ec) {
        return ec != std::errc::no_such_file_or_directory;
    }
    return std::filesystem::exists(st);
}

DecisionEngine::DecisionEngine(const ExtensionNormalizer& normalizer,
                               const std::vector<std::string>& producible_exts)
    : normalizer_(normalizer) {
    auto missing = normalizer_.uncovered(producible_exts);
    if (!missing.empty()) {
        std::string list;
        for (const auto& m : missing) {
            if (!list.empty()) list += ", ";
            list += m;
        }
        throw std::invalid_argument("no extension family for: " + list);
    }
}

std::string DecisionEngine::resolve_target(const std::string& path,
                                           const std::string& new_ext,
                                           const PathExistsProbe& exists) {
    namespace fs = std::filesystem;

    fs::path p(path);
    fs::path dir = p.parent_path();
    std::string stem = p.stem().string();
    std::string suffix = new_ext.empty() ? std::string() : "." + new_ext;

    auto candidate = [&](std::size_t k) {
        std::string name = (k == 0) ? stem + suffix : stem + "_" + std::to_string(k) + suffix;
        return (dir / name).string();
    };

    for (std::size_t k = 0; k <= kMaxCollisionSuffix; ++k) {
        std::string c = candidate(k);
        if (!exists(c)) return c;
    }
    return {};
}

FileVerdict DecisionEngine::decide(const std::string& path,
                                   const std::string& current_ext,
                                   const DetectionOutcome& outcome,
                                   bool rename_enabled,
                                   const PathExistsProbe& exists) const {
    FileVerdict v;

    if (outcome.read_error.has_value() || !outcome.detection.has_value()) {
        v.is_match = false;
        v.action = Action::Error;
        v.reason = reason::kUnreadable;
        return v;
    }

    const DetectionResult& det = *outcome.detection;

    if (det.detected_ext == kBinaryExt && det.confidence <= 0.0) {
        v.is_match = true;
        v.action = Action::None;
        v.reason = reason::kInconclusive;
        return v;
    }

    FamilyId detected = normalizer_.family_of(det.detected_ext);
    if (!normalizer_.is_known(detected)) {
        throw InvariantError("detected extension '" + det.detected_ext + "' has no extension family");
    }
    FamilyId current = normalizer_.family_of(current_ext);

    if (current == detected) {
        v.is_match = true;
        v.action = Action::None;
        v.reason = reason::kMatch;
        return v;
    }

    v.is_match = false;
    if (!rename_enabled) {
        v.action = Action::None;
        v.reason = reason::kReportOnly;
        return v;
    }

    // is_known() was checked above
    std::string target = resolve_target(path, *normalizer_.canonical_ext(detected), exists);
    if (target.empty()) {
        v.action = Action::Error;
        v.reason = reason::kNoFreeName;
        v.error = "no free name after " + std::to_string(kMaxCollisionSuffix) + " candidates";
        return v;
    }

    v.action = Action::Rename;
    v.reason = reason::kMismatch;
    v.new_path = std::move(target);
    return v;
}

} // namespace core
