#include "scan_pipeline.h"

#include <algorithm>
#include <future>
#include <sstream>

#include "concurrency/thread_pool.h"
#include "safe_move.h"
#include "utils/logging.h"
#include "utils/time_utils.h"

namespace core {

namespace {

std::string describe(const DetectionResult& d) {
    std::ostringstream oss;
    oss << d.detected_ext << " (" << d.basis << ", confidence=" << d.confidence << ")";
    return oss.str();
}

} // namespace

ScanPipeline::ScanPipeline(const Sniffer& sniffer, const DecisionEngine& engine)
    : sniffer_(sniffer),
      engine_(engine),
      make_source_([](const FileInfo& fi) { return std::make_unique<FsFileSource>(fi.path); }),
      exists_(path_exists_on_disk),
      move_(move_no_replace) {}

DetectionOutcome ScanPipeline::detect_(const FileInfo& file) const {
    try {
        auto src = make_source_(file);
        return DetectionOutcome::ok(sniffer_.detect(*src));
    } catch (const ReadError& e) {
        return DetectionOutcome::failed(e.what());
    }
}

ResultRecord ScanPipeline::finish_(const FileInfo& file,
                                   const DetectionOutcome& outcome,
                                   bool rename_enabled) const {
    const std::string current_ext = extension_of(file.path);

    if (outcome.read_error.has_value()) {
        EXTCHECK_LOG_WARN("Unreadable: " + file.path + ": " + *outcome.read_error);
    } else if (utils::Logger::instance().enabled(utils::LogLevel::Debug)) {
        EXTCHECK_LOG_DEBUG(file.path + " -> " + describe(*outcome.detection));
    }

    FileVerdict verdict;
    try {
        verdict = engine_.decide(file.path, current_ext, outcome, rename_enabled, exists_);
    } catch (const InvariantError& e) {
        EXTCHECK_LOG_ERROR("Internal error for " + file.path + ": " + e.what());
        return build_error_record(file.path, file.size_bytes, current_ext, e.what(), "internal-error");
    }

    ResultRecord rec = build_record(file.path, file.size_bytes, current_ext, outcome, verdict);
    if (verdict.action != Action::Rename) return rec;

    // The move itself refuses to overwrite; this re-check only gives a
    // clearer message for the common case.
    const std::string& target = *verdict.new_path;
    std::string err;
    if (exists_(target)) {
        err = "target appeared before rename: " + target;
    } else if (move_(file.path, target, &err)) {
        EXTCHECK_LOG_INFO("Renamed " + file.path + " -> " + target);
        return rec;
    }

    EXTCHECK_LOG_WARN("Rename failed for " + file.path + ": " + err);
    rec.action = action_name(Action::Error);
    rec.new_path.clear();
    rec.error = "rename failed: " + err;
    return rec;
}

ResultRecord ScanPipeline::process(const FileInfo& file, bool rename_enabled) const {
    return finish_(file, detect_(file), rename_enabled);
}

ScanSummary ScanPipeline::run(const std::vector<FileInfo>& files, const PipelineOptions& opts) const {
    utils::Stopwatch sw;

    std::vector<FileInfo> ordered = files;
    std::sort(ordered.begin(), ordered.end(), [](const FileInfo& a, const FileInfo& b) {
        return a.path < b.path;
    });

    std::vector<std::future<DetectionOutcome>> futs;
    futs.reserve(ordered.size());

    concurrency::ThreadPool pool(std::min<std::size_t>(
        concurrency::ThreadPool::resolve_thread_count(opts.threads),
        std::max<std::size_t>(ordered.size(), 1)));

    for (const auto& fi : ordered) {
        futs.push_back(pool.submit([this, &fi]() { return detect_(fi); }));
    }

    ScanSummary summary;
    summary.total = ordered.size();
    summary.records.reserve(ordered.size());

    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const FileInfo& fi = ordered[i];
        ResultRecord rec;
        try {
            rec = finish_(fi, futs[i].get(), opts.rename_enabled);
        } catch (const std::exception& e) {
            EXTCHECK_LOG_ERROR("Failed to process " + fi.path + ": " + e.what());
            rec = build_error_record(fi.path, fi.size_bytes, extension_of(fi.path), e.what(), "exception");
        }

        if (rec.action == action_name(Action::Error)) summary.errors++;
        if (rec.action == action_name(Action::Rename)) summary.renamed++;
        if (rec.reason == reason::kMismatch || rec.reason == reason::kReportOnly) summary.mismatches++;
        summary.records.push_back(std::move(rec));
    }

    pool.shutdown();
    summary.elapsed_ms = sw.elapsed_ms();

    EXTCHECK_LOG_INFO(
        "Scan done: total=" + std::to_string(summary.total) +
        " mismatches=" + std::to_string(summary.mismatches) +
        " renamed=" + std::to_string(summary.renamed) +
        " errors=" + std::to_string(summary.errors) +
        " t_ms=" + std::to_string(summary.elapsed_ms)
    );
    return summary;
}

} // namespace core
