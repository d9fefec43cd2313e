#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "decision_engine.h"
#include "file_scanner.h"
#include "raw_file_source.h"
#include "result_record.h"
#include "sniffer.h"

namespace core {

struct ScanSummary {
    std::vector<ResultRecord> records;   // sorted by path
    std::size_t total = 0;
    std::size_t mismatches = 0;
    std::size_t renamed = 0;
    std::size_t errors = 0;
    std::int64_t elapsed_ms = 0;
};

struct PipelineOptions {
    bool rename_enabled = false;
    std::size_t threads = 0;   // 0 = hardware concurrency
};

// Runs sniffer + decision engine over a list of files and executes renames.
//
// Detection is pure per file and runs on a worker pool. Decisions and renames
// then run on the calling thread in path order, so the collision probe for a
// file already sees the renames done for the files before it.
class ScanPipeline {
public:
    using SourceFactory = std::function<std::unique_ptr<RawFileSource>(const FileInfo&)>;
    using Mover = std::function<bool(const std::string& from, const std::string& to, std::string* err)>;

    ScanPipeline(const Sniffer& sniffer, const DecisionEngine& engine);

    // Defaults: FsFileSource, path_exists_on_disk, move_no_replace.
    void set_source_factory(SourceFactory f) { make_source_ = std::move(f); }
    void set_exists_probe(PathExistsProbe p) { exists_ = std::move(p); }
    void set_mover(Mover m) { move_ = std::move(m); }

    ScanSummary run(const std::vector<FileInfo>& files, const PipelineOptions& opts) const;

    // Detect + decide + rename for a single file, on the calling thread.
    ResultRecord process(const FileInfo& file, bool rename_enabled) const;

private:
    DetectionOutcome detect_(const FileInfo& file) const;
    ResultRecord finish_(const FileInfo& file, const DetectionOutcome& outcome, bool rename_enabled) const;

    const Sniffer& sniffer_;
    const DecisionEngine& engine_;
    SourceFactory make_source_;
    PathExistsProbe exists_;
    Mover move_;
};

} // namespace core
