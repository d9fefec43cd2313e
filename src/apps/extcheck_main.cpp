#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/decision_engine.h"
#include "core/extension_normalizer.h"
#include "core/file_scanner.h"
#include "core/scan_pipeline.h"
#include "core/signature_table.h"
#include "core/sniffer.h"
#include "report/csv_report.h"
#include "utils/config.h"
#include "utils/logging.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsageOrMismatch = 2;
constexpr int kExitErrors = 3;

constexpr const char* kDefaultConfig = "params.json";
constexpr const char* kDefaultReport = "report.csv";

// Command-line values; unset means "not given", so config/defaults apply.
struct Args {
    std::optional<std::string> input;
    std::optional<std::string> report;
    bool rename = false;
    std::optional<std::string> config_path;
    std::optional<std::size_t> threads;
    std::optional<std::size_t> sniff_bytes;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool help = false;
};

void print_usage(std::ostream& os) {
    os << "Usage: extcheck --input <file|dir> [options]\n"
          "Validate (and optionally fix) file extensions against file content.\n"
          "\n"
          "  --input <path>        file or directory to scan (recursive)\n"
          "  --report <path>       CSV report path (default: report.csv)\n"
          "  --rename              rename mismatched files to the detected extension\n"
          "  --config <path>       JSON or KEY=VALUE config (default: params.json if present)\n"
          "  --threads <n>         detection workers (default: hardware concurrency)\n"
          "  --sniff_bytes <n>     bytes read from each file (default: 16384)\n"
          "  --log_level <lvl>     trace|debug|info|warn|error\n"
          "  --log_file <path>     also append log lines to this file\n"
          "  --help                show this text\n"
          "\n"
          "Exit codes: 0 ok, 2 bad usage or mismatches found (dry run), 3 errors.\n";
}

std::size_t parse_count(const std::string& flag, const std::string& v) {
    try {
        std::size_t used = 0;
        long long n = std::stoll(v, &used);
        if (used != v.size() || n < 0) throw std::invalid_argument(v);
        return (std::size_t)n;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + v + "'");
    }
}

Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string k = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(k + " requires a value");
            return argv[++i];
        };
        if (k == "--input") a.input = next();
        else if (k == "--report") a.report = next();
        else if (k == "--rename") a.rename = true;
        else if (k == "--config") a.config_path = next();
        else if (k == "--threads") a.threads = parse_count(k, next());
        else if (k == "--sniff_bytes") a.sniff_bytes = parse_count(k, next());
        else if (k == "--log_level") a.log_level = next();
        else if (k == "--log_file") a.log_file = next();
        else if (k == "--help" || k == "-h") a.help = true;
        else throw std::invalid_argument("unknown option: " + k);
    }
    return a;
}

// Loads --config, or params.json from the working directory when present.
// Returns false only when an explicitly requested config cannot be used.
bool load_config(const Args& args, utils::Config& cfg) {
    std::string err;
    if (args.config_path.has_value()) {
        if (!cfg.load_file(*args.config_path, &err)) {
            std::cerr << "[ERR] Failed to read config: " << err << "\n";
            return false;
        }
        return true;
    }

    std::error_code ec;
    if (std::filesystem::exists(kDefaultConfig, ec)) {
        if (!cfg.load_file(kDefaultConfig, &err)) {
            std::cerr << "[WARN] Ignoring " << kDefaultConfig << ": " << err << "\n";
        }
    }
    return true;
}

void print_summary(const core::ScanSummary& s, const std::string& report_path, bool rename) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(report_path, ec);

    EXTCHECK_LOG_INFO("Done. Total: " + std::to_string(s.total) +
                      " | Mismatches: " + std::to_string(s.mismatches) +
                      " | Renamed: " + std::to_string(s.renamed) +
                      " | Errors: " + std::to_string(s.errors));
    EXTCHECK_LOG_INFO("Report: " + (ec ? report_path : abs.string()));
    if (rename) {
        EXTCHECK_LOG_INFO("Rename was enabled. See the 'action' and 'new_path' columns.");
    } else {
        EXTCHECK_LOG_INFO("Rename was NOT enabled (dry run).");
    }
}

int run(const Args& args) {
    utils::Config cfg;
    if (!load_config(args, cfg)) return kExitUsageOrMismatch;

    auto& logger = utils::Logger::instance();
    logger.set_level(utils::parse_log_level(args.log_level.value_or(cfg.get_string("LOG_LEVEL", "info"))));
    {
        std::string lf = args.log_file.value_or(cfg.get_string("LOG_FILE", ""));
        if (!lf.empty() && !logger.set_log_file(lf)) {
            std::cerr << "Failed to open log file: " << lf << "\n";
        }
    }

    std::string input = args.input.value_or(cfg.get_string("INPUT", ""));
    if (input.empty()) {
        EXTCHECK_LOG_ERROR("--input is required (or set 'input' in the config file)");
        return kExitUsageOrMismatch;
    }
    std::error_code ec;
    if (!std::filesystem::exists(input, ec)) {
        EXTCHECK_LOG_ERROR("Input not found: " + input);
        return kExitUsageOrMismatch;
    }

    const std::string report_path = args.report.value_or(cfg.get_string("REPORT", kDefaultReport));
    const bool rename = args.rename || cfg.get_bool("RENAME", false);
    const std::size_t threads = args.threads.value_or(cfg.get_size("THREADS", 0));
    const std::size_t window = args.sniff_bytes.value_or(cfg.get_size("SNIFF_BYTES", core::kDefaultSniffWindow));

    const core::SignatureTable table = core::SignatureTable::builtin();
    const core::ExtensionNormalizer normalizer = core::ExtensionNormalizer::builtin();
    std::optional<core::Sniffer> sniffer;
    std::optional<core::DecisionEngine> engine;
    try {
        sniffer.emplace(table, window);
        engine.emplace(normalizer, sniffer->known_extensions());
    } catch (const std::invalid_argument& e) {
        EXTCHECK_LOG_ERROR(std::string("Invalid setup: ") + e.what());
        return kExitUsageOrMismatch;
    }

    EXTCHECK_LOG_INFO("Scanning: " + input);

    core::ScanConfig scan_cfg;
    scan_cfg.skip_paths.push_back(report_path);
    core::FileScanner scanner(scan_cfg);
    auto files = scanner.scan(input);

    core::ScanPipeline pipeline(*sniffer, *engine);
    core::PipelineOptions opts;
    opts.rename_enabled = rename;
    opts.threads = threads;
    core::ScanSummary summary = pipeline.run(files, opts);

    std::string err;
    if (!report::write_csv(report_path, summary.records, &err)) {
        EXTCHECK_LOG_ERROR("Failed to write report: " + err);
        return kExitErrors;
    }

    print_summary(summary, report_path, rename);

    if (summary.errors) return kExitErrors;
    if (summary.mismatches && !rename) return kExitUsageOrMismatch;
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERR] " << e.what() << "\n\n";
        print_usage(std::cerr);
        return kExitUsageOrMismatch;
    }
    if (args.help) {
        print_usage(std::cout);
        return kExitOk;
    }

    try {
        return run(args);
    } catch (const std::exception& e) {
        EXTCHECK_LOG_ERROR(std::string("Fatal: ") + e.what());
        return kExitErrors;
    }
}
