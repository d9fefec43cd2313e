#include "file_scanner.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "utils/logging.h"

namespace core {

namespace fs = std::filesystem;

namespace {

std::string comparable(const std::string& p) {
    std::error_code ec;
    auto abs = fs::weakly_canonical(fs::path(p), ec);
    if (ec) return fs::path(p).lexically_normal().string();
    return abs.string();
}

} // namespace

FileScanner::FileScanner(ScanConfig cfg) : cfg_(std::move(cfg)) {
    for (auto& s : cfg_.skip_paths) s = comparable(s);
}

bool FileScanner::skipped_(const std::string& path) const {
    if (cfg_.skip_paths.empty()) return false;
    auto c = comparable(path);
    return std::find(cfg_.skip_paths.begin(), cfg_.skip_paths.end(), c) != cfg_.skip_paths.end();
}

std::vector<FileInfo> FileScanner::scan(const std::string& root) const {
    std::vector<FileInfo> out;

    std::error_code ec;
    fs::path rp(root);
    auto st = fs::status(rp, ec);
    if (ec || !fs::exists(st)) {
        EXTCHECK_LOG_WARN("Scan root not found: " + root);
        return out;
    }

    auto push_entry = [&](const fs::directory_entry& de) {
        std::error_code fec;
        if (!de.is_regular_file(fec) || fec) return;
        std::string p = de.path().string();
        if (skipped_(p)) return;

        FileInfo fi;
        fi.path = p;
        fi.size_bytes = de.file_size(fec);
        if (fec) fi.size_bytes = 0;
        out.push_back(std::move(fi));
    };

    if (fs::is_regular_file(st)) {
        push_entry(fs::directory_entry(rp, ec));
        return out;
    }
    if (!fs::is_directory(st)) {
        EXTCHECK_LOG_WARN("Scan root is neither a file nor a directory: " + root);
        return out;
    }

    const auto opts = fs::directory_options::skip_permission_denied;
    auto walk = [&](auto it) {
        for (decltype(it) end; !ec && it != end; it.increment(ec)) {
            if (cfg_.max_files && out.size() >= cfg_.max_files) break;
            push_entry(*it);
        }
        if (ec) {
            EXTCHECK_LOG_WARN("Cannot walk " + root + ": " + ec.message());
        }
    };

    if (cfg_.recursive) {
        walk(fs::recursive_directory_iterator(rp, opts, ec));
    } else {
        walk(fs::directory_iterator(rp, opts, ec));
    }

    // stable order for reproducible reports
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
        return a.path < b.path;
    });

    return out;
}

} // namespace core
