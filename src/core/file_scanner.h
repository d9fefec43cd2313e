#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace core {

struct FileInfo {
    std::string path;
    std::uintmax_t size_bytes = 0;
};

struct ScanConfig {
    bool recursive = true;
    std::size_t max_files = 0;            // 0 = no limit
    std::vector<std::string> skip_paths;  // e.g. the report being written
};

class FileScanner {
public:
    explicit FileScanner(ScanConfig cfg = {});

    // A regular file yields itself; a directory yields the regular files
    // below it (subtrees we may not enter are skipped). Sorted by path.
    std::vector<FileInfo> scan(const std::string& root) const;

private:
    ScanConfig cfg_;

    bool skipped_(const std::string& path) const;
};

} // namespace core
