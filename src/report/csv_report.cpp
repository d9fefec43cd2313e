#include "csv_report.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace report {

const char* const kColumns[] = {
    "path", "size_bytes", "current_ext", "detected_ext", "detected_mime",
    "confidence", "is_match", "action", "new_path", "error", "reason",
};
const std::size_t kColumnCount = sizeof(kColumns) / sizeof(kColumns[0]);

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string format_row(const core::ResultRecord& r) {
    char conf[32];
    std::snprintf(conf, sizeof(conf), "%.2f", r.confidence);

    std::string line;
    line += csv_escape(r.path);                    line += ',';
    line += std::to_string(r.size_bytes);          line += ',';
    line += csv_escape(r.current_ext);             line += ',';
    line += csv_escape(r.detected_ext);            line += ',';
    line += csv_escape(r.detected_mime);           line += ',';
    line += conf;                                  line += ',';
    line += r.is_match ? "true" : "false";         line += ',';
    line += csv_escape(r.action);                  line += ',';
    line += csv_escape(r.new_path);                line += ',';
    line += csv_escape(r.error);                   line += ',';
    line += csv_escape(r.reason);
    return line;
}

void write_csv(std::ostream& out, const std::vector<core::ResultRecord>& records) {
    for (std::size_t i = 0; i < kColumnCount; ++i) {
        if (i) out << ',';
        out << kColumns[i];
    }
    out << "\r\n";
    for (const auto& r : records) {
        out << format_row(r) << "\r\n";
    }
}

bool write_csv(const std::string& path,
               const std::vector<core::ResultRecord>& records,
               std::string* err) {
    namespace fs = std::filesystem;

    fs::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            if (err) *err = "cannot create " + p.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        if (err) *err = "cannot open " + path + " for writing";
        return false;
    }
    write_csv(out, records);
    out.flush();
    if (!out) {
        if (err) *err = "write failed for " + path;
        return false;
    }
    return true;
}

} // namespace report
