#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "core/result_record.h"

namespace report {

// path,size_bytes,current_ext,detected_ext,detected_mime,confidence,is_match,action,new_path,error,reason
extern const char* const kColumns[];
extern const std::size_t kColumnCount;

// RFC 4180: quote when the field holds , " CR or LF; double inner quotes.
std::string csv_escape(std::string_view field);

// One CSV line (no trailing newline) for a record.
std::string format_row(const core::ResultRecord& r);

void write_csv(std::ostream& out, const std::vector<core::ResultRecord>& records);

// Creates parent directories. Returns false and fills *err on failure.
bool write_csv(const std::string& path,
               const std::vector<core::ResultRecord>& records,
               std::string* err = nullptr);

} // namespace report
