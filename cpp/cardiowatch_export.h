// CSV export of stored assessments
#pragma once

#include <string>
#include <vector>
#include "cardiowatch_store.h"

namespace cardiowatch {

constexpr const char* kCsvHeader =
    "Date,Time,HeartRate,HRV,RespiratoryRate,Activity,SleepQuality,RiskLevel,RhythmStatus,PatternStatus";

// Rows follow the order of `records`. Timestamps are epoch seconds rendered in UTC.
std::string exportCsv(const std::vector<AssessmentRecord>& records);

// Quotes a field when it contains a comma, quote or line break
std::string csvEscape(const std::string& field);

bool writeCsvFile(const std::string& path, const std::vector<AssessmentRecord>& records,
                  const char** err_code = nullptr, std::string* err_msg = nullptr);

} // namespace cardiowatch
