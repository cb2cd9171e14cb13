#include "cardiowatch_export.h"
#include "cardiowatch_log.h"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>

namespace cardiowatch {

static bool toUtc(double epochSec, std::tm& out) {
    if (!std::isfinite(epochSec)) return false;
    std::time_t t = static_cast<std::time_t>(std::floor(epochSec));
#if defined(_WIN32)
    return gmtime_s(&out, &t) == 0;
#else
    return gmtime_r(&t, &out) != nullptr;
#endif
}

static inline long long roundInt(double v) {
    return std::isfinite(v) ? std::llround(v) : 0;
}

std::string csvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += '"';
    return out;
}

std::string exportCsv(const std::vector<AssessmentRecord>& records) {
    std::ostringstream os;
    os << kCsvHeader << "\n";
    for (const auto& r : records) {
        char date[16] = "1970-01-01";
        char tod[16] = "00:00:00";
        std::tm tm{};
        if (toUtc(r.assessment.timestamp, tm)) {
            std::strftime(date, sizeof(date), "%Y-%m-%d", &tm);
            std::strftime(tod, sizeof(tod), "%H:%M:%S", &tm);
        }
        const HealthInputs& in = r.inputs;
        os << date << ',' << tod << ','
           << roundInt(in.meanHeartRate) << ','
           << roundInt(in.hrvMean) << ','
           << roundInt(in.respiratoryRate) << ','
           << roundInt(in.activityLevel) << ','
           << roundInt(in.sleepQuality * 100.0) << "%,"
           << csvEscape(r.assessment.risk.label) << ','
           << csvEscape(r.assessment.rhythm.label) << ','
           << csvEscape(r.assessment.pattern.label) << "\n";
    }
    return os.str();
}

bool writeCsvFile(const std::string& path, const std::vector<AssessmentRecord>& records,
                  const char** err_code, std::string* err_msg) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (out) out << exportCsv(records);
    if (!out) {
        if (err_code) *err_code = "CARDIOWATCH_E020";
        if (err_msg) *err_msg = "cannot write export file: " + path;
        CW_LOGE("CWExport", "export failed: %s", path.c_str());
        return false;
    }
    CW_LOGI("CWExport", "exported %zu record(s) to %s", records.size(), path.c_str());
    return true;
}

} // namespace cardiowatch
