#include "cw_options_builder.h"
#include "cardiowatch_log.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

using cardiowatch::MonitorOptions;

static inline bool isFinite(double x) {
    return std::isfinite(x) != 0;
}

static inline bool fail(const char** err_code, std::string* err_msg, const char* code, const std::string& msg) {
    if (err_code) *err_code = code;
    if (err_msg) *err_msg = msg;
    return false;
}

extern "C" bool cw_validate_options(const MonitorOptions& opt,
                                    const char** err_code,
                                    std::string* err_msg) {
    // Buffers: 1 <= recent <= window, channel >= 1
    if (opt.recentCapacity < 1 || opt.windowCapacity < opt.recentCapacity || opt.channelCapacity < 1
        || opt.pendingCapacity < 1 || opt.recentCapacity > 1000000 || opt.windowCapacity > 1000000) {
        return fail(err_code, err_msg, "CARDIOWATCH_E001",
                    "Invalid capacities (1<=recent<=window<=1e6, channel>=1, pending>=1)");
    }
    if (opt.minAssessmentSamples < 0 || opt.periodicMinSamples < 0 || opt.irregularityMinSamples < 2) {
        return fail(err_code, err_msg, "CARDIOWATCH_E001", "Invalid sample minimums (irregularity>=2, others>=0)");
    }

    // Cadence: 0.01..86400 s
    if (!isFinite(opt.tickIntervalSec) || opt.tickIntervalSec < 0.01 || opt.tickIntervalSec > 86400.0) {
        return fail(err_code, err_msg, "CARDIOWATCH_E002", "Invalid tick interval (0.01-86400 s)");
    }

    // Alert thresholds: 0 <= low < high <= 300, exercise in (0,300], cooldown >= 0
    if (!isFinite(opt.restingLowThreshold) || !isFinite(opt.restingHighThreshold) || !isFinite(opt.exerciseHighThreshold)
        || opt.restingLowThreshold < 0.0 || !(opt.restingLowThreshold < opt.restingHighThreshold)
        || opt.restingHighThreshold > 300.0 || opt.exerciseHighThreshold <= 0.0 || opt.exerciseHighThreshold > 300.0) {
        return fail(err_code, err_msg, "CARDIOWATCH_E003", "Invalid alert thresholds (0<=low<high<=300)");
    }
    if (!isFinite(opt.notificationCooldownSec) || opt.notificationCooldownSec < 0.0) {
        return fail(err_code, err_msg, "CARDIOWATCH_E003", "Invalid notification cooldown (>=0 s)");
    }
    if (!isFinite(opt.irregularityStdThreshold) || opt.irregularityStdThreshold < 0.0
        || !isFinite(opt.criticalRiskScore) || opt.criticalRiskScore < 0.0 || opt.criticalRiskScore > 1.0) {
        return fail(err_code, err_msg, "CARDIOWATCH_E003", "Invalid irregularity/risk threshold");
    }

    // Profile
    const auto& p = opt.profile;
    if (!isFinite(p.age) || p.age < 10.0 || p.age > 110.0
        || !isFinite(p.maxHeartRate) || p.maxHeartRate < 100.0 || p.maxHeartRate > 250.0
        || !isFinite(opt.maxHeartRate) || opt.maxHeartRate < 100.0 || opt.maxHeartRate > 250.0) {
        return fail(err_code, err_msg, "CARDIOWATCH_E004", "Invalid profile (age 10-110, max HR 100-250)");
    }
    if (!isFinite(p.timeToTargetSec) || p.timeToTargetSec < 0.0 || std::isinf(p.restingHrBaseline)) {
        return fail(err_code, err_msg, "CARDIOWATCH_E004", "Invalid profile recovery fields");
    }

    // Remaining reals: reject only NaN/Inf or negative
    if (!isFinite(opt.sensorRangeSec) || opt.sensorRangeSec <= 0.0
        || !isFinite(opt.cacheExpirySec) || opt.cacheExpirySec < 0.0) {
        return fail(err_code, err_msg, "CARDIOWATCH_E005", "Invalid range/expiry (NaN/Inf or negative)");
    }
    return true;
}

// ------------------------------------------------------------------
// key=value builder
// ------------------------------------------------------------------

static inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

static inline bool parseNum(const std::string& v, double& out) {
    if (v.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double d = std::strtod(v.c_str(), &end);
    if (errno == ERANGE || end != v.c_str() + v.size() || !isFinite(d)) return false;
    out = d;
    return true;
}

static inline bool parseInt(const std::string& v, int& out) {
    double d = 0.0;
    if (!parseNum(v, d) || d != std::floor(d) || std::fabs(d) > 2.0e9) return false;
    out = static_cast<int>(d);
    return true;
}

static bool applyKey(MonitorOptions& o, const std::string& key, const std::string& val) {
    auto num = [&](double& field) { return parseNum(val, field); };
    auto integer = [&](int& field) { return parseInt(val, field); };

    if (key == "recentCapacity") return integer(o.recentCapacity);
    if (key == "windowCapacity") return integer(o.windowCapacity);
    if (key == "channelCapacity") return integer(o.channelCapacity);
    if (key == "maxHeartRate") return num(o.maxHeartRate);
    if (key == "restingHighThreshold") return num(o.restingHighThreshold);
    if (key == "restingLowThreshold") return num(o.restingLowThreshold);
    if (key == "exerciseHighThreshold") return num(o.exerciseHighThreshold);
    if (key == "irregularityMinSamples") return integer(o.irregularityMinSamples);
    if (key == "irregularityStdThreshold") return num(o.irregularityStdThreshold);
    if (key == "notificationCooldownSec") return num(o.notificationCooldownSec);
    if (key == "tickIntervalSec") return num(o.tickIntervalSec);
    if (key == "periodicMinSamples") return integer(o.periodicMinSamples);
    if (key == "criticalRiskScore") return num(o.criticalRiskScore);
    if (key == "minAssessmentSamples") return integer(o.minAssessmentSamples);
    if (key == "sensorRangeSec") return num(o.sensorRangeSec);
    if (key == "cacheExpirySec") return num(o.cacheExpirySec);
    if (key == "pendingCapacity") return integer(o.pendingCapacity);
    if (key == "profile.age") return num(o.profile.age);
    if (key == "profile.maxHeartRate") return num(o.profile.maxHeartRate);
    if (key == "profile.restingHrBaseline") return num(o.profile.restingHrBaseline);
    if (key == "profile.timeToTargetSec") return num(o.profile.timeToTargetSec);
    return false;
}

MonitorOptions cw_build_options_from_kv(const std::string& text,
                                        bool* ok,
                                        const char** err_code,
                                        std::string* err_msg) {
    MonitorOptions o;
    if (ok) *ok = false;
    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        size_t eq = t.find('=');
        if (eq == std::string::npos) {
            fail(err_code, err_msg, "CARDIOWATCH_E005", "Line " + std::to_string(lineNo) + ": expected key=value");
            return o;
        }
        std::string key = trim(t.substr(0, eq));
        std::string val = trim(t.substr(eq + 1));
        if (!applyKey(o, key, val)) {
            fail(err_code, err_msg, "CARDIOWATCH_E005", "Line " + std::to_string(lineNo) + ": unknown key or bad value '" + key + "'");
            return o;
        }
    }
    if (!cw_validate_options(o, err_code, err_msg)) return o;
    CW_LOGD("CWOptions", "options parsed (%d line(s))", lineNo);
    if (ok) *ok = true;
    return o;
}
