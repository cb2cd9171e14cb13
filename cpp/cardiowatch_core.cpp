#include "cardiowatch_core.h"
#include "cardiowatch_fitness.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace cardiowatch {

// ------------------------------------------------------------------
// Helpers
// ------------------------------------------------------------------

double clampInput(double v, double lo, double hi) {
    if (!std::isfinite(v)) return std::isnan(v) ? lo : (v > 0 ? hi : lo);
    return std::clamp(v, lo, hi);
}

double clampConfidence(double c) {
    if (!std::isfinite(c)) return 0.0;
    return std::clamp(c, 0.0, 1.0);
}

static inline double validateHeartRate(double hr) { return clampInput(hr, 30.0, 250.0); }
static inline double validateHRV(double hrv) { return clampInput(hrv, 0.0, 200.0); }

bool isValidSample(double value) {
    return std::isfinite(value) && value >= kMinValidBpm && value <= kMaxValidBpm;
}

// ------------------------------------------------------------------
// Zones
// ------------------------------------------------------------------

Zone classifyZone(double value, ActivityMode mode, double maxHeartRate) {
    if (mode == ActivityMode::EXERCISE) {
        if (!(maxHeartRate > 0.0) || !std::isfinite(maxHeartRate))
            throw std::invalid_argument("classifyZone: maxHeartRate must be > 0");
        const double pct = value / maxHeartRate * 100.0;
        if (pct < 50.0) return Zone::RESTING;
        if (pct < 60.0) return Zone::WARMUP;
        if (pct < 70.0) return Zone::FAT_BURN;
        if (pct < 80.0) return Zone::CARDIO;
        if (pct < 90.0) return Zone::PEAK;
        return Zone::MAXIMUM;
    }
    if (value < 50.0) return Zone::LOW;
    if (value < 60.0) return Zone::RESTING;
    if (value < 100.0) return Zone::NORMAL;
    if (value < 120.0) return Zone::ELEVATED;
    return Zone::HIGH;
}

const char* zoneName(Zone z) {
    switch (z) {
        case Zone::LOW: return "Low";
        case Zone::RESTING: return "Resting";
        case Zone::NORMAL: return "Normal";
        case Zone::ELEVATED: return "Elevated";
        case Zone::HIGH: return "High";
        case Zone::WARMUP: return "Warm Up";
        case Zone::FAT_BURN: return "Fat Burn";
        case Zone::CARDIO: return "Cardio";
        case Zone::PEAK: return "Peak";
        case Zone::MAXIMUM: return "Maximum";
    }
    return "Unknown";
}

int zoneSeverity(Zone z) {
    // Resting (0) is shared by both modes and sits below Warm Up
    switch (z) {
        case Zone::LOW: return -1;
        case Zone::RESTING: return 0;
        case Zone::NORMAL: return 1;
        case Zone::ELEVATED: return 2;
        case Zone::HIGH: return 3;
        case Zone::WARMUP: return 1;
        case Zone::FAT_BURN: return 2;
        case Zone::CARDIO: return 3;
        case Zone::PEAK: return 4;
        case Zone::MAXIMUM: return 5;
    }
    return 0;
}

const char* alertStatusName(AlertStatus s) {
    switch (s) {
        case AlertStatus::NORMAL: return "Normal";
        case AlertStatus::MONITORING: return "Monitoring";
        case AlertStatus::WARNING: return "Warning";
        case AlertStatus::CRITICAL: return "Critical";
    }
    return "Unknown";
}

const char* urgencyName(Urgency u) {
    switch (u) {
        case Urgency::LOW: return "low";
        case Urgency::MEDIUM: return "medium";
        case Urgency::HIGH: return "high";
    }
    return "unknown";
}

const char* modeName(ActivityMode m) {
    return m == ActivityMode::EXERCISE ? "exercise" : "resting";
}

// ------------------------------------------------------------------
// Stats
// ------------------------------------------------------------------

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double s = std::accumulate(v.begin(), v.end(), 0.0);
    return s / static_cast<double>(v.size());
}

double std_pop(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    const double m = mean(v);
    double acc = 0.0;
    for (double x : v) { double d = x - m; acc += d * d; }
    return std::sqrt(acc / static_cast<double>(v.size()));
}

double rmssd(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    double acc = 0.0;
    for (size_t i = 1; i < v.size(); ++i) { double d = v[i] - v[i - 1]; acc += d * d; }
    return std::sqrt(acc / static_cast<double>(v.size() - 1));
}

double pnn50Like(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    constexpr double kThreshBpm = 50.0 / 60.0; // 50 ms expressed as a bpm step
    size_t over = 0;
    for (size_t i = 1; i < v.size(); ++i) if (std::fabs(v[i] - v[i - 1]) > kThreshBpm) ++over;
    return static_cast<double>(over) / static_cast<double>(v.size() - 1);
}

WindowFeatures computeWindowFeatures(const std::vector<double>& values) {
    WindowFeatures f;
    f.count = values.size();
    if (values.empty()) return f;
    f.mean = mean(values);
    f.stdev = std_pop(values);
    f.pnn50 = pnn50Like(values);
    return f;
}

std::vector<double> rrIntervalsFromHeartRates(const std::vector<double>& heartRates) {
    std::vector<double> rr;
    rr.reserve(heartRates.size());
    for (double hr : heartRates) rr.push_back(60000.0 / validateHeartRate(hr));
    return rr;
}

// ------------------------------------------------------------------
// Scorers
// ------------------------------------------------------------------

ModelOutput detectIrregularRhythm(double meanHeartRate, double stdHeartRate, double pnn50) {
    const double hr = validateHeartRate(meanHeartRate);
    const double sd = clampInput(stdHeartRate, 0.0, 100.0);
    const double p = clampInput(pnn50, 0.0, 1.0);

    double irregularity = 0.0;
    if (sd > 15.0) irregularity += 0.4;
    else if (sd > 10.0) irregularity += 0.2;
    if (p < 0.1 && hr > 85.0) irregularity += 0.3;
    if (hr > 100.0 || hr < 50.0) irregularity += 0.2;
    if (sd > 12.0 && p < 0.08) irregularity += 0.1;

    ModelOutput out;
    // tolerance keeps 0.3 + 0.2 on the Irregular side despite rounding
    const bool irregular = irregularity >= 0.5 - 1e-9;
    out.label = irregular ? labels::kIrregular : labels::kNormal;
    out.confidence = clampConfidence(irregular ? std::min(irregularity, 0.95)
                                               : std::max(1.0 - irregularity, 0.7));
    return out;
}

ModelOutput assessHealthRisk(double avgHeartRate, double hrvMean, double respiratoryRate,
                             double activityLevel, double sleepQuality) {
    const double hr = validateHeartRate(avgHeartRate);
    const double hrv = validateHRV(hrvMean);
    const double resp = clampInput(respiratoryRate, 8.0, 30.0);
    const double activity = clampInput(activityLevel, 0.0, 1000.0);
    const double sleep = clampInput(sleepQuality, 0.0, 1.0);

    const double stress = 1.0 / (1.0 + std::exp(-0.1 * (hr - 75.0)));
    const double recovery = sleep * hrv / 50.0;

    double score = 0.0;
    if (recovery < 0.5) score += 0.4;
    else if (recovery < 0.8) score += 0.2;
    if (activity < 100.0) score += 0.2;
    if (stress > 0.7) score += 0.1;
    if (sleep < 0.5) score += 0.1;
    if (resp > 20.0 || resp < 12.0) score += 0.1;
    if (hr > 90.0 && activity < 200.0) score += 0.1;

    ModelOutput out;
    constexpr double eps = 1e-9;
    if (score >= 0.6 - eps) {
        out.label = labels::kRiskHigh;
        out.confidence = std::min(score + 0.2, 0.95);
    } else if (score >= 0.35 - eps) {
        out.label = labels::kRiskMedium;
        out.confidence = 0.75 + (score - 0.35) * 0.5;
    } else {
        out.label = labels::kRiskLow;
        out.confidence = std::max(0.85 - score, 0.7);
    }
    out.confidence = clampConfidence(out.confidence);
    return out;
}

ModelOutput classifyHRVPattern(const std::vector<double>& rrIntervals) {
    ModelOutput out;
    if (rrIntervals.size() < 5) {
        out.label = labels::kInsufficientData;
        out.confidence = 0.0;
        return out;
    }
    const double meanRR = mean(rrIntervals);
    const double stdRR = std_pop(rrIntervals);
    const double rms = rmssd(rrIntervals);
    const double heartRate = meanRR > 0.0 ? 60000.0 / meanRR : 0.0;

    if (heartRate < 45.0) { out.label = labels::kBradycardia; out.confidence = 0.90; }
    else if (heartRate > 110.0) { out.label = labels::kTachycardia; out.confidence = 0.92; }
    else if (rrIntervals.size() >= 20 && (stdRR > 200.0 || rms > 150.0)) { out.label = labels::kIrregular; out.confidence = 0.95; }
    else if (heartRate >= 60.0 && heartRate <= 100.0 && stdRR <= 100.0) { out.label = labels::kNormal; out.confidence = 0.88; }
    else { out.label = labels::kVariable; out.confidence = 0.75; }
    return out;
}

// ------------------------------------------------------------------
// Critical pre-check and aggregation
// ------------------------------------------------------------------

CriticalCheck checkCriticalConditions(const HealthInputs& in) {
    CriticalCheck c;
    if (in.meanHeartRate > 150.0 && in.activityLevel < 100.0) {
        c.isCritical = true;
        c.message = "Dangerously high resting heart rate detected. Seek immediate medical attention.";
    } else if (in.meanHeartRate < 40.0) {
        c.isCritical = true;
        c.message = "Dangerously low heart rate detected. Seek immediate medical attention.";
    } else if (in.respiratoryRate > 25.0 || in.respiratoryRate < 8.0) {
        c.isCritical = true;
        c.message = "Abnormal respiratory rate detected. Consider medical consultation.";
    } else if (in.hrvMean < 10.0 && in.meanHeartRate > 80.0) {
        c.isCritical = true;
        c.message = "Very low heart rate variability with elevated heart rate. Medical evaluation recommended.";
    }
    return c;
}

std::string overallStatus(const ModelOutput& rhythm, const ModelOutput& risk, const ModelOutput& pattern) {
    if (rhythm.label == labels::kIrregular || risk.label == labels::kRiskHigh || pattern.label == labels::kIrregular)
        return labels::kNeedsAttention;
    if (risk.label == labels::kRiskMedium || pattern.label == labels::kTachycardia || pattern.label == labels::kBradycardia)
        return labels::kMonitor;
    return labels::kHealthy;
}

Assessment runHealthAssessment(const HealthInputs& in, double timestamp, const FitnessProfile& profile) {
    Assessment a;
    a.timestamp = timestamp;
    a.critical = checkCriticalConditions(in);
    a.rhythm = detectIrregularRhythm(in.meanHeartRate, in.stdHeartRate, in.pnn50);
    a.risk = assessHealthRisk(in.meanHeartRate, in.hrvMean, in.respiratoryRate, in.activityLevel, in.sleepQuality);
    a.pattern = classifyHRVPattern(rrIntervalsFromHeartRates(in.recentHeartRates));
    a.fitness = runFitnessAssessment(in, profile);
    a.overallStatus = overallStatus(a.rhythm, a.risk, a.pattern);
    return a;
}

} // namespace cardiowatch
