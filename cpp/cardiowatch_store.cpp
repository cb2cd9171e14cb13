#include "cardiowatch_store.h"

#include <algorithm>

namespace cardiowatch {

static constexpr double kSecondsPerDay = 86400.0;

bool InMemoryAssessmentStore::save(const Assessment& assessment, const HealthInputs& inputs) {
    std::lock_guard<std::mutex> lock(dataMutex_);
    records_.push_back(AssessmentRecord{assessment, inputs});
    return true;
}

std::vector<AssessmentRecord> InMemoryAssessmentStore::query(int daysBack, double now) const {
    const double since = now - static_cast<double>(std::max(0, daysBack)) * kSecondsPerDay;
    std::vector<AssessmentRecord> out;
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        for (const auto& r : records_)
            if (r.assessment.timestamp >= since) out.push_back(r);
    }
    std::stable_sort(out.begin(), out.end(), [](const AssessmentRecord& a, const AssessmentRecord& b) {
        return a.assessment.timestamp > b.assessment.timestamp;
    });
    return out;
}

const char* riskTrendName(RiskTrend t) {
    switch (t) {
        case RiskTrend::IMPROVING: return "improving";
        case RiskTrend::WORSENING: return "worsening";
        default: return "stable";
    }
}

static inline double highShare(std::vector<AssessmentRecord>::const_iterator b,
                               std::vector<AssessmentRecord>::const_iterator e) {
    if (b == e) return 0.0;
    double hi = 0.0, n = 0.0;
    for (auto it = b; it != e; ++it, n += 1.0)
        if (it->assessment.risk.label == labels::kRiskHigh) hi += 1.0;
    return hi / n;
}

HealthTrends summarizeTrends(const std::vector<AssessmentRecord>& records) {
    HealthTrends t;
    if (records.empty()) return t;

    std::vector<AssessmentRecord> asc(records);
    std::stable_sort(asc.begin(), asc.end(), [](const AssessmentRecord& a, const AssessmentRecord& b) {
        return a.assessment.timestamp < b.assessment.timestamp;
    });

    const double n = static_cast<double>(asc.size());
    for (const auto& r : asc) {
        t.averageHeartRate += r.inputs.meanHeartRate;
        t.averageHRV += r.inputs.hrvMean;
        t.averageRespiratoryRate += r.inputs.respiratoryRate;
        t.totalActivity += r.inputs.activityLevel;
        t.averageSleepQuality += r.inputs.sleepQuality;
    }
    t.averageHeartRate /= n;
    t.averageHRV /= n;
    t.averageRespiratoryRate /= n;
    t.averageSleepQuality /= n;
    t.recordCount = asc.size();

    if (asc.size() > 1) {
        const size_t split = asc.size() > 3 ? asc.size() - 3 : 0;
        const double recentAvg = highShare(asc.begin() + split, asc.end());
        const double olderAvg = highShare(asc.begin(), asc.begin() + split);
        if (recentAvg > olderAvg + 0.2) t.riskTrend = RiskTrend::WORSENING;
        else if (recentAvg < olderAvg - 0.2) t.riskTrend = RiskTrend::IMPROVING;
    }
    return t;
}

} // namespace cardiowatch
