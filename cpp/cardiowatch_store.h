// Persistence collaborator boundary and trend summary
#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "cardiowatch_core.h"

namespace cardiowatch {

struct AssessmentRecord {
    Assessment assessment;
    HealthInputs inputs;
};

// Implementations may be backed by any local store. Failures are reported by
// returning false or throwing; the session treats both as non-fatal.
class AssessmentStore {
public:
    virtual ~AssessmentStore() = default;
    virtual bool save(const Assessment& assessment, const HealthInputs& inputs) = 0;
    // Records with timestamp >= now - daysBack*86400, newest first
    virtual std::vector<AssessmentRecord> query(int daysBack, double now) const = 0;
};

class InMemoryAssessmentStore : public AssessmentStore {
public:
    bool save(const Assessment& assessment, const HealthInputs& inputs) override;
    std::vector<AssessmentRecord> query(int daysBack, double now) const override;
    size_t size() const { std::lock_guard<std::mutex> lock(dataMutex_); return records_.size(); }
    void clear() { std::lock_guard<std::mutex> lock(dataMutex_); records_.clear(); }
private:
    mutable std::mutex dataMutex_;
    std::vector<AssessmentRecord> records_; // insertion order
};

enum class RiskTrend { IMPROVING, STABLE, WORSENING };
const char* riskTrendName(RiskTrend t);

struct HealthTrends {
    double averageHeartRate = 0.0;
    double averageHRV = 0.0;
    double averageRespiratoryRate = 0.0;
    double totalActivity = 0.0;
    double averageSleepQuality = 0.0;
    RiskTrend riskTrend = RiskTrend::STABLE;
    size_t recordCount = 0;
};

// Order of `records` does not matter; the trend compares the three newest
// records against the older ones (share of "High" risk, 0.2 margin).
HealthTrends summarizeTrends(const std::vector<AssessmentRecord>& records);

} // namespace cardiowatch
