#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace cardiowatch {

// Valid sample range (bpm)
constexpr double kMinValidBpm = 20.0;
constexpr double kMaxValidBpm = 300.0;

enum class ActivityMode { RESTING = 0, EXERCISE = 1 };

struct Sample {
    double value = 0.0;      // bpm
    double timestamp = 0.0;  // seconds (epoch or monotonic, caller's choice)
    ActivityMode mode = ActivityMode::RESTING;
};

enum class Zone {
    // resting mode
    LOW, RESTING, NORMAL, ELEVATED, HIGH,
    // exercise mode
    WARMUP, FAT_BURN, CARDIO, PEAK, MAXIMUM
};

enum class AlertStatus { NORMAL = 0, MONITORING = 1, WARNING = 2, CRITICAL = 3 };

enum class Urgency { LOW = 0, MEDIUM = 1, HIGH = 2 };

// Fitness profile used by the recovery scorer (defaults mirror the app)
struct FitnessProfile {
    double age = 40.0;
    double maxHeartRate = 180.0;     // used by the VO2max estimate
    double restingHrBaseline = std::numeric_limits<double>::quiet_NaN(); // NaN: restingHR - 2
    double timeToTargetSec = 120.0;
};

// Monitoring options. Defaults reproduce the app behaviour.
struct MonitorOptions {
    // Buffers
    int recentCapacity = 200;             // ring buffer (live display, zone, alerts)
    int windowCapacity = 300;             // feature window (longer horizon stats)
    int channelCapacity = 1024;           // bounded ingestion channel

    // Zones
    double maxHeartRate = 190.0;          // estimated max HR for exercise zones

    // Alert engine
    double restingHighThreshold = 100.0;
    double restingLowThreshold = 50.0;
    double exerciseHighThreshold = 180.0;
    int    irregularityMinSamples = 10;
    double irregularityStdThreshold = 15.0;
    double notificationCooldownSec = 300.0;

    // Periodic evaluator
    double tickIntervalSec = 60.0;
    int    periodicMinSamples = 60;
    double criticalRiskScore = 0.7;

    // Assessment cycle
    int    minAssessmentSamples = 5;
    double sensorRangeSec = 3600.0;       // lookback for ancillary pulls
    double cacheExpirySec = 3600.0;
    int    pendingCapacity = 256;         // replay queue bound, oldest dropped first

    FitnessProfile profile {};
};

struct ModelOutput {
    std::string label;
    double confidence = 0.0; // always within [0,1]
};

struct FitnessOutput {
    double fitnessLevel = 0.0;            // 10..95
    std::string fitnessCategory;
    double vo2max = 0.0;                  // 15..75 ml/kg/min
    std::string vo2maxStatus;
    double cardiovascularAge = 0.0;       // 18..90
    std::string ageComparison;
    double recoveryEfficiency = 0.0;      // 0..100
    std::string recoveryStatus;
    std::string recoveryRecommendation;
    double trainingReadiness = 0.0;       // 0..100
    std::string readinessStatus;
    std::string readinessGuidance;
    std::string recommendation;
};

struct CriticalCheck {
    bool isCritical = false;
    std::string message;
};

// Snapshot of the values an assessment was computed from
struct HealthInputs {
    double meanHeartRate = 0.0;
    double stdHeartRate = 0.0;
    double pnn50 = 0.0;                   // pNN50-like ratio 0..1
    double hrvMean = 50.0;                // ms
    double respiratoryRate = 16.0;        // breaths/min
    double activityLevel = 250.0;         // active energy
    double sleepQuality = 0.8;            // ratio 0..1
    std::vector<double> recentHeartRates;
};

struct Assessment {
    ModelOutput rhythm;
    ModelOutput risk;
    ModelOutput pattern;
    FitnessOutput fitness;
    CriticalCheck critical;
    std::string overallStatus;
    double timestamp = 0.0;
};

// Window statistics shared by the periodic evaluator and the assessment snapshot
struct WindowFeatures {
    size_t count = 0;
    double mean = 0.0;
    double stdev = 0.0;   // population
    double pnn50 = 0.0;   // fraction of |diff| > 50/60 bpm
};

// Labels
namespace labels {
constexpr const char* kNormal = "Normal";
constexpr const char* kIrregular = "Irregular";
constexpr const char* kRiskHigh = "High";
constexpr const char* kRiskMedium = "Medium";
constexpr const char* kRiskLow = "Low";
constexpr const char* kInsufficientData = "Insufficient Data";
constexpr const char* kBradycardia = "Low(Bradycardia)";
constexpr const char* kTachycardia = "High(Tachycardia)";
constexpr const char* kVariable = "Variable";
constexpr const char* kNeedsAttention = "Needs Attention";
constexpr const char* kMonitor = "Monitor";
constexpr const char* kHealthy = "Healthy";
}

// Sample validation (finite and within [20,300] bpm)
bool isValidSample(double value);

// Zone classification (pure)
Zone classifyZone(double value, ActivityMode mode, double maxHeartRate = 190.0);
const char* zoneName(Zone z);
int zoneSeverity(Zone z); // monotone rank within a mode
const char* alertStatusName(AlertStatus s);
const char* urgencyName(Urgency u);
const char* modeName(ActivityMode m);

// Stats helpers
double mean(const std::vector<double>& v);
double std_pop(const std::vector<double>& v);
double rmssd(const std::vector<double>& v);
double pnn50Like(const std::vector<double>& v);
WindowFeatures computeWindowFeatures(const std::vector<double>& values);
std::vector<double> rrIntervalsFromHeartRates(const std::vector<double>& heartRates);

// Clamp helpers (NaN maps to lo)
double clampInput(double v, double lo, double hi);
double clampConfidence(double c);

// Scoring ensemble
ModelOutput detectIrregularRhythm(double meanHeartRate, double stdHeartRate, double pnn50);
ModelOutput assessHealthRisk(double avgHeartRate, double hrvMean, double respiratoryRate,
                             double activityLevel, double sleepQuality);
ModelOutput classifyHRVPattern(const std::vector<double>& rrIntervals);

// Critical pre-check (first matching rule wins)
CriticalCheck checkCriticalConditions(const HealthInputs& in);

// Aggregation
std::string overallStatus(const ModelOutput& rhythm, const ModelOutput& risk, const ModelOutput& pattern);

// Full pipeline: pre-check, four scorers, aggregator
Assessment runHealthAssessment(const HealthInputs& in, double timestamp,
                               const FitnessProfile& profile = {});

} // namespace cardiowatch
