// Cardiovascular fitness and recovery scorer
#pragma once

#include <string>
#include <vector>
#include "cardiowatch_core.h"

namespace cardiowatch {

struct FitnessLevel {
    double level = 50.0;      // 10..95
    std::string category;
};

struct CardiovascularAge {
    double cvAge = 40.0;      // 18..90
    std::string comparison;   // "N years younger" / "N years older" / "Age appropriate"
};

struct RecoveryAnalysis {
    double efficiency = 0.0;  // 0..100
    std::string status;
    std::string recommendation;
};

struct TrainingReadiness {
    double score = 50.0;      // 0..100
    std::string status;
    std::string guidance;
};

// Additive band score from 50, clamped to [10,95]
FitnessLevel predictFitnessLevel(double age, double restingHR, double hrReserve,
                                 double hrr1min, double hrr2min, double rmssd,
                                 double sdnn, double recoveryEfficiency);

double estimateVO2max(double age, double restingHR, double maxHR, double hrReserve, double fitnessLevel);
const char* vo2maxStatus(double vo2max);

CardiovascularAge calculateCardiovascularAge(double chronologicalAge, double fitnessLevel,
                                             double restingHR, double hrr1min, double rmssd);

RecoveryAnalysis analyzeRecoveryPattern(double hrr1min, double hrr2min, double timeToTargetSec);

TrainingReadiness assessTrainingReadiness(double rmssd, double restingHR, double restingHRBaseline,
                                          double sleepQuality);

// Deterministic 1-minute recovery estimate from the HR range of recent samples
double estimateHRR1Min(const std::vector<double>& heartRates);
// 1/2-minute recovery plus a fixed 20 point base (feeds predictFitnessLevel)
double calculateRecoveryEfficiency(double hrr1min, double hrr2min);

std::string generateRecommendation(double fitness, double recovery, double readiness);

// Wires the above from a health snapshot and profile
FitnessOutput runFitnessAssessment(const HealthInputs& in, const FitnessProfile& profile = {});

} // namespace cardiowatch
