#include "cardiowatch_fitness.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace cardiowatch {

FitnessLevel predictFitnessLevel(double age, double restingHR, double /*hrReserve*/,
                                 double hrr1min, double /*hrr2min*/, double rmssd,
                                 double /*sdnn*/, double recoveryEfficiency) {
    double score = 50.0;

    // heart rate recovery carries the most weight
    if (hrr1min > 30) score += 25;
    else if (hrr1min > 25) score += 18;
    else if (hrr1min > 20) score += 10;
    else if (hrr1min > 15) score += 5;
    else if (hrr1min < 12) score -= 20;

    if (restingHR < 50) score += 18;
    else if (restingHR < 55) score += 12;
    else if (restingHR < 65) score += 6;
    else if (restingHR > 75) score -= 12;

    if (rmssd > 60) score += 12;
    else if (rmssd > 40) score += 6;
    else if (rmssd < 20) score -= 10;

    if (age < 30) score += 8;
    else if (age < 40) score += 4;
    else if (age > 60) score -= 5;

    score += recoveryEfficiency * 0.15;
    score = std::clamp(score, 10.0, 95.0);

    FitnessLevel out;
    out.level = score;
    if (score > 80) out.category = "Excellent";
    else if (score > 65) out.category = "Good";
    else if (score > 45) out.category = "Fair";
    else if (score > 30) out.category = "Below Average";
    else out.category = "Needs Improvement";
    return out;
}

double estimateVO2max(double age, double restingHR, double maxHR, double hrReserve, double fitnessLevel) {
    if (!(restingHR > 0.0)) return 15.0;
    const double base = 15.3 * (maxHR / restingHR);
    const double ageAdj = std::max(0.0, (35.0 - age) * 0.25);
    double vo2 = base + fitnessLevel * 0.35 + ageAdj + hrReserve * 0.08;
    if (!std::isfinite(vo2)) vo2 = 15.0;
    return std::clamp(vo2, 15.0, 75.0);
}

const char* vo2maxStatus(double vo2max) {
    if (vo2max >= 50.0) return "Excellent";
    if (vo2max >= 42.0) return "Good";
    if (vo2max >= 35.0) return "Fair";
    if (vo2max >= 28.0) return "Below Average";
    return "Poor";
}

CardiovascularAge calculateCardiovascularAge(double chronologicalAge, double fitnessLevel,
                                             double restingHR, double hrr1min, double rmssd) {
    double cvAge = chronologicalAge + (fitnessLevel - 50.0) * -0.4;

    if (hrr1min > 30) cvAge -= 7;
    else if (hrr1min > 25) cvAge -= 4;
    else if (hrr1min > 20) cvAge -= 2;
    else if (hrr1min < 15) cvAge += 5;

    if (restingHR < 55) cvAge -= 4;
    else if (restingHR < 60) cvAge -= 2;
    else if (restingHR > 75) cvAge += 3;

    if (rmssd > 50) cvAge -= 3;
    else if (rmssd > 35) cvAge -= 1;
    else if (rmssd < 20) cvAge += 4;

    cvAge = std::clamp(cvAge, 18.0, 90.0);

    CardiovascularAge out;
    out.cvAge = cvAge;
    const double diff = cvAge - chronologicalAge;
    std::ostringstream os;
    if (diff < -2) { os << static_cast<int>(std::fabs(diff)) << " years younger"; out.comparison = os.str(); }
    else if (diff > 2) { os << static_cast<int>(diff) << " years older"; out.comparison = os.str(); }
    else out.comparison = "Age appropriate";
    return out;
}

RecoveryAnalysis analyzeRecoveryPattern(double hrr1min, double hrr2min, double timeToTargetSec) {
    const double hrr1Score = std::min(hrr1min / 30.0 * 50.0, 50.0);
    const double hrr2Score = std::min(hrr2min / 50.0 * 30.0, 30.0);
    const double timeScore = std::max(0.0, (180.0 - timeToTargetSec) / 180.0 * 20.0);
    const double eff = std::clamp(hrr1Score + hrr2Score + timeScore, 0.0, 100.0);

    RecoveryAnalysis out;
    out.efficiency = eff;
    if (eff > 85) {
        out.status = "Excellent Recovery";
        out.recommendation = "Your cardiovascular recovery is elite level. Maintain current training intensity.";
    } else if (eff > 70) {
        out.status = "Very Good Recovery";
        out.recommendation = "Recovery is strong. You can handle high-intensity interval training.";
    } else if (eff > 55) {
        out.status = "Good Recovery";
        out.recommendation = "Recovery is healthy. Consider adding interval training 2-3x per week.";
    } else if (eff > 40) {
        out.status = "Fair Recovery";
        out.recommendation = "Recovery needs improvement. Focus on aerobic base building and ensure adequate rest.";
    } else if (eff > 25) {
        out.status = "Below Average Recovery";
        out.recommendation = "Recovery is concerning. Reduce training intensity and prioritize recovery days.";
    } else {
        out.status = "Poor Recovery";
        out.recommendation = "Recovery needs immediate attention. Consult a healthcare provider and focus on gentle activity.";
    }
    return out;
}

TrainingReadiness assessTrainingReadiness(double rmssd, double restingHR, double restingHRBaseline,
                                          double sleepQuality) {
    double score = 50.0;

    if (rmssd > 60) score += 25;
    else if (rmssd > 45) score += 15;
    else if (rmssd > 30) score += 8;
    else if (rmssd < 20) score -= 25;
    else if (rmssd < 25) score -= 10;

    const double elevation = restingHR - restingHRBaseline;
    if (elevation < -2) score += 10;
    else if (elevation < 2) score += 5;
    else if (elevation > 5) score -= 15;

    score += (sleepQuality - 0.5) * 40.0;
    score = std::clamp(score, 0.0, 100.0);

    TrainingReadiness out;
    out.score = score;
    if (score > 85) {
        out.status = "Peak Performance Ready";
        out.guidance = "Your body is primed for maximum effort. Perfect day for personal records or competitions.";
    } else if (score > 70) {
        out.status = "Ready for High Intensity";
        out.guidance = "Great day for challenging workouts, intervals, or strength training.";
    } else if (score > 55) {
        out.status = "Ready for Moderate Activity";
        out.guidance = "Good for steady-state cardio, technique work, or moderate strength training.";
    } else if (score > 40) {
        out.status = "Light Activity Recommended";
        out.guidance = "Focus on recovery activities: easy walking, yoga, or stretching.";
    } else if (score > 25) {
        out.status = "Recovery Priority";
        out.guidance = "Your body needs rest. Consider meditation, light stretching, or complete rest.";
    } else {
        out.status = "Rest Required";
        out.guidance = "Strong signs of fatigue or stress. Take a complete rest day and prioritize sleep.";
    }
    return out;
}

double estimateHRR1Min(const std::vector<double>& heartRates) {
    if (heartRates.empty()) return 20.0;
    auto [mn, mx] = std::minmax_element(heartRates.begin(), heartRates.end());
    const double range = *mx - *mn;
    if (range > 40) return 25.0;
    if (range > 25) return 20.0;
    return 15.0;
}

double calculateRecoveryEfficiency(double hrr1min, double hrr2min) {
    return std::min(hrr1min / 30.0 * 50.0, 50.0) + std::min(hrr2min / 50.0 * 30.0, 30.0) + 20.0;
}

std::string generateRecommendation(double fitness, double recovery, double readiness) {
    std::vector<std::string> parts;
    if (fitness < 40) parts.emplace_back("Focus on building aerobic base with 30-min daily walks");
    else if (fitness < 60) parts.emplace_back("Add 2-3 cardio sessions per week to improve fitness");
    else if (fitness > 75) parts.emplace_back("Maintain excellence with varied training intensities");

    if (recovery < 50) parts.emplace_back("Prioritize recovery with proper sleep and nutrition");
    else if (recovery > 70) parts.emplace_back("Recovery is strong - you can increase training volume");

    if (readiness < 40) parts.emplace_back("Take a rest day or do light recovery activities");
    else if (readiness > 70) parts.emplace_back("Perfect timing for challenging workouts");

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += ". ";
        out += parts[i];
    }
    return out;
}

FitnessOutput runFitnessAssessment(const HealthInputs& in, const FitnessProfile& profile) {
    const double age = clampInput(profile.age, 10.0, 110.0);
    const double restingHR = clampInput(in.meanHeartRate, 30.0, 250.0);
    const double rmssdMs = clampInput(in.hrvMean, 0.0, 200.0);
    const double sleep = clampInput(in.sleepQuality, 0.0, 1.0);
    const double baseline = std::isfinite(profile.restingHrBaseline) ? profile.restingHrBaseline : restingHR - 2.0;

    const double hrr1 = estimateHRR1Min(in.recentHeartRates);
    const double hrr2 = hrr1 * 1.5;
    const double hrReserve = (220.0 - age) - restingHR;

    FitnessLevel lvl = predictFitnessLevel(age, restingHR, hrReserve, hrr1, hrr2, rmssdMs,
                                           in.stdHeartRate, calculateRecoveryEfficiency(hrr1, hrr2));
    CardiovascularAge cv = calculateCardiovascularAge(age, lvl.level, restingHR, hrr1, rmssdMs);
    RecoveryAnalysis rec = analyzeRecoveryPattern(hrr1, hrr2, profile.timeToTargetSec);
    TrainingReadiness ready = assessTrainingReadiness(rmssdMs, restingHR, baseline, sleep);

    FitnessOutput out;
    out.fitnessLevel = lvl.level;
    out.fitnessCategory = lvl.category;
    out.vo2max = estimateVO2max(age, restingHR, profile.maxHeartRate, hrReserve, lvl.level);
    out.vo2maxStatus = vo2maxStatus(out.vo2max);
    out.cardiovascularAge = cv.cvAge;
    out.ageComparison = cv.comparison;
    out.recoveryEfficiency = rec.efficiency;
    out.recoveryStatus = rec.status;
    out.recoveryRecommendation = rec.recommendation;
    out.trainingReadiness = ready.score;
    out.readinessStatus = ready.status;
    out.readinessGuidance = ready.guidance;
    out.recommendation = generateRecommendation(lvl.level, rec.efficiency, ready.score);
    return out;
}

} // namespace cardiowatch
