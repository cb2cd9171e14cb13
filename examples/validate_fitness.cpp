// Fitness / recovery scorer bands and clamps
#include <cmath>
#include <iostream>
#include <string>
#include <vector>
#include "../cpp/cardiowatch_fitness.h"

static int g_failures = 0;
static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_failures;
}
static bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) <= eps; }

using namespace cardiowatch;

static void testFitnessLevel() {
    // 50 + 10 (hrr) + 6 (rest) + 6 (rmssd) + 4 (age) + 75*0.15
    auto a = predictFitnessLevel(35, 58, 127, 22, 33, 45, 4, 75);
    check(near(a.level, 87.25) && a.category == "Excellent", "additive bands -> 87.25 Excellent");
    auto top = predictFitnessLevel(25, 45, 150, 35, 52, 70, 4, 100);
    check(near(top.level, 95.0), "upper clamp 95");
    auto bottom = predictFitnessLevel(70, 90, 60, 10, 15, 10, 4, 0);
    check(near(bottom.level, 10.0) && bottom.category == "Needs Improvement", "lower clamp 10");
    auto fair = predictFitnessLevel(45, 70, 105, 16, 24, 30, 4, 0);
    check(near(fair.level, 55.0) && fair.category == "Fair", "55 -> Fair");
}

static void testVO2() {
    check(near(estimateVO2max(25, 50, 190, 145, 90), 75.0), "VO2max upper clamp 75");
    check(near(estimateVO2max(40, 0, 190, 180, 50), 15.0), "non-positive resting HR -> 15");
    // 15.3 * 160/90 + 10*0.35 + 70*0.08
    const double v = estimateVO2max(60, 90, 160, 70, 10);
    check(near(v, 36.3, 1e-6) && std::string(vo2maxStatus(v)) == "Fair", "VO2max 36.3 Fair");
    check(std::string(vo2maxStatus(50.0)) == "Excellent" && std::string(vo2maxStatus(49.9)) == "Good", "VO2 status 50");
    check(std::string(vo2maxStatus(42.0)) == "Good" && std::string(vo2maxStatus(41.9)) == "Fair", "VO2 status 42");
    check(std::string(vo2maxStatus(28.0)) == "Below Average" && std::string(vo2maxStatus(27.9)) == "Poor", "VO2 status 28");
}

static void testCardiovascularAge() {
    auto same = calculateCardiovascularAge(40, 50, 65, 18, 30);
    check(near(same.cvAge, 40.0) && same.comparison == "Age appropriate", "neutral inputs -> Age appropriate");
    auto young = calculateCardiovascularAge(40, 90, 50, 35, 60);
    check(near(young.cvAge, 18.0) && young.comparison == "22 years younger", "clamped to 18, 22 years younger");
    auto old = calculateCardiovascularAge(60, 10, 85, 10, 10);
    check(near(old.cvAge, 88.0) && old.comparison == "28 years older", "28 years older");
    auto cap = calculateCardiovascularAge(80, 10, 85, 10, 10);
    check(near(cap.cvAge, 90.0) && cap.comparison == "10 years older", "upper clamp 90");
}

static void testRecovery() {
    auto r = analyzeRecoveryPattern(25, 37.5, 120);
    check(near(r.efficiency, 70.833333, 1e-5) && r.status == "Very Good Recovery", "70.83 Very Good");
    auto full = analyzeRecoveryPattern(40, 60, 0);
    check(near(full.efficiency, 100.0) && full.status == "Excellent Recovery", "component caps sum to 100");
    auto none = analyzeRecoveryPattern(0, 0, 300);
    check(near(none.efficiency, 0.0) && none.status == "Poor Recovery" && !none.recommendation.empty(), "0 Poor");
    auto neg = analyzeRecoveryPattern(-100, -100, 500);
    check(neg.efficiency == 0.0, "negative recovery clamped to 0");

    check(near(calculateRecoveryEfficiency(15, 22.5), 58.5), "recovery efficiency carries 20 point base");
    check(estimateHRR1Min({}) == 20.0, "HRR1 default 20 without samples");
    check(estimateHRR1Min({60, 110}) == 25.0, "range > 40 -> 25");
    check(estimateHRR1Min({60, 100}) == 20.0 && estimateHRR1Min({60, 90}) == 20.0, "25 < range <= 40 -> 20");
    check(estimateHRR1Min({60, 70, 65}) == 15.0, "narrow range -> 15");
}

static void testReadiness() {
    auto peak = assessTrainingReadiness(65, 58, 58, 0.8);
    check(near(peak.score, 92.0) && peak.status == "Peak Performance Ready", "92 Peak");
    auto capped = assessTrainingReadiness(65, 55, 58, 0.9);
    check(near(capped.score, 100.0), "upper clamp 100");
    auto rest = assessTrainingReadiness(10, 80, 60, 0.0);
    check(near(rest.score, 0.0) && rest.status == "Rest Required", "lower clamp 0, Rest Required");
}

static void testRecommendation() {
    check(generateRecommendation(30, 40, 30) ==
              "Focus on building aerobic base with 30-min daily walks. "
              "Prioritize recovery with proper sleep and nutrition. "
              "Take a rest day or do light recovery activities",
          "low scores -> three advisories joined");
    check(generateRecommendation(65, 60, 50).empty(), "middle bands contribute nothing");
    check(generateRecommendation(50, 80, 50) ==
              "Add 2-3 cardio sessions per week to improve fitness. Recovery is strong - you can increase training volume",
          "two advisories");
}

static void testPipeline() {
    HealthInputs in;
    in.meanHeartRate = 60; in.hrvMean = 50; in.sleepQuality = 0.8; in.stdHeartRate = 8;
    for (int i = 0; i < 10; ++i) in.recentHeartRates.push_back(55.0 + 5.0 * i); // range 45
    FitnessOutput f = runFitnessAssessment(in);
    check(near(f.fitnessLevel, 84.625) && f.fitnessCategory == "Excellent", "pipeline fitness 84.625");
    check(near(f.vo2max, 75.0) && f.vo2maxStatus == "Excellent", "pipeline VO2max");
    check(near(f.recoveryEfficiency, 70.833333, 1e-5) && f.recoveryStatus == "Very Good Recovery", "pipeline recovery");
    check(near(f.trainingReadiness, 77.0) && f.readinessStatus == "Ready for High Intensity", "pipeline readiness");
    check(f.ageComparison == "16 years younger", "pipeline cardiovascular age");
    check(f.recommendation.find("Maintain excellence") == 0 && f.recommendation.find("Perfect timing") != std::string::npos,
          "pipeline recommendation");

    FitnessProfile p;
    p.restingHrBaseline = 50; // resting 60 is 10 above baseline
    FitnessOutput g = runFitnessAssessment(in, p);
    check(near(g.trainingReadiness, 62.0), "explicit baseline lowers readiness");

    HealthInputs bad = in;
    bad.meanHeartRate = std::nan("");
    bad.hrvMean = -5;
    FitnessOutput h = runFitnessAssessment(bad);
    check(h.fitnessLevel >= 10 && h.fitnessLevel <= 95 && h.vo2max >= 15 && h.vo2max <= 75 &&
          h.cardiovascularAge >= 18 && h.cardiovascularAge <= 90 &&
          h.trainingReadiness >= 0 && h.trainingReadiness <= 100, "ranges hold for invalid inputs");
}

int main() {
    testFitnessLevel();
    testVO2();
    testCardiovascularAge();
    testRecovery();
    testReadiness();
    testRecommendation();
    testPipeline();
    std::cout << (g_failures == 0 ? "ALL OK" : "FAILURES: " + std::to_string(g_failures)) << "\n";
    return g_failures == 0 ? 0 : 1;
}
