// Rhythm / risk / pattern scorers, critical pre-check and aggregator
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include "../cpp/cardiowatch_core.h"

static int g_failures = 0;
static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_failures;
}
static bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

using namespace cardiowatch;

static void testRhythm() {
    // Reference scenarios (pNN50-like values from the reference feature set)
    auto a = detectIrregularRhythm(65, 5.2, 0.18);
    check(a.label == "Normal" && near(a.confidence, 0.998, 0.01), "HR 65 std 5.2 -> Normal ~0.998");
    auto b = detectIrregularRhythm(88, 18.5, 0.05);
    check(b.label == "Irregular" && near(b.confidence, 0.8), "HR 88 std 18.5 -> Irregular (0.8)");
    auto c = detectIrregularRhythm(45, 3.8, 0.28);
    check(c.label == "Normal" && near(c.confidence, 0.8), "HR 45 std 3.8 -> Normal (0.8)");
    auto d = detectIrregularRhythm(165, 4.2, 0.02);
    check(d.label == "Irregular" && near(d.confidence, 0.5), "HR 165 std 4.2 -> Irregular (0.5)");

    auto e = detectIrregularRhythm(120, 40, 0.0);
    check(e.label == "Irregular" && near(e.confidence, 0.95), "irregular confidence capped at 0.95");
    auto f = detectIrregularRhythm(70, 11, 0.5);
    check(f.label == "Normal" && near(f.confidence, 0.8), "10<std<=15 adds 0.2");
}

static void testRisk() {
    // recovery = 0.4 * 37.5 / 50 = 0.3, stress(95) ~ 0.88
    auto hi = assessHealthRisk(95, 37.5, 22, 50, 0.4);
    check(hi.label == "High" && near(hi.confidence, 0.95), "reference high-risk scenario");
    auto med = assessHealthRisk(70, 50, 16, 250, 0.45);
    check(med.label == "Medium" && near(med.confidence, 0.825), "medium tier confidence 0.75+(s-0.35)*0.5");
    auto low = assessHealthRisk(70, 60, 16, 300, 0.9);
    check(low.label == "Low" && near(low.confidence, 0.85), "low tier confidence 0.85-s");
    auto low2 = assessHealthRisk(70, 50, 16, 50, 0.8);
    check(low2.label == "Low" && near(low2.confidence, 0.7), "low tier floor 0.7");
}

static void testPattern() {
    auto ins = classifyHRVPattern({800, 810, 790, 805});
    check(ins.label == "Insufficient Data" && ins.confidence == 0.0, "fewer than 5 RR -> Insufficient Data");
    auto rr = [](const std::vector<double>& hr) { return rrIntervalsFromHeartRates(hr); };
    check(classifyHRVPattern(rr(std::vector<double>(10, 60.0))).label == "Normal", "60 bpm -> Normal");
    auto brady = classifyHRVPattern(rr(std::vector<double>(10, 40.0)));
    check(brady.label == "Low(Bradycardia)" && near(brady.confidence, 0.90), "40 bpm -> Bradycardia 0.90");
    auto tachy = classifyHRVPattern(rr(std::vector<double>(10, 120.0)));
    check(tachy.label == "High(Tachycardia)" && near(tachy.confidence, 0.92), "120 bpm -> Tachycardia 0.92");
    auto var = classifyHRVPattern(rr(std::vector<double>(10, 50.0)));
    check(var.label == "Variable" && near(var.confidence, 0.75), "50 bpm -> Variable 0.75");
    std::vector<double> alt;
    for (int i = 0; i < 20; ++i) alt.push_back(i % 2 ? 100.0 : 50.0);
    auto irr = classifyHRVPattern(rr(alt));
    check(irr.label == "Irregular" && near(irr.confidence, 0.95), "alternating 50/100 bpm x20 -> Irregular");
    alt.pop_back();
    check(classifyHRVPattern(rr(alt)).label != "Irregular", "irregular requires 20 intervals");
    auto normal = classifyHRVPattern(rr(std::vector<double>(8, 72.0)));
    check(near(normal.confidence, 0.88), "normal confidence 0.88");
}

static void testConfidenceBounds() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    const std::vector<double> xs = {nan, inf, -inf, -1e9, -1, 0, 0.05, 0.5, 1, 12, 50, 85, 100, 150, 250, 1e9};
    bool ok = true;
    for (double a : xs) for (double b : xs) for (double c : xs) {
        auto r = detectIrregularRhythm(a, b, c);
        if (!(r.confidence >= 0.0 && r.confidence <= 1.0)) ok = false;
        auto k = assessHealthRisk(a, b, c, b, c);
        if (!(k.confidence >= 0.0 && k.confidence <= 1.0)) ok = false;
        auto p = classifyHRVPattern(rrIntervalsFromHeartRates({a, b, c, a, b, c}));
        if (!(p.confidence >= 0.0 && p.confidence <= 1.0)) ok = false;
    }
    check(ok, "all confidences within [0,1] over extreme inputs");
    check(clampConfidence(nan) == 0.0 && clampConfidence(2.0) == 1.0 && clampConfidence(-1.0) == 0.0, "clampConfidence");
    check(clampInput(nan, 8, 30) == 8 && clampInput(inf, 8, 30) == 30 && clampInput(-inf, 8, 30) == 8, "clampInput non-finite");
}

static void testCritical() {
    HealthInputs in;
    in.meanHeartRate = 72; in.activityLevel = 250; in.respiratoryRate = 16; in.hrvMean = 50;
    check(!checkCriticalConditions(in).isCritical, "normal inputs not critical");

    HealthInputs hi = in; hi.meanHeartRate = 160; hi.activityLevel = 50; hi.respiratoryRate = 30;
    auto c1 = checkCriticalConditions(hi);
    check(c1.isCritical && c1.message.find("Dangerously high resting") == 0, "HR>150 at rest wins over respiration");
    HealthInputs active = hi; active.activityLevel = 500; active.respiratoryRate = 16;
    check(!checkCriticalConditions(active).isCritical, "HR>150 while active is not critical");
    HealthInputs lo = in; lo.meanHeartRate = 35;
    check(checkCriticalConditions(lo).message.find("Dangerously low") == 0, "HR<40");
    HealthInputs resp = in; resp.respiratoryRate = 7;
    check(checkCriticalConditions(resp).message.find("Abnormal respiratory") == 0, "respiration < 8");
    resp.respiratoryRate = 26;
    check(checkCriticalConditions(resp).isCritical, "respiration > 25");
    resp.respiratoryRate = 25;
    check(!checkCriticalConditions(resp).isCritical, "respiration 25 is in range");
    HealthInputs hrv = in; hrv.hrvMean = 5; hrv.meanHeartRate = 85;
    check(checkCriticalConditions(hrv).message.find("Very low heart rate variability") == 0, "HRV<10 with HR>80");
}

static void testAggregator() {
    ModelOutput normal{"Normal", 0.9}, irregular{"Irregular", 0.8};
    ModelOutput high{"High", 0.9}, med{"Medium", 0.8}, low{"Low", 0.8};
    ModelOutput pn{"Normal", 0.88}, ptachy{"High(Tachycardia)", 0.92}, pbrady{"Low(Bradycardia)", 0.9};
    ModelOutput pirr{"Irregular", 0.95}, pins{"Insufficient Data", 0.0};
    check(overallStatus(irregular, low, pn) == "Needs Attention", "rhythm Irregular -> Needs Attention");
    check(overallStatus(normal, high, pn) == "Needs Attention", "risk High -> Needs Attention");
    check(overallStatus(normal, low, pirr) == "Needs Attention", "pattern Irregular -> Needs Attention");
    check(overallStatus(normal, med, pn) == "Monitor", "risk Medium -> Monitor");
    check(overallStatus(normal, low, ptachy) == "Monitor" && overallStatus(normal, low, pbrady) == "Monitor", "tachy/brady -> Monitor");
    check(overallStatus(normal, low, pn) == "Healthy" && overallStatus(normal, low, pins) == "Healthy", "otherwise Healthy");
    check(overallStatus(normal, med, pn) == overallStatus(normal, med, pn), "aggregator idempotent");

    HealthInputs in;
    in.meanHeartRate = 72; in.stdHeartRate = 3; in.pnn50 = 0.3;
    in.recentHeartRates = std::vector<double>(30, 72.0);
    Assessment a1 = runHealthAssessment(in, 1000.0);
    Assessment a2 = runHealthAssessment(in, 1000.0);
    check(a1.overallStatus == a2.overallStatus && a1.fitness.fitnessLevel == a2.fitness.fitnessLevel, "pipeline deterministic");
    check(a1.timestamp == 1000.0 && a1.overallStatus == "Healthy", "healthy snapshot");
    in.recentHeartRates.resize(3);
    Assessment a3 = runHealthAssessment(in, 1001.0);
    check(a3.pattern.label == "Insufficient Data" && !a3.rhythm.label.empty() && !a3.risk.label.empty(),
          "insufficient pattern data does not block other scorers");
}

int main() {
    testRhythm();
    testRisk();
    testPattern();
    testConfidenceBounds();
    testCritical();
    testAggregator();
    std::cout << (g_failures == 0 ? "ALL OK" : "FAILURES: " + std::to_string(g_failures)) << "\n";
    return g_failures == 0 ? 0 : 1;
}
