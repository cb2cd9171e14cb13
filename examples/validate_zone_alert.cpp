// Zone boundaries, severity monotonicity, alert cooldown and periodic evaluator
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../cpp/cardiowatch_stream.h"

static int g_failures = 0;
static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_failures;
}

using namespace cardiowatch;

static void testZones() {
    const auto R = ActivityMode::RESTING;
    const auto E = ActivityMode::EXERCISE;
    check(classifyZone(49, R) == Zone::LOW && classifyZone(50, R) == Zone::RESTING, "resting 49/50");
    check(classifyZone(59, R) == Zone::RESTING && classifyZone(60, R) == Zone::NORMAL, "resting 59/60");
    check(classifyZone(99, R) == Zone::NORMAL && classifyZone(100, R) == Zone::ELEVATED, "resting 99/100");
    check(classifyZone(119, R) == Zone::ELEVATED && classifyZone(120, R) == Zone::HIGH, "resting 119/120");
    // 190 max: 50% = 95, 60% = 114, 70% = 133, 80% = 152, 90% = 171
    check(classifyZone(94, E) == Zone::RESTING && classifyZone(95, E) == Zone::WARMUP, "exercise 50%");
    check(classifyZone(113, E) == Zone::WARMUP && classifyZone(114, E) == Zone::FAT_BURN, "exercise 60%");
    check(classifyZone(132, E) == Zone::FAT_BURN && classifyZone(133, E) == Zone::CARDIO, "exercise 70%");
    check(classifyZone(151, E) == Zone::CARDIO && classifyZone(152, E) == Zone::PEAK, "exercise 80%");
    check(classifyZone(170, E) == Zone::PEAK && classifyZone(171, E) == Zone::MAXIMUM, "exercise 90%");
    check(classifyZone(100, E, 200.0) == Zone::WARMUP, "caller supplied max HR");
    check(std::string(zoneName(Zone::FAT_BURN)) == "Fat Burn" && std::string(zoneName(Zone::WARMUP)) == "Warm Up", "display names");

    bool mono = true;
    for (auto mode : {R, E}) {
        int prev = -100;
        for (double v = 20.0; v <= 300.0; v += 0.25) {
            int s = zoneSeverity(classifyZone(v, mode));
            if (s < prev) mono = false;
            prev = s;
        }
    }
    check(mono, "severity non-decreasing in value within each mode");

    bool threw = false;
    try { classifyZone(120, E, 0.0); } catch (const std::invalid_argument&) { threw = true; }
    check(threw, "exercise zone with max HR 0 throws invalid_argument");
}

static void testAlertTransitions() {
    MonitorOptions opt;
    AlertEngine ae(opt);
    RingBuffer<double> win(300);
    auto feed = [&](double v, double t, ActivityMode m) {
        win.push_back(v);
        return ae.onSample(Sample{v, t, m}, win);
    };
    auto n1 = feed(120, 0, ActivityMode::RESTING);
    check(n1 && ae.status() == AlertStatus::CRITICAL && n1->title == "High Resting Heart Rate", "resting >100 -> Critical, dispatched");
    check(n1 && n1->urgency == Urgency::HIGH && n1->body.find("120 bpm") != std::string::npos, "critical body and urgency");
    auto n2 = feed(121, 1, ActivityMode::RESTING);
    check(!n2 && ae.status() == AlertStatus::CRITICAL, "no dispatch without transition");
    auto n3 = feed(45, 2, ActivityMode::RESTING);
    check(!n3 && ae.status() == AlertStatus::WARNING, "state updates while cooldown suppresses");
    check(ae.suppressedTotal() == 1, "suppressed counted");
    auto n4 = feed(70, 3, ActivityMode::RESTING);
    check(!n4 && ae.status() == AlertStatus::NORMAL, "return to Normal never notifies");
    auto n5 = feed(40, 300, ActivityMode::RESTING);
    check(n5 && n5->title == "Low Heart Rate Detected" && ae.status() == AlertStatus::WARNING, "dispatch again at exactly 300 s");

    AlertEngine ex(opt);
    RingBuffer<double> w2(300);
    w2.push_back(185);
    auto e1 = ex.onSample(Sample{185, 0, ActivityMode::EXERCISE}, w2);
    check(e1 && ex.status() == AlertStatus::WARNING && e1->title == "High Heart Rate During Exercise", "exercise >180 -> Warning");
    w2.push_back(150);
    ex.onSample(Sample{150, 1, ActivityMode::EXERCISE}, w2);
    check(ex.status() == AlertStatus::NORMAL, "exercise 150 -> Normal");

    // Out-of-order timestamps count as inside the cooldown
    AlertEngine oo(opt);
    RingBuffer<double> w3(300);
    w3.push_back(120);
    oo.onSample(Sample{120, 1000, ActivityMode::RESTING}, w3);
    w3.push_back(70);
    oo.onSample(Sample{70, 1001, ActivityMode::RESTING}, w3);
    w3.push_back(45);
    auto back = oo.onSample(Sample{45, 100, ActivityMode::RESTING}, w3);
    check(!back && oo.status() == AlertStatus::WARNING, "earlier timestamp does not bypass cooldown");
}

static void testIrregularityOverlay() {
    MonitorOptions opt;
    AlertEngine ae(opt);
    RingBuffer<double> win(300);
    std::optional<Notification> last;
    int notes = 0;
    for (int i = 0; i < 10; ++i) {
        double v = (i % 2 == 0) ? 60.0 : 95.0; // stdev 17.5
        win.push_back(v);
        auto n = ae.onSample(Sample{v, static_cast<double>(i), ActivityMode::RESTING}, win);
        if (n) { last = n; ++notes; }
        if (i < 9) check(ae.status() == AlertStatus::NORMAL, "no overlay before 10 samples (" + std::to_string(i + 1) + ")");
    }
    check(ae.status() == AlertStatus::MONITORING, "stdev > 15 over last 10 -> Monitoring");
    check(notes == 1 && last && last->title == "Irregular Heart Rhythm Detected", "irregularity notified once");
    win.push_back(60.0);
    auto again = ae.onSample(Sample{60.0, 10.0, ActivityMode::RESTING}, win);
    check(!again && ae.status() == AlertStatus::MONITORING, "staying in Monitoring does not re-notify");

    AlertEngine ex(opt);
    RingBuffer<double> w2(300);
    for (int i = 0; i < 12; ++i) {
        double v = (i % 2 == 0) ? 100.0 : 140.0;
        w2.push_back(v);
        ex.onSample(Sample{v, static_cast<double>(i), ActivityMode::EXERCISE}, w2);
    }
    check(ex.status() == AlertStatus::NORMAL, "overlay ignored in exercise mode");
}

static void testOscillatingCooldown() {
    MonitorOptions opt;
    MonitorEngine engine(opt);
    std::vector<double> sent;
    // Crosses a threshold on every sample for ~2 hours
    for (int i = 0; i < 7200; ++i) {
        double v = 0.0;
        switch (i % 4) {
            case 0: v = 130.0; break;
            case 1: v = 70.0; break;
            case 2: v = 40.0; break;
            default: v = 75.0; break;
        }
        auto r = engine.ingest(Sample{v, static_cast<double>(i), ActivityMode::RESTING});
        if (r.notification) sent.push_back(r.notification->timestamp);
    }
    bool spaced = true;
    for (size_t i = 1; i < sent.size(); ++i)
        if (sent[i] - sent[i - 1] < 300.0) spaced = false;
    check(!sent.empty() && spaced, "no two dispatches within 300 s under oscillation");
    check(sent.size() >= 20 && sent.size() <= 25, "dispatch roughly every cooldown (" + std::to_string(sent.size()) + ")");
    check(engine.alerts().suppressedTotal() > 1000, "suppressed transitions counted");
}

static void testPeriodic() {
    MonitorOptions opt;
    {
        MonitorEngine e(opt);
        for (int i = 0; i < 59; ++i) e.ingest(Sample{72.0, static_cast<double>(i), ActivityMode::RESTING});
        check(!e.evaluatePeriodic(100).evaluated, "periodic no-op below 60 samples");
        e.ingest(Sample{72.0, 59, ActivityMode::RESTING});
        auto r = e.evaluatePeriodic(100);
        check(r.evaluated && std::fabs(r.score - 0.4) < 1e-9 && !r.forcedCritical, "flat series scores 0.4");
    }
    {
        // Slow ramp: pNN50-like 0, wide spread, elevated mean -> score 1.0
        MonitorEngine e(opt);
        for (int i = 0; i < 300; ++i) e.ingest(Sample{60.0 + 0.8 * i, static_cast<double>(i), ActivityMode::RESTING});
        auto r = e.evaluatePeriodic(700.0);
        check(r.evaluated && std::fabs(r.score - 1.0) < 1e-9, "ramp scores 1.0");
        check(r.forcedCritical && e.alertStatus() == AlertStatus::CRITICAL, "score > 0.7 forces Critical");
        check(r.notification && r.notification->title == "Health Risk Detected", "periodic dispatch after cooldown");
        auto again = e.evaluatePeriodic(710.0);
        check(again.forcedCritical && !again.notification, "periodic dispatch respects cooldown");
    }
    {
        // Same ramp in exercise mode drops the elevated-mean term: 0.7 is not > 0.7
        MonitorEngine e(opt);
        for (int i = 0; i < 300; ++i) e.ingest(Sample{60.0 + 0.8 * i, static_cast<double>(i), ActivityMode::EXERCISE});
        auto r = e.evaluatePeriodic(700.0);
        check(r.evaluated && std::fabs(r.score - 0.7) < 1e-9 && !r.forcedCritical, "exercise ramp scores 0.7, not forced");
    }
    WindowFeatures f; f.mean = 110; f.stdev = 25; f.pnn50 = 0.01;
    check(coarseRiskScore(f, false) <= 1.0 && coarseRiskScore(f, false) >= 0.99, "score clamped to 1");
}

int main() {
    testZones();
    testAlertTransitions();
    testIrregularityOverlay();
    testOscillatingCooldown();
    testPeriodic();
    std::cout << (g_failures == 0 ? "ALL OK" : "FAILURES: " + std::to_string(g_failures)) << "\n";
    return g_failures == 0 ? 0 : 1;
}
