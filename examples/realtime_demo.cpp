// Simulated monitoring run: synthetic sensor -> session -> console notifier.
// Usage: realtime_demo [options.kv] [export.csv]
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include "../cpp/cardiowatch_stream.h"
#include "../cpp/cardiowatch_export.h"
#include "../cpp/cardiowatch_log.h"
#include "../cpp/cw_options_builder.h"

using namespace cardiowatch;

// Replays a scripted hour: calm rest, a tachycardic spell, a workout, recovery.
// One sample per simulated second, fed as fast as the session accepts them.
class SimulatedSensor : public SensorSource {
public:
    bool isAvailable() override { return true; }
    bool requestAuthorization() override { return true; }
    void subscribe(SampleCallback cb) override {
        std::lock_guard<std::mutex> lock(m_);
        cb_ = std::move(cb);
    }
    void unsubscribe() override {
        std::lock_guard<std::mutex> lock(m_);
        cb_ = nullptr;
    }
    std::optional<double> latestRespiratoryRate(double) override { return 15.0; }
    std::optional<double> latestActivityEnergy(double) override { return 320.0; }
    std::optional<double> latestSleepRatio(double) override { return 0.78; }
    std::optional<double> latestHrv(double) override { return 48.0; }

    // Emits sample `sec` of the script; returns the simulated timestamp
    double emit(int sec, double t0) {
        uint32_t& s = seed_;
        s = 1664525u * s + 1013904223u;
        const double noise = (static_cast<double>(s % 1000) / 1000.0 - 0.5) * 4.0;
        double value = 68.0 + 3.0 * std::sin(sec / 30.0) + noise;
        ActivityMode mode = ActivityMode::RESTING;
        if (sec >= 900 && sec < 1020) value = 118.0 + noise;           // resting tachycardia
        else if (sec >= 1800 && sec < 2700) {                          // workout
            mode = ActivityMode::EXERCISE;
            value = 110.0 + 75.0 * std::min(1.0, (sec - 1800) / 600.0) + noise;
        } else if (sec >= 2700 && sec < 2760) value = 45.0 + noise;    // dip after the workout
        const double ts = t0 + sec;
        std::lock_guard<std::mutex> lock(m_);
        if (cb_) cb_(value, ts, mode);
        return ts;
    }

private:
    std::mutex m_;
    SampleCallback cb_;
    uint32_t seed_ = 20240611u;
};

class ConsoleNotifier : public Notifier {
public:
    bool dispatch(const std::string& title, const std::string& body, Urgency urgency) override {
        std::printf("[notify:%s] %s - %s\n", urgencyName(urgency), title.c_str(), body.c_str());
        return true;
    }
};

class ConsoleListener : public SessionListener {
public:
    void onAssessment(const Assessment& a) override {
        std::printf("[assessment t=%.0f] %s | rhythm %s (%.2f) risk %s (%.2f) pattern %s | fitness %.1f %s\n",
                    a.timestamp, a.overallStatus.c_str(), a.rhythm.label.c_str(), a.rhythm.confidence,
                    a.risk.label.c_str(), a.risk.confidence, a.pattern.label.c_str(),
                    a.fitness.fitnessLevel, a.fitness.fitnessCategory.c_str());
    }
    void onCriticalCondition(const CriticalCheck& c, double ts) override {
        std::printf("[critical t=%.0f] %s\n", ts, c.message.c_str());
    }
};

int main(int argc, char** argv) {
    MonitorOptions opt;
    if (argc > 1) {
        std::ifstream f(argv[1]);
        if (!f) {
            std::fprintf(stderr, "cannot read options file %s\n", argv[1]);
            return 2;
        }
        std::stringstream ss; ss << f.rdbuf();
        bool ok = false; const char* code = nullptr; std::string msg;
        opt = cw_build_options_from_kv(ss.str(), &ok, &code, &msg);
        if (!ok) {
            std::fprintf(stderr, "invalid options (%s): %s\n", code ? code : "?", msg.c_str());
            return 2;
        }
    }

    auto sensor = std::make_shared<SimulatedSensor>();
    auto store = std::make_shared<InMemoryAssessmentStore>();
    auto notifier = std::make_shared<ConsoleNotifier>();
    MonitoringSession session(sensor, store, notifier, opt);

    std::atomic<double> simNow{1700000000.0};
    const double t0 = simNow.load();
    session.setClock([&] { return simNow.load(); });
    ConsoleListener listener;
    session.setListener(&listener);

    const char* code = nullptr; std::string msg;
    if (!session.start(&code, &msg)) {
        std::fprintf(stderr, "start failed (%s): %s\n", code ? code : "?", msg.c_str());
        return 1;
    }

    // Simulated ticks follow the configured cadence in sample time
    const int tickEvery = std::max(1, static_cast<int>(std::lround(opt.tickIntervalSec)));
    for (int sec = 0; sec < 3600; ++sec) {
        simNow = sensor->emit(sec, t0);
        if ((sec + 1) % tickEvery == 0) {
            session.flush();
            session.requestTick();
        }
    }
    session.flush();

    const SessionStats st = session.stats();
    std::printf("samples accepted=%llu rejected=%llu dropped=%llu ticks=%llu assessments=%llu\n",
                st.samplesAccepted, st.samplesRejected, st.samplesDropped, st.ticks, st.assessments);
    std::printf("notifications dispatched=%llu suppressed=%llu\n",
                st.notificationsDispatched, st.notificationsSuppressed);

    const auto records = store->query(1, simNow.load());
    const HealthTrends trends = summarizeTrends(records);
    std::printf("trend over %zu record(s): avg HR %.1f, risk %s\n",
                trends.recordCount, trends.averageHeartRate, riskTrendName(trends.riskTrend));

    if (argc > 2) {
        if (!writeCsvFile(argv[2], records, &code, &msg)) {
            std::fprintf(stderr, "export failed (%s): %s\n", code ? code : "?", msg.c_str());
            session.stop();
            return 1;
        }
        std::printf("exported %zu row(s) to %s\n", records.size(), argv[2]);
    }
    session.stop();
    return 0;
}
