// MonitoringSession smoke test with fake sensor / store / notifier and a manual clock
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "../cpp/cardiowatch_stream.h"
#include "../cpp/cardiowatch_log.h"

static int g_failures = 0;
static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_failures;
}

using namespace cardiowatch;

class FakeSensor : public SensorSource {
public:
    bool available = true;
    bool authorized = true;
    std::optional<double> respiratoryRate;

    bool isAvailable() override { return available; }
    bool requestAuthorization() override { return authorized; }
    void subscribe(SampleCallback cb) override {
        std::lock_guard<std::mutex> lock(m_);
        cb_ = std::move(cb);
        ++subscribeCalls;
    }
    void unsubscribe() override {
        std::lock_guard<std::mutex> lock(m_);
        cb_ = nullptr;
    }
    std::optional<double> latestRespiratoryRate(double) override { return respiratoryRate; }
    bool emit(double value, double ts, ActivityMode mode = ActivityMode::RESTING) {
        std::lock_guard<std::mutex> lock(m_);
        if (!cb_) return false;
        cb_(value, ts, mode);
        return true;
    }
    bool subscribed() { std::lock_guard<std::mutex> lock(m_); return static_cast<bool>(cb_); }
    int subscribeCalls = 0;
private:
    std::mutex m_;
    SampleCallback cb_;
};

// Scripted notifier: outcome i applies to the i-th dispatch ("ok", "fail", "throw")
class FakeNotifier : public Notifier {
public:
    std::vector<std::string> script;
    bool dispatch(const std::string& title, const std::string&, Urgency) override {
        std::lock_guard<std::mutex> lock(m_);
        const std::string outcome = calls < script.size() ? script[calls] : "ok";
        ++calls;
        if (outcome == "throw") throw std::runtime_error("notification service down");
        if (outcome == "fail") return false;
        titles.push_back(title);
        return true;
    }
    std::vector<std::string> delivered() { std::lock_guard<std::mutex> lock(m_); return titles; }
private:
    std::mutex m_;
    size_t calls = 0;
    std::vector<std::string> titles;
};

class SwitchableStore : public InMemoryAssessmentStore {
public:
    std::atomic<bool> failing{false};
    bool save(const Assessment& a, const HealthInputs& in) override {
        if (failing.load()) return false;
        return InMemoryAssessmentStore::save(a, in);
    }
};

// Scripted store: step i applies to the i-th save ("ok", "fail", "throw" a plain int)
class ScriptedStore : public InMemoryAssessmentStore {
public:
    std::vector<std::string> script;
    bool save(const Assessment& a, const HealthInputs& in) override {
        std::string step = "ok";
        {
            std::lock_guard<std::mutex> lock(m_);
            if (calls < script.size()) step = script[calls];
            ++calls;
        }
        if (step == "throw") throw 42;
        if (step == "fail") return false;
        return InMemoryAssessmentStore::save(a, in);
    }
private:
    std::mutex m_;
    size_t calls = 0;
};

class RecordingListener : public SessionListener {
public:
    void onAssessment(const Assessment& a) override {
        std::lock_guard<std::mutex> lock(m_);
        statuses.push_back(a.overallStatus);
    }
    void onCriticalCondition(const CriticalCheck& c, double) override {
        std::lock_guard<std::mutex> lock(m_);
        critical.push_back(c.message);
    }
    void onAlert(const Notification& n) override {
        std::unique_lock<std::mutex> lock(m_);
        alerts.push_back(n.title);
        if (blockAlerts) {
            entered = true;
            cv_.notify_all();
            cv_.wait(lock, [&] { return !blockAlerts; });
        }
    }
    void waitEntered() {
        std::unique_lock<std::mutex> lock(m_);
        cv_.wait_for(lock, std::chrono::seconds(5), [&] { return entered; });
    }
    void release() {
        std::lock_guard<std::mutex> lock(m_);
        blockAlerts = false;
        cv_.notify_all();
    }
    std::vector<std::string> criticalMessages() { std::lock_guard<std::mutex> lock(m_); return critical; }
    size_t assessmentCount() { std::lock_guard<std::mutex> lock(m_); return statuses.size(); }

    bool blockAlerts = false;
private:
    std::mutex m_;
    std::condition_variable cv_;
    bool entered = false;
    std::vector<std::string> statuses;
    std::vector<std::string> critical;
    std::vector<std::string> alerts;
};

static void testLifecycle() {
    auto sensor = std::make_shared<FakeSensor>();
    auto store = std::make_shared<SwitchableStore>();
    auto notifier = std::make_shared<FakeNotifier>();
    MonitoringSession s(sensor, store, notifier);
    check(s.start() && s.isRunning(), "start");
    check(s.start() && sensor->subscribeCalls == 1, "second start is a no-op");
    for (int i = 0; i < 10; ++i) sensor->emit(72.0, i);
    sensor->emit(500.0, 10.0);
    check(s.flush(), "flush");
    check(s.windowSize() == 10 && s.recentSamples().size() == 10, "samples reach both buffers");
    SessionStats st = s.stats();
    check(st.samplesAccepted == 10 && st.samplesRejected == 1, "invalid sample rejected at the producer");
    check(s.currentZone() == Zone::NORMAL && s.alertStatus() == AlertStatus::NORMAL, "live state readable");
    s.stop();
    check(!s.isRunning() && s.windowSize() == 0 && s.recentSamples().empty(), "stop clears buffers");
    check(!sensor->subscribed() && !s.postSample(72.0, 20.0, ActivityMode::RESTING), "no samples after stop");
    check(s.start() && sensor->subscribeCalls == 2, "restart resubscribes");
    sensor->emit(80.0, 30.0);
    check(s.flush() && s.windowSize() == 1, "restarted session starts empty");
    s.stop();

    auto off = std::make_shared<FakeSensor>();
    off->available = false;
    MonitoringSession s2(off, store, notifier);
    const char* code = nullptr; std::string msg;
    check(!s2.start(&code, &msg) && code && std::string(code) == "CARDIOWATCH_E010", "unavailable sensor -> E010");
    auto denied = std::make_shared<FakeSensor>();
    denied->authorized = false;
    MonitoringSession s3(denied, store, notifier);
    code = nullptr;
    check(!s3.start(&code, &msg) && code && std::string(code) == "CARDIOWATCH_E011", "permission denied -> E011");
    MonitorOptions bad;
    bad.channelCapacity = 0;
    MonitoringSession s4(sensor, store, notifier, bad);
    code = nullptr;
    check(!s4.start(&code, &msg) && code && std::string(code) == "CARDIOWATCH_E001" && !s4.isRunning(),
          "invalid options rejected at start");
}

static void testAssessmentCycle() {
    auto sensor = std::make_shared<FakeSensor>();
    auto store = std::make_shared<SwitchableStore>();
    auto notifier = std::make_shared<FakeNotifier>();
    std::atomic<double> clock{1000.0};
    MonitoringSession s(sensor, store, notifier);
    s.setClock([&] { return clock.load(); });
    RecordingListener listener;
    s.setListener(&listener);
    s.start();

    check(s.requestAssessment() && s.flush() && !s.latestAssessment(), "no assessment below 5 samples");
    for (int i = 0; i < 10; ++i) sensor->emit(72.0, i);
    s.requestAssessment();
    s.flush();
    auto latest = s.latestAssessment();
    check(latest && latest->timestamp == 1000.0 && latest->overallStatus == "Healthy", "assessment published");
    check(store->size() == 1 && listener.assessmentCount() == 1, "assessment persisted and reported");
    check(s.cache()->isAvailable(1000.0 + 3600.0) && !s.cache()->isAvailable(1000.0 + 3601.0), "cached for one hour");

    sensor->respiratoryRate = 30.0;
    clock = 1010.0;
    s.requestAssessment();
    s.flush();
    auto crit = listener.criticalMessages();
    check(crit.size() == 1 && crit[0].find("Abnormal respiratory") == 0, "critical condition surfaced to listener");
    check(s.latestAssessment()->critical.isCritical, "critical result kept on the assessment");
    check(notifier->delivered().empty(), "critical pre-check does not raise notifications");
    sensor->respiratoryRate.reset();

    // Persistence outage: results queue in the cache and replay once the store recovers
    store->failing = true;
    clock = 1020.0; s.requestAssessment();
    clock = 1030.0; s.requestAssessment();
    s.flush();
    check(s.stats().persistFailures == 2 && s.cache()->pendingCount() == 2, "failed writes queued");
    check(s.latestAssessment()->timestamp == 1030.0, "assessment still published during outage");
    store->failing = false;
    clock = 1040.0; s.requestAssessment();
    s.flush();
    check(s.stats().replayed == 2 && s.cache()->pendingCount() == 0 && store->size() == 5, "queued writes replayed");
    auto rows = store->query(1, 1040.0);
    check(rows.size() == 5 && rows.front().assessment.timestamp == 1040.0, "store holds every assessment");
    s.stop();
}

static void testNotifications() {
    auto sensor = std::make_shared<FakeSensor>();
    auto store = std::make_shared<SwitchableStore>();
    auto notifier = std::make_shared<FakeNotifier>();
    notifier->script = {"fail", "throw", "ok"};
    MonitorOptions opt;
    opt.notificationCooldownSec = 0.0;
    MonitoringSession s(sensor, store, notifier, opt);
    s.start();
    double t = 0.0;
    for (double v : {125.0, 72.0, 40.0, 72.0, 125.0}) sensor->emit(v, t++);
    s.flush();
    SessionStats st = s.stats();
    check(st.notificationsDispatched == 3, "three transitions dispatched");
    check(st.notifierFailures == 2, "failed and throwing notifier counted");
    auto delivered = notifier->delivered();
    check(delivered.size() == 1 && delivered[0] == "High Resting Heart Rate", "session survives notifier errors");
    check(s.alertStatus() == AlertStatus::CRITICAL, "alert state tracks the last sample");
    s.stop();
}

static void testTicks() {
    auto sensor = std::make_shared<FakeSensor>();
    auto store = std::make_shared<SwitchableStore>();
    auto notifier = std::make_shared<FakeNotifier>();
    MonitorOptions opt;
    opt.tickIntervalSec = 0.05;
    MonitoringSession s(sensor, store, notifier, opt);
    s.start();
    for (int i = 0; i < 8; ++i) sensor->emit(70.0 + i, i);
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    s.flush();
    SessionStats st = s.stats();
    check(st.ticks >= 2, "timer posts periodic ticks (" + std::to_string(st.ticks) + ")");
    check(st.assessments >= 1 && s.latestAssessment().has_value(), "ticks run the assessment cycle");
    s.stop();
    const unsigned long long after = s.stats().ticks;
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    check(s.stats().ticks == after, "timer stops with the session");
}

static void testBackpressure() {
    auto sensor = std::make_shared<FakeSensor>();
    auto store = std::make_shared<SwitchableStore>();
    auto notifier = std::make_shared<FakeNotifier>();
    MonitorOptions opt;
    opt.channelCapacity = 4;
    MonitoringSession s(sensor, store, notifier, opt);
    RecordingListener listener;
    listener.blockAlerts = true;
    s.setListener(&listener);
    s.start();
    sensor->emit(125.0, 0.0);      // worker blocks in onAlert
    listener.waitEntered();
    int accepted = 0;
    for (int i = 1; i <= 20; ++i)
        if (s.postSample(72.0, i, ActivityMode::RESTING)) ++accepted;
    check(accepted == 4, "channel accepts up to its capacity");
    check(s.requestTick(), "control events bypass the sample bound");
    listener.release();
    check(s.flush(), "flush after release");
    SessionStats st = s.stats();
    check(st.samplesDropped == 16 && st.samplesAccepted == 5, "overflow samples dropped and counted");
    check(st.ticks == 1, "queued tick processed");
    s.stop();
}

// Session clock on the epoch while the sensor stamps seconds since boot:
// periodic escalations must not silence later sample-driven alerts.
static void testSensorTimeCooldown() {
    auto sensor = std::make_shared<FakeSensor>();
    auto store = std::make_shared<SwitchableStore>();
    auto notifier = std::make_shared<FakeNotifier>();
    MonitorOptions opt;
    opt.irregularityStdThreshold = 200.0; // resting transitions only
    MonitoringSession s(sensor, store, notifier, opt);
    s.setClock([] { return 1.7e9; });
    s.start();

    const double boot = 1000.0;
    for (int i = 0; i < 300; ++i) sensor->emit(101.0 + 74.0 * i / 299.0, boot + 2.0 * i);
    s.flush();
    s.requestTick();
    s.flush();
    auto delivered = notifier->delivered();
    check(delivered.size() == 2 && delivered[1] == "Health Risk Detected", "periodic escalation dispatched");

    double t = boot + 598.0;
    for (int k = 0; k < 5; ++k) {
        t += 3600.0;
        sensor->emit(70.0, t);
        sensor->emit(40.0, t + 1.0);
    }
    s.flush();
    delivered = notifier->delivered();
    size_t low = 0;
    for (const auto& title : delivered) if (title == "Low Heart Rate Detected") ++low;
    check(low == 5, "hourly low heart rate alerts dispatched after the escalation (" + std::to_string(low) + ")");
    check(s.stats().notificationsSuppressed == 0, "nothing suppressed across the two clocks");
    s.stop();
}

class ThrowingListener : public SessionListener {
public:
    void onAssessment(const Assessment&) override { throw 42; }
};

static void testNonStandardExceptions() {
    auto sensor = std::make_shared<FakeSensor>();
    auto store = std::make_shared<ScriptedStore>();
    store->script = {"fail", "ok", "throw"};
    auto notifier = std::make_shared<FakeNotifier>();
    std::atomic<double> clock{5000.0};
    MonitoringSession s(sensor, store, notifier);
    s.setClock([&] { return clock.load(); });
    s.start();
    for (int i = 0; i < 10; ++i) sensor->emit(72.0, i);

    clock = 5010.0; s.requestAssessment();   // save fails, queued
    clock = 5020.0; s.requestAssessment();   // save ok, replay throws 42
    check(s.flush(), "worker alive after a replay throw");
    check(s.isRunning() && s.stats().persistFailures == 1 && s.cache()->pendingCount() == 1,
          "record kept queued when replay throws");
    check(s.stats().replayed == 0 && store->size() == 1, "nothing counted as replayed");
    clock = 5030.0; s.requestAssessment();
    s.flush();
    check(s.cache()->pendingCount() == 0 && s.stats().replayed == 1 && store->size() == 3,
          "queued record replayed on the next successful write");

    ThrowingListener throwing;
    s.setListener(&throwing);
    clock = 5040.0; s.requestAssessment();
    check(s.flush(), "worker survives a listener throwing a non-standard exception");
    sensor->emit(73.0, 10.0);
    check(s.flush() && s.windowSize() == 11, "samples still processed afterwards");
    s.setListener(nullptr);
    s.stop();
}

int main() {
    cardiowatch::setLogLevel(cardiowatch::LogLevel::WARN);
    testLifecycle();
    testAssessmentCycle();
    testNotifications();
    testTicks();
    testBackpressure();
    testSensorTimeCooldown();
    testNonStandardExceptions();
    std::cout << (g_failures == 0 ? "ALL OK" : "FAILURES: " + std::to_string(g_failures)) << "\n";
    return g_failures == 0 ? 0 : 1;
}
