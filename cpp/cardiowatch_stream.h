// Live monitoring: buffers, alert engine, periodic evaluator and session threads
#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "cardiowatch_core.h"
#include "cardiowatch_cache.h"
#include "cardiowatch_store.h"

namespace cardiowatch {

// Fixed-capacity FIFO ring buffer; pushing past capacity overwrites the oldest
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t cap) : buf_(cap == 0 ? 1 : cap) {}
    size_t capacity() const { return buf_.size(); }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    void push_back(const T& v) {
        const size_t cap = buf_.size();
        if (size_ == cap) {
            buf_[head_] = v;
            head_ = (head_ + 1) % cap;
            return;
        }
        buf_[(head_ + size_++) % cap] = v;
    }
    // i-th element from oldest (0..size-1)
    const T& at(size_t i) const { return buf_[(head_ + i) % buf_.size()]; }
    const T& back() const { return at(size_ - 1); }
    // Copies oldest..newest into `out`
    void snapshot(std::vector<T>& out) const {
        out.clear();
        out.reserve(size_);
        for (size_t i = 0; i < size_; ++i) out.push_back(at(i));
    }
    // Last min(n, size) elements, oldest..newest
    std::vector<T> recent(size_t n) const {
        n = std::min(n, size_);
        std::vector<T> out;
        out.reserve(n);
        for (size_t i = size_ - n; i < size_; ++i) out.push_back(at(i));
        return out;
    }
    void clear() { head_ = 0; size_ = 0; }
private:
    std::vector<T> buf_;
    size_t head_{0};
    size_t size_{0};
};

struct Notification {
    std::string title;
    std::string body;
    Urgency urgency = Urgency::MEDIUM;
    AlertStatus status = AlertStatus::NORMAL;
    double timestamp = 0.0;
};

// Edge-triggered, cooldown-gated alert state machine
class AlertEngine {
public:
    explicit AlertEngine(const MonitorOptions& opt = {}) : opt_(opt) {}

    // Evaluates one validated sample. `window` is the feature window after the
    // sample was appended. Returns the notification to dispatch, if any.
    std::optional<Notification> onSample(const Sample& s, const RingBuffer<double>& window);
    // Periodic evaluator escalation: state becomes Critical, dispatch is only
    // subject to the cooldown.
    std::optional<Notification> forceCritical(double now);

    AlertStatus status() const { return status_; }
    std::optional<double> lastNotifiedAt() const { return lastNotifiedAt_; }
    unsigned long long dispatchedTotal() const { return dispatchedTotal_; }
    unsigned long long suppressedTotal() const { return suppressedTotal_; }
    void reset() { status_ = AlertStatus::NORMAL; lastNotifiedAt_.reset(); }

private:
    bool cooldownElapsed(double now) const;
    std::optional<Notification> gate(Notification n);

    MonitorOptions opt_;
    AlertStatus status_{AlertStatus::NORMAL};
    std::optional<double> lastNotifiedAt_;
    unsigned long long dispatchedTotal_{0};
    unsigned long long suppressedTotal_{0};
};

// Coarse score over the feature window: 0.3 elevated mean at rest, 0.3 high
// dispersion, 0.4 low pNN50-like ratio. Clamped to [0,1].
double coarseRiskScore(const WindowFeatures& f, bool exercise);

// Sensor collaborator
class SensorSource {
public:
    using SampleCallback = std::function<void(double value, double timestamp, ActivityMode mode)>;
    virtual ~SensorSource() = default;
    virtual bool isAvailable() = 0;
    virtual bool requestAuthorization() = 0;
    // At most one active subscription; after unsubscribe() returns no
    // further callbacks are delivered.
    virtual void subscribe(SampleCallback cb) = 0;
    virtual void unsubscribe() = 0;
    virtual std::optional<double> latestRespiratoryRate(double /*rangeSec*/) { return std::nullopt; }
    virtual std::optional<double> latestActivityEnergy(double /*rangeSec*/) { return std::nullopt; }
    virtual std::optional<double> latestSleepRatio(double /*rangeSec*/) { return std::nullopt; }
    virtual std::optional<double> latestHrv(double /*rangeSec*/) { return std::nullopt; }
};

// Notification collaborator
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual bool dispatch(const std::string& title, const std::string& body, Urgency urgency) = 0;
};

// Single-writer core holding both buffers and the alert engine. Not thread-safe.
class MonitorEngine {
public:
    struct IngestResult {
        bool accepted = false;
        Zone zone = Zone::RESTING;
        AlertStatus status = AlertStatus::NORMAL;
        std::optional<Notification> notification;
    };
    struct PeriodicResult {
        bool evaluated = false;
        WindowFeatures features {};
        double score = 0.0;
        bool forcedCritical = false;
        std::optional<Notification> notification;
    };

    explicit MonitorEngine(const MonitorOptions& opt = {});

    IngestResult ingest(const Sample& s);
    PeriodicResult evaluatePeriodic(double now);
    // Snapshot of window statistics plus ancillary pulls (defaults when absent)
    HealthInputs buildInputs(SensorSource* sensor) const;
    void clear();

    Zone currentZone() const { return zone_; }
    AlertStatus alertStatus() const { return alerts_.status(); }
    ActivityMode lastMode() const { return lastMode_; }
    const RingBuffer<Sample>& recent() const { return recent_; }
    const RingBuffer<double>& window() const { return window_; }
    // Timestamp of the newest accepted sample; alert cooldowns run on this clock
    std::optional<double> lastSampleTime() const {
        if (recent_.empty()) return std::nullopt;
        return recent_.back().timestamp;
    }
    const AlertEngine& alerts() const { return alerts_; }
    const MonitorOptions& options() const { return opt_; }
    unsigned long long acceptedTotal() const { return acceptedTotal_; }
    unsigned long long rejectedTotal() const { return rejectedTotal_; }

private:
    MonitorOptions opt_;
    RingBuffer<Sample> recent_;
    RingBuffer<double> window_;
    AlertEngine alerts_;
    Zone zone_{Zone::RESTING};
    ActivityMode lastMode_{ActivityMode::RESTING};
    unsigned long long acceptedTotal_{0};
    unsigned long long rejectedTotal_{0};
};

// Callbacks run on the session worker thread
class SessionListener {
public:
    virtual ~SessionListener() = default;
    virtual void onAssessment(const Assessment& /*a*/) {}
    virtual void onCriticalCondition(const CriticalCheck& /*c*/, double /*timestamp*/) {}
    virtual void onAlert(const Notification& /*n*/) {}
};

struct SessionStats {
    unsigned long long samplesAccepted = 0;
    unsigned long long samplesRejected = 0;    // failed validation
    unsigned long long samplesDropped = 0;     // channel full
    unsigned long long ticks = 0;
    unsigned long long assessments = 0;
    unsigned long long notificationsDispatched = 0;
    unsigned long long notificationsSuppressed = 0; // cooldown
    unsigned long long notifierFailures = 0;
    unsigned long long persistFailures = 0;
    unsigned long long replayed = 0;
};

// Bounded multi-producer / single-consumer queue. Only push() honours the
// capacity; pushControl() always enqueues.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t cap) : cap_(cap == 0 ? 1 : cap) {}
    bool push(T v) {
        std::lock_guard<std::mutex> lock(m_);
        if (closed_ || bounded_ >= cap_) return false;
        q_.push_back(Item{std::move(v), true});
        ++bounded_;
        cv_.notify_one();
        return true;
    }
    bool pushControl(T v) {
        std::lock_guard<std::mutex> lock(m_);
        if (closed_) return false;
        q_.push_back(Item{std::move(v), false});
        cv_.notify_one();
        return true;
    }
    // Blocks until an item is available or the channel is closed and drained
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(m_);
        cv_.wait(lock, [&] { return closed_ || !q_.empty(); });
        if (q_.empty()) return false;
        Item it = std::move(q_.front());
        q_.pop_front();
        if (it.bounded) --bounded_;
        out = std::move(it.value);
        return true;
    }
    void close() {
        std::lock_guard<std::mutex> lock(m_);
        closed_ = true;
        cv_.notify_all();
    }
    void reopen() {
        std::lock_guard<std::mutex> lock(m_);
        q_.clear();
        bounded_ = 0;
        closed_ = false;
    }
    size_t size() const { std::lock_guard<std::mutex> lock(m_); return q_.size(); }
private:
    struct Item { T value; bool bounded; };
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<Item> q_;
    size_t cap_;
    size_t bounded_{0};
    bool closed_{false};
};

// One monitoring run per start(). Producer (sensor callback) -> bounded
// channel -> worker thread owning the MonitorEngine; a timer thread posts
// periodic ticks; notifications go through a dispatcher thread.
class MonitoringSession {
public:
    using Clock = std::function<double()>; // seconds

    MonitoringSession(std::shared_ptr<SensorSource> sensor,
                      std::shared_ptr<AssessmentStore> store,
                      std::shared_ptr<Notifier> notifier,
                      const MonitorOptions& opt = {},
                      std::shared_ptr<OfflineCache> cache = nullptr);
    ~MonitoringSession();
    MonitoringSession(const MonitoringSession&) = delete;
    MonitoringSession& operator=(const MonitoringSession&) = delete;

    // Errors: CARDIOWATCH_E010 (sensor unavailable), CARDIOWATCH_E011 (denied),
    // option codes from cw_validate_options. Starting a running session is a no-op.
    bool start(const char** err_code = nullptr, std::string* err_msg = nullptr);
    void stop();
    bool isRunning() const { return running_.load(); }

    // Producer path. Returns false when the sample is invalid, the channel is
    // full or the session is not running. Never blocks on the worker.
    bool postSample(double value, double timestamp, ActivityMode mode);
    // Posts a periodic tick / an on-demand assessment cycle
    bool requestTick();
    bool requestAssessment();
    // Waits until everything posted so far has been processed and queued
    // notifications have been handed to the notifier.
    bool flush(double timeoutSec = 5.0);

    // Must be set before start()
    void setClock(Clock c) { clock_ = std::move(c); }
    void setListener(SessionListener* l) { listener_.store(l); }

    std::optional<Assessment> latestAssessment() const { std::lock_guard<std::mutex> lock(dataMutex_); return latest_; }
    Zone currentZone() const { std::lock_guard<std::mutex> lock(dataMutex_); return engine_.currentZone(); }
    AlertStatus alertStatus() const { std::lock_guard<std::mutex> lock(dataMutex_); return engine_.alertStatus(); }
    std::vector<Sample> recentSamples() const;
    size_t windowSize() const { std::lock_guard<std::mutex> lock(dataMutex_); return engine_.window().size(); }
    SessionStats stats() const;
    std::shared_ptr<OfflineCache> cache() const { return cache_; }
    const MonitorOptions& options() const { return opt_; }

private:
    enum class EventType { SAMPLE, TICK, ASSESS, FLUSH };
    struct Event {
        EventType type = EventType::SAMPLE;
        Sample sample {};
        std::shared_ptr<std::promise<void>> done;
    };

    void workerLoop();
    void timerLoop();
    void dispatcherLoop();
    void handleSample(const Sample& s);
    void handleTick(double now);
    void runAssessmentCycle(double now);
    void persist(const Assessment& a, const HealthInputs& in);
    void enqueueNotification(const Notification& n);
    double now() const { return clock_(); }

    std::shared_ptr<SensorSource> sensor_;
    std::shared_ptr<AssessmentStore> store_;
    std::shared_ptr<Notifier> notifier_;
    std::shared_ptr<OfflineCache> cache_;
    MonitorOptions opt_;
    Clock clock_;
    std::atomic<SessionListener*> listener_{nullptr};

    // Worker-owned state, guarded for consumer reads
    mutable std::mutex dataMutex_;
    MonitorEngine engine_;
    std::optional<Assessment> latest_;

    BoundedChannel<Event> channel_;
    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    std::thread timer_;
    std::thread dispatcher_;

    std::mutex timerMutex_;
    std::condition_variable timerCv_;
    bool timerStop_{false};

    std::mutex notifyMutex_;
    std::condition_variable notifyCv_;
    std::condition_variable notifyIdleCv_;
    std::deque<Notification> notifyQueue_;
    bool notifyBusy_{false};
    bool notifyStop_{false};

    std::atomic<unsigned long long> droppedTotal_{0};
    std::atomic<unsigned long long> rejectedTotal_{0};
    std::atomic<unsigned long long> ticksTotal_{0};
    std::atomic<unsigned long long> assessmentsTotal_{0};
    std::atomic<unsigned long long> notifierFailuresTotal_{0};
    std::atomic<unsigned long long> persistFailuresTotal_{0};
    std::atomic<unsigned long long> replayedTotal_{0};
};

} // namespace cardiowatch
