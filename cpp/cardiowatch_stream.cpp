#include "cardiowatch_stream.h"
#include "cardiowatch_log.h"
#include "cw_options_builder.h"

#include <chrono>
#include <cmath>
#include <exception>

namespace cardiowatch {

namespace {
constexpr const char* kTag = "CWStream";
constexpr double kScoreEps = 1e-9;

double systemNowSec() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}
}

// ------------------------------------------------------------------
// AlertEngine
// ------------------------------------------------------------------

bool AlertEngine::cooldownElapsed(double now) const {
    if (!lastNotifiedAt_) return true;
    const double elapsed = now - *lastNotifiedAt_;
    // out-of-order clocks count as inside the cooldown
    if (!(elapsed >= 0.0)) return false;
    return elapsed >= opt_.notificationCooldownSec;
}

std::optional<Notification> AlertEngine::gate(Notification n) {
    if (!cooldownElapsed(n.timestamp)) {
        ++suppressedTotal_;
        CW_LOGD(kTag, "notification suppressed by cooldown: %s", n.title.c_str());
        return std::nullopt;
    }
    lastNotifiedAt_ = n.timestamp;
    ++dispatchedTotal_;
    return n;
}

std::optional<Notification> AlertEngine::onSample(const Sample& s, const RingBuffer<double>& window) {
    const AlertStatus previous = status_;
    const int bpm = static_cast<int>(s.value);
    const bool exercise = s.mode == ActivityMode::EXERCISE;

    AlertStatus next = AlertStatus::NORMAL;
    Notification n;
    n.timestamp = s.timestamp;

    if (exercise) {
        if (s.value > opt_.exerciseHighThreshold) {
            next = AlertStatus::WARNING;
            n.title = "High Heart Rate During Exercise";
            n.body = "Your heart rate is " + std::to_string(bpm) + " bpm. Consider reducing intensity.";
            n.urgency = Urgency::MEDIUM;
        }
    } else {
        if (s.value > opt_.restingHighThreshold) {
            next = AlertStatus::CRITICAL;
            n.title = "High Resting Heart Rate";
            n.body = "Your resting heart rate is " + std::to_string(bpm) + " bpm. This may require attention.";
            n.urgency = Urgency::HIGH;
        } else if (s.value > 0.0 && s.value < opt_.restingLowThreshold) {
            next = AlertStatus::WARNING;
            n.title = "Low Heart Rate Detected";
            n.body = "Your heart rate is " + std::to_string(bpm) + " bpm. Monitor for symptoms.";
            n.urgency = Urgency::MEDIUM;
        }
    }

    // Irregularity overlay over the newest samples of the feature window
    const size_t need = static_cast<size_t>(std::max(2, opt_.irregularityMinSamples));
    if (!exercise && next == AlertStatus::NORMAL && window.size() >= need) {
        if (std_pop(window.recent(need)) > opt_.irregularityStdThreshold) {
            next = AlertStatus::MONITORING;
            n.title = "Irregular Heart Rhythm Detected";
            n.body = "Your heart rhythm appears irregular. Opening live monitor.";
            n.urgency = Urgency::MEDIUM;
        }
    }

    status_ = next;
    n.status = next;
    if (next == previous || next == AlertStatus::NORMAL) return std::nullopt;
    return gate(std::move(n));
}

std::optional<Notification> AlertEngine::forceCritical(double now) {
    status_ = AlertStatus::CRITICAL;
    Notification n;
    n.title = "Health Risk Detected";
    n.body = "Automated analysis detected a potential health risk. Please review your data.";
    n.urgency = Urgency::HIGH;
    n.status = AlertStatus::CRITICAL;
    n.timestamp = now;
    return gate(std::move(n));
}

double coarseRiskScore(const WindowFeatures& f, bool exercise) {
    double score = 0.0;
    if (f.mean > 100.0 && !exercise) score += 0.3;
    if (f.stdev > 20.0) score += 0.3;
    if (f.pnn50 < 0.05) score += 0.4;
    return std::clamp(score, 0.0, 1.0);
}

// ------------------------------------------------------------------
// MonitorEngine
// ------------------------------------------------------------------

MonitorEngine::MonitorEngine(const MonitorOptions& opt)
    : opt_(opt),
      recent_(static_cast<size_t>(std::max(1, opt.recentCapacity))),
      window_(static_cast<size_t>(std::max(1, opt.windowCapacity))),
      alerts_(opt) {}

MonitorEngine::IngestResult MonitorEngine::ingest(const Sample& s) {
    IngestResult r;
    if (!isValidSample(s.value)) {
        ++rejectedTotal_;
        r.zone = zone_;
        r.status = alerts_.status();
        return r;
    }
    recent_.push_back(s);
    window_.push_back(s.value);
    ++acceptedTotal_;
    lastMode_ = s.mode;
    zone_ = classifyZone(s.value, s.mode, opt_.maxHeartRate);
    r.accepted = true;
    r.notification = alerts_.onSample(s, window_);
    r.zone = zone_;
    r.status = alerts_.status();
    return r;
}

MonitorEngine::PeriodicResult MonitorEngine::evaluatePeriodic(double now) {
    PeriodicResult r;
    if (window_.size() < static_cast<size_t>(std::max(0, opt_.periodicMinSamples)) || window_.empty()) return r;
    std::vector<double> values;
    window_.snapshot(values);
    r.evaluated = true;
    r.features = computeWindowFeatures(values);
    r.score = coarseRiskScore(r.features, lastMode_ == ActivityMode::EXERCISE);
    if (r.score > opt_.criticalRiskScore + kScoreEps) {
        r.forcedCritical = true;
        r.notification = alerts_.forceCritical(now);
    }
    return r;
}

HealthInputs MonitorEngine::buildInputs(SensorSource* sensor) const {
    HealthInputs in;
    window_.snapshot(in.recentHeartRates);
    const WindowFeatures f = computeWindowFeatures(in.recentHeartRates);
    in.meanHeartRate = f.mean;
    in.stdHeartRate = f.stdev;
    in.pnn50 = f.pnn50;
    if (sensor) {
        const double range = opt_.sensorRangeSec;
        in.respiratoryRate = sensor->latestRespiratoryRate(range).value_or(16.0);
        in.activityLevel = sensor->latestActivityEnergy(range).value_or(250.0);
        in.sleepQuality = sensor->latestSleepRatio(range).value_or(0.8);
        in.hrvMean = sensor->latestHrv(range).value_or(50.0);
    }
    return in;
}

void MonitorEngine::clear() {
    recent_.clear();
    window_.clear();
    alerts_.reset();
    zone_ = Zone::RESTING;
    lastMode_ = ActivityMode::RESTING;
}

// ------------------------------------------------------------------
// MonitoringSession
// ------------------------------------------------------------------

MonitoringSession::MonitoringSession(std::shared_ptr<SensorSource> sensor,
                                     std::shared_ptr<AssessmentStore> store,
                                     std::shared_ptr<Notifier> notifier,
                                     const MonitorOptions& opt,
                                     std::shared_ptr<OfflineCache> cache)
    : sensor_(std::move(sensor)),
      store_(std::move(store)),
      notifier_(std::move(notifier)),
      cache_(cache ? std::move(cache) : std::make_shared<OfflineCache>(
                                     opt.cacheExpirySec, static_cast<size_t>(std::max(1, opt.pendingCapacity)))),
      opt_(opt),
      clock_(&systemNowSec),
      engine_(opt),
      channel_(static_cast<size_t>(std::max(1, opt.channelCapacity))) {}

MonitoringSession::~MonitoringSession() {
    stop();
}

bool MonitoringSession::start(const char** err_code, std::string* err_msg) {
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    if (running_.load()) return true;

    const char* code = nullptr;
    std::string msg;
    if (!cw_validate_options(opt_, &code, &msg)) {
        if (err_code) *err_code = code;
        if (err_msg) *err_msg = msg;
        CW_LOGE(kTag, "start rejected: %s (%s)", msg.c_str(), code);
        return false;
    }
    bool available = false, authorized = false;
    try {
        available = sensor_ && sensor_->isAvailable();
        authorized = available && sensor_->requestAuthorization();
    } catch (const std::exception& e) {
        CW_LOGE(kTag, "sensor check threw: %s", e.what());
        available = false;
    }
    if (!available) {
        if (err_code) *err_code = "CARDIOWATCH_E010";
        if (err_msg) *err_msg = "Heart rate sensor unavailable";
        CW_LOGE(kTag, "start failed: sensor unavailable");
        return false;
    }
    if (!authorized) {
        if (err_code) *err_code = "CARDIOWATCH_E011";
        if (err_msg) *err_msg = "Heart rate sensor permission denied";
        CW_LOGE(kTag, "start failed: permission denied");
        return false;
    }

    channel_.reopen();
    {
        std::lock_guard<std::mutex> l(timerMutex_);
        timerStop_ = false;
    }
    {
        std::lock_guard<std::mutex> l(notifyMutex_);
        notifyStop_ = false;
        notifyQueue_.clear();
    }
    running_.store(true);
    dispatcher_ = std::thread(&MonitoringSession::dispatcherLoop, this);
    worker_ = std::thread(&MonitoringSession::workerLoop, this);
    timer_ = std::thread(&MonitoringSession::timerLoop, this);
    sensor_->subscribe([this](double value, double timestamp, ActivityMode mode) {
        postSample(value, timestamp, mode);
    });
    CW_LOGI(kTag, "monitoring started (recent=%d window=%d tick=%.1fs)",
            opt_.recentCapacity, opt_.windowCapacity, opt_.tickIntervalSec);
    return true;
}

void MonitoringSession::stop() {
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    if (!running_.load()) return;

    sensor_->unsubscribe();
    running_.store(false);
    {
        std::lock_guard<std::mutex> l(timerMutex_);
        timerStop_ = true;
    }
    timerCv_.notify_all();
    if (timer_.joinable()) timer_.join();

    // worker drains what is already queued, then exits
    channel_.close();
    if (worker_.joinable()) worker_.join();

    {
        std::lock_guard<std::mutex> l(notifyMutex_);
        notifyStop_ = true;
    }
    notifyCv_.notify_all();
    if (dispatcher_.joinable()) dispatcher_.join();

    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        engine_.clear();
    }
    CW_LOGI(kTag, "monitoring stopped (dropped=%llu rejected=%llu)",
            droppedTotal_.load(), rejectedTotal_.load());
}

bool MonitoringSession::postSample(double value, double timestamp, ActivityMode mode) {
    if (!running_.load()) return false;
    if (!isValidSample(value)) {
        rejectedTotal_.fetch_add(1);
        CW_LOGD(kTag, "sample rejected: %.2f", value);
        return false;
    }
    Event ev;
    ev.type = EventType::SAMPLE;
    ev.sample = Sample{value, timestamp, mode};
    if (!channel_.push(std::move(ev))) {
        unsigned long long n = droppedTotal_.fetch_add(1) + 1;
        if (n == 1 || n % 100 == 0) CW_LOGW(kTag, "channel full, %llu sample(s) dropped", n);
        return false;
    }
    return true;
}

bool MonitoringSession::requestTick() {
    if (!running_.load()) return false;
    Event ev;
    ev.type = EventType::TICK;
    return channel_.pushControl(std::move(ev));
}

bool MonitoringSession::requestAssessment() {
    if (!running_.load()) return false;
    Event ev;
    ev.type = EventType::ASSESS;
    return channel_.pushControl(std::move(ev));
}

bool MonitoringSession::flush(double timeoutSec) {
    if (!running_.load()) return false;
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + duration_cast<steady_clock::duration>(duration<double>(timeoutSec));
    Event ev;
    ev.type = EventType::FLUSH;
    ev.done = std::make_shared<std::promise<void>>();
    std::future<void> f = ev.done->get_future();
    if (!channel_.pushControl(std::move(ev))) return false;
    if (f.wait_until(deadline) != std::future_status::ready) return false;
    std::unique_lock<std::mutex> l(notifyMutex_);
    return notifyIdleCv_.wait_until(l, deadline, [&] { return notifyQueue_.empty() && !notifyBusy_; });
}

std::vector<Sample> MonitoringSession::recentSamples() const {
    std::vector<Sample> out;
    std::lock_guard<std::mutex> lock(dataMutex_);
    engine_.recent().snapshot(out);
    return out;
}

SessionStats MonitoringSession::stats() const {
    SessionStats s;
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        s.samplesAccepted = engine_.acceptedTotal();
        s.notificationsDispatched = engine_.alerts().dispatchedTotal();
        s.notificationsSuppressed = engine_.alerts().suppressedTotal();
    }
    s.samplesRejected = rejectedTotal_.load();
    s.samplesDropped = droppedTotal_.load();
    s.ticks = ticksTotal_.load();
    s.assessments = assessmentsTotal_.load();
    s.notifierFailures = notifierFailuresTotal_.load();
    s.persistFailures = persistFailuresTotal_.load();
    s.replayed = replayedTotal_.load();
    return s;
}

void MonitoringSession::workerLoop() {
    Event ev;
    while (channel_.pop(ev)) {
        try {
            switch (ev.type) {
                case EventType::SAMPLE: handleSample(ev.sample); break;
                case EventType::TICK: handleTick(now()); break;
                case EventType::ASSESS: runAssessmentCycle(now()); break;
                case EventType::FLUSH: break;
            }
        } catch (const std::exception& e) {
            CW_LOGE(kTag, "event handling failed: %s", e.what());
        } catch (...) {
            CW_LOGE(kTag, "event handling failed with a non-standard exception");
        }
        if (ev.done) ev.done->set_value();
        ev = Event{};
    }
}

void MonitoringSession::timerLoop() {
    using namespace std::chrono;
    const auto period = duration_cast<steady_clock::duration>(duration<double>(opt_.tickIntervalSec));
    auto next = steady_clock::now() + period;
    std::unique_lock<std::mutex> l(timerMutex_);
    while (!timerStop_) {
        if (timerCv_.wait_until(l, next, [&] { return timerStop_; })) break;
        next += period;
        l.unlock();
        Event ev;
        ev.type = EventType::TICK;
        channel_.pushControl(std::move(ev));
        l.lock();
    }
}

void MonitoringSession::dispatcherLoop() {
    std::unique_lock<std::mutex> l(notifyMutex_);
    for (;;) {
        notifyCv_.wait(l, [&] { return notifyStop_ || !notifyQueue_.empty(); });
        if (notifyQueue_.empty()) break; // stop requested and drained
        Notification n = std::move(notifyQueue_.front());
        notifyQueue_.pop_front();
        notifyBusy_ = true;
        l.unlock();

        bool ok = false;
        if (notifier_) {
            try {
                ok = notifier_->dispatch(n.title, n.body, n.urgency);
            } catch (const std::exception& e) {
                CW_LOGW(kTag, "notifier threw: %s", e.what());
            } catch (...) {
                CW_LOGW(kTag, "notifier threw a non-standard exception");
            }
            if (!ok) {
                notifierFailuresTotal_.fetch_add(1);
                CW_LOGW(kTag, "notification delivery failed: %s", n.title.c_str());
            }
        }

        l.lock();
        notifyBusy_ = false;
        notifyIdleCv_.notify_all();
    }
    notifyIdleCv_.notify_all();
}

void MonitoringSession::enqueueNotification(const Notification& n) {
    CW_LOGI(kTag, "alert %s: %s (%s)", alertStatusName(n.status), n.title.c_str(), urgencyName(n.urgency));
    {
        std::lock_guard<std::mutex> l(notifyMutex_);
        notifyQueue_.push_back(n);
    }
    notifyCv_.notify_one();
    if (SessionListener* listener = listener_.load()) listener->onAlert(n);
}

void MonitoringSession::handleSample(const Sample& s) {
    MonitorEngine::IngestResult r;
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        r = engine_.ingest(s);
    }
    if (r.notification) enqueueNotification(*r.notification);
}

void MonitoringSession::handleTick(double now) {
    ticksTotal_.fetch_add(1);
    MonitorEngine::PeriodicResult r;
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        // the cooldown compares against sample-driven alerts, so stay on sensor time
        r = engine_.evaluatePeriodic(engine_.lastSampleTime().value_or(now));
    }
    if (r.evaluated) {
        CW_LOGD(kTag, "periodic: n=%zu mean=%.1f std=%.2f pnn50=%.3f score=%.2f",
                r.features.count, r.features.mean, r.features.stdev, r.features.pnn50, r.score);
        if (r.forcedCritical) CW_LOGW(kTag, "periodic risk score %.2f above threshold", r.score);
    }
    if (r.notification) enqueueNotification(*r.notification);
    runAssessmentCycle(now);
}

void MonitoringSession::runAssessmentCycle(double now) {
    // engine_ is only mutated on this thread, unlocked reads are safe here
    if (engine_.window().size() < static_cast<size_t>(std::max(1, opt_.minAssessmentSamples))) return;
    const HealthInputs in = engine_.buildInputs(sensor_.get());

    SessionListener* listener = listener_.load();
    const CriticalCheck critical = checkCriticalConditions(in);
    if (critical.isCritical) {
        CW_LOGW(kTag, "critical condition: %s", critical.message.c_str());
        if (listener) listener->onCriticalCondition(critical, now);
    }

    Assessment a = runHealthAssessment(in, now, opt_.profile);
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        latest_ = a;
    }
    assessmentsTotal_.fetch_add(1);
    CW_LOGI(kTag, "assessment: %s (rhythm=%s risk=%s pattern=%s)", a.overallStatus.c_str(),
            a.rhythm.label.c_str(), a.risk.label.c_str(), a.pattern.label.c_str());
    cache_->store(a, now);
    persist(a, in);
    if (listener) listener->onAssessment(a);
}

void MonitoringSession::persist(const Assessment& a, const HealthInputs& in) {
    if (!store_) return;
    bool ok = false;
    try {
        ok = store_->save(a, in);
    } catch (const std::exception& e) {
        CW_LOGE(kTag, "persistence threw: %s", e.what());
    } catch (...) {
        CW_LOGE(kTag, "persistence threw a non-standard exception");
    }
    if (!ok) {
        persistFailuresTotal_.fetch_add(1);
        const bool queued = cache_->enqueue(AssessmentRecord{a, in});
        CW_LOGW(kTag, "persistence failed, %s (pending=%zu)",
                queued ? "queued for replay" : "already queued", cache_->pendingCount());
        return;
    }
    if (cache_->pendingCount() > 0) {
        size_t n = cache_->replay(*store_);
        replayedTotal_.fetch_add(n);
        if (n) CW_LOGI(kTag, "replayed %zu pending record(s)", n);
    }
}

} // namespace cardiowatch
