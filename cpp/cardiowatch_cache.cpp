#include "cardiowatch_cache.h"
#include "cardiowatch_log.h"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <map>
#include <sstream>

namespace cardiowatch {

static const char* kTag = "CWCache";

void OfflineCache::store(const Assessment& a, double now) {
    std::lock_guard<std::mutex> lock(dataMutex_);
    cached_ = CachedAssessment{a, now};
    lastSync_ = now;
}

std::optional<CachedAssessment> OfflineCache::entry(double now) const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    if (!cached_) return std::nullopt;
    if (now - cached_->cachedAt > expirySec_) return std::nullopt;
    return cached_;
}

std::optional<Assessment> OfflineCache::get(double now) const {
    auto e = entry(now);
    if (!e) return std::nullopt;
    return e->assessment;
}

void OfflineCache::clear() {
    std::lock_guard<std::mutex> lock(dataMutex_);
    cached_.reset();
    pending_.clear();
}

// ------------------------------------------------------------------
// File format: one key=value per line, '#' comments ignored
// ------------------------------------------------------------------

using KeyValues = std::map<std::string, std::string>;

static void writeOutput(std::ostream& os, const std::string& prefix, const ModelOutput& m) {
    os << prefix << ".label=" << m.label << "\n";
    os << prefix << ".confidence=" << m.confidence << "\n";
}

// Keys are written as <prefix><name>; the cache file uses an empty prefix
static void writeAssessment(std::ostream& os, const std::string& p, const Assessment& a) {
    const FitnessOutput& f = a.fitness;
    os << p << "timestamp=" << a.timestamp << "\n";
    os << p << "overall=" << a.overallStatus << "\n";
    writeOutput(os, p + "rhythm", a.rhythm);
    writeOutput(os, p + "risk", a.risk);
    writeOutput(os, p + "pattern", a.pattern);
    os << p << "critical.is_critical=" << (a.critical.isCritical ? 1 : 0) << "\n";
    os << p << "critical.message=" << a.critical.message << "\n";
    os << p << "fitness.level=" << f.fitnessLevel << "\n";
    os << p << "fitness.category=" << f.fitnessCategory << "\n";
    os << p << "fitness.vo2max=" << f.vo2max << "\n";
    os << p << "fitness.vo2max_status=" << f.vo2maxStatus << "\n";
    os << p << "fitness.cv_age=" << f.cardiovascularAge << "\n";
    os << p << "fitness.age_comparison=" << f.ageComparison << "\n";
    os << p << "fitness.recovery_efficiency=" << f.recoveryEfficiency << "\n";
    os << p << "fitness.recovery_status=" << f.recoveryStatus << "\n";
    os << p << "fitness.recovery_recommendation=" << f.recoveryRecommendation << "\n";
    os << p << "fitness.readiness=" << f.trainingReadiness << "\n";
    os << p << "fitness.readiness_status=" << f.readinessStatus << "\n";
    os << p << "fitness.readiness_guidance=" << f.readinessGuidance << "\n";
    os << p << "fitness.recommendation=" << f.recommendation << "\n";
}

static void writeInputs(std::ostream& os, const std::string& p, const HealthInputs& in) {
    os << p << "inputs.mean=" << in.meanHeartRate << "\n";
    os << p << "inputs.std=" << in.stdHeartRate << "\n";
    os << p << "inputs.pnn50=" << in.pnn50 << "\n";
    os << p << "inputs.hrv=" << in.hrvMean << "\n";
    os << p << "inputs.respiratory=" << in.respiratoryRate << "\n";
    os << p << "inputs.activity=" << in.activityLevel << "\n";
    os << p << "inputs.sleep=" << in.sleepQuality << "\n";
    os << p << "inputs.recent=";
    for (size_t i = 0; i < in.recentHeartRates.size(); ++i) {
        if (i) os << ',';
        os << in.recentHeartRates[i];
    }
    os << "\n";
}

static bool parseDouble(const KeyValues& kv, const std::string& key, double& out) {
    auto it = kv.find(key);
    if (it == kv.end()) return false;
    const char* s = it->second.c_str();
    char* end = nullptr;
    double v = std::strtod(s, &end);
    if (end == s) return false;
    out = v;
    return true;
}

static std::string str(const KeyValues& kv, const std::string& key) {
    auto it = kv.find(key);
    return it == kv.end() ? std::string() : it->second;
}

static bool parseAssessment(const KeyValues& kv, const std::string& p, Assessment& a) {
    FitnessOutput& f = a.fitness;
    double crit = 0.0;
    bool ok = parseDouble(kv, p + "timestamp", a.timestamp)
        && parseDouble(kv, p + "rhythm.confidence", a.rhythm.confidence)
        && parseDouble(kv, p + "risk.confidence", a.risk.confidence)
        && parseDouble(kv, p + "pattern.confidence", a.pattern.confidence);
    if (!ok) return false;
    parseDouble(kv, p + "critical.is_critical", crit);
    parseDouble(kv, p + "fitness.level", f.fitnessLevel);
    parseDouble(kv, p + "fitness.vo2max", f.vo2max);
    parseDouble(kv, p + "fitness.cv_age", f.cardiovascularAge);
    parseDouble(kv, p + "fitness.recovery_efficiency", f.recoveryEfficiency);
    parseDouble(kv, p + "fitness.readiness", f.trainingReadiness);

    a.overallStatus = str(kv, p + "overall");
    a.rhythm.label = str(kv, p + "rhythm.label");
    a.risk.label = str(kv, p + "risk.label");
    a.pattern.label = str(kv, p + "pattern.label");
    a.rhythm.confidence = clampConfidence(a.rhythm.confidence);
    a.risk.confidence = clampConfidence(a.risk.confidence);
    a.pattern.confidence = clampConfidence(a.pattern.confidence);
    a.critical.isCritical = crit != 0.0;
    a.critical.message = str(kv, p + "critical.message");
    f.fitnessCategory = str(kv, p + "fitness.category");
    f.vo2maxStatus = str(kv, p + "fitness.vo2max_status");
    f.ageComparison = str(kv, p + "fitness.age_comparison");
    f.recoveryStatus = str(kv, p + "fitness.recovery_status");
    f.recoveryRecommendation = str(kv, p + "fitness.recovery_recommendation");
    f.readinessStatus = str(kv, p + "fitness.readiness_status");
    f.readinessGuidance = str(kv, p + "fitness.readiness_guidance");
    f.recommendation = str(kv, p + "fitness.recommendation");
    return true;
}

static bool parseInputs(const KeyValues& kv, const std::string& p, HealthInputs& in) {
    bool ok = parseDouble(kv, p + "inputs.mean", in.meanHeartRate)
        && parseDouble(kv, p + "inputs.std", in.stdHeartRate)
        && parseDouble(kv, p + "inputs.pnn50", in.pnn50);
    if (!ok) return false;
    parseDouble(kv, p + "inputs.hrv", in.hrvMean);
    parseDouble(kv, p + "inputs.respiratory", in.respiratoryRate);
    parseDouble(kv, p + "inputs.activity", in.activityLevel);
    parseDouble(kv, p + "inputs.sleep", in.sleepQuality);
    in.recentHeartRates.clear();
    std::stringstream ss(str(kv, p + "inputs.recent"));
    std::string item;
    while (std::getline(ss, item, ',')) {
        const char* b = item.c_str();
        char* end = nullptr;
        double v = std::strtod(b, &end);
        if (end == b) return false;
        in.recentHeartRates.push_back(v);
    }
    return true;
}

static bool writeText(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (out) out << text;
    return static_cast<bool>(out);
}

// Reads key=value lines; false with `bad` set to the offending line
static bool readKeyValues(std::istream& in, KeyValues& kv, std::string& bad) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            bad = line;
            return false;
        }
        kv[line.substr(0, eq)] = line.substr(eq + 1);
    }
    return true;
}

bool OfflineCache::saveToFile(const std::string& path, const char** err_code, std::string* err_msg) const {
    std::optional<CachedAssessment> snap;
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        snap = cached_;
    }
    std::ostringstream os;
    os.precision(17);
    os << "# cardiowatch cache v1\n";
    if (snap) {
        os << "cached_at=" << snap->cachedAt << "\n";
        writeAssessment(os, "", snap->assessment);
    }
    if (!writeText(path, os.str())) {
        if (err_code) *err_code = "CARDIOWATCH_E020";
        if (err_msg) *err_msg = "cannot write cache file: " + path;
        CW_LOGW(kTag, "cache save failed: %s", path.c_str());
        return false;
    }
    return true;
}

bool OfflineCache::loadFromFile(const std::string& path, const char** err_code, std::string* err_msg) {
    auto fail = [&](const std::string& msg) {
        if (err_code) *err_code = "CARDIOWATCH_E020";
        if (err_msg) *err_msg = msg;
        CW_LOGW(kTag, "cache load failed: %s", msg.c_str());
        return false;
    };
    std::ifstream in(path);
    if (!in) return fail("cannot open cache file: " + path);

    KeyValues kv;
    std::string bad;
    if (!readKeyValues(in, kv, bad)) return fail("malformed line in cache file: " + bad);
    if (kv.empty()) {
        std::lock_guard<std::mutex> lock(dataMutex_);
        cached_.reset();
        return true;
    }

    CachedAssessment c;
    if (!parseDouble(kv, "cached_at", c.cachedAt) || !parseAssessment(kv, "", c.assessment))
        return fail("missing or invalid numeric field in cache file: " + path);

    std::lock_guard<std::mutex> lock(dataMutex_);
    cached_ = c;
    lastSync_ = c.cachedAt;
    return true;
}

// ------------------------------------------------------------------
// Replay queue
// ------------------------------------------------------------------

void OfflineCache::trimPendingLocked() {
    while (pending_.size() > pendingCapacity_) {
        CW_LOGW(kTag, "replay queue full (%zu), dropping record t=%.0f",
                pendingCapacity_, pending_.front().assessment.timestamp);
        pending_.pop_front();
        ++droppedTotal_;
    }
}

bool OfflineCache::enqueue(const AssessmentRecord& rec) {
    std::lock_guard<std::mutex> lock(dataMutex_);
    for (const auto& p : pending_)
        if (p.assessment.timestamp == rec.assessment.timestamp) return false;
    pending_.push_back(rec);
    trimPendingLocked();
    return true;
}

std::vector<AssessmentRecord> OfflineCache::pendingRecords() const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    return std::vector<AssessmentRecord>(pending_.begin(), pending_.end());
}

// Appends the records of `from` not already in `into` (by assessment timestamp)
static void mergeRecords(std::deque<AssessmentRecord>& into, std::deque<AssessmentRecord>& from) {
    for (auto& p : from) {
        bool dup = false;
        for (const auto& q : into) if (q.assessment.timestamp == p.assessment.timestamp) { dup = true; break; }
        if (!dup) into.push_back(std::move(p));
    }
}

size_t OfflineCache::replay(AssessmentStore& store) {
    std::deque<AssessmentRecord> work;
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        work.swap(pending_);
    }
    size_t saved = 0;
    std::deque<AssessmentRecord> failed;
    for (auto& rec : work) {
        bool ok = false;
        try {
            ok = store.save(rec.assessment, rec.inputs);
        } catch (const std::exception& e) {
            CW_LOGW(kTag, "replay save threw: %s", e.what());
        } catch (...) {
            CW_LOGW(kTag, "replay save threw a non-standard exception");
        }
        if (ok) ++saved;
        else failed.push_back(std::move(rec));
    }
    if (!failed.empty()) {
        std::lock_guard<std::mutex> lock(dataMutex_);
        // records enqueued during replay go after the ones that failed again
        mergeRecords(failed, pending_);
        pending_.swap(failed);
        trimPendingLocked();
        CW_LOGD(kTag, "replay kept %zu pending record(s)", pending_.size());
    }
    return saved;
}

bool OfflineCache::savePendingToFile(const std::string& path, const char** err_code, std::string* err_msg) const {
    const std::vector<AssessmentRecord> records = pendingRecords();
    std::ostringstream os;
    os.precision(17);
    os << "# cardiowatch pending v1\n";
    os << "pending.count=" << records.size() << "\n";
    for (size_t i = 0; i < records.size(); ++i) {
        const std::string p = "pending." + std::to_string(i) + ".";
        writeAssessment(os, p, records[i].assessment);
        writeInputs(os, p, records[i].inputs);
    }
    if (!writeText(path, os.str())) {
        if (err_code) *err_code = "CARDIOWATCH_E020";
        if (err_msg) *err_msg = "cannot write pending file: " + path;
        CW_LOGW(kTag, "pending save failed: %s", path.c_str());
        return false;
    }
    return true;
}

bool OfflineCache::loadPendingFromFile(const std::string& path, const char** err_code, std::string* err_msg) {
    auto fail = [&](const std::string& msg) {
        if (err_code) *err_code = "CARDIOWATCH_E020";
        if (err_msg) *err_msg = msg;
        CW_LOGW(kTag, "pending load failed: %s", msg.c_str());
        return false;
    };
    std::ifstream in(path);
    if (!in) return fail("cannot open pending file: " + path);

    KeyValues kv;
    std::string bad;
    if (!readKeyValues(in, kv, bad)) return fail("malformed line in pending file: " + bad);
    double count = 0.0;
    if (!kv.empty() && (!parseDouble(kv, "pending.count", count) || count < 0.0))
        return fail("missing or invalid record count in pending file: " + path);

    std::deque<AssessmentRecord> loaded;
    for (size_t i = 0; i < static_cast<size_t>(count); ++i) {
        const std::string p = "pending." + std::to_string(i) + ".";
        AssessmentRecord rec;
        if (!parseAssessment(kv, p, rec.assessment) || !parseInputs(kv, p, rec.inputs))
            return fail("invalid record " + std::to_string(i) + " in pending file: " + path);
        loaded.push_back(std::move(rec));
    }

    std::lock_guard<std::mutex> lock(dataMutex_);
    mergeRecords(loaded, pending_);
    pending_.swap(loaded);
    trimPendingLocked();
    CW_LOGI(kTag, "loaded pending queue (%zu record(s))", pending_.size());
    return true;
}

} // namespace cardiowatch
