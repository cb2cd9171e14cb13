// Offline cache expiry, file round trip and pending-write replay
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../cpp/cardiowatch_cache.h"

static int g_failures = 0;
static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_failures;
}

using namespace cardiowatch;

static Assessment makeAssessment(double ts) {
    HealthInputs in;
    in.meanHeartRate = 72; in.stdHeartRate = 4; in.pnn50 = 0.2;
    in.recentHeartRates = std::vector<double>(20, 72.0);
    return runHealthAssessment(in, ts);
}

// Fails the first `failFor` calls, optionally by throwing
class FlakyStore : public AssessmentStore {
public:
    FlakyStore(int failFor, bool throwOnFail) : failFor_(failFor), throw_(throwOnFail) {}
    bool save(const Assessment& a, const HealthInputs& in) override {
        ++calls;
        if (failFor_ > 0) {
            --failFor_;
            if (throw_) throw std::runtime_error("disk full");
            return false;
        }
        saved.push_back(a.timestamp);
        return inner_.save(a, in);
    }
    std::vector<AssessmentRecord> query(int daysBack, double now) const override { return inner_.query(daysBack, now); }
    std::vector<double> saved;
    int calls = 0;
private:
    int failFor_;
    bool throw_;
    InMemoryAssessmentStore inner_;
};

static void testExpiry() {
    OfflineCache cache;
    check(!cache.get(0).has_value() && !cache.lastSyncTime().has_value(), "empty cache");
    Assessment a = makeAssessment(1000);
    cache.store(a, 1000);
    check(cache.get(1000).has_value() && cache.get(4600).has_value(), "served up to exactly 3600 s");
    check(!cache.get(4601).has_value() && !cache.isAvailable(4601), "expired after 3600 s");
    check(cache.lastSyncTime() && *cache.lastSyncTime() == 1000, "last sync time");
    auto got = cache.get(2000);
    check(got && got->overallStatus == a.overallStatus && got->fitness.recommendation == a.fitness.recommendation,
          "returns a full copy");
    a.overallStatus = "mutated";
    check(cache.get(2000)->overallStatus != "mutated", "cache holds its own copy");

    OfflineCache shortCache(10.0);
    shortCache.store(a, 0);
    check(shortCache.isAvailable(10) && !shortCache.isAvailable(10.5), "configurable expiry");
    shortCache.clear();
    check(!shortCache.isAvailable(0), "clear drops entry");
}

static void testFileRoundTrip() {
    const std::string path = (std::filesystem::temp_directory_path() / "cardiowatch_cache_roundtrip.txt").string();
    OfflineCache a;
    Assessment x = makeAssessment(1234.5);
    x.critical.isCritical = true;
    x.critical.message = "Abnormal respiratory rate detected. Consider medical consultation.";
    a.store(x, 1300);
    const char* code = nullptr; std::string msg;
    check(a.saveToFile(path, &code, &msg), "save cache file");

    OfflineCache b;
    check(b.loadFromFile(path, &code, &msg), "load cache file");
    auto e = b.entry(1300);
    check(e && e->cachedAt == 1300 && e->assessment.timestamp == 1234.5, "timestamps restored");
    check(e && e->assessment.overallStatus == x.overallStatus && e->assessment.rhythm.label == x.rhythm.label &&
          e->assessment.rhythm.confidence == x.rhythm.confidence, "outputs restored");
    check(e && e->assessment.critical.isCritical && e->assessment.critical.message == x.critical.message, "critical restored");
    check(e && e->assessment.fitness.fitnessLevel == x.fitness.fitnessLevel &&
          e->assessment.fitness.recommendation == x.fitness.recommendation, "fitness restored");
    check(!b.isAvailable(1300 + 3601), "loaded entry keeps its original age");
    std::filesystem::remove(path);

    OfflineCache c;
    code = nullptr;
    check(!c.loadFromFile(path + ".missing", &code, &msg) && code && std::string(code) == "CARDIOWATCH_E020",
          "missing file -> CARDIOWATCH_E020");
    code = nullptr;
    check(!a.saveToFile("/nonexistent-dir/cache.txt", &code, &msg) && code && std::string(code) == "CARDIOWATCH_E020",
          "unwritable path -> CARDIOWATCH_E020");
}

static void testReplay() {
    OfflineCache cache;
    HealthInputs in;
    for (double ts : {10.0, 20.0, 30.0}) check(cache.enqueue(AssessmentRecord{makeAssessment(ts), in}), "enqueue");
    check(!cache.enqueue(AssessmentRecord{makeAssessment(20.0), in}) && cache.pendingCount() == 3, "duplicate timestamp ignored");

    FlakyStore down(100, false);
    check(cache.replay(down) == 0 && cache.pendingCount() == 3, "store down keeps everything queued");

    cache.enqueue(AssessmentRecord{makeAssessment(40.0), in});
    FlakyStore recovering(1, false);
    check(cache.replay(recovering) == 3 && cache.pendingCount() == 1, "first write fails, rest saved");
    check(recovering.saved == std::vector<double>({20.0, 30.0, 40.0}), "saved oldest first");
    FlakyStore up(0, false);
    check(cache.replay(up) == 1 && cache.pendingCount() == 0 && up.saved == std::vector<double>({10.0}), "failed record retried");
    check(cache.replay(up) == 0, "empty replay is a no-op");

    cache.enqueue(AssessmentRecord{makeAssessment(50.0), in});
    cache.enqueue(AssessmentRecord{makeAssessment(60.0), in});
    FlakyStore throwing(1, true);
    check(cache.replay(throwing) == 1 && cache.pendingCount() == 1, "throwing store treated as failure");
    check(throwing.calls == 2 && throwing.saved == std::vector<double>({60.0}), "replay continues after a throw");
}

// Saves fail, succeed, then throw a non-std::exception value
class ScriptedStore : public InMemoryAssessmentStore {
public:
    std::vector<std::string> script;
    bool save(const Assessment& a, const HealthInputs& in) override {
        const std::string step = calls < script.size() ? script[calls] : "ok";
        ++calls;
        if (step == "throw") throw 42;
        if (step == "fail") return false;
        return InMemoryAssessmentStore::save(a, in);
    }
    size_t calls = 0;
};

static void testReplayNonStandardThrow() {
    OfflineCache cache;
    HealthInputs in;
    for (double ts : {10.0, 20.0, 30.0}) cache.enqueue(AssessmentRecord{makeAssessment(ts), in});
    ScriptedStore store;
    store.script = {"throw", "ok", "throw"};
    check(cache.replay(store) == 1, "replay survives a non-standard exception");
    auto left = cache.pendingRecords();
    check(left.size() == 2 && left[0].assessment.timestamp == 10.0 && left[1].assessment.timestamp == 30.0,
          "records whose save threw stay queued in order");
    check(cache.replay(store) == 2 && cache.pendingCount() == 0 && store.size() == 3, "queued records replayed later");
}

static void testCapacity() {
    OfflineCache cache(3600.0, 3);
    check(cache.pendingCapacity() == 3, "configured capacity");
    HealthInputs in;
    for (double ts : {10.0, 20.0, 30.0, 40.0, 50.0}) check(cache.enqueue(AssessmentRecord{makeAssessment(ts), in}), "enqueue at capacity");
    auto left = cache.pendingRecords();
    check(left.size() == 3 && left.front().assessment.timestamp == 30.0 && left.back().assessment.timestamp == 50.0,
          "oldest records dropped first");
    check(cache.droppedTotal() == 2, "drops counted");

    // A failed replay merged with newer records still honours the bound
    struct Down : AssessmentStore {
        bool save(const Assessment&, const HealthInputs&) override { return false; }
        std::vector<AssessmentRecord> query(int, double) const override { return {}; }
    } down;
    check(cache.replay(down) == 0 && cache.pendingCount() == 3, "bound kept across replay");
    check(OfflineCache(3600.0, 0).pendingCapacity() == 1, "capacity 0 clamps to 1");
}

static void testPendingFile() {
    const std::string path = (std::filesystem::temp_directory_path() / "cardiowatch_pending_roundtrip.txt").string();
    OfflineCache a;
    HealthInputs in;
    in.meanHeartRate = 81.25; in.stdHeartRate = 6.5; in.pnn50 = 0.125;
    in.hrvMean = 42; in.respiratoryRate = 14; in.activityLevel = 310; in.sleepQuality = 0.7;
    in.recentHeartRates = {80.0, 82.5, 81.25};
    a.enqueue(AssessmentRecord{makeAssessment(100.0), in});
    a.enqueue(AssessmentRecord{makeAssessment(200.0), HealthInputs{}});
    const char* code = nullptr; std::string msg;
    check(a.savePendingToFile(path, &code, &msg), "save pending file");

    OfflineCache b;
    b.enqueue(AssessmentRecord{makeAssessment(200.0), HealthInputs{}});
    b.enqueue(AssessmentRecord{makeAssessment(300.0), HealthInputs{}});
    check(b.loadPendingFromFile(path, &code, &msg), "load pending file");
    auto recs = b.pendingRecords();
    check(recs.size() == 3 && recs[0].assessment.timestamp == 100.0 && recs[1].assessment.timestamp == 200.0
          && recs[2].assessment.timestamp == 300.0, "file records ahead of queued ones, duplicates merged");
    const HealthInputs& got = recs[0].inputs;
    check(got.meanHeartRate == 81.25 && got.stdHeartRate == 6.5 && got.pnn50 == 0.125 && got.hrvMean == 42
          && got.respiratoryRate == 14 && got.activityLevel == 310 && got.sleepQuality == 0.7,
          "inputs restored");
    check(got.recentHeartRates == std::vector<double>({80.0, 82.5, 81.25}) && recs[1].inputs.recentHeartRates.empty(),
          "heart-rate series restored");
    check(recs[0].assessment.overallStatus == makeAssessment(100.0).overallStatus
          && recs[0].assessment.fitness.recommendation == makeAssessment(100.0).fitness.recommendation,
          "assessment restored");

    OfflineCache empty;
    check(empty.savePendingToFile(path, &code, &msg), "save empty queue");
    OfflineCache c;
    check(c.loadPendingFromFile(path, &code, &msg) && c.pendingCount() == 0, "empty queue round trip");
    std::filesystem::remove(path);

    code = nullptr;
    check(!c.loadPendingFromFile(path + ".missing", &code, &msg) && code && std::string(code) == "CARDIOWATCH_E020",
          "missing pending file -> CARDIOWATCH_E020");
    code = nullptr;
    check(!a.savePendingToFile("/nonexistent-dir/pending.txt", &code, &msg) && code
          && std::string(code) == "CARDIOWATCH_E020", "unwritable pending path -> CARDIOWATCH_E020");
}

int main() {
    testExpiry();
    testFileRoundTrip();
    testReplay();
    testReplayNonStandardThrow();
    testCapacity();
    testPendingFile();
    std::cout << (g_failures == 0 ? "ALL OK" : "FAILURES: " + std::to_string(g_failures)) << "\n";
    return g_failures == 0 ? 0 : 1;
}
