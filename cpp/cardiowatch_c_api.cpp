#include "cardiowatch_c_api.h"
#include "cardiowatch_stream.h"
#include "cardiowatch_log.h"
#include "cw_options_builder.h"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <unordered_map>

namespace cardiowatch {

static void jsonString(std::ostringstream& os, const std::string& s) {
    os << '"';
    for (char c : s) {
        switch (c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default: os << c;
        }
    }
    os << '"';
}

std::string assessmentToJson(const Assessment& a) {
    std::ostringstream os;
    auto out = [&](const char* k, const ModelOutput& m) {
        os << "\"" << k << "\":{\"label\":"; jsonString(os, m.label);
        os << ",\"confidence\":" << m.confidence << "}";
    };
    auto kv = [&](const char* k, double v) { os << "\"" << k << "\":" << v; };
    auto ks = [&](const char* k, const std::string& v) { os << "\"" << k << "\":"; jsonString(os, v); };
    os << "{";
    kv("timestamp", a.timestamp); os << ",";
    ks("overallStatus", a.overallStatus); os << ",";
    out("rhythm", a.rhythm); os << ","; out("risk", a.risk); os << ","; out("pattern", a.pattern); os << ",";
    os << "\"critical\":{\"isCritical\":" << (a.critical.isCritical ? "true" : "false") << ",";
    ks("message", a.critical.message); os << "},";
    const FitnessOutput& f = a.fitness;
    os << "\"fitness\":{";
    kv("fitnessLevel", f.fitnessLevel); os << ","; ks("fitnessCategory", f.fitnessCategory); os << ",";
    kv("vo2max", f.vo2max); os << ","; ks("vo2maxStatus", f.vo2maxStatus); os << ",";
    kv("cardiovascularAge", f.cardiovascularAge); os << ","; ks("ageComparison", f.ageComparison); os << ",";
    kv("recoveryEfficiency", f.recoveryEfficiency); os << ","; ks("recoveryStatus", f.recoveryStatus); os << ",";
    kv("trainingReadiness", f.trainingReadiness); os << ","; ks("readinessStatus", f.readinessStatus); os << ",";
    ks("recommendation", f.recommendation);
    os << "}}";
    return os.str();
}

} // namespace cardiowatch

using cardiowatch::MonitorEngine;

namespace {

struct EngineHandle {
    std::mutex m;
    MonitorEngine engine;
    explicit EngineHandle(const cardiowatch::MonitorOptions& o) : engine(o) {}
};

// Handle registry (32-bit IDs)
std::unordered_map<uint32_t, std::shared_ptr<EngineHandle>> g_handles;
std::mutex g_handles_m;
std::atomic<uint32_t> g_next_id{1};

uint32_t cw_handle_register(std::shared_ptr<EngineHandle> p) {
    std::lock_guard<std::mutex> lock(g_handles_m);
    uint32_t id = g_next_id.fetch_add(1);
    if (id == 0) id = g_next_id.fetch_add(1);
    g_handles[id] = std::move(p);
    return id;
}
std::shared_ptr<EngineHandle> cw_handle_get(uint32_t id) {
    std::lock_guard<std::mutex> lock(g_handles_m);
    auto it = g_handles.find(id);
    return (it == g_handles.end() ? nullptr : it->second);
}

int writeOut(const std::string& json, char* out, size_t cap) {
    if (out && cap > 0) {
        size_t n = std::min(json.size(), cap - 1);
        std::memcpy(out, json.data(), n);
        out[n] = '\0';
    }
    return static_cast<int>(json.size());
}

} // namespace

extern "C" {

uint32_t cw_engine_create(const cardiowatch::MonitorOptions* opt) {
    cardiowatch::MonitorOptions o = opt ? *opt : cardiowatch::MonitorOptions{};
    const char* code = nullptr; std::string msg;
    if (!cw_validate_options(o, &code, &msg)) {
        CW_LOGE("CWBridge", "cw_engine_create: %s (%s)", msg.c_str(), code);
        return 0;
    }
    return cw_handle_register(std::make_shared<EngineHandle>(o));
}

int cw_engine_push(uint32_t h, double value, double timestamp, int mode) {
    auto p = cw_handle_get(h);
    if (!p) return CW_ERR_INVALID_HANDLE;
    cardiowatch::Sample s{value, timestamp, mode == 1 ? cardiowatch::ActivityMode::EXERCISE : cardiowatch::ActivityMode::RESTING};
    std::lock_guard<std::mutex> lock(p->m);
    auto r = p->engine.ingest(s);
    if (!r.accepted) return 0;
    return r.notification ? 2 : 1;
}

int cw_engine_tick(uint32_t h, double now, double* score_out) {
    auto p = cw_handle_get(h);
    if (!p) return CW_ERR_INVALID_HANDLE;
    std::lock_guard<std::mutex> lock(p->m);
    auto r = p->engine.evaluatePeriodic(now);
    if (score_out) *score_out = r.score;
    return r.evaluated ? 1 : 0;
}

int cw_engine_zone(uint32_t h) {
    auto p = cw_handle_get(h);
    if (!p) return CW_ERR_INVALID_HANDLE;
    std::lock_guard<std::mutex> lock(p->m);
    return static_cast<int>(p->engine.currentZone());
}

int cw_engine_alert_status(uint32_t h) {
    auto p = cw_handle_get(h);
    if (!p) return CW_ERR_INVALID_HANDLE;
    std::lock_guard<std::mutex> lock(p->m);
    return static_cast<int>(p->engine.alertStatus());
}

int cw_engine_size(uint32_t h, size_t* recent, size_t* window) {
    auto p = cw_handle_get(h);
    if (!p) return CW_ERR_INVALID_HANDLE;
    std::lock_guard<std::mutex> lock(p->m);
    if (recent) *recent = p->engine.recent().size();
    if (window) *window = p->engine.window().size();
    return CW_OK;
}

int cw_engine_assess(uint32_t h, double timestamp, double hrv, double respiratoryRate,
                     double activity, double sleepRatio, char* out, size_t cap) {
    auto p = cw_handle_get(h);
    if (!p) return CW_ERR_INVALID_HANDLE;
    cardiowatch::HealthInputs in;
    cardiowatch::FitnessProfile profile;
    {
        std::lock_guard<std::mutex> lock(p->m);
        const int minSamples = std::max(1, p->engine.options().minAssessmentSamples);
        if (p->engine.window().size() < static_cast<size_t>(minSamples)) return CW_ERR_INVALID_ARGUMENT;
        in = p->engine.buildInputs(nullptr);
        profile = p->engine.options().profile;
    }
    in.hrvMean = hrv;
    in.respiratoryRate = respiratoryRate;
    in.activityLevel = activity;
    in.sleepQuality = sleepRatio;
    return writeOut(cardiowatch::assessmentToJson(cardiowatch::runHealthAssessment(in, timestamp, profile)), out, cap);
}

int cw_engine_destroy(uint32_t h) {
    std::shared_ptr<EngineHandle> p;
    {
        std::lock_guard<std::mutex> lock(g_handles_m);
        auto it = g_handles.find(h);
        if (it == g_handles.end()) return CW_ERR_INVALID_HANDLE;
        p = std::move(it->second);
        g_handles.erase(it);
    }
    return CW_OK; // released when the last in-flight call returns
}

int cw_assess(const double* heartRates, size_t n, double timestamp, double hrv,
              double respiratoryRate, double activity, double sleepRatio,
              char* out, size_t cap) {
    if (!heartRates && n > 0) return CW_ERR_INVALID_ARGUMENT;
    cardiowatch::HealthInputs in;
    for (size_t i = 0; i < n; ++i)
        if (cardiowatch::isValidSample(heartRates[i])) in.recentHeartRates.push_back(heartRates[i]);
    // same floor as the session's assessment cycle
    const int minSamples = std::max(1, cardiowatch::MonitorOptions{}.minAssessmentSamples);
    if (in.recentHeartRates.size() < static_cast<size_t>(minSamples)) return CW_ERR_INVALID_ARGUMENT;
    const cardiowatch::WindowFeatures f = cardiowatch::computeWindowFeatures(in.recentHeartRates);
    in.meanHeartRate = f.mean;
    in.stdHeartRate = f.stdev;
    in.pnn50 = f.pnn50;
    in.hrvMean = hrv;
    in.respiratoryRate = respiratoryRate;
    in.activityLevel = activity;
    in.sleepQuality = sleepRatio;
    return writeOut(cardiowatch::assessmentToJson(cardiowatch::runHealthAssessment(in, timestamp)), out, cap);
}

const char* cw_error_code(int rc) {
    switch (rc) {
        case CW_ERR_INVALID_ARGUMENT: return "CARDIOWATCH_E005";
        case CW_ERR_INVALID_HANDLE: return "CARDIOWATCH_E101";
        default: return rc < 0 ? "CARDIOWATCH_E005" : "";
    }
}

} // extern "C"
