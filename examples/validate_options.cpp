// Options validation codes and key=value builder
#include <iostream>
#include <limits>
#include <string>
#include "../cpp/cw_options_builder.h"

static int g_failures = 0;
static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_failures;
}

using cardiowatch::MonitorOptions;

static std::string codeFor(const MonitorOptions& o) {
    const char* code = nullptr;
    std::string msg;
    if (cw_validate_options(o, &code, &msg)) return "OK";
    return code ? code : "?";
}

int main() {
    MonitorOptions def;
    check(codeFor(def) == "OK", "defaults are valid");
    check(def.recentCapacity == 200 && def.windowCapacity == 300, "default capacities");
    check(def.notificationCooldownSec == 300.0 && def.tickIntervalSec == 60.0 && def.cacheExpirySec == 3600.0,
          "default timings");
    check(def.restingHighThreshold == 100.0 && def.restingLowThreshold == 50.0 && def.exerciseHighThreshold == 180.0,
          "default alert thresholds");
    check(def.criticalRiskScore == 0.7 && def.periodicMinSamples == 60 && def.irregularityMinSamples == 10,
          "default periodic parameters");

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    auto with = [&](auto mutate) { MonitorOptions o; mutate(o); return codeFor(o); };

    check(with([](MonitorOptions& o) { o.recentCapacity = 0; }) == "CARDIOWATCH_E001", "recent 0 -> E001");
    check(with([](MonitorOptions& o) { o.windowCapacity = 100; }) == "CARDIOWATCH_E001", "window < recent -> E001");
    check(with([](MonitorOptions& o) { o.channelCapacity = 0; }) == "CARDIOWATCH_E001", "channel 0 -> E001");
    check(with([](MonitorOptions& o) { o.irregularityMinSamples = 1; }) == "CARDIOWATCH_E001", "irregularity min 1 -> E001");
    check(with([](MonitorOptions& o) { o.pendingCapacity = 0; }) == "CARDIOWATCH_E001", "pending capacity 0 -> E001");
    check(with([](MonitorOptions& o) { o.recentCapacity = 1; o.windowCapacity = 1; }) == "OK", "capacity 1 allowed");

    check(with([](MonitorOptions& o) { o.tickIntervalSec = 0.0; }) == "CARDIOWATCH_E002", "tick 0 -> E002");
    check(with([&](MonitorOptions& o) { o.tickIntervalSec = nan; }) == "CARDIOWATCH_E002", "tick NaN -> E002");
    check(with([](MonitorOptions& o) { o.tickIntervalSec = 0.05; }) == "OK", "tick 0.05 allowed");

    check(with([](MonitorOptions& o) { o.restingLowThreshold = 100.0; }) == "CARDIOWATCH_E003", "low == high -> E003");
    check(with([](MonitorOptions& o) { o.exerciseHighThreshold = 0.0; }) == "CARDIOWATCH_E003", "exercise 0 -> E003");
    check(with([](MonitorOptions& o) { o.notificationCooldownSec = -1.0; }) == "CARDIOWATCH_E003", "negative cooldown -> E003");
    check(with([](MonitorOptions& o) { o.notificationCooldownSec = 0.0; }) == "OK", "zero cooldown allowed");
    check(with([](MonitorOptions& o) { o.criticalRiskScore = 1.5; }) == "CARDIOWATCH_E003", "risk score > 1 -> E003");

    check(with([](MonitorOptions& o) { o.profile.age = 5.0; }) == "CARDIOWATCH_E004", "age 5 -> E004");
    check(with([](MonitorOptions& o) { o.maxHeartRate = 0.0; }) == "CARDIOWATCH_E004", "max HR 0 -> E004");
    check(with([&](MonitorOptions& o) { o.profile.restingHrBaseline = inf; }) == "CARDIOWATCH_E004", "baseline Inf -> E004");
    check(with([](MonitorOptions& o) { o.profile.restingHrBaseline = 58.0; }) == "OK", "explicit baseline allowed");

    check(with([](MonitorOptions& o) { o.sensorRangeSec = 0.0; }) == "CARDIOWATCH_E005", "sensor range 0 -> E005");
    check(with([&](MonitorOptions& o) { o.cacheExpirySec = nan; }) == "CARDIOWATCH_E005", "expiry NaN -> E005");

    // key=value builder
    bool ok = false;
    const char* code = nullptr;
    std::string msg;
    MonitorOptions o = cw_build_options_from_kv(
        "# demo profile\n"
        "recentCapacity = 50\n"
        "windowCapacity=120\n"
        "\n"
        "notificationCooldownSec=30\n"
        "pendingCapacity=16\n"
        "profile.age=28\n"
        "profile.restingHrBaseline=55.5\r\n",
        &ok, &code, &msg);
    check(ok && o.recentCapacity == 50 && o.windowCapacity == 120 && o.notificationCooldownSec == 30.0
          && o.pendingCapacity == 16,
          "kv builder sets fields");
    check(o.profile.age == 28.0 && o.profile.restingHrBaseline == 55.5 && o.tickIntervalSec == 60.0,
          "profile keys parsed, unset keys keep defaults");

    code = nullptr;
    cw_build_options_from_kv("bogusKey=1\n", &ok, &code, &msg);
    check(!ok && code && std::string(code) == "CARDIOWATCH_E005", "unknown key -> E005");
    code = nullptr;
    cw_build_options_from_kv("recentCapacity=12.5\n", &ok, &code, &msg);
    check(!ok && code && std::string(code) == "CARDIOWATCH_E005", "fractional integer -> E005");
    code = nullptr;
    cw_build_options_from_kv("tickIntervalSec=inf\n", &ok, &code, &msg);
    check(!ok && code && std::string(code) == "CARDIOWATCH_E005", "non-finite value -> E005");
    code = nullptr;
    cw_build_options_from_kv("just a line\n", &ok, &code, &msg);
    check(!ok && code && std::string(code) == "CARDIOWATCH_E005" && msg.find("Line 1") == 0, "missing '=' -> E005 with line");
    code = nullptr;
    cw_build_options_from_kv("recentCapacity=400\n", &ok, &code, &msg);
    check(!ok && code && std::string(code) == "CARDIOWATCH_E001", "parsed values are validated");

    std::cout << (g_failures == 0 ? "ALL OK" : "FAILURES: " + std::to_string(g_failures)) << "\n";
    return g_failures == 0 ? 0 : 1;
}
