// C bridge: handle registry, push/tick, JSON output and error codes
#include <iostream>
#include <string>
#include <vector>
#include "../cpp/cardiowatch_c_api.h"

static int g_failures = 0;
static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_failures;
}

int main() {
    cardiowatch::MonitorOptions bad;
    bad.recentCapacity = 0;
    check(cw_engine_create(&bad) == 0, "invalid options -> handle 0");

    uint32_t h = cw_engine_create(nullptr);
    check(h != 0, "default options -> valid handle");
    uint32_t h2 = cw_engine_create(nullptr);
    check(h2 != 0 && h2 != h, "handles are distinct");

    check(cw_engine_push(h, 500.0, 0.0, 0) == 0, "out-of-range sample rejected");
    check(cw_engine_push(h, 72.0, 0.0, 0) == 1, "normal sample accepted");
    check(cw_engine_push(h, 125.0, 1.0, 0) == 2, "threshold crossing reports a notification");
    check(cw_engine_zone(h) == static_cast<int>(cardiowatch::Zone::HIGH), "zone of last sample");
    check(cw_engine_alert_status(h) == static_cast<int>(cardiowatch::AlertStatus::CRITICAL), "alert status");

    double score = -1.0;
    check(cw_engine_tick(h, 10.0, &score) == 0, "tick below 60 samples not evaluated");
    for (int i = 0; i < 60; ++i) cw_engine_push(h, 72.0, 2.0 + i, 0);
    check(cw_engine_tick(h, 100.0, &score) == 1 && score >= 0.0 && score <= 1.0, "tick evaluated with score");

    size_t recent = 0, window = 0;
    check(cw_engine_size(h, &recent, &window) == CW_OK && recent == 62 && window == 62, "buffer sizes");

    std::vector<char> buf(4096);
    int n = cw_engine_assess(h, 200.0, 50.0, 16.0, 250.0, 0.8, buf.data(), buf.size());
    std::string json(buf.data());
    check(n > 0 && static_cast<size_t>(n) == json.size(), "JSON length reported");
    check(json.find("\"overallStatus\":") != std::string::npos && json.find("\"fitness\":{") != std::string::npos,
          "JSON carries status and fitness");
    check(json.find("\"timestamp\":200") != std::string::npos, "JSON timestamp");

    char small[16];
    int full = cw_engine_assess(h, 200.0, 50.0, 16.0, 250.0, 0.8, small, sizeof(small));
    check(full == n && std::string(small).size() == sizeof(small) - 1, "truncated output stays NUL terminated");

    std::vector<double> series;
    for (int i = 0; i < 30; ++i) series.push_back(i == 5 ? 1000.0 : 65.0);
    n = cw_assess(series.data(), series.size(), 1.0, 50.0, 30.0, 250.0, 0.8, buf.data(), buf.size());
    json.assign(buf.data());
    check(n > 0 && json.find("\"isCritical\":true") != std::string::npos, "respiration 30 flagged critical");
    check(cw_assess(nullptr, 3, 0, 50, 16, 250, 0.8, buf.data(), buf.size()) == CW_ERR_INVALID_ARGUMENT,
          "null series -> invalid argument");

    // No assessment without data: an empty series must not read as "dangerously low"
    buf[0] = '\0';
    check(cw_assess(nullptr, 0, 0, 50, 16, 250, 0.8, buf.data(), buf.size()) == CW_ERR_INVALID_ARGUMENT
          && std::string(buf.data()).empty(), "empty series -> invalid argument, nothing written");
    std::vector<double> sparse = {72.0, 74.0, 0.0, 73.0, 71.0, 400.0};
    check(cw_assess(sparse.data(), sparse.size(), 0, 50, 16, 250, 0.8, buf.data(), buf.size())
          == CW_ERR_INVALID_ARGUMENT, "four valid samples -> invalid argument");
    sparse.push_back(70.0);
    n = cw_assess(sparse.data(), sparse.size(), 0, 50, 16, 250, 0.8, buf.data(), buf.size());
    json.assign(buf.data());
    check(n > 0 && json.find("\"isCritical\":false") != std::string::npos, "five valid samples assessed");

    uint32_t fresh = cw_engine_create(nullptr);
    check(cw_engine_assess(fresh, 0.0, 50.0, 16.0, 250.0, 0.8, buf.data(), buf.size()) == CW_ERR_INVALID_ARGUMENT,
          "engine without samples -> invalid argument");
    for (int i = 0; i < 4; ++i) cw_engine_push(fresh, 72.0, i, 0);
    check(cw_engine_assess(fresh, 4.0, 50.0, 16.0, 250.0, 0.8, buf.data(), buf.size()) == CW_ERR_INVALID_ARGUMENT,
          "engine below minimum window -> invalid argument");
    cw_engine_push(fresh, 72.0, 4.0, 0);
    check(cw_engine_assess(fresh, 5.0, 50.0, 16.0, 250.0, 0.8, buf.data(), buf.size()) > 0,
          "engine assessed once the window reaches the minimum");
    cw_engine_destroy(fresh);

    check(cw_engine_destroy(h) == CW_OK, "destroy");
    check(cw_engine_push(h, 72.0, 0.0, 0) == CW_ERR_INVALID_HANDLE, "destroyed handle is invalid");
    check(cw_engine_destroy(h) == CW_ERR_INVALID_HANDLE, "double destroy");
    check(std::string(cw_error_code(CW_ERR_INVALID_HANDLE)) == "CARDIOWATCH_E101", "E101 for bad handle");
    check(std::string(cw_error_code(CW_ERR_INVALID_ARGUMENT)) == "CARDIOWATCH_E005", "E005 for bad argument");
    check(std::string(cw_error_code(CW_OK)).empty(), "no code for success");
    cw_engine_destroy(h2);

    std::cout << (g_failures == 0 ? "ALL OK" : "FAILURES: " + std::to_string(g_failures)) << "\n";
    return g_failures == 0 ? 0 : 1;
}
