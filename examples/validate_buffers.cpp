// Ring buffer / feature window properties and sample validation
#include <cmath>
#include <cstdint>
#include <deque>
#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include "../cpp/cardiowatch_stream.h"

static int g_failures = 0;
static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_failures;
}

int main() {
    using namespace cardiowatch;

    // Randomised insertion sequences against a deque model
    uint32_t seed = 12345u;
    auto rnd = [&]() { seed = 1664525u * seed + 1013904223u; return seed; };
    bool lengthOk = true, orderOk = true, recentOk = true;
    for (int trial = 0; trial < 200; ++trial) {
        const size_t cap = 1 + rnd() % 64;
        const size_t pushes = rnd() % 400;
        RingBuffer<int> rb(cap);
        std::deque<int> model;
        for (size_t i = 0; i < pushes; ++i) {
            int v = static_cast<int>(rnd() % 100000);
            rb.push_back(v);
            model.push_back(v);
            if (model.size() > cap) model.pop_front();
            if (rb.size() > cap || rb.size() != model.size()) lengthOk = false;
        }
        std::vector<int> snap;
        rb.snapshot(snap);
        if (snap.size() != model.size()) orderOk = false;
        for (size_t i = 0; i < snap.size() && orderOk; ++i)
            if (snap[i] != model[i] || rb.at(i) != model[i]) orderOk = false;
        const size_t n = rnd() % (cap + 5);
        auto rec = rb.recent(n);
        const size_t expect = std::min(n, model.size());
        if (rec.size() != expect) recentOk = false;
        for (size_t i = 0; i < rec.size() && recentOk; ++i)
            if (rec[i] != model[model.size() - expect + i]) recentOk = false;
        // recent() must not mutate
        if (rb.size() != model.size()) recentOk = false;
    }
    check(lengthOk, "length never exceeds capacity");
    check(orderOk, "oldest-first eviction order");
    check(recentOk, "recent(n) returns newest n oldest..newest");

    RingBuffer<double> small(3);
    for (double v : {1.0, 2.0, 3.0, 4.0}) small.push_back(v);
    check(small.at(0) == 2.0 && small.back() == 4.0, "push past capacity evicts index 0");
    small.clear();
    check(small.empty() && small.capacity() == 3, "clear keeps capacity");
    small.push_back(9.0);
    check(small.size() == 1 && small.at(0) == 9.0, "usable after clear");
    RingBuffer<int> one(0);
    one.push_back(1);
    one.push_back(2);
    check(one.capacity() == 1 && one.size() == 1 && one.back() == 2, "capacity 0 behaves as 1");

    // Validator boundaries
    check(isValidSample(20.0) && isValidSample(300.0), "20 and 300 accepted");
    check(!isValidSample(19.999) && !isValidSample(300.001), "just outside range rejected");
    check(!isValidSample(std::numeric_limits<double>::quiet_NaN()), "NaN rejected");
    check(!isValidSample(std::numeric_limits<double>::infinity()), "Inf rejected");
    check(!isValidSample(0.0) && !isValidSample(-70.0), "zero and negative rejected");

    // Engine feeds both buffers with independent capacities; invalid samples never buffered
    MonitorOptions opt;
    opt.recentCapacity = 5;
    opt.windowCapacity = 8;
    MonitorEngine engine(opt);
    for (int i = 0; i < 20; ++i) engine.ingest(Sample{60.0 + i, static_cast<double>(i), ActivityMode::RESTING});
    check(engine.recent().size() == 5 && engine.window().size() == 8, "buffers capped independently");
    check(engine.recent().back().value == 79.0 && engine.window().at(0) == 72.0, "both buffers keep newest");
    auto r = engine.ingest(Sample{500.0, 21.0, ActivityMode::RESTING});
    check(!r.accepted && engine.rejectedTotal() == 1, "out-of-range sample rejected and counted");
    check(engine.window().back() == 79.0, "rejected sample not appended");
    engine.clear();
    check(engine.recent().empty() && engine.window().empty(), "clear empties both buffers");

    std::cout << (g_failures == 0 ? "ALL OK" : "FAILURES: " + std::to_string(g_failures)) << "\n";
    return g_failures == 0 ? 0 : 1;
}
