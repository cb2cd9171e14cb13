// Assessment store queries, trend summary and CSV export
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "../cpp/cardiowatch_export.h"

static int g_failures = 0;
static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_failures;
}

using namespace cardiowatch;

static AssessmentRecord record(double ts, const std::string& risk, double hr = 72.0) {
    AssessmentRecord r;
    r.assessment.timestamp = ts;
    r.assessment.risk = ModelOutput{risk, 0.8};
    r.assessment.rhythm = ModelOutput{labels::kNormal, 0.9};
    r.assessment.pattern = ModelOutput{labels::kNormal, 0.88};
    r.inputs.meanHeartRate = hr;
    r.inputs.hrvMean = 45.4;
    r.inputs.respiratoryRate = 15.6;
    r.inputs.activityLevel = 320.2;
    r.inputs.sleepQuality = 0.8;
    return r;
}

static void testStore() {
    InMemoryAssessmentStore store;
    const double day = 86400.0;
    const double now = 100 * day;
    for (double ts : {now - 10 * day, now - 3 * day, now - 1, now - 7 * day, now - 2 * day})
        store.save(record(ts, "Low").assessment, record(ts, "Low").inputs);
    auto week = store.query(7, now);
    check(week.size() == 4, "7-day window includes the boundary record");
    bool newestFirst = true;
    for (size_t i = 1; i < week.size(); ++i)
        if (week[i - 1].assessment.timestamp < week[i].assessment.timestamp) newestFirst = false;
    check(newestFirst && week.front().assessment.timestamp == now - 1, "results newest first");
    check(store.query(0, now).empty(), "zero-day window only holds records at now");
    check(store.query(30, now).size() == 5 && store.size() == 5, "30-day window");
    store.clear();
    check(store.query(30, now).empty(), "clear");
}

static void testTrends() {
    std::vector<AssessmentRecord> rs;
    for (int i = 0; i < 6; ++i) rs.push_back(record(i, i >= 3 ? "High" : "Low", 60.0 + 10.0 * i));
    HealthTrends t = summarizeTrends(rs);
    check(t.riskTrend == RiskTrend::WORSENING && std::string(riskTrendName(t.riskTrend)) == "worsening",
          "recent High share rising -> worsening");
    check(t.recordCount == 6 && std::abs(t.averageHeartRate - 85.0) < 1e-9, "average heart rate");
    check(std::abs(t.totalActivity - 6 * 320.2) < 1e-6 && std::abs(t.averageSleepQuality - 0.8) < 1e-9, "totals and averages");

    std::vector<AssessmentRecord> reversed(rs.rbegin(), rs.rend());
    check(summarizeTrends(reversed).riskTrend == RiskTrend::WORSENING, "input order does not matter");

    std::vector<AssessmentRecord> better;
    for (int i = 0; i < 6; ++i) better.push_back(record(i, i >= 3 ? "Low" : "High"));
    check(summarizeTrends(better).riskTrend == RiskTrend::IMPROVING, "falling High share -> improving");

    std::vector<AssessmentRecord> flat;
    for (int i = 0; i < 6; ++i) flat.push_back(record(i, i % 3 == 0 ? "High" : "Medium"));
    check(summarizeTrends(flat).riskTrend == RiskTrend::STABLE, "unchanged share -> stable");
    check(summarizeTrends({}).recordCount == 0 && summarizeTrends({record(1, "High")}).riskTrend == RiskTrend::STABLE,
          "empty and single record -> stable");
}

static void testCsv() {
    std::vector<AssessmentRecord> rs{record(1700000000.0, "Low"), record(1700003600.0, "High")};
    rs[1].assessment.pattern.label = "Low(Bradycardia)";
    rs[1].assessment.rhythm.label = "Irregular, \"suspect\"";
    std::string csv = exportCsv(rs);
    std::istringstream in(csv);
    std::string header, row1, row2, extra;
    std::getline(in, header);
    std::getline(in, row1);
    std::getline(in, row2);
    check(header == kCsvHeader, "header line");
    check(row1 == "2023-11-14,22:13:20,72,45,16,320,80%,Low,Normal,Normal", "row rendered in UTC with rounded vitals");
    check(row2 == "2023-11-14,23:13:20,72,45,16,320,80%,High,\"Irregular, \"\"suspect\"\"\",Low(Bradycardia)",
          "fields with commas or quotes are escaped");
    check(!std::getline(in, extra) || extra.empty(), "one row per record");
    check(exportCsv({}) == std::string(kCsvHeader) + "\n", "empty export is header only");
    check(csvEscape("plain") == "plain" && csvEscape("a\nb") == "\"a\nb\"", "csvEscape");

    const std::string path = (std::filesystem::temp_directory_path() / "cardiowatch_export.csv").string();
    const char* code = nullptr; std::string msg;
    check(writeCsvFile(path, rs, &code, &msg), "write CSV file");
    std::ifstream f(path);
    std::stringstream ss; ss << f.rdbuf();
    check(ss.str() == csv, "file content matches export");
    std::filesystem::remove(path);
    check(!writeCsvFile("/nonexistent-dir/out.csv", rs, &code, &msg) && code && std::string(code) == "CARDIOWATCH_E020",
          "unwritable path -> CARDIOWATCH_E020");
}

int main() {
    testStore();
    testTrends();
    testCsv();
    std::cout << (g_failures == 0 ? "ALL OK" : "FAILURES: " + std::to_string(g_failures)) << "\n";
    return g_failures == 0 ? 0 : 1;
}
