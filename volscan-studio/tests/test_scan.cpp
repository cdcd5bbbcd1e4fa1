// test_scan.cpp - file fan-out, outcome accounting and ranking
#include <gtest/gtest.h>

#include "scan.hpp"
#include "test_helpers.hpp"
#include <algorithm>

namespace {

Verdict scored(const std::string& code, int score) {
    Verdict v;
    v.code = code;
    v.score = score;
    return v;
}

// 30 bars that pass the support retest; prior_close / prev_volume pick the tier
BarSeries retest_bars(double prior_close = 10.20, double prev_volume = 50'000) {
    BarSeries s = flat_series(30, 9.80, 50'000);
    s[19].volume = 100'000;
    s[19].open = 10.00;
    for (size_t i = 25; i < 29; ++i) s[i].close = prior_close;
    s[28].volume = prev_volume;
    s[29].close = 10.05;
    s[29].volume = 40'000;
    return s;
}

} // namespace

// ===========================================================================
// Ranking
// ===========================================================================

TEST(RankVerdicts, SupportRetestKeepsTopFiveDescending) {
    std::vector<Verdict> in;
    const int scores[] = {70, 100, 80, 90, 75, 95, 85};
    for (int i = 0; i < 7; ++i) in.push_back(scored("60000" + std::to_string(i), scores[i]));

    const auto out = rank_verdicts(in, support_retest_profile());
    ASSERT_EQ(out.size(), 5u);
    const int expected[] = {100, 95, 90, 85, 80};
    for (size_t i = 0; i < out.size(); ++i) EXPECT_EQ(out[i].score, expected[i]);
}

TEST(RankVerdicts, EqualScoresKeepInputOrder) {
    std::vector<Verdict> in{scored("000003", 90), scored("000001", 100), scored("000002", 90),
                            scored("000004", 90)};
    const auto out = rank_verdicts(in, support_retest_profile());
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0].code, "000001");
    EXPECT_EQ(out[1].code, "000003");
    EXPECT_EQ(out[2].code, "000002");
    EXPECT_EQ(out[3].code, "000004");
}

TEST(RankVerdicts, DeepContractionSortsByCodeWithoutTruncation) {
    std::vector<Verdict> in;
    for (const char* code : {"600010", "000001", "600003", "000900", "601988", "600000", "000002"})
        in.push_back(scored(code, 0));
    const auto out = rank_verdicts(in, deep_contraction_profile());
    ASSERT_EQ(out.size(), 7u);
    EXPECT_TRUE(std::is_sorted(out.begin(), out.end(),
                               [](const Verdict& a, const Verdict& b){ return a.code < b.code; }));
}

// ===========================================================================
// File discovery and per-file screening
// ===========================================================================

TEST(ListCsvFiles, SortedCsvOnly) {
    TempDir dir;
    dir.write("600001.csv", "x");
    dir.write("000001.csv", "x");
    dir.write("readme.txt", "x");
    std::string err;
    const auto files = list_csv_files(dir.path().string(), err);
    ASSERT_TRUE(err.empty()) << err;
    ASSERT_EQ(files.size(), 2u);
    EXPECT_NE(files[0].find("000001.csv"), std::string::npos);
    EXPECT_NE(files[1].find("600001.csv"), std::string::npos);
}

TEST(ListCsvFiles, MissingDirectory) {
    std::string err;
    EXPECT_TRUE(list_csv_files("/nonexistent/volscan/stock_data", err).empty());
    EXPECT_FALSE(err.empty());
}

TEST(ScanFile, ExcludedCodeIsNeverRead) {
    TempDir dir;
    // unreadable content would be an Error if the file were loaded
    const auto path = dir.write("300750.csv", "garbage\n1,2,3\n");
    InstrumentIdentity id;
    const auto out = scan_file(path, support_retest_profile(), NameTable{}, &id);
    EXPECT_EQ(out.kind, OutcomeKind::Excluded);
    EXPECT_EQ(out.reason, Reason::IneligibleCode);
    EXPECT_EQ(id.code, "300750");
}

TEST(ScanFile, MissingFileIsAnError) {
    const auto out = scan_file("/nonexistent/volscan/600000.csv", support_retest_profile(), NameTable{});
    EXPECT_EQ(out.kind, OutcomeKind::Error);
}

TEST(ScanFile, NameTableJoinsOnPaddedCode) {
    TempDir dir;
    const auto path = dir.write("1.csv", to_vendor_csv(retest_bars()));
    NameTable names{{"000001", "平安银行"}};
    InstrumentIdentity id;
    const auto out = scan_file(path, support_retest_profile(), names, &id);
    ASSERT_TRUE(out.matched()) << reason_label(out.reason) << " " << out.detail;
    EXPECT_EQ(out.verdict.code, "000001");
    EXPECT_EQ(out.verdict.name, "平安银行");
    EXPECT_EQ(id.name, "平安银行");
}

TEST(ScanFile, SpecialTreatmentNameFromTable) {
    TempDir dir;
    const auto path = dir.write("600010.csv", to_vendor_csv(retest_bars()));
    NameTable names{{"600010", "*ST包钢"}};
    const auto out = scan_file(path, support_retest_profile(), names);
    EXPECT_EQ(out.reason, Reason::SpecialTreatment);
}

// ===========================================================================
// Whole-universe scan
// ===========================================================================

class UniverseScan : public ::testing::Test {
protected:
    void SetUp() override {
        files_.push_back(dir_.write("600000.csv", to_vendor_csv(retest_bars(9.80, 30'000))));  // 100
        files_.push_back(dir_.write("1.csv", to_vendor_csv(retest_bars())));                   // 70
        files_.push_back(dir_.write("600002.csv", "日期,开盘,收盘,成交量\n2024-01-01,10,x,100\n"));
        files_.push_back(dir_.write("600003.csv", to_vendor_csv(flat_series(10))));
        files_.push_back(dir_.write("300001.csv", to_vendor_csv(retest_bars())));
        files_.push_back(dir_.write("600004.csv", to_vendor_csv(retest_bars(9.80))));          // 90
        names_ = {{"600000", "浦发银行"}, {"000001", "平安银行"}};
        std::sort(files_.begin(), files_.end());
    }

    TempDir dir_;
    std::vector<std::string> files_;
    NameTable names_;
};

TEST_F(UniverseScan, CountsEveryOutcome) {
    const auto report = run_scan(files_, support_retest_profile(), names_, 4);
    ASSERT_EQ(report.entries.size(), files_.size());
    EXPECT_EQ(report.matched, 3u);
    EXPECT_EQ(report.errors, 1u);
    EXPECT_EQ(report.excluded, 2u);

    ASSERT_EQ(report.ranked.size(), 3u);
    EXPECT_EQ(report.ranked[0].code, "600000");
    EXPECT_EQ(report.ranked[0].score, 100);
    EXPECT_EQ(report.ranked[0].name, "浦发银行");
    EXPECT_EQ(report.ranked[1].code, "600004");
    EXPECT_EQ(report.ranked[1].name, kUnknownName);
    EXPECT_EQ(report.ranked[2].code, "000001");
    EXPECT_EQ(report.ranked[2].score, 70);

    for (const auto& v : report.ranked) EXPECT_NE(v.code.rfind("30", 0), 0u);
}

TEST_F(UniverseScan, EntriesFollowInputOrder) {
    const auto report = run_scan(files_, support_retest_profile(), names_, 3);
    for (size_t i = 0; i < files_.size(); ++i) EXPECT_EQ(report.entries[i].path, files_[i]);
}

TEST_F(UniverseScan, WorkerCountDoesNotChangeResults) {
    const auto serial = run_scan(files_, support_retest_profile(), names_, 1);
    const auto parallel = run_scan(files_, support_retest_profile(), names_, 16);
    ASSERT_EQ(serial.entries.size(), parallel.entries.size());
    for (size_t i = 0; i < serial.entries.size(); ++i) {
        EXPECT_EQ(serial.entries[i].outcome.kind, parallel.entries[i].outcome.kind);
        EXPECT_EQ(serial.entries[i].outcome.reason, parallel.entries[i].outcome.reason);
    }
    ASSERT_EQ(serial.ranked.size(), parallel.ranked.size());
    for (size_t i = 0; i < serial.ranked.size(); ++i) {
        EXPECT_EQ(serial.ranked[i].code, parallel.ranked[i].code);
        EXPECT_EQ(serial.ranked[i].score, parallel.ranked[i].score);
    }
}

TEST_F(UniverseScan, RepeatedRunsAreIdentical) {
    const auto first = run_scan(files_, support_retest_profile(), names_, 4);
    const auto second = run_scan(files_, support_retest_profile(), names_, 4);
    ASSERT_EQ(first.ranked.size(), second.ranked.size());
    for (size_t i = 0; i < first.ranked.size(); ++i) {
        EXPECT_EQ(first.ranked[i].code, second.ranked[i].code);
        EXPECT_EQ(first.ranked[i].score, second.ranked[i].score);
        EXPECT_EQ(first.ranked[i].support_price, second.ranked[i].support_price);
    }
}

TEST(WorkerCount, ClampedToTasksAndCeiling) {
    EXPECT_EQ(effective_worker_count(0, 10), 1u);
    EXPECT_EQ(effective_worker_count(-3, 10), 1u);
    EXPECT_EQ(effective_worker_count(4, 10), 4u);
    EXPECT_EQ(effective_worker_count(16, 6), 6u);
    EXPECT_EQ(effective_worker_count(100000, 100000), (size_t)kMaxWorkers);
    EXPECT_EQ(effective_worker_count(8, 0), 0u);
}

TEST_F(UniverseScan, HugeWorkerRequestStillScansEverything) {
    const auto report = run_scan(files_, support_retest_profile(), names_, 100000);
    ASSERT_EQ(report.entries.size(), files_.size());
    EXPECT_EQ(report.matched + report.excluded + report.errors, files_.size());
    EXPECT_EQ(report.matched, 3u);
}

TEST(RunScan, EmptyInput) {
    const auto report = run_scan({}, deep_contraction_profile(), NameTable{}, 4);
    EXPECT_TRUE(report.entries.empty());
    EXPECT_TRUE(report.ranked.empty());
}
