#include "test_base.hpp"
#include "core/performance_logger.hpp"
#include <sstream>

class PerformanceLoggerTest : public TestBase
{
protected:
    std::string readLog(const PerformanceLogger &logger)
    {
        std::ifstream in(logger.getLogPath());
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static size_t occurrences(const std::string &text, const std::string &needle)
    {
        size_t count = 0;
        for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1))
            count++;
        return count;
    }
};

TEST_F(PerformanceLoggerTest, CreatesFileWithHeaderOnce)
{
    PerformanceLogger first(path("Logs"), "perf.txt");
    EXPECT_EQ(first.getLogPath(), path("Logs/perf.txt"));
    PerformanceLogger second(path("Logs"), "perf.txt");

    std::string content = readLog(second);
    EXPECT_EQ(content, "--- Performance Log for Duplicate Check ---\n\n");
}

TEST_F(PerformanceLoggerTest, AutomaticRunSummary)
{
    PerformanceLogger logger(path("Logs"), "perf.txt");
    nlohmann::json stats = {{"timestamp", "2024-05-01 10:00:00"},
                            {"folder", "/photos"},
                            {"mode", "Automatic selection"},
                            {"strategy", "Keep Best Quality"},
                            {"threshold", 5},
                            {"total_time", 3.14159},
                            {"scan_time", 0.5},
                            {"hashing_time", 2.0},
                            {"comparison_time", 0.25},
                            {"automatic_selection_time", 0.01},
                            {"files_processed", 12},
                            {"groups_found", 2},
                            {"files_marked_for_removal", 3},
                            {"discarded_files", {"/photos/a.jpg", "/photos/sub/b.jpg"}}};
    ASSERT_TRUE(logger.logRun(stats));

    std::string content = readLog(logger);
    EXPECT_NE(content.find("--- Run: 2024-05-01 10:00:00 ---\n"), std::string::npos);
    EXPECT_NE(content.find("Total time: 3.14 seconds\n"), std::string::npos);
    EXPECT_NE(content.find("  Strategy: Keep Best Quality\n"), std::string::npos);
    EXPECT_NE(content.find("  Sensitivity (threshold): 5\n"), std::string::npos);
    EXPECT_NE(content.find("  Hashing images:          2.00\n"), std::string::npos);
    EXPECT_NE(content.find("  Automatic selection:     0.01\n"), std::string::npos);
    EXPECT_EQ(content.find("Moving files"), std::string::npos);
    EXPECT_NE(content.find("  Images that failed hashing: N/A\n"), std::string::npos);
    EXPECT_NE(content.find("  - b.jpg\n"), std::string::npos);
    EXPECT_NE(content.find(std::string(50, '-') + "\n\n"), std::string::npos);
}

TEST_F(PerformanceLoggerTest, ManualRunHasNoStrategy)
{
    PerformanceLogger logger(path("Logs"), "perf.txt");
    ASSERT_TRUE(logger.logRun({{"mode", "Manual review"}, {"strategy", "Keep Best Quality"}}));
    std::string content = readLog(logger);
    EXPECT_EQ(content.find("Strategy:"), std::string::npos);
    EXPECT_EQ(content.find("[Discarded Files (sample)]"), std::string::npos);
}

TEST_F(PerformanceLoggerTest, DiscardedSampleIsCapped)
{
    PerformanceLogger logger(path("Logs"), "perf.txt");
    nlohmann::json discarded = nlohmann::json::array();
    for (int i = 0; i < 25; i++)
        discarded.push_back("/p/img" + std::to_string(i) + ".jpg");
    ASSERT_TRUE(logger.logRun({{"discarded_files", discarded}}));
    ASSERT_TRUE(logger.logRun({{"discarded_files", discarded}}));

    std::string content = readLog(logger);
    EXPECT_EQ(occurrences(content, "  - img"), 2 * PerformanceLogger::kDiscardedSampleSize);
    EXPECT_EQ(occurrences(content, "  ... and 5 more.\n"), 2u);
    EXPECT_EQ(content.find("img20.jpg"), std::string::npos);
    EXPECT_EQ(occurrences(content, "--- Performance Log for Duplicate Check ---"), 1u);
}
