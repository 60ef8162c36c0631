// daemon/tests/test_logger.cpp
#include <gtest/gtest.h>
#include "logger.h"
#include "temp_dir.h"
#include <fstream>

TEST(LogEntryTest, JsonCarriesLevelNameAndOptionalProcess) {
    LogEntry entry{1000, LogLevel::ACTION_MUTE, "Mute", "Muted (background)", "spotify.exe", 42};
    json j = entry.to_json();
    EXPECT_EQ(j["level_name"].get<std::string>(), "MUTE");
    EXPECT_EQ(j["process_name"].get<std::string>(), "spotify.exe");
    EXPECT_EQ(j["pid"].get<long long>(), 42);

    LogEntry bare{1000, LogLevel::EVENT, "Daemon", "Daemon started", "", -1};
    json b = bare.to_json();
    EXPECT_FALSE(b.contains("process_name"));
    EXPECT_FALSE(b.contains("pid"));
    EXPECT_STREQ(log_level_name(LogLevel::ERR), "ERROR");
}

// The logger is a process-wide singleton, so everything that needs a live
// instance lives in this one test.
TEST(LoggerTest, WritesRotatesAndReadsBackNewestFirst) {
    TempDir dir;
    auto logger = Logger::get_instance(dir.path.string());

    logger->log(LogLevel::EVENT, "Daemon", "Daemon started");
    logger->log(LogLevel::ACTION_MUTE, "Mute", "Muted (background)", "spotify.exe", 100);
    std::vector<LogEntry> batch;
    for (int i = 0; i < 600; ++i) {
        batch.push_back(LogEntry{2000 + i, LogLevel::INFO, "Bulk", "entry " + std::to_string(i), "", -1});
    }
    logger->log_batch(batch);
    logger->stop();
    logger->stop();

    auto files = logger->get_log_files();
    ASSERT_GE(files.size(), 2u);
    for (const auto& f : files) {
        EXPECT_EQ(f.rfind("hush_", 0), 0u);
        std::ifstream ifs(dir.path / f);
        std::string line;
        int lines = 0;
        while (std::getline(ifs, line)) lines++;
        EXPECT_LE(lines, 500);
    }

    // Newest file holds the tail of the batch.
    auto newest = logger->get_logs_from_file(files[0], 3, std::nullopt, std::nullopt);
    ASSERT_EQ(newest.size(), 3u);
    EXPECT_EQ(newest[0].message, "entry 599");
    EXPECT_EQ(newest[1].message, "entry 598");

    auto windowed = logger->get_logs_from_file(files[0], 10, 2590LL, 2585LL);
    ASSERT_EQ(windowed.size(), 4u);
    EXPECT_EQ(windowed[0].timestamp_ms, 2589);
    EXPECT_EQ(windowed[3].timestamp_ms, 2586);

    bool found_mute = false;
    for (const auto& f : files) {
        for (const auto& entry : logger->get_logs_from_file(f, 0, std::nullopt, std::nullopt)) {
            if (entry.level == LogLevel::ACTION_MUTE) {
                found_mute = true;
                EXPECT_EQ(entry.process_name, "spotify.exe");
                EXPECT_EQ(entry.pid, 100);
            }
        }
    }
    EXPECT_TRUE(found_mute);

    EXPECT_TRUE(logger->get_logs_from_file("hush_missing.log", 10, std::nullopt, std::nullopt).empty());
}
