#include <gtest/gtest.h>
#include "tally_log.hpp"
#include "utils/test_utils.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <future>
#include <set>
#include <string>
#include <thread>
#include <vector>

using tally::FileFormat;

class ThreadSafetyTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = TestUtils::makeScratchDirectory(
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        m_log = tally::LogManager::configure()
            .directory(m_dir)
            .console(nullptr)
            .build();
    }
    void TearDown() override {
        m_log.reset();
        TestUtils::removeDirectory(m_dir);
    }

    std::string m_dir;
    std::unique_ptr<tally::LogManager> m_log;
};

TEST_F(ThreadSafetyTest, ConcurrentBlockingCallsProduceWholeJsonLines) {
    static const int kThreadCount = 8;
    static const int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    std::atomic<int> startFlag(0);
    tally::LogManager &log = *m_log;

    for (int t = 0; t < kThreadCount; ++t) {
        threads.emplace_back([&log, &startFlag, t]() {
            while (startFlag.load(std::memory_order_acquire) == 0) {
                std::this_thread::yield();
            }
            for (int i = 0; i < kMessagesPerThread; ++i) {
                log.error("Thread " + std::to_string(t) + " message " + std::to_string(i));
            }
        });
    }

    startFlag.store(1, std::memory_order_release);
    for (auto &th : threads) {
        th.join();
    }

    auto lines = TestUtils::readLines(m_dir + "/json/error.json");
    ASSERT_EQ(lines.size(), static_cast<size_t>(kThreadCount * kMessagesPerThread));

    std::set<std::string> seen;
    for (const auto &line : lines) {
        nlohmann::json j = nlohmann::json::parse(line);
        seen.insert(j["message"].get<std::string>());
    }
    EXPECT_EQ(seen.size(), static_cast<size_t>(kThreadCount * kMessagesPerThread));
}

TEST_F(ThreadSafetyTest, MixedBlockingAndAsyncCallers) {
    static const int kThreadCount = 4;
    static const int kMessagesPerThread = 50;

    tally::LogManager &log = *m_log;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreadCount; ++t) {
        threads.emplace_back([&log, t]() {
            std::vector<std::future<void> > pending;
            for (int i = 0; i < kMessagesPerThread; ++i) {
                std::string msg = "t" + std::to_string(t) + "-" + std::to_string(i);
                if (i % 2 == 0) {
                    log.warning(msg);
                } else {
                    pending.push_back(log.warningAsync(msg));
                }
            }
            for (auto &f : pending) {
                f.get();
            }
        });
    }
    for (auto &th : threads) {
        th.join();
    }

    auto lines = TestUtils::readLines(m_dir + "/json/warning.json");
    EXPECT_EQ(lines.size(), static_cast<size_t>(kThreadCount * kMessagesPerThread));
    for (const auto &line : lines) {
        EXPECT_NO_THROW(nlohmann::json::parse(line)) << line;
    }
}

// Concurrent first writes to one CSV file may each write the header; the
// data rows must all be present regardless.
TEST_F(ThreadSafetyTest, ConcurrentCsvWritesKeepEveryRow) {
    static const int kThreadCount = 4;
    static const int kMessagesPerThread = 50;

    tally::LogManager &log = *m_log;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreadCount; ++t) {
        threads.emplace_back([&log, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                log.critical("row " + std::to_string(t) + "/" + std::to_string(i), false, FileFormat::Csv);
            }
        });
    }
    for (auto &th : threads) {
        th.join();
    }

    auto rows = TestUtils::parseCsv(TestUtils::readLogFile(m_dir + "/csv/critical.csv"));
    size_t headers = 0;
    size_t dataRows = 0;
    for (const auto &row : rows) {
        ASSERT_EQ(row.size(), 3u);
        if (row[0] == "timestamp") {
            ++headers;
        } else {
            EXPECT_EQ(row[1], "CRITICAL");
            ++dataRows;
        }
    }
    EXPECT_EQ(rows[0][0], "timestamp");
    EXPECT_GE(headers, 1u);
    EXPECT_LE(headers, static_cast<size_t>(kThreadCount));
    EXPECT_EQ(dataRows, static_cast<size_t>(kThreadCount * kMessagesPerThread));
}
