#include <gtest/gtest.h>
#include "tally_log.hpp"

using tally::LogLevel;

TEST(PersistencePolicyTest, DefaultTable) {
    tally::PersistencePolicy policy;
    EXPECT_FALSE(policy.isPersisted(LogLevel::DEBUG));
    EXPECT_FALSE(policy.isPersisted(LogLevel::INFO));
    EXPECT_TRUE(policy.isPersisted(LogLevel::WARNING));
    EXPECT_TRUE(policy.isPersisted(LogLevel::ERROR));
    EXPECT_TRUE(policy.isPersisted(LogLevel::CRITICAL));
}

TEST(PersistencePolicyTest, SaveFileForcesPersistenceOn) {
    tally::PersistencePolicy policy;
    const LogLevel levels[] = {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARNING,
                               LogLevel::ERROR, LogLevel::CRITICAL};
    for (LogLevel level : levels) {
        EXPECT_TRUE(policy.shouldPersist(level, true)) << tally::getLevelString(level);
    }
}

TEST(PersistencePolicyTest, WithoutOverrideFollowsTable) {
    tally::PersistencePolicy policy;
    EXPECT_FALSE(policy.shouldPersist(LogLevel::DEBUG, false));
    EXPECT_FALSE(policy.shouldPersist(LogLevel::INFO, false));
    // The flag cannot turn persistence off for levels that are always written.
    EXPECT_TRUE(policy.shouldPersist(LogLevel::WARNING, false));
    EXPECT_TRUE(policy.shouldPersist(LogLevel::ERROR, false));
    EXPECT_TRUE(policy.shouldPersist(LogLevel::CRITICAL, false));
}

TEST(PersistencePolicyTest, UnknownLevelIsConsoleOnly) {
    tally::PersistencePolicy policy;
    EXPECT_FALSE(policy.isPersisted(static_cast<LogLevel>(42)));
}
