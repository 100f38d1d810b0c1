#include <gtest/gtest.h>

#include "termpost/log.hpp"

#include <sstream>

TEST(Logger, WritesToolAndLevelPrefix)
{
    std::ostringstream sink;
    termpost::log::Logger logger("term-post-ansi", &sink);
    logger.error("cannot read input");
    EXPECT_EQ(sink.str(), "term-post-ansi: error: cannot read input\n");
}

TEST(Logger, ThresholdFiltersLowerLevels)
{
    std::ostringstream sink;
    termpost::log::Logger logger("tool", &sink);
    logger.info("hidden");
    logger.debug("hidden");
    logger.warning("shown");
    EXPECT_EQ(sink.str(), "tool: warning: shown\n");

    logger.setThreshold(termpost::log::Level::Debug);
    EXPECT_TRUE(logger.enabled(termpost::log::Level::Debug));
    logger.debug("detail");
    EXPECT_EQ(sink.str(), "tool: warning: shown\ntool: debug: detail\n");
}

TEST(Logger, NullSinkAndNullLoggerAreSilent)
{
    termpost::log::Logger logger("tool", nullptr);
    EXPECT_FALSE(logger.enabled(termpost::log::Level::Error));
    logger.error("nowhere");

    termpost::log::warning(nullptr, "nobody listens");
    termpost::log::debug(nullptr, "nobody listens");
}
