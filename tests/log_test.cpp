#include "log.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>

static std::string readLog() {
    std::ifstream     in(EDGE_SCROLL_LOG_PATH);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST(EdgeLogTest, WritesOnlyWhenDebugIsOn) {
    std::remove(EDGE_SCROLL_LOG_PATH);

    setDebugLogging(false);
    edgeLog("quiet line");
    EXPECT_EQ(readLog().find("quiet line"), std::string::npos);

    setDebugLogging(true);
    EXPECT_TRUE(debugLoggingEnabled());
    edgeLog("loud line");
    setDebugLogging(false);

    EXPECT_NE(readLog().find("[hypr-edge-scroll] loud line"), std::string::npos);
    std::remove(EDGE_SCROLL_LOG_PATH);
}
