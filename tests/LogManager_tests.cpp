// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include "log/LogManager.hpp"
#include "log/LogMacros.h"

using namespace vrig;

TEST(LogManagerTest, FormatsAndBuffersMessages)
{
    LogManager log;
    log.log("Bones: %d, name '%s'", 3, "arm");
    log.log("second");

    ASSERT_EQ(log.size(), 2u);
    auto messages = log.messages();
    EXPECT_EQ(messages[0], "Bones: 3, name 'arm'");
    EXPECT_EQ(messages[1], "second");

    // Full lines carry a relative time stamp
    EXPECT_EQ(log.lines()[0].rfind("[+", 0), 0u);
    EXPECT_NE(log.lines()[0].find("Bones: 3"), std::string::npos);

    log.clear();
    EXPECT_EQ(log.size(), 0u);
    EXPECT_TRUE(log.messages().empty());
}

TEST(LogManagerTest, EchoesToStream)
{
    std::ostringstream out;
    LogManager log(out);
    log.log("hello %s", "rig");

    EXPECT_NE(out.str().find("hello rig\n"), std::string::npos);
}

TEST(LogManagerTest, MacrosPrefixSeverity)
{
    auto log = std::make_shared<LogManager>();
    VRIG_LOG_INFO(log, "created %d", 1);
    VRIG_LOG_WARN(log, "rejected");
    VRIG_LOG_ERROR(log, "failed");

    auto messages = log->messages();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0], "[INFO] created 1");
    EXPECT_EQ(messages[1], "[WARN] rejected");
    EXPECT_EQ(messages[2], "[ERROR] failed");

    // Null log manager disables logging
    std::shared_ptr<ILogManager> none;
    VRIG_LOG_INFO(none, "dropped");
}
