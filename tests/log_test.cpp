// NOLINTBEGIN(misc-include-cleaner)
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

#include <gtest/gtest.h>

#include "log.h"
#include "log_context.h"

namespace nett
{

TEST(LogTest, InitAndShutdown)
{
    init_log("nett_test_run.log");
    LOG_INFO("testing log initialization");
    set_level("debug");
    LOG_DEBUG("testing debug level");
    set_level("trace");
    LOG_TRACE("testing trace level");
    set_level("warn");
    LOG_WARN("testing warn level");
    set_level("error");
    LOG_ERROR("testing error level");
    shutdown_log();

    std::ifstream f("nett_test_run.log");
    EXPECT_TRUE(f.good());
    const std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("testing log initialization"), std::string::npos);
    f.close();
    std::remove("nett_test_run.log");
    init_console_log();
}

TEST(LogTest, ConfiguredLevelFiltersLines)
{
    init_log("nett_test_level.log", "warn");
    LOG_INFO("hidden info line");
    LOG_WARN("visible warn line");
    shutdown_log();

    std::ifstream f("nett_test_level.log");
    const std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content.find("hidden info line"), std::string::npos);
    EXPECT_NE(content.find("visible warn line"), std::string::npos);
    f.close();
    std::remove("nett_test_level.log");
    init_console_log();
}

TEST(LogTest, EnvVariables)
{
    setenv("TRACE", "1", 1);
    setenv("kLogFileSize", "1024", 1);
    setenv("kLogFileCount", "2", 1);

    init_log("nett_test_env.log", "error");
    EXPECT_TRUE(spdlog::default_logger()->should_log(spdlog::level::trace));
    LOG_TRACE("should be visible");
    shutdown_log();

    unsetenv("TRACE");
    unsetenv("kLogFileSize");
    unsetenv("kLogFileCount");
    std::remove("nett_test_env.log");
    init_console_log();
}

TEST(LogTest, ContextPrefix)
{
    init_console_log("trace");
    connection_context ctx;
    ctx.trace_id("abc");
    ctx.conn_id(3);
    LOG_CTX_INFO(ctx, "{} context line", log_event::kConnInit);
    LOG_CTX_DEBUG(ctx, "no arguments");
    set_level("info");
}

TEST(LogTest, SetLevelValues)
{
    set_level("warning");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    set_level("err");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
    set_level("off");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::off);
    set_level("unknown");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}

}    // namespace nett
// NOLINTEND(misc-include-cleaner)
