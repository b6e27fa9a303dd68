#include <gtest/gtest.h>

#include "engine/core/logging.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace procsim;

TEST(logging, parses_level_names)
{
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
    EXPECT_STREQ(to_string(LogLevel::WARN), "WARN");
}

TEST(logging, sink_receives_records_above_the_level)
{
    std::vector<std::pair<LogLevel, std::string>> seen;
    const LogLevel saved = get_log_level();
    set_log_level(LogLevel::WARN);
    set_log_sink([&seen](LogLevel lvl, const std::string& msg) { seen.emplace_back(lvl, msg); });

    EXPECT_FALSE(log_enabled(LogLevel::INFO));
    EXPECT_TRUE(log_enabled(LogLevel::ERROR));
    log(LogLevel::DEBUG, "dropped");
    log(LogLevel::INFO, "dropped");
    log(LogLevel::WARN, "kept");
    log(LogLevel::ERROR, "also kept");

    set_log_sink(nullptr);
    set_log_level(saved);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].first, LogLevel::WARN);
    EXPECT_EQ(seen[0].second, "kept");
    EXPECT_EQ(seen[1].first, LogLevel::ERROR);
}

TEST(logging, throwing_sink_does_not_escape)
{
    set_log_sink([](LogLevel, const std::string&) { throw std::runtime_error("sink down"); });
    EXPECT_NO_THROW(log(LogLevel::ERROR, "lost"));
    set_log_sink(nullptr);
}
