#include <gtest/gtest.h>
#include "stencil/engine/renderer.hpp"
#include "stencil/log.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sstream>

using namespace stencil;

class LogTest : public ::testing::Test {
protected:
    std::ostringstream captured;

    void SetUp() override {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
        auto logger = std::make_shared<spdlog::logger>("stencil-test", sink);
        logger->set_pattern("%l %v");
        logger->set_level(spdlog::level::debug);
        log::set_logger(logger);
    }

    void TearDown() override {
        log::set_logger(nullptr);
    }
};

TEST_F(LogTest, LenientMissIsLoggedAtDebug) {
    auto tmpl = parse("{known} {unknown}");
    ASSERT_TRUE(tmpl.has_value());

    auto text = render(*tmpl, {{"known", "k"}}, RenderOptions::lenient());
    ASSERT_TRUE(text.has_value());

    log::logger()->flush();
    EXPECT_NE(captured.str().find("debug Variable 'unknown' missing"), std::string::npos) << captured.str();
}

TEST_F(LogTest, ParseFailureIsLogged) {
    auto tmpl = parse("{x} and {{y}}");
    ASSERT_FALSE(tmpl.has_value());

    log::logger()->flush();
    EXPECT_NE(captured.str().find("mixed_format"), std::string::npos) << captured.str();
}

TEST_F(LogTest, RenderedContentIsNotLogged) {
    auto tmpl = parse("{secret}");
    ASSERT_TRUE(tmpl.has_value());

    auto text = render(*tmpl, {{"secret", "hunter2"}});
    ASSERT_TRUE(text.has_value());

    log::logger()->flush();
    EXPECT_EQ(captured.str().find("hunter2"), std::string::npos);
}

TEST_F(LogTest, SetLevelAppliesToCurrentLogger) {
    log::set_level(spdlog::level::warn);
    auto tmpl = parse("{x} and {{y}}");
    ASSERT_FALSE(tmpl.has_value());

    log::logger()->flush();
    EXPECT_TRUE(captured.str().empty());
}

TEST(DefaultLogTest, NullRestoresDefaultLogger) {
    log::set_logger(nullptr);
    auto logger = log::logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), log::kLoggerName);
    EXPECT_EQ(logger->level(), spdlog::level::warn);
}

TEST(DefaultLogTest, DefaultLoggerWritesToColoredStderr) {
    log::set_logger(nullptr);
    const auto& sinks = log::logger()->sinks();
    ASSERT_EQ(sinks.size(), 1u);
    EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(sinks.front()), nullptr);
}
