#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <vector>

#include "dad/foundation/error_code.hpp"
#include "dad/foundation/game_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace dad::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// CapturingLogger: records every line GameLogger forwards
// ---------------------------------------------------------------------------

namespace kc = kcenon::common;

struct CapturedLine {
    log_level level;
    std::string text;
};

class CapturingLogger final : public ILogger {
public:
    kc::VoidResult log(log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        lines_.push_back({level, message});
        return kc::VoidResult::ok(std::monostate{});
    }

    kc::VoidResult log(log_level level, std::string_view message,
                       const kc::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kc::VoidResult log(const kc::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level /*level*/) const override { return true; }

    kc::VoidResult set_level(log_level level) override {
        level_ = level;
        return kc::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return level_; }

    kc::VoidResult flush() override {
        flushed_ = true;
        return kc::VoidResult::ok(std::monostate{});
    }

    std::vector<CapturedLine> lines() const {
        std::lock_guard lock(mutex_);
        return lines_;
    }

    bool flushed() const { return flushed_; }

    void forget() {
        std::lock_guard lock(mutex_);
        lines_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<CapturedLine> lines_;
    log_level level_ = log_level::trace;
    bool flushed_ = false;
};

// ---------------------------------------------------------------------------
// Test fixture: registers a CapturingLogger as the default logger
// ---------------------------------------------------------------------------

class GameLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        sink_ = std::make_shared<CapturingLogger>();
        registry.set_default_logger(sink_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<CapturingLogger> sink_;
};

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::ECS), "ECS");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(LogCategory::Unit), "Unit");
    EXPECT_EQ(logCategoryName(LogCategory::Spawn), "Spawn");
    EXPECT_EQ(logCategoryName(LogCategory::Animation), "Animation");
    EXPECT_EQ(logCategoryName(LogCategory::AI), "AI");
    EXPECT_EQ(kLogCategoryCount, 7u);
}

TEST(LogLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

TEST(LogCategoryTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogCategory("spawn"), LogCategory::Spawn);
    EXPECT_EQ(parseLogCategory("ai"), LogCategory::AI);
    EXPECT_EQ(parseLogCategory("ecs"), LogCategory::ECS);
    EXPECT_FALSE(parseLogCategory("network").has_value());
}

// ---------------------------------------------------------------------------
// Levels
// ---------------------------------------------------------------------------

TEST(GameLoggerBasicTest, DefaultCategoryLevels) {
    GameLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::ECS), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Unit), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Spawn), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Animation), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::AI), LogLevel::Debug);
}

TEST(GameLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    GameLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Unit));

    logger.setCategoryLevel(LogCategory::Unit, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Unit));

    logger.setCategoryLevel(LogCategory::Unit, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Unit));
}

TEST(GameLoggerBasicTest, OffLevelIsNeverEnabled) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));
}

// ---------------------------------------------------------------------------
// Basic logging
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, LogFormatsMessageWithCategory) {
    GameLogger logger;
    logger.log(LogLevel::Info, LogCategory::Unit, "catalog ready");

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].level, log_level::info);
    EXPECT_EQ(lines[0].text, "[Unit] catalog ready");
}

TEST_F(GameLoggerTest, LogFiltersMessagesBelowLevel) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Warning);
    logger.log(LogLevel::Info, LogCategory::Core, "Should be filtered");

    EXPECT_TRUE(sink_->lines().empty());
}

TEST_F(GameLoggerTest, LogWithContextIncludesFields) {
    GameLogger logger;

    LogContext ctx;
    ctx.entity = 42;
    ctx.unit = "knight";
    ctx.team = "Enemy";
    ctx.extra["behavior"] = "MoveToOrigin";

    logger.logWithContext(LogLevel::Debug, LogCategory::Spawn, "unit spawned", ctx);

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);

    const auto& msg = lines[0].text;
    EXPECT_EQ(lines[0].level, log_level::debug);
    EXPECT_EQ(msg.rfind("[Spawn] unit spawned {", 0), 0u);
    EXPECT_NE(msg.find("entity=42"), std::string::npos);
    EXPECT_NE(msg.find("unit=knight"), std::string::npos);
    EXPECT_NE(msg.find("team=Enemy"), std::string::npos);
    EXPECT_NE(msg.find("behavior=MoveToOrigin"), std::string::npos);
}

TEST_F(GameLoggerTest, LogWithEmptyContextOmitsBraces) {
    GameLogger logger;

    LogContext ctx;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", ctx);

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "[Core] No context");
}

TEST_F(GameLoggerTest, FlushDelegatesToLogger) {
    GameLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(sink_->flushed());
}

// ---------------------------------------------------------------------------
// Singleton and macros
// ---------------------------------------------------------------------------

TEST(GameLoggerSingletonTest, InstanceReturnsSameObject) {
    auto& a = GameLogger::instance();
    auto& b = GameLogger::instance();
    EXPECT_EQ(&a, &b);
}

TEST_F(GameLoggerTest, MacroLogsWhenEnabled) {
    GameLogger::instance().setCategoryLevel(LogCategory::Animation, LogLevel::Debug);

    DAD_LOG_DEBUG(LogCategory::Animation, "macro test");

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "[Animation] macro test");

    GameLogger::instance().setCategoryLevel(LogCategory::Animation, LogLevel::Info);
}

TEST_F(GameLoggerTest, MacroSkipsWhenDisabled) {
    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Error);
    sink_->forget();

    DAD_LOG_DEBUG(LogCategory::Core, "should not appear");

    EXPECT_TRUE(sink_->lines().empty());
    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Info);
}
