/// @file game_logger.cpp
/// @brief GameLogger over kcenon GlobalLoggerRegistry.

#include "dad/foundation/game_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace dad::foundation {

namespace kc = kcenon::common::interfaces;

namespace {

kc::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kc::log_level::trace;
        case LogLevel::Debug:    return kc::log_level::debug;
        case LogLevel::Info:     return kc::log_level::info;
        case LogLevel::Warning:  return kc::log_level::warning;
        case LogLevel::Error:    return kc::log_level::error;
        case LogLevel::Critical: return kc::log_level::critical;
        case LogLevel::Off:      return kc::log_level::off;
    }
    return kc::log_level::info;
}

constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // ECS
    LogLevel::Info,   // Config
    LogLevel::Info,   // Unit
    LogLevel::Debug,  // Spawn
    LogLevel::Info,   // Animation
    LogLevel::Debug   // AI
};

std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.entity) {
        append("entity", std::to_string(*ctx.entity));
    }
    if (ctx.unit && !ctx.unit->empty()) {
        append("unit", *ctx.unit);
    }
    if (ctx.team && !ctx.team->empty()) {
        append("team", *ctx.team);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }
    return oss.str();
}

std::string formatLine(LogCategory cat, std::string_view msg, std::string_view ctx) {
    std::string line;
    line.reserve(msg.size() + ctx.size() + 20);
    line += '[';
    line += logCategoryName(cat);
    line += "] ";
    line += msg;
    if (!ctx.empty()) {
        line += " {";
        line += ctx;
        line += '}';
    }
    return line;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (equalsIgnoreCase(logLevelName(level), name)) {
            return level;
        }
    }
    return std::nullopt;
}

std::optional<LogCategory> parseLogCategory(std::string_view name) {
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        if (equalsIgnoreCase(logCategoryName(cat), name)) {
            return cat;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GameLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("dad.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    /// Named category logger when one is registered, the default otherwise.
    std::shared_ptr<kc::ILogger> getLogger(LogCategory cat) const {
        auto& registry = kc::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger(loggerNames[static_cast<std::size_t>(cat)]);
        if (named && named->is_enabled(kc::log_level::critical)) {
            return named;
        }
        return registry.get_default_logger();
    }
};

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->getLogger(cat)->log(mapLevel(level), formatLine(cat, msg, {}));
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto ctxStr = formatContext(ctx);
    impl_->getLogger(cat)->log(mapLevel(level), formatLine(cat, msg, ctxStr));
}

void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

GameResult<void> GameLogger::flush() {
    auto logger = kc::GlobalLoggerRegistry::instance().get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger inst;
    return inst;
}

} // namespace dad::foundation
