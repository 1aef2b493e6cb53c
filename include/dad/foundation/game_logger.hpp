#pragma once

/// @file game_logger.hpp
/// @brief GameLogger: category-filtered logging over kcenon common_system.
///
/// Log output is routed through kcenon's GlobalLoggerRegistry.  Each
/// category looks up a named logger ("dad.<Category>") and falls back to
/// the registry's default logger, so an application can send e.g. spawn
/// diagnostics to a separate sink without touching call sites.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "dad/foundation/game_result.hpp"

namespace dad::foundation {

/// Severity, ordered from most to least verbose.  Values line up with
/// kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t { Trace, Debug, Info, Warning, Error, Critical, Off };

/// Subsystems that can be filtered independently.
enum class LogCategory : uint8_t {
    Core,      ///< Startup, session lifecycle
    ECS,       ///< Entity store
    Config,    ///< Configuration loading and validation
    Unit,      ///< Unit catalog and registry
    Spawn,     ///< Spawn orchestration
    Animation, ///< Animation child instantiation
    AI         ///< Behavior repertoire wiring
};

inline constexpr std::size_t kLogCategoryCount = static_cast<std::size_t>(LogCategory::AI) + 1;

constexpr std::string_view logCategoryName(LogCategory cat) {
    switch (cat) {
        case LogCategory::Core:      return "Core";
        case LogCategory::ECS:       return "ECS";
        case LogCategory::Config:    return "Config";
        case LogCategory::Unit:      return "Unit";
        case LogCategory::Spawn:     return "Spawn";
        case LogCategory::Animation: return "Animation";
        case LogCategory::AI:        return "AI";
    }
    return "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a lowercase level name ("debug", "warning", ...) as used in
/// configuration files.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a lowercase category name ("spawn", "ai", ...).
std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Structured fields appended to a log line as `{key=value, ...}`.
///
/// @code
///   LogContext ctx;
///   ctx.entity = unit.raw;
///   ctx.unit = "knight";
///   ctx.team = "Enemy";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Spawn, "Unit spawned", ctx);
/// @endcode
struct LogContext {
    std::optional<uint32_t> entity;
    std::optional<std::string> unit;
    std::optional<std::string> team;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger.
///
/// Default minimum levels:
/// | Category  | Default |
/// |-----------|---------|
/// | Core      | Info    |
/// | ECS       | Info    |
/// | Config    | Info    |
/// | Unit      | Info    |
/// | Spawn     | Debug   |
/// | Animation | Info    |
/// | AI        | Debug   |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    GameResult<void> flush();

    /// Process-wide logger used by the DAD_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dad::foundation

/// @name DAD_LOG macros
/// Define DAD_MIN_LOG_LEVEL (0=Trace .. 6=Off) before inclusion to compile
/// out calls below the threshold.
/// @{

#ifndef DAD_MIN_LOG_LEVEL
    #define DAD_MIN_LOG_LEVEL 0
#endif

#define DAD_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= DAD_MIN_LOG_LEVEL &&                      \
            ::dad::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::dad::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define DAD_LOG_DEBUG(cat, msg) \
    DAD_LOG(::dad::foundation::LogLevel::Debug, (cat), (msg))

#define DAD_LOG_INFO(cat, msg) \
    DAD_LOG(::dad::foundation::LogLevel::Info, (cat), (msg))

#define DAD_LOG_WARN(cat, msg) \
    DAD_LOG(::dad::foundation::LogLevel::Warning, (cat), (msg))

#define DAD_LOG_ERROR(cat, msg) \
    DAD_LOG(::dad::foundation::LogLevel::Error, (cat), (msg))

/// @}
