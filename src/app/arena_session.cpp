/// @file arena_session.cpp
/// @brief ArenaSession startup sequence.

#include "dad/app/arena_session.hpp"

#include "dad/foundation/game_logger.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace dad::app {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameLogger;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

std::string loggingKey(LogCategory cat) {
    std::string key = "logging.";
    for (char c : foundation::logCategoryName(cat)) {
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key;
}

} // namespace

GameResult<void> ApplyLogLevels(const foundation::ConfigManager& config) {
    for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
        const auto cat = static_cast<LogCategory>(i);
        const auto key = loggingKey(cat);
        if (!config.hasKey(key)) {
            continue;
        }

        auto name = config.get<std::string>(key);
        if (!name) {
            return GameResult<void>::err(name.error());
        }
        auto level = foundation::parseLogLevel(name.value());
        if (!level) {
            return GameResult<void>::err(GameError(
                ErrorCode::ConfigInvalidValue,
                key + ": unknown log level '" + name.value() + "'"));
        }
        GameLogger::instance().setCategoryLevel(cat, *level);
    }
    return GameResult<void>::ok();
}

GameResult<std::unique_ptr<ArenaSession>> ArenaSession::Create(
    const foundation::ConfigManager& config) {
    using SessionResult = GameResult<std::unique_ptr<ArenaSession>>;

    if (auto logging = ApplyLogLevels(config); !logging) {
        return SessionResult::err(logging.error());
    }

    auto registry = units::UnitTypeRegistry::FromConfig(config);
    if (!registry) {
        return SessionResult::err(registry.error());
    }

    auto catalog = std::make_shared<units::UnitCatalog>(units::UnitCatalog::CreateDefault());
    if (auto valid = catalog->Validate(); !valid) {
        return SessionResult::err(valid.error());
    }

    auto session = std::make_unique<ArenaSession>(
        Token{}, std::move(registry).value(), std::move(catalog));

    DAD_LOG_INFO(LogCategory::Core, "arena session ready");
    return SessionResult::ok(std::move(session));
}

ArenaSession::ArenaSession(Token /*token*/, units::UnitTypeRegistry registry,
                           std::shared_ptr<const units::UnitCatalog> catalog)
    : registry_(std::move(registry)),
      catalog_(std::move(catalog)),
      animations_(world_.Entities(),
                  world_.Storage<game::SpriteAnimation>(),
                  world_.Storage<game::Transform>()),
      spawner_(world_, catalog_, animations_) {}

} // namespace dad::app
