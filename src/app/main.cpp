/// @file main.cpp
/// @brief Arena demo entry point.
///
/// Loads the arena configuration, spends the starting mana on defenders,
/// sends an opening wave of knights and tears the level down again.

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <utility>

#include "dad/app/arena_session.hpp"
#include "dad/foundation/config_manager.hpp"
#include "dad/foundation/game_logger.hpp"
#include "dad/version.hpp"

namespace {

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

struct WaveConfig {
    unsigned int startingMana = 100;
    unsigned int knights = 3;
    float knightSpacing = 64.0f;
    float spawnDistance = 400.0f;
};

WaveConfig buildWaveConfig(const dad::foundation::ConfigManager& config) {
    WaveConfig cfg;

    auto mana = config.get<unsigned int>("arena.starting_mana");
    if (mana) {
        cfg.startingMana = mana.value();
    }

    auto knights = config.get<unsigned int>("arena.opening_knights");
    if (knights) {
        cfg.knights = knights.value();
    }

    auto spacing = config.get<float>("arena.knight_spacing");
    if (spacing) {
        cfg.knightSpacing = spacing.value();
    }

    auto distance = config.get<float>("arena.spawn_distance");
    if (distance) {
        cfg.spawnDistance = distance.value();
    }

    return cfg;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace dad;

    auto configPath = parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/arena.yaml";
    }

    foundation::ConfigManager config;
    auto loadResult = config.load(configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto sessionResult = app::ArenaSession::Create(config);
    if (!sessionResult) {
        std::cerr << "Failed to start arena: "
                  << sessionResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto session = std::move(sessionResult).value();
    auto wave = buildWaveConfig(config);

    std::cout << "Dark Arts Defense " << DAD_VERSION_STRING << "\n";

    // Defenders, bought in order while mana lasts.
    unsigned int mana = wave.startingMana;
    const units::UnitType defenders[] = {
        units::UnitType::Acolyte, units::UnitType::Warrior, units::UnitType::Cat};
    float x = -96.0f;
    for (auto type : defenders) {
        if (!session->Registry().CanAfford(type, mana)) {
            std::cout << "Not enough mana for " << units::unitTypeName(type) << "\n";
            continue;
        }
        auto unit = session->Spawner().Spawn(type, game::Team::Player, {x, 0.0f});
        if (!unit) {
            std::cerr << "Spawn failed: " << unit.error().message() << "\n";
            return EXIT_FAILURE;
        }
        mana -= session->Registry().Lookup(type).cost;
        x += 96.0f;
    }

    for (unsigned int i = 0; i < wave.knights; ++i) {
        const float y = (static_cast<float>(i) - static_cast<float>(wave.knights - 1) / 2.0f) *
                        wave.knightSpacing;
        auto unit = session->Spawner().Spawn(units::UnitType::Knight, game::Team::Enemy,
                                             {wave.spawnDistance, y});
        if (!unit) {
            std::cerr << "Spawn failed: " << unit.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto& world = session->World();
    std::cout << "Arena populated (units: " << world.UnitCount()
              << ", entities: " << world.Entities().Count()
              << ", mana left: " << mana << ")\n";

    auto destroyed = world.TeardownLevel();
    std::cout << "Level torn down (" << destroyed << " units removed, "
              << world.Entities().Count() << " entities left)\n";

    auto flushResult = foundation::GameLogger::instance().flush();
    if (!flushResult) {
        std::cerr << "Failed to flush logs: " << flushResult.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
