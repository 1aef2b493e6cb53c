/// @file unit_catalog.cpp
/// @brief UnitCatalog implementation.

#include "dad/units/unit_catalog.hpp"

#include "dad/foundation/game_logger.hpp"
#include "dad/units/unit_validation.hpp"

#include <string>
#include <utility>

namespace dad::units {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

UnitCatalog UnitCatalog::CreateDefault() {
    UnitCatalog catalog;
    auto install = [&catalog](std::unique_ptr<IUnitFactory> factory) {
        auto& slot = catalog.factories_[static_cast<std::size_t>(factory->GetUnitType())];
        slot = std::move(factory);
    };
    install(std::make_unique<AcolyteFactory>());
    install(std::make_unique<WarriorFactory>());
    install(std::make_unique<CatFactory>());
    install(std::make_unique<KnightFactory>());
    return catalog;
}

GameResult<void> UnitCatalog::Register(std::unique_ptr<IUnitFactory> factory) {
    if (!factory) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "cannot register a null unit factory"));
    }

    const auto type = factory->GetUnitType();
    const auto idx = static_cast<std::size_t>(type);
    if (idx >= kUnitTypeCount) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidArgument,
            "unit factory reports unknown type " + std::to_string(idx)));
    }
    if (factories_[idx]) {
        return GameResult<void>::err(GameError(
            ErrorCode::UnitFactoryDuplicate,
            "unit factory already registered for " + std::string(unitTypeName(type)), type));
    }

    factories_[idx] = std::move(factory);
    DAD_LOG_DEBUG(LogCategory::Unit,
                  "registered unit factory: " + std::string(unitTypeName(type)));
    return GameResult<void>::ok();
}

const IUnitFactory* UnitCatalog::Find(UnitType type) const noexcept {
    const auto idx = static_cast<std::size_t>(type);
    if (idx >= kUnitTypeCount) {
        return nullptr;
    }
    return factories_[idx].get();
}

GameResult<void> UnitCatalog::Validate() const {
    for (auto type : kAllUnitTypes) {
        const auto* factory = Find(type);
        if (factory == nullptr) {
            return GameResult<void>::err(GameError(
                ErrorCode::UnitFactoryMissing,
                "no unit factory for " + std::string(unitTypeName(type)), type));
        }
        auto check = ValidateFactory(*factory);
        if (!check) {
            return check;
        }
    }
    DAD_LOG_INFO(LogCategory::Unit,
                 "unit catalog validated: " + std::to_string(Size()) + " factories");
    return GameResult<void>::ok();
}

std::size_t UnitCatalog::Size() const noexcept {
    std::size_t n = 0;
    for (const auto& f : factories_) {
        if (f) {
            ++n;
        }
    }
    return n;
}

} // namespace dad::units
