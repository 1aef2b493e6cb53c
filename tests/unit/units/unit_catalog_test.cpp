#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "dad/units/unit_catalog.hpp"

using namespace dad::units;
using dad::foundation::ErrorCode;
using dad::game::AnimationClipSpec;

namespace {

/// Knight data without any clips.
class ClipLessKnightFactory final : public IUnitFactory {
public:
    UnitType GetUnitType() const override { return UnitType::Knight; }
    StatProfile GetStatProfile() const override { return KnightFactory().GetStatProfile(); }
    dad::game::BehaviorRepertoire GetBehaviorRepertoire() const override {
        return KnightFactory().GetBehaviorRepertoire();
    }
    std::vector<AnimationClipSpec> GetAnimationClips() const override { return {}; }
};

} // namespace

TEST(UnitCatalogTest, DefaultHasEveryType) {
    auto catalog = UnitCatalog::CreateDefault();
    EXPECT_EQ(catalog.Size(), kUnitTypeCount);

    for (auto type : kAllUnitTypes) {
        const auto* factory = catalog.Find(type);
        ASSERT_NE(factory, nullptr) << unitTypeName(type);
        EXPECT_EQ(factory->GetUnitType(), type);
    }
}

TEST(UnitCatalogTest, DefaultValidates) {
    auto catalog = UnitCatalog::CreateDefault();
    EXPECT_TRUE(catalog.Validate().hasValue());
}

TEST(UnitCatalogTest, FindOutOfRangeReturnsNull) {
    auto catalog = UnitCatalog::CreateDefault();
    EXPECT_EQ(catalog.Find(UnitType::COUNT), nullptr);
}

TEST(UnitCatalogTest, RegisterRejectsDuplicate) {
    auto catalog = UnitCatalog::CreateDefault();
    auto result = catalog.Register(std::make_unique<CatFactory>());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnitFactoryDuplicate);
}

TEST(UnitCatalogTest, RegisterRejectsNull) {
    UnitCatalog catalog;
    auto result = catalog.Register(nullptr);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(UnitCatalogTest, ValidateReportsMissingFactory) {
    UnitCatalog catalog;
    ASSERT_TRUE(catalog.Register(std::make_unique<AcolyteFactory>()));
    ASSERT_TRUE(catalog.Register(std::make_unique<WarriorFactory>()));
    ASSERT_TRUE(catalog.Register(std::make_unique<KnightFactory>()));

    auto result = catalog.Validate();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnitFactoryMissing);
    ASSERT_NE(result.error().context<UnitType>(), nullptr);
    EXPECT_EQ(*result.error().context<UnitType>(), UnitType::Cat);
}

TEST(UnitCatalogTest, ValidateReportsDefectiveFactory) {
    UnitCatalog catalog;
    ASSERT_TRUE(catalog.Register(std::make_unique<AcolyteFactory>()));
    ASSERT_TRUE(catalog.Register(std::make_unique<WarriorFactory>()));
    ASSERT_TRUE(catalog.Register(std::make_unique<CatFactory>()));
    ASSERT_TRUE(catalog.Register(std::make_unique<ClipLessKnightFactory>()));

    auto result = catalog.Validate();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MissingIdleClip);
}
