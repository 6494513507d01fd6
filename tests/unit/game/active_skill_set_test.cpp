#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "arc/game/active_skill_set.hpp"
#include "arc/game/balance_config.hpp"
#include "arc/game/skill_catalog.hpp"
#include "arc/game/stat_block.hpp"
#include "test_doubles.hpp"

using namespace arc::game;
using arc::foundation::SkillId;
using arc::test::FakeRendering;
using arc::test::FakeTargeting;
using arc::test::RecordingNotifier;

namespace {

constexpr SkillId kBlink{100};

class ActiveSkillSetTest : public ::testing::Test {
protected:
    ActiveSkillSetTest()
        : catalog_(SkillCatalog::DefaultCatalog()),
          stats_(BalanceConfig::Defaults().progression),
          skills_(catalog_, BalanceConfig::Defaults().targeting, targeting_, &rendering_,
                  &notifier_) {}

    CastResult cast(SkillId id, std::string_view variant = {}) {
        return skills_.Cast(id, stats_, position_, facing_, variant);
    }

    CastResult primary(SkillId id) {
        return skills_.CastPrimaryAttack(id, stats_, position_, facing_);
    }

    /// Normal-category teleport with a real mana cost and cooldown.
    void registerBlink() {
        SkillDefinition blink;
        blink.id = kBlink;
        blink.name = "Blink";
        blink.type = SkillType::Teleport;
        blink.manaCost = 30.0f;
        blink.cooldown = 2.0f;
        blink.range = 10.0f;
        blink.duration = 1.0f;
        ASSERT_TRUE(catalog_.Register(blink).hasValue());
    }

    SkillCatalog catalog_;
    StatBlock stats_;
    FakeTargeting targeting_;
    FakeRendering rendering_;
    RecordingNotifier notifier_;
    ActiveSkillInstanceSet skills_;
    Vector3 position_;
    Vector3 facing_ = Vector3::Forward();
};

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Cast checks
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(ActiveSkillSetTest, CastSpendsManaAndStartsCooldown) {
    auto result = cast(skill_ids::kWaveOfLight);
    ASSERT_TRUE(result.hasValue());

    EXPECT_FLOAT_EQ(stats_.Mana(), 175.0f);
    EXPECT_FLOAT_EQ(catalog_.CooldownRemaining(skill_ids::kWaveOfLight), 0.2f);
    EXPECT_EQ(skills_.Count(), 1u);
    EXPECT_EQ(rendering_.live.size(), 1u);
    EXPECT_FALSE(result.value().target.has_value());
}

TEST_F(ActiveSkillSetTest, UnknownSkillIsRejected) {
    auto result = cast(SkillId(999));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), CastError::InvalidSkillId);
}

TEST_F(ActiveSkillSetTest, DeadCasterIsRejected) {
    stats_.SetDead(true);
    auto result = cast(skill_ids::kWaveOfLight);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), CastError::CasterDead);
    EXPECT_FLOAT_EQ(stats_.Mana(), 200.0f);
}

TEST_F(ActiveSkillSetTest, CooldownBlocksRecast) {
    ASSERT_TRUE(cast(skill_ids::kWaveOfLight).hasValue());
    auto again = cast(skill_ids::kWaveOfLight);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error(), CastError::OnCooldown);
    EXPECT_FLOAT_EQ(stats_.Mana(), 175.0f);
}

TEST_F(ActiveSkillSetTest, InsufficientManaChangesNothing) {
    stats_.SetMana(10.0f);
    auto result = cast(skill_ids::kWaveOfLight);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), CastError::InsufficientMana);
    EXPECT_FLOAT_EQ(stats_.Mana(), 10.0f);
    EXPECT_TRUE(catalog_.IsReady(skill_ids::kWaveOfLight));
    EXPECT_EQ(skills_.Count(), 0u);
}

TEST_F(ActiveSkillSetTest, ExactManaIsEnough) {
    stats_.SetMana(25.0f);
    ASSERT_TRUE(cast(skill_ids::kWaveOfLight).hasValue());
    EXPECT_FLOAT_EQ(stats_.Mana(), 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Live instances
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(ActiveSkillSetTest, InstancesOfOneSkillCoexist) {
    ASSERT_TRUE(cast(skill_ids::kWaveOfLight).hasValue());
    skills_.Update(0.2f, position_);
    ASSERT_TRUE(cast(skill_ids::kWaveOfLight).hasValue());

    EXPECT_EQ(skills_.CountOf(skill_ids::kWaveOfLight), 2u);
    EXPECT_NE(skills_.Instances()[0].id, skills_.Instances()[1].id);
}

TEST_F(ActiveSkillSetTest, ExpiredInstancesAreDisposed) {
    ASSERT_TRUE(cast(skill_ids::kWaveOfLight).hasValue());
    skills_.Update(1.0f, position_);
    EXPECT_EQ(skills_.Count(), 1u);
    EXPECT_GT(rendering_.updates, 0u);

    skills_.Update(2.0f, position_);
    EXPECT_EQ(skills_.Count(), 0u);
    EXPECT_EQ(rendering_.disposed.size(), 1u);
    EXPECT_TRUE(rendering_.live.empty());
}

TEST_F(ActiveSkillSetTest, InstancesExpireIndependently) {
    ASSERT_TRUE(cast(skill_ids::kWaveOfLight).hasValue());  // 3 s
    ASSERT_TRUE(cast(skill_ids::kShieldOfZen).hasValue());  // 8 s

    skills_.Update(3.0f, position_);
    EXPECT_EQ(skills_.Count(), 1u);
    EXPECT_EQ(skills_.CountOf(skill_ids::kShieldOfZen), 1u);
}

TEST_F(ActiveSkillSetTest, ClearDisposesEverything) {
    ASSERT_TRUE(cast(skill_ids::kWaveOfLight).hasValue());
    ASSERT_TRUE(cast(skill_ids::kWaveStrike).hasValue());
    skills_.Clear();
    EXPECT_EQ(skills_.Count(), 0u);
    EXPECT_EQ(rendering_.disposed.size(), 2u);
}

TEST_F(ActiveSkillSetTest, VariantIsRecordedOnInstance) {
    ASSERT_TRUE(cast(skill_ids::kWaveOfLight, "Pillar of the Ancients").hasValue());
    EXPECT_EQ(skills_.Instances().front().variant, "Pillar of the Ancients");
}

TEST_F(ActiveSkillSetTest, OnCastFiresPerInstance) {
    std::vector<std::string> castNames;
    skills_.OnCast().connect(
        [&](const SkillInstance& instance) { castNames.push_back(instance.definition.name); });

    ASSERT_TRUE(cast(skill_ids::kWaveOfLight).hasValue());
    ASSERT_TRUE(cast(skill_ids::kWaveStrike).hasValue());
    EXPECT_EQ(castNames, (std::vector<std::string>{"Wave of Light", "Wave Strike"}));
}

TEST_F(ActiveSkillSetTest, CastAimsAtNearestTarget) {
    auto near = targeting_.Add(Vector3(10.0f, 0.0f, 0.0f));
    targeting_.Add(Vector3(20.0f, 0.0f, 0.0f));

    auto result = cast(skill_ids::kWaveStrike);
    ASSERT_TRUE(result.hasValue());
    ASSERT_TRUE(result.value().target.has_value());
    EXPECT_EQ(*result.value().target, near);
    EXPECT_FLOAT_EQ(skills_.Instances().front().direction.x, 1.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Self effects
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(ActiveSkillSetTest, BuffBoostsCaster) {
    ASSERT_TRUE(cast(skill_ids::kShieldOfZen).hasValue());
    EXPECT_FLOAT_EQ(stats_.AttackPower(), 12.0f);
}

TEST_F(ActiveSkillSetTest, HealRestoresAndBoostsSpeed) {
    stats_.SetHealth(400.0f);
    auto result = cast(skill_ids::kBreathOfHeaven);
    ASSERT_TRUE(result.hasValue());
    EXPECT_FLOAT_EQ(result.value().healed, 15.0f);
    EXPECT_FLOAT_EQ(stats_.Health(), 415.0f);
    EXPECT_FLOAT_EQ(stats_.MovementSpeed(), 21.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Teleport
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(ActiveSkillSetTest, TeleportWithoutTargetRefunds) {
    registerBlink();
    auto result = cast(kBlink);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), CastError::NoTargetFound);

    EXPECT_FLOAT_EQ(stats_.Mana(), 200.0f);
    EXPECT_TRUE(catalog_.IsReady(kBlink));
    EXPECT_EQ(skills_.Count(), 0u);
    ASSERT_EQ(notifier_.messages.size(), 1u);
    EXPECT_EQ(notifier_.messages[0], "No enemy in range");
}

TEST_F(ActiveSkillSetTest, TeleportStopsShortOfTarget) {
    registerBlink();
    targeting_.Add(Vector3(0.0f, 0.0f, 8.0f));

    auto result = cast(kBlink);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().teleported);
    EXPECT_NEAR(position_.z, 6.5f, 1e-4f);
    EXPECT_FLOAT_EQ(stats_.Mana(), 170.0f);
    EXPECT_FLOAT_EQ(catalog_.CooldownRemaining(kBlink), 2.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Primary attacks
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(ActiveSkillSetTest, PrimaryAttackNeedsTarget) {
    auto result = primary(skill_ids::kFistOfThunder);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), CastError::NoTargetFound);
    EXPECT_TRUE(catalog_.IsReady(skill_ids::kFistOfThunder));
    EXPECT_EQ(notifier_.messages.size(), 1u);
}

TEST_F(ActiveSkillSetTest, PrimaryAttackRejectsNormalSkill) {
    auto result = primary(skill_ids::kWaveOfLight);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), CastError::InvalidSkillId);
}

TEST_F(ActiveSkillSetTest, FistOfThunderClosesDistance) {
    targeting_.Add(Vector3(0.0f, 0.0f, 10.0f));
    auto result = primary(skill_ids::kFistOfThunder);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().teleported);
    EXPECT_NEAR(position_.z, 8.5f, 1e-4f);
    EXPECT_NEAR(result.value().casterPosition.z, 8.5f, 1e-4f);
}

TEST_F(ActiveSkillSetTest, FistOfThunderStaysPutInMelee) {
    targeting_.Add(Vector3(0.0f, 0.0f, 2.0f));
    auto result = primary(skill_ids::kFistOfThunder);
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().teleported);
    EXPECT_EQ(position_, Vector3::Zero());
}

TEST_F(ActiveSkillSetTest, StationaryPrimaryNeverMoves) {
    targeting_.Add(Vector3(0.0f, 0.0f, 20.0f));
    auto result = primary(skill_ids::kDeadlyReach);
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().teleported);
    EXPECT_EQ(position_, Vector3::Zero());
}

TEST_F(ActiveSkillSetTest, DeadTargetsAreIgnored) {
    auto target = targeting_.Add(Vector3(0.0f, 0.0f, 5.0f));
    targeting_.Kill(target);
    auto result = primary(skill_ids::kFistOfThunder);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), CastError::NoTargetFound);
}
