#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <set>

#include "ecs/World.h"
#include "nutfall/Rng.h"
#include "nutfall/config/SkillCatalog.h"
#include "nutfall/score/RunSummary.h"
#include "nutfall/systems/Progression.h"
#include "TestSupport.h"

namespace nutfall {
namespace {

TEST(ProgressionTest, PoolDependsOnTheMonthThatEnded) {
  EXPECT_EQ(NutfallSystems::poolForEndedMonth(1), SkillPool::Permanent);
  EXPECT_EQ(NutfallSystems::poolForEndedMonth(2), SkillPool::Permanent);
  EXPECT_EQ(NutfallSystems::poolForEndedMonth(3), SkillPool::Event);
  EXPECT_EQ(NutfallSystems::poolForEndedMonth(6), SkillPool::Event);
  EXPECT_EQ(NutfallSystems::poolForEndedMonth(12), SkillPool::Yearly);
  EXPECT_EQ(NutfallSystems::poolForEndedMonth(13), SkillPool::Permanent);
  EXPECT_EQ(NutfallSystems::poolForEndedMonth(24), SkillPool::Yearly);
}

TEST(ProgressionTest, SkippedMonthsUseTheSamePools) {
  EXPECT_EQ(NutfallSystems::poolForSkippedMonth(1), SkillPool::Permanent);
  EXPECT_EQ(NutfallSystems::poolForSkippedMonth(3), SkillPool::Event);
  EXPECT_EQ(NutfallSystems::poolForSkippedMonth(12), SkillPool::Yearly);
}

TEST(ProgressionTest, OffersAreDistinctMembersOfThePool) {
  Rng rng(21);
  for (SkillPool pool : {SkillPool::Permanent, SkillPool::Event, SkillPool::Yearly}) {
    const auto members = SkillCatalog::pool(pool);
    for (int i = 0; i < 50; ++i) {
      const auto offers = NutfallSystems::rollSkillOffers(rng, pool);
      ASSERT_EQ(offers.size(), std::min<std::size_t>(members.size(), kSkillOfferCount));
      const std::set<SkillId> unique(offers.begin(), offers.end());
      ASSERT_EQ(unique.size(), offers.size());
      for (SkillId id : offers) {
        ASSERT_NE(std::ranges::find(members, id), members.end());
        ASSERT_EQ(SkillCatalog::info(id).pool, pool);
      }
    }
  }
}

TEST(ProgressionTest, YearlyPoolOffersTwoSkills) {
  Rng rng(2);
  EXPECT_EQ(NutfallSystems::rollSkillOffers(rng, SkillPool::Yearly).size(), 2U);
}

TEST(ProgressionTest, SkillKeysRoundTripThroughTheCatalog) {
  EXPECT_EQ(SkillCatalog::fromKey("shellFortification"), SkillId::ShellFortification);
  EXPECT_EQ(SkillCatalog::fromKey("goldenTouch"), SkillId::GoldenTouch);
  EXPECT_FALSE(SkillCatalog::fromKey("laserEyes").has_value());
  EXPECT_EQ(SkillCatalog::info(SkillId::ExtraLife).title, "Phoenix Kernel");
}

TEST(ProgressionTest, SkillEffectsStack) {
  PlayerStats stats{};
  SkillCatalog::apply(SkillId::ShellFortification, stats);
  SkillCatalog::apply(SkillId::IncreasedAgility, stats);
  SkillCatalog::apply(SkillId::WaterAffinity, stats);
  SkillCatalog::apply(SkillId::WaterAffinity, stats);
  SkillCatalog::apply(SkillId::ExtraLife, stats);
  SkillCatalog::apply(SkillId::Photosynthesis, stats);
  SkillCatalog::apply(SkillId::GoldenTouch, stats);

  EXPECT_FLOAT_EQ(stats.maxHealth, kInitialMaxHealth + 5.0F);
  EXPECT_FLOAT_EQ(stats.maxSpeed, kMaxPlayerSpeed + 40.0F);
  EXPECT_FLOAT_EQ(stats.bonusHeal, 2.0F);
  EXPECT_EQ(stats.extraLives, 1);
  EXPECT_EQ(stats.photosynthesisLevel, 1);
  EXPECT_FLOAT_EQ(stats.goldenTouchChance, kGoldenTouchChanceIncrease);
}

TEST(ProgressionTest, SoothingRainsCompoundsTheWaterInterval) {
  PlayerStats stats{};
  for (int i = 0; i < 3; ++i) {
    SkillCatalog::apply(SkillId::SoothingRains, stats);
  }
  EXPECT_NEAR(stats.waterSpawnIntervalMs, kInitialWaterSpawnIntervalMs * 0.729F, 0.01F);
}

TEST(ProgressionTest, BlockChanceIsCapped) {
  PlayerStats stats{};
  for (int i = 0; i < 15; ++i) {
    SkillCatalog::apply(SkillId::BlockChance, stats);
  }
  EXPECT_FLOAT_EQ(stats.blockChance, kBlockChanceCap);
}

TEST(ProgressionTest, PhotosynthesisHealsAfterStandingStillOneSecond) {
  World w;
  FrameReport report;
  test::PlayerRig rig;
  rig.stats.photosynthesisLevel = 2;
  PlayerContext ctx = rig.ctx();

  for (int i = 0; i < 9; ++i) {
    NutfallSystems::tickPhotosynthesis(w, ctx, 0.1F, report);
  }
  EXPECT_FLOAT_EQ(rig.player.health, 10.0F);

  NutfallSystems::tickPhotosynthesis(w, ctx, 0.15F, report);
  EXPECT_FLOAT_EQ(rig.player.health, 12.0F);
  ASSERT_EQ(report.sounds.size(), 1U);
  EXPECT_EQ(report.sounds.front(), SoundCue::PhotosynthesisHeal);
}

TEST(ProgressionTest, PhotosynthesisStopsWhenMoving) {
  World w;
  FrameReport report;
  test::PlayerRig rig;
  rig.stats.photosynthesisLevel = 1;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::tickPhotosynthesis(w, ctx, 0.9F, report);
  rig.player.xVelocity = 50.0F;
  NutfallSystems::tickPhotosynthesis(w, ctx, 0.5F, report);
  EXPECT_FLOAT_EQ(rig.status.standStillTimer, 0.0F);
  EXPECT_FLOAT_EQ(rig.player.health, 10.0F);
}

TEST(ProgressionTest, PhotosynthesisNeedsTheShell) {
  World w;
  FrameReport report;
  test::PlayerRig rig;
  rig.stats.photosynthesisLevel = 1;
  rig.player.health = 0.0F;
  rig.player.isNaked = true;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::tickPhotosynthesis(w, ctx, 2.0F, report);
  EXPECT_FLOAT_EQ(rig.player.health, 0.0F);
}

TEST(ProgressionTest, RecordSkillAggregatesRepeats) {
  std::vector<AcquiredSkill> skills;
  recordSkill(skills, SkillId::GoldenTouch);
  recordSkill(skills, SkillId::ExtraLife);
  recordSkill(skills, SkillId::GoldenTouch);

  ASSERT_EQ(skills.size(), 2U);
  EXPECT_EQ(skills[0].id, SkillId::GoldenTouch);
  EXPECT_EQ(skills[0].count, 2);
  EXPECT_EQ(skills[1].id, SkillId::ExtraLife);
  EXPECT_EQ(skills[1].count, 1);
}

}  // namespace
}  // namespace nutfall
