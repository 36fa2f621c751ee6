#include <gtest/gtest.h>

#include <algorithm>

#include "ecs/World.h"
#include "nutfall/Rng.h"
#include "nutfall/systems/Collision.h"
#include "nutfall/systems/Spawning.h"
#include "TestSupport.h"

namespace nutfall {
namespace {

bool played(const FrameReport& report, SoundCue cue) {
  return std::ranges::find(report.sounds, cue) != report.sounds.end();
}

int elementCount(World& w) {
  return static_cast<int>(w.registry.view<Element>().size());
}

TEST(CollisionTest, OverlapCountsTouchingEdges) {
  const Hitbox a{0.0F, 0.0F, 10.0F, 10.0F};
  EXPECT_TRUE(NutfallSystems::overlaps(a, Hitbox{10.0F, 10.0F, 5.0F, 5.0F}));
  EXPECT_FALSE(NutfallSystems::overlaps(a, Hitbox{10.1F, 0.0F, 5.0F, 5.0F}));
  EXPECT_FALSE(NutfallSystems::spansOverlap(0.0F, 10.0F, 10.0F, 5.0F));
  EXPECT_TRUE(NutfallSystems::spansOverlap(0.0F, 10.0F, 9.0F, 5.0F));
}

TEST(CollisionTest, NakedHitboxIsCenteredInsideShelled) {
  test::PlayerRig rig;
  const Hitbox shelled = NutfallSystems::playerHitbox(rig.player, rig.character);
  EXPECT_FLOAT_EQ(shelled.x, 100.0F);
  EXPECT_FLOAT_EQ(shelled.y, kGameHeight - kGroundHeight - kPlayerHeight);
  EXPECT_FLOAT_EQ(shelled.w, kPlayerWidth);

  rig.player.isNaked = true;
  const Hitbox naked = NutfallSystems::playerHitbox(rig.player, rig.character);
  EXPECT_FLOAT_EQ(naked.w, kNakedPlayerWidth);
  EXPECT_FLOAT_EQ(naked.h, kNakedPlayerHeight);
  EXPECT_FLOAT_EQ(naked.x + (naked.w * 0.5F), shelled.x + (shelled.w * 0.5F));
  EXPECT_FLOAT_EQ(naked.y + naked.h, shelled.y + shelled.h);
}

TEST(CollisionTest, WaterHitboxStartsAtHalfSize) {
  Element drop{};
  drop.type = ElementType::Water;
  drop.y = 100.0F;
  drop.size = 20.0F;
  EXPECT_FLOAT_EQ(NutfallSystems::elementHitbox(drop).y, 110.0F);
  drop.type = ElementType::Snow;
  EXPECT_FLOAT_EQ(NutfallSystems::elementHitbox(drop).y, 100.0F);
}

TEST(CollisionTest, RockHitDamagesShelledPlayerAndScores) {
  World w;
  Rng rng(7);
  FrameReport report;
  test::PlayerRig rig;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::spawnElement(w, test::elementOnPlayer(rig, ElementType::Rock, 40.0F));
  NutfallSystems::resolveCollisions(w, rng, ctx, Season::Spring, report);

  EXPECT_FLOAT_EQ(rig.player.health, 6.0F);
  EXPECT_FALSE(rig.player.isNaked);
  EXPECT_FLOAT_EQ(report.scoreGained, 4.0F);
  EXPECT_EQ(report.rocksHit, 1);
  EXPECT_EQ(elementCount(w), 0);
  EXPECT_TRUE(played(report, SoundCue::Impact));
  EXPECT_TRUE(played(report, SoundCue::Damage));
  EXPECT_FALSE(report.gameOver);
}

TEST(CollisionTest, LethalDamageBreaksShell) {
  Rng rng(1);
  FrameReport report;
  test::PlayerRig rig;
  rig.player.health = 4.0F;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::applyDamage(rng, ctx, 10.0F, report);

  EXPECT_FLOAT_EQ(rig.player.health, 0.0F);
  EXPECT_TRUE(rig.player.isNaked);
  EXPECT_TRUE(rig.shellBreak.active);
  EXPECT_TRUE(report.shellBroken);
  EXPECT_TRUE(played(report, SoundCue::ShellCrack));
  EXPECT_FALSE(played(report, SoundCue::Damage));
}

TEST(CollisionTest, ExtraLifeResurrectsAtFullHealth) {
  Rng rng(1);
  FrameReport report;
  test::PlayerRig rig;
  rig.player.health = 3.0F;
  rig.stats.extraLives = 1;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::applyDamage(rng, ctx, 5.0F, report);

  EXPECT_FLOAT_EQ(rig.player.health, rig.stats.maxHealth);
  EXPECT_FALSE(rig.player.isNaked);
  EXPECT_EQ(rig.stats.extraLives, 0);
  EXPECT_FALSE(rig.shellBreak.active);
  EXPECT_TRUE(played(report, SoundCue::Resurrect));
  EXPECT_FLOAT_EQ(report.screenFlash, kScreenFlashStrength);
}

TEST(CollisionTest, WaterRegrowsShellOfNakedPlayer) {
  World w;
  Rng rng(3);
  FrameReport report;
  test::PlayerRig rig;
  rig.player.health = 0.0F;
  rig.player.isNaked = true;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::spawnElement(w, test::elementOnPlayer(rig, ElementType::Water, kWaterDropSize));
  NutfallSystems::resolveCollisions(w, rng, ctx, Season::Spring, report);

  EXPECT_FLOAT_EQ(rig.player.health, 2.0F);
  EXPECT_FALSE(rig.player.isNaked);
  EXPECT_TRUE(rig.shellReform.active);
  EXPECT_TRUE(report.shellReformed);
  EXPECT_TRUE(played(report, SoundCue::WaterCollect));
}

TEST(CollisionTest, HealNeverExceedsMaxHealth) {
  FrameReport report;
  test::PlayerRig rig;
  rig.player.health = rig.stats.maxHealth - 0.5F;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::applyHeal(ctx, 2.0F, report);
  EXPECT_FLOAT_EQ(rig.player.health, rig.stats.maxHealth);
  EXPECT_FALSE(report.shellReformed);
}

TEST(CollisionTest, HazardOnNakedPlayerEndsRun) {
  World w;
  Rng rng(3);
  FrameReport report;
  test::PlayerRig rig;
  rig.player.health = 0.0F;
  rig.player.isNaked = true;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::spawnElement(w, test::elementOnPlayer(rig, ElementType::Meteor, 20.0F));
  NutfallSystems::resolveCollisions(w, rng, ctx, Season::Spring, report);

  EXPECT_TRUE(report.gameOver);
  EXPECT_TRUE(played(report, SoundCue::GameOver));
  EXPECT_FLOAT_EQ(report.scoreGained, 0.0F);
}

TEST(CollisionTest, OnlyOneElementResolvesPerTick) {
  World w;
  Rng rng(3);
  FrameReport report;
  test::PlayerRig rig;
  PlayerContext ctx = rig.ctx();

  const EntityId first =
      NutfallSystems::spawnElement(w, test::elementOnPlayer(rig, ElementType::Rock, 20.0F));
  const EntityId second =
      NutfallSystems::spawnElement(w, test::elementOnPlayer(rig, ElementType::Water, 15.0F));
  NutfallSystems::resolveCollisions(w, rng, ctx, Season::Spring, report);

  EXPECT_FALSE(w.registry.valid(first));
  EXPECT_TRUE(w.registry.valid(second));
  EXPECT_FLOAT_EQ(rig.player.health, 8.0F);
  EXPECT_FALSE(played(report, SoundCue::WaterCollect));
}

TEST(CollisionTest, MissLeavesEverythingUntouched) {
  World w;
  Rng rng(3);
  FrameReport report;
  test::PlayerRig rig;
  PlayerContext ctx = rig.ctx();

  Element far = test::elementOnPlayer(rig, ElementType::Rock, 20.0F);
  far.x += 300.0F;
  NutfallSystems::spawnElement(w, far);
  NutfallSystems::resolveCollisions(w, rng, ctx, Season::Spring, report);

  EXPECT_EQ(elementCount(w), 1);
  EXPECT_FLOAT_EQ(rig.player.health, 10.0F);
  EXPECT_TRUE(report.sounds.empty());
}

TEST(CollisionTest, SnowHealsAndSlows) {
  World w;
  Rng rng(3);
  FrameReport report;
  test::PlayerRig rig;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::spawnElement(w, test::elementOnPlayer(rig, ElementType::Snow, kWaterDropSize));
  NutfallSystems::resolveCollisions(w, rng, ctx, Season::Winter, report);

  EXPECT_FLOAT_EQ(rig.status.slowTimer, kSnowSlowSeconds);
  EXPECT_FLOAT_EQ(rig.player.health, 12.0F);
}

TEST(CollisionTest, CertainBlockPreventsDamageButStillScores) {
  World w;
  Rng rng(3);
  FrameReport report;
  test::PlayerRig rig;
  rig.stats.blockChance = 1.0F;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::spawnElement(w, test::elementOnPlayer(rig, ElementType::Rock, 30.0F));
  NutfallSystems::resolveCollisions(w, rng, ctx, Season::Spring, report);

  EXPECT_FLOAT_EQ(rig.player.health, 10.0F);
  EXPECT_FLOAT_EQ(report.scoreGained, 3.0F);
  EXPECT_TRUE(played(report, SoundCue::Block));
  EXPECT_FALSE(played(report, SoundCue::Damage));
}

TEST(CollisionTest, GoldenTouchMultipliesPoints) {
  World w;
  Rng rng(3);
  FrameReport report;
  test::PlayerRig rig;
  rig.stats.goldenTouchChance = 1.0F;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::spawnElement(w, test::elementOnPlayer(rig, ElementType::Rock, 20.0F));
  NutfallSystems::resolveCollisions(w, rng, ctx, Season::Spring, report);

  EXPECT_FLOAT_EQ(report.scoreGained, 2.0F * kGoldenScoreMultiplier);
  EXPECT_TRUE(played(report, SoundCue::GoldenTouch));
}

TEST(CollisionTest, HealAmountFollowsSeasonAndBonus) {
  EXPECT_FLOAT_EQ(NutfallSystems::healAmount(Season::Spring, 0.0F), 2.0F);
  EXPECT_FLOAT_EQ(NutfallSystems::healAmount(Season::Summer, 0.0F), 1.0F);
  EXPECT_FLOAT_EQ(NutfallSystems::healAmount(Season::Autumn, 0.0F), 3.0F);
  EXPECT_FLOAT_EQ(NutfallSystems::healAmount(Season::Winter, 0.0F), 2.0F);
  EXPECT_FLOAT_EQ(NutfallSystems::healAmount(Season::Summer, 1.0F), 2.0F);
}

}  // namespace
}  // namespace nutfall
