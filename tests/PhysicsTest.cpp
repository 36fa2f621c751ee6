#include <gtest/gtest.h>

#include <cmath>

#include "ecs/World.h"
#include "nutfall/Rng.h"
#include "nutfall/systems/Effects.h"
#include "nutfall/systems/PlayerPhysics.h"
#include "TestSupport.h"

namespace nutfall {
namespace {

constexpr float kDt = 1.0F / 60.0F;

PlayerState groundedPlayer(float x = 200.0F) {
  PlayerState p{};
  p.x = x;
  p.y = kGroundHeight;
  return p;
}

TEST(PhysicsTest, JumpFromGroundLaunchesAndConsumesIntent) {
  World w;
  Rng rng(1);
  FrameReport report;
  test::FixedIntent input;
  input.value.tryingToJump = true;

  PlayerState p = groundedPlayer();
  NutfallSystems::playerMovement(w, p, input, PhysicsEnv{}, kDt, rng, report);

  EXPECT_FLOAT_EQ(p.yVelocity, kJumpStrength - (kGravity * kDt));
  EXPECT_GT(p.y, kGroundHeight);
  EXPECT_EQ(input.jumpsConsumed, 1);
  ASSERT_EQ(report.sounds.size(), 1U);
  EXPECT_EQ(report.sounds.front(), SoundCue::Jump);
  EXPECT_EQ(NutfallSystems::particleCount(w), 10);
}

TEST(PhysicsTest, NoJumpWhileAirborne) {
  World w;
  Rng rng(1);
  FrameReport report;
  test::FixedIntent input;
  input.value.tryingToJump = true;

  PlayerState p = groundedPlayer();
  p.y = kGroundHeight + 100.0F;
  p.yVelocity = 50.0F;
  NutfallSystems::playerMovement(w, p, input, PhysicsEnv{}, kDt, rng, report);

  EXPECT_FLOAT_EQ(p.yVelocity, 50.0F - (kGravity * kDt));
  EXPECT_EQ(input.jumpsConsumed, 0);
  EXPECT_TRUE(report.sounds.empty());
}

TEST(PhysicsTest, GravityReturnsPlayerToGround) {
  PlayerState p = groundedPlayer();
  p.y = kGroundHeight + 5.0F;
  for (int i = 0; i < 30; ++i) {
    NutfallSystems::integratePlayer(p, MoveIntent{}, PhysicsEnv{}, kDt);
  }
  EXPECT_FLOAT_EQ(p.y, kGroundHeight);
  EXPECT_FLOAT_EQ(p.yVelocity, 0.0F);
  EXPECT_TRUE(p.grounded());
}

TEST(PhysicsTest, VelocityStaysWithinEffectiveMaxSpeed) {
  Rng rng(42);
  PhysicsEnv env{};
  env.gameWidth = 4000.0F;
  PlayerState p = groundedPlayer(2000.0F);

  for (int i = 0; i < 2000; ++i) {
    MoveIntent intent{};
    intent.movingLeft = rng.chance(0.4F);
    intent.movingRight = !intent.movingLeft && rng.chance(0.5F);
    intent.tryingToJump = rng.chance(0.05F);
    env.slowTimer = (i / 200) % 2 == 0 ? 0.0F : 1.0F;
    env.event = (i / 500) % 2 == 0 ? WeatherEvent::Storm : WeatherEvent::None;
    env.wind = WindDirection::Left;

    NutfallSystems::integratePlayer(p, intent, env, rng.range(0.0F, kMaxDeltaSeconds));
    const float limit = NutfallSystems::effectiveMaxSpeed(env);
    ASSERT_LE(std::abs(p.xVelocity), limit) << "step " << i;
  }
}

TEST(PhysicsTest, SlowHalvesMaxSpeed) {
  PhysicsEnv env{};
  EXPECT_FLOAT_EQ(NutfallSystems::effectiveMaxSpeed(env), kMaxPlayerSpeed);
  env.slowTimer = 0.5F;
  EXPECT_FLOAT_EQ(NutfallSystems::effectiveMaxSpeed(env), kMaxPlayerSpeed * 0.5F);
}

TEST(PhysicsTest, FrictionApproachesZeroWithoutCrossing) {
  PlayerState p = groundedPlayer();
  p.xVelocity = 250.0F;

  float previous = p.xVelocity;
  for (int i = 0; i < 120; ++i) {
    NutfallSystems::integratePlayer(p, MoveIntent{}, PhysicsEnv{}, kDt);
    ASSERT_GE(p.xVelocity, 0.0F);
    ASSERT_LE(p.xVelocity, previous);
    previous = p.xVelocity;
  }
  EXPECT_FLOAT_EQ(p.xVelocity, 0.0F);

  p.xVelocity = -120.0F;
  for (int i = 0; i < 120; ++i) {
    NutfallSystems::integratePlayer(p, MoveIntent{}, PhysicsEnv{}, kDt);
    ASSERT_LE(p.xVelocity, 0.0F);
  }
  EXPECT_FLOAT_EQ(p.xVelocity, 0.0F);
}

TEST(PhysicsTest, BlizzardIceSlidesFurther) {
  PlayerState normal = groundedPlayer();
  PlayerState icy = groundedPlayer();
  normal.xVelocity = 200.0F;
  icy.xVelocity = 200.0F;

  PhysicsEnv blizzard{};
  blizzard.event = WeatherEvent::Blizzard;
  for (int i = 0; i < 6; ++i) {
    NutfallSystems::integratePlayer(normal, MoveIntent{}, PhysicsEnv{}, kDt);
    NutfallSystems::integratePlayer(icy, MoveIntent{}, blizzard, kDt);
  }
  EXPECT_NEAR(normal.xVelocity, 200.0F - (kGroundFriction * kDt * 6.0F), 1e-3F);
  EXPECT_NEAR(icy.xVelocity, 200.0F - (kIceFriction * kDt * 6.0F), 1e-3F);
  EXPECT_GT(icy.x, normal.x);
}

TEST(PhysicsTest, StormWindPushesAirbornePlayer) {
  PlayerState p = groundedPlayer();
  p.y = kGroundHeight + 200.0F;

  PhysicsEnv env{};
  env.event = WeatherEvent::Storm;
  env.wind = WindDirection::Right;
  NutfallSystems::integratePlayer(p, MoveIntent{}, env, 0.1F);
  EXPECT_FLOAT_EQ(p.xVelocity, kWindForce * 0.1F);

  env.wind = WindDirection::Left;
  p.xVelocity = 0.0F;
  NutfallSystems::integratePlayer(p, MoveIntent{}, env, 0.1F);
  EXPECT_FLOAT_EQ(p.xVelocity, -kWindForce * 0.1F);
}

TEST(PhysicsTest, ScreenEdgesStopThePlayer) {
  PhysicsEnv env{};
  env.gameWidth = 800.0F;
  env.playerWidth = kPlayerWidth;

  PlayerState p = groundedPlayer(2.0F);
  p.xVelocity = -300.0F;
  MoveIntent left{};
  left.movingLeft = true;
  NutfallSystems::integratePlayer(p, left, env, 0.05F);
  EXPECT_FLOAT_EQ(p.x, 0.0F);
  EXPECT_FLOAT_EQ(p.xVelocity, 0.0F);

  p.x = 800.0F - kPlayerWidth - 1.0F;
  p.xVelocity = 300.0F;
  MoveIntent right{};
  right.movingRight = true;
  NutfallSystems::integratePlayer(p, right, env, 0.05F);
  EXPECT_FLOAT_EQ(p.x, 800.0F - kPlayerWidth);
  EXPECT_FLOAT_EQ(p.xVelocity, 0.0F);
}

}  // namespace
}  // namespace nutfall
