#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include "ecs/World.h"
#include "nutfall/Rng.h"
#include "nutfall/systems/Events.h"
#include "TestSupport.h"

namespace nutfall {
namespace {

bool played(const FrameReport& report, SoundCue cue) {
  return std::ranges::find(report.sounds, cue) != report.sounds.end();
}

int stormCloudCount(World& w) {
  int n = 0;
  for (auto [e, c] : w.registry.view<Cloud>().each()) {
    if (c.storm)
      ++n;
  }
  return n;
}

EntityId addStrike(World& w, float x, float width, double strikeMs) {
  LightningStrike s{};
  s.x = x;
  s.width = width;
  s.warningStartMs = strikeMs - kLightningWarningMs;
  s.strikeMs = strikeMs;
  const EntityId e = w.create();
  w.registry.emplace<LightningStrike>(e, s);
  return e;
}

TEST(EventsTest, EventsFollowSeasonBlocks) {
  EXPECT_EQ(NutfallSystems::eventForMonth(1), WeatherEvent::None);
  EXPECT_EQ(NutfallSystems::eventForMonth(2), WeatherEvent::None);
  EXPECT_EQ(NutfallSystems::eventForMonth(3), WeatherEvent::Storm);
  EXPECT_EQ(NutfallSystems::eventForMonth(6), WeatherEvent::Thunderstorm);
  EXPECT_EQ(NutfallSystems::eventForMonth(9), WeatherEvent::Earthquake);
  EXPECT_EQ(NutfallSystems::eventForMonth(12), WeatherEvent::Blizzard);
  EXPECT_EQ(NutfallSystems::eventForMonth(15), WeatherEvent::Storm);
  EXPECT_EQ(NutfallSystems::eventForMonth(18), WeatherEvent::MeteorShower);
  EXPECT_EQ(NutfallSystems::eventForMonth(30), WeatherEvent::Thunderstorm);
  EXPECT_EQ(NutfallSystems::eventForMonth(54), WeatherEvent::MeteorShower);
}

TEST(EventsTest, EveryThirdMonthHasAnEvent) {
  for (int month = 1; month <= 36; ++month) {
    const bool expected = month % 3 == 0;
    EXPECT_EQ(NutfallSystems::eventForMonth(month) != WeatherEvent::None, expected)
        << "month " << month;
  }
}

TEST(EventsTest, MeteorYearsRecurEveryThreeYears) {
  EXPECT_FALSE(NutfallSystems::isMeteorYear(1));
  EXPECT_TRUE(NutfallSystems::isMeteorYear(2));
  EXPECT_FALSE(NutfallSystems::isMeteorYear(3));
  EXPECT_FALSE(NutfallSystems::isMeteorYear(4));
  EXPECT_TRUE(NutfallSystems::isMeteorYear(5));
  EXPECT_TRUE(NutfallSystems::isMeteorYear(8));
}

TEST(EventsTest, IncomingTitleAppearsLateInThePreviousMonth) {
  EXPECT_EQ(NutfallSystems::incomingEventTitle(2, kIncomingWarningSeconds - 0.1F), "");
  EXPECT_EQ(NutfallSystems::incomingEventTitle(2, kIncomingWarningSeconds), "STORM INCOMING");
  EXPECT_EQ(NutfallSystems::incomingEventTitle(17, 25.0F), "METEOR SHOWER INCOMING");
  EXPECT_EQ(NutfallSystems::incomingEventTitle(1, 29.0F), "");
  EXPECT_EQ(NutfallSystems::incomingEventTitle(3, 29.0F), "");
}

TEST(EventsTest, StormSetsWindAndCloudsUntilCleared) {
  World w;
  Rng rng(4);
  EventState events;
  FrameReport report;

  NutfallSystems::enterEvent(w, rng, events, 3, 800.0F, report);
  EXPECT_EQ(events.current, WeatherEvent::Storm);
  EXPECT_NE(events.wind, WindDirection::None);
  EXPECT_TRUE(played(report, SoundCue::Storm));
  EXPECT_GT(stormCloudCount(w), 0);

  NutfallSystems::clearEvent(w, events);
  EXPECT_EQ(events.current, WeatherEvent::None);
  EXPECT_EQ(events.wind, WindDirection::None);
  EXPECT_EQ(stormCloudCount(w), 0);
}

TEST(EventsTest, ThunderstormEntersSilently) {
  World w;
  Rng rng(4);
  EventState events;
  FrameReport report;

  NutfallSystems::enterEvent(w, rng, events, 6, 800.0F, report);
  EXPECT_EQ(events.current, WeatherEvent::Thunderstorm);
  EXPECT_EQ(events.wind, WindDirection::None);
  EXPECT_TRUE(report.sounds.empty());
  EXPECT_GT(stormCloudCount(w), 0);
}

TEST(EventsTest, MonthWithoutEventLeavesStateAlone) {
  World w;
  Rng rng(4);
  EventState events;
  FrameReport report;

  NutfallSystems::enterEvent(w, rng, events, 4, 800.0F, report);
  EXPECT_EQ(events.current, WeatherEvent::None);
  EXPECT_TRUE(report.sounds.empty());
}

TEST(EventsTest, ClearEventDropsStrikesAndPatches) {
  World w;
  EventState events;
  events.current = WeatherEvent::MeteorShower;
  addStrike(w, 0.0F, 40.0F, 1000.0);
  NutfallSystems::addBurningPatch(w, 10.0F, 40.0F);

  NutfallSystems::clearEvent(w, events);
  EXPECT_TRUE(w.registry.view<LightningStrike>().empty());
  EXPECT_TRUE(w.registry.view<BurningPatch>().empty());
}

TEST(EventsTest, EarthquakeShakesTheScreen) {
  World w;
  Rng rng(8);
  EventState events;
  events.current = WeatherEvent::Earthquake;
  FrameReport report;

  NutfallSystems::updateEvent(w, rng, events, 800.0F, 0.0, 0.016F, report);
  EXPECT_LE(std::abs(events.screenShake.x), kEarthquakeShakeIntensity * 0.5F);
  EXPECT_LE(std::abs(events.screenShake.y), kEarthquakeShakeIntensity * 0.5F);
}

TEST(EventsTest, LightningDamagesShelledPlayerUnderIt) {
  World w;
  Rng rng(1);
  FrameReport report;
  test::PlayerRig rig;
  rig.player.health = 15.0F;
  PlayerContext ctx = rig.ctx();

  addStrike(w, 90.0F, 50.0F, 1000.0);
  NutfallSystems::resolveLightning(w, rng, ctx, 999.0, report);
  EXPECT_FLOAT_EQ(rig.player.health, 15.0F);
  EXPECT_TRUE(report.sounds.empty());

  NutfallSystems::resolveLightning(w, rng, ctx, 1000.0, report);
  EXPECT_FLOAT_EQ(rig.player.health, 5.0F);
  EXPECT_TRUE(played(report, SoundCue::LightningStrike));
  EXPECT_FLOAT_EQ(report.screenFlash, kScreenFlashStrength);

  // A strike hits once even while its window is still open.
  NutfallSystems::resolveLightning(w, rng, ctx, 1050.0, report);
  EXPECT_FLOAT_EQ(rig.player.health, 5.0F);

  NutfallSystems::resolveLightning(w, rng, ctx, 1000.0 + kLightningWindowMs, report);
  EXPECT_TRUE(w.registry.view<LightningStrike>().empty());
}

TEST(EventsTest, LightningMissStillFlashes) {
  World w;
  Rng rng(1);
  FrameReport report;
  test::PlayerRig rig;
  PlayerContext ctx = rig.ctx();

  addStrike(w, 500.0F, 50.0F, 1000.0);
  NutfallSystems::resolveLightning(w, rng, ctx, 1010.0, report);
  EXPECT_FLOAT_EQ(rig.player.health, 10.0F);
  EXPECT_TRUE(played(report, SoundCue::LightningStrike));
  EXPECT_FALSE(report.gameOver);
}

TEST(EventsTest, LightningOnNakedPlayerEndsRun) {
  World w;
  Rng rng(1);
  FrameReport report;
  test::PlayerRig rig;
  rig.player.health = 0.0F;
  rig.player.isNaked = true;
  PlayerContext ctx = rig.ctx();

  addStrike(w, 100.0F, 40.0F, 1000.0);
  NutfallSystems::resolveLightning(w, rng, ctx, 1000.0, report);
  EXPECT_TRUE(report.gameOver);
  EXPECT_TRUE(played(report, SoundCue::GameOver));
}

TEST(EventsTest, BurningPatchBurnsGroundedPlayer) {
  World w;
  Rng rng(1);
  EventState events;
  FrameReport report;
  test::PlayerRig rig;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::addBurningPatch(w, 80.0F, 50.0F);
  NutfallSystems::resolveBurningPatches(w, rng, ctx, events, 0.0, 0.1F, report);

  EXPECT_NEAR(rig.player.health, 10.0F - (kBurningDamagePerSecond * 0.1F), 1e-4F);
  EXPECT_FALSE(played(report, SoundCue::Damage));
  EXPECT_FALSE(report.gameOver);
}

TEST(EventsTest, BurningPatchIgnoresAirbornePlayer) {
  World w;
  Rng rng(1);
  EventState events;
  FrameReport report;
  test::PlayerRig rig;
  rig.player.y = kGroundHeight + 40.0F;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::addBurningPatch(w, 80.0F, 50.0F);
  NutfallSystems::resolveBurningPatches(w, rng, ctx, events, 0.0, 0.1F, report);
  EXPECT_FLOAT_EQ(rig.player.health, 10.0F);
}

TEST(EventsTest, BurningPatchOnNakedPlayerEndsRun) {
  World w;
  Rng rng(1);
  EventState events;
  FrameReport report;
  test::PlayerRig rig;
  rig.player.health = 0.0F;
  rig.player.isNaked = true;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::addBurningPatch(w, 80.0F, 50.0F);
  NutfallSystems::resolveBurningPatches(w, rng, ctx, events, 0.0, 0.016F, report);
  EXPECT_TRUE(report.gameOver);
}

TEST(EventsTest, LightningUsesExtraLife) {
  World w;
  Rng rng(1);
  FrameReport report;
  test::PlayerRig rig;
  rig.player.health = 5.0F;
  rig.stats.extraLives = 1;
  PlayerContext ctx = rig.ctx();

  addStrike(w, 90.0F, 50.0F, 1000.0);
  NutfallSystems::resolveLightning(w, rng, ctx, 1000.0, report);

  EXPECT_EQ(rig.stats.extraLives, 0);
  EXPECT_FLOAT_EQ(rig.player.health, rig.stats.maxHealth);
  EXPECT_FALSE(rig.player.isNaked);
  EXPECT_FALSE(rig.shellBreak.active);
  EXPECT_TRUE(played(report, SoundCue::Resurrect));
  EXPECT_FALSE(report.gameOver);
}

TEST(EventsTest, BurningPatchUsesExtraLife) {
  World w;
  Rng rng(1);
  EventState events;
  FrameReport report;
  test::PlayerRig rig;
  rig.player.health = 0.3F;
  rig.stats.extraLives = 1;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::addBurningPatch(w, 80.0F, 50.0F);
  NutfallSystems::resolveBurningPatches(w, rng, ctx, events, 0.0, 0.1F, report);

  EXPECT_EQ(rig.stats.extraLives, 0);
  EXPECT_FLOAT_EQ(rig.player.health, rig.stats.maxHealth);
  EXPECT_FALSE(rig.player.isNaked);
  EXPECT_TRUE(played(report, SoundCue::Resurrect));
  EXPECT_FALSE(report.gameOver);
}

TEST(EventsTest, BurnIndicatorIsThrottled) {
  World w;
  Rng rng(1);
  EventState events;
  test::PlayerRig rig;
  rig.player.health = 20.0F;
  PlayerContext ctx = rig.ctx();
  auto texts = [&w] { return w.registry.view<FloatingText>().size(); };

  NutfallSystems::addBurningPatch(w, 80.0F, 50.0F);

  // 0.5 damage per 100 ms tick; an indicator needs at least 1 point and
  // 400 ms since the previous one.
  const std::size_t expected[] = {0, 1, 1, 1, 1, 1, 2};
  for (int i = 0; i < 7; ++i) {
    FrameReport report;
    NutfallSystems::resolveBurningPatches(w, rng, ctx, events, i * 100.0, 0.1F, report);
    ASSERT_EQ(texts(), expected[i]) << "tick " << i;
  }

  EXPECT_FLOAT_EQ(rig.player.health, 20.0F - 3.5F);
  EXPECT_DOUBLE_EQ(events.lastGroundDamageMs, 600.0);
  EXPECT_FLOAT_EQ(events.groundDamageAccum, 0.0F);

  std::vector<std::string> labels;
  for (auto [e, t] : w.registry.view<FloatingText>().each()) {
    labels.push_back(t.text);
  }
  std::ranges::sort(labels);
  EXPECT_EQ(labels, (std::vector<std::string>{"-1", "-3"}));
}

TEST(EventsTest, BurningPatchExpires) {
  World w;
  Rng rng(1);
  EventState events;
  test::PlayerRig rig;
  rig.player.x = 600.0F;
  PlayerContext ctx = rig.ctx();

  NutfallSystems::addBurningPatch(w, 80.0F, 50.0F);
  for (int i = 0; i < 29; ++i) {
    FrameReport report;
    NutfallSystems::resolveBurningPatches(w, rng, ctx, events, i * 100.0, 0.1F, report);
  }
  EXPECT_FALSE(w.registry.view<BurningPatch>().empty());

  for (int i = 0; i < 2; ++i) {
    FrameReport report;
    NutfallSystems::resolveBurningPatches(w, rng, ctx, events, 3000.0 + i * 100.0, 0.1F, report);
  }
  EXPECT_TRUE(w.registry.view<BurningPatch>().empty());
}

}  // namespace
}  // namespace nutfall
