#include "nutfall/systems/Events.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <vector>

#include "ecs/World.h"
#include "nutfall/Rng.h"
#include "nutfall/systems/Collision.h"
#include "nutfall/systems/Effects.h"

namespace nutfall {

namespace {

constexpr float kStrikeMaxX = 50.0F;

std::uint8_t alpha(float a) {
  return static_cast<std::uint8_t>(std::lround(a * 255.0F));
}

void spawnEarthquakeDust(World& w, Rng& rng, float gameWidth) {
  Particle p{};
  p.pos = Vec2{rng.uniform() * gameWidth, kGroundLineY + 10.0F};
  p.vel = Vec2{rng.spread(15.0F), -rng.uniform() * 60.0F};
  p.size = rng.range(2.0F, 6.0F);
  p.color = Color{160, 120, 90, alpha(0.6F)};
  p.lifespan = rng.range(0.5F, 1.3F);
  p.kind = ParticleKind::Dust;
  NutfallSystems::spawnParticle(w, p);
}

void spawnSnowflake(World& w, Rng& rng, float gameWidth) {
  Particle p{};
  p.pos = Vec2{rng.uniform() * gameWidth, -10.0F};
  p.vel = Vec2{rng.spread(20.0F), rng.range(40.0F, 70.0F)};
  p.size = rng.range(2.0F, 6.0F);
  p.color = Color{255, 255, 255, alpha(rng.range(0.6F, 0.9F))};
  p.lifespan = rng.range(6.0F, 10.0F);
  p.kind = ParticleKind::Water;
  NutfallSystems::spawnParticle(w, p);
}

void spawnWindStreak(World& w, Vec2 pos, float vx, float size, float life, float a) {
  Particle p{};
  p.pos = pos;
  p.vel = Vec2{vx, 0.0F};
  p.size = size;
  p.color = Color{255, 255, 255, alpha(a)};
  p.lifespan = life;
  p.kind = ParticleKind::Dust;
  NutfallSystems::spawnParticle(w, p);
}

}  // namespace

bool NutfallSystems::isMeteorYear(int year) {
  return year >= 2 && (year - 2) % 3 == 0;
}

WeatherEvent NutfallSystems::eventForMonth(int monthCounter) {
  if (monthCounter < 1 || (monthCounter - 1) % 3 != 2) {
    return WeatherEvent::None;
  }

  const int year = ((monthCounter - 1) / 12) + 1;
  const Season season = Timeline::seasonForMonth(monthCounter);
  if (isMeteorYear(year) && season == Season::Summer) {
    return WeatherEvent::MeteorShower;
  }

  switch (season) {
    case Season::Spring:
      return WeatherEvent::Storm;
    case Season::Summer:
      return WeatherEvent::Thunderstorm;
    case Season::Autumn:
      return WeatherEvent::Earthquake;
    case Season::Winter:
      return WeatherEvent::Blizzard;
  }
  return WeatherEvent::None;
}

const char* NutfallSystems::eventTitle(WeatherEvent e) {
  switch (e) {
    case WeatherEvent::Storm:
      return "STORM";
    case WeatherEvent::Thunderstorm:
      return "THUNDERSTORM";
    case WeatherEvent::Earthquake:
      return "EARTHQUAKE";
    case WeatherEvent::Blizzard:
      return "BLIZZARD";
    case WeatherEvent::MeteorShower:
      return "METEOR SHOWER";
    case WeatherEvent::None:
      break;
  }
  return "";
}

std::string NutfallSystems::incomingEventTitle(int monthCounter, float timeInMonth) {
  if ((monthCounter - 1) % 3 != 1 || timeInMonth < kIncomingWarningSeconds) {
    return {};
  }
  const WeatherEvent next = eventForMonth(monthCounter + 1);
  if (next == WeatherEvent::None) {
    return {};
  }
  return std::format("{} INCOMING", eventTitle(next));
}

void NutfallSystems::enterEvent(World& w,
                                Rng& rng,
                                EventState& events,
                                int monthCounter,
                                float gameWidth,
                                FrameReport& report) {
  const WeatherEvent e = eventForMonth(monthCounter);
  if (e == WeatherEvent::None) {
    return;
  }

  events.current = e;
  events.wind = WindDirection::None;
  events.groundDamageAccum = 0.0F;

  switch (e) {
    case WeatherEvent::Storm:
      events.wind = rng.chance(0.5F) ? WindDirection::Left : WindDirection::Right;
      report.play(SoundCue::Storm);
      spawnStormClouds(w, rng, gameWidth, e);
      break;
    case WeatherEvent::Thunderstorm:
      spawnStormClouds(w, rng, gameWidth, e);
      break;
    case WeatherEvent::Earthquake:
      report.play(SoundCue::Earthquake);
      break;
    case WeatherEvent::Blizzard:
      report.play(SoundCue::Blizzard);
      break;
    default:
      break;
  }
}

void NutfallSystems::clearEvent(World& w, EventState& events) {
  removeStormClouds(w);

  std::vector<EntityId> toDestroy;
  for (auto e : w.registry.view<LightningStrike>()) {
    toDestroy.push_back(e);
  }
  for (auto e : w.registry.view<BurningPatch>()) {
    toDestroy.push_back(e);
  }
  for (EntityId e : toDestroy) {
    w.destroy(e);
  }

  events.current = WeatherEvent::None;
  events.wind = WindDirection::None;
  events.screenShake = Vec2{};
  events.groundDamageAccum = 0.0F;
}

void NutfallSystems::updateEvent(World& w,
                                 Rng& rng,
                                 EventState& events,
                                 float gameWidth,
                                 double nowMs,
                                 float dt,
                                 FrameReport& report) {
  events.screenShake = Vec2{};

  switch (events.current) {
    case WeatherEvent::Thunderstorm: {
      const float widthRatio = gameWidth / kReferenceWidth;
      if (rng.chance(dt * kLightningRatePerSecond * widthRatio)) {
        LightningStrike s{};
        s.x = rng.uniform() * std::max(0.0F, gameWidth - kStrikeMaxX);
        s.width = rng.range(40.0F, 60.0F);
        s.warningStartMs = nowMs;
        s.strikeMs = nowMs + kLightningWarningMs;
        const EntityId e = w.create();
        w.registry.emplace<LightningStrike>(e, s);
      }
      if (rng.chance(dt * kThunderRatePerSecond)) {
        report.play(SoundCue::Thunder);
      }
      break;
    }
    case WeatherEvent::Earthquake:
      events.screenShake = Vec2{rng.spread(kEarthquakeShakeIntensity * 0.5F),
                                rng.spread(kEarthquakeShakeIntensity * 0.5F)};
      if (rng.chance(dt * 20.0F)) {
        spawnEarthquakeDust(w, rng, gameWidth);
      }
      break;
    case WeatherEvent::Blizzard:
      if (rng.chance(dt * 90.0F)) {
        spawnSnowflake(w, rng, gameWidth);
      }
      if (rng.chance(dt * 20.0F)) {
        spawnWindStreak(w, Vec2{gameWidth + 20.0F, rng.uniform() * kGameHeight},
                        -800.0F - (rng.uniform() * 300.0F), rng.range(1.0F, 2.0F),
                        rng.range(0.8F, 1.3F), 0.4F);
      }
      break;
    case WeatherEvent::Storm:
      if (events.wind != WindDirection::None && rng.chance(dt * 80.0F)) {
        const bool left = events.wind == WindDirection::Left;
        const float speed = rng.range(700.0F, 1100.0F);
        spawnWindStreak(w, Vec2{left ? gameWidth + 20.0F : -20.0F, rng.uniform() * kGroundLineY},
                        left ? -speed : speed, rng.range(1.0F, 3.0F), rng.range(0.6F, 1.2F), 0.6F);
      }
      break;
    default:
      break;
  }
}

void NutfallSystems::addBurningPatch(World& w, float x, float width) {
  const EntityId e = w.create();
  w.registry.emplace<BurningPatch>(e, BurningPatch{x, width, kBurningPatchLifespan});
}

void NutfallSystems::resolveLightning(World& w,
                                      Rng& rng,
                                      PlayerContext& ctx,
                                      double nowMs,
                                      FrameReport& report) {
  const Hitbox playerBox = playerHitbox(ctx.player, ctx.character);
  std::vector<EntityId> toDestroy;

  for (auto [e, s] : w.registry.view<LightningStrike>().each()) {
    const bool inWindow = nowMs >= s.strikeMs && nowMs < s.strikeMs + kLightningWindowMs;
    if (!s.hasStruck && inWindow && !report.gameOver) {
      s.hasStruck = true;
      report.play(SoundCue::LightningStrike);
      report.flash(kScreenFlashStrength);

      if (spansOverlap(playerBox.x, playerBox.w, s.x, s.width)) {
        if (ctx.player.isNaked) {
          report.play(SoundCue::GameOver);
          report.gameOver = true;
        } else {
          spawnFloatingText(w, indicatorAnchor(ctx.player, ctx.character),
                            std::format("-{}", kLightningDamage), Palette::kDamage);
          applyDamage(rng, ctx, kLightningDamage, report);
        }
      }
    }
    if (nowMs >= s.strikeMs + kLightningWindowMs) {
      toDestroy.push_back(e);
    }
  }

  for (EntityId e : toDestroy) {
    w.destroy(e);
  }
}

void NutfallSystems::resolveBurningPatches(World& w,
                                           Rng& rng,
                                           PlayerContext& ctx,
                                           EventState& events,
                                           double nowMs,
                                           float dt,
                                           FrameReport& report) {
  auto view = w.registry.view<BurningPatch>();
  if (view.empty()) {
    return;
  }

  if (ctx.player.grounded() && !report.gameOver) {
    const Hitbox playerBox = playerHitbox(ctx.player, ctx.character);
    const bool wasNaked = ctx.player.isNaked;
    for (auto [e, patch] : view.each()) {
      if (!spansOverlap(playerBox.x, playerBox.w, patch.x, patch.width)) {
        continue;
      }
      if (wasNaked) {
        report.play(SoundCue::GameOver);
        report.gameOver = true;
        break;
      }

      const float before = ctx.player.health;
      applyDamage(rng, ctx, kBurningDamagePerSecond * dt, report, false);
      const float taken = before - ctx.player.health;
      if (taken <= 0.0F) {
        continue;
      }

      events.groundDamageAccum += taken;
      if (nowMs - events.lastGroundDamageMs > kBurningTextIntervalMs &&
          events.groundDamageAccum >= 1.0F) {
        spawnFloatingText(w, indicatorAnchor(ctx.player, ctx.character),
                          std::format("-{}", std::lround(events.groundDamageAccum)), Palette::kFire);
        events.groundDamageAccum = 0.0F;
        events.lastGroundDamageMs = nowMs;
      }
    }
  }

  std::vector<EntityId> toDestroy;
  for (auto [e, patch] : view.each()) {
    patch.lifespan -= dt;
    if (patch.lifespan <= 0.0F)
      toDestroy.push_back(e);
  }
  for (EntityId e : toDestroy) {
    w.destroy(e);
  }
}

}  // namespace nutfall
