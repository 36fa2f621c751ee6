#include "nutfall/systems/Spawning.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include "ecs/World.h"
#include "nutfall/Constants.h"
#include "nutfall/Rng.h"
#include "nutfall/systems/Effects.h"
#include "nutfall/systems/Events.h"

namespace nutfall {

namespace {

constexpr float kDifficultyDecay = 0.92F;
constexpr float kSpeedGrowth = 0.15F;
constexpr float kMeteorSpeedMultiplier = 1.5F;
constexpr float kResourceSpeed = 100.0F;

float widthRatio(float gameWidth) {
  return std::max(gameWidth, 1.0F) / kReferenceWidth;
}

}  // namespace

float NutfallSystems::hazardSpawnIntervalMs(int monthCounter, float gameWidth, WeatherEvent event) {
  float interval = kElementSpawnIntervalMs *
                   std::pow(kDifficultyDecay, static_cast<float>(std::max(0, monthCounter - 1)));
  interval /= widthRatio(gameWidth);

  switch (event) {
    case WeatherEvent::Earthquake:
      interval /= 1.5F;
      break;
    case WeatherEvent::Thunderstorm:
      interval *= 2.0F;
      break;
    case WeatherEvent::MeteorShower:
      interval *= 1.25F;
      break;
    default:
      break;
  }
  return interval;
}

float NutfallSystems::resourceSpawnIntervalMs(float baseIntervalMs,
                                              float gameWidth,
                                              WeatherEvent event) {
  float interval = baseIntervalMs / widthRatio(gameWidth);
  if (event == WeatherEvent::Thunderstorm) {
    interval /= 3.0F;
  }
  return interval;
}

float NutfallSystems::hazardSpeedMultiplier(int monthCounter) {
  return 1.0F + (std::sqrt(static_cast<float>(std::max(0, monthCounter - 1))) * kSpeedGrowth);
}

Element NutfallSystems::rollHazard(Rng& rng, const SpawnContext& ctx) {
  const float maxSize =
      ctx.event == WeatherEvent::Earthquake ? kEarthquakeMaxElementSize : kMaxElementSize;

  Element e{};
  e.size = rng.range(kMinElementSize, maxSize);
  e.speed = rng.range(kMinElementSpeed, kMaxElementSpeed) * hazardSpeedMultiplier(ctx.monthCounter);
  e.type = ElementType::Rock;
  if (ctx.event == WeatherEvent::MeteorShower) {
    e.type = ElementType::Meteor;
    e.speed *= kMeteorSpeedMultiplier;
  }
  e.x = rng.uniform() * std::max(0.0F, ctx.gameWidth - e.size);
  e.y = -e.size;
  return e;
}

Element NutfallSystems::rollResource(Rng& rng, const SpawnContext& ctx) {
  Element e{};
  e.size = kWaterDropSize;
  if (ctx.season == Season::Summer) {
    e.size *= 0.7F;
  } else if (ctx.season == Season::Autumn) {
    e.size *= 1.3F;
  }
  e.type = ctx.season == Season::Winter ? ElementType::Snow : ElementType::Water;
  e.speed = kResourceSpeed;
  e.x = rng.uniform() * std::max(0.0F, ctx.gameWidth - e.size);
  e.y = -e.size;
  return e;
}

EntityId NutfallSystems::spawnElement(World& w, Element e) {
  e.id = w.nextSerial();
  const EntityId ent = w.create();
  w.registry.emplace<Element>(ent, e);
  return ent;
}

void NutfallSystems::spawnElements(World& w,
                                   Rng& rng,
                                   SpawnTimers& timers,
                                   const SpawnContext& ctx,
                                   double nowMs) {
  const double hazardInterval = hazardSpawnIntervalMs(ctx.monthCounter, ctx.gameWidth, ctx.event);
  if (nowMs - timers.lastHazardMs > hazardInterval) {
    spawnElement(w, rollHazard(rng, ctx));
    timers.lastHazardMs = nowMs;
  }

  const double resourceInterval =
      resourceSpawnIntervalMs(ctx.waterSpawnIntervalMs, ctx.gameWidth, ctx.event);
  if (nowMs - timers.lastResourceMs > resourceInterval) {
    spawnElement(w, rollResource(rng, ctx));
    timers.lastResourceMs = nowMs;
  }
}

void NutfallSystems::moveElements(World& w, float dt) {
  for (auto [e, el] : w.registry.view<Element>().each()) {
    el.y += el.speed * dt;
  }
}

bool NutfallSystems::touchesGround(const Element& e) {
  return e.y + e.size >= kGroundLineY;
}

void NutfallSystems::resolveGroundContact(World& w, Rng& rng, FrameReport& report) {
  std::vector<EntityId> toDestroy;
  std::vector<Element> landed;

  for (auto [e, el] : w.registry.view<Element>().each()) {
    if (touchesGround(el)) {
      toDestroy.push_back(e);
      landed.push_back(el);
    }
  }
  for (EntityId e : toDestroy) {
    w.destroy(e);
  }

  // Effects spawn entities, so they run after the view walk.
  std::ranges::sort(landed, {}, &Element::id);
  for (const Element& el : landed) {
    switch (el.type) {
      case ElementType::Meteor:
        report.play(SoundCue::MeteorImpact);
        addBurningPatch(w, el.x - kBurningPatchMargin, el.size + (2.0F * kBurningPatchMargin));
        spawnRockBurst(w, rng, el.x, kGroundLineY - el.size, el.size, false);
        break;
      case ElementType::Rock:
        report.play(SoundCue::Impact);
        spawnRockBurst(w, rng, el.x, kGroundLineY - el.size, el.size, false);
        break;
      case ElementType::Water:
        spawnSplash(w, rng, el.x, kGroundLineY, el.size);
        break;
      case ElementType::Snow:
        spawnSplash(w, rng, el.x, kGroundLineY - el.size, el.size);
        break;
    }
  }
}

}  // namespace nutfall
