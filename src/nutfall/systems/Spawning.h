#pragma once

#include "ecs/World.h"
#include "nutfall/components/NutfallComponents.h"

namespace nutfall {

class Rng;

// Timestamps (ms) of the last hazard and resource spawn.
struct SpawnTimers {
  double lastHazardMs = 0.0;
  double lastResourceMs = 0.0;

  void reset(double nowMs) {
    lastHazardMs = nowMs;
    lastResourceMs = nowMs;
  }
};

struct SpawnContext {
  float gameWidth = kDefaultGameWidth;
  int monthCounter = 1;
  WeatherEvent event = WeatherEvent::None;
  Season season = Season::Spring;
  float waterSpawnIntervalMs = kInitialWaterSpawnIntervalMs;
};

namespace NutfallSystems {

[[nodiscard]] float hazardSpawnIntervalMs(int monthCounter, float gameWidth, WeatherEvent event);
[[nodiscard]] float resourceSpawnIntervalMs(float baseIntervalMs,
                                            float gameWidth,
                                            WeatherEvent event);
[[nodiscard]] float hazardSpeedMultiplier(int monthCounter);

[[nodiscard]] Element rollHazard(Rng& rng, const SpawnContext& ctx);
[[nodiscard]] Element rollResource(Rng& rng, const SpawnContext& ctx);

// Assigns the creation-order id and adds the element to the registry.
EntityId spawnElement(World& w, Element e);

// Emits at most one hazard and one resource for this tick.
void spawnElements(World& w, Rng& rng, SpawnTimers& timers, const SpawnContext& ctx, double nowMs);

void moveElements(World& w, float dt);

[[nodiscard]] bool touchesGround(const Element& e);

// Removes every element that reached the ground and plays its impact.
// Meteors leave a burning patch behind.
void resolveGroundContact(World& w, Rng& rng, FrameReport& report);

}  // namespace NutfallSystems

}  // namespace nutfall
