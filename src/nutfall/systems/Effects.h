#pragma once

#include <string>

#include "nutfall/components/NutfallComponents.h"

class World;

namespace nutfall {

class Rng;

namespace NutfallSystems {

// Particle pool. Bursts are skipped when the pool is already full; the
// per-tick cap drops the oldest particles.
[[nodiscard]] int particleCount(World& w);
[[nodiscard]] bool particlesFull(World& w);
void spawnParticle(World& w, Particle p);

// (x, y) is the element's top-left corner in screen space.
void spawnRockBurst(World& w, Rng& rng, float x, float y, float size, bool golden);
void spawnSplash(World& w, Rng& rng, float x, float y, float size);
void spawnDust(World& w, Rng& rng, float x, float y, int count, float intensity);
void spawnSeasonalParticles(World& w, Rng& rng, Season season, float gameWidth, float dt);
void updateParticles(World& w, float dt);

void spawnFloatingText(World& w, Vec2 pos, std::string text, Color color, float lifespan = 1.0F);
void spawnFloatingScore(World& w, Vec2 pos, int amount, bool golden);
void updateFloaters(World& w, float dt);

void spawnAmbientClouds(World& w, Rng& rng, float gameWidth);
void spawnStormClouds(World& w, Rng& rng, float gameWidth, WeatherEvent event);
void removeStormClouds(World& w);
void updateClouds(World& w, float gameWidth, float dt, WeatherEvent event, WindDirection wind);

void startShellBreak(ShellBreakAnim& anim, Rng& rng, Vec2 center);
void startShellReform(ShellReformAnim& anim);
void updateShellAnimations(ShellBreakAnim& brk, ShellReformAnim& reform, float dt);

namespace Palette {
inline constexpr Color kDamage{239, 68, 68, 255};
inline constexpr Color kBlock{255, 255, 255, 255};
inline constexpr Color kHeal{34, 197, 94, 255};
inline constexpr Color kPhotosynthesis{16, 185, 129, 255};
inline constexpr Color kFire{249, 115, 22, 255};
inline constexpr Color kGolden{255, 215, 0, 255};
}  // namespace Palette

}  // namespace NutfallSystems

}  // namespace nutfall
