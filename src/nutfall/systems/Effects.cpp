#include "nutfall/systems/Effects.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <utility>
#include <vector>

#include "ecs/World.h"
#include "nutfall/Constants.h"
#include "nutfall/Rng.h"

namespace nutfall {

namespace {

constexpr float kTwoPi = 6.28318530717958647692F;
constexpr float kPi = kTwoPi * 0.5F;
constexpr float kParticleGravityScale = 0.8F;

constexpr std::array<Color, 3> kLeafColors = {
    Color{217, 119, 6, 255}, Color{245, 158, 11, 255}, Color{180, 83, 9, 255}};

std::uint8_t channel(float v) {
  return static_cast<std::uint8_t>(std::clamp(v, 0.0F, 255.0F));
}

bool fallsUnderGravity(ParticleKind kind) {
  return kind == ParticleKind::Rock || kind == ParticleKind::Dust;
}

}  // namespace

int NutfallSystems::particleCount(World& w) {
  return static_cast<int>(w.registry.view<Particle>().size());
}

bool NutfallSystems::particlesFull(World& w) {
  return particleCount(w) >= kMaxParticles;
}

void NutfallSystems::spawnParticle(World& w, Particle p) {
  p.serial = w.nextSerial();
  const EntityId e = w.create();
  w.registry.emplace<Particle>(e, p);
}

void NutfallSystems::spawnRockBurst(World& w, Rng& rng, float x, float y, float size, bool golden) {
  if (particlesFull(w)) {
    return;
  }

  Color color = Palette::kGolden;
  if (!golden) {
    color = Color{channel(100.0F + rng.uniform() * 20.0F), channel(100.0F + rng.uniform() * 20.0F),
                  channel(100.0F + rng.uniform() * 20.0F), 255};
  }

  const int count = 8 + static_cast<int>(size / 4.0F);
  for (int i = 0; i < count; ++i) {
    const float angle = rng.uniform() * kTwoPi;
    const float speed = rng.range(100.0F, 280.0F);
    Particle p{};
    p.pos = Vec2{x + size * 0.5F, y + size * 0.5F};
    p.vel = Vec2{std::cos(angle) * speed, std::sin(angle) * speed - 200.0F};
    p.size = rng.range(2.0F, 6.0F);
    p.color = color;
    p.lifespan = rng.range(0.8F, 1.5F);
    p.kind = ParticleKind::Rock;
    spawnParticle(w, p);
  }
}

void NutfallSystems::spawnSplash(World& w, Rng& rng, float x, float y, float size) {
  if (particlesFull(w)) {
    return;
  }

  const int count = 10 + static_cast<int>(size / 2.0F);
  for (int i = 0; i < count; ++i) {
    const float angle = kPi + rng.uniform() * kPi;
    const float speed = rng.range(60.0F, 160.0F);
    Particle p{};
    p.pos = Vec2{x + size * 0.5F, y};
    p.vel = Vec2{std::cos(angle) * speed, -std::sin(angle) * speed * 2.2F};
    p.size = rng.range(1.0F, 3.0F);
    p.color = Color{255, 255, 255, 204};
    p.lifespan = rng.range(0.5F, 1.0F);
    p.kind = ParticleKind::Water;
    spawnParticle(w, p);
  }
}

void NutfallSystems::spawnDust(World& w, Rng& rng, float x, float y, int count, float intensity) {
  if (particlesFull(w)) {
    return;
  }

  for (int i = 0; i < count; ++i) {
    const float angle = kPi + rng.uniform() * kPi;
    const float speed = intensity * (0.5F + rng.uniform());
    Particle p{};
    p.pos = Vec2{x, y};
    p.vel = Vec2{std::cos(angle) * speed, -std::sin(angle) * speed * 0.6F};
    p.size = rng.range(2.0F, 5.0F);
    p.color = Color{139, 115, 85, 179};
    p.lifespan = rng.range(0.4F, 0.8F);
    p.kind = ParticleKind::Dust;
    spawnParticle(w, p);
  }
}

void NutfallSystems::spawnSeasonalParticles(World& w,
                                            Rng& rng,
                                            Season season,
                                            float gameWidth,
                                            float dt) {
  if (season != Season::Autumn || particlesFull(w)) {
    return;
  }
  if (!rng.chance(dt * 10.0F)) {
    return;
  }

  Particle p{};
  p.pos = Vec2{rng.uniform() * gameWidth, -10.0F};
  p.vel = Vec2{20.0F - rng.uniform() * 40.0F, rng.range(50.0F, 70.0F)};
  p.size = rng.range(8.0F, 12.0F);
  p.color = kLeafColors[rng.index(kLeafColors.size())];
  p.lifespan = 10.0F;
  p.kind = ParticleKind::Leaf;
  spawnParticle(w, p);
}

void NutfallSystems::updateParticles(World& w, float dt) {
  std::vector<EntityId> toDestroy;
  std::vector<std::pair<std::uint64_t, EntityId>> alive;

  auto view = w.registry.view<Particle>();
  for (auto [e, p] : view.each()) {
    p.pos.x += p.vel.x * dt;
    p.pos.y += p.vel.y * dt;
    if (fallsUnderGravity(p.kind)) {
      p.vel.y += kGravity * kParticleGravityScale * dt;
    }
    p.lifespan -= dt;
    if (p.lifespan <= 0.0F) {
      toDestroy.push_back(e);
    } else {
      alive.emplace_back(p.serial, e);
    }
  }

  if (alive.size() > static_cast<std::size_t>(kMaxParticles)) {
    std::ranges::sort(alive, {}, &std::pair<std::uint64_t, EntityId>::first);
    const std::size_t excess = alive.size() - static_cast<std::size_t>(kMaxParticles);
    for (std::size_t i = 0; i < excess; ++i) {
      toDestroy.push_back(alive[i].second);
    }
  }

  for (EntityId e : toDestroy) {
    w.destroy(e);
  }
}

void NutfallSystems::spawnFloatingText(World& w,
                                       Vec2 pos,
                                       std::string text,
                                       Color color,
                                       float lifespan) {
  const EntityId e = w.create();
  w.registry.emplace<FloatingText>(e, FloatingText{pos, std::move(text), color, lifespan});
}

void NutfallSystems::spawnFloatingScore(World& w, Vec2 pos, int amount, bool golden) {
  const EntityId e = w.create();
  w.registry.emplace<FloatingScore>(e, FloatingScore{pos, amount, 1.0F, golden});
}

void NutfallSystems::updateFloaters(World& w, float dt) {
  std::vector<EntityId> toDestroy;

  for (auto [e, t] : w.registry.view<FloatingText>().each()) {
    t.pos.y -= kFloaterRiseSpeed * dt;
    t.lifespan -= dt;
    if (t.lifespan <= 0.0F)
      toDestroy.push_back(e);
  }
  for (auto [e, s] : w.registry.view<FloatingScore>().each()) {
    s.pos.y -= kFloaterRiseSpeed * dt;
    s.lifespan -= dt;
    if (s.lifespan <= 0.0F)
      toDestroy.push_back(e);
  }

  for (EntityId e : toDestroy) {
    w.destroy(e);
  }
}

void NutfallSystems::spawnAmbientClouds(World& w, Rng& rng, float gameWidth) {
  const int count = std::max(3, static_cast<int>(gameWidth / 250.0F));
  for (int i = 0; i < count; ++i) {
    Cloud c{};
    c.x = rng.uniform() * gameWidth;
    c.y = rng.range(40.0F, 140.0F);
    c.speed = rng.range(8.0F, 20.0F);
    c.width = rng.range(80.0F, 150.0F);
    c.height = rng.range(25.0F, 40.0F);
    const EntityId e = w.create();
    w.registry.emplace<Cloud>(e, c);
  }
}

void NutfallSystems::spawnStormClouds(World& w, Rng& rng, float gameWidth, WeatherEvent event) {
  removeStormClouds(w);

  const bool thunder = event == WeatherEvent::Thunderstorm;
  const int count = thunder ? 7 : 10;
  for (int i = 0; i < count; ++i) {
    Cloud c{};
    c.x = rng.uniform() * gameWidth;
    if (thunder) {
      c.y = rng.range(40.0F, 140.0F);
      c.speed = rng.range(30.0F, 60.0F);
      c.width = rng.range(120.0F, 220.0F);
      c.height = rng.range(35.0F, 60.0F);
    } else {
      c.y = rng.range(60.0F, 180.0F);
      c.speed = rng.range(40.0F, 80.0F);
      c.width = rng.range(100.0F, 180.0F);
      c.height = rng.range(30.0F, 50.0F);
    }
    c.storm = true;
    const EntityId e = w.create();
    w.registry.emplace<Cloud>(e, c);
  }
}

void NutfallSystems::removeStormClouds(World& w) {
  std::vector<EntityId> toDestroy;
  for (auto [e, c] : w.registry.view<Cloud>().each()) {
    if (c.storm)
      toDestroy.push_back(e);
  }
  for (EntityId e : toDestroy) {
    w.destroy(e);
  }
}

void NutfallSystems::updateClouds(World& w,
                                  float gameWidth,
                                  float dt,
                                  WeatherEvent event,
                                  WindDirection wind) {
  const bool windy = event == WeatherEvent::Storm && wind != WindDirection::None;

  for (auto [e, c] : w.registry.view<Cloud>().each()) {
    float speed = c.speed;
    if (windy) {
      speed *= c.storm ? 2.5F : 1.5F;
    }

    if (windy && wind == WindDirection::Right) {
      c.x += speed * dt;
      if (c.x > gameWidth)
        c.x = -c.width;
    } else {
      c.x -= speed * dt;
      if (c.x < -c.width)
        c.x = gameWidth;
    }
  }
}

void NutfallSystems::startShellBreak(ShellBreakAnim& anim, Rng& rng, Vec2 center) {
  anim.active = true;
  anim.lifespan = kShellBreakLifespan;

  anim.left = ShellPiece{};
  anim.left.pos = center;
  anim.left.vel = Vec2{-100.0F - rng.uniform() * 50.0F, -400.0F - rng.uniform() * 100.0F};
  anim.left.rotationVelocity = -200.0F - rng.uniform() * 100.0F;

  anim.right = ShellPiece{};
  anim.right.pos = center;
  anim.right.vel = Vec2{100.0F + rng.uniform() * 50.0F, -400.0F - rng.uniform() * 100.0F};
  anim.right.rotationVelocity = 200.0F + rng.uniform() * 100.0F;
}

void NutfallSystems::startShellReform(ShellReformAnim& anim) {
  anim.active = true;
  anim.progress = 0.0F;
  anim.duration = kShellReformDuration;
}

void NutfallSystems::updateShellAnimations(ShellBreakAnim& brk, ShellReformAnim& reform, float dt) {
  if (brk.active) {
    brk.lifespan -= dt;
    if (brk.lifespan <= 0.0F) {
      brk.active = false;
    } else {
      for (ShellPiece* piece : {&brk.left, &brk.right}) {
        piece->vel.y += kGravity * kParticleGravityScale * dt;
        piece->pos.x += piece->vel.x * dt;
        piece->pos.y += piece->vel.y * dt;
        piece->rotation += piece->rotationVelocity * dt;
      }
    }
  }

  if (reform.active) {
    reform.progress += dt / reform.duration;
    if (reform.progress >= 1.0F) {
      reform.active = false;
      reform.progress = 1.0F;
    }
  }
}

}  // namespace nutfall
