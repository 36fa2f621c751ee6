#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "ecs/World.h"
#include "nutfall/Rng.h"
#include "nutfall/systems/Effects.h"

namespace nutfall {
namespace {

std::vector<std::uint64_t> particleSerials(World& w) {
  std::vector<std::uint64_t> serials;
  for (auto [e, p] : w.registry.view<Particle>().each()) {
    serials.push_back(p.serial);
  }
  std::ranges::sort(serials);
  return serials;
}

void fillParticles(World& w, int count) {
  for (int i = 0; i < count; ++i) {
    Particle p{};
    p.lifespan = 10.0F;
    NutfallSystems::spawnParticle(w, p);
  }
}

TEST(EffectsTest, OverflowDropsTheOldestParticles) {
  World w;
  fillParticles(w, kMaxParticles + 12);
  const std::vector<std::uint64_t> before = particleSerials(w);

  NutfallSystems::updateParticles(w, 0.01F);

  const std::vector<std::uint64_t> after = particleSerials(w);
  ASSERT_EQ(after.size(), static_cast<std::size_t>(kMaxParticles));
  EXPECT_TRUE(std::ranges::equal(after, std::vector<std::uint64_t>(before.begin() + 12, before.end())));
}

TEST(EffectsTest, ExpiredParticlesAreRemovedBeforeTheCap) {
  World w;
  fillParticles(w, kMaxParticles);
  Particle dying{};
  dying.lifespan = 0.005F;
  NutfallSystems::spawnParticle(w, dying);
  const std::vector<std::uint64_t> before = particleSerials(w);

  NutfallSystems::updateParticles(w, 0.01F);

  const std::vector<std::uint64_t> after = particleSerials(w);
  ASSERT_EQ(after.size(), static_cast<std::size_t>(kMaxParticles));
  EXPECT_EQ(after.front(), before.front());
  EXPECT_EQ(after.back(), before[before.size() - 2]);
}

TEST(EffectsTest, FullPoolSkipsNewBursts) {
  World w;
  Rng rng(6);
  fillParticles(w, kMaxParticles);
  ASSERT_TRUE(NutfallSystems::particlesFull(w));

  NutfallSystems::spawnRockBurst(w, rng, 100.0F, 100.0F, 30.0F, false);
  NutfallSystems::spawnSplash(w, rng, 100.0F, 100.0F, 15.0F);
  NutfallSystems::spawnDust(w, rng, 100.0F, 100.0F, 10, 60.0F);
  EXPECT_EQ(NutfallSystems::particleCount(w), kMaxParticles);
}

TEST(EffectsTest, BurstBelowTheCapIsSpawnedWhole) {
  World w;
  Rng rng(6);
  NutfallSystems::spawnSplash(w, rng, 100.0F, 100.0F, 20.0F);
  EXPECT_EQ(NutfallSystems::particleCount(w), 20);
}

TEST(EffectsTest, FloatersRiseAndExpire) {
  World w;
  NutfallSystems::spawnFloatingText(w, Vec2{10.0F, 100.0F}, "+2", Palette::kHeal, 0.8F);
  NutfallSystems::spawnFloatingScore(w, Vec2{10.0F, 100.0F}, 4, false);

  NutfallSystems::updateFloaters(w, 0.5F);
  auto texts = w.registry.view<FloatingText>();
  ASSERT_EQ(texts.size(), 1U);
  EXPECT_FLOAT_EQ(texts.get<FloatingText>(texts.front()).pos.y, 100.0F - (kFloaterRiseSpeed * 0.5F));

  NutfallSystems::updateFloaters(w, 0.4F);
  EXPECT_TRUE(w.registry.view<FloatingText>().empty());
  EXPECT_EQ(w.registry.view<FloatingScore>().size(), 1U);

  NutfallSystems::updateFloaters(w, 0.2F);
  EXPECT_TRUE(w.registry.view<FloatingScore>().empty());
}

}  // namespace
}  // namespace nutfall
