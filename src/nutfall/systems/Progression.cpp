#include "nutfall/systems/Progression.h"

#include <algorithm>
#include <cmath>
#include <format>

#include "ecs/World.h"
#include "nutfall/Rng.h"
#include "nutfall/systems/Collision.h"
#include "nutfall/systems/Effects.h"

namespace nutfall {

namespace {

constexpr float kPhotosynthesisInterval = 1.0F;
constexpr float kPhotosynthesisTextLifespan = 0.8F;
constexpr float kStationarySpeed = 1.0F;

}  // namespace

SkillPool NutfallSystems::poolForEndedMonth(int monthCounter) {
  if ((monthCounter - 1) % 3 == 2) {
    return monthCounter % 12 == 0 ? SkillPool::Yearly : SkillPool::Event;
  }
  return SkillPool::Permanent;
}

SkillPool NutfallSystems::poolForSkippedMonth(int month) {
  if (month % 12 == 0) {
    return SkillPool::Yearly;
  }
  if (month % 3 == 0) {
    return SkillPool::Event;
  }
  return SkillPool::Permanent;
}

std::vector<SkillId> NutfallSystems::rollSkillOffers(Rng& rng, SkillPool pool) {
  const auto skills = SkillCatalog::pool(pool);
  std::vector<SkillId> offers(skills.begin(), skills.end());
  std::shuffle(offers.begin(), offers.end(), rng.engine());
  if (offers.size() > static_cast<std::size_t>(kSkillOfferCount)) {
    offers.resize(kSkillOfferCount);
  }
  return offers;
}

void NutfallSystems::tickPhotosynthesis(World& w, PlayerContext& ctx, float dt, FrameReport& report) {
  PlayerState& p = ctx.player;
  const int level = ctx.stats.photosynthesisLevel;
  const bool standingStill = level > 0 && std::abs(p.xVelocity) < kStationarySpeed &&
                             p.grounded() && !p.isNaked && p.health < ctx.stats.maxHealth;
  if (!standingStill) {
    ctx.status.standStillTimer = 0.0F;
    return;
  }

  ctx.status.standStillTimer += dt;
  if (ctx.status.standStillTimer < kPhotosynthesisInterval) {
    return;
  }

  const float heal = static_cast<float>(level);
  const float newHealth = std::min(ctx.stats.maxHealth, p.health + heal);
  if (newHealth > p.health) {
    report.play(SoundCue::PhotosynthesisHeal);
    spawnFloatingText(w, indicatorAnchor(p, ctx.character), std::format("+{}", level),
                      Palette::kPhotosynthesis, kPhotosynthesisTextLifespan);
    p.health = newHealth;
  }
  ctx.status.standStillTimer -= kPhotosynthesisInterval;
}

}  // namespace nutfall
