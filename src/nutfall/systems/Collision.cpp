#include "nutfall/systems/Collision.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <utility>
#include <vector>

#include "ecs/World.h"
#include "nutfall/Rng.h"
#include "nutfall/config/CharacterConfig.h"
#include "nutfall/systems/Effects.h"

namespace nutfall {

Hitbox NutfallSystems::playerHitbox(const PlayerState& p, const CharacterConfig& character) {
  const CharacterConfig::Box& shelled = character.hitbox.shelled;
  if (!p.isNaked) {
    return Hitbox{p.x, kGameHeight - p.y - shelled.h, shelled.w, shelled.h};
  }

  const CharacterConfig::Box& naked = character.hitbox.naked;
  const float xOffset = (shelled.w - naked.w) * 0.5F;
  return Hitbox{p.x + xOffset, kGameHeight - p.y - naked.h, naked.w, naked.h};
}

Hitbox NutfallSystems::elementHitbox(const Element& e) {
  // Water drops are drawn as a teardrop whose body sits in the lower half.
  const float y = e.type == ElementType::Water ? e.y + (e.size * 0.5F) : e.y;
  return Hitbox{e.x, y, e.size, e.size};
}

bool NutfallSystems::overlaps(const Hitbox& a, const Hitbox& b) {
  return a.x <= b.x + b.w && a.x + a.w >= b.x && a.y <= b.y + b.h && a.y + a.h >= b.y;
}

bool NutfallSystems::spansOverlap(float ax, float aw, float bx, float bw) {
  return ax < bx + bw && ax + aw > bx;
}

Vec2 NutfallSystems::indicatorAnchor(const PlayerState& p, const CharacterConfig& character) {
  const CharacterConfig::Box& shelled = character.hitbox.shelled;
  return Vec2{p.x + (shelled.w * 0.5F), kGameHeight - p.y - shelled.h};
}

Vec2 NutfallSystems::playerCenter(const PlayerState& p, const CharacterConfig& character) {
  const CharacterConfig::Box& shelled = character.hitbox.shelled;
  return Vec2{p.x + (shelled.w * 0.5F), kGameHeight - p.y - (shelled.h * 0.5F)};
}

void NutfallSystems::applyDamage(Rng& rng,
                                 PlayerContext& ctx,
                                 float damage,
                                 FrameReport& report,
                                 bool damageSound) {
  PlayerState& p = ctx.player;
  const float newHealth = std::max(0.0F, p.health - damage);

  if (newHealth > 0.0F) {
    if (damageSound) {
      report.play(SoundCue::Damage);
    }
    p.health = newHealth;
    return;
  }

  if (ctx.stats.extraLives > 0) {
    --ctx.stats.extraLives;
    report.play(SoundCue::Resurrect);
    report.flash(kScreenFlashStrength);
    p.health = ctx.stats.maxHealth;
    p.isNaked = false;
    return;
  }

  if (p.health > 0.0F) {
    report.play(SoundCue::ShellCrack);
    startShellBreak(ctx.shellBreak, rng, playerCenter(p, ctx.character));
    report.shellBroken = true;
  }
  p.health = 0.0F;
  p.isNaked = true;
}

float NutfallSystems::healAmount(Season season, float bonusHeal) {
  float base = kWaterHealAmount;
  if (season == Season::Summer) {
    base *= 0.5F;
  } else if (season == Season::Autumn) {
    base *= 1.5F;
  }
  return std::round((base + bonusHeal) * 10.0F) / 10.0F;
}

void NutfallSystems::applyHeal(PlayerContext& ctx, float amount, FrameReport& report) {
  PlayerState& p = ctx.player;
  p.health = std::min(ctx.stats.maxHealth, p.health + amount);

  if (p.isNaked && p.health > 0.0F) {
    p.isNaked = false;
    startShellReform(ctx.shellReform);
    report.shellReformed = true;
  }
}

void NutfallSystems::resolveCollisions(World& w,
                                       Rng& rng,
                                       PlayerContext& ctx,
                                       Season season,
                                       FrameReport& report) {
  const Hitbox playerBox = playerHitbox(ctx.player, ctx.character);

  EntityId hitEntity = kInvalidEntity;
  Element hit{};
  for (auto [e, el] : w.registry.view<Element>().each()) {
    if (!overlaps(playerBox, elementHitbox(el))) {
      continue;
    }
    // First in creation order wins.
    if (hitEntity == kInvalidEntity || el.id < hit.id) {
      hitEntity = e;
      hit = el;
    }
  }
  if (hitEntity == kInvalidEntity) {
    return;
  }
  w.destroy(hitEntity);

  PlayerState& p = ctx.player;
  const Vec2 anchor = indicatorAnchor(p, ctx.character);

  if (isHazard(hit.type)) {
    if (p.isNaked) {
      report.play(SoundCue::GameOver);
      report.gameOver = true;
      return;
    }

    int points = static_cast<int>(std::lround(hit.size / 10.0F));
    const bool golden = rng.chance(ctx.stats.goldenTouchChance);
    if (golden) {
      points *= kGoldenScoreMultiplier;
      report.play(SoundCue::GoldenTouch);
    }
    report.scoreGained += static_cast<float>(points);
    ++report.rocksHit;
    spawnFloatingScore(w, Vec2{hit.x + (hit.size * 0.5F), hit.y + (hit.size * 0.5F)}, points,
                       golden);

    report.play(hit.type == ElementType::Meteor ? SoundCue::MeteorImpact : SoundCue::Impact);
    spawnRockBurst(w, rng, hit.x, hit.y, hit.size, golden);

    if (rng.chance(ctx.stats.blockChance)) {
      report.play(SoundCue::Block);
      spawnFloatingText(w, anchor, "0", Palette::kBlock);
      return;
    }

    const float damage = std::round(hit.size / 10.0F);
    spawnFloatingText(w, anchor, std::format("-{}", damage), Palette::kDamage);
    applyDamage(rng, ctx, damage, report);
    return;
  }

  report.play(SoundCue::WaterCollect);
  spawnSplash(w, rng, hit.x, hit.y, hit.size);

  const float heal = healAmount(season, ctx.stats.bonusHeal);
  spawnFloatingText(w, anchor, std::format("+{}", heal), Palette::kHeal);
  if (hit.type == ElementType::Snow) {
    ctx.status.slowTimer = kSnowSlowSeconds;
  }
  applyHeal(ctx, heal, report);
}

}  // namespace nutfall
