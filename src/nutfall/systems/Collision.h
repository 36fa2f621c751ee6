#pragma once

#include "nutfall/components/NutfallComponents.h"

class World;

namespace nutfall {

class Rng;
struct CharacterConfig;

// Screen-space rectangle, y grows downward.
struct Hitbox {
  float x = 0.0F;
  float y = 0.0F;
  float w = 0.0F;
  float h = 0.0F;
};

// Player-side state touched by damage and healing.
struct PlayerContext {
  PlayerState& player;
  PlayerStats& stats;
  StatusEffects& status;
  ShellBreakAnim& shellBreak;
  ShellReformAnim& shellReform;
  const CharacterConfig& character;
};

namespace NutfallSystems {

[[nodiscard]] Hitbox playerHitbox(const PlayerState& p, const CharacterConfig& character);
[[nodiscard]] Hitbox elementHitbox(const Element& e);

// Edges touching count as a hit.
[[nodiscard]] bool overlaps(const Hitbox& a, const Hitbox& b);
// Horizontal spans only; edges touching do not count.
[[nodiscard]] bool spansOverlap(float ax, float aw, float bx, float bw);

// Where damage and heal indicators appear above the player.
[[nodiscard]] Vec2 indicatorAnchor(const PlayerState& p, const CharacterConfig& character);
[[nodiscard]] Vec2 playerCenter(const PlayerState& p, const CharacterConfig& character);

// Damage cascade for a shelled player: an extra life resurrects at full
// health, otherwise the shell breaks and health pins at zero.
void applyDamage(Rng& rng,
                 PlayerContext& ctx,
                 float damage,
                 FrameReport& report,
                 bool damageSound = true);

[[nodiscard]] float healAmount(Season season, float bonusHeal);
// Clamps to max health and restores a broken shell once health is above zero.
void applyHeal(PlayerContext& ctx, float amount, FrameReport& report);

// Resolves at most one element hit per tick, in creation order. The element
// hit is removed; a hazard hitting a naked player ends the run.
void resolveCollisions(World& w, Rng& rng, PlayerContext& ctx, Season season, FrameReport& report);

}  // namespace NutfallSystems

}  // namespace nutfall
