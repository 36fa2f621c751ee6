#pragma once

#include "nutfall/Collaborators.h"
#include "nutfall/Constants.h"
#include "nutfall/components/NutfallComponents.h"

class World;

namespace nutfall {

class Rng;

struct PhysicsEnv {
  float gameWidth = kDefaultGameWidth;
  float playerWidth = kPlayerWidth;
  float maxSpeed = kMaxPlayerSpeed;
  float slowTimer = 0.0F;
  WeatherEvent event = WeatherEvent::None;
  WindDirection wind = WindDirection::None;
};

namespace NutfallSystems {

[[nodiscard]] float effectiveMaxSpeed(const PhysicsEnv& env);

// Advances one player step. Returns true when a jump started this step.
bool integratePlayer(PlayerState& p, const MoveIntent& intent, const PhysicsEnv& env, float dt);

// integratePlayer plus the jump side effects: dust burst, sound cue and
// acknowledging the one-shot jump intent.
void playerMovement(World& w,
                    PlayerState& p,
                    IntentSource& input,
                    const PhysicsEnv& env,
                    float dt,
                    Rng& rng,
                    FrameReport& report);

}  // namespace NutfallSystems

}  // namespace nutfall
