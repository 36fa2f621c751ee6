#include "nutfall/systems/PlayerPhysics.h"

#include <algorithm>

#include "ecs/World.h"
#include "nutfall/Rng.h"
#include "nutfall/systems/Effects.h"

namespace nutfall {

namespace {

constexpr int kJumpDustCount = 10;
constexpr float kJumpDustIntensity = 60.0F;

}  // namespace

float NutfallSystems::effectiveMaxSpeed(const PhysicsEnv& env) {
  return env.slowTimer > 0.0F ? env.maxSpeed * 0.5F : env.maxSpeed;
}

bool NutfallSystems::integratePlayer(PlayerState& p,
                                     const MoveIntent& intent,
                                     const PhysicsEnv& env,
                                     float dt) {
  const bool grounded = p.grounded();
  const float friction =
      (env.event == WeatherEvent::Blizzard && grounded) ? kIceFriction : kGroundFriction;
  const float accel = env.slowTimer > 0.0F ? kPlayerAcceleration * 0.5F : kPlayerAcceleration;

  if (intent.movingLeft) {
    p.xVelocity -= accel * dt;
  } else if (intent.movingRight) {
    p.xVelocity += accel * dt;
  }

  if (env.event == WeatherEvent::Storm) {
    if (env.wind == WindDirection::Left) {
      p.xVelocity -= kWindForce * dt;
    } else if (env.wind == WindDirection::Right) {
      p.xVelocity += kWindForce * dt;
    }
  }

  // Friction brings velocity to rest without crossing zero.
  if (!intent.movingLeft && !intent.movingRight && grounded) {
    if (p.xVelocity > 0.0F) {
      p.xVelocity = std::max(0.0F, p.xVelocity - friction * dt);
    } else if (p.xVelocity < 0.0F) {
      p.xVelocity = std::min(0.0F, p.xVelocity + friction * dt);
    }
  }

  const float maxSpeed = effectiveMaxSpeed(env);
  p.xVelocity = std::clamp(p.xVelocity, -maxSpeed, maxSpeed);
  p.x += p.xVelocity * dt;

  bool jumped = false;
  if (intent.tryingToJump && grounded) {
    p.yVelocity = kJumpStrength;
    jumped = true;
  }

  p.yVelocity -= kGravity * dt;
  p.y += p.yVelocity * dt;

  if (p.y < kGroundHeight) {
    p.y = kGroundHeight;
    p.yVelocity = 0.0F;
  }

  const float maxX = std::max(0.0F, env.gameWidth - env.playerWidth);
  if (p.x < 0.0F) {
    p.x = 0.0F;
    p.xVelocity = 0.0F;
  }
  if (p.x > maxX) {
    p.x = maxX;
    p.xVelocity = 0.0F;
  }

  return jumped;
}

void NutfallSystems::playerMovement(World& w,
                                    PlayerState& p,
                                    IntentSource& input,
                                    const PhysicsEnv& env,
                                    float dt,
                                    Rng& rng,
                                    FrameReport& report) {
  if (!integratePlayer(p, input.intent(), env, dt)) {
    return;
  }

  report.play(SoundCue::Jump);
  spawnDust(w, rng, p.x + (env.playerWidth * 0.5F), kGroundLineY, kJumpDustCount,
            kJumpDustIntensity);
  input.consumeJump();
}

}  // namespace nutfall
