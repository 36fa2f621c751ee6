#include "nutfall/controller/Simulation.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "nutfall/systems/Collision.h"
#include "nutfall/systems/Effects.h"
#include "nutfall/systems/Events.h"
#include "nutfall/systems/PlayerPhysics.h"
#include "nutfall/systems/Progression.h"

namespace nutfall {

Simulation::Simulation(std::uint32_t seed)
    : rng_(seed), character_(CharacterRegistry::get("pistachio")) {
  // Read-only views from the renderer need every pool to exist up front.
  (void)world_.registry.storage<Element>();
  (void)world_.registry.storage<Particle>();
  (void)world_.registry.storage<FloatingText>();
  (void)world_.registry.storage<FloatingScore>();
  (void)world_.registry.storage<LightningStrike>();
  (void)world_.registry.storage<BurningPatch>();
  (void)world_.registry.storage<Cloud>();

  player_.characterId = character_.id;
  player_.x = (gameWidth_ - character_.hitbox.shelled.w) * 0.5F;
  stats_ = character_.initialStats();
  NutfallSystems::spawnAmbientClouds(world_, rng_, gameWidth_);
}

void Simulation::setDimensions(float width, float height) {
  gameWidth_ = std::max(1.0F, width);
  gameHeight_ = std::max(1.0F, height);
  const float maxX = std::max(0.0F, gameWidth_ - character_.hitbox.shelled.w);
  player_.x = std::clamp(player_.x, 0.0F, maxX);
}

void Simulation::selectCharacter(const std::string& id) {
  character_ = CharacterRegistry::get(id);
  player_.characterId = character_.id;
  if (status_ == GameStatus::Start) {
    stats_ = character_.initialStats();
  }
}

bool Simulation::startGame(double nowMs) {
  if (assets_ != nullptr && !assets_->ready()) {
    return false;
  }
  resetRun(nowMs);
  beginPlaying(nowMs);
  return true;
}

bool Simulation::startDebugGame(int year, int month, double nowMs) {
  if (assets_ != nullptr && !assets_->ready()) {
    return false;
  }
  resetRun(nowMs);

  const int totalMonths = std::max(0, (year * 12) + month);
  timeline_.monthCounter = totalMonths + 1;
  timeline_.difficultyLevel = totalMonths + 1;

  for (int i = 1; i <= totalMonths; ++i) {
    const auto pool = SkillCatalog::pool(NutfallSystems::poolForSkippedMonth(i));
    const SkillId picked = pool[rng_.index(pool.size())];
    SkillCatalog::apply(picked, stats_);
    recordSkill(acquired_, picked);
  }

  beginPlaying(nowMs);
  return true;
}

void Simulation::resetRun(double nowMs) {
  world_.clear();
  NutfallSystems::spawnAmbientClouds(world_, rng_, gameWidth_);

  player_ = PlayerState{};
  player_.characterId = character_.id;
  player_.x = (gameWidth_ - character_.hitbox.shelled.w) * 0.5F;
  stats_ = character_.initialStats();
  effects_ = StatusEffects{};
  timeline_ = Timeline{};
  events_ = EventState{};
  spawnTimers_.reset(nowMs);
  shellBreak_ = ShellBreakAnim{};
  shellReform_ = ShellReformAnim{};

  offers_.clear();
  acquired_.clear();
  score_ = 0.0F;
  rocksDestroyed_ = 0;
  screenFlash_ = 0.0F;
  pendingSounds_.clear();
  lastRun_ = RunSummary{};
}

void Simulation::beginPlaying(double nowMs) {
  status_ = GameStatus::Playing;
  lastFrameMs_ = nowMs;
  hasLastFrame_ = true;

  FrameReport report;
  NutfallSystems::enterEvent(world_, rng_, events_, timeline_.monthCounter, gameWidth_, report);
  pendingSounds_.insert(pendingSounds_.end(), report.sounds.begin(), report.sounds.end());
}

float Simulation::frameDelta(double nowMs) {
  double dt = hasLastFrame_ ? (nowMs - lastFrameMs_) / 1000.0 : 0.0;
  lastFrameMs_ = nowMs;
  hasLastFrame_ = true;
  return static_cast<float>(std::clamp(dt, 0.0, static_cast<double>(kMaxDeltaSeconds)));
}

void Simulation::drainPending(TickOutput& out) {
  out.sounds.insert(out.sounds.begin(), pendingSounds_.begin(), pendingSounds_.end());
  pendingSounds_.clear();
}

TickOutput Simulation::tick(double nowMs, IntentSource& input) {
  TickOutput out;
  const float dt = frameDelta(nowMs);

  if (status_ == GameStatus::Start) {
    breathingPhase_ += dt;
    NutfallSystems::updateClouds(world_, gameWidth_, dt, WeatherEvent::None, WindDirection::None);
    return out;
  }
  if (status_ != GameStatus::Playing) {
    return out;
  }

  NutfallSystems::updateClouds(world_, gameWidth_, dt, events_.current, events_.wind);

  if (timeline_.timeInMonth + dt >= kMonthSeconds) {
    levelUp();
    drainPending(out);
    out.leveledUp = true;
    return out;
  }

  events_.incomingTitle =
      NutfallSystems::incomingEventTitle(timeline_.monthCounter, timeline_.timeInMonth);
  timeline_.timeInMonth += dt;

  screenFlash_ = std::max(0.0F, screenFlash_ - (dt * kScreenFlashDecayPerSecond));
  effects_.slowTimer = std::max(0.0F, effects_.slowTimer - dt);

  FrameReport report;
  PlayerContext ctx{player_, stats_, effects_, shellBreak_, shellReform_, character_};

  NutfallSystems::updateShellAnimations(shellBreak_, shellReform_, dt);

  PhysicsEnv env{};
  env.gameWidth = gameWidth_;
  env.playerWidth = character_.hitbox.shelled.w;
  env.maxSpeed = stats_.maxSpeed;
  env.slowTimer = effects_.slowTimer;
  env.event = events_.current;
  env.wind = events_.wind;
  NutfallSystems::playerMovement(world_, player_, input, env, dt, rng_, report);
  NutfallSystems::tickPhotosynthesis(world_, ctx, dt, report);

  NutfallSystems::updateEvent(world_, rng_, events_, gameWidth_, nowMs, dt, report);
  NutfallSystems::spawnSeasonalParticles(world_, rng_, timeline_.season(), gameWidth_, dt);

  SpawnContext spawn{};
  spawn.gameWidth = gameWidth_;
  spawn.monthCounter = timeline_.monthCounter;
  spawn.event = events_.current;
  spawn.season = timeline_.season();
  spawn.waterSpawnIntervalMs = stats_.waterSpawnIntervalMs;
  NutfallSystems::spawnElements(world_, rng_, spawnTimers_, spawn, nowMs);
  NutfallSystems::moveElements(world_, dt);

  NutfallSystems::resolveCollisions(world_, rng_, ctx, timeline_.season(), report);
  if (!report.gameOver) {
    NutfallSystems::resolveGroundContact(world_, rng_, report);
    NutfallSystems::resolveLightning(world_, rng_, ctx, nowMs, report);
  }
  if (!report.gameOver) {
    NutfallSystems::resolveBurningPatches(world_, rng_, ctx, events_, nowMs, dt, report);
  }

  drainPending(out);
  out.sounds.insert(out.sounds.end(), report.sounds.begin(), report.sounds.end());

  if (report.gameOver) {
    endRun();
    out.gameOver = true;
    return out;
  }

  NutfallSystems::updateParticles(world_, dt);
  NutfallSystems::updateFloaters(world_, dt);

  score_ += report.scoreGained + dt;
  rocksDestroyed_ += report.rocksHit;
  screenFlash_ = std::max(screenFlash_, report.screenFlash);
  return out;
}

void Simulation::levelUp() {
  const int endedMonth = timeline_.monthCounter;

  NutfallSystems::clearEvent(world_, events_);
  events_.incomingTitle.clear();
  offers_ = NutfallSystems::rollSkillOffers(rng_, NutfallSystems::poolForEndedMonth(endedMonth));

  timeline_.timeInMonth = kMonthSeconds;
  timeline_.monthCounter = endedMonth + 1;
  timeline_.difficultyLevel += 1;
  status_ = GameStatus::LevelUp;
}

bool Simulation::selectSkill(SkillId id, double nowMs) {
  if (status_ != GameStatus::LevelUp) {
    return false;
  }
  if (std::ranges::find(offers_, id) == offers_.end()) {
    return false;
  }

  SkillCatalog::apply(id, stats_);
  recordSkill(acquired_, id);
  offers_.clear();
  timeline_.timeInMonth = 0.0F;
  beginPlaying(nowMs);
  return true;
}

void Simulation::endRun() {
  status_ = GameStatus::EnteringName;

  RunSummary run;
  run.score = static_cast<int>(std::floor(score_));
  run.setMonthsSurvived(timeline_.monthCounter);
  run.rocksDestroyed = rocksDestroyed_;
  run.maxHealth = stats_.maxHealth;
  run.finalSpeed = stats_.maxSpeed;
  run.acquiredSkills = acquired_;
  run.characterId = character_.id;
  lastRun_ = std::move(run);
}

void Simulation::finishNameEntry(const std::string& name) {
  if (status_ != GameStatus::EnteringName) {
    return;
  }
  lastRun_.name = name;
  status_ = GameStatus::Start;
}

HudSnapshot Simulation::hud() const {
  HudSnapshot h;
  h.score = static_cast<int>(std::floor(score_));
  h.health = player_.health;
  h.maxHealth = stats_.maxHealth;
  h.year = timeline_.year();
  h.monthOfYear = timeline_.monthOfYear();
  h.season = timeline_.season();
  h.timeRemaining = timeline_.timeRemaining();
  h.extraLives = stats_.extraLives;
  h.slowed = effects_.slowTimer > 0.0F;
  h.event = events_.current;
  h.incomingTitle = events_.incomingTitle;
  return h;
}

}  // namespace nutfall
