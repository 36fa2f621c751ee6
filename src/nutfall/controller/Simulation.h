#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "ecs/World.h"
#include "nutfall/Collaborators.h"
#include "nutfall/Rng.h"
#include "nutfall/components/NutfallComponents.h"
#include "nutfall/config/CharacterConfig.h"
#include "nutfall/config/SkillCatalog.h"
#include "nutfall/score/RunSummary.h"
#include "nutfall/systems/Spawning.h"

namespace nutfall {

struct TickOutput {
  std::vector<SoundCue> sounds;
  bool leveledUp = false;
  bool gameOver = false;
};

struct HudSnapshot {
  int score = 0;
  float health = 0.0F;
  float maxHealth = 0.0F;
  int year = 1;
  int monthOfYear = 1;
  Season season = Season::Spring;
  float timeRemaining = kMonthSeconds;
  int extraLives = 0;
  bool slowed = false;
  WeatherEvent event = WeatherEvent::None;
  std::string incomingTitle;
};

// Owns every piece of run state and advances it once per host frame. Entity
// collections live in the world registry; the player, stats and timeline are
// plain members.
class Simulation {
 public:
  explicit Simulation(std::uint32_t seed = 5489U);

  void setDimensions(float width, float height);
  void setAssetProvider(const AssetProvider* assets) { assets_ = assets; }
  void selectCharacter(const std::string& id);
  void reseed(std::uint32_t seed) { rng_.reseed(seed); }

  // Refuses while assets are still loading.
  bool startGame(double nowMs);
  // Starts at absolute month year*12+month+1 with one random skill granted for
  // every month skipped.
  bool startDebugGame(int year, int month, double nowMs);

  TickOutput tick(double nowMs, IntentSource& input);

  // Only valid while a level-up offer is open and for an offered skill.
  bool selectSkill(SkillId id, double nowMs);

  // Leaves the game-over screen once the name has been recorded.
  void finishNameEntry(const std::string& name);

  [[nodiscard]] GameStatus status() const { return status_; }
  [[nodiscard]] const PlayerState& player() const { return player_; }
  [[nodiscard]] const PlayerStats& stats() const { return stats_; }
  [[nodiscard]] const StatusEffects& statusEffects() const { return effects_; }
  [[nodiscard]] const Timeline& timeline() const { return timeline_; }
  [[nodiscard]] const EventState& events() const { return events_; }
  [[nodiscard]] const ShellBreakAnim& shellBreak() const { return shellBreak_; }
  [[nodiscard]] const ShellReformAnim& shellReform() const { return shellReform_; }
  [[nodiscard]] const CharacterConfig& character() const { return character_; }
  [[nodiscard]] const World& world() const { return world_; }
  [[nodiscard]] std::span<const SkillId> offers() const { return offers_; }
  [[nodiscard]] const std::vector<AcquiredSkill>& acquiredSkills() const { return acquired_; }
  [[nodiscard]] float score() const { return score_; }
  [[nodiscard]] int rocksDestroyed() const { return rocksDestroyed_; }
  [[nodiscard]] float screenFlash() const { return screenFlash_; }
  [[nodiscard]] float breathingPhase() const { return breathingPhase_; }
  [[nodiscard]] float gameWidth() const { return gameWidth_; }
  [[nodiscard]] float gameHeight() const { return gameHeight_; }
  [[nodiscard]] const RunSummary& lastRun() const { return lastRun_; }
  [[nodiscard]] HudSnapshot hud() const;

  // Direct access for tests and the debug inspector.
  World& world() { return world_; }
  PlayerState& mutablePlayer() { return player_; }
  PlayerStats& mutableStats() { return stats_; }
  Timeline& mutableTimeline() { return timeline_; }
  Rng& rng() { return rng_; }

 private:
  void resetRun(double nowMs);
  void beginPlaying(double nowMs);
  void levelUp();
  void endRun();
  [[nodiscard]] float frameDelta(double nowMs);
  void drainPending(TickOutput& out);

  World world_;
  Rng rng_;
  const AssetProvider* assets_ = nullptr;
  CharacterConfig character_;

  float gameWidth_ = kDefaultGameWidth;
  float gameHeight_ = kGameHeight;

  GameStatus status_ = GameStatus::Start;
  PlayerState player_{};
  PlayerStats stats_{};
  StatusEffects effects_{};
  Timeline timeline_{};
  EventState events_{};
  SpawnTimers spawnTimers_{};
  ShellBreakAnim shellBreak_{};
  ShellReformAnim shellReform_{};

  std::vector<SkillId> offers_;
  std::vector<AcquiredSkill> acquired_;
  float score_ = 0.0F;
  int rocksDestroyed_ = 0;
  float screenFlash_ = 0.0F;
  float breathingPhase_ = 0.0F;

  double lastFrameMs_ = 0.0;
  bool hasLastFrame_ = false;
  std::vector<SoundCue> pendingSounds_;
  RunSummary lastRun_{};
};

}  // namespace nutfall
