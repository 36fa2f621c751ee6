#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "nutfall/Constants.h"

namespace nutfall {

// =============================================================================
// Basic value types
// =============================================================================

struct Vec2 {
  float x = 0.0F;
  float y = 0.0F;
};

struct Color {
  std::uint8_t r = 255;
  std::uint8_t g = 255;
  std::uint8_t b = 255;
  std::uint8_t a = 255;
};

// =============================================================================
// Enumerations
// =============================================================================

enum class ElementType : std::uint8_t { Rock, Water, Snow, Meteor };

enum class Season : std::uint8_t { Spring, Summer, Autumn, Winter };

enum class WeatherEvent : std::uint8_t {
  None,
  Storm,
  Thunderstorm,
  Earthquake,
  Blizzard,
  MeteorShower,
};

enum class WindDirection : std::uint8_t { None, Left, Right };

enum class GameStatus : std::uint8_t { Start, Playing, LevelUp, EnteringName };

enum class ParticleKind : std::uint8_t { Rock, Water, Dust, Leaf };

enum class SoundCue : std::uint8_t {
  Jump,
  Damage,
  Impact,
  MeteorImpact,
  WaterCollect,
  Block,
  Resurrect,
  ShellCrack,
  GoldenTouch,
  GameOver,
  Thunder,
  LightningStrike,
  Storm,
  Earthquake,
  Blizzard,
  PhotosynthesisHeal,
};

inline bool isHazard(ElementType t) {
  return t == ElementType::Rock || t == ElementType::Meteor;
}

const char* elementTypeName(ElementType t);
const char* seasonName(Season s);
const char* weatherEventName(WeatherEvent e);
const char* gameStatusName(GameStatus s);
const char* soundCueName(SoundCue c);

// =============================================================================
// Player
// =============================================================================

// y is height above the bottom edge of the playfield; the feet rest on the
// ground at y == kGroundHeight.
struct PlayerState {
  float x = 0.0F;
  float y = kGroundHeight;
  float xVelocity = 0.0F;
  float yVelocity = 0.0F;
  float health = 0.0F;
  bool isNaked = true;
  std::string characterId;

  [[nodiscard]] bool grounded() const { return y <= kGroundHeight; }
};

// Run-long modifiers. Starting values come from the character, skills stack on top.
struct PlayerStats {
  float maxHealth = kInitialMaxHealth;
  float maxSpeed = kMaxPlayerSpeed;
  int extraLives = 0;
  float blockChance = 0.0F;
  float bonusHeal = 0.0F;
  float waterSpawnIntervalMs = kInitialWaterSpawnIntervalMs;
  int photosynthesisLevel = 0;
  float goldenTouchChance = 0.0F;
};

struct StatusEffects {
  float slowTimer = 0.0F;  // seconds; halves acceleration and max speed
  float standStillTimer = 0.0F;
};

struct ShellPiece {
  Vec2 pos{};
  Vec2 vel{};
  float rotation = 0.0F;
  float rotationVelocity = 0.0F;
};

struct ShellBreakAnim {
  bool active = false;
  ShellPiece left{};
  ShellPiece right{};
  float lifespan = 0.0F;
};

struct ShellReformAnim {
  bool active = false;
  float progress = 0.0F;
  float duration = kShellReformDuration;
};

// =============================================================================
// Entity components (one registry entity each)
// =============================================================================

// Falling element. y is screen-down; the element spawns at y = -size.
struct Element {
  std::uint64_t id = 0;  // creation order
  float x = 0.0F;
  float y = 0.0F;
  float size = 0.0F;
  float speed = 0.0F;
  ElementType type = ElementType::Rock;
};

struct Particle {
  std::uint64_t serial = 0;
  Vec2 pos{};
  Vec2 vel{};
  float size = 2.0F;
  Color color{};
  float lifespan = 1.0F;
  ParticleKind kind = ParticleKind::Dust;
};

struct FloatingText {
  Vec2 pos{};
  std::string text;
  Color color{};
  float lifespan = 1.0F;
};

struct FloatingScore {
  Vec2 pos{};
  int amount = 0;
  float lifespan = 1.0F;
  bool golden = false;
};

struct LightningStrike {
  float x = 0.0F;
  float width = 40.0F;
  double warningStartMs = 0.0;
  double strikeMs = 0.0;
  bool hasStruck = false;
};

struct BurningPatch {
  float x = 0.0F;
  float width = 0.0F;
  float lifespan = kBurningPatchLifespan;
};

struct Cloud {
  float x = 0.0F;
  float y = 0.0F;
  float speed = 10.0F;
  float width = 100.0F;
  float height = 30.0F;
  bool storm = false;
};

// =============================================================================
// Progression and event state
// =============================================================================

struct Timeline {
  int monthCounter = 1;  // 1-based absolute month
  int difficultyLevel = 1;
  float timeInMonth = 0.0F;

  [[nodiscard]] Season season() const { return seasonForMonth(monthCounter); }
  [[nodiscard]] int year() const { return ((monthCounter - 1) / 12) + 1; }
  [[nodiscard]] int monthOfYear() const { return ((monthCounter - 1) % 12) + 1; }
  [[nodiscard]] float timeRemaining() const {
    return std::max(0.0F, kMonthSeconds - timeInMonth);
  }

  static Season seasonForMonth(int month) {
    return static_cast<Season>(((month - 1) / 3) % 4);
  }
};

struct EventState {
  WeatherEvent current = WeatherEvent::None;
  WindDirection wind = WindDirection::None;
  std::string incomingTitle;
  Vec2 screenShake{};
  float groundDamageAccum = 0.0F;
  double lastGroundDamageMs = -1.0e9;
};

// Side effects gathered while the systems run one tick.
struct FrameReport {
  std::vector<SoundCue> sounds;
  float screenFlash = 0.0F;
  float scoreGained = 0.0F;
  int rocksHit = 0;
  bool gameOver = false;
  bool shellBroken = false;
  bool shellReformed = false;

  void play(SoundCue cue) { sounds.push_back(cue); }
  void flash(float strength) { screenFlash = std::max(screenFlash, strength); }
};

}  // namespace nutfall
