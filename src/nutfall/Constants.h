#pragma once

namespace nutfall {

// Logical playfield. Width follows the window, height is fixed.
inline constexpr float kGameHeight = 700.0F;
inline constexpr float kDefaultGameWidth = 800.0F;
inline constexpr float kGroundHeight = 180.0F;
inline constexpr float kGroundLineY = kGameHeight - kGroundHeight;  // screen-down y of the ground

inline constexpr float kPlayerWidth = 40.0F;
inline constexpr float kPlayerHeight = 50.0F;
inline constexpr float kNakedPlayerWidth = kPlayerWidth * 0.55F;
inline constexpr float kNakedPlayerHeight = kPlayerHeight * 0.85F;

inline constexpr float kJumpStrength = 600.0F;
inline constexpr float kGravity = 1500.0F;
inline constexpr float kPlayerAcceleration = 1200.0F;
inline constexpr float kMaxPlayerSpeed = 300.0F;
inline constexpr float kGroundFriction = 800.0F;
inline constexpr float kIceFriction = 100.0F;
inline constexpr float kWindForce = 400.0F;

inline constexpr float kInitialMaxHealth = 20.0F;

// Spawn timing in milliseconds, sizes in world units, speeds in units/sec.
inline constexpr float kElementSpawnIntervalMs = 450.0F;
inline constexpr float kInitialWaterSpawnIntervalMs = 2500.0F;
inline constexpr float kMinElementSize = 15.0F;
inline constexpr float kMaxElementSize = 40.0F;
inline constexpr float kEarthquakeMaxElementSize = 25.0F;
inline constexpr float kMinElementSpeed = 100.0F;
inline constexpr float kMaxElementSpeed = 250.0F;
inline constexpr float kWaterDropSize = 15.0F;
inline constexpr float kReferenceWidth = 800.0F;

inline constexpr float kWaterHealAmount = 2.0F;
inline constexpr float kSnowSlowSeconds = 2.0F;
inline constexpr float kBlockChanceCap = 0.9F;
inline constexpr float kGoldenTouchChanceIncrease = 0.05F;
inline constexpr int kGoldenScoreMultiplier = 10;

inline constexpr float kMonthSeconds = 30.0F;
inline constexpr float kIncomingWarningSeconds = 24.0F;
inline constexpr float kMaxDeltaSeconds = 0.1F;

inline constexpr float kLightningWarningMs = 1200.0F;
inline constexpr float kLightningWindowMs = 100.0F;
inline constexpr float kLightningDamage = 10.0F;
inline constexpr float kLightningRatePerSecond = 1.5F;
inline constexpr float kThunderRatePerSecond = 0.3F;

inline constexpr float kBurningPatchLifespan = 3.0F;
inline constexpr float kBurningPatchMargin = 10.0F;
inline constexpr float kBurningDamagePerSecond = 5.0F;
inline constexpr float kBurningTextIntervalMs = 400.0F;

inline constexpr float kScreenFlashStrength = 0.8F;
inline constexpr float kScreenFlashDecayPerSecond = 4.0F;
inline constexpr float kEarthquakeShakeIntensity = 4.0F;

inline constexpr int kMaxParticles = 150;
inline constexpr float kFloaterRiseSpeed = 20.0F;
inline constexpr float kShellBreakLifespan = 1.5F;
inline constexpr float kShellReformDuration = 0.5F;

inline constexpr const char* kGameVersion = "0.2.0";

}  // namespace nutfall
