#include "nutfall/config/SkillCatalog.h"

#include <algorithm>
#include <array>

#include "nutfall/Constants.h"

namespace nutfall {

namespace {

constexpr std::array<Skill, 8> kSkills = {{
    {SkillId::ShellFortification, "shellFortification", "Shell Fortification",
     "Permanently increases your maximum Shell HP by 5.", SkillPool::Permanent,
     Color{74, 222, 128, 255}},
    {SkillId::IncreasedAgility, "increasedAgility", "Increased Agility",
     "Permanently increases your maximum movement speed.", SkillPool::Permanent,
     Color{96, 165, 250, 255}},
    {SkillId::WaterAffinity, "waterAffinity", "Water Affinity",
     "Permanently increases the healing from all water drops by 1. This effect stacks.",
     SkillPool::Event, Color{56, 189, 248, 255}},
    {SkillId::SoothingRains, "soothingRains", "Soothing Rains",
     "Permanently increases the frequency of healing water drops.", SkillPool::Permanent,
     Color{34, 211, 238, 255}},
    {SkillId::ExtraLife, "extraLife", "Phoenix Kernel",
     "Gain an extra life. If your shell breaks, you are instantly revived with full HP.",
     SkillPool::Event, Color{250, 204, 21, 255}},
    {SkillId::BlockChance, "blockChance", "Stone Shell",
     "Permanently increase your chance to block rock damage by 10%. This effect stacks.",
     SkillPool::Event, Color{192, 132, 252, 255}},
    {SkillId::Photosynthesis, "photosynthesis", "Photosynthesis",
     "Regenerate 1 HP for every second you stand still. Stacks increase this amount.",
     SkillPool::Yearly, Color{52, 211, 153, 255}},
    {SkillId::GoldenTouch, "goldenTouch", "Golden Touch",
     "Gain a 5% chance for destroyed rocks to grant 10x score. Stacks increase chance.",
     SkillPool::Yearly, Color{251, 191, 36, 255}},
}};

constexpr std::array<SkillId, 3> kPermanentPool = {
    SkillId::ShellFortification, SkillId::IncreasedAgility, SkillId::SoothingRains};
constexpr std::array<SkillId, 3> kEventPool = {SkillId::WaterAffinity, SkillId::BlockChance,
                                               SkillId::ExtraLife};
constexpr std::array<SkillId, 2> kYearlyPool = {SkillId::Photosynthesis, SkillId::GoldenTouch};

constexpr float kFortificationHealth = 5.0F;
constexpr float kAgilitySpeed = 40.0F;
constexpr float kWaterAffinityHeal = 1.0F;
constexpr float kSoothingRainsFactor = 0.9F;
constexpr float kBlockChanceStep = 0.1F;

}  // namespace

const Skill& SkillCatalog::info(SkillId id) {
  return kSkills[static_cast<std::size_t>(id)];
}

std::optional<SkillId> SkillCatalog::fromKey(std::string_view key) {
  for (const Skill& s : kSkills) {
    if (s.key == key)
      return s.id;
  }
  return std::nullopt;
}

std::span<const SkillId> SkillCatalog::pool(SkillPool p) {
  switch (p) {
    case SkillPool::Permanent:
      return kPermanentPool;
    case SkillPool::Event:
      return kEventPool;
    case SkillPool::Yearly:
      return kYearlyPool;
  }
  return kPermanentPool;
}

const char* SkillCatalog::poolName(SkillPool p) {
  switch (p) {
    case SkillPool::Permanent:
      return "permanent";
    case SkillPool::Event:
      return "event";
    case SkillPool::Yearly:
      return "yearly";
  }
  return "?";
}

void SkillCatalog::apply(SkillId id, PlayerStats& stats) {
  switch (id) {
    case SkillId::ShellFortification:
      stats.maxHealth += kFortificationHealth;
      break;
    case SkillId::IncreasedAgility:
      stats.maxSpeed += kAgilitySpeed;
      break;
    case SkillId::WaterAffinity:
      stats.bonusHeal += kWaterAffinityHeal;
      break;
    case SkillId::SoothingRains:
      stats.waterSpawnIntervalMs *= kSoothingRainsFactor;
      break;
    case SkillId::ExtraLife:
      stats.extraLives += 1;
      break;
    case SkillId::BlockChance:
      stats.blockChance = std::min(stats.blockChance + kBlockChanceStep, kBlockChanceCap);
      break;
    case SkillId::Photosynthesis:
      stats.photosynthesisLevel += 1;
      break;
    case SkillId::GoldenTouch:
      stats.goldenTouchChance += kGoldenTouchChanceIncrease;
      break;
  }
}

}  // namespace nutfall
