#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "nutfall/components/NutfallComponents.h"

namespace nutfall {

enum class SkillId : std::uint8_t {
  ShellFortification,
  IncreasedAgility,
  WaterAffinity,
  SoothingRains,
  ExtraLife,
  BlockChance,
  Photosynthesis,
  GoldenTouch,
};

enum class SkillPool : std::uint8_t { Permanent, Event, Yearly };

struct Skill {
  SkillId id;
  std::string_view key;  // stable id used in score records
  std::string_view title;
  std::string_view description;
  SkillPool pool;
  Color color;
};

namespace SkillCatalog {

const Skill& info(SkillId id);
std::optional<SkillId> fromKey(std::string_view key);
std::span<const SkillId> pool(SkillPool p);
const char* poolName(SkillPool p);

// Numeric effect of picking the skill once. Reselecting stacks.
void apply(SkillId id, PlayerStats& stats);

}  // namespace SkillCatalog

}  // namespace nutfall
