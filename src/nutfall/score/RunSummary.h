#pragma once

#include <string>
#include <vector>

#include <toml++/toml.h>

#include "nutfall/Constants.h"
#include "nutfall/config/SkillCatalog.h"

namespace nutfall {

struct AcquiredSkill {
  SkillId id = SkillId::ShellFortification;
  int count = 0;
};

// Final record of one run. The TOML keys are what the high-score table and
// any leaderboard consumer read, so they never change meaning.
struct RunSummary {
  std::string name;
  int score = 0;
  int year = 0;   // full years survived
  int month = 0;  // remaining months survived
  int rocksDestroyed = 0;
  float maxHealth = 0.0F;
  float finalSpeed = 0.0F;
  std::vector<AcquiredSkill> acquiredSkills;
  std::string characterId;
  std::string version = kGameVersion;

  // monthCounter is the month the run ended in; it is not counted as survived.
  void setMonthsSurvived(int monthCounter);
  [[nodiscard]] int monthsSurvived() const { return (year * 12) + month; }

  [[nodiscard]] toml::table toToml() const;
  bool loadFromToml(const toml::table& tbl, const char* path);
};

// Adds one pick of the skill, aggregating repeats.
void recordSkill(std::vector<AcquiredSkill>& skills, SkillId id);

}  // namespace nutfall
