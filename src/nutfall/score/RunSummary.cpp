#include "nutfall/score/RunSummary.h"

#include <algorithm>
#include <string_view>
#include <utility>

#include "util/TomlUtil.h"

namespace nutfall {

void recordSkill(std::vector<AcquiredSkill>& skills, SkillId id) {
  auto it = std::ranges::find(skills, id, &AcquiredSkill::id);
  if (it != skills.end()) {
    ++it->count;
    return;
  }
  skills.push_back(AcquiredSkill{id, 1});
}

void RunSummary::setMonthsSurvived(int monthCounter) {
  const int survived = std::max(0, monthCounter - 1);
  year = survived / 12;
  month = survived % 12;
}

toml::table RunSummary::toToml() const {
  toml::array skills;
  for (const AcquiredSkill& s : acquiredSkills) {
    skills.push_back(toml::table{
        {"id", std::string(SkillCatalog::info(s.id).key)},
        {"count", s.count},
    });
  }

  toml::table tbl;
  tbl.insert("name", name);
  tbl.insert("score", score);
  tbl.insert("year", year);
  tbl.insert("month", month);
  tbl.insert("rocks_destroyed", rocksDestroyed);
  tbl.insert("max_health", static_cast<double>(maxHealth));
  tbl.insert("final_speed", static_cast<double>(finalSpeed));
  tbl.insert("character_id", characterId);
  tbl.insert("version", version);
  tbl.insert("acquired_skills", std::move(skills));
  return tbl;
}

bool RunSummary::loadFromToml(const toml::table& tbl, const char* path) {
  TomlUtil::warnUnknownKeys(tbl, path, "score",
                            {"name", "score", "year", "month", "rocks_destroyed", "max_health",
                             "final_speed", "character_id", "version", "acquired_skills"});

  RunSummary next{};
  next.version.clear();

  const auto scoreValue = tbl["score"].value<int>();
  if (!scoreValue) {
    TomlUtil::warnf(path, "score entry without an integer 'score'");
    return false;
  }
  next.score = *scoreValue;

  if (auto v = tbl.get("name"))
    next.name = v->value_or(next.name);
  if (auto v = tbl.get("year"))
    next.year = v->value_or(next.year);
  if (auto v = tbl.get("month"))
    next.month = v->value_or(next.month);
  if (auto v = tbl.get("rocks_destroyed"))
    next.rocksDestroyed = v->value_or(next.rocksDestroyed);
  if (auto v = tbl.get("max_health"))
    next.maxHealth = v->value_or(next.maxHealth);
  if (auto v = tbl.get("final_speed"))
    next.finalSpeed = v->value_or(next.finalSpeed);
  if (auto v = tbl.get("character_id"))
    next.characterId = v->value_or(next.characterId);
  if (auto v = tbl.get("version"))
    next.version = v->value_or(next.version);

  if (next.month < 0 || next.month > 11) {
    TomlUtil::warnf(path, "score month {} out of range [0, 11]", next.month);
    next.month = std::clamp(next.month, 0, 11);
  }

  if (const toml::array* skills = tbl["acquired_skills"].as_array()) {
    for (const toml::node& node : *skills) {
      const toml::table* s = node.as_table();
      if (!s) {
        TomlUtil::warnf(path, "acquired_skills entries must be tables");
        continue;
      }
      const std::string key = (*s)["id"].value_or(std::string{});
      const auto id = SkillCatalog::fromKey(key);
      if (!id) {
        TomlUtil::warnf(path, "unknown skill '{}'", key);
        continue;
      }
      const int count = (*s)["count"].value_or(1);
      if (count <= 0)
        continue;
      next.acquiredSkills.push_back(AcquiredSkill{*id, count});
    }
  }

  *this = std::move(next);
  return true;
}

}  // namespace nutfall
