#include <gtest/gtest.h>

#include <string>

#include <toml++/toml.h>

#include "nutfall/score/HighScores.h"
#include "nutfall/score/RunSummary.h"
#include "util/TomlUtil.h"
#include "TestSupport.h"

namespace nutfall {
namespace {

RunSummary run(const std::string& name, int score) {
  RunSummary r;
  r.name = name;
  r.score = score;
  return r;
}

TEST(HighScoresTest, MonthsSurvivedExcludeTheFinalMonth) {
  RunSummary r;
  r.setMonthsSurvived(1);
  EXPECT_EQ(r.year, 0);
  EXPECT_EQ(r.month, 0);

  r.setMonthsSurvived(15);
  EXPECT_EQ(r.year, 1);
  EXPECT_EQ(r.month, 2);
  EXPECT_EQ(r.monthsSurvived(), 14);
}

TEST(HighScoresTest, AddKeepsDescendingOrderAndEarlierTiesFirst) {
  HighScoreTable table;
  EXPECT_EQ(table.add(run("a", 50)), 0);
  EXPECT_EQ(table.add(run("b", 80)), 0);
  EXPECT_EQ(table.add(run("c", 50)), 2);
  EXPECT_EQ(table.add(run("d", 10)), 3);

  const auto& e = table.entries();
  ASSERT_EQ(e.size(), 4U);
  EXPECT_EQ(e[0].name, "b");
  EXPECT_EQ(e[1].name, "a");
  EXPECT_EQ(e[2].name, "c");
  EXPECT_EQ(e[3].name, "d");
}

TEST(HighScoresTest, FullTableRejectsLowRuns) {
  HighScoreTable table;
  for (int i = 0; i < static_cast<int>(HighScoreTable::kMaxEntries); ++i) {
    table.add(run("r" + std::to_string(i), 100 + i));
  }
  EXPECT_EQ(table.add(run("low", 100)), -1);
  EXPECT_EQ(table.add(run("top", 500)), 0);
  EXPECT_EQ(table.entries().size(), HighScoreTable::kMaxEntries);
  EXPECT_EQ(table.entries().back().score, 101);
}

TEST(HighScoresTest, MissingFileLoadsAsEmptyTable) {
  const auto dir = test::scratchDir("missing_scores");
  HighScoreTable table;
  table.add(run("stale", 1));
  EXPECT_TRUE(table.load((dir / "nope.toml").string()));
  EXPECT_TRUE(table.empty());
}

TEST(HighScoresTest, MalformedFileFailsToLoad) {
  const auto dir = test::scratchDir("bad_scores");
  const auto path = dir / "highscores.toml";
  test::writeFile(path, "scores = [ {score = }\n");

  HighScoreTable table;
  EXPECT_FALSE(table.load(path.string()));
}

TEST(HighScoresTest, SavedTableLoadsBack) {
  const auto dir = test::scratchDir("saved_scores");
  const auto path = dir / "highscores.toml";

  RunSummary best = run("Ada", 321);
  best.setMonthsSurvived(20);
  best.rocksDestroyed = 44;
  best.maxHealth = 25.0F;
  best.finalSpeed = 340.0F;
  best.characterId = "walnut";
  recordSkill(best.acquiredSkills, SkillId::BlockChance);
  recordSkill(best.acquiredSkills, SkillId::BlockChance);

  HighScoreTable table;
  table.add(best);
  table.add(run("Bo", 12));
  ASSERT_TRUE(table.save(path.string()));

  HighScoreTable loaded;
  ASSERT_TRUE(loaded.load(path.string()));
  ASSERT_EQ(loaded.entries().size(), 2U);
  const RunSummary& r = loaded.entries().front();
  EXPECT_EQ(r.name, "Ada");
  EXPECT_EQ(r.score, 321);
  EXPECT_EQ(r.year, 1);
  EXPECT_EQ(r.month, 7);
  EXPECT_EQ(r.rocksDestroyed, 44);
  EXPECT_FLOAT_EQ(r.maxHealth, 25.0F);
  EXPECT_EQ(r.characterId, "walnut");
  EXPECT_EQ(r.version, kGameVersion);
  ASSERT_EQ(r.acquiredSkills.size(), 1U);
  EXPECT_EQ(r.acquiredSkills[0].id, SkillId::BlockChance);
  EXPECT_EQ(r.acquiredSkills[0].count, 2);
}

TEST(HighScoresTest, EntriesWithoutScoreAreDropped) {
  const auto dir = test::scratchDir("scoreless");
  const auto path = dir / "highscores.toml";
  test::writeFile(path,
                  "version = 1\n"
                  "[[scores]]\nname = \"no score\"\n"
                  "[[scores]]\nname = \"ok\"\nscore = 7\n");

  HighScoreTable table;
  ASSERT_TRUE(table.load(path.string()));
  ASSERT_EQ(table.entries().size(), 1U);
  EXPECT_EQ(table.entries()[0].name, "ok");
}

TEST(HighScoresTest, UnknownSkillsAreSkippedWithWarning) {
  auto tbl = toml::parse(R"(
score = 10
month = 14
acquired_skills = [ { id = "laserEyes", count = 1 }, { id = "extraLife", count = 3 } ]
)");

  TomlUtil::resetWarningCount();
  RunSummary r;
  ASSERT_TRUE(r.loadFromToml(tbl, "inline"));
  EXPECT_EQ(TomlUtil::warningCount(), 2);
  EXPECT_EQ(r.month, 11);
  ASSERT_EQ(r.acquiredSkills.size(), 1U);
  EXPECT_EQ(r.acquiredSkills[0].id, SkillId::ExtraLife);
  EXPECT_EQ(r.acquiredSkills[0].count, 3);
}

}  // namespace
}  // namespace nutfall
