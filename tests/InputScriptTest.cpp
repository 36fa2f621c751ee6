#include <gtest/gtest.h>

#include <string>

#include "core/InputScript.h"
#include "util/TomlUtil.h"
#include "TestSupport.h"

namespace {

TEST(InputScriptTest, KeyframesHoldUntilChanged) {
  const auto dir = nutfall::test::scratchDir("script_hold");
  const auto path = dir / "hold.toml";
  nutfall::test::writeFile(path, R"(
version = 1
keyframes = [
  { frame = 10, right = true },
  { frame = 5, start = true },
  { frame = 20, jump = true },
  { frame = 30, right = false, left = true, jump = false },
]
)");

  InputScript script;
  ASSERT_TRUE(script.loadFromToml(path.string().c_str()));
  EXPECT_EQ(script.keyframeCount(), 4U);

  EXPECT_FALSE(script.advance(4).start);
  EXPECT_TRUE(script.advance(5).start);
  EXPECT_FALSE(script.intent().movingRight);

  script.advance(15);
  EXPECT_TRUE(script.intent().movingRight);

  script.advance(25);
  EXPECT_TRUE(script.intent().movingRight);
  EXPECT_TRUE(script.intent().tryingToJump);

  script.advance(30);
  EXPECT_FALSE(script.intent().movingRight);
  EXPECT_TRUE(script.intent().movingLeft);
  EXPECT_FALSE(script.intent().tryingToJump);
}

TEST(InputScriptTest, JumpStaysHeldUntilAKeyframeReleasesIt) {
  const auto dir = nutfall::test::scratchDir("script_jump");
  const auto path = dir / "jump.toml";
  nutfall::test::writeFile(path, "keyframes = [ { frame = 1, jump = true }, { frame = 5, jump = false } ]\n");

  InputScript script;
  ASSERT_TRUE(script.loadFromToml(path.string().c_str()));
  script.advance(1);
  script.consumeJump();
  EXPECT_TRUE(script.intent().tryingToJump);

  script.advance(4);
  EXPECT_TRUE(script.intent().tryingToJump);
  script.advance(5);
  EXPECT_FALSE(script.intent().tryingToJump);
}

TEST(InputScriptTest, PickSlotsAreZeroBased) {
  const auto dir = nutfall::test::scratchDir("script_pick");
  const auto path = dir / "pick.toml";
  nutfall::test::writeFile(path, R"(
keyframes = [
  { frame = 1, pick = 2 },
  { frame = 2, pick = 4 },
]
)");

  TomlUtil::resetWarningCount();
  InputScript script;
  ASSERT_TRUE(script.loadFromToml(path.string().c_str()));
  EXPECT_EQ(TomlUtil::warningCount(), 1);
  EXPECT_EQ(script.advance(1).pickSlot, 1);
  EXPECT_EQ(script.advance(2).pickSlot, -1);
}

TEST(InputScriptTest, RewindingReplaysFromTheStart) {
  const auto dir = nutfall::test::scratchDir("script_rewind");
  const auto path = dir / "rewind.toml";
  nutfall::test::writeFile(path, "keyframes = [ { frame = 3, start = true, left = true } ]\n");

  InputScript script;
  ASSERT_TRUE(script.loadFromToml(path.string().c_str()));
  EXPECT_TRUE(script.advance(10).start);
  EXPECT_FALSE(script.advance(11).start);
  EXPECT_FALSE(script.advance(1).start);
  EXPECT_FALSE(script.intent().movingLeft);
  EXPECT_TRUE(script.advance(3).start);
}

TEST(InputScriptTest, IncludeMergesKeyframes) {
  const auto dir = nutfall::test::scratchDir("script_include");
  nutfall::test::writeFile(dir / "base.toml", "keyframes = [ { frame = 1, start = true } ]\n");
  nutfall::test::writeFile(dir / "top.toml",
                           "include = \"base.toml\"\nkeyframes = [ { frame = 2, jump = true } ]\n");

  InputScript script;
  ASSERT_TRUE(script.loadFromToml((dir / "top.toml").string().c_str()));
  EXPECT_EQ(script.keyframeCount(), 2U);
  EXPECT_TRUE(script.advance(1).start);
  script.advance(2);
  EXPECT_TRUE(script.intent().tryingToJump);
}

TEST(InputScriptTest, IncludeCycleWarnsAndStops) {
  const auto dir = nutfall::test::scratchDir("script_cycle");
  nutfall::test::writeFile(dir / "a.toml",
                           "include = \"b.toml\"\nkeyframes = [ { frame = 1, left = true } ]\n");
  nutfall::test::writeFile(dir / "b.toml",
                           "include = \"a.toml\"\nkeyframes = [ { frame = 2, right = true } ]\n");

  TomlUtil::resetWarningCount();
  InputScript script;
  ASSERT_TRUE(script.loadFromToml((dir / "a.toml").string().c_str()));
  EXPECT_EQ(TomlUtil::warningCount(), 1);
  EXPECT_EQ(script.keyframeCount(), 2U);
}

TEST(InputScriptTest, MissingFileFailsToLoad) {
  const auto dir = nutfall::test::scratchDir("script_missing");
  InputScript script;
  EXPECT_FALSE(script.loadFromToml((dir / "absent.toml").string().c_str()));
  EXPECT_FALSE(script.loaded());
  EXPECT_FALSE(script.advance(100).start);
}

TEST(InputScriptTest, ShippedScriptsLoadCleanly) {
  const std::string dir = std::string(NUTFALL_TEST_DATA_DIR) + "/scripts/";
  TomlUtil::resetWarningCount();

  InputScript smoke;
  ASSERT_TRUE(smoke.loadFromToml((dir + "smoke.toml").c_str()));
  InputScript walk;
  ASSERT_TRUE(walk.loadFromToml((dir + "walk_left.toml").c_str()));
  EXPECT_EQ(walk.keyframeCount(), smoke.keyframeCount() + 1);
  EXPECT_EQ(TomlUtil::warningCount(), 0);
}

}  // namespace
