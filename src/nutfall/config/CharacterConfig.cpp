#include "nutfall/config/CharacterConfig.h"

#include <algorithm>
#include <cstdio>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace nutfall {

namespace {

constexpr const char* kFallbackId = "pistachio";

void readColor(const char* path, const toml::table& render, const char* key, Color& inOut) {
  const toml::node* node = render.get(key);
  if (!node)
    return;

  const auto s = node->value<std::string>();
  const auto rgb = s ? TomlUtil::parseHexRgb(*s) : std::nullopt;
  if (!rgb) {
    TomlUtil::warnf(path, "render.{} must be a hex string like \"RRGGBB\"", key);
    return;
  }
  inOut = Color{(*rgb)[0], (*rgb)[1], (*rgb)[2], 255};
}

void readBox(const char* path,
             const toml::table& hitbox,
             const char* key,
             CharacterConfig::Box& inOut) {
  const toml::table* box = hitbox[key].as_table();
  if (!box)
    return;

  const std::string scope = std::string("hitbox.") + key;
  TomlUtil::warnUnknownKeys(*box, path, scope, {"w", "h"});
  if (auto v = box->get("w"))
    inOut.w = v->value_or(inOut.w);
  if (auto v = box->get("h"))
    inOut.h = v->value_or(inOut.h);

  if (inOut.w <= 0.0F || inOut.h <= 0.0F) {
    TomlUtil::warnf(path, "{} must have positive w and h", scope);
    inOut.w = std::max(1.0F, inOut.w);
    inOut.h = std::max(1.0F, inOut.h);
  }
}

}  // namespace

bool CharacterConfig::loadFromToml(const char* path) {
  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    std::printf("CharacterConfig: parse error in %s: %s\n", path, err.what());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path, "root",
                            {"version", "character", "hitbox", "starting_stats", "render"});

  CharacterConfig next{};

  if (auto v = tbl["version"].value<int>())
    next.version = *v;

  if (auto c = tbl["character"].as_table()) {
    TomlUtil::warnUnknownKeys(*c, path, "character", {"id", "display", "description"});
    if (auto v = c->get("id"))
      next.id = v->value_or(next.id);
    if (auto v = c->get("display"))
      next.displayName = v->value_or(next.displayName);
    if (auto v = c->get("description"))
      next.description = v->value_or(next.description);
  }
  if (next.id.empty()) {
    TomlUtil::warnf(path, "character.id is required");
    return false;
  }
  if (next.displayName.empty())
    next.displayName = next.id;

  if (auto h = tbl["hitbox"].as_table()) {
    TomlUtil::warnUnknownKeys(*h, path, "hitbox", {"shelled", "naked"});
    readBox(path, *h, "shelled", next.hitbox.shelled);
    readBox(path, *h, "naked", next.hitbox.naked);
  }
  if (next.hitbox.naked.w > next.hitbox.shelled.w ||
      next.hitbox.naked.h > next.hitbox.shelled.h) {
    TomlUtil::warnf(path, "hitbox.naked must fit inside hitbox.shelled; clamping");
    next.hitbox.naked.w = std::min(next.hitbox.naked.w, next.hitbox.shelled.w);
    next.hitbox.naked.h = std::min(next.hitbox.naked.h, next.hitbox.shelled.h);
  }

  if (auto s = tbl["starting_stats"].as_table()) {
    TomlUtil::warnUnknownKeys(*s, path, "starting_stats",
                              {"max_health", "max_speed", "extra_lives", "block_chance",
                               "bonus_heal", "golden_touch_chance"});
    StartingStats& st = next.startingStats;
    if (auto v = s->get("max_health"))
      st.maxHealth = v->value_or(st.maxHealth);
    if (auto v = s->get("max_speed"))
      st.maxSpeed = v->value_or(st.maxSpeed);
    if (auto v = s->get("extra_lives"))
      st.extraLives = v->value_or(st.extraLives);
    if (auto v = s->get("block_chance"))
      st.blockChance = v->value_or(st.blockChance);
    if (auto v = s->get("bonus_heal"))
      st.bonusHeal = v->value_or(st.bonusHeal);
    if (auto v = s->get("golden_touch_chance"))
      st.goldenTouchChance = v->value_or(st.goldenTouchChance);

    if (st.blockChance < 0.0F || st.blockChance > kBlockChanceCap) {
      TomlUtil::warnf(path, "starting_stats.block_chance must be in [0, {}]", kBlockChanceCap);
      st.blockChance = std::clamp(st.blockChance, 0.0F, kBlockChanceCap);
    }
    if (kInitialMaxHealth + st.maxHealth < 1.0F) {
      TomlUtil::warnf(path, "starting_stats.max_health must be at least {}",
                      1.0F - kInitialMaxHealth);
      st.maxHealth = 1.0F - kInitialMaxHealth;
    }
    if (kMaxPlayerSpeed + st.maxSpeed < 0.0F) {
      TomlUtil::warnf(path, "starting_stats.max_speed must be at least {}", -kMaxPlayerSpeed);
      st.maxSpeed = -kMaxPlayerSpeed;
    }
    st.extraLives = std::max(0, st.extraLives);
    st.bonusHeal = std::max(0.0F, st.bonusHeal);
    st.goldenTouchChance = std::clamp(st.goldenTouchChance, 0.0F, 1.0F);
  }

  if (auto r = tbl["render"].as_table()) {
    TomlUtil::warnUnknownKeys(*r, path, "render",
                              {"seed", "shell_left", "shell_right", "shell_color",
                               "kernel_color"});
    if (auto v = r->get("seed"))
      next.render.seed = static_cast<std::uint32_t>(v->value_or(0));
    if (auto v = r->get("shell_left"))
      next.render.shellLeft = v->value_or(next.render.shellLeft);
    if (auto v = r->get("shell_right"))
      next.render.shellRight = v->value_or(next.render.shellRight);
    readColor(path, *r, "shell_color", next.render.shell);
    readColor(path, *r, "kernel_color", next.render.kernel);
  }

  *this = std::move(next);
  return true;
}

PlayerStats CharacterConfig::initialStats() const {
  PlayerStats s{};
  s.maxHealth = kInitialMaxHealth + startingStats.maxHealth;
  s.maxSpeed = kMaxPlayerSpeed + startingStats.maxSpeed;
  s.extraLives = startingStats.extraLives;
  s.blockChance = startingStats.blockChance;
  s.bonusHeal = startingStats.bonusHeal;
  s.waterSpawnIntervalMs = kInitialWaterSpawnIntervalMs;
  s.photosynthesisLevel = 0;
  s.goldenTouchChance = startingStats.goldenTouchChance;
  return s;
}

CharacterConfig makePistachio() {
  CharacterConfig c{};
  c.id = "pistachio";
  c.displayName = "Pistachio";
  c.description = "The original nut. Balanced and classic.";
  c.render.seed = 1;
  return c;
}

CharacterConfig makeWalnut() {
  CharacterConfig c{};
  c.id = "walnut";
  c.displayName = "Walnut";
  c.description = "A tough nut to crack. Starts with extra shell fortification.";
  c.hitbox.shelled.w = kPlayerWidth * 1.1F;
  c.hitbox.naked.w = kNakedPlayerWidth * 1.1F;
  c.startingStats.maxHealth = 5.0F;
  c.render.seed = 2;
  c.render.shell = Color{120, 84, 50, 255};
  c.render.kernel = Color{214, 190, 140, 255};
  return c;
}

void CharacterRegistry::registerBuiltins() {
  for (CharacterConfig c : {makePistachio(), makeWalnut()}) {
    const std::string id = c.id;
    if (!cache_.contains(id))
      order_.push_back(id);
    cache_[id] = std::move(c);
  }
}

bool CharacterRegistry::load(const char* path) {
  if (cache_.empty())
    registerBuiltins();

  CharacterConfig cfg;
  if (!cfg.loadFromToml(path)) {
    std::printf("CharacterRegistry: skipped %s\n", path);
    return false;
  }
  const std::string id = cfg.id;
  if (!cache_.contains(id))
    order_.push_back(id);
  cache_[id] = std::move(cfg);
  return true;
}

const CharacterConfig* CharacterRegistry::find(const std::string& id) {
  if (cache_.empty())
    registerBuiltins();
  auto it = cache_.find(id);
  return (it != cache_.end()) ? &it->second : nullptr;
}

const CharacterConfig& CharacterRegistry::get(const std::string& id) {
  if (const CharacterConfig* c = find(id))
    return *c;
  return *find(kFallbackId);
}

std::vector<std::string> CharacterRegistry::ids() {
  if (cache_.empty())
    registerBuiltins();
  return order_;
}

void CharacterRegistry::clear() {
  cache_.clear();
  order_.clear();
}

}  // namespace nutfall
