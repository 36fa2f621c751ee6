#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "nutfall/Constants.h"
#include "nutfall/components/NutfallComponents.h"

namespace nutfall {

struct CharacterConfig {
  int version = 1;
  std::string id;
  std::string displayName;
  std::string description;

  struct Box {
    float w = kPlayerWidth;
    float h = kPlayerHeight;
  };

  // The naked box is used only while the shell is broken and sits centered
  // inside the shelled footprint.
  struct Hitbox {
    Box shelled{kPlayerWidth, kPlayerHeight};
    Box naked{kNakedPlayerWidth, kNakedPlayerHeight};
  } hitbox;

  // maxHealth and maxSpeed are added to the base values; the rest replace zero.
  struct StartingStats {
    float maxHealth = 0.0F;
    float maxSpeed = 0.0F;
    int extraLives = 0;
    float blockChance = 0.0F;
    float bonusHeal = 0.0F;
    float goldenTouchChance = 0.0F;
  } startingStats;

  struct Render {
    std::uint32_t seed = 0;
    std::string shellLeft;   // optional sprite for the left shell half
    std::string shellRight;  // optional sprite for the right shell half
    Color shell{196, 170, 110, 255};
    Color kernel{150, 190, 90, 255};
  } render;

  bool loadFromToml(const char* path);

  [[nodiscard]] PlayerStats initialStats() const;
};

CharacterConfig makePistachio();
CharacterConfig makeWalnut();

// Lookup table keyed by character id. Built-ins are always present; TOML files
// may override them or add new ids.
class CharacterRegistry {
 public:
  static void registerBuiltins();
  static bool load(const char* path);
  static const CharacterConfig* find(const std::string& id);
  // Unknown ids resolve to pistachio.
  static const CharacterConfig& get(const std::string& id);
  static std::vector<std::string> ids();
  static void clear();

 private:
  static inline std::unordered_map<std::string, CharacterConfig> cache_;
  static inline std::vector<std::string> order_;
};

}  // namespace nutfall
