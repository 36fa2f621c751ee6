#pragma once

#include <SDL3/SDL_render.h>

#include <span>
#include <string>
#include <vector>

#include "nutfall/controller/Simulation.h"
#include "nutfall/score/HighScores.h"

class SpriteCache;

namespace nutfall {

// Host-side overlays drawn on top of the playfield.
struct ScreenModel {
  enum class Overlay { None, Characters, HighScores };

  Overlay overlay = Overlay::None;
  int menuIndex = 0;  // characters list or level-up offer
  std::span<const std::string> characterIds;
  const HighScoreTable* highScores = nullptr;
  int highlightRank = -1;
  std::string nameBuffer;
  bool assetsReady = true;
};

// Flat-shaded view of a Simulation in logical playfield units. The caller
// sets the render scale so kGameHeight fills the window.
class SceneRenderer {
 public:
  void init(SDL_Renderer* renderer, SpriteCache* sprites);

  void render(const Simulation& sim, const ScreenModel& screen, double nowMs);

 private:
  void renderSky(const Simulation& sim);
  void renderClouds(const Simulation& sim, Vec2 shake);
  void renderGround(const Simulation& sim, Vec2 shake);
  void renderLightning(const Simulation& sim, Vec2 shake, double nowMs);
  void renderElements(const Simulation& sim, Vec2 shake);
  void renderPlayer(const Simulation& sim, Vec2 shake);
  void renderShellBreak(const Simulation& sim, Vec2 shake);
  void renderParticles(const Simulation& sim, Vec2 shake);
  void renderFloaters(const Simulation& sim, Vec2 shake);
  void renderHud(const Simulation& sim);
  void renderFlash(const Simulation& sim);

  void renderStartScreen(const Simulation& sim, const ScreenModel& screen);
  void renderLevelUp(const Simulation& sim, const ScreenModel& screen);
  void renderNameEntry(const Simulation& sim, const ScreenModel& screen);
  void renderCharacterList(const Simulation& sim, const ScreenModel& screen);
  void renderHighScores(const Simulation& sim, const ScreenModel& screen);

  void fillRect(float x, float y, float w, float h, Color c);
  void text(float x, float y, const std::string& s, Color c);
  void centeredText(float y, const std::string& s, Color c, float width);
  void dimBackground(float width, Uint8 alpha);

  SDL_Renderer* renderer_ = nullptr;
  SpriteCache* sprites_ = nullptr;
};

}  // namespace nutfall
