#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstdint>
#include <string>
#include <vector>

#include "core/DebugUI.h"
#include "core/Input.h"
#include "core/InputScript.h"
#include "core/SoundLog.h"
#include "core/SpriteCache.h"
#include "nutfall/controller/Simulation.h"
#include "nutfall/render/SceneRenderer.h"
#include "nutfall/score/HighScores.h"

// Host frame step. dt is wall time (or the fixed script step) before the
// debug time scale is applied.
struct TimeStep {
  float dt = 0.0F;  // seconds
  uint64_t frame = 0;
};

struct AppConfig {
  int maxFrames = -1;
  int width = 0;  // 0 = from prefs
  int height = 0;
  const char* characterId = nullptr;
  const char* charactersDir = "data/characters";
  const char* inputScriptTomlPath = nullptr;
  bool hasSeed = false;
  uint32_t seed = 0;
  int startYear = -1;  // debug start when >= 0
  int startMonth = 0;
  bool noPrefs = false;
  bool noUi = false;
  bool logSounds = false;
};

class App {
 public:
  bool init(const AppConfig& cfg, const char* argv0);
  void run();
  void shutdown();

 private:
  enum class Overlay : uint8_t { None, Characters, HighScores };

  void loadCharacters(const char* dir);
  void handleEvent(const SDL_Event& e);
  void handleCommands(const AppCommands& cmds);
  void handleScriptActions(const ScriptActions& actions);
  void handleNameEntryEvent(const SDL_Event& e);
  void tick(TimeStep ts);
  void render();
  void renderDebugUi();
  void updateViewport();

  void startRun();
  void pickSkill(int slot);
  void submitName(bool record);
  void setNameEntryActive(bool active);
  void selectCharacter(const std::string& id);
  void savePrefs();

  SDL_Window* window_ = nullptr;
  SDL_Renderer* renderer_ = nullptr;
  bool running_ = true;
  const char* argv0_ = nullptr;
  AppConfig cfg_{};

  bool debugOverlay_ = false;
  bool panelsOpen_ = false;
  bool uiEnabled_ = true;
  bool prefsEnabled_ = true;
  bool simPaused_ = false;
  int pendingSimSteps_ = 0;
  float timeScale_ = 1.0F;
  float renderScale_ = 1.0F;

  // Simulation clock; advances with scaled frame time and stops while paused.
  double simClockMs_ = 0.0;
  uint64_t lastTicksNs_ = 0;
  TimeStep lastTs_{};
  uint64_t simFrame_ = 0;

  Overlay overlay_ = Overlay::None;
  int menuIndex_ = 0;
  int highlightRank_ = -1;
  std::vector<std::string> characterIds_;
  std::string nameBuffer_;
  bool nameEntryActive_ = false;
  std::string playerName_;
  std::string highScoresPath_;

  Input input_;
  InputScript inputScript_;
  bool inputScriptEnabled_ = false;
  DebugUI debugUi_;
  SpriteCache sprites_;
  SoundLog sound_;
  nutfall::Simulation sim_;
  nutfall::SceneRenderer scene_;
  nutfall::HighScoreTable highScores_;
};
