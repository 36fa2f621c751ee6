#include "core/App.h"

#include <SDL3/SDL.h>

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <span>
#include <utility>

#include "core/Prefs.h"
#include "nutfall/config/CharacterConfig.h"
#include "util/Paths.h"

namespace {

constexpr double kScriptFrameMs = 1000.0 / 60.0;
constexpr float kMaxRealDeltaSeconds = 0.25F;
constexpr std::size_t kMaxNameLength = 16;

std::string trimmed(const std::string& s) {
  const auto first = s.find_first_not_of(" \t");
  if (first == std::string::npos)
    return {};
  const auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

void popUtf8(std::string& s) {
  while (!s.empty()) {
    const auto c = static_cast<unsigned char>(s.back());
    s.pop_back();
    if ((c & 0xC0U) != 0x80U)
      break;
  }
}

}  // namespace

bool App::init(const AppConfig& cfg, const char* argv0) {
  cfg_ = cfg;
  argv0_ = argv0;
  prefsEnabled_ = !cfg.noPrefs;
  uiEnabled_ = !cfg.noUi;

  SessionPrefs prefs{};
  if (prefsEnabled_)
    (void)loadSessionPrefs(prefs);

  const int width = cfg.width > 0 ? cfg.width : prefs.windowWidth;
  const int height = cfg.height > 0 ? cfg.height : prefs.windowHeight;

  if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMEPAD)) {
    std::printf("SDL_Init failed: %s\n", SDL_GetError());
    return false;
  }

  window_ = SDL_CreateWindow("nutfall", width, height, SDL_WINDOW_RESIZABLE);
  if (!window_) {
    std::printf("SDL_CreateWindow failed: %s\n", SDL_GetError());
    return false;
  }

  renderer_ = SDL_CreateRenderer(window_, nullptr);
  if (!renderer_) {
    std::printf("SDL_CreateRenderer failed: %s\n", SDL_GetError());
    return false;
  }
  SDL_SetRenderVSync(renderer_, 1);

  loadCharacters(cfg.charactersDir);

  const uint32_t seed = cfg.hasSeed ? cfg.seed : static_cast<uint32_t>(SDL_GetTicksNS());
  sim_.reseed(seed);
  std::printf("nutfall: seed=%u\n", seed);

  sim_.selectCharacter(cfg.characterId ? cfg.characterId : prefs.characterId);
  playerName_ = prefs.playerName;
  panelsOpen_ = prefs.panelsOpen;
  timeScale_ = prefs.timeScale;

  input_.init();
  input_.setGamepadDeadzone(prefs.gamepadDeadzone);

  sound_.setEcho(cfg.logSounds);

  sprites_.init(renderer_, argv0_);
  sim_.setAssetProvider(&sprites_);
  sprites_.preload(characterIds_);
  scene_.init(renderer_, &sprites_);

  if (prefsEnabled_) {
    highScoresPath_ = highScoresFilePath();
    if (!highScoresPath_.empty() && !highScores_.load(highScoresPath_))
      std::printf("HighScores: keeping an empty table\n");
  }

  if (uiEnabled_) {
    if (!debugUi_.init(window_, renderer_, prefsEnabled_ ? prefsDirPath() : std::string{})) {
      std::printf("DebugUI: init failed, continuing without panels\n");
      uiEnabled_ = false;
    }
  }

  if (cfg.inputScriptTomlPath) {
    const std::string path = Paths::resolveAssetPath(cfg.inputScriptTomlPath, argv0_);
    if (!inputScript_.loadFromToml(path.c_str())) {
      std::printf("InputScript: failed to load %s\n", path.c_str());
      return false;
    }
    inputScriptEnabled_ = true;
    std::printf("InputScript: %zu keyframe(s) from %s\n", inputScript_.keyframeCount(),
                inputScript_.path().c_str());
  }

  updateViewport();
  lastTicksNs_ = SDL_GetTicksNS();

  if (cfg.startYear >= 0) {
    if (!sim_.startDebugGame(cfg.startYear, cfg.startMonth, simClockMs_))
      std::printf("nutfall: debug start refused, assets not ready\n");
  }

  return true;
}

void App::loadCharacters(const char* dir) {
  nutfall::CharacterRegistry::registerBuiltins();
  if (dir) {
    const std::string resolved = Paths::resolveAssetPath(dir, argv0_);
    for (const std::string& file : Paths::listTomlFiles(resolved)) {
      (void)nutfall::CharacterRegistry::load(file.c_str());
    }
  }
  characterIds_ = nutfall::CharacterRegistry::ids();
}

void App::run() {
  while (running_) {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
      handleEvent(e);
    }
    handleCommands(input_.consumeCommands());

    const uint64_t now = SDL_GetTicksNS();
    float dt = static_cast<float>(static_cast<double>(now - lastTicksNs_) / 1.0e9);
    lastTicksNs_ = now;
    dt = std::clamp(dt, 0.0F, kMaxRealDeltaSeconds);
    if (inputScriptEnabled_)
      dt = static_cast<float>(kScriptFrameMs / 1000.0);

    tick(TimeStep{dt, simFrame_});
    render();

    if (cfg_.maxFrames > 0 && simFrame_ >= static_cast<uint64_t>(cfg_.maxFrames))
      running_ = false;
  }

  const nutfall::HudSnapshot hud = sim_.hud();
  std::printf("nutfall: frames=%llu status=%s score=%d month=%d health=%.1f\n",
              static_cast<unsigned long long>(simFrame_), nutfall::gameStatusName(sim_.status()),
              hud.score, sim_.timeline().monthCounter, static_cast<double>(hud.health));
  if (cfg_.logSounds)
    sound_.printSummary();
}

void App::shutdown() {
  savePrefs();
  setNameEntryActive(false);

  debugUi_.shutdown();
  sprites_.shutdown();
  input_.shutdown();

  if (renderer_) {
    SDL_DestroyRenderer(renderer_);
    renderer_ = nullptr;
  }
  if (window_) {
    SDL_DestroyWindow(window_);
    window_ = nullptr;
  }

  SDL_Quit();
}

void App::handleEvent(const SDL_Event& e) {
  if (uiEnabled_)
    debugUi_.processEvent(e);

  if (e.type == SDL_EVENT_QUIT) {
    running_ = false;
    return;
  }
  if (e.type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED || e.type == SDL_EVENT_WINDOW_RESIZED) {
    updateViewport();
    return;
  }

  const bool keyEvent = e.type == SDL_EVENT_KEY_DOWN || e.type == SDL_EVENT_KEY_UP;
  if (keyEvent && uiEnabled_ && debugUi_.wantCaptureKeyboard())
    return;

  if (nameEntryActive_)
    handleNameEntryEvent(e);

  // Tap or click anywhere starts a run from the title screen.
  const bool pointerDown = e.type == SDL_EVENT_FINGER_DOWN || e.type == SDL_EVENT_MOUSE_BUTTON_DOWN;
  if (pointerDown && overlay_ == Overlay::None && sim_.status() == nutfall::GameStatus::Start &&
      !(uiEnabled_ && debugUi_.wantCaptureMouse())) {
    startRun();
  }

  input_.handleEvent(e);
}

void App::handleNameEntryEvent(const SDL_Event& e) {
  if (e.type == SDL_EVENT_TEXT_INPUT && e.text.text) {
    const std::string typed(e.text.text);
    if (nameBuffer_.size() + typed.size() <= kMaxNameLength)
      nameBuffer_ += typed;
    return;
  }
  if (e.type == SDL_EVENT_KEY_DOWN && e.key.scancode == SDL_SCANCODE_BACKSPACE)
    popUtf8(nameBuffer_);
}

// NOLINTNEXTLINE
void App::handleCommands(const AppCommands& cmds) {
  if (cmds.quit) {
    running_ = false;
    return;
  }
  if (cmds.togglePanels)
    panelsOpen_ = !panelsOpen_;
  if (cmds.toggleDebugOverlay)
    debugOverlay_ = !debugOverlay_;

  if (nameEntryActive_) {
    if (cmds.confirm)
      submitName(true);
    else if (cmds.back)
      submitName(false);
    return;
  }

  if (overlay_ == Overlay::Characters) {
    const int count = static_cast<int>(characterIds_.size());
    if (count > 0) {
      if (cmds.menuUp)
        menuIndex_ = (menuIndex_ + count - 1) % count;
      if (cmds.menuDown)
        menuIndex_ = (menuIndex_ + 1) % count;
    }
    if (cmds.confirm && menuIndex_ >= 0 && menuIndex_ < count) {
      selectCharacter(characterIds_[static_cast<std::size_t>(menuIndex_)]);
      overlay_ = Overlay::None;
    } else if (cmds.back || cmds.showCharacters) {
      overlay_ = Overlay::None;
    }
    return;
  }

  if (overlay_ == Overlay::HighScores) {
    if (cmds.confirm || cmds.back || cmds.showHighScores) {
      overlay_ = Overlay::None;
      highlightRank_ = -1;
    }
    return;
  }

  switch (sim_.status()) {
    case nutfall::GameStatus::Start:
      if (cmds.confirm) {
        startRun();
      } else if (cmds.showCharacters) {
        overlay_ = Overlay::Characters;
        const auto it = std::ranges::find(characterIds_, sim_.character().id);
        menuIndex_ = it == characterIds_.end()
                         ? 0
                         : static_cast<int>(std::distance(characterIds_.begin(), it));
      } else if (cmds.showHighScores) {
        overlay_ = Overlay::HighScores;
      }
      break;
    case nutfall::GameStatus::Playing:
      if (cmds.back)
        simPaused_ = !simPaused_;
      break;
    case nutfall::GameStatus::LevelUp: {
      const int count = static_cast<int>(sim_.offers().size());
      if (cmds.pickSlot >= 0) {
        pickSkill(cmds.pickSlot);
      } else if (count > 0) {
        if (cmds.menuLeft)
          menuIndex_ = (menuIndex_ + count - 1) % count;
        if (cmds.menuRight)
          menuIndex_ = (menuIndex_ + 1) % count;
        if (cmds.confirm)
          pickSkill(menuIndex_);
      }
      break;
    }
    case nutfall::GameStatus::EnteringName:
      break;
  }
}

void App::handleScriptActions(const ScriptActions& actions) {
  if (actions.start && sim_.status() == nutfall::GameStatus::Start)
    startRun();
  if (actions.pickSlot >= 0 && sim_.status() == nutfall::GameStatus::LevelUp)
    pickSkill(actions.pickSlot);
}

void App::tick(TimeStep ts) {
  lastTs_ = ts;

  if (simPaused_) {
    if (pendingSimSteps_ <= 0)
      return;
    --pendingSimSteps_;
    simClockMs_ += kScriptFrameMs;
  } else {
    simClockMs_ += static_cast<double>(ts.dt) * 1000.0 * static_cast<double>(timeScale_);
  }

  if (inputScriptEnabled_)
    handleScriptActions(inputScript_.advance(simFrame_));

  nutfall::IntentSource& source =
      inputScriptEnabled_ ? static_cast<nutfall::IntentSource&>(inputScript_) : input_;

  const nutfall::GameStatus before = sim_.status();
  sound_.setFrame(simFrame_);
  const nutfall::TickOutput out = sim_.tick(simClockMs_, source);
  for (nutfall::SoundCue cue : out.sounds) {
    sound_.play(cue);
  }
  ++simFrame_;

  if (out.leveledUp)
    menuIndex_ = 0;

  if (out.gameOver) {
    nameBuffer_ = inputScriptEnabled_ ? std::string("script") : playerName_;
    setNameEntryActive(true);
    if (inputScriptEnabled_)
      submitName(true);
  }

  const nutfall::GameStatus after = sim_.status();
  if (after != before)
    input_.resetGameInput();
  input_.setTouchEnabled(after == nutfall::GameStatus::Playing);
}

void App::startRun() {
  if (!sim_.startGame(simClockMs_)) {
    std::printf("nutfall: assets still loading\n");
    return;
  }
  overlay_ = Overlay::None;
  simPaused_ = false;
  input_.resetGameInput();
}

void App::pickSkill(int slot) {
  const std::span<const nutfall::SkillId> offers = sim_.offers();
  if (slot < 0 || slot >= static_cast<int>(offers.size()))
    return;
  if (sim_.selectSkill(offers[static_cast<std::size_t>(slot)], simClockMs_)) {
    menuIndex_ = 0;
    input_.resetGameInput();
  }
}

void App::submitName(bool record) {
  const std::string name = trimmed(nameBuffer_);
  highlightRank_ = -1;

  if (record) {
    nutfall::RunSummary run = sim_.lastRun();
    run.name = name;
    highlightRank_ = highScores_.add(std::move(run));
    if (!highScoresPath_.empty() && !highScores_.save(highScoresPath_))
      std::printf("HighScores: failed to save %s\n", highScoresPath_.c_str());
    if (!name.empty())
      playerName_ = name;
    overlay_ = Overlay::HighScores;
  }

  sim_.finishNameEntry(name);
  setNameEntryActive(false);
  nameBuffer_.clear();
}

void App::setNameEntryActive(bool active) {
  if (nameEntryActive_ == active)
    return;
  nameEntryActive_ = active;
  if (!window_)
    return;
  if (active)
    (void)SDL_StartTextInput(window_);
  else
    (void)SDL_StopTextInput(window_);
}

void App::selectCharacter(const std::string& id) {
  sim_.selectCharacter(id);
  savePrefs();
}

void App::savePrefs() {
  if (!prefsEnabled_ || !window_)
    return;

  SessionPrefs prefs{};
  prefs.characterId = sim_.character().id;
  prefs.playerName = playerName_;
  SDL_GetWindowSize(window_, &prefs.windowWidth, &prefs.windowHeight);
  prefs.panelsOpen = panelsOpen_;
  prefs.timeScale = timeScale_;
  prefs.gamepadDeadzone = input_.gamepadDeadzone();
  if (!saveSessionPrefs(prefs))
    std::printf("Prefs: failed to save session prefs\n");
}

void App::updateViewport() {
  if (!renderer_ || !window_)
    return;

  int outW = 0;
  int outH = 0;
  if (!SDL_GetRenderOutputSize(renderer_, &outW, &outH) || outW <= 0 || outH <= 0)
    return;

  // Height is fixed in playfield units; width follows the window aspect.
  renderScale_ = static_cast<float>(outH) / nutfall::kGameHeight;
  sim_.setDimensions(static_cast<float>(outW) / renderScale_, nutfall::kGameHeight);

  int winW = 0;
  int winH = 0;
  SDL_GetWindowSize(window_, &winW, &winH);
  input_.setViewportHeight(winH);
}

void App::render() {
  nutfall::ScreenModel screen{};
  switch (overlay_) {
    case Overlay::None:
      screen.overlay = nutfall::ScreenModel::Overlay::None;
      break;
    case Overlay::Characters:
      screen.overlay = nutfall::ScreenModel::Overlay::Characters;
      break;
    case Overlay::HighScores:
      screen.overlay = nutfall::ScreenModel::Overlay::HighScores;
      break;
  }
  screen.menuIndex = menuIndex_;
  screen.characterIds = characterIds_;
  screen.highScores = &highScores_;
  screen.highlightRank = highlightRank_;
  screen.nameBuffer = nameBuffer_;
  screen.assetsReady = sprites_.ready();

  SDL_SetRenderScale(renderer_, renderScale_, renderScale_);
  scene_.render(sim_, screen, simClockMs_);
  SDL_SetRenderScale(renderer_, 1.0F, 1.0F);

  if (uiEnabled_ && (panelsOpen_ || debugOverlay_)) {
    debugUi_.beginFrame();
    renderDebugUi();
    debugUi_.endFrame(renderer_);
  }

  SDL_RenderPresent(renderer_);
}

void App::renderDebugUi() {
  if (debugOverlay_) {
    entt::registry& reg = sim_.world().registry;
    DebugUIOverlayModel overlay{};
    overlay.frame = simFrame_;
    overlay.dt = lastTs_.dt;
    overlay.status = nutfall::gameStatusName(sim_.status());
    overlay.elements = static_cast<int>(reg.storage<nutfall::Element>().size());
    overlay.particles = static_cast<int>(reg.storage<nutfall::Particle>().size());
    overlay.floaters = static_cast<int>(reg.storage<nutfall::FloatingText>().size() +
                                        reg.storage<nutfall::FloatingScore>().size());
    overlay.strikes = static_cast<int>(reg.storage<nutfall::LightningStrike>().size());
    overlay.patches = static_cast<int>(reg.storage<nutfall::BurningPatch>().size());
    overlay.clouds = static_cast<int>(reg.storage<nutfall::Cloud>().size());
    debugUi_.drawOverlay(overlay);
  }

  if (!panelsOpen_)
    return;

  DebugUIInspectorModel model{};
  model.sim = &sim_;
  model.simPaused = simPaused_;
  model.timeScale = timeScale_;
  model.gamepadDeadzone = input_.gamepadDeadzone();
  model.characterId = sim_.character().id;
  model.characterIds = &characterIds_;
  input_.appendLegend(model.legend);

  const DebugUIActions actions = debugUi_.drawInspector(model);
  if (actions.quit)
    running_ = false;
  if (actions.setSimPaused)
    simPaused_ = actions.simPaused;
  if (actions.stepFrames > 0)
    pendingSimSteps_ += actions.stepFrames;
  if (actions.setTimeScale)
    timeScale_ = std::clamp(actions.timeScale, 0.1F, 2.0F);
  if (actions.setGamepadDeadzone)
    input_.setGamepadDeadzone(actions.gamepadDeadzone);
  if (actions.selectCharacter)
    selectCharacter(actions.characterId);
  if (actions.debugStart) {
    if (sim_.startDebugGame(actions.debugYear, actions.debugMonth, simClockMs_)) {
      overlay_ = Overlay::None;
      input_.resetGameInput();
    }
  }
  if (actions.resetLayoutAndPrefs) {
    if (!deleteSessionPrefs() || !deleteImGuiIni())
      std::printf("Prefs: failed to delete saved prefs\n");
  }
}
