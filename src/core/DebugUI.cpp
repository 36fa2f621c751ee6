#include "core/DebugUI.h"

#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>

#include <algorithm>
#include <cstdio>

#include "nutfall/components/NutfallComponents.h"
#include "nutfall/config/SkillCatalog.h"
#include "nutfall/controller/Simulation.h"
#include "nutfall/systems/Spawning.h"

namespace {

ImVec4 toImVec4(nutfall::Color c) {
  return ImVec4(static_cast<float>(c.r) / 255.0F, static_cast<float>(c.g) / 255.0F,
                static_cast<float>(c.b) / 255.0F, static_cast<float>(c.a) / 255.0F);
}

void drawSimulationContents(const nutfall::Simulation& sim) {
  using namespace nutfall;

  const PlayerState& p = sim.player();
  const PlayerStats& s = sim.stats();
  const Timeline& t = sim.timeline();
  const EventState& e = sim.events();

  ImGui::PushTextWrapPos(0.0F);
  ImGui::TextWrapped("status: %s  character: %s", gameStatusName(sim.status()),
                     sim.character().id.c_str());
  ImGui::TextWrapped("month %d (year %d, %s)  t=%.1f/%.0f  difficulty=%d", t.monthCounter,
                     t.year(), seasonName(t.season()), t.timeInMonth, kMonthSeconds,
                     t.difficultyLevel);
  ImGui::TextWrapped("event: %s  wind: %d", weatherEventName(e.current), static_cast<int>(e.wind));
  if (!e.incomingTitle.empty())
    ImGui::TextWrapped("incoming: %s", e.incomingTitle.c_str());

  ImGui::Separator();
  ImGui::TextWrapped("pos: (%.1f, %.1f)  vel: (%.1f, %.1f)  grounded=%d", p.x, p.y, p.xVelocity,
                     p.yVelocity, p.grounded() ? 1 : 0);
  ImGui::TextWrapped("health: %.1f / %.1f  naked=%d  slow=%.2f", p.health, s.maxHealth,
                     p.isNaked ? 1 : 0, sim.statusEffects().slowTimer);
  ImGui::TextWrapped("speed=%.0f  lives=%d  block=%.2f  bonus_heal=%.1f", s.maxSpeed, s.extraLives,
                     s.blockChance, s.bonusHeal);
  ImGui::TextWrapped("water_interval=%.0fms  photosynthesis=%d  golden=%.2f",
                     s.waterSpawnIntervalMs, s.photosynthesisLevel, s.goldenTouchChance);

  const float w = sim.gameWidth();
  ImGui::TextWrapped("spawn: hazard every %.0fms (x%.2f speed)  resource every %.0fms",
                     NutfallSystems::hazardSpawnIntervalMs(t.monthCounter, w, e.current),
                     NutfallSystems::hazardSpeedMultiplier(t.monthCounter),
                     NutfallSystems::resourceSpawnIntervalMs(s.waterSpawnIntervalMs, w, e.current));
  ImGui::TextWrapped("score: %.1f  rocks: %d  flash: %.2f", sim.score(), sim.rocksDestroyed(),
                     sim.screenFlash());
  ImGui::PopTextWrapPos();

  if (!sim.acquiredSkills().empty()) {
    ImGui::Separator();
    ImGui::TextUnformatted("Skills:");
    for (const AcquiredSkill& a : sim.acquiredSkills()) {
      const Skill& info = SkillCatalog::info(a.id);
      ImGui::TextColored(toImVec4(info.color), "%.*s x%d", static_cast<int>(info.title.size()),
                         info.title.data(), a.count);
    }
  }
}

}  // namespace

bool DebugUI::init(SDL_Window* window, SDL_Renderer* renderer, const std::string& prefsDir) {
  if (initialized_)
    return true;

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGui::StyleColorsDark();

  ImGuiIO& io = ImGui::GetIO();
  iniPath_.clear();
  if (!prefsDir.empty()) {
    iniPath_ = prefsDir + "imgui.ini";
    io.IniFilename = iniPath_.c_str();  // persist layout outside the repo
  } else {
    io.IniFilename = nullptr;
  }
  io.LogFilename = nullptr;

  if (!ImGui_ImplSDL3_InitForSDLRenderer(window, renderer)) {
    ImGui::DestroyContext();
    return false;
  }

  if (!ImGui_ImplSDLRenderer3_Init(renderer)) {
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    return false;
  }

  initialized_ = true;
  return true;
}

void DebugUI::shutdown() {
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_Shutdown();
  ImGui_ImplSDL3_Shutdown();
  ImGui::DestroyContext();
  initialized_ = false;
}

void DebugUI::processEvent(const SDL_Event& e) {
  if (!initialized_)
    return;
  (void)ImGui_ImplSDL3_ProcessEvent(&e);
}

void DebugUI::beginFrame() {
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_NewFrame();
  ImGui_ImplSDL3_NewFrame();
  ImGui::NewFrame();
}

void DebugUI::endFrame(SDL_Renderer* renderer) {
  if (!initialized_)
    return;
  ImGui::Render();
  ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
}

bool DebugUI::wantCaptureKeyboard() const {
  if (!initialized_)
    return false;
  return ImGui::GetIO().WantCaptureKeyboard;
}

bool DebugUI::wantCaptureMouse() const {
  if (!initialized_)
    return false;
  return ImGui::GetIO().WantCaptureMouse;
}

void DebugUI::drawOverlay(const DebugUIOverlayModel& model) {
  if (!initialized_)
    return;

  ImGui::SetNextWindowPos(ImVec2(16.0F, 200.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowBgAlpha(0.75F);

  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                                 ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav;

  if (ImGui::Begin("Overlay", nullptr, flags)) {
    ImGui::Text("frame: %llu  dt: %.5f  status: %s", static_cast<unsigned long long>(model.frame),
                model.dt, model.status);
    ImGui::Text("elements=%d particles=%d floaters=%d", model.elements, model.particles,
                model.floaters);
    ImGui::Text("strikes=%d patches=%d clouds=%d", model.strikes, model.patches, model.clouds);
    ImGui::TextUnformatted("overlay: F1  ui: Ctrl-H  quit: Ctrl-C");
  }
  ImGui::End();
}

// NOLINTNEXTLINE
DebugUIActions DebugUI::drawInspector(const DebugUIInspectorModel& model) {
  DebugUIActions out{};
  if (!initialized_)
    return out;

  ImGui::SetNextWindowPos(ImVec2(16.0F, 16.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(380.0F, 520.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowBgAlpha(0.90F);

  if (!ImGui::Begin("Nutfall")) {
    ImGui::End();
    return out;
  }

  if (ImGui::CollapsingHeader("Simulation", ImGuiTreeNodeFlags_DefaultOpen)) {
    bool paused = model.simPaused;
    if (ImGui::Checkbox("Paused", &paused)) {
      out.setSimPaused = true;
      out.simPaused = paused;
    }
    ImGui::SameLine();
    if (!model.simPaused)
      ImGui::BeginDisabled();
    if (ImGui::Button("Step"))
      out.stepFrames = 1;
    ImGui::SameLine();
    if (ImGui::Button("Step x10"))
      out.stepFrames = 10;
    if (!model.simPaused)
      ImGui::EndDisabled();

    float timeScale = model.timeScale;
    if (ImGui::SliderFloat("Time scale", &timeScale, 0.1F, 2.0F, "%.2f")) {
      out.setTimeScale = true;
      out.timeScale = timeScale;
    }
  }

  if (ImGui::CollapsingHeader("Debug start", ImGuiTreeNodeFlags_DefaultOpen)) {
    ImGui::InputInt("Year", &debugYear_);
    ImGui::InputInt("Month", &debugMonth_);
    debugYear_ = std::clamp(debugYear_, 0, 99);
    debugMonth_ = std::clamp(debugMonth_, 0, 11);
    ImGui::TextDisabled("starts at month %d", (debugYear_ * 12) + debugMonth_ + 1);
    if (ImGui::Button("Start here")) {
      out.debugStart = true;
      out.debugYear = debugYear_;
      out.debugMonth = debugMonth_;
    }
  }

  if (model.characterIds && ImGui::CollapsingHeader("Character")) {
    for (const std::string& id : *model.characterIds) {
      const bool selected = id == model.characterId;
      if (ImGui::Selectable(id.c_str(), selected) && !selected) {
        out.selectCharacter = true;
        out.characterId = id;
      }
    }
  }

  if (model.sim && ImGui::CollapsingHeader("State", ImGuiTreeNodeFlags_DefaultOpen)) {
    drawSimulationContents(*model.sim);
  }

  if (ImGui::CollapsingHeader("Settings")) {
    int deadzone = model.gamepadDeadzone;
    if (ImGui::SliderInt("Gamepad deadzone", &deadzone, 0, 32767)) {
      out.setGamepadDeadzone = true;
      out.gamepadDeadzone = deadzone;
    }
    if (ImGui::Button("Reset layout and prefs"))
      out.resetLayoutAndPrefs = true;
    ImGui::SameLine();
    if (ImGui::Button("Quit"))
      out.quit = true;
  }

  if (!model.legend.empty() && ImGui::CollapsingHeader("Controls")) {
    for (const std::string& line : model.legend) {
      ImGui::TextUnformatted(line.c_str());
    }
  }

  ImGui::End();
  return out;
}
