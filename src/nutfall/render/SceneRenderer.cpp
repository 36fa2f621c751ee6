#include "nutfall/render/SceneRenderer.h"

#include <SDL3/SDL_blendmode.h>
#include <SDL3/SDL_rect.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <initializer_list>
#include <string_view>

#include "core/SpriteCache.h"
#include "nutfall/systems/Events.h"

namespace nutfall {

namespace {

constexpr float kCharSize = static_cast<float>(SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE);

constexpr Color kWhite{255, 255, 255, 255};
constexpr Color kMuted{200, 200, 210, 255};
constexpr Color kHighlight{255, 215, 0, 255};

Color skyColor(Season s, WeatherEvent e) {
  if (e == WeatherEvent::Storm || e == WeatherEvent::Thunderstorm)
    return Color{70, 80, 100, 255};
  switch (s) {
    case Season::Spring:
      return Color{135, 206, 235, 255};
    case Season::Summer:
      return Color{110, 190, 250, 255};
    case Season::Autumn:
      return Color{240, 190, 140, 255};
    case Season::Winter:
      return Color{190, 210, 225, 255};
  }
  return Color{135, 206, 235, 255};
}

Color groundColor(Season s) {
  switch (s) {
    case Season::Spring:
      return Color{96, 160, 70, 255};
    case Season::Summer:
      return Color{120, 150, 60, 255};
    case Season::Autumn:
      return Color{150, 110, 60, 255};
    case Season::Winter:
      return Color{235, 240, 245, 255};
  }
  return Color{96, 160, 70, 255};
}

Color elementColor(ElementType t) {
  switch (t) {
    case ElementType::Rock:
      return Color{110, 110, 115, 255};
    case ElementType::Meteor:
      return Color{230, 90, 30, 255};
    case ElementType::Water:
      return Color{60, 140, 230, 255};
    case ElementType::Snow:
      return Color{245, 250, 255, 255};
  }
  return kWhite;
}

Uint8 fade(float lifespan) {
  return static_cast<Uint8>(std::clamp(lifespan, 0.0F, 1.0F) * 255.0F);
}

}  // namespace

void SceneRenderer::init(SDL_Renderer* renderer, SpriteCache* sprites) {
  renderer_ = renderer;
  sprites_ = sprites;
}

void SceneRenderer::fillRect(float x, float y, float w, float h, Color c) {
  SDL_SetRenderDrawColor(renderer_, c.r, c.g, c.b, c.a);
  SDL_FRect rect{x, y, w, h};
  SDL_RenderFillRect(renderer_, &rect);
}

void SceneRenderer::text(float x, float y, const std::string& s, Color c) {
  SDL_SetRenderDrawColor(renderer_, c.r, c.g, c.b, c.a);
  SDL_RenderDebugText(renderer_, x, y, s.c_str());
}

void SceneRenderer::centeredText(float y, const std::string& s, Color c, float width) {
  const float w = static_cast<float>(s.size()) * kCharSize;
  text((width - w) * 0.5F, y, s, c);
}

void SceneRenderer::dimBackground(float width, Uint8 alpha) {
  fillRect(0.0F, 0.0F, width, kGameHeight, Color{0, 0, 0, alpha});
}

void SceneRenderer::render(const Simulation& sim, const ScreenModel& screen, double nowMs) {
  if (!renderer_)
    return;

  SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
  const Vec2 shake = sim.events().screenShake;

  renderSky(sim);
  renderClouds(sim, shake);
  renderGround(sim, shake);
  renderLightning(sim, shake, nowMs);
  renderElements(sim, shake);
  renderPlayer(sim, shake);
  renderShellBreak(sim, shake);
  renderParticles(sim, shake);
  renderFloaters(sim, shake);
  renderFlash(sim);

  if (screen.overlay == ScreenModel::Overlay::Characters) {
    renderCharacterList(sim, screen);
    return;
  }
  if (screen.overlay == ScreenModel::Overlay::HighScores) {
    renderHighScores(sim, screen);
    return;
  }

  switch (sim.status()) {
    case GameStatus::Start:
      renderStartScreen(sim, screen);
      break;
    case GameStatus::Playing:
      renderHud(sim);
      break;
    case GameStatus::LevelUp:
      renderHud(sim);
      renderLevelUp(sim, screen);
      break;
    case GameStatus::EnteringName:
      renderNameEntry(sim, screen);
      break;
  }
}

void SceneRenderer::renderSky(const Simulation& sim) {
  const Color sky = skyColor(sim.timeline().season(), sim.events().current);
  SDL_SetRenderDrawColor(renderer_, sky.r, sky.g, sky.b, 255);
  SDL_RenderClear(renderer_);
}

void SceneRenderer::renderClouds(const Simulation& sim, Vec2 shake) {
  auto view = sim.world().registry.view<const Cloud>();
  for (auto [e, c] : view.each()) {
    (void)e;
    const Color color = c.storm ? Color{60, 65, 80, 220} : Color{255, 255, 255, 200};
    fillRect(c.x + shake.x, c.y + shake.y, c.width, c.height, color);
    // Puff on top so clouds do not read as plain bars.
    fillRect(c.x + (c.width * 0.25F) + shake.x, c.y - (c.height * 0.4F) + shake.y,
             c.width * 0.5F, c.height * 0.5F, color);
  }
}

void SceneRenderer::renderGround(const Simulation& sim, Vec2 shake) {
  const float w = sim.gameWidth();
  fillRect(shake.x - 20.0F, kGroundLineY + shake.y, w + 40.0F, kGroundHeight + 20.0F,
           groundColor(sim.timeline().season()));

  auto patches = sim.world().registry.view<const BurningPatch>();
  for (auto [e, p] : patches.each()) {
    (void)e;
    const Uint8 a = fade(p.lifespan / kBurningPatchLifespan);
    fillRect(p.x + shake.x, kGroundLineY - 4.0F + shake.y, p.width, 8.0F, Color{249, 115, 22, a});
  }
}

void SceneRenderer::renderLightning(const Simulation& sim, Vec2 shake, double nowMs) {
  auto view = sim.world().registry.view<const LightningStrike>();
  for (auto [e, s] : view.each()) {
    (void)e;
    if (nowMs < s.strikeMs) {
      // Blink faster as the strike approaches.
      const double remaining = s.strikeMs - nowMs;
      const bool on = std::fmod(nowMs, remaining < 400.0 ? 100.0 : 250.0) < 60.0;
      const Uint8 a = on ? 110 : 50;
      fillRect(s.x + shake.x, shake.y, s.width, kGroundLineY, Color{255, 240, 120, a});
    } else {
      fillRect(s.x + shake.x, shake.y, s.width, kGroundLineY, Color{255, 255, 255, 240});
    }
  }
}

void SceneRenderer::renderElements(const Simulation& sim, Vec2 shake) {
  auto view = sim.world().registry.view<const Element>();
  for (auto [e, el] : view.each()) {
    (void)e;
    fillRect(el.x + shake.x, el.y + shake.y, el.size, el.size, elementColor(el.type));
    if (el.type == ElementType::Meteor) {
      fillRect(el.x + (el.size * 0.25F) + shake.x, el.y - (el.size * 0.8F) + shake.y,
               el.size * 0.5F, el.size * 0.8F, Color{255, 180, 60, 140});
    }
  }
}

void SceneRenderer::renderPlayer(const Simulation& sim, Vec2 shake) {
  const PlayerState& p = sim.player();
  const CharacterConfig& c = sim.character();
  const CharacterConfig::Box& shelled = c.hitbox.shelled;
  const CharacterConfig::Box& naked = c.hitbox.naked;

  float squash = 1.0F;
  if (sim.status() == GameStatus::Start)
    squash = 1.0F + (0.03F * std::sin(sim.breathingPhase() * 2.0F));

  const float h = shelled.h * squash;
  const float left = p.x + shake.x;
  const float top = kGameHeight - p.y - h + shake.y;

  // Kernel is always drawn; the shell covers it unless broken.
  const float kx = left + ((shelled.w - naked.w) * 0.5F);
  const float ky = kGameHeight - p.y - (naked.h * squash) + shake.y;
  fillRect(kx, ky, naked.w, naked.h * squash, c.render.kernel);

  const ShellReformAnim& reform = sim.shellReform();
  if (p.isNaked && !reform.active)
    return;

  Color shell = c.render.shell;
  if (reform.active)
    shell.a = static_cast<Uint8>(std::clamp(reform.progress, 0.0F, 1.0F) * 255.0F);

  SDL_Texture* leftTex = sprites_ ? sprites_->get(c.render.shellLeft) : nullptr;
  SDL_Texture* rightTex = sprites_ ? sprites_->get(c.render.shellRight) : nullptr;
  const float half = shelled.w * 0.5F;
  if (leftTex && rightTex) {
    SDL_SetTextureAlphaMod(leftTex, shell.a);
    SDL_SetTextureAlphaMod(rightTex, shell.a);
    SDL_FRect l{left, top, half, h};
    SDL_FRect r{left + half, top, half, h};
    SDL_RenderTexture(renderer_, leftTex, nullptr, &l);
    SDL_RenderTexture(renderer_, rightTex, nullptr, &r);
    return;
  }

  fillRect(left, top, half - 1.0F, h, shell);
  fillRect(left + half + 1.0F, top, half - 1.0F, h, shell);
}

void SceneRenderer::renderShellBreak(const Simulation& sim, Vec2 shake) {
  const ShellBreakAnim& brk = sim.shellBreak();
  if (!brk.active)
    return;

  const CharacterConfig::Box& shelled = sim.character().hitbox.shelled;
  Color shell = sim.character().render.shell;
  shell.a = fade(brk.lifespan / kShellBreakLifespan);

  const float w = shelled.w * 0.5F;
  for (const ShellPiece* piece : {&brk.left, &brk.right}) {
    fillRect(piece->pos.x - (w * 0.5F) + shake.x, piece->pos.y - (shelled.h * 0.5F) + shake.y, w,
             shelled.h, shell);
  }
}

void SceneRenderer::renderParticles(const Simulation& sim, Vec2 shake) {
  auto view = sim.world().registry.view<const Particle>();
  for (auto [e, p] : view.each()) {
    (void)e;
    Color c = p.color;
    c.a = static_cast<Uint8>(static_cast<float>(c.a) * std::clamp(p.lifespan, 0.0F, 1.0F));
    fillRect(p.pos.x - (p.size * 0.5F) + shake.x, p.pos.y - (p.size * 0.5F) + shake.y, p.size,
             p.size, c);
  }
}

void SceneRenderer::renderFloaters(const Simulation& sim, Vec2 shake) {
  auto texts = sim.world().registry.view<const FloatingText>();
  for (auto [e, t] : texts.each()) {
    (void)e;
    Color c = t.color;
    c.a = fade(t.lifespan);
    const float w = static_cast<float>(t.text.size()) * kCharSize;
    text(t.pos.x - (w * 0.5F) + shake.x, t.pos.y + shake.y, t.text, c);
  }

  auto scores = sim.world().registry.view<const FloatingScore>();
  for (auto [e, s] : scores.each()) {
    (void)e;
    Color c = s.golden ? Color{255, 215, 0, 255} : kWhite;
    c.a = fade(s.lifespan);
    const std::string label = std::format("+{}", s.amount);
    const float w = static_cast<float>(label.size()) * kCharSize;
    text(s.pos.x - (w * 0.5F) + shake.x, s.pos.y - 12.0F + shake.y, label, c);
  }
}

void SceneRenderer::renderFlash(const Simulation& sim) {
  if (sim.screenFlash() <= 0.0F)
    return;
  const Uint8 a = static_cast<Uint8>(std::clamp(sim.screenFlash(), 0.0F, 1.0F) * 255.0F);
  fillRect(0.0F, 0.0F, sim.gameWidth(), kGameHeight, Color{255, 255, 255, a});
}

void SceneRenderer::renderHud(const Simulation& sim) {
  const HudSnapshot hud = sim.hud();
  const Color dark{20, 20, 30, 255};

  text(10.0F, 10.0F, std::format("SCORE {}", hud.score), dark);
  text(10.0F, 24.0F,
       std::format("YEAR {}  MONTH {}  {}", hud.year, hud.monthOfYear, seasonName(hud.season)),
       dark);
  text(10.0F, 38.0F, std::format("TIME {:.0f}", std::ceil(hud.timeRemaining)), dark);

  // Health bar.
  const float barW = 200.0F;
  const float frac = hud.maxHealth > 0.0F ? std::clamp(hud.health / hud.maxHealth, 0.0F, 1.0F) : 0.0F;
  fillRect(10.0F, 54.0F, barW, 10.0F, Color{40, 40, 40, 160});
  fillRect(10.0F, 54.0F, barW * frac, 10.0F, Color{34, 197, 94, 255});
  text(barW + 18.0F, 55.0F, std::format("{:.1f}/{:.0f}", hud.health, hud.maxHealth), dark);

  float y = 70.0F;
  if (hud.extraLives > 0) {
    text(10.0F, y, std::format("LIVES +{}", hud.extraLives), dark);
    y += 14.0F;
  }
  if (hud.slowed) {
    text(10.0F, y, "SLOWED", Color{60, 140, 230, 255});
  }

  const float w = sim.gameWidth();
  if (hud.event != WeatherEvent::None) {
    centeredText(14.0F, NutfallSystems::eventTitle(hud.event), Color{180, 30, 30, 255}, w);
  } else if (!hud.incomingTitle.empty()) {
    centeredText(14.0F, hud.incomingTitle, Color{200, 120, 20, 255}, w);
  }
}

void SceneRenderer::renderStartScreen(const Simulation& sim, const ScreenModel& screen) {
  const float w = sim.gameWidth();
  centeredText(200.0F, "NUTFALL", Color{60, 40, 20, 255}, w);
  centeredText(220.0F, std::format("playing as {}", sim.character().displayName),
               Color{60, 40, 20, 255}, w);
  if (!screen.assetsReady) {
    centeredText(260.0F, "loading...", Color{60, 40, 20, 255}, w);
    return;
  }
  centeredText(260.0F, "ENTER / tap to start", Color{20, 20, 30, 255}, w);
  centeredText(276.0F, "C characters   TAB high scores", Color{20, 20, 30, 255}, w);
}

void SceneRenderer::renderLevelUp(const Simulation& sim, const ScreenModel& screen) {
  const float w = sim.gameWidth();
  dimBackground(w, 150);
  centeredText(150.0F,
               std::format("MONTH {} SURVIVED - choose a skill", sim.timeline().monthCounter - 1),
               kWhite, w);

  const std::span<const SkillId> offers = sim.offers();
  const float cardW = 220.0F;
  const float gap = 20.0F;
  const float total = (static_cast<float>(offers.size()) * (cardW + gap)) - gap;
  float x = (w - total) * 0.5F;
  for (std::size_t i = 0; i < offers.size(); ++i) {
    const Skill& s = SkillCatalog::info(offers[i]);
    const bool selected = static_cast<int>(i) == screen.menuIndex;
    fillRect(x, 200.0F, cardW, 120.0F, selected ? Color{70, 70, 90, 240} : Color{40, 40, 55, 230});
    fillRect(x, 200.0F, cardW, 4.0F, s.color);
    text(x + 10.0F, 214.0F, std::format("{} {}", i + 1, s.title), s.color);
    // Wrap the description to the card width.
    const std::size_t perLine = static_cast<std::size_t>((cardW - 20.0F) / kCharSize);
    std::string_view rest = s.description;
    float ty = 236.0F;
    while (!rest.empty()) {
      std::size_t n = std::min(perLine, rest.size());
      if (n < rest.size()) {
        const std::size_t space = rest.substr(0, n).rfind(' ');
        if (space != std::string_view::npos && space > 0)
          n = space;
      }
      text(x + 10.0F, ty, std::string(rest.substr(0, n)), kMuted);
      rest.remove_prefix(n);
      while (!rest.empty() && rest.front() == ' ')
        rest.remove_prefix(1);
      ty += 12.0F;
    }
    x += cardW + gap;
  }
  centeredText(340.0F, "1-3 or LEFT/RIGHT + ENTER", kMuted, w);
}

void SceneRenderer::renderNameEntry(const Simulation& sim, const ScreenModel& screen) {
  const float w = sim.gameWidth();
  const RunSummary& run = sim.lastRun();
  dimBackground(w, 170);
  centeredText(170.0F, "GAME OVER", Color{239, 68, 68, 255}, w);
  centeredText(200.0F, std::format("score {}   rocks {}", run.score, run.rocksDestroyed), kWhite, w);
  centeredText(216.0F, std::format("survived {} year(s) {} month(s)", run.year, run.month), kWhite,
               w);
  centeredText(250.0F, "enter your name:", kMuted, w);
  centeredText(266.0F, screen.nameBuffer + "_", kHighlight, w);
  centeredText(296.0F, "ENTER to save   ESC to skip", kMuted, w);
}

void SceneRenderer::renderCharacterList(const Simulation& sim, const ScreenModel& screen) {
  const float w = sim.gameWidth();
  dimBackground(w, 170);
  centeredText(150.0F, "CHOOSE A CHARACTER", kWhite, w);
  float y = 190.0F;
  for (std::size_t i = 0; i < screen.characterIds.size(); ++i) {
    const CharacterConfig& c = CharacterRegistry::get(screen.characterIds[i]);
    const bool selected = static_cast<int>(i) == screen.menuIndex;
    const bool current = c.id == sim.character().id;
    centeredText(y, std::format("{}{}{}", selected ? "> " : "  ", c.displayName, current ? " *" : ""),
                 selected ? kHighlight : kWhite, w);
    if (selected && !c.description.empty())
      centeredText(y + 12.0F, c.description, kMuted, w);
    y += 30.0F;
  }
  centeredText(y + 10.0F, "UP/DOWN + ENTER   ESC back", kMuted, w);
}

void SceneRenderer::renderHighScores(const Simulation& sim, const ScreenModel& screen) {
  const float w = sim.gameWidth();
  dimBackground(w, 190);
  centeredText(100.0F, "HIGH SCORES", kWhite, w);

  if (!screen.highScores || screen.highScores->empty()) {
    centeredText(140.0F, "no runs recorded yet", kMuted, w);
  } else {
    float y = 130.0F;
    int rank = 0;
    for (const RunSummary& run : screen.highScores->entries()) {
      const std::string line = std::format("{:2}. {:<12} {:>7}  {}y {}m  {}", rank + 1,
                                           run.name.empty() ? "anonymous" : run.name, run.score,
                                           run.year, run.month, run.characterId);
      centeredText(y, line, rank == screen.highlightRank ? kHighlight : kWhite, w);
      y += 14.0F;
      ++rank;
    }
  }
  centeredText(kGameHeight - 60.0F, "ENTER / ESC back", kMuted, w);
}

}  // namespace nutfall
