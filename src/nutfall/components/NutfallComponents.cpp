#include "nutfall/components/NutfallComponents.h"

namespace nutfall {

const char* elementTypeName(ElementType t) {
  switch (t) {
    case ElementType::Rock:
      return "rock";
    case ElementType::Water:
      return "water";
    case ElementType::Snow:
      return "snow";
    case ElementType::Meteor:
      return "meteor";
  }
  return "?";
}

const char* seasonName(Season s) {
  switch (s) {
    case Season::Spring:
      return "spring";
    case Season::Summer:
      return "summer";
    case Season::Autumn:
      return "autumn";
    case Season::Winter:
      return "winter";
  }
  return "?";
}

const char* weatherEventName(WeatherEvent e) {
  switch (e) {
    case WeatherEvent::None:
      return "none";
    case WeatherEvent::Storm:
      return "storm";
    case WeatherEvent::Thunderstorm:
      return "thunderstorm";
    case WeatherEvent::Earthquake:
      return "earthquake";
    case WeatherEvent::Blizzard:
      return "blizzard";
    case WeatherEvent::MeteorShower:
      return "meteorShower";
  }
  return "?";
}

const char* gameStatusName(GameStatus s) {
  switch (s) {
    case GameStatus::Start:
      return "start";
    case GameStatus::Playing:
      return "playing";
    case GameStatus::LevelUp:
      return "levelUp";
    case GameStatus::EnteringName:
      return "enteringName";
  }
  return "?";
}

const char* soundCueName(SoundCue c) {
  switch (c) {
    case SoundCue::Jump:
      return "jump";
    case SoundCue::Damage:
      return "damage";
    case SoundCue::Impact:
      return "impact";
    case SoundCue::MeteorImpact:
      return "meteorImpact";
    case SoundCue::WaterCollect:
      return "waterCollect";
    case SoundCue::Block:
      return "block";
    case SoundCue::Resurrect:
      return "resurrect";
    case SoundCue::ShellCrack:
      return "shellCrack";
    case SoundCue::GoldenTouch:
      return "goldenTouch";
    case SoundCue::GameOver:
      return "gameOver";
    case SoundCue::Thunder:
      return "thunder";
    case SoundCue::LightningStrike:
      return "lightningStrike";
    case SoundCue::Storm:
      return "storm";
    case SoundCue::Earthquake:
      return "earthquake";
    case SoundCue::Blizzard:
      return "blizzard";
    case SoundCue::PhotosynthesisHeal:
      return "photosynthesisHeal";
  }
  return "?";
}

}  // namespace nutfall
