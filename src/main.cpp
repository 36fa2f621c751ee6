#include "core/App.h"

#include <SDL3/SDL_hints.h>

#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace {

void usage(const char* argv0) {
  std::printf(
      "usage: %s [--frames N] [--video-driver NAME] [--width W] [--height H]\n"
      "          [--character ID] [--characters DIR] [--input-script PATH] [--seed N]\n"
      "          [--start-year Y] [--start-month M] [--no-prefs] [--no-ui] [--log-sounds]\n",
      argv0);
  std::printf("  --frames N           Run N frames then exit (smoke test)\n");
  std::printf("  --video-driver NAME  Force SDL video backend (e.g. x11, wayland, offscreen)\n");
  std::printf("  --width W            Window width (default: from prefs, 800)\n");
  std::printf("  --height H           Window height (default: from prefs, 700)\n");
  std::printf("  --character ID       Play as this character (pistachio, walnut, ...)\n");
  std::printf("  --characters DIR     Character TOML directory (default: data/characters)\n");
  std::printf("  --input-script PATH  Replay scripted input from a TOML file\n");
  std::printf("  --seed N             Seed the random generator for a reproducible run\n");
  std::printf("  --start-year Y       Debug start: skip Y years (0-99)\n");
  std::printf("  --start-month M      Debug start: skip M more months (0-11)\n");
  std::printf("  --no-prefs           Do not read or write prefs and high scores\n");
  std::printf("  --no-ui              Disable the debug panels\n");
  std::printf("  --log-sounds         Print every sound cue\n");
  std::printf("  -h, --help           Show this help\n");
}

bool parseInt(const char* s, int lo, int hi, int& out) {
  if (!s || !*s)
    return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (!end || *end != '\0')
    return false;
  if (v < lo || v > hi)
    return false;
  out = static_cast<int>(v);
  return true;
}

bool parseSeed(const char* s, uint32_t& out) {
  if (!s || !*s)
    return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 10);
  if (!end || *end != '\0' || v > 0xFFFFFFFFULL)
    return false;
  out = static_cast<uint32_t>(v);
  return true;
}

}  // namespace

// NOLINTNEXTLINE
int main(int argc, char** argv) {
  AppConfig cfg{};
  const char* videoDriver = nullptr;

  auto fail = [&](const char* message) {
    std::printf("%s\n", message);
    usage(argv[0]);
    return 1;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;
    if (arg == "--frames") {
      if (!parseInt(next, 1, 10000000, cfg.maxFrames))
        return fail("invalid --frames value");
      ++i;
    } else if (arg == "--video-driver") {
      if (!next)
        return fail("missing --video-driver value");
      videoDriver = argv[++i];
    } else if (arg == "--width") {
      if (!parseInt(next, 320, 7680, cfg.width))
        return fail("invalid --width value");
      ++i;
    } else if (arg == "--height") {
      if (!parseInt(next, 240, 4320, cfg.height))
        return fail("invalid --height value");
      ++i;
    } else if (arg == "--character") {
      if (!next)
        return fail("missing --character value");
      cfg.characterId = argv[++i];
    } else if (arg == "--characters") {
      if (!next)
        return fail("missing --characters value");
      cfg.charactersDir = argv[++i];
    } else if (arg == "--input-script") {
      if (!next)
        return fail("missing --input-script value");
      cfg.inputScriptTomlPath = argv[++i];
    } else if (arg == "--seed") {
      if (!parseSeed(next, cfg.seed))
        return fail("invalid --seed value");
      cfg.hasSeed = true;
      ++i;
    } else if (arg == "--start-year") {
      if (!parseInt(next, 0, 99, cfg.startYear))
        return fail("invalid --start-year value");
      ++i;
    } else if (arg == "--start-month") {
      if (!parseInt(next, 0, 11, cfg.startMonth))
        return fail("invalid --start-month value");
      ++i;
    } else if (arg == "--no-prefs") {
      cfg.noPrefs = true;
    } else if (arg == "--no-ui") {
      cfg.noUi = true;
    } else if (arg == "--log-sounds") {
      cfg.logSounds = true;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      std::printf("unknown option: %s\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
  }

  // A month offset alone still means a debug start in year 0.
  if (cfg.startYear < 0 && cfg.startMonth > 0)
    cfg.startYear = 0;

  if (videoDriver) {
    SDL_SetHint(SDL_HINT_VIDEO_DRIVER, videoDriver);
  }

  App app;
  if (!app.init(cfg, argv[0])) {
    app.shutdown();
    return 1;
  }

  app.run();
  app.shutdown();
  return 0;
}
