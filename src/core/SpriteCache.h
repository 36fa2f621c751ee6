#pragma once

#include <SDL3/SDL_render.h>

#include <string>
#include <unordered_map>
#include <vector>

#include "nutfall/Collaborators.h"

// Texture cache keyed by resolved path. Reports ready once every character
// sprite has been attempted; missing files fall back to flat shapes.
class SpriteCache : public nutfall::AssetProvider {
 public:
  void init(SDL_Renderer* renderer, const char* argv0);
  void shutdown();

  // Loads the shell sprites of every listed character.
  void preload(const std::vector<std::string>& characterIds);

  [[nodiscard]] bool ready() const override { return ready_; }

  // Empty paths and load failures return nullptr.
  SDL_Texture* get(const std::string& path);

 private:
  SDL_Texture* loadTexture(const std::string& path);

  SDL_Renderer* renderer_ = nullptr;
  const char* argv0_ = nullptr;
  bool ready_ = false;
  std::unordered_map<std::string, SDL_Texture*> textures_;
};
