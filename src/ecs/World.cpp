#include "ecs/World.h"

EntityId World::create() {
  return registry.create();
}

void World::destroy(EntityId id) {
  registry.destroy(id);
}

void World::clear() {
  registry.clear();
  serial_ = 1;
}
