#pragma once

#include <cstdint>
#include <entt/entt.hpp>

using EntityId = entt::entity;
inline constexpr EntityId kInvalidEntity = entt::null;

class World {
 public:
  EntityId create();
  void destroy(EntityId);
  void clear();

  // Monotonic counter for creation-order ids (elements, particles).
  std::uint64_t nextSerial() { return serial_++; }

  entt::registry registry;

 private:
  std::uint64_t serial_ = 1;
};
