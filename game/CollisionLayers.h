// Physics layer ids used by arena bodies.
#pragma once

#include <cstdint>

namespace Arena::Layers {

constexpr std::uint8_t kPlayer = 1;
constexpr std::uint8_t kEnemy = 2;
constexpr std::uint8_t kPlayerProjectile = 3;
constexpr std::uint8_t kEnemyProjectile = 4;
constexpr std::uint8_t kObstacle = 5;

}  // namespace Arena::Layers
