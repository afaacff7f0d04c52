// Projectile preset: damage, flight and pierce parameters shared by both sides.
#pragma once

#include <cstdint>
#include <string>

namespace Arena {

struct ProjectileDefinition {
    std::string id;
    float damage{10.0f};
    float damageMultiplier{1.0f};
    float speed{400.0f};     // px/s
    float radius{5.0f};
    int pierce{1};           // distinct enemies per flight
    float knockback{0.0f};
    double lifetimeMs{3000.0};
    bool canCutTiles{false};
    std::uint32_t color{0xFFFFFF};
};

}  // namespace Arena
