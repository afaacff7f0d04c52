// Data structure describing an enemy archetype (stats at wave multiplier 1).
#pragma once

#include <cstdint>
#include <string>

namespace Arena {

struct EnemyDefinition {
    std::string id;

    float health{100.0f};
    float damage{10.0f};
    float speed{100.0f};
    float speedCap{2.0f};      // ceiling of the per-wave speed multiplier
    float scoreChance{0.5f};   // probability of awarding a point on death
    float radius{15.0f};
    float knockbackResistance{0.0f};  // 1 or more = immune
    std::uint32_t color{0xFFFFFF};

    // Damage shield sized as a fraction of health; 0 disables.
    float shieldFraction{0.0f};
    double shieldRechargeMs{5000.0};

    // Spawns `splitCount` enemies of `splitType` where this one died.
    std::string splitType;
    int splitCount{0};

    // Dash cycle: steer for dashWaitMs, speed up to dashSpeed along the aim taken when the dash
    // starts over dashMs, then ease back over dashRecoverMs. 0 disables.
    float dashSpeed{0.0f};
    double dashWaitMs{4000.0};
    double dashMs{1000.0};
    double dashRecoverMs{1000.0};

    // Ranged attack; 0 disables.
    double fireCooldownMs{0.0};
    float fireRange{0.0f};
    std::string projectile{"enemy_bullet"};
};

}  // namespace Arena
