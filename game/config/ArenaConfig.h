// Tunable numbers for a session; defaults reproduce the shipped balance.
#pragma once

#include <string>
#include <vector>

#include "../../engine/math/Vec2.h"
#include "../EnemyDefinition.h"
#include "../ProjectileDefinition.h"

namespace Arena {

struct CombatSettings {
    double playerDamageCooldownMs{500.0};
    float projectilePush{150.0f};
    float contactPush{200.0f};
    double knockbackDurationMs{100.0};
};

struct PlayfieldSettings {
    float width{1280.0f};
    float height{720.0f};
    float margin{50.0f};

    bool outOfBounds(const Surge::Vec2& p) const {
        return p.x < -margin || p.x > width + margin || p.y < -margin || p.y > height + margin;
    }
    Surge::Vec2 center() const { return Surge::Vec2{width * 0.5f, height * 0.5f}; }
};

struct PlayerSettings {
    float maxHealth{100.0f};
    float speed{200.0f};
    float radius{16.0f};
    double fireIntervalMs{250.0};
    std::string weapon{"bullet"};
};

struct WaveSettings {
    double bossDelayMs{2000.0};
    int bossBurstCount{3};
    int bossInterval{10};
    int waveClearBonusBase{15};
    int waveClearBonusCap{55};
    double intermissionMs{3000.0};
};

struct ArenaConfig {
    CombatSettings combat{};
    PlayfieldSettings playfield{};
    PlayerSettings player{};
    WaveSettings waves{};
    std::vector<EnemyDefinition> enemies;
    std::vector<ProjectileDefinition> projectiles;

    const EnemyDefinition* findEnemy(const std::string& id) const;
    const ProjectileDefinition* findProjectile(const std::string& id) const;

    static ArenaConfig defaults();
};

}  // namespace Arena
