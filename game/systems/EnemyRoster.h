// Owns live enemies and enemy-fired projectiles: spawning, wave scaling and the per-frame sweep.
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "../../engine/math/Vec2.h"
#include "../../engine/physics/PhysicsWorld.h"
#include "../config/ArenaConfig.h"
#include "../entities/Enemy.h"
#include "../entities/Projectile.h"
#include "BodyIndex.h"

namespace Arena {

class EnemyRoster {
public:
    EnemyRoster(const ArenaConfig& config, Surge::PhysicsWorld& physics, BodyIndex& bodies, std::mt19937& rng);
    EnemyRoster(const EnemyRoster&) = delete;
    EnemyRoster& operator=(const EnemyRoster&) = delete;

    // Unknown type ids log a warning and return nullptr. Without a position the enemy appears
    // just outside a random playfield edge.
    Enemy* spawnEnemy(const std::string& typeId, std::optional<Surge::Vec2> position = std::nullopt);
    Projectile* spawnEnemyProjectile(const Enemy& shooter, const Surge::Vec2& target);

    // Advances the wave multiplier using the index of the wave just completed.
    void scaleEnemyStats(int wave);
    void setCurrentWave(int wave) { currentWave_ = wave; }
    int currentWave() const { return currentWave_; }
    double waveMultiplier() const { return waveMultiplier_; }
    void resetScaling();

    // Removes destroyed entries (newest first), steers and fires the rest, then spawns split children.
    void update(const Surge::Vec2& playerPos, double nowMs, double deltaMs);
    void clear();
    void clearProjectiles();

    std::size_t activeCount() const;
    const std::vector<std::unique_ptr<Enemy>>& enemies() const { return enemies_; }
    const std::vector<std::unique_ptr<Projectile>>& projectiles() const { return projectiles_; }
    Enemy* findEnemy(int id);
    Projectile* findProjectile(int id);
    Enemy* nearestEnemy(const Surge::Vec2& from);
    // Area damage with linear falloff to 5% at the rim; destroyed enemies are skipped.
    // Returns how many enemies the blast killed.
    int damageInRadius(const Surge::Vec2& center, float radius, float damage, double nowMs);
    // Type with the highest base health; unknown ids are skipped, ties keep the earlier entry.
    std::string strongestOf(const std::vector<std::string>& typeIds) const;

private:
    Surge::Vec2 randomEdgePosition();
    void releaseBody(Surge::BodyHandle body);

    const ArenaConfig& config_;
    Surge::PhysicsWorld& physics_;
    BodyIndex& bodies_;
    std::mt19937& rng_;

    std::vector<std::unique_ptr<Enemy>> enemies_;
    std::vector<std::unique_ptr<Projectile>> projectiles_;
    int nextEnemyId_{0};
    int nextProjectileId_{0};
    int currentWave_{0};
    double waveMultiplier_{1.0};
};

}  // namespace Arena
