// Owns projectiles fired by the player: launch, lifetime/bounds sweep and clearing.
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "../../engine/physics/PhysicsWorld.h"
#include "../config/ArenaConfig.h"
#include "../entities/Projectile.h"
#include "BodyIndex.h"

namespace Arena {

class CombatEffects;

// Launch angles for `count` shots fanned symmetrically around `aim`.
std::vector<float> spreadAngles(float aim, int count, float step = 0.3f);

class PlayerArsenal {
public:
    PlayerArsenal(const ArenaConfig& config, Surge::PhysicsWorld& physics, BodyIndex& bodies);
    PlayerArsenal(const PlayerArsenal&) = delete;
    PlayerArsenal& operator=(const PlayerArsenal&) = delete;

    // Launches a preset along `angle` (radians). Unknown presets log a warning and return nullptr.
    Projectile* fire(const std::string& presetId, const Surge::Vec2& origin, float angle, int ownerId = 0);
    // Speed modifiers ("bullet", "speed") are applied at launch when effects are attached.
    void setEffects(const CombatEffects* effects) { effects_ = effects; }

    void update(double deltaMs);
    void clear();

    Projectile* find(int id);
    const std::vector<std::unique_ptr<Projectile>>& projectiles() const { return projectiles_; }
    std::size_t activeCount() const;

private:
    const ArenaConfig& config_;
    Surge::PhysicsWorld& physics_;
    BodyIndex& bodies_;
    const CombatEffects* effects_{nullptr};
    std::vector<std::unique_ptr<Projectile>> projectiles_;
    int nextId_{0};
};

}  // namespace Arena
