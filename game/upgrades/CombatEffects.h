// Effect/modifier queries and hooks consulted during combat resolution.
#pragma once

#include <string>

namespace Arena {

class Enemy;
class Projectile;

class CombatEffects {
public:
    virtual ~CombatEffects() = default;

    virtual float applyModifiers(const std::string& category, const std::string& stat, float base) const = 0;
    virtual bool hasEffect(const std::string& name) const = 0;
    virtual float getEffectValue(const std::string& name) const = 0;

    virtual void onProjectileHit(const Projectile& projectile, Enemy& enemy) = 0;
    virtual void onEnemyKill(const Enemy& enemy) = 0;
    // Adjusts incoming player damage (armor and the like) before rounding.
    virtual float onPlayerDamage(float amount) { return amount; }
};

}  // namespace Arena
