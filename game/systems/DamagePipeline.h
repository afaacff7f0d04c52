// Final damage numbers: modifiers, multiplier and ceiling rounding.
#pragma once

namespace Arena {

class CombatEffects;
class Projectile;

class DamagePipeline {
public:
    explicit DamagePipeline(const CombatEffects& effects) : effects_(effects) {}

    // ceil(applyModifiers("bullet", "damage", base) * multiplier)
    int projectileDamage(float baseDamage, float multiplier) const;
    int projectileDamage(const Projectile& projectile) const;
    // Not rounded; applied as a continuous impulse.
    float knockback(float base) const;

    static int playerDamage(float raw);

private:
    const CombatEffects& effects_;
};

}  // namespace Arena
