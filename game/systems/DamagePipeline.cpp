#include "DamagePipeline.h"

#include <cmath>

#include "../entities/Projectile.h"
#include "../upgrades/CombatEffects.h"

namespace Arena {

int DamagePipeline::projectileDamage(float baseDamage, float multiplier) const {
    const float modified = effects_.applyModifiers("bullet", "damage", baseDamage);
    return static_cast<int>(std::ceil(modified * multiplier));
}

int DamagePipeline::projectileDamage(const Projectile& projectile) const {
    return projectileDamage(projectile.damage(), projectile.damageMultiplier());
}

float DamagePipeline::knockback(float base) const { return effects_.applyModifiers("attack", "knockback", base); }

int DamagePipeline::playerDamage(float raw) { return static_cast<int>(std::ceil(raw)); }

}  // namespace Arena
