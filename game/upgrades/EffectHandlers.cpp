#include "EffectHandlers.h"

#include <algorithm>
#include <string>

#include "../../engine/core/Logger.h"
#include "../../engine/core/TimerQueue.h"
#include "../entities/Enemy.h"
#include "../entities/Player.h"
#include "../entities/Projectile.h"
#include "../systems/EnemyRoster.h"

namespace Arena {

void registerEffectHandlers(UpgradeEffects& effects, Player& player) {
    // Handlers read their value at call time so stacked upgrades apply immediately.
    UpgradeEffects* fx = &effects;
    Player* hero = &player;

    EffectHandler lifesteal{};
    lifesteal.onHit = [fx, hero](const Projectile& projectile, Enemy&) {
        hero->heal(projectile.damage() * fx->getEffectValue("lifesteal"));
    };
    effects.registerEffect("lifesteal", lifesteal);

    EffectHandler regen{};
    regen.onUpdate = [fx, hero](double deltaMs) {
        hero->heal(static_cast<float>(fx->getEffectValue("regen") * deltaMs / 1000.0));
    };
    effects.registerEffect("regen", regen);

    EffectHandler armor{};
    armor.onDamage = [fx](float amount) {
        return std::max(1.0f, amount * (1.0f - fx->getEffectValue("armor")));
    };
    effects.registerEffect("armor", armor);
}

void registerKillEffects(UpgradeEffects& effects, EnemyRoster& roster, const Surge::TimerQueue& clock) {
    UpgradeEffects* fx = &effects;
    EnemyRoster* enemies = &roster;
    const Surge::TimerQueue* timers = &clock;

    EffectHandler explode{};
    explode.onKill = [fx, enemies, timers](const Enemy& dead) {
        const float damage = fx->applyModifiers("bullet", "explosionDamage", fx->getEffectValue("explode_on_kill"));
        const int killed = enemies->damageInRadius(dead.position(), kKillExplosionRadius, damage, timers->nowMs());
        if (killed > 0) {
            Surge::logDebug("Explosion took " + std::to_string(killed) + " more enemies");
        }
    };
    effects.registerEffect("explode_on_kill", explode);
}

}  // namespace Arena
