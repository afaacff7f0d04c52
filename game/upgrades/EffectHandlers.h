// Built-in effect handlers: lifesteal, regen and armor bound to the player, explode_on_kill bound to the roster.
#pragma once

#include "UpgradeEffects.h"

namespace Surge {
class TimerQueue;
}

namespace Arena {

class EnemyRoster;
class Player;

// Blast radius of explode_on_kill, in pixels.
constexpr float kKillExplosionRadius = 60.0f;

void registerEffectHandlers(UpgradeEffects& effects, Player& player);
// Damage is the effect value through the ("bullet", "explosionDamage") modifiers. Enemies killed by
// the blast are not scored and do not explode in turn.
void registerKillEffects(UpgradeEffects& effects, EnemyRoster& roster, const Surge::TimerQueue& clock);

}  // namespace Arena
