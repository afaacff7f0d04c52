// Live enemy instance: wave-scaled combat stats, shield, knockback and ranged attack timers.
#pragma once

#include <functional>
#include <string>

#include "../../engine/math/Vec2.h"
#include "../../engine/physics/Contact.h"
#include "../EnemyDefinition.h"

namespace Arena {

class Enemy {
public:
    using DestroyHook = std::function<void(Enemy&)>;

    // Stats are scaled once here; maxHealth is fixed from then on.
    Enemy(int id, const EnemyDefinition& def, double waveMultiplier, float speedMultiplier, Surge::BodyHandle body);

    int id() const { return id_; }
    const std::string& typeId() const { return def_.id; }
    const EnemyDefinition& definition() const { return def_; }
    Surge::BodyHandle body() const { return body_; }

    float health() const { return health_; }
    float maxHealth() const { return maxHealth_; }
    float damage() const { return damage_; }
    float speed() const { return speed_; }
    float speedCap() const { return def_.speedCap; }
    float scoreChance() const { return def_.scoreChance; }
    float knockbackResistance() const { return def_.knockbackResistance; }

    // Returns true if this hit killed the enemy (and destroyed it).
    bool takeDamage(float amount, double nowMs);

    bool shielded() const { return shieldHealth_ > 0.0f; }
    float shieldHealth() const { return shieldHealth_; }

    // Ignored while shielded or fully resistant; otherwise overrides steering until the knockback ends.
    bool applyKnockback(const Surge::Vec2& impulse, double nowMs, double durationMs);
    bool knockedBack(double nowMs) const { return nowMs < knockbackUntilMs_; }

    // Steering velocity towards the player, the dash velocity for dashing archetypes, or the
    // knockback velocity while it lasts.
    Surge::Vec2 update(const Surge::Vec2& playerPos, double nowMs);

    // True once per cooldown while the player is in range.
    bool readyToFire(const Surge::Vec2& playerPos, double nowMs);

    bool killed() const { return killed_; }
    bool destroy();
    bool isDestroyed() const { return destroyed_; }
    void setDestroyHook(DestroyHook hook) { onDestroy_ = std::move(hook); }

    const Surge::Vec2& position() const { return position_; }
    void setPosition(const Surge::Vec2& p) { position_ = p; }

private:
    void raiseShield();
    Surge::Vec2 steer(const Surge::Vec2& playerPos) const;
    Surge::Vec2 dashVelocity(const Surge::Vec2& playerPos, double nowMs);

    int id_{0};
    EnemyDefinition def_{};
    Surge::BodyHandle body_{Surge::kInvalidBody};

    float health_{0.0f};
    float maxHealth_{0.0f};
    float damage_{0.0f};
    float speed_{0.0f};

    float shieldHealth_{0.0f};
    double shieldBrokenAtMs_{0.0};
    bool shieldBroken_{false};

    Surge::Vec2 knockbackVelocity_{};
    double knockbackUntilMs_{-1.0};
    double dashCycleStartMs_{-1.0};
    float dashAngle_{0.0f};
    bool dashAimed_{false};

    double lastShotMs_{0.0};
    bool hasShot_{false};

    Surge::Vec2 position_{};
    bool killed_{false};
    bool destroyed_{false};
    DestroyHook onDestroy_{};
};

}  // namespace Arena
