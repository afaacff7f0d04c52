#include "Enemy.h"

#include <algorithm>

namespace Arena {

Enemy::Enemy(int id, const EnemyDefinition& def, double waveMultiplier, float speedMultiplier, Surge::BodyHandle body)
    : id_(id), def_(def), body_(body) {
    health_ = static_cast<float>(def.health * waveMultiplier);
    maxHealth_ = health_;
    damage_ = static_cast<float>(def.damage * waveMultiplier);
    speed_ = def.speed * speedMultiplier;
    if (def_.shieldFraction > 0.0f) {
        raiseShield();
    }
}

void Enemy::raiseShield() {
    shieldHealth_ = health_ * def_.shieldFraction;
    shieldBroken_ = false;
}

bool Enemy::takeDamage(float amount, double nowMs) {
    if (destroyed_ || amount <= 0.0f) return false;
    if (shieldHealth_ > 0.0f) {
        shieldHealth_ -= amount;
        if (shieldHealth_ <= 0.0f) {
            shieldHealth_ = 0.0f;
            shieldBroken_ = true;
            shieldBrokenAtMs_ = nowMs;
        }
        return false;
    }
    health_ = std::min(maxHealth_, health_ - amount);
    if (health_ <= 0.0f) {
        health_ = 0.0f;
        killed_ = true;
        destroy();
        return true;
    }
    return false;
}

bool Enemy::applyKnockback(const Surge::Vec2& impulse, double nowMs, double durationMs) {
    if (destroyed_ || shielded() || def_.knockbackResistance >= 1.0f) return false;
    knockbackVelocity_ = impulse * (1.0f - def_.knockbackResistance);
    knockbackUntilMs_ = nowMs + durationMs;
    return true;
}

Surge::Vec2 Enemy::update(const Surge::Vec2& playerPos, double nowMs) {
    if (shieldBroken_ && nowMs - shieldBrokenAtMs_ >= def_.shieldRechargeMs) {
        raiseShield();
    }
    if (knockedBack(nowMs)) {
        return knockbackVelocity_;
    }
    if (def_.dashSpeed > 0.0f) {
        return dashVelocity(playerPos, nowMs);
    }
    return steer(playerPos);
}

Surge::Vec2 Enemy::steer(const Surge::Vec2& playerPos) const {
    if (distance(position_, playerPos) < 1.0f) {
        return Surge::Vec2{};
    }
    return Surge::fromAngle(Surge::angleBetween(position_, playerPos), speed_);
}

Surge::Vec2 Enemy::dashVelocity(const Surge::Vec2& playerPos, double nowMs) {
    const double cycle = def_.dashWaitMs + def_.dashMs + def_.dashRecoverMs;
    if (cycle <= 0.0) return steer(playerPos);
    if (dashCycleStartMs_ < 0.0 || nowMs - dashCycleStartMs_ >= cycle) {
        dashCycleStartMs_ = nowMs;
        dashAimed_ = false;
    }

    const double t = nowMs - dashCycleStartMs_;
    if (t < def_.dashWaitMs) return steer(playerPos);

    // The direction is locked for the rest of the cycle.
    if (!dashAimed_) {
        dashAngle_ = Surge::angleBetween(position_, playerPos);
        dashAimed_ = true;
    }
    float speed = 0.0f;
    if (t < def_.dashWaitMs + def_.dashMs) {
        const double progress = def_.dashMs > 0.0 ? (t - def_.dashWaitMs) / def_.dashMs : 1.0;
        speed = speed_ + (def_.dashSpeed - speed_) * static_cast<float>(progress);
    } else {
        const double progress =
            def_.dashRecoverMs > 0.0 ? (t - def_.dashWaitMs - def_.dashMs) / def_.dashRecoverMs : 1.0;
        speed = def_.dashSpeed + (speed_ - def_.dashSpeed) * static_cast<float>(progress);
    }
    return Surge::fromAngle(dashAngle_, speed);
}

bool Enemy::readyToFire(const Surge::Vec2& playerPos, double nowMs) {
    if (destroyed_ || def_.fireCooldownMs <= 0.0) return false;
    if (distance(position_, playerPos) > def_.fireRange) return false;
    if (hasShot_ && nowMs - lastShotMs_ < def_.fireCooldownMs) return false;
    hasShot_ = true;
    lastShotMs_ = nowMs;
    return true;
}

bool Enemy::destroy() {
    if (destroyed_) return false;
    destroyed_ = true;
    if (onDestroy_) {
        auto hook = std::move(onDestroy_);
        onDestroy_ = nullptr;
        hook(*this);
    }
    return true;
}

}  // namespace Arena
