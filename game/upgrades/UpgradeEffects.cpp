#include "UpgradeEffects.h"

#include <utility>

namespace Arena {

void UpgradeEffects::registerEffect(const std::string& name, EffectHandler handler) {
    handlers_[name] = std::move(handler);
}

void UpgradeEffects::addEffect(const std::string& name, float value) { active_[name] += value; }

void UpgradeEffects::removeEffect(const std::string& name) { active_.erase(name); }

float UpgradeEffects::applyModifiers(const std::string& category, const std::string& stat, float base) const {
    return modifiers_.apply(category, stat, base);
}

bool UpgradeEffects::hasEffect(const std::string& name) const {
    auto it = active_.find(name);
    return it != active_.end() && it->second > 0.0f;
}

float UpgradeEffects::getEffectValue(const std::string& name) const {
    auto it = active_.find(name);
    return it != active_.end() ? it->second : 0.0f;
}

void UpgradeEffects::onProjectileHit(const Projectile& projectile, Enemy& enemy) {
    for (const auto& [name, value] : active_) {
        if (value <= 0.0f) continue;
        auto it = handlers_.find(name);
        if (it != handlers_.end() && it->second.onHit) {
            it->second.onHit(projectile, enemy);
        }
    }
}

void UpgradeEffects::onEnemyKill(const Enemy& enemy) {
    for (const auto& [name, value] : active_) {
        if (value <= 0.0f) continue;
        auto it = handlers_.find(name);
        if (it != handlers_.end() && it->second.onKill) {
            it->second.onKill(enemy);
        }
    }
}

float UpgradeEffects::onPlayerDamage(float amount) {
    float modified = amount;
    for (const auto& [name, value] : active_) {
        if (value <= 0.0f) continue;
        auto it = handlers_.find(name);
        if (it != handlers_.end() && it->second.onDamage) {
            modified = it->second.onDamage(modified);
        }
    }
    return modified;
}

void UpgradeEffects::onUpdate(double deltaMs) {
    for (const auto& [name, value] : active_) {
        if (value <= 0.0f) continue;
        auto it = handlers_.find(name);
        if (it != handlers_.end() && it->second.onUpdate) {
            it->second.onUpdate(deltaMs);
        }
    }
}

void UpgradeEffects::reset() {
    active_.clear();
    abilities_.clear();
}

}  // namespace Arena
