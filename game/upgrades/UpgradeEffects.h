// Active upgrade effects with per-effect hook handlers, exposed to combat as CombatEffects.
#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>

#include "CombatEffects.h"
#include "UpgradeModifiers.h"

namespace Arena {

struct EffectHandler {
    std::function<void(const Projectile&, Enemy&)> onHit;
    std::function<void(const Enemy&)> onKill;
    std::function<void(double deltaMs)> onUpdate;
    std::function<float(float amount)> onDamage;
};

class UpgradeEffects final : public CombatEffects {
public:
    explicit UpgradeEffects(const UpgradeModifiers& modifiers) : modifiers_(modifiers) {}

    void registerEffect(const std::string& name, EffectHandler handler);
    // Values stack: adding the same effect twice sums them.
    void addEffect(const std::string& name, float value);
    void removeEffect(const std::string& name);

    void addAbility(const std::string& name) { abilities_.insert(name); }
    bool hasAbility(const std::string& name) const { return abilities_.count(name) > 0; }

    float applyModifiers(const std::string& category, const std::string& stat, float base) const override;
    bool hasEffect(const std::string& name) const override;
    float getEffectValue(const std::string& name) const override;

    void onProjectileHit(const Projectile& projectile, Enemy& enemy) override;
    void onEnemyKill(const Enemy& enemy) override;
    float onPlayerDamage(float amount) override;
    void onUpdate(double deltaMs);

    void reset();

private:
    const UpgradeModifiers& modifiers_;
    std::map<std::string, EffectHandler> handlers_;
    std::map<std::string, float> active_;
    std::set<std::string> abilities_;
};

}  // namespace Arena
