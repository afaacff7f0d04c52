// Projectile lifecycle: per-flight hit memory, pierce budget and one-way destruction.
#pragma once

#include <functional>
#include <set>

#include "../../engine/math/Vec2.h"
#include "../../engine/physics/Contact.h"
#include "../ProjectileDefinition.h"

namespace Arena {

enum class ProjectileOwner { Player, Enemy };

class Projectile {
public:
    using DestroyHook = std::function<void(Projectile&)>;

    Projectile(int id, ProjectileOwner owner, int ownerId, const ProjectileDefinition& def, Surge::BodyHandle body);

    int id() const { return id_; }
    ProjectileOwner owner() const { return owner_; }
    int ownerId() const { return ownerId_; }
    Surge::BodyHandle body() const { return body_; }

    float damage() const { return damage_; }
    float damageMultiplier() const { return damageMultiplier_; }
    float knockback() const { return knockback_; }
    int pierce() const { return pierce_; }
    int pierceCount() const { return pierceCount_; }
    bool canCutTiles() const { return canCutTiles_; }
    void setDamage(float damage) { damage_ = damage; }
    void setDamageMultiplier(float mult) { damageMultiplier_ = mult; }

    bool canHitEnemy(int enemyId) const;
    // Remembers the victim and spends one pierce charge. Returns true if that destroyed the projectile.
    bool recordHit(int enemyId);
    std::size_t hitCount() const { return hitMemory_.size(); }

    void notifyObstacleHit() { ++obstacleHits_; }
    int obstacleHits() const { return obstacleHits_; }
    // Spends a pierce charge without a victim (tile cutting, ricochet).
    bool consumePierce();

    // Returns false when already destroyed; the destroy hook runs once.
    bool destroy();
    bool isDestroyed() const { return destroyed_; }
    void setDestroyHook(DestroyHook hook) { onDestroy_ = std::move(hook); }

    const Surge::Vec2& position() const { return position_; }
    void setPosition(const Surge::Vec2& p) { position_ = p; }

    void age(double deltaMs) { ageMs_ += deltaMs; }
    bool expired() const { return lifetimeMs_ > 0.0 && ageMs_ >= lifetimeMs_; }

private:
    int id_{0};
    ProjectileOwner owner_{ProjectileOwner::Player};
    int ownerId_{0};
    Surge::BodyHandle body_{Surge::kInvalidBody};

    float damage_{0.0f};
    float damageMultiplier_{1.0f};
    float knockback_{0.0f};
    int pierce_{1};
    int pierceCount_{0};
    bool canCutTiles_{false};
    std::set<int> hitMemory_;
    int obstacleHits_{0};

    Surge::Vec2 position_{};
    double lifetimeMs_{0.0};
    double ageMs_{0.0};

    bool destroyed_{false};
    DestroyHook onDestroy_{};
};

}  // namespace Arena
