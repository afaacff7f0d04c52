#include "Projectile.h"

#include <algorithm>

namespace Arena {

Projectile::Projectile(int id, ProjectileOwner owner, int ownerId, const ProjectileDefinition& def,
                       Surge::BodyHandle body)
    : id_(id),
      owner_(owner),
      ownerId_(ownerId),
      body_(body),
      damage_(def.damage),
      damageMultiplier_(def.damageMultiplier),
      knockback_(def.knockback),
      pierce_(std::max(1, def.pierce)),
      canCutTiles_(def.canCutTiles),
      lifetimeMs_(def.lifetimeMs) {}

bool Projectile::canHitEnemy(int enemyId) const {
    return !destroyed_ && hitMemory_.count(enemyId) == 0;
}

bool Projectile::recordHit(int enemyId) {
    if (destroyed_) return false;
    hitMemory_.insert(enemyId);
    return consumePierce();
}

bool Projectile::consumePierce() {
    if (destroyed_) return false;
    pierceCount_ = std::min(pierce_, pierceCount_ + 1);
    if (pierceCount_ >= pierce_) {
        return destroy();
    }
    return false;
}

bool Projectile::destroy() {
    if (destroyed_) return false;
    destroyed_ = true;
    if (onDestroy_) {
        // Moved out first so a hook that touches this projectile again cannot re-enter itself.
        auto hook = std::move(onDestroy_);
        onDestroy_ = nullptr;
        hook(*this);
    }
    return true;
}

}  // namespace Arena
