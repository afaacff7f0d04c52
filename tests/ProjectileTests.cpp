// Projectile lifecycle: pierce budget, hit memory, idempotent destruction, lifetime.
#include <cassert>

#include "../game/entities/Projectile.h"

using namespace Arena;

namespace {
ProjectileDefinition preset(int pierce) {
    ProjectileDefinition def{};
    def.id = "test";
    def.damage = 10.0f;
    def.pierce = pierce;
    def.lifetimeMs = 3000.0;
    return def;
}
}  // namespace

int main() {
    {
        // A projectile may always strike at least once.
        Projectile p(1, ProjectileOwner::Player, 0, preset(0), Surge::kInvalidBody);
        assert(p.pierce() == 1);
        assert(p.canHitEnemy(7));
        assert(p.recordHit(7));
        assert(p.isDestroyed());
    }
    {
        Projectile p(1, ProjectileOwner::Player, 0, preset(2), Surge::kInvalidBody);
        assert(!p.recordHit(1));
        assert(!p.isDestroyed());
        assert(!p.canHitEnemy(1));
        assert(p.canHitEnemy(2));
        assert(p.recordHit(2));
        assert(p.isDestroyed());
        assert(p.pierceCount() == 2);
        // Nothing more once destroyed.
        assert(!p.canHitEnemy(3));
        assert(!p.recordHit(3));
        assert(p.pierceCount() <= p.pierce());
        assert(p.hitCount() == 2);
    }
    {
        int hookCalls = 0;
        Projectile p(4, ProjectileOwner::Enemy, 9, preset(1), Surge::kInvalidBody);
        p.setDestroyHook([&hookCalls](Projectile&) { ++hookCalls; });
        assert(p.destroy());
        assert(!p.destroy());
        assert(hookCalls == 1);
        assert(p.owner() == ProjectileOwner::Enemy);
        assert(p.ownerId() == 9);
    }
    {
        // Obstacle wear without a victim.
        Projectile p(1, ProjectileOwner::Player, 0, preset(3), Surge::kInvalidBody);
        p.notifyObstacleHit();
        assert(!p.consumePierce());
        assert(!p.consumePierce());
        assert(p.consumePierce());
        assert(p.isDestroyed());
        assert(p.obstacleHits() == 1);
        assert(p.hitCount() == 0);
    }
    {
        Projectile p(1, ProjectileOwner::Player, 0, preset(1), Surge::kInvalidBody);
        p.age(2999.0);
        assert(!p.expired());
        p.age(1.0);
        assert(p.expired());
    }
    return 0;
}
