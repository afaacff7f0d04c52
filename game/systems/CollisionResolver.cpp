#include "CollisionResolver.h"

#include <string>
#include <utility>

#include "../../engine/core/Logger.h"
#include "../entities/Enemy.h"
#include "../entities/Player.h"
#include "../entities/Projectile.h"
#include "../session/SessionState.h"
#include "../upgrades/CombatEffects.h"
#include "EnemyRoster.h"
#include "PlayerArsenal.h"

namespace Arena {

namespace {

bool isProjectile(EntityKind kind) {
    return kind == EntityKind::PlayerProjectile || kind == EntityKind::EnemyProjectile;
}

}  // namespace

CollisionResolver::CollisionResolver(BodyIndex& bodies, EnemyRoster& roster, PlayerArsenal& arsenal, Player& player,
                                     CombatEffects& effects, SessionState& session, Surge::PhysicsWorld& physics,
                                     const CombatSettings& settings, const Surge::TimerQueue& clock,
                                     std::mt19937& rng)
    : bodies_(bodies),
      roster_(roster),
      arsenal_(arsenal),
      player_(player),
      effects_(effects),
      session_(session),
      physics_(physics),
      settings_(settings),
      clock_(clock),
      rng_(rng),
      damage_(effects) {}

void CollisionResolver::resolve(const Surge::ContactEvent& contact) {
    if (contact.kind == Surge::ContactKind::Solid) return;
    if (contact.kind == Surge::ContactKind::Obstacle) {
        resolveObstacle(contact);
        return;
    }

    auto first = bodies_.lookup(contact.a);
    auto second = bodies_.lookup(contact.b);
    if (!first || !second) {
        Surge::logDebug("Contact with unregistered body ignored");
        return;
    }
    // Order the pair so that the lower kind comes first: Player < Enemy < PlayerProjectile < EnemyProjectile.
    if (second->kind < first->kind) std::swap(first, second);

    if (first->kind == EntityKind::Enemy && second->kind == EntityKind::PlayerProjectile) {
        Enemy* enemy = roster_.findEnemy(first->id);
        Projectile* projectile = arsenal_.find(second->id);
        if (!enemy || !projectile) {
            Surge::logDebug("Projectile/enemy lookup miss");
            return;
        }
        projectileHitsEnemy(*projectile, *enemy);
    } else if (first->kind == EntityKind::Player && second->kind == EntityKind::EnemyProjectile) {
        Projectile* projectile = roster_.findProjectile(second->id);
        if (!projectile) {
            Surge::logDebug("Enemy projectile lookup miss");
            return;
        }
        enemyProjectileHitsPlayer(*projectile);
    } else if (first->kind == EntityKind::Player && second->kind == EntityKind::Enemy) {
        Enemy* enemy = roster_.findEnemy(second->id);
        if (!enemy) {
            Surge::logDebug("Enemy lookup miss");
            return;
        }
        enemyTouchesPlayer(*enemy);
    }
}

void CollisionResolver::projectileHitsEnemy(Projectile& projectile, Enemy& enemy) {
    if (projectile.isDestroyed() || enemy.isDestroyed()) return;
    if (!projectile.canHitEnemy(enemy.id())) return;

    effects_.onProjectileHit(projectile, enemy);
    if (enemy.isDestroyed()) return;

    const int dealt = damage_.projectileDamage(projectile);
    const bool killed = enemy.takeDamage(static_cast<float>(dealt), clock_.nowMs());
    projectile.recordHit(enemy.id());

    if (projectile.knockback() > 0.0f) {
        const float force = damage_.knockback(projectile.knockback());
        const float angle = Surge::angleBetween(projectile.position(), enemy.position());
        enemy.applyKnockback(Surge::fromAngle(angle, force), clock_.nowMs(), settings_.knockbackDurationMs);
    }
    if (killed) {
        enemyKilled(enemy);
    }
}

void CollisionResolver::enemyProjectileHitsPlayer(Projectile& projectile) {
    if (projectile.isDestroyed() || player_.isDead()) return;
    if (!playerDamageReady()) return;

    damagePlayer(projectile.damage());
    session_.markPlayerDamaged(clock_.nowMs());
    projectile.destroy();

    const float angle = Surge::angleBetween(projectile.position(), player_.position());
    const Surge::Vec2 push = Surge::fromAngle(angle, settings_.projectilePush);
    player_.applyPush(push);
    physics_.setVelocity(player_.body(), push);
}

void CollisionResolver::enemyTouchesPlayer(Enemy& enemy) {
    if (enemy.isDestroyed() || player_.isDead()) return;
    if (!playerDamageReady()) return;

    const int amount = DamagePipeline::playerDamage(enemy.damage());
    damagePlayer(static_cast<float>(amount));
    session_.markPlayerDamaged(clock_.nowMs());

    if (effects_.hasEffect("thorns") && !enemy.isDestroyed()) {
        const float thorns = static_cast<float>(amount) * effects_.getEffectValue("thorns");
        if (enemy.takeDamage(thorns, clock_.nowMs())) {
            enemyKilled(enemy);
        }
    }

    const float angle = Surge::angleBetween(enemy.position(), player_.position());
    const Surge::Vec2 push = Surge::fromAngle(angle, settings_.contactPush);
    player_.applyPush(push);
    physics_.setVelocity(player_.body(), push);
}

bool CollisionResolver::playerDamageReady() const {
    return session_.playerDamageReady(clock_.nowMs(), settings_.playerDamageCooldownMs);
}

void CollisionResolver::damagePlayer(float raw) {
    const int rounded = DamagePipeline::playerDamage(raw);
    const int amount = DamagePipeline::playerDamage(effects_.onPlayerDamage(static_cast<float>(rounded)));
    const int applied = player_.takeDamage(amount);
    if (applied > 0) {
        session_.playerDamaged(applied, player_.health());
    }
    if (player_.isDead()) {
        session_.playerDied();
    }
}

void CollisionResolver::enemyKilled(Enemy& enemy) {
    session_.recordKill(enemy);
    std::uniform_real_distribution<float> roll(0.0f, 1.0f);
    if (roll(rng_) < enemy.scoreChance()) {
        session_.awardPoints(1);
    }
    effects_.onEnemyKill(enemy);
}

ObstacleVerdict CollisionResolver::evaluateObstacleContact(Surge::BodyHandle projectileBody,
                                                           Surge::BodyHandle obstacleBody,
                                                           const Surge::Vec2& normal) const {
    ObstacleVerdict verdict{};
    verdict.normal = normal;

    auto ref = bodies_.lookup(projectileBody);
    if (!ref || !isProjectile(ref->kind)) {
        Surge::logDebug("Obstacle contact without projectile (body " + std::to_string(obstacleBody) + ")");
        return verdict;
    }
    verdict.projectile = *ref;
    const Projectile* projectile = findProjectile(*ref);
    if (!projectile || projectile->isDestroyed()) return verdict;

    verdict.effects.push_back(ObstacleEffect::NotifyObstacleHit);
    if (projectile->canCutTiles()) {
        verdict.effects.push_back(ObstacleEffect::ConsumePierce);
    } else if (ref->kind == EntityKind::PlayerProjectile && effects_.hasEffect("ricochet")) {
        verdict.effects.push_back(ObstacleEffect::Ricochet);
    } else {
        verdict.effects.push_back(ObstacleEffect::DestroyProjectile);
    }
    return verdict;
}

void CollisionResolver::commit(const ObstacleVerdict& verdict) {
    if (verdict.effects.empty()) return;
    Projectile* projectile = findProjectile(verdict.projectile);
    if (!projectile) return;

    for (auto effect : verdict.effects) {
        if (projectile->isDestroyed()) break;
        switch (effect) {
            case ObstacleEffect::NotifyObstacleHit:
                projectile->notifyObstacleHit();
                break;
            case ObstacleEffect::ConsumePierce:
                projectile->consumePierce();
                break;
            case ObstacleEffect::Ricochet: {
                const Surge::Vec2 vel = physics_.velocity(projectile->body());
                if (vel.x * verdict.normal.x + vel.y * verdict.normal.y < 0.0f) {
                    physics_.setVelocity(projectile->body(), Surge::reflect(vel, verdict.normal));
                }
                projectile->consumePierce();
                break;
            }
            case ObstacleEffect::DestroyProjectile:
                projectile->destroy();
                break;
        }
    }
}

Surge::ObstacleDecision CollisionResolver::resolveObstacle(const Surge::ContactEvent& contact) {
    auto first = bodies_.lookup(contact.a);
    const bool projectileIsA = first && isProjectile(first->kind);
    const Surge::BodyHandle projectileBody = projectileIsA ? contact.a : contact.b;
    const Surge::BodyHandle obstacleBody = projectileIsA ? contact.b : contact.a;
    const Surge::Vec2 normal = projectileIsA ? contact.normal : contact.normal * -1.0f;

    ObstacleVerdict verdict = evaluateObstacleContact(projectileBody, obstacleBody, normal);
    commit(verdict);
    return verdict.decision;
}

Projectile* CollisionResolver::findProjectile(const EntityRef& ref) const {
    if (ref.kind == EntityKind::PlayerProjectile) return arsenal_.find(ref.id);
    if (ref.kind == EntityKind::EnemyProjectile) return roster_.findProjectile(ref.id);
    return nullptr;
}

}  // namespace Arena
