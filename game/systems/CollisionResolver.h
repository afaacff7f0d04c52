// Turns physics contacts into combat outcomes: damage, knockback, projectile wear and score.
#pragma once

#include <random>
#include <vector>

#include "../../engine/core/TimerQueue.h"
#include "../../engine/physics/Contact.h"
#include "../../engine/physics/PhysicsWorld.h"
#include "../config/ArenaConfig.h"
#include "BodyIndex.h"
#include "DamagePipeline.h"

namespace Arena {

class CombatEffects;
class Enemy;
class EnemyRoster;
class Player;
class PlayerArsenal;
class Projectile;
class SessionState;

enum class ObstacleEffect {
    NotifyObstacleHit,
    ConsumePierce,
    Ricochet,
    DestroyProjectile,
};

// Outcome of a projectile touching an obstacle, computed before anything is mutated.
struct ObstacleVerdict {
    Surge::ObstacleDecision decision{Surge::ObstacleDecision::Pass};
    EntityRef projectile{};
    Surge::Vec2 normal{};  // obstacle surface normal, pointing at the projectile
    std::vector<ObstacleEffect> effects;
};

class CollisionResolver {
public:
    CollisionResolver(BodyIndex& bodies, EnemyRoster& roster, PlayerArsenal& arsenal, Player& player,
                      CombatEffects& effects, SessionState& session, Surge::PhysicsWorld& physics,
                      const CombatSettings& settings, const Surge::TimerQueue& clock, std::mt19937& rng);

    // Overlap contacts carry the combat rules; solid contacts are the physics layer's business.
    void resolve(const Surge::ContactEvent& contact);

    ObstacleVerdict evaluateObstacleContact(Surge::BodyHandle projectileBody, Surge::BodyHandle obstacleBody,
                                            const Surge::Vec2& normal) const;
    void commit(const ObstacleVerdict& verdict);
    // evaluate + commit; the decision tells the physics caller whether to block.
    Surge::ObstacleDecision resolveObstacle(const Surge::ContactEvent& contact);

private:
    void projectileHitsEnemy(Projectile& projectile, Enemy& enemy);
    void enemyProjectileHitsPlayer(Projectile& projectile);
    void enemyTouchesPlayer(Enemy& enemy);

    bool playerDamageReady() const;
    void damagePlayer(float raw);
    void enemyKilled(Enemy& enemy);
    Projectile* findProjectile(const EntityRef& ref) const;

    BodyIndex& bodies_;
    EnemyRoster& roster_;
    PlayerArsenal& arsenal_;
    Player& player_;
    CombatEffects& effects_;
    SessionState& session_;
    Surge::PhysicsWorld& physics_;
    const CombatSettings& settings_;
    const Surge::TimerQueue& clock_;
    std::mt19937& rng_;
    DamagePipeline damage_;
};

}  // namespace Arena
