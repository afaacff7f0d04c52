#include "EnemyRoster.h"

#include <algorithm>
#include <limits>

#include "../../engine/core/Logger.h"
#include "../CollisionLayers.h"
#include "WaveScaling.h"

namespace Arena {

EnemyRoster::EnemyRoster(const ArenaConfig& config, Surge::PhysicsWorld& physics, BodyIndex& bodies,
                         std::mt19937& rng)
    : config_(config), physics_(physics), bodies_(bodies), rng_(rng) {}

Enemy* EnemyRoster::spawnEnemy(const std::string& typeId, std::optional<Surge::Vec2> position) {
    const EnemyDefinition* def = config_.findEnemy(typeId);
    if (!def) {
        Surge::logWarn("Unknown enemy type: " + typeId);
        return nullptr;
    }

    Surge::BodyDesc desc{};
    desc.layer = Layers::kEnemy;
    desc.position = position ? *position : randomEdgePosition();
    desc.halfExtents = Surge::Vec2{def->radius, def->radius};
    const Surge::BodyHandle body = physics_.createBody(desc);

    const int id = ++nextEnemyId_;
    auto enemy = std::make_unique<Enemy>(id, *def, waveMultiplier_,
                                         WaveScaling::speedMultiplier(currentWave_, def->speedCap), body);
    enemy->setPosition(desc.position);
    enemy->setDestroyHook([this](Enemy& e) { releaseBody(e.body()); });
    bodies_.bind(body, EntityRef{EntityKind::Enemy, id});

    enemies_.push_back(std::move(enemy));
    return enemies_.back().get();
}

Projectile* EnemyRoster::spawnEnemyProjectile(const Enemy& shooter, const Surge::Vec2& target) {
    const ProjectileDefinition* def = config_.findProjectile(shooter.definition().projectile);
    if (!def) {
        Surge::logWarn("Unknown projectile type: " + shooter.definition().projectile);
        return nullptr;
    }

    Surge::BodyDesc desc{};
    desc.layer = Layers::kEnemyProjectile;
    desc.position = shooter.position();
    desc.halfExtents = Surge::Vec2{def->radius, def->radius};
    const Surge::BodyHandle body = physics_.createBody(desc);
    physics_.setVelocity(body, Surge::fromAngle(Surge::angleBetween(shooter.position(), target), def->speed));

    const int id = ++nextProjectileId_;
    auto proj = std::make_unique<Projectile>(id, ProjectileOwner::Enemy, shooter.id(), *def, body);
    proj->setDamage(shooter.damage());
    proj->setPosition(desc.position);
    proj->setDestroyHook([this](Projectile& p) { releaseBody(p.body()); });
    bodies_.bind(body, EntityRef{EntityKind::EnemyProjectile, id});

    projectiles_.push_back(std::move(proj));
    return projectiles_.back().get();
}

void EnemyRoster::scaleEnemyStats(int wave) {
    waveMultiplier_ = WaveScaling::nextWaveMultiplier(waveMultiplier_, wave);
}

void EnemyRoster::resetScaling() {
    waveMultiplier_ = 1.0;
    currentWave_ = 0;
}

void EnemyRoster::update(const Surge::Vec2& playerPos, double nowMs, double deltaMs) {
    struct Split {
        std::string type;
        int count{0};
        Surge::Vec2 position{};
    };
    std::vector<Split> splits;

    for (int i = static_cast<int>(enemies_.size()) - 1; i >= 0; --i) {
        Enemy& enemy = *enemies_[i];
        if (enemy.isDestroyed()) {
            if (enemy.killed() && enemy.definition().splitCount > 0 && !enemy.definition().splitType.empty()) {
                splits.push_back(Split{enemy.definition().splitType, enemy.definition().splitCount, enemy.position()});
            }
            enemies_.erase(enemies_.begin() + i);
            continue;
        }
        enemy.setPosition(physics_.position(enemy.body()));
        physics_.setVelocity(enemy.body(), enemy.update(playerPos, nowMs));
        if (enemy.readyToFire(playerPos, nowMs)) {
            spawnEnemyProjectile(enemy, playerPos);
        }
    }

    for (int i = static_cast<int>(projectiles_.size()) - 1; i >= 0; --i) {
        Projectile& proj = *projectiles_[i];
        if (!proj.isDestroyed()) {
            proj.setPosition(physics_.position(proj.body()));
            proj.age(deltaMs);
            if (config_.playfield.outOfBounds(proj.position()) || proj.expired()) {
                proj.destroy();
            }
        }
        if (proj.isDestroyed()) {
            projectiles_.erase(projectiles_.begin() + i);
        }
    }

    for (const auto& split : splits) {
        for (int n = 0; n < split.count; ++n) {
            const float offset = (static_cast<float>(n) - (split.count - 1) * 0.5f) * 20.0f;
            spawnEnemy(split.type, Surge::Vec2{split.position.x + offset, split.position.y});
        }
    }
}

void EnemyRoster::clear() {
    for (auto& enemy : enemies_) {
        enemy->destroy();
    }
    enemies_.clear();
    clearProjectiles();
}

void EnemyRoster::clearProjectiles() {
    for (auto& proj : projectiles_) {
        proj->destroy();
    }
    projectiles_.clear();
}

std::size_t EnemyRoster::activeCount() const {
    std::size_t count = 0;
    for (const auto& enemy : enemies_) {
        if (!enemy->isDestroyed()) ++count;
    }
    return count;
}

Enemy* EnemyRoster::findEnemy(int id) {
    for (auto& enemy : enemies_) {
        if (enemy->id() == id) return enemy.get();
    }
    return nullptr;
}

Projectile* EnemyRoster::findProjectile(int id) {
    for (auto& proj : projectiles_) {
        if (proj->id() == id) return proj.get();
    }
    return nullptr;
}

Enemy* EnemyRoster::nearestEnemy(const Surge::Vec2& from) {
    Enemy* best = nullptr;
    float bestDist = std::numeric_limits<float>::max();
    for (auto& enemy : enemies_) {
        if (enemy->isDestroyed()) continue;
        const float d = Surge::distance(from, enemy->position());
        if (d < bestDist) {
            bestDist = d;
            best = enemy.get();
        }
    }
    return best;
}

int EnemyRoster::damageInRadius(const Surge::Vec2& center, float radius, float damage, double nowMs) {
    if (radius <= 0.0f || damage <= 0.0f) return 0;
    int killed = 0;
    for (auto& enemy : enemies_) {
        if (enemy->isDestroyed()) continue;
        const float dist = Surge::distance(center, enemy->position());
        if (dist > radius) continue;
        const float falloff = std::max(0.05f, 1.0f - (dist / radius) * 0.95f);
        if (enemy->takeDamage(damage * falloff, nowMs)) {
            ++killed;
        }
    }
    return killed;
}

std::string EnemyRoster::strongestOf(const std::vector<std::string>& typeIds) const {
    std::string best;
    float bestHealth = -1.0f;
    for (const auto& id : typeIds) {
        const EnemyDefinition* def = config_.findEnemy(id);
        if (def && def->health > bestHealth) {
            bestHealth = def->health;
            best = id;
        }
    }
    return best;
}

Surge::Vec2 EnemyRoster::randomEdgePosition() {
    const auto& field = config_.playfield;
    std::uniform_int_distribution<int> edgeDist(0, 3);
    std::uniform_real_distribution<float> alongX(0.0f, field.width);
    std::uniform_real_distribution<float> alongY(0.0f, field.height);
    switch (edgeDist(rng_)) {
        case 0: return Surge::Vec2{alongX(rng_), -field.margin};
        case 1: return Surge::Vec2{field.width + field.margin, alongY(rng_)};
        case 2: return Surge::Vec2{alongX(rng_), field.height + field.margin};
        default: return Surge::Vec2{-field.margin, alongY(rng_)};
    }
}

void EnemyRoster::releaseBody(Surge::BodyHandle body) {
    bodies_.unbind(body);
    if (!physics_.destroyBody(body)) {
        Surge::logDebug("Enemy body already released: " + std::to_string(body));
    }
}

}  // namespace Arena
