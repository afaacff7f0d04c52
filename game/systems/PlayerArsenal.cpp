#include "PlayerArsenal.h"

#include "../../engine/core/Logger.h"
#include "../CollisionLayers.h"
#include "../upgrades/CombatEffects.h"

namespace Arena {

PlayerArsenal::PlayerArsenal(const ArenaConfig& config, Surge::PhysicsWorld& physics, BodyIndex& bodies)
    : config_(config), physics_(physics), bodies_(bodies) {}

std::vector<float> spreadAngles(float aim, int count, float step) {
    std::vector<float> angles;
    if (count <= 0) return angles;
    angles.reserve(static_cast<std::size_t>(count));
    const float centre = static_cast<float>(count - 1) * 0.5f;
    for (int i = 0; i < count; ++i) {
        angles.push_back(aim + (static_cast<float>(i) - centre) * step);
    }
    return angles;
}

Projectile* PlayerArsenal::fire(const std::string& presetId, const Surge::Vec2& origin, float angle, int ownerId) {
    const ProjectileDefinition* def = config_.findProjectile(presetId);
    if (!def) {
        Surge::logWarn("Unknown projectile preset: " + presetId);
        return nullptr;
    }

    Surge::BodyDesc desc{};
    desc.layer = Layers::kPlayerProjectile;
    desc.position = origin;
    desc.halfExtents = Surge::Vec2{def->radius, def->radius};
    const Surge::BodyHandle body = physics_.createBody(desc);
    const float speed = effects_ ? effects_->applyModifiers("bullet", "speed", def->speed) : def->speed;
    physics_.setVelocity(body, Surge::fromAngle(angle, speed));

    const int id = ++nextId_;
    auto proj = std::make_unique<Projectile>(id, ProjectileOwner::Player, ownerId, *def, body);
    proj->setPosition(origin);
    proj->setDestroyHook([this](Projectile& p) {
        bodies_.unbind(p.body());
        if (!physics_.destroyBody(p.body())) {
            Surge::logDebug("Projectile body already released: " + std::to_string(p.body()));
        }
    });
    bodies_.bind(body, EntityRef{EntityKind::PlayerProjectile, id});

    projectiles_.push_back(std::move(proj));
    return projectiles_.back().get();
}

void PlayerArsenal::update(double deltaMs) {
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
}

void PlayerArsenal::clear() {
    for (auto& proj : projectiles_) {
        proj->destroy();
    }
    projectiles_.clear();
}

Projectile* PlayerArsenal::find(int id) {
    for (auto& proj : projectiles_) {
        if (proj->id() == id) return proj.get();
    }
    return nullptr;
}

std::size_t PlayerArsenal::activeCount() const {
    std::size_t count = 0;
    for (const auto& proj : projectiles_) {
        if (!proj->isDestroyed()) ++count;
    }
    return count;
}

}  // namespace Arena
