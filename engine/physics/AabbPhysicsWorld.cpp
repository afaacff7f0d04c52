#include "AabbPhysicsWorld.h"

#include <cmath>

#include "../ecs/components/AABB.h"
#include "../ecs/components/BodyInfo.h"
#include "../ecs/components/Transform.h"
#include "../ecs/components/Velocity.h"

namespace Surge {

void AabbPhysicsWorld::addPairRule(std::uint8_t layerA, std::uint8_t layerB, PairResponse response) {
    rules_.push_back(PairRule{layerA, layerB, response});
}

BodyHandle AabbPhysicsWorld::createBody(const BodyDesc& desc) {
    auto e = registry_.create();
    registry_.emplace<ECS::Transform>(e, ECS::Transform{desc.position});
    registry_.emplace<ECS::Velocity>(e, ECS::Velocity{});
    registry_.emplace<ECS::AABB>(e, ECS::AABB{desc.halfExtents});
    registry_.emplace<ECS::BodyInfo>(e, ECS::BodyInfo{desc.layer, desc.isStatic});
    return e;
}

bool AabbPhysicsWorld::destroyBody(BodyHandle body) { return registry_.destroy(body); }

bool AabbPhysicsWorld::hasBody(BodyHandle body) const { return registry_.alive(body); }

Vec2 AabbPhysicsWorld::position(BodyHandle body) const {
    const auto* tf = registry_.get<ECS::Transform>(body);
    return tf ? tf->position : Vec2{};
}

void AabbPhysicsWorld::setPosition(BodyHandle body, const Vec2& position) {
    if (auto* tf = registry_.get<ECS::Transform>(body)) {
        tf->position = position;
    }
}

Vec2 AabbPhysicsWorld::velocity(BodyHandle body) const {
    const auto* vel = registry_.get<ECS::Velocity>(body);
    return vel ? vel->value : Vec2{};
}

void AabbPhysicsWorld::setVelocity(BodyHandle body, const Vec2& velocity) {
    if (auto* vel = registry_.get<ECS::Velocity>(body)) {
        vel->value = velocity;
    }
}

std::vector<ContactEvent> AabbPhysicsWorld::step(double deltaSeconds) {
    const float dt = static_cast<float>(deltaSeconds);
    registry_.view<ECS::Transform, ECS::Velocity, ECS::BodyInfo>(
        [dt](ECS::Entity, ECS::Transform& tf, ECS::Velocity& vel, ECS::BodyInfo& info) {
            if (!info.isStatic) {
                tf.position += vel.value * dt;
            }
        });

    std::vector<ContactEvent> contacts;
    for (const auto& rule : rules_) {
        const auto first = bodiesOnLayer(rule.layerA);
        const bool sameLayer = rule.layerA == rule.layerB;
        const auto second = sameLayer ? first : bodiesOnLayer(rule.layerB);
        for (std::size_t i = 0; i < first.size(); ++i) {
            for (std::size_t j = sameLayer ? i + 1 : 0; j < second.size(); ++j) {
                Vec2 normal{};
                float depth = 0.0f;
                if (!overlapping(first[i], second[j], normal, depth)) continue;

                ContactEvent contact{};
                contact.a = first[i];
                contact.b = second[j];
                contact.normal = normal;
                switch (rule.response) {
                    case PairResponse::Overlap:
                        contact.kind = ContactKind::Overlap;
                        break;
                    case PairResponse::Solid:
                        contact.kind = ContactKind::Solid;
                        separate(first[i], second[j], normal, depth);
                        break;
                    case PairResponse::Process:
                        contact.kind = ContactKind::Obstacle;
                        break;
                }
                contacts.push_back(contact);
            }
        }
    }
    return contacts;
}

void AabbPhysicsWorld::blockContact(const ContactEvent& contact) {
    if (!registry_.alive(contact.a) || !registry_.alive(contact.b)) {
        return;
    }
    Vec2 normal{};
    float depth = 0.0f;
    if (overlapping(contact.a, contact.b, normal, depth)) {
        separate(contact.a, contact.b, normal, depth);
        if (auto* vel = registry_.get<ECS::Velocity>(contact.a)) {
            vel->value = Vec2{0.0f, 0.0f};
        }
    }
}

bool AabbPhysicsWorld::overlapping(ECS::Entity a, ECS::Entity b, Vec2& normal, float& depth) const {
    const auto* ta = registry_.get<ECS::Transform>(a);
    const auto* tb = registry_.get<ECS::Transform>(b);
    const auto* aa = registry_.get<ECS::AABB>(a);
    const auto* ab = registry_.get<ECS::AABB>(b);
    if (!ta || !tb || !aa || !ab) return false;

    const float dx = ta->position.x - tb->position.x;
    const float dy = ta->position.y - tb->position.y;
    const float px = (aa->halfExtents.x + ab->halfExtents.x) - std::abs(dx);
    const float py = (aa->halfExtents.y + ab->halfExtents.y) - std::abs(dy);
    if (px < 0.0f || py < 0.0f) return false;

    if (px < py) {
        normal = Vec2{dx < 0.0f ? -1.0f : 1.0f, 0.0f};
        depth = px;
    } else {
        normal = Vec2{0.0f, dy < 0.0f ? -1.0f : 1.0f};
        depth = py;
    }
    return true;
}

void AabbPhysicsWorld::separate(ECS::Entity a, ECS::Entity b, const Vec2& normal, float depth) {
    auto* ta = registry_.get<ECS::Transform>(a);
    auto* tb = registry_.get<ECS::Transform>(b);
    const auto* ia = registry_.get<ECS::BodyInfo>(a);
    const auto* ib = registry_.get<ECS::BodyInfo>(b);
    if (!ta || !tb || !ia || !ib) return;

    const bool moveA = !ia->isStatic;
    const bool moveB = !ib->isStatic;
    if (moveA && moveB) {
        ta->position += normal * (depth * 0.5f);
        tb->position += normal * (-depth * 0.5f);
    } else if (moveA) {
        ta->position += normal * depth;
    } else if (moveB) {
        tb->position += normal * -depth;
    }
}

std::vector<ECS::Entity> AabbPhysicsWorld::bodiesOnLayer(std::uint8_t layer) const {
    std::vector<ECS::Entity> out;
    registry_.view<ECS::BodyInfo>([&out, layer](ECS::Entity e, const ECS::BodyInfo& info) {
        if (info.layer == layer) out.push_back(e);
    });
    return out;
}

}  // namespace Surge
