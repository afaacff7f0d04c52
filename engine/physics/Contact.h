// Contact notifications delivered by the physics collaborator to game logic.
#pragma once

#include "../ecs/Entity.h"
#include "../math/Vec2.h"

namespace Surge {

using BodyHandle = ECS::Entity;
constexpr BodyHandle kInvalidBody = ECS::kInvalidEntity;

enum class ContactKind {
    Overlap,   // loose contact, bodies keep interpenetrating
    Solid,     // blocking contact, already separated by the physics world
    Obstacle,  // awaiting a Block/Pass decision before any response is applied
};

enum class ObstacleDecision { Pass, Block };

struct ContactEvent {
    ContactKind kind{ContactKind::Overlap};
    BodyHandle a{kInvalidBody};
    BodyHandle b{kInvalidBody};
    Vec2 normal{};  // unit axis of least penetration, pointing from b towards a
};

}  // namespace Surge
