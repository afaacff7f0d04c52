// Abstract physics collaborator: body lifecycle and kinematic state used by game logic.
#pragma once

#include <cstdint>

#include "Contact.h"

namespace Surge {

struct BodyDesc {
    std::uint8_t layer{0};
    Vec2 position{};
    Vec2 halfExtents{8.0f, 8.0f};
    bool isStatic{false};
};

class PhysicsWorld {
public:
    virtual ~PhysicsWorld() = default;

    virtual BodyHandle createBody(const BodyDesc& desc) = 0;
    // Returns false for unknown or already destroyed bodies.
    virtual bool destroyBody(BodyHandle body) = 0;
    virtual bool hasBody(BodyHandle body) const = 0;

    virtual Vec2 position(BodyHandle body) const = 0;
    virtual void setPosition(BodyHandle body, const Vec2& position) = 0;
    virtual Vec2 velocity(BodyHandle body) const = 0;
    virtual void setVelocity(BodyHandle body, const Vec2& velocity) = 0;
};

}  // namespace Surge
