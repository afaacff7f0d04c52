// ECS-backed axis-aligned physics world: integrates velocities and reports layer-filtered contacts.
#pragma once

#include <cstdint>
#include <vector>

#include "../ecs/Registry.h"
#include "PhysicsWorld.h"

namespace Surge {

enum class PairResponse {
    Overlap,  // report only
    Solid,    // separate, then report
    Process,  // report as ContactKind::Obstacle; separation only through blockContact()
};

class AabbPhysicsWorld final : public PhysicsWorld {
public:
    // Contacts between the two layers are reported with a body of `layerA` as ContactEvent::a.
    void addPairRule(std::uint8_t layerA, std::uint8_t layerB, PairResponse response);

    BodyHandle createBody(const BodyDesc& desc) override;
    bool destroyBody(BodyHandle body) override;
    bool hasBody(BodyHandle body) const override;

    Vec2 position(BodyHandle body) const override;
    void setPosition(BodyHandle body, const Vec2& position) override;
    Vec2 velocity(BodyHandle body) const override;
    void setVelocity(BodyHandle body, const Vec2& velocity) override;

    // Moves dynamic bodies, resolves solid pairs and returns this frame's contacts in rule order,
    // then body creation order.
    std::vector<ContactEvent> step(double deltaSeconds);

    // Applies a blocking response to a contact whose obstacle decision was Block.
    void blockContact(const ContactEvent& contact);

    std::size_t bodyCount() const { return registry_.size(); }

private:
    struct PairRule {
        std::uint8_t layerA{0};
        std::uint8_t layerB{0};
        PairResponse response{PairResponse::Overlap};
    };

    bool overlapping(ECS::Entity a, ECS::Entity b, Vec2& normal, float& depth) const;
    void separate(ECS::Entity a, ECS::Entity b, const Vec2& normal, float depth);
    std::vector<ECS::Entity> bodiesOnLayer(std::uint8_t layer) const;

    ECS::Registry registry_;
    std::vector<PairRule> rules_;
};

}  // namespace Surge
