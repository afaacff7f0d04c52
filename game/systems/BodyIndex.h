// Bidirectional map between physics bodies and the game entities that own them.
#pragma once

#include <map>
#include <optional>

#include "../../engine/physics/Contact.h"

namespace Arena {

enum class EntityKind { Player, Enemy, PlayerProjectile, EnemyProjectile, Obstacle };

struct EntityRef {
    EntityKind kind{EntityKind::Enemy};
    int id{0};

    bool operator<(const EntityRef& rhs) const {
        return kind != rhs.kind ? kind < rhs.kind : id < rhs.id;
    }
};

class BodyIndex {
public:
    // Returns false if the body is already bound.
    bool bind(Surge::BodyHandle body, EntityRef ref);
    bool unbind(Surge::BodyHandle body);

    std::optional<EntityRef> lookup(Surge::BodyHandle body) const;
    Surge::BodyHandle bodyOf(EntityRef ref) const;
    std::size_t size() const { return byBody_.size(); }

private:
    std::map<Surge::BodyHandle, EntityRef> byBody_;
    std::map<EntityRef, Surge::BodyHandle> byEntity_;
};

}  // namespace Arena
