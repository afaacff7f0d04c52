// Minimal ECS registry backing the physics world: entity lifecycle + component management.
// Ids are never reused, so a stale handle held by game code can never alias a newer entity.
#pragma once

#include <cstddef>
#include <set>
#include <utility>

#include "ComponentStorage.h"
#include "Entity.h"

namespace Surge::ECS {

class Registry {
public:
    Entity create() {
        const Entity id = ++lastIssued_;
        alive_.insert(id);
        return id;
    }

    // Returns false when the entity was already destroyed.
    bool destroy(Entity e) {
        if (alive_.erase(e) == 0) {
            return false;
        }
        storage_.removeAll(e);
        return true;
    }

    bool alive(Entity e) const { return alive_.count(e) > 0; }
    std::size_t size() const { return alive_.size(); }

    template <typename T, typename... Args>
    T& emplace(Entity e, Args&&... args) {
        return storage_.template pool<T>().emplace(e, std::forward<Args>(args)...);
    }

    template <typename T>
    T* get(Entity e) {
        return storage_.template pool<T>().get(e);
    }

    template <typename T>
    const T* get(Entity e) const {
        const auto* p = storage_.template pool<T>();
        return p ? p->get(e) : nullptr;
    }

    template <typename T>
    bool has(Entity e) const {
        const auto* p = storage_.template pool<T>();
        return p && p->contains(e);
    }

    template <typename Primary, typename... Rest, typename Func>
    void view(Func&& func) {
        auto& primaryPool = storage_.template pool<Primary>();
        for (auto& [entity, primary] : primaryPool) {
            if ((storage_.template pool<Rest>().contains(entity) && ...)) {
                func(entity, primary, *storage_.template pool<Rest>().get(entity)...);
            }
        }
    }

    template <typename Primary, typename... Rest, typename Func>
    void view(Func&& func) const {
        const auto* primaryPool = storage_.template pool<Primary>();
        if (!primaryPool) {
            return;
        }
        for (const auto& [entity, primary] : *primaryPool) {
            bool allHave = ((storage_.template pool<Rest>() && storage_.template pool<Rest>()->contains(entity)) && ...);
            if (allHave) {
                func(entity, primary, *storage_.template pool<Rest>()->get(entity)...);
            }
        }
    }

private:
    Entity lastIssued_{kInvalidEntity};
    std::set<Entity> alive_;
    ComponentStorage storage_;
};

}  // namespace Surge::ECS
