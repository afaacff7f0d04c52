// Per-type component pools keyed by entity id; iteration follows entity creation order.
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "Entity.h"

namespace Surge::ECS {

class PoolBase {
public:
    virtual ~PoolBase() = default;
    virtual bool erase(Entity e) = 0;
    virtual bool contains(Entity e) const = 0;
};

template <typename T>
class ComponentPool final : public PoolBase {
public:
    using Map = std::map<Entity, T>;

    // Re-emplacing on the same entity replaces the component.
    template <typename... Args>
    T& emplace(Entity e, Args&&... args) {
        auto result = items_.insert_or_assign(e, T{std::forward<Args>(args)...});
        return result.first->second;
    }

    T* get(Entity e) {
        auto it = items_.find(e);
        return it == items_.end() ? nullptr : &it->second;
    }

    const T* get(Entity e) const {
        auto it = items_.find(e);
        return it == items_.end() ? nullptr : &it->second;
    }

    bool erase(Entity e) override { return items_.erase(e) > 0; }
    bool contains(Entity e) const override { return items_.find(e) != items_.end(); }
    std::size_t size() const { return items_.size(); }

    typename Map::iterator begin() { return items_.begin(); }
    typename Map::iterator end() { return items_.end(); }
    typename Map::const_iterator begin() const { return items_.begin(); }
    typename Map::const_iterator end() const { return items_.end(); }

private:
    Map items_;
};

class ComponentStorage {
public:
    // Creates the pool on first use.
    template <typename T>
    ComponentPool<T>& pool() {
        auto& slot = pools_[std::type_index(typeid(T))];
        if (!slot) {
            slot = std::make_unique<ComponentPool<T>>();
        }
        return static_cast<ComponentPool<T>&>(*slot);
    }

    // nullptr until a component of this type has been added.
    template <typename T>
    const ComponentPool<T>* pool() const {
        auto it = pools_.find(std::type_index(typeid(T)));
        return it == pools_.end() ? nullptr : static_cast<const ComponentPool<T>*>(it->second.get());
    }

    void removeAll(Entity e) {
        for (auto& entry : pools_) {
            entry.second->erase(e);
        }
    }

private:
    std::map<std::type_index, std::unique_ptr<PoolBase>> pools_;
};

}  // namespace Surge::ECS
