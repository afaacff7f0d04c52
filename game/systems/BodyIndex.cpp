#include "BodyIndex.h"

namespace Arena {

bool BodyIndex::bind(Surge::BodyHandle body, EntityRef ref) {
    if (body == Surge::kInvalidBody || byBody_.count(body) > 0) return false;
    byBody_[body] = ref;
    byEntity_[ref] = body;
    return true;
}

bool BodyIndex::unbind(Surge::BodyHandle body) {
    auto it = byBody_.find(body);
    if (it == byBody_.end()) return false;
    byEntity_.erase(it->second);
    byBody_.erase(it);
    return true;
}

std::optional<EntityRef> BodyIndex::lookup(Surge::BodyHandle body) const {
    auto it = byBody_.find(body);
    if (it == byBody_.end()) return std::nullopt;
    return it->second;
}

Surge::BodyHandle BodyIndex::bodyOf(EntityRef ref) const {
    auto it = byEntity_.find(ref);
    return it != byEntity_.end() ? it->second : Surge::kInvalidBody;
}

}  // namespace Arena
