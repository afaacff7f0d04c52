#include "UpgradeModifiers.h"

namespace Arena {

void UpgradeModifiers::addModifier(const std::string& target, const std::string& stat, float value,
                                   bool multiplicative) {
    auto& bucket = multiplicative ? multiplicative_ : additive_;
    bucket[Key{target, stat}] += value;
}

void UpgradeModifiers::removeModifier(const std::string& target, const std::string& stat) {
    additive_.erase(Key{target, stat});
    multiplicative_.erase(Key{target, stat});
}

float UpgradeModifiers::additive(const std::string& target, const std::string& stat) const {
    auto it = additive_.find(Key{target, stat});
    return it != additive_.end() ? it->second : 0.0f;
}

float UpgradeModifiers::multiplicative(const std::string& target, const std::string& stat) const {
    auto it = multiplicative_.find(Key{target, stat});
    return it != multiplicative_.end() ? it->second : 0.0f;
}

float UpgradeModifiers::apply(const std::string& target, const std::string& stat, float base) const {
    return (base + additive(target, stat)) * (1.0f + multiplicative(target, stat));
}

void UpgradeModifiers::reset() {
    additive_.clear();
    multiplicative_.clear();
}

}  // namespace Arena
