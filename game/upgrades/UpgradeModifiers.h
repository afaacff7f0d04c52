// Stacked numeric stat modifiers per target ("bullet", "attack", ...).
#pragma once

#include <map>
#include <string>
#include <utility>

namespace Arena {

class UpgradeModifiers {
public:
    // Multiplicative values stack additively: two +5% upgrades give +10%.
    void addModifier(const std::string& target, const std::string& stat, float value, bool multiplicative = false);
    void removeModifier(const std::string& target, const std::string& stat);

    float additive(const std::string& target, const std::string& stat) const;
    float multiplicative(const std::string& target, const std::string& stat) const;

    // (base + additive) * (1 + multiplicative)
    float apply(const std::string& target, const std::string& stat, float base) const;

    void reset();

private:
    using Key = std::pair<std::string, std::string>;
    std::map<Key, float> additive_;
    std::map<Key, float> multiplicative_;
};

}  // namespace Arena
