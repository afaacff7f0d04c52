#include "Player.h"

#include <algorithm>

namespace Arena {

Player::Player(float maxHealth, Surge::BodyHandle body) : health_(maxHealth), maxHealth_(maxHealth), body_(body) {}

int Player::takeDamage(int amount) {
    if (amount <= 0 || isDead() || shielded_) return 0;
    health_ = std::max(0.0f, health_ - static_cast<float>(amount));
    return amount;
}

void Player::heal(float amount) {
    if (amount <= 0.0f || isDead()) return;
    health_ = std::min(maxHealth_, health_ + amount);
}

bool Player::activateShield() {
    if (shielded_) return false;
    shielded_ = true;
    return true;
}

void Player::update(double deltaSeconds) {
    const float decay = std::max(0.0f, 1.0f - static_cast<float>(deltaSeconds) * 5.0f);
    push_ = push_ * decay;
}

void Player::reset(float maxHealth) {
    maxHealth_ = maxHealth;
    health_ = maxHealth;
    shielded_ = false;
    push_ = Surge::Vec2{};
}

}  // namespace Arena
