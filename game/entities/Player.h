// The player avatar: health, shield ability and the push impulse left by hits.
#pragma once

#include "../../engine/math/Vec2.h"
#include "../../engine/physics/Contact.h"

namespace Arena {

class Player {
public:
    Player() = default;
    Player(float maxHealth, Surge::BodyHandle body);

    Surge::BodyHandle body() const { return body_; }
    void setBody(Surge::BodyHandle body) { body_ = body; }

    float health() const { return health_; }
    float maxHealth() const { return maxHealth_; }
    bool isDead() const { return health_ <= 0.0f; }

    // Returns the damage actually applied (0 while shielded or dead).
    int takeDamage(int amount);
    void heal(float amount);

    // Returns false if the shield was already up.
    bool activateShield();
    void deactivateShield() { shielded_ = false; }
    bool shielded() const { return shielded_; }

    void applyPush(const Surge::Vec2& impulse) { push_ = impulse; }
    const Surge::Vec2& push() const { return push_; }
    // Push decays to zero over roughly a fifth of a second.
    void update(double deltaSeconds);

    const Surge::Vec2& position() const { return position_; }
    void setPosition(const Surge::Vec2& p) { position_ = p; }

    void reset(float maxHealth);

private:
    float health_{100.0f};
    float maxHealth_{100.0f};
    Surge::BodyHandle body_{Surge::kInvalidBody};
    bool shielded_{false};
    Surge::Vec2 push_{};
    Surge::Vec2 position_{};
};

}  // namespace Arena
