// Per-frame input snapshot for the arena front end.
#pragma once

#include <array>

namespace Surge {

enum class InputKey {
    Forward = 0,
    Backward,
    Left,
    Right,
    Restart,
    Pause,
    Shield,
    Count
};

class InputState {
public:
    void setKeyDown(InputKey key, bool down) {
        const int idx = static_cast<int>(key);
        if (down && !keys_[idx]) {
            pressed_[idx] = true;
        }
        keys_[idx] = down;
    }
    bool isDown(InputKey key) const { return keys_[static_cast<int>(key)]; }
    // True only on the frame the key went down.
    bool wasPressed(InputKey key) const { return pressed_[static_cast<int>(key)]; }

    void nextFrame() { pressed_.fill(false); }

private:
    std::array<bool, static_cast<int>(InputKey::Count)> keys_{};
    std::array<bool, static_cast<int>(InputKey::Count)> pressed_{};
};

}  // namespace Surge
