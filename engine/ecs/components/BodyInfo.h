// Collision layer and mobility of a physics body.
#pragma once

#include <cstdint>

namespace Surge::ECS {

struct BodyInfo {
    std::uint8_t layer{0};
    bool isStatic{false};  // never moved by integration or separation
};

}  // namespace Surge::ECS
