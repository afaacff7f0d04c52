// Position component (engine-agnostic).
#pragma once

#include "../../math/Vec2.h"

namespace Surge::ECS {

struct Transform {
    Vec2 position{};
};

}  // namespace Surge::ECS
