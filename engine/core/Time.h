// Time structures used by the main loop.
#pragma once

namespace Surge {

struct TimeStep {
    double deltaSeconds{0.0};
    double elapsedSeconds{0.0};

    double deltaMs() const { return deltaSeconds * 1000.0; }
};

}  // namespace Surge
