// Headless window: stays open for a fixed number of frames, then requests shutdown.
// Scripted key taps stand in for a keyboard.
#pragma once

#include <map>
#include <vector>

#include "../input/InputState.h"
#include "Window.h"

namespace Surge {

class NullWindow final : public Window {
public:
    explicit NullWindow(int frameBudget = 1);

    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<class RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, class InputState& input) override;
    void swapBuffers() override;
    bool isOpen() const override { return isOpen_; }

    // Holds `key` down during frame `frame` (1-based) and releases it on the next poll.
    void tapKey(int frame, InputKey key) { taps_.emplace(frame, key); }

    int framesRun() const { return framesRun_; }

private:
    std::multimap<int, InputKey> taps_;
    std::vector<InputKey> held_;
    int frameBudget_{1};
    int framesRun_{0};
    bool isOpen_{false};
};

}  // namespace Surge
