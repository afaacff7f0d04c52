// Main loop: polls the window, routes the pause/restart keys and steps the listener.
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "ApplicationListener.h"
#include "Time.h"
#include "../input/InputState.h"
#include "../platform/Window.h"
#include "../render/RenderDevice.h"

namespace Surge {

class Application {
public:
    // Headless runs advance exactly kFixedStepSeconds per frame and never sleep. Windowed runs use the
    // measured frame time clamped to kMaxFrameSeconds, then sleep out the rest of the fixed step.
    static constexpr double kFixedStepSeconds = 1.0 / 60.0;
    static constexpr double kMaxFrameSeconds = 0.1;

    Application(ApplicationListener& listener, WindowPtr window, WindowConfig config = {});
    ~Application();

    bool initialize();
    void run();
    void requestQuit(const std::string& reason);

    // Notifies the listener only when the state actually changes.
    void setPaused(bool paused);
    bool paused() const { return paused_; }

    Window& window() { return *window_; }
    RenderDevice& renderer() { return *renderDevice_; }
    const WindowConfig& config() const { return config_; }
    const TimeStep& timeStep() const { return timeStep_; }
    std::uint64_t frameCount() const { return frameCount_; }

private:
    double measureDelta();
    void handleControlKeys();

    ApplicationListener& listener_;
    WindowPtr window_;
    WindowConfig config_;
    bool running_{false};
    bool paused_{false};
    TimeStep timeStep_{};
    std::uint64_t frameCount_{0};
    std::optional<std::chrono::steady_clock::time_point> lastFrame_;
    InputState input_{};
    RenderDevicePtr renderDevice_;
};

}  // namespace Surge
