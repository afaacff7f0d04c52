#include "Application.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

#include "Logger.h"

namespace Surge {

Application::Application(ApplicationListener& listener, WindowPtr window, WindowConfig config)
    : listener_(listener), window_(std::move(window)), config_(std::move(config)) {}

Application::~Application() { listener_.onShutdown(); }

bool Application::initialize() {
    if (!window_) {
        logError("Application requires a Window instance.");
        return false;
    }

    if (!window_->initialize(config_)) {
        logError("Failed to initialize window.");
        return false;
    }

    renderDevice_ = window_->createRenderDevice();
    if (!renderDevice_) {
        logError("Failed to create render device.");
        return false;
    }

    running_ = listener_.onInitialize(*this);
    return running_;
}

void Application::run() {
    while (running_ && window_->isOpen()) {
        const double rawDelta = measureDelta();

        window_->pollEvents(*this, input_);
        if (!running_) {
            break;
        }
        handleControlKeys();

        timeStep_.deltaSeconds = paused_ ? 0.0 : rawDelta;
        timeStep_.elapsedSeconds += timeStep_.deltaSeconds;
        listener_.onUpdate(timeStep_, input_);
        ++frameCount_;
        input_.nextFrame();
        window_->swapBuffers();
        renderDevice_->present();

        if (!config_.headless && rawDelta < kFixedStepSeconds) {
            std::this_thread::sleep_for(std::chrono::duration<double>(kFixedStepSeconds - rawDelta));
        }
    }

    logInfo("Application loop exited after " + std::to_string(frameCount_) + " frames.");
}

double Application::measureDelta() {
    using clock = std::chrono::steady_clock;
    if (config_.headless) {
        return kFixedStepSeconds;
    }
    const auto now = clock::now();
    if (!lastFrame_) {
        lastFrame_ = now;
        return kFixedStepSeconds;
    }
    const std::chrono::duration<double> dt = now - *lastFrame_;
    lastFrame_ = now;
    return std::min(dt.count(), kMaxFrameSeconds);
}

void Application::handleControlKeys() {
    if (input_.wasPressed(InputKey::Pause)) {
        setPaused(!paused_);
    }
    if (input_.wasPressed(InputKey::Restart)) {
        setPaused(false);
        listener_.onRestart();
    }
}

void Application::setPaused(bool paused) {
    if (paused_ == paused) {
        return;
    }
    paused_ = paused;
    logInfo(paused_ ? "Paused." : "Resumed.");
    listener_.onPauseChanged(paused_);
}

void Application::requestQuit(const std::string& reason) {
    if (!running_) {
        return;
    }
    running_ = false;
    logInfo("Shutdown requested: " + reason);
}

}  // namespace Surge
