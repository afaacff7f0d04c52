#include "NullWindow.h"

#include <algorithm>
#include <string>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../render/NullRenderDevice.h"

namespace Surge {

NullWindow::NullWindow(int frameBudget) : frameBudget_(std::max(1, frameBudget)) {}

bool NullWindow::initialize(const WindowConfig& config) {
    isOpen_ = true;
    logInfo("NullWindow active: " + config.title + " (" + std::to_string(config.width) + "x" +
            std::to_string(config.height) + "), " + std::to_string(frameBudget_) + " frames.");
    return true;
}

std::unique_ptr<RenderDevice> NullWindow::createRenderDevice() {
    return std::make_unique<NullRenderDevice>();
}

void NullWindow::pollEvents(Application& app, InputState& input) {
    if (!isOpen_) {
        return;
    }
    for (auto key : held_) {
        input.setKeyDown(key, false);
    }
    held_.clear();
    if (framesRun_ >= frameBudget_) {
        isOpen_ = false;
        app.requestQuit("NullWindow frame budget exhausted.");
        return;
    }
    ++framesRun_;
    const auto range = taps_.equal_range(framesRun_);
    for (auto it = range.first; it != range.second; ++it) {
        input.setKeyDown(it->second, true);
        held_.push_back(it->second);
    }
}

void NullWindow::swapBuffers() {
    // Nothing to do for the null backend.
}

}  // namespace Surge
