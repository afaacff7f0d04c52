// SDL2 window: keyboard table for the arena keys; losing focus pauses the application.
#pragma once

#include <SDL.h>

#include <map>

#include "../input/InputState.h"
#include "Window.h"

namespace Surge {

class SDLWindow final : public Window {
public:
    // Bindings: WASD and arrows move, Escape pauses, Backspace restarts, E raises the shield.
    SDLWindow();
    ~SDLWindow() override;

    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<class RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, InputState& input) override;
    void swapBuffers() override;
    bool isOpen() const override { return isOpen_; }

private:
    SDL_Window* window_{nullptr};
    SDL_Renderer* renderer_{nullptr};
    std::map<SDL_Keycode, InputKey> bindings_;
    bool isOpen_{false};
};

}  // namespace Surge
