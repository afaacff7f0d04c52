#include "SDLWindow.h"

#include <SDL.h>

#include <string>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../input/InputState.h"
#include "SDLRenderDevice.h"

namespace Surge {

SDLWindow::SDLWindow()
    : bindings_{{SDLK_w, InputKey::Forward},     {SDLK_UP, InputKey::Forward},   {SDLK_s, InputKey::Backward},
                {SDLK_DOWN, InputKey::Backward}, {SDLK_a, InputKey::Left},       {SDLK_LEFT, InputKey::Left},
                {SDLK_d, InputKey::Right},       {SDLK_RIGHT, InputKey::Right},  {SDLK_ESCAPE, InputKey::Pause},
                {SDLK_BACKSPACE, InputKey::Restart}, {SDLK_e, InputKey::Shield}} {}

SDLWindow::~SDLWindow() {
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
    }
    if (window_) {
        SDL_DestroyWindow(window_);
    }
    SDL_Quit();
}

bool SDLWindow::initialize(const WindowConfig& config) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS | SDL_INIT_TIMER) != 0) {
        logError(std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }

    Uint32 windowFlags = SDL_WINDOW_SHOWN;
    window_ = SDL_CreateWindow(config.title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               config.width, config.height, windowFlags);
    if (!window_) {
        logError(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        return false;
    }

    const auto rendererFlags = config.vsync ? SDL_RENDERER_PRESENTVSYNC : 0;
    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | rendererFlags);
    if (!renderer_) {
        logError(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        return false;
    }

    isOpen_ = true;
    logInfo("SDLWindow initialized.");
    return true;
}

std::unique_ptr<RenderDevice> SDLWindow::createRenderDevice() {
    if (!renderer_) {
        return nullptr;
    }
    return std::make_unique<SDLRenderDevice>(renderer_);
}

void SDLWindow::pollEvents(Application& app, InputState& input) {
    SDL_Event evt;
    while (SDL_PollEvent(&evt)) {
        switch (evt.type) {
            case SDL_QUIT:
                isOpen_ = false;
                app.requestQuit("Window close requested.");
                break;
            case SDL_WINDOWEVENT:
                if (evt.window.event == SDL_WINDOWEVENT_FOCUS_LOST) {
                    app.setPaused(true);
                }
                break;
            case SDL_KEYDOWN:
            case SDL_KEYUP: {
                if (evt.type == SDL_KEYDOWN && evt.key.repeat) break;
                auto it = bindings_.find(evt.key.keysym.sym);
                if (it != bindings_.end()) {
                    input.setKeyDown(it->second, evt.type == SDL_KEYDOWN);
                }
                break;
            }
            default:
                break;
        }
    }
}

void SDLWindow::swapBuffers() {
    // Present is driven by RenderDevice::present; no-op here to avoid double clear/present.
}

}  // namespace Surge
