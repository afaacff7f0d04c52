// SDL2 implementation of RenderDevice.
#pragma once

#include <SDL.h>

#include "../render/RenderDevice.h"

namespace Surge {

class SDLRenderDevice final : public RenderDevice {
public:
    explicit SDLRenderDevice(SDL_Renderer* renderer);

    void clear(const Color& color) override;
    void drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) override;
    void drawRectOutline(const Vec2& topLeft, const Vec2& size, const Color& color) override;
    void present() override;

private:
    SDL_Renderer* renderer_{nullptr};  // owned by SDLWindow
};

}  // namespace Surge
