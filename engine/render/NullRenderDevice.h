// No-op renderer used by NullWindow and headless runs; counts frames for smoke checks.
#pragma once

#include <cstddef>

#include "RenderDevice.h"

namespace Surge {

class NullRenderDevice final : public RenderDevice {
public:
    void clear(const Color& /*color*/) override {}
    void drawFilledRect(const Vec2& /*topLeft*/, const Vec2& /*size*/, const Color& /*color*/) override { ++rects_; }
    void present() override { ++frames_; }

    std::size_t framesPresented() const { return frames_; }
    std::size_t rectsDrawn() const { return rects_; }

private:
    std::size_t frames_{0};
    std::size_t rects_{0};
};

}  // namespace Surge
