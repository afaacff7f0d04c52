// Game-side hooks driven by Application: lifecycle, per-frame update and the session control keys.
#pragma once

namespace Surge {

class Application;
struct TimeStep;
class InputState;

class ApplicationListener {
public:
    virtual ~ApplicationListener() = default;

    virtual bool onInitialize(Application& app) = 0;
    // Called once per frame; step.deltaSeconds is 0 while the application is paused.
    virtual void onUpdate(const TimeStep& step, const InputState& input) = 0;
    virtual void onShutdown() = 0;

    // InputKey::Pause toggles the pause state, and a lost window focus pauses as well.
    virtual void onPauseChanged(bool paused) { (void)paused; }
    // InputKey::Restart; the application resumes before calling this.
    virtual void onRestart() {}
};

}  // namespace Surge
