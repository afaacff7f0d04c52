// Game layer bootstrap: wires the combat core to the physics host and the engine loop.
#pragma once

#include <random>
#include <vector>

#include "../engine/core/ApplicationListener.h"
#include "../engine/core/TimerQueue.h"
#include "../engine/input/InputState.h"
#include "../engine/physics/AabbPhysicsWorld.h"
#include "../engine/render/RenderDevice.h"
#include "config/ArenaConfig.h"
#include "entities/Player.h"
#include "session/SessionState.h"
#include "systems/BodyIndex.h"
#include "systems/CollisionResolver.h"
#include "systems/EnemyRoster.h"
#include "systems/PlayerArsenal.h"
#include "systems/WaveSystem.h"
#include "upgrades/UpgradeEffects.h"
#include "upgrades/UpgradeModifiers.h"

namespace Arena {

class ArenaGame final : public Surge::ApplicationListener {
public:
    explicit ArenaGame(ArenaConfig config = ArenaConfig::defaults(), unsigned int seed = 1337u);

    bool onInitialize(Surge::Application& app) override;
    void onUpdate(const Surge::TimeStep& step, const Surge::InputState& input) override;
    void onShutdown() override;
    void onPauseChanged(bool paused) override;
    void onRestart() override;

    // Starts wave 1; called by onInitialize, or directly when driving tick() by hand.
    void start();
    void restart();
    // One simulation frame: timers, movement, contacts, sweeps, wave bookkeeping.
    void tick(double deltaSeconds, const Surge::InputState& input);

    Surge::BodyHandle addObstacle(const Surge::Vec2& center, const Surge::Vec2& halfExtents);

    const ArenaConfig& config() const { return config_; }
    SessionState& session() { return session_; }
    WaveSystem& waves() { return waves_; }
    EnemyRoster& roster() { return roster_; }
    PlayerArsenal& arsenal() { return arsenal_; }
    CollisionResolver& resolver() { return resolver_; }
    BodyIndex& bodies() { return bodies_; }
    Player& player() { return player_; }
    UpgradeModifiers& modifiers() { return modifiers_; }
    UpgradeEffects& effects() { return effects_; }
    Surge::TimerQueue& timers() { return timers_; }
    Surge::AabbPhysicsWorld& physics() { return physics_; }
    bool paused() const { return paused_; }

private:
    void configurePhysics();
    void movePlayer(const Surge::InputState& input);
    void autoFire(double deltaMs);
    void checkWaveProgress();
    void render(Surge::RenderDevice& device) const;

    ArenaConfig config_;
    std::mt19937 rng_;
    Surge::TimerQueue timers_;
    Surge::AabbPhysicsWorld physics_;
    BodyIndex bodies_;
    SessionState session_;
    Player player_;
    UpgradeModifiers modifiers_;
    UpgradeEffects effects_;
    EnemyRoster roster_;
    PlayerArsenal arsenal_;
    CollisionResolver resolver_;
    WaveSystem waves_;

    Surge::Application* app_{nullptr};
    std::vector<Surge::BodyHandle> obstacles_;
    double fireCooldownMs_{0.0};
    Surge::TimerHandle intermissionTimer_{Surge::kInvalidTimer};
    Surge::TimerHandle shieldTimer_{Surge::kInvalidTimer};
    bool started_{false};
    bool paused_{false};
};

}  // namespace Arena
