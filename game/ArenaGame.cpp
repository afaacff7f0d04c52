#include "ArenaGame.h"

#include <algorithm>
#include <initializer_list>
#include <string>
#include <utility>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/core/Time.h"
#include "../engine/render/Color.h"
#include "CollisionLayers.h"
#include "upgrades/EffectHandlers.h"

namespace Arena {

namespace {
constexpr double kShieldDurationMs = 3000.0;
}  // namespace

ArenaGame::ArenaGame(ArenaConfig config, unsigned int seed)
    : config_(std::move(config)),
      rng_(seed),
      effects_(modifiers_),
      roster_(config_, physics_, bodies_, rng_),
      arsenal_(config_, physics_, bodies_),
      resolver_(bodies_, roster_, arsenal_, player_, effects_, session_, physics_, config_.combat, timers_, rng_),
      waves_(roster_, session_, timers_, config_.waves, rng_) {
    configurePhysics();
    arsenal_.setEffects(&effects_);
    registerEffectHandlers(effects_, player_);
    registerKillEffects(effects_, roster_, timers_);

    Surge::BodyDesc desc{};
    desc.layer = Layers::kPlayer;
    desc.position = config_.playfield.center();
    desc.halfExtents = Surge::Vec2{config_.player.radius, config_.player.radius};
    const Surge::BodyHandle body = physics_.createBody(desc);
    player_ = Player(config_.player.maxHealth, body);
    player_.setPosition(desc.position);
    bodies_.bind(body, EntityRef{EntityKind::Player, 0});

    session_.signals().clearProjectiles = [this]() { arsenal_.clear(); };
    session_.signals().playerDeath = [this]() {
        Surge::logInfo("Player died on wave " + std::to_string(waves_.currentWave()) + " with " +
                       std::to_string(session_.points()) + " points");
    };
}

void ArenaGame::configurePhysics() {
    using Surge::PairResponse;
    physics_.addPairRule(Layers::kEnemy, Layers::kPlayerProjectile, PairResponse::Overlap);
    physics_.addPairRule(Layers::kPlayer, Layers::kEnemyProjectile, PairResponse::Overlap);
    // Contact damage is reported before the pair is pushed apart.
    physics_.addPairRule(Layers::kPlayer, Layers::kEnemy, PairResponse::Overlap);
    physics_.addPairRule(Layers::kPlayer, Layers::kEnemy, PairResponse::Solid);
    physics_.addPairRule(Layers::kEnemy, Layers::kEnemy, PairResponse::Solid);
    physics_.addPairRule(Layers::kPlayerProjectile, Layers::kObstacle, PairResponse::Process);
    physics_.addPairRule(Layers::kEnemyProjectile, Layers::kObstacle, PairResponse::Process);
    physics_.addPairRule(Layers::kPlayer, Layers::kObstacle, PairResponse::Solid);
    physics_.addPairRule(Layers::kEnemy, Layers::kObstacle, PairResponse::Solid);
}

bool ArenaGame::onInitialize(Surge::Application& app) {
    app_ = &app;
    const auto& field = config_.playfield;
    const Surge::Vec2 pillar{24.0f, 24.0f};
    addObstacle(Surge::Vec2{field.width * 0.25f, field.height * 0.3f}, pillar);
    addObstacle(Surge::Vec2{field.width * 0.75f, field.height * 0.3f}, pillar);
    addObstacle(Surge::Vec2{field.width * 0.25f, field.height * 0.7f}, pillar);
    addObstacle(Surge::Vec2{field.width * 0.75f, field.height * 0.7f}, pillar);
    start();
    return true;
}

void ArenaGame::onUpdate(const Surge::TimeStep& step, const Surge::InputState& input) {
    if (!paused_ && step.deltaSeconds > 0.0) {
        tick(step.deltaSeconds, input);
    }
    if (app_) {
        render(app_->renderer());
    }
}

void ArenaGame::onShutdown() {
    Surge::logInfo("Session over: wave " + std::to_string(waves_.currentWave()) + ", " +
                   std::to_string(session_.kills()) + " kills, " + std::to_string(session_.points()) + " points");
}

void ArenaGame::onPauseChanged(bool paused) { paused_ = paused; }

void ArenaGame::onRestart() { restart(); }

void ArenaGame::start() {
    if (started_) return;
    started_ = true;
    waves_.startNextWave();
}

void ArenaGame::restart() {
    for (auto* handle : {&intermissionTimer_, &shieldTimer_}) {
        if (*handle != Surge::kInvalidTimer) {
            timers_.cancel(*handle);
            *handle = Surge::kInvalidTimer;
        }
    }
    roster_.clear();
    arsenal_.clear();
    waves_.reset();
    session_.reset();
    modifiers_.reset();
    effects_.reset();

    player_.reset(config_.player.maxHealth);
    player_.setPosition(config_.playfield.center());
    physics_.setPosition(player_.body(), player_.position());
    physics_.setVelocity(player_.body(), Surge::Vec2{});
    fireCooldownMs_ = 0.0;
    paused_ = false;
    started_ = false;
    Surge::logInfo("Session restarted");
    start();
}

Surge::BodyHandle ArenaGame::addObstacle(const Surge::Vec2& center, const Surge::Vec2& halfExtents) {
    Surge::BodyDesc desc{};
    desc.layer = Layers::kObstacle;
    desc.position = center;
    desc.halfExtents = halfExtents;
    desc.isStatic = true;
    const Surge::BodyHandle body = physics_.createBody(desc);
    bodies_.bind(body, EntityRef{EntityKind::Obstacle, static_cast<int>(obstacles_.size())});
    obstacles_.push_back(body);
    return body;
}

void ArenaGame::tick(double deltaSeconds, const Surge::InputState& input) {
    if (session_.playerDead()) return;
    const double deltaMs = deltaSeconds * 1000.0;

    timers_.advance(deltaMs);

    if (input.wasPressed(Surge::InputKey::Shield) && effects_.hasAbility("shield") && player_.activateShield()) {
        shieldTimer_ = timers_.schedule(kShieldDurationMs, [this]() {
            player_.deactivateShield();
            shieldTimer_ = Surge::kInvalidTimer;
        });
    }

    movePlayer(input);
    autoFire(deltaMs);

    const auto contacts = physics_.step(deltaSeconds);
    player_.setPosition(physics_.position(player_.body()));
    for (const auto& contact : contacts) {
        if (contact.kind == Surge::ContactKind::Obstacle) {
            if (resolver_.resolveObstacle(contact) == Surge::ObstacleDecision::Block) {
                physics_.blockContact(contact);
            }
        } else {
            resolver_.resolve(contact);
        }
    }

    effects_.onUpdate(deltaMs);
    player_.update(deltaSeconds);
    roster_.update(player_.position(), timers_.nowMs(), deltaMs);
    arsenal_.update(deltaMs);
    checkWaveProgress();
}

void ArenaGame::movePlayer(const Surge::InputState& input) {
    Surge::Vec2 dir{};
    if (input.isDown(Surge::InputKey::Forward)) dir.y -= 1.0f;
    if (input.isDown(Surge::InputKey::Backward)) dir.y += 1.0f;
    if (input.isDown(Surge::InputKey::Left)) dir.x -= 1.0f;
    if (input.isDown(Surge::InputKey::Right)) dir.x += 1.0f;
    const float len = dir.length();
    if (len > 0.0f) {
        dir = dir * (1.0f / len);
    }
    const float speed = modifiers_.apply("player", "speed", config_.player.speed);
    physics_.setVelocity(player_.body(), dir * speed + player_.push());

    // Keep the player inside the playfield.
    const auto& field = config_.playfield;
    const float r = config_.player.radius;
    Surge::Vec2 pos = physics_.position(player_.body());
    pos.x = std::clamp(pos.x, r, field.width - r);
    pos.y = std::clamp(pos.y, r, field.height - r);
    physics_.setPosition(player_.body(), pos);
    player_.setPosition(pos);
}

void ArenaGame::autoFire(double deltaMs) {
    fireCooldownMs_ -= deltaMs;
    if (fireCooldownMs_ > 0.0) return;
    const Enemy* target = roster_.nearestEnemy(player_.position());
    if (!target) return;
    const float aim = Surge::angleBetween(player_.position(), target->position());
    const int shots = 1 + static_cast<int>(effects_.getEffectValue("multishot"));
    bool fired = false;
    for (float angle : spreadAngles(aim, shots)) {
        fired = arsenal_.fire(config_.player.weapon, player_.position(), angle) != nullptr || fired;
    }
    if (fired) {
        const double rate = std::max(0.1f, modifiers_.apply("player", "fireRate", 1.0f));
        fireCooldownMs_ = config_.player.fireIntervalMs / rate;
    }
}

void ArenaGame::checkWaveProgress() {
    if (!waves_.isWaveComplete()) return;
    waves_.completeWave();
    intermissionTimer_ = timers_.schedule(config_.waves.intermissionMs, [this]() {
        intermissionTimer_ = Surge::kInvalidTimer;
        waves_.startNextWave();
    });
}

void ArenaGame::render(Surge::RenderDevice& device) const {
    device.clear(Surge::Color{12, 12, 20, 255});

    auto drawCentered = [&device](const Surge::Vec2& center, float half, const Surge::Color& color) {
        device.drawFilledRect(Surge::Vec2{center.x - half, center.y - half}, Surge::Vec2{half * 2.0f, half * 2.0f},
                              color);
    };

    for (auto body : obstacles_) {
        drawCentered(physics_.position(body), 24.0f, Surge::Color{70, 70, 90, 255});
    }
    for (const auto& enemy : roster_.enemies()) {
        if (enemy->isDestroyed()) continue;
        const float r = enemy->definition().radius;
        drawCentered(enemy->position(), r, Surge::colorFromHex(enemy->definition().color));
        if (enemy->shielded()) {
            device.drawRectOutline(Surge::Vec2{enemy->position().x - r - 4.0f, enemy->position().y - r - 4.0f},
                                   Surge::Vec2{r * 2.0f + 8.0f, r * 2.0f + 8.0f}, Surge::Color{0, 255, 255, 200});
        }
    }
    for (const auto& proj : roster_.projectiles()) {
        if (!proj->isDestroyed()) drawCentered(proj->position(), 4.0f, Surge::Color{255, 100, 100, 255});
    }
    for (const auto& proj : arsenal_.projectiles()) {
        if (!proj->isDestroyed()) drawCentered(proj->position(), 4.0f, Surge::Color{255, 255, 255, 255});
    }

    const float pr = config_.player.radius;
    drawCentered(player_.position(), pr, Surge::Color{80, 220, 255, 255});
    if (player_.shielded()) {
        device.drawRectOutline(Surge::Vec2{player_.position().x - pr - 6.0f, player_.position().y - pr - 6.0f},
                               Surge::Vec2{pr * 2.0f + 12.0f, pr * 2.0f + 12.0f}, Surge::Color{0, 255, 255, 255});
    }

    // Health bar.
    const float frac = player_.maxHealth() > 0.0f ? player_.health() / player_.maxHealth() : 0.0f;
    device.drawFilledRect(Surge::Vec2{16.0f, 16.0f}, Surge::Vec2{200.0f, 12.0f}, Surge::Color{60, 20, 20, 255});
    device.drawFilledRect(Surge::Vec2{16.0f, 16.0f}, Surge::Vec2{200.0f * frac, 12.0f}, Surge::Color{220, 50, 50, 255});
}

}  // namespace Arena
