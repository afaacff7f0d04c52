#include "WaveSystem.h"

#include <algorithm>
#include <string>
#include <vector>

#include "../../engine/core/Logger.h"
#include "../session/SessionState.h"
#include "EnemyRoster.h"
#include "WaveScaling.h"

namespace Arena {

WaveSystem::WaveSystem(EnemyRoster& roster, SessionState& session, Surge::TimerQueue& timers, WaveSettings settings,
                       std::mt19937& rng)
    : roster_(roster), session_(session), timers_(timers), settings_(settings), rng_(rng) {}

WaveSystem::~WaveSystem() { cancelTimers(); }

void WaveSystem::startNextWave() {
    cancelTimers();
    ++currentWave_;
    roster_.setCurrentWave(currentWave_);
    roster_.scaleEnemyStats(currentWave_ - 1);

    const bool boss = isBossWave();
    totalEnemiesToSpawn_ =
        boss ? WaveScaling::bossWaveEnemyCount(currentWave_) : WaveScaling::normalEnemyCount(currentWave_);
    enemiesSpawned_ = 0;
    waveActive_ = true;
    bossPending_ = boss;

    const double delay = WaveScaling::spawnDelayMs(currentWave_);
    Surge::logInfo("Wave " + std::to_string(currentWave_) + (boss ? " (boss)" : "") + ": " +
                   std::to_string(totalEnemiesToSpawn_) + " enemies, multiplier " +
                   std::to_string(roster_.waveMultiplier()));

    if (totalEnemiesToSpawn_ > 0) {
        spawnTimer_ = timers_.scheduleRepeating(delay, [this]() { spawnTick(); });
    }
    if (boss) {
        bossTimer_ = timers_.schedule(settings_.bossDelayMs, [this]() { spawnBossBurst(); });
    }
    session_.waveStarted(currentWave_, boss);
}

void WaveSystem::spawnTick() {
    if (!waveActive_) {
        cancelTimers();
        return;
    }
    const auto types = WaveScaling::availableTypes(currentWave_);
    std::uniform_int_distribution<std::size_t> pick(0, types.size() - 1);
    // A failed spawn still counts so the wave can finish.
    roster_.spawnEnemy(types[pick(rng_)]);
    ++enemiesSpawned_;
    if (enemiesSpawned_ >= totalEnemiesToSpawn_) {
        timers_.cancel(spawnTimer_);
        spawnTimer_ = Surge::kInvalidTimer;
    }
}

void WaveSystem::spawnBossBurst() {
    bossTimer_ = Surge::kInvalidTimer;
    if (!waveActive_) return;
    const std::string strongest = roster_.strongestOf(WaveScaling::availableTypes(currentWave_));
    if (strongest.empty()) {
        Surge::logWarn("Boss burst skipped: no known enemy type for wave " + std::to_string(currentWave_));
        bossPending_ = false;
        return;
    }
    Surge::logInfo("Boss burst: " + std::to_string(settings_.bossBurstCount) + "x " + strongest);
    for (int i = 0; i < settings_.bossBurstCount; ++i) {
        roster_.spawnEnemy(strongest);
    }
    bossPending_ = false;
}

bool WaveSystem::isWaveComplete() const {
    if (!waveActive_) return false;
    if (enemiesSpawned_ < totalEnemiesToSpawn_ || bossPending_) return false;
    return roster_.activeCount() == 0;
}

void WaveSystem::completeWave() {
    if (!waveActive_) return;
    cancelTimers();
    roster_.clearProjectiles();
    session_.requestClearProjectiles();
    waveActive_ = false;
    bossPending_ = false;
    session_.awardPoints(
        WaveScaling::waveClearBonus(currentWave_, settings_.waveClearBonusBase, settings_.waveClearBonusCap));
    Surge::logInfo("Wave " + std::to_string(currentWave_) + " cleared");
    session_.waveCompleted(currentWave_);
}

void WaveSystem::setWave(int wave) {
    cancelTimers();
    waveActive_ = false;
    bossPending_ = false;
    enemiesSpawned_ = 0;
    totalEnemiesToSpawn_ = 0;
    currentWave_ = std::max(0, wave);
    roster_.setCurrentWave(currentWave_);
}

void WaveSystem::reset() {
    setWave(0);
    roster_.resetScaling();
}

bool WaveSystem::isBossWave() const {
    return settings_.bossInterval > 0 && currentWave_ % settings_.bossInterval == 0;
}

bool WaveSystem::isPrimeWave() const { return WaveScaling::isPrime(currentWave_); }

WavePhase WaveSystem::phase() const {
    if (!waveActive_) return WavePhase::Idle;
    if (enemiesSpawned_ < totalEnemiesToSpawn_ || bossPending_) return WavePhase::Spawning;
    return WavePhase::Completing;
}

void WaveSystem::cancelTimers() {
    if (spawnTimer_ != Surge::kInvalidTimer) {
        timers_.cancel(spawnTimer_);
        spawnTimer_ = Surge::kInvalidTimer;
    }
    if (bossTimer_ != Surge::kInvalidTimer) {
        timers_.cancel(bossTimer_);
        bossTimer_ = Surge::kInvalidTimer;
    }
}

}  // namespace Arena
