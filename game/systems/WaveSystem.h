// Drives wave progression: spawn pacing, boss bursts and wave completion.
#pragma once

#include <random>
#include <string>

#include "../../engine/core/TimerQueue.h"
#include "../config/ArenaConfig.h"

namespace Arena {

class EnemyRoster;
class SessionState;

enum class WavePhase { Idle, Spawning, Completing };

class WaveSystem {
public:
    WaveSystem(EnemyRoster& roster, SessionState& session, Surge::TimerQueue& timers, WaveSettings settings,
               std::mt19937& rng);
    ~WaveSystem();
    WaveSystem(const WaveSystem&) = delete;
    WaveSystem& operator=(const WaveSystem&) = delete;

    void startNextWave();
    // Active wave with nothing left to spawn (boss burst included) and no live enemies.
    bool isWaveComplete() const;
    void completeWave();

    void setWave(int wave);
    void reset();

    int currentWave() const { return currentWave_; }
    bool isBossWave() const;
    bool isPrimeWave() const;
    bool waveActive() const { return waveActive_; }
    WavePhase phase() const;

    int enemiesSpawned() const { return enemiesSpawned_; }
    int totalEnemiesToSpawn() const { return totalEnemiesToSpawn_; }
    bool bossPending() const { return bossPending_; }

private:
    void spawnTick();
    void spawnBossBurst();
    void cancelTimers();

    EnemyRoster& roster_;
    SessionState& session_;
    Surge::TimerQueue& timers_;
    WaveSettings settings_;
    std::mt19937& rng_;

    int currentWave_{0};
    bool waveActive_{false};
    int enemiesSpawned_{0};
    int totalEnemiesToSpawn_{0};
    bool bossPending_{false};
    Surge::TimerHandle spawnTimer_{Surge::kInvalidTimer};
    Surge::TimerHandle bossTimer_{Surge::kInvalidTimer};
};

}  // namespace Arena
