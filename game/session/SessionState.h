// Per-session score and progress counters plus the signals other systems listen to.
// Owned by the host and passed by reference; there is no global instance.
#pragma once

#include <functional>

namespace Arena {

class Enemy;

struct SessionSignals {
    std::function<void(const Enemy&)> kill;
    std::function<void(int points, int total)> points;
    std::function<void(int wave, bool boss)> waveStart;
    std::function<void(int wave)> waveComplete;
    std::function<void(int amount, float healthLeft)> playerDamaged;
    std::function<void()> playerDeath;
    std::function<void()> clearProjectiles;
};

class SessionState {
public:
    SessionSignals& signals() { return signals_; }

    void recordKill(const Enemy& enemy);
    void awardPoints(int amount);
    void waveStarted(int wave, bool boss);
    void waveCompleted(int wave);
    void playerDamaged(int amount, float healthLeft);
    void playerDied();
    void requestClearProjectiles();

    // Player damage cooldown shared by every damage source.
    bool playerDamageReady(double nowMs, double cooldownMs) const;
    void markPlayerDamaged(double nowMs);
    double lastPlayerDamageMs() const { return lastPlayerDamageMs_; }

    int kills() const { return kills_; }
    int points() const { return points_; }
    int wave() const { return wave_; }
    int wavesCompleted() const { return wavesCompleted_; }
    int damageTaken() const { return damageTaken_; }
    bool playerDead() const { return playerDead_; }

    void reset();

private:
    SessionSignals signals_{};
    int kills_{0};
    int points_{0};
    int wave_{0};
    int wavesCompleted_{0};
    int damageTaken_{0};
    bool playerDead_{false};
    bool hasDamageStamp_{false};
    double lastPlayerDamageMs_{0.0};
};

}  // namespace Arena
