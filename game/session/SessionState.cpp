#include "SessionState.h"

#include <algorithm>

namespace Arena {

void SessionState::recordKill(const Enemy& enemy) {
    ++kills_;
    if (signals_.kill) signals_.kill(enemy);
}

void SessionState::awardPoints(int amount) {
    if (amount <= 0) return;
    points_ += amount;
    if (signals_.points) signals_.points(amount, points_);
}

void SessionState::waveStarted(int wave, bool boss) {
    wave_ = wave;
    if (signals_.waveStart) signals_.waveStart(wave, boss);
}

void SessionState::waveCompleted(int wave) {
    ++wavesCompleted_;
    if (signals_.waveComplete) signals_.waveComplete(wave);
}

void SessionState::playerDamaged(int amount, float healthLeft) {
    damageTaken_ += amount;
    if (signals_.playerDamaged) signals_.playerDamaged(amount, healthLeft);
}

void SessionState::playerDied() {
    if (playerDead_) return;
    playerDead_ = true;
    if (signals_.playerDeath) signals_.playerDeath();
}

void SessionState::requestClearProjectiles() {
    if (signals_.clearProjectiles) signals_.clearProjectiles();
}

bool SessionState::playerDamageReady(double nowMs, double cooldownMs) const {
    if (!hasDamageStamp_) return true;
    return nowMs - lastPlayerDamageMs_ >= cooldownMs;
}

void SessionState::markPlayerDamaged(double nowMs) {
    lastPlayerDamageMs_ = hasDamageStamp_ ? std::max(lastPlayerDamageMs_, nowMs) : nowMs;
    hasDamageStamp_ = true;
}

void SessionState::reset() {
    kills_ = 0;
    points_ = 0;
    wave_ = 0;
    wavesCompleted_ = 0;
    damageTaken_ = 0;
    playerDead_ = false;
    hasDamageStamp_ = false;
    lastPlayerDamageMs_ = 0.0;
}

}  // namespace Arena
