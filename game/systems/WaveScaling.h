// Per-wave difficulty curves: stat multiplier bands, speed cap, enemy counts and spawn pacing.
#pragma once

#include <string>
#include <vector>

namespace Arena::WaveScaling {

// Evaluated once per wave transition with the index of the wave just completed.
double nextWaveMultiplier(double current, int wave);
float speedMultiplier(int wave, float speedCap);

int normalEnemyCount(int wave);
int bossWaveEnemyCount(int wave);
double spawnDelayMs(int wave);
std::vector<std::string> availableTypes(int wave);
int waveClearBonus(int wave, int base, int cap);
bool isPrime(int value);

}  // namespace Arena::WaveScaling
