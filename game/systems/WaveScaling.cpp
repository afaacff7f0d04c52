#include "WaveScaling.h"

#include <algorithm>
#include <cmath>

namespace Arena::WaveScaling {

double nextWaveMultiplier(double current, int wave) {
    // Bands up to wave 20 accumulate; later waves replace the multiplier outright.
    const double w = static_cast<double>(wave);
    if (wave == 2) return current + w * 0.15;
    if (wave == 3 || wave == 4) return current + w * 0.25;
    if (wave < 7) return current + w * 0.45;
    if (wave < 9) return current + w * 0.65;
    if (wave < 11) return current + w * 1.15;
    if (wave < 14) return current + w * 1.45;
    if (wave < 17) return current + w * 1.85;
    if (wave < 21) return current + w * 2.25;
    return std::exp((w - 19.0) / 6.0);
}

float speedMultiplier(int wave, float speedCap) { return std::min(speedCap, 1.0f + wave * 0.1f); }

int normalEnemyCount(int wave) {
    const double w = static_cast<double>(wave);
    return static_cast<int>(std::floor(40.0 + 2.0 * w + std::pow(w, 1.2)));
}

int bossWaveEnemyCount(int wave) { return static_cast<int>(std::floor(normalEnemyCount(wave) * 0.5)); }

double spawnDelayMs(int wave) { return std::clamp(1000.0 - 50.0 * wave, 25.0, 500.0); }

std::vector<std::string> availableTypes(int wave) {
    std::vector<std::string> types{"triangle"};
    if (wave >= 4) types.push_back("square");
    if (wave >= 7) types.push_back("pentagon");
    if (wave >= 11) types.push_back("hexagon");
    return types;
}

int waveClearBonus(int wave, int base, int cap) {
    return std::min(cap, static_cast<int>(std::floor(base + 2.0 * wave)));
}

bool isPrime(int value) {
    if (value < 2) return false;
    for (int d = 2; d * d <= value; ++d) {
        if (value % d == 0) return false;
    }
    return true;
}

}  // namespace Arena::WaveScaling
