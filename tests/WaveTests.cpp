// Wave progression: boss detection, spawn pacing, completion, bonuses and timer cancellation.
#include <cassert>
#include <cmath>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "../engine/core/Logger.h"
#include "../game/ArenaGame.h"
#include "../game/systems/WaveScaling.h"

using namespace Arena;

namespace {
bool near(double a, double b, double eps = 1e-3) { return std::fabs(a - b) <= eps; }

int countType(EnemyRoster& roster, const std::string& type) {
    int n = 0;
    for (const auto& enemy : roster.enemies()) {
        if (!enemy->isDestroyed() && enemy->typeId() == type) ++n;
    }
    return n;
}

ArenaConfig withBossDelay(double delayMs) {
    ArenaConfig cfg = ArenaConfig::defaults();
    cfg.waves.bossDelayMs = delayMs;
    return cfg;
}
}  // namespace

int main() {
    {
        ArenaGame game;
        auto& waves = game.waves();
        const std::vector<std::pair<int, bool>> bossCases{{0, true},   {9, false},  {10, true},
                                                          {19, false}, {20, true}, {100, true}};
        for (const auto& [wave, boss] : bossCases) {
            waves.setWave(wave);
            assert(waves.isBossWave() == boss);
        }
        waves.setWave(7);
        assert(waves.isPrimeWave());
        waves.setWave(9);
        assert(!waves.isPrimeWave());
        waves.setWave(1);
        assert(!waves.isPrimeWave());
        waves.setWave(2);
        assert(waves.isPrimeWave());
    }
    {
        using namespace WaveScaling;
        assert(normalEnemyCount(1) == 43);
        assert(normalEnemyCount(5) == 56);
        assert(bossWaveEnemyCount(10) == 37);
        assert(near(spawnDelayMs(1), 500.0));
        assert(near(spawnDelayMs(12), 400.0));
        assert(near(spawnDelayMs(19), 50.0));
        assert(near(spawnDelayMs(30), 25.0));
        assert(availableTypes(3).size() == 1);
        assert(availableTypes(4).size() == 2 && availableTypes(4)[1] == "square");
        assert(availableTypes(7).back() == "pentagon");
        assert(availableTypes(11).size() == 4 && availableTypes(11).back() == "hexagon");
        assert(waveClearBonus(1, 15, 55) == 17);
        assert(waveClearBonus(20, 15, 55) == 55);
        assert(waveClearBonus(30, 15, 55) == 55);
    }
    {
        // Wave 1 from start to completion.
        ArenaGame game;
        auto& waves = game.waves();
        std::vector<std::pair<int, bool>> started;
        std::vector<int> completed;
        game.session().signals().waveStart = [&started](int wave, bool boss) { started.emplace_back(wave, boss); };
        game.session().signals().waveComplete = [&completed](int wave) { completed.push_back(wave); };

        assert(waves.phase() == WavePhase::Idle);
        game.start();
        game.start();
        assert(waves.currentWave() == 1);
        assert(started.size() == 1 && started[0].first == 1 && !started[0].second);
        assert(waves.totalEnemiesToSpawn() == 43);
        assert(waves.phase() == WavePhase::Spawning);
        assert(near(game.roster().waveMultiplier(), 1.0));
        assert(!waves.isWaveComplete());

        game.timers().advance(499.0);
        assert(waves.enemiesSpawned() == 0);
        game.timers().advance(1.0);
        assert(waves.enemiesSpawned() == 1);
        assert(game.roster().activeCount() == 1);

        game.timers().advance(42.0 * 500.0);
        assert(waves.enemiesSpawned() == 43);
        assert(game.timers().pendingCount() == 0);
        game.timers().advance(5000.0);
        assert(waves.enemiesSpawned() == 43);
        assert(game.roster().activeCount() == 43);
        assert(waves.phase() == WavePhase::Completing);
        assert(!waves.isWaveComplete());

        game.roster().clear();
        assert(waves.isWaveComplete());

        // Leftover projectiles on both sides go away with the wave.
        Enemy* shooter = game.roster().spawnEnemy("shooter", Surge::Vec2{100.0f, 100.0f});
        game.roster().spawnEnemyProjectile(*shooter, game.player().position());
        shooter->destroy();
        game.arsenal().fire("bullet", game.player().position(), 0.0f);
        assert(waves.isWaveComplete());

        waves.completeWave();
        assert(game.roster().projectiles().empty());
        assert(game.arsenal().activeCount() == 0);
        assert(game.session().points() == 17);
        assert(game.session().wavesCompleted() == 1);
        assert(completed.size() == 1 && completed[0] == 1);
        assert(waves.phase() == WavePhase::Idle);
        assert(!waves.waveActive());
        assert(!waves.isWaveComplete());
        // Completing twice is a no-op.
        waves.completeWave();
        assert(game.session().points() == 17);

        waves.startNextWave();
        assert(waves.currentWave() == 2);
        assert(near(game.roster().waveMultiplier(), 1.45));
        game.roster().clear();
        waves.completeWave();
        waves.startNextWave();
        assert(near(game.roster().waveMultiplier(), 1.75));
        assert(started.size() == 3);
    }
    {
        // Boss wave: half population plus a delayed burst of the strongest available type.
        ArenaGame game(withBossDelay(1750.0));
        auto& waves = game.waves();
        bool bossFlag = false;
        game.session().signals().waveStart = [&bossFlag](int, bool boss) { bossFlag = boss; };
        waves.setWave(9);
        waves.startNextWave();
        assert(waves.currentWave() == 10);
        assert(bossFlag);
        assert(waves.isBossWave());
        assert(waves.totalEnemiesToSpawn() == 37);
        assert(waves.bossPending());

        game.timers().advance(1749.0);
        assert(waves.enemiesSpawned() == 3);
        const int before = countType(game.roster(), "square");
        game.timers().advance(1.0);
        assert(countType(game.roster(), "square") == before + 3);
        assert(!waves.bossPending());
        assert(waves.enemiesSpawned() == 3);
    }
    {
        // The burst picks the toughest archetype on offer, not the last one unlocked.
        ArenaGame game;
        assert(game.roster().strongestOf(WaveScaling::availableTypes(1)) == "triangle");
        assert(game.roster().strongestOf(WaveScaling::availableTypes(10)) == "square");
        assert(game.roster().strongestOf(WaveScaling::availableTypes(20)) == "hexagon");
        assert(game.roster().strongestOf({"octagon"}).empty());
    }
    {
        // The wave cannot complete while the boss burst is still due.
        ArenaGame game(withBossDelay(30000.0));
        auto& waves = game.waves();
        waves.setWave(9);
        waves.startNextWave();
        game.timers().advance(37.0 * 500.0);
        assert(waves.enemiesSpawned() == 37);
        game.roster().clear();
        assert(!waves.isWaveComplete());
        assert(waves.phase() == WavePhase::Spawning);
        game.timers().advance(30000.0);
        assert(!waves.bossPending());
        assert(game.roster().activeCount() == 3);
        game.roster().clear();
        assert(waves.isWaveComplete());
    }
    {
        // Failed spawns still count towards the total, so the wave finishes.
        ArenaConfig cfg = ArenaConfig::defaults();
        std::vector<EnemyDefinition> kept;
        for (const auto& def : cfg.enemies) {
            if (def.id != "triangle") kept.push_back(def);
        }
        cfg.enemies = kept;
        ArenaGame game(cfg);
        const auto level = Surge::Logger::minLevel();
        Surge::Logger::setMinLevel(Surge::LogLevel::Error);
        game.start();
        game.timers().advance(43.0 * 500.0);
        Surge::Logger::setMinLevel(level);
        assert(game.waves().enemiesSpawned() == 43);
        assert(game.roster().enemies().empty());
        assert(game.waves().isWaveComplete());
    }
    {
        // setWave stops pending spawns; reset returns to the base multiplier.
        ArenaGame game;
        auto& waves = game.waves();
        game.start();
        game.timers().advance(600.0);
        assert(waves.enemiesSpawned() == 1);
        waves.setWave(5);
        assert(game.timers().pendingCount() == 0);
        assert(waves.currentWave() == 5);
        assert(game.roster().currentWave() == 5);
        assert(!waves.waveActive());
        assert(waves.enemiesSpawned() == 0 && waves.totalEnemiesToSpawn() == 0);
        game.timers().advance(5000.0);
        assert(game.roster().activeCount() == 1);

        waves.startNextWave();
        assert(waves.currentWave() == 6);
        assert(near(game.roster().waveMultiplier(), 1.0 + 5 * 0.45));
        waves.reset();
        assert(waves.currentWave() == 0);
        assert(near(game.roster().waveMultiplier(), 1.0));
        assert(game.timers().pendingCount() == 0);
    }
    {
        // A wave system going away takes its timers with it.
        ArenaConfig cfg = ArenaConfig::defaults();
        Surge::AabbPhysicsWorld physics;
        BodyIndex bodies;
        std::mt19937 rng(7u);
        EnemyRoster roster(cfg, physics, bodies, rng);
        SessionState session;
        Surge::TimerQueue timers;
        {
            WaveSystem waves(roster, session, timers, cfg.waves, rng);
            waves.startNextWave();
            assert(timers.pendingCount() == 1);
            assert(session.wave() == 1);
        }
        assert(timers.pendingCount() == 0);
        timers.advance(10000.0);
        assert(roster.enemies().empty());
    }
    return 0;
}
