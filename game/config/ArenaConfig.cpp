#include "ArenaConfig.h"

namespace Arena {

namespace {

EnemyDefinition makeEnemy(const std::string& id, float health, float speed, float damage, float scoreChance,
                          float speedCap, float radius, std::uint32_t color) {
    EnemyDefinition def{};
    def.id = id;
    def.health = health;
    def.speed = speed;
    def.damage = damage;
    def.scoreChance = scoreChance;
    def.speedCap = speedCap;
    def.radius = radius;
    def.color = color;
    return def;
}

ProjectileDefinition makeProjectile(const std::string& id, float damage, float speed, float radius, int pierce,
                                    float knockback, std::uint32_t color) {
    ProjectileDefinition def{};
    def.id = id;
    def.damage = damage;
    def.speed = speed;
    def.radius = radius;
    def.pierce = pierce;
    def.knockback = knockback;
    def.color = color;
    return def;
}

}  // namespace

const EnemyDefinition* ArenaConfig::findEnemy(const std::string& id) const {
    for (const auto& def : enemies) {
        if (def.id == id) return &def;
    }
    return nullptr;
}

const ProjectileDefinition* ArenaConfig::findProjectile(const std::string& id) const {
    for (const auto& def : projectiles) {
        if (def.id == id) return &def;
    }
    return nullptr;
}

ArenaConfig ArenaConfig::defaults() {
    ArenaConfig cfg{};

    cfg.enemies.push_back(makeEnemy("triangle", 100.0f, 100.0f, 35.0f, 0.3f, 2.5f, 15.0f, 0xFF4444));

    auto square = makeEnemy("square", 200.0f, 80.0f, 75.0f, 0.4f, 4.5f, 20.0f, 0x4488FF);
    square.knockbackResistance = 0.9f;
    cfg.enemies.push_back(square);

    auto diamond = makeEnemy("diamond", 50.0f, 100.0f, 50.0f, 0.45f, 2.5f, 20.0f, 0xFFDD44);
    diamond.dashSpeed = 500.0f;
    cfg.enemies.push_back(diamond);

    auto pentagon = makeEnemy("pentagon", 75.0f, 50.0f, 12.0f, 0.2f, 2.0f, 22.0f, 0xAA44FF);
    pentagon.splitType = "triangle";
    pentagon.splitCount = 2;
    cfg.enemies.push_back(pentagon);

    auto hexagon = makeEnemy("hexagon", 575.0f, 52.0f, 100.0f, 0.6f, 1.3f, 30.0f, 0x44FFAA);
    hexagon.shieldFraction = 0.65f;
    hexagon.shieldRechargeMs = 5000.0;
    cfg.enemies.push_back(hexagon);

    auto shooter = makeEnemy("shooter", 45.0f, 50.0f, 20.0f, 0.5f, 1.5f, 15.0f, 0xFF8844);
    shooter.fireCooldownMs = 1000.0;
    shooter.fireRange = 400.0f;
    shooter.projectile = "enemy_bullet";
    cfg.enemies.push_back(shooter);

    cfg.projectiles.push_back(makeProjectile("bullet", 10.0f, 400.0f, 5.0f, 1, 7.0f, 0xFFFFFF));
    cfg.projectiles.push_back(makeProjectile("heavy_bullet", 25.0f, 300.0f, 8.0f, 2, 7.0f, 0xFFCC66));
    auto cutter = makeProjectile("cutter", 15.0f, 350.0f, 6.0f, 3, 0.0f, 0x66FFFF);
    cutter.canCutTiles = true;
    cfg.projectiles.push_back(cutter);
    cfg.projectiles.push_back(makeProjectile("enemy_bullet", 10.0f, 400.0f, 5.0f, 1, 0.0f, 0xFF6666));

    return cfg;
}

}  // namespace Arena
