#include "ConfigLoader.h"

#include <fstream>
#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Arena {

namespace {

template <typename T>
void readValue(const nlohmann::json& src, const char* key, T& dst) {
    if (src.contains(key)) {
        dst = src[key].get<T>();
    }
}

void readCombat(const nlohmann::json& j, CombatSettings& dst) {
    readValue(j, "playerDamageCooldownMs", dst.playerDamageCooldownMs);
    readValue(j, "projectilePush", dst.projectilePush);
    readValue(j, "contactPush", dst.contactPush);
    readValue(j, "knockbackDurationMs", dst.knockbackDurationMs);
}

void readPlayfield(const nlohmann::json& j, PlayfieldSettings& dst) {
    readValue(j, "width", dst.width);
    readValue(j, "height", dst.height);
    readValue(j, "margin", dst.margin);
}

void readPlayer(const nlohmann::json& j, PlayerSettings& dst) {
    readValue(j, "maxHealth", dst.maxHealth);
    readValue(j, "speed", dst.speed);
    readValue(j, "radius", dst.radius);
    readValue(j, "fireIntervalMs", dst.fireIntervalMs);
    readValue(j, "weapon", dst.weapon);
}

void readWaves(const nlohmann::json& j, WaveSettings& dst) {
    readValue(j, "bossDelayMs", dst.bossDelayMs);
    readValue(j, "bossBurstCount", dst.bossBurstCount);
    readValue(j, "bossInterval", dst.bossInterval);
    readValue(j, "waveClearBonusBase", dst.waveClearBonusBase);
    readValue(j, "waveClearBonusCap", dst.waveClearBonusCap);
    readValue(j, "intermissionMs", dst.intermissionMs);
}

void readEnemy(const nlohmann::json& j, EnemyDefinition& def) {
    readValue(j, "health", def.health);
    readValue(j, "damage", def.damage);
    readValue(j, "speed", def.speed);
    readValue(j, "speedCap", def.speedCap);
    readValue(j, "scoreChance", def.scoreChance);
    readValue(j, "radius", def.radius);
    readValue(j, "knockbackResistance", def.knockbackResistance);
    readValue(j, "color", def.color);
    readValue(j, "shieldFraction", def.shieldFraction);
    readValue(j, "shieldRechargeMs", def.shieldRechargeMs);
    readValue(j, "splitType", def.splitType);
    readValue(j, "splitCount", def.splitCount);
    readValue(j, "dashSpeed", def.dashSpeed);
    readValue(j, "dashWaitMs", def.dashWaitMs);
    readValue(j, "dashMs", def.dashMs);
    readValue(j, "dashRecoverMs", def.dashRecoverMs);
    readValue(j, "fireCooldownMs", def.fireCooldownMs);
    readValue(j, "fireRange", def.fireRange);
    readValue(j, "projectile", def.projectile);
}

void readProjectile(const nlohmann::json& j, ProjectileDefinition& def) {
    readValue(j, "damage", def.damage);
    readValue(j, "damageMultiplier", def.damageMultiplier);
    readValue(j, "speed", def.speed);
    readValue(j, "radius", def.radius);
    readValue(j, "pierce", def.pierce);
    readValue(j, "knockback", def.knockback);
    readValue(j, "lifetimeMs", def.lifetimeMs);
    readValue(j, "canCutTiles", def.canCutTiles);
    readValue(j, "color", def.color);
}

// Entries override the built-in definition with the same id, or append a new one.
template <typename Def, typename Reader>
void mergeDefinitions(const nlohmann::json& arr, std::vector<Def>& defs, Reader reader) {
    if (!arr.is_array()) return;
    for (const auto& entry : arr) {
        if (!entry.is_object() || !entry.contains("id")) {
            Surge::logWarn("Skipping definition without id");
            continue;
        }
        const auto id = entry["id"].get<std::string>();
        Def* target = nullptr;
        for (auto& def : defs) {
            if (def.id == id) {
                target = &def;
                break;
            }
        }
        if (!target) {
            defs.push_back(Def{});
            target = &defs.back();
            target->id = id;
        }
        reader(entry, *target);
    }
}

std::optional<ArenaConfig> parse(const nlohmann::json& j) {
    ArenaConfig cfg = ArenaConfig::defaults();
    if (!j.is_object()) {
        Surge::logError("Arena config root must be an object");
        return std::nullopt;
    }
    try {
        if (j.contains("combat")) readCombat(j["combat"], cfg.combat);
        if (j.contains("playfield")) readPlayfield(j["playfield"], cfg.playfield);
        if (j.contains("player")) readPlayer(j["player"], cfg.player);
        if (j.contains("waves")) readWaves(j["waves"], cfg.waves);
        if (j.contains("enemies")) mergeDefinitions(j["enemies"], cfg.enemies, readEnemy);
        if (j.contains("projectiles")) mergeDefinitions(j["projectiles"], cfg.projectiles, readProjectile);
    } catch (const nlohmann::json::exception& e) {
        Surge::logError(std::string("Invalid arena config: ") + e.what());
        return std::nullopt;
    }
    return cfg;
}

}  // namespace

std::optional<ArenaConfig> ConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Surge::logWarn("Arena config not found: " + path);
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        Surge::logError("Failed to parse " + path + ": " + e.what());
        return std::nullopt;
    }
    return parse(j);
}

std::optional<ArenaConfig> ConfigLoader::loadFromString(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        Surge::logError(std::string("Failed to parse arena config: ") + e.what());
        return std::nullopt;
    }
    return parse(j);
}

}  // namespace Arena
