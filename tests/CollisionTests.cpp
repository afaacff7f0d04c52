// Contact resolution: hits, pierce, player damage gating, thorns, knockback and obstacle verdicts.
#include <cassert>
#include <cmath>
#include <vector>

#include "../game/ArenaGame.h"

using namespace Arena;

namespace {
bool near(double a, double b, double eps = 1e-3) { return std::fabs(a - b) <= eps; }

Surge::ContactEvent overlap(Surge::BodyHandle a, Surge::BodyHandle b) {
    Surge::ContactEvent contact{};
    contact.kind = Surge::ContactKind::Overlap;
    contact.a = a;
    contact.b = b;
    return contact;
}

ArenaConfig tweakedTriangle(float health, float scoreChance) {
    ArenaConfig cfg = ArenaConfig::defaults();
    for (auto& def : cfg.enemies) {
        if (def.id == "triangle") {
            def.health = health;
            def.scoreChance = scoreChance;
        }
    }
    return cfg;
}
}  // namespace

int main() {
    {
        // A pierce-1 bullet damages the first enemy only, even when both overlaps arrive in one frame.
        ArenaGame game;
        Enemy* first = game.roster().spawnEnemy("triangle", Surge::Vec2{100.0f, 100.0f});
        Enemy* second = game.roster().spawnEnemy("triangle", Surge::Vec2{110.0f, 100.0f});
        Projectile* bullet = game.arsenal().fire("bullet", Surge::Vec2{100.0f, 100.0f}, 0.0f);
        const auto bulletBody = bullet->body();

        game.resolver().resolve(overlap(first->body(), bulletBody));
        game.resolver().resolve(overlap(second->body(), bulletBody));
        assert(near(first->health(), 90.0));
        assert(near(second->health(), 100.0));
        assert(bullet->isDestroyed());
        assert(!game.physics().hasBody(bulletBody));
    }
    {
        // Pierce 2 reaches two enemies; the a/b order of the contact does not matter.
        ArenaGame game;
        Enemy* first = game.roster().spawnEnemy("triangle", Surge::Vec2{100.0f, 100.0f});
        Enemy* second = game.roster().spawnEnemy("triangle", Surge::Vec2{110.0f, 100.0f});
        Projectile* heavy = game.arsenal().fire("heavy_bullet", Surge::Vec2{100.0f, 100.0f}, 0.0f);

        game.resolver().resolve(overlap(first->body(), heavy->body()));
        assert(!heavy->isDestroyed());
        game.resolver().resolve(overlap(heavy->body(), second->body()));
        assert(near(first->health(), 75.0));
        assert(near(second->health(), 75.0));
        assert(heavy->isDestroyed());
        assert(heavy->hitCount() == 2);
    }
    {
        // The same enemy is struck once per flight no matter how many overlaps report it.
        ArenaGame game;
        Enemy* enemy = game.roster().spawnEnemy("triangle", Surge::Vec2{100.0f, 100.0f});
        Projectile* cutter = game.arsenal().fire("cutter", Surge::Vec2{100.0f, 100.0f}, 0.0f);
        for (int i = 0; i < 4; ++i) {
            game.resolver().resolve(overlap(enemy->body(), cutter->body()));
        }
        assert(near(enemy->health(), 85.0));
        assert(cutter->pierceCount() == 1);
        assert(!cutter->isDestroyed());
    }
    {
        // Kills are counted once and roll the archetype's score chance.
        ArenaGame game(tweakedTriangle(100.0f, 1.0f));
        game.modifiers().addModifier("bullet", "damage", 990.0f);
        int killSignals = 0;
        game.session().signals().kill = [&killSignals](const Enemy&) { ++killSignals; };
        Enemy* enemy = game.roster().spawnEnemy("triangle", Surge::Vec2{100.0f, 100.0f});
        const auto enemyBody = enemy->body();
        Projectile* a = game.arsenal().fire("bullet", Surge::Vec2{100.0f, 100.0f}, 0.0f);
        Projectile* b = game.arsenal().fire("bullet", Surge::Vec2{100.0f, 100.0f}, 0.0f);

        game.resolver().resolve(overlap(enemyBody, a->body()));
        assert(enemy->isDestroyed());
        assert(enemy->killed());
        game.resolver().resolve(overlap(enemyBody, b->body()));
        assert(!b->isDestroyed());
        assert(killSignals == 1);
        assert(game.session().kills() == 1);
        assert(game.session().points() == 1);
        assert(!game.physics().hasBody(enemyBody));
    }
    {
        ArenaGame game(tweakedTriangle(100.0f, 0.0f));
        game.modifiers().addModifier("bullet", "damage", 990.0f);
        Enemy* enemy = game.roster().spawnEnemy("triangle", Surge::Vec2{100.0f, 100.0f});
        Projectile* bullet = game.arsenal().fire("bullet", Surge::Vec2{100.0f, 100.0f}, 0.0f);
        game.resolver().resolve(overlap(enemy->body(), bullet->body()));
        assert(game.session().kills() == 1);
        assert(game.session().points() == 0);
    }
    {
        // Contact damage, push and the shared cooldown.
        ArenaGame game;
        std::vector<int> damageEvents;
        game.session().signals().playerDamaged = [&damageEvents](int amount, float) {
            damageEvents.push_back(amount);
        };
        const auto playerBody = game.player().body();
        const auto playerPos = game.player().position();
        Enemy* tri = game.roster().spawnEnemy("triangle", Surge::Vec2{playerPos.x + 20.0f, playerPos.y});

        game.resolver().resolve(overlap(playerBody, tri->body()));
        assert(near(game.player().health(), 65.0));
        assert(near(game.player().push().x, -200.0));
        assert(near(game.player().push().length(), 200.0));
        assert(near(game.physics().velocity(playerBody).x, -200.0));

        game.timers().advance(499.0);
        game.resolver().resolve(overlap(tri->body(), playerBody));
        assert(near(game.player().health(), 65.0));
        game.timers().advance(1.0);
        game.resolver().resolve(overlap(tri->body(), playerBody));
        assert(near(game.player().health(), 30.0));

        // An enemy bullet inside the cooldown does nothing and keeps flying.
        game.timers().advance(250.0);
        Enemy* shooter = game.roster().spawnEnemy("shooter", Surge::Vec2{playerPos.x, playerPos.y + 140.0f});
        Projectile* shot = game.roster().spawnEnemyProjectile(*shooter, playerPos);
        game.resolver().resolve(overlap(playerBody, shot->body()));
        assert(near(game.player().health(), 30.0));
        assert(!shot->isDestroyed());

        game.timers().advance(250.0);
        game.resolver().resolve(overlap(playerBody, shot->body()));
        assert(near(game.player().health(), 10.0));
        assert(shot->isDestroyed());
        assert(near(game.player().push().length(), 150.0));
        assert(game.player().push().y < 0.0f);

        assert(damageEvents.size() == 3);
        assert(damageEvents[0] == 35 && damageEvents[1] == 35 && damageEvents[2] == 20);
        assert(game.session().damageTaken() == 90);
        assert(near(game.session().lastPlayerDamageMs(), 1000.0));
    }
    {
        // Death is signalled once and a dead player takes no further damage.
        ArenaGame game;
        int deaths = 0;
        game.session().signals().playerDeath = [&deaths]() { ++deaths; };
        Enemy* hex = game.roster().spawnEnemy("hexagon", game.player().position());
        game.resolver().resolve(overlap(game.player().body(), hex->body()));
        assert(game.player().isDead());
        assert(near(game.player().health(), 0.0));
        assert(game.session().playerDead());
        game.timers().advance(1000.0);
        game.resolver().resolve(overlap(game.player().body(), hex->body()));
        assert(deaths == 1);
        assert(game.session().damageTaken() == 100);
    }
    {
        // Thorns reflect part of the contact damage.
        ArenaGame game;
        game.effects().addEffect("thorns", 0.5f);
        Enemy* tri = game.roster().spawnEnemy("triangle", game.player().position());
        game.resolver().resolve(overlap(game.player().body(), tri->body()));
        assert(near(tri->health(), 82.5));
        assert(near(game.player().health(), 65.0));
    }
    {
        ArenaGame game(tweakedTriangle(10.0f, 1.0f));
        game.effects().addEffect("thorns", 0.5f);
        Enemy* tri = game.roster().spawnEnemy("triangle", game.player().position());
        game.resolver().resolve(overlap(game.player().body(), tri->body()));
        assert(tri->isDestroyed());
        assert(game.session().kills() == 1);
        assert(game.session().points() == 1);
    }
    {
        // A shielded player takes nothing, but the hit still starts the cooldown.
        ArenaGame game;
        Enemy* tri = game.roster().spawnEnemy("triangle", game.player().position());
        assert(game.player().activateShield());
        game.resolver().resolve(overlap(game.player().body(), tri->body()));
        assert(near(game.player().health(), 100.0));
        assert(game.session().damageTaken() == 0);
        game.player().deactivateShield();
        game.timers().advance(100.0);
        game.resolver().resolve(overlap(game.player().body(), tri->body()));
        assert(near(game.player().health(), 100.0));
        game.timers().advance(400.0);
        game.resolver().resolve(overlap(game.player().body(), tri->body()));
        assert(near(game.player().health(), 65.0));
    }
    {
        // Armor scales contact damage before rounding.
        ArenaGame game;
        game.effects().addEffect("armor", 0.5f);
        Enemy* tri = game.roster().spawnEnemy("triangle", game.player().position());
        game.resolver().resolve(overlap(game.player().body(), tri->body()));
        assert(near(game.player().health(), 82.0));
    }
    {
        // The shield key needs the ability and wears off after three seconds.
        ArenaGame game;
        Surge::InputState input;
        input.setKeyDown(Surge::InputKey::Shield, true);
        game.tick(1.0 / 60.0, input);
        assert(!game.player().shielded());

        game.effects().addAbility("shield");
        input.nextFrame();
        input.setKeyDown(Surge::InputKey::Shield, false);
        input.setKeyDown(Surge::InputKey::Shield, true);
        game.tick(1.0 / 60.0, input);
        assert(game.player().shielded());
        input.nextFrame();
        for (int i = 0; i < 100; ++i) game.tick(1.0 / 60.0, input);
        assert(game.player().shielded());
        for (int i = 0; i < 100; ++i) game.tick(1.0 / 60.0, input);
        assert(!game.player().shielded());
    }
    {
        // Knockback follows the projectile direction and respects resistance and shields.
        ArenaGame game;
        Enemy* tri = game.roster().spawnEnemy("triangle", Surge::Vec2{100.0f, 100.0f});
        Enemy* square = game.roster().spawnEnemy("square", Surge::Vec2{100.0f, 300.0f});
        Enemy* hex = game.roster().spawnEnemy("hexagon", Surge::Vec2{100.0f, 500.0f});
        Projectile* p1 = game.arsenal().fire("bullet", Surge::Vec2{80.0f, 100.0f}, 0.0f);
        Projectile* p2 = game.arsenal().fire("bullet", Surge::Vec2{80.0f, 300.0f}, 0.0f);
        Projectile* p3 = game.arsenal().fire("bullet", Surge::Vec2{80.0f, 500.0f}, 0.0f);
        game.resolver().resolve(overlap(tri->body(), p1->body()));
        game.resolver().resolve(overlap(square->body(), p2->body()));
        game.resolver().resolve(overlap(hex->body(), p3->body()));

        assert(tri->knockedBack(0.0));
        assert(tri->knockedBack(99.0));
        assert(!tri->knockedBack(100.0));
        assert(square->knockedBack(0.0));
        assert(!hex->knockedBack(0.0));
        assert(near(hex->shieldHealth(), 575.0 * 0.65 - 10.0));

        game.roster().update(game.player().position(), 50.0, 16.0);
        assert(near(game.physics().velocity(tri->body()).x, 7.0));
        assert(near(game.physics().velocity(square->body()).x, 0.7));
        // Once the knockback ends the enemy steers again.
        game.roster().update(game.player().position(), 150.0, 16.0);
        assert(near(game.physics().velocity(tri->body()).length(), 100.0, 0.01));
    }
    {
        ArenaGame game;
        game.modifiers().addModifier("attack", "knockback", 1.0f, true);
        Enemy* tri = game.roster().spawnEnemy("triangle", Surge::Vec2{100.0f, 100.0f});
        Projectile* bullet = game.arsenal().fire("bullet", Surge::Vec2{100.0f, 120.0f}, 0.0f);
        game.resolver().resolve(overlap(tri->body(), bullet->body()));
        game.roster().update(game.player().position(), 10.0, 16.0);
        // Pushed straight up, away from the bullet below it.
        assert(near(game.physics().velocity(tri->body()).y, -14.0));
    }
    {
        // Plain projectiles are destroyed by obstacles; evaluation alone mutates nothing.
        ArenaGame game;
        const auto wall = game.addObstacle(Surge::Vec2{300.0f, 300.0f}, Surge::Vec2{24.0f, 24.0f});
        Projectile* bullet = game.arsenal().fire("bullet", Surge::Vec2{300.0f, 270.0f}, 1.5707964f);

        const auto verdict = game.resolver().evaluateObstacleContact(bullet->body(), wall, Surge::Vec2{0.0f, -1.0f});
        assert(verdict.decision == Surge::ObstacleDecision::Pass);
        assert(verdict.projectile.kind == EntityKind::PlayerProjectile);
        assert(verdict.projectile.id == bullet->id());
        assert(verdict.effects.size() == 2);
        assert(verdict.effects[0] == ObstacleEffect::NotifyObstacleHit);
        assert(verdict.effects[1] == ObstacleEffect::DestroyProjectile);
        assert(!bullet->isDestroyed());
        assert(bullet->obstacleHits() == 0);

        game.resolver().commit(verdict);
        assert(bullet->isDestroyed());
        assert(bullet->obstacleHits() == 1);
        // Evaluating a destroyed projectile yields no effects.
        const auto again = game.resolver().evaluateObstacleContact(bullet->body(), wall, Surge::Vec2{0.0f, -1.0f});
        assert(again.effects.empty());
    }
    {
        // Tile cutters pass through, spending one pierce charge per obstacle.
        ArenaGame game;
        const auto wall = game.addObstacle(Surge::Vec2{300.0f, 300.0f}, Surge::Vec2{24.0f, 24.0f});
        Projectile* cutter = game.arsenal().fire("cutter", Surge::Vec2{300.0f, 270.0f}, 1.5707964f);
        Surge::ContactEvent contact{};
        contact.kind = Surge::ContactKind::Obstacle;
        contact.a = cutter->body();
        contact.b = wall;
        contact.normal = Surge::Vec2{0.0f, -1.0f};

        assert(game.resolver().resolveObstacle(contact) == Surge::ObstacleDecision::Pass);
        assert(!cutter->isDestroyed());
        assert(cutter->pierceCount() == 1);
        assert(cutter->obstacleHits() == 1);
        game.resolver().resolveObstacle(contact);
        game.resolver().resolveObstacle(contact);
        assert(cutter->isDestroyed());
        assert(cutter->obstacleHits() == 3);
    }
    {
        // Ricochet reflects player projectiles moving into the surface and still costs pierce.
        ArenaGame game;
        game.effects().addEffect("ricochet", 1.0f);
        const auto wall = game.addObstacle(Surge::Vec2{300.0f, 300.0f}, Surge::Vec2{24.0f, 24.0f});
        Projectile* heavy = game.arsenal().fire("heavy_bullet", Surge::Vec2{300.0f, 270.0f}, 1.5707964f);
        assert(game.physics().velocity(heavy->body()).y > 299.0f);

        // Obstacle first: the normal points at the obstacle and gets flipped.
        Surge::ContactEvent contact{};
        contact.kind = Surge::ContactKind::Obstacle;
        contact.a = wall;
        contact.b = heavy->body();
        contact.normal = Surge::Vec2{0.0f, 1.0f};
        const auto verdict =
            game.resolver().evaluateObstacleContact(heavy->body(), wall, Surge::Vec2{0.0f, -1.0f});
        assert(verdict.effects.size() == 2 && verdict.effects[1] == ObstacleEffect::Ricochet);

        assert(game.resolver().resolveObstacle(contact) == Surge::ObstacleDecision::Pass);
        assert(near(game.physics().velocity(heavy->body()).y, -300.0, 0.01));
        assert(!heavy->isDestroyed());
        assert(heavy->pierceCount() == 1);

        // Already moving away: no second reflection, last charge spent.
        game.resolver().resolveObstacle(contact);
        assert(heavy->isDestroyed());

        // Enemy projectiles never ricochet.
        Enemy* shooter = game.roster().spawnEnemy("shooter", Surge::Vec2{300.0f, 200.0f});
        Projectile* shot = game.roster().spawnEnemyProjectile(*shooter, Surge::Vec2{300.0f, 300.0f});
        const auto enemyVerdict =
            game.resolver().evaluateObstacleContact(shot->body(), wall, Surge::Vec2{0.0f, -1.0f});
        assert(enemyVerdict.projectile.kind == EntityKind::EnemyProjectile);
        assert(enemyVerdict.effects.size() == 2 && enemyVerdict.effects[1] == ObstacleEffect::DestroyProjectile);
    }
    {
        // Solid contacts carry no combat rules and unknown bodies are ignored.
        ArenaGame game;
        Enemy* tri = game.roster().spawnEnemy("triangle", game.player().position());
        Surge::ContactEvent solid = overlap(game.player().body(), tri->body());
        solid.kind = Surge::ContactKind::Solid;
        game.resolver().resolve(solid);
        assert(near(game.player().health(), 100.0));

        game.resolver().resolve(overlap(game.player().body(), 9999u));
        game.resolver().resolve(overlap(9999u, tri->body()));
        assert(near(game.player().health(), 100.0));
        assert(near(tri->health(), 100.0));
    }
    return 0;
}
