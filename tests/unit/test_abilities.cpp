/**
 * @file test_abilities.cpp
 * @brief Unit tests for per-object special abilities
 */

#include <gtest/gtest.h>
#include "crater/damage/damage_engine.h"
#include <algorithm>
#include <memory>
#include <vector>

namespace crater::test {

using namespace crater::damage;
using events::Event;
using events::EventType;

namespace {

constexpr KindId TARGET = 1;
constexpr KindId MINE = 2;
constexpr KindId BOMB = 3;
constexpr KindId PULSER = 4;
constexpr KindId SPLITTER = 5;
constexpr KindId MEDIC = 6;
constexpr KindId FLYER = 7;

SizeT count_events(const std::vector<Event>& events, EventType type) {
    return static_cast<SizeT>(std::count_if(events.begin(), events.end(),
        [type](const Event& e) { return e.type == type; }));
}

} // anonymous namespace

// ============================================================================
// Flag Helpers
// ============================================================================

TEST(AbilityFlagsTest, Combine) {
    AbilitySet set = Ability::ExplodeOnContact | Ability::Flying;
    EXPECT_TRUE(has_ability(set, Ability::ExplodeOnContact));
    EXPECT_TRUE(has_ability(set, Ability::Flying));
    EXPECT_FALSE(has_ability(set, Ability::Healer));

    set = set | Ability::Healer;
    EXPECT_TRUE(has_ability(set, Ability::Healer));
    EXPECT_FALSE(has_ability(to_set(Ability::None), Ability::Spawner));
}

TEST(AbilityFlagsTest, Names) {
    for (Ability a : {Ability::ExplodeOnContact, Ability::ExplodeOnDestroy, Ability::DamagePulse,
                      Ability::Spawner, Ability::Healer, Ability::Flying}) {
        EXPECT_EQ(ability_from_string(ability_to_string(a)), a);
    }
    EXPECT_EQ(ability_from_string("Teleport"), Ability::None);
    EXPECT_EQ(ability_from_string(nullptr), Ability::None);
    EXPECT_STREQ(ability_to_string(Ability::None), "None");
}

// ============================================================================
// Fixture
// ============================================================================

class AbilityTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = DamageConfig::defaults();
        config.kinds[MINE].name = "mine";
        config.kinds[MINE].abilities = to_set(Ability::ExplodeOnContact);
        config.kinds[BOMB].name = "bomb";
        config.kinds[BOMB].abilities = to_set(Ability::ExplodeOnDestroy);
        config.kinds[PULSER].name = "pulser";
        config.kinds[PULSER].abilities = to_set(Ability::DamagePulse);
        config.kinds[SPLITTER].name = "splitter";
        config.kinds[SPLITTER].abilities = to_set(Ability::Spawner);
        config.kinds[MEDIC].name = "medic";
        config.kinds[MEDIC].abilities = to_set(Ability::Healer);
        config.kinds[FLYER].name = "flyer";
        config.kinds[FLYER].abilities = to_set(Ability::Flying);
        build();
    }

    void build() {
        engine = std::make_unique<DamageEngine>(
            [this](const surface::CraterRequest& r) {
                craters.push_back(r);
                return 7;
            },
            config);
    }

    std::vector<Event> drain() {
        return engine->events().drain();
    }

    DamageConfig config;
    std::unique_ptr<DamageEngine> engine;
    std::vector<surface::CraterRequest> craters;
};

// ============================================================================
// Explosions
// ============================================================================

TEST_F(AbilityTest, ExplodeOnDestroyDamagesNeighbours) {
    engine->register_object(1, BOMB, {0.0, 0.0});
    engine->register_object(2, TARGET, {20.0, 0.0});
    engine->register_object(3, TARGET, {200.0, 0.0});

    EXPECT_EQ(engine->apply_damage(1, 1000, TARGET), DamageResult::Destroyed);
    EXPECT_EQ(engine->health(2), 20);
    EXPECT_EQ(engine->health(3), 100);

    ASSERT_EQ(craters.size(), 1u);
    EXPECT_EQ(craters[0].center, Vec2(0.0, 0.0));
    EXPECT_DOUBLE_EQ(craters[0].radius, 50.0);
    EXPECT_DOUBLE_EQ(craters[0].raggedness, 0.3);

    auto events = drain();
    EXPECT_EQ(count_events(events, EventType::AbilityTriggered), 1u);
    auto it = std::find_if(events.begin(), events.end(),
        [](const Event& e) { return e.type == EventType::CraterRequested; });
    ASSERT_NE(it, events.end());
    EXPECT_EQ(it->get_data<events::CraterEventData>().source, 1u);
    EXPECT_EQ(it->get_data<events::CraterEventData>().cells_destroyed, 7);
}

TEST_F(AbilityTest, ExplosionsChain) {
    engine->register_object(1, BOMB, {0.0, 0.0});
    engine->register_object(2, 50, 0.0, BOMB, {30.0, 0.0});

    engine->apply_damage(1, 1000, TARGET);
    EXPECT_FALSE(engine->is_alive(1));
    EXPECT_FALSE(engine->is_alive(2));
    ASSERT_EQ(craters.size(), 2u);
    EXPECT_EQ(craters[1].center, Vec2(30.0, 0.0));
    EXPECT_EQ(count_events(drain(), EventType::ObjectDestroyed), 2u);
}

/**
 * @brief Any contact detonates, regardless of impulse
 */
TEST_F(AbilityTest, ExplodeOnContactBypassesThreshold) {
    engine->register_object(1, MINE, {0.0, 0.0});
    engine->register_object(2, PRIMARY_KIND, {10.0, 0.0});

    auto r = engine->apply_collision_damage(1, 2, 1.0);
    EXPECT_EQ(r.status, DamageResult::Applied);
    EXPECT_EQ(r.first, DamageResult::Destroyed);
    EXPECT_EQ(r.second, DamageResult::Applied);

    EXPECT_FALSE(engine->is_alive(1));
    EXPECT_EQ(engine->health(2), 80);      // 80 x 0.25
    EXPECT_EQ(craters.size(), 1u);
}

TEST_F(AbilityTest, ExplodeOnContactCanSurviveSeveralBlasts) {
    config.abilities.explosions_before_destruction = 2;
    build();
    engine->register_object(1, MINE, {0.0, 0.0});
    engine->register_object(2, TARGET, {10.0, 0.0});

    engine->apply_collision_damage(1, 2, 1.0);
    EXPECT_TRUE(engine->is_alive(1));
    EXPECT_EQ(engine->health(2), 20);

    engine->update(0.2);
    engine->apply_collision_damage(2, 1, 1.0);
    EXPECT_FALSE(engine->is_alive(1));
    EXPECT_FALSE(engine->is_alive(2));
    EXPECT_EQ(craters.size(), 2u);
}

// ============================================================================
// Damage Pulse
// ============================================================================

TEST_F(AbilityTest, PulseChargesThenReleases) {
    engine->register_object(1, PULSER, {0.0, 0.0});
    engine->register_object(2, TARGET, {40.0, 0.0});

    engine->apply_damage(1, 10, TARGET);
    const HealthRecord* pulser = engine->find(1);
    ASSERT_NE(pulser, nullptr);
    EXPECT_TRUE(pulser->pulse_charging);

    engine->update(0.5);
    EXPECT_EQ(engine->health(2), 100);
    EXPECT_TRUE(craters.empty());

    engine->update(0.6);
    EXPECT_EQ(engine->health(2), 80);
    EXPECT_EQ(engine->health(1), 90);
    ASSERT_EQ(craters.size(), 1u);
    EXPECT_DOUBLE_EQ(craters[0].radius, 90.0);

    // Second charge is the last one
    engine->apply_damage(1, 10, TARGET);
    engine->update(1.0);
    EXPECT_EQ(engine->health(2), 60);
    EXPECT_FALSE(engine->is_alive(1));

    auto events = drain();
    EXPECT_EQ(count_events(events, EventType::AbilityTriggered), 2u);
}

TEST_F(AbilityTest, PulseIdleWithoutDamage) {
    engine->register_object(1, PULSER, {0.0, 0.0});
    engine->register_object(2, TARGET, {40.0, 0.0});
    engine->update(5.0);
    EXPECT_EQ(engine->health(2), 100);
    EXPECT_TRUE(craters.empty());
}

// ============================================================================
// Spawner
// ============================================================================

TEST_F(AbilityTest, SpawnerRespondsToPrimaryHitsOnly) {
    engine->register_object(1, SPLITTER, {25.0, -5.0});

    engine->apply_damage(1, 10, PRIMARY_KIND);
    auto events = drain();
    ASSERT_EQ(count_events(events, EventType::SpawnRequested), 1u);
    auto it = std::find_if(events.begin(), events.end(),
        [](const Event& e) { return e.type == EventType::SpawnRequested; });
    const auto& data = it->get_data<events::SpawnRequestData>();
    EXPECT_EQ(data.parent, 1u);
    EXPECT_EQ(data.kind, SPLITTER);
    EXPECT_EQ(data.near, Vec2(25.0, -5.0));

    engine->apply_damage(1, 10, TARGET);
    EXPECT_EQ(count_events(drain(), EventType::SpawnRequested), 0u);
}

// ============================================================================
// Healer
// ============================================================================

TEST_F(AbilityTest, HealerRestoresPrimariesUntilSpent) {
    engine->register_object(1, MEDIC, {0.0, 0.0});
    engine->register_object(2, 100, 0.0, PRIMARY_KIND, {50.0, 0.0});
    engine->register_object(3, 100, 0.0, PRIMARY_KIND, {500.0, 0.0});
    engine->apply_damage(2, 50, TARGET);
    engine->apply_damage(3, 50, TARGET);

    // Only heals while resting
    engine->update(1.0);
    EXPECT_EQ(engine->health(2), 50);

    engine->set_resting(1, true);
    engine->update(1.0);
    EXPECT_EQ(engine->health(2), 60);
    engine->update(1.0);
    EXPECT_EQ(engine->health(2), 70);
    EXPECT_TRUE(engine->is_alive(1));
    engine->update(1.0);
    EXPECT_EQ(engine->health(2), 80);
    EXPECT_FALSE(engine->is_alive(1));

    engine->update(1.0);
    EXPECT_EQ(engine->health(2), 80);
    EXPECT_EQ(engine->health(3), 50);
    EXPECT_EQ(count_events(drain(), EventType::ObjectHealed), 3u);
}

TEST_F(AbilityTest, HealerIgnoresNonPrimary) {
    engine->register_object(1, MEDIC, {0.0, 0.0});
    engine->register_object(2, TARGET, {10.0, 0.0});
    engine->apply_damage(2, 50, TARGET);
    engine->set_resting(1, true);
    engine->update(1.0);
    EXPECT_EQ(engine->health(2), 50);
}

// ============================================================================
// Flying
// ============================================================================

TEST_F(AbilityTest, FlyingPreventsSinking) {
    engine->register_object(1, FLYER);
    engine->register_object(2, TARGET);
    EXPECT_TRUE(engine->prevents_sinking(1));
    EXPECT_FALSE(engine->prevents_sinking(2));
    EXPECT_FALSE(engine->prevents_sinking(99));

    engine->set_abilities(2, Ability::Flying | Ability::Spawner);
    EXPECT_TRUE(engine->prevents_sinking(2));
    EXPECT_TRUE(engine->has_ability(2, Ability::Spawner));
}

} // namespace crater::test
