/**
 * @file main.cpp
 * @brief Plays a short scripted round on a destructible table
 */

#include "crater/crater.h"
#include <exception>
#include <iomanip>
#include <iostream>
#include <vector>

namespace {

constexpr crater::KindId TARGET = 1;
constexpr crater::KindId MINE = 2;
constexpr crater::KindId SPLITTER = 3;

void print_events(const std::vector<crater::events::Event>& events) {
    using crater::events::EventType;
    for (const auto& e : events) {
        std::cout << std::setw(7) << e.timestamp << "  "
                  << crater::events::get_event_type_name(e.type);
        if (const auto* d = e.try_get_data<crater::events::DamageEventData>()) {
            std::cout << "  target=" << d->target << " hp=" << d->remaining_health;
        } else if (const auto* c = e.try_get_data<crater::events::CraterEventData>()) {
            std::cout << "  r=" << c->radius << " cells=" << c->cells_destroyed;
        } else if (const auto* x = e.try_get_data<crater::events::DestroyedEventData>()) {
            std::cout << "  object=" << x->object;
        }
        std::cout << "\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::cout << "crater table round example\n";
    std::cout << "Version: " << crater::GetVersionString() << "\n\n";

    crater::config::CoreConfig config;
    try {
        if (argc > 1) {
            crater::config::ConfigLoader loader;
            config = loader.load_core_config(argv[1]);
        } else {
            config.damage.kinds[MINE].name = "mine";
            config.damage.kinds[MINE].max_health = 30;
            config.damage.kinds[MINE].abilities =
                crater::damage::to_set(crater::damage::Ability::ExplodeOnContact);
            config.damage.kinds[SPLITTER].name = "splitter";
            config.damage.kinds[SPLITTER].abilities =
                crater::damage::to_set(crater::damage::Ability::Spawner);
            config.random.seed = 7;
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << "\n";
        return 1;
    }

    crater::log::init(config.logging);
    crater::session::Round round(config);
    auto& engine = round.damage();

    engine.register_object(1, crater::PRIMARY_KIND, {-200.0, 0.0});
    engine.register_object(2, TARGET, {100.0, 40.0});
    engine.register_object(3, MINE, {0.0, -60.0});
    engine.register_object(4, SPLITTER, {180.0, -80.0});

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Time(s)  Event\n";
    std::cout << "-------  -----------------------------\n";

    // Primary strikes each object in turn, then rolls over the mine
    engine.apply_collision_damage(1, 2, 180.0);
    print_events(round.tick(0.25));
    engine.apply_collision_damage(1, 4, 120.0);
    print_events(round.tick(0.25));

    engine.set_position(1, {-10.0, -50.0});
    engine.apply_collision_damage(1, 3, 5.0);
    print_events(round.tick(0.25));

    // Find somewhere safe for the primary after the blast
    auto spot = round.respawn_point({0.0, -60.0}, 15.0, 1);
    std::cout << "\nRespawn: " << crater::spawn::spawn_status_to_string(spot.status)
              << " at (" << spot.point.x << ", " << spot.point.y << ") after "
              << spot.attempts << " attempts\n";
    const auto& stats = round.surface().statistics();
    std::cout << "Craters: " << stats.craters << ", cells destroyed: " << stats.cells_destroyed << "\n";
    std::cout << "Surface destroyed: " << round.surface().destroyed_fraction() * 100.0 << "%\n";
    std::cout << "Primary health: " << engine.health(1) << "\n";

    crater::log::shutdown();
    return 0;
}
