/**
 * @file round.cpp
 * @brief Round context implementation
 */

#include "crater/session/round.h"
#include "crater/core/log.h"

namespace crater::session {

namespace {

config::CoreConfig validated(const config::CoreConfig& config) {
    config.validate();
    return config;
}

// Spawn search draws from its own stream so crater perturbations stay reproducible
constexpr UInt64 SPAWN_STREAM = 0x5350574EULL;

} // anonymous namespace

Round::Round(const config::CoreConfig& config, const Vec2& center)
    : Round(config, surface::TableGeometry::standard(center, config.surface.table_height,
                                                     config.surface.cell_size)) {
}

Round::Round(const config::CoreConfig& config, const surface::TableGeometry& geometry)
    : config_(validated(config))
    , surface_(geometry, config_.surface.crater, config_.random.seed, config_.random.call_counter)
    , damage_([this](const surface::CraterRequest& request) {
                  return surface_.destroy_radius(request);
              },
              config_.damage, config_.events)
    , spawner_(surface_, config_.spawn, config_.random.seed ^ SPAWN_STREAM) {
    wire_render_sink();
    log::get()->info("Round {} ready: {}x{} grid, {} playable cells",
                     round_number_, surface_.grid().cols(), surface_.grid().rows(),
                     surface_.grid().count(surface::CellType::Surface));
}

void Round::wire_render_sink() {
    surface_.set_render_sink([this](const surface::SurfaceChange& change) {
        if (change.kind == surface::SurfaceChangeKind::Rebuild) {
            return;
        }
        events::CraterEventData data;
        data.center = change.center;
        data.radius = change.radius;
        data.cells_destroyed = change.cells_destroyed;
        damage_.events().push(events::Event::create_crater(events::EventType::SurfaceChanged,
                                                           data, damage_.clock()));
    });
}

std::vector<events::Event> Round::tick(Real dt) {
    damage_.update(dt);
    return damage_.events().drain();
}

spawn::SpawnResult Round::respawn_point(const Vec2& preferred, Real clearance, ObjectId exclude) {
    std::vector<Vec2> occupied = damage_.occupied_positions(exclude);
    spawn::SpawnResult result = spawner_.find_valid_point(preferred, clearance, occupied);
    if (result.ok()) {
        return result;
    }

    Vec2 center = surface_.geometry().playable().center();
    result.point = surface_.is_walkable(center) ? center : preferred;
    log::get()->warn("Respawn fell back to ({:.1f}, {:.1f})", result.point.x, result.point.y);
    return result;
}

void Round::reset(const surface::TableGeometry& geometry) {
    surface_.rebuild(geometry);
    damage_.reset_all_health();
    damage_.events().clear();
    ++round_number_;
    log::get()->info("Round {} started", round_number_);
}

} // namespace crater::session
