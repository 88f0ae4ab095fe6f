#pragma once
/**
 * @file round.h
 * @brief Per-round context owning the surface, damage and spawn state
 *
 * The Round wires DamageEngine's terrain hook to the SurfaceManager and
 * forwards surface changes into the same event queue, so a host drives
 * everything through one object and drains one event list per tick.
 * A Round is neither copyable nor movable: its members refer to each other.
 */

#include "crater/config/config.h"
#include "crater/damage/damage_engine.h"
#include "crater/spawn/spawn_validator.h"
#include "crater/surface/surface_manager.h"
#include <vector>

namespace crater::session {

class Round {
public:
    /**
     * @brief Build a round on the standard table centered at @p center
     * @throws std::invalid_argument on invalid configuration
     */
    explicit Round(const config::CoreConfig& config, const Vec2& center = {});

    /**
     * @brief Build a round on explicit geometry
     */
    Round(const config::CoreConfig& config, const surface::TableGeometry& geometry);

    Round(const Round&) = delete;
    Round& operator=(const Round&) = delete;
    Round(Round&&) = delete;
    Round& operator=(Round&&) = delete;

    /**
     * @brief Advance timers and hand back everything that happened since the last tick
     */
    std::vector<events::Event> tick(Real dt);

    /**
     * @brief Spawn search with the last-resort policy applied
     *
     * On exhaustion falls back to the playable center if it is walkable,
     * otherwise to @p preferred; the returned status stays Exhausted.
     */
    spawn::SpawnResult respawn_point(const Vec2& preferred, Real clearance,
                                     ObjectId exclude = INVALID_OBJECT_ID);

    /**
     * @brief New round on fresh geometry: surface rebuilt, health restored
     */
    void reset(const surface::TableGeometry& geometry);

    surface::SurfaceManager& surface() noexcept { return surface_; }
    const surface::SurfaceManager& surface() const noexcept { return surface_; }
    damage::DamageEngine& damage() noexcept { return damage_; }
    const damage::DamageEngine& damage() const noexcept { return damage_; }
    spawn::SpawnValidator& spawner() noexcept { return spawner_; }
    events::EventQueue& events() noexcept { return damage_.events(); }

    const config::CoreConfig& config() const noexcept { return config_; }
    UInt64 round_number() const noexcept { return round_number_; }

private:
    void wire_render_sink();

    config::CoreConfig config_;
    surface::SurfaceManager surface_;
    damage::DamageEngine damage_;
    spawn::SpawnValidator spawner_;
    UInt64 round_number_{1};
};

} // namespace crater::session
