#pragma once
/**
 * @file crater.h
 * @brief Main include file for crater
 *
 * crater - destructible table surface and damage core
 *
 * Include this single header to access all public crater APIs.
 */

#include "crater/core/types.h"
#include "crater/core/random.h"
#include "crater/core/log.h"

#include "crater/surface/table_geometry.h"
#include "crater/surface/spatial_grid.h"
#include "crater/surface/surface_manager.h"

#include "crater/damage/abilities.h"
#include "crater/damage/damage_engine.h"

#include "crater/spawn/spawn_validator.h"

#include "crater/events/event.h"
#include "crater/events/event_queue.h"

#include "crater/config/config.h"
#include "crater/session/round.h"

/**
 * @namespace crater
 * @brief Root namespace for all crater components
 */
namespace crater {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace crater
