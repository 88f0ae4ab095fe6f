#pragma once
/**
 * @file config.h
 * @brief Configuration loading and management
 */

#include "crater/core/types.h"
#include "crater/core/log.h"
#include "crater/damage/damage_engine.h"
#include "crater/events/event_queue.h"
#include "crater/spawn/spawn_validator.h"
#include "crater/surface/surface_manager.h"
#include <string>
#include <vector>

namespace crater::config {

/**
 * @brief Seed state for deterministic randomness, persisted by the host
 */
struct RandomConfig {
    UInt64 seed{0};
    UInt64 call_counter{0};
};

/**
 * @brief Table and crater settings
 */
struct SurfaceConfig {
    Real table_height{500.0};          ///< Outer height of the standard table
    Real cell_size{5.0};
    Real default_raggedness{0.3};
    surface::CraterParams crater;
};

/**
 * @brief Complete core configuration loaded from XML
 */
struct CoreConfig {
    SurfaceConfig surface;
    damage::DamageConfig damage{damage::DamageConfig::defaults()};
    spawn::SpawnConfig spawn;
    events::EventQueueConfig events;
    log::LogConfig logging;
    RandomConfig random;

    /**
     * @brief Load configuration from XML file
     * @throws std::runtime_error if the file cannot be parsed or holds invalid values
     */
    static CoreConfig load(const std::string& path);

    /**
     * @brief Parse configuration from an XML string
     * @throws std::runtime_error on parse errors or invalid values
     */
    static CoreConfig parse(const std::string& xml);

    /**
     * @brief Create default configuration
     */
    static CoreConfig defaults();

    /**
     * @brief Save configuration to XML file
     */
    bool save(const std::string& path) const;

    /**
     * @throws std::invalid_argument on out-of-range values
     */
    void validate() const;
};

/**
 * @brief Configuration loader service
 */
class ConfigLoader {
public:
    ConfigLoader();
    ~ConfigLoader();

    /**
     * @brief Load core configuration, resolving the name against search paths
     */
    CoreConfig load_core_config(const std::string& path);

    /**
     * @brief Add search path for configuration files
     */
    void add_search_path(const std::string& path);

    /**
     * @brief Find file in search paths
     * @return Resolved path, or empty string if not found
     */
    std::string find_file(const std::string& filename) const;

    const std::vector<std::string>& search_paths() const { return search_paths_; }

private:
    std::vector<std::string> search_paths_;
};

} // namespace crater::config
