#pragma once
/**
 * @file damage_engine.h
 * @brief Health tracking, damage rules and destruction side effects
 *
 * Provides:
 * - Per-object health records with armor and kind-based multipliers
 * - Point, collision and area damage
 * - Destruction notifications (object, last primary, all targets)
 * - Ability-driven craters, blasts, split-spawn requests and healing
 *
 * Records live in a dense array owned by the engine; hosts refer to
 * objects by their own ObjectId. Operations on unknown or destroyed
 * objects are silent no-ops reported through DamageResult.
 */

#include "crater/core/types.h"
#include "crater/damage/abilities.h"
#include "crater/events/event_queue.h"
#include "crater/surface/surface_manager.h"
#include <array>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace crater::damage {

// ============================================================================
// Results
// ============================================================================

enum class DamageResult : UInt8 {
    Applied = 0,
    NoEffect,              ///< Zero or invalid amount
    Destroyed,             ///< This call destroyed the object
    NotRegistered,
    AlreadyDestroyed,
    AlreadyRegistered,
    Immune,                ///< Pair immunity suppressed a collision
    BelowThreshold,        ///< Collision impulse under the damage threshold
    OnCooldown,            ///< Same pair collided too recently
    InvalidArgument
};

inline const char* damage_result_to_string(DamageResult result) {
    switch (result) {
        case DamageResult::Applied: return "Applied";
        case DamageResult::NoEffect: return "NoEffect";
        case DamageResult::Destroyed: return "Destroyed";
        case DamageResult::NotRegistered: return "NotRegistered";
        case DamageResult::AlreadyDestroyed: return "AlreadyDestroyed";
        case DamageResult::AlreadyRegistered: return "AlreadyRegistered";
        case DamageResult::Immune: return "Immune";
        case DamageResult::BelowThreshold: return "BelowThreshold";
        case DamageResult::OnCooldown: return "OnCooldown";
        case DamageResult::InvalidArgument: return "InvalidArgument";
        default: return "Unknown";
    }
}

/**
 * @brief Outcome of one collision
 */
struct CollisionResult {
    DamageResult status{DamageResult::NoEffect};   ///< Gate outcome, or Applied
    DamageResult first{DamageResult::NoEffect};    ///< Result for object a
    DamageResult second{DamageResult::NoEffect};   ///< Result for object b
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Defaults applied to every object of one kind
 */
struct KindProfile {
    std::string name{"target"};
    Int32 max_health{100};
    Real armor{0.0};                   ///< Fraction of incoming damage absorbed, [0, 1]
    Real same_kind_multiplier{1.0};    ///< Applied when source kind == target kind
    Real incoming_multiplier{1.0};     ///< Applied to all damage taken
    bool exempt_from_clear{false};     ///< Ignored by the all-targets-destroyed check
    AbilitySet abilities{0};
};

/**
 * @brief Collision damage rules
 */
struct CollisionDamageConfig {
    Real min_impulse{50.0};            ///< Impulses below this never deal damage
    Real strike_damage{10.0};          ///< Primary hitting a non-primary: dealt to the target
    Real recoil_damage{5.0};           ///< Primary hitting a non-primary: dealt to the primary
    Real contact_damage{1.0};          ///< Any other pair, dealt to both
    Real damage_multiplier{1.0};       ///< Global collision scale
    Real impulse_reference{0.0};       ///< > 0 scales damage by impulse / reference
    Real pair_cooldown{0.1};           ///< Seconds before the same pair can deal damage again
};

/**
 * @brief Parameters of ability effects
 */
struct AbilityConfig {
    Real explosion_radius{50.0};
    Real explosion_damage{80.0};
    Real explosion_raggedness{0.3};
    UInt32 explosions_before_destruction{1};

    Real pulse_radius{90.0};
    Real pulse_damage{20.0};
    Real pulse_delay{1.0};             ///< Charge time in seconds
    UInt32 pulse_max_triggers{2};      ///< Releases before the object destroys itself

    Real healing_radius{150.0};
    Real healing_rate{10.0};           ///< Health per second while resting
    Real healing_budget{30.0};         ///< Total healing before the healer breaks
};

struct DamageConfig {
    CollisionDamageConfig collision;
    AbilityConfig abilities;
    std::array<KindProfile, MAX_KINDS> kinds{};

    /**
     * @brief Primary kind: 100 HP, 75% armor, halved self-damage, exempt.
     *        Every other kind: 100 HP, no armor.
     */
    static DamageConfig defaults();

    /**
     * @throws std::invalid_argument on out-of-range values
     */
    void validate() const;
};

// ============================================================================
// Health Record
// ============================================================================

struct HealthRecord {
    ObjectId id{INVALID_OBJECT_ID};
    KindId kind{PRIMARY_KIND};
    Int32 health{0};
    Int32 max_health{0};
    Real armor{0.0};
    AbilitySet abilities{0};
    bool destroyed{false};
    bool active{false};                ///< Slot in use
    Vec2 position{};                   ///< Last known position
    bool resting{false};
    Real damage_carry{0.0};            ///< Fractional damage not yet subtracted

    // Ability state
    UInt32 explosions{0};
    UInt32 pulse_triggers{0};
    bool pulse_charging{false};
    Real pulse_timer{0.0};
    Real healing_spent{0.0};
    Real healing_carry{0.0};
    bool detonating{false};
};

/**
 * @brief Crater hook into the surface; returns cells destroyed
 */
using TerrainMutator = std::function<Int32(const surface::CraterRequest&)>;

// ============================================================================
// DamageEngine
// ============================================================================

class DamageEngine {
public:
    /**
     * @param mutator Terrain hook for craters (usually SurfaceManager::destroy_radius)
     * @param config Damage rules
     * @param queue_config Bounds of the outgoing event queue
     * @throws std::invalid_argument if the hook is empty or config is invalid
     */
    explicit DamageEngine(TerrainMutator mutator,
                          const DamageConfig& config = DamageConfig::defaults(),
                          const events::EventQueueConfig& queue_config = {});

    // Non-copyable
    DamageEngine(const DamageEngine&) = delete;
    DamageEngine& operator=(const DamageEngine&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * @brief Track an object at full health
     *
     * Abilities come from the kind profile.
     */
    DamageResult register_object(ObjectId id, Int32 max_health, Real armor, KindId kind,
                                 const Vec2& position = {});

    /**
     * @brief Track an object using every value from its kind profile
     */
    DamageResult register_object(ObjectId id, KindId kind, const Vec2& position = {});

    /**
     * @brief Stop tracking an object; later damage to it is a no-op
     * @return false if it was not registered
     */
    bool unregister_object(ObjectId id);

    /**
     * @brief Drop every record and timer (new round)
     */
    void clear();

    // ========================================================================
    // Damage
    // ========================================================================

    /**
     * @brief Apply damage to one object
     *
     * effective = raw x (1 - armor) x incoming multiplier, times the
     * same-kind multiplier when source_kind equals the target's kind.
     *
     * @param source Originating object, for events and spawn requests
     */
    DamageResult apply_damage(ObjectId target, Real raw_amount, KindId source_kind,
                              ObjectId source = INVALID_OBJECT_ID);

    /**
     * @brief Damage both sides of a collision according to their kinds
     */
    CollisionResult apply_collision_damage(ObjectId a, ObjectId b, Real impulse);

    /**
     * @brief Flat damage to every live object within radius of center
     * @param exclude Object spared from the blast (usually its source)
     * @return Number of objects damaged
     */
    Int32 apply_area_damage(const Vec2& center, Real radius, Real amount,
                            KindId source_kind = NO_KIND,
                            ObjectId exclude = INVALID_OBJECT_ID);

    /**
     * @brief Restore health, clamped to max; live objects only
     */
    DamageResult heal(ObjectId id, Int32 amount);

    /**
     * @brief Restore every live object to full health
     */
    void reset_all_health();

    // ========================================================================
    // Simulation
    // ========================================================================

    /**
     * @brief Advance the damage clock
     *
     * Expires cooldowns and immunity, releases charged pulses and runs
     * healers.
     */
    void update(Real dt);

    /// Host position sync; call once per tick for every live object
    void set_position(ObjectId id, const Vec2& position);
    void set_resting(ObjectId id, bool resting);
    void set_abilities(ObjectId id, AbilitySet abilities);

    /**
     * @brief Suppress collision damage between two objects for a while
     */
    void grant_immunity(ObjectId a, ObjectId b, Real duration);
    bool is_immune(ObjectId a, ObjectId b) const;

    // ========================================================================
    // Queries
    // ========================================================================

    bool is_registered(ObjectId id) const;
    bool is_alive(ObjectId id) const;
    Int32 health(ObjectId id) const;          ///< 0 if unknown
    Int32 max_health(ObjectId id) const;      ///< 0 if unknown
    bool has_ability(ObjectId id, Ability ability) const;
    bool prevents_sinking(ObjectId id) const;

    /// Record lookup; nullptr if unknown
    const HealthRecord* find(ObjectId id) const;

    SizeT registered_count() const noexcept { return index_.size(); }
    SizeT alive_count() const;
    SizeT alive_primary_count() const;
    SizeT alive_target_count() const;

    /// Positions of live objects, for spawn clearance checks
    std::vector<Vec2> occupied_positions(ObjectId exclude = INVALID_OBJECT_ID) const;

    Real clock() const noexcept { return clock_; }
    const DamageConfig& config() const noexcept { return config_; }
    const KindProfile& profile(KindId kind) const;

    events::EventQueue& events() noexcept { return events_; }
    const events::EventQueue& events() const noexcept { return events_; }

private:
    HealthRecord* lookup(ObjectId id);
    const HealthRecord* lookup(ObjectId id) const;
    SizeT slot_of(ObjectId id) const;

    DamageResult damage_slot(SizeT slot, Real raw_amount, KindId source_kind, ObjectId source);
    void destroy_slot(SizeT slot);
    void detonate_slot(SizeT slot, Ability ability, Real radius, Real amount);
    void release_pulse(SizeT slot);
    void run_healer(SizeT slot, Real dt);
    void check_all_targets();
    void emit(events::Event event);

    static UInt64 pair_key(ObjectId a, ObjectId b) noexcept;

    TerrainMutator mutator_;
    DamageConfig config_;
    events::EventQueue events_;

    std::vector<HealthRecord> records_;
    std::vector<SizeT> free_slots_;
    std::unordered_map<ObjectId, SizeT> index_;

    std::unordered_map<UInt64, Real> pair_cooldowns_;   ///< Pair -> expiry time
    std::unordered_map<UInt64, Real> pair_immunity_;    ///< Pair -> expiry time

    Real clock_{0.0};
    bool all_targets_reported_{false};
};

} // namespace crater::damage
