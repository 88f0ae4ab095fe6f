#pragma once
/**
 * @file event.h
 * @brief Notification types produced by the damage core
 *
 * Events are small value types collected during a simulation step and
 * consumed by the host once per tick, either as a drained list or through
 * subscribed handlers.
 */

#include "crater/core/types.h"
#include "crater/damage/abilities.h"
#include <variant>

namespace crater::events {

// ============================================================================
// Event Types
// ============================================================================

enum class EventType : UInt8 {
    ObjectDamaged           = 0,
    ObjectHealed            = 1,
    ObjectDestroyed         = 2,
    PrimaryObjectDestroyed  = 3,   ///< Last live primary object is gone; host should respawn
    AllTargetsDestroyed     = 4,   ///< No non-exempt objects remain
    CraterRequested         = 5,
    AbilityTriggered        = 6,
    SpawnRequested          = 7,
    SurfaceChanged          = 8,

    Count
};

/**
 * @brief Get human-readable name for event type
 */
const char* get_event_type_name(EventType type);

/**
 * @brief Destruction notifications that must reach the host
 *
 * ObjectDestroyed, PrimaryObjectDestroyed and AllTargetsDestroyed are
 * queued even when the queue is at its size bound.
 */
bool is_terminal_event(EventType type) noexcept;

// ============================================================================
// Event Data Structures
// ============================================================================

/**
 * @brief A single damage application after armor and multipliers
 */
struct DamageEventData {
    ObjectId source{INVALID_OBJECT_ID};
    ObjectId target{INVALID_OBJECT_ID};
    KindId source_kind{NO_KIND};
    Real raw_amount{0.0};
    Real effective_damage{0.0};
    Int32 remaining_health{0};
};

struct HealEventData {
    ObjectId object{INVALID_OBJECT_ID};
    Int32 amount{0};
    Int32 health{0};
};

struct DestroyedEventData {
    ObjectId object{INVALID_OBJECT_ID};
    KindId kind{NO_KIND};
    Vec2 last_position{};
};

/**
 * @brief Crater request or surface change
 */
struct CraterEventData {
    ObjectId source{INVALID_OBJECT_ID};
    Vec2 center{};
    Real radius{0.0};
    Real raggedness{0.0};
    Int32 cells_destroyed{0};
};

struct AbilityEventData {
    ObjectId object{INVALID_OBJECT_ID};
    damage::Ability ability{damage::Ability::None};
    Vec2 position{};
    UInt32 trigger_count{0};
};

struct SpawnRequestData {
    ObjectId parent{INVALID_OBJECT_ID};
    KindId kind{NO_KIND};
    Vec2 near{};
};

using EventData = std::variant<
    std::monostate,
    DamageEventData,
    HealEventData,
    DestroyedEventData,
    CraterEventData,
    AbilityEventData,
    SpawnRequestData
>;

// ============================================================================
// Event Structure
// ============================================================================

struct Event {
    EventType type{EventType::ObjectDamaged};
    Real timestamp{0.0};                     ///< Damage clock when the event occurred
    EventData data;

    template<typename T>
    bool has_data() const {
        return std::holds_alternative<T>(data);
    }

    /**
     * @throws std::bad_variant_access if type doesn't match
     */
    template<typename T>
    const T& get_data() const {
        return std::get<T>(data);
    }

    template<typename T>
    const T* try_get_data() const {
        return std::get_if<T>(&data);
    }

    // Factory methods
    static Event create_damaged(const DamageEventData& d, Real timestamp);
    static Event create_healed(ObjectId id, Int32 amount, Int32 health, Real timestamp);
    static Event create_destroyed(ObjectId id, KindId kind, const Vec2& last_position, Real timestamp);
    static Event create_primary_destroyed(ObjectId id, const Vec2& last_position, Real timestamp);
    static Event create_all_targets_destroyed(Real timestamp);
    static Event create_crater(EventType type, const CraterEventData& d, Real timestamp);
    static Event create_ability(ObjectId id, damage::Ability ability, const Vec2& position,
                                UInt32 trigger_count, Real timestamp);
    static Event create_spawn_request(ObjectId parent, KindId kind, const Vec2& near, Real timestamp);
};

} // namespace crater::events
