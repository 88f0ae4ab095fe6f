/**
 * @file event.cpp
 * @brief Event names and factories
 */

#include "crater/events/event.h"

namespace crater::events {

const char* get_event_type_name(EventType type) {
    switch (type) {
        case EventType::ObjectDamaged: return "ObjectDamaged";
        case EventType::ObjectHealed: return "ObjectHealed";
        case EventType::ObjectDestroyed: return "ObjectDestroyed";
        case EventType::PrimaryObjectDestroyed: return "PrimaryObjectDestroyed";
        case EventType::AllTargetsDestroyed: return "AllTargetsDestroyed";
        case EventType::CraterRequested: return "CraterRequested";
        case EventType::AbilityTriggered: return "AbilityTriggered";
        case EventType::SpawnRequested: return "SpawnRequested";
        case EventType::SurfaceChanged: return "SurfaceChanged";
        default: return "Unknown";
    }
}

bool is_terminal_event(EventType type) noexcept {
    return type == EventType::ObjectDestroyed ||
           type == EventType::PrimaryObjectDestroyed ||
           type == EventType::AllTargetsDestroyed;
}

Event Event::create_damaged(const DamageEventData& d, Real timestamp) {
    return Event{EventType::ObjectDamaged, timestamp, d};
}

Event Event::create_healed(ObjectId id, Int32 amount, Int32 health, Real timestamp) {
    return Event{EventType::ObjectHealed, timestamp, HealEventData{id, amount, health}};
}

Event Event::create_destroyed(ObjectId id, KindId kind, const Vec2& last_position, Real timestamp) {
    return Event{EventType::ObjectDestroyed, timestamp, DestroyedEventData{id, kind, last_position}};
}

Event Event::create_primary_destroyed(ObjectId id, const Vec2& last_position, Real timestamp) {
    return Event{EventType::PrimaryObjectDestroyed, timestamp,
                 DestroyedEventData{id, PRIMARY_KIND, last_position}};
}

Event Event::create_all_targets_destroyed(Real timestamp) {
    return Event{EventType::AllTargetsDestroyed, timestamp, std::monostate{}};
}

Event Event::create_crater(EventType type, const CraterEventData& d, Real timestamp) {
    return Event{type, timestamp, d};
}

Event Event::create_ability(ObjectId id, damage::Ability ability, const Vec2& position,
                            UInt32 trigger_count, Real timestamp) {
    return Event{EventType::AbilityTriggered, timestamp,
                 AbilityEventData{id, ability, position, trigger_count}};
}

Event Event::create_spawn_request(ObjectId parent, KindId kind, const Vec2& near, Real timestamp) {
    return Event{EventType::SpawnRequested, timestamp, SpawnRequestData{parent, kind, near}};
}

} // namespace crater::events
