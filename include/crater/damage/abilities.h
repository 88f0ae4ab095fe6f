#pragma once
/**
 * @file abilities.h
 * @brief Closed set of per-object special abilities
 */

#include "crater/core/types.h"

namespace crater::damage {

/**
 * @brief Ability flags; an object's abilities are a bitwise OR of these
 */
enum class Ability : UInt16 {
    None             = 0,
    ExplodeOnContact = 1 << 0,   ///< Any collision detonates the object
    ExplodeOnDestroy = 1 << 1,   ///< Destruction detonates the object
    DamagePulse      = 1 << 2,   ///< Damage starts a timed charge that releases a blast
    Spawner          = 1 << 3,   ///< Hits from the primary kind request a split-spawn
    Healer           = 1 << 4,   ///< Heals nearby primary objects while resting
    Flying           = 1 << 5,   ///< Never sinks through holes
};

using AbilitySet = UInt16;

constexpr AbilitySet operator|(Ability a, Ability b) noexcept {
    return static_cast<AbilitySet>(static_cast<AbilitySet>(a) | static_cast<AbilitySet>(b));
}

constexpr AbilitySet operator|(AbilitySet set, Ability a) noexcept {
    return static_cast<AbilitySet>(set | static_cast<AbilitySet>(a));
}

constexpr bool has_ability(AbilitySet set, Ability a) noexcept {
    return (set & static_cast<AbilitySet>(a)) != 0;
}

constexpr AbilitySet to_set(Ability a) noexcept {
    return static_cast<AbilitySet>(a);
}

inline const char* ability_to_string(Ability a) {
    switch (a) {
        case Ability::None: return "None";
        case Ability::ExplodeOnContact: return "ExplodeOnContact";
        case Ability::ExplodeOnDestroy: return "ExplodeOnDestroy";
        case Ability::DamagePulse: return "DamagePulse";
        case Ability::Spawner: return "Spawner";
        case Ability::Healer: return "Healer";
        case Ability::Flying: return "Flying";
        default: return "Unknown";
    }
}

/**
 * @brief Parse a single ability name; Ability::None if unknown
 */
Ability ability_from_string(const char* name);

} // namespace crater::damage
