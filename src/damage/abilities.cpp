/**
 * @file abilities.cpp
 * @brief Ability name parsing
 */

#include "crater/damage/abilities.h"
#include <cstring>

namespace crater::damage {

Ability ability_from_string(const char* name) {
    if (name == nullptr) return Ability::None;
    if (std::strcmp(name, "ExplodeOnContact") == 0) return Ability::ExplodeOnContact;
    if (std::strcmp(name, "ExplodeOnDestroy") == 0) return Ability::ExplodeOnDestroy;
    if (std::strcmp(name, "DamagePulse") == 0) return Ability::DamagePulse;
    if (std::strcmp(name, "Spawner") == 0) return Ability::Spawner;
    if (std::strcmp(name, "Healer") == 0) return Ability::Healer;
    if (std::strcmp(name, "Flying") == 0) return Ability::Flying;
    return Ability::None;
}

} // namespace crater::damage
