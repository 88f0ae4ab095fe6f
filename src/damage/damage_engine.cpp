/**
 * @file damage_engine.cpp
 * @brief Implementation of the damage engine
 */

#include "crater/damage/damage_engine.h"
#include "crater/core/log.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace crater::damage {

using events::Event;
using events::EventType;

namespace {
    constexpr SizeT NO_SLOT = static_cast<SizeT>(-1);

    bool in_unit_range(Real v) {
        return v >= 0.0 && v <= 1.0;
    }
}

// ============================================================================
// DamageConfig
// ============================================================================

DamageConfig DamageConfig::defaults() {
    DamageConfig config;
    KindProfile& primary = config.kinds[PRIMARY_KIND];
    primary.name = "primary";
    primary.max_health = 100;
    primary.armor = 0.75;
    primary.same_kind_multiplier = 0.5;
    primary.exempt_from_clear = true;
    return config;
}

void DamageConfig::validate() const {
    for (SizeT i = 0; i < kinds.size(); ++i) {
        const auto& k = kinds[i];
        if (k.max_health <= 0) {
            throw std::invalid_argument("DamageConfig: kind " + std::to_string(i) + " max_health must be positive");
        }
        if (!in_unit_range(k.armor)) {
            throw std::invalid_argument("DamageConfig: kind " + std::to_string(i) + " armor must be in [0, 1]");
        }
        if (k.same_kind_multiplier < 0.0 || k.incoming_multiplier < 0.0) {
            throw std::invalid_argument("DamageConfig: kind " + std::to_string(i) + " multipliers must be non-negative");
        }
    }
    if (collision.min_impulse < 0.0 || collision.pair_cooldown < 0.0 || collision.damage_multiplier < 0.0) {
        throw std::invalid_argument("DamageConfig: collision thresholds must be non-negative");
    }
    if (abilities.explosion_radius < 0.0 || abilities.pulse_radius < 0.0 || abilities.healing_radius < 0.0) {
        throw std::invalid_argument("DamageConfig: ability radii must be non-negative");
    }
    if (!(abilities.explosion_raggedness >= 0.0 && abilities.explosion_raggedness <= 1.0)) {
        throw std::invalid_argument("DamageConfig: explosion_raggedness must be in [0, 1]");
    }
    if (abilities.explosions_before_destruction == 0 || abilities.pulse_max_triggers == 0) {
        throw std::invalid_argument("DamageConfig: ability trigger counts must be at least 1");
    }
}

// ============================================================================
// Construction
// ============================================================================

DamageEngine::DamageEngine(TerrainMutator mutator, const DamageConfig& config,
                           const events::EventQueueConfig& queue_config)
    : mutator_(std::move(mutator))
    , config_(config)
    , events_(queue_config) {
    if (!mutator_) {
        throw std::invalid_argument("DamageEngine: terrain mutation hook is not wired");
    }
    config_.validate();
}

// ============================================================================
// Registration
// ============================================================================

DamageResult DamageEngine::register_object(ObjectId id, Int32 max_health, Real armor,
                                           KindId kind, const Vec2& position) {
    if (id == INVALID_OBJECT_ID || max_health <= 0 || !in_unit_range(armor) || kind >= MAX_KINDS) {
        log::get()->debug("register_object rejected: id={} max_health={} armor={} kind={}",
                          id, max_health, armor, kind);
        return DamageResult::InvalidArgument;
    }
    if (index_.count(id) != 0) {
        log::get()->debug("register_object: {} already registered", id);
        return DamageResult::AlreadyRegistered;
    }

    SizeT slot;
    if (!free_slots_.empty()) {
        slot = free_slots_.back();
        free_slots_.pop_back();
    } else {
        slot = records_.size();
        records_.emplace_back();
    }

    HealthRecord& rec = records_[slot];
    rec = HealthRecord{};
    rec.id = id;
    rec.kind = kind;
    rec.health = max_health;
    rec.max_health = max_health;
    rec.armor = armor;
    rec.abilities = config_.kinds[kind].abilities;
    rec.position = position;
    rec.active = true;
    index_[id] = slot;

    if (!config_.kinds[kind].exempt_from_clear) {
        all_targets_reported_ = false;
    }
    return DamageResult::Applied;
}

DamageResult DamageEngine::register_object(ObjectId id, KindId kind, const Vec2& position) {
    if (kind >= MAX_KINDS) {
        return DamageResult::InvalidArgument;
    }
    const KindProfile& p = config_.kinds[kind];
    return register_object(id, p.max_health, p.armor, kind, position);
}

bool DamageEngine::unregister_object(ObjectId id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    SizeT slot = it->second;
    bool was_live_target = !records_[slot].destroyed &&
                           !config_.kinds[records_[slot].kind].exempt_from_clear;

    records_[slot] = HealthRecord{};
    free_slots_.push_back(slot);
    index_.erase(it);

    // Drop pair timers so a reused id starts clean
    auto involves = [id](const auto& entry) {
        return static_cast<ObjectId>(entry.first >> 32) == id ||
               static_cast<ObjectId>(entry.first & 0xFFFFFFFFu) == id;
    };
    std::erase_if(pair_cooldowns_, involves);
    std::erase_if(pair_immunity_, involves);

    if (was_live_target) {
        check_all_targets();
    }
    return true;
}

void DamageEngine::clear() {
    records_.clear();
    free_slots_.clear();
    index_.clear();
    pair_cooldowns_.clear();
    pair_immunity_.clear();
    events_.clear();
    clock_ = 0.0;
    all_targets_reported_ = false;
}

// ============================================================================
// Damage
// ============================================================================

DamageResult DamageEngine::apply_damage(ObjectId target, Real raw_amount, KindId source_kind,
                                        ObjectId source) {
    SizeT slot = slot_of(target);
    if (slot == NO_SLOT) {
        log::get()->debug("apply_damage: {} not registered", target);
        return DamageResult::NotRegistered;
    }
    return damage_slot(slot, raw_amount, source_kind, source);
}

DamageResult DamageEngine::damage_slot(SizeT slot, Real raw_amount, KindId source_kind,
                                       ObjectId source) {
    HealthRecord& rec = records_[slot];
    if (rec.destroyed) {
        log::get()->debug("apply_damage: {} already destroyed", rec.id);
        return DamageResult::AlreadyDestroyed;
    }
    if (!(raw_amount > 0.0) || !std::isfinite(raw_amount)) {
        return DamageResult::NoEffect;
    }

    const KindProfile& profile = config_.kinds[rec.kind];
    Real effective = raw_amount * (1.0 - rec.armor) * profile.incoming_multiplier;
    if (source_kind == rec.kind) {
        effective *= profile.same_kind_multiplier;
    }

    // Whole points come off health; the remainder carries to the next hit
    Real total = effective + rec.damage_carry;
    Real whole = std::floor(total);
    rec.damage_carry = total - whole;
    rec.health = std::max(0, rec.health - static_cast<Int32>(std::min(whole, static_cast<Real>(rec.health))));

    events::DamageEventData data;
    data.source = source;
    data.target = rec.id;
    data.source_kind = source_kind;
    data.raw_amount = raw_amount;
    data.effective_damage = effective;
    data.remaining_health = rec.health;
    emit(Event::create_damaged(data, clock_));

    if (rec.health <= 0) {
        destroy_slot(slot);
        return DamageResult::Destroyed;
    }

    // Ability reactions to surviving a hit
    if (damage::has_ability(rec.abilities, Ability::DamagePulse) && effective > 0.0 &&
        !rec.pulse_charging && rec.pulse_triggers < config_.abilities.pulse_max_triggers) {
        rec.pulse_charging = true;
        rec.pulse_timer = 0.0;
        log::get()->debug("Object {} pulse charging", rec.id);
    }
    if (damage::has_ability(rec.abilities, Ability::Spawner) && source_kind == PRIMARY_KIND) {
        emit(Event::create_spawn_request(rec.id, rec.kind, rec.position, clock_));
    }

    return DamageResult::Applied;
}

CollisionResult DamageEngine::apply_collision_damage(ObjectId a, ObjectId b, Real impulse) {
    CollisionResult result;

    SizeT sa = slot_of(a);
    SizeT sb = slot_of(b);
    if (sa == NO_SLOT || sb == NO_SLOT) {
        result.status = DamageResult::NotRegistered;
        return result;
    }
    if (sa == sb) {
        return result;
    }
    if (records_[sa].destroyed || records_[sb].destroyed) {
        result.status = DamageResult::AlreadyDestroyed;
        return result;
    }
    if (is_immune(a, b)) {
        result.status = DamageResult::Immune;
        return result;
    }

    const auto& cc = config_.collision;
    bool a_explodes = damage::has_ability(records_[sa].abilities, Ability::ExplodeOnContact);
    bool b_explodes = damage::has_ability(records_[sb].abilities, Ability::ExplodeOnContact);

    if (!a_explodes && !b_explodes && !(impulse >= cc.min_impulse)) {
        result.status = DamageResult::BelowThreshold;
        return result;
    }

    UInt64 key = pair_key(a, b);
    auto cd = pair_cooldowns_.find(key);
    if (cd != pair_cooldowns_.end() && cd->second > clock_) {
        result.status = DamageResult::OnCooldown;
        return result;
    }
    pair_cooldowns_[key] = clock_ + cc.pair_cooldown;

    result.status = DamageResult::Applied;

    if (a_explodes || b_explodes) {
        const auto& ac = config_.abilities;
        if (a_explodes) {
            detonate_slot(sa, Ability::ExplodeOnContact, ac.explosion_radius, ac.explosion_damage);
        }
        if (b_explodes) {
            detonate_slot(sb, Ability::ExplodeOnContact, ac.explosion_radius, ac.explosion_damage);
        }
        result.first = records_[sa].destroyed ? DamageResult::Destroyed : DamageResult::Applied;
        result.second = records_[sb].destroyed ? DamageResult::Destroyed : DamageResult::Applied;
        return result;
    }

    Real scale = cc.damage_multiplier;
    if (cc.impulse_reference > 0.0) {
        scale *= impulse / cc.impulse_reference;
    }

    const KindId kind_a = records_[sa].kind;
    const KindId kind_b = records_[sb].kind;
    const bool a_primary = kind_a == PRIMARY_KIND;
    const bool b_primary = kind_b == PRIMARY_KIND;

    Real to_a = cc.contact_damage;
    Real to_b = cc.contact_damage;
    if (a_primary && !b_primary) {
        to_b = cc.strike_damage;
        to_a = cc.recoil_damage;
    } else if (b_primary && !a_primary) {
        to_a = cc.strike_damage;
        to_b = cc.recoil_damage;
    }

    result.second = damage_slot(sb, to_b * scale, kind_a, a);
    result.first = damage_slot(sa, to_a * scale, kind_b, b);
    return result;
}

Int32 DamageEngine::apply_area_damage(const Vec2& center, Real radius, Real amount,
                                      KindId source_kind, ObjectId exclude) {
    if (!(radius >= 0.0)) {
        return 0;
    }

    // Snapshot first: damage may destroy objects and trigger chained blasts
    std::vector<SizeT> hits;
    for (SizeT slot = 0; slot < records_.size(); ++slot) {
        const HealthRecord& rec = records_[slot];
        if (!rec.active || rec.destroyed || rec.id == exclude) {
            continue;
        }
        if (rec.position.distance_to(center) <= radius) {
            hits.push_back(slot);
        }
    }

    Int32 damaged = 0;
    for (SizeT slot : hits) {
        DamageResult r = damage_slot(slot, amount, source_kind, exclude);
        if (r == DamageResult::Applied || r == DamageResult::Destroyed) {
            ++damaged;
        }
    }
    return damaged;
}

DamageResult DamageEngine::heal(ObjectId id, Int32 amount) {
    HealthRecord* rec = lookup(id);
    if (rec == nullptr) {
        return DamageResult::NotRegistered;
    }
    if (rec->destroyed) {
        return DamageResult::AlreadyDestroyed;
    }
    Int32 healed = std::min(std::max(amount, 0), rec->max_health - rec->health);
    if (healed <= 0) {
        return DamageResult::NoEffect;
    }
    rec->health += healed;
    emit(Event::create_healed(id, healed, rec->health, clock_));
    return DamageResult::Applied;
}

void DamageEngine::reset_all_health() {
    for (auto& rec : records_) {
        if (rec.active && !rec.destroyed) {
            rec.health = rec.max_health;
            rec.damage_carry = 0.0;
        }
    }
}

// ============================================================================
// Destruction and Abilities
// ============================================================================

void DamageEngine::destroy_slot(SizeT slot) {
    HealthRecord& rec = records_[slot];
    if (rec.destroyed) {
        return;
    }
    rec.destroyed = true;
    rec.health = 0;
    rec.pulse_charging = false;

    const ObjectId id = rec.id;
    const KindId kind = rec.kind;
    const Vec2 position = rec.position;

    log::get()->info("Object {} (kind {}) destroyed at ({:.1f}, {:.1f})",
                     id, config_.kinds[kind].name, position.x, position.y);
    emit(Event::create_destroyed(id, kind, position, clock_));

    if (damage::has_ability(rec.abilities, Ability::ExplodeOnDestroy) && !rec.detonating) {
        const auto& ac = config_.abilities;
        detonate_slot(slot, Ability::ExplodeOnDestroy, ac.explosion_radius, ac.explosion_damage);
    }

    if (kind == PRIMARY_KIND && alive_primary_count() == 0) {
        emit(Event::create_primary_destroyed(id, position, clock_));
    }
    if (!config_.kinds[kind].exempt_from_clear) {
        check_all_targets();
    }
}

void DamageEngine::detonate_slot(SizeT slot, Ability ability, Real radius, Real amount) {
    HealthRecord& rec = records_[slot];
    if (rec.detonating) {
        return;
    }
    rec.detonating = true;

    const ObjectId id = rec.id;
    const KindId kind = rec.kind;
    const Vec2 position = rec.position;
    UInt32 count = ability == Ability::ExplodeOnContact ? ++rec.explosions : 1;

    emit(Event::create_ability(id, ability, position, count, clock_));

    surface::CraterRequest request{position, radius, config_.abilities.explosion_raggedness};
    Int32 cells = mutator_(request);
    emit(Event::create_crater(EventType::CraterRequested,
                              {id, position, radius, request.raggedness, cells}, clock_));

    apply_area_damage(position, radius, amount, kind, id);

    records_[slot].detonating = false;

    if (ability == Ability::ExplodeOnContact &&
        count >= config_.abilities.explosions_before_destruction) {
        // The blast itself is the destruction effect; no second detonation
        records_[slot].detonating = true;
        destroy_slot(slot);
        records_[slot].detonating = false;
    }
}

void DamageEngine::release_pulse(SizeT slot) {
    HealthRecord& rec = records_[slot];
    rec.pulse_charging = false;
    rec.pulse_timer = 0.0;
    ++rec.pulse_triggers;

    const ObjectId id = rec.id;
    const KindId kind = rec.kind;
    const Vec2 position = rec.position;
    const UInt32 triggers = rec.pulse_triggers;
    const auto& ac = config_.abilities;

    emit(Event::create_ability(id, Ability::DamagePulse, position, triggers, clock_));

    surface::CraterRequest request{position, ac.pulse_radius, ac.explosion_raggedness};
    Int32 cells = mutator_(request);
    emit(Event::create_crater(EventType::CraterRequested,
                              {id, position, ac.pulse_radius, request.raggedness, cells}, clock_));

    apply_area_damage(position, ac.pulse_radius, ac.pulse_damage, kind, id);

    if (triggers >= ac.pulse_max_triggers && !records_[slot].destroyed) {
        destroy_slot(slot);
    }
}

void DamageEngine::run_healer(SizeT slot, Real dt) {
    const auto& ac = config_.abilities;
    HealthRecord& healer = records_[slot];
    if (!healer.resting || healer.healing_spent >= ac.healing_budget) {
        return;
    }

    Real amount = ac.healing_rate * dt + healer.healing_carry;
    Real whole = std::floor(amount);
    healer.healing_carry = amount - whole;
    if (whole < 1.0) {
        return;
    }
    Int32 per_target = static_cast<Int32>(std::min(whole, ac.healing_budget - healer.healing_spent));
    if (per_target <= 0) {
        return;
    }

    const Vec2 position = healer.position;
    Int32 total = 0;
    for (auto& rec : records_) {
        if (!rec.active || rec.destroyed || rec.kind != PRIMARY_KIND) {
            continue;
        }
        if (rec.position.distance_to(position) > ac.healing_radius) {
            continue;
        }
        Int32 before = rec.health;
        if (heal(rec.id, per_target) == DamageResult::Applied) {
            total += rec.health - before;
        }
    }

    HealthRecord& self = records_[slot];
    self.healing_spent += static_cast<Real>(total);
    if (self.healing_spent >= ac.healing_budget) {
        emit(Event::create_ability(self.id, Ability::Healer, position, 1, clock_));
        destroy_slot(slot);
    }
}

void DamageEngine::check_all_targets() {
    if (all_targets_reported_) {
        return;
    }
    if (alive_target_count() == 0) {
        all_targets_reported_ = true;
        log::get()->info("All targets destroyed");
        emit(Event::create_all_targets_destroyed(clock_));
    }
}

// ============================================================================
// Simulation
// ============================================================================

void DamageEngine::update(Real dt) {
    if (!(dt > 0.0)) {
        return;
    }
    clock_ += dt;

    std::erase_if(pair_cooldowns_, [this](const auto& e) { return e.second <= clock_; });
    std::erase_if(pair_immunity_, [this](const auto& e) { return e.second <= clock_; });

    for (SizeT slot = 0; slot < records_.size(); ++slot) {
        HealthRecord& rec = records_[slot];
        if (!rec.active || rec.destroyed) {
            continue;
        }
        if (rec.pulse_charging) {
            rec.pulse_timer += dt;
            if (rec.pulse_timer >= config_.abilities.pulse_delay) {
                release_pulse(slot);
            }
        }
        if (!records_[slot].destroyed && damage::has_ability(records_[slot].abilities, Ability::Healer)) {
            run_healer(slot, dt);
        }
    }
}

void DamageEngine::set_position(ObjectId id, const Vec2& position) {
    if (HealthRecord* rec = lookup(id)) {
        rec->position = position;
    }
}

void DamageEngine::set_resting(ObjectId id, bool resting) {
    if (HealthRecord* rec = lookup(id)) {
        rec->resting = resting;
    }
}

void DamageEngine::set_abilities(ObjectId id, AbilitySet abilities) {
    if (HealthRecord* rec = lookup(id)) {
        rec->abilities = abilities;
    }
}

void DamageEngine::grant_immunity(ObjectId a, ObjectId b, Real duration) {
    if (a == b || !(duration > 0.0)) {
        return;
    }
    Real& expiry = pair_immunity_[pair_key(a, b)];
    expiry = std::max(expiry, clock_ + duration);
}

bool DamageEngine::is_immune(ObjectId a, ObjectId b) const {
    auto it = pair_immunity_.find(pair_key(a, b));
    return it != pair_immunity_.end() && it->second > clock_;
}

// ============================================================================
// Queries
// ============================================================================

bool DamageEngine::is_registered(ObjectId id) const {
    return index_.count(id) != 0;
}

bool DamageEngine::is_alive(ObjectId id) const {
    const HealthRecord* rec = lookup(id);
    return rec != nullptr && !rec->destroyed;
}

Int32 DamageEngine::health(ObjectId id) const {
    const HealthRecord* rec = lookup(id);
    return rec != nullptr ? rec->health : 0;
}

Int32 DamageEngine::max_health(ObjectId id) const {
    const HealthRecord* rec = lookup(id);
    return rec != nullptr ? rec->max_health : 0;
}

bool DamageEngine::has_ability(ObjectId id, Ability ability) const {
    const HealthRecord* rec = lookup(id);
    return rec != nullptr && damage::has_ability(rec->abilities, ability);
}

bool DamageEngine::prevents_sinking(ObjectId id) const {
    return has_ability(id, Ability::Flying);
}

const HealthRecord* DamageEngine::find(ObjectId id) const {
    return lookup(id);
}

SizeT DamageEngine::alive_count() const {
    return static_cast<SizeT>(std::count_if(records_.begin(), records_.end(),
        [](const HealthRecord& r) { return r.active && !r.destroyed; }));
}

SizeT DamageEngine::alive_primary_count() const {
    return static_cast<SizeT>(std::count_if(records_.begin(), records_.end(),
        [](const HealthRecord& r) { return r.active && !r.destroyed && r.kind == PRIMARY_KIND; }));
}

SizeT DamageEngine::alive_target_count() const {
    return static_cast<SizeT>(std::count_if(records_.begin(), records_.end(),
        [this](const HealthRecord& r) {
            return r.active && !r.destroyed && !config_.kinds[r.kind].exempt_from_clear;
        }));
}

std::vector<Vec2> DamageEngine::occupied_positions(ObjectId exclude) const {
    std::vector<Vec2> out;
    out.reserve(index_.size());
    for (const auto& rec : records_) {
        if (rec.active && !rec.destroyed && rec.id != exclude) {
            out.push_back(rec.position);
        }
    }
    return out;
}

const KindProfile& DamageEngine::profile(KindId kind) const {
    return config_.kinds.at(kind);
}

// ============================================================================
// Internals
// ============================================================================

SizeT DamageEngine::slot_of(ObjectId id) const {
    auto it = index_.find(id);
    return it != index_.end() ? it->second : NO_SLOT;
}

HealthRecord* DamageEngine::lookup(ObjectId id) {
    SizeT slot = slot_of(id);
    return slot != NO_SLOT ? &records_[slot] : nullptr;
}

const HealthRecord* DamageEngine::lookup(ObjectId id) const {
    SizeT slot = slot_of(id);
    return slot != NO_SLOT ? &records_[slot] : nullptr;
}

void DamageEngine::emit(Event event) {
    events_.push(std::move(event));
}

UInt64 DamageEngine::pair_key(ObjectId a, ObjectId b) noexcept {
    ObjectId lo = std::min(a, b);
    ObjectId hi = std::max(a, b);
    return (static_cast<UInt64>(lo) << 32) | static_cast<UInt64>(hi);
}

} // namespace crater::damage
