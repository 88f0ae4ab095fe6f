/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Reads and writes CoreConfig using pugixml. Missing elements keep their
 * default values.
 */

#include "crater/config/config.h"
#include <pugixml.hpp>
#include <filesystem>
#include <stdexcept>

namespace crater::config {

namespace {

// ============================================================================
// Parse Helpers
// ============================================================================

Real read_real(const pugi::xml_node& parent, const char* name, Real fallback) {
    return parent.child(name).text().as_double(fallback);
}

Int32 read_int(const pugi::xml_node& parent, const char* name, Int32 fallback) {
    return parent.child(name).text().as_int(fallback);
}

UInt32 read_uint(const pugi::xml_node& parent, const char* name, UInt32 fallback) {
    return parent.child(name).text().as_uint(fallback);
}

UInt64 read_u64(const pugi::xml_node& parent, const char* name, UInt64 fallback) {
    return static_cast<UInt64>(parent.child(name).text().as_ullong(fallback));
}

bool read_bool(const pugi::xml_node& parent, const char* name, bool fallback) {
    return parent.child(name).text().as_bool(fallback);
}

std::string read_string(const pugi::xml_node& parent, const char* name, const std::string& fallback) {
    auto node = parent.child(name);
    return node ? std::string(node.text().as_string(fallback.c_str())) : fallback;
}

template<typename T>
void write(pugi::xml_node& parent, const char* name, const T& value) {
    parent.append_child(name).text().set(value);
}

void write_string(pugi::xml_node& parent, const char* name, const std::string& value) {
    parent.append_child(name).text().set(value.c_str());
}

void parse_crater(const pugi::xml_node& node, surface::CraterParams& c) {
    c.inner_fraction = read_real(node, "inner_fraction", c.inner_fraction);
    c.segment_count = read_int(node, "segments", c.segment_count);
    c.perturbation = read_real(node, "perturbation", c.perturbation);
    c.inner_perturbation_scale = read_real(node, "inner_perturbation_scale", c.inner_perturbation_scale);
    c.spike_edge_low = read_real(node, "spike_edge_low", c.spike_edge_low);
    c.spike_edge_high = read_real(node, "spike_edge_high", c.spike_edge_high);
    c.spike_noise_high = read_real(node, "spike_noise_high", c.spike_noise_high);
    c.spike_noise_low = read_real(node, "spike_noise_low", c.spike_noise_low);
    c.spike_strength = read_real(node, "spike_strength", c.spike_strength);
    c.destroy_threshold = read_real(node, "destroy_threshold", c.destroy_threshold);
}

void parse_kind(const pugi::xml_node& node, damage::KindProfile& k) {
    k.name = node.attribute("name").as_string(k.name.c_str());
    k.max_health = read_int(node, "max_health", k.max_health);
    k.armor = read_real(node, "armor", k.armor);
    k.same_kind_multiplier = read_real(node, "same_kind_multiplier", k.same_kind_multiplier);
    k.incoming_multiplier = read_real(node, "incoming_multiplier", k.incoming_multiplier);
    k.exempt_from_clear = read_bool(node, "exempt", k.exempt_from_clear);

    if (node.child("ability")) {
        k.abilities = 0;
        for (auto ability : node.children("ability")) {
            const char* name = ability.text().as_string();
            damage::Ability a = damage::ability_from_string(name);
            if (a == damage::Ability::None) {
                throw std::runtime_error(std::string("Unknown ability: ") + name);
            }
            k.abilities = k.abilities | a;
        }
    }
}

void parse_damage(const pugi::xml_node& node, damage::DamageConfig& d) {
    if (auto c = node.child("collision")) {
        auto& cc = d.collision;
        cc.min_impulse = read_real(c, "min_impulse", cc.min_impulse);
        cc.strike_damage = read_real(c, "strike_damage", cc.strike_damage);
        cc.recoil_damage = read_real(c, "recoil_damage", cc.recoil_damage);
        cc.contact_damage = read_real(c, "contact_damage", cc.contact_damage);
        cc.damage_multiplier = read_real(c, "damage_multiplier", cc.damage_multiplier);
        cc.impulse_reference = read_real(c, "impulse_reference", cc.impulse_reference);
        cc.pair_cooldown = read_real(c, "pair_cooldown", cc.pair_cooldown);
    }

    if (auto a = node.child("abilities")) {
        auto& ac = d.abilities;
        ac.explosion_radius = read_real(a, "explosion_radius", ac.explosion_radius);
        ac.explosion_damage = read_real(a, "explosion_damage", ac.explosion_damage);
        ac.explosion_raggedness = read_real(a, "explosion_raggedness", ac.explosion_raggedness);
        ac.explosions_before_destruction = read_uint(a, "explosions_before_destruction",
                                                     ac.explosions_before_destruction);
        ac.pulse_radius = read_real(a, "pulse_radius", ac.pulse_radius);
        ac.pulse_damage = read_real(a, "pulse_damage", ac.pulse_damage);
        ac.pulse_delay = read_real(a, "pulse_delay", ac.pulse_delay);
        ac.pulse_max_triggers = read_uint(a, "pulse_max_triggers", ac.pulse_max_triggers);
        ac.healing_radius = read_real(a, "healing_radius", ac.healing_radius);
        ac.healing_rate = read_real(a, "healing_rate", ac.healing_rate);
        ac.healing_budget = read_real(a, "healing_budget", ac.healing_budget);
    }

    for (auto kind : node.children("kind")) {
        auto id = kind.attribute("id");
        if (!id) {
            throw std::runtime_error("Damage kind without id attribute");
        }
        unsigned int index = id.as_uint(MAX_KINDS);
        if (index >= MAX_KINDS) {
            throw std::runtime_error("Damage kind id out of range: " + std::string(id.value()));
        }
        parse_kind(kind, d.kinds[index]);
    }
}

CoreConfig parse_document(const pugi::xml_document& doc) {
    auto root = doc.child("crater_config");
    if (!root) {
        root = doc.child("config");
    }
    if (!root) {
        throw std::runtime_error("Invalid crater config XML: no root element");
    }

    CoreConfig config = CoreConfig::defaults();

    if (auto r = root.child("random")) {
        config.random.seed = read_u64(r, "seed", config.random.seed);
        config.random.call_counter = read_u64(r, "call_counter", config.random.call_counter);
    }

    if (auto l = root.child("logging")) {
        auto& lc = config.logging;
        lc.level = read_string(l, "level", lc.level);
        lc.pattern = read_string(l, "pattern", lc.pattern);
        lc.file_path = read_string(l, "file", lc.file_path);
        lc.console = read_bool(l, "console", lc.console);
    }

    if (auto s = root.child("surface")) {
        auto& sc = config.surface;
        sc.table_height = read_real(s, "table_height", sc.table_height);
        sc.cell_size = read_real(s, "cell_size", sc.cell_size);
        sc.default_raggedness = read_real(s, "raggedness", sc.default_raggedness);
        if (auto c = s.child("crater")) {
            parse_crater(c, sc.crater);
        }
    }

    if (auto d = root.child("damage")) {
        parse_damage(d, config.damage);
    }

    if (auto sp = root.child("spawn")) {
        auto& spc = config.spawn;
        spc.max_attempts = read_int(sp, "max_attempts", spc.max_attempts);
        spc.offset_distance = read_real(sp, "offset_distance", spc.offset_distance);
        spc.degraded_clearance_factor = read_real(sp, "degraded_clearance_factor",
                                                  spc.degraded_clearance_factor);
        spc.allow_degraded = read_bool(sp, "allow_degraded", spc.allow_degraded);
    }

    if (auto e = root.child("events")) {
        config.events.max_queue_size = static_cast<SizeT>(
            read_u64(e, "max_queue_size", config.events.max_queue_size));
    }

    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        log::get()->error("Rejected crater config: {}", e.what());
        throw std::runtime_error(std::string("Invalid crater config: ") + e.what());
    }
    return config;
}

} // anonymous namespace

// ============================================================================
// CoreConfig Implementation
// ============================================================================

CoreConfig CoreConfig::defaults() {
    return CoreConfig{};
}

void CoreConfig::validate() const {
    if (!(surface.table_height > 0.0) || !(surface.cell_size > 0.0)) {
        throw std::invalid_argument("SurfaceConfig: table_height and cell_size must be positive");
    }
    if (!(surface.default_raggedness >= 0.0 && surface.default_raggedness <= 1.0)) {
        throw std::invalid_argument("SurfaceConfig: raggedness must be in [0, 1]");
    }
    surface.crater.validate();
    damage.validate();
    spawn.validate();
    if (events.max_queue_size == 0) {
        throw std::invalid_argument("EventQueueConfig: max_queue_size must be positive");
    }
}

CoreConfig CoreConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        log::get()->error("Failed to load config {}: {}", path, result.description());
        throw std::runtime_error("Failed to load config: " + std::string(result.description()));
    }
    return parse_document(doc);
}

CoreConfig CoreConfig::parse(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        log::get()->error("Failed to parse config: {}", result.description());
        throw std::runtime_error("Failed to parse config: " + std::string(result.description()));
    }
    return parse_document(doc);
}

bool CoreConfig::save(const std::string& path) const {
    pugi::xml_document doc;
    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("crater_config");

    auto r = root.append_child("random");
    write(r, "seed", static_cast<unsigned long long>(random.seed));
    write(r, "call_counter", static_cast<unsigned long long>(random.call_counter));

    auto l = root.append_child("logging");
    write_string(l, "level", logging.level);
    write_string(l, "pattern", logging.pattern);
    write_string(l, "file", logging.file_path);
    write(l, "console", logging.console);

    auto s = root.append_child("surface");
    write(s, "table_height", surface.table_height);
    write(s, "cell_size", surface.cell_size);
    write(s, "raggedness", surface.default_raggedness);
    auto c = s.append_child("crater");
    const auto& cp = surface.crater;
    write(c, "inner_fraction", cp.inner_fraction);
    write(c, "segments", cp.segment_count);
    write(c, "perturbation", cp.perturbation);
    write(c, "inner_perturbation_scale", cp.inner_perturbation_scale);
    write(c, "spike_edge_low", cp.spike_edge_low);
    write(c, "spike_edge_high", cp.spike_edge_high);
    write(c, "spike_noise_high", cp.spike_noise_high);
    write(c, "spike_noise_low", cp.spike_noise_low);
    write(c, "spike_strength", cp.spike_strength);
    write(c, "destroy_threshold", cp.destroy_threshold);

    auto d = root.append_child("damage");
    auto col = d.append_child("collision");
    const auto& cc = damage.collision;
    write(col, "min_impulse", cc.min_impulse);
    write(col, "strike_damage", cc.strike_damage);
    write(col, "recoil_damage", cc.recoil_damage);
    write(col, "contact_damage", cc.contact_damage);
    write(col, "damage_multiplier", cc.damage_multiplier);
    write(col, "impulse_reference", cc.impulse_reference);
    write(col, "pair_cooldown", cc.pair_cooldown);

    auto ab = d.append_child("abilities");
    const auto& ac = damage.abilities;
    write(ab, "explosion_radius", ac.explosion_radius);
    write(ab, "explosion_damage", ac.explosion_damage);
    write(ab, "explosion_raggedness", ac.explosion_raggedness);
    write(ab, "explosions_before_destruction", ac.explosions_before_destruction);
    write(ab, "pulse_radius", ac.pulse_radius);
    write(ab, "pulse_damage", ac.pulse_damage);
    write(ab, "pulse_delay", ac.pulse_delay);
    write(ab, "pulse_max_triggers", ac.pulse_max_triggers);
    write(ab, "healing_radius", ac.healing_radius);
    write(ab, "healing_rate", ac.healing_rate);
    write(ab, "healing_budget", ac.healing_budget);

    constexpr damage::Ability ALL_ABILITIES[] = {
        damage::Ability::ExplodeOnContact, damage::Ability::ExplodeOnDestroy,
        damage::Ability::DamagePulse, damage::Ability::Spawner,
        damage::Ability::Healer, damage::Ability::Flying,
    };
    for (SizeT i = 0; i < damage.kinds.size(); ++i) {
        const auto& k = damage.kinds[i];
        auto kn = d.append_child("kind");
        kn.append_attribute("id") = static_cast<unsigned int>(i);
        kn.append_attribute("name") = k.name.c_str();
        write(kn, "max_health", k.max_health);
        write(kn, "armor", k.armor);
        write(kn, "same_kind_multiplier", k.same_kind_multiplier);
        write(kn, "incoming_multiplier", k.incoming_multiplier);
        write(kn, "exempt", k.exempt_from_clear);
        for (auto a : ALL_ABILITIES) {
            if (damage::has_ability(k.abilities, a)) {
                write_string(kn, "ability", damage::ability_to_string(a));
            }
        }
    }

    auto sp = root.append_child("spawn");
    write(sp, "max_attempts", spawn.max_attempts);
    write(sp, "offset_distance", spawn.offset_distance);
    write(sp, "degraded_clearance_factor", spawn.degraded_clearance_factor);
    write(sp, "allow_degraded", spawn.allow_degraded);

    auto e = root.append_child("events");
    write(e, "max_queue_size", static_cast<unsigned long long>(events.max_queue_size));

    return doc.save_file(path.c_str());
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::ConfigLoader() {
    // Add default search paths
    search_paths_.push_back(".");
    search_paths_.push_back("./data");
    search_paths_.push_back("./config");
}

ConfigLoader::~ConfigLoader() = default;

CoreConfig ConfigLoader::load_core_config(const std::string& path) {
    std::string full_path = find_file(path);
    if (full_path.empty()) {
        throw std::runtime_error("Config file not found: " + path);
    }
    return CoreConfig::load(full_path);
}

void ConfigLoader::add_search_path(const std::string& path) {
    search_paths_.push_back(path);
}

std::string ConfigLoader::find_file(const std::string& filename) const {
    if (std::filesystem::path(filename).is_absolute()) {
        return std::filesystem::exists(filename) ? filename : std::string();
    }

    for (const auto& search_path : search_paths_) {
        std::filesystem::path full_path = std::filesystem::path(search_path) / filename;
        if (std::filesystem::exists(full_path)) {
            return full_path.string();
        }
    }
    return {};
}

} // namespace crater::config
