#include "chronicle/timeline/ProcessorSupport.hh"

#include <algorithm>
#include <iterator>

namespace chronicle {

namespace {

constexpr std::string_view kRealCountryTypes[] = {"default", "fallen_empire", "awakened_fallen_empire"};

constexpr std::string_view kColonizableClasses[] = {
    "pc_desert", "pc_arid", "pc_savannah", "pc_tropical", "pc_continental", "pc_ocean", "pc_tundra",
    "pc_arctic", "pc_alpine", "pc_gaia", "pc_nuked", "pc_machine",
    // megastructures
    "pc_ringworld_habitable", "pc_habitat",
    // planetary diversity
    "pc_antarctic", "pc_deadcity", "pc_retinal", "pc_irradiated_terrestrial", "pc_lush", "pc_geocrystalline",
    "pc_marginal", "pc_irradiated_marginal", "pc_marginal_cold", "pc_crystal", "pc_floating", "pc_graveyard",
    "pc_mushroom", "pc_city", "pc_archive", "pc_biolumen", "pc_technoorganic", "pc_tidallylocked", "pc_glacial",
    "pc_frozen_desert", "pc_steppe", "pc_hadesert", "pc_boreal", "pc_sandsea", "pc_subarctic", "pc_geothermal",
    "pc_cascadian", "pc_swamp", "pc_mangrove", "pc_desertislands", "pc_mesa", "pc_oasis", "pc_hajungle",
    "pc_methane", "pc_ammonia"};

constexpr std::string_view kDestroyedClasses[] = {
    // weapons
    "pc_shattered", "pc_shielded", "pc_ringworld_shielded", "pc_habitat_shielded", "pc_ringworld_habitable_damaged",
    // events and crises
    "pc_egg_cracked", "pc_shrouded", "pc_ai", "pc_infested", "pc_gray_goo"};

template <size_t N> bool contains(const std::string_view (&values)[N], std::string_view value) {
    return std::find(std::begin(values), std::end(values), value) != std::end(values);
}

} // namespace

std::vector<std::pair<std::int64_t, const Value*>> idEntries(const Value* section) {
    std::vector<std::pair<std::int64_t, const Value*>> entries;
    if (!section || !section->isMap()) {
        return entries;
    }
    const auto& map = section->asMap();
    entries.reserve(map.size());
    for (size_t i = 0; i < map.size(); ++i) {
        const auto* id = std::get_if<std::int64_t>(&map.keyAt(i));
        const auto& value = map.valueAt(i);
        if (id && value.isMap()) {
            entries.emplace_back(*id, &value);
        }
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return entries;
}

std::vector<std::pair<std::int64_t, const Value*>> idEntries(const Value& node, const Key& key) {
    return idEntries(node.get(key));
}

std::string nameOf(const Value* node, std::string_view fallback) {
    if (!node) {
        return std::string(fallback);
    }
    if (node->isString()) {
        return node->asString();
    }
    if (node->isMap()) {
        const auto* key = node->get(std::string("key"));
        if (key && key->isString()) {
            return key->asString();
        }
    }
    return std::string(fallback);
}

std::string nameAt(const Value& node, const Key& key, std::string_view fallback) {
    return nameOf(node.get(key), fallback);
}

bool isRealCountryType(std::string_view countryType) {
    return contains(kRealCountryTypes, countryType);
}

bool isColonizablePlanetClass(std::string_view planetClass) {
    return contains(kColonizableClasses, planetClass);
}

bool isDestroyedPlanetClass(std::string_view planetClass) {
    return contains(kDestroyedClasses, planetClass);
}

std::optional<Day> dayAt(const Value& node, const Key& key) {
    const auto* v = node.get(key);
    if (!v || !v->isString()) {
        return std::nullopt;
    }
    return dateToDays(v->asString());
}

std::optional<std::int64_t> intAt(const Value& node, const Key& key) {
    const auto* v = node.get(key);
    if (v && v->isList() && !v->asList().empty()) {
        v = &v->asList().front();
    }
    if (!v || !v->isInt()) {
        return std::nullopt;
    }
    return v->asInt();
}

double numberOf(const Value* node, double fallback) {
    if (node && node->isList() && !node->asList().empty()) {
        node = &node->asList().front();
    }
    return (node && node->isNumber()) ? node->asNumber() : fallback;
}

bool assignAttr(IdentityMap& entities, Entity& entity, const std::string& key, nlohmann::json value) {
    auto it = entity.attributes.find(key);
    if (it != entity.attributes.end() && *it == value) {
        return false;
    }
    entity.attributes[key] = std::move(value);
    entities.touch(entity);
    return true;
}

HistoricalEvent appendInstant(const EventScope& scope, EventKind kind, EventSubject subject, bool known) {
    HistoricalEvent event;
    event.kind = kind;
    event.start = scope.day;
    event.end = scope.day;
    event.subject = std::move(subject);
    event.knownToObserver = known;
    return scope.store.appendEvent(scope.series, std::move(event));
}

bool revealsFor(const ObserverView& view, EventKind kind, const Entity* country) {
    return country && view.reveals(kind, country->sourceId);
}

bool revealsFor(const ObserverView& view, EventKind kind, const Entity* country, const Entity* counterpart) {
    return revealsFor(view, kind, country) || revealsFor(view, kind, counterpart);
}

} // namespace chronicle
