#include "chronicle/store/Model.hh"

#include "chronicle/utils/ErrorHandling.hh"

#include <algorithm>
#include <array>
#include <utility>

namespace chronicle {

namespace {

constexpr std::array<std::pair<EntityKind, std::string_view>, 7> kEntityKindNames = {{
    {EntityKind::Country, "country"},
    {EntityKind::System, "system"},
    {EntityKind::Leader, "leader"},
    {EntityKind::Planet, "planet"},
    {EntityKind::Faction, "faction"},
    {EntityKind::War, "war"},
    {EntityKind::Species, "species"},
}};

constexpr std::array<std::pair<EventKind, std::string_view>, 38> kEventKindNames = {{
    {EventKind::RuledEmpire, "ruled_empire"},
    {EventKind::GovernedSector, "governed_sector"},
    {EventKind::FactionLeader, "faction_leader"},
    {EventKind::ResearchLeader, "research_leader"},
    {EventKind::LeaderRecruited, "leader_recruited"},
    {EventKind::LeaderDied, "leader_died"},
    {EventKind::LevelUp, "level_up"},
    {EventKind::GainedTrait, "gained_trait"},
    {EventKind::LostTrait, "lost_trait"},
    {EventKind::ResearchedTechnology, "researched_technology"},
    {EventKind::Tradition, "tradition"},
    {EventKind::AscensionPerk, "ascension_perk"},
    {EventKind::Edict, "edict"},
    {EventKind::ExpandedToSystem, "expanded_to_system"},
    {EventKind::ConqueredSystem, "conquered_system"},
    {EventKind::LostSystem, "lost_system"},
    {EventKind::Colonization, "colonization"},
    {EventKind::CapitalRelocation, "capital_relocation"},
    {EventKind::PlanetDestroyed, "planet_destroyed"},
    {EventKind::Terraforming, "terraforming"},
    {EventKind::NewFaction, "new_faction"},
    {EventKind::GovernmentReform, "government_reform"},
    {EventKind::FirstContact, "first_contact"},
    {EventKind::NonAggressionPact, "non_aggression_pact"},
    {EventKind::DefensivePact, "defensive_pact"},
    {EventKind::FormedFederation, "formed_federation"},
    {EventKind::CommercialPact, "commercial_pact"},
    {EventKind::ResearchAgreement, "research_agreement"},
    {EventKind::MigrationTreaty, "migration_treaty"},
    {EventKind::Embassy, "embassy"},
    {EventKind::ClosedBorders, "closed_borders"},
    {EventKind::ReceivedClosedBorders, "received_closed_borders"},
    {EventKind::SentRivalry, "sent_rivalry"},
    {EventKind::ReceivedRivalry, "received_rivalry"},
    {EventKind::War, "war"},
    {EventKind::Peace, "peace"},
    {EventKind::FleetCombat, "fleet_combat"},
    {EventKind::ArmyCombat, "army_combat"},
}};

bool sameOrUnset(const std::optional<EntityId>& wanted, EntityId actual) {
    return !wanted || *wanted == actual;
}

EventKind eventKindOrThrow(const std::string& name) {
    auto kind = eventKindFromString(name);
    if (!kind) {
        throwError("Unknown event kind '" + name + "'");
    }
    return *kind;
}

} // namespace

std::string_view entityKindToString(EntityKind kind) {
    for (const auto& [k, name] : kEntityKindNames) {
        if (k == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<EntityKind> entityKindFromString(std::string_view name) {
    for (const auto& [k, n] : kEntityKindNames) {
        if (n == name) {
            return k;
        }
    }
    return std::nullopt;
}

std::string_view eventKindToString(EventKind kind) {
    for (const auto& [k, name] : kEventKindNames) {
        if (k == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<EventKind> eventKindFromString(std::string_view name) {
    for (const auto& [k, n] : kEventKindNames) {
        if (n == name) {
            return k;
        }
    }
    return std::nullopt;
}

// -- Entity --

std::string Entity::attrString(const std::string& key, std::string_view fallback) const {
    auto it = attributes.find(key);
    if (it != attributes.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::string(fallback);
}

std::int64_t Entity::attrInt(const std::string& key, std::int64_t fallback) const {
    auto it = attributes.find(key);
    if (it != attributes.end() && it->is_number_integer()) {
        return it->get<std::int64_t>();
    }
    return fallback;
}

bool Entity::attrBool(const std::string& key, bool fallback) const {
    auto it = attributes.find(key);
    if (it != attributes.end() && it->is_boolean()) {
        return it->get<bool>();
    }
    return fallback;
}

bool Entity::hasAttr(const std::string& key) const {
    return attributes.contains(key) && !attributes.at(key).is_null();
}

// -- EventFilter --

EventFilter EventFilter::forSubject(EventKind kind, const EventSubject& subject) {
    EventFilter filter;
    filter.kinds = {kind};
    filter.country = subject.country;
    filter.targetCountry = subject.targetCountry;
    filter.leader = subject.leader;
    filter.system = subject.system;
    filter.planet = subject.planet;
    filter.war = subject.war;
    filter.faction = subject.faction;
    filter.description = subject.description;
    return filter;
}

bool EventFilter::matches(const HistoricalEvent& event) const {
    if (!kinds.empty() && std::find(kinds.begin(), kinds.end(), event.kind) == kinds.end()) {
        return false;
    }
    const auto& s = event.subject;
    if (!sameOrUnset(country, s.country) || !sameOrUnset(targetCountry, s.targetCountry) ||
        !sameOrUnset(leader, s.leader) || !sameOrUnset(system, s.system) || !sameOrUnset(planet, s.planet) ||
        !sameOrUnset(war, s.war) || !sameOrUnset(faction, s.faction)) {
        return false;
    }
    if (description && *description != s.description) {
        return false;
    }
    if (openOnly && !event.isOpen()) {
        return false;
    }
    if (knownOnly && !event.knownToObserver) {
        return false;
    }
    if (to && event.start > *to) {
        return false;
    }
    if (from && event.end && *event.end < *from) {
        return false;
    }
    return true;
}

// -- JSON --

void to_json(nlohmann::json& j, const Entity& e) {
    j = nlohmann::json{{"id", e.id},
                       {"kind", std::string(entityKindToString(e.kind))},
                       {"source_id", e.sourceId},
                       {"attributes", e.attributes}};
}

void from_json(const nlohmann::json& j, Entity& e) {
    j.at("id").get_to(e.id);
    auto kind = entityKindFromString(j.at("kind").get<std::string>());
    if (!kind) {
        throwError("Unknown entity kind '" + j.at("kind").get<std::string>() + "'");
    }
    e.kind = *kind;
    j.at("source_id").get_to(e.sourceId);
    e.attributes = j.value("attributes", nlohmann::json::object());
}

void to_json(nlohmann::json& j, const EventSubject& s) {
    j = nlohmann::json::object();
    auto put = [&j](const char* name, EntityId id) {
        if (id != kNoEntity) {
            j[name] = id;
        }
    };
    put("country", s.country);
    put("target_country", s.targetCountry);
    put("leader", s.leader);
    put("system", s.system);
    put("planet", s.planet);
    put("war", s.war);
    put("faction", s.faction);
    if (!s.description.empty()) {
        j["description"] = s.description;
    }
}

void from_json(const nlohmann::json& j, EventSubject& s) {
    s.country = j.value("country", kNoEntity);
    s.targetCountry = j.value("target_country", kNoEntity);
    s.leader = j.value("leader", kNoEntity);
    s.system = j.value("system", kNoEntity);
    s.planet = j.value("planet", kNoEntity);
    s.war = j.value("war", kNoEntity);
    s.faction = j.value("faction", kNoEntity);
    s.description = j.value("description", std::string());
}

void to_json(nlohmann::json& j, const HistoricalEvent& e) {
    j = nlohmann::json{{"id", e.id},
                       {"kind", std::string(eventKindToString(e.kind))},
                       {"start", e.start},
                       {"subject", e.subject},
                       {"known", e.knownToObserver}};
    if (e.end) {
        j["end"] = *e.end;
    }
}

void from_json(const nlohmann::json& j, HistoricalEvent& e) {
    j.at("id").get_to(e.id);
    e.kind = eventKindOrThrow(j.at("kind").get<std::string>());
    j.at("start").get_to(e.start);
    if (j.contains("end") && !j.at("end").is_null()) {
        e.end = j.at("end").get<Day>();
    } else {
        e.end.reset();
    }
    e.subject = j.value("subject", EventSubject{});
    e.knownToObserver = j.value("known", false);
}

void to_json(nlohmann::json& j, const SnapshotRecord& r) {
    j = nlohmann::json{{"entity", r.entity}, {"kind", r.kind}, {"day", r.day}, {"values", r.values}};
}

void from_json(const nlohmann::json& j, SnapshotRecord& r) {
    j.at("entity").get_to(r.entity);
    j.at("kind").get_to(r.kind);
    j.at("day").get_to(r.day);
    r.values = j.value("values", nlohmann::json::object());
}

} // namespace chronicle
