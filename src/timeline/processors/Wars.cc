#include "chronicle/timeline/Processors.hh"

#include "chronicle/core/Log.hh"
#include "chronicle/timeline/ProcessorSupport.hh"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace chronicle {

namespace {

constexpr const char* kInProgress = "in_progress";

struct Participant {
    std::int64_t country = -1;
    bool attacker = false;
    std::string callType;
    std::int64_t caller = -1;
};

std::vector<Participant> participantsOf(const Value& war) {
    std::vector<Participant> participants;
    for (auto [key, attacker] : {std::pair{"attackers", true}, std::pair{"defenders", false}}) {
        for (const auto* party : itemsAt(war, key)) {
            if (!party->isMap()) {
                continue;
            }
            Participant participant;
            participant.country = getIntOr(*party, "country", -1);
            participant.attacker = attacker;
            participant.callType = getStringOr(*party, "call_type", "unknown");
            participant.caller = getIntOr(*party, "caller", -1);
            participants.push_back(std::move(participant));
        }
    }
    return participants;
}

std::set<std::int64_t> participantIds(const Entity& war) {
    std::set<std::int64_t> ids;
    auto it = war.attributes.find("participant_ids");
    if (it != war.attributes.end() && it->is_array()) {
        for (const auto& id : *it) {
            if (id.is_number_integer()) {
                ids.insert(id.get<std::int64_t>());
            }
        }
    }
    return ids;
}

std::string battleDescription(const std::string& type, bool attackerVictory, double attackerExhaustion,
                              double defenderExhaustion) {
    std::ostringstream out;
    out << type << "|" << (attackerVictory ? "attacker" : "defender") << "|" << std::fixed << std::setprecision(3)
        << attackerExhaustion << "|" << defenderExhaustion;
    return out.str();
}

// Records the battles of one war that were not seen before.
void recordBattles(ProcessorInput& input, const Value& node, Entity& war, const CountriesOutput& countries,
                   const SystemsOutput& systems, const PlanetsOutput& planets, const ObserverView& view) {
    auto scope = input.scope();
    for (const auto* battle : itemsAt(node, "battles")) {
        if (!battle->isMap()) {
            continue;
        }
        auto attackers = intsAt(*battle, "attackers");
        auto defenders = intsAt(*battle, "defenders");
        std::string victory = getStringOr(*battle, "attacker_victory", "");
        if (attackers.empty() || defenders.empty() || (victory != "yes" && victory != "no")) {
            continue;
        }

        EventSubject subject;
        subject.war = war.id;
        if (Entity* planet = lookup(planets.planets, getIntOr(*battle, "planet", -1))) {
            subject.planet = planet->id;
            subject.system = planet->attrInt("system", kNoEntity);
        } else if (Entity* system = lookup(systems.systems, getIntOr(*battle, "system", -1))) {
            subject.system = system->id;
        } else {
            continue;
        }

        std::string type = getStringOr(*battle, "type", "other");
        double attackerExhaustion = getNumberOr(*battle, "attacker_war_exhaustion", 0.0);
        double defenderExhaustion = getNumberOr(*battle, "defender_war_exhaustion", 0.0);
        if (attackerExhaustion + defenderExhaustion <= 0.001 && type != "armies") {
            continue;
        }
        Day date = dayAt(*battle, "date").value_or(input.day());

        Entity* attacker = lookup(countries.countries, attackers.front());
        Entity* defender = lookup(countries.countries, defenders.front());
        subject.country = entityIdOf(attacker);
        subject.targetCountry = entityIdOf(defender);
        subject.description = battleDescription(type, victory == "yes", attackerExhaustion, defenderExhaustion);

        bool known = false;
        for (std::int64_t countryId : attackers) {
            known = known || revealsFor(view, EventKind::FleetCombat, lookup(countries.countries, countryId));
        }
        for (std::int64_t countryId : defenders) {
            known = known || revealsFor(view, EventKind::FleetCombat, lookup(countries.countries, countryId));
        }
        EventKind kind = type == "armies" ? EventKind::ArmyCombat : EventKind::FleetCombat;
        recordMomentaryEvent(scope, kind, subject, known, date, date);
    }
}

} // namespace

std::any WarProcessor::run(ProcessorInput& input) {
    const auto& rulers = input.deps.get<RulersOutput>(processor_id::kRuler);
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& systems = input.deps.get<SystemsOutput>(processor_id::kSystems);
    const auto& planets = input.deps.get<PlanetsOutput>(processor_id::kPlanetModels);
    const auto& view = input.deps.get<ObserverView>(processor_id::kObserverRelations);
    auto scope = input.scope();

    WarsOutput out;
    for (const auto& [warId, node] : idEntries(input.gamestate(), "war")) {
        bool created = false;
        Entity& war = input.entities.getOrCreate(EntityKind::War, warId, &created);
        if (created) {
            assignAttr(input.entities, war, "start_day", dayAt(*node, "start_date").value_or(input.day()));
            assignAttr(input.entities, war, "outcome", kInProgress);
        } else if (war.attrString("outcome") != kInProgress) {
            continue;
        }
        assignAttr(input.entities, war, "name", nameAt(*node, "name", "Unnamed war"));
        assignAttr(input.entities, war, "attacker_exhaustion", getNumberOr(*node, "attacker_war_exhaustion", 0.0));
        assignAttr(input.entities, war, "defender_exhaustion", getNumberOr(*node, "defender_war_exhaustion", 0.0));
        out.activeWars[warId] = &war;

        auto known = participantIds(war);
        nlohmann::json participants = war.hasAttr("participants") ? war.attributes.at("participants")
                                                                   : nlohmann::json::array();
        for (const auto& participant : participantsOf(*node)) {
            Entity* country = lookup(countries.countries, participant.country);
            if (!country) {
                input.ambiguous("war " + std::to_string(warId) + " has unknown participant " +
                                std::to_string(participant.country));
                continue;
            }
            if (!known.insert(participant.country).second) {
                continue;
            }
            participants.push_back({{"country", country->id},
                                    {"attacker", participant.attacker},
                                    {"call_type", participant.callType}});

            EventSubject subject;
            subject.country = country->id;
            subject.targetCountry = entityIdOf(lookup(countries.countries, participant.caller));
            subject.leader = entityIdOf(rulers.rulerOf(participant.country));
            subject.war = war.id;
            subject.description = participant.callType;
            appendInstant(scope, EventKind::War, subject, revealsFor(view, EventKind::War, country));
        }
        assignAttr(input.entities, war, "participants", std::move(participants));
        assignAttr(input.entities, war, "participant_ids", nlohmann::json(known));

        recordBattles(input, *node, war, countries, systems, planets, view);
    }
    return out;
}

std::any TruceProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& rulers = input.deps.get<RulersOutput>(processor_id::kRuler);
    const auto& diplomacy = input.deps.get<DiplomacyOutput>(processor_id::kDiplomacy);
    const auto& wars = input.deps.get<WarsOutput>(processor_id::kWars);
    const ObserverView* view = input.deps.contains(processor_id::kObserverRelations)
                                   ? &input.deps.get<ObserverView>(processor_id::kObserverRelations)
                                   : nullptr;
    auto scope = input.scope();

    std::map<std::int64_t, const Value*> warTruces;
    for (const auto& [truceId, node] : idEntries(input.gamestate(), "truce")) {
        if (getStringOr(*node, "truce_type", "") == "war") {
            warTruces[truceId] = node;
        }
    }

    for (Entity* war : input.entities.all(EntityKind::War)) {
        if (war->attrString("outcome") != kInProgress || lookup(wars.activeWars, war->sourceId)) {
            continue;
        }
        auto participants = participantIds(*war);
        Day warStart = war->attrInt("start_day", 0);

        // The truce binding the same countries ends the war at its start.
        std::optional<Day> truceStart;
        for (const auto& [truceId, node] : warTruces) {
            auto bound = diplomacy.truceCountries.find(truceId);
            if (bound == diplomacy.truceCountries.end() || bound->second.empty()) {
                continue;
            }
            bool sameParties = std::includes(participants.begin(), participants.end(), bound->second.begin(),
                                             bound->second.end());
            if (sameParties) {
                truceStart = dayAt(*node, "start_date");
                if (!truceStart) {
                    truceStart = input.day() - 1;
                }
                break;
            }
        }

        Day end = std::max(warStart, truceStart.value_or(input.day() - 1));
        assignAttr(input.entities, *war, "outcome", truceStart ? "truce" : "resolution_unknown");
        assignAttr(input.entities, *war, "end_day", end);
        CHRONICLE_TIMELINE_LOG_DEBUG("War {} ended on {} ({})", war->sourceId, daysToDate(end),
                                     war->attrString("outcome"));

        for (std::int64_t countryId : participants) {
            Entity* country = lookup(countries.countries, countryId);
            if (!country) {
                country = input.entities.find(EntityKind::Country, countryId);
            }
            if (!country) {
                continue;
            }
            EventSubject subject;
            subject.country = country->id;
            subject.leader = entityIdOf(rulers.rulerOf(countryId));
            subject.war = war->id;
            recordMomentaryEvent(scope, EventKind::Peace, subject, view && revealsFor(*view, EventKind::Peace, country),
                                 end, end);
        }
    }
    return Completed{};
}

} // namespace chronicle
