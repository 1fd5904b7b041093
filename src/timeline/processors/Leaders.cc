#include "chronicle/timeline/Processors.hh"

#include "chronicle/core/Log.hh"
#include "chronicle/timeline/ProcessorSupport.hh"

#include <algorithm>
#include <set>
#include <sstream>

namespace chronicle {

namespace {

constexpr const char* kResearchAreas[] = {"physics", "society", "engineering"};

const Value* countryNode(const ProcessorInput& input, std::int64_t countryId) {
    const auto* section = input.gamestate().get("country");
    const auto* node = section ? section->get(countryId) : nullptr;
    return (node && node->isMap()) ? node : nullptr;
}

std::string leaderClass(const Value& leader) {
    if (leader.get("pre_ruler_class")) {
        return getStringOr(leader, "pre_ruler_class", "unknown class");
    }
    return getStringOr(leader, "class", "unknown class");
}

// Traits split into the subclass marker and the sorted remainder.
std::pair<std::string, std::vector<std::string>> leaderTraits(const Value& leader) {
    std::string subclass;
    std::vector<std::string> traits;
    for (auto& trait : stringsAt(leader, "traits")) {
        if (trait.rfind("subclass", 0) == 0) {
            if (subclass.empty()) {
                subclass = trait;
            }
        } else {
            traits.push_back(std::move(trait));
        }
    }
    std::sort(traits.begin(), traits.end());
    return {subclass, traits};
}

std::string stripLevel(const std::string& trait) {
    auto end = trait.find_last_not_of("_0123456789");
    return end == std::string::npos ? std::string() : trait.substr(0, end + 1);
}

std::set<std::string> jsonStrings(const nlohmann::json& values) {
    std::set<std::string> result;
    if (values.is_array()) {
        for (const auto& value : values) {
            if (value.is_string()) {
                result.insert(value.get<std::string>());
            }
        }
    }
    return result;
}

std::set<std::string> attrStrings(const Entity& entity, const std::string& key) {
    auto it = entity.attributes.find(key);
    return it == entity.attributes.end() ? std::set<std::string>() : jsonStrings(*it);
}

Entity* countryOfLeader(IdentityMap& entities, const Entity& leader) {
    EntityId country = leader.attrInt("country", kNoEntity);
    return country == kNoEntity ? nullptr : entities.byId(country);
}

// Writes the leader's current attributes. Level and trait changes against
// the stored state produce events.
void updateLeader(ProcessorInput& input, const ObserverView& view, const SpeciesOutput& species, Entity& leader,
                  const Value& node, bool announce) {
    const Value* name = node.get("name");
    std::string firstName = "Unknown Leader";
    std::string secondName;
    if (name && name->isMap()) {
        const Value* first = name->get("first_name");
        firstName = nameOf(first ? first : name->get("full_names"), "Unknown Leader");
        secondName = nameAt(*name, "second_name", "");
    } else {
        firstName = nameOf(name, "Unknown Leader");
    }

    std::int64_t speciesId = getIntOr(node, "species", -1);
    Entity* leaderSpecies = lookup(species.species, speciesId);
    if (!leaderSpecies) {
        input.ambiguous("leader " + std::to_string(leader.sourceId) + " has unknown species " +
                        std::to_string(speciesId));
    }

    auto [subclass, traits] = leaderTraits(node);
    std::int64_t level = getIntOr(node, "level", -1);
    Entity* country = countryOfLeader(input.entities, leader);
    auto scope = input.scope();

    if (announce) {
        std::int64_t previousLevel = leader.attrInt("level", level);
        if (previousLevel != level) {
            EventSubject subject;
            subject.country = entityIdOf(country);
            subject.leader = leader.id;
            subject.description = std::to_string(level);
            recordMomentaryEvent(scope, EventKind::LevelUp, subject, revealsFor(view, EventKind::LevelUp, country));
        }

        auto oldTraits = attrStrings(leader, "traits");
        std::set<std::string> newTraits(traits.begin(), traits.end());
        for (const auto& trait : oldTraits) {
            bool upgraded = std::any_of(newTraits.begin(), newTraits.end(), [&trait](const std::string& t) {
                return stripLevel(t) == stripLevel(trait);
            });
            if (newTraits.count(trait) == 0 && !upgraded) {
                EventSubject subject{entityIdOf(country), kNoEntity, leader.id};
                subject.description = trait;
                appendInstant(scope, EventKind::LostTrait, subject, revealsFor(view, EventKind::LostTrait, country));
            }
        }
        for (const auto& trait : newTraits) {
            if (oldTraits.count(trait) == 0) {
                EventSubject subject{entityIdOf(country), kNoEntity, leader.id};
                subject.description = trait;
                appendInstant(scope, EventKind::GainedTrait, subject,
                              revealsFor(view, EventKind::GainedTrait, country));
            }
        }
    }

    assignAttr(input.entities, leader, "first_name", firstName);
    assignAttr(input.entities, leader, "second_name", secondName);
    assignAttr(input.entities, leader, "class", leaderClass(node));
    assignAttr(input.entities, leader, "subclass", subclass);
    assignAttr(input.entities, leader, "gender", getStringOr(node, "gender", "other"));
    assignAttr(input.entities, leader, "species", entityIdOf(leaderSpecies));
    assignAttr(input.entities, leader, "level", level);
    assignAttr(input.entities, leader, "traits", traits);
}

} // namespace

std::any LeaderProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& species = input.deps.get<SpeciesOutput>(processor_id::kSpecies);
    const auto& view = input.deps.get<ObserverView>(processor_id::kObserverRelations);
    const auto* section = input.gamestate().get("leaders");
    auto scope = input.scope();

    LeadersOutput out;

    // Leaders seen before: update the living, retire the missing.
    for (Entity* leader : input.entities.all(EntityKind::Leader)) {
        out.leaders[leader->sourceId] = leader;
        if (!leader->attrBool("active")) {
            continue;
        }
        const Value* node = section ? section->get(leader->sourceId) : nullptr;
        if (node && node->isMap()) {
            updateLeader(input, view, species, *leader, *node, true);
            continue;
        }

        Entity* country = countryOfLeader(input.entities, *leader);
        assignAttr(input.entities, *leader, "active", false);
        assignAttr(input.entities, *leader, "last_day", input.day());
        EventSubject subject;
        subject.country = entityIdOf(country);
        subject.leader = leader->id;
        recordMomentaryEvent(scope, EventKind::LeaderDied, subject, revealsFor(view, EventKind::LeaderDied, country));
    }

    // Newly hired leaders, found through their employer.
    for (const auto& [countryId, country] : countries.countries) {
        const Value* node = countryNode(input, countryId);
        if (!node) {
            continue;
        }
        for (std::int64_t leaderId : intsAt(*node, "owned_leaders")) {
            const Value* leaderNode = section ? section->get(leaderId) : nullptr;
            if (!leaderNode || !leaderNode->isMap()) {
                continue;
            }
            bool created = false;
            Entity& leader = input.entities.getOrCreate(EntityKind::Leader, leaderId, &created);
            out.leaders[leaderId] = &leader;
            if (!created && leader.attrBool("active")) {
                continue;
            }

            Day hired = input.day();
            for (const char* key : {"date", "start", "date_added"}) {
                if (auto day = dayAt(*leaderNode, key)) {
                    hired = std::min(hired, *day);
                }
            }
            assignAttr(input.entities, leader, "country", country->id);
            assignAttr(input.entities, leader, "active", true);
            assignAttr(input.entities, leader, "hired_day", hired);
            updateLeader(input, view, species, leader, *leaderNode, false);

            EventSubject subject;
            subject.country = country->id;
            subject.leader = leader.id;
            recordMomentaryEvent(scope, EventKind::LeaderRecruited, subject,
                                 revealsFor(view, EventKind::LeaderRecruited, country), hired, input.day());
        }
    }
    return out;
}

std::any RulerProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& leaders = input.deps.get<LeadersOutput>(processor_id::kLeader);
    const auto& planets = input.deps.get<PlanetsOutput>(processor_id::kPlanetModels);
    const auto& view = input.deps.get<ObserverView>(processor_id::kObserverRelations);
    auto scope = input.scope();

    RulersOutput out;
    for (const auto& [countryId, country] : countries.countries) {
        const Value* node = countryNode(input, countryId);
        if (!node) {
            continue;
        }
        auto rulerId = intAt(*node, "ruler");
        Entity* ruler = rulerId ? lookup(leaders.leaders, *rulerId) : nullptr;
        if (!rulerId && countries.isReal(countryId)) {
            CHRONICLE_TIMELINE_LOG_DEBUG("Country {} has no ruler", countryId);
        }
        out.rulerByCountry[countryId] = ruler;

        // Capital
        if (auto capitalId = intAt(*node, "capital")) {
            Entity* capital = lookup(planets.planets, *capitalId);
            if (capital && assignAttr(input.entities, *country, "capital", capital->id)) {
                EventSubject subject;
                subject.country = country->id;
                subject.leader = entityIdOf(ruler);
                subject.planet = capital->id;
                subject.system = capital->attrInt("system", kNoEntity);
                appendInstant(scope, EventKind::CapitalRelocation, subject,
                              revealsFor(view, EventKind::CapitalRelocation, country));
            }
        }

        // Reign
        EventFilter reign;
        reign.kinds = {EventKind::RuledEmpire};
        reign.country = country->id;
        std::optional<EventSubject> current;
        if (ruler) {
            current = EventSubject{};
            current->country = country->id;
            current->leader = ruler->id;
        }
        recordContinuousFact(scope, reign, EventKind::RuledEmpire, current,
                             revealsFor(view, EventKind::RuledEmpire, country));
        assignAttr(input.entities, *country, "ruler", entityIdOf(ruler));

        // Traditions and ascension perks: names not seen before.
        for (auto [key, kind] : {std::pair{"traditions", EventKind::Tradition},
                                 std::pair{"ascension_perks", EventKind::AscensionPerk}}) {
            auto known = attrStrings(*country, key);
            auto adopted = stringsAt(*node, key);
            bool changed = false;
            for (const auto& name : adopted) {
                if (!known.insert(name).second) {
                    continue;
                }
                changed = true;
                EventSubject subject;
                subject.country = country->id;
                subject.leader = entityIdOf(ruler);
                subject.description = name;
                appendInstant(scope, kind, subject, revealsFor(view, kind, country));
            }
            if (changed) {
                assignAttr(input.entities, *country, key, nlohmann::json(known));
            }
        }

        // Edicts: one event per (edict, expiry).
        for (const auto* edict : itemsAt(*node, "edicts")) {
            if (!edict->isMap()) {
                continue;
            }
            std::string name = getStringOr(*edict, "edict", "");
            if (name.empty()) {
                continue;
            }
            std::optional<Day> expiry;
            std::string date = getStringOr(*edict, "date", "");
            if (!date.empty() && date != "1.01.01" && !getFlag(*edict, "perpetual")) {
                expiry = dateToDays(date);
            }

            EventFilter same;
            same.kinds = {EventKind::Edict};
            same.country = country->id;
            same.description = name;
            auto previous = input.store.events(scope.series, same);
            // Stored ends are clamped to the day the edict was first seen.
            bool seen = std::any_of(previous.begin(), previous.end(), [&expiry](const HistoricalEvent& e) {
                return e.end == (expiry ? std::optional<Day>(std::max(*expiry, e.start)) : std::nullopt);
            });
            if (seen) {
                continue;
            }
            HistoricalEvent event;
            event.kind = EventKind::Edict;
            event.start = input.day();
            event.end = expiry ? std::optional<Day>(std::max(*expiry, input.day())) : std::nullopt;
            event.subject.country = country->id;
            event.subject.leader = entityIdOf(ruler);
            event.subject.description = name;
            event.knownToObserver = revealsFor(view, EventKind::Edict, country);
            input.store.appendEvent(scope.series, std::move(event));
        }
    }
    return out;
}

std::any GovernmentProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& rulers = input.deps.get<RulersOutput>(processor_id::kRuler);
    const ObserverView* view = input.deps.contains(processor_id::kObserverRelations)
                                   ? &input.deps.get<ObserverView>(processor_id::kObserverRelations)
                                   : nullptr;
    auto scope = input.scope();

    for (const auto& [countryId, country] : countries.countries) {
        const Value* node = countryNode(input, countryId);
        if (!node) {
            continue;
        }
        const Value* ethos = childMap(*node, "ethos");
        const Value* government = childMap(*node, "government");
        auto ethicsList = ethos ? stringsAt(*ethos, "ethic") : std::vector<std::string>{};
        auto civicsList = government ? stringsAt(*government, "civics") : std::vector<std::string>{};
        std::set<std::string> ethics(ethicsList.begin(), ethicsList.end());
        std::set<std::string> civics(civicsList.begin(), civicsList.end());

        nlohmann::json current = {
            {"name", nameAt(*node, "name", "Unnamed Country")},
            {"type", government ? getStringOr(*government, "type", "other") : "other"},
            {"authority", government ? getStringOr(*government, "authority", "other") : "other"},
            {"personality", getStringOr(*node, "personality", "unknown_personality")},
            {"ethics", ethics},
            {"civics", civics},
        };

        auto stored = country->attributes.find("government");
        if (stored == country->attributes.end()) {
            assignAttr(input.entities, *country, "government", std::move(current));
            continue;
        }

        std::vector<std::string> changes;
        auto listChanges = [&changes](const std::set<std::string>& before, const std::set<std::string>& after) {
            for (const auto& item : after) {
                if (before.count(item) == 0) {
                    changes.push_back("+" + item);
                }
            }
            for (const auto& item : before) {
                if (after.count(item) == 0) {
                    changes.push_back("-" + item);
                }
            }
        };
        const nlohmann::json& previous = *stored;
        auto field = [&previous](const char* key) {
            return previous.contains(key) ? previous.at(key) : nlohmann::json();
        };
        listChanges(jsonStrings(field("ethics")), ethics);
        listChanges(jsonStrings(field("civics")), civics);
        for (const char* key : {"name", "type"}) {
            if (field(key) != current[key]) {
                changes.push_back(std::string(key) + "=" + current[key].get<std::string>());
            }
        }

        if (!changes.empty()) {
            std::ostringstream description;
            for (size_t i = 0; i < changes.size(); ++i) {
                description << (i > 0 ? "," : "") << changes[i];
            }
            EventSubject subject;
            subject.country = country->id;
            subject.leader = entityIdOf(rulers.rulerOf(countryId));
            subject.description = description.str();
            appendInstant(scope, EventKind::GovernmentReform, subject,
                          view && revealsFor(*view, EventKind::GovernmentReform, country));
        }
        assignAttr(input.entities, *country, "government", std::move(current));
    }
    return Completed{};
}

std::any FactionProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& leaders = input.deps.get<LeadersOutput>(processor_id::kLeader);
    const auto& view = input.deps.get<ObserverView>(processor_id::kObserverRelations);
    auto scope = input.scope();

    FactionsOutput out;
    for (const auto& [factionId, node] : idEntries(input.gamestate(), "pop_factions")) {
        Entity* country = lookup(countries.countries, getIntOr(*node, "country", -1));
        if (!country) {
            continue;
        }
        bool created = false;
        Entity& faction = input.entities.getOrCreate(EntityKind::Faction, factionId, &created);
        assignAttr(input.entities, faction, "name", nameAt(*node, "name", "Unnamed faction"));
        assignAttr(input.entities, faction, "type", getStringOr(*node, "type", "unknown"));
        assignAttr(input.entities, faction, "country", country->id);
        if (created) {
            EventSubject subject;
            subject.country = country->id;
            subject.faction = faction.id;
            recordMomentaryEvent(scope, EventKind::NewFaction, subject,
                                 revealsFor(view, EventKind::NewFaction, country));
        }
        out.factions[factionId] = &faction;

        EventFilter leadership;
        leadership.kinds = {EventKind::FactionLeader};
        leadership.faction = faction.id;
        std::optional<EventSubject> current;
        if (Entity* leader = lookup(leaders.leaders, getIntOr(*node, "leader", -1))) {
            current = EventSubject{};
            current->country = country->id;
            current->leader = leader->id;
            current->faction = faction.id;
        }
        recordContinuousFact(scope, leadership, EventKind::FactionLeader, current,
                             revealsFor(view, EventKind::FactionLeader, country));
    }

    // Pseudo-factions shared by all countries for pops outside any faction.
    const std::pair<std::int64_t, const char*> pseudo[] = {
        {kNoFaction, "No faction"},
        {kSlaveFaction, "No faction (enslaved)"},
        {kPurgeFaction, "No faction (purge)"},
        {kRobotFaction, "No faction (non-sentient robot)"},
    };
    for (const auto& [factionId, name] : pseudo) {
        Entity& faction = input.entities.getOrCreate(EntityKind::Faction, factionId);
        assignAttr(input.entities, faction, "name", name);
        assignAttr(input.entities, faction, "type", "no_faction");
        out.factions[factionId] = &faction;
    }
    return out;
}

std::any ScientistEventProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& leaders = input.deps.get<LeadersOutput>(processor_id::kLeader);
    const auto& view = input.deps.get<ObserverView>(processor_id::kObserverRelations);
    auto scope = input.scope();

    for (const auto& [countryId, country] : countries.countries) {
        const Value* node = countryNode(input, countryId);
        const Value* techStatus = node ? childMap(*node, "tech_status") : nullptr;
        if (!techStatus) {
            continue;
        }

        const Value* areaLeaders = childMap(*techStatus, "leaders");
        for (const char* area : kResearchAreas) {
            EventFilter research;
            research.kinds = {EventKind::ResearchLeader};
            research.country = country->id;
            research.description = area;
            std::optional<EventSubject> current;
            auto leaderId = areaLeaders ? intAt(*areaLeaders, area) : std::nullopt;
            if (Entity* leader = leaderId ? lookup(leaders.leaders, *leaderId) : nullptr) {
                current = EventSubject{};
                current->country = country->id;
                current->leader = leader->id;
                current->description = area;
            }
            recordContinuousFact(scope, research, EventKind::ResearchLeader, current,
                                 revealsFor(view, EventKind::ResearchLeader, country));
        }

        auto names = stringsAt(*techStatus, "technology");
        auto levels = intsAt(*techStatus, "level");
        std::set<std::string> researched;
        for (size_t i = 0; i < names.size(); ++i) {
            std::int64_t level = i < levels.size() ? levels[i] : 1;
            researched.insert(level > 1 ? names[i] + "_level_" + std::to_string(level) : names[i]);
        }

        // The first sighting of a country only seeds what it already knows.
        if (country->hasAttr("technologies")) {
            auto known = attrStrings(*country, "technologies");
            for (const auto& tech : researched) {
                if (known.count(tech) > 0) {
                    continue;
                }
                EventSubject subject;
                subject.country = country->id;
                subject.description = tech;
                recordMomentaryEvent(scope, EventKind::ResearchedTechnology, subject,
                                     revealsFor(view, EventKind::ResearchedTechnology, country));
            }
        }
        assignAttr(input.entities, *country, "technologies", nlohmann::json(researched));
    }
    return Completed{};
}

} // namespace chronicle
