#include "chronicle/timeline/Processors.hh"

#include "chronicle/core/Log.hh"
#include "chronicle/timeline/ProcessorSupport.hh"

#include <algorithm>

namespace chronicle {

namespace {

struct RelationFlag {
    Relation relation;
    const char* key;
};

constexpr RelationFlag kRelationFlags[] = {
    {Relation::Rivalry, "is_rival"},
    {Relation::DefensivePact, "defensive_pact"},
    {Relation::Federation, "alliance"},
    {Relation::NonAggressionPact, "non_aggression_pledge"},
    {Relation::ClosedBorders, "closed_borders"},
    {Relation::Communications, "communications"},
    {Relation::MigrationTreaty, "migration_access"},
    {Relation::CommercialPact, "commercial_pact"},
    {Relation::Neighbor, "borders"},
    {Relation::ResearchAgreement, "research_agreement"},
    {Relation::Embassy, "embassy"},
};

constexpr Relation kSharedAgreements[] = {Relation::ResearchAgreement, Relation::CommercialPact,
                                          Relation::MigrationTreaty,   Relation::DefensivePact,
                                          Relation::Federation,        Relation::Embassy};

constexpr const char* kResources[] = {"energy",         "minerals",  "alloys",    "consumer_goods",
                                      "food",           "unity",     "influence", "physics_research",
                                      "society_research", "engineering_research"};

size_t indexOf(Relation relation) {
    return static_cast<size_t>(relation);
}

// Attitude of `country` towards `target` from the country's AI block.
std::string attitudeTowards(const Value& country, std::int64_t target) {
    const auto* ai = childMap(country, "ai");
    if (!ai) {
        return "unknown";
    }
    for (const auto* attitude : itemsAt(*ai, "attitude")) {
        if (attitude->isMap() && getIntOr(*attitude, "country", -1) == target) {
            return getStringOr(*attitude, "attitude", "unknown");
        }
    }
    return "unknown";
}

size_t countItems(const Value& node, const Key& key) {
    return itemsAt(node, key).size();
}

} // namespace

Entity* lookup(const EntityIndex& index, std::int64_t sourceId) {
    auto it = index.find(sourceId);
    return it == index.end() ? nullptr : it->second;
}

std::string_view relationToString(Relation relation) {
    switch (relation) {
    case Relation::Rivalry:
        return "rivalry";
    case Relation::DefensivePact:
        return "defensive_pact";
    case Relation::Federation:
        return "federation";
    case Relation::NonAggressionPact:
        return "non_aggression_pact";
    case Relation::ClosedBorders:
        return "closed_borders";
    case Relation::Communications:
        return "communications";
    case Relation::MigrationTreaty:
        return "migration_treaty";
    case Relation::CommercialPact:
        return "commercial_pact";
    case Relation::Neighbor:
        return "neighbor";
    case Relation::ResearchAgreement:
        return "research_agreement";
    case Relation::Embassy:
        return "embassy";
    }
    return "unknown";
}

bool DiplomacyOutput::has(std::int64_t country, Relation relation, std::int64_t target) const {
    auto it = relations.find(country);
    return it != relations.end() && it->second[indexOf(relation)].count(target) > 0;
}

bool SensorLinks::has(std::int64_t from, std::int64_t to) const {
    auto it = linked.find(from);
    return it != linked.end() && it->second.count(to) > 0;
}

Entity* RulersOutput::rulerOf(std::int64_t country) const {
    auto it = rulerByCountry.find(country);
    return it == rulerByCountry.end() ? nullptr : it->second;
}

std::any CountryProcessor::run(ProcessorInput& input) {
    const auto& snapshot = input.snapshot;
    auto countries = idEntries(input.gamestate(), "country");
    if (countries.empty()) {
        CHRONICLE_TIMELINE_LOG_WARN("{} {}: snapshot has no countries", snapshot.seriesName, daysToDate(input.day()));
        return {};
    }

    CountriesOutput out;
    for (const auto& [countryId, node] : countries) {
        std::string type = getStringOr(*node, "type", "");
        std::vector<std::string> colors;
        if (const auto* flag = childMap(*node, "flag")) {
            colors = stringsAt(*flag, "colors");
        }
        std::string primary = colors.empty() ? "black" : colors[0];
        std::string secondary = colors.size() >= 2 ? colors[1] : primary;
        bool isObserver = snapshot.observerCountry && *snapshot.observerCountry == countryId;

        bool created = false;
        Entity& country = input.entities.getOrCreate(EntityKind::Country, countryId, &created);
        assignAttr(input.entities, country, "name", nameAt(*node, "name", "no name"));
        assignAttr(input.entities, country, "type", type);
        assignAttr(input.entities, country, "primary_color", primary);
        assignAttr(input.entities, country, "secondary_color", secondary);
        assignAttr(input.entities, country, "is_observer", isObserver);
        assignAttr(input.entities, country, "is_other_player", snapshot.otherPlayers.count(countryId) > 0);
        if (isObserver && !country.hasAttr("first_contact_day")) {
            assignAttr(input.entities, country, "first_contact_day", input.day());
        }

        out.countries[countryId] = &country;
        if (isRealCountryType(type)) {
            out.realCountries.insert(countryId);
        }
    }
    return out;
}

std::any SpeciesProcessor::run(ProcessorInput& input) {
    SpeciesOutput out;
    for (const auto& [speciesId, node] : idEntries(input.gamestate(), "species_db")) {
        bool created = false;
        Entity& species = input.entities.getOrCreate(EntityKind::Species, speciesId, &created);
        std::string speciesClass = getStringOr(*node, "class", "Unknown Class");
        assignAttr(input.entities, species, "name", nameAt(*node, "name", "Unnamed Species"));
        if (created) {
            std::vector<std::string> traits;
            if (const auto* traitBlock = childMap(*node, "traits")) {
                traits = stringsAt(*traitBlock, "trait");
            }
            assignAttr(input.entities, species, "class", speciesClass);
            assignAttr(input.entities, species, "base", getIntOr(*node, "base", -1));
            assignAttr(input.entities, species, "home_planet", getIntOr(*node, "home_planet", -1));
            assignAttr(input.entities, species, "traits", traits);
        }
        out.species[speciesId] = &species;
        if (speciesClass == "ROBOT") {
            out.robotSpecies.insert(speciesId);
        }
    }
    return out;
}

std::any FleetOwnerProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);

    FleetOwners out;
    for (const auto& [countryId, node] : idEntries(input.gamestate(), "country")) {
        if (!lookup(countries.countries, countryId)) {
            continue;
        }
        const auto* manager = childMap(*node, "fleets_manager");
        if (!manager) {
            continue;
        }
        for (const auto* fleet : itemsAt(*manager, "owned_fleets")) {
            if (!fleet->isMap()) {
                continue;
            }
            if (auto fleetId = intAt(*fleet, "fleet")) {
                out.ownerByFleet[*fleetId] = countryId;
            }
        }
    }
    return out;
}

std::any DiplomacyProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto* section = input.gamestate().get("country");

    DiplomacyOutput out;
    for (const auto& [countryId, entity] : countries.countries) {
        auto& relations = out.relations[countryId];
        const auto* node = section ? section->get(countryId) : nullptr;
        const auto* manager = node ? childMap(*node, "relations_manager") : nullptr;
        if (!manager) {
            continue;
        }
        for (const auto* relation : itemsAt(*manager, "relation")) {
            if (!relation->isMap()) {
                continue;
            }
            auto target = intAt(*relation, "country");
            if (!target) {
                continue;
            }
            for (const auto& flag : kRelationFlags) {
                if (getFlag(*relation, flag.key)) {
                    relations[indexOf(flag.relation)].insert(*target);
                }
            }
            if (auto truce = intAt(*relation, "truce")) {
                out.truceCountries[*truce].insert(countryId);
                out.truceCountries[*truce].insert(*target);
            }
        }
    }
    return out;
}

std::any SensorLinkProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);

    SensorLinks out;
    for (const auto& [countryId, entity] : countries.countries) {
        out.linked[countryId];
    }
    for (const auto& [dealId, deal] : idEntries(input.gamestate(), "trade_deal")) {
        const auto* first = childMap(*deal, "first");
        const auto* second = childMap(*deal, "second");
        if (!first || !second || !getFlag(*second, "sensor_link")) {
            continue;
        }
        auto from = intAt(*first, "country");
        auto to = intAt(*second, "country");
        if (!from || !to) {
            continue;
        }
        Day start = dayAt(*deal, "date").value_or(0);
        Day end = start + kDaysPerYear * static_cast<Day>(getIntOr(*deal, "length", 0));
        if (start <= input.day() && input.day() <= end) {
            out.linked[*from].insert(*to);
        }
    }
    return out;
}

std::any ObserverRelationsProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& diplomacy = input.deps.get<DiplomacyOutput>(processor_id::kDiplomacy);
    const auto& sensors = input.deps.get<SensorLinks>(processor_id::kSensorLinks);
    const auto& observer = input.snapshot.observerCountry;

    ObserverView view(observer);
    if (!observer) {
        return view;
    }

    const auto* section = input.gamestate().get("country");
    for (const auto& [countryId, entity] : countries.countries) {
        ObserverRelation relation;
        relation.isObserver = countryId == *observer;
        relation.hasMet = diplomacy.has(countryId, Relation::Communications, *observer) ||
                          diplomacy.has(*observer, Relation::Communications, countryId);
        if (const auto* node = section ? section->get(countryId) : nullptr) {
            relation.attitude = attitudeTowards(*node, *observer);
        }
        relation.sensorLink = sensors.has(*observer, countryId);
        relation.sharedAgreement =
            std::any_of(std::begin(kSharedAgreements), std::end(kSharedAgreements), [&](Relation r) {
                return diplomacy.has(countryId, r, *observer) || diplomacy.has(*observer, r, countryId);
            });
        view.setRelation(countryId, std::move(relation));
    }

    auto scope = input.scope();
    for (const auto& [countryId, entity] : countries.countries) {
        Disclosure level = view.disclosure(countryId);
        if (level >= Disclosure::Known && !entity->hasAttr("first_contact_day")) {
            assignAttr(input.entities, *entity, "first_contact_day", input.day());
        }

        auto previous = static_cast<Disclosure>(entity->attrInt("max_disclosure", 0));
        if (level <= previous) {
            continue;
        }
        assignAttr(input.entities, *entity, "max_disclosure", static_cast<int>(level));

        // Events recorded while the observer knew less about this country.
        EventFilter about;
        about.country = entity->id;
        EventFilter against;
        against.targetCountry = entity->id;
        size_t widened = 0;
        for (const auto* filter : {&about, &against}) {
            for (auto& event : input.store.events(input.snapshot.series, *filter)) {
                if (requiredDisclosure(event.kind) <= level && widenVisibility(scope, event, true)) {
                    ++widened;
                }
            }
        }
        if (widened > 0) {
            CHRONICLE_TIMELINE_LOG_DEBUG("{} {}: {} earlier events about country {} became known",
                                         input.snapshot.seriesName, daysToDate(input.day()), widened, countryId);
        }
    }
    return view;
}

std::any CountryDataProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& diplomacy = input.deps.get<DiplomacyOutput>(processor_id::kDiplomacy);
    const auto& sensors = input.deps.get<SensorLinks>(processor_id::kSensorLinks);
    const auto& ownership = input.deps.get<SystemOwnership>(processor_id::kSystemOwners);
    const auto& snapshot = input.snapshot;
    const auto* section = input.gamestate().get("country");

    CountryDataOutput out;
    for (std::int64_t countryId : countries.realCountries) {
        Entity* entity = lookup(countries.countries, countryId);
        const auto* node = section ? section->get(countryId) : nullptr;
        if (!entity || !node || !node->isMap()) {
            continue;
        }
        bool isObserver = snapshot.observerCountry && *snapshot.observerCountry == countryId;

        nlohmann::json values;
        for (const char* key : {"military_power", "tech_power", "economy_power", "fleet_size", "empire_size",
                                "empire_cohesion", "victory_rank", "victory_score"}) {
            values[key] = numberOf(node->get(key));
        }
        const auto* techStatus = childMap(*node, "tech_status");
        values["tech_count"] = techStatus ? countItems(*techStatus, "technology") : 0;
        values["exploration_progress"] = countItems(*node, "surveyed");
        values["owned_planets"] = countItems(*node, "owned_planets");
        auto owned = ownership.systemsByOwner.find(countryId);
        values["controlled_systems"] = owned == ownership.systemsByOwner.end() ? 0 : owned->second.size();

        if (snapshot.observerCountry) {
            std::int64_t observer = *snapshot.observerCountry;
            values["attitude_towards_observer"] = isObserver ? "is_player" : attitudeTowards(*node, observer);
            values["has_sensor_link_with_observer"] = isObserver || sensors.has(observer, countryId);
            for (const auto& flag : kRelationFlags) {
                std::string key = "has_" + std::string(relationToString(flag.relation)) + "_with_observer";
                values[key] = diplomacy.has(countryId, flag.relation, observer);
            }
        }

        nlohmann::json budget = nlohmann::json::object();
        std::map<std::string, double> net;
        for (const char* resource : kResources) {
            net[resource] = 0.0;
        }
        const auto* balance = childMap(*node, "budget");
        balance = balance ? childMap(*balance, "current_month") : nullptr;
        balance = balance ? childMap(*balance, "balance") : nullptr;
        if (balance) {
            const auto& items = balance->asMap();
            for (size_t i = 0; i < items.size(); ++i) {
                std::string item = keyToString(items.keyAt(i));
                const auto& amounts = items.valueAt(i);
                if (item == "none" || !amounts.isMap() || amounts.asMap().empty()) {
                    continue;
                }
                nlohmann::json line = nlohmann::json::object();
                const auto& entries = amounts.asMap();
                for (size_t j = 0; j < entries.size(); ++j) {
                    std::string resource = keyToString(entries.keyAt(j));
                    double amount = numberOf(&entries.valueAt(j));
                    line[resource] = amount;
                    auto total = net.find(resource);
                    if (total != net.end()) {
                        total->second += amount;
                    }
                }
                budget[item] = std::move(line);
            }
        }
        for (const auto& [resource, amount] : net) {
            values["net_" + resource] = amount;
        }

        input.store.addRecord(snapshot.series, SnapshotRecord{entity->id, "country_data", input.day(), values});
        bool otherPlayer = snapshot.otherPlayers.count(countryId) > 0;
        if (!otherPlayer && (isObserver || snapshot.options.readAllCountries) && !budget.empty()) {
            input.store.addRecord(snapshot.series, SnapshotRecord{entity->id, "budget", input.day(), budget});
        }
        out.byCountry[countryId] = std::move(values);
    }
    return out;
}

TimelinePipeline makeDefaultPipeline() {
    TimelinePipeline pipeline;
    pipeline.registerProcessor(std::make_unique<SystemsProcessor>());
    pipeline.registerProcessor(std::make_unique<CountryProcessor>());
    pipeline.registerProcessor(std::make_unique<SpeciesProcessor>());
    pipeline.registerProcessor(std::make_unique<FleetOwnerProcessor>());
    pipeline.registerProcessor(std::make_unique<DiplomacyProcessor>());
    pipeline.registerProcessor(std::make_unique<SensorLinkProcessor>());
    pipeline.registerProcessor(std::make_unique<ObserverRelationsProcessor>());
    pipeline.registerProcessor(std::make_unique<SystemOwnershipProcessor>());
    pipeline.registerProcessor(std::make_unique<CountryDataProcessor>());
    pipeline.registerProcessor(std::make_unique<LeaderProcessor>());
    pipeline.registerProcessor(std::make_unique<PlanetProcessor>());
    pipeline.registerProcessor(std::make_unique<SectorColonyProcessor>());
    pipeline.registerProcessor(std::make_unique<PlanetUpdateProcessor>());
    pipeline.registerProcessor(std::make_unique<RulerProcessor>());
    pipeline.registerProcessor(std::make_unique<GovernmentProcessor>());
    pipeline.registerProcessor(std::make_unique<FactionProcessor>());
    pipeline.registerProcessor(std::make_unique<DiplomacyEventProcessor>());
    pipeline.registerProcessor(std::make_unique<ScientistEventProcessor>());
    pipeline.registerProcessor(std::make_unique<WarProcessor>());
    pipeline.registerProcessor(std::make_unique<TruceProcessor>());
    pipeline.registerProcessor(std::make_unique<PopStatsProcessor>());
    return pipeline;
}

} // namespace chronicle
