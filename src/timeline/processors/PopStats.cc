#include "chronicle/timeline/Processors.hh"

#include "chronicle/core/Log.hh"
#include "chronicle/timeline/ProcessorSupport.hh"

namespace chronicle {

namespace {

// Running sums for one group of pops.
struct PopTally {
    std::int64_t popCount = 0;
    double crime = 0.0;
    double happiness = 0.0;
    double power = 0.0;

    void add(double popCrime, double popHappiness, double popPower) {
        ++popCount;
        crime += popCrime;
        happiness += popHappiness;
        power += popPower;
    }

    nlohmann::json averages() const {
        double n = popCount > 0 ? static_cast<double>(popCount) : 1.0;
        return {{"pop_count", popCount}, {"crime", crime / n}, {"happiness", happiness / n}, {"power", power / n}};
    }
};

struct CountryTallies {
    std::map<std::int64_t, PopTally> bySpecies;
    std::map<std::int64_t, PopTally> byFaction;
    std::map<std::string, PopTally> byJob;
    std::map<std::string, PopTally> byStratum;
    std::map<std::string, PopTally> byEthos;
    std::map<std::int64_t, PopTally> byPlanet;
};

std::int64_t factionOfPop(const Value& pop, const std::string& stratum, std::int64_t speciesId,
                          const SpeciesOutput& species) {
    if (auto faction = intAt(pop, "pop_faction")) {
        return *faction;
    }
    if (stratum == "slave") {
        return kSlaveFaction;
    }
    if (species.robotSpecies.count(speciesId) > 0) {
        return kRobotFaction;
    }
    if (stratum == "purge") {
        return kPurgeFaction;
    }
    return kNoFaction;
}

nlohmann::json labelled(const std::map<std::string, PopTally>& groups) {
    nlohmann::json values = nlohmann::json::object();
    for (const auto& [label, tally] : groups) {
        values[label] = tally.averages();
    }
    return values;
}

} // namespace

std::any PopStatsProcessor::run(ProcessorInput& input) {
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& species = input.deps.get<SpeciesOutput>(processor_id::kSpecies);
    const auto& factions = input.deps.get<FactionsOutput>(processor_id::kFaction);
    const auto& countryData = input.deps.get<CountryDataOutput>(processor_id::kCountryData);
    const auto& planets = input.deps.get<PlanetsOutput>(processor_id::kPlanetModels);
    const auto& snapshot = input.snapshot;

    // Countries whose breakdowns are kept this snapshot.
    std::set<std::int64_t> tracked;
    for (const auto& [countryId, entity] : countries.countries) {
        bool isObserver = snapshot.observerCountry && *snapshot.observerCountry == countryId;
        if (snapshot.otherPlayers.count(countryId) > 0 || countryData.byCountry.count(countryId) == 0) {
            continue;
        }
        if (isObserver || snapshot.options.readAllCountries) {
            tracked.insert(countryId);
        }
    }
    if (tracked.empty()) {
        return Completed{};
    }

    std::map<std::int64_t, std::int64_t> countryByPlanet;
    for (const auto& [countryId, node] : idEntries(input.gamestate(), "country")) {
        for (std::int64_t planetId : intsAt(*node, "owned_planets")) {
            countryByPlanet[planetId] = countryId;
        }
    }

    std::map<std::int64_t, CountryTallies> tallies;
    for (const auto& [popId, pop] : idEntries(input.gamestate(), "pop")) {
        std::int64_t planetId = getIntOr(*pop, "planet", -1);
        auto owner = countryByPlanet.find(planetId);
        if (owner == countryByPlanet.end() || tracked.count(owner->second) == 0) {
            continue;
        }

        std::int64_t speciesId = getIntOr(*pop, "species", -1);
        std::string job = getStringOr(*pop, "job", "unemployed");
        std::string stratum = getStringOr(*pop, "category", "unknown stratum");
        std::int64_t faction = factionOfPop(*pop, stratum, speciesId, species);
        const Value* ethos = childMap(*pop, "ethos");
        std::string ethic = ethos ? getStringOr(*ethos, "ethic", "ethic_no_ethos") : "ethic_no_ethos";

        double crime = getNumberOr(*pop, "crime", 0.0);
        double happiness = getNumberOr(*pop, "happiness", 0.0);
        double power = getNumberOr(*pop, "power", 0.0);

        auto& country = tallies[owner->second];
        country.bySpecies[speciesId].add(crime, happiness, power);
        country.byFaction[faction].add(crime, happiness, power);
        country.byJob[job].add(crime, happiness, power);
        country.byStratum[stratum].add(crime, happiness, power);
        country.byEthos[ethic].add(crime, happiness, power);
        country.byPlanet[planetId].add(crime, happiness, power);
    }

    const auto* factionSection = input.gamestate().get("pop_factions");
    const auto* planetSection = childMap(input.gamestate(), "planets");
    planetSection = planetSection ? childMap(*planetSection, "planet") : nullptr;

    size_t records = 0;
    for (const auto& [countryId, groups] : tallies) {
        Entity* country = lookup(countries.countries, countryId);
        if (!country) {
            continue;
        }
        auto add = [&](EntityId entity, const char* kind, nlohmann::json values) {
            input.store.addRecord(snapshot.series, SnapshotRecord{entity, kind, input.day(), std::move(values)});
            ++records;
        };

        nlohmann::json bySpecies = nlohmann::json::object();
        for (const auto& [speciesId, tally] : groups.bySpecies) {
            Entity* entity = lookup(species.species, speciesId);
            if (!entity) {
                continue;
            }
            auto values = tally.averages();
            values["name"] = entity->attrString("name");
            bySpecies[std::to_string(entity->id)] = std::move(values);
        }
        add(country->id, "pop_stats_species", std::move(bySpecies));

        nlohmann::json byFaction = nlohmann::json::object();
        for (const auto& [factionId, tally] : groups.byFaction) {
            Entity* entity = lookup(factions.factions, factionId);
            if (!entity) {
                continue;
            }
            const Value* node = factionSection ? factionSection->get(factionId) : nullptr;
            auto values = tally.averages();
            values["name"] = entity->attrString("name");
            values["faction_approval"] = node && node->isMap() ? getNumberOr(*node, "faction_approval", 0.0) : 0.0;
            values["support"] = node && node->isMap() ? getNumberOr(*node, "support", 0.0) : 0.0;
            byFaction[std::to_string(entity->id)] = std::move(values);
        }
        add(country->id, "pop_stats_faction", std::move(byFaction));

        add(country->id, "pop_stats_job", labelled(groups.byJob));
        add(country->id, "pop_stats_stratum", labelled(groups.byStratum));
        add(country->id, "pop_stats_ethos", labelled(groups.byEthos));

        for (const auto& [planetId, tally] : groups.byPlanet) {
            Entity* planet = lookup(planets.planets, planetId);
            const Value* node = planetSection ? planetSection->get(planetId) : nullptr;
            if (!planet || !node || !node->isMap()) {
                CHRONICLE_TIMELINE_LOG_DEBUG("No planet {} for pop statistics", planetId);
                continue;
            }
            auto values = tally.averages();
            for (const char* key : {"migration", "free_amenities", "free_housing", "stability"}) {
                values[key] = getNumberOr(*node, key, 0.0);
            }
            add(planet->id, "planet_stats", std::move(values));
        }
    }
    CHRONICLE_TIMELINE_LOG_DEBUG("{} {}: {} pop statistics records", snapshot.seriesName, daysToDate(input.day()),
                                 records);
    return Completed{};
}

} // namespace chronicle
