#include "chronicle/timeline/Processors.hh"

#include "chronicle/core/Log.hh"
#include "chronicle/timeline/ProcessorSupport.hh"

namespace chronicle {

std::any SystemsProcessor::run(ProcessorInput& input) {
    auto systems = idEntries(input.gamestate(), "galactic_object");
    if (systems.empty()) {
        CHRONICLE_TIMELINE_LOG_WARN("{} {}: snapshot has no galactic objects", input.snapshot.seriesName,
                                    daysToDate(input.day()));
        return {};
    }

    SystemsOutput out;
    for (const auto& [systemId, node] : systems) {
        auto starbases = intsAt(*node, "starbases");
        if (starbases.empty()) {
            starbases = intsAt(*node, "starbase");
        }
        if (starbases.size() > 1) {
            CHRONICLE_TIMELINE_LOG_DEBUG("System {} has {} starbases", systemId, starbases.size());
        }
        for (std::int64_t starbase : starbases) {
            out.systemByStarbase[starbase] = systemId;
        }

        bool created = false;
        Entity& system = input.entities.getOrCreate(EntityKind::System, systemId, &created);
        assignAttr(input.entities, system, "name", nameAt(*node, "name"));
        if (created) {
            const auto* coordinate = childMap(*node, "coordinate");
            std::vector<std::int64_t> hyperlanes;
            for (const auto* lane : itemsAt(*node, "hyperlane")) {
                auto to = lane->isMap() ? intAt(*lane, "to") : std::nullopt;
                if (to && *to != systemId) {
                    hyperlanes.push_back(*to);
                }
            }
            assignAttr(input.entities, system, "star_class", getStringOr(*node, "star_class", "Unknown"));
            assignAttr(input.entities, system, "x", coordinate ? getNumberOr(*coordinate, "x", 0.0) : 0.0);
            assignAttr(input.entities, system, "y", coordinate ? getNumberOr(*coordinate, "y", 0.0) : 0.0);
            assignAttr(input.entities, system, "hyperlanes", hyperlanes);
            assignAttr(input.entities, system, "owner", kNoEntity);
        }
        out.systems[systemId] = &system;
    }
    return out;
}

std::any SystemOwnershipProcessor::run(ProcessorInput& input) {
    const auto& systems = input.deps.get<SystemsOutput>(processor_id::kSystems);
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& fleets = input.deps.get<FleetOwners>(processor_id::kFleetOwner);
    const auto& view = input.deps.get<ObserverView>(processor_id::kObserverRelations);

    const auto* manager = childMap(input.gamestate(), "starbase_mgr");
    const auto* starbases = manager ? manager->get("starbases") : nullptr;
    if (!starbases || !starbases->isMap()) {
        return {};
    }

    std::map<std::int64_t, std::int64_t> fleetByShip;
    for (const auto& [shipId, ship] : idEntries(input.gamestate(), "ships")) {
        if (auto fleet = intAt(*ship, "fleet")) {
            fleetByShip[shipId] = *fleet;
        }
    }

    // Starbases are visited in ascending id order, so when several claim
    // one system in the same snapshot the lowest starbase id wins.
    SystemOwnership out;
    for (const auto& [starbaseId, starbase] : idEntries(starbases)) {
        auto system = systems.systemByStarbase.find(starbaseId);
        auto station = intAt(*starbase, "station");
        auto fleet = station ? fleetByShip.find(*station) : fleetByShip.end();
        auto owner = fleet != fleetByShip.end() ? fleets.ownerByFleet.find(fleet->second) : fleets.ownerByFleet.end();
        if (system == systems.systemByStarbase.end() || owner == fleets.ownerByFleet.end() ||
            !lookup(systems.systems, system->second)) {
            // Some megastructures count as starbases and have no owner chain.
            CHRONICLE_TIMELINE_LOG_DEBUG("Cannot establish ownership for starbase {}", starbaseId);
            continue;
        }

        auto [claim, inserted] = out.ownerBySystem.emplace(system->second, owner->second);
        if (!inserted) {
            if (claim->second != owner->second) {
                input.ambiguous("system " + std::to_string(system->second) + " is claimed by countries " +
                                std::to_string(claim->second) + " and " + std::to_string(owner->second) +
                                "; keeping " + std::to_string(claim->second));
            }
            continue;
        }
        out.systemsByOwner[owner->second].insert(system->second);
    }

    auto scope = input.scope();
    for (const auto& [systemId, system] : systems.systems) {
        Entity* newOwner = nullptr;
        auto claim = out.ownerBySystem.find(systemId);
        if (claim != out.ownerBySystem.end()) {
            newOwner = lookup(countries.countries, claim->second);
            if (!newOwner) {
                input.ambiguous("owner " + std::to_string(claim->second) + " of system " + std::to_string(systemId) +
                                " is not a known country");
                continue;
            }
        }

        EntityId previousId = system->attrInt("owner", kNoEntity);
        if (entityIdOf(newOwner) == previousId) {
            continue;
        }
        Entity* previous = previousId != kNoEntity ? input.entities.byId(previousId) : nullptr;

        EventFilter ownership;
        ownership.kinds = {EventKind::ExpandedToSystem, EventKind::ConqueredSystem};
        ownership.system = system->id;
        ownership.openOnly = true;
        if (auto open = input.store.latestEvent(scope.series, ownership)) {
            closeEvent(scope, *open);
        }

        if (previous) {
            EventSubject lost;
            lost.country = previous->id;
            lost.targetCountry = entityIdOf(newOwner);
            lost.system = system->id;
            appendInstant(scope, EventKind::LostSystem, lost,
                          revealsFor(view, EventKind::LostSystem, previous, newOwner));
        }
        if (newOwner) {
            EventKind kind = previous ? EventKind::ConqueredSystem : EventKind::ExpandedToSystem;
            EventSubject gained;
            gained.country = newOwner->id;
            gained.targetCountry = entityIdOf(previous);
            gained.system = system->id;

            HistoricalEvent event;
            event.kind = kind;
            event.start = input.day();
            event.subject = gained;
            event.knownToObserver = revealsFor(view, kind, newOwner, previous);
            input.store.appendEvent(scope.series, std::move(event));
        }
        assignAttr(input.entities, *system, "owner", entityIdOf(newOwner));
    }
    return out;
}

std::any PlanetProcessor::run(ProcessorInput& input) {
    const auto& systems = input.deps.get<SystemsOutput>(processor_id::kSystems);
    const auto* planets = childMap(input.gamestate(), "planets");
    planets = planets ? childMap(*planets, "planet") : nullptr;
    if (!planets) {
        return {};
    }
    const auto* countrySection = input.gamestate().get("country");

    PlanetsOutput out;
    for (const auto& [systemId, node] : idEntries(input.gamestate(), "galactic_object")) {
        Entity* system = lookup(systems.systems, systemId);
        for (std::int64_t planetId : intsAt(*node, "planet")) {
            const auto* planet = planets->get(planetId);
            if (!planet || !planet->isMap()) {
                continue;
            }

            bool created = false;
            Entity& entity = input.entities.getOrCreate(EntityKind::Planet, planetId, &created);
            if (created) {
                assignAttr(input.entities, entity, "name", nameAt(*planet, "name"));
                assignAttr(input.entities, entity, "planet_class", getStringOr(*planet, "planet_class", ""));
                assignAttr(input.entities, entity, "system", entityIdOf(system));
                auto colonized = dayAt(*planet, "colonize_date");
                if (colonized && !getFlag(*planet, "is_under_colonization")) {
                    assignAttr(input.entities, entity, "colonized_day", *colonized);
                }
            }
            assignAttr(input.entities, entity, "size", getIntOr(*planet, "planet_size", 0));

            EntityId owner = kNoEntity;
            if (auto ownerId = intAt(*planet, "owner");
                ownerId && countrySection && countrySection->get(*ownerId)) {
                Entity* country = input.entities.find(EntityKind::Country, *ownerId);
                owner = entityIdOf(country);
            }
            assignAttr(input.entities, entity, "owner", owner);

            out.planets[planetId] = &entity;
            out.systemByPlanet[planetId] = systemId;
        }
    }
    return out;
}

std::any PlanetUpdateProcessor::run(ProcessorInput& input) {
    const auto& planets = input.deps.get<PlanetsOutput>(processor_id::kPlanetModels);
    const auto* section = childMap(input.gamestate(), "planets");
    section = section ? childMap(*section, "planet") : nullptr;

    for (const auto& [planetId, entity] : planets.planets) {
        const auto* planet = section ? section->get(planetId) : nullptr;
        if (!planet || !planet->isMap()) {
            continue;
        }
        assignAttr(input.entities, *entity, "name", nameAt(*planet, "name"));
        assignAttr(input.entities, *entity, "planet_class", getStringOr(*planet, "planet_class", ""));
    }
    return Completed{};
}

} // namespace chronicle
