#include "chronicle/timeline/Processors.hh"

#include "chronicle/core/Log.hh"
#include "chronicle/timeline/ProcessorSupport.hh"

#include <algorithm>

namespace chronicle {

namespace {

struct SectorContext {
    ProcessorInput& input;
    const ObserverView& view;
    const PlanetsOutput& planets;
    const Value* planetSection;
    Entity* country;
};

void updateColonization(SectorContext& ctx, Entity& planet, const Value& node, const Entity* system,
                        const Entity* governor) {
    auto scope = ctx.input.scope();
    EventFilter colonization;
    colonization.kinds = {EventKind::Colonization};
    colonization.planet = planet.id;
    auto open = colonization;
    open.openOnly = true;
    auto running = ctx.input.store.latestEvent(scope.series, open);

    bool underColonization = getFlag(node, "is_under_colonization");
    auto completedOn = underColonization ? std::nullopt : dayAt(node, "colonize_date");
    if (!underColonization && !completedOn) {
        return;
    }
    if (planet.hasAttr("colonized_day") && !running) {
        return;
    }

    bool known = revealsFor(ctx.view, EventKind::Colonization, ctx.country);
    if (!completedOn) {
        if (running) {
            widenVisibility(scope, *running, known);
            return;
        }
        HistoricalEvent event;
        event.kind = EventKind::Colonization;
        event.start = ctx.input.day();
        event.subject.country = ctx.country->id;
        event.subject.leader = entityIdOf(governor);
        event.subject.system = entityIdOf(system);
        event.subject.planet = planet.id;
        event.knownToObserver = known;
        ctx.input.store.appendEvent(scope.series, std::move(event));
        return;
    }

    assignAttr(ctx.input.entities, planet, "colonized_day", *completedOn);
    if (running) {
        running->end = std::max(running->start, *completedOn);
        ctx.input.store.updateEvent(scope.series, *running);
        widenVisibility(scope, *running, known);
        return;
    }
    if (ctx.input.store.latestEvent(scope.series, colonization)) {
        return;
    }
    HistoricalEvent event;
    event.kind = EventKind::Colonization;
    event.start = std::min(ctx.input.day(), *completedOn);
    event.end = *completedOn;
    event.subject.country = ctx.country->id;
    event.subject.leader = entityIdOf(governor);
    event.subject.system = entityIdOf(system);
    event.subject.planet = planet.id;
    event.knownToObserver = known;
    ctx.input.store.appendEvent(scope.series, std::move(event));
}

void updateTerraforming(SectorContext& ctx, Entity& planet, const Value& node, const Entity* system,
                        const Entity* governor) {
    EventFilter terraforming;
    terraforming.kinds = {EventKind::Terraforming};
    terraforming.planet = planet.id;

    std::optional<EventSubject> current;
    if (const Value* process = childMap(node, "terraform_process")) {
        std::string target = getStringOr(*process, "planet_class", "");
        if (target.empty()) {
            CHRONICLE_TIMELINE_LOG_INFO("Terraforming of planet {} has no target class", planet.sourceId);
        } else {
            current = EventSubject{};
            current->country = ctx.country->id;
            current->leader = entityIdOf(governor);
            current->system = entityIdOf(system);
            current->planet = planet.id;
            current->description = getStringOr(node, "planet_class", "") + "," + target;
        }
    }
    recordContinuousFact(ctx.input.scope(), terraforming, EventKind::Terraforming, current,
                         revealsFor(ctx.view, EventKind::Terraforming, ctx.country));
}

void processSystem(SectorContext& ctx, const Entity* system, std::int64_t systemId, const Entity* governor) {
    const Value* systemNode = nullptr;
    if (const auto* section = ctx.input.gamestate().get("galactic_object")) {
        systemNode = section->get(systemId);
    }
    if (!systemNode || !systemNode->isMap()) {
        return;
    }

    for (std::int64_t planetId : intsAt(*systemNode, "planet")) {
        const Value* node = ctx.planetSection->get(planetId);
        Entity* planet = lookup(ctx.planets.planets, planetId);
        if (!node || !node->isMap() || !planet) {
            continue;
        }

        std::string planetClass = getStringOr(*node, "planet_class", "");
        bool colonizable = isColonizablePlanetClass(planetClass) || node->get("colonize_date");
        if (colonizable) {
            updateColonization(ctx, *planet, *node, system, governor);
        }
        if (colonizable || node->get("terraform_process")) {
            updateTerraforming(ctx, *planet, *node, system, governor);
        }
        if (isDestroyedPlanetClass(planetClass) && planetClass != planet->attrString("planet_class")) {
            EventSubject subject;
            subject.country = ctx.country->id;
            subject.system = entityIdOf(system);
            subject.planet = planet->id;
            appendInstant(ctx.input.scope(), EventKind::PlanetDestroyed, subject,
                          revealsFor(ctx.view, EventKind::PlanetDestroyed, ctx.country));
        }
    }
}

} // namespace

std::any SectorColonyProcessor::run(ProcessorInput& input) {
    const auto& systems = input.deps.get<SystemsOutput>(processor_id::kSystems);
    const auto& ownership = input.deps.get<SystemOwnership>(processor_id::kSystemOwners);
    const auto& planets = input.deps.get<PlanetsOutput>(processor_id::kPlanetModels);
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& leaders = input.deps.get<LeadersOutput>(processor_id::kLeader);
    const auto& view = input.deps.get<ObserverView>(processor_id::kObserverRelations);

    const auto* sectors = input.gamestate().get("sectors");
    const auto* planetSection = childMap(input.gamestate(), "planets");
    planetSection = planetSection ? childMap(*planetSection, "planet") : nullptr;
    if (!sectors || !sectors->isMap() || !planetSection) {
        return Completed{};
    }
    const auto* countrySection = input.gamestate().get("country");
    auto scope = input.scope();

    for (const auto& [countryId, country] : countries.countries) {
        const Value* node = countrySection ? countrySection->get(countryId) : nullptr;
        const Value* owned = node ? childMap(*node, "sectors") : nullptr;
        if (!owned) {
            continue;
        }

        SectorContext ctx{input, view, planets, planetSection, country};
        std::set<std::int64_t> unprocessed;
        if (auto it = ownership.systemsByOwner.find(countryId); it != ownership.systemsByOwner.end()) {
            unprocessed = it->second;
        }
        std::set<std::string> governedSectors;

        // Planets are visited sector by sector so that events can name the
        // responsible governor.
        for (std::int64_t sectorId : intsAt(*owned, "owned")) {
            const Value* sector = sectors->get(sectorId);
            if (!sector || !sector->isMap()) {
                continue;
            }
            std::string sectorName = nameAt(*sector, "name");
            Entity* governor = lookup(leaders.leaders, getIntOr(*sector, "governor", -1));

            for (std::int64_t systemId : intsAt(*sector, "systems")) {
                Entity* system = lookup(systems.systems, systemId);
                if (!system) {
                    CHRONICLE_TIMELINE_LOG_INFO("Sector {} lists unknown system {}", sectorId, systemId);
                    continue;
                }
                processSystem(ctx, system, systemId, governor);
                unprocessed.erase(systemId);
            }

            Entity* capital = lookup(planets.planets, getIntOr(*sector, "local_capital", -1));
            if (!governor || !capital) {
                continue;
            }
            governedSectors.insert(sectorName);

            EventFilter governance;
            governance.kinds = {EventKind::GovernedSector};
            governance.country = country->id;
            governance.description = sectorName;
            EventSubject current;
            current.country = country->id;
            current.leader = governor->id;
            current.planet = capital->id;
            current.system = capital->attrInt("system", kNoEntity);
            current.description = sectorName;
            recordContinuousFact(scope, governance, EventKind::GovernedSector, current,
                                 revealsFor(view, EventKind::GovernedSector, country));
        }

        for (std::int64_t systemId : unprocessed) {
            processSystem(ctx, lookup(systems.systems, systemId), systemId, nullptr);
        }

        // Sectors without a governor this snapshot.
        EventFilter stale;
        stale.kinds = {EventKind::GovernedSector};
        stale.country = country->id;
        stale.openOnly = true;
        for (auto& event : input.store.events(scope.series, stale)) {
            if (governedSectors.count(event.subject.description) == 0) {
                closeEvent(scope, event);
            }
        }
    }
    return Completed{};
}

} // namespace chronicle
