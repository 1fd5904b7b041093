#pragma once

#include "chronicle/timeline/Observer.hh"
#include "chronicle/timeline/Pipeline.hh"
#include "chronicle/timeline/Processor.hh"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace chronicle {

// Processor ids. Dependencies are declared with these names.
namespace processor_id {
inline constexpr const char* kSystems = "systems";
inline constexpr const char* kCountry = "country";
inline constexpr const char* kSpecies = "species";
inline constexpr const char* kFleetOwner = "fleet_owner";
inline constexpr const char* kDiplomacy = "diplomacy";
inline constexpr const char* kSensorLinks = "sensor_links";
inline constexpr const char* kObserverRelations = "observer_relations";
inline constexpr const char* kSystemOwners = "system_owners";
inline constexpr const char* kCountryData = "country_data";
inline constexpr const char* kLeader = "leader";
inline constexpr const char* kPlanetModels = "planet_models";
inline constexpr const char* kSectorsColonies = "sectors_colonies";
inline constexpr const char* kPlanetUpdates = "planet_updates";
inline constexpr const char* kRuler = "ruler";
inline constexpr const char* kGovernment = "government";
inline constexpr const char* kFaction = "faction";
inline constexpr const char* kDiplomacyEvents = "diplomacy_events";
inline constexpr const char* kScientistEvents = "scientist_events";
inline constexpr const char* kWars = "wars";
inline constexpr const char* kTruces = "truces";
inline constexpr const char* kPopStats = "pop_stats";
} // namespace processor_id

// In-source id -> live entity handle owned by the snapshot's IdentityMap.
using EntityIndex = std::map<std::int64_t, Entity*>;

Entity* lookup(const EntityIndex& index, std::int64_t sourceId);

// -- Outputs --

struct SystemsOutput {
    EntityIndex systems;
    std::map<std::int64_t, std::int64_t> systemByStarbase;
};

struct CountriesOutput {
    EntityIndex countries;
    std::set<std::int64_t> realCountries;

    bool isReal(std::int64_t sourceId) const { return realCountries.count(sourceId) > 0; }
};

struct SpeciesOutput {
    EntityIndex species;
    std::set<std::int64_t> robotSpecies;
};

// Fleet id -> owning country id.
struct FleetOwners {
    std::map<std::int64_t, std::int64_t> ownerByFleet;
};

enum class Relation : uint8_t {
    Rivalry,
    DefensivePact,
    Federation,
    NonAggressionPact,
    ClosedBorders,
    Communications,
    MigrationTreaty,
    CommercialPact,
    Neighbor,
    ResearchAgreement,
    Embassy
};

inline constexpr size_t kRelationCount = 11;

std::string_view relationToString(Relation relation);

struct DiplomacyOutput {
    // country -> relation -> targets
    std::map<std::int64_t, std::array<std::set<std::int64_t>, kRelationCount>> relations;
    // truce id -> countries bound by it
    std::map<std::int64_t, std::set<std::int64_t>> truceCountries;

    bool has(std::int64_t country, Relation relation, std::int64_t target) const;
};

struct SensorLinks {
    // country -> countries whose sensor data it currently receives
    std::map<std::int64_t, std::set<std::int64_t>> linked;

    bool has(std::int64_t from, std::int64_t to) const;
};

struct SystemOwnership {
    std::map<std::int64_t, std::int64_t> ownerBySystem;
    std::map<std::int64_t, std::set<std::int64_t>> systemsByOwner;
};

struct CountryDataOutput {
    // country id -> the country_data record values written this snapshot
    std::map<std::int64_t, nlohmann::json> byCountry;
};

struct LeadersOutput {
    // Active leaders plus every leader seen before.
    EntityIndex leaders;
};

struct PlanetsOutput {
    EntityIndex planets;
    std::map<std::int64_t, std::int64_t> systemByPlanet;
};

struct RulersOutput {
    std::map<std::int64_t, Entity*> rulerByCountry;

    Entity* rulerOf(std::int64_t country) const;
};

struct FactionsOutput {
    EntityIndex factions;
};

struct WarsOutput {
    EntityIndex activeWars;
};

// Pseudo-faction ids for pops outside any political faction.
inline constexpr std::int64_t kNoFaction = -1;
inline constexpr std::int64_t kSlaveFaction = -2;
inline constexpr std::int64_t kPurgeFaction = -3;
inline constexpr std::int64_t kRobotFaction = -4;

// -- Processors --

class SystemsProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kSystems; }
    std::any run(ProcessorInput& input) override;
};

class CountryProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kCountry; }
    std::any run(ProcessorInput& input) override;
};

class SpeciesProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kSpecies; }
    std::any run(ProcessorInput& input) override;
};

class FleetOwnerProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kFleetOwner; }
    std::vector<std::string> dependencies() const override { return {processor_id::kCountry}; }
    std::any run(ProcessorInput& input) override;
};

class DiplomacyProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kDiplomacy; }
    std::vector<std::string> dependencies() const override { return {processor_id::kCountry}; }
    std::any run(ProcessorInput& input) override;
};

class SensorLinkProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kSensorLinks; }
    std::vector<std::string> dependencies() const override { return {processor_id::kCountry}; }
    std::any run(ProcessorInput& input) override;
};

// Builds the ObserverView for the snapshot and retroactively widens the
// visibility of events about countries the observer learned more about.
class ObserverRelationsProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kObserverRelations; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kCountry, processor_id::kDiplomacy, processor_id::kSensorLinks};
    }
    std::any run(ProcessorInput& input) override;
};

class SystemOwnershipProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kSystemOwners; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kSystems, processor_id::kCountry, processor_id::kFleetOwner,
                processor_id::kObserverRelations};
    }
    std::any run(ProcessorInput& input) override;
};

class CountryDataProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kCountryData; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kCountry, processor_id::kDiplomacy, processor_id::kSensorLinks,
                processor_id::kSystemOwners, processor_id::kObserverRelations};
    }
    std::any run(ProcessorInput& input) override;
};

class LeaderProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kLeader; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kCountry, processor_id::kSpecies, processor_id::kObserverRelations};
    }
    std::any run(ProcessorInput& input) override;
};

class PlanetProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kPlanetModels; }
    std::vector<std::string> dependencies() const override { return {processor_id::kSystems}; }
    std::any run(ProcessorInput& input) override;
};

class SectorColonyProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kSectorsColonies; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kSystems,  processor_id::kSystemOwners, processor_id::kPlanetModels,
                processor_id::kCountry,  processor_id::kLeader,       processor_id::kObserverRelations};
    }
    std::any run(ProcessorInput& input) override;
};

class PlanetUpdateProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kPlanetUpdates; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kPlanetModels, processor_id::kSectorsColonies};
    }
    std::any run(ProcessorInput& input) override;
};

class RulerProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kRuler; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kCountry, processor_id::kLeader, processor_id::kPlanetModels,
                processor_id::kObserverRelations};
    }
    std::any run(ProcessorInput& input) override;
};

class GovernmentProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kGovernment; }
    std::vector<std::string> dependencies() const override { return {processor_id::kCountry, processor_id::kRuler}; }
    std::any run(ProcessorInput& input) override;
};

class FactionProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kFaction; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kCountry, processor_id::kLeader, processor_id::kObserverRelations};
    }
    std::any run(ProcessorInput& input) override;
};

class DiplomacyEventProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kDiplomacyEvents; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kDiplomacy, processor_id::kCountry, processor_id::kRuler,
                processor_id::kObserverRelations};
    }
    std::any run(ProcessorInput& input) override;
};

class ScientistEventProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kScientistEvents; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kCountry, processor_id::kLeader, processor_id::kObserverRelations};
    }
    std::any run(ProcessorInput& input) override;
};

class WarProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kWars; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kRuler, processor_id::kCountry, processor_id::kSystems, processor_id::kPlanetModels,
                processor_id::kObserverRelations};
    }
    std::any run(ProcessorInput& input) override;
};

class TruceProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kTruces; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kCountry, processor_id::kRuler, processor_id::kDiplomacy, processor_id::kWars};
    }
    std::any run(ProcessorInput& input) override;
};

class PopStatsProcessor : public Processor {
  public:
    std::string id() const override { return processor_id::kPopStats; }
    std::vector<std::string> dependencies() const override {
        return {processor_id::kCountry, processor_id::kSpecies, processor_id::kFaction, processor_id::kCountryData,
                processor_id::kPlanetModels};
    }
    std::any run(ProcessorInput& input) override;
};

// Every processor above, registered in dependency order.
TimelinePipeline makeDefaultPipeline();

} // namespace chronicle
