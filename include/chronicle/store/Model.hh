#pragma once

#include "chronicle/core/Date.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle {

using SeriesId = std::int64_t;
using EntityId = std::int64_t;
using EventId = std::int64_t;

// Entity ids start at 1; 0 marks an absent reference.
inline constexpr EntityId kNoEntity = 0;

enum class EntityKind : uint8_t { Country, System, Leader, Planet, Faction, War, Species };

std::string_view entityKindToString(EntityKind kind);
std::optional<EntityKind> entityKindFromString(std::string_view name);

/**
 * @brief Long-lived object tracked across snapshots.
 *
 * Identified within its series by (kind, sourceId). Attributes are
 * overwritten in place; references to other entities are stored as their
 * EntityId, never as embedded copies.
 */
struct Entity {
    EntityId id = kNoEntity;
    EntityKind kind = EntityKind::Country;
    std::int64_t sourceId = 0;
    nlohmann::json attributes = nlohmann::json::object();

    std::string attrString(const std::string& key, std::string_view fallback = "") const;
    std::int64_t attrInt(const std::string& key, std::int64_t fallback = 0) const;
    bool attrBool(const std::string& key, bool fallback = false) const;
    bool hasAttr(const std::string& key) const;

    bool operator==(const Entity& other) const = default;
};

enum class EventKind : uint8_t {
    RuledEmpire,
    GovernedSector,
    FactionLeader,
    ResearchLeader,
    LeaderRecruited,
    LeaderDied,
    LevelUp,
    GainedTrait,
    LostTrait,
    ResearchedTechnology,
    Tradition,
    AscensionPerk,
    Edict,
    ExpandedToSystem,
    ConqueredSystem,
    LostSystem,
    Colonization,
    CapitalRelocation,
    PlanetDestroyed,
    Terraforming,
    NewFaction,
    GovernmentReform,
    FirstContact,
    NonAggressionPact,
    DefensivePact,
    FormedFederation,
    CommercialPact,
    ResearchAgreement,
    MigrationTreaty,
    Embassy,
    ClosedBorders,
    ReceivedClosedBorders,
    SentRivalry,
    ReceivedRivalry,
    War,
    Peace,
    FleetCombat,
    ArmyCombat
};

std::string_view eventKindToString(EventKind kind);
std::optional<EventKind> eventKindFromString(std::string_view name);

// Entities an event is about. Two events share a subject exactly when every
// field compares equal.
struct EventSubject {
    EntityId country = kNoEntity;
    EntityId targetCountry = kNoEntity;
    EntityId leader = kNoEntity;
    EntityId system = kNoEntity;
    EntityId planet = kNoEntity;
    EntityId war = kNoEntity;
    EntityId faction = kNoEntity;
    std::string description;

    bool operator==(const EventSubject& other) const = default;
};

/**
 * @brief Append-only interval record.
 *
 * An open event (no end) describes a condition that still holds. After the
 * owning snapshot commits, only `end` and a false -> true change of
 * `knownToObserver` may be written.
 */
struct HistoricalEvent {
    EventId id = 0;
    EventKind kind = EventKind::War;
    Day start = 0;
    std::optional<Day> end;
    EventSubject subject;
    bool knownToObserver = false;

    bool isOpen() const { return !end.has_value(); }
    bool operator==(const HistoricalEvent& other) const = default;
};

// Conjunction of optional constraints over events.
struct EventFilter {
    std::vector<EventKind> kinds; // empty: any kind
    std::optional<EntityId> country;
    std::optional<EntityId> targetCountry;
    std::optional<EntityId> leader;
    std::optional<EntityId> system;
    std::optional<EntityId> planet;
    std::optional<EntityId> war;
    std::optional<EntityId> faction;
    std::optional<std::string> description;
    // Date range: events whose [start, end] interval overlaps [from, to].
    std::optional<Day> from;
    std::optional<Day> to;
    bool openOnly = false;
    bool knownOnly = false;

    static EventFilter forSubject(EventKind kind, const EventSubject& subject);

    bool matches(const HistoricalEvent& event) const;
};

// Immutable per (entity, snapshot) metrics.
struct SnapshotRecord {
    EntityId entity = kNoEntity;
    std::string kind;
    Day day = 0;
    nlohmann::json values = nlohmann::json::object();

    bool operator==(const SnapshotRecord& other) const = default;
};

void to_json(nlohmann::json& j, const Entity& e);
void from_json(const nlohmann::json& j, Entity& e);
void to_json(nlohmann::json& j, const EventSubject& s);
void from_json(const nlohmann::json& j, EventSubject& s);
void to_json(nlohmann::json& j, const HistoricalEvent& e);
void from_json(const nlohmann::json& j, HistoricalEvent& e);
void to_json(nlohmann::json& j, const SnapshotRecord& r);
void from_json(const nlohmann::json& j, SnapshotRecord& r);

} // namespace chronicle
