#pragma once

#include "chronicle/core/Date.hh"
#include "chronicle/parser/Value.hh"
#include "chronicle/store/Model.hh"
#include "chronicle/timeline/EventRecorder.hh"
#include "chronicle/timeline/IdentityMap.hh"
#include "chronicle/timeline/Observer.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chronicle {

// Shape helpers shared by the extraction processors. Every helper tolerates
// a missing or differently shaped node and falls back instead of throwing.

// Integer-keyed entries of a section whose value is a map, sorted by id.
// Entries holding a scalar placeholder such as "none" are left out.
std::vector<std::pair<std::int64_t, const Value*>> idEntries(const Value* section);
std::vector<std::pair<std::int64_t, const Value*>> idEntries(const Value& node, const Key& key);

// Display name of a node: a plain string, or a localisation map carrying
// "key". Anything else gives `fallback`.
std::string nameOf(const Value* node, std::string_view fallback = "Unnamed");
std::string nameAt(const Value& node, const Key& key, std::string_view fallback = "Unnamed");

// Country types that take part in diplomacy and carry per-country metrics.
bool isRealCountryType(std::string_view countryType);

bool isColonizablePlanetClass(std::string_view planetClass);
bool isDestroyedPlanetClass(std::string_view planetClass);

// Date-valued field as a day index. "none" and malformed dates give
// nullopt.
std::optional<Day> dayAt(const Value& node, const Key& key);

// Integer field that may also appear as a one element list.
std::optional<std::int64_t> intAt(const Value& node, const Key& key);

// Numeric value of a node. A list contributes its first number; anything
// else gives `fallback`.
double numberOf(const Value* node, double fallback = 0.0);

// Overwrites one attribute and marks the entity for write-back when the
// value differs. Returns whether it changed.
bool assignAttr(IdentityMap& entities, Entity& entity, const std::string& key, nlohmann::json value);

// Appends an instantaneous event [day, day]. Used where a detected change,
// not the subject, decides that the event is new.
HistoricalEvent appendInstant(const EventScope& scope, EventKind kind, EventSubject subject, bool known);

// Visibility of an event about one entity country. Missing countries are
// never visible.
bool revealsFor(const ObserverView& view, EventKind kind, const Entity* country);
bool revealsFor(const ObserverView& view, EventKind kind, const Entity* country, const Entity* counterpart);

inline EntityId entityIdOf(const Entity* entity) {
    return entity ? entity->id : kNoEntity;
}

} // namespace chronicle
