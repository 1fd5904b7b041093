#pragma once

#include "chronicle/store/Store.hh"

#include <map>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace chronicle {

/**
 * @brief Per-transaction entity cache.
 *
 * Maps (kind, in-source id) to one live Entity handle so that every
 * processor in a snapshot mutates the same object. New entities are inserted
 * into the store immediately to obtain their id; modified ones are written
 * back by flush(). Handles stay valid for the lifetime of the map.
 */
class IdentityMap {
  public:
    IdentityMap(Store& store, SeriesId series);

    IdentityMap(const IdentityMap&) = delete;
    IdentityMap& operator=(const IdentityMap&) = delete;

    // nullptr when the entity does not exist yet.
    Entity* find(EntityKind kind, std::int64_t sourceId);
    Entity* byId(EntityId id);

    // Returns the existing entity or inserts a new one. `created` reports
    // which of the two happened.
    Entity& getOrCreate(EntityKind kind, std::int64_t sourceId, bool* created = nullptr);

    // Every entity of a kind, loaded from the store on first use.
    std::vector<Entity*> all(EntityKind kind);

    // Marks an entity for write-back.
    void touch(const Entity& entity);

    // Writes touched entities back to the store. Returns how many.
    size_t flush();

    size_t cachedCount() const { return byId_.size(); }

  private:
    Entity* adopt(Entity entity);

    Store& store_;
    SeriesId series_;
    std::unordered_map<EntityId, std::unique_ptr<Entity>> byId_;
    std::map<std::pair<EntityKind, std::int64_t>, EntityId> byKey_;
    std::unordered_set<EntityId> dirty_;
    std::unordered_set<int> loadedKinds_;
};

} // namespace chronicle
