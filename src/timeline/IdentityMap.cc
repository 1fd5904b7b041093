#include "chronicle/timeline/IdentityMap.hh"

#include "chronicle/core/Log.hh"

#include <algorithm>
#include <limits>

namespace chronicle {

IdentityMap::IdentityMap(Store& store, SeriesId series) : store_(store), series_(series) {}

Entity* IdentityMap::adopt(Entity entity) {
    auto [it, inserted] = byId_.try_emplace(entity.id, nullptr);
    if (inserted) {
        byKey_[{entity.kind, entity.sourceId}] = entity.id;
        it->second = std::make_unique<Entity>(std::move(entity));
    }
    return it->second.get();
}

Entity* IdentityMap::find(EntityKind kind, std::int64_t sourceId) {
    auto it = byKey_.find({kind, sourceId});
    if (it != byKey_.end()) {
        return byId_.at(it->second).get();
    }
    if (loadedKinds_.count(static_cast<int>(kind)) > 0) {
        return nullptr;
    }
    auto stored = store_.findEntity(series_, kind, sourceId);
    if (!stored) {
        return nullptr;
    }
    return adopt(std::move(*stored));
}

Entity* IdentityMap::byId(EntityId id) {
    auto it = byId_.find(id);
    if (it != byId_.end()) {
        return it->second.get();
    }
    auto stored = store_.getEntity(series_, id);
    if (!stored) {
        return nullptr;
    }
    return adopt(std::move(*stored));
}

Entity& IdentityMap::getOrCreate(EntityKind kind, std::int64_t sourceId, bool* created) {
    if (Entity* existing = find(kind, sourceId)) {
        if (created) {
            *created = false;
        }
        return *existing;
    }
    Entity fresh;
    fresh.kind = kind;
    fresh.sourceId = sourceId;
    Entity* entity = adopt(store_.upsertEntity(series_, std::move(fresh)));
    if (created) {
        *created = true;
    }
    CHRONICLE_TIMELINE_LOG_DEBUG("New {} entity {} (source id {})", std::string(entityKindToString(kind)), entity->id,
                                 sourceId);
    return *entity;
}

std::vector<Entity*> IdentityMap::all(EntityKind kind) {
    if (loadedKinds_.insert(static_cast<int>(kind)).second) {
        for (auto& entity : store_.entities(series_, kind)) {
            adopt(std::move(entity));
        }
    }
    std::vector<Entity*> result;
    for (auto it = byKey_.lower_bound({kind, std::numeric_limits<std::int64_t>::min()});
         it != byKey_.end() && it->first.first == kind; ++it) {
        result.push_back(byId_.at(it->second).get());
    }
    return result;
}

void IdentityMap::touch(const Entity& entity) {
    dirty_.insert(entity.id);
}

size_t IdentityMap::flush() {
    std::vector<EntityId> ids(dirty_.begin(), dirty_.end());
    std::sort(ids.begin(), ids.end());
    for (EntityId id : ids) {
        store_.upsertEntity(series_, *byId_.at(id));
    }
    dirty_.clear();
    return ids.size();
}

} // namespace chronicle
