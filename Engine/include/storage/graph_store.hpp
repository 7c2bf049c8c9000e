#pragma once

#include <model/entity.hpp>
#include <model/relation.hpp>
#include <export.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace Broadsheet {

/**
 * @brief Owned, append/merge-only store of global entities and relations.
 *
 * Records keep creation order. Entities are indexed by global id and relations by
 * dedup signature, so lookups match what a full scan over the records would find.
 * Single-writer: callers serialise mutation (GlobalIntegrator holds the lock).
 */
class BROADSHEET_API GraphStore {
public:
    GlobalEntity* find_entity(const std::string& id);
    const GlobalEntity* find_entity(const std::string& id) const;

    // Throws std::logic_error if the id is already present
    GlobalEntity& add_entity(GlobalEntity entity);

    GlobalEntity& entity_at(size_t index) { return entities_.at(index); }
    const std::vector<GlobalEntity>& entities() const { return entities_; }

    GlobalRelation* find_relation(const std::string& signature);

    // Throws std::logic_error if the signature is already present
    GlobalRelation& add_relation(const std::string& signature, GlobalRelation relation);

    const std::vector<GlobalRelation>& relations() const { return relations_; }

    size_t entity_count() const { return entities_.size(); }
    size_t relation_count() const { return relations_.size(); }

private:
    std::vector<GlobalEntity> entities_;
    std::vector<GlobalRelation> relations_;
    std::unordered_map<std::string, size_t> entity_index_;    // global id -> position
    std::unordered_map<std::string, size_t> relation_index_;  // signature -> position
};

} // namespace Broadsheet
