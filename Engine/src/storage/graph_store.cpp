#include <storage/graph_store.hpp>
#include <stdexcept>
#include <utility>

namespace Broadsheet {

GlobalEntity* GraphStore::find_entity(const std::string& id) {
    auto it = entity_index_.find(id);
    return it == entity_index_.end() ? nullptr : &entities_[it->second];
}

const GlobalEntity* GraphStore::find_entity(const std::string& id) const {
    auto it = entity_index_.find(id);
    return it == entity_index_.end() ? nullptr : &entities_[it->second];
}

GlobalEntity& GraphStore::add_entity(GlobalEntity entity) {
    if (entity_index_.count(entity.id)) {
        throw std::logic_error("Duplicate global entity id: " + entity.id);
    }
    entity_index_.emplace(entity.id, entities_.size());
    entities_.push_back(std::move(entity));
    return entities_.back();
}

GlobalRelation* GraphStore::find_relation(const std::string& signature) {
    auto it = relation_index_.find(signature);
    return it == relation_index_.end() ? nullptr : &relations_[it->second];
}

GlobalRelation& GraphStore::add_relation(const std::string& signature, GlobalRelation relation) {
    if (!relation_index_.emplace(signature, relations_.size()).second) {
        throw std::logic_error("Duplicate relation signature: " + signature);
    }
    relations_.push_back(std::move(relation));
    return relations_.back();
}

} // namespace Broadsheet
