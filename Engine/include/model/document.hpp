/**
 * @file document.hpp
 * @brief One per-document extraction record, as produced upstream
 */

#pragma once

#include <model/entity.hpp>
#include <model/relation.hpp>
#include <string>
#include <vector>

namespace Broadsheet {

struct LocationRow {
    std::string entity_id;
    LocationAttributes attributes;
};

struct TimeRow {
    std::string entity_id;
    TimeAttributes attributes;
};

/**
 * @brief Entities, relations and the attribute tables keyed by local entity id
 */
struct DocumentRecord {
    std::string id;
    std::vector<LocalEntity> entities;
    std::vector<LocalRelation> relations;
    std::vector<LocationRow> locations;
    std::vector<TimeRow> timeperiods;
};

} // namespace Broadsheet
