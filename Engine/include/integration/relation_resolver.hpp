/**
 * @file relation_resolver.hpp
 * @brief Remaps document-local relations onto global ids and deduplicates them
 */

#pragma once

#include <model/relation.hpp>
#include <export.hpp>
#include <string>
#include <unordered_map>

namespace Broadsheet {

class GraphStore;

// local entity id -> global entity id, for one document
using IdMap = std::unordered_map<std::string, std::string>;

enum class RelationOutcome {
    Added,    // new global relation stored
    Merged,   // folded into an existing relation (sources, confidence)
    Dropped   // subject or object never integrated
};

class BROADSHEET_API RelationResolver {
public:
    explicit RelationResolver(GraphStore& store) : store_(store) {}

    /**
     * @brief Integrate one relation of @p document_id.
     *
     * Unresolved context ids are dropped from the relation; unresolved subject or
     * object drops the whole relation. A relation whose signature is already stored
     * unions the document into its sources and keeps the higher confidence.
     */
    RelationOutcome integrate(const std::string& document_id, const LocalRelation& relation, const IdMap& id_map);

    /**
     * @brief Dedup key: subject_predicate_object[_time_<ctx>][_loc_<ctx>]
     */
    static std::string signature(const std::string& subject, const std::string& predicate,
                                 const std::string& object,
                                 const std::string* context_time, const std::string* context_location);

    static std::string signature(const GlobalRelation& relation);

private:
    GraphStore& store_;
};

} // namespace Broadsheet
