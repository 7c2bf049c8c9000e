/**
 * @file relation.hpp
 * @brief Subject-predicate-object assertions, local and global
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Broadsheet {

/**
 * @brief Relation between document-scoped entity ids
 */
struct LocalRelation {
    std::string subject;
    std::string predicate;
    std::string object;
    double confidence = 0.0;
    std::optional<std::string> context_time;      // local id of a TIME entity
    std::optional<std::string> context_location;  // local id of a LOCATION entity
};

/**
 * @brief Relation remapped onto global entity ids
 */
struct GlobalRelation {
    std::string id;                               // "R" + 11 hex chars of the signature hash
    std::string subject;
    std::string predicate;
    std::string object;
    double confidence = 0.0;                      // max over all contributing documents
    std::optional<std::string> context_time;
    std::optional<std::string> context_location;
    std::vector<std::string> sources;
};

} // namespace Broadsheet
