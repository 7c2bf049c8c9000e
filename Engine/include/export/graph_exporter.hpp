/**
 * @file graph_exporter.hpp
 * @brief JSON graph and CSV table export of an integrated GraphStore
 *
 * JSON layout:
 *   {"entities": [{"id", "type", "text", "normalized"?, "confidence", "sources",
 *                  "attributes"?: {...}}, ...],
 *    "relations": [{"id", "subject", "predicate", "object", "confidence",
 *                   "context_time"?, "context_location"?, "sources"}, ...]}
 *
 * "attributes" carries the location or time bag and is omitted when empty. Arrays keep
 * creation order.
 *
 * Tables (one CSV each): entities, locations, timeperiods, relations.
 */

#pragma once

#include <storage/graph_store.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace Broadsheet {

struct TableCounts {
    size_t entities = 0;
    size_t locations = 0;
    size_t timeperiods = 0;
    size_t relations = 0;
};

class BROADSHEET_API GraphExporter {
public:
    using Json = nlohmann::ordered_json;

    static Json entity_to_json(const GlobalEntity& entity);
    static Json relation_to_json(const GlobalRelation& relation);

    static Json to_json(const GraphStore& store);

    /**
     * @brief Write the JSON graph (2-space indent), creating parent directories.
     * @throws std::runtime_error if the file cannot be written
     */
    static void write_json(const GraphStore& store, const std::filesystem::path& path);

    /**
     * @brief Write entities.csv, locations.csv, timeperiods.csv and relations.csv into @p dir.
     * @throws std::runtime_error if a file cannot be written
     */
    static TableCounts write_tables(const GraphStore& store, const std::filesystem::path& dir);

    static const std::vector<std::string>& entity_columns();
    static const std::vector<std::string>& location_columns();
    static const std::vector<std::string>& timeperiod_columns();
    static const std::vector<std::string>& relation_columns();
};

} // namespace Broadsheet
