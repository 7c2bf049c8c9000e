#include <export/graph_exporter.hpp>
#include <export/table_writer.hpp>
#include <storage/format_utils.hpp>
#include <utils/logger.hpp>
#include <fstream>
#include <stdexcept>

namespace Broadsheet {

namespace fs = std::filesystem;
using Json = GraphExporter::Json;

namespace {

template <typename T>
void put_optional(Json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

Json location_to_json(const LocationAttributes& a) {
    Json j = Json::object();
    put_optional(j, "latitude", a.latitude);
    put_optional(j, "longitude", a.longitude);
    put_optional(j, "display_name", a.display_name);
    put_optional(j, "location_type", a.location_type);
    put_optional(j, "importance", a.importance);
    put_optional(j, "osm_id", a.osm_id);
    put_optional(j, "bbox_south", a.bbox_south);
    put_optional(j, "bbox_north", a.bbox_north);
    put_optional(j, "bbox_west", a.bbox_west);
    put_optional(j, "bbox_east", a.bbox_east);
    return j;
}

Json time_to_json(const TimeAttributes& a) {
    Json j = Json::object();
    if (a.precision) j["precision"] = to_string(*a.precision);
    if (a.kind) j["type"] = to_string(*a.kind);
    put_optional(j, "start_date", a.start_date);
    put_optional(j, "end_date", a.end_date);
    put_optional(j, "date_reliability", a.date_reliability);
    return j;
}

} // namespace

Json GraphExporter::entity_to_json(const GlobalEntity& e) {
    Json j;
    j["id"] = e.id;
    j["type"] = std::string(e.type_name());
    j["text"] = e.text;
    put_optional(j, "normalized", e.normalized);
    j["confidence"] = e.confidence;
    j["sources"] = e.sources;

    if (e.type == EntityType::Location && !e.location.empty()) {
        j["attributes"] = location_to_json(e.location);
    } else if (e.type == EntityType::Time && !e.time.empty()) {
        j["attributes"] = time_to_json(e.time);
    }
    return j;
}

Json GraphExporter::relation_to_json(const GlobalRelation& r) {
    Json j;
    j["id"] = r.id;
    j["subject"] = r.subject;
    j["predicate"] = r.predicate;
    j["object"] = r.object;
    j["confidence"] = r.confidence;
    put_optional(j, "context_time", r.context_time);
    put_optional(j, "context_location", r.context_location);
    j["sources"] = r.sources;
    return j;
}

Json GraphExporter::to_json(const GraphStore& store) {
    Json entities = Json::array();
    for (const auto& e : store.entities()) entities.push_back(entity_to_json(e));

    Json relations = Json::array();
    for (const auto& r : store.relations()) relations.push_back(relation_to_json(r));

    Json root;
    root["entities"] = std::move(entities);
    root["relations"] = std::move(relations);
    return root;
}

void GraphExporter::write_json(const GraphStore& store, const fs::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open " + path.string() + " for writing");
    }
    out << to_json(store).dump(2) << '\n';
    out.close();
    if (out.fail()) {
        throw std::runtime_error("Failed writing " + path.string());
    }
    Logger::success("Integrated data saved to " + path.string());
}

const std::vector<std::string>& GraphExporter::entity_columns() {
    static const std::vector<std::string> cols = {"entity_id", "type", "text", "normalized", "confidence", "sources"};
    return cols;
}

const std::vector<std::string>& GraphExporter::location_columns() {
    static const std::vector<std::string> cols = {"entity_id", "latitude", "longitude", "display_name",
                                                  "location_type", "importance", "bbox_south", "bbox_north",
                                                  "bbox_west", "bbox_east"};
    return cols;
}

const std::vector<std::string>& GraphExporter::timeperiod_columns() {
    static const std::vector<std::string> cols = {"entity_id", "precision", "type",
                                                  "start_date", "end_date", "date_reliability"};
    return cols;
}

const std::vector<std::string>& GraphExporter::relation_columns() {
    static const std::vector<std::string> cols = {"relation_id", "subject_id", "predicate", "object_id",
                                                  "confidence", "context_time_id", "context_location_id", "sources"};
    return cols;
}

TableCounts GraphExporter::write_tables(const GraphStore& store, const fs::path& dir) {
    TableCounts counts;
    TableWriter writer(dir);

    writer.begin_table("entities", entity_columns());
    for (const auto& e : store.entities()) {
        writer.add_row({e.id, std::string(e.type_name()), e.text, format_optional(e.normalized),
                        format_double(e.confidence), join_sources(e.sources)});
    }
    counts.entities = writer.count();
    writer.flush();

    writer.begin_table("locations", location_columns());
    for (const auto& e : store.entities()) {
        if (e.type != EntityType::Location) continue;
        const auto& a = e.location;
        writer.add_row({e.id, format_optional(a.latitude), format_optional(a.longitude),
                        format_optional(a.display_name), format_optional(a.location_type),
                        format_optional(a.importance), format_optional(a.bbox_south),
                        format_optional(a.bbox_north), format_optional(a.bbox_west),
                        format_optional(a.bbox_east)});
    }
    counts.locations = writer.count();
    writer.flush();
    Logger::info("Wrote " + std::to_string(counts.locations) + " location entities to locations.csv");

    writer.begin_table("timeperiods", timeperiod_columns());
    for (const auto& e : store.entities()) {
        if (e.type != EntityType::Time) continue;
        const auto& a = e.time;
        writer.add_row({e.id, a.precision ? to_string(*a.precision) : std::string(),
                        a.kind ? to_string(*a.kind) : std::string(), format_optional(a.start_date),
                        format_optional(a.end_date), format_optional(a.date_reliability)});
    }
    counts.timeperiods = writer.count();
    writer.flush();
    Logger::info("Wrote " + std::to_string(counts.timeperiods) + " time entities to timeperiods.csv");

    writer.begin_table("relations", relation_columns());
    for (const auto& r : store.relations()) {
        writer.add_row({r.id, r.subject, r.predicate, r.object, format_double(r.confidence),
                        format_optional(r.context_time), format_optional(r.context_location),
                        join_sources(r.sources)});
    }
    counts.relations = writer.count();
    writer.flush();

    Logger::success("CSV files for graph import generated in " + dir.string());
    return counts;
}

} // namespace Broadsheet
